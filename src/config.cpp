#include "config.hpp"
#include "utils.hpp"

#include <iostream>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Depfetch {

    namespace {

        // Reads an optional positive integer key, keeping the default when absent.
        template <typename Int>
        void readPositive(const YAML::Node& root, const char* key, Int& value) {
            if (!root[key]) {
                return;
            }
            Int parsed = root[key].as<Int>();
            if (parsed <= 0) {
                throw std::runtime_error(std::string("Configuration value '") + key
                                         + "' must be positive");
            }
            value = parsed;
        }

        void readString(const YAML::Node& root, const char* key, std::string& value) {
            if (root[key]) {
                value = root[key].as<std::string>();
            }
        }

    } // end anonymous namespace

    Config Config::loadFromFile(const std::string& path) {
        Config config;

        if (!fs::exists(path)) {
            log_warning("Configuration file not found, using defaults: " + path);
            return config;
        }

        try {
            YAML::Node root = YAML::LoadFile(path);
            if (!root || root.IsNull()) {
                return config;
            }
            if (!root.IsMap()) {
                throw std::runtime_error("top level must be a mapping");
            }

            readString(root, "registry", config.registry);
            readString(root, "listing_url", config.listingUrl);
            readString(root, "output_dir", config.outputDir);
            readString(root, "user_agent", config.userAgent);
            readPositive(root, "page_size", config.pageSize);
            readPositive(root, "listing_concurrency", config.listingConcurrency);
            readPositive(root, "download_concurrency", config.downloadConcurrency);
            readPositive(root, "connect_timeout", config.connectTimeout);
            readPositive(root, "timeout", config.timeout);
        } catch (const YAML::Exception& e) {
            throw std::runtime_error("Invalid configuration file " + path + ": " + e.what());
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("Invalid configuration file " + path + ": " + e.what());
        }

        return config;
    }

    void Config::saveToFile(const std::string& path) const {
        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "registry"             << YAML::Value << registry;
        out << YAML::Key << "listing_url"          << YAML::Value << listingUrl;
        out << YAML::Key << "page_size"            << YAML::Value << pageSize;
        out << YAML::Key << "listing_concurrency"  << YAML::Value << listingConcurrency;
        out << YAML::Key << "download_concurrency" << YAML::Value << downloadConcurrency;
        out << YAML::Key << "output_dir"           << YAML::Value << outputDir;
        out << YAML::Key << "user_agent"           << YAML::Value << userAgent;
        out << YAML::Key << "connect_timeout"      << YAML::Value << connectTimeout;
        out << YAML::Key << "timeout"              << YAML::Value << timeout;
        out << YAML::EndMap;

        std::ofstream file(path, std::ios::trunc); // Truncate file to overwrite
        if (!file.is_open()) {
            throw std::runtime_error("Unable to open configuration file for writing: " + path);
        }

        file << "# depfetch configuration\n";
        file << out.c_str() << "\n";
    }

    void Config::print() const {
        std::cout << "Effective configuration:" << std::endl;
        std::cout << "  registry:             " << registry << std::endl;
        std::cout << "  listing_url:          " << listingUrl << std::endl;
        std::cout << "  page_size:            " << pageSize << std::endl;
        std::cout << "  listing_concurrency:  " << listingConcurrency << std::endl;
        std::cout << "  download_concurrency: " << downloadConcurrency << std::endl;
        std::cout << "  output_dir:           " << outputDir << std::endl;
        std::cout << "  user_agent:           " << userAgent << std::endl;
        std::cout << "  connect_timeout:      " << connectTimeout << "s" << std::endl;
        std::cout << "  timeout:              " << timeout << "s" << std::endl;
    }
}
