#include <iostream>
#include <string>
#include <cstdlib>
#include <exception>
#include <vector>
#include <filesystem>

#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "pipeline.hpp"
#include "utils.hpp"

namespace {

const char* const defaultConfigPath = "depfetch.yaml";

void printHelp()
{
    std::cout << "depfetch (x86_64)\n"
              << "Usage: depfetch [--config <file>] command [args]\n\n"
              << "depfetch finds the most depended-upon npm packages and unpacks\n"
              << "their published tarballs, one directory per package.\n\n"
              << "Useful commands:\n"
              << "  download <count> [--outdir <dir>]  - Fetch and extract the top packages\n"
              << "  list <count>                       - Print the top packages\n"
              << "  config [--save <file>]             - Show the effective configuration,\n"
              << "                                       or write it to <file>\n"
              << "  help                               - Show this message\n\n"
              << "Configuration is read from ./" << defaultConfigPath
              << " unless --config is given.\n";
}

// Parses a positive package count, or returns -1.
int parseCount(const std::string& arg)
{
    try {
        size_t used = 0;
        int value = std::stoi(arg, &used);
        if (used != arg.size() || value <= 0) {
            return -1;
        }
        return value;
    } catch (const std::exception&) {
        return -1;
    }
}

// Logs an error, unwrapping a batch failure down to the job that caused it.
void reportError(const std::exception& e)
{
    if (auto batch = dynamic_cast<const Depfetch::BatchError*>(&e)) {
        try {
            batch->rethrowCause();
        } catch (const Depfetch::BatchError& inner) {
            reportError(inner);
            return;
        } catch (const std::exception& cause) {
            Depfetch::log_error(cause.what());
            return;
        }
    }
    Depfetch::log_error(e.what());
}

} // namespace

int main(int argc, char* argv[])
{
    std::string configPath = defaultConfigPath;
    std::string outDir;
    std::string savePath;
    std::vector<std::string> args;

    // Options may appear anywhere; everything else is positional
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "--outdir" || arg == "--save") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument.\n";
                return 1;
            }
            if (arg == "--config") {
                configPath = argv[++i];
            }
            else if (arg == "--outdir") {
                outDir = argv[++i];
            }
            else {
                savePath = argv[++i];
            }
        }
        else {
            args.push_back(arg);
        }
    }

    // If no command is supplied, show the help message
    if (args.empty() || args[0] == "help" || args[0] == "--help") {
        printHelp();
        return 0;
    }

    const std::string& command = args[0];

    try {
        // A missing default file is not worth a warning
        Depfetch::Config config;
        if (configPath != defaultConfigPath || std::filesystem::exists(configPath)) {
            config = Depfetch::Config::loadFromFile(configPath);
        }
        if (!outDir.empty()) {
            config.outputDir = outDir;
        }

        // -------------------------------------------------------------
        // Config Command
        // -------------------------------------------------------------
        if (command == "config") {
            if (!savePath.empty()) {
                config.saveToFile(savePath);
                Depfetch::log_message("Configuration written to " + savePath);
                return 0;
            }
            config.print();
            return 0;
        }

        if (command != "download" && command != "list") {
            std::cerr << "Unknown command: " << command << "\n";
            return 1;
        }

        int count = args.size() == 2 ? parseCount(args[1]) : -1;
        if (count < 0) {
            std::cerr << "Usage: depfetch " << command << " <count>"
                      << (command == "download" ? " [--outdir <dir>]" : "") << "\n";
            return 1;
        }

        Depfetch::CurlHttpClient http(config);
        Depfetch::Pipeline pipeline(http, config);

        // -------------------------------------------------------------
        // List Command
        // -------------------------------------------------------------
        if (command == "list") {
            for (const auto& pkg : pipeline.listPackages(count)) {
                std::cout << pkg.name << "@" << pkg.version << "\n";
            }
            return 0;
        }

        // -------------------------------------------------------------
        // Download Command
        // -------------------------------------------------------------
        int status = 0;
        pipeline.downloadPackages(count, [&status](std::exception_ptr error) {
            if (!error) {
                return;
            }
            status = 1;
            try {
                std::rethrow_exception(error);
            } catch (const std::exception& e) {
                reportError(e);
            }
        });
        return status;
    }
    catch (const std::exception& e) {
        reportError(e);
        return 1;
    }
}
