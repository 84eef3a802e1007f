#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <string>

namespace Depfetch {

class Config
{
public:
    /**
     * @brief Base URL of the registry serving package tarballs.
     */
    std::string registry = "https://registry.npmjs.org";

    /**
     * @brief Listing page ranking packages by dependent count. The page
     *        offset is appended as "?offset=N".
     */
    std::string listingUrl = "https://www.npmjs.com/browse/depended";

    /**
     * @brief Number of packages on one listing page.
     */
    int pageSize = 36;

    /**
     * @brief Listing pages fetched at once.
     */
    int listingConcurrency = 3;

    /**
     * @brief Package archives fetched and extracted at once.
     */
    int downloadConcurrency = 3;

    /**
     * @brief Root directory that receives one subdirectory per package.
     */
    std::string outputDir = "./packages";

    std::string userAgent = "depfetch/1.0";

    /**
     * @brief Connection timeout in seconds.
     */
    long connectTimeout = 15;

    /**
     * @brief Whole-transfer timeout in seconds.
     */
    long timeout = 300;

    /**
     * @brief Loads configuration from a YAML file on disk.
     *
     * A missing file yields the defaults. Keys absent from the file keep
     * their defaults.
     *
     * @param path Path to the configuration file.
     * @return A fully populated Config instance.
     * @throws std::runtime_error if the file is malformed or a value is invalid.
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Saves the current configuration to a YAML file.
     * @param path Path to the file where configuration should be saved.
     */
    void saveToFile(const std::string& path) const;

    /**
     * @brief Prints the effective configuration to standard output.
     */
    void print() const;
};

} // namespace Depfetch

#endif // CONFIG_HPP
