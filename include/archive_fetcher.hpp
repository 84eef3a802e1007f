#ifndef ARCHIVE_FETCHER_HPP
#define ARCHIVE_FETCHER_HPP

#include <string>

namespace Depfetch {

class Config;
class HttpClient;

/**
 * @brief Registry path of a package tarball, relative to the registry root.
 *
 * Scoped names put the scope in front: "@scope/name" 1.2.3 gives
 * "@scope/name/-/name-1.2.3.tgz", plain "lodash" 4.17.0 gives
 * "lodash/-/lodash-4.17.0.tgz".
 */
std::string tarballPath(const std::string& packageName, const std::string& version);

/**
 * @brief Directory name a package is extracted to: its percent-encoded name,
 *        e.g. "%40scope%2Fname".
 */
std::string packageFolderName(const std::string& packageName);

/**
 * @class ArchiveFetcher
 * @brief Downloads a package tarball from the registry and unpacks it under
 *        the output directory as `<outputDir>/<packageFolderName>/...`.
 */
class ArchiveFetcher
{
public:
    ArchiveFetcher(HttpClient& http, const Config& config);

    /**
     * @brief Full download URL of a package tarball.
     */
    std::string tarballUrl(const std::string& packageName, const std::string& version) const;

    /**
     * @brief Fetches and extracts one package release.
     *
     * Safe to call from several threads at once for different packages.
     *
     * @return packageName, once every entry has been written to disk.
     * @throws FetchError if the status is not 200.
     * @throws DecompressionError if the body is not gzip.
     * @throws ExtractionError on a malformed archive or I/O failure.
     */
    std::string fetchAndExtract(const std::string& packageName,
                                const std::string& version) const;

    const std::string& outputDir() const { return outputDir_; }

private:
    HttpClient& http_;
    std::string registry_;
    std::string outputDir_;
};

} // namespace Depfetch

#endif // ARCHIVE_FETCHER_HPP
