#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "archive_fetcher.hpp"
#include "config.hpp"
#include "listing.hpp"

#include <exception>
#include <functional>
#include <string>
#include <vector>

namespace Depfetch {

class HttpClient;

/**
 * @brief Offsets of the listing pages needed to cover `count` packages:
 *        0, pageSize, 2*pageSize, ... while the offset is below `count`.
 *
 * A count of 50 with pages of 36 gives {0, 36}. Counts below 1 give no
 * pages.
 */
std::vector<int> pageOffsets(int count, int pageSize);

/**
 * @class Pipeline
 * @brief Finds the top packages of the listing and extracts their archives.
 *
 * Stage one fetches listing pages through runBatched() and keeps the first
 * `count` packages in listing order. Stage two runs ArchiveFetcher over
 * exactly those packages, also through runBatched(). The first error of
 * either stage ends the run.
 */
class Pipeline
{
public:
    Pipeline(HttpClient& http,
             const Config& config,
             PageExtractor extractor = extractDependedPackages);

    /**
     * @brief Runs the listing stage only.
     *
     * @param count Number of packages wanted.
     * @return At most `count` packages in listing order.
     * @throws BatchError wrapping the first page failure.
     */
    std::vector<PackageRef> listPackages(int count) const;

    /**
     * @brief Lists the top `count` packages and extracts each of them.
     *
     * Packages extracted before a failure stay on disk.
     *
     * @return The names of the extracted packages, in listing order.
     * @throws BatchError wrapping the first failure of either stage.
     */
    std::vector<std::string> downloadPackages(int count) const;

    /**
     * @brief Completion-callback form of downloadPackages(int).
     *
     * `done` receives a null exception_ptr on success, or the error that
     * ended the run.
     */
    void downloadPackages(int count,
                          const std::function<void(std::exception_ptr)>& done) const;

private:
    Config         config_;
    ListingFetcher listing_;
    ArchiveFetcher archives_;
};

} // namespace Depfetch

#endif // PIPELINE_HPP
