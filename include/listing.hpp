#ifndef LISTING_HPP
#define LISTING_HPP

#include <functional>
#include <string>
#include <vector>

namespace Depfetch {

class Config;
class HttpClient;

/**
 * @brief One package release: registry name (possibly "@scope/name") and
 *        version.
 */
struct PackageRef {
    std::string name;
    std::string version;

    bool operator==(const PackageRef& other) const {
        return name == other.name && version == other.version;
    }
    bool operator!=(const PackageRef& other) const { return !(*this == other); }
};

/**
 * @brief Turns the text of one listing page into the packages it shows, in
 *        order of appearance.
 */
using PageExtractor = std::function<std::vector<PackageRef>(const std::string&)>;

/**
 * @brief Default PageExtractor for the npm "most depended upon" page.
 *
 * Matches every `<a class="version" href="/package/NAME">VERSION</a>`
 * anchor; the markup is assumed to be well formed.
 */
std::vector<PackageRef> extractDependedPackages(const std::string& pageText);

/**
 * @class ListingFetcher
 * @brief Fetches one page of the ranked package listing.
 */
class ListingFetcher
{
public:
    ListingFetcher(HttpClient& http,
                   const Config& config,
                   PageExtractor extractor = extractDependedPackages);

    /**
     * @brief Builds the URL of the listing page at `offset`.
     */
    std::string pageUrl(int offset) const;

    /**
     * @brief Fetches, inflates and parses the listing page at `offset`.
     *
     * The request asks for a gzip-encoded body. Safe to call from several
     * threads at once.
     *
     * @param offset Index of the first package on the page.
     * @return The page's packages in order of appearance.
     * @throws FetchError if the status is not 200.
     * @throws DecompressionError if the body is not valid gzip.
     */
    std::vector<PackageRef> fetchListingPage(int offset) const;

private:
    HttpClient&   http_;
    std::string   listingUrl_;
    PageExtractor extractor_;
};

} // namespace Depfetch

#endif // LISTING_HPP
