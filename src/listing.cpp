#include "listing.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "gzip.hpp"
#include "http_client.hpp"
#include "utils.hpp"

#include <regex>
#include <utility>

namespace Depfetch {

std::vector<PackageRef> extractDependedPackages(const std::string& pageText)
{
    // Capture 1 is the package name, capture 2 its version.
    static const std::regex versionAnchor(
        R"re(<a class="version" href="/package/([^"]+)">([^<]+)</a>)re");

    std::vector<PackageRef> packages;
    auto begin = std::sregex_iterator(pageText.begin(), pageText.end(), versionAnchor);
    auto end   = std::sregex_iterator();

    for (auto it = begin; it != end; ++it) {
        packages.push_back(PackageRef{(*it)[1].str(), (*it)[2].str()});
    }
    return packages;
}

ListingFetcher::ListingFetcher(HttpClient& http,
                               const Config& config,
                               PageExtractor extractor)
    : http_(http),
      listingUrl_(config.listingUrl),
      extractor_(std::move(extractor))
{
}

std::string ListingFetcher::pageUrl(int offset) const
{
    const char separator = listingUrl_.find('?') == std::string::npos ? '?' : '&';
    return listingUrl_ + separator + "offset=" + std::to_string(offset);
}

std::vector<PackageRef> ListingFetcher::fetchListingPage(int offset) const
{
    HttpRequest request;
    request.url = pageUrl(offset);
    request.headers.push_back("Accept-Encoding: gzip,deflate");

    HttpResponse response = http_.get(request);
    if (response.status != 200) {
        throw FetchError(stripScheme(request.url), response.status);
    }

    // Inflate the whole body first; only complete text goes to the extractor.
    std::string pageText = gunzip(response.body);
    std::vector<PackageRef> packages = extractor_(pageText);

    log_message("Listing page at offset " + std::to_string(offset) + ": "
                + std::to_string(packages.size()) + " packages");
    return packages;
}

} // namespace Depfetch
