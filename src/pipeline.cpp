#include "pipeline.hpp"
#include "batch_runner.hpp"
#include "http_client.hpp"
#include "utils.hpp"

#include <algorithm>
#include <utility>

namespace Depfetch {

std::vector<int> pageOffsets(int count, int pageSize)
{
    std::vector<int> offsets;
    if (pageSize <= 0) {
        return offsets;
    }
    // Wide enough that offset + pageSize cannot overflow near INT_MAX
    for (long long offset = 0; offset < count; offset += pageSize) {
        offsets.push_back(static_cast<int>(offset));
    }
    return offsets;
}

Pipeline::Pipeline(HttpClient& http, const Config& config, PageExtractor extractor)
    : config_(config),
      listing_(http, config_, std::move(extractor)),
      archives_(http, config_)
{
}

std::vector<PackageRef> Pipeline::listPackages(int count) const
{
    const std::vector<int> offsets = pageOffsets(count, config_.pageSize);

    std::vector<PackageRef> ranked = runBatched(
        offsets,
        [this](int offset) { return listing_.fetchListingPage(offset); },
        config_.listingConcurrency);

    if (ranked.size() > static_cast<size_t>(std::max(count, 0))) {
        ranked.resize(static_cast<size_t>(count));
    }

    log_message("Listing produced " + std::to_string(ranked.size()) + " packages from "
                + std::to_string(offsets.size()) + " pages");
    return ranked;
}

std::vector<std::string> Pipeline::downloadPackages(int count) const
{
    const std::vector<PackageRef> toDownload = listPackages(count);

    std::vector<std::string> extracted = runBatched(
        toDownload,
        [this](const PackageRef& pkg) {
            return archives_.fetchAndExtract(pkg.name, pkg.version);
        },
        config_.downloadConcurrency);

    log_message("Extracted " + std::to_string(extracted.size()) + " packages into "
                + archives_.outputDir());
    return extracted;
}

void Pipeline::downloadPackages(int count,
                                const std::function<void(std::exception_ptr)>& done) const
{
    std::exception_ptr error;
    try {
        downloadPackages(count);
    } catch (const std::exception&) {
        error = std::current_exception();
    }
    done(error);
}

} // namespace Depfetch
