#include "archive_fetcher.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http_client.hpp"
#include "tarball.hpp"
#include "utils.hpp"

namespace Depfetch {

std::string tarballPath(const std::string& packageName, const std::string& version)
{
    std::string org;
    std::string name = packageName;

    // "@org/name": the org part keeps its trailing slash
    if (!packageName.empty() && packageName[0] == '@') {
        size_t slash = packageName.find('/');
        size_t index = (slash == std::string::npos) ? 0 : slash + 1;
        org  = packageName.substr(0, index);
        name = packageName.substr(index);
    }

    return org + name + "/-/" + name + "-" + version + ".tgz";
}

std::string packageFolderName(const std::string& packageName)
{
    return percentEncode(packageName);
}

ArchiveFetcher::ArchiveFetcher(HttpClient& http, const Config& config)
    : http_(http),
      registry_(config.registry),
      outputDir_(config.outputDir)
{
    while (!registry_.empty() && registry_.back() == '/') {
        registry_.pop_back();
    }
}

std::string ArchiveFetcher::tarballUrl(const std::string& packageName,
                                       const std::string& version) const
{
    return registry_ + "/" + tarballPath(packageName, version);
}

std::string ArchiveFetcher::fetchAndExtract(const std::string& packageName,
                                            const std::string& version) const
{
    HttpRequest request;
    request.url = tarballUrl(packageName, version);

    HttpResponse response = http_.get(request);
    if (response.status != 200) {
        throw FetchError(stripScheme(request.url), response.status);
    }

    const std::string folderName = packageFolderName(packageName);
    size_t entries = extractTarball(response.body, outputDir_, folderName);

    log_message("Extracted " + packageName + "@" + version + " ("
                + std::to_string(entries) + " entries) into "
                + outputDir_ + "/" + folderName);
    return packageName;
}

} // namespace Depfetch
