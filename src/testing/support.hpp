#ifndef TESTING_SUPPORT_HPP
#define TESTING_SUPPORT_HPP

#include "http_client.hpp"
#include "listing.hpp"

#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace Depfetch::testing {

namespace fs = std::filesystem;

/**
 * @brief A fresh directory under the system temp directory, removed with
 *        everything in it on destruction.
 */
class TempDir
{
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

/**
 * @brief gzip-compresses `plain` with libarchive's raw writer.
 */
std::string gzipBytes(const std::string& plain);

/**
 * @brief Builds a .tgz holding the given (path, contents) regular files.
 */
std::string makeTarball(const std::vector<std::pair<std::string, std::string>>& files);

/**
 * @brief One member of a test tarball. `data` is the file contents for
 *        File entries and the link target for Symlink and Hardlink entries.
 */
struct TarEntry
{
    enum Kind { File, Symlink, Hardlink };

    std::string path;
    Kind        kind;
    std::string data;
};

/**
 * @brief Builds a .tgz holding the given entries, in order.
 */
std::string makeTarballEntries(const std::vector<TarEntry>& entries);

/**
 * @brief HTML in the shape of the npm listing page, one version anchor per
 *        package.
 */
std::string listingHtml(const std::vector<PackageRef>& packages);

std::string readFile(const fs::path& path);

/**
 * @brief HttpClient answering from a handler and recording every request.
 */
class FakeHttpClient : public HttpClient
{
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    explicit FakeHttpClient(Handler handler);

    HttpResponse get(const HttpRequest& request) override;

    std::vector<HttpRequest> requests() const;

    /**
     * @brief Number of recorded requests whose URL contains `needle`.
     */
    size_t countRequests(const std::string& needle) const;

private:
    Handler                  handler_;
    mutable std::mutex       mutex_;
    std::vector<HttpRequest> requests_;
};

} // namespace Depfetch::testing

#endif // TESTING_SUPPORT_HPP
