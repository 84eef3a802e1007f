#include "testing/support.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <fstream>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace Depfetch::testing {

namespace {

    using ArchiveWriter = std::unique_ptr<struct archive, decltype(&archive_write_free)>;
    using EntryPtr      = std::unique_ptr<struct archive_entry, decltype(&archive_entry_free)>;

    la_ssize_t appendToString(struct archive*, void* client, const void* buff, size_t length)
    {
        static_cast<std::string*>(client)->append(static_cast<const char*>(buff), length);
        return static_cast<la_ssize_t>(length);
    }

    void check(struct archive* a, int r, const char* what)
    {
        if (r < ARCHIVE_WARN) {
            const char* msg = archive_error_string(a);
            throw std::runtime_error(std::string(what) + ": " + (msg ? msg : "?"));
        }
    }

    void writeFileEntry(struct archive* a, const std::string& path, const std::string& contents)
    {
        EntryPtr entry(archive_entry_new(), &archive_entry_free);
        archive_entry_set_pathname(entry.get(), path.c_str());
        archive_entry_set_filetype(entry.get(), AE_IFREG);
        archive_entry_set_perm(entry.get(), 0644);
        archive_entry_set_size(entry.get(), static_cast<la_int64_t>(contents.size()));

        check(a, archive_write_header(a, entry.get()), "archive_write_header");
        if (!contents.empty()) {
            la_ssize_t n = archive_write_data(a, contents.data(), contents.size());
            if (n < 0 || static_cast<size_t>(n) != contents.size()) {
                check(a, ARCHIVE_FATAL, "archive_write_data");
            }
        }
    }

    void writeLinkEntry(struct archive* a, const TarEntry& link)
    {
        EntryPtr entry(archive_entry_new(), &archive_entry_free);
        archive_entry_set_pathname(entry.get(), link.path.c_str());
        archive_entry_set_size(entry.get(), 0);

        if (link.kind == TarEntry::Symlink) {
            archive_entry_set_filetype(entry.get(), AE_IFLNK);
            archive_entry_set_perm(entry.get(), 0777);
            archive_entry_set_symlink(entry.get(), link.data.c_str());
        }
        else {
            archive_entry_set_filetype(entry.get(), AE_IFREG);
            archive_entry_set_perm(entry.get(), 0644);
            archive_entry_set_hardlink(entry.get(), link.data.c_str());
        }

        check(a, archive_write_header(a, entry.get()), "archive_write_header");
    }

    // Opens a gzip-compressed in-memory writer in the given format.
    ArchiveWriter openGzipWriter(std::string& out, int (*setFormat)(struct archive*))
    {
        ArchiveWriter a(archive_write_new(), &archive_write_free);
        check(a.get(), archive_write_add_filter_gzip(a.get()), "add_filter_gzip");
        check(a.get(), setFormat(a.get()), "set_format");
        // No block padding after the gzip trailer
        check(a.get(), archive_write_set_bytes_in_last_block(a.get(), 1), "bytes_in_last_block");
        check(a.get(), archive_write_open(a.get(), &out, nullptr, appendToString, nullptr),
              "archive_write_open");
        return a;
    }

} // end anonymous namespace

TempDir::TempDir()
{
    std::random_device rd;
    std::mt19937 mt(rd());
    std::uniform_int_distribution<unsigned long> dist(100000, 999999);

    path_ = fs::temp_directory_path() / ("depfetch-test-" + std::to_string(dist(mt)));
    fs::create_directories(path_);
}

TempDir::~TempDir()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::string gzipBytes(const std::string& plain)
{
    std::string out;
    {
        ArchiveWriter a = openGzipWriter(out, archive_write_set_format_raw);
        writeFileEntry(a.get(), "data", plain);
        check(a.get(), archive_write_close(a.get()), "archive_write_close");
    }
    return out;
}

std::string makeTarball(const std::vector<std::pair<std::string, std::string>>& files)
{
    std::string out;
    {
        ArchiveWriter a = openGzipWriter(out, archive_write_set_format_ustar);
        for (const auto& [path, contents] : files) {
            writeFileEntry(a.get(), path, contents);
        }
        check(a.get(), archive_write_close(a.get()), "archive_write_close");
    }
    return out;
}

std::string makeTarballEntries(const std::vector<TarEntry>& entries)
{
    std::string out;
    {
        ArchiveWriter a = openGzipWriter(out, archive_write_set_format_ustar);
        for (const auto& entry : entries) {
            if (entry.kind == TarEntry::File) {
                writeFileEntry(a.get(), entry.path, entry.data);
            }
            else {
                writeLinkEntry(a.get(), entry);
            }
        }
        check(a.get(), archive_write_close(a.get()), "archive_write_close");
    }
    return out;
}

std::string listingHtml(const std::vector<PackageRef>& packages)
{
    std::ostringstream html;
    html << "<html><body><ul>\n";
    for (const auto& pkg : packages) {
        html << "<li><h3>" << pkg.name << "</h3>"
             << "<p>A package</p>"
             << "<a class=\"version\" href=\"/package/" << pkg.name << "\">"
             << pkg.version << "</a></li>\n";
    }
    html << "</ul></body></html>\n";
    return html.str();
}

std::string readFile(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

FakeHttpClient::FakeHttpClient(Handler handler)
    : handler_(std::move(handler))
{
}

HttpResponse FakeHttpClient::get(const HttpRequest& request)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
    }
    return handler_(request);
}

std::vector<HttpRequest> FakeHttpClient::requests() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

size_t FakeHttpClient::countRequests(const std::string& needle) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& request : requests_) {
        if (request.url.find(needle) != std::string::npos) {
            ++count;
        }
    }
    return count;
}

} // namespace Depfetch::testing
