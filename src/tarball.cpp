#include "tarball.hpp"
#include "errors.hpp"
#include "gzip.hpp"
#include "utils.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <memory>
#include <set>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace Depfetch {

const char* const tarballWrapperSegment = "package";

namespace {

    using ArchiveReader = std::unique_ptr<struct archive, decltype(&archive_read_free)>;
    using ArchiveWriter = std::unique_ptr<struct archive, decltype(&archive_write_free)>;

    std::string errorString(struct archive* a)
    {
        const char* msg = archive_error_string(a);
        return msg ? msg : "unknown libarchive error";
    }

    /**
     * -------------------------------------------------------------------
     * escapesRoot
     *
     * True for absolute entry paths and for any path with a ".." segment.
     * Such entries could write outside the extraction root.
     * -------------------------------------------------------------------
     */
    bool escapesRoot(const std::string& entryPath)
    {
        if (!entryPath.empty() && (entryPath[0] == '/' || entryPath[0] == '\\')) {
            return true;
        }

        std::istringstream iss(entryPath);
        std::string segment;
        while (std::getline(iss, segment, '/')) {
            if (segment == "..") {
                return true;
            }
        }
        return false;
    }

    /**
     * -------------------------------------------------------------------
     * passesThroughLink
     *
     * True if a directory component of `relativePath` is one of the
     * symlinks already written from this archive.
     * -------------------------------------------------------------------
     */
    bool passesThroughLink(const std::string& relativePath,
                           const std::set<std::string>& links)
    {
        for (size_t slash = relativePath.find('/'); slash != std::string::npos;
             slash = relativePath.find('/', slash + 1)) {
            if (links.count(relativePath.substr(0, slash))) {
                return true;
            }
        }
        return false;
    }

    std::string withoutTrailingSlashes(std::string path)
    {
        while (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        return path;
    }

    /**
     * -------------------------------------------------------------------
     * copy_data
     *
     * Copies the data blocks of the current entry from the reading archive
     * to the disk writer.
     * -------------------------------------------------------------------
     */
    void copy_data(struct archive* ar, struct archive* aw)
    {
        const void* buff;
        size_t size;
        la_int64_t offset;
        int r;

        while (true) {
            r = archive_read_data_block(ar, &buff, &size, &offset);
            if (r == ARCHIVE_EOF) {
                return; // End of this entry
            }
            if (r == ARCHIVE_RETRY) {
                continue;
            }
            if (r < ARCHIVE_WARN) {
                throw ExtractionError("reading entry data: " + errorString(ar));
            }

            if (archive_write_data_block(aw, buff, size, offset) < ARCHIVE_OK) {
                throw ExtractionError("writing entry data: " + errorString(aw));
            }
        }
    }

} // end anonymous namespace

std::string remapWrapperSegment(const std::string& entryPath,
                                const std::string& folderName)
{
    std::string path = entryPath;
    while (path.rfind("./", 0) == 0) {
        path.erase(0, 2);
    }

    const std::string wrapper = tarballWrapperSegment;
    if (path == wrapper) {
        return folderName;
    }
    if (path.rfind(wrapper + "/", 0) == 0) {
        return folderName + path.substr(wrapper.size());
    }
    return path;
}

size_t extractTarball(const std::string& compressed,
                      const std::string& destRoot,
                      const std::string& folderName)
{
    if (!looksLikeGzip(compressed)) {
        throw DecompressionError("archive is not a gzip stream");
    }

    std::error_code ec;
    fs::create_directories(destRoot, ec);
    if (ec) {
        throw ExtractionError("cannot create " + destRoot + ": " + ec.message());
    }

    ArchiveReader a(archive_read_new(), &archive_read_free);
    ArchiveWriter ext(archive_write_disk_new(), &archive_write_free);
    if (!a || !ext) {
        throw ExtractionError("archive_read_new or archive_write_disk_new failed");
    }

    archive_read_support_filter_gzip(a.get());
    archive_read_support_format_tar(a.get());

    // Preserve mtime and permission bits. Entry paths are checked by
    // escapesRoot() since destRoot itself may legitimately contain "..".
    int extract_flags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM;
    archive_write_disk_set_options(ext.get(), extract_flags);
    archive_write_disk_set_standard_lookup(ext.get());

    if (archive_read_open_memory(a.get(), compressed.data(), compressed.size()) != ARCHIVE_OK) {
        throw ExtractionError("opening archive: " + errorString(a.get()));
    }

    size_t written = 0;
    std::set<std::string> symlinksWritten;
    struct archive_entry* entry;
    int r;

    while ((r = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK
           || r == ARCHIVE_WARN) {

        const char* rawPath = archive_entry_pathname(entry);
        if (!rawPath) {
            throw ExtractionError("entry without a path name");
        }

        std::string origPath = rawPath;
        if (escapesRoot(origPath)) {
            throw ExtractionError("entry escapes the extraction root: " + origPath);
        }

        std::string relativePath = remapWrapperSegment(origPath, folderName);
        if (relativePath.empty()) {
            archive_read_data_skip(a.get());
            continue;
        }

        if (passesThroughLink(relativePath, symlinksWritten)) {
            throw ExtractionError("entry is written through a symlink: " + origPath);
        }

        // Symlinks may only point below their own directory
        if (archive_entry_filetype(entry) == AE_IFLNK) {
            const char* target = archive_entry_symlink(entry);
            std::string targetStr = target ? target : "";
            if (escapesRoot(targetStr)) {
                throw ExtractionError("symlink " + origPath + " points outside the extraction root: "
                                      + targetStr);
            }
            symlinksWritten.insert(withoutTrailingSlashes(relativePath));
        }

        fs::path fullDestPath = fs::path(destRoot) / relativePath;
        archive_entry_set_pathname(entry, fullDestPath.string().c_str());

        // Hardlinks point at other entries of the same archive, so they get
        // the same remapping.
        const char* hl_target = archive_entry_hardlink(entry);
        if (hl_target) {
            std::string hl_target_str(hl_target);
            if (escapesRoot(hl_target_str)) {
                throw ExtractionError("hardlink escapes the extraction root: " + hl_target_str);
            }
            fs::path fullLinkTarget = fs::path(destRoot) / remapWrapperSegment(hl_target_str, folderName);
            archive_entry_set_hardlink(entry, fullLinkTarget.string().c_str());
        }

        r = archive_write_header(ext.get(), entry);
        if (r < ARCHIVE_WARN) {
            throw ExtractionError(fullDestPath.string() + ": " + errorString(ext.get()));
        }
        if (r == ARCHIVE_WARN) {
            log_warning("archive_write_header for " + fullDestPath.string() + ": "
                        + errorString(ext.get()));
        }

        if (archive_entry_size(entry) > 0) {
            copy_data(a.get(), ext.get());
        }

        r = archive_write_finish_entry(ext.get());
        if (r < ARCHIVE_WARN) {
            throw ExtractionError(fullDestPath.string() + ": " + errorString(ext.get()));
        }

        ++written;
    }

    // Anything other than a clean end of archive means a damaged stream
    if (r != ARCHIVE_EOF) {
        throw ExtractionError("reading archive header: " + errorString(a.get()));
    }

    // Closing the disk writer flushes deferred metadata (directory times,
    // permissions); extraction is only complete once it succeeds.
    if (archive_write_close(ext.get()) != ARCHIVE_OK) {
        throw ExtractionError("finishing extraction: " + errorString(ext.get()));
    }

    return written;
}

} // namespace Depfetch
