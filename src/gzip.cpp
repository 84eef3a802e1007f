#include "gzip.hpp"
#include "errors.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <memory>
#include <vector>

namespace Depfetch {

namespace {

    // Read buffer handed to archive_read_data.
    const size_t inflateChunkSize = 65536;

    using ArchiveReader = std::unique_ptr<struct archive, decltype(&archive_read_free)>;

    std::string errorString(struct archive* a)
    {
        const char* msg = archive_error_string(a);
        return msg ? msg : "unknown libarchive error";
    }

} // end anonymous namespace

bool looksLikeGzip(const std::string& data)
{
    return data.size() >= 2
        && static_cast<unsigned char>(data[0]) == 0x1f
        && static_cast<unsigned char>(data[1]) == 0x8b;
}

std::string gunzip(const std::string& compressed)
{
    if (!looksLikeGzip(compressed)) {
        throw DecompressionError("input is not a gzip stream");
    }

    ArchiveReader a(archive_read_new(), &archive_read_free);
    if (!a) {
        throw DecompressionError("archive_read_new failed");
    }

    // The "raw" format treats the whole decompressed stream as one entry.
    archive_read_support_filter_gzip(a.get());
    archive_read_support_format_raw(a.get());

    if (archive_read_open_memory(a.get(), compressed.data(), compressed.size()) != ARCHIVE_OK) {
        throw DecompressionError(errorString(a.get()));
    }

    struct archive_entry* entry;
    if (archive_read_next_header(a.get(), &entry) != ARCHIVE_OK) {
        throw DecompressionError(errorString(a.get()));
    }

    std::string plain;
    std::vector<char> buffer(inflateChunkSize);

    while (true) {
        la_ssize_t n = archive_read_data(a.get(), buffer.data(), inflateChunkSize);
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (n == ARCHIVE_RETRY) {
                continue;
            }
            throw DecompressionError(errorString(a.get()));
        }
        plain.append(buffer.data(), static_cast<size_t>(n));
    }

    return plain;
}

} // namespace Depfetch
