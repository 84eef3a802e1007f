#ifndef TARBALL_HPP
#define TARBALL_HPP

#include <string>

namespace Depfetch {

/**
 * @brief Top-level directory every registry tarball wraps its files in.
 */
extern const char* const tarballWrapperSegment;

/**
 * @brief Replaces a leading wrapper segment of an entry path.
 *
 * "package/lib/x.js" becomes "<folderName>/lib/x.js" and "package" alone
 * becomes "<folderName>". Paths whose first segment is anything else
 * (including "packages/...") are returned unchanged. A leading "./" is
 * dropped before matching.
 *
 * @param entryPath  The path as stored in the archive.
 * @param folderName The replacement for the wrapper segment.
 * @return The remapped relative path.
 */
std::string remapWrapperSegment(const std::string& entryPath,
                                const std::string& folderName);

/**
 * @brief Extracts an in-memory tar.gz under destRoot, renaming the wrapper
 *        segment of every entry to folderName.
 *
 * Entries that would land outside destRoot are refused: absolute paths,
 * ".." segments, symlinks whose target is absolute or climbs with "..",
 * and entries written through a symlink extracted earlier from the same
 * archive.
 *
 * @param compressed The gzip-compressed tar bytes.
 * @param destRoot   Directory receiving the package folder (created if missing).
 * @param folderName Name given to the wrapper directory on disk.
 * @return The number of entries written.
 * @throws DecompressionError if the data is not gzip.
 * @throws ExtractionError on a malformed entry or any filesystem failure.
 */
size_t extractTarball(const std::string& compressed,
                      const std::string& destRoot,
                      const std::string& folderName);

} // namespace Depfetch

#endif // TARBALL_HPP
