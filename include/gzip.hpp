#ifndef GZIP_HPP
#define GZIP_HPP

#include <string>

namespace Depfetch {

/**
 * @brief Checks for the two gzip magic bytes at the start of a buffer.
 */
bool looksLikeGzip(const std::string& data);

/**
 * @brief Inflates a complete gzip stream held in memory.
 *
 * @param compressed The raw gzip bytes.
 * @return The decompressed bytes.
 * @throws DecompressionError if the input is not gzip or is corrupt.
 */
std::string gunzip(const std::string& compressed);

} // namespace Depfetch

#endif // GZIP_HPP
