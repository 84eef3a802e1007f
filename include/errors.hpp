#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>

namespace Depfetch {

/**
 * @class FetchError
 * @brief An HTTP request did not come back with status 200.
 *
 * A status of 0 means the transfer itself failed (DNS, connect, timeout)
 * and no response was received.
 */
class FetchError : public std::runtime_error
{
public:
    FetchError(const std::string& target, long status);
    FetchError(const std::string& target, const std::string& transportError);

    const std::string& target() const { return target_; }
    long status() const { return status_; }

private:
    std::string target_;
    long        status_;
};

/**
 * @class DecompressionError
 * @brief A response body that should be gzip was not, or was corrupt.
 */
class DecompressionError : public std::runtime_error
{
public:
    explicit DecompressionError(const std::string& message)
        : std::runtime_error("Decompression failed: " + message) {}
};

/**
 * @class ExtractionError
 * @brief A tar entry was malformed, or writing it to disk failed.
 */
class ExtractionError : public std::runtime_error
{
public:
    explicit ExtractionError(const std::string& message)
        : std::runtime_error("Extraction failed: " + message) {}
};

/**
 * @class BatchError
 * @brief The first failure of a batch run.
 *
 * Holds the index of the input whose job failed and the original
 * exception, unchanged.
 */
class BatchError : public std::runtime_error
{
public:
    BatchError(std::size_t index, std::exception_ptr cause);

    std::size_t index() const { return index_; }
    std::exception_ptr cause() const { return cause_; }

    /**
     * @brief Rethrows the original exception.
     */
    [[noreturn]] void rethrowCause() const;

private:
    std::size_t        index_;
    std::exception_ptr cause_;
};

} // namespace Depfetch

#endif // ERRORS_HPP
