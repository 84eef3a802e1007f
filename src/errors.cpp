#include "errors.hpp"

namespace Depfetch {

namespace {

    std::string describe(std::exception_ptr cause)
    {
        try {
            std::rethrow_exception(cause);
        } catch (const std::exception& e) {
            return e.what();
        } catch (...) {
            return "unknown error";
        }
    }

} // end anonymous namespace

FetchError::FetchError(const std::string& target, long status)
    : std::runtime_error("GET " + target + " returned " + std::to_string(status)),
      target_(target),
      status_(status)
{
}

FetchError::FetchError(const std::string& target, const std::string& transportError)
    : std::runtime_error("GET " + target + " failed: " + transportError),
      target_(target),
      status_(0)
{
}

BatchError::BatchError(std::size_t index, std::exception_ptr cause)
    : std::runtime_error("job #" + std::to_string(index) + " failed: " + describe(cause)),
      index_(index),
      cause_(cause)
{
}

void BatchError::rethrowCause() const
{
    std::rethrow_exception(cause_);
}

} // namespace Depfetch
