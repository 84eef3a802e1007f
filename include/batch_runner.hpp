#ifndef BATCH_RUNNER_HPP
#define BATCH_RUNNER_HPP

#include "errors.hpp"

#include <algorithm>   // std::min
#include <cstddef>
#include <exception>
#include <functional>  // std::invoke
#include <future>      // std::async, std::future
#include <iterator>    // std::make_move_iterator
#include <tuple>       // std::apply, std::tuple_size
#include <type_traits>
#include <utility>
#include <vector>

namespace Depfetch {

namespace detail {

    template <typename T>
    struct is_vector : std::false_type {};

    template <typename T, typename A>
    struct is_vector<std::vector<T, A>> : std::true_type {};

    // std::pair, std::tuple and std::array jobs are spread into the transform.
    template <typename T, typename = void>
    struct is_tuple_like : std::false_type {};

    template <typename T>
    struct is_tuple_like<T, std::void_t<decltype(std::tuple_size<T>::value)>> : std::true_type {};

    // A transform returning std::vector<R> contributes R elements; anything
    // else contributes itself.
    template <typename U>
    struct flat_element { using type = U; };

    template <typename T, typename A>
    struct flat_element<std::vector<T, A>> { using type = T; };

    template <typename Fn, typename T>
    auto invokeJob(Fn& fn, const T& job)
    {
        if constexpr (is_tuple_like<T>::value) {
            return std::apply(fn, job);
        } else {
            return std::invoke(fn, job);
        }
    }

    template <typename E, typename U>
    void appendFlat(std::vector<E>& out, U&& value)
    {
        if constexpr (is_vector<std::decay_t<U>>::value) {
            out.insert(out.end(),
                       std::make_move_iterator(value.begin()),
                       std::make_move_iterator(value.end()));
        } else {
            out.push_back(std::forward<U>(value));
        }
    }

} // namespace detail

/**
 * @brief Applies `transform` to every input with at most `maxConcurrent`
 *        jobs running at once, and returns the flattened results in input
 *        order.
 *
 * Inputs are taken in consecutive chunks of `maxConcurrent`. Every job of a
 * chunk gets its own asynchronous task, and the whole chunk is joined before
 * the next one starts, so completion order never affects result order.
 *
 * `transform` is shared by the concurrent jobs of a chunk and must be safe
 * to call from several threads.
 *
 * @param inputs        The jobs. Never modified.
 * @param transform     Called once per job. Jobs that are pairs or tuples are
 *                      spread into positional arguments.
 * @param maxConcurrent Chunk size; values below 1 mean 1.
 * @return Every result, a transform returning a vector contributing each of
 *         its elements.
 * @throws BatchError for the lowest-indexed failing job of the first chunk
 *         that has a failure. Later chunks are never started and earlier
 *         results are dropped.
 */
template <typename T, typename Fn>
auto runBatched(const std::vector<T>& inputs, Fn transform, int maxConcurrent = 1)
{
    using JobResult = std::decay_t<decltype(detail::invokeJob(transform, std::declval<const T&>()))>;
    using Element   = typename detail::flat_element<JobResult>::type;
    static_assert(!std::is_void<JobResult>::value,
                  "runBatched transforms must return a value");

    std::vector<Element> results;
    const std::size_t limit = maxConcurrent > 0 ? static_cast<std::size_t>(maxConcurrent) : 1;

    for (std::size_t cursor = 0; cursor < inputs.size(); cursor += limit) {
        const std::size_t end = std::min(inputs.size(), cursor + limit);

        std::vector<std::future<JobResult>> inFlight;
        inFlight.reserve(end - cursor);
        for (std::size_t i = cursor; i < end; ++i) {
            const T& job = inputs[i];
            inFlight.push_back(std::async(std::launch::async, [&transform, &job]() {
                return detail::invokeJob(transform, job);
            }));
        }

        // Join every job of the chunk, even after a failure, so nothing of
        // this chunk is still running when we return or throw.
        std::vector<JobResult> settled;
        settled.reserve(inFlight.size());
        std::exception_ptr firstError;
        std::size_t failedIndex = 0;

        for (std::size_t k = 0; k < inFlight.size(); ++k) {
            try {
                settled.push_back(inFlight[k].get());
            } catch (...) {
                if (!firstError) {
                    firstError  = std::current_exception();
                    failedIndex = cursor + k;
                }
            }
        }

        if (firstError) {
            throw BatchError(failedIndex, firstError);
        }

        for (auto& value : settled) {
            detail::appendFlat(results, std::move(value));
        }
    }

    return results;
}

} // namespace Depfetch

#endif // BATCH_RUNNER_HPP
