#pragma once

#include <future>
#include <utility>

#include <oneapi/tbb/blocked_range.h>
#include <oneapi/tbb/parallel_for.h>

namespace drisk::core {

/// @brief Run a given function asynchronous
/// @tparam F Function type
/// @tparam ...Ts Function parameters type
/// @param action The action to run
/// @param ...params The action parameters
/// @return The std::future referring to the function call.
template <class F, class... Ts> auto run_async(F &&action, Ts &&...params) {
    return std::async(std::launch::async, std::forward<F>(action), std::forward<Ts>(params)...);
}

/// @brief Calls func for every index in [first, last), in parallel
/// @details Each call must only write to state owned by its index.
template <class Index, class UnaryFunction>
void parallel_for(Index first, Index last, const UnaryFunction &func) {
    if (last <= first) {
        return;
    }

    tbb::parallel_for(tbb::blocked_range<Index>(first, last),
                      [&func](const tbb::blocked_range<Index> &range) {
                          for (auto index = range.begin(); index != range.end(); ++index) {
                              func(index);
                          }
                      });
}

} // namespace drisk::core
