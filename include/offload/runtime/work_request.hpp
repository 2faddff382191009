#pragma once

/**
 * @file
 * @brief Task body plus the callbacks that receive its notifications.
 */

#include "offload/core/result.hpp"
#include "offload/runtime/work_context.hpp"

#include <functional>
#include <string>

namespace offload::runtime {

namespace detail {

template <class T>
struct done_callback {
    using type = std::function<void(T)>;
};

template <>
struct done_callback<void> {
    using type = std::function<void()>;
};

} // namespace detail

/**
 * @brief Description of one unit of background work.
 *
 * `body` runs on a worker thread; every callback runs on the main thread.
 * Callbacks left empty are skipped. The pool takes the request by value and
 * never modifies it afterwards.
 *
 * @tparam T Result type of the task body.
 */
template <class T>
struct work_request {
    using value_type = T;
    using body_type = std::function<result<T>(work_context&)>;
    using done_type = typename detail::done_callback<T>::type;
    using error_type = std::function<void(const std::string&)>;
    using progress_type = std::function<void(int, const std::string&)>;
    using cancel_type = std::function<void()>;

    body_type body{};
    done_type on_done{};
    error_type on_error{};
    progress_type on_progress{};
    cancel_type on_cancel{};
    /// Label used in log output.
    std::string name{};
};

} // namespace offload::runtime
