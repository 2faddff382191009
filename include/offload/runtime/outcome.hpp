#pragma once

/**
 * @file
 * @brief Tagged terminal result a worker thread hands to the main thread.
 */

#include <string>
#include <utility>
#include <variant>

namespace offload::runtime {

/// @brief The body returned a value.
template <class T>
struct done_outcome {
    T value;
};

template <>
struct done_outcome<void> {};

/// @brief The body failed; `message` is ready for display.
struct error_outcome {
    std::string message;
};

/// @brief The body observed cancellation at a checkpoint.
struct cancel_outcome {};

template <class T>
using outcome = std::variant<done_outcome<T>, error_outcome, cancel_outcome>;

/// @brief Lambda overload set for `std::visit`.
template <class... Ts>
struct overloads : Ts... {
    using Ts::operator()...;
};

template <class... Ts>
overloads(Ts...) -> overloads<Ts...>;

} // namespace offload::runtime
