#pragma once

/**
 * @file
 * @brief Error value carried by `result<T>` and delivered to error callbacks.
 */

#include <cerrno>
#include <string>
#include <system_error>

namespace offload {

/**
 * @brief Library error codes, reported in the `offload` category.
 */
enum class work_errc {
    /// Task body observed a cancellation request at a checkpoint.
    cancelled = 1,
    /// Task body failed; details live in the error message.
    failed = 2,
    /// Task body threw something not derived from `std::exception`.
    unhandled_exception = 3,
    /// Submission was attempted after the pool shut down.
    pool_closed = 4,
};

/// @return Category singleton for `work_errc` values.
[[nodiscard]] const std::error_category& work_category() noexcept;

/// @brief Enables implicit conversion of `work_errc` to `std::error_code`.
[[nodiscard]] std::error_code make_error_code(work_errc code) noexcept;

/**
 * @brief Error value used across `result<T>`.
 *
 * Wraps a `std::error_code` together with an optional human-readable message.
 * The message is what error callbacks receive, so task bodies should phrase it
 * for direct display.
 */
class error {
public:
    /// Construct a success-like empty error (`value() == 0`).
    error() = default;
    /// Construct from an explicit error code.
    explicit error(std::error_code code) noexcept;
    /// Construct from an error code and a display message.
    error(std::error_code code, std::string message);

    /**
     * @brief Build an error from errno.
     * @param value errno value. Defaults to current `errno`.
     * @return Converted `error` in the system category.
     */
    [[nodiscard]] static error from_errno(int value = errno) noexcept;

    /// @return Underlying `std::error_code`.
    [[nodiscard]] std::error_code code() const noexcept;
    /// @return Integer code value.
    [[nodiscard]] int value() const noexcept;
    /// @return Explicit message if one was given, else the code's message.
    [[nodiscard]] std::string message() const;
    /// @return `true` when this is the distinguished cancellation signal.
    [[nodiscard]] bool is_cancellation() const noexcept;

private:
    std::error_code code_;
    std::string message_;
};

/**
 * @brief Convenience helper that wraps an errno value into `error`.
 * @param value errno value to convert.
 */
[[nodiscard]] error make_error_from_errno(int value) noexcept;

/// @brief Build an error carrying only a library code.
[[nodiscard]] error make_error(work_errc code);

/// @brief Build a `work_errc::failed` error with a display message.
[[nodiscard]] error make_error(std::string message);

} // namespace offload

template <>
struct std::is_error_code_enum<offload::work_errc> : std::true_type {};
