#pragma once

/**
 * @file
 * @brief RAII ownership wrapper for POSIX file descriptors.
 */

#include "offload/core/result.hpp"

#include <utility>

namespace offload {

/**
 * @brief Move-only owner of a file descriptor.
 */
class unique_fd {
public:
    /// Construct an empty handle (`fd == -1`).
    unique_fd() noexcept = default;
    /// Take ownership of an existing descriptor.
    explicit unique_fd(int fd) noexcept;
    /// Close the descriptor if still owned.
    ~unique_fd() noexcept;

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    unique_fd(unique_fd&& other) noexcept;
    unique_fd& operator=(unique_fd&& other) noexcept;

    /// @return Owned file descriptor or `-1`.
    [[nodiscard]] int get() const noexcept;
    /// @return `true` when the object owns a valid descriptor.
    [[nodiscard]] bool valid() const noexcept;
    [[nodiscard]] explicit operator bool() const noexcept;

    /**
     * @brief Release ownership without closing.
     * @return Previously owned descriptor or `-1`.
     */
    [[nodiscard]] int release() noexcept;
    /**
     * @brief Replace the owned descriptor.
     * @param fd New descriptor. Defaults to `-1` (close and clear).
     */
    void reset(int fd = -1) noexcept;

private:
    int fd_{-1};
};

/// @brief Read and write ends of a pipe.
struct pipe_pair {
    unique_fd read_end{};
    unique_fd write_end{};
};

/**
 * @brief Create a close-on-exec pipe.
 * @param flags Extra `pipe2` flags such as `O_NONBLOCK`.
 */
[[nodiscard]] result<pipe_pair> make_pipe(int flags = 0) noexcept;

} // namespace offload
