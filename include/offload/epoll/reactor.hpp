#pragma once

/**
 * @file
 * @brief Thin epoll wrapper that lets the main loop sleep until woken.
 */

#include "offload/core/result.hpp"
#include "offload/core/unique_fd.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace offload::epoll {

/**
 * @brief One `epoll_wait` readiness event.
 */
struct ready_event {
    /// Ready file descriptor.
    int fd{-1};
    /// Ready bitmask (`EPOLLIN`, `EPOLLERR`, ...).
    std::uint32_t events{0};
};

/**
 * @brief RAII wrapper over an epoll instance.
 */
class reactor {
public:
    /// Construct an invalid reactor.
    reactor() noexcept = default;
    explicit reactor(offload::unique_fd epoll_fd) noexcept;

    reactor(const reactor&) = delete;
    reactor& operator=(const reactor&) = delete;
    reactor(reactor&&) noexcept = default;
    reactor& operator=(reactor&&) noexcept = default;

    /// @brief Create a new epoll instance.
    [[nodiscard]] static result<reactor> create() noexcept;
    /// @brief Register descriptor interest.
    [[nodiscard]] result<void> add(int fd, std::uint32_t events) noexcept;
    /// @brief Remove descriptor from epoll.
    [[nodiscard]] result<void> remove(int fd) noexcept;
    /**
     * @brief Wait for readiness events.
     * @param events Output span of event slots.
     * @param timeout Maximum wait duration; `std::nullopt` waits forever.
     * @return Number of filled event entries. `EINTR` reports zero.
     */
    [[nodiscard]] result<std::size_t>
    wait(std::span<ready_event> events,
         std::optional<std::chrono::milliseconds> timeout) noexcept;

    /// @return Native epoll descriptor.
    [[nodiscard]] int native_handle() const noexcept;
    /// @return `true` when a valid epoll descriptor is owned.
    [[nodiscard]] bool valid() const noexcept;

private:
    offload::unique_fd epoll_fd_;
};

} // namespace offload::epoll
