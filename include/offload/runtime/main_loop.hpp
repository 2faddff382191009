#pragma once

/**
 * @file
 * @brief Main-thread dispatch queue backed by `epoll` and an `eventfd`.
 */

#include "offload/core/result.hpp"
#include "offload/core/unique_fd.hpp"
#include "offload/epoll/reactor.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace offload::runtime {

/**
 * @brief Queue of closures that all run on one designated thread.
 *
 * Any thread may `post()`; only the thread driving `poll()` / `run()` executes
 * closures, in posting order. A host with its own event loop watches
 * `native_handle()` for readability and calls `poll()` once per iteration.
 * Without a host loop, `run()` dispatches until `stop()`.
 */
class main_loop final {
public:
    using closure = std::move_only_function<void()>;

    /// Construct and initialize loop resources.
    main_loop() noexcept;
    ~main_loop();

    main_loop(const main_loop&) = delete;
    main_loop& operator=(const main_loop&) = delete;
    main_loop(main_loop&&) = delete;
    main_loop& operator=(main_loop&&) = delete;

    /// @return `true` when initialization succeeded.
    [[nodiscard]] bool valid() const noexcept;

    /// @brief Queue a closure for the main thread. Callable from any thread.
    void post(closure fn);
    /**
     * @brief Queue a closure to run once `delay` has elapsed.
     * @param delay Minimum time before the closure becomes ready.
     * @param fn Closure to run on the main thread.
     */
    void post_after(std::chrono::milliseconds delay, closure fn);

    /**
     * @brief Run every closure that is ready now, then return.
     *
     * Closures posted while the batch runs wait for the next call. A closure
     * that throws `std::exception` is logged and skipped; any other exception
     * propagates and leaves the rest of the batch queued.
     * @return Number of closures executed.
     */
    [[nodiscard]] result<std::size_t> poll();
    /// @brief Dispatch until `stop()` is requested.
    [[nodiscard]] result<void> run();
    /// @brief Dispatch until `stop()` or until `duration` has elapsed.
    [[nodiscard]] result<void> run_for(std::chrono::milliseconds duration);
    /// @brief Request `run()` / `run_for()` to return. Callable from any thread.
    void stop() noexcept;

    /// @return `true` on the thread that drives this loop.
    [[nodiscard]] bool is_main_thread() const noexcept;
    /// @return Descriptor that turns readable when closures are posted.
    [[nodiscard]] int native_handle() const noexcept;
    /**
     * @return Time until the next closure becomes ready: zero when one is
     * ready now, `std::nullopt` when nothing is queued.
     */
    [[nodiscard]] std::optional<std::chrono::milliseconds> next_timeout() const;
    /// @return Closures queued, timers included.
    [[nodiscard]] std::size_t pending() const;

private:
    using clock = std::chrono::steady_clock;

    struct timer_entry {
        clock::time_point deadline{};
        std::uint64_t sequence{0};
        closure fn{};
    };

    struct timer_later {
        bool operator()(const timer_entry& lhs,
                        const timer_entry& rhs) const noexcept {
            if (lhs.deadline != rhs.deadline) {
                return lhs.deadline > rhs.deadline;
            }
            return lhs.sequence > rhs.sequence;
        }
    };

    [[nodiscard]] result<void>
    dispatch_until(std::optional<clock::time_point> deadline);
    [[nodiscard]] std::optional<std::chrono::milliseconds>
    next_timeout_locked(clock::time_point now) const;
    void collect_expired_locked(clock::time_point now,
                                std::deque<closure>& batch);
    void wake() noexcept;
    void consume_wakeup() noexcept;

    offload::epoll::reactor reactor_{};
    offload::unique_fd wake_fd_{};
    std::optional<offload::error> init_error_{};

    mutable std::mutex mutex_;
    std::deque<closure> ready_{};
    std::vector<timer_entry> timers_{};
    std::uint64_t timer_sequence_{0};

    std::atomic<std::thread::id> owner_{};
    std::atomic_bool stop_requested_{false};
};

} // namespace offload::runtime
