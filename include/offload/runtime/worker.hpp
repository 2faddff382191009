#pragma once

/**
 * @file
 * @brief Caller-side handle to one background task execution.
 */

#include "offload/runtime/cancel.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace offload::runtime {

/// @brief Lifecycle of a worker. Terminal states are final.
enum class worker_state {
    running,
    done,
    errored,
    cancelled,
};

/// @return Lower-case name of `state`.
[[nodiscard]] std::string_view to_string(worker_state state) noexcept;

namespace detail {

/// State shared by a worker handle, its thread and its pending notifications.
struct worker_core {
    worker_core(std::uint64_t worker_id, std::string worker_name)
        : id(worker_id), name(std::move(worker_name)) {}

    const std::uint64_t id;
    const std::string name;
    cancellation_token token{};
    std::atomic<worker_state> state{worker_state::running};
};

} // namespace detail

class worker_pool;

/**
 * @brief Handle to a submitted task.
 *
 * Copies refer to the same execution. Dropping every handle does not stop
 * the task; its callbacks still fire.
 *
 * @tparam T Result type of the task body.
 */
template <class T>
class worker {
public:
    /// Construct an empty handle.
    worker() = default;

    /// @return `true` when this handle refers to a submitted task.
    [[nodiscard]] bool valid() const noexcept {
        return core_ != nullptr;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return valid();
    }

    /// @return Pool-unique id, or `0` for an empty handle.
    [[nodiscard]] std::uint64_t id() const noexcept {
        return core_ ? core_->id : 0;
    }

    /**
     * @return Current state. It leaves `running` on the main thread, right
     * before the terminal callback is invoked.
     */
    [[nodiscard]] worker_state state() const noexcept {
        return core_ ? core_->state.load(std::memory_order_acquire)
                     : worker_state::running;
    }

    /// @return `true` once the terminal notification has been delivered.
    [[nodiscard]] bool finished() const noexcept {
        return state() != worker_state::running;
    }

    /**
     * @brief Ask the task body to stop at its next checkpoint.
     *
     * Returns immediately. Does nothing for an empty handle or a worker that
     * already finished.
     */
    void cancel() const noexcept {
        if (!core_ || finished()) {
            return;
        }
        core_->token.request();
    }

    /// @return `true` once `cancel()` took effect on this execution.
    [[nodiscard]] bool cancel_requested() const noexcept {
        return core_ && core_->token.is_requested();
    }

    friend bool operator==(const worker& lhs, const worker& rhs) noexcept {
        return lhs.core_ == rhs.core_;
    }

private:
    friend class worker_pool;

    explicit worker(std::shared_ptr<detail::worker_core> core)
        : core_(std::move(core)) {}

    std::shared_ptr<detail::worker_core> core_{};
};

} // namespace offload::runtime
