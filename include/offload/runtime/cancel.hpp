#pragma once

/**
 * @file
 * @brief One-way cancellation flag shared by a worker and its task body.
 */

#include <atomic>
#include <memory>

namespace offload::runtime {

/**
 * @brief Thread-safe cancellation flag.
 *
 * Copies share one flag. Once requested it stays requested; there is no reset.
 */
class cancellation_token {
public:
    /// Construct a fresh, unrequested flag.
    cancellation_token() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    /// @brief Request cancellation. Idempotent, callable from any thread.
    void request() const noexcept {
        state_->store(true, std::memory_order_release);
    }

    /// @return `true` once any copy of this token had `request()` called.
    [[nodiscard]] bool is_requested() const noexcept {
        return state_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> state_;
};

} // namespace offload::runtime
