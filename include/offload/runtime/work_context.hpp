#pragma once

/**
 * @file
 * @brief Handle a running task body uses to observe cancellation and report progress.
 */

#include "offload/core/result.hpp"
#include "offload/runtime/cancel.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace offload::runtime {

/**
 * @brief Per-run view of a worker, passed by reference to the task body.
 *
 * Lives on the worker thread for exactly one invocation of the body.
 */
class work_context {
public:
    using progress_sink = std::function<void(int, std::string)>;

    /**
     * @param token Cancellation flag of the owning worker.
     * @param worker_id Id of the owning worker.
     * @param sink Forwards progress notifications to the main thread.
     */
    work_context(cancellation_token token, std::uint64_t worker_id,
                 progress_sink sink);

    work_context(const work_context&) = delete;
    work_context& operator=(const work_context&) = delete;

    /**
     * @brief Cancellation checkpoint.
     *
     * Returns the `work_errc::cancelled` error once cancellation was requested.
     * The body should propagate it. Once a checkpoint has reported
     * cancellation the worker ends with `on_cancel`, whatever the body
     * returns afterwards.
     */
    [[nodiscard]] result<void> check_cancelled();

    /// @return `true` once a checkpoint has reported cancellation.
    [[nodiscard]] bool cancellation_observed() const noexcept;

    /// @return Current state of the flag, without signalling anything.
    [[nodiscard]] bool cancellation_requested() const noexcept;

    /**
     * @brief Queue a progress notification for the main thread.
     *
     * Values are passed through as given. Calls made after a checkpoint has
     * reported cancellation are dropped.
     */
    void progress(int percent, std::string message);

    /// @return Id of the worker running this body.
    [[nodiscard]] std::uint64_t worker_id() const noexcept;

    /// @return Token of the owning worker, for handing to blocking helpers.
    [[nodiscard]] const cancellation_token& token() const noexcept;

private:
    cancellation_token token_;
    std::uint64_t worker_id_{0};
    progress_sink sink_;
    bool cancellation_observed_{false};
};

} // namespace offload::runtime
