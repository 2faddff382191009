#pragma once

/**
 * @file
 * @brief Starts task bodies on background threads and routes their
 * notifications back to the main loop.
 */

#include "offload/core/log.hpp"
#include "offload/core/result.hpp"
#include "offload/runtime/main_loop.hpp"
#include "offload/runtime/outcome.hpp"
#include "offload/runtime/work_context.hpp"
#include "offload/runtime/work_request.hpp"
#include "offload/runtime/worker.hpp"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>

namespace offload::runtime {

/**
 * @brief Pool configuration.
 */
struct pool_options {
    /// Name used in log lines.
    std::string name{"offload"};
};

namespace detail {

/**
 * @brief Thread registry shared by a pool and the notifications it posted.
 *
 * Notifications hold it weakly, so they can tell that the pool is gone.
 */
class pool_registry {
public:
    explicit pool_registry(pool_options options);

    pool_registry(const pool_registry&) = delete;
    pool_registry& operator=(const pool_registry&) = delete;

    /// @brief Allocate and register a new worker, unless the pool is closed.
    [[nodiscard]] result<std::shared_ptr<worker_core>> open(std::string name);
    /// @brief Start the background thread of a registered worker.
    [[nodiscard]] result<void> launch(const std::shared_ptr<worker_core>& core,
                                      std::move_only_function<void()> body);
    /// @brief Forget a worker whose terminal notification is being delivered.
    void retire(std::uint64_t id);
    /**
     * @brief Reject new workers, cancel live ones and join their threads.
     *
     * Terminal notifications already posted are still delivered.
     */
    void close() noexcept;
    /**
     * @brief `close()`, then settle every undelivered worker as cancelled.
     *
     * Used when the pool goes away together with the owner of its callbacks.
     */
    void abandon() noexcept;

    void cancel_all() noexcept;
    [[nodiscard]] bool closed() const noexcept;
    [[nodiscard]] std::size_t active_count() const noexcept;
    [[nodiscard]] const pool_options& options() const noexcept;

private:
    struct entry {
        std::shared_ptr<worker_core> core{};
        std::thread thread{};
    };

    const pool_options options_;
    mutable std::mutex mutex_;
    std::unordered_map<std::uint64_t, entry> entries_{};
    std::uint64_t next_id_{1};
    bool closed_{false};
};

/**
 * @brief Run a body, mapping every way it can end to an `outcome<T>`.
 *
 * A body that observed cancellation at a checkpoint ends cancelled, even if
 * it then returned a value, wrapped the signal in another error or threw.
 */
template <class T>
outcome<T> invoke_body(const work_request<T>& request, work_context& context) {
    if (!request.body) {
        return error_outcome{"work request has no task body"};
    }

    auto finished = [&]() -> outcome<T> {
        try {
            auto body_result = request.body(context);
            if (body_result.has_value()) {
                if constexpr (std::is_void_v<T>) {
                    return done_outcome<void>{};
                } else {
                    return done_outcome<T>{std::move(body_result).value()};
                }
            }
            if (body_result.error().is_cancellation()) {
                return cancel_outcome{};
            }
            return error_outcome{body_result.error().message()};
        } catch (const std::exception& ex) {
            return error_outcome{ex.what()};
        } catch (...) {
            return error_outcome{make_error(work_errc::unhandled_exception).message()};
        }
    }();

    if (context.cancellation_observed()) {
        return cancel_outcome{};
    }
    return finished;
}

/// @brief Invoke a user callback, logging anything it throws.
template <class Fn, class... Args>
void invoke_callback(const worker_core& core, const char* kind, Fn& fn,
                     Args&&... args) {
    if (!fn) {
        return;
    }
    try {
        fn(std::forward<Args>(args)...);
    } catch (const std::exception& ex) {
        log::get()->error("worker {} ({}) {} callback threw: {}", core.id,
                          core.name, kind, ex.what());
    }
}

} // namespace detail

/**
 * @brief Factory and registry for workers.
 *
 * Every submission gets its own thread; there is no limit or queue. All
 * callbacks run on the thread that drives `loop`. The loop must outlive the
 * pool. Destroying the pool cancels and joins live workers, discards every
 * notification that was not delivered yet and leaves their handles in
 * `worker_state::cancelled`.
 */
class worker_pool {
public:
    explicit worker_pool(main_loop& loop, pool_options options = {});
    ~worker_pool();

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;
    worker_pool(worker_pool&&) = delete;
    worker_pool& operator=(worker_pool&&) = delete;

    /**
     * @brief Start `request` on a new thread and return its handle at once.
     * @return Handle of the new worker, or an empty handle after `shutdown()`
     * or when no thread could be started.
     */
    template <class T>
    worker<T> submit(work_request<T> request) {
        auto submitted = try_submit(std::move(request));
        if (!submitted.has_value()) {
            log::get()->warn("[{}] submit rejected: {}", registry_->options().name,
                             submitted.error().message());
            return worker<T>{};
        }
        return std::move(submitted).value();
    }

    /// @brief Like `submit()`, reporting why a worker could not be started.
    template <class T>
    [[nodiscard]] result<worker<T>> try_submit(work_request<T> request) {
        auto opened = registry_->open(request.name);
        if (!opened.has_value()) {
            return err<worker<T>>(opened.error());
        }
        auto core = std::move(opened).value();

        auto shared_request =
            std::make_shared<const work_request<T>>(std::move(request));
        std::weak_ptr<detail::pool_registry> registry = registry_;
        main_loop* loop = &loop_;

        auto launched = registry_->launch(
            core, [loop, registry, core, shared_request]() {
                run_worker<T>(*loop, registry, core, shared_request);
            });
        if (!launched.has_value()) {
            return err<worker<T>>(launched.error());
        }

        log::get()->debug("[{}] submitted worker {} ({})",
                          registry_->options().name, core->id, core->name);
        return worker<T>{std::move(core)};
    }

    /// @return Workers whose terminal notification is still outstanding.
    [[nodiscard]] std::size_t active_count() const noexcept;
    /// @brief Request cancellation of every live worker.
    void cancel_all() noexcept;
    /**
     * @brief Cancel and join live workers, then reject further submissions.
     *
     * Workers still deliver their terminal callback on the loop afterwards.
     * Progress posted before the call is dropped.
     */
    void shutdown() noexcept;
    /// @return `true` after `shutdown()`.
    [[nodiscard]] bool closed() const noexcept;
    [[nodiscard]] const pool_options& options() const noexcept;
    /// @return Loop that receives this pool's notifications.
    [[nodiscard]] main_loop& loop() noexcept;

private:
    template <class T>
    using request_ptr = std::shared_ptr<const work_request<T>>;

    template <class T>
    static void run_worker(main_loop& loop,
                           const std::weak_ptr<detail::pool_registry>& registry,
                           const std::shared_ptr<detail::worker_core>& core,
                           const request_ptr<T>& request) {
        work_context context{
            core->token, core->id,
            [&loop, registry, core, request](int percent, std::string message) {
                loop.post([registry, core, request, percent,
                           message = std::move(message)]() {
                    deliver_progress<T>(registry, *core, *request, percent,
                                        message);
                });
            }};

        auto finished = detail::invoke_body(*request, context);
        loop.post([registry, core, request,
                   finished = std::move(finished)]() mutable {
            deliver_terminal<T>(registry, *core, *request, std::move(finished));
        });
    }

    template <class T>
    static void deliver_progress(const std::weak_ptr<detail::pool_registry>& registry,
                                 const detail::worker_core& core,
                                 const work_request<T>& request, int percent,
                                 const std::string& message) {
        const auto owner = registry.lock();
        if (!owner || owner->closed()) {
            log::get()->debug("dropping progress of worker {}: pool is gone",
                              core.id);
            return;
        }
        if (core.state.load(std::memory_order_acquire) != worker_state::running) {
            return;
        }
        detail::invoke_callback(core, "progress", request.on_progress, percent,
                                message);
    }

    template <class T>
    static void deliver_terminal(const std::weak_ptr<detail::pool_registry>& registry,
                                 detail::worker_core& core,
                                 const work_request<T>& request,
                                 outcome<T> finished) {
        const auto owner = registry.lock();
        if (!owner || core.state.load(std::memory_order_acquire) !=
                          worker_state::running) {
            log::get()->debug("dropping terminal notification of worker {}: "
                              "pool is gone",
                              core.id);
            return;
        }

        const auto terminal = std::visit(
            overloads{
                [](const done_outcome<T>&) { return worker_state::done; },
                [](const error_outcome&) { return worker_state::errored; },
                [](const cancel_outcome&) { return worker_state::cancelled; },
            },
            finished);

        core.state.store(terminal, std::memory_order_release);
        owner->retire(core.id);
        log::get()->debug("[{}] worker {} ({}) finished: {}",
                          owner->options().name, core.id, core.name,
                          to_string(terminal));

        std::visit(
            overloads{
                [&](done_outcome<T>& done) {
                    if constexpr (std::is_void_v<T>) {
                        detail::invoke_callback(core, "done", request.on_done);
                    } else {
                        detail::invoke_callback(core, "done", request.on_done,
                                                std::move(done.value));
                    }
                },
                [&](error_outcome& failure) {
                    detail::invoke_callback(core, "error", request.on_error,
                                            failure.message);
                },
                [&](cancel_outcome&) {
                    detail::invoke_callback(core, "cancel", request.on_cancel);
                },
            },
            finished);
    }

    main_loop& loop_;
    std::shared_ptr<detail::pool_registry> registry_;
};

} // namespace offload::runtime
