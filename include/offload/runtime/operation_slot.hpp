#pragma once

/**
 * @file
 * @brief Holder for the single live worker of one logical operation.
 */

#include "offload/runtime/work_request.hpp"
#include "offload/runtime/worker.hpp"
#include "offload/runtime/worker_pool.hpp"

#include <cstdint>
#include <memory>
#include <utility>

namespace offload::runtime {

/**
 * @brief Keeps at most one live worker per operation, cancel-and-replace style.
 *
 * `replace()` cancels whatever the slot holds before submitting the new
 * request. The slot empties itself when its current worker delivers its
 * terminal callback, before that callback runs. A superseded worker that
 * finishes later leaves the slot alone. Destroying the slot cancels its worker.
 *
 * Main-thread only.
 */
template <class T>
class operation_slot {
public:
    operation_slot() : state_(std::make_shared<slot_state>()) {}

    ~operation_slot() {
        cancel();
    }

    operation_slot(const operation_slot&) = delete;
    operation_slot& operator=(const operation_slot&) = delete;

    /**
     * @brief Cancel the current worker, then submit `request` in its place.
     * @return Handle of the new worker (empty if the pool rejected it).
     */
    worker<T> replace(worker_pool& pool, work_request<T> request) {
        cancel();

        std::weak_ptr<slot_state> state = state_;
        auto release = [state](std::uint64_t id) {
            if (auto alive = state.lock(); alive && alive->current.id() == id) {
                alive->current = worker<T>{};
            }
        };

        // The wrapped callbacks need the new worker's id, which only exists
        // after submission; they read it from a shared cell.
        auto id_cell = std::make_shared<std::uint64_t>(0);
        request.on_done = wrap(std::move(request.on_done), release, id_cell);
        request.on_error = wrap(std::move(request.on_error), release, id_cell);
        request.on_cancel = wrap(std::move(request.on_cancel), release, id_cell);

        state_->current = pool.submit(std::move(request));
        *id_cell = state_->current.id();
        return state_->current;
    }

    /// @brief Cancel the current worker and empty the slot.
    void cancel() {
        state_->current.cancel();
        state_->current = worker<T>{};
    }

    /// @brief Empty the slot without cancelling.
    void clear() noexcept {
        state_->current = worker<T>{};
    }

    /// @return `true` while the slot holds a worker.
    [[nodiscard]] bool busy() const noexcept {
        return state_->current.valid();
    }

    /// @return Handle of the current worker, possibly empty.
    [[nodiscard]] const worker<T>& current() const noexcept {
        return state_->current;
    }

private:
    struct slot_state {
        worker<T> current{};
    };

    template <class Callback, class Release>
    static Callback wrap(Callback callback, Release release,
                         std::shared_ptr<std::uint64_t> id_cell) {
        return [callback = std::move(callback), release = std::move(release),
                id_cell = std::move(id_cell)](auto&&... args) {
            release(*id_cell);
            if (callback) {
                callback(std::forward<decltype(args)>(args)...);
            }
        };
    }

    std::shared_ptr<slot_state> state_;
};

} // namespace offload::runtime
