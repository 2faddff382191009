#include "offload/runtime/worker_pool.hpp"

#include <system_error>
#include <vector>

namespace offload::runtime {

std::string_view to_string(worker_state state) noexcept {
    switch (state) {
    case worker_state::running:
        return "running";
    case worker_state::done:
        return "done";
    case worker_state::errored:
        return "errored";
    case worker_state::cancelled:
        return "cancelled";
    }
    return "unknown";
}

namespace detail {

pool_registry::pool_registry(pool_options options)
    : options_(std::move(options)) {}

result<std::shared_ptr<worker_core>> pool_registry::open(std::string name) {
    std::lock_guard lock{mutex_};
    if (closed_) {
        return err<std::shared_ptr<worker_core>>(make_error(work_errc::pool_closed));
    }

    const auto id = next_id_++;
    if (name.empty()) {
        name = "worker-" + std::to_string(id);
    }
    auto core = std::make_shared<worker_core>(id, std::move(name));
    entries_.emplace(id, entry{.core = core, .thread = {}});
    return core;
}

result<void> pool_registry::launch(const std::shared_ptr<worker_core>& core,
                                   std::move_only_function<void()> body) {
    std::lock_guard lock{mutex_};
    auto it = entries_.find(core->id);
    if (it == entries_.end()) {
        return err<void>(make_error(work_errc::pool_closed));
    }

    try {
        it->second.thread = std::thread{std::move(body)};
    } catch (const std::system_error& ex) {
        entries_.erase(it);
        return err<void>(error{ex.code(), std::string{"cannot start worker thread: "} +
                                              ex.what()});
    }
    return ok();
}

void pool_registry::retire(std::uint64_t id) {
    std::thread finished;
    {
        std::lock_guard lock{mutex_};
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return;
        }
        finished = std::move(it->second.thread);
        entries_.erase(it);
    }

    // The terminal notification is the last thing the thread posts, so this
    // join only waits for it to unwind.
    if (finished.joinable()) {
        if (finished.get_id() == std::this_thread::get_id()) {
            finished.detach();
        } else {
            finished.join();
        }
    }
}

void pool_registry::close() noexcept {
    std::vector<std::thread> running;
    {
        std::lock_guard lock{mutex_};
        if (closed_) {
            return;
        }
        closed_ = true;
        for (auto& [id, live] : entries_) {
            live.core->token.request();
            if (live.thread.joinable()) {
                running.push_back(std::move(live.thread));
            }
        }
    }

    if (!running.empty()) {
        log::get()->debug("[{}] shutting down with {} live worker(s)",
                          options_.name, running.size());
    }

    // Entries stay registered until their terminal notification arrives.
    for (auto& thread : running) {
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }
}

void pool_registry::abandon() noexcept {
    close();

    std::unordered_map<std::uint64_t, entry> pending;
    {
        std::lock_guard lock{mutex_};
        pending.swap(entries_);
    }
    if (!pending.empty()) {
        log::get()->debug("[{}] discarding notifications of {} worker(s)",
                          options_.name, pending.size());
    }
    for (auto& [id, live] : pending) {
        live.core->state.store(worker_state::cancelled, std::memory_order_release);
    }
}

void pool_registry::cancel_all() noexcept {
    std::lock_guard lock{mutex_};
    for (auto& [id, live] : entries_) {
        live.core->token.request();
    }
}

bool pool_registry::closed() const noexcept {
    std::lock_guard lock{mutex_};
    return closed_;
}

std::size_t pool_registry::active_count() const noexcept {
    std::lock_guard lock{mutex_};
    return entries_.size();
}

const pool_options& pool_registry::options() const noexcept {
    return options_;
}

} // namespace detail

worker_pool::worker_pool(main_loop& loop, pool_options options)
    : loop_(loop),
      registry_(std::make_shared<detail::pool_registry>(std::move(options))) {}

worker_pool::~worker_pool() {
    registry_->abandon();
}

std::size_t worker_pool::active_count() const noexcept {
    return registry_->active_count();
}

void worker_pool::cancel_all() noexcept {
    registry_->cancel_all();
}

void worker_pool::shutdown() noexcept {
    registry_->close();
}

bool worker_pool::closed() const noexcept {
    return registry_->closed();
}

const pool_options& worker_pool::options() const noexcept {
    return registry_->options();
}

main_loop& worker_pool::loop() noexcept {
    return loop_;
}

} // namespace offload::runtime
