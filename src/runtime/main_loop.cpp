#include "offload/runtime/main_loop.hpp"

#include "offload/core/log.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <exception>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <utility>

namespace offload::runtime {

main_loop::main_loop() noexcept : owner_(std::this_thread::get_id()) {
    auto reactor_result = offload::epoll::reactor::create();
    if (!reactor_result.has_value()) {
        init_error_ = reactor_result.error();
        return;
    }
    reactor_ = std::move(reactor_result.value());

    const int wake_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wake_fd < 0) {
        init_error_ = error::from_errno();
        return;
    }
    wake_fd_ = offload::unique_fd{wake_fd};

    const auto register_result = reactor_.add(wake_fd_.get(), EPOLLIN);
    if (!register_result.has_value()) {
        init_error_ = register_result.error();
    }
}

main_loop::~main_loop() {
    std::lock_guard lock{mutex_};
    if (!ready_.empty() || !timers_.empty()) {
        log::get()->debug("main loop destroyed with {} ready and {} timed "
                          "closures pending",
                          ready_.size(), timers_.size());
    }
}

bool main_loop::valid() const noexcept {
    return !init_error_.has_value() && reactor_.valid() && wake_fd_.valid();
}

void main_loop::post(closure fn) {
    if (!fn) {
        return;
    }
    {
        std::lock_guard lock{mutex_};
        ready_.push_back(std::move(fn));
    }
    wake();
}

void main_loop::post_after(std::chrono::milliseconds delay, closure fn) {
    if (!fn) {
        return;
    }
    if (delay <= std::chrono::milliseconds{0}) {
        post(std::move(fn));
        return;
    }
    {
        std::lock_guard lock{mutex_};
        timers_.push_back(timer_entry{.deadline = clock::now() + delay,
                                      .sequence = timer_sequence_++,
                                      .fn = std::move(fn)});
        std::push_heap(timers_.begin(), timers_.end(), timer_later{});
    }
    wake();
}

result<std::size_t> main_loop::poll() {
    if (!valid()) {
        return err<std::size_t>(init_error_.value_or(make_error_from_errno(EBADF)));
    }

    owner_.store(std::this_thread::get_id(), std::memory_order_release);
    consume_wakeup();

    std::deque<closure> batch;
    {
        std::lock_guard lock{mutex_};
        batch.swap(ready_);
        collect_expired_locked(clock::now(), batch);
    }

    std::size_t executed = 0;
    while (!batch.empty()) {
        auto fn = std::move(batch.front());
        batch.pop_front();
        ++executed;

        try {
            fn();
        } catch (const std::exception& ex) {
            log::get()->error("main loop closure threw: {}", ex.what());
        } catch (...) {
            std::lock_guard lock{mutex_};
            while (!batch.empty()) {
                ready_.push_front(std::move(batch.back()));
                batch.pop_back();
            }
            wake();
            throw;
        }
    }
    return executed;
}

result<void> main_loop::run() {
    return dispatch_until(std::nullopt);
}

result<void> main_loop::run_for(std::chrono::milliseconds duration) {
    return dispatch_until(clock::now() + duration);
}

void main_loop::stop() noexcept {
    stop_requested_.store(true, std::memory_order_release);
    wake();
}

bool main_loop::is_main_thread() const noexcept {
    return owner_.load(std::memory_order_acquire) == std::this_thread::get_id();
}

int main_loop::native_handle() const noexcept {
    return reactor_.native_handle();
}

std::optional<std::chrono::milliseconds> main_loop::next_timeout() const {
    std::lock_guard lock{mutex_};
    return next_timeout_locked(clock::now());
}

std::size_t main_loop::pending() const {
    std::lock_guard lock{mutex_};
    return ready_.size() + timers_.size();
}

result<void>
main_loop::dispatch_until(std::optional<clock::time_point> deadline) {
    if (!valid()) {
        return err<void>(init_error_.value_or(make_error_from_errno(EBADF)));
    }

    stop_requested_.store(false, std::memory_order_release);
    std::array<offload::epoll::ready_event, 4> events{};

    while (!stop_requested_.load(std::memory_order_acquire)) {
        const auto poll_result = poll();
        if (!poll_result.has_value()) {
            return err<void>(poll_result.error());
        }
        if (stop_requested_.load(std::memory_order_acquire)) {
            break;
        }

        const auto now = clock::now();
        if (deadline.has_value() && now >= deadline.value()) {
            break;
        }

        auto timeout = next_timeout();
        if (deadline.has_value()) {
            const auto remaining =
                std::chrono::ceil<std::chrono::milliseconds>(deadline.value() - now);
            timeout = timeout.has_value() ? std::min(timeout.value(), remaining)
                                          : remaining;
        }

        const auto wait_result = reactor_.wait(events, timeout);
        if (!wait_result.has_value()) {
            return err<void>(wait_result.error());
        }
    }

    return ok();
}

std::optional<std::chrono::milliseconds>
main_loop::next_timeout_locked(clock::time_point now) const {
    if (!ready_.empty()) {
        return std::chrono::milliseconds{0};
    }
    if (timers_.empty()) {
        return std::nullopt;
    }

    const auto remaining = timers_.front().deadline - now;
    if (remaining <= clock::duration::zero()) {
        return std::chrono::milliseconds{0};
    }
    return std::chrono::ceil<std::chrono::milliseconds>(remaining);
}

void main_loop::collect_expired_locked(clock::time_point now,
                                       std::deque<closure>& batch) {
    while (!timers_.empty() && timers_.front().deadline <= now) {
        std::pop_heap(timers_.begin(), timers_.end(), timer_later{});
        batch.push_back(std::move(timers_.back().fn));
        timers_.pop_back();
    }
}

void main_loop::wake() noexcept {
    if (!wake_fd_.valid()) {
        return;
    }

    const std::uint64_t signal = 1;
    while (::write(wake_fd_.get(), &signal, sizeof(signal)) < 0) {
        if (errno == EINTR) {
            continue;
        }
        // EAGAIN: the counter is saturated, so the loop is already awake.
        break;
    }
}

void main_loop::consume_wakeup() noexcept {
    std::uint64_t value = 0;
    while (::read(wake_fd_.get(), &value, sizeof(value)) < 0) {
        if (errno != EINTR) {
            break;
        }
    }
}

} // namespace offload::runtime
