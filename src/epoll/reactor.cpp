#include "offload/epoll/reactor.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <limits>
#include <sys/epoll.h>

namespace offload::epoll {

namespace {

constexpr std::size_t kMaxEventBatch = 64;

} // namespace

reactor::reactor(offload::unique_fd epoll_fd) noexcept
    : epoll_fd_(std::move(epoll_fd)) {}

result<reactor> reactor::create() noexcept {
    const int fd = ::epoll_create1(EPOLL_CLOEXEC);
    if (fd < 0) {
        return err<reactor>(error::from_errno());
    }

    return reactor{offload::unique_fd{fd}};
}

result<void> reactor::add(int fd, std::uint32_t events) noexcept {
    if (!valid() || fd < 0) {
        return err<void>(make_error_from_errno(EBADF));
    }

    ::epoll_event event{};
    event.events = events;
    event.data.fd = fd;
    if (::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, fd, &event) != 0) {
        return err<void>(error::from_errno());
    }
    return ok();
}

result<void> reactor::remove(int fd) noexcept {
    if (!valid() || fd < 0) {
        return err<void>(make_error_from_errno(EBADF));
    }

    if (::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_DEL, fd, nullptr) == 0 ||
        errno == ENOENT) {
        return ok();
    }
    return err<void>(error::from_errno());
}

result<std::size_t>
reactor::wait(std::span<ready_event> events,
              std::optional<std::chrono::milliseconds> timeout) noexcept {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }
    if (events.empty()) {
        return err<std::size_t>(make_error_from_errno(EINVAL));
    }

    int timeout_ms = -1;
    if (timeout.has_value()) {
        const auto clamped = std::clamp<long long>(
            timeout->count(), 0,
            static_cast<long long>(std::numeric_limits<int>::max()));
        timeout_ms = static_cast<int>(clamped);
    }

    std::array<::epoll_event, kMaxEventBatch> sys_events{};
    const auto batch = std::min(events.size(), sys_events.size());
    const int ready_count = ::epoll_wait(epoll_fd_.get(), sys_events.data(),
                                         static_cast<int>(batch), timeout_ms);
    if (ready_count < 0) {
        if (errno == EINTR) {
            return static_cast<std::size_t>(0);
        }
        return err<std::size_t>(error::from_errno());
    }

    for (int i = 0; i < ready_count; ++i) {
        const auto index = static_cast<std::size_t>(i);
        events[index] = ready_event{.fd = sys_events[index].data.fd,
                                    .events = sys_events[index].events};
    }
    return static_cast<std::size_t>(ready_count);
}

int reactor::native_handle() const noexcept {
    return epoll_fd_.get();
}

bool reactor::valid() const noexcept {
    return epoll_fd_.valid();
}

} // namespace offload::epoll
