#include "offload/core/unique_fd.hpp"

#include <array>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace offload {

unique_fd::unique_fd(int fd) noexcept : fd_(fd) {}

unique_fd::~unique_fd() noexcept {
    reset();
}

unique_fd::unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}

unique_fd& unique_fd::operator=(unique_fd&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

int unique_fd::get() const noexcept {
    return fd_;
}

bool unique_fd::valid() const noexcept {
    return fd_ >= 0;
}

unique_fd::operator bool() const noexcept {
    return valid();
}

int unique_fd::release() noexcept {
    return std::exchange(fd_, -1);
}

void unique_fd::reset(int fd) noexcept {
    if (fd_ == fd) {
        return;
    }
    if (valid()) {
        (void)::close(fd_);
    }
    fd_ = fd;
}

result<pipe_pair> make_pipe(int flags) noexcept {
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), flags | O_CLOEXEC) != 0) {
        return err<pipe_pair>(error::from_errno());
    }
    return pipe_pair{.read_end = unique_fd{fds[0]},
                     .write_end = unique_fd{fds[1]}};
}

} // namespace offload
