#include "offload/process/command.hpp"

#include "offload/core/log.hpp"
#include "offload/core/unique_fd.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <initializer_list>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace offload::process {

namespace {

constexpr std::size_t kReadChunk = 4096;
constexpr auto kTermGracePeriod = std::chrono::milliseconds{500};
constexpr int kExecFailedStatus = 127;
constexpr auto kReapInterval = std::chrono::milliseconds{5};

// Appends whatever is readable. Returns false once the pipe reached EOF.
result<bool> drain(int fd, std::string& sink) {
    std::array<char, kReadChunk> buffer{};
    while (true) {
        const auto count = ::read(fd, buffer.data(), buffer.size());
        if (count > 0) {
            sink.append(buffer.data(), static_cast<std::size_t>(count));
            continue;
        }
        if (count == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        return err<bool>(error::from_errno());
    }
}

result<int> wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return err<int>(error::from_errno());
        }
    }
    return status;
}

// SIGTERM, a short grace period, then SIGKILL.
void terminate_child(pid_t pid) {
    (void)::kill(pid, SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() + kTermGracePeriod;
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid || (reaped < 0 && errno != EINTR)) {
            return;
        }
        ::usleep(10'000);
    }

    (void)::kill(pid, SIGKILL);
    (void)wait_child(pid);
}

} // namespace

result<command_output> run_captured(const std::vector<std::string>& argv,
                                    const runtime::cancellation_token& token,
                                    std::chrono::milliseconds poll_interval) {
    if (argv.empty()) {
        return err<command_output>(make_error("empty command line"));
    }
    if (token.is_requested()) {
        return err<command_output>(make_error(work_errc::cancelled));
    }

    auto out_pipe = make_pipe();
    if (!out_pipe.has_value()) {
        return err<command_output>(out_pipe.error());
    }
    auto err_pipe = make_pipe();
    if (!err_pipe.has_value()) {
        return err<command_output>(err_pipe.error());
    }
    // Only the parent's ends are non-blocking; the child keeps blocking stdio.
    for (const int fd : {out_pipe->read_end.get(), err_pipe->read_end.get()}) {
        if (::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | O_NONBLOCK) != 0) {
            return err<command_output>(error::from_errno());
        }
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return err<command_output>(error::from_errno());
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on.
        const int dev_null = ::open("/dev/null", O_RDONLY);
        if (dev_null >= 0) {
            ::dup2(dev_null, STDIN_FILENO);
        }
        ::dup2(out_pipe->write_end.get(), STDOUT_FILENO);
        ::dup2(err_pipe->write_end.get(), STDERR_FILENO);
        // dup2 clears O_CLOEXEC on the new descriptors only.
        ::execvp(args[0], args.data());
        constexpr std::string_view kExecFailed = ": cannot execute\n";
        (void)::write(STDERR_FILENO, args[0], std::strlen(args[0]));
        (void)::write(STDERR_FILENO, kExecFailed.data(), kExecFailed.size());
        ::_exit(kExecFailedStatus);
    }

    out_pipe->write_end.reset();
    err_pipe->write_end.reset();

    log::get()->debug("spawned '{}' as pid {}", argv.front(), pid);

    command_output output{};
    bool out_open = true;
    bool err_open = true;
    while (out_open || err_open) {
        if (token.is_requested()) {
            terminate_child(pid);
            log::get()->debug("pid {} terminated on cancellation", pid);
            return err<command_output>(make_error(work_errc::cancelled));
        }

        std::array<::pollfd, 2> fds{};
        fds[0] = ::pollfd{.fd = out_open ? out_pipe->read_end.get() : -1,
                          .events = POLLIN,
                          .revents = 0};
        fds[1] = ::pollfd{.fd = err_open ? err_pipe->read_end.get() : -1,
                          .events = POLLIN,
                          .revents = 0};

        const int ready = ::poll(fds.data(), fds.size(),
                                 static_cast<int>(poll_interval.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            const auto failure = error::from_errno();
            terminate_child(pid);
            return err<command_output>(failure);
        }
        if (ready == 0) {
            continue;
        }

        if (out_open && fds[0].revents != 0) {
            auto drained = drain(fds[0].fd, output.out);
            if (!drained.has_value()) {
                terminate_child(pid);
                return err<command_output>(drained.error());
            }
            out_open = drained.value();
        }
        if (err_open && fds[1].revents != 0) {
            auto drained = drain(fds[1].fd, output.err);
            if (!drained.has_value()) {
                terminate_child(pid);
                return err<command_output>(drained.error());
            }
            err_open = drained.value();
        }
    }

    // Both pipes are closed, but the child may still be running.
    int status = 0;
    while (true) {
        const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            break;
        }
        if (reaped < 0) {
            if (errno == EINTR) {
                continue;
            }
            return err<command_output>(error::from_errno());
        }
        if (token.is_requested()) {
            terminate_child(pid);
            log::get()->debug("pid {} terminated on cancellation", pid);
            return err<command_output>(make_error(work_errc::cancelled));
        }
        std::this_thread::sleep_for(kReapInterval);
    }

    if (WIFSIGNALED(status)) {
        return err<command_output>(make_error(
            argv.front() + " killed by signal " +
            std::to_string(WTERMSIG(status))));
    }
    output.exit_code = WEXITSTATUS(status);
    return output;
}

result<std::vector<std::string>> run_lines(const std::vector<std::string>& argv,
                                           const runtime::cancellation_token& token) {
    auto output = run_captured(argv, token);
    if (!output.has_value()) {
        return err<std::vector<std::string>>(output.error());
    }

    if (output->exit_code != 0) {
        auto message = trim(output->err);
        if (message.empty()) {
            message = trim(output->out);
        }
        if (message.empty()) {
            message = "Unknown command error";
        }
        return err<std::vector<std::string>>(make_error(std::string{message}));
    }
    return split_lines(output->out);
}

std::string_view trim(std::string_view text) noexcept {
    constexpr std::string_view kWhitespace = " \t\r\n\f\v";
    const auto first = text.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(kWhitespace);
    return text.substr(first, last - first + 1);
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    while (!text.empty()) {
        const auto end = text.find('\n');
        const auto line = trim(text.substr(0, end));
        if (!line.empty()) {
            lines.emplace_back(line);
        }
        if (end == std::string_view::npos) {
            break;
        }
        text.remove_prefix(end + 1);
    }
    return lines;
}

} // namespace offload::process
