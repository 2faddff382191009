#include "offload/offload.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr auto kDefaultTimeout = std::chrono::milliseconds{30'000};

struct list_options {
    std::chrono::milliseconds timeout{kDefaultTimeout};
    bool strip_suffix{true};
    std::vector<std::string> argv{};
};

bool parse_args(int argc, char** argv, list_options& options) {
    int i = 1;
    for (; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg == "--keep-suffix") {
            options.strip_suffix = false;
            continue;
        }
        if (arg == "--timeout") {
            if (i + 1 >= argc) {
                return false;
            }
            std::size_t consumed = 0;
            const std::string value{argv[++i]};
            unsigned long parsed = 0;
            try {
                parsed = std::stoul(value, &consumed, 10);
            } catch (const std::exception&) {
                return false;
            }
            if (consumed != value.size() || parsed == 0) {
                return false;
            }
            options.timeout = std::chrono::milliseconds{parsed};
            continue;
        }
        break;
    }

    for (; i < argc; ++i) {
        options.argv.emplace_back(argv[i]);
    }
    return !options.argv.empty();
}

// Drops one trailing ':' or '/' the way remote and directory listings print them.
std::string strip_listing_suffix(std::string entry) {
    if (!entry.empty() && (entry.back() == ':' || entry.back() == '/')) {
        entry.pop_back();
    }
    return entry;
}

} // namespace

int main(int argc, char** argv) {
    list_options options{};
    if (!parse_args(argc, argv, options)) {
        std::cerr << "usage: offload_list_command [--timeout <ms>] [--keep-suffix] "
                     "[--] <command> [args...]\n"
                     "example: offload_list_command rclone listremotes\n";
        return 2;
    }

    offload::runtime::main_loop loop;
    if (!loop.valid()) {
        std::cerr << "main loop unavailable\n";
        return 1;
    }
    offload::runtime::worker_pool pool{loop, {.name = "list"}};

    int exit_code = 0;
    offload::runtime::work_request<std::vector<std::string>> request;
    request.name = options.argv.front();
    request.body = [&options](offload::runtime::work_context& context)
        -> offload::result<std::vector<std::string>> {
        if (auto checkpoint = context.check_cancelled(); !checkpoint) {
            return offload::err<std::vector<std::string>>(checkpoint.error());
        }
        auto lines = offload::process::run_lines(options.argv, context.token());
        if (!lines.has_value() || !options.strip_suffix) {
            return lines;
        }
        std::vector<std::string> entries;
        entries.reserve(lines->size());
        for (auto& line : lines.value()) {
            entries.push_back(strip_listing_suffix(std::move(line)));
        }
        return entries;
    };
    request.on_done = [&](std::vector<std::string> entries) {
        std::sort(entries.begin(), entries.end());
        for (const auto& entry : entries) {
            std::cout << entry << '\n';
        }
        if (entries.empty()) {
            std::cerr << "(no entries)\n";
        }
        loop.stop();
    };
    request.on_error = [&](const std::string& message) {
        std::cerr << "command error: " << message << '\n';
        exit_code = 1;
        loop.stop();
    };
    request.on_cancel = [&]() {
        std::cerr << "timed out after " << options.timeout.count() << " ms\n";
        exit_code = 124;
        loop.stop();
    };

    const auto worker = pool.submit(std::move(request));
    if (!worker.valid()) {
        std::cerr << "could not start worker\n";
        return 1;
    }
    loop.post_after(options.timeout, [worker]() { worker.cancel(); });

    const auto run_status = loop.run();
    if (!run_status.has_value()) {
        std::cerr << "main loop error: " << run_status.error().message() << '\n';
        return 1;
    }
    return exit_code;
}
