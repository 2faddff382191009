#include "offload/offload.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace {

constexpr int kSteps = 10;
constexpr auto kStepTime = std::chrono::milliseconds{250};
constexpr auto kQuitGrace = std::chrono::milliseconds{500};

struct demo_options {
    std::optional<std::chrono::milliseconds> cancel_after{};
    bool fail{false};
};

bool parse_args(int argc, char** argv, demo_options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--fail") {
            options.fail = true;
            continue;
        }
        if (arg == "--cancel-after") {
            if (i + 1 >= argc) {
                return false;
            }
            std::size_t consumed = 0;
            const std::string value{argv[++i]};
            long parsed = 0;
            try {
                parsed = std::stol(value, &consumed, 10);
            } catch (const std::exception&) {
                return false;
            }
            if (consumed != value.size() || parsed < 0) {
                return false;
            }
            options.cancel_after = std::chrono::milliseconds{parsed};
            continue;
        }
        if (arg == "--log-level") {
            if (i + 1 >= argc || !offload::log::set_level(argv[++i])) {
                return false;
            }
            continue;
        }
        return false;
    }
    return true;
}

offload::result<std::string> demo_body(offload::runtime::work_context& context,
                                       bool fail) {
    for (int step = 0; step < kSteps; ++step) {
        if (auto checkpoint = context.check_cancelled(); !checkpoint) {
            return offload::err<std::string>(checkpoint.error());
        }
        std::this_thread::sleep_for(kStepTime);
        if (fail && step == kSteps / 2) {
            return offload::err<std::string>(
                offload::make_error("simulated failure at step " +
                                    std::to_string(step + 1)));
        }
        const int percent = ((step + 1) * 100) / kSteps;
        context.progress(percent, "Step " + std::to_string(step + 1) + " of " +
                                      std::to_string(kSteps));
    }
    return std::string{"Done."};
}

} // namespace

int main(int argc, char** argv) {
    demo_options options{};
    if (!parse_args(argc, argv, options)) {
        std::cerr << "usage: offload_progress_demo [--cancel-after <ms>] [--fail] "
                     "[--log-level <level>]\n";
        return 2;
    }

    offload::runtime::main_loop loop;
    if (!loop.valid()) {
        std::cerr << "main loop unavailable\n";
        return 1;
    }
    offload::runtime::worker_pool pool{loop, {.name = "demo"}};
    offload::runtime::operation_slot<std::string> active;

    int exit_code = 0;
    // Leave the loop a moment after the terminal callback, as a window would
    // close after its final repaint.
    auto quit_later = [&loop]() { loop.post_after(kQuitGrace, [&loop]() { loop.stop(); }); };

    offload::runtime::work_request<std::string> request;
    request.name = "background-work";
    request.body = [fail = options.fail](offload::runtime::work_context& context) {
        return demo_body(context, fail);
    };
    request.on_progress = [](int percent, const std::string& message) {
        std::cout << "[" << percent << "%] " << message << '\n';
    };
    request.on_done = [&](const std::string& text) {
        std::cout << "finished: " << text << '\n';
        quit_later();
    };
    request.on_cancel = [&]() {
        std::cout << "cancelled\n";
        quit_later();
    };
    request.on_error = [&](const std::string& message) {
        std::cerr << "worker error: " << message << '\n';
        exit_code = 1;
        quit_later();
    };

    std::cout << "working in background...\n";
    active.replace(pool, std::move(request));

    if (options.cancel_after.has_value()) {
        loop.post_after(options.cancel_after.value(), [&active]() {
            if (active.busy()) {
                std::cout << "cancel requested...\n";
                active.current().cancel();
            }
        });
    }

    const auto run_status = loop.run();
    if (!run_status.has_value()) {
        std::cerr << "main loop error: " << run_status.error().message() << '\n';
        return 1;
    }
    return exit_code;
}
