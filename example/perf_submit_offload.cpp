#include "offload/runtime/main_loop.hpp"
#include "offload/runtime/worker_pool.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using clock_type = std::chrono::steady_clock;

// Latency of one submit until its on_done runs on the loop thread, in us.
using latency_samples = std::vector<double>;

std::size_t iterations_from_args(int argc, char** argv) {
    if (argc <= 1) {
        return 2000;
    }
    const std::string_view text{argv[1]};
    std::size_t value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return 0;
    }
    return value;
}

latency_samples measure_submit_latency(std::size_t iterations) {
    offload::runtime::main_loop loop;
    offload::runtime::worker_pool pool{loop, {.name = "perf"}};

    latency_samples samples;
    samples.reserve(iterations);
    clock_type::time_point submitted_at{};

    std::function<void()> submit_next;
    submit_next = [&]() {
        offload::runtime::work_request<void> request;
        request.body = [](offload::runtime::work_context& context)
            -> offload::result<void> { return context.check_cancelled(); };
        request.on_done = [&]() {
            const std::chrono::duration<double, std::micro> took =
                clock_type::now() - submitted_at;
            samples.push_back(took.count());
            if (samples.size() == iterations) {
                loop.stop();
                return;
            }
            submit_next();
        };
        request.on_error = [&](const std::string&) { loop.stop(); };
        submitted_at = clock_type::now();
        (void)pool.submit(std::move(request));
    };

    loop.post(submit_next);
    if (!loop.run().has_value()) {
        samples.clear();
    }
    return samples;
}

double percentile(const latency_samples& sorted, double fraction) {
    const auto index = static_cast<std::size_t>(fraction * static_cast<double>(sorted.size() - 1));
    return sorted[index];
}

} // namespace

int main(int argc, char** argv) {
    const auto iterations = iterations_from_args(argc, argv);
    if (iterations == 0) {
        std::cerr << "usage: offload_perf_submit [iterations]\n";
        return 1;
    }

    auto samples = measure_submit_latency(iterations);
    if (samples.size() != iterations) {
        std::cerr << "benchmark failed after " << samples.size() << " round trips\n";
        return 1;
    }
    std::sort(samples.begin(), samples.end());

    std::cout << "impl,iterations,min_us,p50_us,p99_us,max_us\n";
    std::cout << "offload," << iterations << "," << samples.front() << ","
              << percentile(samples, 0.5) << "," << percentile(samples, 0.99) << ","
              << samples.back() << "\n";
    return 0;
}
