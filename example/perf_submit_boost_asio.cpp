#define BOOST_ERROR_CODE_HEADER_ONLY

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <functional>
#include <iostream>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace {

using clock_type = std::chrono::steady_clock;

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

// One thread per job whose completion is posted back to the io_context
// thread, which starts the next job. Same shape as liboffload's submit.
std::vector<double> measure_post_latency(std::size_t iterations) {
    boost::asio::io_context io{};
    auto guard = boost::asio::make_work_guard(io);

    std::vector<double> samples;
    samples.reserve(iterations);
    std::vector<std::thread> jobs;
    jobs.reserve(iterations);
    clock_type::time_point started_at{};

    std::function<void()> start_next;
    start_next = [&]() {
        started_at = clock_type::now();
        jobs.emplace_back([&]() {
            boost::asio::post(io, [&]() {
                const std::chrono::duration<double, std::micro> took =
                    clock_type::now() - started_at;
                samples.push_back(took.count());
                if (samples.size() == iterations) {
                    guard.reset();
                    return;
                }
                start_next();
            });
        });
    };

    boost::asio::post(io, start_next);
    io.run();
    for (auto& job : jobs) {
        job.join();
    }
    return samples;
}

double percentile(const std::vector<double>& sorted, double fraction) {
    const auto index = static_cast<std::size_t>(fraction * static_cast<double>(sorted.size() - 1));
    return sorted[index];
}

} // namespace

int main(int argc, char** argv) {
    const auto iterations = iterations_from_args(argc, argv);
    if (iterations == 0) {
        std::cerr << "usage: offload_perf_submit_boost_asio [iterations]\n";
        return 1;
    }

    auto samples = measure_post_latency(iterations);
    if (samples.size() != iterations) {
        std::cerr << "benchmark failed after " << samples.size() << " round trips\n";
        return 1;
    }
    std::sort(samples.begin(), samples.end());

    std::cout << "impl,iterations,min_us,p50_us,p99_us,max_us\n";
    std::cout << "boost_asio," << iterations << "," << samples.front() << ","
              << percentile(samples, 0.5) << "," << percentile(samples, 0.99) << ","
              << samples.back() << "\n";
    return 0;
}
