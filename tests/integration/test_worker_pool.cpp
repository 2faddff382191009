#include "offload/runtime/main_loop.hpp"
#include "offload/runtime/worker_pool.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

namespace {

using namespace std::chrono_literals;
using offload::runtime::work_context;
using offload::runtime::work_request;
using offload::runtime::worker_state;

template <class Predicate>
bool pump_until(offload::runtime::main_loop& loop, Predicate done,
                std::chrono::milliseconds limit = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (!done()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        if (!loop.run_for(10ms).has_value()) {
            return false;
        }
    }
    return true;
}

// Callback trace; callbacks only ever run on the thread that created it.
struct recorder {
    std::thread::id main_thread{std::this_thread::get_id()};
    std::vector<std::string> events{};
    int terminal_count{0};
    bool off_main_thread{false};

    void note(std::string event, bool terminal = false) {
        if (std::this_thread::get_id() != main_thread) {
            off_main_thread = true;
        }
        events.push_back(std::move(event));
        if (terminal) {
            ++terminal_count;
        }
    }

    template <class T>
    void attach(work_request<T>& request) {
        if constexpr (std::is_void_v<T>) {
            request.on_done = [this]() { note("done", true); };
        } else {
            request.on_done = [this](T value) {
                note("done:" + std::to_string(value), true);
            };
        }
        request.on_error = [this](const std::string& message) {
            note("error:" + message, true);
        };
        request.on_cancel = [this]() { note("cancel", true); };
        request.on_progress = [this](int percent, const std::string& message) {
            note("progress:" + std::to_string(percent) + ":" + message);
        };
    }
};

class worker_pool_test : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(loop.valid());
    }

    offload::runtime::main_loop loop;
    offload::runtime::worker_pool pool{loop};
};

TEST_F(worker_pool_test, delivers_result_on_main_thread) {
    recorder trace;
    std::atomic<bool> body_off_main{false};
    const auto main_id = std::this_thread::get_id();

    work_request<int> request;
    request.body = [&](work_context&) -> offload::result<int> {
        body_off_main.store(std::this_thread::get_id() != main_id);
        return 42;
    };
    trace.attach(request);

    const auto worker = pool.submit(std::move(request));
    ASSERT_TRUE(worker.valid());
    EXPECT_GT(worker.id(), 0U);

    ASSERT_TRUE(pump_until(loop, [&]() { return worker.finished(); }));

    EXPECT_EQ(trace.events, (std::vector<std::string>{"done:42"}));
    EXPECT_EQ(trace.terminal_count, 1);
    EXPECT_FALSE(trace.off_main_thread);
    EXPECT_TRUE(body_off_main.load());
    EXPECT_EQ(worker.state(), worker_state::done);
    EXPECT_EQ(pool.active_count(), 0U);
}

TEST_F(worker_pool_test, progress_precedes_terminal_in_emission_order) {
    recorder trace;

    work_request<int> request;
    request.body = [](work_context& context) -> offload::result<int> {
        context.progress(10, "a");
        context.progress(90, "b");
        return 7;
    };
    trace.attach(request);

    const auto worker = pool.submit(std::move(request));
    ASSERT_TRUE(pump_until(loop, [&]() { return worker.finished(); }));

    EXPECT_EQ(trace.events, (std::vector<std::string>{"progress:10:a",
                                                      "progress:90:b",
                                                      "done:7"}));
    EXPECT_FALSE(trace.off_main_thread);
}

TEST_F(worker_pool_test, returned_failure_becomes_error_message) {
    recorder trace;

    work_request<int> request;
    request.body = [](work_context&) -> offload::result<int> {
        return offload::err<int>(offload::make_error("boom"));
    };
    trace.attach(request);

    const auto worker = pool.submit(std::move(request));
    ASSERT_TRUE(pump_until(loop, [&]() { return worker.finished(); }));

    EXPECT_EQ(trace.events, (std::vector<std::string>{"error:boom"}));
    EXPECT_EQ(worker.state(), worker_state::errored);
}

TEST_F(worker_pool_test, thrown_exception_becomes_error_message) {
    recorder trace;

    work_request<int> request;
    request.body = [](work_context&) -> offload::result<int> {
        throw std::runtime_error("boom");
    };
    trace.attach(request);

    const auto worker = pool.submit(std::move(request));
    ASSERT_TRUE(pump_until(loop, [&]() { return worker.finished(); }));

    EXPECT_EQ(trace.events, (std::vector<std::string>{"error:boom"}));
}

TEST_F(worker_pool_test, non_standard_exception_still_ends_in_error_callback) {
    recorder trace;

    work_request<int> request;
    request.body = [](work_context&) -> offload::result<int> { throw 17; };
    trace.attach(request);

    const auto worker = pool.submit(std::move(request));
    ASSERT_TRUE(pump_until(loop, [&]() { return worker.finished(); }));

    ASSERT_EQ(trace.events.size(), 1U);
    EXPECT_EQ(trace.events.front(), "error:task body threw an unknown exception");
    EXPECT_EQ(trace.terminal_count, 1);
}

TEST_F(worker_pool_test, errno_failure_uses_system_message) {
    recorder trace;

    work_request<int> request;
    request.body = [](work_context&) -> offload::result<int> {
        return offload::err<int>(offload::make_error_from_errno(ENOENT));
    };
    trace.attach(request);

    const auto worker = pool.submit(std::move(request));
    ASSERT_TRUE(pump_until(loop, [&]() { return worker.finished(); }));

    ASSERT_EQ(trace.events.size(), 1U);
    EXPECT_EQ(trace.events.front(),
              ("error:" + std::error_code{ENOENT, std::system_category()}.message()));
}

TEST_F(worker_pool_test, request_without_body_reports_error) {
    recorder trace;
    work_request<int> request;
    trace.attach(request);

    const auto worker = pool.submit(std::move(request));
    ASSERT_TRUE(pump_until(loop, [&]() { return worker.finished(); }));

    EXPECT_EQ(trace.events,
              (std::vector<std::string>{"error:work request has no task body"}));
}

TEST_F(worker_pool_test, void_result_uses_nullary_done_callback) {
    recorder trace;

    work_request<void> request;
    request.body = [](work_context&) -> offload::result<void> {
        return offload::ok();
    };
    trace.attach(request);

    const auto worker = pool.submit(std::move(request));
    ASSERT_TRUE(pump_until(loop, [&]() { return worker.finished(); }));

    EXPECT_EQ(trace.events, (std::vector<std::string>{"done"}));
}

TEST_F(worker_pool_test, move_only_results_are_delivered) {
    std::unique_ptr<std::string> received;

    work_request<std::unique_ptr<std::string>> request;
    request.body =
        [](work_context&) -> offload::result<std::unique_ptr<std::string>> {
        return std::make_unique<std::string>("listing");
    };
    request.on_done = [&](std::unique_ptr<std::string> value) {
        received = std::move(value);
    };

    const auto worker = pool.submit(std::move(request));
    ASSERT_TRUE(pump_until(loop, [&]() { return worker.finished(); }));

    ASSERT_NE(received, nullptr);
    EXPECT_EQ(*received, "listing");
}

TEST_F(worker_pool_test, unset_callbacks_are_skipped) {
    work_request<int> request;
    request.body = [](work_context& context) -> offload::result<int> {
        context.progress(50, "half");
        return 1;
    };

    const auto worker = pool.submit(std::move(request));
    ASSERT_TRUE(pump_until(loop, [&]() { return worker.finished(); }));
    EXPECT_EQ(worker.state(), worker_state::done);
}

TEST_F(worker_pool_test, submit_returns_before_slow_body_produces_output) {
    recorder trace;
    std::promise<void> release;
    auto released = release.get_future().share();

    work_request<int> request;
    request.body = [released](work_context& context) -> offload::result<int> {
        released.wait();
        if (auto checkpoint = context.check_cancelled(); !checkpoint) {
            return offload::err<int>(checkpoint.error());
        }
        return 3;
    };
    trace.attach(request);

    const auto start = std::chrono::steady_clock::now();
    const auto worker = pool.submit(std::move(request));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 200ms);
    ASSERT_TRUE(worker.valid());
    EXPECT_EQ(worker.state(), worker_state::running);
    EXPECT_EQ(pool.active_count(), 1U);

    ASSERT_TRUE(loop.run_for(30ms).has_value());
    EXPECT_TRUE(trace.events.empty());

    release.set_value();
    ASSERT_TRUE(pump_until(loop, [&]() { return worker.finished(); }));
    EXPECT_EQ(trace.events, (std::vector<std::string>{"done:3"}));
}

TEST_F(worker_pool_test, concurrent_workers_each_finish_exactly_once) {
    constexpr int kWorkers = 16;
    std::vector<int> terminal_hits(kWorkers, 0);
    std::vector<offload::runtime::worker<int>> workers;

    for (int i = 0; i < kWorkers; ++i) {
        work_request<int> request;
        request.body = [i](work_context& context) -> offload::result<int> {
            context.progress(i, "working");
            std::this_thread::sleep_for(std::chrono::milliseconds{i % 4});
            if (i % 3 == 0) {
                return offload::err<int>(offload::make_error("odd one out"));
            }
            return i;
        };
        request.on_done = [&terminal_hits, i](int value) {
            EXPECT_EQ(value, i);
            ++terminal_hits[static_cast<std::size_t>(i)];
        };
        request.on_error = [&terminal_hits, i](const std::string&) {
            ++terminal_hits[static_cast<std::size_t>(i)];
        };
        request.on_cancel = [&terminal_hits, i]() {
            ++terminal_hits[static_cast<std::size_t>(i)];
        };
        workers.push_back(pool.submit(std::move(request)));
    }

    ASSERT_TRUE(pump_until(loop, [&]() { return pool.active_count() == 0; }));
    ASSERT_TRUE(loop.run_for(20ms).has_value());

    for (int i = 0; i < kWorkers; ++i) {
        EXPECT_EQ(terminal_hits[static_cast<std::size_t>(i)], 1) << "worker " << i;
        EXPECT_TRUE(workers[static_cast<std::size_t>(i)].finished());
    }
}

TEST_F(worker_pool_test, worker_ids_are_unique_and_increasing) {
    work_request<int> first;
    first.body = [](work_context&) -> offload::result<int> { return 1; };
    work_request<int> second = first;

    const auto a = pool.submit(std::move(first));
    const auto b = pool.submit(std::move(second));
    EXPECT_LT(a.id(), b.id());

    ASSERT_TRUE(pump_until(loop, [&]() { return a.finished() && b.finished(); }));
}

TEST_F(worker_pool_test, throwing_callback_is_contained) {
    work_request<int> first;
    first.body = [](work_context&) -> offload::result<int> { return 1; };
    first.on_done = [](int) { throw std::runtime_error("callback failure"); };

    bool second_done = false;
    work_request<int> second;
    second.body = [](work_context&) -> offload::result<int> { return 2; };
    second.on_done = [&](int) { second_done = true; };

    const auto a = pool.submit(std::move(first));
    const auto b = pool.submit(std::move(second));
    ASSERT_TRUE(pump_until(loop, [&]() { return a.finished() && b.finished(); }));

    EXPECT_EQ(a.state(), worker_state::done);
    EXPECT_TRUE(second_done);
}

TEST_F(worker_pool_test, dropped_handle_still_delivers) {
    bool done = false;
    {
        work_request<int> request;
        request.body = [](work_context&) -> offload::result<int> { return 5; };
        request.on_done = [&](int) { done = true; };
        (void)pool.submit(std::move(request));
    }

    ASSERT_TRUE(pump_until(loop, [&]() { return done; }));
}

TEST_F(worker_pool_test, shutdown_rejects_new_submissions) {
    recorder trace;
    work_request<int> live_request;
    live_request.body = [](work_context& context) -> offload::result<int> {
        while (true) {
            if (auto checkpoint = context.check_cancelled(); !checkpoint) {
                return offload::err<int>(checkpoint.error());
            }
            std::this_thread::sleep_for(1ms);
        }
    };
    trace.attach(live_request);
    const auto live = pool.submit(std::move(live_request));
    ASSERT_TRUE(live.valid());

    pool.shutdown();
    EXPECT_TRUE(pool.closed());
    EXPECT_TRUE(live.cancel_requested());

    work_request<int> request;
    request.body = [](work_context&) -> offload::result<int> { return 1; };

    const auto rejected = pool.try_submit(request);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code(), offload::work_errc::pool_closed);

    const auto empty = pool.submit(request);
    EXPECT_FALSE(empty.valid());
    empty.cancel();
    EXPECT_EQ(empty.id(), 0U);

    // The worker that was live at shutdown still settles on the loop.
    ASSERT_TRUE(pump_until(loop, [&]() { return live.finished(); }));
    EXPECT_EQ(live.state(), worker_state::cancelled);
    EXPECT_EQ(trace.terminal_count, 1);
    EXPECT_EQ(trace.events, std::vector<std::string>{"cancel"});
    EXPECT_EQ(pool.active_count(), 0U);
}

TEST_F(worker_pool_test, shutdown_delivers_result_finished_before_it) {
    recorder trace;
    std::atomic<bool> body_returned{false};

    work_request<int> request;
    request.body = [&](work_context&) -> offload::result<int> {
        body_returned.store(true);
        return 3;
    };
    trace.attach(request);
    const auto worker = pool.submit(std::move(request));

    while (!body_returned.load()) {
        std::this_thread::sleep_for(1ms);
    }
    pool.shutdown();

    ASSERT_TRUE(pump_until(loop, [&]() { return worker.finished(); }));
    EXPECT_EQ(worker.state(), worker_state::done);
    EXPECT_EQ(trace.events, std::vector<std::string>{"done:3"});
}

TEST(worker_pool_lifetime_test, destroying_pool_cancels_and_discards_notifications) {
    offload::runtime::main_loop loop;
    ASSERT_TRUE(loop.valid());

    std::atomic<bool> body_saw_cancel{false};
    bool any_callback = false;
    offload::runtime::worker<int> worker;
    {
        offload::runtime::worker_pool pool{loop};

        work_request<int> request;
        request.body = [&](work_context& context) -> offload::result<int> {
            while (!context.cancellation_requested()) {
                std::this_thread::sleep_for(1ms);
            }
            body_saw_cancel.store(true);
            return offload::err<int>(context.check_cancelled().error());
        };
        request.on_done = [&](int) { any_callback = true; };
        request.on_error = [&](const std::string&) { any_callback = true; };
        request.on_cancel = [&]() { any_callback = true; };

        worker = pool.submit(std::move(request));
        ASSERT_TRUE(worker.valid());
    }

    EXPECT_TRUE(body_saw_cancel.load());
    EXPECT_EQ(worker.state(), worker_state::cancelled);
    EXPECT_TRUE(worker.finished());
    EXPECT_EQ(loop.pending(), 1U);
    ASSERT_TRUE(loop.poll().has_value());
    EXPECT_FALSE(any_callback);
    EXPECT_EQ(worker.state(), worker_state::cancelled);
}

TEST(worker_pool_lifetime_test, destroying_pool_joins_bodies_before_the_loop_goes_away) {
    std::atomic<bool> body_finished{false};
    {
        offload::runtime::main_loop loop;
        ASSERT_TRUE(loop.valid());
        {
            offload::runtime::worker_pool pool{loop};

            work_request<void> request;
            request.body = [&](work_context& context) -> offload::result<void> {
                std::this_thread::sleep_for(100ms);
                context.progress(50, "late");
                body_finished.store(true);
                return offload::ok();
            };
            (void)pool.submit(std::move(request));
        }
        // The body ran to completion inside the pool destructor, so its late
        // progress was posted to a loop that is still alive.
        EXPECT_TRUE(body_finished.load());
        EXPECT_EQ(loop.pending(), 2U);
    }
    EXPECT_TRUE(body_finished.load());
}

} // namespace
