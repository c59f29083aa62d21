#include <gtest/gtest.h>
#include "../common/thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace {

std::vector<int> numbers(int count) {
    std::vector<int> out;
    for (int i = 0; i < count; ++i) out.push_back(i);
    return out;
}

}

TEST(ThreadPoolTest, RejectsWorkerCountBelowOne) {
    std::vector<int> tasks = numbers(3);
    auto noop = [](const CancelToken&, const int&) { return Result<void>::Ok(); };
    Result<void> r = runWorkerPool(CancelToken(), tasks, 0, noop);
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.code, ErrorCode::Config);

    auto producer = [](const CancelToken&, TaskSink<int>&) { return Result<void>::Ok(); };
    r = runWorkerPoolStream<int>(CancelToken(), -1, noop, producer);
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.code, ErrorCode::Config);
}

TEST(ThreadPoolTest, EveryTaskRunsExactlyOnce) {
    const int taskCount = 40;
    std::vector<int> tasks = numbers(taskCount);
    for (int workers : {1, 4, taskCount, taskCount + 10}) {
        std::vector<std::atomic<int>> runs(taskCount);
        for (auto& r : runs) r = 0;
        Result<void> r = runWorkerPool(CancelToken(), tasks, workers, [&](const CancelToken&, const int& t) {
            runs[t]++;
            return Result<void>::Ok();
        });
        ASSERT_TRUE(r.success) << r.message;
        for (int i = 0; i < taskCount; ++i) EXPECT_EQ(runs[i].load(), 1) << "workers " << workers << " task " << i;
    }
}

TEST(ThreadPoolTest, NeverExceedsWorkerLimit) {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<int> tasks = numbers(30);
    Result<void> r = runWorkerPool(CancelToken(), tasks, 3, [&](const CancelToken&, const int&) {
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --active;
        return Result<void>::Ok();
    });
    ASSERT_TRUE(r.success);
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(ThreadPoolTest, FirstFailureStopsUnstartedTasks) {
    std::vector<int> tasks = numbers(200);
    std::atomic<int> started{0};
    Result<void> r = runWorkerPool(CancelToken(), tasks, 2, [&](const CancelToken&, const int& t) {
        ++started;
        if (t == 3) return Result<void>::Error("task 3 broke", ErrorCode::Remote);
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return Result<void>::Ok();
    });
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.message, "task 3 broke");
    EXPECT_EQ(r.code, ErrorCode::Remote);
    // at most the queue (2 workers x 2) plus the running ones got past task 3
    EXPECT_LT(started.load(), 20);
}

TEST(ThreadPoolTest, OnlyTheFirstErrorIsKept) {
    std::vector<int> tasks = numbers(8);
    Result<void> r = runWorkerPool(CancelToken(), tasks, 8, [&](const CancelToken&, const int& t) {
        if (t == 0) return Result<void>::Error("first");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return Result<void>::Error("later " + std::to_string(t));
    });
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.message, "first");
}

TEST(ThreadPoolTest, RunningTasksObserveCancellation) {
    std::vector<int> tasks = numbers(4);
    std::atomic<int> sawCancel{0};
    std::atomic<int> started{0};
    Result<void> r = runWorkerPool(CancelToken(), tasks, 4, [&](const CancelToken& token, const int& t) {
        if (t == 0) {
            // fail only once the other three are already running
            for (int i = 0; i < 400 && started.load() < 3; ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            return Result<void>::Error("boom");
        }
        ++started;
        for (int i = 0; i < 200 && !token.isCancelled(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        if (token.isCancelled()) {
            ++sawCancel;
            return token.status();
        }
        return Result<void>::Ok();
    });
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.message, "boom");
    EXPECT_EQ(sawCancel.load(), 3);
}

TEST(ThreadPoolTest, ExpiredCallerDeadlineIsReturnedAsIs) {
    CancelToken expired = CancelToken::withTimeout(std::chrono::milliseconds(0));
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    std::atomic<int> ran{0};
    std::vector<int> tasks = numbers(5);
    Result<void> r = runWorkerPool(expired, tasks, 2, [&](const CancelToken&, const int&) {
        ++ran;
        return Result<void>::Ok();
    });
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.code, ErrorCode::DeadlineExceeded);
    EXPECT_EQ(ran.load(), 0);
}

TEST(ThreadPoolTest, CallerCancellationDoesNotMaskEarlierError) {
    CancelToken parent;
    std::vector<int> tasks = numbers(10);
    Result<void> r = runWorkerPool(parent, tasks, 2, [&](const CancelToken& token, const int& t) {
        if (t == 0) return Result<void>::Error("real failure", ErrorCode::Io);
        parent.cancel();
        return token.status();
    });
    ASSERT_FALSE(r.success);
    // whichever came first, the run reports it; a genuine error is never replaced
    if (r.code != ErrorCode::Cancelled) {
        EXPECT_EQ(r.message, "real failure");
    }
}

TEST(ThreadPoolTest, CallerCancellationMidRunIsReported) {
    CancelToken parent;
    std::vector<int> tasks = numbers(100);
    std::atomic<int> ran{0};
    Result<void> r = runWorkerPool(parent, tasks, 2, [&](const CancelToken& token, const int& t) {
        ++ran;
        if (t == 5) parent.cancel();
        if (token.isCancelled()) return token.status();
        return Result<void>::Ok();
    });
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.code, ErrorCode::Cancelled);
    EXPECT_LT(ran.load(), 100);
}

TEST(ThreadPoolTest, StreamedProducerFeedsWorkers) {
    std::mutex mutex;
    std::set<int> seen;
    auto worker = [&](const CancelToken&, const int& t) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.insert(t);
        return Result<void>::Ok();
    };
    auto producer = [](const CancelToken& token, TaskSink<int>& sink) {
        for (int i = 0; i < 500; ++i) {
            if (!sink.push(i)) return token.status();
        }
        return Result<void>::Ok();
    };
    Result<void> r = runWorkerPoolStream<int>(CancelToken(), 4, worker, producer);
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(seen.size(), 500u);
}

TEST(ThreadPoolTest, StreamedProducerErrorIsReturned) {
    std::atomic<int> ran{0};
    auto worker = [&](const CancelToken&, const int&) {
        ++ran;
        return Result<void>::Ok();
    };
    auto producer = [](const CancelToken& token, TaskSink<int>& sink) -> Result<void> {
        for (int i = 0; i < 3; ++i) {
            if (!sink.push(i)) return token.status();
        }
        return Result<void>::Error("listing failed", ErrorCode::Transient);
    };
    Result<void> r = runWorkerPoolStream<int>(CancelToken(), 2, worker, producer);
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.message, "listing failed");
    EXPECT_LE(ran.load(), 3);
}

TEST(ThreadPoolTest, StreamedProducerStopsAfterWorkerFailure) {
    std::atomic<int> pushed{0};
    auto worker = [](const CancelToken&, const int& t) {
        if (t == 0) return Result<void>::Error("worker failed", ErrorCode::Remote);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
        return Result<void>::Ok();
    };
    auto producer = [&](const CancelToken& token, TaskSink<int>& sink) {
        for (int i = 0; i < 100000; ++i) {
            if (!sink.push(i)) return token.status();
            ++pushed;
        }
        return Result<void>::Ok();
    };
    Result<void> r = runWorkerPoolStream<int>(CancelToken(), 2, worker, producer);
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.message, "worker failed");
    EXPECT_LT(pushed.load(), 100000);
}

TEST(CancelTokenTest, ChildFollowsParentButNotTheOtherWay) {
    CancelToken parent;
    CancelToken child = parent.child();
    child.cancel();
    EXPECT_TRUE(child.isCancelled());
    EXPECT_FALSE(parent.isCancelled());

    CancelToken other = parent.child();
    parent.cancel();
    EXPECT_TRUE(other.isCancelled());
    EXPECT_EQ(other.reason(), ErrorCode::Cancelled);
}

TEST(CancelTokenTest, DeadlineFires) {
    CancelToken token = CancelToken::withTimeout(std::chrono::milliseconds(30));
    EXPECT_TRUE(token.status().success);
    EXPECT_FALSE(token.sleepFor(std::chrono::milliseconds(500)));
    EXPECT_EQ(token.status().code, ErrorCode::DeadlineExceeded);
    EXPECT_EQ(token.status().message, "deadline exceeded");
}
