#pragma once
#include "cancel_token.hpp"
#include "config.hpp"
#include "result.hpp"
#include <algorithm>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// Bounded worker pool with fail-fast semantics.
//
// Workers pull jobs from a queue of limited capacity, so a producer that
// outruns them blocks instead of buffering without bound. The first job that
// fails is remembered and fires the pool's cancellation token: queued jobs are
// dropped and submit() starts returning false. Jobs already running are left
// to finish on their own.
class ThreadPool {
public:
    using Job = std::function<Result<void>(const CancelToken&)>;

    ThreadPool(size_t threads, size_t queueCapacity, const CancelToken& parent);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // blocks while the queue is full; false once the pool is cancelled or closed
    bool submit(Job job);

    // records a failure that happened outside the workers (e.g. in a producer)
    void fail(const Result<void>& error);

    void close();

    // closes the queue, joins every worker and reports the first failure,
    // or the caller's own cancellation when nothing failed
    Result<void> wait();

    const CancelToken& token() const { return token_; }

private:
    void workerLoop();
    void recordFailure(const Result<void>& error);

    std::vector<std::thread> workers;
    std::queue<Job> tasks;
    size_t capacity_;

    std::mutex queue_mutex;
    std::condition_variable condition;      // job available or shutting down
    std::condition_variable space;          // room in the queue
    bool stop = false;

    CancelToken parent_;
    CancelToken token_;

    std::mutex error_mutex;
    bool hasError_ = false;
    Result<void> firstError_ = Result<void>::Ok();
    bool joined_ = false;
};

// Handed to a streamed producer; each push() becomes one job.
template<class T>
class TaskSink {
public:
    using Worker = std::function<Result<void>(const CancelToken&, const T&)>;

    TaskSink(ThreadPool& pool, Worker worker) : pool_(pool), worker_(std::move(worker)) {}

    // false means stop producing: the pool was cancelled
    bool push(T task) {
        const Worker* worker = &worker_;
        return pool_.submit([worker, task = std::move(task)](const CancelToken& token) {
            return (*worker)(token, task);
        });
    }

    const CancelToken& token() const { return pool_.token(); }

private:
    ThreadPool& pool_;
    Worker worker_;
};

inline Result<void> checkWorkerCount(int maxWorkers) {
    if (maxWorkers < 1) {
        return Result<void>::Error("max workers must be at least 1, got " + std::to_string(maxWorkers),
                                   ErrorCode::Config);
    }
    return Result<void>::Ok();
}

// Runs every task of a list known up front on min(maxWorkers, tasks.size()) threads.
template<class T, class Worker>
Result<void> runWorkerPool(const CancelToken& ctx, const std::vector<T>& tasks, int maxWorkers, Worker worker) {
    Result<void> valid = checkWorkerCount(maxWorkers);
    if (!valid.success) return valid;
    if (tasks.empty()) return Result<void>::Ok();

    Result<void> live = ctx.status();
    if (!live.success) return live;

    size_t workerCount = std::min(static_cast<size_t>(maxWorkers), tasks.size());
    size_t capacity = std::min(static_cast<size_t>(maxWorkers) * Config::WORKER_QUEUE_MULTIPLIER, tasks.size());

    ThreadPool pool(workerCount, capacity, ctx);
    for (const T& task : tasks) {
        const T* taskPtr = &task;
        bool queued = pool.submit([&worker, taskPtr](const CancelToken& token) {
            return worker(token, *taskPtr);
        });
        if (!queued) break;
    }
    return pool.wait();
}

// Runs tasks as a producer emits them, on exactly maxWorkers threads. The
// producer runs on the calling thread and should stop when push() returns false.
template<class T, class Worker, class Producer>
Result<void> runWorkerPoolStream(const CancelToken& ctx, int maxWorkers, Worker worker, Producer producer) {
    Result<void> valid = checkWorkerCount(maxWorkers);
    if (!valid.success) return valid;

    Result<void> live = ctx.status();
    if (!live.success) return live;

    ThreadPool pool(static_cast<size_t>(maxWorkers),
                    static_cast<size_t>(maxWorkers) * Config::WORKER_QUEUE_MULTIPLIER, ctx);
    TaskSink<T> sink(pool, typename TaskSink<T>::Worker(worker));

    Result<void> produced = producer(pool.token(), sink);
    if (!produced.success && !isCancellation(produced.code)) {
        pool.fail(produced);
    }
    return pool.wait();
}
