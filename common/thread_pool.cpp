#include "thread_pool.hpp"

namespace {
// workers re-check the caller's deadline at least this often while idle
const std::chrono::milliseconds POLL_INTERVAL(25);
}

ThreadPool::ThreadPool(size_t threads, size_t queueCapacity, const CancelToken& parent)
    : capacity_(queueCapacity == 0 ? 1 : queueCapacity), parent_(parent), token_(parent.child()) {
    for (size_t i = 0; i < threads; ++i) {
        workers.emplace_back([this]() { workerLoop(); });
    }
}

ThreadPool::~ThreadPool() {
    if (!joined_) {
        token_.cancel();
        wait();
    }
}

void ThreadPool::workerLoop() {
    for (;;) {
        Job job;
        // lock
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            while (!stop && tasks.empty() && !token_.isCancelled()) {
                condition.wait_for(lock, POLL_INTERVAL);
            }

            // a cancelled pool never starts what is still queued
            if (token_.isCancelled())
                return;
            if (tasks.empty())
                return;

            job = std::move(tasks.front());
            tasks.pop();
        }
        space.notify_one();

        Result<void> result = job(token_); // Execute the task
        if (!result.success) {
            // a job that gave up because the pool was already cancelled is not a new failure
            if (isCancellation(result.code) && token_.isCancelled())
                return;
            recordFailure(result);
            return;
        }
    }
}

bool ThreadPool::submit(Job job) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        while (!stop && tasks.size() >= capacity_ && !token_.isCancelled()) {
            space.wait_for(lock, POLL_INTERVAL);
        }
        if (stop || token_.isCancelled())
            return false;

        tasks.emplace(std::move(job));
    }
    condition.notify_one();
    return true;
}

void ThreadPool::recordFailure(const Result<void>& error) {
    {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!hasError_) {
            hasError_ = true;
            firstError_ = error;
        }
    }
    token_.cancel();
    condition.notify_all();
    space.notify_all();
}

void ThreadPool::fail(const Result<void>& error) {
    recordFailure(error);
}

void ThreadPool::close() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex);
        stop = true;
    }
    condition.notify_all(); // Wake all threads
    space.notify_all();
}

Result<void> ThreadPool::wait() {
    if (!joined_) {
        close();
        for (std::thread& worker : workers)
            worker.join();
        joined_ = true;
    }

    {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (hasError_) return firstError_;
    }
    return parent_.status();
}
