#ifndef HTTP_CONNECTOR_THREAD_POOL_HPP
#define HTTP_CONNECTOR_THREAD_POOL_HPP

#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace concurrency {
    class ThreadPool {
       public:
        explicit ThreadPool(size_t num_threads);

        ~ThreadPool();
        ThreadPool(const ThreadPool&) = delete;
        ThreadPool& operator=(const ThreadPool&) = delete;
        ThreadPool(ThreadPool&&) = delete;
        ThreadPool& operator=(ThreadPool&&) = delete;

        // min(32, hardware threads + 4)
        static size_t default_thread_count();

        // Tasks must not throw; an escaping exception terminates the worker's process.
        void enqueue(std::function<void()> next_task);
        void wait_all();
        [[nodiscard]] size_t size() const { return threads_.size(); }

       private:
        void worker_loop();

        std::vector<std::thread> threads_;
        std::queue<std::function<void()> > tasks_;
        std::mutex queue_mutex_;
        std::condition_variable condition_variable_;
        std::condition_variable completion_cv_;
        bool stop_ = false;
        size_t active_tasks_ = 0;
    };
}  // namespace concurrency

#endif
