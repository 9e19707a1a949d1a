// src/thread_pool.cpp
#include "thread_pool.hpp"

namespace FileSplitter
{
    namespace Concurrency
    {

        ThreadPool::ThreadPool(size_t num_threads, std::string pool_name)
            : name(std::move(pool_name)), stop_all(false)
        {
            if (num_threads == 0)
            {
                throw std::runtime_error("ThreadPool " + name + " cannot be initialized with 0 threads.");
            }
            workers.reserve(num_threads);
            for (size_t i = 0; i < num_threads; ++i)
            {
                workers.emplace_back(
                    [this] {
                        for (;;)
                        {
                            std::function<void()> task;
                            {
                                std::unique_lock<std::mutex> lock(this->queue_mutex);
                                this->condition.wait(lock,
                                                     [this]
                                                     { return this->stop_all || !this->tasks.empty(); });

                                // Drain the queue before exiting so no submitted future is left unfulfilled
                                if (this->stop_all && this->tasks.empty())
                                    return;

                                task = std::move(this->tasks.front());
                                this->tasks.pop();
                            }
                            // packaged_task stores any exception in its future
                            task();
                        }
                    });
            }
        }

        ThreadPool::~ThreadPool()
        {
            {
                std::unique_lock<std::mutex> lock(queue_mutex);
                stop_all = true;
            }
            condition.notify_all();
            for (std::thread &worker : workers)
            {
                if (worker.joinable())
                {
                    worker.join();
                }
            }
        }

    } // namespace Concurrency
} // namespace FileSplitter
