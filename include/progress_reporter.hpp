// include/progress_reporter.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <functional>

namespace FileSplitter
{
    namespace Progress
    {

        // Sink for byte-level progress of one file's pipeline. The engine calls report()
        // synchronously from the thread running that pipeline, once per chunk boundary.
        class ProgressReporter
        {
        public:
            virtual ~ProgressReporter() = default;
            virtual void report(uint64_t bytes_processed, uint64_t bytes_total) = 0;
        };

        class NullProgressReporter : public ProgressReporter
        {
        public:
            void report(uint64_t, uint64_t) override {}
        };

        class CallbackProgressReporter : public ProgressReporter
        {
        public:
            using Callback = std::function<void(uint64_t, uint64_t)>;

            explicit CallbackProgressReporter(Callback callback) : callback(std::move(callback)) {}

            void report(uint64_t bytes_processed, uint64_t bytes_total) override
            {
                if (callback)
                {
                    callback(bytes_processed, bytes_total);
                }
            }

        private:
            Callback callback;
        };

        // Cooperative cancellation, checked by the engine between chunks.
        class CancellationToken
        {
        public:
            void cancel() { cancelled.store(true); }
            bool isCancelled() const { return cancelled.load(); }

        private:
            std::atomic<bool> cancelled{false};
        };

    } // namespace Progress
} // namespace FileSplitter
