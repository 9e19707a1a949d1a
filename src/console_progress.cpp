// src/console_progress.cpp
#include "console_progress.hpp"

namespace FileSplitter
{
    namespace Cli
    {

        namespace
        {
            int percentOf(uint64_t processed, uint64_t total)
            {
                if (total == 0)
                {
                    return 100;
                }
                if (processed >= total)
                {
                    return 100;
                }
                return static_cast<int>(static_cast<double>(processed) * 100.0 / static_cast<double>(total));
            }
        } // namespace

        // Prints only when the whole-percent value changes
        class ConsoleProgress::FileReporter : public Progress::ProgressReporter
        {
        public:
            FileReporter(ConsoleProgress &sink, std::string label) : sink(sink), label(std::move(label)) {}

            void report(uint64_t bytes_processed, uint64_t bytes_total) override
            {
                const int percent = percentOf(bytes_processed, bytes_total);
                if (percent == last_percent)
                {
                    return;
                }
                last_percent = percent;
                sink.printLine(formatLine(label, bytes_processed, bytes_total));
            }

        private:
            ConsoleProgress &sink;
            std::string label;
            int last_percent = -1;
        };

        ConsoleProgress::ConsoleProgress(std::ostream &out, bool enabled) : out(out), enabled(enabled) {}

        std::unique_ptr<Progress::ProgressReporter> ConsoleProgress::reporterFor(const std::filesystem::path &input)
        {
            if (!enabled)
            {
                return std::make_unique<Progress::NullProgressReporter>();
            }
            return std::make_unique<FileReporter>(*this, input.filename().string());
        }

        std::string ConsoleProgress::formatLine(const std::string &label, uint64_t processed, uint64_t total)
        {
            return label + ": " + std::to_string(processed) + "/" + std::to_string(total) + " bytes (" +
                   std::to_string(percentOf(processed, total)) + "%)";
        }

        void ConsoleProgress::printLine(const std::string &line)
        {
            std::lock_guard<std::mutex> lock(output_mutex);
            out << line << std::endl;
        }

    } // namespace Cli
} // namespace FileSplitter
