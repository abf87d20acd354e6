#include "logger.hpp"

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

#include "string_utils.hpp"

namespace logging {
    namespace {
        const size_t LEVEL_COLUMN_WIDTH = 7;
        const size_t TIMESTAMP_BUFFER_SIZE = 32;

        std::string timestamp() {
            const auto now = std::chrono::system_clock::now();
            const std::time_t t = std::chrono::system_clock::to_time_t(now);
            std::tm tm{};
            localtime_r(&t, &tm);

            std::array<char, TIMESTAMP_BUFFER_SIZE> buf{};
            std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &tm);
            return buf.data();
        }
    }  // namespace

    std::string_view level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace:
                return "TRACE";
            case Level::Debug:
                return "DEBUG";
            case Level::Info:
                return "INFO";
            case Level::Warn:
                return "WARNING";
            case Level::Error:
                return "ERROR";
        }
        return "?";
    }

    Level parse_level(std::string_view name) {
        const std::string lower = string_utils::to_lower(name);
        if (lower == "trace") {
            return Level::Trace;
        }
        if (lower == "debug") {
            return Level::Debug;
        }
        if (lower == "info") {
            return Level::Info;
        }
        if (lower == "warn" || lower == "warning") {
            return Level::Warn;
        }
        if (lower == "error") {
            return Level::Error;
        }
        throw std::invalid_argument("Unknown log level: " + std::string(name));
    }

    //
    // Sink
    //

    Sink::Sink() : out_(&std::cerr) {}

    Sink& Sink::instance() {
        static Sink inst;
        return inst;
    }

    void Sink::set_output(std::ostream* os) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os != nullptr ? os : &std::cerr;
    }

    void Sink::write(std::string_view line) {
        std::lock_guard<std::mutex> lock(mutex_);
        *out_ << line << '\n';
        out_->flush();
    }

    //
    // Logger
    //

    Logger::Logger(std::string name, Level level) : name_(std::move(name)), level_(level) {}

    void Logger::log(Level lvl, std::string_view func, std::string_view msg) const {
        if (!enabled(lvl)) {
            return;
        }

        std::ostringstream line;
        line << timestamp() << " level=" << std::left << std::setw(LEVEL_COLUMN_WIDTH) << level_name(lvl) << " - " << name_ << "." << func
             << "(): " << msg;
        Sink::instance().write(line.str());
    }
}  // namespace logging
