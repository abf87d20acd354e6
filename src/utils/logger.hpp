#ifndef HTTP_CONNECTOR_LOGGER_HPP
#define HTTP_CONNECTOR_LOGGER_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace logging {
    enum class Level : uint8_t { Trace, Debug, Info, Warn, Error };

    std::string_view level_name(Level lvl);

    // Throws std::invalid_argument for unknown names.
    Level parse_level(std::string_view name);

    // Process-wide output shared by every Logger. Writes are serialized.
    class Sink {
       public:
        static Sink& instance();

        ~Sink() = default;
        Sink(const Sink&) = delete;
        Sink& operator=(const Sink&) = delete;
        Sink(Sink&&) = delete;
        Sink& operator=(Sink&&) = delete;

        void set_output(std::ostream* os);
        void write(std::string_view line);

       private:
        Sink();

        std::ostream* out_;
        std::mutex mutex_;
    };

    class Logger {
       public:
        explicit Logger(std::string name, Level level = Level::Warn);

        // The level may change while other threads are logging.
        void set_level(Level lvl) { level_.store(lvl, std::memory_order_relaxed); }
        [[nodiscard]] Level level() const { return level_.load(std::memory_order_relaxed); }
        [[nodiscard]] const std::string& name() const { return name_; }
        [[nodiscard]] bool enabled(Level lvl) const { return lvl >= level(); }

        // "YYYY-MM-DD HH:MM:SS level=INFO    - Name.func(): message"
        void log(Level lvl, std::string_view func, std::string_view msg) const;

       private:
        std::string name_;
        std::atomic<Level> level_;
    };

    // Collects << into a string and hands it to the logger on destruction.
    class LogStream {
       public:
        LogStream(const Logger& logger, Level lvl, const char* func) : logger_(logger), lvl_(lvl), func_(func) {}

        ~LogStream() { logger_.log(lvl_, func_, ss_.str()); }
        LogStream(const LogStream&) = delete;
        LogStream& operator=(const LogStream&) = delete;
        LogStream(LogStream&&) = delete;
        LogStream& operator=(LogStream&&) = delete;

        template <typename T>
        LogStream& operator<<(const T& v) {
            ss_ << v;
            return *this;
        }

       private:
        const Logger& logger_;
        Level lvl_;
        const char* func_;
        std::ostringstream ss_;
    };
}  // namespace logging

#define HC_LOG(logger, lvl, msg)                                   \
    do {                                                           \
        if ((logger).enabled(lvl)) {                               \
            ::logging::LogStream((logger), (lvl), __func__) << msg; \
        }                                                          \
    } while (0)

#define HC_LOG_TRACE(logger, msg) HC_LOG(logger, ::logging::Level::Trace, msg)
#define HC_LOG_DEBUG(logger, msg) HC_LOG(logger, ::logging::Level::Debug, msg)
#define HC_LOG_INFO(logger, msg) HC_LOG(logger, ::logging::Level::Info, msg)
#define HC_LOG_WARN(logger, msg) HC_LOG(logger, ::logging::Level::Warn, msg)
#define HC_LOG_ERROR(logger, msg) HC_LOG(logger, ::logging::Level::Error, msg)

#endif
