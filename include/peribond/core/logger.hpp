#pragma once

#include <memory>
#include <string>
#include <chrono>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace prb {

// ============================================================================
// Logger Class
// ============================================================================

class Logger {
public:
    enum class Level {
        Trace = SPDLOG_LEVEL_TRACE,
        Debug = SPDLOG_LEVEL_DEBUG,
        Info = SPDLOG_LEVEL_INFO,
        Warn = SPDLOG_LEVEL_WARN,
        Error = SPDLOG_LEVEL_ERROR,
        Critical = SPDLOG_LEVEL_CRITICAL,
        Off = SPDLOG_LEVEL_OFF
    };

    // Get the global logger instance (singleton)
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    // Initialize logger with console output
    void init_console(Level level = Level::Info) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog(level));

        install(std::make_shared<spdlog::logger>("prb", console_sink), level);
    }

    // Initialize logger with rotating file output
    void init_file(const std::string& filename,
                   Level level = Level::Info,
                   std::size_t max_size = 1024 * 1024 * 10,  // 10MB
                   std::size_t max_files = 3) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            filename, max_size, max_files
        );
        file_sink->set_level(to_spdlog(level));

        install(std::make_shared<spdlog::logger>("prb", file_sink), level);
    }

    // Initialize logger with both console and file output
    void init_combined(const std::string& filename,
                       Level console_level = Level::Info,
                       Level file_level = Level::Debug) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(to_spdlog(console_level));

        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename);
        file_sink->set_level(to_spdlog(file_level));

        spdlog::sinks_init_list sink_list = {console_sink, file_sink};
        // Capture all, sinks will filter
        install(std::make_shared<spdlog::logger>("prb", sink_list), Level::Trace);
    }

    // Level from its lower-case name ("trace" ... "critical", "off"); Info if unknown
    static Level parse_level(const std::string& name) {
        auto level = spdlog::level::from_str(name);
        if (level == spdlog::level::off && name != "off") {
            return Level::Info;
        }
        return static_cast<Level>(level);
    }

    void set_level(Level level) {
        if (logger_) {
            logger_->set_level(to_spdlog(level));
        }
    }

    template<typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->trace(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->debug(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->info(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->warn(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->error(fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) logger_->critical(fmt, std::forward<Args>(args)...);
    }

    void flush() {
        if (logger_) logger_->flush();
    }

    std::shared_ptr<spdlog::logger> get_logger() {
        return logger_;
    }

private:
    Logger() {
        init_console();
    }

    ~Logger() {
        flush();
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    static spdlog::level::level_enum to_spdlog(Level level) {
        return static_cast<spdlog::level::level_enum>(level);
    }

    void install(std::shared_ptr<spdlog::logger> logger, Level level) {
        logger_ = std::move(logger);
        logger_->set_level(to_spdlog(level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        spdlog::set_default_logger(logger_);
    }

    std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define PRB_LOG_TRACE(...)    ::prb::Logger::instance().trace(__VA_ARGS__)
#define PRB_LOG_DEBUG(...)    ::prb::Logger::instance().debug(__VA_ARGS__)
#define PRB_LOG_INFO(...)     ::prb::Logger::instance().info(__VA_ARGS__)
#define PRB_LOG_WARN(...)     ::prb::Logger::instance().warn(__VA_ARGS__)
#define PRB_LOG_ERROR(...)    ::prb::Logger::instance().error(__VA_ARGS__)
#define PRB_LOG_CRITICAL(...) ::prb::Logger::instance().critical(__VA_ARGS__)

// ============================================================================
// Scoped Timer for Performance Logging
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(std::string name)
        : name_(std::move(name))
        , start_(std::chrono::steady_clock::now())
    {}

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
            end - start_
        ).count();

        PRB_LOG_DEBUG("{} took {} us", name_, duration);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    std::chrono::steady_clock::time_point start_;
};

#define PRB_SCOPED_TIMER_CONCAT_(a, b) a##b
#define PRB_SCOPED_TIMER_NAME_(line) PRB_SCOPED_TIMER_CONCAT_(prb_timer_, line)
#define PRB_SCOPED_TIMER(name) ::prb::ScopedTimer PRB_SCOPED_TIMER_NAME_(__LINE__)(name)

} // namespace prb
