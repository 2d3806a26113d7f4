/**
 * bctl logger.
 *
 * To define a custom logger, the application must implement bctl::Logger
 * and call global_logger to set the logger implementation.
 *
 * Log statements always go to stderr: stdout carries tokens and reports.
 */

#pragma once

#include <chrono>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <source_location>

#include <bctl/format.hpp>

namespace {
    /// Compile-time evalute basename from full file path
    consteval const char* log_basename_(const char* path) {
        const char* last = nullptr;
        for (const char* current = path; *current != '\0'; ++current)
            if (*current == '/' || *current == '\\') last = current;
        return last ? last + 1 : path;
    }
}

namespace bctl
{
    enum class log_level_t { L_TRACE, L_DEBUG, L_INFO, L_WARN, L_ERROR, L_FATAL };
    static const char* log_level_str[] = { "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL" }; // needs same order
    using enum log_level_t;

    /// Logger implementation interface
    class Logger {
    public:
        virtual void log(
            log_level_t level,
            const std::source_location src,
            const char* basename,
            std::string statement
        ) = 0;

    public:
        Logger() = default;
        Logger(const Logger&) = delete;
        Logger(Logger&&) = delete;
        Logger& operator=(const Logger&) = delete;
        Logger& operator=(Logger&&) = delete;
        virtual ~Logger() = default;
    };

    /// Default Logger implementation
    class DefaultLogger : public Logger {
    public:
        log_level_t min_level = L_WARN;

        inline void log(
            log_level_t level,
            const std::source_location src,
            const char* basename,
            std::string statement
        ) {
            if (level < min_level) return;
            fmt::print(stderr, "{} [{}] {} (bctl:{}:{}:{})\n",
                std::chrono::system_clock::now(),
                log_level_str[static_cast<size_t>(level)],
                statement,
                basename,
                src.line(),
                src.column());
        }
    };

    /// Get or set the global bctl logger
    inline Logger* global_logger(std::unique_ptr<Logger> set_to = nullptr) {
        static std::unique_ptr<Logger> logger = std::make_unique<DefaultLogger>(); // singleton
        if (set_to) logger = std::move(set_to);
        return logger.get();
    }

    consteval auto log(log_level_t level, const std::source_location src = std::source_location::current()) {
        const char* basename = log_basename_(src.file_name());
        return [=]<typename... T>(fmt::format_string<T...> fmt, T&&... args) constexpr -> void {
            bctl::global_logger()->log(level, src, basename, fmt::format(fmt, std::forward<T>(args)...));
        };
    }

    /// map a level name (as used in BCTL_LOG_LEVEL) to a level
    inline std::optional<log_level_t> log_level_from(std::string_view name) noexcept {
        for (size_t i = 0; i < std::size(log_level_str); ++i) {
            std::string_view l{log_level_str[i]};
            if (l.size() != name.size()) continue;
            bool same = true;
            for (size_t c = 0; c < l.size(); ++c)
                if (l[c] != name[c] && l[c] != name[c] - ('a' - 'A')) { same = false; break; }
            if (same) return static_cast<log_level_t>(i);
        }
        return std::nullopt;
    }

    /*
     * Set the default logger's threshold from the environment (BCTL_LOG_LEVEL)
     * then lower it one level for each -v given on the command line.
     */
    inline void configure_logging(int verbose) {
        auto* dl = dynamic_cast<DefaultLogger*>(global_logger());
        if (! dl) return;
        if (auto e = std::getenv("BCTL_LOG_LEVEL"); e) {
            if (auto l = log_level_from(e); l) dl->min_level = *l;
            else fmt::print(stderr, "ignoring unknown BCTL_LOG_LEVEL '{}'\n", e);
        }
        auto lvl = static_cast<int>(dl->min_level) - verbose;
        dl->min_level = static_cast<log_level_t>(lvl < 0? 0 : lvl);
    }
} // namespace bctl
