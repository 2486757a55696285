#pragma once
#include <string>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace sentry {
enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

class Logger {
public:
    static void set_level(LogLevel lv) {
        std::lock_guard<std::mutex> lk(mu_);
        level_ = lv;
    }

    static LogLevel level() {
        std::lock_guard<std::mutex> lk(mu_);
        return level_;
    }

    template <typename... Args>
    static void debug(const char* fmt, Args... args) { write(LogLevel::Debug, stdout, "[D] ", fmt, args...); }

    template <typename... Args>
    static void info(const char* fmt, Args... args) { write(LogLevel::Info, stdout, "[I] ", fmt, args...); }

    template <typename... Args>
    static void warn(const char* fmt, Args... args) { write(LogLevel::Warn, stdout, "[W] ", fmt, args...); }

    template <typename... Args>
    static void error(const char* fmt, Args... args) { write(LogLevel::Error, stderr, "[E] ", fmt, args...); }

private:
    template <typename... Args>
    static void write(LogLevel lv, FILE* out, const char* tag, const char* fmt, Args... args) {
        std::lock_guard<std::mutex> lk(mu_);
        if (lv < level_) return;
        std::string line = timestamp() + " " + tag + fmt + "\n";
        if constexpr (sizeof...(Args) == 0) fputs(line.c_str(), out);
        else fprintf(out, line.c_str(), args...);
        fflush(out);
    }

    static std::string timestamp() {
        std::time_t now = std::time(nullptr);
        std::tm tm{};
        localtime_r(&now, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        return buf;
    }

    static inline std::mutex mu_{};
    static inline LogLevel level_{LogLevel::Info};
};
}
