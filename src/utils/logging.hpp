#pragma once

#include <functional>
#include <string>
#include <unordered_map>

namespace courier::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel ParseLogLevel(const std::string& value);

using LogFields = std::unordered_map<std::string, std::string>;

struct LogMessage {
    LogLevel level;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
    // Replaces console output when set.
    std::function<void(const std::string& name, const LogMessage& msg)> sink;
};

class Logger {
public:
    explicit Logger(std::string name, LogConfig config = {});

    void Debug(const std::string& message, const LogFields& fields = {}) const;
    void Info(const std::string& message, const LogFields& fields = {}) const;
    void Warn(const std::string& message, const LogFields& fields = {}) const;
    void Error(const std::string& message, const LogFields& fields = {}) const;

    Logger Child(const std::string& name) const;
    const std::string& Name() const { return name_; }

private:
    void Log(LogLevel level, const std::string& message, const LogFields& fields) const;

    std::string name_;
    LogConfig config_;
};

}  // namespace courier::utils
