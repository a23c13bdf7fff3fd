#include "utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <sstream>

namespace courier::utils {
namespace {

std::string FormatFields(const LogFields& fields) {
    if (fields.empty()) {
        return {};
    }
    // Stable output order regardless of hash layout.
    std::map<std::string, std::string> ordered(fields.begin(), fields.end());
    std::ostringstream oss;
    for (const auto& [key, value] : ordered) {
        oss << " " << key << "=" << value;
    }
    return oss.str();
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value) {
    std::string lowered = value;
    lowered.erase(std::remove_if(lowered.begin(), lowered.end(), [](unsigned char c) {
        return std::isspace(c);
    }), lowered.end());
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

Logger::Logger(std::string name, LogConfig config)
    : name_(std::move(name))
    , config_(std::move(config)) {}

void Logger::Debug(const std::string& message, const LogFields& fields) const {
    Log(LogLevel::kDebug, message, fields);
}

void Logger::Info(const std::string& message, const LogFields& fields) const {
    Log(LogLevel::kInfo, message, fields);
}

void Logger::Warn(const std::string& message, const LogFields& fields) const {
    Log(LogLevel::kWarn, message, fields);
}

void Logger::Error(const std::string& message, const LogFields& fields) const {
    Log(LogLevel::kError, message, fields);
}

Logger Logger::Child(const std::string& name) const {
    return Logger(name, config_);
}

void Logger::Log(LogLevel level, const std::string& message, const LogFields& fields) const {
    if (static_cast<int>(level) < static_cast<int>(config_.min_level)) {
        return;
    }
    if (config_.sink) {
        config_.sink(name_, LogMessage{level, message, fields});
        return;
    }
    std::cerr << "[" << name_ << "] " << message << FormatFields(fields) << std::endl;
}

}  // namespace courier::utils
