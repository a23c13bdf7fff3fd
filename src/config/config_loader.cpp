#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace courier::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
#if defined(_WIN32)
    if (!home) {
        home = std::getenv("USERPROFILE");
    }
#endif
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    return GetDataPath() / "config.json";
}

template <typename T>
void ApplyNumber(T& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number()) {
        target = source[key].get<T>();
    }
}

void ApplyBool(bool& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyChannelConfig(ChannelConfig& target, const nlohmann::json& channel) {
    if (channel.contains("dispatch") && channel["dispatch"].is_object()) {
        const auto& dispatch = channel["dispatch"];
        ApplyNumber(target.dispatch.inline_retries, dispatch, "inlineRetries");
        ApplyNumber(target.dispatch.retry_max, dispatch, "retryMax");
        ApplyNumber(target.dispatch.retry_base_ms, dispatch, "retryBaseMs");
        ApplyNumber(target.dispatch.retry_max_ms, dispatch, "retryMaxMs");
        ApplyNumber(target.dispatch.retry_jitter_ms, dispatch, "retryJitterMs");
        ApplyBool(target.dispatch.dlq_enabled, dispatch, "dlqEnabled");
        ApplyString(target.dispatch.dlq_path, dispatch, "dlqPath");
    }
    if (channel.contains("outboundDedupe") && channel["outboundDedupe"].is_object()) {
        const auto& dedupe = channel["outboundDedupe"];
        ApplyNumber(target.outbound_dedupe.ttl_ms, dedupe, "ttlMs");
        ApplyNumber(target.outbound_dedupe.max_size, dedupe, "maxSize");
    }
    if (channel.contains("rateLimit") && channel["rateLimit"].is_object()) {
        const auto& rate = channel["rateLimit"];
        ApplyNumber(target.rate_limit.capacity, rate, "capacity");
        ApplyNumber(target.rate_limit.refill_rate, rate, "refillRate");
        ApplyNumber(target.rate_limit.refill_interval_ms, rate, "refillIntervalMs");
    }
    if (channel.contains("circuitBreaker") && channel["circuitBreaker"].is_object()) {
        const auto& breaker = channel["circuitBreaker"];
        ApplyBool(target.circuit_breaker.enabled, breaker, "enabled");
        ApplyNumber(target.circuit_breaker.failure_threshold, breaker, "failureThreshold");
        ApplyNumber(target.circuit_breaker.reset_timeout_ms, breaker, "resetTimeoutMs");
        ApplyNumber(target.circuit_breaker.half_open_max, breaker, "halfOpenMax");
    }
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("channel") && data["channel"].is_object()) {
        ApplyChannelConfig(config.channel, data["channel"]);
    }

    if (data.contains("channels") && data["channels"].is_object()) {
        const auto& channels = data["channels"];
        if (channels.contains("telegram") && channels["telegram"].is_object()) {
            const auto& telegram = channels["telegram"];
            ApplyBool(config.channels.telegram.enabled, telegram, "enabled");
            ApplyString(config.channels.telegram.token, telegram, "token");
            if (telegram.contains("allowFrom") && telegram["allowFrom"].is_array()) {
                config.channels.telegram.allow_from.clear();
                for (const auto& item : telegram["allowFrom"]) {
                    if (item.is_string()) {
                        config.channels.telegram.allow_from.push_back(item.get<std::string>());
                    }
                }
            }
        }
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(config.logging.level, data["logging"], "level");
    }
}

// Floors that keep a hand-edited config from disabling backoff or the cache.
void ClampConfig(Config& config) {
    auto& dispatch = config.channel.dispatch;
    dispatch.inline_retries = std::max(0, dispatch.inline_retries);
    dispatch.retry_max = std::max(0, dispatch.retry_max);
    dispatch.retry_base_ms = std::max(100LL, dispatch.retry_base_ms);
    dispatch.retry_max_ms = std::max(100LL, dispatch.retry_max_ms);
    dispatch.retry_jitter_ms = std::max(0LL, dispatch.retry_jitter_ms);
    if (dispatch.dlq_path.empty()) {
        dispatch.dlq_path = (GetDataPath() / "dlq" / "dlq.db").string();
    }

    auto& dedupe = config.channel.outbound_dedupe;
    dedupe.ttl_ms = std::max(1000LL, dedupe.ttl_ms);
    dedupe.max_size = std::max<std::size_t>(500, dedupe.max_size);

    auto& rate = config.channel.rate_limit;
    rate.capacity = std::max(1, rate.capacity);
    rate.refill_rate = std::max(1, rate.refill_rate);
    rate.refill_interval_ms = std::max(1LL, rate.refill_interval_ms);

    auto& breaker = config.channel.circuit_breaker;
    breaker.failure_threshold = std::max(1, breaker.failure_threshold);
    breaker.reset_timeout_ms = std::max(0LL, breaker.reset_timeout_ms);
    breaker.half_open_max = std::max(1, breaker.half_open_max);
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

template <typename T>
void ApplyEnvNumber(T& target, const char* name) {
    const auto value = GetEnv(name);
    if (value.empty()) {
        return;
    }
    try {
        target = static_cast<T>(std::stoll(value));
    } catch (const std::exception&) {
        std::cerr << "[config] ignoring non-numeric " << name << "=" << value << std::endl;
    }
}

void ApplyEnvBool(bool& target, const char* name) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = ParseBool(value);
    }
}

void ApplyEnvString(std::string& target, const char* name) {
    const auto value = GetEnv(name);
    if (!value.empty()) {
        target = value;
    }
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

void ApplyEnvironment(Config& config) {
    auto& dispatch = config.channel.dispatch;
    ApplyEnvNumber(dispatch.inline_retries, "COURIER_DISPATCH_INLINE_RETRIES");
    ApplyEnvNumber(dispatch.retry_max, "COURIER_DISPATCH_RETRY_MAX");
    ApplyEnvNumber(dispatch.retry_base_ms, "COURIER_DISPATCH_RETRY_BASE_MS");
    ApplyEnvNumber(dispatch.retry_max_ms, "COURIER_DISPATCH_RETRY_MAX_MS");
    ApplyEnvNumber(dispatch.retry_jitter_ms, "COURIER_DISPATCH_RETRY_JITTER_MS");
    ApplyEnvBool(dispatch.dlq_enabled, "COURIER_DISPATCH_DLQ_ENABLED");
    ApplyEnvString(dispatch.dlq_path, "COURIER_DISPATCH_DLQ_PATH");

    ApplyEnvNumber(config.channel.outbound_dedupe.ttl_ms, "COURIER_OUTBOUND_DEDUPE_TTL_MS");
    ApplyEnvNumber(config.channel.outbound_dedupe.max_size, "COURIER_OUTBOUND_DEDUPE_MAX_SIZE");

    ApplyEnvNumber(config.channel.rate_limit.capacity, "COURIER_RATE_LIMIT_CAPACITY");
    ApplyEnvNumber(config.channel.rate_limit.refill_rate, "COURIER_RATE_LIMIT_REFILL_RATE");
    ApplyEnvNumber(config.channel.rate_limit.refill_interval_ms, "COURIER_RATE_LIMIT_REFILL_INTERVAL_MS");

    auto& breaker = config.channel.circuit_breaker;
    ApplyEnvBool(breaker.enabled, "COURIER_CIRCUIT_BREAKER_ENABLED");
    ApplyEnvNumber(breaker.failure_threshold, "COURIER_CIRCUIT_BREAKER_FAILURE_THRESHOLD");
    ApplyEnvNumber(breaker.reset_timeout_ms, "COURIER_CIRCUIT_BREAKER_RESET_TIMEOUT_MS");
    ApplyEnvNumber(breaker.half_open_max, "COURIER_CIRCUIT_BREAKER_HALF_OPEN_MAX");

    ApplyEnvBool(config.channels.telegram.enabled, "COURIER_TELEGRAM_ENABLED");
    const auto telegram_token = GetEnv("COURIER_TELEGRAM_TOKEN");
    if (!telegram_token.empty()) {
        config.channels.telegram.token = telegram_token;
        config.channels.telegram.enabled = true;
    }
    const auto telegram_allow_from = GetEnv("COURIER_TELEGRAM_ALLOW_FROM");
    if (!telegram_allow_from.empty()) {
        config.channels.telegram.allow_from = SplitCsv(telegram_allow_from);
    }

    ApplyEnvString(config.logging.level, "COURIER_LOG_LEVEL");
}

}  // namespace

std::filesystem::path GetDataPath() {
    return GetHomePath() / ".courier";
}

Config LoadConfigFromJson(const nlohmann::json& data) {
    Config config{};
    ApplyConfigFromJson(config, data);
    ClampConfig(config);
    return config;
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "[config] keeping defaults, failed to parse " << config_path.string()
                      << ": " << ex.what() << std::endl;
        }
    }

    ApplyEnvironment(config);
    ClampConfig(config);
    return config;
}

}  // namespace courier::config
