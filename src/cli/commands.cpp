#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>

#include "bus/message_bus.hpp"
#include "channels/channel_manager.hpp"
#include "channels/dispatch_service.hpp"
#include "channels/dlq_store.hpp"
#include "channels/telegram_channel.hpp"
#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

std::filesystem::path GetPidFilePath() {
    return courier::config::GetDataPath() / "gateway.pid";
}

bool IsProcessRunning(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

std::optional<pid_t> ReadPidFile() {
    std::ifstream input(GetPidFilePath());
    if (!input.is_open()) {
        return std::nullopt;
    }
    pid_t pid = 0;
    input >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

bool WritePidFile(pid_t pid) {
    const auto path = GetPidFilePath();
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        return false;
    }
    output << pid;
    return true;
}

void RemovePidFile() {
    std::error_code ec;
    std::filesystem::remove(GetPidFilePath(), ec);
}

void HandleSignal(int signal) {
    g_signal = signal;
}

courier::utils::LogConfig MakeLogConfig(const courier::config::Config& config) {
    courier::utils::LogConfig log_config{};
    log_config.min_level = courier::utils::ParseLogLevel(config.logging.level);
    return log_config;
}

std::shared_ptr<courier::channels::DeadLetterSink> OpenDeadLetterStore(
    const courier::config::Config& config,
    const courier::utils::Logger& logger) {
    if (!config.channel.dispatch.dlq_enabled) {
        return nullptr;
    }
    try {
        return std::make_shared<courier::channels::SqliteDeadLetterStore>(config.channel.dispatch.dlq_path);
    } catch (const std::exception& ex) {
        logger.Error("dead-letter store unavailable", {{"path", config.channel.dispatch.dlq_path},
                                                       {"error", ex.what()}});
        return nullptr;
    }
}

void RegisterChannels(courier::channels::ChannelManager& channels,
                      const courier::config::Config& config,
                      courier::bus::MessageBus& bus,
                      const courier::utils::Logger& logger) {
    if (config.channels.telegram.enabled) {
        channels.Register(std::make_unique<courier::channels::TelegramChannel>(
            config.channels.telegram, bus, logger.Child("telegram")));
    }
}

nlohmann::json BuildDeadLetterJson(const courier::channels::DeadLetterRecord& record) {
    nlohmann::json metadata = nlohmann::json::object();
    for (const auto& [key, value] : record.metadata) {
        metadata[key] = value;
    }
    return {
        {"at", record.at},
        {"provider", record.provider},
        {"chat_id", record.chat_id},
        {"message_id", record.message_id},
        {"sender_id", record.sender_id},
        {"reply_to", record.reply_to},
        {"thread_id", record.thread_id},
        {"retry_count", record.retry_count},
        {"error", record.error},
        {"content", record.content},
        {"metadata", std::move(metadata)}
    };
}

int RunGateway() {
    const auto config = courier::config::LoadConfig();
    const courier::utils::Logger logger("gateway", MakeLogConfig(config));

    const auto existing_pid = ReadPidFile();
    if (existing_pid && IsProcessRunning(*existing_pid)) {
        std::cout << "courier gateway already running (pid=" << *existing_pid << ")" << std::endl;
        return 1;
    }
    RemovePidFile();
    if (!WritePidFile(::getpid())) {
        std::cout << "Failed to write gateway pid file." << std::endl;
        return 1;
    }

    courier::bus::MessageBus bus;
    courier::channels::ChannelManager channels(logger.Child("channels"));
    RegisterChannels(channels, config, bus, logger);
    courier::channels::DispatchService dispatch(
        bus,
        channels,
        courier::channels::DispatchOptionsFromConfig(config.channel, OpenDeadLetterStore(config, logger)),
        logger.Child("dispatch"));

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    channels.StartAll();
    dispatch.Start();
    std::cout << "courier gateway started. Press Ctrl+C to stop." << std::endl;

    while (g_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }

    dispatch.Stop();
    channels.StopAll();
    bus.Close();
    RemovePidFile();
    return 0;
}

int RunSend(const std::string& provider, const std::string& chat_id, const std::string& text) {
    const auto config = courier::config::LoadConfig();
    const courier::utils::Logger logger("send", MakeLogConfig(config));

    courier::bus::MessageBus bus;
    courier::channels::ChannelManager channels(logger.Child("channels"));
    RegisterChannels(channels, config, bus, logger);
    courier::channels::DispatchService dispatch(
        bus,
        channels,
        courier::channels::DispatchOptionsFromConfig(config.channel, OpenDeadLetterStore(config, logger)),
        logger.Child("dispatch"));
    channels.StartAll();

    courier::bus::OutboundMessage msg{};
    msg.id = "cli-" + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    msg.provider = provider;
    msg.channel = provider;
    msg.chat_id = chat_id;
    msg.sender_id = "cli";
    msg.content = text;

    const auto result = dispatch.Send(provider, msg);
    channels.StopAll();
    const nlohmann::json output = {
        {"ok", result.ok},
        {"message_id", result.message_id.empty() ? nlohmann::json(nullptr) : nlohmann::json(result.message_id)},
        {"error", result.error.empty() ? nlohmann::json(nullptr) : nlohmann::json(result.error)}
    };
    std::cout << output.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return result.ok ? 0 : 1;
}

int RunDeadLetterList(std::size_t limit) {
    const auto config = courier::config::LoadConfig();
    try {
        courier::channels::SqliteDeadLetterStore store(config.channel.dispatch.dlq_path);
        for (const auto& record : store.List(limit)) {
            std::cout << BuildDeadLetterJson(record).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                      << std::endl;
        }
    } catch (const std::exception& ex) {
        std::cerr << "[dlq] " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

int RunStatus() {
    const auto config = courier::config::LoadConfig();
    const auto& dispatch = config.channel.dispatch;
    const auto& dedupe = config.channel.outbound_dedupe;
    const auto& rate = config.channel.rate_limit;
    const auto& breaker = config.channel.circuit_breaker;
    const nlohmann::json status = {
        {"dispatch", {
            {"inlineRetries", dispatch.inline_retries},
            {"retryMax", dispatch.retry_max},
            {"retryBaseMs", dispatch.retry_base_ms},
            {"retryMaxMs", dispatch.retry_max_ms},
            {"retryJitterMs", dispatch.retry_jitter_ms},
            {"dlqEnabled", dispatch.dlq_enabled},
            {"dlqPath", dispatch.dlq_path}
        }},
        {"outboundDedupe", {{"ttlMs", dedupe.ttl_ms}, {"maxSize", dedupe.max_size}}},
        {"rateLimit", {
            {"capacity", rate.capacity},
            {"refillRate", rate.refill_rate},
            {"refillIntervalMs", rate.refill_interval_ms}
        }},
        {"circuitBreaker", {
            {"enabled", breaker.enabled},
            {"failureThreshold", breaker.failure_threshold},
            {"resetTimeoutMs", breaker.reset_timeout_ms},
            {"halfOpenMax", breaker.half_open_max}
        }},
        {"channels", {{"telegram", config.channels.telegram.enabled}}},
        {"gateway", {{"running", [] {
            const auto pid = ReadPidFile();
            return pid.has_value() && IsProcessRunning(*pid);
        }()}}}
    };
    std::cout << status.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    return 0;
}

void PrintUsage() {
    std::cout << "Usage: courier gateway | courier send <provider> <chat_id> <text>"
              << " | courier dlq [limit] | courier status" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];
    if (command == "gateway") {
        return RunGateway();
    }
    if (command == "send" && argc >= 5) {
        return RunSend(argv[2], argv[3], argv[4]);
    }
    if (command == "dlq") {
        std::size_t limit = 100;
        if (argc >= 3) {
            try {
                limit = static_cast<std::size_t>(std::stoul(argv[2]));
            } catch (const std::exception&) {
                std::cout << "Invalid limit: " << argv[2] << std::endl;
                return 1;
            }
        }
        return RunDeadLetterList(limit);
    }
    if (command == "status") {
        return RunStatus();
    }
    PrintUsage();
    return 1;
}
