#include "channels/telegram_channel.hpp"

#include <chrono>
#include <cstdlib>
#include <vector>

#ifdef HAVE_CURL
#include <tgbot/net/CurlHttpClient.h>
#endif

#include "utils/common.hpp"

namespace courier::channels {
namespace {

bool ProxyConfigured() {
    for (const char* name : {"COURIER_TELEGRAM_USE_CURL", "HTTPS_PROXY", "HTTP_PROXY", "ALL_PROXY",
                             "https_proxy", "http_proxy", "all_proxy"}) {
        if (std::getenv(name) != nullptr) {
            return true;
        }
    }
    return false;
}

// Maps Telegram API error text onto the dispatcher's permanent-failure markers.
std::string ClassifyApiError(const std::string& what) {
    const auto lower = courier::utils::ToLower(what);
    if (lower.find("unauthorized") != std::string::npos) {
        return "invalid_auth: " + what;
    }
    if (lower.find("chat not found") != std::string::npos) {
        return "channel_not_found: " + what;
    }
    if (lower.find("forbidden") != std::string::npos) {
        return "permission_denied: " + what;
    }
    return "telegram_api_error: " + what;
}

}  // namespace

TelegramChannel::TelegramChannel(const courier::config::TelegramConfig& config,
                                 courier::bus::MessageBus& bus,
                                 courier::utils::Logger logger)
    : ChannelBase("telegram", bus, config.allow_from, std::move(logger))
    , config_(config) {}

TelegramChannel::~TelegramChannel() {
    Stop();
}

void TelegramChannel::Start() {
    if (running_) {
        return;
    }
    if (config_.token.empty()) {
        logger_.Warn("token is empty; channel disabled");
        return;
    }
    if (ProxyConfigured()) {
#ifdef HAVE_CURL
        http_client_ = std::make_unique<TgBot::CurlHttpClient>();
        bot_ = std::make_unique<TgBot::Bot>(config_.token, *http_client_);
        logger_.Info("bot initialized with CurlHttpClient (proxy-aware)");
#else
        bot_ = std::make_unique<TgBot::Bot>(config_.token);
        logger_.Info("curl not available, fallback to BoostHttpOnlySslClient");
#endif
    } else {
        bot_ = std::make_unique<TgBot::Bot>(config_.token);
        logger_.Info("bot initialized with BoostHttpOnlySslClient");
    }
    bot_->getEvents().onAnyMessage([this](TgBot::Message::Ptr message) {
        OnMessage(message);
    });

    running_ = true;
    polling_ = true;
    polling_thread_ = std::make_unique<std::thread>([this]() {
        long_poll_ = std::make_unique<TgBot::TgLongPoll>(*bot_);
        while (running_ && polling_) {
            try {
                long_poll_->start();
            } catch (const std::exception& ex) {
                logger_.Warn("long poll error", {{"error", ex.what()}});
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }
    });
}

void TelegramChannel::Stop() {
    running_ = false;
    polling_ = false;
    if (polling_thread_ && polling_thread_->joinable()) {
        polling_thread_->join();
    }
    polling_thread_.reset();
    long_poll_.reset();
    bot_.reset();
    http_client_.reset();
}

void TelegramChannel::OnMessage(const TgBot::Message::Ptr& message) {
    if (!message || !message->from || !message->chat) {
        return;
    }
    std::string sender_id = std::to_string(message->from->id);
    if (!message->from->username.empty()) {
        sender_id += "|" + message->from->username;
    }
    const std::string chat_id = std::to_string(message->chat->id);
    const std::string message_id = std::to_string(message->messageId);
    {
        std::lock_guard<std::mutex> lock(chat_mutex_);
        message_chat_ids_[message_id] = chat_id;
    }

    std::vector<std::string> parts;
    if (!message->text.empty()) {
        parts.push_back(message->text);
    }
    if (!message->caption.empty()) {
        parts.push_back(message->caption);
    }

    std::unordered_map<std::string, std::string> metadata;
    metadata["message_id"] = message_id;
    metadata["user_id"] = std::to_string(message->from->id);
    metadata["username"] = message->from->username;
    metadata["is_group"] = message->chat->type != TgBot::Chat::Type::Private ? "true" : "false";
    HandleMessage(message_id, sender_id, chat_id, courier::utils::Join(parts, "\n"), metadata);
}

std::string TelegramChannel::ResolveChatId(const courier::bus::OutboundMessage& msg) {
    if (!msg.chat_id.empty() || msg.reply_to.empty()) {
        return msg.chat_id;
    }
    std::lock_guard<std::mutex> lock(chat_mutex_);
    auto it = message_chat_ids_.find(msg.reply_to);
    return it == message_chat_ids_.end() ? std::string() : it->second;
}

SendResult TelegramChannel::Send(const courier::bus::OutboundMessage& msg) {
    if (!bot_) {
        return SendResult::Failure("bot_token_missing");
    }
    const auto chat_id = ResolveChatId(msg);
    if (chat_id.empty()) {
        return SendResult::Failure("chat_id_required");
    }
    long long chat = 0;
    long long reply_to_message_id = 0;
    try {
        chat = std::stoll(chat_id);
        if (!msg.reply_to.empty()) {
            reply_to_message_id = std::stoll(msg.reply_to);
        }
    } catch (const std::exception&) {
        return SendResult::Failure("invalid_arguments: non-numeric telegram id");
    }
    try {
        auto sent = bot_->getApi().sendMessage(chat, msg.content, false, reply_to_message_id);
        return SendResult::Success(sent ? std::to_string(sent->messageId) : msg.id);
    } catch (const TgBot::TgException& ex) {
        return SendResult::Failure(ClassifyApiError(ex.what()));
    } catch (const std::exception& ex) {
        return SendResult::Failure(std::string("telegram_send_failed: ") + ex.what());
    }
}

}  // namespace courier::channels
