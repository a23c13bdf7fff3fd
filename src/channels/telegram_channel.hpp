#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include <tgbot/tgbot.h>

#include "channels/channel_base.hpp"
#include "config/config_schema.hpp"

namespace courier::channels {

class TelegramChannel : public ChannelBase {
public:
    TelegramChannel(const courier::config::TelegramConfig& config,
                    courier::bus::MessageBus& bus,
                    courier::utils::Logger logger);
    ~TelegramChannel() override;

    void Start() override;
    void Stop() override;
    SendResult Send(const courier::bus::OutboundMessage& msg) override;

private:
    void OnMessage(const TgBot::Message::Ptr& message);
    std::string ResolveChatId(const courier::bus::OutboundMessage& msg);

    courier::config::TelegramConfig config_;
    std::mutex chat_mutex_;
    std::unordered_map<std::string, std::string> message_chat_ids_;
    std::unique_ptr<TgBot::HttpClient> http_client_;
    std::unique_ptr<TgBot::Bot> bot_;
    std::unique_ptr<TgBot::TgLongPoll> long_poll_;
    std::unique_ptr<std::thread> polling_thread_;
    std::atomic<bool> polling_{false};
};

}  // namespace courier::channels
