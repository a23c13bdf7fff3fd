#pragma once

#include <atomic>
#include <string>
#include <unordered_map>
#include <vector>

#include "bus/events.hpp"
#include "bus/message_bus.hpp"
#include "channels/channel_registry.hpp"
#include "utils/logging.hpp"

namespace courier::channels {

class ChannelBase {
public:
    ChannelBase(std::string name,
                courier::bus::MessageBus& bus,
                std::vector<std::string> allow_from,
                courier::utils::Logger logger);
    virtual ~ChannelBase() = default;
    virtual std::string Name() const { return name_; }
    virtual void Start() = 0;
    virtual void Stop() = 0;
    virtual SendResult Send(const courier::bus::OutboundMessage& msg) = 0;

    bool IsAllowed(const std::string& sender_id) const;
    bool HandleMessage(
        const std::string& message_id,
        const std::string& sender_id,
        const std::string& chat_id,
        const std::string& content,
        const std::unordered_map<std::string, std::string>& metadata);

    bool IsRunning() const { return running_; }

protected:
    std::string name_;
    courier::bus::MessageBus& bus_;
    std::vector<std::string> allow_from_;
    courier::utils::Logger logger_;
    std::atomic<bool> running_{false};
};

}  // namespace courier::channels
