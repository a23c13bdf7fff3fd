#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "channels/channel_base.hpp"
#include "channels/channel_registry.hpp"

namespace courier::channels {

class ChannelManager : public ChannelRegistry {
public:
    explicit ChannelManager(courier::utils::Logger logger);

    void Register(std::unique_ptr<ChannelBase> channel);
    ChannelBase* GetChannel(const std::string& name);
    SendResult Send(const courier::bus::OutboundMessage& msg) override;
    void StartAll();
    void StopAll();

    std::unordered_map<std::string, bool> Status() const;

private:
    courier::utils::Logger logger_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<ChannelBase>> channels_;
};

}  // namespace courier::channels
