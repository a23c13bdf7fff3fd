#include "channels/channel_manager.hpp"

#include <exception>

#include "utils/common.hpp"

namespace courier::channels {

ChannelManager::ChannelManager(courier::utils::Logger logger)
    : logger_(std::move(logger)) {}

void ChannelManager::Register(std::unique_ptr<ChannelBase> channel) {
    auto name = courier::utils::ToLower(channel->Name());
    std::lock_guard<std::mutex> lock(mutex_);
    channels_[std::move(name)] = std::move(channel);
}

ChannelBase* ChannelManager::GetChannel(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = channels_.find(courier::utils::ToLower(name));
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second.get();
}

SendResult ChannelManager::Send(const courier::bus::OutboundMessage& msg) {
    const auto provider = ResolveProvider(msg);
    if (!provider) {
        return SendResult::Failure("channel_not_found");
    }
    auto channel = GetChannel(*provider);
    if (!channel) {
        return SendResult::Failure("channel_not_found:" + *provider);
    }
    if (!channel->IsRunning()) {
        return SendResult::Failure("channel_not_running:" + *provider);
    }
    try {
        return channel->Send(msg);
    } catch (const std::exception& ex) {
        logger_.Warn("channel send threw", {{"provider", *provider}, {"error", ex.what()}});
        return SendResult::Failure(ex.what());
    }
}

void ChannelManager::StartAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, channel] : channels_) {
        channel->Start();
        logger_.Info("channel started", {{"provider", name}, {"running", channel->IsRunning() ? "true" : "false"}});
    }
}

void ChannelManager::StopAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, channel] : channels_) {
        channel->Stop();
    }
}

std::unordered_map<std::string, bool> ChannelManager::Status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<std::string, bool> status;
    for (const auto& [name, channel] : channels_) {
        status[name] = channel->IsRunning();
    }
    return status;
}

}  // namespace courier::channels
