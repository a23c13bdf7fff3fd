#pragma once

#include <optional>
#include <string>

#include "bus/events.hpp"
#include "utils/common.hpp"

namespace courier::channels {

struct SendResult {
    bool ok = false;
    std::string message_id;
    std::string error;

    static SendResult Success(std::string message_id) {
        return SendResult{true, std::move(message_id), {}};
    }
    static SendResult Failure(std::string error) {
        return SendResult{false, {}, std::move(error)};
    }
};

// Transmits a message to whichever platform its provider names.
// Failures are reported in the result, never thrown.
class ChannelRegistry {
public:
    virtual ~ChannelRegistry() = default;
    virtual SendResult Send(const courier::bus::OutboundMessage& msg) = 0;
};

// Lowercased provider of a message, or nullopt when it names none.
inline std::optional<std::string> ResolveProvider(const courier::bus::OutboundMessage& msg) {
    auto provider = courier::utils::ToLower(msg.provider);
    if (provider.empty()) {
        return std::nullopt;
    }
    return provider;
}

}  // namespace courier::channels
