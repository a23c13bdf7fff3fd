#include "channels/outbound_dedupe.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include "utils/common.hpp"

namespace courier::channels {
namespace {

constexpr const char* kKeySeparator = "::";

std::string MetadataValue(const courier::bus::OutboundMessage& msg, const char* key) {
    auto it = msg.metadata.find(key);
    return it == msg.metadata.end() ? std::string() : it->second;
}

std::string NormalizeMedia(const courier::bus::OutboundMessage& msg) {
    std::vector<std::string> parts;
    parts.reserve(msg.media.size());
    for (const auto& item : msg.media) {
        parts.push_back(item.type + ":" + NormalizeText(item.url));
    }
    std::sort(parts.begin(), parts.end());
    return courier::utils::Join(parts, "|");
}

}  // namespace

std::string NormalizeText(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    bool pending_space = false;
    for (const unsigned char c : value) {
        if (std::isspace(c)) {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space) {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(static_cast<char>(std::tolower(c)));
    }
    return result;
}

std::string DefaultOutboundDedupePolicy::Key(const std::string& provider,
                                             const courier::bus::OutboundMessage& msg) const {
    const auto kind = NormalizeText(MetadataValue(msg, "kind"));
    auto trigger = MetadataValue(msg, "trigger_message_id");
    if (trigger.empty()) {
        trigger = MetadataValue(msg, "source_message_id");
    }
    if (trigger.empty()) {
        trigger = MetadataValue(msg, "request_id");
    }
    trigger = NormalizeText(trigger);
    const auto chat = NormalizeText(msg.chat_id);
    const auto thread = NormalizeText(msg.thread_id);
    const auto reply_to = NormalizeText(msg.reply_to);

    if ((kind == "agent_reply" || kind == "agent_error") && !trigger.empty()) {
        return courier::utils::Join({provider, chat, thread, reply_to, kind, trigger}, kKeySeparator);
    }

    const auto base = trigger.empty() ? NormalizeText(msg.sender_id) : trigger;
    return courier::utils::Join(
        {provider, chat, thread, reply_to, kind, base, NormalizeText(msg.content), NormalizeMedia(msg)},
        kKeySeparator);
}

}  // namespace courier::channels
