#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace courier::bus {

struct MediaItem {
    std::string type;  // image, video, audio, file, link
    std::string url;
    std::string mime;
    std::string name;
    std::int64_t size = 0;
};

struct Message {
    std::string id;
    std::string provider;
    std::string channel;
    std::string sender_id;
    std::string chat_id;
    std::string content;
    std::string reply_to;
    std::string thread_id;
    std::vector<MediaItem> media;
    std::unordered_map<std::string, std::string> metadata;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();

    std::string SessionKey() const {
        return provider + ":" + chat_id;
    }
};

using InboundMessage = Message;
using OutboundMessage = Message;

struct ProgressEvent {
    std::string task_id;
    int step = 0;
    int total_steps = 0;
    std::string description;
    std::string provider;
    std::string chat_id;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

}  // namespace courier::bus
