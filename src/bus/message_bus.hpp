#pragma once

#include <atomic>
#include <cstddef>
#include <optional>
#include <vector>

#include "bus/events.hpp"
#include "bus/message_queue.hpp"

namespace courier::bus {

constexpr long long kDefaultConsumeTimeoutMs = 30000;
constexpr long long kMaxConsumeTimeoutMs = 300000;

struct ConsumeOptions {
    // Non-positive means the default; clamped to [1, kMaxConsumeTimeoutMs].
    long long timeout_ms = 0;
};

enum class Direction {
    kInbound,
    kOutbound,
    kAll
};

struct QueueSizes {
    std::size_t inbound = 0;
    std::size_t outbound = 0;
    std::size_t total = 0;
};

struct DrainResult {
    std::size_t drained_inbound = 0;
    std::size_t drained_outbound = 0;
    std::size_t drained_progress = 0;
};

class MessageBus {
public:
    bool PublishInbound(const InboundMessage& msg);
    std::optional<InboundMessage> ConsumeInbound(const ConsumeOptions& options = {});
    bool PublishOutbound(const OutboundMessage& msg);
    std::optional<OutboundMessage> ConsumeOutbound(const ConsumeOptions& options = {});
    bool PublishProgress(const ProgressEvent& event);
    std::optional<ProgressEvent> ConsumeProgress(const ConsumeOptions& options = {});

    std::vector<Message> Peek(std::size_t limit = 20) const;
    std::size_t Size(Direction direction = Direction::kAll) const;
    QueueSizes Sizes() const;
    std::size_t OutboundWaiters() const { return outbound_.WaiterCount(); }
    DrainResult Drain(std::size_t limit = 5000);

    void Close();
    bool IsClosed() const { return closed_; }

private:
    MessageQueue<InboundMessage> inbound_;
    MessageQueue<OutboundMessage> outbound_;
    MessageQueue<ProgressEvent> progress_;
    std::atomic<bool> closed_{false};
};

}  // namespace courier::bus
