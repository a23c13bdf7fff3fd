#include "bus/message_bus.hpp"

#include <algorithm>
#include <chrono>

namespace courier::bus {
namespace {

std::chrono::milliseconds ResolveTimeout(const ConsumeOptions& options) {
    const auto raw = options.timeout_ms > 0 ? options.timeout_ms : kDefaultConsumeTimeoutMs;
    return std::chrono::milliseconds(std::clamp(raw, 1LL, kMaxConsumeTimeoutMs));
}

}  // namespace

bool MessageBus::PublishInbound(const InboundMessage& msg) {
    return inbound_.Publish(msg);
}

std::optional<InboundMessage> MessageBus::ConsumeInbound(const ConsumeOptions& options) {
    return inbound_.Consume(ResolveTimeout(options));
}

bool MessageBus::PublishOutbound(const OutboundMessage& msg) {
    return outbound_.Publish(msg);
}

std::optional<OutboundMessage> MessageBus::ConsumeOutbound(const ConsumeOptions& options) {
    return outbound_.Consume(ResolveTimeout(options));
}

bool MessageBus::PublishProgress(const ProgressEvent& event) {
    return progress_.Publish(event);
}

std::optional<ProgressEvent> MessageBus::ConsumeProgress(const ConsumeOptions& options) {
    return progress_.Consume(ResolveTimeout(options));
}

std::vector<Message> MessageBus::Peek(std::size_t limit) const {
    const auto n = std::max<std::size_t>(1, limit);
    auto result = inbound_.Peek(n);
    auto outbound = outbound_.Peek(n);
    result.insert(result.end(),
                  std::make_move_iterator(outbound.begin()),
                  std::make_move_iterator(outbound.end()));
    return result;
}

std::size_t MessageBus::Size(Direction direction) const {
    switch (direction) {
        case Direction::kInbound:
            return inbound_.Size();
        case Direction::kOutbound:
            return outbound_.Size();
        case Direction::kAll:
            break;
    }
    return inbound_.Size() + outbound_.Size();
}

QueueSizes MessageBus::Sizes() const {
    QueueSizes sizes{};
    sizes.inbound = inbound_.Size();
    sizes.outbound = outbound_.Size();
    sizes.total = sizes.inbound + sizes.outbound;
    return sizes;
}

DrainResult MessageBus::Drain(std::size_t limit) {
    const auto max = std::max<std::size_t>(1, limit);
    DrainResult result{};
    result.drained_inbound = inbound_.Drain(max);
    result.drained_outbound = outbound_.Drain(max);
    result.drained_progress = progress_.Drain(max);
    return result;
}

void MessageBus::Close() {
    closed_ = true;
    inbound_.Close();
    outbound_.Close();
    progress_.Close();
    Drain();
}

}  // namespace courier::bus
