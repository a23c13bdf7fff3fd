#pragma once

#include <string>

#include "bus/events.hpp"

namespace courier::channels {

// Decides what counts as "the same outbound message" for suppression.
class OutboundDedupePolicy {
public:
    virtual ~OutboundDedupePolicy() = default;
    virtual std::string Key(const std::string& provider,
                            const courier::bus::OutboundMessage& msg) const = 0;
};

// Terminal agent replies (kind agent_reply / agent_error) that name the
// message that triggered them are keyed on that trigger only, so repeated
// answers to one request collapse. Everything else is keyed on the
// normalized content and media.
class DefaultOutboundDedupePolicy : public OutboundDedupePolicy {
public:
    std::string Key(const std::string& provider,
                    const courier::bus::OutboundMessage& msg) const override;
};

// Collapses whitespace runs to one space, trims, lowercases.
std::string NormalizeText(const std::string& value);

}  // namespace courier::channels
