#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "convintel/v1/patterns.pb.h"

namespace convintel::model {

// Declaration order is the lexicographic order used for sequence tie-breaks.
enum class Channel : std::uint8_t {
  kEmail    = 1,
  kSms      = 2,
  kLinkedin = 3,
  kVoice    = 4,
};

inline constexpr std::array<Channel, 4> kAllChannels = {Channel::kEmail, Channel::kSms, Channel::kLinkedin, Channel::kVoice};

constexpr std::string_view ToString(Channel channel) {
  switch (channel) {
    case Channel::kEmail:
      return "email";
    case Channel::kSms:
      return "sms";
    case Channel::kLinkedin:
      return "linkedin";
    case Channel::kVoice:
      return "voice";
  }
  return "unknown";
}

std::optional<Channel> ParseChannel(std::string_view text);

// An absent slot sorts before every channel.
using ChannelSlot = std::optional<Channel>;

inline constexpr std::size_t kSequenceCapacity = 3;

// First three channels of a lead's touch history, padded with empty slots.
using ChannelSequenceKey = std::array<ChannelSlot, kSequenceCapacity>;

std::string ToString(const ChannelSequenceKey& key);

convintel::v1::Channel ToProto(ChannelSlot channel);
ChannelSlot            FromProto(convintel::v1::Channel channel);

} // namespace convintel::model
