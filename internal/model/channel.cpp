#include "channel.hpp"

#include <algorithm>
#include <cctype>

namespace convintel::model {

std::optional<Channel> ParseChannel(std::string_view text) {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });
  for (const auto channel : kAllChannels) {
    if (lowered == ToString(channel)) return channel;
  }
  if (lowered == "phone" || lowered == "call") return Channel::kVoice;
  return std::nullopt;
}

std::string ToString(const ChannelSequenceKey& key) {
  std::string out;
  for (const auto& slot : key) {
    if (!slot) break;
    if (!out.empty()) out += " -> ";
    out += ToString(*slot);
  }
  return out.empty() ? "none" : out;
}

convintel::v1::Channel ToProto(ChannelSlot channel) {
  if (!channel) return convintel::v1::CHANNEL_UNSPECIFIED;
  switch (*channel) {
    case Channel::kEmail:
      return convintel::v1::CHANNEL_EMAIL;
    case Channel::kSms:
      return convintel::v1::CHANNEL_SMS;
    case Channel::kLinkedin:
      return convintel::v1::CHANNEL_LINKEDIN;
    case Channel::kVoice:
      return convintel::v1::CHANNEL_VOICE;
  }
  return convintel::v1::CHANNEL_UNSPECIFIED;
}

ChannelSlot FromProto(convintel::v1::Channel channel) {
  switch (channel) {
    case convintel::v1::CHANNEL_EMAIL:
      return Channel::kEmail;
    case convintel::v1::CHANNEL_SMS:
      return Channel::kSms;
    case convintel::v1::CHANNEL_LINKEDIN:
      return Channel::kLinkedin;
    case convintel::v1::CHANNEL_VOICE:
      return Channel::kVoice;
    default:
      return std::nullopt;
  }
}

} // namespace convintel::model
