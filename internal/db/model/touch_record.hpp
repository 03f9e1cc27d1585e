#pragma once

#include <cstdint>
#include <string>

#include "internal/model/channel.hpp"

namespace convintel::db::model {

struct TouchRecord {
  std::string id;
  std::string tenant_id;
  std::string lead_id;

  convintel::model::Channel channel = convintel::model::Channel::kEmail;

  uint64_t sent_at_ms   = 0;
  uint32_t touch_number = 1; // 1-indexed position in the lead's sequence
  std::string sequence_id;

  // raw message, kept for snapshot reconstruction
  std::string subject;
  std::string body;
  std::string template_id;

  // JSON-encoded convintel.v1.ContentSnapshot; empty = missing
  std::string content_snapshot;

  bool led_to_booking = false;
};

} // namespace convintel::db::model
