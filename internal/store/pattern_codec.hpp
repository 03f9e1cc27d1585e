#pragma once

#include <string>

#include "convintel/v1/patterns.pb.h"
#include "internal/db/model/pattern_record.hpp"
#include "internal/model/lead.hpp"
#include "internal/model/pattern_type.hpp"

namespace convintel::store {

/*
  Payload <-> stored JSON.

  Encoding is canonical (declared field names, defaults printed, repeated
  fields in insertion order) so identical payloads produce identical bytes.
*/

std::string EncodePayload(const convintel::v1::PatternPayload& payload);

// Throws util::MalformedContent when the JSON is unparsable or carries a
// payload of another pattern type.
convintel::v1::PatternPayload DecodePayload(const std::string& json, model::PatternType expected);

bool PayloadMatchesType(const convintel::v1::PatternPayload& payload, model::PatternType type);

// Decodes the payload; throws util::MalformedContent like DecodePayload.
convintel::v1::Pattern ToProto(const db::model::PatternRecord& record);

model::ScoringWeights FromProto(const convintel::v1::ScoringWeights& weights);

} // namespace convintel::store
