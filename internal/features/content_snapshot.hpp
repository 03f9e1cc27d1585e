#pragma once

#include <string>

#include "convintel/v1/content.pb.h"
#include "internal/db/model/lead_record.hpp"
#include "internal/db/model/touch_record.hpp"

namespace convintel::features {

// Rebuilds the structured features of a touch from its raw subject/body.
// Day and hour come from sent_at in UTC. lead may be null.
convintel::v1::ContentSnapshot BuildContentSnapshot(const db::model::TouchRecord& touch, const db::model::LeadRecord* lead);

// Canonical JSON (field names as declared, defaults printed).
std::string EncodeSnapshot(const convintel::v1::ContentSnapshot& snapshot);

// Throws util::MalformedContent for empty or unparsable input.
convintel::v1::ContentSnapshot DecodeSnapshot(const std::string& json);

} // namespace convintel::features
