#include "pattern_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace convintel::store {

std::string EncodePayload(const convintel::v1::PatternPayload& payload) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(payload, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode pattern payload: " + status.ToString());
  }
  return json;
}

bool PayloadMatchesType(const convintel::v1::PatternPayload& payload, model::PatternType type) {
  switch (type) {
    case model::PatternType::kWho:
      return payload.kind_case() == convintel::v1::PatternPayload::kWho;
    case model::PatternType::kWhat:
      return payload.kind_case() == convintel::v1::PatternPayload::kWhat;
    case model::PatternType::kWhen:
      return payload.kind_case() == convintel::v1::PatternPayload::kWhen;
    case model::PatternType::kHow:
      return payload.kind_case() == convintel::v1::PatternPayload::kHow;
  }
  return false;
}

convintel::v1::PatternPayload DecodePayload(const std::string& json, model::PatternType expected) {
  if (json.empty()) {
    throw util::MalformedContent("pattern payload missing");
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  convintel::v1::PatternPayload payload;
  const auto                    status = google::protobuf::util::JsonStringToMessage(json, &payload, options);
  if (!status.ok()) {
    throw util::MalformedContent("pattern payload unparsable: " + status.ToString());
  }
  if (!PayloadMatchesType(payload, expected)) {
    throw util::MalformedContent("pattern payload does not match type " + std::string(model::ToString(expected)));
  }
  return payload;
}

convintel::v1::Pattern ToProto(const db::model::PatternRecord& record) {
  convintel::v1::Pattern pattern;
  pattern.set_tenant_id(record.tenant_id);
  pattern.set_pattern_type(model::ToProto(record.pattern_type));
  pattern.set_version(record.version);
  *pattern.mutable_computed_at() = util::MillisToProto(record.computed_at_ms);
  *pattern.mutable_valid_until() = util::MillisToProto(record.valid_until_ms);
  pattern.set_sample_size(record.sample_size);
  pattern.set_confidence(record.confidence);
  *pattern.mutable_payload() = DecodePayload(record.payload_json, record.pattern_type);
  return pattern;
}

model::ScoringWeights FromProto(const convintel::v1::ScoringWeights& weights) {
  model::ScoringWeights out;
  out.data_quality = weights.data_quality();
  out.authority    = weights.authority();
  out.company_fit  = weights.company_fit();
  out.timing       = weights.timing();
  return out;
}

} // namespace convintel::store
