#include "content_snapshot.hpp"

#include <google/protobuf/util/json_util.h>

#include "content_features.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace convintel::features {

convintel::v1::ContentSnapshot BuildContentSnapshot(const db::model::TouchRecord& touch, const db::model::LeadRecord* lead) {
  convintel::v1::ContentSnapshot snapshot;

  const std::string& body = touch.body;
  snapshot.set_word_count(CountWords(body));
  snapshot.set_char_count(static_cast<uint32_t>(body.size()));
  snapshot.set_touch_number(touch.touch_number);
  snapshot.set_sequence_id(touch.sequence_id);
  snapshot.set_day_of_week(util::DayOfWeekUtc(touch.sent_at_ms));
  snapshot.set_hour_of_day(util::HourOfDayUtc(touch.sent_at_ms));
  snapshot.set_template_id(touch.template_id);
  snapshot.set_link_count(CountLinks(body));

  for (auto& pain : ExtractPainPoints(body)) {
    snapshot.add_pain_points(std::move(pain));
  }
  snapshot.set_cta(ExtractCta(body));
  for (auto& angle : ExtractAngles(body)) {
    snapshot.add_angles(std::move(angle));
  }

  PersonalizationContext context;
  if (lead != nullptr) {
    context.first_name = lead->first_name;
    context.company    = lead->company;
    context.industry   = lead->industry;
  }
  const auto flags = ExtractPersonalization(body, context);
  auto*      p     = snapshot.mutable_personalization();
  p->set_has_company_mention(flags.has_company_mention);
  p->set_has_first_name(flags.has_first_name);
  p->set_has_recent_news(flags.has_recent_news);
  p->set_has_mutual_connection(flags.has_mutual_connection);
  p->set_has_industry_specific(flags.has_industry_specific);

  if (touch.channel == model::Channel::kEmail) {
    snapshot.set_subject(touch.subject);
    snapshot.set_subject_pattern(ClassifySubject(touch.subject));
  }
  if (touch.channel == model::Channel::kSms) {
    snapshot.set_segment_count(SmsSegments(body));
  }
  return snapshot;
}

std::string EncodeSnapshot(const convintel::v1::ContentSnapshot& snapshot) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  options.preserve_proto_field_names    = true;

  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(snapshot, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode content snapshot: " + status.ToString());
  }
  return json;
}

convintel::v1::ContentSnapshot DecodeSnapshot(const std::string& json) {
  if (json.empty()) {
    throw util::MalformedContent("content snapshot missing");
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  convintel::v1::ContentSnapshot snapshot;
  const auto                     status = google::protobuf::util::JsonStringToMessage(json, &snapshot, options);
  if (!status.ok()) {
    throw util::MalformedContent("content snapshot unparsable: " + status.ToString());
  }
  return snapshot;
}

} // namespace convintel::features
