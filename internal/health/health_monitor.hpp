#pragma once

#include <memory>
#include <vector>

#include "convintel/v1/runs.pb.h"
#include "internal/config/settings.hpp"
#include "internal/db/model/pattern_record.hpp"
#include "internal/store/pattern_store.hpp"
#include "internal/util/time.hpp"

namespace convintel::health {

/*
  HealthMonitor

  Scans every current pattern and emits structured warnings:

    expired                 high
    expiring_soon           low
    low_sample_size         medium
    low_confidence          medium
    weights_out_of_bounds   high   (WHO only)
    undecodable_payload     high

  The single escalation point of the service: when high-severity warnings
  reach the configured threshold the check logs an error and bumps the
  escalation metric.
*/
class HealthMonitor {
 public:
  HealthMonitor(std::shared_ptr<store::PatternStore> store, config::HealthSettings settings);

  convintel::v1::HealthReport Check(util::TimePoint now);

  std::vector<convintel::v1::HealthWarning> Inspect(const db::model::PatternRecord& record, util::TimePoint now) const;

 private:
  std::shared_ptr<store::PatternStore> store_;
  config::HealthSettings               settings_;
};

} // namespace convintel::health
