#pragma once

#include <string>

#include "internal/model/lead.hpp"

namespace convintel::db::model {

struct TenantRecord {
  std::string id;
  std::string name;

  convintel::model::SubscriptionStatus status = convintel::model::SubscriptionStatus::kActive;

  bool deleted = false;
};

} // namespace convintel::db::model
