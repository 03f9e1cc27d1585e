#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/settings.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/detectors/detector.hpp"
#include "internal/util/time.hpp"

namespace convintel::store {

struct RecordOutcome {
  bool     superseded = false;
  uint64_t version    = 0; // current version after the write; 0 = no current row
  uint32_t attempts   = 0;
};

/*
  PatternStore

  Sole writer of patterns, pattern history and the weight cache.

  Record() always appends a history row (version 0 when the run was not
  promoted) and, when the run clears the confidence and sample floors,
  supersedes the current row with version + 1 in the same transaction.
  A WHO supersede refreshes the tenant's weight cache in that transaction
  too, so readers never see new weights without the pattern behind them.

  Busy/conflict results and commit conflicts are retried with a fixed
  backoff; exhaustion or any other repository error is StoreWriteFailure.
*/
class PatternStore {
 public:
  PatternStore(std::shared_ptr<db::Repository> repository, config::StoreSettings settings);

  RecordOutcome Record(const std::string& tenant_id, const detectors::DetectionResult& result, util::TimePoint computed_at);

  // Moves current rows with valid_until <= now into history (archived) and
  // deletes them. Returns the number archived.
  uint32_t ArchiveExpired(util::TimePoint now);

  bool ShouldPromote(const detectors::DetectionResult& result) const;

  std::optional<db::model::PatternRecord>        Get(const std::string& tenant_id, model::PatternType type);

  // Current row or throw: util::InsufficientData when the latest run never
  // cleared the floors, util::NotFound when nothing usable was ever stored.
  db::model::PatternRecord                       Require(const std::string& tenant_id, model::PatternType type);
  std::vector<db::model::PatternRecord>          List(const std::string& tenant_id);
  std::vector<db::model::PatternRecord>          ListAll();
  std::vector<db::model::PatternHistoryRecord>   History(const std::string& tenant_id, model::PatternType type, uint32_t limit);

  const config::StoreSettings& Settings() const {
    return settings_;
  }

 private:
  template <typename Fn>
  auto WithRetry(const std::string& op, uint32_t* attempts, Fn&& fn);

  std::shared_ptr<db::Repository> repository_;
  config::StoreSettings           settings_;
};

} // namespace convintel::store
