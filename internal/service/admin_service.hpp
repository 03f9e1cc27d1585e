#pragma once

#include <string_view>

#include "convintel/services/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace convintel::service {

/*
  Operator surface over the pattern store, the learning orchestrator,
  backfill and the health monitor. The gRPC server and convintelctl both
  call through here.
*/
class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  convintel::services::v1::GetPatternResponse
  GetPattern(const convintel::services::v1::GetPatternRequest& req);

  convintel::services::v1::ListPatternsResponse
  ListPatterns(const convintel::services::v1::ListPatternsRequest& req);

  convintel::services::v1::GetPatternHistoryResponse
  GetPatternHistory(const convintel::services::v1::GetPatternHistoryRequest& req);

  convintel::services::v1::TriggerLearningResponse
  TriggerLearning(const convintel::services::v1::TriggerLearningRequest& req);

  convintel::services::v1::TriggerBackfillResponse
  TriggerBackfill(const convintel::services::v1::TriggerBackfillRequest& req);

  convintel::services::v1::RunHealthCheckResponse
  RunHealthCheck(const convintel::services::v1::RunHealthCheckRequest& req);

private:
  template <typename Fn>
  auto Instrumented(std::string_view route, Fn&& fn);

  ServiceContext ctx_;
};

}
