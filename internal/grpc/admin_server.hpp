#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "convintel/services/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace convintel::grpc {

class AdminServer final : public convintel::services::v1::PatternAdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<convintel::service::AdminService> svc);

  ::grpc::Status GetPattern(::grpc::ServerContext*,
                            const convintel::services::v1::GetPatternRequest*,
                            convintel::services::v1::GetPatternResponse*) override;

  ::grpc::Status ListPatterns(::grpc::ServerContext*,
                              const convintel::services::v1::ListPatternsRequest*,
                              convintel::services::v1::ListPatternsResponse*) override;

  ::grpc::Status GetPatternHistory(::grpc::ServerContext*,
                                   const convintel::services::v1::GetPatternHistoryRequest*,
                                   convintel::services::v1::GetPatternHistoryResponse*) override;

  ::grpc::Status TriggerLearning(::grpc::ServerContext*,
                                 const convintel::services::v1::TriggerLearningRequest*,
                                 convintel::services::v1::TriggerLearningResponse*) override;

  ::grpc::Status TriggerBackfill(::grpc::ServerContext*,
                                 const convintel::services::v1::TriggerBackfillRequest*,
                                 convintel::services::v1::TriggerBackfillResponse*) override;

  ::grpc::Status RunHealthCheck(::grpc::ServerContext*,
                                const convintel::services::v1::RunHealthCheckRequest*,
                                convintel::services::v1::RunHealthCheckResponse*) override;

private:
  std::shared_ptr<convintel::service::AdminService> service_;
};

}
