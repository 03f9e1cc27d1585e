#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace convintel::grpc {

using namespace convintel::services::v1;

AdminServer::AdminServer(std::shared_ptr<convintel::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetPattern(::grpc::ServerContext*, const GetPatternRequest* req, GetPatternResponse* resp) {
  try {
    *resp = service_->GetPattern(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListPatterns(::grpc::ServerContext*, const ListPatternsRequest* req, ListPatternsResponse* resp) {
  try {
    *resp = service_->ListPatterns(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetPatternHistory(::grpc::ServerContext*, const GetPatternHistoryRequest* req,
                                              GetPatternHistoryResponse* resp) {
  try {
    *resp = service_->GetPatternHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::TriggerLearning(::grpc::ServerContext*, const TriggerLearningRequest* req, TriggerLearningResponse* resp) {
  try {
    *resp = service_->TriggerLearning(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::TriggerBackfill(::grpc::ServerContext*, const TriggerBackfillRequest* req, TriggerBackfillResponse* resp) {
  try {
    *resp = service_->TriggerBackfill(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::RunHealthCheck(::grpc::ServerContext*, const RunHealthCheckRequest* req, RunHealthCheckResponse* resp) {
  try {
    *resp = service_->RunHealthCheck(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace convintel::grpc
