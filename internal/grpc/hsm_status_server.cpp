#include "hsm_status_server.hpp"

#include "grpc_error.hpp"

namespace hsm::grpc {

using namespace hsm::status::v1;

HsmStatusServer::HsmStatusServer(std::shared_ptr<hsm::service::HsmStatusService> svc) : service_(std::move(svc)) {
}

::grpc::Status HsmStatusServer::CreateStatus(::grpc::ServerContext*, const CreateStatusRequest* req, CreateStatusResponse* resp) {
  try {
    *resp = service_->CreateStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HsmStatusServer::RunSweep(::grpc::ServerContext*, const RunSweepRequest* req, RunSweepResponse* resp) {
  try {
    *resp = service_->RunSweep(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HsmStatusServer::Backfill(::grpc::ServerContext*, const BackfillRequest* req, BackfillResponse* resp) {
  try {
    *resp = service_->Backfill(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HsmStatusServer::CheckOnline(::grpc::ServerContext*, const CheckOnlineRequest* req, CheckOnlineResponse* resp) {
  try {
    *resp = service_->CheckOnline(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HsmStatusServer::Retrieve(::grpc::ServerContext*, const RetrieveRequest* req, RetrieveResponse* resp) {
  try {
    *resp = service_->Retrieve(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HsmStatusServer::GetFileStatus(::grpc::ServerContext*, const GetFileStatusRequest* req, StatusResponse* resp) {
  try {
    *resp = service_->GetFileStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HsmStatusServer::GetDatasetStatus(::grpc::ServerContext*, const GetDatasetStatusRequest* req, StatusResponse* resp) {
  try {
    *resp = service_->GetDatasetStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status HsmStatusServer::GetExperimentStatus(::grpc::ServerContext*, const GetExperimentStatusRequest* req, StatusResponse* resp) {
  try {
    *resp = service_->GetExperimentStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace hsm::grpc
