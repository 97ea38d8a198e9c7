#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "hsm/status/v1_grpc.hpp"
#include "internal/service/hsm_status_service.hpp"

namespace hsm::grpc {

class HsmStatusServer final : public hsm::status::v1::HsmStatusService::Service {
public:
  explicit HsmStatusServer(std::shared_ptr<hsm::service::HsmStatusService> svc);

  ::grpc::Status CreateStatus(::grpc::ServerContext*,
                              const hsm::status::v1::CreateStatusRequest*,
                              hsm::status::v1::CreateStatusResponse*) override;

  ::grpc::Status RunSweep(::grpc::ServerContext*,
                          const hsm::status::v1::RunSweepRequest*,
                          hsm::status::v1::RunSweepResponse*) override;

  ::grpc::Status Backfill(::grpc::ServerContext*,
                          const hsm::status::v1::BackfillRequest*,
                          hsm::status::v1::BackfillResponse*) override;

  ::grpc::Status CheckOnline(::grpc::ServerContext*,
                             const hsm::status::v1::CheckOnlineRequest*,
                             hsm::status::v1::CheckOnlineResponse*) override;

  ::grpc::Status Retrieve(::grpc::ServerContext*,
                          const hsm::status::v1::RetrieveRequest*,
                          hsm::status::v1::RetrieveResponse*) override;

  ::grpc::Status GetFileStatus(::grpc::ServerContext*,
                               const hsm::status::v1::GetFileStatusRequest*,
                               hsm::status::v1::StatusResponse*) override;

  ::grpc::Status GetDatasetStatus(::grpc::ServerContext*,
                                  const hsm::status::v1::GetDatasetStatusRequest*,
                                  hsm::status::v1::StatusResponse*) override;

  ::grpc::Status GetExperimentStatus(::grpc::ServerContext*,
                                     const hsm::status::v1::GetExperimentStatusRequest*,
                                     hsm::status::v1::StatusResponse*) override;

private:
  std::shared_ptr<hsm::service::HsmStatusService> service_;
};

} // namespace hsm::grpc
