#pragma once

#include <string>

#include "hsm/status/v1/hsm_status_service.pb.h"
#include "service_context.hpp"

namespace hsm::service {

/*
  Transport-independent entry points of the status service.

  Every method is safe to call repeatedly and concurrently. Errors are
  thrown as the util exception types and mapped to gRPC codes by the
  server layer.
*/
class HsmStatusService {
public:
  explicit HsmStatusService(ServiceContext ctx);

  hsm::status::v1::CreateStatusResponse
  CreateStatus(const hsm::status::v1::CreateStatusRequest& req);

  // Hook for the ingest pipeline once a file's checksum has been verified.
  hsm::status::v1::CreateStatusResponse
  OnFileVerified(const std::string& file_id);

  hsm::status::v1::RunSweepResponse
  RunSweep(const hsm::status::v1::RunSweepRequest& req);

  hsm::status::v1::BackfillResponse
  Backfill(const hsm::status::v1::BackfillRequest& req);

  hsm::status::v1::CheckOnlineResponse
  CheckOnline(const hsm::status::v1::CheckOnlineRequest& req);

  hsm::status::v1::RetrieveResponse
  Retrieve(const hsm::status::v1::RetrieveRequest& req);

  hsm::status::v1::StatusResponse
  GetFileStatus(const hsm::status::v1::GetFileStatusRequest& req);

  hsm::status::v1::StatusResponse
  GetDatasetStatus(const hsm::status::v1::GetDatasetStatusRequest& req);

  hsm::status::v1::StatusResponse
  GetExperimentStatus(const hsm::status::v1::GetExperimentStatusRequest& req);

private:
  const std::string& NamespaceOr(const std::string& requested) const;

  ServiceContext ctx_;
};

} // namespace hsm::service
