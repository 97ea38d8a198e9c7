#include "internal/grpc/grpc_error.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/hsm_status_server.hpp"
#include "internal/util/errors.hpp"

namespace {

using hsm::grpc::ToStatus;

void TestErrorCodeMapping() {
  assert(ToStatus(hsm::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(hsm::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(hsm::util::Unverified("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(hsm::util::StorageClassNotSupportedError("x")).error_code() == ::grpc::StatusCode::UNIMPLEMENTED);
  assert(ToStatus(hsm::util::MissingLocationError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(hsm::util::MultipleConfigError("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(hsm::util::ProbeError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_message() == "boom");
}

void TestServerTranslatesServiceErrors() {
  auto repo = std::make_shared<hsm::db::memory::MemoryRepository>();
  auto app  = hsm::factory::Build(hsm::config::DefaultConfig(), repo);

  hsm::grpc::HsmStatusServer server(app.status_service);

  hsm::status::v1::GetFileStatusRequest req;
  hsm::status::v1::StatusResponse       resp;
  assert(server.GetFileStatus(nullptr, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_file_id("unknown");
  assert(server.GetFileStatus(nullptr, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  hsm::status::v1::BackfillRequest  backfill_req;
  hsm::status::v1::BackfillResponse backfill_resp;
  assert(server.Backfill(nullptr, &backfill_req, &backfill_resp).ok());
  assert(backfill_resp.created() == 0);
}

} // namespace

int main() {
  TestErrorCodeMapping();
  TestServerTranslatesServiceErrors();

  std::cout << "hsm_status_unit_grpc_error: pass\n";
  return 0;
}
