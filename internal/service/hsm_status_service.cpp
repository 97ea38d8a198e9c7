#include "hsm_status_service.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/status/online_status.hpp"
#include "internal/status/reconciliation_sweep.hpp"
#include "internal/status/status_creator.hpp"
#include "internal/status/status_store.hpp"

namespace hsm::service {

using namespace hsm::status::v1;

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

/*
  Runs one request inside a span, records request count/latency and logs
  the failure before rethrowing it to the transport.
*/
template <typename Func>
auto Instrumented(const char* route, Func&& func) -> decltype(func(std::declval<hsm::observability::SpanScope&>())) {
  hsm::observability::SpanScope span(route);
  const auto                    started_at = std::chrono::steady_clock::now();

  try {
    auto resp = func(span);
    hsm::observability::Metrics::Instance().RecordRequest(route, true);
    hsm::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    return resp;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    HSM_LOG_ERROR("RPC failed", {hsm::observability::StringField("route", route), hsm::observability::StringField("error", ex.what())});
    hsm::observability::Metrics::Instance().RecordRequest(route, false);
    hsm::observability::Metrics::Instance().ObserveRequestLatencyMs(route, ElapsedMs(started_at));
    throw;
  }
}

void RequireId(const std::string& value, const char* what) {
  if (value.empty()) {
    throw std::invalid_argument(std::string(what) + " is required");
  }
}

hsm::status::v1::CreateStatusOutcome ToProto(hsm::status::CreateStatusOutcome outcome) {
  switch (outcome) {
    case hsm::status::CreateStatusOutcome::kCreated:
      return CREATE_STATUS_OUTCOME_CREATED;
    case hsm::status::CreateStatusOutcome::kAlreadyExists:
      return CREATE_STATUS_OUTCOME_ALREADY_EXISTS;
    case hsm::status::CreateStatusOutcome::kLockNotAcquired:
      return CREATE_STATUS_OUTCOME_LOCK_NOT_ACQUIRED;
    case hsm::status::CreateStatusOutcome::kUnverified:
      return CREATE_STATUS_OUTCOME_UNVERIFIED;
    case hsm::status::CreateStatusOutcome::kFileNotFound:
      return CREATE_STATUS_OUTCOME_FILE_NOT_FOUND;
  }
  return CREATE_STATUS_OUTCOME_UNSPECIFIED;
}

CreateStatusResponse ToResponse(const hsm::status::CreateStatusResult& result) {
  CreateStatusResponse resp;
  resp.set_outcome(ToProto(result.outcome));
  resp.set_online(result.created_value.value_or(false));
  return resp;
}

} // namespace

HsmStatusService::HsmStatusService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store || !ctx_.online || !ctx_.creator || !ctx_.sweep) {
    throw std::invalid_argument("HsmStatusService requires store, online status, creator and sweep");
  }
}

const std::string& HsmStatusService::NamespaceOr(const std::string& requested) const {
  return requested.empty() ? ctx_.default_namespace : requested;
}

CreateStatusResponse HsmStatusService::CreateStatus(const CreateStatusRequest& req) {
  return Instrumented("HsmStatusService.CreateStatus", [&](hsm::observability::SpanScope& span) {
    RequireId(req.file_id(), "file_id");
    span.SetAttribute("file_id", req.file_id());
    return ToResponse(ctx_.creator->CreateStatus(req.file_id(), NamespaceOr(req.namespace_uri())));
  });
}

CreateStatusResponse HsmStatusService::OnFileVerified(const std::string& file_id) {
  return Instrumented("HsmStatusService.OnFileVerified", [&](hsm::observability::SpanScope& span) {
    RequireId(file_id, "file_id");
    span.SetAttribute("file_id", file_id);
    auto result = ctx_.creator->CreateStatus(file_id, ctx_.default_namespace);
    HSM_LOG_DEBUG("Verified file processed", {hsm::observability::StringField("file_id", file_id),
                                              hsm::observability::StringField("outcome", hsm::status::CreateStatusOutcomeName(result.outcome))});
    return ToResponse(result);
  });
}

RunSweepResponse HsmStatusService::RunSweep(const RunSweepRequest& req) {
  return Instrumented("HsmStatusService.RunSweep", [&](hsm::observability::SpanScope& span) {
    const auto started_at = std::chrono::steady_clock::now();
    const auto report     = ctx_.sweep->Run(NamespaceOr(req.namespace_uri()));

    auto& metrics = hsm::observability::Metrics::Instance();
    metrics.ObserveSweepDurationMs(ElapsedMs(started_at));
    metrics.AddSweepFiles("unchanged", report.unchanged);
    metrics.AddSweepFiles("flipped_offline", report.flipped_offline);
    metrics.AddSweepFiles("skipped", report.skipped);
    metrics.AddSweepFiles("skipped_locked", report.skipped_locked);
    metrics.AddSweepFiles("failed", report.failed);
    span.SetAttribute("candidates", static_cast<std::int64_t>(report.candidates));

    RunSweepResponse resp;
    auto*            out = resp.mutable_report();
    out->set_candidates(report.candidates);
    out->set_unchanged(report.unchanged);
    out->set_flipped_offline(report.flipped_offline);
    out->set_skipped(report.skipped);
    out->set_skipped_locked(report.skipped_locked);
    out->set_failed(report.failed);
    return resp;
  });
}

BackfillResponse HsmStatusService::Backfill(const BackfillRequest& req) {
  return Instrumented("HsmStatusService.Backfill", [&](hsm::observability::SpanScope&) {
    const auto report = ctx_.creator->Backfill(NamespaceOr(req.namespace_uri()));

    BackfillResponse resp;
    resp.set_created(report.created);
    resp.set_already_exists(report.already_exists);
    resp.set_lock_not_acquired(report.lock_not_acquired);
    resp.set_failed(report.failed);
    return resp;
  });
}

CheckOnlineResponse HsmStatusService::CheckOnline(const CheckOnlineRequest& req) {
  return Instrumented("HsmStatusService.CheckOnline", [&](hsm::observability::SpanScope& span) {
    RequireId(req.file_id(), "file_id");
    span.SetAttribute("file_id", req.file_id());

    CheckOnlineResponse resp;
    resp.set_online(ctx_.online->CheckOnline(req.file_id()));
    return resp;
  });
}

RetrieveResponse HsmStatusService::Retrieve(const RetrieveRequest& req) {
  return Instrumented("HsmStatusService.Retrieve", [&](hsm::observability::SpanScope& span) {
    std::vector<std::string> ids(req.file_ids().begin(), req.file_ids().end());
    span.SetAttribute("files", static_cast<std::int64_t>(ids.size()));

    RetrieveResponse resp;
    for (const auto& entry : ctx_.online->Retrieve(ids)) {
      auto* result = resp.add_results();
      result->set_file_id(entry.file_id);
      result->set_ok(entry.outcome.IsSuccess() && entry.outcome.GetOrThrow());
      result->set_error(entry.outcome.ErrorMessage());
    }
    return resp;
  });
}

StatusResponse HsmStatusService::GetFileStatus(const GetFileStatusRequest& req) {
  return Instrumented("HsmStatusService.GetFileStatus", [&](hsm::observability::SpanScope&) {
    RequireId(req.file_id(), "file_id");
    StatusResponse resp;
    resp.set_online(ctx_.store->FileStatus(req.file_id(), NamespaceOr(req.namespace_uri())));
    return resp;
  });
}

StatusResponse HsmStatusService::GetDatasetStatus(const GetDatasetStatusRequest& req) {
  return Instrumented("HsmStatusService.GetDatasetStatus", [&](hsm::observability::SpanScope&) {
    RequireId(req.dataset_id(), "dataset_id");
    StatusResponse resp;
    resp.set_online(ctx_.store->DatasetOnline(req.dataset_id(), NamespaceOr(req.namespace_uri())));
    return resp;
  });
}

StatusResponse HsmStatusService::GetExperimentStatus(const GetExperimentStatusRequest& req) {
  return Instrumented("HsmStatusService.GetExperimentStatus", [&](hsm::observability::SpanScope&) {
    RequireId(req.experiment_id(), "experiment_id");
    StatusResponse resp;
    resp.set_online(ctx_.store->ExperimentOnline(req.experiment_id(), NamespaceOr(req.namespace_uri())));
    return resp;
  });
}

} // namespace hsm::service
