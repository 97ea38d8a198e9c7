#include <cstdlib>
#include <iostream>
#include <string>

#include "hsm/status/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/stat_probe.hpp"

using namespace hsm::status::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  hsmctl <config.yaml> probe <path>\n"
            << "  hsmctl <config.yaml> check <file_id>\n"
            << "  hsmctl <config.yaml> create-status <file_id> [namespace]\n"
            << "  hsmctl <config.yaml> sweep [namespace]\n"
            << "  hsmctl <config.yaml> backfill [namespace]\n"
            << "  hsmctl <config.yaml> retrieve <file_id>...\n"
            << "  hsmctl <config.yaml> file-status <file_id> [namespace]\n"
            << "  hsmctl <config.yaml> dataset-status <dataset_id> [namespace]\n"
            << "  hsmctl <config.yaml> experiment-status <experiment_id> [namespace]\n";
}

static const char* OnlineText(bool online) {
  return online ? "online" : "offline";
}

static std::string OptionalArg(int argc, char** argv, int index) {
  return argc > index ? argv[index] : "";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];
  std::string cmd         = argv[2];

  try {
    auto config = hsm::config::ConfigLoader::LoadFromYaml(config_path);
    hsm::observability::InitializeLogging(config);

    // ------------------------------------------------------------

    if (cmd == "probe") {
      if (argc < 4) return 1;

      hsm::probe::StatProbeOptions options;
      options.strategy     = hsm::probe::ParseProbeStrategy(config.hsm().probe_strategy());
      options.stat_program = config.hsm().stat_program();

      auto result = hsm::probe::StatProbe(options).ProbeOrThrow(argv[3]);
      std::cout << "size_bytes=" << result.size_bytes << " allocated_blocks=" << result.allocated_blocks << " "
                << OnlineText(hsm::probe::IsOnline(result, config.hsm().min_file_size_bytes())) << "\n";
      return 0;
    }

    auto  app     = hsm::factory::Build(config);
    auto& service = *app.status_service;

    // ------------------------------------------------------------

    if (cmd == "check") {
      if (argc < 4) return 1;
      CheckOnlineRequest req;
      req.set_file_id(argv[3]);
      std::cout << OnlineText(service.CheckOnline(req).online()) << "\n";
    } else if (cmd == "create-status") {
      if (argc < 4) return 1;
      CreateStatusRequest req;
      req.set_file_id(argv[3]);
      req.set_namespace_uri(OptionalArg(argc, argv, 4));
      auto resp = service.CreateStatus(req);
      std::cout << CreateStatusOutcome_Name(resp.outcome());
      if (resp.outcome() == CREATE_STATUS_OUTCOME_CREATED) std::cout << " " << OnlineText(resp.online());
      std::cout << "\n";
    } else if (cmd == "sweep") {
      RunSweepRequest req;
      req.set_namespace_uri(OptionalArg(argc, argv, 3));
      const auto& r = service.RunSweep(req).report();
      std::cout << "candidates=" << r.candidates() << " unchanged=" << r.unchanged() << " flipped_offline=" << r.flipped_offline()
                << " skipped=" << r.skipped() << " skipped_locked=" << r.skipped_locked() << " failed=" << r.failed() << "\n";
    } else if (cmd == "backfill") {
      BackfillRequest req;
      req.set_namespace_uri(OptionalArg(argc, argv, 3));
      auto resp = service.Backfill(req);
      std::cout << "created=" << resp.created() << " already_exists=" << resp.already_exists()
                << " lock_not_acquired=" << resp.lock_not_acquired() << " failed=" << resp.failed() << "\n";
    } else if (cmd == "retrieve") {
      if (argc < 4) return 1;
      RetrieveRequest req;
      for (int i = 3; i < argc; ++i) req.add_file_ids(argv[i]);
      auto resp = service.Retrieve(req);
      for (const auto& r : resp.results()) {
        std::cout << r.file_id() << " " << (r.ok() ? "ok" : "failed");
        if (!r.ok()) std::cout << " " << r.error();
        std::cout << "\n";
      }
    } else if (cmd == "file-status") {
      if (argc < 4) return 1;
      GetFileStatusRequest req;
      req.set_file_id(argv[3]);
      req.set_namespace_uri(OptionalArg(argc, argv, 4));
      std::cout << OnlineText(service.GetFileStatus(req).online()) << "\n";
    } else if (cmd == "dataset-status") {
      if (argc < 4) return 1;
      GetDatasetStatusRequest req;
      req.set_dataset_id(argv[3]);
      req.set_namespace_uri(OptionalArg(argc, argv, 4));
      std::cout << OnlineText(service.GetDatasetStatus(req).online()) << "\n";
    } else if (cmd == "experiment-status") {
      if (argc < 4) return 1;
      GetExperimentStatusRequest req;
      req.set_experiment_id(argv[3]);
      req.set_namespace_uri(OptionalArg(argc, argv, 4));
      std::cout << OnlineText(service.GetExperimentStatus(req).online()) << "\n";
    } else {
      Usage();
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    hsm::observability::ShutdownLogging();
    return 2;
  }

  hsm::observability::ShutdownLogging();
  return 0;
}
