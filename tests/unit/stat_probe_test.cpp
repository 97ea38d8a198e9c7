#include "internal/probe/stat_probe.hpp"

#include <cassert>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using hsm::probe::ParseProbeStrategy;
using hsm::probe::ParseStatOutput;
using hsm::probe::ProbeResult;
using hsm::probe::ProbeStrategy;
using hsm::probe::StatProbe;
using hsm::probe::StatProbeOptions;

void TestParsesGnuStatOutput() {
  const char* output =
      "  File: /data/file.bin\n"
      "  Size: 1000      \tBlocks: 0          IO Block: 4096   regular file\n"
      "Device: 803h/2051d\tInode: 12345       Links: 1\n";
  auto parsed = ParseStatOutput(output);
  assert(parsed.has_value());
  assert(parsed->size_bytes == 1000);
  assert(parsed->allocated_blocks == 0);
}

void TestParseRejectsOutputWithoutSizeAndBlocks() {
  assert(!ParseStatOutput("stat: cannot stat 'x': No such file or directory\n").has_value());
  assert(!ParseStatOutput("").has_value());
  // Size and Blocks must be on the same line.
  assert(!ParseStatOutput("Size: 10\nBlocks: 0\n").has_value());
}

void TestParseStrategy() {
  assert(ParseProbeStrategy("auto") == ProbeStrategy::kAuto);
  assert(ParseProbeStrategy("native") == ProbeStrategy::kNative);
  assert(ParseProbeStrategy("command") == ProbeStrategy::kCommand);

  bool threw = false;
  try {
    (void)ParseProbeStrategy("lstat");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestNativeProbeReadsSizeAndBlocks() {
  hsm::test::TempDir dir("stat_probe");
  const auto         dense  = dir.File("dense.bin");
  const auto         sparse = dir.File("sparse.bin");
  hsm::test::WriteDenseFile(dense, 8192);
  hsm::test::WriteSparseFile(sparse, hsm::test::kLargeFileSize);

  StatProbeOptions options;
  options.strategy = ProbeStrategy::kNative;
  StatProbe probe(options);

  auto dense_result = probe.ProbeOrThrow(dense);
  assert(dense_result.size_bytes == 8192);
  assert(dense_result.allocated_blocks > 0);

  auto sparse_result = probe.ProbeOrThrow(sparse);
  assert(sparse_result.size_bytes == hsm::test::kLargeFileSize);
  assert(sparse_result.allocated_blocks == 0);
}

void TestMissingFileIsProbeError() {
  StatProbe probe;
  auto      outcome = probe.Probe("/nonexistent/hsm/status/probe");
  assert(outcome.FailedWith<hsm::util::ProbeError>());

  assert(probe.Probe("").FailedWith<hsm::util::ProbeError>());
}

void TestMissingStatProgramIsProbeError() {
  StatProbeOptions options;
  options.strategy     = ProbeStrategy::kCommand;
  options.stat_program = "hsm-status-no-such-stat-program";
  StatProbe probe(options);

  assert(probe.Probe("/").FailedWith<hsm::util::ProbeError>());
}

std::string WriteScript(const hsm::test::TempDir& dir, const std::string& name, const std::string& body) {
  const auto path = dir.File(name);
  {
    std::ofstream out(path);
    out << "#!/bin/sh\n" << body;
  }
  std::filesystem::permissions(path, std::filesystem::perms::owner_all);
  return path;
}

StatProbe CommandProbe(const std::string& program) {
  StatProbeOptions options;
  options.strategy     = ProbeStrategy::kCommand;
  options.stat_program = program;
  return StatProbe(options);
}

void TestCommandStatParsesProgramOutput() {
  hsm::test::TempDir dir("stat_probe_command");
  const auto         program = WriteScript(dir, "fake-stat", "echo \"  File: $2\"\necho \"  Size: 1000  Blocks: 0  IO Block: 4096\"\n");

  auto result = CommandProbe(program).ProbeOrThrow(dir.File("any.bin"));
  assert(result.size_bytes == 1000);
  assert(result.allocated_blocks == 0);

  const auto silent = WriteScript(dir, "silent-stat", "echo nothing useful\n");
  assert(CommandProbe(silent).Probe(dir.File("any.bin")).FailedWith<hsm::util::ProbeError>());
}

// A stat(1) child must not inherit the capture pipe of a probe running on
// another thread; the fd count seen by the child stays at its baseline.
void TestConcurrentCommandStatsDoNotShareDescriptors() {
  hsm::test::TempDir dir("stat_probe_fds");
  const auto         blocking = WriteScript(dir, "blocking-stat",
                                          ": > \"$2.started\"\n"
                                          "i=0\n"
                                          "while [ ! -e \"$2.go\" ] && [ $i -lt 400 ]; do sleep 0.05; i=$((i+1)); done\n"
                                          "echo \"  Size: 5  Blocks: 1\"\n");
  const auto         counting = WriteScript(dir, "counting-stat", "n=$(ls /proc/$$/fd | wc -l)\necho \"  Size: $n  Blocks: 1\"\n");

  const auto counter  = CommandProbe(counting);
  const auto baseline = counter.ProbeOrThrow(dir.File("x")).size_bytes;

  const auto marker         = dir.File("sibling");
  auto       sibling_result = hsm::util::Outcome<ProbeResult>::Failure(std::make_exception_ptr(std::runtime_error("not run")));
  std::thread sibling([&] { sibling_result = CommandProbe(blocking).Probe(marker); });

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (!std::filesystem::exists(marker + ".started") && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  assert(std::filesystem::exists(marker + ".started"));

  const auto during = counter.ProbeOrThrow(dir.File("x")).size_bytes;

  std::ofstream(marker + ".go").close();
  sibling.join();

  assert(sibling_result.IsSuccess());
  assert(during == baseline);
}

} // namespace

int main() {
  TestParsesGnuStatOutput();
  TestParseRejectsOutputWithoutSizeAndBlocks();
  TestParseStrategy();
  TestNativeProbeReadsSizeAndBlocks();
  TestMissingFileIsProbeError();
  TestMissingStatProgramIsProbeError();
  TestCommandStatParsesProgramOutput();
  TestConcurrentCommandStatsDoNotShareDescriptors();

  std::cout << "hsm_status_unit_stat_probe: pass\n";
  return 0;
}
