#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/probe/online_classifier.hpp"
#include "internal/util/outcome.hpp"

namespace hsm::probe {

/*
  Extracts (size, allocated blocks) for a path.

  Strategies:
    kNative   -> stat(2)
    kCommand  -> run the stat(1) utility and parse "Size:" / "Blocks:"
    kAuto     -> stat(2), falling back to stat(1) when the syscall is not
                 supported by the filesystem or runtime

  Every failure surfaces as util::ProbeError so callers can tell a broken
  probe apart from an offline classification.
*/

enum class ProbeStrategy {
  kAuto,
  kNative,
  kCommand,
};

// "auto" | "native" | "command"; throws std::invalid_argument otherwise.
ProbeStrategy ParseProbeStrategy(std::string_view value);

struct StatProbeOptions {
  ProbeStrategy strategy = ProbeStrategy::kAuto;
  std::string   stat_program{"stat"};
};

class StatProbe {
 public:
  explicit StatProbe(StatProbeOptions options = {});

  util::Outcome<ProbeResult> Probe(const std::string& path) const;

  // Same as Probe() but throws util::ProbeError.
  ProbeResult ProbeOrThrow(const std::string& path) const;

 private:
  // nullopt when stat(2) is unavailable for this path.
  std::optional<ProbeResult> NativeStat(const std::string& path) const;
  ProbeResult                CommandStat(const std::string& path) const;

  StatProbeOptions options_;
};

// First line of stat(1) output carrying both "Size: N" and "Blocks: N".
std::optional<ProbeResult> ParseStatOutput(std::string_view output);

} // namespace hsm::probe
