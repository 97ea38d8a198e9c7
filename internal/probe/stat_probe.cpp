#include "internal/probe/stat_probe.hpp"

#include <fcntl.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <regex>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

extern char** environ;

namespace hsm::probe {

namespace {

bool IsUnsupportedErrno(int err) {
  return err == ENOSYS || err == EOPNOTSUPP || err == ENOTSUP;
}

std::string ErrnoMessage(int err) {
  return std::strerror(err);
}

// Runs argv[0] with stdout+stderr captured. Returns the combined output.
// The pipe is close-on-exec so children spawned by other workers never hold it.
std::string RunCapture(const std::vector<std::string>& args) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw util::ProbeError("pipe failed: " + ErrnoMessage(errno));
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addclose(&actions, fds[0]);
  posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO);
  posix_spawn_file_actions_addclose(&actions, fds[1]);

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t     pid = 0;
  const int rc  = posix_spawnp(&pid, argv[0], &actions, nullptr, argv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  ::close(fds[1]);

  if (rc != 0) {
    ::close(fds[0]);
    throw util::ProbeError("failed to run '" + args[0] + "': " + ErrnoMessage(rc));
  }

  std::string output;
  char        buffer[4096];
  for (;;) {
    const ssize_t n = ::read(fds[0], buffer, sizeof(buffer));
    if (n > 0) {
      output.append(buffer, static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    break;
  }
  ::close(fds[0]);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw util::ProbeError("waitpid failed for '" + args[0] + "': " + ErrnoMessage(errno));
    }
  }

  return output;
}

std::string FirstLine(const std::string& text) {
  const auto end = text.find('\n');
  return end == std::string::npos ? text : text.substr(0, end);
}

} // namespace

ProbeStrategy ParseProbeStrategy(std::string_view value) {
  if (value == "auto") {
    return ProbeStrategy::kAuto;
  }
  if (value == "native") {
    return ProbeStrategy::kNative;
  }
  if (value == "command") {
    return ProbeStrategy::kCommand;
  }
  throw std::invalid_argument("unknown probe strategy: " + std::string(value));
}

std::optional<ProbeResult> ParseStatOutput(std::string_view output) {
  static const std::regex kSizeAndBlocks(R"(Size:\s*(\d+).*Blocks:\s*(\d+))");

  std::size_t start = 0;
  while (start <= output.size()) {
    auto end = output.find('\n', start);
    if (end == std::string_view::npos) {
      end = output.size();
    }

    const std::string line(output.substr(start, end - start));
    std::smatch       match;
    if (std::regex_search(line, match, kSizeAndBlocks)) {
      try {
        ProbeResult result;
        result.size_bytes       = std::stoull(match[1].str());
        result.allocated_blocks = std::stoull(match[2].str());
        return result;
      } catch (const std::out_of_range&) {
        // number too large for uint64; keep scanning
      }
    }

    if (end == output.size()) {
      break;
    }
    start = end + 1;
  }

  return std::nullopt;
}

StatProbe::StatProbe(StatProbeOptions options) : options_(std::move(options)) {
  if (options_.stat_program.empty()) {
    options_.stat_program = "stat";
  }
}

util::Outcome<ProbeResult> StatProbe::Probe(const std::string& path) const {
  return util::Outcome<ProbeResult>::Attempt([&] { return ProbeOrThrow(path); });
}

ProbeResult StatProbe::ProbeOrThrow(const std::string& path) const {
  if (path.empty()) {
    throw util::ProbeError("cannot probe an empty path");
  }

  if (options_.strategy == ProbeStrategy::kCommand) {
    return CommandStat(path);
  }

  if (auto native = NativeStat(path)) {
    return *native;
  }

  if (options_.strategy == ProbeStrategy::kNative) {
    throw util::ProbeError("stat(2) is not supported for " + path);
  }

  HSM_LOG_DEBUG("stat(2) unsupported, falling back to stat(1)", {observability::StringField("path", path)});
  return CommandStat(path);
}

std::optional<ProbeResult> StatProbe::NativeStat(const std::string& path) const {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    const int err = errno;
    if (IsUnsupportedErrno(err)) {
      return std::nullopt;
    }
    throw util::ProbeError("stat failed for " + path + ": " + ErrnoMessage(err));
  }

  ProbeResult result;
  result.size_bytes       = static_cast<uint64_t>(st.st_size);
  result.allocated_blocks = static_cast<uint64_t>(st.st_blocks);
  return result;
}

ProbeResult StatProbe::CommandStat(const std::string& path) const {
  // "--" keeps paths starting with a dash from being read as options.
  const auto output = RunCapture({options_.stat_program, "--", path});

  if (auto parsed = ParseStatOutput(output)) {
    return *parsed;
  }

  throw util::ProbeError("unable to detect size and blocks for " + path + " from '" + options_.stat_program +
                         "' output: " + FirstLine(output));
}

} // namespace hsm::probe
