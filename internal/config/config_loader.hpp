#pragma once

#include <string>

#include "config/config.pb.h"

namespace hsm::config {

inline constexpr const char* kDefaultBindAddress       = "0.0.0.0:50061";
inline constexpr const char* kDefaultDatafileNamespace = "http://tardis.edu.au/schemas/hsm/datafile/1";
inline constexpr const char* kDefaultProbeStrategy     = "auto";
inline constexpr const char* kDefaultStatProgram       = "stat";
inline constexpr const char* kDefaultLockCache         = "memory";
inline constexpr unsigned    kDefaultSweepBatchSize    = 256;

// Storage classes whose objects live on a POSIX filesystem and can therefore
// be probed. Override with hsm.storage_classes.
inline constexpr const char* kDefaultStorageClasses[] = {
    "tardis.tardis_portal.storage.MyTardisLocalFileSystemStorage",
    "django.core.files.storage.FileSystemStorage",
};

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset values are filled by ApplyDefaults().
*/
class ConfigLoader {
 public:
  static hsm::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

// Fills every unset field with its default. Idempotent.
void ApplyDefaults(hsm::runtime::config::RuntimeConfig& config);

// Config with all defaults and an in-memory database.
hsm::runtime::config::RuntimeConfig DefaultConfig();

} // namespace hsm::config
