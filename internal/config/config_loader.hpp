#pragma once

#include <string>

#include "config/config.pb.h"

namespace fleet::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected. Enum values may be written in short lowercase form
  (`mode: embedded`). Unset fields receive the defaults below and the
  result is validated before it is returned.
*/
class ConfigLoader {
 public:
  static constexpr const char* kDefaultBindAddress       = "0.0.0.0:50051";
  static constexpr const char* kDefaultIngestAddress     = "0.0.0.0:50052";
  static constexpr uint32_t    kDefaultPurgeIntervalSec  = 3600;
  static constexpr uint32_t    kDefaultPoolThreads       = 4;
  static constexpr uint32_t    kDefaultSweepIntervalSec  = 30;
  static constexpr uint32_t    kDefaultCommandTtlSec     = 86400;
  static constexpr uint32_t    kDefaultStaleClaimSec     = 600;
  static constexpr const char* kDefaultLogLevel          = "info";

  static fleet::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static fleet::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(fleet::runtime::config::RuntimeConfig& config);
  // std::runtime_error describing the first invalid setting.
  static void Validate(const fleet::runtime::config::RuntimeConfig& config);
};

} // namespace fleet::config
