#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/retry/retry_policy.hpp"

namespace eventstore::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  mistyped values are rejected by the protobuf JSON parser.
*/
class ConfigLoader {
 public:
  static eventstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static eventstore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

// RetryConfig with unset fields replaced by RetryOptions defaults.
retry::RetryOptions ToRetryOptions(const eventstore::runtime::config::RetryConfig& config);

} // namespace eventstore::config
