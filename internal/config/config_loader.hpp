#pragma once

#include <string>

#include "config/config.pb.h"

namespace devicefarm::config {

/*
  Loads ClientConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Quoted scalars always stay strings, so numeric-looking secrets
  survive the conversion.

  Defaults are applied to fields left unset; see ApplyDefaults.
*/
class ConfigLoader {
 public:
  static devicefarm::runtime::config::ClientConfig LoadFromYaml(const std::string& path);
  static devicefarm::runtime::config::ClientConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(devicefarm::runtime::config::ClientConfig* config);

  /*
    Environment overrides:
      AWS_REGION                                       aws.region
      AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY /
      AWS_SESSION_TOKEN                                aws.credentials, only when
                                                       the file has none
  */
  static void ApplyEnvironment(devicefarm::runtime::config::ClientConfig* config);
};

} // namespace devicefarm::config
