#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using devicefarm::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "devicefarm_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfig() {
  const auto yaml_path = WriteYaml("full",
                                   R"(aws:
  region: us-west-2
  endpoint: "http://localhost:4566"
  role_arn: "arn:aws:iam::123456789012:role/DeviceFarmRunner"
  credentials:
    access_key_id: AKIDEXAMPLE
    secret_access_key: "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY"
http:
  user_agent: "ci-runner/2.0"
  timeout_ms: 60000
  verify_tls: false
upload:
  poll_interval_ms: 1000
  timeout_ms: 600000
logging:
  level: debug
  progress: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.aws().endpoint() == "http://localhost:4566");
  assert(config.aws().role_arn() == "arn:aws:iam::123456789012:role/DeviceFarmRunner");
  assert(config.aws().credentials().access_key_id() == "AKIDEXAMPLE");
  assert(config.http().user_agent() == "ci-runner/2.0");
  assert(config.http().timeout_ms() == 60000);
  assert(config.http().has_verify_tls() && !config.http().verify_tls());
  assert(config.upload().poll_interval_ms() == 1000);
  assert(config.upload().timeout_ms() == 600000);
  assert(config.logging().level() == "debug");
  assert(config.logging().progress());
}

void TestDefaultsApplyToEmptyDocument() {
  auto config = ConfigLoader::LoadFromString("");
  assert(config.aws().region() == "us-west-2");
  assert(config.http().user_agent() == "devicefarm-client/1.0");
  assert(config.http().timeout_ms() == 300000);
  assert(config.http().verify_tls());
  assert(config.upload().poll_interval_ms() == 5000);
  assert(config.upload().timeout_ms() == 0);
  assert(config.logging().level() == "info");
  assert(!config.logging().progress());
}

void TestQuotedNumericScalarsStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(aws:
  credentials:
    access_key_id: "1234567890"
    secret_access_key: "true"
)");
  assert(config.aws().credentials().access_key_id() == "1234567890");
  assert(config.aws().credentials().secret_access_key() == "true");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = ConfigLoader::LoadFromString(R"(logging:
  pattern: "C:\\logs\\\"quoted\"\\%v"
)");
  assert(config.logging().pattern() == "C:\\logs\\\"quoted\"\\%v");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(aws:
  region: us-west-2
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/devicefarm.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

void TestEnvironmentOverrides() {
  setenv("AWS_REGION", "us-east-1", 1);
  setenv("AWS_ACCESS_KEY_ID", "ENVKEY", 1);
  setenv("AWS_SECRET_ACCESS_KEY", "ENVSECRET", 1);
  setenv("AWS_SESSION_TOKEN", "ENVTOKEN", 1);

  auto from_env = ConfigLoader::LoadFromString("logging:\n  level: warn\n");
  ConfigLoader::ApplyEnvironment(&from_env);
  assert(from_env.aws().region() == "us-east-1");
  assert(from_env.aws().credentials().access_key_id() == "ENVKEY");
  assert(from_env.aws().credentials().secret_access_key() == "ENVSECRET");
  assert(from_env.aws().credentials().session_token() == "ENVTOKEN");

  // Credentials in the file win over the environment.
  auto from_file = ConfigLoader::LoadFromString(R"(aws:
  credentials:
    access_key_id: FILEKEY
    secret_access_key: FILESECRET
)");
  ConfigLoader::ApplyEnvironment(&from_file);
  assert(from_file.aws().credentials().access_key_id() == "FILEKEY");
  assert(from_file.aws().credentials().session_token().empty());

  unsetenv("AWS_REGION");
  unsetenv("AWS_ACCESS_KEY_ID");
  unsetenv("AWS_SECRET_ACCESS_KEY");
  unsetenv("AWS_SESSION_TOKEN");
}

} // namespace

int main() {
  TestFullConfig();
  TestDefaultsApplyToEmptyDocument();
  TestQuotedNumericScalarsStayStrings();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestEnvironmentOverrides();

  std::cout << "config_loader_test: pass\n";
  return 0;
}
