#include <pthread.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "client/cpp/devicefarm_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/test_spec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using devicefarm::client::DeviceFarmClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  devicefarmctl --config <file.yaml> projects\n"
            << "  devicefarmctl --config <file.yaml> device-pools <project>\n"
            << "  devicefarmctl --config <file.yaml> devices <project>\n"
            << "  devicefarmctl --config <file.yaml> account\n"
            << "  devicefarmctl --config <file.yaml> unmetered <android|ios>\n"
            << "  devicefarmctl --config <file.yaml> upload-app <project> <file>\n"
            << "  devicefarmctl --config <file.yaml> upload-extra <project> <file>\n"
            << "  devicefarmctl --config <file.yaml> upload-test <project> <framework> <file>\n"
            << "  devicefarmctl --config <file.yaml> schedule <project> <run-name> <device-pool> <framework> <test-package-arn> "
               "[app-arn] [timeout-minutes]\n"
            << "  devicefarmctl --config <file.yaml> run <run-arn>\n"
            << "  devicefarmctl --config <file.yaml> jobs <run-arn>\n"
            << "  devicefarmctl --config <file.yaml> artifacts <run-arn> <destination-dir>\n"
            << "\n"
            << "Frameworks: instrumentation calabash uiautomator uiautomation xctest xctest-ui\n"
            << "            appium-java-testng appium-java-junit appium-python\n"
            << "            appium-web-java-testng appium-web-java-junit appium-web-python\n";
}

// Prints the failure and returns the operation-failure exit code.
static int Fail(const arrow::Status& status) {
  std::cerr << status.ToString() << "\n";
  return 2;
}

static void PrintUpload(const devicefarm::v1::Upload& upload) {
  std::cout << "arn=" << upload.arn() << "\n";
  std::cout << "name=" << upload.name() << "\n";
  std::cout << "type=" << upload.type() << "\n";
  std::cout << "status=" << upload.status() << "\n";
  std::cout << "created=" << devicefarm::util::ToIso8601(devicefarm::util::FromEpochSeconds(upload.created())) << "\n";
}

static void PrintRun(const devicefarm::v1::Run& run) {
  std::cout << "arn=" << run.arn() << "\n";
  std::cout << "name=" << run.name() << "\n";
  std::cout << "status=" << run.status() << "\n";
  std::cout << "result=" << run.result() << "\n";
  std::cout << "jobs=" << run.completed_jobs() << "/" << run.total_jobs() << "\n";
  std::cout << "created=" << devicefarm::util::ToIso8601(devicefarm::util::FromEpochSeconds(run.created())) << "\n";
}

/*
  SIGINT / SIGTERM are blocked in every thread and consumed here. The first
  one interrupts a pending upload wait; the second terminates immediately.
*/
static void StartSignalThread(std::shared_ptr<devicefarm::poll::InterruptibleSleeper> sleeper) {
  std::thread([sleeper = std::move(sleeper)] {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);

    bool interrupted = false;
    while (true) {
      int signal = 0;
      if (sigwait(&signals, &signal) != 0) {
        return;
      }
      if (interrupted) {
        std::_Exit(128 + signal);
      }
      interrupted = true;
      DEVICEFARM_LOG_WARN("interrupt received", {devicefarm::observability::IntField("signal", signal)});
      sleeper->Interrupt();
    }
  }).detach();
}

static int Run(const DeviceFarmClient& client, const std::string& cmd, int argc, char** argv) {
  // argv[0..argc) are the arguments after the command name.

  if (cmd == "projects") {
    auto projects = client.ListProjects();
    if (!projects.ok()) return Fail(projects.status());
    for (const auto& project : *projects) {
      std::cout << project.arn() << " " << project.name() << "\n";
    }
    return 0;
  }

  if (cmd == "device-pools") {
    if (argc < 1) return 1;
    auto project = client.GetProject(argv[0]);
    if (!project.ok()) return Fail(project.status());
    auto pools = client.ListDevicePools(*project);
    if (!pools.ok()) return Fail(pools.status());
    for (const auto& pool : *pools) {
      std::cout << pool.arn() << " " << pool.name() << "\n";
    }
    return 0;
  }

  if (cmd == "devices") {
    if (argc < 1) return 1;
    auto devices = client.ListDevices(std::string(argv[0]));
    if (!devices.ok()) return Fail(devices.status());
    for (const auto& device : *devices) {
      std::cout << device.arn() << " " << device.name() << " " << device.platform() << " " << device.os() << "\n";
    }
    return 0;
  }

  if (cmd == "account") {
    auto settings = client.GetAccountSettings();
    if (!settings.ok()) return Fail(settings.status());
    if (!settings->has_value()) {
      std::cout << "no account settings\n";
      return 0;
    }
    const auto& value = settings->value();
    std::cout << "account=" << value.aws_account_number() << "\n";
    for (const auto& [platform, count] : value.unmetered_devices()) {
      std::cout << "unmetered." << platform << "=" << count << "\n";
    }
    return 0;
  }

  if (cmd == "unmetered") {
    if (argc < 1) return 1;
    auto count = client.GetUnmeteredDeviceCount(argv[0]);
    if (!count.ok()) return Fail(count.status());
    std::cout << *count << "\n";
    return 0;
  }

  if (cmd == "upload-app" || cmd == "upload-extra") {
    if (argc < 2) return 1;
    auto project = client.GetProject(argv[0]);
    if (!project.ok()) return Fail(project.status());
    auto upload = cmd == "upload-app" ? client.UploadApp(*project, argv[1]) : client.UploadExtraData(*project, argv[1]);
    if (!upload.ok()) return Fail(upload.status());
    PrintUpload(*upload);
    return 0;
  }

  if (cmd == "upload-test") {
    if (argc < 3) return 1;
    auto test = devicefarm::model::ParseTestSpec(argv[1], argv[2]);
    if (!test) {
      std::cerr << "unsupported framework: " << argv[1] << "\n";
      return 1;
    }
    auto project = client.GetProject(argv[0]);
    if (!project.ok()) return Fail(project.status());
    auto upload = client.UploadTest(*project, *test);
    if (!upload.ok()) return Fail(upload.status());
    PrintUpload(*upload);
    return 0;
  }

  if (cmd == "schedule") {
    if (argc < 5) return 1;
    auto test = devicefarm::model::ParseTestSpec(argv[3], "");
    if (!test) {
      std::cerr << "unsupported framework: " << argv[3] << "\n";
      return 1;
    }

    auto project = client.GetProject(argv[0]);
    if (!project.ok()) return Fail(project.status());
    auto pool = client.GetDevicePool(*project, argv[2]);
    if (!pool.ok()) return Fail(pool.status());

    devicefarm::client::ScheduleRunOptions options;
    options.project_arn     = project->arn();
    options.name            = argv[1];
    options.device_pool_arn = pool->arn();
    options.test            = devicefarm::model::MakeScheduleRunTest(*test, argv[4]);
    if (argc >= 6 && std::string(argv[5]).size() > 0) {
      options.app_arn = std::string(argv[5]);
    }
    if (argc >= 7) {
      try {
        options.job_timeout_minutes = std::stoi(argv[6]);
      } catch (const std::exception&) {
        std::cerr << "invalid timeout: " << argv[6] << "\n";
        return 1;
      }
    }

    auto run = client.ScheduleRun(options);
    if (!run.ok()) return Fail(run.status());
    PrintRun(*run);
    return 0;
  }

  if (cmd == "run") {
    if (argc < 1) return 1;
    auto run = client.DescribeRun(argv[0]);
    if (!run.ok()) return Fail(run.status());
    PrintRun(*run);
    return 0;
  }

  if (cmd == "jobs") {
    if (argc < 1) return 1;
    auto jobs = client.ListJobs(argv[0]);
    if (!jobs.ok()) return Fail(jobs.status());
    for (const auto& job : *jobs) {
      std::cout << job.arn() << " " << job.name() << " " << job.status() << " " << job.result() << "\n";
    }
    return 0;
  }

  if (cmd == "artifacts") {
    if (argc < 2) return 1;
    auto collected = client.GetArtifacts(argv[0], argv[1]);
    if (!collected.ok()) return Fail(collected.status());
    for (const auto& path : collected->artifacts) {
      std::cout << path.string() << "\n";
    }
    std::cout << "artifacts=" << collected->artifacts.size() << "\n";
    return 0;
  }

  std::cerr << "unknown command: " << cmd << "\n";
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  // Block before any thread starts so every thread inherits the mask.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  // Consume signals from here on; an interrupt during setup stays pending on
  // the sleeper and ends the first upload wait.
  auto sleeper = std::make_shared<devicefarm::poll::InterruptibleSleeper>();
  StartSignalThread(sleeper);

  int rc = 0;
  try {
    auto config = devicefarm::config::ConfigLoader::LoadFromYaml(config_path);
    devicefarm::config::ConfigLoader::ApplyEnvironment(&config);

    devicefarm::observability::InitializeLogging(config);

    auto deps = devicefarm::factory::BuildClient(config, sleeper);

    rc = Run(*deps.client, cmd, argc - 4, argv + 4);
    if (rc == 1) {
      Usage();
    }
  } catch (const std::exception& e) {
    DEVICEFARM_LOG_ERROR("Fatal error", {devicefarm::observability::StringField("error", e.what())});
    rc = 2;
  }

  devicefarm::observability::ShutdownLogging();
  return rc;
}
