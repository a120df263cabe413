#include <chrono>
#include <iostream>
#include <string>
#include <thread>

#include "client/cpp/devicefarm_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

/*
  Uploads an Android app and its instrumentation test package, runs them on a
  device pool, waits for the run and collects every artifact.

    instrumentation_run_example <config.yaml> <project> <pool> <app.apk> <tests.apk> <out-dir>
*/
int main(int argc, char** argv) {
  if (argc != 7) {
    std::cerr << "usage: " << argv[0] << " <config.yaml> <project> <pool> <app.apk> <tests.apk> <out-dir>\n";
    return 1;
  }

  auto config = devicefarm::config::ConfigLoader::LoadFromYaml(argv[1]);
  devicefarm::config::ConfigLoader::ApplyEnvironment(&config);
  config.mutable_logging()->set_progress(true);
  devicefarm::observability::InitializeLogging(config);

  auto  deps   = devicefarm::factory::BuildClient(config);
  auto& client = *deps.client;

  auto project = client.GetProject(argv[2]);
  if (!project.ok()) {
    std::cerr << "GetProject failed: " << project.status().ToString() << '\n';
    return 1;
  }
  auto pool = client.GetDevicePool(*project, argv[3]);
  if (!pool.ok()) {
    std::cerr << "GetDevicePool failed: " << pool.status().ToString() << '\n';
    return 1;
  }

  auto app = client.UploadApp(*project, argv[4]);
  if (!app.ok()) {
    std::cerr << "UploadApp failed: " << app.status().ToString() << '\n';
    return 1;
  }

  const devicefarm::model::TestSpec test = devicefarm::model::InstrumentationTest{argv[5]};
  auto                              package = client.UploadTest(*project, test);
  if (!package.ok()) {
    std::cerr << "UploadTest failed: " << package.status().ToString() << '\n';
    return 1;
  }

  devicefarm::client::ScheduleRunOptions options;
  options.project_arn     = project->arn();
  options.name            = "instrumentation example";
  options.device_pool_arn = pool->arn();
  options.app_arn         = app->arn();
  options.test            = devicefarm::model::MakeScheduleRunTest(test, package->arn());

  auto run = client.ScheduleRun(options);
  if (!run.ok()) {
    std::cerr << "ScheduleRun failed: " << run.status().ToString() << '\n';
    return 1;
  }
  std::cout << "scheduled " << run->arn() << '\n';

  // The client does not wait for runs; poll until the service completes it.
  while (true) {
    auto current = client.DescribeRun(run->arn());
    if (!current.ok()) {
      std::cerr << "DescribeRun failed: " << current.status().ToString() << '\n';
      return 1;
    }
    if (current->status() == "COMPLETED") {
      std::cout << "result=" << current->result() << '\n';
      break;
    }
    std::this_thread::sleep_for(std::chrono::seconds(30));
  }

  auto collected = client.GetArtifacts(run->arn(), argv[6]);
  if (!collected.ok()) {
    std::cerr << "GetArtifacts failed: " << collected.status().ToString() << '\n';
    return 1;
  }
  std::cout << "artifacts=" << collected->artifacts.size() << '\n';
  return 0;
}
