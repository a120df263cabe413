#pragma once

#include <filesystem>
#include <string>

#include "devicefarm/v1/resources.pb.h"

namespace devicefarm::util::layout {

/*
  Local naming of collected run results:

      <destination>/<job name>-<device os | job id>/<suite name>/<test name>/<artifact name>-<artifact id>.<ext>

  Two jobs of one run may share a name (same device model, different OS), so
  the job directory carries the device OS, or the job's own id when the
  service reports no OS.

  Every component comes from the service and passes through SafeComponent,
  so the tree always stays below <destination>.
*/

/*
  One path component from a service-supplied name.
  '/', '\\' and NUL become '_'; "", "." and ".." become underscores.
*/
std::string SafeComponent(const std::string& name);

std::string JobDirectoryName(const devicefarm::v1::Job& job);

std::string SuiteDirectoryName(const devicefarm::v1::Suite& suite);

std::string TestDirectoryName(const devicefarm::v1::Test& test);

// "png" for both ".png" and "png". Only one leading dot is removed.
std::string StripLeadingDot(const std::string& extension);

std::string ArtifactFileName(const devicefarm::v1::Artifact& artifact);

inline std::filesystem::path ArtifactPath(const std::filesystem::path& test_directory, const devicefarm::v1::Artifact& artifact) {
  return test_directory / ArtifactFileName(artifact);
}

} // namespace devicefarm::util::layout
