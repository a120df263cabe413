#include "result_layout.hpp"

#include "internal/util/arn.hpp"

namespace devicefarm::util::layout {

std::string SafeComponent(const std::string& name) {
  if (name.empty()) {
    return "_";
  }
  if (name == "." || name == "..") {
    return std::string(name.size(), '_');
  }

  std::string out = name;
  for (char& c : out) {
    if (c == '/' || c == '\\' || c == '\0') {
      c = '_';
    }
  }
  return out;
}

std::string JobDirectoryName(const devicefarm::v1::Job& job) {
  std::string suffix;
  if (job.has_device() && !job.device().os().empty()) {
    suffix = job.device().os();
  } else {
    suffix = arn::ShortId(job.arn());
  }
  return SafeComponent(job.name() + "-" + suffix);
}

std::string SuiteDirectoryName(const devicefarm::v1::Suite& suite) {
  return SafeComponent(suite.name());
}

std::string TestDirectoryName(const devicefarm::v1::Test& test) {
  return SafeComponent(test.name());
}

std::string StripLeadingDot(const std::string& extension) {
  if (!extension.empty() && extension.front() == '.') {
    return extension.substr(1);
  }
  return extension;
}

std::string ArtifactFileName(const devicefarm::v1::Artifact& artifact) {
  const auto id = arn::SplitLast(arn::ResourcePath(artifact.arn())).leaf;
  return SafeComponent(artifact.name() + "-" + id + "." + StripLeadingDot(artifact.extension()));
}

} // namespace devicefarm::util::layout
