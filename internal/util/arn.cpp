#include "arn.hpp"

#include "internal/util/errors.hpp"

namespace devicefarm::util::arn {

std::vector<std::string> Split(const std::string& arn) {
  std::vector<std::string> segments;
  std::string::size_type   begin = 0;
  while (true) {
    const auto end = arn.find(':', begin);
    if (end == std::string::npos) {
      segments.push_back(arn.substr(begin));
      break;
    }
    segments.push_back(arn.substr(begin, end - begin));
    begin = end + 1;
  }

  if (segments.size() != kSegmentCount) {
    throw MalformedArn("resource name '" + arn + "' has " + std::to_string(segments.size()) + " segments, expected " +
                       std::to_string(kSegmentCount));
  }
  return segments;
}

std::string Join(const std::vector<std::string>& segments) {
  if (segments.size() != kSegmentCount) {
    throw MalformedArn("cannot join " + std::to_string(segments.size()) + " segments into a resource name");
  }
  std::string out;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    if (i != 0) {
      out.push_back(':');
    }
    out += segments[i];
  }
  return out;
}

std::string ResourcePath(const std::string& arn) {
  return Split(arn)[kResourcePathIndex];
}

std::string WithResource(const std::string& arn, const std::string& kind, const std::string& resource_path) {
  auto segments                = Split(arn);
  segments[kKindIndex]         = kind;
  segments[kResourcePathIndex] = resource_path;
  return Join(segments);
}

PathSplit SplitLast(const std::string& resource_path) {
  const auto slash = resource_path.rfind('/');
  if (slash == std::string::npos) {
    throw MalformedArn("resource path '" + resource_path + "' has no parent component");
  }
  return {resource_path.substr(0, slash), resource_path.substr(slash + 1)};
}

std::string ShortId(const std::string& arn) {
  const auto path  = ResourcePath(arn);
  const auto slash = path.rfind('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace devicefarm::util::arn
