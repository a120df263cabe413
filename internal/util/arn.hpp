#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace devicefarm::util::arn {

/*
  Resource-name helpers.

  Service resource names have exactly seven colon-delimited segments:

      arn:aws:devicefarm:<region>:<account>:<kind>:<path>
       0   1      2         3         4      5      6

  <path> is slash-delimited and grows one component per hierarchy level,
  e.g. run "proj/run", job "proj/run/job", artifact "proj/run/job/suite/test/artifact".

  Every function here throws MalformedArn when the input does not have that
  layout, so a change in the service grammar fails at the parse site instead
  of producing wrong directory names.
*/

constexpr std::size_t kSegmentCount     = 7;
constexpr std::size_t kKindIndex        = 5;
constexpr std::size_t kResourcePathIndex = 6;

std::vector<std::string> Split(const std::string& arn);
std::string              Join(const std::vector<std::string>& segments);

// Segment 6 of the name.
std::string ResourcePath(const std::string& arn);

// Copy of `arn` with the kind segment set to `kind` and the resource path to
// `resource_path`. Used to derive job names from a run name ("job") and suite
// names from a run name ("suite").
std::string WithResource(const std::string& arn, const std::string& kind, const std::string& resource_path);

struct PathSplit {
  std::string parent;
  std::string leaf;
};

// Splits a resource path at its last '/'. Requires at least one '/'.
PathSplit SplitLast(const std::string& resource_path);

// Last path component of the resource path; the whole path when it has no '/'.
std::string ShortId(const std::string& arn);

} // namespace devicefarm::util::arn
