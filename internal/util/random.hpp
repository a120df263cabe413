#pragma once

#include <cstddef>
#include <string>

namespace devicefarm::util {

/*
  Random helpers

  Used for STS role session names and temporary file names, which only need
  to be distinct, not unpredictable.
*/

std::string RandomAlphanumeric(std::size_t length);

} // namespace devicefarm::util
