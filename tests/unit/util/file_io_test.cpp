#include "internal/util/file_io.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace {

namespace file_io = devicefarm::util::file_io;

std::filesystem::path FreshDirectory(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "devicefarm_file_io_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::size_t CountEntries(const std::filesystem::path& dir) {
  std::size_t n = 0;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    (void)entry;
    ++n;
  }
  return n;
}

void TestWriteThenRead() {
  const auto dir  = FreshDirectory("roundtrip");
  const auto path = dir / "Logcat-a0.txt";

  file_io::WriteFile(path, arrow::Buffer::FromString("log line"));
  assert(ReadAll(path) == "log line");
  assert(file_io::ReadFile(path)->ToString() == "log line");
  assert(CountEntries(dir) == 1);
}

void TestNeighbourTempNameIsKept() {
  const auto dir = FreshDirectory("neighbour");
  {
    std::ofstream keep(dir / "Logcat-a0.txt.tmp");
    keep << "not ours";
  }

  file_io::WriteFile(dir / "Logcat-a0.txt", arrow::Buffer::FromString("log line"));
  assert(ReadAll(dir / "Logcat-a0.txt.tmp") == "not ours");
  assert(ReadAll(dir / "Logcat-a0.txt") == "log line");
  assert(CountEntries(dir) == 2);
}

void TestFailedWriteLeavesNoTempFile() {
  const auto dir = FreshDirectory("failed");

  // A non-empty directory under the target name makes the final rename fail.
  const auto target = dir / "Logcat-a0.txt";
  std::filesystem::create_directories(target);
  {
    std::ofstream occupant(target / "occupant");
    occupant << "x";
  }

  bool threw = false;
  try {
    file_io::WriteFile(target, arrow::Buffer::FromString("log line"));
  } catch (const std::exception&) {
    threw = true;
  }
  assert(threw);
  assert(CountEntries(dir) == 1);
  assert(std::filesystem::is_directory(target));
  assert(ReadAll(target / "occupant") == "x");
}

void TestOpenFailureThrows() {
  const auto dir = FreshDirectory("missing_parent");

  bool threw = false;
  try {
    file_io::WriteFile(dir / "no-such-dir" / "a.txt", arrow::Buffer::FromString("x"));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(CountEntries(dir) == 0);
}

} // namespace

int main() {
  TestWriteThenRead();
  TestNeighbourTempNameIsKept();
  TestFailedWriteLeavesNoTempFile();
  TestOpenFailureThrows();

  std::cout << "file_io_test: pass\n";
  return 0;
}
