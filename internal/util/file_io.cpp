#include "file_io.hpp"

#include <arrow/io/file.h>

#include <exception>
#include <system_error>

#include "internal/util/random.hpp"

namespace devicefarm::util::file_io {

std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path) {
  auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
  auto size = Unwrap(file->GetSize());
  auto data = Unwrap(file->Read(size));
  Unwrap(file->Close());
  return data;
}

namespace {

constexpr std::size_t kTempSuffixLength = 8;

// "<path>.<random>.part" that does not exist yet.
std::filesystem::path UnusedTempPath(const std::filesystem::path& path) {
  while (true) {
    std::filesystem::path candidate = path.string() + "." + RandomAlphanumeric(kTempSuffixLength) + ".part";
    if (!std::filesystem::exists(candidate)) {
      return candidate;
    }
  }
}

} // namespace

void WriteFile(const std::filesystem::path& path, const std::shared_ptr<arrow::Buffer>& buffer) {
  const auto tmp_path = UnusedTempPath(path);

  try {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path.string()));
    Unwrap(out->Write(buffer->data(), buffer->size()));
    Unwrap(out->Flush());
    Unwrap(out->Close());

    std::filesystem::rename(tmp_path, path);
  } catch (const std::exception&) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    throw;
  }
}

} // namespace devicefarm::util::file_io
