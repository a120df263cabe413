#pragma once

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <arrow/status.h>

#include <filesystem>
#include <memory>
#include <stdexcept>

namespace devicefarm::util::file_io {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(const arrow::Result<T>& result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return *result;
}

inline void Unwrap(const arrow::Status& status) {
  if (!status.ok()) throw std::runtime_error(status.ToString());
}

/*
  Read an entire local file into a buffer.
*/
std::shared_ptr<arrow::Buffer> ReadFile(const std::filesystem::path& path);

/*
  Atomic write:
      write <path>.<random>.part → flush → rename

  A failed write removes its temporary file and never leaves a truncated
  artifact under its final name. Existing files other than `path` are not
  touched.
*/
void WriteFile(const std::filesystem::path& path, const std::shared_ptr<arrow::Buffer>& buffer);

} // namespace devicefarm::util::file_io
