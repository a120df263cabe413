#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace devicefarm::util {

/*
  Central error types.

  Thrown by the internal layers; DeviceFarmClient translates them into
  arrow::Status at its public boundary (see status.hpp).
*/

// A project or device pool name has no exact match.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// File extension does not map to any upload type.
class UnrecognizedArtifactType : public std::runtime_error {
 public:
  explicit UnrecognizedArtifactType(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingArtifactPath : public std::runtime_error {
 public:
  explicit MissingArtifactPath(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LocalFileNotFound : public std::runtime_error {
 public:
  explicit LocalFileNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The PUT to the pre-signed URL could not be executed.
class UploadTransportFailure : public std::runtime_error {
 public:
  explicit UploadTransportFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The PUT to the pre-signed URL answered with something other than 200.
class UploadRejected : public std::runtime_error {
 public:
  UploadRejected(const std::string& msg, int http_status) : std::runtime_error(msg), http_status_(http_status) {
  }

  int http_status() const {
    return http_status_;
  }

 private:
  int http_status_;
};

// The service moved the upload to FAILED.
class UploadFailed : public std::runtime_error {
 public:
  UploadFailed(const std::string& msg, std::string metadata) : std::runtime_error(msg), metadata_(std::move(metadata)) {
  }

  const std::string& metadata() const {
    return metadata_;
  }

 private:
  std::string metadata_;
};

class UploadTimedOut : public std::runtime_error {
 public:
  explicit UploadTimedOut(const std::string& msg) : std::runtime_error(msg) {
  }
};

class WaitInterrupted : public std::runtime_error {
 public:
  explicit WaitInterrupted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A resource name does not have the expected segment layout.
class MalformedArn : public std::invalid_argument {
 public:
  explicit MalformedArn(const std::string& msg) : std::invalid_argument(msg) {
  }
};

// Generic HTTP failure: resolve, connect, TLS, read or write.
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The remote API answered with an error document.
class ServiceError : public std::runtime_error {
 public:
  ServiceError(const std::string& msg, std::string code, int http_status)
      : std::runtime_error(msg), code_(std::move(code)), http_status_(http_status) {
  }

  const std::string& code() const {
    return code_;
  }

  int http_status() const {
    return http_status_;
  }

  bool IsNotFound() const {
    return code_ == "NotFoundException";
  }

 private:
  std::string code_;
  int         http_status_;
};

class CredentialsError : public std::runtime_error {
 public:
  explicit CredentialsError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace devicefarm::util
