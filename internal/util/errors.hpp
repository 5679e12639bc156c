#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/model_identity.hpp"

namespace linksync::util {

/*
  Central error types.

  Gateway implementations throw these; the engine translates them into
  ErrorKind values (see model::Classify).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AccessDenied : public std::runtime_error {
 public:
  explicit AccessDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Another user or session holds the central model.
class Locked : public std::runtime_error {
 public:
  explicit Locked(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransientIO : public std::runtime_error {
 public:
  explicit TransientIO(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SyncConflict : public std::runtime_error {
 public:
  explicit SyncConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CorruptModel : public std::runtime_error {
 public:
  explicit CorruptModel(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The host itself cannot be reached. Halts a sync run.
class GatewayUnavailable : public std::runtime_error {
 public:
  explicit GatewayUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CycleDetected : public std::runtime_error {
 public:
  CycleDetected(const std::string& msg, std::vector<model::ModelIdentity> members)
      : std::runtime_error(msg), members_(std::move(members)) {
  }

  const std::vector<model::ModelIdentity>& Members() const {
    return members_;
  }

 private:
  std::vector<model::ModelIdentity> members_;
};

class InvalidSelection : public std::runtime_error {
 public:
  explicit InvalidSelection(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace linksync::util
