#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace linksync::model {

enum class Region : std::uint8_t {
  kUS   = 0,
  kEMEA = 1,
  kAUS  = 2,
  kCAN  = 3,
  kDEU  = 4,
  kIND  = 5,
  kJPN  = 6,
  kGBR  = 7,
};

std::string_view ToString(Region region);

// Case-insensitive. Throws std::invalid_argument on unknown text.
Region ParseRegion(std::string_view text);

/*
  Identity of one cloud model: (region, project, model).

  Immutable value type. Two links resolving to the same identity refer to
  the same graph node.
*/
class ModelIdentity {
 public:
  ModelIdentity(Region region, std::string project_id, std::string model_id);

  Region region() const {
    return region_;
  }
  const std::string& project_id() const {
    return project_id_;
  }
  const std::string& model_id() const {
    return model_id_;
  }

  // REGION/project/model
  std::string ToString() const;
  // First 8 characters of the model id, for log lines.
  std::string ShortName() const;

  friend bool operator==(const ModelIdentity& a, const ModelIdentity& b) {
    return a.region_ == b.region_ && a.project_id_ == b.project_id_ && a.model_id_ == b.model_id_;
  }
  friend bool operator!=(const ModelIdentity& a, const ModelIdentity& b) {
    return !(a == b);
  }
  friend bool operator<(const ModelIdentity& a, const ModelIdentity& b);

 private:
  Region      region_;
  std::string project_id_;
  std::string model_id_;
};

struct ModelIdentityHash {
  std::size_t operator()(const ModelIdentity& id) const;
};

/*
  Delimited identity record used for clipboard export:

    name,REGION,project,model

  Throws std::invalid_argument if the name contains a comma, since the
  record could not be parsed back.
*/
std::string FormatIdentityRecord(std::string_view name, const ModelIdentity& id);

struct IdentityRecord {
  std::string   name;
  ModelIdentity identity;
};

// Throws std::invalid_argument on malformed input.
IdentityRecord ParseIdentityRecord(std::string_view record);

} // namespace linksync::model

namespace std {
template <>
struct hash<linksync::model::ModelIdentity> {
  std::size_t operator()(const linksync::model::ModelIdentity& id) const {
    return linksync::model::ModelIdentityHash{}(id);
  }
};
} // namespace std
