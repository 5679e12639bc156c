#include "model_identity.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

namespace linksync::model {

namespace {

constexpr std::array<std::pair<Region, std::string_view>, 8> kRegions = {{
    {Region::kUS, "US"},
    {Region::kEMEA, "EMEA"},
    {Region::kAUS, "AUS"},
    {Region::kCAN, "CAN"},
    {Region::kDEU, "DEU"},
    {Region::kIND, "IND"},
    {Region::kJPN, "JPN"},
    {Region::kGBR, "GBR"},
}};

std::string Trim(std::string_view text) {
  auto begin = text.begin();
  auto end   = text.end();
  while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) ++begin;
  while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) --end;
  return std::string(begin, end);
}

void HashCombine(std::size_t& seed, std::size_t value) {
  seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

} // namespace

std::string_view ToString(Region region) {
  for (const auto& [value, name] : kRegions) {
    if (value == region) return name;
  }
  return "UNKNOWN";
}

Region ParseRegion(std::string_view text) {
  std::string upper = Trim(text);
  std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

  for (const auto& [value, name] : kRegions) {
    if (name == upper) return value;
  }
  throw std::invalid_argument("unknown cloud region '" + std::string(text) + "'");
}

ModelIdentity::ModelIdentity(Region region, std::string project_id, std::string model_id)
    : region_(region), project_id_(std::move(project_id)), model_id_(std::move(model_id)) {
  if (project_id_.empty()) throw std::invalid_argument("model identity: project id is empty");
  if (model_id_.empty()) throw std::invalid_argument("model identity: model id is empty");
}

std::string ModelIdentity::ToString() const {
  return std::string(model::ToString(region_)) + "/" + project_id_ + "/" + model_id_;
}

std::string ModelIdentity::ShortName() const {
  return model_id_.substr(0, 8);
}

bool operator<(const ModelIdentity& a, const ModelIdentity& b) {
  return std::tie(a.region_, a.project_id_, a.model_id_) < std::tie(b.region_, b.project_id_, b.model_id_);
}

std::size_t ModelIdentityHash::operator()(const ModelIdentity& id) const {
  std::size_t seed = std::hash<std::uint8_t>{}(static_cast<std::uint8_t>(id.region()));
  HashCombine(seed, std::hash<std::string>{}(id.project_id()));
  HashCombine(seed, std::hash<std::string>{}(id.model_id()));
  return seed;
}

std::string FormatIdentityRecord(std::string_view name, const ModelIdentity& id) {
  if (name.find(',') != std::string_view::npos) {
    throw std::invalid_argument("identity record: name '" + std::string(name) + "' contains a comma");
  }

  std::string record;
  record.reserve(name.size() + id.project_id().size() + id.model_id().size() + 8);
  record.append(name);
  record.push_back(',');
  record.append(model::ToString(id.region()));
  record.push_back(',');
  record.append(id.project_id());
  record.push_back(',');
  record.append(id.model_id());
  return record;
}

IdentityRecord ParseIdentityRecord(std::string_view record) {
  std::vector<std::string> fields;
  std::size_t              start = 0;
  while (true) {
    const auto comma = record.find(',', start);
    if (comma == std::string_view::npos) {
      fields.push_back(Trim(record.substr(start)));
      break;
    }
    fields.push_back(Trim(record.substr(start, comma - start)));
    start = comma + 1;
  }

  if (fields.size() != 4) {
    throw std::invalid_argument("identity record: expected 4 fields (name,region,project,model), got " + std::to_string(fields.size()));
  }

  return IdentityRecord{fields[0], ModelIdentity(ParseRegion(fields[1]), fields[2], fields[3])};
}

} // namespace linksync::model
