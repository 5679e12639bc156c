#include "catalog_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"

namespace linksync::gateway::memory {

namespace obs = linksync::observability;

using model::ErrorKind;
using model::ModelIdentity;

namespace {

std::string Lowered(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string Required(const YAML::Node& node, const char* key, const std::string& where) {
  const auto value = node[key];
  if (!value || !value.IsScalar() || value.Scalar().empty()) {
    throw std::runtime_error("catalog: " + where + " is missing '" + key + "'");
  }
  return value.Scalar();
}

ModelIdentity ParseIdentity(const YAML::Node& node, const std::string& where, const model::Region* default_region) {
  model::Region region;
  if (node["region"]) {
    region = model::ParseRegion(node["region"].Scalar());
  } else if (default_region) {
    region = *default_region;
  } else {
    throw std::runtime_error("catalog: " + where + " is missing 'region'");
  }
  return ModelIdentity(region, Required(node, "project", where), Required(node, "model", where));
}

} // namespace

ErrorKind ParseErrorKind(const std::string& text) {
  auto lowered = Lowered(text);
  lowered.erase(std::remove(lowered.begin(), lowered.end(), '_'), lowered.end());
  for (auto kind : {ErrorKind::kNotFound, ErrorKind::kAccessDenied, ErrorKind::kLocked, ErrorKind::kTransientIO, ErrorKind::kSyncConflict,
                    ErrorKind::kCorruptModel, ErrorKind::kGatewayUnavailable, ErrorKind::kInternal}) {
    if (Lowered(std::string(model::ToString(kind))) == lowered) return kind;
  }
  throw std::invalid_argument("unknown error kind: " + text);
}

void CatalogLoader::LoadFromYaml(const std::string& path, MemoryGateway& gateway) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load model catalog: " + std::string(e.what()));
  }

  Load(root, gateway);
  LINKSYNC_LOG_INFO("Model catalog loaded", {obs::StringField("path", path), obs::IntField("models", static_cast<std::int64_t>(gateway.ModelCount()))});
}

void CatalogLoader::Load(const YAML::Node& root, MemoryGateway& gateway) {
  const auto models = root["models"];
  if (!models || !models.IsSequence()) {
    throw std::runtime_error("catalog: top-level 'models' list is required");
  }

  // models first so links can take their names from the catalog
  std::vector<ModelIdentity> identities;
  identities.reserve(models.size());
  for (std::size_t i = 0; i < models.size(); ++i) {
    const auto  node  = models[i];
    const auto  where = "models[" + std::to_string(i) + "]";
    try {
      auto id = ParseIdentity(node, where, nullptr);

      std::vector<std::string> worksets;
      if (const auto list = node["worksets"]) {
        worksets = list.as<std::vector<std::string>>();
      }

      const auto name = node["name"] ? node["name"].Scalar() : id.ShortName();
      gateway.AddModel(id, name, std::move(worksets));
      identities.push_back(std::move(id));
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error("catalog: " + where + ": " + e.what());
    } catch (const YAML::Exception& e) {
      throw std::runtime_error("catalog: " + where + ": " + e.what());
    }
  }

  for (std::size_t i = 0; i < models.size(); ++i) {
    const auto  node   = models[i];
    const auto  where  = "models[" + std::to_string(i) + "]";
    const auto& parent = identities[i];
    const auto  region = parent.region();

    try {
      if (const auto links = node["links"]) {
        for (std::size_t j = 0; j < links.size(); ++j) {
          const auto link = links[j];
          auto child = ParseIdentity(link, where + ".links[" + std::to_string(j) + "]", &region);
          gateway.AddLink(parent, child, link["name"] ? link["name"].Scalar() : std::string());
        }
      }

      if (const auto unresolved = node["unresolved_links"]) {
        for (const auto& description : unresolved.as<std::vector<std::string>>()) {
          gateway.AddUnresolvedLink(parent, description);
        }
      }

      if (const auto faults = node["faults"]) {
        for (std::size_t j = 0; j < faults.size(); ++j) {
          const auto fault      = faults[j];
          const auto fault_at   = where + ".faults[" + std::to_string(j) + "]";
          const auto operation  = ParseOperation(Required(fault, "operation", fault_at));
          const auto kind       = ParseErrorKind(Required(fault, "error", fault_at));
          const auto times      = fault["times"] ? fault["times"].as<std::uint32_t>() : 0U;
          const auto message    = fault["message"] ? fault["message"].Scalar() : std::string();
          gateway.InjectFault(parent, operation, kind, times, message);
        }
      }
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error("catalog: " + where + ": " + e.what());
    } catch (const YAML::Exception& e) {
      throw std::runtime_error("catalog: " + where + ": " + e.what());
    }
  }
}

} // namespace linksync::gateway::memory
