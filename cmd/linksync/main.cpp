#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/planning/sync_plan.hpp"
#include "internal/planning/topological_sorter.hpp"
#include "internal/report/run_report.hpp"
#include "internal/util/errors.hpp"

namespace obs = linksync::observability;

using linksync::model::ModelIdentity;

namespace {

constexpr int kExitOk      = 0;
constexpr int kExitUsage   = 1;
constexpr int kExitFatal   = 2;
constexpr int kExitCycle   = 3;
constexpr int kExitPartial = 4;

linksync::util::CancellationToken g_cancel;

void HandleSignal(int) {
  g_cancel.Cancel();
}

void Usage() {
  std::cout << "Usage:\n"
            << "  linksync --config <cfg.yaml> discover <REGION> <project> <model> [--name N] [--json]\n"
            << "  linksync --config <cfg.yaml> plan     <REGION> <project> <model> [--name N] [--select p:m,...]\n"
            << "  linksync --config <cfg.yaml> sync     <REGION> <project> <model> [--name N] [--select p:m,...] [--json]\n"
            << "  linksync id <name> <REGION> <project> <model>\n";
}

struct CommandLine {
  std::string                config_path;
  std::string                command;
  std::vector<std::string>   positional;
  std::string                name;
  std::optional<std::string> select;
  bool                       json{false};
};

// Returns nullopt on malformed arguments.
std::optional<CommandLine> Parse(int argc, char** argv) {
  CommandLine cl;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto              value = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) return std::nullopt;
      return std::string(argv[++i]);
    };

    if (arg == "--config") {
      auto v = value();
      if (!v) return std::nullopt;
      cl.config_path = *v;
    } else if (arg == "--name") {
      auto v = value();
      if (!v) return std::nullopt;
      cl.name = *v;
    } else if (arg == "--select") {
      cl.select = value();
      if (!cl.select) return std::nullopt;
    } else if (arg == "--json") {
      cl.json = true;
    } else if (cl.command.empty()) {
      cl.command = arg;
    } else {
      cl.positional.push_back(arg);
    }
  }
  return cl;
}

// "project:model,project:model" within the root's region.
std::vector<ModelIdentity> ParseSelection(const std::string& text, linksync::model::Region region) {
  std::vector<ModelIdentity> selection;
  std::stringstream          in(text);
  std::string                item;
  while (std::getline(in, item, ',')) {
    if (item.empty()) continue;
    const auto colon = item.find(':');
    if (colon == std::string::npos) {
      throw linksync::util::InvalidSelection("selection entry must be project:model, got '" + item + "'");
    }
    selection.emplace_back(region, item.substr(0, colon), item.substr(colon + 1));
  }
  return selection;
}

// Prints run events to stderr while a command is running.
class ProgressPrinter {
 public:
  explicit ProgressPrinter(std::shared_ptr<linksync::events::EventChannel> events) : events_(std::move(events)) {
    thread_ = std::thread([this] {
      while (true) {
        auto event = events_->WaitNext(std::chrono::milliseconds(200));
        if (event) {
          std::cerr << linksync::events::Describe(*event) << "\n";
        } else if (events_->Closed()) {
          break;
        }
      }
    });
  }

  ~ProgressPrinter() {
    events_->Close();
    if (thread_.joinable()) thread_.join();
  }

 private:
  std::shared_ptr<linksync::events::EventChannel> events_;
  std::thread                                     thread_;
};

int RunIdentity(const CommandLine& cl) {
  if (cl.positional.size() != 4) {
    Usage();
    return kExitUsage;
  }
  const ModelIdentity id(linksync::model::ParseRegion(cl.positional[1]), cl.positional[2], cl.positional[3]);
  std::cout << linksync::model::FormatIdentityRecord(cl.positional[0], id) << "\n";
  return kExitOk;
}

int RunEngineCommand(const CommandLine& cl) {
  if (cl.config_path.empty() || cl.positional.size() != 3) {
    Usage();
    return kExitUsage;
  }

  auto config = linksync::config::ConfigLoader::LoadFromYaml(cl.config_path);

  obs::InitializeTracing(config);
  obs::InitializeMetrics(config);
  obs::InitializeLogging(config);

  const ModelIdentity root(linksync::model::ParseRegion(cl.positional[0]), cl.positional[1], cl.positional[2]);

  auto app = linksync::factory::Build(config);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  // --json has no progress consumer; a closed channel only keeps history
  std::optional<ProgressPrinter> progress;
  if (cl.json) {
    app.events->Close();
  } else {
    progress.emplace(app.events);
  }

  const auto root_name = cl.name.empty() ? app.gateway->NameOf(root) : cl.name;
  auto       found     = app.discoverer->Discover(root, root_name.empty() ? root.ShortName() : root_name, std::nullopt, &g_cancel);
  if (found.cancelled) {
    progress.reset();
    std::cerr << "Discovery cancelled after " << found.graph.Size() << " models\n";
    return kExitPartial;
  }

  std::vector<ModelIdentity> order;
  try {
    order = linksync::planning::TopologicalSorter::Sort(found.graph);
  } catch (const linksync::util::CycleDetected& e) {
    progress.reset();
    if (cl.json) {
      std::cout << linksync::report::ToJson(linksync::report::BuildDiscoveryReport(found.graph, false, {}, e.Members()));
    } else {
      std::cout << linksync::report::FormatDiscoverySummary(found.graph, {}, e.Members());
    }
    return kExitCycle;
  }

  if (cl.command == "discover") {
    progress.reset();
    if (cl.json) {
      std::cout << linksync::report::ToJson(linksync::report::BuildDiscoveryReport(found.graph, false, order, {}));
    } else {
      std::cout << linksync::report::FormatDiscoverySummary(found.graph, order, {});
    }
    return kExitOk;
  }

  const auto selection = cl.select ? ParseSelection(*cl.select, root.region()) : order;
  const auto plan      = linksync::planning::BuildPlan(found.graph, order, selection);

  if (cl.command == "plan") {
    progress.reset();
    std::cout << "Sync plan (" << plan.ExplicitCount() << " selected, " << plan.ImplicitCount() << " included)\n";
    for (std::size_t i = 0; i < plan.entries.size(); ++i) {
      const auto& entry = plan.entries[i];
      std::cout << "  " << (i + 1) << ". " << entry.name << "  " << entry.identity.ToString();
      if (entry.implicit) std::cout << "  [implicit]";
      if (entry.discovery_error) std::cout << "  [unreadable: " << linksync::model::ToString(*entry.discovery_error) << "]";
      std::cout << "\n";
    }
    return kExitOk;
  }

  auto result = app.orchestrator->Run(plan, app.run_options, &g_cancel);
  progress.reset();

  if (cl.json) {
    std::cout << linksync::report::ToJson(linksync::report::BuildSyncReport(result));
  } else {
    std::cout << linksync::report::FormatSyncSummary(result);
  }
  return result.Clean() ? kExitOk : kExitPartial;
}

void ShutdownObservability() {
  obs::ShutdownLogging();
  obs::ShutdownMetrics();
  obs::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  auto cl = Parse(argc, argv);
  if (!cl || cl->command.empty()) {
    Usage();
    return kExitUsage;
  }

  try {
    if (cl->command == "id") {
      return RunIdentity(*cl);
    }
    if (cl->command != "discover" && cl->command != "plan" && cl->command != "sync") {
      Usage();
      return kExitUsage;
    }

    const int code = RunEngineCommand(*cl);
    ShutdownObservability();
    return code;
  } catch (const linksync::util::InvalidSelection& e) {
    std::cerr << "invalid selection: " << e.what() << "\n";
    ShutdownObservability();
    return kExitUsage;
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    Usage();
    ShutdownObservability();
    return kExitUsage;
  } catch (const std::exception& e) {
    LINKSYNC_LOG_ERROR("Fatal error", {obs::StringField("error", e.what())});
    ShutdownObservability();
    return kExitFatal;
  }
}
