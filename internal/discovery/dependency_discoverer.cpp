#include "internal/discovery/dependency_discoverer.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <thread>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace linksync::discovery {

namespace obs = linksync::observability;

using model::ModelIdentity;

struct DependencyDiscoverer::Inspection {
  std::optional<gateway::LinkScan> scan;
  model::ErrorKind                 error{model::ErrorKind::kInternal};
  std::string                      error_message;
  std::exception_ptr               outage;
};

DependencyDiscoverer::DependencyDiscoverer(gateway::CloudDocumentGatewayPtr gateway, std::shared_ptr<ledger::ResourceLedger> ledger,
                                           std::shared_ptr<events::EventChannel> events, DiscoveryOptions options)
    : gateway_(std::move(gateway)), ledger_(std::move(ledger)), events_(std::move(events)), options_(options) {
  if (options_.max_concurrent_opens == 0) {
    options_.max_concurrent_opens = 1;
  }
}

DependencyDiscoverer::Inspection DependencyDiscoverer::Inspect(const ModelIdentity& id, const std::optional<gateway::DocumentHandle>& open_handle) {
  Inspection result;

  if (open_handle) {
    try {
      result.scan = gateway_->ReadDirectLinks(*open_handle);
    } catch (const util::GatewayUnavailable&) {
      result.outage = std::current_exception();
    } catch (const std::exception& e) {
      result.error         = model::Classify(e);
      result.error_message = e.what();
    }
    return result;
  }

  for (std::uint32_t attempt = 1;; ++attempt) {
    try {
      auto handle = gateway_->OpenDetached(id);
      obs::Metrics::Instance().RecordModelOpen("detached", true);

      ledger::ScopedDocument document(*ledger_, std::move(handle));
      result.scan = gateway_->ReadDirectLinks(document.handle());
      return result;
    } catch (const util::GatewayUnavailable&) {
      result.outage = std::current_exception();
      return result;
    } catch (const std::exception& e) {
      obs::Metrics::Instance().RecordModelOpen("detached", false);
      result.error         = model::Classify(e);
      result.error_message = e.what();

      if (!options_.retry.ShouldRetry(result.error, attempt)) {
        return result;
      }

      const auto wait = options_.retry.BackoffFor(attempt);
      LINKSYNC_LOG_WARN("Retrying detached open",
                        {obs::StringField("model", id.ToString()), obs::StringField("error", model::ToString(result.error)),
                         obs::IntField("attempt", attempt), obs::IntField("backoff_ms", wait.count())});
      obs::Metrics::Instance().RecordRetry("discover");
      std::this_thread::sleep_for(wait);
    }
  }
}

void DependencyDiscoverer::Merge(graph::DependencyGraph& graph, const ModelIdentity& id, Inspection& inspection,
                                 std::vector<ModelIdentity>& next) {
  if (!inspection.scan) {
    graph.MarkFailed(id, inspection.error, inspection.error_message);
    events_->PublishProgress(id, "Failed: " + std::string(model::ToString(inspection.error)) + " " + inspection.error_message);
    LINKSYNC_LOG_WARN("Model could not be inspected",
                      {obs::StringField("model", id.ToString()), obs::StringField("error", model::ToString(inspection.error)),
                       obs::StringField("detail", inspection.error_message)});
    return;
  }

  auto& scan = *inspection.scan;

  std::vector<ModelIdentity> children;
  children.reserve(scan.links.size());
  for (auto& link : scan.links) {
    children.push_back(link.identity);
    if (graph.Insert(link.identity, link.name)) {
      next.push_back(link.identity);
    }
  }

  for (const auto& skipped : scan.skipped) {
    events_->PublishProgress(id, "Skipped link: " + skipped);
  }

  graph.RecordLinks(id, children, std::move(scan.skipped));
  graph.MarkDiscovered(id);
  events_->PublishProgress(id, "Scanned " + std::to_string(graph.Node(id).children.size()) + " links");
}

DiscoveryResult DependencyDiscoverer::Discover(const ModelIdentity& root, const std::string& root_name,
                                               const std::optional<gateway::DocumentHandle>& root_handle,
                                               const util::CancellationToken*                cancel) {
  obs::SpanScope span("linksync.discover");
  span.SetAttribute("linksync.root", root.ToString());

  DiscoveryResult result{graph::DependencyGraph(root, root_name), false};
  auto&           graph = result.graph;

  LINKSYNC_LOG_INFO("Discovery started", {obs::StringField("root", root.ToString()), obs::IntField("concurrency", options_.max_concurrent_opens)});

  std::vector<ModelIdentity> frontier{root};
  while (!frontier.empty()) {
    std::vector<ModelIdentity> next;

    for (std::size_t begin = 0; begin < frontier.size(); begin += options_.max_concurrent_opens) {
      if (cancel && cancel->IsCancelled()) {
        result.cancelled = true;
        break;
      }

      const std::size_t end = std::min<std::size_t>(frontier.size(), begin + options_.max_concurrent_opens);

      std::vector<std::future<Inspection>> inflight;
      inflight.reserve(end - begin);
      for (std::size_t i = begin; i < end; ++i) {
        const auto& id = frontier[i];
        graph.MarkDiscovering(id);
        events_->PublishProgress(id, "Scanning " + graph.Node(id).name);

        std::optional<gateway::DocumentHandle> open_handle;
        if (id == root && root_handle) {
          open_handle = root_handle;
        }
        inflight.push_back(std::async(std::launch::async, [this, id, open_handle] { return Inspect(id, open_handle); }));
      }

      std::vector<Inspection> inspections;
      inspections.reserve(inflight.size());
      for (auto& future : inflight) {
        inspections.push_back(future.get());
      }

      for (auto& inspection : inspections) {
        if (inspection.outage) {
          ledger_->Drain();
          span.RecordException("gateway unavailable");
          LINKSYNC_LOG_ERROR("Discovery aborted: gateway unavailable", {obs::StringField("root", root.ToString())});
          std::rethrow_exception(inspection.outage);
        }
      }

      for (std::size_t i = begin; i < end; ++i) {
        Merge(graph, frontier[i], inspections[i - begin], next);
      }
    }

    if (result.cancelled) {
      LINKSYNC_LOG_WARN("Discovery cancelled", {obs::IntField("known_models", static_cast<std::int64_t>(graph.Size()))});
      break;
    }

    frontier = std::move(next);
  }

  span.SetAttribute("linksync.models", static_cast<std::int64_t>(graph.Size()));
  LINKSYNC_LOG_INFO("Discovery finished", {obs::IntField("models", static_cast<std::int64_t>(graph.Size())), obs::BoolField("cancelled", result.cancelled)});
  return result;
}

} // namespace linksync::discovery
