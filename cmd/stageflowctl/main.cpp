#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/template_loader.hpp"
#include "internal/state/run_state_util.hpp"
#include "internal/events/event_types.hpp"
#include "stageflow/v1.hpp"

using namespace stageflow::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  stageflowctl <config.yaml> runs\n"
            << "  stageflowctl <config.yaml> events <run_id> [from] [to]\n"
            << "  stageflowctl <config.yaml> state <run_id>\n"
            << "  stageflowctl <config.yaml> state-at <run_id> <sequence>\n"
            << "  stageflowctl <config.yaml> branch <run_id> <sequence>\n"
            << "  stageflowctl <config.yaml> templates\n"
            << "  stageflowctl <config.yaml> register <template.yaml>\n"
            << "  stageflowctl <config.yaml> cache invalidate <key>\n"
            << "  stageflowctl <config.yaml> cache invalidate-scope <scope>\n"
            << "  stageflowctl <config.yaml> cache purge\n"
            << "  stageflowctl <config.yaml> cache stats\n";
}

static int PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "cannot print " << message.GetTypeName() << ": " << status.ToString() << "\n";
    return 1;
  }
  std::cout << json << "\n";
  return 0;
}

static uint64_t ParseSequence(const char* arg) {
  try {
    return std::stoull(arg);
  } catch (const std::exception&) {
    std::cerr << "invalid sequence: " << arg << "\n";
    std::exit(1);
  }
}

static int Dispatch(stageflow::factory::Application& app, int argc, char** argv) {
  const std::string cmd = argv[2];

  if (cmd == "runs") {
    const auto listed = app.orchestrator->ListRuns(ListRunsRequest{});
    for (const auto& run : listed.runs()) {
      std::cout << run.run_id() << "  " << stageflow::state::RunStatusName(run.status()) << "  " << run.template_id() << "@"
                << run.template_version();
      if (!run.parent_run_id().empty()) std::cout << "  branch of " << run.parent_run_id() << "@" << run.branch_sequence();
      std::cout << "\n";
    }
    return 0;
  }

  if (cmd == "events") {
    if (argc < 4) return 1;
    ReadEventsRequest req;
    req.set_run_id(argv[3]);
    if (argc >= 5) req.set_from_sequence(ParseSequence(argv[4]));
    if (argc >= 6) req.set_to_sequence(ParseSequence(argv[5]));
    const auto read = app.orchestrator->ReadEvents(req);
    for (const auto& event : read.events()) {
      std::cout << event.sequence() << "  " << stageflow::events::PayloadName(event) << "\n";
    }
    return 0;
  }

  if (cmd == "state") {
    if (argc < 4) return 1;
    GetRunStateRequest req;
    req.set_run_id(argv[3]);
    return PrintJson(app.orchestrator->GetRunState(req));
  }

  if (cmd == "state-at") {
    if (argc < 5) return 1;
    GetRunStateAtRequest req;
    req.set_run_id(argv[3]);
    req.set_sequence(ParseSequence(argv[4]));
    return PrintJson(app.orchestrator->GetRunStateAt(req));
  }

  if (cmd == "branch") {
    if (argc < 5) return 1;
    BranchRunRequest req;
    req.set_run_id(argv[3]);
    req.set_sequence(ParseSequence(argv[4]));
    // The branch is left resumable; `stageflow recover` drives it.
    std::cout << app.orchestrator->BranchRun(req).run_id() << "\n";
    return 0;
  }

  if (cmd == "templates") {
    const auto listed = app.catalog->ListTemplates(ListTemplatesRequest{});
    for (const auto& ref : listed.templates()) {
      std::cout << ref.template_id() << "@" << ref.version() << "\n";
    }
    return 0;
  }

  if (cmd == "register") {
    if (argc < 4) return 1;
    RegisterTemplateRequest req;
    *req.mutable_pipeline() = stageflow::pipeline::TemplateLoader::LoadFromYaml(argv[3]);
    const auto resp         = app.catalog->RegisterTemplate(req);
    std::cout << resp.template_id() << "@" << resp.version() << " " << resp.digest() << "\n";
    return 0;
  }

  if (cmd == "cache") {
    if (argc < 4) return 1;
    const std::string sub = argv[3];

    if (sub == "invalidate" && argc >= 5) {
      InvalidateCacheRequest req;
      req.set_key(argv[4]);
      app.admin->InvalidateCache(req);
      return 0;
    }
    if (sub == "invalidate-scope" && argc >= 5) {
      InvalidateCacheRequest req;
      req.set_isolation_scope(argv[4]);
      app.admin->InvalidateCache(req);
      return 0;
    }
    if (sub == "purge") {
      const auto purged = app.admin->PurgeExpiredCache(PurgeExpiredCacheRequest{});
      std::cout << "removed memory=" << purged.memory_removed() << " persistent=" << purged.persistent_removed() << "\n";
      return 0;
    }
    if (sub == "stats") {
      return PrintJson(app.admin->CacheStats(CacheStatsRequest{}));
    }
    return 1;
  }

  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  try {
    auto config = stageflow::config::ConfigLoader::LoadFromYaml(argv[1]);
    stageflow::observability::InitializeLogging(config);

    auto app = stageflow::factory::Build(config);
    const int rc = Dispatch(app, argc, argv);
    if (rc == 1) Usage();

    app.Shutdown();
    stageflow::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    stageflow::observability::ShutdownLogging();
    return 2;
  }
}
