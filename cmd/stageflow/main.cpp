#include <chrono>
#include <csignal>
#include <iostream>
#include <set>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/pipeline/template_loader.hpp"
#include "internal/state/run_state_util.hpp"
#include "internal/util/errors.hpp"
#include "stageflow/v1.hpp"

using namespace stageflow::v1;
using stageflow::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage:\n"
            << "  stageflow --config <config.yaml> run <template.yaml> [key=value ...]\n"
            << "  stageflow --config <config.yaml> recover\n";
}

static void ShutdownObservability() {
  stageflow::observability::ShutdownLogging();
  stageflow::observability::ShutdownMetrics();
  stageflow::observability::ShutdownTracing();
}

// Asks on the terminal until the run accepts a selection.
static void PromptForFeedback(stageflow::factory::Application& app, const std::string& run_id, const std::string& stage_id,
                              const google::protobuf::RepeatedPtrField<std::string>& candidates) {
  std::cout << "\n[" << stage_id << "] waiting for your input\n";
  for (int i = 0; i < candidates.size(); ++i) {
    std::cout << "  " << (i + 1) << ") " << candidates.Get(i) << "\n";
  }

  std::string line;
  while (g_running) {
    std::cout << "> " << std::flush;
    if (!std::getline(std::cin, line)) {
      g_running = 0;
      return;
    }

    SupplyFeedbackRequest req;
    req.set_run_id(run_id);
    req.set_stage_id(stage_id);
    req.set_selection(line);
    try {
      app.orchestrator->SupplyFeedback(req);
      return;
    } catch (const stageflow::util::ValidationError& e) {
      std::cout << "not accepted: " << e.what() << "\n";
    }
  }
}

static int RunTemplate(stageflow::factory::Application& app, const std::string& template_path, int argc, char** argv, int first_input) {
  RegisterTemplateRequest register_req;
  *register_req.mutable_pipeline() = stageflow::pipeline::TemplateLoader::LoadFromYaml(template_path);
  const auto registered            = app.catalog->RegisterTemplate(register_req);

  StartRunRequest start_req;
  start_req.set_template_id(registered.template_id());
  start_req.set_template_version(registered.version());
  for (int i = first_input; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        eq  = arg.find('=');
    if (eq == std::string::npos) {
      std::cerr << "expected key=value, got '" << arg << "'\n";
      return 1;
    }
    (*start_req.mutable_inputs())[arg.substr(0, eq)] = arg.substr(eq + 1);
  }

  const auto run_id       = app.orchestrator->StartRun(start_req).run_id();
  auto       subscription = app.orchestrator->Subscribe(run_id);
  std::cout << "run " << run_id << "\n";

  std::set<std::string> prompted;
  GetRunStateRequest    state_req;
  state_req.set_run_id(run_id);

  // Stages that began waiting before the subscription existed.
  const auto current = app.orchestrator->GetRunState(state_req);
  for (const auto& stage : current.stages()) {
    if (stage.awaiting_feedback() && prompted.insert(stage.stage_id()).second) {
      PromptForFeedback(app, run_id, stage.stage_id(), stage.candidates());
    }
  }

  bool cancelled = false;
  while (!subscription->Closed()) {
    if (!g_running && !cancelled) {
      CancelRunRequest cancel_req;
      cancel_req.set_run_id(run_id);
      cancel_req.set_reason("interrupted");
      app.orchestrator->CancelRun(cancel_req);
      cancelled = true;
    }

    auto update = subscription->Next(std::chrono::milliseconds(500));
    if (!update) continue;

    if (update->has_chunk()) {
      std::cout << update->chunk().text() << std::flush;
      continue;
    }

    const auto& event = update->event();
    if (event.has_stage_started()) {
      std::cout << "\n== " << event.stage_started().stage_id() << " (attempt " << event.stage_started().attempt() << ")\n";
    } else if (event.has_stage_completed() && event.stage_completed().source() != COMPLETION_SOURCE_FRESH) {
      std::cout << event.stage_completed().output() << "\n";
    } else if (event.has_stage_retried()) {
      std::cout << "\n!! " << event.stage_retried().stage_id() << ": " << event.stage_retried().error() << ", retrying\n";
    } else if (event.has_stage_failed()) {
      std::cout << "\n!! " << event.stage_failed().stage_id() << " failed: " << event.stage_failed().error() << "\n";
    } else if (event.has_stage_awaiting_feedback()) {
      const auto& awaiting = event.stage_awaiting_feedback();
      if (prompted.insert(awaiting.stage_id()).second) PromptForFeedback(app, run_id, awaiting.stage_id(), awaiting.candidates());
    }
  }

  const auto state = app.orchestrator->WaitForRun(run_id, std::chrono::seconds(30));
  std::cout << "\nrun " << run_id << " " << stageflow::state::RunStatusName(state.status());
  if (!state.failure_reason().empty()) std::cout << ": " << state.failure_reason();
  std::cout << "\n";
  const auto tokens = stageflow::state::TotalTokens(state);
  std::cout << "tokens prompt=" << tokens.prompt_tokens() << " completion=" << tokens.completion_tokens() << "\n";
  for (const auto& [model, usage] : state.tokens_by_model()) {
    std::cout << "  " << model << " prompt=" << usage.prompt_tokens() << " completion=" << usage.completion_tokens() << "\n";
  }
  return state.status() == RUN_STATUS_COMPLETED ? 0 : 3;
}

static int Recover(stageflow::factory::Application& app) {
  const auto recovered = app.orchestrator->RecoverRuns();
  std::cout << "recovered " << recovered.run_ids_size() << " run(s)\n";

  for (const auto& run_id : recovered.run_ids()) {
    while (g_running) {
      const auto state = app.orchestrator->WaitForRun(run_id, std::chrono::seconds(1));
      if (stageflow::state::IsTerminal(state.status())) {
        std::cout << run_id << " " << stageflow::state::RunStatusName(state.status()) << "\n";
        break;
      }
    }
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }
  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = stageflow::config::ConfigLoader::LoadFromYaml(config_path);

    stageflow::observability::InitializeTracing(config);
    stageflow::observability::InitializeMetrics(config);
    stageflow::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = stageflow::factory::Build(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    int rc = 1;
    if (cmd == "run" && argc >= 5) {
      rc = RunTemplate(app, argv[4], argc, argv, 5);
    } else if (cmd == "recover") {
      rc = Recover(app);
    } else {
      Usage();
    }

    STAGEFLOW_LOG_INFO("Shutting down stageflow");
    app.Shutdown();
    ShutdownObservability();
    return rc;
  } catch (const std::exception& e) {
    STAGEFLOW_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }
}
