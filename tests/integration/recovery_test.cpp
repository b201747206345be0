#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/generation/mock_generation_client.hpp"
#include "internal/pipeline/template_loader.hpp"
#include "internal/state/run_state_util.hpp"
#include "stageflow/v1.hpp"

namespace {

using namespace std::chrono_literals;
using namespace stageflow::v1;

using stageflow::state::FindStage;

constexpr const char* kEssay = R"(metadata:
  id: essay
  version: "1"
steps:
  quick:
    prompt_template: "Quick note"
  slow:
    prompt_template: "Slow essay"
  after:
    prompt_template: "After {{steps.slow}}"
    depends_on: slow
)";

constexpr const char* kNote = R"(metadata:
  id: note
  version: "1"
steps:
  only:
    prompt_template: "Remember the milk"
)";

stageflow::runtime::config::RuntimeConfig SqliteConfig(const std::string& path) {
  auto config  = stageflow::config::ConfigLoader::Defaults();
  auto* sqlite = config.mutable_database()->mutable_sqlite();
  sqlite->set_path(path);
  sqlite->set_wal_mode(true);
  config.mutable_orchestrator()->mutable_default_retry()->set_initial_backoff_ms(1);
  config.mutable_cache()->set_persistent_enabled(true);
  return config;
}

std::string Register(stageflow::factory::Application& app, const char* yaml) {
  RegisterTemplateRequest req;
  *req.mutable_pipeline() = stageflow::pipeline::TemplateLoader::ParseYaml(yaml);
  return app.catalog->RegisterTemplate(req).template_id();
}

std::string Start(stageflow::factory::Application& app, const std::string& template_id) {
  StartRunRequest req;
  req.set_template_id(template_id);
  return app.orchestrator->StartRun(req).run_id();
}

RunState State(stageflow::factory::Application& app, const std::string& run_id) {
  GetRunStateRequest req;
  req.set_run_id(run_id);
  return app.orchestrator->GetRunState(req);
}

bool Eventually(const std::function<bool()>& predicate) {
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(5ms);
  }
  return predicate();
}

void TestRecoveryAfterRestart(const std::string& path) {
  std::string interrupted_run;
  std::string finished_run;
  uint64_t    durable_sequence = 0;

  {
    auto client = std::make_shared<stageflow::generation::MockGenerationClient>();
    client->HoldUntilCancelled("Slow essay");
    auto app = stageflow::factory::Build(SqliteConfig(path), client);

    Register(app, kEssay);
    Register(app, kNote);

    finished_run = Start(app, "note");
    assert(app.orchestrator->WaitForRun(finished_run, 10s).status() == RUN_STATUS_COMPLETED);

    interrupted_run = Start(app, "essay");
    assert(Eventually([&] {
      const auto state = State(app, interrupted_run);
      return FindStage(state, "quick")->status() == STAGE_STATUS_COMPLETED && client->Active() == 1;
    }));

    app.Shutdown();

    const auto stopped = State(app, interrupted_run);
    assert(stopped.status() == RUN_STATUS_RUNNING);
    assert(FindStage(stopped, "slow")->status() == STAGE_STATUS_RUNNING);
    durable_sequence = stopped.sequence();

    // A crash mid-append leaves an unreadable record behind.
    stageflow::db::model::EventRecord torn;
    torn.run_id         = interrupted_run;
    torn.sequence       = durable_sequence + 1;
    torn.event_type     = "stage_completed";
    torn.payload        = "not-a-protobuf";
    torn.recorded_at_ms = 1;
    auto tx             = app.repository->Begin();
    assert(app.repository->AppendEvent(*tx, torn));
    tx->Commit();
  }

  auto client = std::make_shared<stageflow::generation::MockGenerationClient>();
  client->Track("Remember the milk");
  client->Track("Quick note");
  auto app = stageflow::factory::Build(SqliteConfig(path), client);

  // Templates come back from the database.
  assert(app.catalog->ListTemplates(ListTemplatesRequest{}).templates_size() == 2);

  const auto before = State(app, interrupted_run);
  assert(before.sequence() == durable_sequence);

  const auto recovered = app.orchestrator->RecoverRuns();
  assert(recovered.run_ids_size() == 1);
  assert(recovered.run_ids(0) == interrupted_run);

  const auto state = app.orchestrator->WaitForRun(interrupted_run, 10s);
  assert(state.status() == RUN_STATUS_COMPLETED);
  assert(FindStage(state, "quick")->attempt() == 1);
  assert(FindStage(state, "slow")->attempt() == 2);
  assert(FindStage(state, "after")->status() == STAGE_STATUS_COMPLETED);
  assert(client->CallsFor("Quick note") == 0);

  ReadEventsRequest read;
  read.set_run_id(interrupted_run);
  const auto events = app.orchestrator->ReadEvents(read);
  bool       retried = false;
  for (int i = 0; i < events.events_size(); ++i) {
    const auto& event = events.events(i);
    assert(event.sequence() == static_cast<uint64_t>(i + 1));
    if (event.has_stage_retried() && event.stage_retried().stage_id() == "slow") {
      assert(event.stage_retried().error() == "interrupted");
      assert(event.sequence() == durable_sequence + 1);
      retried = true;
    }
  }
  assert(retried);

  // The persistent cache tier survived the restart.
  const auto again = app.orchestrator->WaitForRun(Start(app, "note"), 10s);
  assert(again.status() == RUN_STATUS_COMPLETED);
  assert(FindStage(again, "only")->source() == COMPLETION_SOURCE_CACHE);
  assert(client->CallsFor("Remember the milk") == 0);

  assert(State(app, finished_run).status() == RUN_STATUS_COMPLETED);

  app.Shutdown();
}

} // namespace

int main() {
#if STAGEFLOW_DB_SQLITE
  const auto path =
      (std::filesystem::temp_directory_path() /
       ("stageflow_recovery_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) + ".db"))
          .string();

  TestRecoveryAfterRestart(path);

  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
#else
  std::cout << "skipping recovery suite: sqlite backend not enabled\n";
#endif

  std::cout << "stageflow_integration_recovery: pass\n";
  return 0;
}
