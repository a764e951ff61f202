// EN: Unit tests for PipelineEngine (registry, event dispatch, superseding pushes, chaining, history)
// FR: Tests unitaires pour PipelineEngine (registre, dispatch d'événements, pushs remplacés, chaînage, historique)

#include <gtest/gtest.h>
#include "orchestrator/pipeline_engine.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>

using namespace CDO;
using namespace CDO::Orchestrator;
using namespace std::chrono_literals;

namespace {

// EN: Jobs wait until the gate opens or they are cancelled. Build jobs emit one artifact.
// FR: Les jobs attendent l'ouverture de la porte ou leur annulation. Les builds émettent un artefact.
class GatedExecutor : public JobExecutor {
public:
    explicit GatedExecutor(bool open = true) : open_(open) {}

    JobOutcome execute(const JobRequest& request, const CancellationToken& cancellation) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            started_runs_.push_back(request.run_id);
        }
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!open_.load() && !cancellation.isCancelled() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(2ms);
        }
        if (cancellation.isCancelled()) {
            return JobOutcome::cancelled();
        }
        if (request.template_name == fail_template_) {
            return JobOutcome::failed(1, "step 1 exited with code 1", 0);
        }
        if (request.template_name == "build") {
            return JobOutcome::succeeded({Artifact{"dist/app.tar.gz", "binary", ""}});
        }
        return JobOutcome::succeeded();
    }

    void open() { open_.store(true); }
    void failTemplate(const std::string& name) { fail_template_ = name; }

    size_t startedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return started_runs_.size();
    }

    bool waitForStarted(size_t count) const {
        const auto deadline = std::chrono::steady_clock::now() + 5s;
        while (startedCount() < count) {
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(2ms);
        }
        return true;
    }

private:
    std::atomic<bool> open_;
    std::string fail_template_;
    mutable std::mutex mutex_;
    std::vector<std::string> started_runs_;
};

JobTemplate job(const std::string& name, std::vector<std::string> needs = {}) {
    JobTemplate job;
    job.name = name;
    job.needs = std::move(needs);
    job.steps.push_back(JobStep{"", "make " + name, "", {}});
    return job;
}

PipelineDefinition ciPipeline() {
    PipelineDefinition definition;
    definition.name = "ci";
    definition.triggers = {TriggerRule{EventKind::PUSH, {"main"}, {}}, TriggerRule{EventKind::TAG, {"v*"}, {}}};
    definition.jobs = {job("build"), job("test", {"build"})};
    return definition;
}

PipelineDefinition releasePipeline() {
    PipelineDefinition definition;
    definition.name = "create-release";
    definition.triggers = {TriggerRule{EventKind::WORKFLOW_COMPLETION, {"main"}, {"ci"}}};
    definition.jobs = {job("announce")};
    return definition;
}

} // namespace

class PipelineEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setConsoleOutput(false);
        config_.thread_pool_size = 8;
        config_.poll_interval = 5ms;
    }

    std::unique_ptr<PipelineEngine> makeEngine(std::shared_ptr<ReleaseEndpoint> endpoint = nullptr) {
        return std::make_unique<PipelineEngine>(config_, executor_, std::move(endpoint));
    }

    PipelineEngine::Config config_;
    std::shared_ptr<GatedExecutor> executor_ = std::make_shared<GatedExecutor>();
};

TEST_F(PipelineEngineTest, RegistryOperations) {
    auto engine = makeEngine();
    engine->registerPipeline(ciPipeline());
    engine->registerPipeline(releasePipeline());

    auto names = engine->getPipelineNames();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_EQ(names[0], "ci");
    EXPECT_EQ(names[1], "create-release");

    auto replacement = ciPipeline();
    replacement.jobs.push_back(job("lint"));
    engine->registerPipeline(replacement);
    EXPECT_EQ(engine->getPipeline("ci")->jobs.size(), 3u);

    EXPECT_TRUE(engine->unregisterPipeline("create-release"));
    EXPECT_FALSE(engine->unregisterPipeline("create-release"));
    EXPECT_FALSE(engine->getPipeline("create-release").has_value());
}

TEST_F(PipelineEngineTest, RejectsInvalidDefinitions) {
    auto engine = makeEngine();
    auto broken = ciPipeline();
    broken.jobs.push_back(job("deploy", {"missing"}));

    EXPECT_THROW(engine->registerPipeline(broken), PipelineDefinitionError);
    EXPECT_TRUE(engine->getPipelineNames().empty());
}

TEST_F(PipelineEngineTest, LoadsPipelineFiles) {
    const auto path = std::filesystem::temp_directory_path() / "cdo_engine_nightly.yml";
    {
        std::ofstream file(path);
        file << "name: nightly\non:\n  push:\n    branches: [main]\njobs:\n  build:\n    steps: [make]\n";
    }
    auto engine = makeEngine();
    EXPECT_EQ(engine->loadPipelineFile(path.string()), "nightly");
    EXPECT_TRUE(engine->getPipeline("nightly").has_value());
    std::filesystem::remove(path);
}

TEST_F(PipelineEngineTest, ExecuteEventRunsMatchingPipeline) {
    auto engine = makeEngine();
    engine->registerPipeline(ciPipeline());

    auto runs = engine->executeEvent(PushEvent{"refs/heads/main"});
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].pipeline_name, "ci");
    ASSERT_TRUE(runs[0].conclusion.has_value());
    EXPECT_EQ(*runs[0].conclusion, RunConclusion::SUCCESS);
    EXPECT_EQ(runs[0].countWithStatus(JobStatus::SUCCEEDED), 2u);

    auto stored = engine->getRun(runs[0].run_id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->run_id, runs[0].run_id);
    EXPECT_TRUE(engine->getActiveRunIds().empty());
}

TEST_F(PipelineEngineTest, UnmatchedEventStartsNothing) {
    auto engine = makeEngine();
    engine->registerPipeline(ciPipeline());

    EXPECT_TRUE(engine->dispatchEvent(PushEvent{"refs/heads/feature/x"}).empty());
    EXPECT_TRUE(engine->executeEvent(PullRequestEvent{"refs/heads/main", "refs/heads/feature/x"}).empty());
    EXPECT_TRUE(engine->getRunHistory().empty());
}

// EN: A successful run feeds a workflow_completion event to the pipelines that follow it
// FR: Une run réussie émet un événement workflow_completion vers les pipelines qui la suivent
TEST_F(PipelineEngineTest, SuccessfulRunTriggersFollowers) {
    auto engine = makeEngine();
    engine->registerPipeline(ciPipeline());
    engine->registerPipeline(releasePipeline());

    auto runs = engine->executeEvent(PushEvent{"refs/heads/main"});
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_EQ(runs[0].pipeline_name, "ci");
    EXPECT_EQ(runs[1].pipeline_name, "create-release");
    EXPECT_EQ(runs[1].variables.at("upstream_pipeline"), "ci");
    EXPECT_EQ(runs[1].variables.at("ref_name"), "main");
    EXPECT_EQ(*runs[1].conclusion, RunConclusion::SUCCESS);
}

TEST_F(PipelineEngineTest, FailedRunDoesNotTriggerFollowers) {
    executor_->failTemplate("test");
    auto engine = makeEngine();
    engine->registerPipeline(ciPipeline());
    engine->registerPipeline(releasePipeline());

    auto runs = engine->executeEvent(PushEvent{"refs/heads/main"});
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(*runs[0].conclusion, RunConclusion::FAILURE);
}

TEST_F(PipelineEngineTest, ChainingCanBeDisabled) {
    config_.chain_upstream_completions = false;
    auto engine = makeEngine();
    engine->registerPipeline(ciPipeline());
    engine->registerPipeline(releasePipeline());

    EXPECT_EQ(engine->executeEvent(PushEvent{"refs/heads/main"}).size(), 1u);
}

TEST_F(PipelineEngineTest, NewerPushCancelsOlderRunOfSameRef) {
    executor_ = std::make_shared<GatedExecutor>(false);
    config_.chain_upstream_completions = false;
    auto engine = makeEngine();
    engine->registerPipeline(ciPipeline());

    auto first = engine->dispatchEvent(PushEvent{"refs/heads/main"});
    ASSERT_EQ(first.size(), 1u);
    ASSERT_TRUE(executor_->waitForStarted(1));

    auto second = engine->dispatchEvent(PushEvent{"refs/heads/main"});
    ASSERT_EQ(second.size(), 1u);
    ASSERT_TRUE(engine->waitForRun(first[0], 5s));
    ASSERT_TRUE(executor_->waitForStarted(2));
    executor_->open();
    ASSERT_TRUE(engine->waitForIdle(5s));

    auto older = engine->getRun(first[0]);
    auto newer = engine->getRun(second[0]);
    ASSERT_TRUE(older && newer);
    EXPECT_EQ(*older->conclusion, RunConclusion::CANCELLED);
    EXPECT_TRUE(older->cancellation.isCancelled());
    EXPECT_EQ(*newer->conclusion, RunConclusion::SUCCESS);
}

TEST_F(PipelineEngineTest, TagPushDoesNotSupersedeBranchRun) {
    executor_ = std::make_shared<GatedExecutor>(false);
    config_.chain_upstream_completions = false;
    auto engine = makeEngine();
    engine->registerPipeline(ciPipeline());

    auto branch = engine->dispatchEvent(PushEvent{"refs/heads/main"});
    ASSERT_TRUE(executor_->waitForStarted(1));
    auto tag = engine->dispatchEvent(TagEvent{"refs/tags/v1.0.0", "v1.0.0"});
    ASSERT_EQ(tag.size(), 1u);
    executor_->open();
    ASSERT_TRUE(engine->waitForIdle(5s));

    EXPECT_EQ(*engine->getRun(branch[0])->conclusion, RunConclusion::SUCCESS);
    EXPECT_EQ(*engine->getRun(tag[0])->conclusion, RunConclusion::SUCCESS);
}

TEST_F(PipelineEngineTest, CancelRunIsAcknowledgedOnce) {
    executor_ = std::make_shared<GatedExecutor>(false);
    auto engine = makeEngine();
    engine->registerPipeline(ciPipeline());

    auto ids = engine->dispatchEvent(PushEvent{"refs/heads/main"});
    ASSERT_TRUE(executor_->waitForStarted(1));
    EXPECT_TRUE(engine->cancelRun(ids[0]));
    EXPECT_FALSE(engine->cancelRun(ids[0]));
    EXPECT_FALSE(engine->cancelRun("ci#unknown"));

    ASSERT_TRUE(engine->waitForRun(ids[0], 5s));
    auto run = engine->getRun(ids[0]);
    EXPECT_EQ(*run->conclusion, RunConclusion::CANCELLED);
    EXPECT_EQ(run->findInstance("build")->status, JobStatus::CANCELLED);
    EXPECT_EQ(run->findInstance("test")->status, JobStatus::CANCELLED);
}

TEST_F(PipelineEngineTest, ReleaseJobPublishesThroughEndpoint) {
    auto endpoint = std::make_shared<InMemoryReleaseEndpoint>();
    auto engine = makeEngine(endpoint);

    auto definition = ciPipeline();
    JobTemplate release;
    release.name = "release";
    release.needs = {"test"};
    ReleaseSpec spec;
    spec.artifact_globs = {"dist/*.tar.gz"};
    spec.name_template = "App ${{ tag_name }}";
    spec.condition = Condition::parse("ref_type == 'tag'");
    release.release = spec;
    definition.jobs.push_back(release);
    engine->registerPipeline(definition);

    auto branch_runs = engine->executeEvent(PushEvent{"refs/heads/main"});
    ASSERT_EQ(branch_runs.size(), 1u);
    EXPECT_EQ(branch_runs[0].findInstance("release")->status, JobStatus::SKIPPED);

    auto tag_runs = engine->executeEvent(TagEvent{"refs/tags/v1.0.0", "v1.0.0"});
    ASSERT_EQ(tag_runs.size(), 1u);
    EXPECT_EQ(*tag_runs[0].conclusion, RunConclusion::SUCCESS);

    auto releases = endpoint->releases();
    ASSERT_EQ(releases.size(), 1u);
    EXPECT_EQ(releases[0].metadata.name, "App v1.0.0");
    EXPECT_EQ(releases[0].metadata.tag, "v1.0.0");
}

TEST_F(PipelineEngineTest, ReleaseJobWithoutEndpointFails) {
    auto engine = makeEngine();
    auto definition = ciPipeline();
    JobTemplate release;
    release.name = "release";
    release.needs = {"build"};
    ReleaseSpec spec;
    spec.artifact_globs = {"dist/*"};
    release.release = spec;
    definition.jobs.push_back(release);
    engine->registerPipeline(definition);

    auto runs = engine->executeEvent(TagEvent{"refs/tags/v1.0.0", "v1.0.0"});
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(*runs[0].conclusion, RunConclusion::FAILURE);
    EXPECT_EQ(runs[0].findInstance("release")->status_reason, "no release publisher configured");
}

TEST_F(PipelineEngineTest, HistoryIsBounded) {
    config_.max_run_history = 2;
    config_.chain_upstream_completions = false;
    auto engine = makeEngine();
    engine->registerPipeline(ciPipeline());

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        ids.push_back(engine->executeEvent(TagEvent{"refs/tags/v1." + std::to_string(i), ""})[0].run_id);
    }
    auto history = engine->getRunHistory();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_FALSE(engine->getRun(ids[0]).has_value());
    EXPECT_EQ(history.back().run_id, ids[2]);
}

TEST_F(PipelineEngineTest, EventCallbackSeesRunFinished) {
    auto engine = makeEngine();
    engine->registerPipeline(ciPipeline());

    std::mutex mutex;
    std::vector<RunEvent> events;
    engine->registerEventCallback([&](const RunEvent& event) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(event);
    });
    auto runs = engine->executeEvent(PushEvent{"refs/heads/main"});
    engine->unregisterEventCallback();

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, RunEventType::RUN_FINISHED);
    EXPECT_EQ(events.back().run_id, runs[0].run_id);
}

TEST_F(PipelineEngineTest, ShutdownCancelsAndRefusesNewEvents) {
    executor_ = std::make_shared<GatedExecutor>(false);
    auto engine = makeEngine();
    engine->registerPipeline(ciPipeline());

    auto ids = engine->dispatchEvent(PushEvent{"refs/heads/main"});
    ASSERT_TRUE(executor_->waitForStarted(1));
    engine->shutdown();

    EXPECT_EQ(*engine->getRun(ids[0])->conclusion, RunConclusion::CANCELLED);
    EXPECT_TRUE(engine->dispatchEvent(PushEvent{"refs/heads/main"}).empty());
    EXPECT_NO_THROW(engine->shutdown());
}

TEST(PipelineEngineConfigTest, ReadsEngineSection) {
    Logger::getInstance().setConsoleOutput(false);
    auto& manager = ConfigManager::getInstance();
    manager.reset();
    ASSERT_TRUE(manager.loadFromString(
        "engine:\n  thread_pool_size: 3\n  max_concurrent_jobs: 2\n  cancel_superseded_runs: false\n"
        "  max_run_history: 5\n"));

    auto config = PipelineEngine::Config::fromConfigManager();
    EXPECT_EQ(config.thread_pool_size, 3u);
    EXPECT_EQ(config.max_concurrent_jobs, 2u);
    EXPECT_FALSE(config.cancel_superseded_runs);
    EXPECT_TRUE(config.chain_upstream_completions);
    EXPECT_EQ(config.max_run_history, 5u);
    EXPECT_EQ(config.max_chain_depth, 8u);

    manager.reset();
    auto defaults = PipelineEngine::Config::fromConfigManager();
    EXPECT_EQ(defaults.thread_pool_size, 8u);
    EXPECT_EQ(defaults.max_concurrent_jobs, 0u);
}

TEST(PipelineEngineConfigTest, ValidationRulesRejectBadSettings) {
    Logger::getInstance().setConsoleOutput(false);
    auto& manager = ConfigManager::getInstance();
    manager.reset();
    manager.addValidationRules(PipelineEngine::Config::validationRules());
    ASSERT_TRUE(manager.loadFromString(
        "engine:\n  thread_pool_size: -2\n  cancel_superseded_runs: sometimes\n"
        "release:\n  on_existing: overwrite\n  max_attempts: 0\n"));

    std::vector<std::string> errors;
    EXPECT_FALSE(manager.validate(errors));
    ASSERT_EQ(errors.size(), 4u);
    auto mentions = [&errors](const std::string& key) {
        return std::any_of(errors.begin(), errors.end(),
                           [&key](const std::string& e) { return e.find(key) != std::string::npos; });
    };
    EXPECT_TRUE(mentions("engine.thread_pool_size"));
    EXPECT_TRUE(mentions("engine.cancel_superseded_runs"));
    EXPECT_TRUE(mentions("release.on_existing"));
    EXPECT_TRUE(mentions("release.max_attempts"));

    ASSERT_TRUE(manager.loadFromString(
        "engine:\n  thread_pool_size: 0\n  max_concurrent_jobs: 2\n"
        "release:\n  on_existing: update_draft\n  max_attempts: 3\n  timeout_ms: 500\n"));
    EXPECT_TRUE(manager.validate(errors));
    EXPECT_TRUE(errors.empty());
    manager.reset();
}

TEST(PipelineEngineConstructionTest, RequiresExecutor) {
    Logger::getInstance().setConsoleOutput(false);
    EXPECT_THROW(PipelineEngine(PipelineEngine::Config{}, nullptr), std::invalid_argument);
}
