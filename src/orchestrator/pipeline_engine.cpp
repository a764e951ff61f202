// EN: Pipeline engine: pipeline registry, run lifecycle, superseding pushes and completion chaining.
// FR: Moteur de pipeline : registre, cycle de vie des runs, pushs remplacés et chaînage des complétions.

#include "orchestrator/pipeline_engine.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>

#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/threading/thread_pool.hpp"
#include "orchestrator/trigger_evaluator.hpp"

namespace CDO {
namespace Orchestrator {

namespace {

size_t positiveOr(int value, size_t fallback) {
    return value > 0 ? static_cast<size_t>(value) : fallback;
}

template<typename Predicate>
bool waitWithTimeout(std::condition_variable& condition, std::unique_lock<std::mutex>& lock,
                     std::chrono::milliseconds timeout, Predicate predicate) {
    if (timeout == std::chrono::milliseconds::max()) {
        condition.wait(lock, predicate);
        return true;
    }
    return condition.wait_for(lock, timeout, predicate);
}

} // namespace

PipelineEngine::Config PipelineEngine::Config::fromConfigManager() {
    Config config;
    auto& manager = ConfigManager::getInstance();

    config.thread_pool_size = positiveOr(
        manager.get("engine", "thread_pool_size").asOrDefault<int>(0), config.thread_pool_size);
    int max_jobs = manager.get("engine", "max_concurrent_jobs").asOrDefault<int>(0);
    config.max_concurrent_jobs = max_jobs > 0 ? static_cast<size_t>(max_jobs) : 0;
    config.cancel_superseded_runs =
        manager.get("engine", "cancel_superseded_runs").asOrDefault<bool>(config.cancel_superseded_runs);
    config.chain_upstream_completions =
        manager.get("engine", "chain_upstream_completions").asOrDefault<bool>(config.chain_upstream_completions);
    config.max_chain_depth = positiveOr(
        manager.get("engine", "max_chain_depth").asOrDefault<int>(0), config.max_chain_depth);
    config.max_run_history = positiveOr(
        manager.get("engine", "max_run_history").asOrDefault<int>(0), config.max_run_history);
    config.poll_interval = std::chrono::milliseconds(positiveOr(
        manager.get("engine", "poll_interval_ms").asOrDefault<int>(0),
        static_cast<size_t>(config.poll_interval.count())));
    return config;
}

std::vector<ConfigManager::ValidationRule> PipelineEngine::Config::validationRules() {
    auto rule = [](const std::string& key, const std::string& type, std::optional<double> min_value,
                   const std::string& description) {
        ConfigManager::ValidationRule r;
        r.key = key;
        r.type = type;
        r.min_value = min_value;
        r.description = description;
        return r;
    };

    std::vector<ConfigManager::ValidationRule> rules = {
        rule("engine.thread_pool_size", "int", 0.0, "Worker threads, 0 keeps the default"),
        rule("engine.max_concurrent_jobs", "int", 0.0, "Jobs per run, 0 = unbounded"),
        rule("engine.cancel_superseded_runs", "bool", std::nullopt, "Cancel older pushes of the same ref"),
        rule("engine.chain_upstream_completions", "bool", std::nullopt, "Emit workflow_completion events"),
        rule("engine.max_chain_depth", "int", 0.0, "Follow chain guard"),
        rule("engine.max_run_history", "int", 0.0, "Finished runs kept in memory"),
        rule("engine.poll_interval_ms", "int", 0.0, "Cancellation poll interval"),
        rule("executor.working_directory", "string", std::nullopt, "Shared source tree"),
        rule("executor.workspace_root", "string", std::nullopt, "Per-job workspaces"),
        rule("release.endpoint", "string", std::nullopt, "memory or a REST base URL"),
        rule("release.max_attempts", "int", 1.0, "Attempts per release request"),
        rule("release.timeout_ms", "int", 1.0, "Release request timeout"),
    };

    ConfigManager::ValidationRule on_existing =
        rule("release.on_existing", "string", std::nullopt, "Policy for an existing release");
    on_existing.allowed_values = {"fail", "update", "update_draft"};
    rules.push_back(on_existing);
    return rules;
}

// ---------------------------------------------------------------------------
// EN: Implementation
// FR: Implémentation
// ---------------------------------------------------------------------------

class PipelineEngine::PipelineEngineImpl {
public:
    PipelineEngineImpl(const Config& config, std::shared_ptr<JobExecutor> executor,
                       std::shared_ptr<ReleaseEndpoint> endpoint)
        : config_(config),
          executor_(std::move(executor)),
          endpoint_(std::move(endpoint)),
          pool_(ThreadPoolConfig{config.thread_pool_size, 0}) {
        if (!executor_) {
            throw std::invalid_argument("PipelineEngine requires a job executor");
        }
        if (endpoint_) {
            publisher_ = std::make_unique<ReleasePublisher>(*endpoint_);
        }
        LOG_INFO_META("engine", "Pipeline engine started",
                      (Logger::Metadata{{"threads", std::to_string(config_.thread_pool_size)},
                                        {"max_concurrent_jobs", std::to_string(config_.max_concurrent_jobs)}}));
    }

    ~PipelineEngineImpl() {
        shutdown();
    }

    void registerPipeline(const PipelineDefinition& definition) {
        PipelineDefinitionLoader::validate(definition);
        auto shared = std::make_shared<const PipelineDefinition>(definition);
        std::lock_guard<std::mutex> lock(mutex_);
        bool replaced = pipelines_.count(definition.name) > 0;
        pipelines_[definition.name] = shared;
        LOG_INFO_META("engine", std::string(replaced ? "Pipeline replaced" : "Pipeline registered"),
                      (Logger::Metadata{{"pipeline", definition.name},
                                        {"jobs", std::to_string(definition.jobs.size())}}));
    }

    std::string loadPipelineFile(const std::string& path, const PipelineLoaderOptions& options) {
        PipelineDefinitionLoader loader(options);
        PipelineDefinition definition = loader.loadFile(path);
        registerPipeline(definition);
        return definition.name;
    }

    bool unregisterPipeline(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return pipelines_.erase(name) > 0;
    }

    std::vector<std::string> getPipelineNames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        names.reserve(pipelines_.size());
        for (const auto& entry : pipelines_) {
            names.push_back(entry.first);
        }
        return names;
    }

    std::optional<PipelineDefinition> getPipeline(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pipelines_.find(name);
        if (it == pipelines_.end()) {
            return std::nullopt;
        }
        return *it->second;
    }

    std::vector<std::string> dispatchEvent(const Event& event, size_t chain_depth) {
        std::vector<std::string> started;

        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_) {
            LOG_WARN("engine", "Event ignored, engine is shutting down");
            return started;
        }
        reapFinishedLocked();

        for (const auto& entry : pipelines_) {
            const auto& definition = entry.second;
            TriggerEvaluator evaluator(*definition);
            std::optional<PipelineRun> candidate = evaluator.evaluate(event);
            if (!candidate) {
                continue;
            }

            auto run = std::make_unique<PipelineRun>(std::move(*candidate));
            if (config_.cancel_superseded_runs && effectiveEventKind(event) == EventKind::PUSH) {
                cancelSupersededLocked(*run);
            }

            std::string run_id = run->run_id;
            auto active = std::make_unique<ActiveRun>();
            active->definition = definition;
            active->ref = run->variables.count("ref") ? run->variables.at("ref") : std::string();
            active->event_kind = effectiveEventKind(event);
            active->chain_depth = chain_depth;
            active->run = std::move(run);

            RunnerConfig runner_config;
            runner_config.max_concurrent_jobs = config_.max_concurrent_jobs;
            runner_config.poll_interval = config_.poll_interval;
            active->runner = std::make_unique<DependencyGraphRunner>(*definition, *executor_, pool_,
                                                                     publisher_.get(), runner_config);
            active->runner->setEventCallback([this](const RunEvent& run_event) { forwardEvent(run_event); });

            ActiveRun* raw = active.get();
            active_[run_id] = std::move(active);
            started_order_.push_back(run_id);

            LOG_INFO_META("engine", "Run triggered",
                          (Logger::Metadata{{"run_id", run_id},
                                            {"pipeline", definition->name},
                                            {"event", PipelineUtils::eventKindToString(effectiveEventKind(event))},
                                            {"chain_depth", std::to_string(chain_depth)}}));

            futures_.push_back(std::async(std::launch::async, [this, raw, run_id]() { driveRun(raw, run_id); }));
            started.push_back(run_id);
        }

        if (started.empty()) {
            LOG_DEBUG_META("engine", "No pipeline triggered",
                           (Logger::Metadata{{"event", PipelineUtils::eventKindToString(effectiveEventKind(event))}}));
        }
        return started;
    }

    std::vector<PipelineRun> executeEvent(const Event& event) {
        size_t first;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            first = started_order_.size();
        }
        dispatchEvent(event, 0);
        waitForIdle(std::chrono::milliseconds::max());

        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<PipelineRun> runs;
        for (size_t i = first; i < started_order_.size(); ++i) {
            if (const PipelineRun* run = findHistoryLocked(started_order_[i])) {
                runs.push_back(*run);
            }
        }
        return runs;
    }

    bool waitForRun(const std::string& run_id, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool finished = waitWithTimeout(idle_condition_, lock, timeout,
                                        [&]() { return active_.find(run_id) == active_.end(); });
        return finished && findHistoryLocked(run_id) != nullptr;
    }

    bool waitForIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return waitWithTimeout(idle_condition_, lock, timeout, [&]() { return active_.empty(); });
    }

    bool cancelRun(const std::string& run_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(run_id);
        if (it == active_.end()) {
            return false;
        }
        bool first = it->second->run->cancellation.cancel();
        if (first) {
            LOG_INFO_META("engine", "Run cancellation requested", (Logger::Metadata{{"run_id", run_id}}));
        }
        return first;
    }

    size_t cancelAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t cancelled = 0;
        for (auto& entry : active_) {
            if (entry.second->run->cancellation.cancel()) {
                ++cancelled;
            }
        }
        if (cancelled > 0) {
            LOG_WARN("engine", "Cancelled " + std::to_string(cancelled) + " active runs");
        }
        return cancelled;
    }

    std::optional<PipelineRun> getRun(const std::string& run_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const PipelineRun* run = findHistoryLocked(run_id);
        if (!run) {
            return std::nullopt;
        }
        return *run;
    }

    std::vector<PipelineRun> getRunHistory() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<PipelineRun>(history_.begin(), history_.end());
    }

    std::vector<std::string> getActiveRunIds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        for (const auto& entry : active_) {
            ids.push_back(entry.first);
        }
        return ids;
    }

    void registerEventCallback(RunEventCallback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void unregisterEventCallback() {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = nullptr;
    }

    Config getConfig() const {
        return config_;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutting_down_) {
                return;
            }
            shutting_down_ = true;
        }
        size_t cancelled = cancelAll();
        LOG_INFO("engine", "Shutting down, waiting for " + std::to_string(cancelled) + " cancelled runs");

        waitForIdle(std::chrono::milliseconds::max());

        std::vector<std::future<void>> futures;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            futures.swap(futures_);
        }
        for (auto& future : futures) {
            future.wait();
        }
        pool_.shutdown();
        LOG_INFO("engine", "Pipeline engine stopped");
    }

private:
    struct ActiveRun {
        std::shared_ptr<const PipelineDefinition> definition;
        std::unique_ptr<PipelineRun> run;
        std::unique_ptr<DependencyGraphRunner> runner;
        std::string ref;
        EventKind event_kind = EventKind::PUSH;
        size_t chain_depth = 0;
    };

    // EN: Runs on the run's own thread; the ActiveRun stays in active_ until the run is archived
    // FR: S'exécute sur le thread de la run; l'ActiveRun reste dans active_ jusqu'à l'archivage
    void driveRun(ActiveRun* active, const std::string& run_id) {
        PipelineRun& run = *active->run;
        RunConclusion conclusion = RunConclusion::FAILURE;
        try {
            conclusion = active->runner->run(run);
        } catch (const std::exception& e) {
            LOG_ERROR_META("engine", std::string("Run aborted: ") + e.what(), (Logger::Metadata{{"run_id", run_id}}));
            run.conclusion = RunConclusion::FAILURE;
            run.finished_at = std::chrono::system_clock::now();
        }

        // EN: Chained runs are registered before this one leaves active_, so idle never flickers
        // FR: Les runs chaînées sont enregistrées avant que celle-ci quitte active_
        if (config_.chain_upstream_completions) {
            if (active->chain_depth < config_.max_chain_depth) {
                auto ref_name = run.variables.find("ref_name");
                UpstreamCompletionEvent completion{run.pipeline_name, PipelineUtils::conclusionToString(conclusion),
                                                   ref_name != run.variables.end() ? ref_name->second : std::string()};
                dispatchEvent(Event(completion), active->chain_depth + 1);
            } else {
                LOG_WARN_META("engine", "Chain depth limit reached, completion not forwarded",
                              (Logger::Metadata{{"run_id", run_id},
                                                {"chain_depth", std::to_string(active->chain_depth)}}));
            }
        }

        std::unique_ptr<ActiveRun> finished;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = active_.find(run_id);
            if (it != active_.end()) {
                finished = std::move(it->second);
                active_.erase(it);
            }
            history_.push_back(std::move(run));
            while (history_.size() > config_.max_run_history) {
                history_.pop_front();
            }
        }
        idle_condition_.notify_all();
    }

    void cancelSupersededLocked(const PipelineRun& incoming) {
        auto ref = incoming.variables.find("ref");
        if (ref == incoming.variables.end()) {
            return;
        }
        for (auto& entry : active_) {
            ActiveRun& active = *entry.second;
            if (active.run->pipeline_name != incoming.pipeline_name || active.event_kind != EventKind::PUSH ||
                active.ref != ref->second) {
                continue;
            }
            if (active.run->cancellation.cancel()) {
                LOG_INFO_META("engine", "Superseded run cancelled",
                              (Logger::Metadata{{"run_id", entry.first},
                                                {"superseded_by", incoming.run_id},
                                                {"ref", ref->second}}));
            }
        }
    }

    // EN: Drops futures of runs that already finished
    // FR: Libère les futures des runs déjà terminées
    void reapFinishedLocked() {
        futures_.erase(std::remove_if(futures_.begin(), futures_.end(),
                                      [](std::future<void>& future) {
                                          return future.wait_for(std::chrono::seconds(0)) ==
                                                 std::future_status::ready;
                                      }),
                       futures_.end());
    }

    const PipelineRun* findHistoryLocked(const std::string& run_id) const {
        for (const auto& run : history_) {
            if (run.run_id == run_id) {
                return &run;
            }
        }
        return nullptr;
    }

    void forwardEvent(const RunEvent& event) {
        RunEventCallback callback;
        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            callback = callback_;
        }
        if (callback) {
            callback(event);
        }
    }

    Config config_;
    std::shared_ptr<JobExecutor> executor_;
    std::shared_ptr<ReleaseEndpoint> endpoint_;
    std::unique_ptr<ReleasePublisher> publisher_;
    ThreadPool pool_;

    mutable std::mutex mutex_;
    std::condition_variable idle_condition_;
    std::map<std::string, std::shared_ptr<const PipelineDefinition>> pipelines_;
    std::map<std::string, std::unique_ptr<ActiveRun>> active_;
    std::deque<PipelineRun> history_;
    std::vector<std::string> started_order_;
    std::vector<std::future<void>> futures_;
    bool shutting_down_ = false;

    std::mutex callback_mutex_;
    RunEventCallback callback_;
};

// ---------------------------------------------------------------------------
// EN: Public interface
// FR: Interface publique
// ---------------------------------------------------------------------------

PipelineEngine::PipelineEngine(const Config& config, std::shared_ptr<JobExecutor> executor,
                               std::shared_ptr<ReleaseEndpoint> endpoint)
    : impl_(std::make_unique<PipelineEngineImpl>(config, std::move(executor), std::move(endpoint))) {}

PipelineEngine::~PipelineEngine() = default;

void PipelineEngine::registerPipeline(const PipelineDefinition& definition) {
    impl_->registerPipeline(definition);
}

std::string PipelineEngine::loadPipelineFile(const std::string& path, const PipelineLoaderOptions& options) {
    return impl_->loadPipelineFile(path, options);
}

bool PipelineEngine::unregisterPipeline(const std::string& name) {
    return impl_->unregisterPipeline(name);
}

std::vector<std::string> PipelineEngine::getPipelineNames() const {
    return impl_->getPipelineNames();
}

std::optional<PipelineDefinition> PipelineEngine::getPipeline(const std::string& name) const {
    return impl_->getPipeline(name);
}

std::vector<std::string> PipelineEngine::dispatchEvent(const Event& event) {
    return impl_->dispatchEvent(event, 0);
}

std::vector<PipelineRun> PipelineEngine::executeEvent(const Event& event) {
    return impl_->executeEvent(event);
}

bool PipelineEngine::waitForRun(const std::string& run_id, std::chrono::milliseconds timeout) {
    return impl_->waitForRun(run_id, timeout);
}

bool PipelineEngine::waitForIdle(std::chrono::milliseconds timeout) {
    return impl_->waitForIdle(timeout);
}

bool PipelineEngine::cancelRun(const std::string& run_id) {
    return impl_->cancelRun(run_id);
}

size_t PipelineEngine::cancelAll() {
    return impl_->cancelAll();
}

std::optional<PipelineRun> PipelineEngine::getRun(const std::string& run_id) const {
    return impl_->getRun(run_id);
}

std::vector<PipelineRun> PipelineEngine::getRunHistory() const {
    return impl_->getRunHistory();
}

std::vector<std::string> PipelineEngine::getActiveRunIds() const {
    return impl_->getActiveRunIds();
}

void PipelineEngine::registerEventCallback(RunEventCallback callback) {
    impl_->registerEventCallback(std::move(callback));
}

void PipelineEngine::unregisterEventCallback() {
    impl_->unregisterEventCallback();
}

PipelineEngine::Config PipelineEngine::getConfig() const {
    return impl_->getConfig();
}

void PipelineEngine::shutdown() {
    impl_->shutdown();
}

} // namespace Orchestrator
} // namespace CDO
