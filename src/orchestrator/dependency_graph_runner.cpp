// EN: Dependency graph runner: needs resolution, gating, bounded dispatch, fail-fast and cancellation.
// FR: Runner du graphe de dépendances : résolution des needs, garde, lancement borné, fail-fast et annulation.

#include "orchestrator/dependency_graph_runner.hpp"

#include <set>
#include <stdexcept>

#include "infrastructure/logging/logger.hpp"
#include "orchestrator/matrix_expander.hpp"

namespace CDO {
namespace Orchestrator {

// EN: Per-run bookkeeping, only touched by the thread calling run()
// FR: Suivi par run, manipulé uniquement par le thread qui appelle run()
struct DependencyGraphRunner::RunState {
    explicit RunState(PipelineRun& r) : run(r) {}

    PipelineRun& run;
    std::vector<const JobTemplate*> templates;      // EN: Indexed like run.instances / FR: Indexé comme run.instances
    std::vector<CancellationSource> cancel_sources;
    std::unordered_map<std::string, size_t> running_per_template;
    size_t running = 0;
    bool cancel_applied = false;
    Logger::Metadata meta;
};

namespace {

bool isWaiting(JobStatus status) {
    return status == JobStatus::PENDING || status == JobStatus::BLOCKED;
}

bool isUnstarted(JobStatus status) {
    return status == JobStatus::PENDING || status == JobStatus::BLOCKED || status == JobStatus::READY;
}

} // namespace

DependencyGraphRunner::DependencyGraphRunner(const PipelineDefinition& definition, JobExecutor& executor,
                                             ThreadPool& pool, ReleasePublisher* publisher, RunnerConfig config)
    : definition_(definition), executor_(executor), pool_(pool), publisher_(publisher), config_(config) {}

void DependencyGraphRunner::setEventCallback(RunEventCallback callback) {
    callback_ = std::move(callback);
}

RunConclusion DependencyGraphRunner::run(PipelineRun& run) {
    if (run.instances.empty()) {
        MatrixExpander::expandInto(definition_, run);
    }

    RunState state(run);
    state.meta = Logger::Metadata{{"run_id", run.run_id}, {"pipeline", run.pipeline_name}};
    state.cancel_sources.resize(run.instances.size());
    for (size_t i = 0; i < run.instances.size(); ++i) {
        const JobTemplate* job = definition_.findJob(run.instances[i].template_name);
        state.templates.push_back(job);
        if (!job) {
            LOG_ERROR_META("runner", "Instance '" + run.instances[i].id + "' refers to unknown job '" +
                           run.instances[i].template_name + "'", state.meta);
            markTerminal(state, i, JobStatus::SKIPPED, "unknown job template");
        }
    }

    LOG_INFO_META("runner", "Run started with " + std::to_string(run.instances.size()) + " job instances",
                  state.meta);

    try {
        drive(state);
    } catch (const std::exception& e) {
        LOG_ERROR_META("runner", std::string("Run loop aborted: ") + e.what(), state.meta);
        drainRunning(state);
        throw;
    }

    const RunConclusion conclusion = concludeRun(run);
    run.conclusion = conclusion;
    run.finished_at = std::chrono::system_clock::now();

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(*run.finished_at - run.created_at);
    Logger::Metadata meta = state.meta;
    meta["conclusion"] = PipelineUtils::conclusionToString(conclusion);
    meta["duration"] = PipelineUtils::formatDuration(elapsed);
    if (conclusion == RunConclusion::SUCCESS) {
        LOG_INFO_META("runner", "Run finished", meta);
    } else {
        LOG_WARN_META("runner", "Run finished", meta);
    }
    emit(RunEventType::RUN_FINISHED, run, "", JobStatus::PENDING, PipelineUtils::conclusionToString(conclusion));
    return conclusion;
}

void DependencyGraphRunner::drive(RunState& state) {
    while (true) {
        if (state.run.cancellation.isCancelled() && !state.cancel_applied) {
            cancelRun(state, "run cancelled");
        }

        while (evaluateWaiting(state)) {
        }

        if (!state.cancel_applied) {
            dispatchReady(state);
        }

        if (state.running == 0) {
            bool all_terminal = true;
            for (const auto& instance : state.run.instances) {
                if (!isTerminal(instance.status)) {
                    all_terminal = false;
                    break;
                }
            }
            if (all_terminal) {
                break;
            }
            skipUnreachable(state);
            continue;
        }

        std::deque<Completion> batch;
        {
            std::unique_lock<std::mutex> lock(completion_mutex_);
            completion_condition_.wait_for(lock, config_.poll_interval, [this] { return !completions_.empty(); });
            batch.swap(completions_);
        }
        for (auto& completion : batch) {
            processCompletion(state, std::move(completion));
        }
    }
}

// EN: Job bodies capture this runner, so none may still be running when run() unwinds
// FR: Les corps de job capturent ce runner, aucun ne doit tourner quand run() se termine en erreur
void DependencyGraphRunner::drainRunning(RunState& state) {
    PipelineRun& run = state.run;
    for (size_t i = 0; i < run.instances.size(); ++i) {
        if (run.instances[i].status == JobStatus::RUNNING) {
            run.instances[i].cancel_requested = true;
            state.cancel_sources[i].cancel();
        }
    }

    while (state.running > 0) {
        std::deque<Completion> batch;
        {
            std::unique_lock<std::mutex> lock(completion_mutex_);
            completion_condition_.wait(lock, [this] { return !completions_.empty(); });
            batch.swap(completions_);
        }
        for (const auto& completion : batch) {
            JobInstance& instance = run.instances[completion.index];
            --state.running;
            switch (completion.outcome.result) {
                case JobResult::SUCCEEDED: instance.status = JobStatus::SUCCEEDED; break;
                case JobResult::FAILED:    instance.status = JobStatus::FAILED; break;
                case JobResult::CANCELLED: instance.status = JobStatus::CANCELLED; break;
            }
            instance.status_reason = completion.outcome.message;
            instance.exit_code = completion.outcome.exit_code;
            instance.finished_at = std::chrono::system_clock::now();
        }
    }

    for (auto& instance : run.instances) {
        if (!isTerminal(instance.status)) {
            instance.status = JobStatus::CANCELLED;
            instance.status_reason = "run aborted";
            instance.finished_at = std::chrono::system_clock::now();
        }
    }
}

RunConclusion DependencyGraphRunner::concludeRun(const PipelineRun& run) {
    bool any_cancelled = false;
    for (const auto& instance : run.instances) {
        if (instance.status == JobStatus::FAILED) {
            return RunConclusion::FAILURE;
        }
        if (instance.status == JobStatus::CANCELLED) {
            any_cancelled = true;
        }
    }
    return any_cancelled ? RunConclusion::CANCELLED : RunConclusion::SUCCESS;
}

bool DependencyGraphRunner::evaluateWaiting(RunState& state) {
    PipelineRun& run = state.run;
    bool progressed = false;

    for (size_t i = 0; i < run.instances.size(); ++i) {
        JobInstance& instance = run.instances[i];
        if (!isWaiting(instance.status) || !state.templates[i]) {
            continue;
        }
        const JobTemplate& job = *state.templates[i];

        std::string unmet;
        bool waiting = false;
        for (const auto& need : job.needs) {
            const auto needed = run.instancesOf(need);
            if (needed.empty()) {
                unmet = "needed job '" + need + "' has no instance";
                break;
            }
            for (const JobInstance* other : needed) {
                if (other->status == JobStatus::FAILED || other->status == JobStatus::CANCELLED ||
                    other->status == JobStatus::SKIPPED) {
                    unmet = "needed job '" + other->id + "' is " + PipelineUtils::statusToString(other->status);
                    break;
                }
                if (other->status != JobStatus::SUCCEEDED) {
                    waiting = true;
                }
            }
            if (!unmet.empty()) {
                break;
            }
        }

        if (!unmet.empty()) {
            markTerminal(state, i, JobStatus::SKIPPED, unmet);
            progressed = true;
            continue;
        }

        if (waiting) {
            if (instance.status == JobStatus::PENDING) {
                instance.status = JobStatus::BLOCKED;
                LOG_DEBUG_META("runner", "'" + instance.id + "' blocked on its needs", state.meta);
                progressed = true;
            }
            continue;
        }

        const VariableScope scope(run.variables, instance.bindings);
        std::string skip_reason;
        try {
            if (job.condition && !job.condition->evaluate(scope)) {
                skip_reason = "condition is false: " + job.condition->source();
            } else if (job.release && job.release->condition && !job.release->condition->evaluate(scope)) {
                skip_reason = "release gate is false: " + job.release->condition->source();
            }
        } catch (const ConditionParseError& e) {
            markTerminal(state, i, JobStatus::FAILED, e.what());
            if (!job.matrix || job.matrix->fail_fast) {
                applyFailFast(state, i);
            }
            progressed = true;
            continue;
        }
        if (!skip_reason.empty()) {
            markTerminal(state, i, JobStatus::SKIPPED, skip_reason);
            progressed = true;
            continue;
        }

        instance.status = JobStatus::READY;
        progressed = true;
    }
    return progressed;
}

void DependencyGraphRunner::dispatchReady(RunState& state) {
    PipelineRun& run = state.run;
    for (size_t i = 0; i < run.instances.size(); ++i) {
        if (run.instances[i].status != JobStatus::READY) {
            continue;
        }
        if (config_.max_concurrent_jobs > 0 && state.running >= config_.max_concurrent_jobs) {
            return;
        }
        const JobTemplate& job = *state.templates[i];
        if (job.matrix && job.matrix->max_parallel &&
            state.running_per_template[job.name] >= *job.matrix->max_parallel) {
            continue;
        }
        dispatch(state, i);
    }
}

void DependencyGraphRunner::dispatch(RunState& state, size_t index) {
    PipelineRun& run = state.run;
    JobInstance& instance = run.instances[index];
    const JobTemplate& job = *state.templates[index];

    instance.status = JobStatus::RUNNING;
    instance.started_at = std::chrono::system_clock::now();
    ++state.running;
    ++state.running_per_template[job.name];

    Logger::Metadata meta = state.meta;
    meta["job"] = instance.id;
    LOG_INFO_META("runner", "Job started", meta);
    emit(RunEventType::JOB_STARTED, run, instance.id, JobStatus::RUNNING, "");

    JobRequest request;
    try {
        request = buildRequest(run, instance, job);
    } catch (const ConditionParseError& e) {
        postCompletion(Completion{index, JobOutcome::failed(-1, e.what()), std::nullopt});
        return;
    }

    std::optional<ReleaseSpec> release = job.release;
    PublishContext context;
    std::vector<Artifact> upstream;
    if (release) {
        if (!publisher_) {
            postCompletion(Completion{index, JobOutcome::failed(-1, "no release publisher configured"), std::nullopt});
            return;
        }
        context = PublishContext::fromRun(run);
        upstream = upstreamArtifacts(run, job);
    }

    const CancellationToken token = state.cancel_sources[index].token().combinedWith(run.cancellation.token());

    try {
        pool_.submitNamed(instance.id, TaskPriority::NORMAL,
                          [this, index, request, token, release, context, upstream]() {
            Completion completion;
            completion.index = index;
            try {
                completion.outcome = executor_.execute(request, token);
            } catch (const std::exception& e) {
                LOG_ERROR("runner", "Executor error in '" + request.instance_id + "': " + e.what());
                completion.outcome = JobOutcome::failed(-1, std::string("executor error: ") + e.what());
            }

            if (release && completion.outcome.result == JobResult::SUCCEEDED) {
                std::vector<Artifact> artifacts = upstream;
                for (const auto& artifact : completion.outcome.artifacts) {
                    artifacts.push_back(artifact);
                }
                try {
                    completion.publish = publisher_->publish(*release, context, artifacts, token);
                } catch (const std::exception& e) {
                    completion.publish = PublishOutcome::failed(PublishError::TRANSPORT_FAILURE, e.what());
                }
            }
            postCompletion(std::move(completion));
        });
    } catch (const std::runtime_error& e) {
        LOG_ERROR_META("runner", "Could not submit job: " + std::string(e.what()), meta);
        postCompletion(Completion{index, JobOutcome::failed(-1, e.what()), std::nullopt});
    }
}

void DependencyGraphRunner::processCompletion(RunState& state, Completion completion) {
    PipelineRun& run = state.run;
    JobInstance& instance = run.instances[completion.index];
    const JobTemplate& job = *state.templates[completion.index];

    --state.running;
    --state.running_per_template[job.name];

    instance.finished_at = std::chrono::system_clock::now();
    instance.exit_code = completion.outcome.exit_code;
    for (auto& artifact : completion.outcome.artifacts) {
        if (artifact.producer.empty()) {
            artifact.producer = instance.id;
        }
    }
    instance.artifacts = std::move(completion.outcome.artifacts);

    JobStatus status = JobStatus::FAILED;
    switch (completion.outcome.result) {
        case JobResult::SUCCEEDED: status = JobStatus::SUCCEEDED; break;
        case JobResult::FAILED:    status = JobStatus::FAILED; break;
        case JobResult::CANCELLED: status = JobStatus::CANCELLED; break;
    }
    std::string reason = completion.outcome.message;

    if (completion.publish) {
        const PublishOutcome& publish = *completion.publish;
        instance.publish_outcome = publish;
        reason = publish.message;
        switch (publish.status) {
            case PublishStatus::PUBLISHED:
                status = JobStatus::SUCCEEDED;
                reason = "published release " + publish.release_id;
                break;
            case PublishStatus::SKIPPED:
                status = JobStatus::SKIPPED;
                break;
            case PublishStatus::FAILED:
                status = publish.error == PublishError::CANCELLED ? JobStatus::CANCELLED : JobStatus::FAILED;
                break;
        }
    }

    instance.status = status;
    instance.status_reason = reason;

    Logger::Metadata meta = state.meta;
    meta["job"] = instance.id;
    meta["status"] = PipelineUtils::statusToString(status);
    if (instance.exit_code) {
        meta["exit_code"] = std::to_string(*instance.exit_code);
    }
    if (instance.started_at) {
        meta["duration"] = PipelineUtils::formatDuration(
            std::chrono::duration_cast<std::chrono::milliseconds>(*instance.finished_at - *instance.started_at));
    }
    if (status == JobStatus::FAILED) {
        LOG_WARN_META("runner", "Job failed: " + reason, meta);
    } else {
        LOG_INFO_META("runner", "Job finished", meta);
    }
    emit(RunEventType::JOB_FINISHED, run, instance.id, status, reason);

    const bool fail_fast = !job.matrix || job.matrix->fail_fast;
    if (status == JobStatus::FAILED && fail_fast) {
        applyFailFast(state, completion.index);
    }
}

void DependencyGraphRunner::applyFailFast(RunState& state, size_t failed_index) {
    PipelineRun& run = state.run;
    const std::string& template_name = run.instances[failed_index].template_name;
    const std::string reason = "fail-fast: '" + run.instances[failed_index].id + "' failed";

    for (size_t i = 0; i < run.instances.size(); ++i) {
        JobInstance& sibling = run.instances[i];
        if (i == failed_index || sibling.template_name != template_name) {
            continue;
        }
        if (isUnstarted(sibling.status)) {
            markTerminal(state, i, JobStatus::CANCELLED, reason);
        } else if (sibling.status == JobStatus::RUNNING && !sibling.cancel_requested) {
            sibling.cancel_requested = true;
            state.cancel_sources[i].cancel();
            LOG_INFO_META("runner", "Cancel requested for running '" + sibling.id + "' (" + reason + ")", state.meta);
        }
    }
}

void DependencyGraphRunner::cancelRun(RunState& state, const std::string& reason) {
    state.cancel_applied = true;
    LOG_WARN_META("runner", "Cancelling run: " + reason, state.meta);

    for (size_t i = 0; i < state.run.instances.size(); ++i) {
        JobInstance& instance = state.run.instances[i];
        if (isUnstarted(instance.status)) {
            markTerminal(state, i, JobStatus::CANCELLED, reason);
        } else if (instance.status == JobStatus::RUNNING) {
            instance.cancel_requested = true;
            state.cancel_sources[i].cancel();
        }
    }
}

void DependencyGraphRunner::skipUnreachable(RunState& state) {
    for (size_t i = 0; i < state.run.instances.size(); ++i) {
        if (!isTerminal(state.run.instances[i].status)) {
            LOG_ERROR_META("runner", "'" + state.run.instances[i].id + "' can never become ready", state.meta);
            markTerminal(state, i, JobStatus::SKIPPED, "dependencies can never be satisfied");
        }
    }
}

JobRequest DependencyGraphRunner::buildRequest(const PipelineRun& run, const JobInstance& instance,
                                               const JobTemplate& job) const {
    const VariableScope scope(run.variables, instance.bindings);

    JobRequest request;
    request.run_id = run.run_id;
    request.pipeline_name = run.pipeline_name;
    request.instance_id = instance.id;
    request.template_name = job.name;
    request.runs_on = substitute(job.runs_on, scope);
    request.bindings = instance.bindings;
    request.variables = run.variables;
    request.artifact_globs = job.artifact_globs;

    for (const auto& step : job.steps) {
        JobStep resolved;
        resolved.name = substitute(step.name, scope);
        resolved.run = substitute(step.run, scope);
        resolved.uses = step.uses;
        for (const auto& [key, value] : step.with) {
            resolved.with[key] = substitute(value, scope);
        }
        request.steps.push_back(std::move(resolved));
    }
    return request;
}

std::vector<Artifact> DependencyGraphRunner::upstreamArtifacts(const PipelineRun& run, const JobTemplate& job) const {
    // EN: Transitive closure of the needs
    // FR: Fermeture transitive des needs
    std::set<std::string> upstream;
    std::vector<std::string> pending(job.needs.begin(), job.needs.end());
    while (!pending.empty()) {
        const std::string name = pending.back();
        pending.pop_back();
        if (!upstream.insert(name).second) {
            continue;
        }
        if (const JobTemplate* needed = definition_.findJob(name)) {
            pending.insert(pending.end(), needed->needs.begin(), needed->needs.end());
        }
    }

    std::vector<Artifact> artifacts;
    for (const auto& instance : run.instances) {
        if (instance.status == JobStatus::SUCCEEDED && upstream.count(instance.template_name) > 0) {
            artifacts.insert(artifacts.end(), instance.artifacts.begin(), instance.artifacts.end());
        }
    }
    return artifacts;
}

void DependencyGraphRunner::markTerminal(RunState& state, size_t index, JobStatus status, const std::string& reason) {
    JobInstance& instance = state.run.instances[index];
    instance.status = status;
    instance.status_reason = reason;
    instance.finished_at = std::chrono::system_clock::now();

    Logger::Metadata meta = state.meta;
    meta["job"] = instance.id;
    if (status == JobStatus::FAILED) {
        LOG_WARN_META("runner", "FAILED: " + reason, meta);
        emit(RunEventType::JOB_FINISHED, state.run, instance.id, status, reason);
        return;
    }
    LOG_INFO_META("runner", PipelineUtils::statusToString(status) + ": " + reason, meta);

    emit(status == JobStatus::SKIPPED ? RunEventType::JOB_SKIPPED : RunEventType::JOB_CANCELLED,
         state.run, instance.id, status, reason);
}

void DependencyGraphRunner::postCompletion(Completion completion) {
    {
        std::lock_guard<std::mutex> lock(completion_mutex_);
        completions_.push_back(std::move(completion));
    }
    completion_condition_.notify_one();
}

void DependencyGraphRunner::emit(RunEventType type, const PipelineRun& run, const std::string& instance_id,
                                 JobStatus status, const std::string& message) {
    if (!callback_) {
        return;
    }
    RunEvent event;
    event.type = type;
    event.run_id = run.run_id;
    event.instance_id = instance_id;
    event.status = status;
    event.message = message;
    callback_(event);
}

} // namespace Orchestrator
} // namespace CDO
