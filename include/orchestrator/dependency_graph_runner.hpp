#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "infrastructure/threading/thread_pool.hpp"
#include "orchestrator/job_executor.hpp"
#include "orchestrator/pipeline_definition.hpp"
#include "orchestrator/pipeline_types.hpp"
#include "orchestrator/release_publisher.hpp"

namespace CDO {
namespace Orchestrator {

enum class RunEventType {
    JOB_STARTED = 0,
    JOB_FINISHED = 1,
    JOB_SKIPPED = 2,
    JOB_CANCELLED = 3,      // EN: Cancelled before it started / FR: Annulé avant de démarrer
    RUN_FINISHED = 4
};

struct RunEvent {
    RunEventType type;
    std::string run_id;
    std::string instance_id;                // EN: Empty for RUN_FINISHED / FR: Vide pour RUN_FINISHED
    JobStatus status = JobStatus::PENDING;
    std::string message;
    std::chrono::steady_clock::time_point timestamp = std::chrono::steady_clock::now();
};

using RunEventCallback = std::function<void(const RunEvent&)>;

struct RunnerConfig {
    // EN: Jobs running at once across all templates of a run (0 means unbounded)
    // FR: Jobs simultanés tous templates confondus (0 = illimité)
    size_t max_concurrent_jobs = 0;
    // EN: How often pipeline cancellation is polled while waiting for completions
    // FR: Fréquence de vérification de l'annulation pendant l'attente des complétions
    std::chrono::milliseconds poll_interval{20};
};

// EN: Drives one PipelineRun to a terminal state.
//     Decision logic runs on the calling thread; job bodies run on the ThreadPool and report back
//     through a completion queue, in any order. Per instance:
//       PENDING -> BLOCKED -> READY -> RUNNING -> SUCCEEDED | FAILED | CANCELLED
//       PENDING | BLOCKED -> SKIPPED (needs unmet, condition or release gate false)
//     A job never retries. Conclusion: FAILURE if any instance failed, else CANCELLED if any
//     instance was cancelled, else SUCCESS.
// FR: Mène une PipelineRun jusqu'à un état terminal. La logique de décision tourne sur le thread
//     appelant; les corps de jobs tournent sur le ThreadPool et remontent via une queue.
class DependencyGraphRunner {
public:
    // EN: The publisher may be null when the pipeline has no release job
    // FR: Le publisher peut être nul si le pipeline n'a pas de job de release
    DependencyGraphRunner(const PipelineDefinition& definition, JobExecutor& executor, ThreadPool& pool,
                          ReleasePublisher* publisher = nullptr, RunnerConfig config = RunnerConfig{});

    DependencyGraphRunner(const DependencyGraphRunner&) = delete;
    DependencyGraphRunner& operator=(const DependencyGraphRunner&) = delete;

    void setEventCallback(RunEventCallback callback);

    // EN: Expands the templates if the run has no instance yet, then runs it to completion.
    //     Returns only once no job body of this run is still executing.
    // FR: Développe les templates si la run n'a pas d'instance, puis l'exécute jusqu'au bout.
    RunConclusion run(PipelineRun& run);

    // EN: Severity order FAILED > CANCELLED > SUCCEEDED (SKIPPED counts as success)
    // FR: Ordre de sévérité FAILED > CANCELLED > SUCCEEDED (SKIPPED compte comme succès)
    static RunConclusion concludeRun(const PipelineRun& run);

private:
    struct Completion {
        size_t index = 0;
        JobOutcome outcome;
        std::optional<PublishOutcome> publish;
    };

    struct RunState;

    void drive(RunState& state);
    void drainRunning(RunState& state);
    bool evaluateWaiting(RunState& state);
    void dispatchReady(RunState& state);
    void dispatch(RunState& state, size_t index);
    void processCompletion(RunState& state, Completion completion);
    void applyFailFast(RunState& state, size_t failed_index);
    void cancelRun(RunState& state, const std::string& reason);
    void skipUnreachable(RunState& state);

    JobRequest buildRequest(const PipelineRun& run, const JobInstance& instance, const JobTemplate& job) const;
    std::vector<Artifact> upstreamArtifacts(const PipelineRun& run, const JobTemplate& job) const;

    void markTerminal(RunState& state, size_t index, JobStatus status, const std::string& reason);
    void postCompletion(Completion completion);
    void emit(RunEventType type, const PipelineRun& run, const std::string& instance_id, JobStatus status,
              const std::string& message);

    const PipelineDefinition& definition_;
    JobExecutor& executor_;
    ThreadPool& pool_;
    ReleasePublisher* publisher_;
    RunnerConfig config_;
    RunEventCallback callback_;

    std::mutex completion_mutex_;
    std::condition_variable completion_condition_;
    std::deque<Completion> completions_;
};

} // namespace Orchestrator
} // namespace CDO
