#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/config/config_manager.hpp"
#include "orchestrator/dependency_graph_runner.hpp"
#include "orchestrator/job_executor.hpp"
#include "orchestrator/pipeline_definition.hpp"
#include "orchestrator/pipeline_types.hpp"
#include "orchestrator/release_publisher.hpp"

namespace CDO {
namespace Orchestrator {

// EN: Main engine: owns registered pipelines, the worker pool, active runs and run history.
//     Each triggered run is driven by its own DependencyGraphRunner on a dedicated thread while
//     job bodies share the pool.
// FR: Moteur principal : possède les pipelines enregistrés, le pool de workers, les runs actives
//     et l'historique. Chaque run est menée par son propre DependencyGraphRunner.
class PipelineEngine {
public:
    struct Config {
        size_t thread_pool_size = 8;
        size_t max_concurrent_jobs = 0;                 // EN: Per run, 0 = unbounded / FR: Par run, 0 = illimité
        bool cancel_superseded_runs = true;             // EN: A new push cancels older runs of the same ref / FR: Un nouveau push annule les runs du même ref
        bool chain_upstream_completions = true;         // EN: Feed finished runs back as workflow_completion events / FR: Réinjecte les runs terminées
        size_t max_chain_depth = 8;                     // EN: Guard against follow loops / FR: Protection contre les boucles de suivi
        size_t max_run_history = 100;                   // EN: Finished runs kept in memory / FR: Runs terminées gardées en mémoire
        std::chrono::milliseconds poll_interval{20};

        // EN: Reads the engine.* section of the global ConfigManager, keeping defaults for missing keys
        // FR: Lit la section engine.* du ConfigManager global, avec les défauts pour les clés absentes
        static Config fromConfigManager();

        // EN: Rules for every engine.*, executor.* and release.* key read by cdoctl
        // FR: Règles pour chaque clé engine.*, executor.* et release.* lue par cdoctl
        static std::vector<ConfigManager::ValidationRule> validationRules();
    };

    // EN: The endpoint may be null; release jobs then fail with a clear reason
    // FR: L'endpoint peut être nul; les jobs de release échouent alors avec une raison claire
    PipelineEngine(const Config& config, std::shared_ptr<JobExecutor> executor,
                   std::shared_ptr<ReleaseEndpoint> endpoint = nullptr);
    ~PipelineEngine();

    PipelineEngine(const PipelineEngine&) = delete;
    PipelineEngine& operator=(const PipelineEngine&) = delete;

    // EN: Pipeline management. Registering a name twice replaces the earlier definition.
    // FR: Gestion des pipelines. Enregistrer deux fois un nom remplace la définition précédente.
    void registerPipeline(const PipelineDefinition& definition);
    std::string loadPipelineFile(const std::string& path, const PipelineLoaderOptions& options = {});
    bool unregisterPipeline(const std::string& name);
    std::vector<std::string> getPipelineNames() const;
    std::optional<PipelineDefinition> getPipeline(const std::string& name) const;

    // EN: Starts one run per pipeline whose trigger matches; returns the new run ids
    // FR: Démarre une run par pipeline dont le trigger correspond; retourne les ids des runs
    std::vector<std::string> dispatchEvent(const Event& event);

    // EN: Dispatches and waits until the engine is idle; returns every run started meanwhile,
    //     chained runs included, in start order
    // FR: Lance puis attend que le moteur soit inactif; retourne toutes les runs démarrées
    std::vector<PipelineRun> executeEvent(const Event& event);

    bool waitForRun(const std::string& run_id,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds::max());
    bool waitForIdle(std::chrono::milliseconds timeout = std::chrono::milliseconds::max());

    // EN: Run control
    // FR: Contrôle des runs
    bool cancelRun(const std::string& run_id);
    size_t cancelAll();

    // EN: Finished runs only; active runs are owned by their runner until they end
    // FR: Runs terminées seulement; les runs actives appartiennent à leur runner
    std::optional<PipelineRun> getRun(const std::string& run_id) const;
    std::vector<PipelineRun> getRunHistory() const;
    std::vector<std::string> getActiveRunIds() const;

    void registerEventCallback(RunEventCallback callback);
    void unregisterEventCallback();

    Config getConfig() const;

    // EN: Cancels active runs, waits for them and stops the pool. Idempotent.
    // FR: Annule les runs actives, les attend et arrête le pool. Idempotent.
    void shutdown();

private:
    class PipelineEngineImpl;
    std::unique_ptr<PipelineEngineImpl> impl_;
};

} // namespace Orchestrator
} // namespace CDO
