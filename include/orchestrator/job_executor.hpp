#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "orchestrator/pipeline_types.hpp"

namespace CDO {
namespace Orchestrator {

// EN: Everything an executor needs to run one JobInstance. Steps are already substituted.
// FR: Tout ce dont un exécuteur a besoin pour lancer une JobInstance. Étapes déjà substituées.
struct JobRequest {
    std::string run_id;
    std::string pipeline_name;
    std::string instance_id;
    std::string template_name;
    std::string runs_on;
    std::vector<JobStep> steps;
    MatrixBindings bindings;
    VariableMap variables;
    std::vector<std::string> artifact_globs;
};

enum class JobResult {
    SUCCEEDED = 0,
    FAILED = 1,
    CANCELLED = 2
};

struct JobOutcome {
    JobResult result = JobResult::FAILED;
    std::vector<Artifact> artifacts;
    std::optional<int> exit_code;
    std::optional<size_t> failed_step;     // EN: Index of the failing step / FR: Index de l'étape en échec
    std::string message;

    static JobOutcome succeeded(std::vector<Artifact> artifacts = {});
    static JobOutcome failed(int exit_code, const std::string& message,
                             std::optional<size_t> failed_step = std::nullopt);
    static JobOutcome cancelled(const std::string& message = "cancelled");
};

// EN: Collaborator boundary: runs a job's ordered steps. Implementations must be thread-safe,
//     poll the cancellation token and report instead of throwing for step failures.
// FR: Frontière de collaboration : exécute les étapes ordonnées d'un job. Les implémentations
//     doivent être thread-safe et interroger le token d'annulation.
class JobExecutor {
public:
    virtual ~JobExecutor() = default;
    virtual JobOutcome execute(const JobRequest& request, const CancellationToken& cancellation) = 0;
};

struct ShellExecutorConfig {
    std::string working_directory = ".";                // EN: Shared source tree / FR: Arborescence source partagée
    std::string workspace_root;                         // EN: Empty = <working_directory>/.cdo/workspaces
    std::string shell = "/bin/sh";
    std::chrono::milliseconds poll_interval{20};
    std::chrono::milliseconds kill_grace_period{2000};  // EN: SIGTERM to SIGKILL delay / FR: Délai SIGTERM vers SIGKILL
};

// EN: Runs "run" steps through the shell with run variables exported as CDO_* environment
//     variables. "uses" steps are external actions and are skipped.
//     Every instance gets its own workspace, emptied when the job starts; steps run there and
//     artifacts are only collected from it. CDO_SOURCE_DIR points at the shared working directory.
// FR: Exécute les étapes "run" via le shell avec les variables exportées en CDO_*.
//     Les étapes "uses" sont des actions externes et sont ignorées.
//     Chaque instance a son propre espace de travail, vidé au démarrage du job.
class ShellJobExecutor : public JobExecutor {
public:
    explicit ShellJobExecutor(ShellExecutorConfig config = ShellExecutorConfig{});

    JobOutcome execute(const JobRequest& request, const CancellationToken& cancellation) override;

    // EN: "matrix.python-version" becomes "CDO_MATRIX_PYTHON_VERSION"
    // FR: "matrix.python-version" devient "CDO_MATRIX_PYTHON_VERSION"
    static std::string environmentName(const std::string& variable);

    // EN: <workspace_root>/<run id>/<instance id>, both reduced to file-name safe characters
    // FR: <workspace_root>/<id de run>/<id d'instance>, réduits à des caractères sûrs
    std::string workspaceFor(const JobRequest& request) const;

    // EN: Files under directory whose relative path matches one of the globs, sorted by name
    // FR: Fichiers sous directory dont le chemin relatif correspond à un glob, triés par nom
    static std::vector<Artifact> collectArtifacts(const std::string& directory,
                                                  const std::vector<std::string>& globs,
                                                  const std::string& producer);

    const ShellExecutorConfig& getConfig() const { return config_; }

private:
    struct StepResult {
        bool cancelled = false;
        int exit_code = 0;
    };

    StepResult runStep(const std::string& command, const std::string& directory,
                       const std::vector<std::string>& environment, const CancellationToken& cancellation) const;
    std::vector<std::string> buildEnvironment(const JobRequest& request, const std::string& workspace) const;

    ShellExecutorConfig config_;
};

} // namespace Orchestrator
} // namespace CDO
