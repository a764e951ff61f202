#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "orchestrator/condition.hpp"

namespace CDO {
namespace Orchestrator {

// ---------------------------------------------------------------------------
// EN: Events
// FR: Événements
// ---------------------------------------------------------------------------

struct PushEvent {
    std::string ref;                    // EN: Full ref, e.g. refs/heads/main / FR: Ref complète
};

struct PullRequestEvent {
    std::string base_ref;
    std::string head_ref;
};

struct TagEvent {
    std::string ref;                    // EN: refs/tags/<name> / FR: refs/tags/<nom>
    std::string tag_name;
};

// EN: Completion of another pipeline's run
// FR: Fin d'un run d'un autre pipeline
struct UpstreamCompletionEvent {
    std::string source_pipeline;
    std::string conclusion;             // EN: "success", "failure" or "cancelled" / FR: idem
    std::string source_branch;
};

// EN: Immutable trigger input, consumed once by the trigger evaluator
// FR: Entrée de déclenchement immuable, consommée une fois par l'évaluateur
using Event = std::variant<PushEvent, PullRequestEvent, TagEvent, UpstreamCompletionEvent>;

enum class EventKind {
    PUSH = 0,
    PULL_REQUEST = 1,
    TAG = 2,
    WORKFLOW_COMPLETION = 3
};

EventKind eventKindOf(const Event& event);

// EN: Kind used for trigger selection and run variables: a push of refs/tags/... counts as TAG
// FR: Type utilisé pour la sélection et les variables : un push de refs/tags/... compte comme TAG
EventKind effectiveEventKind(const Event& event);

// ---------------------------------------------------------------------------
// EN: Statuses
// FR: Statuts
// ---------------------------------------------------------------------------

enum class JobStatus {
    PENDING = 0,        // EN: Created, not yet evaluated / FR: Créé, pas encore évalué
    BLOCKED = 1,        // EN: Waiting for needed templates / FR: En attente des templates requis
    READY = 2,          // EN: Eligible for dispatch / FR: Éligible au lancement
    RUNNING = 3,        // EN: Body submitted to a worker / FR: Corps soumis à un worker
    SUCCEEDED = 4,
    FAILED = 5,
    CANCELLED = 6,
    SKIPPED = 7         // EN: Needs unmet or condition false / FR: Dépendances non satisfaites ou condition fausse
};

bool isTerminal(JobStatus status);

enum class RunConclusion {
    SUCCESS = 0,
    FAILURE = 1,
    CANCELLED = 2
};

// ---------------------------------------------------------------------------
// EN: Definition side
// FR: Côté définition
// ---------------------------------------------------------------------------

// EN: Output of a job, addressed by its relative path
// FR: Sortie d'un job, adressée par son chemin relatif
struct Artifact {
    std::string name;
    std::string content;
    std::string producer;               // EN: Producing instance id / FR: Id de l'instance productrice
};

struct MatrixSpec {
    std::vector<std::pair<std::string, std::vector<std::string>>> axes; // EN: Declared order / FR: Ordre déclaré
    bool fail_fast = true;
    std::optional<size_t> max_parallel;
};

enum class ExistingReleasePolicy {
    UPDATE_DRAFT = 0,   // EN: Update an existing draft in place / FR: Met à jour un brouillon existant
    FAIL_IF_EXISTS = 1
};

struct ReleaseSpec {
    std::vector<std::string> artifact_globs;
    bool draft = false;
    bool prerelease = false;
    std::string name_template = "${{ ref_name }}";
    std::string tag_template = "${{ ref_name }}";
    std::string body_template;
    bool generate_notes = false;
    std::optional<Condition> condition;
    ExistingReleasePolicy on_existing = ExistingReleasePolicy::FAIL_IF_EXISTS;
};

// EN: Opaque job step. Either a shell command (run) or an external action (uses).
// FR: Étape de job opaque. Soit une commande shell (run), soit une action externe (uses).
struct JobStep {
    std::string name;
    std::string run;
    std::string uses;
    std::map<std::string, std::string> with;
};

struct JobTemplate {
    std::string name;
    std::vector<JobStep> steps;
    std::vector<std::string> needs;
    std::optional<Condition> condition;
    std::optional<MatrixSpec> matrix;
    std::string runs_on;
    std::vector<std::string> artifact_globs;
    std::optional<ReleaseSpec> release;

    bool isRelease() const { return release.has_value(); }
};

// ---------------------------------------------------------------------------
// EN: Publish outcome (recorded on the release instance)
// FR: Résultat de publication (enregistré sur l'instance de release)
// ---------------------------------------------------------------------------

enum class PublishStatus {
    PUBLISHED = 0,
    SKIPPED = 1,
    FAILED = 2
};

enum class PublishError {
    NONE = 0,
    NO_ARTIFACTS = 1,
    ALREADY_EXISTS = 2,
    TRANSPORT_FAILURE = 3,
    CANCELLED = 4,
    INVALID_SPEC = 5    // EN: Name, tag or body template could not be rendered / FR: Template de nom, tag ou corps invalide
};

struct PublishOutcome {
    PublishStatus status = PublishStatus::SKIPPED;
    PublishError error = PublishError::NONE;
    std::string release_id;
    std::string message;
    std::vector<std::string> uploaded_assets;
    std::string orphaned_release_id;    // EN: Set when rollback failed / FR: Défini si le rollback a échoué

    static PublishOutcome published(const std::string& release_id, std::vector<std::string> assets);
    static PublishOutcome skipped(const std::string& reason);
    static PublishOutcome failed(PublishError error, const std::string& message);
};

// ---------------------------------------------------------------------------
// EN: Cancellation (request/acknowledge)
// FR: Annulation (requête/acquittement)
// ---------------------------------------------------------------------------

// EN: Read side. Cancelled when any of the sources it observes is cancelled.
// FR: Côté lecture. Annulé dès qu'une des sources observées est annulée.
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const;

    // EN: Token that also observes `other`
    // FR: Token qui observe aussi `other`
    CancellationToken combinedWith(const CancellationToken& other) const;

private:
    friend class CancellationSource;
    std::vector<std::shared_ptr<const std::atomic<bool>>> flags_;
};

class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    // EN: Returns true on the first call only
    // FR: Retourne true seulement au premier appel
    bool cancel();
    bool isCancelled() const { return flag_->load(); }
    CancellationToken token() const;

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// ---------------------------------------------------------------------------
// EN: Run side
// FR: Côté exécution
// ---------------------------------------------------------------------------

struct JobInstance {
    std::string id;
    std::string template_name;
    MatrixBindings bindings;
    JobStatus status = JobStatus::PENDING;
    std::vector<Artifact> artifacts;
    bool cancel_requested = false;
    std::optional<int> exit_code;
    std::string status_reason;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> finished_at;
    std::optional<PublishOutcome> publish_outcome;
};

// EN: Owned aggregate of one pipeline execution. Only the runner mutates its instances.
// FR: Agrégat possédé d'une exécution de pipeline. Seul le runner modifie ses instances.
struct PipelineRun {
    std::string run_id;
    std::string pipeline_name;
    Event event;
    VariableMap variables;
    std::vector<JobInstance> instances;
    CancellationSource cancellation;
    std::optional<RunConclusion> conclusion;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
    std::optional<std::chrono::system_clock::time_point> finished_at;

    JobInstance* findInstance(const std::string& id);
    const JobInstance* findInstance(const std::string& id) const;
    std::vector<const JobInstance*> instancesOf(const std::string& template_name) const;
    size_t countWithStatus(JobStatus status) const;
};

// EN: Status conversion helpers
// FR: Fonctions de conversion de statut
namespace PipelineUtils {
    std::string statusToString(JobStatus status);
    std::string conclusionToString(RunConclusion conclusion);
    std::string eventKindToString(EventKind kind);
    std::string publishStatusToString(PublishStatus status);
    std::string publishErrorToString(PublishError error);

    // EN: refs/heads/x and refs/tags/x become x; other refs are returned unchanged
    // FR: refs/heads/x et refs/tags/x deviennent x; les autres refs sont inchangées
    std::string shortRefName(const std::string& ref);

    std::string formatDuration(std::chrono::milliseconds duration);
    std::string formatTimestamp(std::chrono::system_clock::time_point timestamp);
}

} // namespace Orchestrator
} // namespace CDO
