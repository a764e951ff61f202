#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "orchestrator/pipeline_types.hpp"

namespace YAML {
class Node;
}

namespace CDO {
namespace Orchestrator {

// EN: Thrown when a pipeline file cannot be parsed or fails validation
// FR: Lancée quand un fichier de pipeline ne peut être parsé ou échoue à la validation
class PipelineDefinitionError : public std::runtime_error {
public:
    explicit PipelineDefinitionError(const std::string& message) : std::runtime_error(message) {}
};

// EN: One trigger rule: an event kind plus optional ref globs (and source pipelines for completions)
// FR: Une règle de déclenchement : un type d'événement plus des globs de ref optionnels
struct TriggerRule {
    EventKind kind = EventKind::PUSH;
    std::vector<std::string> ref_patterns;      // EN: Empty matches every ref / FR: Vide = toute ref
    std::vector<std::string> source_pipelines;  // EN: workflow_completion only / FR: workflow_completion seulement
};

struct PipelineDefinition {
    std::string name;
    std::string source_path;
    std::vector<TriggerRule> triggers;          // EN: Declared order, first match wins / FR: Ordre déclaré
    std::vector<JobTemplate> jobs;              // EN: Declared order / FR: Ordre déclaré

    const JobTemplate* findJob(const std::string& job_name) const;
};

struct PipelineLoaderOptions {
    // EN: Policy applied to release blocks that do not set on_existing
    // FR: Politique appliquée aux blocs release sans on_existing
    ExistingReleasePolicy default_on_existing = ExistingReleasePolicy::FAIL_IF_EXISTS;
};

// EN: Loads YAML pipeline files into validated PipelineDefinitions. Accepts the native format
//     and the common workflow layout (on/jobs/strategy/steps, workflow_run, gh-release steps).
// FR: Charge les fichiers YAML de pipeline en PipelineDefinitions validées.
class PipelineDefinitionLoader {
public:
    explicit PipelineDefinitionLoader(PipelineLoaderOptions options = PipelineLoaderOptions{});

    // EN: Throws PipelineDefinitionError on I/O, syntax or validation errors
    // FR: Lance PipelineDefinitionError sur erreur d'E/S, de syntaxe ou de validation
    PipelineDefinition loadFile(const std::string& path) const;
    PipelineDefinition loadString(const std::string& content, const std::string& default_name = "") const;

    // EN: Structural checks: names, unknown needs, self needs, dependency cycles, release templates
    // FR: Vérifications structurelles : noms, needs inconnus, cycles, templates de release
    static void validate(const PipelineDefinition& definition);

    // EN: Returns the job names that form a dependency cycle, empty if the graph is acyclic
    // FR: Retourne les jobs formant un cycle de dépendances, vide si le graphe est acyclique
    static std::vector<std::string> findCycle(const PipelineDefinition& definition);

private:
    PipelineDefinition parseRoot(const YAML::Node& root, const std::string& default_name) const;
    std::vector<TriggerRule> parseTriggers(const YAML::Node& node) const;
    JobTemplate parseJob(const std::string& name, const YAML::Node& node) const;
    MatrixSpec parseStrategy(const std::string& job_name, const YAML::Node& node) const;
    ReleaseSpec parseRelease(const std::string& job_name, const YAML::Node& node) const;
    JobStep parseStep(const std::string& job_name, const YAML::Node& node) const;

    PipelineLoaderOptions options_;
};

} // namespace Orchestrator
} // namespace CDO
