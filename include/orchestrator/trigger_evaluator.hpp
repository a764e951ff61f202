#pragma once

#include <optional>
#include <string>

#include "orchestrator/pipeline_definition.hpp"
#include "orchestrator/pipeline_types.hpp"

namespace CDO {
namespace Orchestrator {

// EN: Decides whether an event starts a run of one pipeline and binds the run variables.
//     Rules are tried in declared order and the first match wins. An upstream completion only
//     starts a run when its conclusion is "success".
// FR: Décide si un événement démarre un run d'un pipeline et lie les variables du run.
//     Les règles sont testées dans l'ordre déclaré, la première qui correspond gagne.
class TriggerEvaluator {
public:
    explicit TriggerEvaluator(const PipelineDefinition& definition);

    // EN: No match is not an error: returns std::nullopt
    // FR: Pas de correspondance n'est pas une erreur : retourne std::nullopt
    std::optional<PipelineRun> evaluate(const Event& event) const;

    // EN: Index of the first matching rule, if any
    // FR: Index de la première règle correspondante, s'il y en a une
    std::optional<size_t> findMatchingRule(const Event& event) const;

    // EN: Run variables derived from an event (ref, ref_name, ref_type, tag_name, ...)
    // FR: Variables de run dérivées d'un événement (ref, ref_name, ref_type, tag_name, ...)
    static VariableMap bindVariables(const Event& event);

private:
    bool matches(const TriggerRule& rule, const Event& event) const;
    static bool matchesAnyPattern(const std::vector<std::string>& patterns, const std::string& ref);
    static std::string nextRunId(const std::string& pipeline_name);

    const PipelineDefinition& definition_;
};

} // namespace Orchestrator
} // namespace CDO
