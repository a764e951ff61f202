#pragma once

#include <string>
#include <vector>

#include "orchestrator/pipeline_definition.hpp"
#include "orchestrator/pipeline_types.hpp"

namespace CDO {
namespace Orchestrator {

// EN: Expands job templates into concrete JobInstances (cartesian product of the matrix axes).
// FR: Développe les templates de job en JobInstances concrètes (produit cartésien des axes).
class MatrixExpander {
public:
    // EN: Ordered instances, first axis varies slowest. No matrix gives one unbound instance;
    //     an empty axis gives no instance at all.
    // FR: Instances ordonnées, le premier axe varie le plus lentement. Sans matrice : une instance;
    //     un axe vide : aucune instance.
    static std::vector<JobInstance> expand(const JobTemplate& job);

    // EN: Appends the instances of every template of the definition to the run
    // FR: Ajoute à la run les instances de tous les templates de la définition
    static void expandInto(const PipelineDefinition& definition, PipelineRun& run);

    // EN: "name (v1, v2)" or "name" without bindings
    // FR: "nom (v1, v2)" ou "nom" sans bindings
    static std::string instanceId(const std::string& template_name, const MatrixBindings& bindings);

    // EN: Number of combinations, without materializing them
    // FR: Nombre de combinaisons, sans les construire
    static size_t combinationCount(const JobTemplate& job);
};

} // namespace Orchestrator
} // namespace CDO
