#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "orchestrator/pipeline_types.hpp"

namespace CDO {
namespace Orchestrator {

// EN: Serializes a finished (or in-flight) PipelineRun for cdoctl and logs.
// FR: Sérialise une PipelineRun terminée (ou en cours) pour cdoctl et les logs.
class RunReport {
public:
    // EN: Full report: run fields, variables, and one entry per job instance
    // FR: Rapport complet : champs de la run, variables et une entrée par instance
    static nlohmann::json toJson(const PipelineRun& run);

    // EN: One line per instance, then the conclusion
    // FR: Une ligne par instance, puis la conclusion
    static std::string toText(const PipelineRun& run);

    static nlohmann::json instanceToJson(const JobInstance& instance);
    static nlohmann::json publishOutcomeToJson(const PublishOutcome& outcome);
};

} // namespace Orchestrator
} // namespace CDO
