#include "orchestrator/run_report.hpp"

#include <iomanip>
#include <sstream>

namespace CDO {
namespace Orchestrator {

nlohmann::json RunReport::toJson(const PipelineRun& run) {
    nlohmann::json report;
    report["run_id"] = run.run_id;
    report["pipeline"] = run.pipeline_name;
    report["event"] = PipelineUtils::eventKindToString(effectiveEventKind(run.event));
    report["conclusion"] = run.conclusion ? nlohmann::json(PipelineUtils::conclusionToString(*run.conclusion))
                                          : nlohmann::json(nullptr);
    report["created_at"] = PipelineUtils::formatTimestamp(run.created_at);
    if (run.finished_at) {
        report["finished_at"] = PipelineUtils::formatTimestamp(*run.finished_at);
        report["duration_ms"] =
            std::chrono::duration_cast<std::chrono::milliseconds>(*run.finished_at - run.created_at).count();
    }
    report["cancel_requested"] = run.cancellation.isCancelled();

    report["variables"] = nlohmann::json::object();
    for (const auto& [name, value] : run.variables) {
        report["variables"][name] = value;
    }

    report["jobs"] = nlohmann::json::array();
    for (const auto& instance : run.instances) {
        report["jobs"].push_back(instanceToJson(instance));
    }
    return report;
}

nlohmann::json RunReport::instanceToJson(const JobInstance& instance) {
    nlohmann::json job;
    job["id"] = instance.id;
    job["template"] = instance.template_name;
    job["status"] = PipelineUtils::statusToString(instance.status);
    job["cancel_requested"] = instance.cancel_requested;
    if (!instance.status_reason.empty()) {
        job["reason"] = instance.status_reason;
    }

    nlohmann::json bindings = nlohmann::json::object();
    for (const auto& [axis, value] : instance.bindings) {
        bindings[axis] = value;
    }
    job["matrix"] = bindings;

    if (instance.exit_code) {
        job["exit_code"] = *instance.exit_code;
    }
    if (instance.started_at && instance.finished_at) {
        job["duration_ms"] =
            std::chrono::duration_cast<std::chrono::milliseconds>(*instance.finished_at - *instance.started_at).count();
    }

    job["artifacts"] = nlohmann::json::array();
    for (const auto& artifact : instance.artifacts) {
        job["artifacts"].push_back({{"name", artifact.name}, {"size", artifact.content.size()}});
    }

    if (instance.publish_outcome) {
        job["release"] = publishOutcomeToJson(*instance.publish_outcome);
    }
    return job;
}

nlohmann::json RunReport::publishOutcomeToJson(const PublishOutcome& outcome) {
    nlohmann::json release;
    release["status"] = PipelineUtils::publishStatusToString(outcome.status);
    if (outcome.error != PublishError::NONE) {
        release["error"] = PipelineUtils::publishErrorToString(outcome.error);
    }
    if (!outcome.release_id.empty()) {
        release["release_id"] = outcome.release_id;
    }
    if (!outcome.message.empty()) {
        release["message"] = outcome.message;
    }
    release["assets"] = outcome.uploaded_assets;
    if (!outcome.orphaned_release_id.empty()) {
        release["orphaned_release_id"] = outcome.orphaned_release_id;
    }
    return release;
}

std::string RunReport::toText(const PipelineRun& run) {
    std::ostringstream out;
    out << run.pipeline_name << " [" << run.run_id << "]\n";
    for (const auto& instance : run.instances) {
        out << "  " << std::left << std::setw(10) << PipelineUtils::statusToString(instance.status) << " "
            << instance.id;
        if (!instance.status_reason.empty()) {
            out << " - " << instance.status_reason;
        }
        out << "\n";
    }
    out << "  conclusion: "
        << (run.conclusion ? PipelineUtils::conclusionToString(*run.conclusion) : std::string("running")) << "\n";
    return out.str();
}

} // namespace Orchestrator
} // namespace CDO
