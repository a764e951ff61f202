// EN: Trigger evaluation: event kind and ref glob matching, upstream gating and run variable binding.
// FR: Évaluation des déclencheurs : type d'événement, globs de ref, filtre amont et variables du run.

#include "orchestrator/trigger_evaluator.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>

#include "infrastructure/logging/logger.hpp"

namespace CDO {
namespace Orchestrator {

namespace {

const std::string kTagPrefix = "refs/tags/";
const std::string kHeadsPrefix = "refs/heads/";

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

std::string tagNameOf(const std::string& ref, const std::string& tag_name) {
    return tag_name.empty() ? PipelineUtils::shortRefName(ref) : tag_name;
}

} // namespace

TriggerEvaluator::TriggerEvaluator(const PipelineDefinition& definition) : definition_(definition) {}

std::optional<PipelineRun> TriggerEvaluator::evaluate(const Event& event) const {
    const auto rule_index = findMatchingRule(event);
    if (!rule_index) {
        LOG_DEBUG("trigger", "No trigger rule of '" + definition_.name + "' matches " +
                  PipelineUtils::eventKindToString(effectiveEventKind(event)) + " event");
        return std::nullopt;
    }

    PipelineRun run;
    run.run_id = nextRunId(definition_.name);
    run.pipeline_name = definition_.name;
    run.event = event;
    run.variables = bindVariables(event);
    run.variables["pipeline"] = definition_.name;
    run.variables["run_id"] = run.run_id;

    LOG_INFO_META("trigger", "Pipeline '" + definition_.name + "' triggered",
                  (Logger::Metadata{{"run_id", run.run_id},
                                    {"event", run.variables["event"]},
                                    {"ref", run.variables["ref"]},
                                    {"rule", std::to_string(*rule_index)}}));
    return run;
}

std::optional<size_t> TriggerEvaluator::findMatchingRule(const Event& event) const {
    if (const auto* upstream = std::get_if<UpstreamCompletionEvent>(&event)) {
        if (upstream->conclusion != "success") {
            LOG_DEBUG("trigger", "Upstream '" + upstream->source_pipeline + "' concluded with " +
                      upstream->conclusion + ", dependent runs are not started");
            return std::nullopt;
        }
    }

    for (size_t i = 0; i < definition_.triggers.size(); ++i) {
        try {
            if (matches(definition_.triggers[i], event)) {
                return i;
            }
        } catch (const ConditionParseError& e) {
            LOG_ERROR("trigger", "Trigger rule #" + std::to_string(i + 1) + " of '" + definition_.name +
                      "' is unusable: " + e.what());
        }
    }
    return std::nullopt;
}

bool TriggerEvaluator::matches(const TriggerRule& rule, const Event& event) const {
    if (rule.kind != effectiveEventKind(event)) {
        return false;
    }

    return std::visit([&rule](const auto& e) -> bool {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PushEvent>) {
            const std::string short_ref = PipelineUtils::shortRefName(e.ref);
            return matchesAnyPattern(rule.ref_patterns, short_ref);
        } else if constexpr (std::is_same_v<T, PullRequestEvent>) {
            return matchesAnyPattern(rule.ref_patterns, PipelineUtils::shortRefName(e.base_ref));
        } else if constexpr (std::is_same_v<T, TagEvent>) {
            return matchesAnyPattern(rule.ref_patterns, tagNameOf(e.ref, e.tag_name));
        } else {
            const auto& sources = rule.source_pipelines;
            if (std::find(sources.begin(), sources.end(), e.source_pipeline) == sources.end()) {
                return false;
            }
            return matchesAnyPattern(rule.ref_patterns, PipelineUtils::shortRefName(e.source_branch));
        }
    }, event);
}

bool TriggerEvaluator::matchesAnyPattern(const std::vector<std::string>& patterns, const std::string& ref) {
    if (patterns.empty()) {
        return true;
    }
    for (const auto& pattern : patterns) {
        if (globMatch(pattern, ref)) {
            return true;
        }
    }
    return false;
}

VariableMap TriggerEvaluator::bindVariables(const Event& event) {
    VariableMap variables;
    variables["event"] = PipelineUtils::eventKindToString(effectiveEventKind(event));

    std::visit([&variables](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PushEvent>) {
            variables["ref"] = e.ref;
            variables["ref_name"] = PipelineUtils::shortRefName(e.ref);
            if (startsWith(e.ref, kTagPrefix)) {
                variables["ref_type"] = "tag";
                variables["tag_name"] = variables["ref_name"];
            } else {
                variables["ref_type"] = "branch";
            }
        } else if constexpr (std::is_same_v<T, PullRequestEvent>) {
            variables["ref"] = e.head_ref;
            variables["ref_name"] = PipelineUtils::shortRefName(e.head_ref);
            variables["ref_type"] = "branch";
            variables["base_ref"] = e.base_ref;
            variables["head_ref"] = e.head_ref;
        } else if constexpr (std::is_same_v<T, TagEvent>) {
            const std::string tag_name = tagNameOf(e.ref, e.tag_name);
            variables["ref"] = e.ref.empty() ? kTagPrefix + tag_name : e.ref;
            variables["ref_name"] = tag_name;
            variables["ref_type"] = "tag";
            variables["tag_name"] = tag_name;
        } else {
            const std::string branch = PipelineUtils::shortRefName(e.source_branch);
            if (!branch.empty()) {
                variables["ref"] = startsWith(e.source_branch, "refs/") ? e.source_branch : kHeadsPrefix + branch;
            }
            variables["ref_name"] = branch;
            variables["ref_type"] = "branch";
            variables["upstream_pipeline"] = e.source_pipeline;
            variables["upstream_conclusion"] = e.conclusion;
            variables["upstream_branch"] = branch;
            variables["event.workflow_run.name"] = e.source_pipeline;
            variables["event.workflow_run.conclusion"] = e.conclusion;
            variables["event.workflow_run.head_branch"] = branch;
        }
    }, event);

    return variables;
}

std::string TriggerEvaluator::nextRunId(const std::string& pipeline_name) {
    static std::atomic<uint64_t> counter{0};
    std::ostringstream oss;
    oss << pipeline_name << "#" << std::setw(4) << std::setfill('0') << ++counter;
    return oss.str();
}

} // namespace Orchestrator
} // namespace CDO
