// EN: YAML pipeline loader and structural validation (needs, cycles, conditions, templates).
// FR: Chargeur de pipelines YAML et validation structurelle (needs, cycles, conditions, templates).

#include "orchestrator/pipeline_definition.hpp"

#include <algorithm>
#include <filesystem>
#include <functional>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

#include <yaml-cpp/yaml.h>

#include "infrastructure/logging/logger.hpp"

namespace CDO {
namespace Orchestrator {

namespace {

const std::string kReleaseActionPrefix = "softprops/action-gh-release";

std::string trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string scalarOf(const YAML::Node& node, const std::string& context) {
    if (!node.IsScalar()) {
        throw PipelineDefinitionError(context + ": expected a scalar value");
    }
    return node.Scalar();
}

// EN: Scalar, newline separated scalar or sequence of scalars
// FR: Scalaire, scalaire multi-ligne ou séquence de scalaires
std::vector<std::string> stringListOf(const YAML::Node& node, const std::string& context) {
    std::vector<std::string> values;
    if (!node || node.IsNull()) {
        return values;
    }
    if (node.IsScalar()) {
        std::istringstream lines(node.Scalar());
        std::string line;
        while (std::getline(lines, line)) {
            line = trim(line);
            if (!line.empty()) {
                values.push_back(line);
            }
        }
        return values;
    }
    if (!node.IsSequence()) {
        throw PipelineDefinitionError(context + ": expected a string or a list of strings");
    }
    for (const auto& item : node) {
        values.push_back(scalarOf(item, context));
    }
    return values;
}

bool boolOf(const YAML::Node& node, const std::string& context) {
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        throw PipelineDefinitionError(context + ": expected a boolean, got '" +
                                      (node.IsScalar() ? node.Scalar() : std::string("<node>")) + "'");
    }
}

Condition conditionOf(const YAML::Node& node, const std::string& context) {
    try {
        return Condition::parse(scalarOf(node, context));
    } catch (const ConditionParseError& e) {
        throw PipelineDefinitionError(context + ": " + e.what());
    }
}

void checkTemplate(const std::string& text, const std::string& context) {
    static const VariableMap empty;
    try {
        (void)substitute(text, VariableScope(empty));
    } catch (const ConditionParseError& e) {
        throw PipelineDefinitionError(context + ": " + e.what());
    }
}

void checkGlobs(const std::vector<std::string>& patterns, const std::string& context) {
    for (const auto& pattern : patterns) {
        try {
            validateGlob(pattern);
        } catch (const ConditionParseError&) {
            throw PipelineDefinitionError(context + ": invalid glob pattern '" + pattern + "'");
        }
    }
}

std::string quoteList(const std::vector<std::string>& names) {
    std::string result;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            result += " -> ";
        }
        result += "'" + names[i] + "'";
    }
    return result;
}

} // namespace

const JobTemplate* PipelineDefinition::findJob(const std::string& job_name) const {
    for (const auto& job : jobs) {
        if (job.name == job_name) {
            return &job;
        }
    }
    return nullptr;
}

PipelineDefinitionLoader::PipelineDefinitionLoader(PipelineLoaderOptions options)
    : options_(options) {}

PipelineDefinition PipelineDefinitionLoader::loadFile(const std::string& path) const {
    if (!std::filesystem::exists(path)) {
        throw PipelineDefinitionError("Pipeline file not found: " + path);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw PipelineDefinitionError("Failed to parse pipeline file " + path + ": " + e.what());
    }

    PipelineDefinition definition = parseRoot(root, std::filesystem::path(path).stem().string());
    definition.source_path = path;
    validate(definition);

    LOG_INFO_META("pipeline_definition", "Pipeline loaded: " + definition.name,
                  (Logger::Metadata{{"file", path},
                                    {"jobs", std::to_string(definition.jobs.size())},
                                    {"triggers", std::to_string(definition.triggers.size())}}));
    return definition;
}

PipelineDefinition PipelineDefinitionLoader::loadString(const std::string& content,
                                                        const std::string& default_name) const {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        throw PipelineDefinitionError("Failed to parse pipeline definition: " + std::string(e.what()));
    }

    PipelineDefinition definition = parseRoot(root, default_name);
    validate(definition);
    return definition;
}

PipelineDefinition PipelineDefinitionLoader::parseRoot(const YAML::Node& root,
                                                       const std::string& default_name) const {
    if (!root.IsMap()) {
        throw PipelineDefinitionError("Pipeline definition must be a mapping");
    }

    PipelineDefinition definition;
    definition.name = root["name"] ? trim(scalarOf(root["name"], "name")) : default_name;

    // EN: yaml-cpp keeps "on" as a plain string key
    // FR: yaml-cpp garde "on" comme clé chaîne
    definition.triggers = parseTriggers(root["on"]);

    const YAML::Node jobs = root["jobs"];
    if (!jobs || !jobs.IsMap() || jobs.size() == 0) {
        throw PipelineDefinitionError("Pipeline '" + definition.name + "' declares no jobs");
    }
    for (const auto& entry : jobs) {
        const std::string job_name = entry.first.as<std::string>();
        definition.jobs.push_back(parseJob(job_name, entry.second));
    }

    if (definition.triggers.empty()) {
        LOG_WARN("pipeline_definition", "Pipeline '" + definition.name + "' has no trigger rule");
    }
    return definition;
}

std::vector<TriggerRule> PipelineDefinitionLoader::parseTriggers(const YAML::Node& node) const {
    std::vector<TriggerRule> rules;
    if (!node || node.IsNull()) {
        return rules;
    }

    auto addRules = [&rules](const std::string& kind, const YAML::Node& config) {
        const std::string context = "on." + kind;
        const bool has_map = config.IsMap();
        if (kind == "push") {
            const YAML::Node branches = has_map ? config["branches"] : YAML::Node();
            const YAML::Node tags = has_map ? config["tags"] : YAML::Node();
            const bool has_branches = branches && !branches.IsNull();
            const bool has_tags = tags && !tags.IsNull();
            if (has_branches || !has_tags) {
                TriggerRule rule;
                rule.kind = EventKind::PUSH;
                rule.ref_patterns = stringListOf(branches, context + ".branches");
                rules.push_back(rule);
            }
            if (has_tags || !has_branches) {
                TriggerRule rule;
                rule.kind = EventKind::TAG;
                rule.ref_patterns = stringListOf(tags, context + ".tags");
                rules.push_back(rule);
            }
        } else if (kind == "pull_request") {
            TriggerRule rule;
            rule.kind = EventKind::PULL_REQUEST;
            if (has_map) {
                rule.ref_patterns = stringListOf(config["branches"], context + ".branches");
            }
            rules.push_back(rule);
        } else if (kind == "tag" || kind == "tags") {
            TriggerRule rule;
            rule.kind = EventKind::TAG;
            rule.ref_patterns = has_map ? stringListOf(config["tags"], context + ".tags")
                                        : stringListOf(config, context);
            rules.push_back(rule);
        } else if (kind == "workflow_completion" || kind == "workflow_run") {
            TriggerRule rule;
            rule.kind = EventKind::WORKFLOW_COMPLETION;
            if (has_map) {
                rule.source_pipelines = stringListOf(config["workflows"], context + ".workflows");
                rule.ref_patterns = stringListOf(config["branches"], context + ".branches");
            }
            if (rule.source_pipelines.empty()) {
                throw PipelineDefinitionError(context + ": at least one source workflow is required");
            }
            rules.push_back(rule);
        } else {
            LOG_WARN("pipeline_definition", "Ignoring unsupported trigger kind: " + kind);
        }
    };

    if (node.IsScalar()) {
        addRules(node.Scalar(), YAML::Node());
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            addRules(scalarOf(item, "on"), YAML::Node());
        }
    } else if (node.IsMap()) {
        for (const auto& entry : node) {
            addRules(entry.first.as<std::string>(), entry.second);
        }
    } else {
        throw PipelineDefinitionError("on: expected a trigger name, list or mapping");
    }
    return rules;
}

JobTemplate PipelineDefinitionLoader::parseJob(const std::string& name, const YAML::Node& node) const {
    const std::string context = "jobs." + name;
    if (!node.IsMap()) {
        throw PipelineDefinitionError(context + ": job definition must be a mapping");
    }

    JobTemplate job;
    job.name = trim(name);

    job.needs = stringListOf(node["needs"], context + ".needs");

    if (node["if"]) {
        job.condition = conditionOf(node["if"], context + ".if");
    }

    if (node["runs-on"]) {
        job.runs_on = scalarOf(node["runs-on"], context + ".runs-on");
        checkTemplate(job.runs_on, context + ".runs-on");
    }

    if (node["strategy"]) {
        job.matrix = parseStrategy(name, node["strategy"]);
    } else if (node["matrix"]) {
        YAML::Node strategy;
        strategy["matrix"] = node["matrix"];
        job.matrix = parseStrategy(name, strategy);
    }

    if (node["steps"]) {
        const YAML::Node steps = node["steps"];
        if (!steps.IsSequence()) {
            throw PipelineDefinitionError(context + ".steps: expected a list");
        }
        for (size_t i = 0; i < steps.size(); ++i) {
            const YAML::Node step_node = steps[i];
            const std::string step_context = context + ".steps[" + std::to_string(i) + "]";

            // EN: A gh-release step becomes the job's release block instead of a shell step
            // FR: Une étape gh-release devient le bloc release du job au lieu d'une étape shell
            if (step_node.IsMap() && step_node["uses"] &&
                scalarOf(step_node["uses"], step_context + ".uses").rfind(kReleaseActionPrefix, 0) == 0) {
                if (job.release) {
                    throw PipelineDefinitionError(context + ": more than one release step");
                }
                job.release = parseRelease(name, step_node["with"] ? step_node["with"] : YAML::Node(YAML::NodeType::Map));
                if (step_node["if"]) {
                    job.release->condition = conditionOf(step_node["if"], step_context + ".if");
                }
                continue;
            }
            job.steps.push_back(parseStep(name, step_node));
        }
    }

    if (node["release"]) {
        if (job.release) {
            throw PipelineDefinitionError(context + ": more than one release block");
        }
        job.release = parseRelease(name, node["release"]);
    }

    job.artifact_globs = stringListOf(node["artifacts"], context + ".artifacts");
    if (job.release && job.artifact_globs.empty()) {
        job.artifact_globs = job.release->artifact_globs;
    }

    return job;
}

MatrixSpec PipelineDefinitionLoader::parseStrategy(const std::string& job_name, const YAML::Node& node) const {
    const std::string context = "jobs." + job_name + ".strategy";
    if (!node.IsMap()) {
        throw PipelineDefinitionError(context + ": expected a mapping");
    }

    MatrixSpec matrix;
    if (node["fail-fast"]) {
        matrix.fail_fast = boolOf(node["fail-fast"], context + ".fail-fast");
    }
    if (node["max-parallel"]) {
        int max_parallel = 0;
        try {
            max_parallel = node["max-parallel"].as<int>();
        } catch (const YAML::Exception&) {
            throw PipelineDefinitionError(context + ".max-parallel: expected an integer");
        }
        if (max_parallel <= 0) {
            throw PipelineDefinitionError(context + ".max-parallel: must be positive");
        }
        matrix.max_parallel = static_cast<size_t>(max_parallel);
    }

    const YAML::Node axes = node["matrix"];
    if (axes) {
        if (!axes.IsMap()) {
            throw PipelineDefinitionError(context + ".matrix: expected a mapping of axes");
        }
        for (const auto& axis : axes) {
            const std::string axis_name = axis.first.as<std::string>();
            if (axis_name == "include" || axis_name == "exclude") {
                throw PipelineDefinitionError(context + ".matrix." + axis_name + " is not supported");
            }
            matrix.axes.emplace_back(axis_name, stringListOf(axis.second, context + ".matrix." + axis_name));
        }
    }
    return matrix;
}

ReleaseSpec PipelineDefinitionLoader::parseRelease(const std::string& job_name, const YAML::Node& node) const {
    const std::string context = "jobs." + job_name + ".release";
    if (!node.IsMap()) {
        throw PipelineDefinitionError(context + ": expected a mapping");
    }

    ReleaseSpec release;
    release.on_existing = options_.default_on_existing;
    release.artifact_globs = stringListOf(node["files"], context + ".files");

    if (node["draft"]) {
        release.draft = boolOf(node["draft"], context + ".draft");
    }
    if (node["prerelease"]) {
        release.prerelease = boolOf(node["prerelease"], context + ".prerelease");
    }
    if (node["name"]) {
        release.name_template = scalarOf(node["name"], context + ".name");
    }
    if (node["tag"]) {
        release.tag_template = scalarOf(node["tag"], context + ".tag");
    } else if (node["tag_name"]) {
        release.tag_template = scalarOf(node["tag_name"], context + ".tag_name");
    }
    if (node["body"]) {
        const std::string body = scalarOf(node["body"], context + ".body");
        if (trim(body) == "auto") {
            release.generate_notes = true;
        } else {
            release.body_template = body;
        }
    }
    for (const char* key : {"generate_release_notes", "generate_notes"}) {
        if (node[key]) {
            release.generate_notes = boolOf(node[key], context + "." + key);
        }
    }
    if (node["if"]) {
        release.condition = conditionOf(node["if"], context + ".if");
    }
    if (node["on_existing"]) {
        const std::string policy = scalarOf(node["on_existing"], context + ".on_existing");
        if (policy == "update" || policy == "update_draft") {
            release.on_existing = ExistingReleasePolicy::UPDATE_DRAFT;
        } else if (policy == "fail" || policy == "fail_if_exists") {
            release.on_existing = ExistingReleasePolicy::FAIL_IF_EXISTS;
        } else {
            throw PipelineDefinitionError(context + ".on_existing: expected 'update' or 'fail', got '" +
                                          policy + "'");
        }
    }

    checkTemplate(release.name_template, context + ".name");
    checkTemplate(release.tag_template, context + ".tag");
    checkTemplate(release.body_template, context + ".body");
    return release;
}

JobStep PipelineDefinitionLoader::parseStep(const std::string& job_name, const YAML::Node& node) const {
    const std::string context = "jobs." + job_name + ".steps";
    JobStep step;

    if (node.IsScalar()) {
        step.run = node.Scalar();
    } else if (node.IsMap()) {
        if (node["name"]) {
            step.name = scalarOf(node["name"], context + ".name");
        }
        if (node["run"]) {
            step.run = scalarOf(node["run"], context + ".run");
        }
        if (node["uses"]) {
            step.uses = scalarOf(node["uses"], context + ".uses");
        }
        if (node["with"]) {
            if (!node["with"].IsMap()) {
                throw PipelineDefinitionError(context + ".with: expected a mapping");
            }
            for (const auto& entry : node["with"]) {
                step.with[entry.first.as<std::string>()] = scalarOf(entry.second, context + ".with");
            }
        }
    } else {
        throw PipelineDefinitionError(context + ": expected a command or a step mapping");
    }

    if (step.run.empty() && step.uses.empty()) {
        throw PipelineDefinitionError(context + ": step needs either 'run' or 'uses'");
    }

    checkTemplate(step.name, context + ".name");
    checkTemplate(step.run, context + ".run");
    for (const auto& [key, value] : step.with) {
        checkTemplate(value, context + ".with." + key);
    }
    return step;
}

void PipelineDefinitionLoader::validate(const PipelineDefinition& definition) {
    if (definition.name.empty()) {
        throw PipelineDefinitionError("Pipeline name must not be empty");
    }

    for (size_t i = 0; i < definition.triggers.size(); ++i) {
        checkGlobs(definition.triggers[i].ref_patterns,
                   "Pipeline '" + definition.name + "' trigger #" + std::to_string(i + 1));
    }

    std::unordered_set<std::string> names;
    for (const auto& job : definition.jobs) {
        if (job.name.empty()) {
            throw PipelineDefinitionError("Pipeline '" + definition.name + "' has a job with an empty name");
        }
        if (!names.insert(job.name).second) {
            throw PipelineDefinitionError("Duplicate job name: " + job.name);
        }
    }

    for (const auto& job : definition.jobs) {
        for (const auto& need : job.needs) {
            if (need == job.name) {
                throw PipelineDefinitionError("Job '" + job.name + "' needs itself");
            }
            if (names.find(need) == names.end()) {
                throw PipelineDefinitionError("Job '" + job.name + "' needs unknown job '" + need + "'");
            }
        }
        if (job.matrix) {
            for (const auto& [axis, values] : job.matrix->axes) {
                if (axis.empty()) {
                    throw PipelineDefinitionError("Job '" + job.name + "' has a matrix axis with an empty name");
                }
                std::unordered_set<std::string> seen;
                for (const auto& value : values) {
                    if (!seen.insert(value).second) {
                        throw PipelineDefinitionError("Job '" + job.name + "' repeats value '" + value +
                                                      "' on matrix axis '" + axis + "'");
                    }
                }
            }
            if (job.matrix->max_parallel && *job.matrix->max_parallel == 0) {
                throw PipelineDefinitionError("Job '" + job.name + "' has max-parallel 0");
            }
        }
        if (job.release && job.release->artifact_globs.empty()) {
            throw PipelineDefinitionError("Release job '" + job.name + "' declares no files");
        }
        checkGlobs(job.artifact_globs, "Job '" + job.name + "' artifacts");
        if (job.release) {
            checkGlobs(job.release->artifact_globs, "Release job '" + job.name + "' files");
        }
    }

    const auto cycle = findCycle(definition);
    if (!cycle.empty()) {
        throw PipelineDefinitionError("Dependency cycle in pipeline '" + definition.name + "': " +
                                      quoteList(cycle));
    }
}

std::vector<std::string> PipelineDefinitionLoader::findCycle(const PipelineDefinition& definition) {
    // EN: DFS with coloring; the gray path is kept to report the cycle
    // FR: DFS avec coloration; le chemin gris est gardé pour rapporter le cycle
    std::unordered_map<std::string, int> colors; // 0=white, 1=gray, 2=black
    std::vector<std::string> path;
    std::vector<std::string> cycle;

    std::function<bool(const JobTemplate&)> dfs = [&](const JobTemplate& job) -> bool {
        colors[job.name] = 1;
        path.push_back(job.name);

        for (const auto& need : job.needs) {
            const JobTemplate* dep = definition.findJob(need);
            if (!dep) {
                continue;
            }
            if (colors[need] == 1) {
                auto start = std::find(path.begin(), path.end(), need);
                cycle.assign(start, path.end());
                cycle.push_back(need);
                return true;
            }
            if (colors[need] == 0 && dfs(*dep)) {
                return true;
            }
        }

        colors[job.name] = 2;
        path.pop_back();
        return false;
    };

    for (const auto& job : definition.jobs) {
        if (colors[job.name] == 0 && dfs(job)) {
            return cycle;
        }
    }
    return {};
}

} // namespace Orchestrator
} // namespace CDO
