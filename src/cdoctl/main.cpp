// EN: cdoctl - loads pipeline files, feeds one event to the engine and reports the resulting runs.
// FR: cdoctl - charge les fichiers de pipeline, injecte un événement et affiche les runs obtenues.

#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "infrastructure/cli/config_override.hpp"
#include "infrastructure/config/config_manager.hpp"
#include "infrastructure/http/http_client.hpp"
#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/signal_handler.hpp"
#include "orchestrator/http_release_endpoint.hpp"
#include "orchestrator/job_executor.hpp"
#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/run_report.hpp"

using namespace CDO;
using namespace CDO::Orchestrator;

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_RUN_FAILED = 1,
    EXIT_RUN_CANCELLED = 2,
    EXIT_USAGE = 3
};

void defineOptions(CLI::ConfigOverrideParser& parser) {
    using CLI::CliOptionConstraint;
    using CLI::CliOptionDefinition;
    using CLI::CliOptionType;

    std::vector<CliOptionDefinition> options;

    CliOptionDefinition pipeline;
    pipeline.long_name = "pipeline";
    pipeline.short_name = 'p';
    pipeline.description = "Pipeline definition file (YAML)";
    pipeline.repeatable = true;
    pipeline.required = true;
    pipeline.category = "Pipeline";
    options.push_back(pipeline);

    CliOptionDefinition config;
    config.long_name = "config";
    config.short_name = 'c';
    config.description = "Configuration file (YAML)";
    config.category = "Pipeline";
    options.push_back(config);

    CliOptionDefinition event;
    event.long_name = "event";
    event.short_name = 'e';
    event.description = "Event kind";
    event.constraint = CliOptionConstraint::ENUM_VALUES;
    event.enum_values = {"push", "pull_request", "tag", "workflow_completion"};
    event.default_value = "push";
    event.category = "Event";
    options.push_back(event);

    auto eventField = [&options](const std::string& name, const std::string& description) {
        CliOptionDefinition field;
        field.long_name = name;
        field.description = description;
        field.category = "Event";
        options.push_back(field);
    };
    eventField("ref", "Git ref, e.g. refs/heads/main or refs/tags/v1.2.3");
    eventField("tag", "Tag name for tag events");
    eventField("base", "Base ref of a pull request");
    eventField("head", "Head ref of a pull request");
    eventField("source", "Upstream pipeline name for workflow_completion events");
    eventField("conclusion", "Upstream conclusion for workflow_completion events");
    eventField("branch", "Upstream branch for workflow_completion events");

    CliOptionDefinition working_dir;
    working_dir.long_name = "working-dir";
    working_dir.short_name = 'C';
    working_dir.description = "Directory job steps run in";
    working_dir.config_path = "executor.working_directory";
    working_dir.category = "Execution";
    options.push_back(working_dir);

    CliOptionDefinition jobs;
    jobs.long_name = "max-jobs";
    jobs.short_name = 'j';
    jobs.type = CliOptionType::INTEGER;
    jobs.constraint = CliOptionConstraint::NON_NEGATIVE;
    jobs.description = "Jobs running at once per run (0 = unbounded)";
    jobs.config_path = "engine.max_concurrent_jobs";
    jobs.category = "Execution";
    options.push_back(jobs);

    CliOptionDefinition endpoint;
    endpoint.long_name = "release-endpoint";
    endpoint.description = "'memory' or the repository API URL";
    endpoint.config_path = "release.endpoint";
    endpoint.category = "Execution";
    options.push_back(endpoint);

    CliOptionDefinition json;
    json.long_name = "json";
    json.type = CliOptionType::BOOLEAN;
    json.description = "Print the run reports as JSON";
    json.category = "Output";
    options.push_back(json);

    parser.addOptions(options);
    parser.addLoggingOptions();
}

Event buildEvent(const CLI::CliParseResult& args) {
    const std::string kind = args.value("event", "push");
    if (kind == "pull_request") {
        return PullRequestEvent{args.value("base", args.value("ref")), args.value("head")};
    }
    if (kind == "tag") {
        std::string tag = args.value("tag");
        std::string ref = args.value("ref");
        if (tag.empty() && ref.empty()) {
            throw std::invalid_argument("tag events need --tag or --ref");
        }
        return TagEvent{ref, tag};
    }
    if (kind == "workflow_completion") {
        if (!args.has("source")) {
            throw std::invalid_argument("workflow_completion events need --source");
        }
        return UpstreamCompletionEvent{args.value("source"), args.value("conclusion", "success"),
                                       args.value("branch")};
    }
    if (!args.has("ref")) {
        throw std::invalid_argument("push events need --ref");
    }
    return PushEvent{args.value("ref")};
}

void configureLogging() {
    auto& logger = Logger::getInstance();
    auto& config = ConfigManager::getInstance();

    auto level = Logger::levelFromString(config.get("logging", "level").asOrDefault<std::string>("info"));
    if (level) {
        logger.setLogLevel(*level);
    }
    std::string file = config.get("logging", "file").asOrDefault<std::string>("");
    if (!file.empty() && !logger.setOutputFile(file)) {
        std::cerr << "cdoctl: cannot open log file " << file << std::endl;
    }
}

int exitCodeFor(const std::vector<PipelineRun>& runs) {
    int code = EXIT_OK;
    for (const auto& run : runs) {
        if (run.conclusion == RunConclusion::FAILURE) {
            return EXIT_RUN_FAILED;
        }
        if (run.conclusion == RunConclusion::CANCELLED) {
            code = EXIT_RUN_CANCELLED;
        }
    }
    return code;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::ConfigOverrideParser parser("cdoctl");
    parser.setHelpHeader("cdoctl - event-triggered pipeline orchestrator");
    parser.setHelpFooter("Exit codes: 0 success or nothing triggered, 1 failure, 2 cancelled, 3 usage error");
    defineOptions(parser);

    CLI::CliParseResult args = parser.parse(argc, argv);
    if (args.status == CLI::CliParseStatus::HELP_REQUESTED) {
        std::cout << args.help_text;
        return EXIT_OK;
    }
    if (args.status == CLI::CliParseStatus::VERSION_REQUESTED) {
        std::cout << args.version_text;
        return EXIT_OK;
    }
    if (!args.ok()) {
        for (const auto& error : args.errors) {
            std::cerr << "cdoctl: " << error << std::endl;
        }
        std::cerr << "Try 'cdoctl --help'." << std::endl;
        return EXIT_USAGE;
    }
    for (const auto& warning : args.warnings) {
        std::cerr << "cdoctl: " << warning << std::endl;
    }

    // EN: Configuration precedence: file, then environment, then command line
    // FR: Priorité de configuration : fichier, puis environnement, puis ligne de commande
    auto& config = ConfigManager::getInstance();
    if (args.has("config") && !config.loadFromFile(args.value("config"))) {
        std::cerr << "cdoctl: cannot load configuration " << args.value("config") << std::endl;
        return EXIT_USAGE;
    }
    config.loadEnvironmentOverrides("CDO_");
    CLI::applyOverrides(args, config);

    config.addValidationRules(PipelineEngine::Config::validationRules());
    std::vector<std::string> config_errors;
    if (!config.validate(config_errors)) {
        for (const auto& error : config_errors) {
            std::cerr << "cdoctl: " << error << std::endl;
        }
        return EXIT_USAGE;
    }
    configureLogging();

    Event event;
    try {
        event = buildEvent(args);
    } catch (const std::invalid_argument& e) {
        std::cerr << "cdoctl: " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    ShellExecutorConfig executor_config;
    executor_config.working_directory =
        config.get("executor", "working_directory").asOrDefault<std::string>(executor_config.working_directory);
    executor_config.workspace_root =
        config.get("executor", "workspace_root").asOrDefault<std::string>(executor_config.workspace_root);
    auto executor = std::make_shared<ShellJobExecutor>(executor_config);

    std::unique_ptr<HttpClient> http_client;
    std::shared_ptr<ReleaseEndpoint> endpoint;
    std::string endpoint_url = config.get("release", "endpoint").asOrDefault<std::string>("memory");
    if (endpoint_url == "memory") {
        endpoint = std::make_shared<InMemoryReleaseEndpoint>();
    } else {
        long timeout_ms = config.get("release", "timeout_ms").asOrDefault<int>(30000);
        http_client = std::make_unique<HttpClient>(timeout_ms, timeout_ms);

        HttpReleaseEndpointConfig http_config;
        http_config.base_url = endpoint_url;
        http_config.upload_url = config.get("release", "upload_url").asOrDefault<std::string>("");
        http_config.retry.max_attempts = static_cast<size_t>(
            std::max(1, config.get("release", "max_attempts").asOrDefault<int>(3)));
        std::string authorization = config.get("release", "authorization").asOrDefault<std::string>("");
        if (!authorization.empty()) {
            http_config.headers["Authorization"] = authorization;
        }
        endpoint = std::make_shared<HttpReleaseEndpoint>(*http_client, http_config);
    }

    PipelineEngine engine(PipelineEngine::Config::fromConfigManager(), executor, endpoint);

    PipelineLoaderOptions loader_options;
    std::string on_existing = config.get("release", "on_existing").asOrDefault<std::string>("fail");
    if (on_existing == "update" || on_existing == "update_draft") {
        loader_options.default_on_existing = ExistingReleasePolicy::UPDATE_DRAFT;
    }

    for (const auto& path : args.all("pipeline")) {
        try {
            engine.loadPipelineFile(path, loader_options);
        } catch (const std::exception& e) {
            std::cerr << "cdoctl: " << e.what() << std::endl;
            return EXIT_USAGE;
        }
    }

    auto& signals = SignalHandler::getInstance();
    signals.initialize();
    signals.registerCleanupCallback("cancel-runs", [&engine]() { engine.cancelAll(); });

    std::vector<PipelineRun> runs = engine.executeEvent(event);

    signals.unregisterCleanupCallback("cancel-runs");
    engine.shutdown();

    if (runs.empty()) {
        std::cout << "No pipeline triggered by this event." << std::endl;
        return EXIT_OK;
    }

    if (args.has("json")) {
        nlohmann::json report = nlohmann::json::array();
        for (const auto& run : runs) {
            report.push_back(RunReport::toJson(run));
        }
        std::cout << report.dump(2) << std::endl;
    } else {
        for (const auto& run : runs) {
            std::cout << RunReport::toText(run) << std::endl;
        }
    }

    return exitCodeFor(runs);
}
