// EN: Job outcomes and the shell executor (fork/exec per step, cooperative cancellation, artifact collection).
// FR: Résultats de job et exécuteur shell (fork/exec par étape, annulation coopérative, collecte d'artefacts).

#include "orchestrator/job_executor.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <thread>

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "infrastructure/logging/logger.hpp"

extern char** environ;

namespace CDO {
namespace Orchestrator {

namespace {

std::string pathComponent(const std::string& value) {
    std::string component;
    for (char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        component += (std::isalnum(uc) || c == '-' || c == '_' || c == '.') ? c : '_';
    }
    if (component.empty() || component == "." || component == "..") {
        component = "_" + component;
    }
    return component;
}

} // namespace

JobOutcome JobOutcome::succeeded(std::vector<Artifact> artifacts) {
    JobOutcome outcome;
    outcome.result = JobResult::SUCCEEDED;
    outcome.exit_code = 0;
    outcome.artifacts = std::move(artifacts);
    return outcome;
}

JobOutcome JobOutcome::failed(int exit_code, const std::string& message, std::optional<size_t> failed_step) {
    JobOutcome outcome;
    outcome.result = JobResult::FAILED;
    outcome.exit_code = exit_code;
    outcome.failed_step = failed_step;
    outcome.message = message;
    return outcome;
}

JobOutcome JobOutcome::cancelled(const std::string& message) {
    JobOutcome outcome;
    outcome.result = JobResult::CANCELLED;
    outcome.message = message;
    return outcome;
}

ShellJobExecutor::ShellJobExecutor(ShellExecutorConfig config) : config_(std::move(config)) {}

std::string ShellJobExecutor::workspaceFor(const JobRequest& request) const {
    namespace fs = std::filesystem;
    const fs::path root = config_.workspace_root.empty()
                              ? fs::path(config_.working_directory) / ".cdo" / "workspaces"
                              : fs::path(config_.workspace_root);
    return (root / pathComponent(request.run_id) / pathComponent(request.instance_id)).string();
}

JobOutcome ShellJobExecutor::execute(const JobRequest& request, const CancellationToken& cancellation) {
    namespace fs = std::filesystem;
    const Logger::Metadata meta{{"run_id", request.run_id}, {"job", request.instance_id}};

    std::error_code ec;
    if (!fs::is_directory(config_.working_directory, ec)) {
        LOG_ERROR_META("shell_executor", "Working directory does not exist: " + config_.working_directory, meta);
        return JobOutcome::failed(126, "working directory does not exist: " + config_.working_directory);
    }

    // EN: Leftovers of an earlier run with the same ids must not become artifacts
    // FR: Les restes d'une run précédente avec les mêmes ids ne doivent pas devenir des artefacts
    const std::string workspace = workspaceFor(request);
    fs::remove_all(workspace, ec);
    if (!ec) {
        fs::create_directories(workspace, ec);
    }
    if (ec) {
        LOG_ERROR_META("shell_executor", "Cannot prepare workspace " + workspace + ": " + ec.message(), meta);
        return JobOutcome::failed(126, "cannot prepare workspace " + workspace + ": " + ec.message());
    }

    const auto environment = buildEnvironment(request, workspace);

    for (size_t i = 0; i < request.steps.size(); ++i) {
        const JobStep& step = request.steps[i];
        const std::string label = step.name.empty() ? "step " + std::to_string(i + 1) : step.name;

        if (cancellation.isCancelled()) {
            return JobOutcome::cancelled("cancelled before " + label);
        }

        if (step.run.empty()) {
            LOG_INFO_META("shell_executor", "Skipping external action '" + step.uses + "' (" + label + ")", meta);
            continue;
        }

        LOG_DEBUG_META("shell_executor", "Running " + label, meta);
        const StepResult result = runStep(step.run, workspace, environment, cancellation);
        if (result.cancelled) {
            return JobOutcome::cancelled("cancelled during " + label);
        }
        if (result.exit_code != 0) {
            LOG_WARN_META("shell_executor", label + " exited with code " + std::to_string(result.exit_code), meta);
            return JobOutcome::failed(result.exit_code, label + " exited with code " +
                                      std::to_string(result.exit_code), i);
        }
    }

    return JobOutcome::succeeded(collectArtifacts(workspace, request.artifact_globs, request.instance_id));
}

ShellJobExecutor::StepResult ShellJobExecutor::runStep(const std::string& command, const std::string& directory,
                                                       const std::vector<std::string>& environment,
                                                       const CancellationToken& cancellation) const {
    // EN: Everything the child touches is prepared before fork
    // FR: Tout ce que le fils utilise est préparé avant le fork
    std::vector<char*> envp;
    envp.reserve(environment.size() + 1);
    for (const auto& entry : environment) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    const std::string shell_name = std::filesystem::path(config_.shell).filename().string();
    char* argv[] = {const_cast<char*>(shell_name.c_str()), const_cast<char*>("-c"),
                    const_cast<char*>(command.c_str()), nullptr};
    const char* working_directory = directory.c_str();

    const pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error("fork failed: " + std::string(std::strerror(errno)));
    }

    if (pid == 0) {
        setpgid(0, 0);
        if (chdir(working_directory) != 0) {
            _exit(126);
        }
        execve(config_.shell.c_str(), argv, envp.data());
        _exit(127);
    }

    // EN: Also set from the parent so the group exists before any kill
    // FR: Aussi défini côté parent pour que le groupe existe avant tout kill
    setpgid(pid, pid);

    int status = 0;
    while (true) {
        const pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) {
            break;
        }
        if (done < 0 && errno != EINTR) {
            throw std::runtime_error("waitpid failed: " + std::string(std::strerror(errno)));
        }

        if (cancellation.isCancelled()) {
            kill(-pid, SIGTERM);
            const auto deadline = std::chrono::steady_clock::now() + config_.kill_grace_period;
            while (waitpid(pid, &status, WNOHANG) == 0) {
                if (std::chrono::steady_clock::now() >= deadline) {
                    kill(-pid, SIGKILL);
                    waitpid(pid, &status, 0);
                    break;
                }
                std::this_thread::sleep_for(config_.poll_interval);
            }
            StepResult result;
            result.cancelled = true;
            return result;
        }

        std::this_thread::sleep_for(config_.poll_interval);
    }

    StepResult result;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}

std::vector<std::string> ShellJobExecutor::buildEnvironment(const JobRequest& request,
                                                            const std::string& workspace) const {
    std::map<std::string, std::string> exported;
    for (const auto& [name, value] : request.variables) {
        exported[environmentName(name)] = value;
    }
    for (const auto& [axis, value] : request.bindings) {
        exported[environmentName("matrix." + axis)] = value;
    }
    exported["CDO_RUN_ID"] = request.run_id;
    exported["CDO_PIPELINE"] = request.pipeline_name;
    exported["CDO_JOB"] = request.instance_id;
    exported["CDO_JOB_TEMPLATE"] = request.template_name;
    exported["CDO_RUNS_ON"] = request.runs_on;
    std::error_code ec;
    const auto workspace_path = std::filesystem::absolute(workspace, ec);
    exported["CDO_WORKSPACE"] = ec ? workspace : workspace_path.lexically_normal().string();
    const auto source = std::filesystem::absolute(config_.working_directory, ec);
    exported["CDO_SOURCE_DIR"] = ec ? config_.working_directory : source.lexically_normal().string();

    std::vector<std::string> environment;
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string line(*entry);
        const auto eq = line.find('=');
        if (eq != std::string::npos && exported.count(line.substr(0, eq)) > 0) {
            continue;
        }
        environment.push_back(line);
    }
    for (const auto& [name, value] : exported) {
        environment.push_back(name + "=" + value);
    }
    return environment;
}

std::string ShellJobExecutor::environmentName(const std::string& variable) {
    std::string name = "CDO_";
    for (char c : variable) {
        const auto uc = static_cast<unsigned char>(c);
        name += std::isalnum(uc) ? static_cast<char>(std::toupper(uc)) : '_';
    }
    return name;
}

std::vector<Artifact> ShellJobExecutor::collectArtifacts(const std::string& directory,
                                                         const std::vector<std::string>& globs,
                                                         const std::string& producer) {
    namespace fs = std::filesystem;
    std::vector<Artifact> artifacts;
    if (globs.empty()) {
        return artifacts;
    }

    const fs::path root(directory);
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return artifacts;
    }

    for (fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
         it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARN("shell_executor", "Artifact scan error: " + ec.message());
            break;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const std::string relative = fs::relative(it->path(), root, ec).generic_string();
        bool matched = false;
        for (const auto& glob : globs) {
            if (globMatch(glob, relative)) {
                matched = true;
                break;
            }
        }
        if (!matched) {
            continue;
        }

        std::ifstream file(it->path(), std::ios::binary);
        if (!file) {
            LOG_WARN("shell_executor", "Cannot read artifact: " + relative);
            continue;
        }
        Artifact artifact;
        artifact.name = relative;
        artifact.content.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        artifact.producer = producer;
        artifacts.push_back(std::move(artifact));
    }

    std::sort(artifacts.begin(), artifacts.end(),
              [](const Artifact& a, const Artifact& b) { return a.name < b.name; });
    return artifacts;
}

} // namespace Orchestrator
} // namespace CDO
