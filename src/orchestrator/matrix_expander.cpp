#include "orchestrator/matrix_expander.hpp"

#include "infrastructure/logging/logger.hpp"

namespace CDO {
namespace Orchestrator {

std::vector<JobInstance> MatrixExpander::expand(const JobTemplate& job) {
    std::vector<JobInstance> instances;

    if (!job.matrix || job.matrix->axes.empty()) {
        JobInstance instance;
        instance.id = job.name;
        instance.template_name = job.name;
        instances.push_back(std::move(instance));
        return instances;
    }

    const auto& axes = job.matrix->axes;
    const size_t total = combinationCount(job);
    if (total == 0) {
        LOG_INFO("matrix", "Job '" + job.name + "' has an empty matrix axis, no instance created");
        return instances;
    }
    instances.reserve(total);

    // EN: Odometer over axis indices; the last axis turns fastest
    // FR: Compteur kilométrique sur les indices d'axes; le dernier axe tourne le plus vite
    std::vector<size_t> cursor(axes.size(), 0);
    for (size_t n = 0; n < total; ++n) {
        JobInstance instance;
        instance.template_name = job.name;
        for (size_t a = 0; a < axes.size(); ++a) {
            instance.bindings.emplace_back(axes[a].first, axes[a].second[cursor[a]]);
        }
        instance.id = instanceId(job.name, instance.bindings);
        instances.push_back(std::move(instance));

        for (size_t a = axes.size(); a-- > 0;) {
            if (++cursor[a] < axes[a].second.size()) {
                break;
            }
            cursor[a] = 0;
        }
    }

    LOG_DEBUG("matrix", "Job '" + job.name + "' expanded into " + std::to_string(instances.size()) + " instances");
    return instances;
}

void MatrixExpander::expandInto(const PipelineDefinition& definition, PipelineRun& run) {
    for (const auto& job : definition.jobs) {
        auto instances = expand(job);
        for (auto& instance : instances) {
            run.instances.push_back(std::move(instance));
        }
    }
}

std::string MatrixExpander::instanceId(const std::string& template_name, const MatrixBindings& bindings) {
    if (bindings.empty()) {
        return template_name;
    }
    std::string id = template_name + " (";
    for (size_t i = 0; i < bindings.size(); ++i) {
        if (i > 0) {
            id += ", ";
        }
        id += bindings[i].second;
    }
    id += ")";
    return id;
}

size_t MatrixExpander::combinationCount(const JobTemplate& job) {
    if (!job.matrix || job.matrix->axes.empty()) {
        return 1;
    }
    size_t total = 1;
    for (const auto& axis : job.matrix->axes) {
        total *= axis.second.size();
    }
    return total;
}

} // namespace Orchestrator
} // namespace CDO
