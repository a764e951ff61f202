// EN: Pipeline data model helpers: event kinds, cancellation, run lookups and string conversions.
// FR: Fonctions du modèle de données : types d'événements, annulation, recherches et conversions.

#include "orchestrator/pipeline_types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace CDO {
namespace Orchestrator {

EventKind eventKindOf(const Event& event) {
    return std::visit([](const auto& e) -> EventKind {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PushEvent>) {
            return EventKind::PUSH;
        } else if constexpr (std::is_same_v<T, PullRequestEvent>) {
            return EventKind::PULL_REQUEST;
        } else if constexpr (std::is_same_v<T, TagEvent>) {
            return EventKind::TAG;
        } else {
            return EventKind::WORKFLOW_COMPLETION;
        }
    }, event);
}

EventKind effectiveEventKind(const Event& event) {
    if (const auto* push = std::get_if<PushEvent>(&event)) {
        if (push->ref.rfind("refs/tags/", 0) == 0) {
            return EventKind::TAG;
        }
    }
    return eventKindOf(event);
}

bool isTerminal(JobStatus status) {
    switch (status) {
        case JobStatus::SUCCEEDED:
        case JobStatus::FAILED:
        case JobStatus::CANCELLED:
        case JobStatus::SKIPPED:
            return true;
        default:
            return false;
    }
}

PublishOutcome PublishOutcome::published(const std::string& release_id, std::vector<std::string> assets) {
    PublishOutcome outcome;
    outcome.status = PublishStatus::PUBLISHED;
    outcome.release_id = release_id;
    outcome.uploaded_assets = std::move(assets);
    return outcome;
}

PublishOutcome PublishOutcome::skipped(const std::string& reason) {
    PublishOutcome outcome;
    outcome.status = PublishStatus::SKIPPED;
    outcome.message = reason;
    return outcome;
}

PublishOutcome PublishOutcome::failed(PublishError error, const std::string& message) {
    PublishOutcome outcome;
    outcome.status = PublishStatus::FAILED;
    outcome.error = error;
    outcome.message = message;
    return outcome;
}

bool CancellationToken::isCancelled() const {
    for (const auto& flag : flags_) {
        if (flag->load()) {
            return true;
        }
    }
    return false;
}

CancellationToken CancellationToken::combinedWith(const CancellationToken& other) const {
    CancellationToken combined = *this;
    combined.flags_.insert(combined.flags_.end(), other.flags_.begin(), other.flags_.end());
    return combined;
}

bool CancellationSource::cancel() {
    return !flag_->exchange(true);
}

CancellationToken CancellationSource::token() const {
    CancellationToken token;
    token.flags_.push_back(flag_);
    return token;
}

JobInstance* PipelineRun::findInstance(const std::string& id) {
    for (auto& instance : instances) {
        if (instance.id == id) {
            return &instance;
        }
    }
    return nullptr;
}

const JobInstance* PipelineRun::findInstance(const std::string& id) const {
    for (const auto& instance : instances) {
        if (instance.id == id) {
            return &instance;
        }
    }
    return nullptr;
}

std::vector<const JobInstance*> PipelineRun::instancesOf(const std::string& template_name) const {
    std::vector<const JobInstance*> result;
    for (const auto& instance : instances) {
        if (instance.template_name == template_name) {
            result.push_back(&instance);
        }
    }
    return result;
}

size_t PipelineRun::countWithStatus(JobStatus status) const {
    size_t count = 0;
    for (const auto& instance : instances) {
        if (instance.status == status) {
            ++count;
        }
    }
    return count;
}

std::string PipelineUtils::statusToString(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING:   return "PENDING";
        case JobStatus::BLOCKED:   return "BLOCKED";
        case JobStatus::READY:     return "READY";
        case JobStatus::RUNNING:   return "RUNNING";
        case JobStatus::SUCCEEDED: return "SUCCEEDED";
        case JobStatus::FAILED:    return "FAILED";
        case JobStatus::CANCELLED: return "CANCELLED";
        case JobStatus::SKIPPED:   return "SKIPPED";
        default: return "UNKNOWN";
    }
}

std::string PipelineUtils::conclusionToString(RunConclusion conclusion) {
    switch (conclusion) {
        case RunConclusion::SUCCESS:   return "success";
        case RunConclusion::FAILURE:   return "failure";
        case RunConclusion::CANCELLED: return "cancelled";
        default: return "unknown";
    }
}

std::string PipelineUtils::eventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::PUSH:                return "push";
        case EventKind::PULL_REQUEST:        return "pull_request";
        case EventKind::TAG:                 return "tag";
        case EventKind::WORKFLOW_COMPLETION: return "workflow_completion";
        default: return "unknown";
    }
}

std::string PipelineUtils::publishStatusToString(PublishStatus status) {
    switch (status) {
        case PublishStatus::PUBLISHED: return "PUBLISHED";
        case PublishStatus::SKIPPED:   return "SKIPPED";
        case PublishStatus::FAILED:    return "FAILED";
        default: return "UNKNOWN";
    }
}

std::string PipelineUtils::publishErrorToString(PublishError error) {
    switch (error) {
        case PublishError::NONE:              return "NONE";
        case PublishError::NO_ARTIFACTS:      return "NO_ARTIFACTS";
        case PublishError::ALREADY_EXISTS:    return "ALREADY_EXISTS";
        case PublishError::TRANSPORT_FAILURE: return "TRANSPORT_FAILURE";
        case PublishError::CANCELLED:         return "CANCELLED";
        case PublishError::INVALID_SPEC:      return "INVALID_SPEC";
        default: return "UNKNOWN";
    }
}

std::string PipelineUtils::shortRefName(const std::string& ref) {
    static const std::string heads = "refs/heads/";
    static const std::string tags = "refs/tags/";
    if (ref.compare(0, heads.size(), heads) == 0) {
        return ref.substr(heads.size());
    }
    if (ref.compare(0, tags.size(), tags) == 0) {
        return ref.substr(tags.size());
    }
    return ref;
}

std::string PipelineUtils::formatDuration(std::chrono::milliseconds duration) {
    const auto total_ms = duration.count();
    if (total_ms < 1000) {
        return std::to_string(total_ms) + "ms";
    }
    const auto seconds = total_ms / 1000;
    if (seconds < 60) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << static_cast<double>(total_ms) / 1000.0 << "s";
        return oss.str();
    }
    return std::to_string(seconds / 60) + "m" + std::to_string(seconds % 60) + "s";
}

std::string PipelineUtils::formatTimestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace Orchestrator
} // namespace CDO
