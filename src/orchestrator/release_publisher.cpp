// EN: Release publisher (gating, artifact resolution, staged create/upload/finalize with rollback)
//     and the in-memory endpoint.
// FR: Publisher de release (garde, résolution d'artefacts, création/upload/finalisation avec rollback)
//     et l'endpoint en mémoire.

#include "orchestrator/release_publisher.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/error_recovery.hpp"

namespace CDO {
namespace Orchestrator {

namespace {

// EN: Raised internally when the cancellation token fires between endpoint calls
// FR: Levée en interne quand le token d'annulation se déclenche entre deux appels
class PublishCancelled : public std::runtime_error {
public:
    explicit PublishCancelled(const std::string& where)
        : std::runtime_error("publish cancelled " + where) {}
};

void throwIfCancelled(const CancellationToken& cancellation, const std::string& where) {
    if (cancellation.isCancelled()) {
        throw PublishCancelled(where);
    }
}

Logger::Metadata releaseMeta(const ReleaseMetadata& metadata) {
    return Logger::Metadata{{"release", metadata.name}, {"tag", metadata.tag}};
}

} // namespace

PublishContext PublishContext::fromRun(const PipelineRun& run) {
    PublishContext context;
    context.run_id = run.run_id;
    context.pipeline_name = run.pipeline_name;
    context.variables = run.variables;
    for (const auto& instance : run.instances) {
        if (instance.status == JobStatus::SUCCEEDED) {
            context.succeeded_jobs.push_back(instance.id);
        }
    }
    return context;
}

ReleasePublisher::ReleasePublisher(ReleaseEndpoint& endpoint) : endpoint_(endpoint) {}

bool ReleasePublisher::isGateOpen(const ReleaseSpec& spec, const VariableMap& variables) const {
    if (!spec.condition) {
        return true;
    }
    return spec.condition->evaluate(VariableScope(variables));
}

PublishOutcome ReleasePublisher::publish(const ReleaseSpec& spec, const PipelineRun& run,
                                         const std::vector<Artifact>& artifacts) {
    return publish(spec, PublishContext::fromRun(run), artifacts, run.cancellation.token());
}

PublishOutcome ReleasePublisher::publish(const ReleaseSpec& spec, const PublishContext& context,
                                         const std::vector<Artifact>& artifacts,
                                         const CancellationToken& cancellation) {
    bool gate_open = false;
    try {
        gate_open = isGateOpen(spec, context.variables);
    } catch (const ConditionParseError& e) {
        return PublishOutcome::failed(PublishError::INVALID_SPEC, e.what());
    }
    if (!gate_open) {
        LOG_INFO_META("release", "Release gate closed: " + spec.condition->source(),
                      (Logger::Metadata{{"run_id", context.run_id}}));
        return PublishOutcome::skipped("gating condition is false: " + spec.condition->source());
    }

    if (cancellation.isCancelled()) {
        return PublishOutcome::failed(PublishError::CANCELLED, "cancelled before publishing");
    }

    ReleaseMetadata metadata;
    try {
        const VariableScope scope(context.variables);
        metadata.tag = substitute(spec.tag_template, scope);
        metadata.name = substitute(spec.name_template, scope);
        metadata.body = substitute(spec.body_template, scope);
    } catch (const ConditionParseError& e) {
        return PublishOutcome::failed(PublishError::INVALID_SPEC, e.what());
    }
    if (metadata.tag.empty()) {
        return PublishOutcome::failed(PublishError::INVALID_SPEC, "release tag resolved to an empty string");
    }
    if (metadata.name.empty()) {
        metadata.name = metadata.tag;
    }
    metadata.draft = spec.draft;
    metadata.prerelease = spec.prerelease;

    std::vector<Artifact> matched;
    try {
        matched = resolveArtifacts(spec.artifact_globs, artifacts);
    } catch (const ConditionParseError& e) {
        return PublishOutcome::failed(PublishError::INVALID_SPEC, e.what());
    }
    if (matched.empty()) {
        LOG_ERROR_META("release", "No artifact matches the release files", releaseMeta(metadata));
        return PublishOutcome::failed(PublishError::NO_ARTIFACTS, "no artifact matches the release files");
    }

    // EN: Two different files would land on the same asset name
    // FR: Deux fichiers différents donneraient le même nom d'asset
    std::unordered_map<std::string, std::string> uploaded_as;
    for (const auto& artifact : matched) {
        const auto inserted = uploaded_as.emplace(assetName(artifact.name), artifact.name);
        if (!inserted.second) {
            LOG_ERROR_META("release", "Asset name collision on '" + inserted.first->first + "'", releaseMeta(metadata));
            return PublishOutcome::failed(PublishError::INVALID_SPEC,
                                          "'" + inserted.first->second + "' and '" + artifact.name +
                                          "' would both be uploaded as '" + inserted.first->first + "'");
        }
    }

    if (spec.generate_notes) {
        const std::string notes = generateNotes(metadata, context, matched);
        metadata.body = metadata.body.empty() ? notes : metadata.body + "\n\n" + notes;
    }

    std::lock_guard<std::mutex> lock(publish_mutex_);

    std::optional<ReleaseRecord> existing;
    try {
        existing = endpoint_.findRelease(metadata.name, metadata.tag, cancellation);
    } catch (const RetryAbortedException& e) {
        return PublishOutcome::failed(PublishError::CANCELLED, e.what());
    } catch (const std::exception& e) {
        return PublishOutcome::failed(PublishError::TRANSPORT_FAILURE, e.what());
    }

    if (existing) {
        if (spec.on_existing == ExistingReleasePolicy::UPDATE_DRAFT && existing->metadata.draft) {
            return updateExisting(*existing, metadata, matched, cancellation);
        }
        LOG_WARN_META("release", "Release already exists", releaseMeta(metadata));
        return PublishOutcome::failed(PublishError::ALREADY_EXISTS,
                                      "release '" + metadata.name + "' (" + metadata.tag + ") already exists");
    }

    return createAndUpload(metadata, matched, cancellation);
}

PublishOutcome ReleasePublisher::createAndUpload(const ReleaseMetadata& metadata,
                                                 const std::vector<Artifact>& artifacts,
                                                 const CancellationToken& cancellation) {
    ReleaseRecord record;
    try {
        record = endpoint_.createRelease(metadata, cancellation);
    } catch (const RetryAbortedException& e) {
        return PublishOutcome::failed(PublishError::CANCELLED, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR_META("release", "Release creation failed: " + std::string(e.what()), releaseMeta(metadata));
        return PublishOutcome::failed(PublishError::TRANSPORT_FAILURE, e.what());
    }

    std::vector<std::string> uploaded;
    PublishOutcome outcome;
    try {
        for (const auto& artifact : artifacts) {
            throwIfCancelled(cancellation, "before uploading " + artifact.name);
            endpoint_.uploadAsset(record.id, artifact, cancellation);
            uploaded.push_back(artifact.name);
        }
        throwIfCancelled(cancellation, "before finalizing");
        endpoint_.finalizeRelease(record.id, metadata, cancellation);

        LOG_INFO_META("release", "Release published with " + std::to_string(uploaded.size()) + " assets",
                      releaseMeta(metadata));
        return PublishOutcome::published(record.id, uploaded);

    } catch (const PublishCancelled& e) {
        outcome = PublishOutcome::failed(PublishError::CANCELLED, e.what());
    } catch (const RetryAbortedException& e) {
        outcome = PublishOutcome::failed(PublishError::CANCELLED, e.what());
    } catch (const std::exception& e) {
        outcome = PublishOutcome::failed(PublishError::TRANSPORT_FAILURE, e.what());
    }

    LOG_WARN_META("release", "Publish aborted, rolling back: " + outcome.message, releaseMeta(metadata));
    rollback(record.id, metadata, outcome);
    return outcome;
}

PublishOutcome ReleasePublisher::updateExisting(const ReleaseRecord& existing, const ReleaseMetadata& metadata,
                                                const std::vector<Artifact>& artifacts,
                                                const CancellationToken& cancellation) {
    std::vector<std::string> uploaded;
    try {
        for (const auto& artifact : artifacts) {
            throwIfCancelled(cancellation, "before uploading " + artifact.name);
            endpoint_.uploadAsset(existing.id, artifact, cancellation);
            uploaded.push_back(artifact.name);
        }
        throwIfCancelled(cancellation, "before updating");
        endpoint_.updateRelease(existing.id, metadata, cancellation);
    } catch (const PublishCancelled& e) {
        return PublishOutcome::failed(PublishError::CANCELLED, e.what());
    } catch (const RetryAbortedException& e) {
        return PublishOutcome::failed(PublishError::CANCELLED, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR_META("release", "Draft update failed: " + std::string(e.what()), releaseMeta(metadata));
        return PublishOutcome::failed(PublishError::TRANSPORT_FAILURE, e.what());
    }

    LOG_INFO_META("release", "Existing draft updated", releaseMeta(metadata));
    return PublishOutcome::published(existing.id, uploaded);
}

void ReleasePublisher::rollback(const std::string& release_id, const ReleaseMetadata& metadata,
                                PublishOutcome& outcome) {
    // EN: Rollback ignores the run's cancellation
    // FR: Le rollback ignore l'annulation du run
    const CancellationToken never;
    try {
        endpoint_.deleteRelease(release_id, never);
        LOG_INFO_META("release", "Staged release " + release_id + " deleted", releaseMeta(metadata));
        return;
    } catch (const std::exception& e) {
        LOG_ERROR_META("release", "Rollback of release " + release_id + " failed: " + e.what(),
                       releaseMeta(metadata));
    }

    outcome.orphaned_release_id = release_id;
    ReleaseMetadata marked = metadata;
    marked.name += kIncompleteMarker;
    marked.draft = true;
    try {
        endpoint_.updateRelease(release_id, marked, never);
        outcome.message += "; release " + release_id + " left marked as incomplete";
    } catch (const std::exception& e) {
        LOG_ERROR_META("release", "Could not mark release " + release_id + " as incomplete: " + e.what(),
                       releaseMeta(metadata));
        outcome.message += "; release " + release_id + " could not be removed or marked";
    }
}

std::vector<Artifact> ReleasePublisher::resolveArtifacts(const std::vector<std::string>& globs,
                                                         const std::vector<Artifact>& artifacts) {
    std::vector<Artifact> matched;
    std::unordered_set<std::string> names;
    for (const auto& artifact : artifacts) {
        const bool hit = std::any_of(globs.begin(), globs.end(), [&artifact](const std::string& glob) {
            return globMatch(glob, artifact.name);
        });
        if (!hit) {
            continue;
        }
        if (!names.insert(artifact.name).second) {
            LOG_WARN("release", "Duplicate artifact '" + artifact.name + "' from " + artifact.producer + " ignored");
            continue;
        }
        matched.push_back(artifact);
    }
    return matched;
}

std::string ReleasePublisher::assetName(const std::string& artifact_name) {
    return std::filesystem::path(artifact_name).filename().string();
}

std::string ReleasePublisher::generateNotes(const ReleaseMetadata& metadata, const PublishContext& context,
                                            const std::vector<Artifact>& artifacts) {
    std::ostringstream notes;
    notes << "## " << metadata.name << "\n\n";
    notes << "Pipeline `" << context.pipeline_name << "`, run `" << context.run_id << "`";
    const auto ref = context.variables.find("ref");
    if (ref != context.variables.end() && !ref->second.empty()) {
        notes << " on `" << ref->second << "`";
    }
    notes << ".\n";

    if (!context.succeeded_jobs.empty()) {
        notes << "\n### Jobs\n";
        for (const auto& job : context.succeeded_jobs) {
            notes << "- " << job << "\n";
        }
    }

    notes << "\n### Files\n";
    for (const auto& artifact : artifacts) {
        notes << "- " << artifact.name << " (" << artifact.content.size() << " bytes)\n";
    }
    return notes.str();
}

// ---------------------------------------------------------------------------
// EN: InMemoryReleaseEndpoint
// FR: InMemoryReleaseEndpoint
// ---------------------------------------------------------------------------

std::optional<ReleaseRecord> InMemoryReleaseEndpoint::findRelease(const std::string& name, const std::string& tag,
                                                                  const CancellationToken&) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, record] : releases_) {
        if (!record.staged && record.metadata.name == name && record.metadata.tag == tag) {
            return record;
        }
    }
    return std::nullopt;
}

ReleaseRecord InMemoryReleaseEndpoint::createRelease(const ReleaseMetadata& metadata, const CancellationToken&) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_create_) {
        throw std::runtime_error("simulated release creation failure");
    }
    ReleaseRecord record;
    record.id = "rel-" + std::to_string(next_id_++);
    record.metadata = metadata;
    record.staged = true;
    releases_[record.id] = record;
    return record;
}

void InMemoryReleaseEndpoint::uploadAsset(const std::string& release_id, const Artifact& artifact,
                                          const CancellationToken&) {
    std::function<void(const std::string&)> hook;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hook = upload_hook_;
    }
    if (hook) {
        hook(artifact.name);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_uploads_after_ && upload_count_ >= *fail_uploads_after_) {
        throw std::runtime_error("simulated upload failure for " + artifact.name);
    }
    ReleaseRecord& record = recordOrThrow(release_id);
    if (std::find(record.assets.begin(), record.assets.end(), artifact.name) == record.assets.end()) {
        record.assets.push_back(artifact.name);
    }
    contents_[release_id][artifact.name] = artifact.content;
    ++upload_count_;
}

void InMemoryReleaseEndpoint::finalizeRelease(const std::string& release_id, const ReleaseMetadata& metadata,
                                              const CancellationToken&) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReleaseRecord& record = recordOrThrow(release_id);
    record.metadata = metadata;
    record.staged = false;
}

void InMemoryReleaseEndpoint::updateRelease(const std::string& release_id, const ReleaseMetadata& metadata,
                                            const CancellationToken&) {
    std::lock_guard<std::mutex> lock(mutex_);
    recordOrThrow(release_id).metadata = metadata;
}

void InMemoryReleaseEndpoint::deleteRelease(const std::string& release_id, const CancellationToken&) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_delete_) {
        throw std::runtime_error("simulated delete failure for " + release_id);
    }
    recordOrThrow(release_id);
    releases_.erase(release_id);
    contents_.erase(release_id);
}

std::string InMemoryReleaseEndpoint::addRelease(const ReleaseMetadata& metadata,
                                                const std::vector<std::string>& assets) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReleaseRecord record;
    record.id = "rel-" + std::to_string(next_id_++);
    record.metadata = metadata;
    record.assets = assets;
    releases_[record.id] = record;
    return record.id;
}

void InMemoryReleaseEndpoint::setFailCreate(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_create_ = fail;
}

void InMemoryReleaseEndpoint::setFailUploadsAfter(std::optional<size_t> successful_uploads) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_uploads_after_ = successful_uploads;
}

void InMemoryReleaseEndpoint::setFailDelete(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_delete_ = fail;
}

void InMemoryReleaseEndpoint::setUploadHook(std::function<void(const std::string&)> hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    upload_hook_ = std::move(hook);
}

std::vector<ReleaseRecord> InMemoryReleaseEndpoint::releases() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ReleaseRecord> visible;
    for (const auto& [id, record] : releases_) {
        if (!record.staged) {
            visible.push_back(record);
        }
    }
    return visible;
}

std::vector<ReleaseRecord> InMemoryReleaseEndpoint::allReleases() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ReleaseRecord> all;
    for (const auto& [id, record] : releases_) {
        all.push_back(record);
    }
    return all;
}

std::optional<ReleaseRecord> InMemoryReleaseEndpoint::getRelease(const std::string& release_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = releases_.find(release_id);
    if (it == releases_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> InMemoryReleaseEndpoint::assetContent(const std::string& release_id,
                                                                 const std::string& asset_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto release = contents_.find(release_id);
    if (release == contents_.end()) {
        return std::nullopt;
    }
    auto asset = release->second.find(asset_name);
    if (asset == release->second.end()) {
        return std::nullopt;
    }
    return asset->second;
}

size_t InMemoryReleaseEndpoint::uploadCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return upload_count_;
}

ReleaseRecord& InMemoryReleaseEndpoint::recordOrThrow(const std::string& release_id) {
    auto it = releases_.find(release_id);
    if (it == releases_.end()) {
        throw std::runtime_error("unknown release: " + release_id);
    }
    return it->second;
}

} // namespace Orchestrator
} // namespace CDO
