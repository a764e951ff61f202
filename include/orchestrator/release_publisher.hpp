#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "orchestrator/pipeline_types.hpp"

namespace CDO {
namespace Orchestrator {

// EN: Release metadata as sent to the endpoint
// FR: Métadonnées de release envoyées à l'endpoint
struct ReleaseMetadata {
    std::string name;
    std::string tag;
    std::string body;
    bool draft = false;
    bool prerelease = false;
};

struct ReleaseRecord {
    std::string id;
    ReleaseMetadata metadata;
    bool staged = false;                // EN: Created but not finalized, invisible to lookups / FR: Créée mais non finalisée
    std::vector<std::string> assets;
};

// EN: Narrow interface to the release host. Transport errors are thrown (std::exception);
//     retries are the implementation's own business.
// FR: Interface étroite vers l'hôte de release. Les erreurs de transport sont lancées;
//     les retries relèvent de l'implémentation.
class ReleaseEndpoint {
public:
    virtual ~ReleaseEndpoint() = default;

    // EN: Finalized release with this (name, tag) identity, if any
    // FR: Release finalisée avec cette identité (nom, tag), s'il y en a une
    virtual std::optional<ReleaseRecord> findRelease(const std::string& name, const std::string& tag,
                                                     const CancellationToken& cancellation) = 0;

    // EN: Creates a staged release, not visible until finalized
    // FR: Crée une release en préparation, invisible jusqu'à sa finalisation
    virtual ReleaseRecord createRelease(const ReleaseMetadata& metadata,
                                        const CancellationToken& cancellation) = 0;

    virtual void uploadAsset(const std::string& release_id, const Artifact& artifact,
                             const CancellationToken& cancellation) = 0;
    virtual void finalizeRelease(const std::string& release_id, const ReleaseMetadata& metadata,
                                 const CancellationToken& cancellation) = 0;
    virtual void updateRelease(const std::string& release_id, const ReleaseMetadata& metadata,
                               const CancellationToken& cancellation) = 0;
    virtual void deleteRelease(const std::string& release_id, const CancellationToken& cancellation) = 0;
};

// EN: Run data the publisher reads: variables for gating and templates, succeeded jobs for notes
// FR: Données de run lues par le publisher : variables et jobs réussis pour les notes
struct PublishContext {
    std::string run_id;
    std::string pipeline_name;
    VariableMap variables;
    std::vector<std::string> succeeded_jobs;

    static PublishContext fromRun(const PipelineRun& run);
};

// EN: Guarded, all-or-nothing release publication.
//     Gate false gives Skipped; no matching artifact gives Failed(NO_ARTIFACTS); an existing
//     (name, tag) release is updated only if it is a draft under UPDATE_DRAFT, otherwise
//     Failed(ALREADY_EXISTS). A staged release is deleted on failure or cancellation; when the
//     delete fails it is renamed with an "[incomplete]" marker and reported as orphaned.
// FR: Publication de release gardée et atomique (voir ci-dessus).
class ReleasePublisher {
public:
    explicit ReleasePublisher(ReleaseEndpoint& endpoint);

    bool isGateOpen(const ReleaseSpec& spec, const VariableMap& variables) const;

    PublishOutcome publish(const ReleaseSpec& spec, const PublishContext& context,
                           const std::vector<Artifact>& artifacts,
                           const CancellationToken& cancellation = CancellationToken());

    PublishOutcome publish(const ReleaseSpec& spec, const PipelineRun& run,
                           const std::vector<Artifact>& artifacts);

    // EN: Artifacts whose name matches one of the globs, first producer wins on duplicate names
    // FR: Artefacts dont le nom correspond à un glob, le premier producteur gagne en cas de doublon
    static std::vector<Artifact> resolveArtifacts(const std::vector<std::string>& globs,
                                                  const std::vector<Artifact>& artifacts);

    // EN: Name a file is uploaded under: the last path component
    // FR: Nom sous lequel un fichier est téléversé : le dernier composant du chemin
    static std::string assetName(const std::string& artifact_name);

    static std::string generateNotes(const ReleaseMetadata& metadata, const PublishContext& context,
                                     const std::vector<Artifact>& artifacts);

    static constexpr const char* kIncompleteMarker = " [incomplete]";

private:
    PublishOutcome createAndUpload(const ReleaseMetadata& metadata, const std::vector<Artifact>& artifacts,
                                   const CancellationToken& cancellation);
    PublishOutcome updateExisting(const ReleaseRecord& existing, const ReleaseMetadata& metadata,
                                  const std::vector<Artifact>& artifacts, const CancellationToken& cancellation);
    void rollback(const std::string& release_id, const ReleaseMetadata& metadata, PublishOutcome& outcome);

    ReleaseEndpoint& endpoint_;

    // EN: Serializes lookups and creations so one identity is never created twice
    // FR: Sérialise recherches et créations pour ne jamais créer deux fois une identité
    std::mutex publish_mutex_;
};

// EN: Endpoint kept in memory, used by tests and dry runs. Supports failure injection.
// FR: Endpoint gardé en mémoire, utilisé par les tests et les dry runs. Injection de pannes.
class InMemoryReleaseEndpoint : public ReleaseEndpoint {
public:
    std::optional<ReleaseRecord> findRelease(const std::string& name, const std::string& tag,
                                             const CancellationToken& cancellation) override;
    ReleaseRecord createRelease(const ReleaseMetadata& metadata, const CancellationToken& cancellation) override;
    void uploadAsset(const std::string& release_id, const Artifact& artifact,
                     const CancellationToken& cancellation) override;
    void finalizeRelease(const std::string& release_id, const ReleaseMetadata& metadata,
                         const CancellationToken& cancellation) override;
    void updateRelease(const std::string& release_id, const ReleaseMetadata& metadata,
                       const CancellationToken& cancellation) override;
    void deleteRelease(const std::string& release_id, const CancellationToken& cancellation) override;

    // EN: Seeds a finalized release, e.g. an existing draft
    // FR: Ajoute une release finalisée, par exemple un brouillon existant
    std::string addRelease(const ReleaseMetadata& metadata, const std::vector<std::string>& assets = {});

    void setFailCreate(bool fail);
    // EN: Uploads fail once this many uploads succeeded; std::nullopt disables it
    // FR: Les uploads échouent après ce nombre de succès; std::nullopt désactive
    void setFailUploadsAfter(std::optional<size_t> successful_uploads);
    void setFailDelete(bool fail);
    // EN: Called before each upload, outside the endpoint lock
    // FR: Appelé avant chaque upload, hors du verrou de l'endpoint
    void setUploadHook(std::function<void(const std::string& asset_name)> hook);

    // EN: Finalized releases only
    // FR: Releases finalisées seulement
    std::vector<ReleaseRecord> releases() const;
    std::vector<ReleaseRecord> allReleases() const;
    std::optional<ReleaseRecord> getRelease(const std::string& release_id) const;
    std::optional<std::string> assetContent(const std::string& release_id, const std::string& asset_name) const;
    size_t uploadCount() const;

private:
    ReleaseRecord& recordOrThrow(const std::string& release_id);

    mutable std::mutex mutex_;
    std::map<std::string, ReleaseRecord> releases_;
    std::map<std::string, std::map<std::string, std::string>> contents_;
    uint64_t next_id_ = 1;
    size_t upload_count_ = 0;
    bool fail_create_ = false;
    bool fail_delete_ = false;
    std::optional<size_t> fail_uploads_after_;
    std::function<void(const std::string&)> upload_hook_;
};

} // namespace Orchestrator
} // namespace CDO
