#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "infrastructure/http/http_client.hpp"
#include "infrastructure/system/error_recovery.hpp"
#include "orchestrator/release_publisher.hpp"

namespace CDO {
namespace Orchestrator {

struct HttpReleaseEndpointConfig {
    // EN: Repository API root, e.g. https://api.github.com/repos/owner/name
    // FR: Racine API du dépôt, par ex. https://api.github.com/repos/owner/name
    std::string base_url;
    // EN: Asset upload root; empty means base_url
    // FR: Racine d'upload des assets; vide = base_url
    std::string upload_url;
    HttpHeaders headers;
    RetryConfig retry = ErrorRecoveryUtils::createHttpRetryConfig();
};

// EN: Release endpoint speaking a GitHub-style REST API. JSON bodies use nlohmann::json and every
//     call goes through ErrorRecoveryManager; cancellation aborts the waits between retries.
//     Staged releases are drafts remembered locally so lookups ignore them.
// FR: Endpoint de release pour une API REST de type GitHub. Corps JSON via nlohmann::json et
//     retries via ErrorRecoveryManager; l'annulation interrompt les attentes entre tentatives.
class HttpReleaseEndpoint : public ReleaseEndpoint {
public:
    HttpReleaseEndpoint(HttpTransport& transport, HttpReleaseEndpointConfig config);

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

    static std::string urlEncode(const std::string& value);

    // EN: Target of the rel="next" entry of a Link header (name matched case-insensitively)
    // FR: Cible de l'entrée rel="next" d'un header Link (nom comparé sans casse)
    static std::optional<std::string> nextPageUrl(const HttpHeaders& headers);

private:
    HttpResponse send(const std::string& operation, const HttpRequest& request,
                      const CancellationToken& cancellation, bool allow_not_found = false);
    HttpRequest jsonRequest(const std::string& method, const std::string& url, const std::string& body) const;
    std::string releaseUrl(const std::string& release_id) const;

    HttpTransport& transport_;
    HttpReleaseEndpointConfig config_;

    std::mutex staged_mutex_;
    std::set<std::string> staged_ids_;
};

} // namespace Orchestrator
} // namespace CDO
