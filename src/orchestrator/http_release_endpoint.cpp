#include "orchestrator/http_release_endpoint.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "infrastructure/logging/logger.hpp"

namespace CDO {
namespace Orchestrator {

namespace {

// EN: Upper bound on listing pages, against a server that always answers with a next link
// FR: Borne sur le nombre de pages, contre un serveur qui renvoie toujours un lien next
constexpr size_t kMaxListingPages = 100;

std::string lowercase(std::string value) {
    for (auto& c : value) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return value;
}

nlohmann::json parseBody(const HttpResponse& response, const std::string& operation) {
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + operation + " response: " + e.what());
    }
}

nlohmann::json metadataToJson(const ReleaseMetadata& metadata) {
    return nlohmann::json{{"tag_name", metadata.tag},
                          {"name", metadata.name},
                          {"body", metadata.body},
                          {"draft", metadata.draft},
                          {"prerelease", metadata.prerelease}};
}

// EN: Numeric ids are rendered without quotes
// FR: Les ids numériques sont rendus sans guillemets
std::string idOf(const nlohmann::json& release) {
    const auto& id = release.at("id");
    return id.is_string() ? id.get<std::string>() : id.dump();
}

// EN: Missing or null fields read as empty / false
// FR: Champs absents ou null lus comme vides / false
std::string stringField(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    return (it != object.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

bool boolField(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    return it != object.end() && it->is_boolean() && it->get<bool>();
}

ReleaseRecord recordFromJson(const nlohmann::json& release) {
    if (!release.is_object() || !release.contains("id")) {
        throw std::runtime_error("Unexpected release payload: " + release.dump());
    }
    ReleaseRecord record;
    record.id = idOf(release);
    record.metadata.tag = stringField(release, "tag_name");
    record.metadata.name = stringField(release, "name");
    record.metadata.body = stringField(release, "body");
    record.metadata.draft = boolField(release, "draft");
    record.metadata.prerelease = boolField(release, "prerelease");
    auto assets = release.find("assets");
    if (assets != release.end() && assets->is_array()) {
        for (const auto& asset : *assets) {
            record.assets.push_back(stringField(asset, "name"));
        }
    }
    return record;
}

} // namespace

HttpReleaseEndpoint::HttpReleaseEndpoint(HttpTransport& transport, HttpReleaseEndpointConfig config)
    : transport_(transport), config_(std::move(config)) {
    while (!config_.base_url.empty() && config_.base_url.back() == '/') {
        config_.base_url.pop_back();
    }
    if (config_.upload_url.empty()) {
        config_.upload_url = config_.base_url;
    }
    if (config_.headers.find("Accept") == config_.headers.end()) {
        config_.headers["Accept"] = "application/vnd.github+json";
    }
    if (config_.headers.find("User-Agent") == config_.headers.end()) {
        config_.headers["User-Agent"] = "cdoctl";
    }
}

std::optional<ReleaseRecord> HttpReleaseEndpoint::findRelease(const std::string& name, const std::string& tag,
                                                              const CancellationToken& cancellation) {
    std::set<std::string> staged;
    {
        std::lock_guard<std::mutex> lock(staged_mutex_);
        staged = staged_ids_;
    }

    std::optional<std::string> url = config_.base_url + "/releases?per_page=100";
    for (size_t page = 0; url && page < kMaxListingPages; ++page) {
        HttpRequest request{"GET", *url, config_.headers, std::nullopt};
        const HttpResponse response = send("find", request, cancellation);
        const auto releases = parseBody(response, "find");
        if (!releases.is_array()) {
            throw std::runtime_error("Unexpected release list payload");
        }

        for (const auto& release : releases) {
            ReleaseRecord record = recordFromJson(release);
            if (staged.count(record.id) > 0) {
                continue;
            }
            if (record.metadata.name == name && record.metadata.tag == tag) {
                return record;
            }
        }
        url = nextPageUrl(response.headers);
    }
    if (url) {
        LOG_WARN("http_release", "Release listing truncated after " + std::to_string(kMaxListingPages) + " pages");
    }
    return std::nullopt;
}

std::optional<std::string> HttpReleaseEndpoint::nextPageUrl(const HttpHeaders& headers) {
    std::string link;
    for (const auto& [key, value] : headers) {
        if (lowercase(key) == "link") {
            link = value;
            break;
        }
    }

    // <url>; rel="next", <url>; rel="last"
    size_t pos = 0;
    while (pos < link.size()) {
        const size_t open = link.find('<', pos);
        const size_t close = open == std::string::npos ? std::string::npos : link.find('>', open);
        if (close == std::string::npos) {
            break;
        }
        const size_t end = std::min(link.find('<', close), link.size());
        const std::string params = lowercase(link.substr(close + 1, end - close - 1));
        if (params.find("rel=\"next\"") != std::string::npos || params.find("rel=next") != std::string::npos) {
            return link.substr(open + 1, close - open - 1);
        }
        pos = end;
    }
    return std::nullopt;
}

ReleaseRecord HttpReleaseEndpoint::createRelease(const ReleaseMetadata& metadata,
                                                 const CancellationToken& cancellation) {
    nlohmann::json payload = metadataToJson(metadata);
    payload["draft"] = true;

    const HttpResponse response = send("create",
                                       jsonRequest("POST", config_.base_url + "/releases", payload.dump()),
                                       cancellation);
    ReleaseRecord record = recordFromJson(parseBody(response, "create"));
    record.staged = true;
    {
        std::lock_guard<std::mutex> lock(staged_mutex_);
        staged_ids_.insert(record.id);
    }
    LOG_DEBUG("http_release", "Staged release " + record.id + " created for tag " + metadata.tag);
    return record;
}

void HttpReleaseEndpoint::uploadAsset(const std::string& release_id, const Artifact& artifact,
                                      const CancellationToken& cancellation) {
    const std::string asset_name = ReleasePublisher::assetName(artifact.name);
    HttpRequest request{"POST",
                        config_.upload_url + "/releases/" + release_id + "/assets?name=" + urlEncode(asset_name),
                        config_.headers, artifact.content};
    request.headers["Content-Type"] = "application/octet-stream";
    send("upload", request, cancellation);
}

void HttpReleaseEndpoint::finalizeRelease(const std::string& release_id, const ReleaseMetadata& metadata,
                                          const CancellationToken& cancellation) {
    send("finalize", jsonRequest("PATCH", releaseUrl(release_id), metadataToJson(metadata).dump()), cancellation);
    std::lock_guard<std::mutex> lock(staged_mutex_);
    staged_ids_.erase(release_id);
}

void HttpReleaseEndpoint::updateRelease(const std::string& release_id, const ReleaseMetadata& metadata,
                                        const CancellationToken& cancellation) {
    send("update", jsonRequest("PATCH", releaseUrl(release_id), metadataToJson(metadata).dump()), cancellation);
}

void HttpReleaseEndpoint::deleteRelease(const std::string& release_id, const CancellationToken& cancellation) {
    HttpRequest request{"DELETE", releaseUrl(release_id), config_.headers, std::nullopt};
    const HttpResponse response = send("delete", request, cancellation, true);
    if (response.status == 404) {
        LOG_DEBUG("http_release", "Release " + release_id + " was already gone");
    }
    std::lock_guard<std::mutex> lock(staged_mutex_);
    staged_ids_.erase(release_id);
}

HttpResponse HttpReleaseEndpoint::send(const std::string& operation, const HttpRequest& request,
                                       const CancellationToken& cancellation, bool allow_not_found) {
    RetryConfig retry = config_.retry;
    retry.abort_requested = [cancellation]() { return cancellation.isCancelled(); };

    return ErrorRecoveryManager::getInstance().executeWithRetry("release." + operation, retry, [&]() {
        HttpResponse response = transport_.perform(request);
        if (response.status >= 400 && !(allow_not_found && response.status == 404)) {
            throw HttpStatusError(response.status, request.method + " " + request.url + " returned HTTP " +
                                                   std::to_string(response.status));
        }
        return response;
    });
}

HttpRequest HttpReleaseEndpoint::jsonRequest(const std::string& method, const std::string& url,
                                             const std::string& body) const {
    HttpRequest request{method, url, config_.headers, body};
    request.headers["Content-Type"] = "application/json";
    return request;
}

std::string HttpReleaseEndpoint::releaseUrl(const std::string& release_id) const {
    return config_.base_url + "/releases/" + release_id;
}

std::string HttpReleaseEndpoint::urlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << static_cast<char>(c);
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return encoded.str();
}

} // namespace Orchestrator
} // namespace CDO
