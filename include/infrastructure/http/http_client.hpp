// EN: Declaration of the HttpClient class and related types. Provides HTTP methods (GET, HEAD,
// POST, PUT, PATCH, DELETE) over libcurl, used by the release endpoint. FR : Déclaration de la
// classe HttpClient et des types associés. Fournit les méthodes HTTP (GET, HEAD, POST, PUT, PATCH,
// DELETE) via libcurl, utilisées par l'endpoint de release.

#pragma once

#include <map>
#include <optional>
#include <string>

namespace CDO {

using HttpHeaders = std::map<std::string, std::string>;

// EN: Structure representing an HTTP request.
// FR : Structure représentant une requête HTTP.
struct HttpRequest {
    std::string method;
    std::string url;
    HttpHeaders headers;
    std::optional<std::string> body;
};

// EN: Structure representing an HTTP response.
// FR : Structure représentant une réponse HTTP.
struct HttpResponse {
    int status = 0;
    HttpHeaders headers;
    std::string body;
    long elapsed_ms = 0;

    bool ok() const { return status >= 200 && status < 300; }
};

// EN: Transport seam. Throws std::runtime_error on connection-level failures; HTTP error
//     statuses are returned, not thrown.
// FR : Point d'abstraction du transport. Lance std::runtime_error sur échec de connexion; les
//      statuts HTTP d'erreur sont retournés, pas lancés.
class HttpTransport {
  public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

// EN: HttpClient class. Provides HTTP methods and manages timeouts.
// FR : Classe HttpClient. Fournit les méthodes HTTP et gère les timeouts.
class HttpClient : public HttpTransport {
  private:
    long connectTimeoutMs_;
    long readTimeoutMs_;

  public:
    HttpClient(long connectTimeoutMs, long readTimeoutMs);

    HttpResponse perform(const HttpRequest& request) override;

    HttpResponse get(const std::string& url, const HttpHeaders& extraHeaders = {});
    HttpResponse head(const std::string& url, const HttpHeaders& extraHeaders = {});
    HttpResponse post(const std::string& url, const HttpHeaders& extraHeaders = {},
                      const std::string& body = "");
    HttpResponse put(const std::string& url, const HttpHeaders& extraHeaders = {},
                     const std::string& body = "");
    HttpResponse patch(const std::string& url, const HttpHeaders& extraHeaders = {},
                       const std::string& body = "");
    HttpResponse del(const std::string& url, const HttpHeaders& extraHeaders = {});
};

}  // namespace CDO
