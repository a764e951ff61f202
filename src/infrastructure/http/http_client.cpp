// EN: Implementation of the HttpClient class. One libcurl easy handle per request, with error and
// header handling. FR : Implémentation de la classe HttpClient. Un handle libcurl par requête, avec
// gestion des erreurs et des headers.

#include "infrastructure/http/http_client.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <curl/curl.h>

namespace CDO {

namespace {

// EN: Callback for writing response body.
// FR : Callback pour écrire le corps de la réponse.
size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    size_t total = size * nmemb;
    body->append(static_cast<char*>(contents), total);
    return total;
}

// EN: Callback for parsing response headers.
// FR : Callback pour parser les headers de la réponse.
size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* headers = static_cast<HttpHeaders*>(userdata);
    std::string line(buffer, total);
    auto pos = line.find(':');
    if (pos != std::string::npos) {
        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);
        // Trim whitespace
        key.erase(key.find_last_not_of(" \r\n") + 1);
        value.erase(0, value.find_first_not_of(" \r\n"));
        value.erase(value.find_last_not_of(" \r\n") + 1);
        (*headers)[key] = value;
    }
    return total;
}

struct CurlHandleDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

}  // namespace

// EN: Constructor. Initializes timeouts and the libcurl global state once per process.
// FR : Constructeur. Initialise les timeouts et l'état global libcurl une fois par processus.
HttpClient::HttpClient(long connectTimeoutMs, long readTimeoutMs)
    : connectTimeoutMs_(connectTimeoutMs), readTimeoutMs_(readTimeoutMs) {
    static std::once_flag curl_init;
    std::call_once(curl_init, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

HttpResponse HttpClient::perform(const HttpRequest& request) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) throw std::runtime_error("CURL init failed");

    HttpResponse resp;

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, connectTimeoutMs_);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, readTimeoutMs_);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &resp.headers);

    if (request.method == "HEAD") {
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    } else if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    if (request.body) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body->data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.body->size()));
    }

    std::unique_ptr<curl_slist, CurlListDeleter> chunk;
    for (const auto& [k, v] : request.headers) {
        std::string line = k + ": " + v;
        curl_slist* appended = curl_slist_append(chunk.get(), line.c_str());
        if (!appended) throw std::runtime_error("CURL header allocation failed");
        chunk.release();
        chunk.reset(appended);
    }
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, chunk.get());

    char errorBuffer[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errorBuffer);

    auto start = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl.get());
    auto end = std::chrono::steady_clock::now();

    resp.elapsed_ms = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count());

    if (res != CURLE_OK) {
        std::string errMsg = errorBuffer[0] ? errorBuffer : curl_easy_strerror(res);
        throw std::runtime_error(request.method + " " + request.url + ": " + errMsg);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    resp.status = static_cast<int>(status);
    return resp;
}

HttpResponse HttpClient::get(const std::string& url, const HttpHeaders& extraHeaders) {
    return perform(HttpRequest{"GET", url, extraHeaders, std::nullopt});
}

HttpResponse HttpClient::head(const std::string& url, const HttpHeaders& extraHeaders) {
    return perform(HttpRequest{"HEAD", url, extraHeaders, std::nullopt});
}

HttpResponse HttpClient::post(const std::string& url, const HttpHeaders& extraHeaders,
                              const std::string& body) {
    return perform(HttpRequest{"POST", url, extraHeaders, body});
}

HttpResponse HttpClient::put(const std::string& url, const HttpHeaders& extraHeaders,
                             const std::string& body) {
    return perform(HttpRequest{"PUT", url, extraHeaders, body});
}

HttpResponse HttpClient::patch(const std::string& url, const HttpHeaders& extraHeaders,
                               const std::string& body) {
    return perform(HttpRequest{"PATCH", url, extraHeaders, body});
}

HttpResponse HttpClient::del(const std::string& url, const HttpHeaders& extraHeaders) {
    return perform(HttpRequest{"DELETE", url, extraHeaders, std::nullopt});
}

}  // namespace CDO
