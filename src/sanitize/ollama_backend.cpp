#include "sanitize/ollama_backend.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>

#include "core/errors.hpp"
#include "util/json_text.hpp"
#include "util/logger.hpp"

namespace docsanitizer {
namespace sanitize {

namespace logger = util::logger;

namespace {

struct CurlHandleDeleter
{
    void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};

struct CurlListDeleter
{
    void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

} // namespace

OllamaBackend::OllamaBackend(OllamaOptions options)
    : options_(std::move(options))
{
    if (options_.endpoint.empty()) {
        throw std::invalid_argument("OllamaBackend: endpoint must not be empty");
    }
    if (options_.model.empty()) {
        throw std::invalid_argument("OllamaBackend: model must not be empty");
    }
    while (!options_.endpoint.empty() && options_.endpoint.back() == '/') {
        options_.endpoint.pop_back();
    }
    initCurl();
    logger::info("[OllamaBackend] using model " + options_.model + " at " + options_.endpoint);
}

void OllamaBackend::initCurl()
{
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

size_t OllamaBackend::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    if (!userdata) {
        return 0;
    }
    std::string &resp = *reinterpret_cast<std::string *>(userdata);
    size_t total = size * nmemb;
    resp.append(ptr, total);
    return total;
}

int OllamaBackend::progressCallback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto *cancelled = static_cast<const std::atomic<bool> *>(clientp);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
    return (cancelled && cancelled->load()) ? 1 : 0;
}

std::string OllamaBackend::buildRequestBody(const std::string &prompt) const
{
    std::ostringstream body;
    body << "{\"model\":\"" << util::json::escape(options_.model) << "\","
         << "\"prompt\":\"" << util::json::escape(prompt) << "\","
         << "\"stream\":false,"
         << "\"options\":{\"temperature\":" << options_.temperature << ",\"top_p\":" << options_.topP
         << ",\"num_predict\":" << options_.numPredict << "}}";
    return body.str();
}

std::string OllamaBackend::parseResponseBody(const std::string &body)
{
    std::optional<std::string> error;
    std::optional<std::string> response;
    try {
        error = util::json::findStringField(body, "error");
        response = util::json::findStringField(body, "response");
    } catch (const std::runtime_error &ex) {
        throw InvalidCompletionError(std::string("malformed reply: ") + ex.what());
    }
    if (error) {
        throw core::BackendUnavailableError("backend replied with an error: " + *error);
    }
    if (!response) {
        throw InvalidCompletionError("reply has no \"response\" field");
    }
    return *response;
}

std::string OllamaBackend::generate(const std::string &prompt, const std::atomic<bool> &cancelled)
{
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        throw core::BackendUnavailableError("curl_easy_init failed");
    }

    const std::string url = options_.endpoint + "/api/generate";
    const std::string body = buildRequestBody(prompt);
    std::string response;

    std::unique_ptr<curl_slist, CurlListDeleter> headers(curl_slist_append(nullptr, "Content-Type: application/json"));
    if (headers) {
        curl_slist_append(headers.get(), "Expect:"); // disable Expect: 100-continue
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(options_.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<std::atomic<bool> *>(&cancelled));

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw core::BackendUnavailableError("request cancelled");
    }
    if (res != CURLE_OK) {
        logger::warn("[OllamaBackend] request failed: " + std::string(curl_easy_strerror(res)));
        throw core::BackendUnavailableError(curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        std::string detail;
        try {
            detail = util::json::findStringField(response, "error").value_or("");
        } catch (const std::runtime_error &) {
            detail.clear(); // non-JSON error page
        }
        logger::warn("[OllamaBackend] HTTP " + std::to_string(status));
        throw core::BackendUnavailableError("HTTP " + std::to_string(status) + (detail.empty() ? "" : ": " + detail));
    }

    return parseResponseBody(response);
}

} // namespace sanitize
} // namespace docsanitizer
