#ifndef DOCSANITIZER_SANITIZE_OLLAMA_BACKEND_HPP
#define DOCSANITIZER_SANITIZE_OLLAMA_BACKEND_HPP

#include <chrono>
#include <curl/curl.h>
#include <string>
#include "sanitize/model_backend.hpp"

namespace docsanitizer {
namespace sanitize {

/*
  OllamaBackend
  --------------------------------
  ModelBackend over an Ollama-compatible HTTP API, using libcurl.

    POST <endpoint>/api/generate
    {"model": ..., "prompt": ..., "stream": false,
     "options": {"temperature": ..., "top_p": ..., "num_predict": ...}}

  and reads the "response" string of the reply. Connection failures, non-2xx
  statuses and {"error": ...} replies raise core::BackendUnavailableError.

  - curl_global_init runs once per process (see initCurl).
  - Each call uses its own easy handle, so concurrent calls are safe.
  - The transfer is aborted from the progress callback once the caller's
    cancellation flag is set.
*/
struct OllamaOptions
{
    std::string endpoint = "http://127.0.0.1:11434";
    std::string model = "phi4:14b";
    double temperature = 0.1;
    double topP = 0.9;
    int numPredict = 8192;
    std::chrono::seconds timeout{300};
};

class OllamaBackend : public ModelBackend
{
public:
    explicit OllamaBackend(OllamaOptions options);

    std::string generate(const std::string &prompt, const std::atomic<bool> &cancelled) override;

    std::string modelName() const override { return options_.model; }

    std::string buildRequestBody(const std::string &prompt) const;

    /**
     * @brief Completion text from a /api/generate reply body.
     * @throw core::BackendUnavailableError for error replies.
     * @throw InvalidCompletionError for malformed JSON or a missing "response".
     */
    static std::string parseResponseBody(const std::string &body);

private:
    static void initCurl();
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);
    static int progressCallback(void *clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal,
                                curl_off_t ulnow);

    OllamaOptions options_;
};

} // namespace sanitize
} // namespace docsanitizer

#endif // DOCSANITIZER_SANITIZE_OLLAMA_BACKEND_HPP
