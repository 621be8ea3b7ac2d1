#ifndef DOCSANITIZER_SANITIZE_MODEL_BACKEND_HPP
#define DOCSANITIZER_SANITIZE_MODEL_BACKEND_HPP

#include <atomic>
#include <stdexcept>
#include <string>

namespace docsanitizer {
namespace sanitize {

/**
 * @brief The backend answered, but not with a usable completion. The engine
 *        counts it as a rejected attempt for the chunk, not as an outage.
 */
class InvalidCompletionError : public std::runtime_error
{
public:
    explicit InvalidCompletionError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

/**
 * @class ModelBackend
 * @brief The language model as seen by the engine: prompt in, completion out.
 *
 * generate() may be called from several pool threads at once. It throws
 * core::BackendUnavailableError when the backend cannot be reached or answers
 * with an error, InvalidCompletionError when a successful reply carries no
 * completion, and should give up promptly once @p cancelled becomes true.
 */
class ModelBackend
{
public:
    virtual ~ModelBackend() = default;

    virtual std::string generate(const std::string &prompt, const std::atomic<bool> &cancelled) = 0;

    virtual std::string modelName() const = 0;
};

} // namespace sanitize
} // namespace docsanitizer

#endif // DOCSANITIZER_SANITIZE_MODEL_BACKEND_HPP
