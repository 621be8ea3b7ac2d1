#ifndef DOCSANITIZER_CORE_ERRORS_HPP
#define DOCSANITIZER_CORE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace docsanitizer {
namespace core {

/*
  Caller-visible failures
  --------------------------------
  Everything the engine throws at its callers derives from SanitizerError and
  names the stage that failed, so a front end can decide between "pick another
  profile", "upload again", "fix the file" and "try later":

    profile       ProfileNotFoundError, ProfileValidationError
    store         DocumentUnavailableError
    extraction    ExtractionFailedError
    sanitization  PartialSanitizationFailureError, BackendUnavailableError
    timeout       TimeoutError

  Component-internal errors (ObjectNotFoundError, ExtractionError, ZipError,
  InvalidCompletionError) live next to their components and are translated
  by the engine.
*/

enum class FailureStage {
    Profile,
    Store,
    Extraction,
    Sanitization,
    Timeout
};

inline const char *stageName(FailureStage stage)
{
    switch (stage) {
    case FailureStage::Profile:
        return "profile";
    case FailureStage::Store:
        return "store";
    case FailureStage::Extraction:
        return "extraction";
    case FailureStage::Sanitization:
        return "sanitization";
    case FailureStage::Timeout:
        return "timeout";
    }
    return "unknown";
}

class SanitizerError : public std::runtime_error
{
public:
    SanitizerError(FailureStage stage, const std::string &message)
        : std::runtime_error(std::string("[") + stageName(stage) + "] " + message)
        , stage_(stage)
    {
    }

    FailureStage stage() const { return stage_; }

private:
    FailureStage stage_;
};

class ProfileNotFoundError : public SanitizerError
{
public:
    explicit ProfileNotFoundError(const std::string &profileName)
        : SanitizerError(FailureStage::Profile, "profile not found: " + profileName)
        , profileName_(profileName)
    {
    }

    const std::string &profileName() const { return profileName_; }

private:
    std::string profileName_;
};

// Illegal category/action pair, unknown names, bad profile name, or a stored
// record that does not describe every category exactly once.
class ProfileValidationError : public SanitizerError
{
public:
    explicit ProfileValidationError(const std::string &message)
        : SanitizerError(FailureStage::Profile, message)
    {
    }
};

// The identifier is unknown, reclaimed or expired. The caller should upload again.
class DocumentUnavailableError : public SanitizerError
{
public:
    explicit DocumentUnavailableError(const std::string &objectId)
        : SanitizerError(FailureStage::Store,
                         "document " + objectId + " is not available (unknown or expired); upload it again")
        , objectId_(objectId)
    {
    }

    const std::string &objectId() const { return objectId_; }

private:
    std::string objectId_;
};

class ExtractionFailedError : public SanitizerError
{
public:
    explicit ExtractionFailedError(const std::string &cause)
        : SanitizerError(FailureStage::Extraction, "extraction failed: " + cause)
        , cause_(cause)
    {
    }

    const std::string &cause() const { return cause_; }

private:
    std::string cause_;
};

// A chunk could not be sanitized after all retries. The whole request fails;
// unsanitized text is never returned in its place.
class PartialSanitizationFailureError : public SanitizerError
{
public:
    PartialSanitizationFailureError(size_t ordinal, size_t chunkCount, const std::string &reason)
        : SanitizerError(FailureStage::Sanitization,
                         "chunk " + std::to_string(ordinal) + " of " + std::to_string(chunkCount) +
                             " could not be sanitized: " + reason)
        , ordinal_(ordinal)
        , chunkCount_(chunkCount)
    {
    }

    size_t ordinal() const { return ordinal_; }
    size_t chunkCount() const { return chunkCount_; }

private:
    size_t ordinal_;
    size_t chunkCount_;
};

// Transport-level failure talking to the model backend (connection refused,
// HTTP error, error reply). Distinct from output that fails validation.
class BackendUnavailableError : public SanitizerError
{
public:
    explicit BackendUnavailableError(const std::string &message)
        : SanitizerError(FailureStage::Sanitization, "model backend unavailable: " + message)
    {
    }
};

class TimeoutError : public SanitizerError
{
public:
    explicit TimeoutError(const std::string &message)
        : SanitizerError(FailureStage::Timeout, message)
    {
    }
};

} // namespace core
} // namespace docsanitizer

#endif // DOCSANITIZER_CORE_ERRORS_HPP
