#ifndef DOCSANITIZER_UTIL_CONFIG_PARSER_HPP
#define DOCSANITIZER_UTIL_CONFIG_PARSER_HPP

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include "sanitizer_config.hpp"
#include "logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Populates a SanitizerConfig from a "key=value" file and from the
 *        environment.
 *
 * DESIGN GOALS:
 *   - One setting per line, '#' starts a comment line, blank lines ignored.
 *   - A missing file is not an error: defaults stay in place and a warning is logged.
 *   - Malformed lines and unparsable numbers throw std::runtime_error, as do
 *     durations above SanitizerConfig::kMaxDurationSeconds.
 *   - Unknown keys are logged and skipped so old files keep working.
 *   - applyEnvironment() lets deployments override the handful of settings
 *     they usually inject (FILE_TTL_SECONDS, OLLAMA_HOST, OLLAMA_MODEL,
 *     PROFILE_STORAGE, LOG_LEVEL).
 *
 * USAGE:
 *   @code
 *   docsanitizer::config::SanitizerConfig cfg;
 *   docsanitizer::util::ConfigParser parser(cfg);
 *   parser.loadFromFile("docsanitizer.conf");
 *   parser.applyEnvironment();
 *   @endcode
 */

namespace docsanitizer {
namespace util {

class ConfigParser
{
public:
    /// Looks up an environment variable; returns nullptr when unset.
    using EnvLookup = std::function<const char *(const char *)>;

    explicit ConfigParser(config::SanitizerConfig &config)
        : config_(config)
    {
    }

    /**
     * @brief Parse the file line by line into the referenced config.
     * @return false if the file does not exist (defaults kept).
     * @throw std::runtime_error on malformed content.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("[ConfigParser] File not found, using defaults: " + filepath);
            return false;
        }

        logger::info("[ConfigParser] Loading config from " + filepath);

        std::string line;
        size_t lineNo = 0;
        while (std::getline(inFile, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: invalid line " + std::to_string(lineNo) +
                                         " (no '='): " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);

            applyKeyValue(key, val);
        }

        logger::info("[ConfigParser] Config loaded.");
        return true;
    }

    /**
     * @brief Apply overrides from the process environment.
     * @param lookup Injected for tests; defaults to std::getenv.
     */
    inline void applyEnvironment(const EnvLookup &lookup = EnvLookup())
    {
        std::lock_guard<std::mutex> lock(mutex_);
        EnvLookup env = lookup;
        if (!env) {
            env = [](const char *name) -> const char * { return std::getenv(name); };
        }

        if (const char *v = env("FILE_TTL_SECONDS")) {
            applyKeyValue("objectTtlSeconds", v);
        }
        if (const char *v = env("OLLAMA_HOST")) {
            applyKeyValue("backendEndpoint", v);
        }
        if (const char *v = env("OLLAMA_MODEL")) {
            applyKeyValue("backendModel", v);
        }
        if (const char *v = env("PROFILE_STORAGE")) {
            applyKeyValue("profileDatabase", v);
        }
        if (const char *v = env("LOG_LEVEL")) {
            applyKeyValue("logLevel", v);
        }
    }

private:
    config::SanitizerConfig &config_;
    std::mutex mutex_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "objectTtlSeconds") {
            config_.objectTtlSeconds = parsePositive(key, val, config::SanitizerConfig::kMaxDurationSeconds);
        } else if (key == "sweepIntervalSeconds") {
            config_.sweepIntervalSeconds = parseUInt(key, val, config::SanitizerConfig::kMaxDurationSeconds);
        } else if (key == "maxObjectBytes") {
            config_.maxObjectBytes = parseUInt(key, val);
        } else if (key == "maxDocumentBytes") {
            config_.maxDocumentBytes = parsePositive(key, val);
        } else if (key == "maxChunkChars") {
            config_.maxChunkChars = parsePositive(key, val);
        } else if (key == "chunkRetryCount") {
            config_.chunkRetryCount = parseUInt(key, val);
        } else if (key == "chunkFanOut") {
            config_.chunkFanOut = parsePositive(key, val);
        } else if (key == "requestTimeoutSeconds") {
            config_.requestTimeoutSeconds = parsePositive(key, val, config::SanitizerConfig::kMaxDurationSeconds);
        } else if (key == "backendRetryCount") {
            config_.backendRetryCount = parseUInt(key, val);
        } else if (key == "backendBackoffMillis") {
            config_.backendBackoffMillis = parseUInt(key, val, config::SanitizerConfig::kMaxDurationSeconds * 1000);
        } else if (key == "backendTimeoutSeconds") {
            config_.backendTimeoutSeconds = parsePositive(key, val, config::SanitizerConfig::kMaxDurationSeconds);
        } else if (key == "backendEndpoint") {
            config_.backendEndpoint = stripTrailingSlash(val);
        } else if (key == "backendModel") {
            config_.backendModel = val;
        } else if (key == "temperature") {
            config_.temperature = parseDouble(key, val);
        } else if (key == "topP") {
            config_.topP = parseDouble(key, val);
        } else if (key == "numPredict") {
            config_.numPredict = parsePositive(key, val);
        } else if (key == "deleteAfterSanitize") {
            config_.deleteAfterSanitize = parseBool(key, val);
        } else if (key == "profileDatabase") {
            config_.profileDatabase = val;
        } else if (key == "logLevel") {
            logger::parseLogLevel(val); // validate early
            config_.logLevel = val;
        } else if (key == "logFile") {
            config_.logFile = val;
        } else {
            logger::warn("[ConfigParser] Unrecognized key '" + key + "'");
            return;
        }
        logger::debug("[ConfigParser] " + key + " set to " + val);
    }

    static inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        pos = s.find_last_not_of(whitespace);
        if (pos != std::string::npos) {
            s.erase(pos + 1);
        }
    }

    static inline std::string stripTrailingSlash(std::string s)
    {
        while (!s.empty() && s.back() == '/') {
            s.pop_back();
        }
        return s;
    }

    static inline uint64_t parseUInt(const std::string &key, const std::string &val,
                                     uint64_t max = UINT64_MAX)
    {
        if (val.empty() || val[0] == '-' || val[0] == '+') {
            throw std::runtime_error("ConfigParser: " + key + " expects an unsigned integer, got '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("non-numeric suffix");
            }
            if (n > max) {
                throw std::runtime_error("above the maximum of " + std::to_string(max));
            }
            return n;
        } catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: " + key + " expects an unsigned integer, got '" + val +
                                     "': " + ex.what());
        }
    }

    static inline uint64_t parsePositive(const std::string &key, const std::string &val,
                                         uint64_t max = UINT64_MAX)
    {
        uint64_t n = parseUInt(key, val, max);
        if (n == 0) {
            throw std::runtime_error("ConfigParser: " + key + " must be greater than zero");
        }
        return n;
    }

    static inline double parseDouble(const std::string &key, const std::string &val)
    {
        try {
            size_t idx = 0;
            double d = std::stod(val, &idx);
            if (idx != val.size()) {
                throw std::runtime_error("non-numeric suffix");
            }
            return d;
        } catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: " + key + " expects a number, got '" + val + "': " + ex.what());
        }
    }

    static inline bool parseBool(const std::string &key, const std::string &val)
    {
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        }
        if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        throw std::runtime_error("ConfigParser: " + key + " expects true/false, got '" + val + "'");
    }
};

} // namespace util
} // namespace docsanitizer

#endif // DOCSANITIZER_UTIL_CONFIG_PARSER_HPP
