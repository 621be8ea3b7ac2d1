#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "config/sanitizer_config.hpp"
#include "core/errors.hpp"
#include "core/media_kind.hpp"
#include "policy/policy_resolver.hpp"
#include "policy/profile_store.hpp"
#include "sanitize/ollama_backend.hpp"
#include "sanitize/sanitization_engine.hpp"
#include "store/object_store.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace logger = docsanitizer::util::logger;

namespace {

bool readFile(const std::string &path, std::vector<uint8_t> &out)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

} // namespace

int main(int argc, char **argv)
{
    using namespace docsanitizer;

    // stdout carries the sanitized document and the profile table.
    logger::setConsoleStream(std::cerr);
    logger::setLogLevel(logger::LogLevel::INFO);
    logger::info("[main] DocSanitizer starting...");

    // 1. Parse configuration
    config::SanitizerConfig cfg;
    util::ConfigParser configParser(cfg);

    std::string configPath = "docsanitizer.conf";
    if (argc > 1) {
        configPath = argv[1];
    }
    try {
        configParser.loadFromFile(configPath);
        configParser.applyEnvironment();
        logger::setLogLevel(logger::parseLogLevel(cfg.logLevel));
    } catch (const std::exception &ex) {
        logger::critical(std::string("[main] Invalid configuration: ") + ex.what());
        return 1;
    }
    if (!cfg.logFile.empty()) {
        logger::enableFileOutput(cfg.logFile, true);
    }

    // 2. Profiles
    std::unique_ptr<policy::ProfileStore> profiles;
    try {
        profiles = std::make_unique<policy::ProfileStore>(cfg.profileDatabase);
    } catch (const std::exception &ex) {
        logger::critical(std::string("[main] Failed to open profile store: ") + ex.what());
        return 1;
    }
    policy::PolicyResolver resolver(*profiles);

    if (argc <= 2) {
        std::cout << profiles->formatProfilesTable() << std::endl;
        std::cout << "Usage: " << argv[0] << " [config] [document] [profile]" << std::endl;
        return 0;
    }

    // 3. Object store with its reclamation sweep
    store::ObjectStore objectStore(std::chrono::duration_cast<std::chrono::milliseconds>(cfg.objectTtl()),
                                   std::chrono::duration_cast<std::chrono::milliseconds>(cfg.sweepInterval()),
                                   cfg.maxObjectBytes);
    objectStore.startReclamation();

    // 4. Backend and engine
    sanitize::OllamaOptions ollama;
    ollama.endpoint = cfg.backendEndpoint;
    ollama.model = cfg.backendModel;
    ollama.temperature = cfg.temperature;
    ollama.topP = cfg.topP;
    ollama.numPredict = static_cast<int>(cfg.numPredict);
    ollama.timeout = std::chrono::seconds(cfg.backendTimeoutSeconds);

    int exitCode = 0;
    try {
        sanitize::OllamaBackend backend(ollama);
        sanitize::SanitizationEngine engine(objectStore, resolver, backend,
                                            sanitize::EngineOptions::fromConfig(cfg));

        // 5. Upload and sanitize the document
        const std::string documentPath = argv[2];
        const std::string profileName = argc > 3 ? argv[3] : policy::ProfileStore::kDefaultProfileName;

        std::vector<uint8_t> bytes;
        if (!readFile(documentPath, bytes)) {
            logger::error("[main] Cannot read " + documentPath);
            objectStore.stopReclamation();
            return 1;
        }

        std::string id = objectStore.put(std::move(bytes), core::mediaKindFromFilename(documentPath), documentPath);
        logger::info("[main] Uploaded " + documentPath + " as " + id);

        sanitize::SanitizationResult result = engine.sanitize(id, profileName);
        std::cout << result.render();
    } catch (const core::SanitizerError &ex) {
        logger::error(std::string("[main] ") + ex.what());
        exitCode = 2;
    } catch (const std::exception &ex) {
        logger::error(std::string("[main] ") + ex.what());
        exitCode = 1;
    }

    // 6. Shutdown
    objectStore.stopReclamation();
    logger::info("[main] DocSanitizer exiting.");
    return exitCode;
}
