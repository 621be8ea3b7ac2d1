#ifndef DOCSANITIZER_TEST_UNIT_TEST_CONFIG_PARSER_HPP
#define DOCSANITIZER_TEST_UNIT_TEST_CONFIG_PARSER_HPP

// test/unit/test_config_parser.hpp
// -----------------------------------------------------------
// key=value config files and environment overrides.

#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>
#include <iostream>
#include <map>
#include <sstream>
#include <string>

#include "config/sanitizer_config.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

using docsanitizer::config::SanitizerConfig;
using docsanitizer::util::ConfigParser;

void writeConfigFile(const std::string &path, const std::string &content)
{
    std::ofstream ofs(path, std::ios::trunc);
    ofs << content;
}

TEST(ConfigParserTest, DefaultsMatchDocumentedValues) {
    SanitizerConfig cfg;
    EXPECT_EQ(cfg.objectTtlSeconds, (uint64_t)300);
    EXPECT_EQ(cfg.sweepInterval(), std::chrono::seconds(30));
    EXPECT_EQ(cfg.maxChunkChars, (uint64_t)6000);
    EXPECT_EQ(cfg.chunkFanOut, (uint64_t)4);
    EXPECT_TRUE(cfg.deleteAfterSanitize);
    EXPECT_EQ(cfg.backendEndpoint, "http://127.0.0.1:11434");
}

TEST(ConfigParserTest, LoadsKeysCommentsAndBlankLines) {
    const std::string file = "test_docsanitizer.conf";
    writeConfigFile(file,
                    "# object store\n"
                    "objectTtlSeconds = 120\n"
                    "\n"
                    "sweepIntervalSeconds=5\n"
                    "maxChunkChars=2000\n"
                    "backendEndpoint=http://models.local:11434/\n"
                    "deleteAfterSanitize=false\n"
                    "temperature=0.3\n"
                    "someFutureKey=1\n");

    SanitizerConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_TRUE(parser.loadFromFile(file));
    EXPECT_EQ(cfg.objectTtlSeconds, (uint64_t)120);
    EXPECT_EQ(cfg.sweepInterval(), std::chrono::seconds(5));
    EXPECT_EQ(cfg.maxChunkChars, (uint64_t)2000);
    EXPECT_EQ(cfg.backendEndpoint, "http://models.local:11434");
    EXPECT_FALSE(cfg.deleteAfterSanitize);
    EXPECT_DOUBLE_EQ(cfg.temperature, 0.3);

    std::remove(file.c_str());
}

TEST(ConfigParserTest, MissingFileKeepsDefaults) {
    SanitizerConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_FALSE(parser.loadFromFile("does_not_exist_docsanitizer.conf"));
    EXPECT_EQ(cfg.objectTtlSeconds, (uint64_t)300);
}

TEST(ConfigParserTest, MalformedContentThrows) {
    const std::string file = "test_docsanitizer_bad.conf";
    SanitizerConfig cfg;
    ConfigParser parser(cfg);

    writeConfigFile(file, "objectTtlSeconds 120\n");
    EXPECT_THROW(parser.loadFromFile(file), std::runtime_error);

    writeConfigFile(file, "maxChunkChars=lots\n");
    EXPECT_THROW(parser.loadFromFile(file), std::runtime_error);

    writeConfigFile(file, "chunkFanOut=0\n");
    EXPECT_THROW(parser.loadFromFile(file), std::runtime_error);

    writeConfigFile(file, "deleteAfterSanitize=maybe\n");
    EXPECT_THROW(parser.loadFromFile(file), std::runtime_error);

    std::remove(file.c_str());
}

TEST(ConfigParserTest, DurationsAboveTenYearsAreRejected) {
    const std::string file = "test_docsanitizer_durations.conf";
    SanitizerConfig cfg;
    ConfigParser parser(cfg);

    writeConfigFile(file, "requestTimeoutSeconds=18446744073709551615\n");
    EXPECT_THROW(parser.loadFromFile(file), std::runtime_error);
    EXPECT_EQ(cfg.requestTimeoutSeconds, (uint64_t)900);

    writeConfigFile(file, "objectTtlSeconds=315360001\n");
    EXPECT_THROW(parser.loadFromFile(file), std::runtime_error);

    writeConfigFile(file, "sweepIntervalSeconds=9223372036854775807\n");
    EXPECT_THROW(parser.loadFromFile(file), std::runtime_error);

    writeConfigFile(file, "backendTimeoutSeconds=400000000\n");
    EXPECT_THROW(parser.loadFromFile(file), std::runtime_error);

    writeConfigFile(file, "backendBackoffMillis=315360000001\n");
    EXPECT_THROW(parser.loadFromFile(file), std::runtime_error);

    // The ceiling itself is accepted and converts without overflow.
    writeConfigFile(file, "requestTimeoutSeconds=315360000\nobjectTtlSeconds=315360000\n");
    EXPECT_TRUE(parser.loadFromFile(file));
    EXPECT_EQ(cfg.requestTimeoutSeconds, SanitizerConfig::kMaxDurationSeconds);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.requestTimeout());
    EXPECT_EQ(millis.count(), 315360000000LL);
    EXPECT_EQ(cfg.sweepInterval(), std::chrono::seconds(31536000));

    // Non-duration sizes keep the full unsigned range.
    writeConfigFile(file, "maxObjectBytes=18446744073709551615\n");
    EXPECT_TRUE(parser.loadFromFile(file));

    std::remove(file.c_str());
}

TEST(ConfigParserTest, EnvironmentDurationIsBounded) {
    SanitizerConfig cfg;
    ConfigParser parser(cfg);
    EXPECT_THROW(parser.applyEnvironment([](const char *name) -> const char * {
        return std::string(name) == "FILE_TTL_SECONDS" ? "99999999999999" : nullptr;
    }),
                 std::runtime_error);
    EXPECT_EQ(cfg.objectTtlSeconds, (uint64_t)300);
}

TEST(ConfigParserTest, EnvironmentOverridesFileValues) {
    std::map<std::string, std::string> env = {
        {"FILE_TTL_SECONDS", "45"},
        {"OLLAMA_HOST", "http://gpu-box:11434/"},
        {"OLLAMA_MODEL", "llama3:8b"},
        {"PROFILE_STORAGE", "/tmp/profiles.sqlite"},
        {"LOG_LEVEL", "debug"},
    };
    SanitizerConfig cfg;
    ConfigParser parser(cfg);
    parser.applyEnvironment([&env](const char *name) -> const char * {
        auto it = env.find(name);
        return it == env.end() ? nullptr : it->second.c_str();
    });

    EXPECT_EQ(cfg.objectTtlSeconds, (uint64_t)45);
    EXPECT_EQ(cfg.backendEndpoint, "http://gpu-box:11434");
    EXPECT_EQ(cfg.backendModel, "llama3:8b");
    EXPECT_EQ(cfg.profileDatabase, "/tmp/profiles.sqlite");
    EXPECT_EQ(cfg.logLevel, "debug");
    // Untouched settings keep their defaults.
    EXPECT_EQ(cfg.maxChunkChars, (uint64_t)6000);
}

TEST(LoggerTest, ParsesLevelNames) {
    namespace logger = docsanitizer::util::logger;
    EXPECT_EQ(logger::parseLogLevel("debug"), logger::LogLevel::DEBUG);
    EXPECT_EQ(logger::parseLogLevel("Warning"), logger::LogLevel::WARN);
    EXPECT_EQ(logger::parseLogLevel("CRITICAL"), logger::LogLevel::CRITICAL);
    EXPECT_THROW(logger::parseLogLevel("loud"), std::invalid_argument);
}

TEST(LoggerTest, ConsoleLinesFollowTheSelectedStream) {
    namespace logger = docsanitizer::util::logger;
    std::ostringstream captured;
    std::ostringstream stdoutCapture;
    const logger::LogLevel level = logger::Logger::getInstance().getLogLevel();
    std::streambuf *previous = std::cout.rdbuf(stdoutCapture.rdbuf());

    logger::setLogLevel(logger::LogLevel::WARN);
    logger::setConsoleStream(captured);
    logger::warn("[LoggerTest] routed away from stdout");
    logger::setConsoleStream(std::cout);
    logger::setLogLevel(level);
    std::cout.rdbuf(previous);

    EXPECT_NE(captured.str().find("[WARN] [LoggerTest] routed away from stdout"), std::string::npos);
    EXPECT_EQ(stdoutCapture.str().find("[LoggerTest]"), std::string::npos);
}

} // anonymous namespace

#endif // DOCSANITIZER_TEST_UNIT_TEST_CONFIG_PARSER_HPP
