#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

#include "functions/config/src/config.hpp"

using namespace epubkit;

namespace {

std::filesystem::path write_temp(const std::string& name, const std::string& content) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path, std::ios::binary) << content;
    return path;
}

} // namespace

TEST(Config, LoadEnvSkipsCommentsAndBlankLines) {
    auto path = write_temp("epubkit_env_test", "# comment\r\n\r\nEPUBKIT_LOG_LEVEL = debug\r\nnot a pair\nA=b=c\n");
    auto env = load_env(path);
    std::filesystem::remove(path);

    EXPECT_EQ(env.size(), 2u);
    EXPECT_EQ(env["EPUBKIT_LOG_LEVEL"], "debug");
    EXPECT_EQ(env["A"], "b=c");
}

TEST(Config, MissingFileGivesDefaults) {
    Config config = load_config("/nonexistent/epubkit/.env");
    EXPECT_EQ(config.log_level, LogLevel::Warn);
    EXPECT_FALSE(config.omit_legacy);
    EXPECT_EQ(config.xml_indent, 2);
}

TEST(Config, ReadsKnownKeys) {
    Config config = config_from_env({{"EPUBKIT_LOG_LEVEL", "INFO"},
                                     {"EPUBKIT_OMIT_LEGACY", "true"},
                                     {"EPUBKIT_XML_INDENT", "0"}});
    EXPECT_EQ(config.log_level, LogLevel::Info);
    EXPECT_TRUE(config.omit_legacy);
    EXPECT_EQ(config.xml_indent, 0);
}

TEST(Config, RejectsInvalidValues) {
    EXPECT_THROW(config_from_env({{"EPUBKIT_LOG_LEVEL", "loud"}}), std::runtime_error);
    EXPECT_THROW(config_from_env({{"EPUBKIT_OMIT_LEGACY", "maybe"}}), std::runtime_error);
    EXPECT_THROW(config_from_env({{"EPUBKIT_XML_INDENT", "-1"}}), std::runtime_error);
}

TEST(Config, ApplySetsLogLevel) {
    Config config;
    config.log_level = LogLevel::Debug;
    apply_config(config);
    EXPECT_EQ(log_level(), LogLevel::Debug);
    set_log_level(LogLevel::Warn);
}
