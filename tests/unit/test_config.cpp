/*
 * dircat C++ - Configuration tests
 */
#include <gtest/gtest.h>

#include <dircat/core/config.hpp>
#include "test_helpers.hpp"

using namespace dircat;
using dircat::testing_support::TempDir;

TEST(ConfigTest, DottedKeysReadNestedObjects) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(
        "{\"safe_mode\": {\"enabled\": true, \"max_json_depth\": 16, "
        "\"preset\": \"strict\", \"allowed_domains\": [\"github.com\", 7, \"gitlab.com\"]}}"));

    EXPECT_TRUE(cfg.has("safe_mode.enabled"));
    EXPECT_FALSE(cfg.has("safe_mode.missing"));
    EXPECT_FALSE(cfg.has("safe_mode.enabled.deeper"));

    EXPECT_TRUE(cfg.get_bool("safe_mode.enabled", false));
    EXPECT_EQ(16, cfg.get_int("safe_mode.max_json_depth", 0));
    EXPECT_EQ("strict", cfg.get_string("safe_mode.preset", "default"));

    std::vector<std::string> domains = cfg.get_string_list("safe_mode.allowed_domains");
    ASSERT_EQ(2u, domains.size());
    EXPECT_EQ("gitlab.com", domains[1]);
}

TEST(ConfigTest, WrongTypesFallBackToDefault) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string("{\"a\": \"yes\", \"b\": 1.5, \"c\": 3}"));
    EXPECT_FALSE(cfg.get_bool("a", false));
    EXPECT_EQ(9, cfg.get_int("b", 9));
    EXPECT_EQ("fallback", cfg.get_string("c", "fallback"));
    EXPECT_TRUE(cfg.get_string_list("c").empty());
}

TEST(ConfigTest, InvalidInputKeepsPreviousContents) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string("{\"log\": {\"level\": \"debug\"}}"));

    EXPECT_FALSE(cfg.load_string("{not json"));
    EXPECT_FALSE(cfg.last_error().empty());
    EXPECT_FALSE(cfg.load_string("[1, 2]"));
    EXPECT_EQ("config root must be a JSON object", cfg.last_error());

    EXPECT_EQ("debug", cfg.get_string("log.level", "info"));
}

TEST(ConfigTest, SettersCreateIntermediateObjects) {
    Config cfg;
    cfg.set_bool("safe_mode.enabled", true);
    cfg.set_int("validation.workers", 8);
    cfg.set_string("safe_mode.preset", "strict");

    EXPECT_TRUE(cfg.get_bool("safe_mode.enabled", false));
    EXPECT_EQ(8, cfg.get_int("validation.workers", 0));
    EXPECT_EQ("strict", cfg.get_string("safe_mode.preset", ""));
    EXPECT_TRUE(cfg.data()["safe_mode"].is_object());
}

TEST(ConfigTest, LoadFile) {
    TempDir dir;
    ASSERT_TRUE(dir.valid());
    std::string path = dir.file("config.json", "{\"log\": {\"level\": \"warn\"}}");

    Config cfg;
    ASSERT_TRUE(cfg.load_file(path));
    EXPECT_EQ("warn", cfg.get_string("log.level", ""));

    EXPECT_FALSE(cfg.load_file(dir.path() + "/missing.json"));
    EXPECT_NE(std::string::npos, cfg.last_error().find("cannot open"));
}
