/*
 * dircat C++ - Safe mode configuration tests
 */
#include <gtest/gtest.h>

#include <dircat/security/safe_mode.hpp>

#include <limits>

using namespace dircat;

TEST(SafeModeConfigTest, DefaultsAreDisabled) {
    SafeModeConfig c = SafeModeConfig::defaults();
    EXPECT_FALSE(c.enabled);
    EXPECT_TRUE(c.allow_local_paths);
    EXPECT_FALSE(c.allowed_domains.has_value());
    EXPECT_FALSE(c.allowed_roots.has_value());
    EXPECT_TRUE(c.validate_input("/home/me/project").success);
    EXPECT_TRUE(c.validate_input("http://localhost:8080/repo").success);
}

TEST(SafeModeConfigTest, StrictPresetIsRestrictive) {
    SafeModeConfig c = SafeModeConfig::strict();
    EXPECT_TRUE(c.enabled);
    EXPECT_FALSE(c.allow_local_paths);
    EXPECT_FALSE(c.allow_symlinks);
    EXPECT_TRUE(c.reject_hardlinks);
    ASSERT_TRUE(c.allowed_domains.has_value());
    EXPECT_EQ(1u, c.allowed_domains->count("github.com"));
    EXPECT_EQ(1u, c.allowed_domains->count("gitlab.com"));
    EXPECT_LT(c.max_pattern_length, SafeModeConfig::defaults().max_pattern_length);
    EXPECT_LT(c.max_json_depth, SafeModeConfig::defaults().max_json_depth);
    EXPECT_LT(c.max_array_length, SafeModeConfig::defaults().max_array_length);

    EXPECT_EQ(SecurityErrorKind::LocalPathsDisabled, c.validate_input("/etc/passwd").error.kind);
}

TEST(SafeModeConfigTest, StrictPresetBoundsScanWork) {
    SafeModeConfig c = SafeModeConfig::strict();
    EXPECT_EQ(10u * 1024 * 1024, c.max_file_size);
    EXPECT_EQ(500u * 1024 * 1024, c.max_repo_size);
    EXPECT_EQ(50u * 1024 * 1024, c.max_output_size);
    EXPECT_EQ(1000u, c.max_file_count);
    EXPECT_FALSE(c.allow_clipboard);

    SafeModeConfig d = SafeModeConfig::defaults();
    EXPECT_EQ(std::numeric_limits<uint64_t>::max(), d.max_file_size);
    EXPECT_EQ(std::numeric_limits<size_t>::max(), d.max_file_count);
    EXPECT_TRUE(d.allow_clipboard);
}

TEST(SafeModeConfigTest, FilePolicyFollowsFlags) {
    SafeModeConfig c = SafeModeConfig::strict();
    FileAccessPolicy p = c.file_policy();
    EXPECT_TRUE(p.require_containment);
    EXPECT_TRUE(p.reject_hardlinks);
    EXPECT_TRUE(p.reject_symlinks);

    c.allow_symlinks = true;
    c.reject_hardlinks = false;
    p = c.file_policy();
    EXPECT_FALSE(p.reject_symlinks);
    EXPECT_FALSE(p.reject_hardlinks);
}

TEST(SafeModeConfigTest, DomainAllowlistIsExact) {
    SafeModeConfig c = SafeModeConfig::strict();
    EXPECT_TRUE(c.is_domain_allowed("github.com"));
    EXPECT_TRUE(c.is_domain_allowed("GitHub.com."));
    EXPECT_FALSE(c.is_domain_allowed("api.github.com"));
    EXPECT_FALSE(c.is_domain_allowed("github.com.evil.example"));
    EXPECT_FALSE(c.is_domain_allowed("evilgithub.com"));
    EXPECT_FALSE(c.is_domain_allowed(""));

    c.allowed_domains->insert("[2606:50c0::1]");
    EXPECT_TRUE(c.is_domain_allowed("[2606:50C0::1]"));

    c.allowed_domains.reset();
    EXPECT_TRUE(c.is_domain_allowed("anything.example"));
}

TEST(SafeModeConfigTest, SensitiveRootsDeduplicated) {
    SafeModeConfig c;
    c.add_sensitive_root("/srv/app");
    c.add_sensitive_root(" /srv/app ");
    c.add_sensitive_root("");
    ASSERT_EQ(1u, c.sensitive_roots.size());
    EXPECT_EQ("/srv/app", c.sensitive_roots[0]);
}

// ============================================================================
// from_config
// ============================================================================

TEST(SafeModeConfigTest, FromConfigDefaultsWhenEmpty) {
    Config cfg;
    SafeModeConfig c = SafeModeConfig::from_config(cfg);
    EXPECT_FALSE(c.enabled);
    EXPECT_EQ(SafeModeConfig::defaults().max_json_depth, c.max_json_depth);
}

TEST(SafeModeConfigTest, FromConfigPresetAndOverrides) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(
        "{\"safe_mode\": {"
        "  \"preset\": \"Strict\","
        "  \"allow_local_paths\": true,"
        "  \"allowed_domains\": [\" GitHub.com \", \"codeberg.org.\", \"\"],"
        "  \"allowed_roots\": [\"/srv/repos\"],"
        "  \"sensitive_roots\": [\"/opt/dircat\"],"
        "  \"max_pattern_length\": 64,"
        "  \"max_json_depth\": 0,"
        "  \"request_timeout_ms\": 5000"
        "}}"));

    SafeModeConfig c = SafeModeConfig::from_config(cfg);
    EXPECT_TRUE(c.enabled);
    EXPECT_TRUE(c.allow_local_paths);
    EXPECT_FALSE(c.allow_symlinks);

    ASSERT_TRUE(c.allowed_domains.has_value());
    EXPECT_EQ(2u, c.allowed_domains->size());
    EXPECT_TRUE(c.is_domain_allowed("github.com"));
    EXPECT_TRUE(c.is_domain_allowed("codeberg.org"));
    EXPECT_FALSE(c.is_domain_allowed("gitlab.com"));

    ASSERT_TRUE(c.allowed_roots.has_value());
    EXPECT_EQ("/srv/repos", (*c.allowed_roots)[0]);
    ASSERT_EQ(1u, c.sensitive_roots.size());

    EXPECT_EQ(64u, c.max_pattern_length);
    EXPECT_EQ(SafeModeConfig::strict().max_json_depth, c.max_json_depth);
    EXPECT_EQ(5000, c.request_timeout_ms);
}

TEST(SafeModeConfigTest, UnknownPresetFallsBackToStrict) {
    Config cfg;
    cfg.set_string("safe_mode.preset", "paranoid-ish");
    SafeModeConfig c = SafeModeConfig::from_config(cfg);
    EXPECT_TRUE(c.enabled);
    EXPECT_FALSE(c.allow_local_paths);
}

TEST(SafeModeConfigTest, EnabledFlagOverridesDefaultPreset) {
    Config cfg;
    cfg.set_bool("safe_mode.enabled", true);
    SafeModeConfig c = SafeModeConfig::from_config(cfg);
    EXPECT_TRUE(c.enabled);
    EXPECT_TRUE(c.allow_local_paths);
    EXPECT_FALSE(c.allowed_domains.has_value());
}

TEST(SafeModeConfigTest, FromConfigReadsWorkBounds) {
    Config cfg;
    ASSERT_TRUE(cfg.load_string(
        "{\"safe_mode\": {"
        "  \"preset\": \"strict\","
        "  \"max_file_size\": 4096,"
        "  \"max_repo_size\": 6442450944,"
        "  \"max_output_size\": -1,"
        "  \"max_file_count\": 20,"
        "  \"allow_clipboard\": true"
        "}}"));

    SafeModeConfig c = SafeModeConfig::from_config(cfg);
    EXPECT_EQ(4096u, c.max_file_size);
    EXPECT_EQ(6442450944ull, c.max_repo_size);
    EXPECT_EQ(SafeModeConfig::strict().max_output_size, c.max_output_size);
    EXPECT_EQ(20u, c.max_file_count);
    EXPECT_TRUE(c.allow_clipboard);
}
