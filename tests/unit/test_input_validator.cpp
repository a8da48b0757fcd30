/*
 * dircat C++ - Input validator tests
 *
 * Every test runs offline: domain names go through FakeDnsResolver.
 */
#include <gtest/gtest.h>

#include <dircat/security/input_validator.hpp>
#include "test_helpers.hpp"

#include <memory>
#include <string>

using namespace dircat;
using dircat::testing_support::FakeDnsResolver;
using dircat::testing_support::TempDir;

class InputValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        resolver = std::make_shared<FakeDnsResolver>();
        resolver->add("github.com", "140.82.112.3");
        resolver->add("gitlab.com", "172.65.251.78");
        resolver->add("rebind.example", "127.0.0.1");
        resolver->add("mixed.example", "93.184.216.34");
        resolver->add("mixed.example", "10.0.0.7");
        resolver->add("v6.example", "2606:4700::1111");
        resolver->add("v6-local.example", "fd00::5");

        strict = SafeModeConfig::strict();
        strict.resolver = resolver;

        open_network = SafeModeConfig::strict();
        open_network.allowed_domains.reset();
        open_network.resolver = resolver;
    }

    ValidationOutcome check(const std::string& input) const {
        return validate_input(input, strict);
    }

    std::shared_ptr<FakeDnsResolver> resolver;
    SafeModeConfig strict;
    SafeModeConfig open_network;
};

// ============================================================================
// Obfuscated loopback encodings
// ============================================================================

TEST_F(InputValidatorTest, LoopbackEncodingsNeverYieldAnAddress) {
    const char* inputs[] = {
        "https://127.0.0.1/repo.git",
        "https://0177.0.0.1/repo.git",
        "https://2130706433/repo.git",
        "https://0x7f000001/repo.git",
        "https://127.1/repo.git",
        "https://[::1]/repo.git",
        "https://[0000:0000:0000:0000:0000:0000:0000:0001]/repo.git",
        "https://[::ffff:127.0.0.1]/repo.git",
        "https://[64:ff9b::7f00:1]/repo.git",
    };
    for (size_t i = 0; i < sizeof(inputs) / sizeof(inputs[0]); ++i) {
        ValidationOutcome r = check(inputs[i]);
        EXPECT_FALSE(r.success) << inputs[i];
        EXPECT_FALSE(r.resolved.has_value()) << inputs[i];
        EXPECT_EQ(SecurityErrorKind::PrivateOrLoopbackAddress, r.error.kind) << inputs[i];
    }
}

TEST_F(InputValidatorTest, ZeroPaddedLoopbackBlocked) {
    const char* inputs[] = {
        "https://0127.0.0.1/",
        "https://00000000127.0.0.1/",
        "https://127.0.0.000000000001/",
    };
    for (size_t i = 0; i < sizeof(inputs) / sizeof(inputs[0]); ++i) {
        ValidationOutcome r = validate_input(inputs[i], open_network);
        EXPECT_FALSE(r.success) << inputs[i];
        EXPECT_FALSE(r.resolved.has_value()) << inputs[i];
        EXPECT_EQ(SecurityErrorKind::PrivateOrLoopbackAddress, r.error.kind) << inputs[i];
    }
}

TEST_F(InputValidatorTest, PrivateLiteralsBlockedWithoutAllowlist) {
    EXPECT_EQ(SecurityErrorKind::PrivateOrLoopbackAddress,
              validate_input("https://10.0.0.1/x", open_network).error.kind);
    EXPECT_EQ(SecurityErrorKind::PrivateOrLoopbackAddress,
              validate_input("https://169.254.169.254/latest/meta-data", open_network).error.kind);
    EXPECT_EQ(SecurityErrorKind::PrivateOrLoopbackAddress,
              validate_input("https://[fe80::1]/x", open_network).error.kind);
    EXPECT_EQ(SecurityErrorKind::PrivateOrLoopbackAddress,
              validate_input("https://0.0.0.0/x", open_network).error.kind);
}

TEST_F(InputValidatorTest, UserinfoDoesNotHideTheRealHost) {
    ValidationOutcome r = check("https://github.com@127.0.0.1/repo.git");
    EXPECT_FALSE(r.success);
    EXPECT_EQ(SecurityErrorKind::PrivateOrLoopbackAddress, r.error.kind);
}

// ============================================================================
// Schemes and transports
// ============================================================================

TEST_F(InputValidatorTest, DangerousTransportsRejectedEvenWhenDisabled) {
    SafeModeConfig off = SafeModeConfig::defaults();
    const char* inputs[] = {
        "ext::sh -c touch% /tmp/pwned",
        "EXT::sh",
        "fd::17",
        "ext://whatever",
        "Fd://3",
    };
    for (size_t i = 0; i < sizeof(inputs) / sizeof(inputs[0]); ++i) {
        EXPECT_EQ(SecurityErrorKind::ForbiddenScheme, validate_input(inputs[i], off).error.kind)
            << inputs[i];
        EXPECT_EQ(SecurityErrorKind::ForbiddenScheme, check(inputs[i]).error.kind) << inputs[i];
    }
}

TEST_F(InputValidatorTest, OnlyHttpsWhenEnabled) {
    EXPECT_EQ(SecurityErrorKind::ForbiddenScheme, check("http://github.com/a/b").error.kind);
    EXPECT_EQ(SecurityErrorKind::ForbiddenScheme, check("ssh://git@github.com/a/b").error.kind);
    EXPECT_EQ(SecurityErrorKind::ForbiddenScheme, check("file:///etc/passwd").error.kind);
    EXPECT_EQ(SecurityErrorKind::ForbiddenScheme, check("git@github.com:a/b.git").error.kind);
    EXPECT_EQ(SecurityErrorKind::ForbiddenScheme, check("transport::address").error.kind);
}

TEST_F(InputValidatorTest, ControlCharactersAlwaysMalformed) {
    SafeModeConfig off = SafeModeConfig::defaults();
    EXPECT_EQ(SecurityErrorKind::MalformedInput,
              validate_input(std::string("https://github.com/a\0b", 22), off).error.kind);
    EXPECT_EQ(SecurityErrorKind::MalformedInput, check("https://github.com/a\nb").error.kind);
}

TEST_F(InputValidatorTest, DisabledModeAcceptsEverythingElse) {
    SafeModeConfig off = SafeModeConfig::defaults();
    ValidationOutcome r = validate_input("http://127.0.0.1/repo", off);
    EXPECT_TRUE(r.success);
    EXPECT_FALSE(r.resolved.has_value());
    EXPECT_TRUE(validate_input("/home/me/project", off).success);
}

// ============================================================================
// URL hygiene
// ============================================================================

TEST_F(InputValidatorTest, MalformedAuthorities) {
    EXPECT_EQ(SecurityErrorKind::MalformedInput, check("https://127.0.0.1\\@github.com/").error.kind);
    EXPECT_EQ(SecurityErrorKind::MalformedInput, check("https://github%2ecom/").error.kind);
    EXPECT_EQ(SecurityErrorKind::MalformedInput, check("https:///path").error.kind);
    EXPECT_EQ(SecurityErrorKind::MalformedInput, check("https://github.com:99999/").error.kind);
    EXPECT_EQ(SecurityErrorKind::MalformedInput, check("https://github.com:abc/").error.kind);
    EXPECT_EQ(SecurityErrorKind::MalformedInput, check("https://[::1/").error.kind);
    EXPECT_EQ(SecurityErrorKind::MalformedInput, check("https://[zzzz]/").error.kind);
}

TEST_F(InputValidatorTest, NumericLookingHostThatIsNotAnAddress) {
    EXPECT_EQ(SecurityErrorKind::MalformedInput,
              validate_input("https://1.2.3.999/", open_network).error.kind);
    EXPECT_EQ(SecurityErrorKind::MalformedInput,
              validate_input("https://foo.0x10000000000/", open_network).error.kind);
}

TEST_F(InputValidatorTest, ParseUrlComponents) {
    ParsedUrl url;
    std::string error;
    ASSERT_TRUE(parse_url("HTTPS://user:pw@GitHub.COM.:8443/a/b?x=1", url, error)) << error;
    EXPECT_EQ("https", url.scheme);
    EXPECT_EQ("github.com", url.host);
    EXPECT_EQ(8443, url.port);
    EXPECT_EQ("/a/b?x=1", url.path);

    ASSERT_TRUE(parse_url("https://[2606:4700::1111]/x", url, error)) << error;
    EXPECT_TRUE(url.bracketed);
    EXPECT_EQ("2606:4700::1111", url.bare_host());
    EXPECT_EQ(443, url.effective_port());
}

// ============================================================================
// Allowlist and resolution
// ============================================================================

TEST_F(InputValidatorTest, AllowlistedDomainPinsResolvedAddress) {
    ValidationOutcome r = check("https://github.com/owner/repo.git");
    ASSERT_TRUE(r.success) << r.error.message;
    ASSERT_TRUE(r.resolved.has_value());
    EXPECT_EQ("140.82.112.3", r.resolved->to_string());
}

TEST_F(InputValidatorTest, AllowlistIsExactAndCaseInsensitive) {
    EXPECT_TRUE(check("https://GitHub.com./owner/repo").success);
    EXPECT_EQ(SecurityErrorKind::DomainNotAllowed, check("https://evil.com/x").error.kind);
    EXPECT_EQ(SecurityErrorKind::DomainNotAllowed, check("https://api.github.com/x").error.kind);
    EXPECT_EQ(SecurityErrorKind::DomainNotAllowed, check("https://github.com.evil.com/x").error.kind);
}

TEST_F(InputValidatorTest, AllowlistAndClassificationAreConjunctive) {
    SafeModeConfig cfg = strict;
    cfg.allowed_domains->insert("rebind.example");
    cfg.allowed_domains->insert("127.0.0.1");

    EXPECT_EQ(SecurityErrorKind::PrivateOrLoopbackAddress,
              validate_input("https://rebind.example/x", cfg).error.kind);
    EXPECT_EQ(SecurityErrorKind::PrivateOrLoopbackAddress,
              validate_input("https://127.0.0.1/x", cfg).error.kind);
}

TEST_F(InputValidatorTest, AnyPrivateAnswerFailsTheHost) {
    EXPECT_EQ(SecurityErrorKind::PrivateOrLoopbackAddress,
              validate_input("https://mixed.example/x", open_network).error.kind);
    EXPECT_EQ(SecurityErrorKind::PrivateOrLoopbackAddress,
              validate_input("https://v6-local.example/x", open_network).error.kind);
}

TEST_F(InputValidatorTest, PublicIPv6AnswerIsPinned) {
    ValidationOutcome r = validate_input("https://v6.example/x", open_network);
    ASSERT_TRUE(r.success) << r.error.message;
    EXPECT_EQ("2606:4700::1111", r.resolved->to_string());
}

TEST_F(InputValidatorTest, PublicLiteralSucceedsWithItsOwnAddress) {
    ValidationOutcome r = validate_input("https://8.8.8.8/x", open_network);
    ASSERT_TRUE(r.success) << r.error.message;
    EXPECT_EQ("8.8.8.8", r.resolved->to_string());
    EXPECT_EQ(0, resolver->calls());
}

TEST_F(InputValidatorTest, UnresolvableHost) {
    ValidationOutcome r = validate_input("https://no-such-host.example/x", open_network);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(SecurityErrorKind::ResolutionFailed, r.error.kind);
}

// ============================================================================
// Local paths
// ============================================================================

TEST_F(InputValidatorTest, LocalPathsDisabledUnderStrict) {
    EXPECT_EQ(SecurityErrorKind::LocalPathsDisabled, check("/etc").error.kind);
    EXPECT_EQ(SecurityErrorKind::LocalPathsDisabled, check("./project").error.kind);
    EXPECT_EQ(SecurityErrorKind::LocalPathsDisabled, check("C:\\Users\\me").error.kind);
}

TEST_F(InputValidatorTest, LocalPathsCheckedAgainstAllowedRoots) {
    TempDir tmp;
    ASSERT_TRUE(tmp.valid());
    std::string inside = tmp.dir("project");

    SafeModeConfig cfg = strict;
    cfg.allow_local_paths = true;
    cfg.allowed_roots = std::vector<std::string>(1, tmp.path());

    EXPECT_TRUE(validate_input(inside, cfg).success);
    EXPECT_EQ(SecurityErrorKind::PathTraversal, validate_input("/", cfg).error.kind);
    EXPECT_EQ(SecurityErrorKind::NotFound, validate_input(tmp.path() + "/missing", cfg).error.kind);
}

TEST_F(InputValidatorTest, NetworkInputDetection) {
    EXPECT_TRUE(is_network_input("https://github.com/a/b"));
    EXPECT_TRUE(is_network_input("git@github.com:a/b.git"));
    EXPECT_TRUE(is_network_input("ext::sh"));
    EXPECT_FALSE(is_network_input("/srv/repo"));
    EXPECT_FALSE(is_network_input("C:\\repo"));
    EXPECT_FALSE(is_network_input("./dir/with:colon"));
}
