/*
 * dircat C++ - Error sanitizer tests
 */
#include <gtest/gtest.h>

#include <dircat/security/error_sanitizer.hpp>

#include <string>
#include <vector>

using namespace dircat;

namespace {

std::vector<std::string> project_roots() {
    std::vector<std::string> roots;
    roots.push_back("/home/user/dircat");
    return roots;
}

} // namespace

TEST(ErrorSanitizerTest, ProjectRootReplacedWithToken) {
    EXPECT_EQ("Error opening file <path_redacted>: Permission denied",
              sanitize_error("Error opening file /home/user/dircat/src/main.rs: Permission denied",
                             project_roots()));
}

TEST(ErrorSanitizerTest, ConfigOverloadUsesSensitiveRoots) {
    SafeModeConfig c = SafeModeConfig::strict();
    c.add_sensitive_root("/srv/app/");
    EXPECT_EQ("Cannot read <path_redacted> (EACCES)",
              c.sanitize_error("Cannot read /srv/app/data/cache.bin (EACCES)"));
}

TEST(ErrorSanitizerTest, RootsWithSpacesRemovedCompletely) {
    std::vector<std::string> roots(1, "/Users/Jane Doe/projects");
    std::string out = sanitize_error("stat failed: /Users/Jane Doe/projects/a/b.txt", roots);
    EXPECT_EQ("stat failed: <path_redacted>", out);
    EXPECT_EQ(std::string::npos, out.find("Jane Doe"));
}

TEST(ErrorSanitizerTest, UnconfiguredAbsolutePathsRedacted) {
    std::vector<std::string> none;
    EXPECT_EQ("open <path_redacted> failed",
              sanitize_error("open /etc/shadow failed", none));
    EXPECT_EQ("<path_redacted>: No such file or directory",
              sanitize_error("/var/tmp/dircat-42/repo/README.md: No such file or directory", none));
}

TEST(ErrorSanitizerTest, WindowsPathsRedactedAndSeparatorsNormalized) {
    std::vector<std::string> none;
    EXPECT_EQ("Cannot open <path_redacted>: denied",
              sanitize_error("Cannot open C:\\Users\\bob\\secret.txt: denied", none));
    EXPECT_EQ("Cannot open <path_redacted>",
              sanitize_error("Cannot open d:/work/repo", none));
    EXPECT_EQ("pattern a/b failed", sanitize_error("pattern a\\b failed", none));
}

TEST(ErrorSanitizerTest, WindowsSensitiveRoot) {
    std::vector<std::string> roots(1, "C:\\Program Files\\dircat");
    std::string out = sanitize_error(
        "load failed: C:\\Program Files\\dircat\\plugins\\x.dll", roots);
    EXPECT_EQ("load failed: <path_redacted>", out);
}

TEST(ErrorSanitizerTest, RepeatedSlashesConsumed) {
    std::vector<std::string> none;
    EXPECT_EQ("failed at <path_redacted>", sanitize_error("failed at /opt/data//x/", none));
}

TEST(ErrorSanitizerTest, FileUrlsRedacted) {
    std::vector<std::string> none;
    EXPECT_EQ("clone of <path_redacted> refused",
              sanitize_error("clone of file:///home/me/repo refused", none));
    EXPECT_EQ("clone of <path_redacted> refused",
              sanitize_error("clone of FILE://localhost/etc refused", none));
}

TEST(ErrorSanitizerTest, PathsAfterColonRedacted) {
    std::vector<std::string> none;
    EXPECT_EQ("open <path_redacted>:<path_redacted> failed",
              sanitize_error("open /etc/passwd:/root/.ssh/id_rsa failed", none));
    EXPECT_EQ("PATH=<path_redacted>:<path_redacted>",
              sanitize_error("PATH=/usr/bin:/opt/secret/bin", none));
    EXPECT_EQ("clone failed for git@example.org:<path_redacted>",
              sanitize_error("clone failed for git@example.org:/srv/git/repo.git", none));
}

TEST(ErrorSanitizerTest, FileUrlWithoutAuthorityRedacted) {
    std::vector<std::string> none;
    EXPECT_EQ("see <path_redacted>", sanitize_error("see file:/etc/shadow", none));
    EXPECT_EQ("see <path_redacted> now", sanitize_error("see File:/etc/shadow now", none));
}

TEST(ErrorSanitizerTest, NetworkUrlsStayReadable) {
    std::vector<std::string> none;
    std::string msg = "Safe Mode: Domain 'evil.example' is not in the allowlist "
                      "(https://evil.example/org/repo.git)";
    EXPECT_EQ(msg, sanitize_error(msg, none));
}

TEST(ErrorSanitizerTest, RelativeAndRootOnlyEntriesIgnored) {
    std::vector<std::string> roots;
    roots.push_back("src");
    roots.push_back("/");
    roots.push_back("");
    EXPECT_EQ("src/main.rs: parse error", sanitize_error("src/main.rs: parse error", roots));
}

TEST(ErrorSanitizerTest, TextWithoutPathsUnchanged) {
    std::vector<std::string> none;
    std::string msg = "Safe Mode: 'pattern' exceeds maximum length of 256 characters.";
    EXPECT_EQ(msg, sanitize_error(msg, none));
    EXPECT_EQ("", sanitize_error("", none));
}

TEST(ErrorSanitizerTest, Idempotent) {
    std::vector<std::string> roots = project_roots();
    roots.push_back("C:\\build");
    const char* samples[] = {
        "Error opening file /home/user/dircat/src/main.rs: Permission denied",
        "C:\\build\\out\\a.obj and /tmp/x and file:///etc/hosts",
        "https://github.com/org/repo failed at /opt/data//x",
        "<path_redacted>/again",
        "ratio 3/4 of /a/b/c/",
        "PATH=/usr/bin:/opt/secret/bin and file:/etc/shadow",
        "https://github.com/org/repo:/tmp/x",
        "plain message"
    };
    for (size_t i = 0; i < sizeof(samples) / sizeof(samples[0]); ++i) {
        std::string once = sanitize_error(samples[i], roots);
        EXPECT_EQ(once, sanitize_error(once, roots)) << samples[i];
        EXPECT_EQ(std::string::npos, once.find("/home/user/dircat")) << samples[i];
    }
}
