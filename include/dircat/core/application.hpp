/*
 * dircat C++ - Application
 *
 * dircat-guard: command-line front end to the safe mode layer.
 *
 *   dircat-guard [--config FILE] [--strict] [--log-level L] <command> ...
 *
 *   check-input <input>                 validate a repository URL or path
 *   check-file <path> [--root DIR]      containment and link checks
 *   check-request scan|generate <f|->   run a request body through RequestGuard
 *   sanitize <text>                     scrub paths from a message
 *   probe <url>                         validate, then GET over a pinned connection
 */
#ifndef dircat_CORE_APPLICATION_HPP
#define dircat_CORE_APPLICATION_HPP

#include "config.hpp"
#include <dircat/security/safe_mode.hpp>

#include <string>
#include <vector>

namespace dircat {

class ValidationPool;

struct AppInfo {
    static constexpr const char* NAME = "dircat-guard";
    static constexpr const char* VERSION = "1.0.0";
};

void print_usage(const char* prog);
void print_version();

class Application {
public:
    static Application& instance();

    // False when the process should exit right away (help, version, bad
    // arguments, unreadable config); exit_code() says with what.
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    int exit_code() const { return exit_code_; }

    Config& config() { return config_; }
    const SafeModeConfig& safe_mode() const { return safe_mode_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    bool load_config();
    void setup_logging();
    void setup_safe_mode();
    void setup_pool();

    int cmd_check_input();
    int cmd_check_file();
    int cmd_check_request();
    int cmd_sanitize();
    int cmd_probe();

    Config config_;
    SafeModeConfig safe_mode_;
    ValidationPool* pool_;

    std::string config_file_;
    std::string log_level_override_;
    bool force_strict_;
    bool curl_ready_;

    std::string command_;
    std::vector<std::string> args_;
    int exit_code_;
};

} // namespace dircat

#endif // dircat_CORE_APPLICATION_HPP
