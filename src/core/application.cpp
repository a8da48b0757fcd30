/*
 * dircat C++ - Application Implementation
 *
 * Owns the configuration, the safe mode value and the validation pool for
 * the lifetime of one dircat-guard invocation.
 */
#include <dircat/core/application.hpp>
#include <dircat/core/logger.hpp>
#include <dircat/core/utils.hpp>
#include <dircat/security/input_validator.hpp>
#include <dircat/security/file_access.hpp>
#include <dircat/security/error_sanitizer.hpp>
#include <dircat/security/complexity_guard.hpp>
#include <dircat/service/request_guard.hpp>
#include <dircat/service/validation_pool.hpp>
#include <dircat/net/http_client.hpp>

#include <iostream>
#include <fstream>
#include <cerrno>
#include <cstring>
#include <climits>
#include <sys/stat.h>
#include <unistd.h>
#include <curl/curl.h>

namespace dircat {

// ============================================================================
// Utility Functions
// ============================================================================

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - safe mode validation for dircat inputs\n\n"
              << "Usage: " << prog << " [options] <command> [args]\n\n"
              << "Options:\n"
              << "  --config FILE     Load settings from a JSON config file\n"
              << "  --strict          Use the strict safe mode preset\n"
              << "  --log-level L     debug, info, warn or error\n"
              << "  -h, --help        Show this help message\n"
              << "  -v, --version     Show version\n\n"
              << "Commands:\n"
              << "  check-input <input>                   Validate a repository URL or local path\n"
              << "  check-file <path> [--root DIR]        Containment and link checks for a file\n"
              << "  check-request scan|generate <file|->  Run a request body through the guard\n"
              << "  sanitize <text>                       Scrub filesystem paths from a message\n"
              << "  probe <url>                           Validate, then GET over a pinned connection\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

namespace {

static std::string current_directory() {
    char buf[PATH_MAX];
    if (getcwd(buf, sizeof(buf)) == NULL) {
        LOG_WARN("getcwd failed: %s", strerror(errno));
        return "";
    }
    return std::string(buf);
}

// Reads at most limit + 1 bytes so an oversized body is still reported
// as too large without being held in memory whole.
static bool read_body(const std::string& source, size_t limit, std::string& out) {
    std::istream* in = &std::cin;
    std::ifstream file;
    if (source != "-") {
        file.open(source.c_str(), std::ios::in | std::ios::binary);
        if (!file) {
            return false;
        }
        in = &file;
    }

    out.clear();
    char buf[8192];
    while (out.size() <= limit && in->read(buf, sizeof(buf)).gcount() > 0) {
        out.append(buf, static_cast<size_t>(in->gcount()));
    }
    if (out.size() > limit + 1) {
        out.resize(limit + 1);
    }
    return !in->bad();
}

static void print_denied(const SecurityError& error, const SafeModeConfig& cfg) {
    std::cout << "denied " << error_kind_name(error.kind) << ": "
              << sanitize_error(error.message, cfg) << "\n";
}

} // namespace

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : pool_(nullptr)
    , force_strict_(false)
    , curl_ready_(false)
    , exit_code_(0)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            exit_code_ = 0;
            return false;
        }
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            print_version();
            exit_code_ = 0;
            return false;
        }
        if (command_.empty() && strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file_ = std::string(argv[++i]);
            continue;
        }
        if (command_.empty() && strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            log_level_override_ = std::string(argv[++i]);
            continue;
        }
        if (command_.empty() && strcmp(argv[i], "--strict") == 0) {
            force_strict_ = true;
            continue;
        }
        if (command_.empty()) {
            command_ = argv[i];
        } else {
            args_.push_back(argv[i]);
        }
    }

    if (command_.empty()) {
        print_usage(argv[0]);
        exit_code_ = 2;
        return false;
    }
    return true;
}

bool Application::load_config() {
    if (config_file_.empty()) {
        return true;
    }
    if (!config_.load_file(config_file_)) {
        LOG_ERROR("Failed to load config: %s", config_.last_error().c_str());
        return false;
    }
    LOG_DEBUG("Loaded config from %s", config_file_.c_str());
    return true;
}

void Application::setup_logging() {
    std::string level = log_level_override_.empty()
        ? config_.get_string("log_level", "warn")
        : log_level_override_;

    if (!Logger::instance().set_level(level)) {
        LOG_WARN("Unknown log level '%s', keeping current level", level.c_str());
    }

    std::string log_file = config_.get_string("log_file", "");
    if (!log_file.empty() && !Logger::instance().open_file(log_file)) {
        LOG_WARN("Cannot open log file '%s': %s, logging to stderr", log_file.c_str(), strerror(errno));
    }
}

void Application::setup_safe_mode() {
    if (force_strict_) {
        config_.set_string("safe_mode.preset", "strict");
        config_.set_bool("safe_mode.enabled", true);
    }
    safe_mode_ = SafeModeConfig::from_config(config_);

    std::string cwd = current_directory();
    if (!cwd.empty()) {
        safe_mode_.add_sensitive_root(cwd);
    }

    LOG_INFO("[SafeMode] %s (local paths %s, %zu sensitive roots)",
             safe_mode_.enabled ? "enabled" : "disabled",
             safe_mode_.allow_local_paths ? "allowed" : "denied",
             safe_mode_.sensitive_roots.size());
}

void Application::setup_pool() {
    int64_t workers = config_.get_int("validation.workers", 4);
    int64_t max_pending = config_.get_int("validation.max_pending", 64);
    if (workers < 1) workers = 1;
    if (max_pending < 1) max_pending = 1;

    pool_ = new ValidationPool(static_cast<size_t>(workers), static_cast<size_t>(max_pending));
}

bool Application::init(int argc, char* argv[]) {
    // Initialize libcurl globally (before threads start)
    curl_ready_ = (curl_global_init(CURL_GLOBAL_ALL) == CURLE_OK);
    if (!curl_ready_) {
        LOG_WARN("curl_global_init failed; probe will be unavailable");
    }

    if (!parse_args(argc, argv)) {
        return false;
    }
    if (!load_config()) {
        exit_code_ = 2;
        return false;
    }

    setup_logging();
    setup_safe_mode();
    setup_pool();
    return true;
}

// ============================================================================
// Commands
// ============================================================================

int Application::cmd_check_input() {
    if (args_.size() != 1) {
        std::cerr << "usage: check-input <input>\n";
        return 2;
    }

    ValidationOutcome outcome = pool_->validate(args_[0], safe_mode_, safe_mode_.request_timeout_ms);
    if (!outcome.success) {
        print_denied(outcome.error, safe_mode_);
        return 1;
    }

    std::cout << "allowed";
    if (outcome.resolved) {
        std::cout << " " << outcome.resolved->to_string();
    }
    std::cout << "\n";
    return 0;
}

int Application::cmd_check_file() {
    std::string path;
    std::string root;
    for (size_t i = 0; i < args_.size(); ++i) {
        if (args_[i] == "--root" && i + 1 < args_.size()) {
            root = args_[++i];
        } else if (path.empty()) {
            path = args_[i];
        } else {
            std::cerr << "usage: check-file <path> [--root DIR]\n";
            return 2;
        }
    }
    if (path.empty()) {
        std::cerr << "usage: check-file <path> [--root DIR]\n";
        return 2;
    }
    if (root.empty() && !safe_mode_.allowed_roots) {
        root = current_directory();
    }

    const std::vector<std::string>* roots = safe_mode_.allowed_roots ? &(*safe_mode_.allowed_roots) : nullptr;
    FileAccessOutcome outcome = validate_file_access(path, root, roots, safe_mode_.file_policy());
    if (!outcome.success) {
        print_denied(outcome.error, safe_mode_);
        return 1;
    }

    struct stat st;
    if (stat(outcome.canonical_path.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
        GuardResult size = check_file_size(static_cast<uint64_t>(st.st_size), safe_mode_);
        if (!size.success) {
            print_denied(size.error, safe_mode_);
            return 1;
        }
    }
    std::cout << "allowed " << sanitize_error(outcome.canonical_path, safe_mode_) << "\n";
    return 0;
}

int Application::cmd_check_request() {
    if (args_.size() != 2 || (args_[0] != "scan" && args_[0] != "generate")) {
        std::cerr << "usage: check-request scan|generate <file|->\n";
        return 2;
    }

    std::string body;
    if (!read_body(args_[1], safe_mode_.max_body_bytes, body)) {
        LOG_ERROR("Cannot read request body from '%s'", args_[1].c_str());
        return 2;
    }

    RequestGuard guard(safe_mode_, pool_);
    bool accepted = false;
    GuardResponse response;
    Json summary;
    if (args_[0] == "scan") {
        GuardedRequest<ScanRequest> r = guard.guard_scan(body);
        accepted = r.success;
        response = r.response;
        if (accepted) {
            summary["input_path"] = r.request.input_path;
            if (r.pinned) summary["pinned"] = r.pinned->to_string();
        }
    } else {
        GuardedRequest<GenerateRequest> r = guard.guard_generate(body);
        accepted = r.success;
        response = r.response;
        if (accepted) {
            summary["input_path"] = r.request.input_path;
            summary["selected_files"] = r.request.selected_files ? r.request.selected_files->size() : 0;
            if (r.pinned) summary["pinned"] = r.pinned->to_string();
        }
    }

    if (accepted) {
        summary["status"] = "ok";
        std::cout << 200 << "\n" << summary.dump() << "\n";
        return 0;
    }
    std::cout << response.status << "\n" << response.body << "\n";
    return 1;
}

int Application::cmd_sanitize() {
    if (args_.empty()) {
        std::cerr << "usage: sanitize <text>\n";
        return 2;
    }
    std::cout << sanitize_error(join(args_, " "), safe_mode_) << "\n";
    return 0;
}

int Application::cmd_probe() {
    if (args_.size() != 1) {
        std::cerr << "usage: probe <url>\n";
        return 2;
    }
    if (!curl_ready_) {
        LOG_ERROR("libcurl is not initialized");
        return 1;
    }

    const std::string& url = args_[0];
    ValidationOutcome outcome = pool_->validate(url, safe_mode_, safe_mode_.request_timeout_ms);
    if (!outcome.success) {
        print_denied(outcome.error, safe_mode_);
        return 1;
    }

    HttpClient http;
    http.set_timeout(static_cast<long>(safe_mode_.request_timeout_ms / 1000 + 1));
    if (outcome.resolved) {
        PinnedAddress pinned;
        if (!make_pinned_address(url, *outcome.resolved, pinned)) {
            std::cout << "denied " << error_kind_name(SecurityErrorKind::MalformedInput)
                      << ": cannot pin URL\n";
            return 1;
        }
        http.pin(pinned);
    }

    HttpResponse response = http.get(url);
    if (response.status_code == 0) {
        std::cout << "error " << sanitize_error(response.error, safe_mode_) << "\n";
        return 1;
    }
    std::cout << "HTTP " << response.status_code << " (" << response.body.size() << " bytes)";
    if (outcome.resolved) {
        std::cout << " via " << outcome.resolved->to_string();
    }
    std::cout << "\n";
    return 0;
}

int Application::run() {
    LOG_DEBUG("Running command '%s' with %zu argument(s)", command_.c_str(), args_.size());

    if (command_ == "check-input") return cmd_check_input();
    if (command_ == "check-file") return cmd_check_file();
    if (command_ == "check-request") return cmd_check_request();
    if (command_ == "sanitize") return cmd_sanitize();
    if (command_ == "probe") return cmd_probe();

    std::cerr << "Unknown command: " << command_ << "\n";
    print_usage(AppInfo::NAME);
    return 2;
}

void Application::shutdown() {
    if (pool_) {
        LOG_DEBUG("[App] Stopping validation pool (pending: %zu)", pool_->pending());
        pool_->shutdown();
        delete pool_;
        pool_ = nullptr;
    }

    // Cleanup libcurl
    if (curl_ready_) {
        curl_global_cleanup();
        curl_ready_ = false;
    }
}

} // namespace dircat
