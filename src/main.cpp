/*
 * dircat C++ - dircat-guard
 *
 * Command-line front end to the safe mode validation layer.
 *
 * Usage:
 *   ./dircat-guard [--config config.json] [--strict] <command> [args]
 */
#include <dircat/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = dircat::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal setup errors
        app.shutdown();
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
