/*
 * mdguard C++17 - Markdown chunk planner and span guard
 *
 * Usage:
 *   ./mdguard [--config config.json] [--dry-run] [INPUT]
 *
 * Settings are read from config.json when present.
 */
#include <mdguard/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = mdguard::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
