/*
 * lgctl - Looking glass command line control
 *
 * Builds the web UI, starts the looking glass service and inspects its
 * configured devices, directives, plugins and parameters.
 *
 * Usage:
 *   ./lgctl [options] <command> [command options]
 */
#include <lgctl/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = lgctl::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
