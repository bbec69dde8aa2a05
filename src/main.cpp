#include "core/cli.hpp"
#include "app.hpp"

int main(int argc, char* argv[]) {
    int cli_result = CLI::run(argc, argv);

    if (cli_result != -1) {
        // handled by CLI (run, check, steps, validate, help, version, or error)
        return cli_result;
    }

    // No subcommand → launch TUI on the current directory
    App app(".");
    app.run();
    return 0;
}
