#include "makemcp/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    makemcp::cli::App app;
    return app.run(argc, argv);
}
