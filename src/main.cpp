#include "flowgate/cli/app.hpp"

auto main(int argc, char** argv) -> int {
    flowgate::cli::App app;
    return app.run(argc, argv);
}
