#include "cronlet/cli/app.hpp"

int main(int argc, char** argv) {
    cronlet::cli::App app;
    return app.run(argc, argv);
}
