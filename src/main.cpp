#include "warden/cli/app.hpp"

int main(int argc, char** argv) {
    warden::cli::App app;
    return app.run(argc, argv);
}
