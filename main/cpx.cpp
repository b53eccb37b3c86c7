#include "cli/App.hpp"

int main(const int argc, char** argv) {
    return mvx::cli::App(mvx::transfer::Mode::Copy).run(argc, argv);
}
