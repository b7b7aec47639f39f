#include "cli.hpp"

int main(int argc, char* argv[]) {
    return kpctl::cli_run(argc, argv);
}
