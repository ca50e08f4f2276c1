#include "cli.hpp"

int main(int argc, char** argv) {
    return chkr::run_cli(argc, argv);
}
