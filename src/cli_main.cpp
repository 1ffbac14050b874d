#include "jsonexpect/Cli.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return jsonexpect::run_cli(argc, argv, std::cout, std::cerr);
}
