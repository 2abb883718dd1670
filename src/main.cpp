#include "tagattest/sdk/CommandLine.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    tagattest::sdk::CommandLine command_line(std::cout, std::cerr);
    return command_line.run(argc, argv);
}
