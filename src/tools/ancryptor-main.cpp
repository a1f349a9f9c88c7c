#include "commands.hpp"
#include <iostream>

int main(int argc, char* argv[]) {
    return ancryptor::tools::run(argc, argv, std::cin, std::cout, std::cerr);
}
