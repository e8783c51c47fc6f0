#include <canonguard/tools/CheckCommand.hpp>

#include <iostream>

int main(int argc, char** argv) {
    return CG::Tools::RunCheckCommand(argc, argv, std::cout, std::cerr);
}
