#include "retable/tools/retable_command.hpp"

#include <iostream>

int main(int argc, char** argv)
{
    return retable::tools::run_retable_command(argc, argv, std::cin, std::cout, std::cerr);
}
