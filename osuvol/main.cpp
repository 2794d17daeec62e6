#include <osuvol/app.hpp>

#include <iostream>

int main(int argc, char* argv[])
{
    return osuvol::run_cli(argc, argv, std::cout, std::cerr);
}
