#include "app/cli.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    const int rc = litereplica::app::run(args, std::cout);
    if (rc == litereplica::app::kExitUsage) {
        litereplica::app::print_usage(argv[0], std::cerr);
    }
    return rc;
}
