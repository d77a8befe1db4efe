#include <iostream>

#include "cli.h"
#include "refundError.h"

int main(int argc, char* argv[]) {
    try {
        CLI cli;
        cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << ErrorReport(e) << std::endl;
        return 1;
    }

    return 0;
}
