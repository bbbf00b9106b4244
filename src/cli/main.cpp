#include "fnsanitizer/CLI.h"
#include <iostream>

int main(int argc, char* argv[]) {
    try {
        fns::CLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
