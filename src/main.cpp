#include "daemon/app/app.h"

#include <iostream>

int main(int argc, char* argv[]) {
    return daemon_app::runWrapper(argc, argv, std::cin, std::cout, std::cerr);
}
