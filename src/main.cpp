//
//  main.cpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include <iostream>
#include <string>
#include <vector>

#include "cli.hpp"

int main(int argc, char **argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return qovcheck::run_cli(args, std::cout, std::cerr);
}
