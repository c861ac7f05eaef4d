//
//  cli.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace qovcheck {

// Process exit codes of the qovcheck tool.
inline constexpr int kExitOk = 0;
inline constexpr int kExitFailed = 1;  // invalid file, IO failure or comparison mismatch.
inline constexpr int kExitUsage = 2;

/**
 * @brief Run the command line tool.
 *
 * `args` excludes the program name. One positional path validates that file, two compare
 * them. Reports go to `out`, usage and IO errors to `err`.
 *
 * @return kExitOk, kExitFailed or kExitUsage.
 */
int run_cli(const std::vector<std::string> &args, std::ostream &out, std::ostream &err);

}  // namespace qovcheck
