//
//  end_marker.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "issue.hpp"

namespace qovcheck {

// Compare the final 8 bytes of the buffer with 00 00 00 00 00 00 00 01.
// Independent of the chunk walk: an END chunk is neither required nor consulted.
// Returns std::nullopt when the marker is valid.
std::optional<Issue> check_end_marker(const std::vector<uint8_t> &data);

}  // namespace qovcheck
