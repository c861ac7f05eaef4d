//
//  validator.hpp
//  QovCheck
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>

#include "header_parser.hpp"
#include "issue.hpp"

namespace qovcheck {

// Check every header field on its own; one field failing never hides another.
IssueList validate_header(const Header &header);

// Per-type chunk rules. SYNC, END, KEYFRAME and PFRAME are constrained; BFRAME, AUDIO,
// INDEX and unknown types are accepted as-is. Returned issues carry the chunk type but
// no offset (the walker fills that in).
IssueList validate_chunk(uint8_t type, uint8_t flags, uint32_t size, uint32_t timestamp);

}  // namespace qovcheck
