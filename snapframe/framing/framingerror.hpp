// snapframe/framing/framingerror.hpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "snapframe/system/error.hpp"
#include <ostream>

namespace snapframe {
namespace framing {

enum struct ErrorKindE : uint8_t {
    None,
    Format,
    Corruption,
    UnsupportedChunk,
    TruncatedStream,
    Closed,
    //! Anything reported by a channel, passed through unchanged
    ChannelIO,
};

ErrorKindE error_kind(const ErrorConditionT& _rerr);

std::ostream& operator<<(std::ostream& _ros, const ErrorKindE _kind);

extern const ErrorConditionT error_missing_stream_marker;
extern const ErrorConditionT error_invalid_stream_marker;
extern const ErrorConditionT error_chunk_too_short;
extern const ErrorConditionT error_chunk_too_large;
extern const ErrorConditionT error_block_too_large;
extern const ErrorConditionT error_block_decode;
extern const ErrorConditionT error_checksum_mismatch;
extern const ErrorConditionT error_unsupported_chunk;
extern const ErrorConditionT error_truncated_stream;
extern const ErrorConditionT error_closed;
extern const ErrorConditionT error_channel_io;
extern const ErrorConditionT error_channel_short_write;

} // namespace framing
} // namespace snapframe
