// snapframe/framing/src/framingerror.cpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include <sstream>

#include "snapframe/framing/framingerror.hpp"

namespace snapframe {
namespace framing {

namespace {

enum {
    Error_Missing_Stream_Marker_E = 1,
    Error_Invalid_Stream_Marker_E,
    Error_Chunk_Too_Short_E,
    Error_Chunk_Too_Large_E,
    Error_Block_Too_Large_E,
    Error_Block_Decode_E,
    Error_Checksum_Mismatch_E,
    Error_Unsupported_Chunk_E,
    Error_Truncated_Stream_E,
    Error_Closed_E,
    Error_Channel_IO_E,
    Error_Channel_Short_Write_E,
};

class ErrorCategory : public ErrorCategoryT {
public:
    ErrorCategory() {}
    const char* name() const noexcept override
    {
        return "snapframe::framing";
    }
    std::string message(int _ev) const override;
};

const ErrorCategory category;

std::string ErrorCategory::message(int _ev) const
{
    std::ostringstream oss;

    oss << "(" << name() << ":" << _ev << "): ";

    switch (_ev) {
    case 0:
        oss << "Success";
        break;
    case Error_Missing_Stream_Marker_E:
        oss << "Missing stream identifier";
        break;
    case Error_Invalid_Stream_Marker_E:
        oss << "Invalid stream identifier";
        break;
    case Error_Chunk_Too_Short_E:
        oss << "Data chunk shorter than its checksum";
        break;
    case Error_Chunk_Too_Large_E:
        oss << "Encoded chunk length exceeds limit";
        break;
    case Error_Block_Too_Large_E:
        oss << "Decoded block length exceeds limit";
        break;
    case Error_Block_Decode_E:
        oss << "Block decompression failed";
        break;
    case Error_Checksum_Mismatch_E:
        oss << "Checksum does not match";
        break;
    case Error_Unsupported_Chunk_E:
        oss << "Unrecognized unskippable chunk";
        break;
    case Error_Truncated_Stream_E:
        oss << "Unexpected end of stream";
        break;
    case Error_Closed_E:
        oss << "Closed";
        break;
    case Error_Channel_IO_E:
        oss << "Channel input/output";
        break;
    case Error_Channel_Short_Write_E:
        oss << "Channel short write";
        break;
    default:
        oss << "Unknown";
        break;
    }
    return oss.str();
}

} // namespace

/*extern*/ const ErrorConditionT error_missing_stream_marker(Error_Missing_Stream_Marker_E, category);
/*extern*/ const ErrorConditionT error_invalid_stream_marker(Error_Invalid_Stream_Marker_E, category);
/*extern*/ const ErrorConditionT error_chunk_too_short(Error_Chunk_Too_Short_E, category);
/*extern*/ const ErrorConditionT error_chunk_too_large(Error_Chunk_Too_Large_E, category);
/*extern*/ const ErrorConditionT error_block_too_large(Error_Block_Too_Large_E, category);
/*extern*/ const ErrorConditionT error_block_decode(Error_Block_Decode_E, category);
/*extern*/ const ErrorConditionT error_checksum_mismatch(Error_Checksum_Mismatch_E, category);
/*extern*/ const ErrorConditionT error_unsupported_chunk(Error_Unsupported_Chunk_E, category);
/*extern*/ const ErrorConditionT error_truncated_stream(Error_Truncated_Stream_E, category);
/*extern*/ const ErrorConditionT error_closed(Error_Closed_E, category);
/*extern*/ const ErrorConditionT error_channel_io(Error_Channel_IO_E, category);
/*extern*/ const ErrorConditionT error_channel_short_write(Error_Channel_Short_Write_E, category);

ErrorKindE error_kind(const ErrorConditionT& _rerr)
{
    if (!_rerr) {
        return ErrorKindE::None;
    }
    if (&_rerr.category() != &category) {
        return ErrorKindE::ChannelIO;
    }
    switch (_rerr.value()) {
    case Error_Missing_Stream_Marker_E:
    case Error_Invalid_Stream_Marker_E:
    case Error_Chunk_Too_Short_E:
        return ErrorKindE::Format;
    case Error_Chunk_Too_Large_E:
    case Error_Block_Too_Large_E:
    case Error_Block_Decode_E:
    case Error_Checksum_Mismatch_E:
        return ErrorKindE::Corruption;
    case Error_Unsupported_Chunk_E:
        return ErrorKindE::UnsupportedChunk;
    case Error_Truncated_Stream_E:
        return ErrorKindE::TruncatedStream;
    case Error_Closed_E:
        return ErrorKindE::Closed;
    default:
        return ErrorKindE::ChannelIO;
    }
}

std::ostream& operator<<(std::ostream& _ros, const ErrorKindE _kind)
{
    switch (_kind) {
    case ErrorKindE::None:
        return _ros << "None";
    case ErrorKindE::Format:
        return _ros << "Format";
    case ErrorKindE::Corruption:
        return _ros << "Corruption";
    case ErrorKindE::UnsupportedChunk:
        return _ros << "UnsupportedChunk";
    case ErrorKindE::TruncatedStream:
        return _ros << "TruncatedStream";
    case ErrorKindE::Closed:
        return _ros << "Closed";
    case ErrorKindE::ChannelIO:
        return _ros << "ChannelIO";
    }
    return _ros << "Unknown";
}

} // namespace framing
} // namespace snapframe
