// snapframe/framing/framingprotocol.hpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "snapframe/system/common.hpp"
#include <cstddef>
#include <cstdint>
#include <ostream>

namespace snapframe {
namespace framing {

//! Media type used for content negotiation of framed streams
constexpr const char* media_type     = "application/x-snappy-framed";
constexpr const char* file_extension = ".sz";

//! Maximum number of decoded bytes a data chunk may carry
constexpr size_t max_block_size   = 65536;
constexpr size_t checksum_size    = 4;
constexpr size_t max_chunk_length = 0xffffff;

constexpr size_t     stream_marker_size = 6;
constexpr const char stream_marker_body[stream_marker_size + 1] = "sNaPpY";

//! The whole stream marker chunk, header included, as it appears on the wire
constexpr const char stream_marker_chunk[] = {
    '\xff', '\x06', '\x00', '\x00', 's', 'N', 'a', 'P', 'p', 'Y'};

enum struct ChunkTagE : uint8_t {
    CompressedBlock   = 0x00,
    UncompressedBlock = 0x01,
    Padding           = 0xfe,
    StreamMarker      = 0xff,
};

enum struct ChunkTypeE : uint8_t {
    StreamMarker,
    CompressedBlock,
    UncompressedBlock,
    Padding,
    ReservedSkippable,
    ReservedUnskippable,
};

//! The only place where numeric chunk tags are interpreted
inline ChunkTypeE chunk_type(const uint8_t _tag) noexcept
{
    switch (static_cast<ChunkTagE>(_tag)) {
    case ChunkTagE::CompressedBlock:
        return ChunkTypeE::CompressedBlock;
    case ChunkTagE::UncompressedBlock:
        return ChunkTypeE::UncompressedBlock;
    case ChunkTagE::Padding:
        return ChunkTypeE::Padding;
    case ChunkTagE::StreamMarker:
        return ChunkTypeE::StreamMarker;
    default:
        break;
    }
    if (_tag >= 0x80) {
        return ChunkTypeE::ReservedSkippable;
    }
    return ChunkTypeE::ReservedUnskippable;
}

std::ostream& operator<<(std::ostream& _ros, const ChunkTypeE _type);

inline char* store_uint24(char* _pd, const uint32_t _val)
{
    uint8_t* pd = reinterpret_cast<uint8_t*>(_pd);
    pd[0]       = static_cast<uint8_t>(_val);
    pd[1]       = static_cast<uint8_t>(_val >> 8);
    pd[2]       = static_cast<uint8_t>(_val >> 16);
    return _pd + 3;
}

inline const char* load_uint24(const char* _ps, uint32_t& _val)
{
    const uint8_t* ps = reinterpret_cast<const uint8_t*>(_ps);
    _val              = static_cast<uint32_t>(ps[0]) | (static_cast<uint32_t>(ps[1]) << 8) | (static_cast<uint32_t>(ps[2]) << 16);
    return _ps + 3;
}

inline char* store_uint32(char* _pd, const uint32_t _val)
{
    uint8_t* pd = reinterpret_cast<uint8_t*>(_pd);
    pd[0]       = static_cast<uint8_t>(_val);
    pd[1]       = static_cast<uint8_t>(_val >> 8);
    pd[2]       = static_cast<uint8_t>(_val >> 16);
    pd[3]       = static_cast<uint8_t>(_val >> 24);
    return _pd + 4;
}

inline const char* load_uint32(const char* _ps, uint32_t& _val)
{
    const uint8_t* ps = reinterpret_cast<const uint8_t*>(_ps);
    _val              = static_cast<uint32_t>(ps[0]) | (static_cast<uint32_t>(ps[1]) << 8) | (static_cast<uint32_t>(ps[2]) << 16) | (static_cast<uint32_t>(ps[3]) << 24);
    return _ps + 4;
}

//! 1 byte tag followed by a 3 bytes little endian payload length
class ChunkHeader {
    uint8_t  tag_;
    uint32_t length_;

public:
    static constexpr size_t size_of_header = 4;

    ChunkHeader(
        const uint8_t  _tag    = 0,
        const uint32_t _length = 0)
        : tag_(_tag)
        , length_(_length)
    {
    }

    ChunkHeader(
        const ChunkTagE _tag,
        const uint32_t  _length)
        : tag_(static_cast<uint8_t>(_tag))
        , length_(_length)
    {
    }

    uint8_t tag() const noexcept
    {
        return tag_;
    }

    ChunkTypeE type() const noexcept
    {
        return chunk_type(tag_);
    }

    uint32_t length() const noexcept
    {
        return length_;
    }

    char* store(char* _pd) const
    {
        *reinterpret_cast<uint8_t*>(_pd) = tag_;
        return store_uint24(_pd + 1, length_);
    }

    const char* load(const char* _ps)
    {
        tag_ = *reinterpret_cast<const uint8_t*>(_ps);
        return load_uint24(_ps + 1, length_);
    }
};

//! CRC-32C (Castagnoli) continuing from a previous result; use 0 to start
uint32_t crc32c_update(uint32_t _crc, const char* _pdata, size_t _size);

inline uint32_t crc32c(const char* _pdata, const size_t _size)
{
    return crc32c_update(0, _pdata, _size);
}

constexpr uint32_t checksum_mask_delta = 0xa282ead8;

inline constexpr uint32_t mask_checksum(const uint32_t _crc) noexcept
{
    return ((_crc >> 15) | (_crc << 17)) + checksum_mask_delta;
}

inline constexpr uint32_t unmask_checksum(const uint32_t _masked) noexcept
{
    const uint32_t x = _masked - checksum_mask_delta;
    return (x >> 17) | (x << 15);
}

} // namespace framing
} // namespace snapframe
