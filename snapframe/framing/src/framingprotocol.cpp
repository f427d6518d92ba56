// snapframe/framing/src/framingprotocol.cpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "snapframe/framing/framingprotocol.hpp"
#include <array>

namespace snapframe {
namespace framing {

namespace {

// reflected Castagnoli polynomial
constexpr uint32_t crc32c_polynomial = 0x82f63b78;

using Crc32cTableT = std::array<std::array<uint32_t, 256>, 8>;

// slicing-by-8 tables: row 0 is the classic byte table, row k advances k more zero bytes
constexpr Crc32cTableT make_crc32c_table()
{
    Crc32cTableT table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            crc = (crc & 1) != 0 ? (crc >> 1) ^ crc32c_polynomial : crc >> 1;
        }
        table[0][i] = crc;
    }
    for (uint32_t i = 0; i < 256; ++i) {
        for (size_t k = 1; k < 8; ++k) {
            const uint32_t prev = table[k - 1][i];
            table[k][i]         = (prev >> 8) ^ table[0][prev & 0xff];
        }
    }
    return table;
}

constexpr Crc32cTableT crc32c_table = make_crc32c_table();

} // namespace

uint32_t crc32c_update(const uint32_t _crc, const char* _pdata, size_t _size)
{
    const auto& t   = crc32c_table;
    uint32_t    crc = ~_crc;

    while (_size >= 8) {
        uint32_t one;
        uint32_t two;
        load_uint32(_pdata, one);
        load_uint32(_pdata + 4, two);
        one ^= crc;
        crc = t[7][one & 0xff] ^ t[6][(one >> 8) & 0xff] ^ t[5][(one >> 16) & 0xff] ^ t[4][one >> 24] ^ t[3][two & 0xff] ^ t[2][(two >> 8) & 0xff] ^ t[1][(two >> 16) & 0xff] ^ t[0][two >> 24];
        _pdata += 8;
        _size -= 8;
    }

    const uint8_t* pd = reinterpret_cast<const uint8_t*>(_pdata);
    while (_size != 0) {
        crc = (crc >> 8) ^ t[0][(crc ^ *pd) & 0xff];
        ++pd;
        --_size;
    }
    return ~crc;
}

std::ostream& operator<<(std::ostream& _ros, const ChunkTypeE _type)
{
    switch (_type) {
    case ChunkTypeE::StreamMarker:
        return _ros << "StreamMarker";
    case ChunkTypeE::CompressedBlock:
        return _ros << "CompressedBlock";
    case ChunkTypeE::UncompressedBlock:
        return _ros << "UncompressedBlock";
    case ChunkTypeE::Padding:
        return _ros << "Padding";
    case ChunkTypeE::ReservedSkippable:
        return _ros << "ReservedSkippable";
    case ChunkTypeE::ReservedUnskippable:
        return _ros << "ReservedUnskippable";
    }
    return _ros << "Unknown";
}

} // namespace framing
} // namespace snapframe
