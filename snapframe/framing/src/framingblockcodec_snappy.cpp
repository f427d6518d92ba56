// snapframe/framing/src/framingblockcodec_snappy.cpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "snapframe/framing/framingblockcodec_snappy.hpp"

#include "snappy.h"

namespace snapframe {
namespace framing {
namespace snappy {

const char* Engine::name() const
{
    return "snappy";
}

size_t Engine::maxCompressedLength(const size_t _raw_size) const
{
    return ::snappy::MaxCompressedLength(_raw_size);
}

size_t Engine::compress(const char* _pfrom, const size_t _from_sz, char* _pto) const
{
    size_t len = 0;
    ::snappy::RawCompress(_pfrom, _from_sz, _pto, &len);
    return len;
}

bool Engine::decodedLength(const char* _pfrom, const size_t _from_sz, size_t& _rlength) const
{
    return ::snappy::GetUncompressedLength(_pfrom, _from_sz, &_rlength);
}

bool Engine::decode(const char* _pfrom, const size_t _from_sz, char* _pto) const
{
    return ::snappy::RawUncompress(_pfrom, _from_sz, _pto);
}

const Engine& engine()
{
    static const Engine e;
    return e;
}

} // namespace snappy
} // namespace framing
} // namespace snapframe
