// snapframe/framing/framingblockcodec_snappy.hpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "snapframe/framing/framingblockcodec.hpp"

namespace snapframe {
namespace framing {
namespace snappy {

class Engine final : public BlockCodec {
public:
    const char* name() const override;
    size_t      maxCompressedLength(size_t _raw_size) const override;
    size_t      compress(const char* _pfrom, size_t _from_sz, char* _pto) const override;
    bool        decodedLength(const char* _pfrom, size_t _from_sz, size_t& _rlength) const override;
    bool        decode(const char* _pfrom, size_t _from_sz, char* _pto) const override;
};

//! The process wide snappy engine used by the default Configuration
const Engine& engine();

} // namespace snappy
} // namespace framing
} // namespace snapframe
