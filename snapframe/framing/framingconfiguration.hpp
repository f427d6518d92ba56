// snapframe/framing/framingconfiguration.hpp
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
#include "snapframe/framing/framingprotocol.hpp"

namespace snapframe {
namespace framing {

struct Configuration {
    Configuration();

    //! block_size clamped to [1, max_block_size]
    size_t blockSize() const
    {
        if (block_size == 0) {
            return 1;
        }
        return block_size < max_block_size ? block_size : max_block_size;
    }

    const BlockCodec& blockCodec() const
    {
        return *pblock_codec;
    }

    size_t            block_size;
    const BlockCodec* pblock_codec;
};

} // namespace framing
} // namespace snapframe
