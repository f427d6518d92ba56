// snapframe/framing/src/framingconfiguration.cpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "snapframe/framing/framingconfiguration.hpp"
#include "snapframe/framing/framingblockcodec_snappy.hpp"

namespace snapframe {
namespace framing {

/*virtual*/ BlockCodec::~BlockCodec()
{
}

Configuration::Configuration()
    : block_size(max_block_size)
    , pblock_codec(&snappy::engine())
{
}

} // namespace framing
} // namespace snapframe
