// snapframe/framing/framingblockcodec.hpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include <cstddef>

namespace snapframe {
namespace framing {

//! Block level compression primitive used by Encoder and Decoder
/*!
    Implementations must be stateless or internally synchronized: a single
    instance is shared by every encoder and decoder configured with it.
*/
class BlockCodec {
public:
    virtual ~BlockCodec();

    virtual const char* name() const = 0;

    //! Upper bound of compress() output for _raw_size input bytes
    virtual size_t maxCompressedLength(size_t _raw_size) const = 0;

    //! Compress _from_sz bytes into _pto which has room for maxCompressedLength(_from_sz) bytes
    /*!
        Never fails. A result not smaller than _from_sz means the block
        should be stored literally.
    */
    virtual size_t compress(const char* _pfrom, size_t _from_sz, char* _pto) const = 0;

    //! Returns false if the encoded bytes are malformed
    virtual bool decodedLength(const char* _pfrom, size_t _from_sz, size_t& _rlength) const = 0;

    //! Decode into _pto which has room for decodedLength() bytes; false if malformed
    virtual bool decode(const char* _pfrom, size_t _from_sz, char* _pto) const = 0;
};

} // namespace framing
} // namespace snapframe
