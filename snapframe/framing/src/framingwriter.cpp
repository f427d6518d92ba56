// snapframe/framing/src/framingwriter.cpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "snapframe/framing/framingwriter.hpp"
#include "snapframe/framing/framingerror.hpp"
#include "snapframe/system/log.hpp"
#include <algorithm>
#include <cstring>

namespace snapframe {
namespace framing {

namespace {
const LoggerT logger("snapframe::framing::writer");
} // namespace

Writer::Writer(
    OutputChannel*       _pchannel,
    const Configuration& _rcfg)
    : encoder_(_pchannel, _rcfg)
    , buf_(encoder_.configuration().blockSize())
    , buffered_(0)
{
}

size_t Writer::write(const char* _pbuf, const size_t _bufsz, ErrorConditionT& _rerror)
{
    {
        const ErrorConditionT err = encoder_.status();
        if (err) {
            _rerror = err;
            return 0;
        }
    }
    const size_t block_size = buf_.size();
    size_t       off        = 0;

    while (off < _bufsz) {
        if (buffered_ == 0 && (_bufsz - off) >= block_size) {
            const size_t sz = ((_bufsz - off) / block_size) * block_size;
            snapframe_log(logger, Verbose, this << " direct encode " << sz);
            if (encoder_.write(_pbuf + off, sz, _rerror) != sz) {
                return 0;
            }
            off += sz;
            continue;
        }

        const size_t sz = std::min(block_size - buffered_, _bufsz - off);
        memcpy(buf_.data() + buffered_, _pbuf + off, sz);
        buffered_ += sz;
        off += sz;

        if (buffered_ == block_size && !doFlush(_rerror)) {
            return 0;
        }
    }
    return _bufsz;
}

bool Writer::doFlush(ErrorConditionT& _rerror)
{
    if (buffered_ == 0) {
        return true;
    }
    const size_t sz = buffered_;
    buffered_       = 0;
    return encoder_.write(buf_.data(), sz, _rerror) == sz;
}

ErrorConditionT Writer::flush()
{
    ErrorConditionT err = encoder_.status();
    if (!err) {
        doFlush(err);
    }
    return err;
}

ErrorConditionT Writer::close()
{
    const ErrorConditionT err = flush();
    if (err) {
        return err;
    }
    return encoder_.close();
}

void Writer::reset(OutputChannel* _pchannel)
{
    encoder_.reset(_pchannel);
    buffered_ = 0;
}

uint64_t Writer::readFrom(InputChannel& _rsource, ErrorConditionT& _rerror)
{
    uint64_t total = 0;

    {
        const ErrorConditionT err = encoder_.status();
        if (err) {
            _rerror = err;
            return 0;
        }
    }

    while (true) {
        ErrorConditionT err;
        const size_t    sz = _rsource.read(buf_.data() + buffered_, buf_.size() - buffered_, err);

        total += sz;
        buffered_ += sz;

        if (buffered_ == buf_.size() && !doFlush(_rerror)) {
            return total;
        }
        if (err) {
            snapframe_log(logger, Warning, this << " source read failed: " << err.message());
            encoder_.fail(err);
            _rerror = err;
            return total;
        }
        if (sz == 0) {
            break;
        }
    }
    return total;
}

} // namespace framing
} // namespace snapframe
