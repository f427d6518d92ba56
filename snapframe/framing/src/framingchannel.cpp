// snapframe/framing/src/framingchannel.cpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "snapframe/framing/framingchannel.hpp"
#include "snapframe/framing/framingerror.hpp"
#include <algorithm>
#include <cstring>

namespace snapframe {
namespace framing {

/*virtual*/ InputChannel::~InputChannel()
{
}

/*virtual*/ OutputChannel::~OutputChannel()
{
}

size_t IStreamChannel::read(char* _pbuf, const size_t _bufsz, ErrorConditionT& _rerror)
{
    if (_bufsz == 0) {
        return 0;
    }
    ris_.read(_pbuf, static_cast<std::streamsize>(_bufsz));
    const size_t rv = static_cast<size_t>(ris_.gcount());
    if (ris_.bad()) {
        _rerror = error_channel_io;
        return 0;
    }
    return rv;
}

size_t OStreamChannel::write(const char* _pbuf, const size_t _bufsz, ErrorConditionT& _rerror)
{
    ros_.write(_pbuf, static_cast<std::streamsize>(_bufsz));
    if (!ros_) {
        _rerror = error_channel_io;
        return 0;
    }
    return _bufsz;
}

size_t StringInputChannel::read(char* _pbuf, const size_t _bufsz, ErrorConditionT& /*_rerror*/)
{
    const size_t toread = std::min(_bufsz, data_.size() - offset_);
    if (toread != 0) {
        memcpy(_pbuf, data_.data() + offset_, toread);
        offset_ += toread;
    }
    return toread;
}

size_t StringOutputChannel::write(const char* _pbuf, const size_t _bufsz, ErrorConditionT& /*_rerror*/)
{
    rstr_.append(_pbuf, _bufsz);
    return _bufsz;
}

} // namespace framing
} // namespace snapframe
