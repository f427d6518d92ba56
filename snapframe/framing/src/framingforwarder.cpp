// snapframe/framing/src/framingforwarder.cpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "snapframe/framing/framingforwarder.hpp"
#include "snapframe/framing/framingerror.hpp"

namespace snapframe {
namespace framing {

Forwarder::Forwarder(OutputChannel* _pchannel)
    : pchannel_(_pchannel)
    , mode_(ModeE::Forwarding)
    , forwarded_size_(0)
    , buf_off_(0)
{
}

void Forwarder::reset(OutputChannel* _pchannel)
{
    pchannel_       = _pchannel;
    mode_           = ModeE::Forwarding;
    forwarded_size_ = 0;
    error_.clear();
    buf_.clear();
    buf_off_ = 0;
}

// on failure records the error and goes Buffering
size_t Forwarder::doForward(const char* _pbuf, const size_t _bufsz)
{
    ErrorConditionT err;
    size_t          sz = 0;

    if (pchannel_ != nullptr) {
        sz = pchannel_->write(_pbuf, _bufsz, err);
        if (sz > _bufsz) {
            sz = _bufsz;
        }
    } else {
        err = error_channel_io;
    }
    forwarded_size_ += sz;

    if (err || sz < _bufsz) {
        error_ = err ? err : error_channel_short_write;
        mode_  = ModeE::Buffering;
    }
    return sz;
}

void Forwarder::write(const char* _pbuf, const size_t _bufsz)
{
    if (_bufsz == 0) {
        return;
    }
    if (mode_ == ModeE::Forwarding) {
        const size_t sz = doForward(_pbuf, _bufsz);
        if (sz == _bufsz) {
            return;
        }
        _pbuf += sz;
        buf_.insert(buf_.end(), _pbuf, _pbuf + (_bufsz - sz));
    } else {
        buf_.insert(buf_.end(), _pbuf, _pbuf + _bufsz);
    }
}

bool Forwarder::drain()
{
    if (mode_ == ModeE::Forwarding) {
        return true;
    }
    mode_ = ModeE::Forwarding;
    buf_off_ += doForward(buf_.data() + buf_off_, buf_.size() - buf_off_);

    if (mode_ == ModeE::Forwarding) {
        buf_.clear();
        buf_off_ = 0;
        return true;
    }
    return false;
}

ErrorConditionT Forwarder::takeError()
{
    ErrorConditionT err = error_;
    error_.clear();
    return err;
}

void Forwarder::release(std::vector<char>& _rbuf)
{
    if (buf_off_ != 0) {
        buf_.erase(buf_.begin(), buf_.begin() + buf_off_);
        buf_off_ = 0;
    }
    _rbuf.swap(buf_);
    buf_.clear();
    mode_ = ModeE::Forwarding;
}

std::ostream& operator<<(std::ostream& _ros, const Forwarder::ModeE _mode)
{
    switch (_mode) {
    case Forwarder::ModeE::Forwarding:
        return _ros << "Forwarding";
    case Forwarder::ModeE::Buffering:
        return _ros << "Buffering";
    }
    return _ros << "Unknown";
}

} // namespace framing
} // namespace snapframe
