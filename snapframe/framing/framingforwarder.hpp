// snapframe/framing/framingforwarder.hpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "snapframe/framing/framingchannel.hpp"
#include <vector>

namespace snapframe {
namespace framing {

//! Passes bytes to a sink and buffers whatever the sink refuses
/*!
    On the first sink failure (an error or a short write) the forwarder
    switches to Buffering. From then on every byte, starting with the
    unaccepted rest of the failing write, is kept in an internal buffer.
    write() never fails; the sink error is kept until takeError().
*/
class Forwarder : NonCopyable {
public:
    enum struct ModeE : uint8_t {
        Forwarding,
        Buffering,
    };

    explicit Forwarder(OutputChannel* _pchannel = nullptr);

    void reset(OutputChannel* _pchannel);

    void write(const char* _pbuf, size_t _bufsz);

    //! Retry delivering the buffered bytes; true when back to Forwarding
    bool drain();

    ErrorConditionT takeError();

    //! Swap the buffered bytes into _rbuf and go back to Forwarding
    void release(std::vector<char>& _rbuf);

    ModeE mode() const
    {
        return mode_;
    }

    bool isForwarding() const
    {
        return mode_ == ModeE::Forwarding;
    }

    uint64_t forwardedSize() const
    {
        return forwarded_size_;
    }

    size_t bufferedSize() const
    {
        return buf_.size() - buf_off_;
    }

private:
    size_t doForward(const char* _pbuf, size_t _bufsz);

private:
    OutputChannel*    pchannel_;
    ModeE             mode_;
    uint64_t          forwarded_size_;
    ErrorConditionT   error_;
    std::vector<char> buf_;
    size_t            buf_off_;
};

std::ostream& operator<<(std::ostream& _ros, const Forwarder::ModeE _mode);

} // namespace framing
} // namespace snapframe
