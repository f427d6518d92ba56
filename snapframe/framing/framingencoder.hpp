// snapframe/framing/framingencoder.hpp
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
#include "snapframe/framing/framingconfiguration.hpp"
#include <vector>

namespace snapframe {
namespace framing {

//! Turns raw bytes into a framed chunk stream written to an OutputChannel
/*!
    Every write call is cut into slices of at most Configuration::blockSize()
    bytes and each slice becomes exactly one data chunk. The stream marker is
    sent once, before the first data chunk.
    A channel failure latches the encoder in StateE::Failed; all later calls
    return the same error without touching the channel until reset.
*/
class Encoder : NonCopyable {
public:
    enum struct StateE : uint8_t {
        Open,
        Failed,
        Closed,
    };

    explicit Encoder(
        OutputChannel*       _pchannel = nullptr,
        const Configuration& _rcfg     = Configuration());

    //! All or nothing: returns _bufsz with no error or 0 with _rerror set
    size_t write(const char* _pbuf, size_t _bufsz, ErrorConditionT& _rerror);

    ErrorConditionT flush();

    //! Does not close the channel
    ErrorConditionT close();

    void reset(OutputChannel* _pchannel);

    //! Latch an error raised by whatever feeds the encoder; no-op unless Open
    void fail(const ErrorConditionT& _rerror);

    StateE state() const
    {
        return state_;
    }

    const ErrorConditionT& error() const
    {
        return error_;
    }

    ErrorConditionT status() const;

    bool isStreamMarkerSent() const
    {
        return marker_sent_;
    }

    const Configuration& configuration() const
    {
        return config_;
    }

    OutputChannel* channel() const
    {
        return pchannel_;
    }

private:
    bool doEncodeBlock(const char* _pbuf, size_t _bufsz);
    bool doWriteAll(const char* _pbuf, size_t _bufsz);
    void doFail(const ErrorConditionT& _rerr);

private:
    const Configuration config_;
    OutputChannel*      pchannel_;
    StateE              state_;
    bool                marker_sent_;
    ErrorConditionT     error_;
    char                header_buf_[ChunkHeader::size_of_header + checksum_size];
    std::vector<char>   compress_buf_;
};

std::ostream& operator<<(std::ostream& _ros, const Encoder::StateE _state);

} // namespace framing
} // namespace snapframe
