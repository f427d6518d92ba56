// snapframe/framing/framingdecoder.hpp
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
#include "snapframe/framing/framingforwarder.hpp"
#include <vector>

namespace snapframe {
namespace framing {

//! Reads a framed chunk stream from an InputChannel and yields verified raw bytes
/*!
    Bytes of a data chunk are released only after its checksum matched.
    Any stream error latches the decoder in StateE::Failed until reset.
    The end of the input at a chunk boundary is a clean end of stream.

    Two consumption modes:
    - pull, through read();
    - push, through writeTo(), which forwards every verified block to a
    sink. A failing sink does not latch the decoder: the undelivered bytes
    stay pending and are served first by the next read() or writeTo().
*/
class Decoder : NonCopyable {
public:
    enum struct StateE : uint8_t {
        Open,
        Failed,
    };

    explicit Decoder(
        InputChannel*        _pchannel = nullptr,
        const Configuration& _rcfg     = Configuration());

    //! Returns 0 with no error at the end of the stream
    size_t read(char* _pbuf, size_t _bufsz, ErrorConditionT& _rerror);

    //! Forward the whole remaining stream to _rsink; returns the bytes _rsink accepted
    uint64_t writeTo(OutputChannel& _rsink, ErrorConditionT& _rerror);

    void reset(InputChannel* _pchannel);

    StateE state() const
    {
        return state_;
    }

    const ErrorConditionT& error() const
    {
        return error_;
    }

    size_t pendingSize() const
    {
        return out_buf_.size() - out_off_;
    }

    bool isStreamMarkerSeen() const
    {
        return marker_seen_;
    }

    const Configuration& configuration() const
    {
        return config_;
    }

private:
    enum struct StepE : uint8_t {
        Block,
        EndOfStream,
        Failed,
    };

    StepE  doDecodeNextBlock();
    bool   doDecodeDataChunk(const ChunkHeader& _rheader);
    bool   doCheckStreamMarker(const ChunkHeader& _rheader);
    bool   doSkip(size_t _len);
    size_t doRead(char* _pbuf, size_t _bufsz);
    bool   doReadExact(char* _pbuf, size_t _bufsz);
    void   doDeliver(const char* _pbuf, size_t _bufsz);
    void   doFail(const ErrorConditionT& _rerr);
    void   doClearPending();

private:
    const Configuration config_;
    const size_t        max_payload_;
    InputChannel*       pchannel_;
    StateE              state_;
    bool                marker_seen_;
    bool                pushing_;
    ErrorConditionT     error_;
    char                header_buf_[ChunkHeader::size_of_header];
    std::vector<char>   src_buf_;
    std::vector<char>   dst_buf_;
    std::vector<char>   out_buf_;
    size_t              out_off_;
    Forwarder           forwarder_;
};

std::ostream& operator<<(std::ostream& _ros, const Decoder::StateE _state);

} // namespace framing
} // namespace snapframe
