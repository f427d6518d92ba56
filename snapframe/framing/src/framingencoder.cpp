// snapframe/framing/src/framingencoder.cpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "snapframe/framing/framingencoder.hpp"
#include "snapframe/framing/framingerror.hpp"
#include "snapframe/system/exception.hpp"
#include "snapframe/system/log.hpp"
#include <algorithm>

namespace snapframe {
namespace framing {

namespace {
const LoggerT logger("snapframe::framing::encoder");
} // namespace

Encoder::Encoder(
    OutputChannel*       _pchannel,
    const Configuration& _rcfg)
    : config_(_rcfg)
    , pchannel_(_pchannel)
    , state_(StateE::Open)
    , marker_sent_(false)
{
    snapframe_check_log(config_.pblock_codec != nullptr, logger, "no block codec configured");
}

ErrorConditionT Encoder::status() const
{
    switch (state_) {
    case StateE::Failed:
        return error_;
    case StateE::Closed:
        return error_closed;
    default:
        return ErrorConditionT();
    }
}

size_t Encoder::write(const char* _pbuf, const size_t _bufsz, ErrorConditionT& _rerror)
{
    if (state_ != StateE::Open) {
        _rerror = status();
        return 0;
    }
    if (_bufsz == 0) {
        return 0;
    }
    snapframe_check_log(pchannel_ != nullptr, logger, "write on encoder without channel");

    const size_t block_size = config_.blockSize();
    size_t       off        = 0;

    while (off < _bufsz) {
        const size_t sz = std::min(block_size, _bufsz - off);
        if (!doEncodeBlock(_pbuf + off, sz)) {
            _rerror = error_;
            return 0;
        }
        off += sz;
    }
    return _bufsz;
}

ErrorConditionT Encoder::flush()
{
    return status();
}

ErrorConditionT Encoder::close()
{
    ErrorConditionT err = status();
    if (state_ == StateE::Open) {
        snapframe_log(logger, Verbose, this << " closed");
        state_ = StateE::Closed;
    }
    return err;
}

void Encoder::reset(OutputChannel* _pchannel)
{
    pchannel_    = _pchannel;
    state_       = StateE::Open;
    marker_sent_ = false;
    error_.clear();
}

bool Encoder::doEncodeBlock(const char* _pbuf, const size_t _bufsz)
{
    const BlockCodec& rcodec = config_.blockCodec();
    const uint32_t    crc    = mask_checksum(crc32c(_pbuf, _bufsz));

    const size_t max_sz = rcodec.maxCompressedLength(_bufsz);
    if (compress_buf_.size() < max_sz) {
        compress_buf_.resize(max_sz);
    }

    const size_t compressed_sz = rcodec.compress(_pbuf, _bufsz, compress_buf_.data());
    const char*  pdata         = _pbuf;
    size_t       data_sz       = _bufsz;
    ChunkTagE    tag           = ChunkTagE::UncompressedBlock;

    if (compressed_sz < _bufsz) {
        pdata   = compress_buf_.data();
        data_sz = compressed_sz;
        tag     = ChunkTagE::CompressedBlock;
    }

    if (!marker_sent_) {
        if (!doWriteAll(stream_marker_chunk, sizeof(stream_marker_chunk))) {
            return false;
        }
        snapframe_log(logger, Verbose, this << " stream marker sent");
        marker_sent_ = true;
    }

    const ChunkHeader header(tag, static_cast<uint32_t>(data_sz + checksum_size));
    store_uint32(header.store(header_buf_), crc);

    if (!doWriteAll(header_buf_, sizeof(header_buf_)) || !doWriteAll(pdata, data_sz)) {
        return false;
    }
    snapframe_log(logger, Verbose, this << " chunk " << header.type() << " raw = " << _bufsz << " payload = " << header.length());
    return true;
}

bool Encoder::doWriteAll(const char* _pbuf, const size_t _bufsz)
{
    ErrorConditionT err;
    const size_t    sz = pchannel_->write(_pbuf, _bufsz, err);
    if (err) {
        doFail(err);
        return false;
    }
    if (sz != _bufsz) {
        doFail(error_channel_short_write);
        return false;
    }
    return true;
}

void Encoder::fail(const ErrorConditionT& _rerror)
{
    if (state_ == StateE::Open) {
        doFail(_rerror);
    }
}

void Encoder::doFail(const ErrorConditionT& _rerr)
{
    snapframe_log(logger, Error, this << " failed: " << _rerr.message());
    error_ = _rerr;
    state_ = StateE::Failed;
}

std::ostream& operator<<(std::ostream& _ros, const Encoder::StateE _state)
{
    switch (_state) {
    case Encoder::StateE::Open:
        return _ros << "Open";
    case Encoder::StateE::Failed:
        return _ros << "Failed";
    case Encoder::StateE::Closed:
        return _ros << "Closed";
    }
    return _ros << "Unknown";
}

} // namespace framing
} // namespace snapframe
