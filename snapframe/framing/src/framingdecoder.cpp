// snapframe/framing/src/framingdecoder.cpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "snapframe/framing/framingdecoder.hpp"
#include "snapframe/framing/framingerror.hpp"
#include "snapframe/system/exception.hpp"
#include "snapframe/system/log.hpp"
#include <algorithm>
#include <cstring>

namespace snapframe {
namespace framing {

namespace {
const LoggerT logger("snapframe::framing::decoder");

constexpr size_t skip_piece_size = 16 * 1024;

size_t max_payload(const Configuration& _rcfg)
{
    snapframe_check_log(_rcfg.pblock_codec != nullptr, logger, "no block codec configured");
    return _rcfg.blockCodec().maxCompressedLength(max_block_size) + checksum_size;
}
} // namespace

Decoder::Decoder(
    InputChannel*        _pchannel,
    const Configuration& _rcfg)
    : config_(_rcfg)
    , max_payload_(max_payload(_rcfg))
    , pchannel_(_pchannel)
    , state_(StateE::Open)
    , marker_seen_(false)
    , pushing_(false)
    , out_off_(0)
{
}

void Decoder::reset(InputChannel* _pchannel)
{
    pchannel_    = _pchannel;
    state_       = StateE::Open;
    marker_seen_ = false;
    pushing_     = false;
    error_.clear();
    doClearPending();
    forwarder_.reset(nullptr);
}

size_t Decoder::read(char* _pbuf, const size_t _bufsz, ErrorConditionT& _rerror)
{
    if (state_ == StateE::Failed) {
        _rerror = error_;
        return 0;
    }

    while (pendingSize() < _bufsz) {
        const StepE step = doDecodeNextBlock();
        if (step == StepE::Failed) {
            doClearPending();
            _rerror = error_;
            return 0;
        }
        if (step == StepE::EndOfStream) {
            break;
        }
    }

    const size_t sz = std::min(_bufsz, pendingSize());
    if (sz != 0) {
        memcpy(_pbuf, out_buf_.data() + out_off_, sz);
        out_off_ += sz;
        if (out_off_ == out_buf_.size()) {
            doClearPending();
        }
    }
    return sz;
}

uint64_t Decoder::writeTo(OutputChannel& _rsink, ErrorConditionT& _rerror)
{
    if (state_ == StateE::Failed) {
        _rerror = error_;
        return 0;
    }

    forwarder_.reset(&_rsink);

    if (pendingSize() != 0) {
        snapframe_log(logger, Verbose, this << " forward pending " << pendingSize());
        forwarder_.write(out_buf_.data() + out_off_, pendingSize());
        doClearPending();
    }

    pushing_ = true;
    while (forwarder_.isForwarding()) {
        const StepE step = doDecodeNextBlock();
        if (step == StepE::Failed) {
            _rerror = error_;
            break;
        }
        if (step == StepE::EndOfStream) {
            break;
        }
    }
    pushing_ = false;

    const uint64_t rv = forwarder_.forwardedSize();

    if (!forwarder_.isForwarding()) {
        const ErrorConditionT err = forwarder_.takeError();
        snapframe_log(logger, Warning, this << " sink failed: " << err.message() << " keep pending " << forwarder_.bufferedSize());
        _rerror = err;
        forwarder_.release(out_buf_);
        out_off_ = 0;
    }
    forwarder_.reset(nullptr);
    return rv;
}

Decoder::StepE Decoder::doDecodeNextBlock()
{
    while (true) {
        const size_t sz = doRead(header_buf_, ChunkHeader::size_of_header);
        if (state_ == StateE::Failed) {
            return StepE::Failed;
        }
        if (sz == 0) {
            snapframe_log(logger, Verbose, this << " end of stream");
            return StepE::EndOfStream;
        }
        if (sz < ChunkHeader::size_of_header) {
            doFail(error_truncated_stream);
            return StepE::Failed;
        }

        ChunkHeader header;
        header.load(header_buf_);
        const ChunkTypeE type = header.type();

        snapframe_log(logger, Verbose, this << " chunk " << type << " tag = " << static_cast<int>(header.tag()) << " length = " << header.length());

        if (type == ChunkTypeE::StreamMarker) {
            if (!doCheckStreamMarker(header)) {
                return StepE::Failed;
            }
            continue;
        }

        if (!marker_seen_) {
            doFail(error_missing_stream_marker);
            return StepE::Failed;
        }

        switch (type) {
        case ChunkTypeE::CompressedBlock:
        case ChunkTypeE::UncompressedBlock:
            if (doDecodeDataChunk(header)) {
                return StepE::Block;
            }
            return StepE::Failed;
        case ChunkTypeE::Padding:
        case ChunkTypeE::ReservedSkippable:
            if (!doSkip(header.length())) {
                return StepE::Failed;
            }
            break;
        case ChunkTypeE::ReservedUnskippable:
            if (doSkip(header.length())) {
                doFail(error_unsupported_chunk);
            }
            return StepE::Failed;
        default:
            doFail(error_unsupported_chunk);
            return StepE::Failed;
        }
    }
}

bool Decoder::doCheckStreamMarker(const ChunkHeader& _rheader)
{
    if (_rheader.length() != stream_marker_size) {
        doFail(error_invalid_stream_marker);
        return false;
    }
    char buf[stream_marker_size];
    if (!doReadExact(buf, stream_marker_size)) {
        return false;
    }
    if (memcmp(buf, stream_marker_body, stream_marker_size) != 0) {
        doFail(error_invalid_stream_marker);
        return false;
    }
    marker_seen_ = true;
    return true;
}

bool Decoder::doDecodeDataChunk(const ChunkHeader& _rheader)
{
    const size_t len = _rheader.length();

    if (len > max_payload_) {
        doFail(error_chunk_too_large);
        return false;
    }
    if (len < checksum_size) {
        doFail(error_chunk_too_short);
        return false;
    }
    if (src_buf_.size() < len) {
        src_buf_.resize(len);
    }
    if (!doReadExact(src_buf_.data(), len)) {
        return false;
    }

    uint32_t masked_crc;
    load_uint32(src_buf_.data(), masked_crc);

    const char*  pencoded  = src_buf_.data() + checksum_size;
    const size_t encodedsz = len - checksum_size;
    const char*  pdata     = pencoded;
    size_t       datasz    = encodedsz;

    if (_rheader.type() == ChunkTypeE::CompressedBlock) {
        const BlockCodec& rcodec = config_.blockCodec();
        if (!rcodec.decodedLength(pencoded, encodedsz, datasz)) {
            doFail(error_block_decode);
            return false;
        }
        if (datasz > max_block_size) {
            doFail(error_block_too_large);
            return false;
        }
        if (dst_buf_.size() < datasz) {
            dst_buf_.resize(datasz);
        }
        if (!rcodec.decode(pencoded, encodedsz, dst_buf_.data())) {
            doFail(error_block_decode);
            return false;
        }
        pdata = dst_buf_.data();
    } else if (datasz > max_block_size) {
        doFail(error_block_too_large);
        return false;
    }

    if (crc32c(pdata, datasz) != unmask_checksum(masked_crc)) {
        doFail(error_checksum_mismatch);
        return false;
    }
    doDeliver(pdata, datasz);
    return true;
}

bool Decoder::doSkip(size_t _len)
{
    if (src_buf_.size() < std::min(_len, skip_piece_size)) {
        src_buf_.resize(std::min(_len, skip_piece_size));
    }
    while (_len != 0) {
        const size_t sz = std::min(_len, src_buf_.size());
        if (!doReadExact(src_buf_.data(), sz)) {
            return false;
        }
        _len -= sz;
    }
    return true;
}

// reads until _bufsz bytes, end of input or channel failure
size_t Decoder::doRead(char* _pbuf, const size_t _bufsz)
{
    snapframe_check_log(pchannel_ != nullptr, logger, "read on decoder without channel");

    size_t off = 0;
    while (off < _bufsz) {
        ErrorConditionT err;
        const size_t    sz = pchannel_->read(_pbuf + off, _bufsz - off, err);
        if (err) {
            doFail(err);
            break;
        }
        if (sz == 0) {
            break;
        }
        off += std::min(sz, _bufsz - off);
    }
    return off;
}

bool Decoder::doReadExact(char* _pbuf, const size_t _bufsz)
{
    const size_t sz = doRead(_pbuf, _bufsz);
    if (state_ == StateE::Failed) {
        return false;
    }
    if (sz < _bufsz) {
        doFail(error_truncated_stream);
        return false;
    }
    return true;
}

void Decoder::doDeliver(const char* _pbuf, const size_t _bufsz)
{
    if (pushing_) {
        forwarder_.write(_pbuf, _bufsz);
        return;
    }
    if (out_off_ != 0) {
        out_buf_.erase(out_buf_.begin(), out_buf_.begin() + out_off_);
        out_off_ = 0;
    }
    out_buf_.insert(out_buf_.end(), _pbuf, _pbuf + _bufsz);
}

void Decoder::doFail(const ErrorConditionT& _rerr)
{
    snapframe_log(logger, Error, this << " failed: " << _rerr.message());
    error_ = _rerr;
    state_ = StateE::Failed;
}

void Decoder::doClearPending()
{
    out_buf_.clear();
    out_off_ = 0;
}

std::ostream& operator<<(std::ostream& _ros, const Decoder::StateE _state)
{
    switch (_state) {
    case Decoder::StateE::Open:
        return _ros << "Open";
    case Decoder::StateE::Failed:
        return _ros << "Failed";
    }
    return _ros << "Unknown";
}

} // namespace framing
} // namespace snapframe
