#include "framing_test_common.hpp"
#include "snapframe/framing/framingencoder.hpp"
#include <iostream>

using namespace std;
using namespace snapframe;
using namespace snapframe::framing;
using namespace snapframe::framing::test;

namespace {

//! Codec that never wins: every block is stored literally
class StoreCodec final : public BlockCodec {
public:
    const char* name() const override
    {
        return "store";
    }
    size_t maxCompressedLength(const size_t _raw_size) const override
    {
        return _raw_size + 1;
    }
    size_t compress(const char* _pfrom, const size_t _from_sz, char* _pto) const override
    {
        memcpy(_pto, _pfrom, _from_sz);
        _pto[_from_sz] = '\0';
        return _from_sz + 1;
    }
    bool decodedLength(const char* /*_pfrom*/, size_t /*_from_sz*/, size_t& /*_rlength*/) const override
    {
        return false;
    }
    bool decode(const char* /*_pfrom*/, size_t /*_from_sz*/, char* /*_pto*/) const override
    {
        return false;
    }
};

} // namespace

int test_encoder(int argc, char* argv[])
{
    const string data = make_text_data(150000, 31);
    {
        // empty write
        string              stream;
        StringOutputChannel channel(stream);
        Encoder             encoder(&channel);
        ErrorConditionT     err;
        snapframe_check(encoder.write(data.data(), 0, err) == 0 && !err, "empty write");
        snapframe_check(stream.empty() && !encoder.isStreamMarkerSent(), "empty write produced output");
        snapframe_check(!encoder.flush() && !encoder.close(), "flush/close after empty write");
        snapframe_check(stream.empty(), "close produced output");
    }
    {
        // marker sent once, one data chunk per slice
        Configuration cfg;
        cfg.block_size = 100;
        string              stream;
        StringOutputChannel channel(stream);
        Encoder             encoder(&channel, cfg);
        ErrorConditionT     err;
        snapframe_check(encoder.write(data.data(), 250, err) == 250 && !err, "write 250");
        snapframe_check(encoder.write(data.data() + 250, 50, err) == 50 && !err, "write 50");
        snapframe_check(encoder.isStreamMarkerSent(), "marker flag");

        const auto chunks = walk_chunks(stream);
        snapframe_check(chunks.size() == 5, "expected marker + 4 data chunks, got " << chunks.size());
        for (size_t i = 1; i < chunks.size(); ++i) {
            snapframe_check(chunks[i].tag != static_cast<uint8_t>(ChunkTagE::StreamMarker), "marker repeated");
        }
        string out;
        snapframe_check(!decode(stream, out) && out == data.substr(0, 300), "sliced output differs");
    }
    {
        // reset equivalence
        string              first;
        string              second;
        StringOutputChannel channel1(first);
        StringOutputChannel channel2(second);
        Encoder             encoder(&channel1);
        ErrorConditionT     err;
        encoder.write(data.data(), 1000, err);
        snapframe_check(!err && !encoder.close(), "first stream");

        encoder.reset(&channel2);
        snapframe_check(encoder.state() == Encoder::StateE::Open && !encoder.isStreamMarkerSent(), "reset state");
        snapframe_check(encoder.write(data.data(), data.size(), err) == data.size() && !err, "write after reset");
        snapframe_check(second == encode(data), "reset encoder differs from a fresh one");
        snapframe_check(first == encode(data.substr(0, 1000)), "first stream differs");
    }
    {
        // close semantics
        string              stream;
        StringOutputChannel channel(stream);
        Encoder             encoder(&channel);
        ErrorConditionT     err;
        encoder.write(data.data(), 10, err);
        snapframe_check(!encoder.close(), "first close");
        snapframe_check(encoder.state() == Encoder::StateE::Closed, "closed state");
        const size_t sz = stream.size();

        snapframe_check(encoder.write(data.data(), 10, err) == 0 && err == error_closed, "write after close");
        snapframe_check(error_kind(err) == ErrorKindE::Closed, "closed kind");
        snapframe_check(encoder.flush() == error_closed, "flush after close");
        snapframe_check(encoder.close() == error_closed, "second close");
        snapframe_check(stream.size() == sz, "output after close");

        encoder.reset(&channel);
        err.clear();
        snapframe_check(encoder.write(data.data(), 10, err) == 10 && !err, "write after reset from closed");
    }
    {
        // channel failure latches, no further I/O
        string               stream;
        FailingOutputChannel channel(stream, 5);
        Encoder              encoder(&channel);
        ErrorConditionT      err;

        snapframe_check(encoder.write(data.data(), data.size(), err) == 0, "failing write must return 0");
        snapframe_check(err == std::errc::broken_pipe, "channel error not passed through: " << err.message());
        snapframe_check(error_kind(err) == ErrorKindE::ChannelIO, "channel error kind");
        snapframe_check(encoder.state() == Encoder::StateE::Failed && encoder.error() == err, "failed state");

        const size_t writes = channel.writeCount();
        channel.budget(FailingOutputChannel::unlimited);
        ErrorConditionT err2;
        snapframe_check(encoder.write(data.data(), 10, err2) == 0 && err2 == err, "latched error on write");
        snapframe_check(encoder.flush() == err && encoder.close() == err, "latched error on flush/close");
        snapframe_check(channel.writeCount() == writes, "I/O after failure");

        stream.clear();
        encoder.reset(&channel);
        err2.clear();
        snapframe_check(encoder.write(data.data(), data.size(), err2) == data.size() && !err2, "write after reset from failed");
        snapframe_check(stream == encode(data), "reset after failure differs from fresh encoder");
    }
    {
        // short write without an error
        string               stream;
        FailingOutputChannel channel(stream, 20, true);
        Encoder              encoder(&channel);
        ErrorConditionT      err;
        snapframe_check(encoder.write(data.data(), 100, err) == 0 && err == error_channel_short_write, "short write: " << err.message());
        snapframe_check(encoder.state() == Encoder::StateE::Failed, "short write latches");
    }
    {
        // literal fallback decided by the codec
        Configuration    cfg;
        const StoreCodec codec;
        cfg.pblock_codec    = &codec;
        const string stream = encode(data, cfg);
        for (const auto& ci : walk_chunks(stream)) {
            snapframe_check(ci.tag != static_cast<uint8_t>(ChunkTagE::CompressedBlock), "store codec produced a compressed chunk");
        }
        string out;
        snapframe_check(!decode(stream, out) && out == data, "literal stream decoded by the default decoder");
    }
    {
        // an external failure latches only an open encoder
        string              stream;
        StringOutputChannel channel(stream);
        Encoder             encoder(&channel);
        ErrorConditionT     err;
        snapframe_check(!encoder.close(), "close");
        encoder.fail(make_error_condition(std::errc::io_error));
        snapframe_check(encoder.state() == Encoder::StateE::Closed && encoder.status() == error_closed, "fail on a closed encoder");

        encoder.reset(&channel);
        encoder.fail(make_error_condition(std::errc::io_error));
        snapframe_check(encoder.state() == Encoder::StateE::Failed && encoder.error() == std::errc::io_error, "fail on an open encoder");
        snapframe_check(encoder.write(data.data(), 10, err) == 0 && err == std::errc::io_error, "write after fail");
        snapframe_check(stream.empty(), "I/O after fail");
    }
    {
        // writing needs a channel
        Encoder         encoder;
        ErrorConditionT err;
        bool            thrown = false;
        try {
            encoder.write(data.data(), 10, err);
        } catch (RuntimeError& _rerr) {
            cout << _rerr.what() << endl;
            thrown = true;
        }
        snapframe_check(thrown, "write without channel must throw");
    }
    {
        Configuration cfg;
        cfg.pblock_codec = nullptr;
        bool thrown      = false;
        try {
            Encoder encoder(nullptr, cfg);
        } catch (std::runtime_error& _rerr) {
            cout << _rerr.what() << endl;
            thrown = true;
        }
        snapframe_check(thrown, "missing codec must throw");
    }
    return 0;
}
