#include "framing_test_common.hpp"
#include "snapframe/framing/framingforwarder.hpp"
#include <iostream>

using namespace std;
using namespace snapframe;
using namespace snapframe::framing;
using namespace snapframe::framing::test;

int test_forwarder(int argc, char* argv[])
{
    const string data = make_text_data(100, 61);
    {
        string              out;
        StringOutputChannel sink(out);
        Forwarder           fwd(&sink);
        fwd.write(data.data(), 40);
        fwd.write(data.data() + 40, 60);
        snapframe_check(fwd.mode() == Forwarder::ModeE::Forwarding, "mode");
        snapframe_check(fwd.forwardedSize() == 100 && fwd.bufferedSize() == 0 && out == data, "forwarding");
        snapframe_check(!fwd.takeError(), "error while forwarding");
        snapframe_check(fwd.drain(), "drain while forwarding");
    }
    {
        string               out;
        FailingOutputChannel sink(out, 10);
        Forwarder            fwd(&sink);
        fwd.write(data.data(), 25);
        snapframe_check(fwd.mode() == Forwarder::ModeE::Buffering, "failure must switch to buffering");
        snapframe_check(fwd.forwardedSize() == 10 && fwd.bufferedSize() == 15, "split after failure");

        const size_t writes = sink.writeCount();
        fwd.write(data.data() + 25, 5);
        snapframe_check(fwd.bufferedSize() == 20 && sink.writeCount() == writes, "buffering must not touch the sink");

        const ErrorConditionT err = fwd.takeError();
        snapframe_check(err == std::errc::broken_pipe, "sink error kept: " << err.message());
        snapframe_check(!fwd.takeError(), "error taken twice");

        snapframe_check(!fwd.drain(), "drain into a dead sink");
        snapframe_check(fwd.mode() == Forwarder::ModeE::Buffering && fwd.bufferedSize() == 20, "failed drain");
        snapframe_check(fwd.takeError() == std::errc::broken_pipe, "failed drain error");

        sink.budget(7);
        snapframe_check(!fwd.drain() && fwd.bufferedSize() == 13 && fwd.forwardedSize() == 17, "partial drain");
        fwd.takeError();

        sink.budget(FailingOutputChannel::unlimited);
        snapframe_check(fwd.drain(), "drain");
        snapframe_check(fwd.mode() == Forwarder::ModeE::Forwarding && fwd.bufferedSize() == 0, "back to forwarding");
        fwd.write(data.data() + 30, 70);
        snapframe_check(out == data && fwd.forwardedSize() == 100, "order preserved");
    }
    {
        string               out;
        FailingOutputChannel sink(out, 3, true);
        Forwarder            fwd(&sink);
        fwd.write(data.data(), 10);
        snapframe_check(fwd.takeError() == error_channel_short_write, "silent short write");

        fwd.write(data.data() + 10, 10);
        vector<char> buf(5, 'x');
        fwd.release(buf);
        snapframe_check(string(buf.data(), buf.size()) == data.substr(3, 17), "released bytes");
        snapframe_check(fwd.mode() == Forwarder::ModeE::Forwarding && fwd.bufferedSize() == 0, "after release");
    }
    {
        Forwarder fwd;
        fwd.write(data.data(), 10);
        snapframe_check(fwd.mode() == Forwarder::ModeE::Buffering && fwd.takeError() == error_channel_io, "no sink");

        string              out;
        StringOutputChannel sink(out);
        fwd.reset(&sink);
        snapframe_check(fwd.mode() == Forwarder::ModeE::Forwarding && fwd.bufferedSize() == 0 && fwd.forwardedSize() == 0, "reset");
        fwd.write(data.data(), 10);
        snapframe_check(out == data.substr(0, 10), "forwarding after reset");
    }
    return 0;
}
