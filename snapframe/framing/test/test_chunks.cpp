#include "framing_test_common.hpp"
#include <iostream>

using namespace std;
using namespace snapframe;
using namespace snapframe::framing;
using namespace snapframe::framing::test;

namespace {

ErrorConditionT decode_expect(const string& _stream, const ErrorConditionT& _expected, const char* _what)
{
    string                out;
    const ErrorConditionT err = decode(_stream, out);
    snapframe_check(err == _expected, _what << ": got " << err.message() << " expected " << _expected.message());
    snapframe_check(out.empty() || !err, _what << ": bytes delivered along with error");
    return err;
}

} // namespace

int test_chunks(int argc, char* argv[])
{
    for (uint32_t tag = 0x02; tag <= 0x7f; ++tag) {
        string stream;
        append_stream_marker(stream);
        append_chunk(stream, static_cast<uint8_t>(tag), "xyz");
        append_literal_chunk(stream, "hello");

        const ErrorConditionT err = decode_expect(stream, error_unsupported_chunk, "unskippable");
        snapframe_check(error_kind(err) == ErrorKindE::UnsupportedChunk, "unskippable kind");
    }

    for (uint32_t tag = 0x80; tag <= 0xfe; ++tag) {
        string stream;
        append_stream_marker(stream);
        append_chunk(stream, static_cast<uint8_t>(tag), string(tag, 'p'));
        append_literal_chunk(stream, "hello");
        append_chunk(stream, static_cast<uint8_t>(tag), string());
        append_literal_chunk(stream, " world");

        string                out;
        const ErrorConditionT err = decode(stream, out);
        snapframe_check(!err, "skippable tag " << tag << " failed: " << err.message());
        snapframe_check(out == "hello world", "skippable tag " << tag << " decoded: " << out);
    }
    {
        // large padding is discarded in pieces
        string stream;
        append_stream_marker(stream);
        append_chunk(stream, static_cast<uint8_t>(ChunkTagE::Padding), string(max_chunk_length, '\0'));
        append_literal_chunk(stream, "after padding");
        string out;
        snapframe_check(!decode(stream, out) && out == "after padding", "large padding");
    }
    {
        string stream;
        append_literal_chunk(stream, "hello");
        decode_expect(stream, error_missing_stream_marker, "data before marker");
    }
    {
        string stream;
        append_chunk(stream, static_cast<uint8_t>(ChunkTagE::Padding), "pad");
        append_stream_marker(stream);
        append_literal_chunk(stream, "hello");
        decode_expect(stream, error_missing_stream_marker, "padding before marker");
    }
    {
        string stream;
        append_chunk(stream, 0x05, "xyz");
        decode_expect(stream, error_missing_stream_marker, "unskippable before marker");
    }
    {
        string stream;
        append_chunk(stream, static_cast<uint8_t>(ChunkTagE::StreamMarker), "sNaPpZ");
        append_literal_chunk(stream, "hello");
        const ErrorConditionT err = decode_expect(stream, error_invalid_stream_marker, "wrong marker body");
        snapframe_check(error_kind(err) == ErrorKindE::Format, "invalid marker kind");
    }
    {
        string stream;
        append_chunk(stream, static_cast<uint8_t>(ChunkTagE::StreamMarker), "sNaPp");
        decode_expect(stream, error_invalid_stream_marker, "short marker");
    }
    {
        string stream;
        append_chunk(stream, static_cast<uint8_t>(ChunkTagE::StreamMarker), "sNaPpYY");
        decode_expect(stream, error_invalid_stream_marker, "long marker");
    }
    {
        // markers may repeat anywhere
        string stream;
        append_stream_marker(stream);
        append_literal_chunk(stream, "ab");
        append_stream_marker(stream);
        append_stream_marker(stream);
        append_literal_chunk(stream, "cd");
        string out;
        snapframe_check(!decode(stream, out) && out == "abcd", "repeated marker");
    }
    {
        string stream;
        append_stream_marker(stream);
        append_literal_chunk(stream, "ab");
        append_chunk(stream, static_cast<uint8_t>(ChunkTagE::StreamMarker), "SNAPPY");
        decode_expect(stream, error_invalid_stream_marker, "bad marker mid stream");
    }
    {
        const size_t max_payload = Configuration().blockCodec().maxCompressedLength(max_block_size) + checksum_size;
        const uint8_t tags[] = {static_cast<uint8_t>(ChunkTagE::CompressedBlock), static_cast<uint8_t>(ChunkTagE::UncompressedBlock)};
        for (const auto tag : tags) {
            // rejected on the header alone: no payload follows
            string stream;
            append_stream_marker(stream);
            char buf[ChunkHeader::size_of_header];
            ChunkHeader(tag, static_cast<uint32_t>(max_payload + 1)).store(buf);
            stream.append(buf, sizeof(buf));
            const ErrorConditionT err = decode_expect(stream, error_chunk_too_large, "oversized chunk");
            snapframe_check(error_kind(err) == ErrorKindE::Corruption, "oversized chunk kind");

            stream.clear();
            append_stream_marker(stream);
            append_chunk(stream, tag, "abc");
            decode_expect(stream, error_chunk_too_short, "chunk shorter than checksum");
        }
    }
    {
        string stream;
        append_stream_marker(stream);
        append_literal_chunk(stream, string(max_block_size + 1, 'l'));
        decode_expect(stream, error_block_too_large, "literal block too large");
    }
    {
        // literal block of exactly max_block_size is fine
        string stream;
        append_stream_marker(stream);
        append_literal_chunk(stream, string(max_block_size, 'l'));
        string out;
        snapframe_check(!decode(stream, out) && out.size() == max_block_size, "max literal block");
    }
    {
        string stream;
        append_stream_marker(stream);
        append_chunk(stream, static_cast<uint8_t>(ChunkTagE::CompressedBlock), string("\0\0\0\0\xff\xff\xff\xff\xff", 9));
        decode_expect(stream, error_block_decode, "malformed compressed block");
    }
    {
        // compressed block declaring more than max_block_size decoded bytes
        string payload(checksum_size, '\0');
        payload += string("\x81\x80\x04", 3); // varint 65537
        payload += string(10, '\0');
        string stream;
        append_stream_marker(stream);
        append_chunk(stream, static_cast<uint8_t>(ChunkTagE::CompressedBlock), payload);
        decode_expect(stream, error_block_too_large, "compressed block too large");
    }
    {
        // compressed chunk built by hand
        const string      data = string(5000, 'c');
        const BlockCodec& rcodec = Configuration().blockCodec();
        string            compressed(rcodec.maxCompressedLength(data.size()), '\0');
        compressed.resize(rcodec.compress(data.data(), data.size(), compressed.data()));

        string payload(checksum_size, '\0');
        store_uint32(payload.data(), mask_checksum(crc32c(data.data(), data.size())));
        payload += compressed;

        string stream;
        append_stream_marker(stream);
        append_chunk(stream, static_cast<uint8_t>(ChunkTagE::CompressedBlock), payload);

        string out;
        snapframe_check(!decode(stream, out) && out == data, "hand built compressed chunk");

        // checksum computed over the compressed bytes must be rejected
        store_uint32(payload.data(), mask_checksum(crc32c(compressed.data(), compressed.size())));
        stream.clear();
        append_stream_marker(stream);
        append_chunk(stream, static_cast<uint8_t>(ChunkTagE::CompressedBlock), payload);
        decode_expect(stream, error_checksum_mismatch, "checksum of compressed bytes");
    }
    {
        // unmasked checksum must be rejected
        const string data = "unmasked";
        string       payload(checksum_size, '\0');
        store_uint32(payload.data(), crc32c(data.data(), data.size()));
        payload += data;
        string stream;
        append_stream_marker(stream);
        append_chunk(stream, static_cast<uint8_t>(ChunkTagE::UncompressedBlock), payload);
        decode_expect(stream, error_checksum_mismatch, "unmasked checksum");
    }
    {
        string stream;
        append_stream_marker(stream);
        append_chunk(stream, 0x42, string(100, 'u'));
        stream.resize(stream.size() - 10);
        decode_expect(stream, error_truncated_stream, "truncated unskippable chunk");
    }
    return 0;
}
