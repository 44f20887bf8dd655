#include "aether/errors.hpp"
#include "aether/event_loop.hpp"
#include "aether/file_stream.hpp"
#include "aether/log.hpp"
#include "aether/transport.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {

using aether::EventLoop;
using aether::transport::Bytes;
using aether::transport::ChunkFrame;
using aether::transport::LoopbackChannel;
using aether::transport::MetaFrame;
using aether::transport::SessionState;
using aether::transport::TransferSession;

Bytes RandomBytes(std::size_t size, unsigned seed) {
    std::mt19937 rng(seed);
    Bytes out(size);
    for (auto& byte : out) {
        byte = static_cast<std::uint8_t>(rng() & 0xFF);
    }
    return out;
}

MetaFrame NamedMeta(const std::string& filename, std::uint64_t size = 0) {
    MetaFrame meta;
    meta.filename = filename;
    meta.mime = "application/octet-stream";
    meta.size = size;
    return meta;
}

std::unique_ptr<aether::filestream::ByteSource> Source(Bytes data) {
    return std::make_unique<aether::filestream::MemorySource>(std::move(data));
}

class CapturedLog {
public:
    CapturedLog() : previous_(aether::log::CurrentLevel()) {
        aether::log::SetSink(&stream_);
        aether::log::SetLevel(aether::log::Level::Debug);
    }
    ~CapturedLog() {
        aether::log::SetSink(nullptr);
        aether::log::SetLevel(previous_);
    }
    std::string text() const { return stream_.str(); }

private:
    aether::log::Level previous_;
    std::ostringstream stream_;
};

TEST(FrameCodec, MetaFramePreservesEveryField) {
    MetaFrame meta = NamedMeta("r\xC3\xA9sum\xC3\xA9.pdf", 1000000);
    meta.total_chunks = 62;
    meta.encrypted = true;
    meta.salt = Bytes(16, 0xAA);
    meta.iv = Bytes(12, 0xBB);
    Bytes wire = aether::transport::EncodeFrame(meta);
    EXPECT_EQ(std::string(wire.begin(), wire.begin() + 4), "AEF1");

    auto frame = aether::transport::DecodeFrame(wire);
    ASSERT_TRUE(std::holds_alternative<MetaFrame>(frame));
    const auto& decoded = std::get<MetaFrame>(frame);
    EXPECT_EQ(decoded.filename, meta.filename);
    EXPECT_EQ(decoded.mime, meta.mime);
    EXPECT_EQ(decoded.size, meta.size);
    EXPECT_EQ(decoded.total_chunks, 62u);
    EXPECT_TRUE(decoded.encrypted);
    EXPECT_EQ(decoded.salt, meta.salt);
    EXPECT_EQ(decoded.iv, meta.iv);
}

TEST(FrameCodec, ChunkFrameCarriesOffsetAndData) {
    ChunkFrame chunk;
    chunk.offset = 0x0123456789ULL;
    chunk.data = RandomBytes(300, 1);
    auto frame = aether::transport::DecodeFrame(aether::transport::EncodeFrame(chunk));
    ASSERT_TRUE(std::holds_alternative<ChunkFrame>(frame));
    EXPECT_EQ(std::get<ChunkFrame>(frame).offset, chunk.offset);
    EXPECT_EQ(std::get<ChunkFrame>(frame).data, chunk.data);
}

TEST(FrameCodec, RejectsMalformedFrames) {
    Bytes wire = aether::transport::EncodeFrame(NamedMeta("a.txt", 3));
    Bytes bad_magic = wire;
    bad_magic[0] = 'X';
    EXPECT_THROW(aether::transport::DecodeFrame(bad_magic), aether::CorruptStream);

    Bytes truncated(wire.begin(), wire.end() - 1);
    EXPECT_THROW(aether::transport::DecodeFrame(truncated), aether::CorruptStream);

    Bytes bad_kind = wire;
    bad_kind[4] = 0x7F;
    EXPECT_THROW(aether::transport::DecodeFrame(bad_kind), aether::CorruptStream);

    EXPECT_THROW(aether::transport::DecodeFrame(Bytes{'A', 'E'}), aether::CorruptStream);
}

TEST(TransportMath, ChunkCountAndPercent) {
    EXPECT_EQ(aether::transport::ChunkCount(0, 16384), 0u);
    EXPECT_EQ(aether::transport::ChunkCount(16384, 16384), 1u);
    EXPECT_EQ(aether::transport::ChunkCount(1000000, 16384), 62u);
    EXPECT_THROW(aether::transport::ChunkCount(10, 0), std::invalid_argument);
    EXPECT_EQ(aether::transport::PercentOf(0, 0), 100);
    EXPECT_EQ(aether::transport::PercentOf(1, 3), 33);
    EXPECT_EQ(aether::transport::PercentOf(2, 3), 67);
    EXPECT_EQ(aether::transport::PercentOf(5, 3), 100);
}

TEST(EventLoop, RunsTasksInPostOrderAndTimersWhenDue) {
    double now = 0.0;
    EventLoop loop([&now] { return now; });
    std::vector<int> order;
    loop.PostDelayed(1.0, [&order] { order.push_back(3); });
    loop.Post([&order, &loop] {
        order.push_back(1);
        loop.Post([&order] { order.push_back(2); });
    });
    EXPECT_EQ(loop.RunReady(), 2u);
    EXPECT_EQ(order, (std::vector<int>{1, 2}));
    EXPECT_EQ(loop.Pending(), 1u);
    now = 1.0;
    EXPECT_EQ(loop.RunReady(), 1u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(loop.Pending(), 0u);
}

TEST(ChunkedTransport, ReassemblesMillionBytesAndCompletesOnce) {
    const std::size_t kTotal = 1000000;
    Bytes data = RandomBytes(kTotal, 42);

    EventLoop loop;
    LoopbackChannel channel(loop);
    TransferSession session;
    aether::transport::BindSession(channel, session);

    int completions = 0;
    std::uint64_t received_at_completion = 0;
    Bytes completed;
    session.SetCompleteCallback([&](const MetaFrame& meta, const Bytes& payload) {
        ++completions;
        received_at_completion = session.bytes_received();
        EXPECT_EQ(meta.filename, "big.bin");
        completed = payload;
    });
    std::vector<std::uint64_t> receive_progress;
    session.SetProgressCallback([&](int, std::uint64_t done, std::uint64_t total) {
        EXPECT_EQ(total, kTotal);
        EXPECT_FALSE(session.complete());
        receive_progress.push_back(done);
    });

    aether::transport::SendOptions options;
    options.chunk_size = 16384;
    options.yield_every = 50;
    int last_percent = -1;
    std::size_t progress_calls = 0;
    bool sent_ok = false;
    auto sender = aether::transport::SendStream(
        loop, Source(data), channel, NamedMeta("big.bin"), options,
        [&](int percent, std::uint64_t done, std::uint64_t total) {
            EXPECT_EQ(total, kTotal);
            EXPECT_GE(percent, last_percent);
            last_percent = percent;
            ++progress_calls;
            EXPECT_LE(done, total);
        },
        [&sent_ok](bool ok) { sent_ok = ok; });

    loop.Run();

    EXPECT_TRUE(sent_ok);
    EXPECT_EQ(sender->chunks_sent(), 62u);
    EXPECT_EQ(progress_calls, 62u);
    EXPECT_EQ(last_percent, 100);
    EXPECT_EQ(completions, 1);
    EXPECT_EQ(received_at_completion, kTotal);
    EXPECT_EQ(receive_progress.size(), 62u);
    EXPECT_EQ(receive_progress.back(), kTotal);
    EXPECT_EQ(session.state(), SessionState::Complete);
    EXPECT_EQ(completed, data);
    EXPECT_EQ(session.TakePayload(), data);
}

TEST(ChunkedTransport, SenderYieldsSoChannelDrains) {
    EventLoop loop;
    LoopbackChannel channel(loop);
    TransferSession session;
    aether::transport::BindSession(channel, session);

    const std::size_t chunk = 1000;
    aether::transport::SendOptions options;
    options.chunk_size = chunk;
    options.yield_every = 50;
    auto sender = aether::transport::SendStream(loop, Source(RandomBytes(chunk * 200, 5)), channel,
                                                NamedMeta("drain.bin"), options, nullptr);
    loop.Run();

    EXPECT_EQ(sender->yields(), 3u);
    EXPECT_TRUE(session.complete());
    // One batch of chunk frames plus the meta frame, never the whole file.
    std::size_t frame_overhead = 4 + 1 + 4 + 8;
    EXPECT_LE(channel.peak_buffered(), 50 * (chunk + frame_overhead) + 256);
    EXPECT_EQ(channel.BufferedAmount(), 0u);
}

TEST(ChunkedTransport, LastChunkMayBeShort) {
    EventLoop loop;
    LoopbackChannel channel(loop);
    std::vector<std::size_t> sizes;
    channel.SetMessageHandler([&sizes](Bytes message) {
        auto frame = aether::transport::DecodeFrame(message);
        if (auto* chunk = std::get_if<ChunkFrame>(&frame)) {
            sizes.push_back(chunk->data.size());
        } else {
            EXPECT_TRUE(sizes.empty()) << "meta frame must come first";
        }
    });
    aether::transport::SendOptions options;
    options.chunk_size = 4;
    aether::transport::SendStream(loop, Source(RandomBytes(10, 1)), channel, NamedMeta("short.bin"), options,
                                  nullptr);
    loop.Run();
    EXPECT_EQ(sizes, (std::vector<std::size_t>{4, 4, 2}));
}

TEST(ChunkedTransport, ChunkBeforeMetadataIsDroppedWithWarning) {
    CapturedLog log;
    TransferSession session;
    EXPECT_FALSE(session.OnChunk(0, Bytes{1, 2, 3}));
    EXPECT_EQ(session.state(), SessionState::AwaitingMeta);
    EXPECT_FALSE(session.meta_received());
    EXPECT_EQ(session.dropped_chunks(), 1u);
    EXPECT_NE(log.text().find("before metadata"), std::string::npos);

    session.OnMetadata(NamedMeta("late.bin", 3));
    EXPECT_TRUE(session.OnChunk(0, Bytes{1, 2, 3}));
    EXPECT_EQ(session.TakePayload(), (Bytes{1, 2, 3}));
}

TEST(ChunkedTransport, UnexpectedOffsetIsDropped) {
    CapturedLog log;
    TransferSession session;
    session.OnMetadata(NamedMeta("gap.bin", 6));
    EXPECT_FALSE(session.OnChunk(3, Bytes{4, 5, 6}));
    EXPECT_EQ(session.bytes_received(), 0u);
    EXPECT_NE(log.text().find("Unexpected chunk offset"), std::string::npos);
    EXPECT_FALSE(session.OnChunk(0, Bytes{1, 2, 3}));
    EXPECT_TRUE(session.OnChunk(3, Bytes{4, 5, 6}));
    EXPECT_FALSE(session.OnChunk(6, Bytes{7}));
    EXPECT_EQ(session.dropped_chunks(), 2u);
}

TEST(ChunkedTransport, EmptyFileCompletesOnMetadata) {
    TransferSession session;
    int completions = 0;
    session.SetCompleteCallback([&completions](const MetaFrame&, const Bytes& payload) {
        ++completions;
        EXPECT_TRUE(payload.empty());
    });
    session.OnMetadata(NamedMeta("empty.txt", 0));
    EXPECT_TRUE(session.complete());
    EXPECT_EQ(completions, 1);
    session.OnClose();
    EXPECT_EQ(session.state(), SessionState::Complete);
}

TEST(ChunkedTransport, CloseBeforeCompletionAborts) {
    TransferSession session;
    session.OnMetadata(NamedMeta("partial.bin", 100));
    session.OnChunk(0, Bytes(40, 0x11));
    session.OnClose();
    EXPECT_EQ(session.state(), SessionState::Aborted);
    try {
        session.TakePayload();
        FAIL() << "expected TransferAborted";
    } catch (const aether::TransferAborted& exc) {
        EXPECT_EQ(exc.bytes_received(), 40u);
        EXPECT_EQ(exc.bytes_expected(), 100u);
    }
    EXPECT_FALSE(session.OnChunk(40, Bytes(60, 0x22)));
}

TEST(ChunkedTransport, PayloadIsUnavailableWhileReceiving) {
    TransferSession session;
    session.OnMetadata(NamedMeta("wip.bin", 10));
    EXPECT_THROW(session.TakePayload(), std::logic_error);
}

TEST(ChunkedTransport, ChannelClosedMidTransferFailsBothEnds) {
    EventLoop loop;
    LoopbackChannel channel(loop);
    TransferSession session;
    aether::transport::BindSession(channel, session);

    aether::transport::SendOptions options;
    options.chunk_size = 100;
    options.yield_every = 4;
    bool done_called = false;
    bool sent_ok = true;
    auto sender = aether::transport::SendStream(
        loop, Source(RandomBytes(10000, 9)), channel, NamedMeta("cut.bin"), options,
        [&channel](int, std::uint64_t done, std::uint64_t) {
            if (done >= 1000) {
                channel.Close();
            }
        },
        [&](bool ok) {
            done_called = true;
            sent_ok = ok;
        });
    loop.Run();

    EXPECT_TRUE(done_called);
    EXPECT_FALSE(sent_ok);
    EXPECT_EQ(sender->state(), aether::transport::SendState::Failed);
    EXPECT_EQ(session.state(), SessionState::Aborted);
    EXPECT_EQ(session.bytes_received(), 1000u);
    EXPECT_THROW(session.TakePayload(), aether::TransferAborted);
}

TEST(ChunkedTransport, StreamChannelFeedsReadFrames) {
    Bytes data = RandomBytes(50000, 77);
    std::stringstream wire(std::ios::in | std::ios::out | std::ios::binary);
    {
        EventLoop loop;
        aether::transport::StreamChannel channel(wire);
        aether::transport::SendOptions options;
        options.chunk_size = 4096;
        aether::transport::SendStream(loop, Source(data), channel, NamedMeta("piped.bin"), options, nullptr);
        loop.Run();
        channel.Close();
    }
    TransferSession session;
    std::size_t frames = aether::transport::ReadFrames(wire, session);
    EXPECT_EQ(frames, 1u + 13u);
    EXPECT_EQ(session.meta().filename, "piped.bin");
    EXPECT_EQ(session.TakePayload(), data);
}

TEST(ChunkedTransport, StreamsFromFileSource) {
    Bytes data = RandomBytes(70000, 11);
    auto path = std::filesystem::temp_directory_path() / "aether_transport_source.bin";
    aether::filestream::WriteFileBytes(path, data);

    EventLoop loop;
    LoopbackChannel channel(loop);
    TransferSession session;
    aether::transport::BindSession(channel, session);
    auto source = std::make_unique<aether::filestream::FileSource>(path);
    EXPECT_EQ(source->Size(), data.size());
    aether::transport::SendStream(loop, std::move(source), channel, NamedMeta("disk.bin"),
                                  aether::transport::SendOptions{}, nullptr);
    loop.Run();

    EXPECT_EQ(session.meta().size, data.size());
    EXPECT_EQ(session.meta().total_chunks, 5u);
    EXPECT_EQ(session.TakePayload(), data);
    std::filesystem::remove(path);
    EXPECT_THROW(aether::filestream::FileSource{path}, std::runtime_error);
}

TEST(ChunkedTransport, TruncatedFrameStreamAborts) {
    std::stringstream wire(std::ios::in | std::ios::out | std::ios::binary);
    {
        EventLoop loop;
        aether::transport::StreamChannel channel(wire);
        aether::transport::SendOptions options;
        options.chunk_size = 1000;
        aether::transport::SendStream(loop, Source(RandomBytes(5000, 3)), channel, NamedMeta("cut.bin"), options,
                                      nullptr);
        loop.Run();
    }
    std::string bytes = wire.str();
    std::stringstream cut(bytes.substr(0, bytes.size() - 500), std::ios::in | std::ios::binary);
    TransferSession session;
    aether::transport::ReadFrames(cut, session);
    EXPECT_EQ(session.state(), SessionState::Aborted);
    EXPECT_EQ(session.bytes_received(), 4000u);
}

TEST(ChunkedTransport, CorruptFrameMidStreamAborts) {
    MetaFrame meta = NamedMeta("bad.bin", 100);
    meta.total_chunks = 1;
    Bytes wire = aether::transport::EncodeFrame(meta);
    Bytes bogus = {'A', 'E', 'F', '1', 0x09, 0x00, 0x00, 0x00, 0x00};
    wire.insert(wire.end(), bogus.begin(), bogus.end());

    std::stringstream in(std::string(wire.begin(), wire.end()), std::ios::in | std::ios::binary);
    TransferSession session;
    EXPECT_THROW(aether::transport::ReadFrames(in, session), aether::CorruptStream);
    EXPECT_EQ(session.state(), SessionState::Aborted);
    EXPECT_THROW(session.TakePayload(), aether::TransferAborted);
}

TEST(ChunkedTransport, OversizeFrameMidStreamAborts) {
    Bytes wire = aether::transport::EncodeFrame(NamedMeta("big.bin", 100));
    Bytes huge = {'A', 'E', 'F', '1', 0x02, 0xFF, 0xFF, 0xFF, 0xFF};
    wire.insert(wire.end(), huge.begin(), huge.end());

    std::stringstream in(std::string(wire.begin(), wire.end()), std::ios::in | std::ios::binary);
    TransferSession session;
    EXPECT_THROW(aether::transport::ReadFrames(in, session), aether::CorruptStream);
    EXPECT_EQ(session.state(), SessionState::Aborted);
}

TEST(ChunkedTransport, RejectsInvalidSendOptions) {
    EventLoop loop;
    LoopbackChannel channel(loop);
    aether::transport::SendOptions options;
    options.chunk_size = 0;
    EXPECT_THROW(aether::transport::StreamSender::Create(loop, Source(Bytes(3)), channel, NamedMeta("x"), options),
                 std::invalid_argument);
    options.chunk_size = 16;
    options.yield_every = 0;
    EXPECT_THROW(aether::transport::StreamSender::Create(loop, Source(Bytes(3)), channel, NamedMeta("x"), options),
                 std::invalid_argument);
}

}  // namespace
