#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "aether/constants.hpp"
#include "aether/event_loop.hpp"
#include "aether/file_stream.hpp"

namespace aether::transport {

using Bytes = std::vector<std::uint8_t>;

struct MetaFrame {
    std::string filename;
    std::uint64_t size = 0;
    std::string mime;
    std::uint64_t total_chunks = 0;
    bool encrypted = false;
    Bytes salt;
    Bytes iv;
};

struct ChunkFrame {
    std::uint64_t offset = 0;
    Bytes data;
};

using Frame = std::variant<MetaFrame, ChunkFrame>;

// Wire form: "AEF1" | kind:u8 | body_len:u32be | body.
// Meta body is length-prefixed [filename, mime, size:u64be, total_chunks:u64be,
// flags:u8, salt, iv]; chunk body is offset:u64be followed by the data.
Bytes EncodeFrame(const Frame& frame);
// Throws CorruptStream on bad magic, unknown kind, or a body that does not parse.
Frame DecodeFrame(const Bytes& wire);

std::uint64_t ChunkCount(std::uint64_t size, std::size_t chunk_size);
int PercentOf(std::uint64_t done, std::uint64_t total);

using ProgressCallback = std::function<void(int percent, std::uint64_t done, std::uint64_t total)>;

// Ordered, reliable message channel to one peer.
class PeerChannel {
public:
    virtual ~PeerChannel() = default;

    virtual void Send(Bytes message) = 0;
    // Bytes accepted by Send but not yet delivered.
    virtual std::size_t BufferedAmount() const = 0;
    virtual bool IsOpen() const = 0;
    virtual void Close() = 0;
};

struct SendOptions {
    std::size_t chunk_size = constants::kBeamChunkSize;
    std::size_t yield_every = constants::kBeamYieldEvery;
};

SendOptions DefaultSendOptions();

enum class SendState {
    Idle,
    Sending,
    Done,
    Failed
};

// Sends one meta frame and then the source in order. Every `yield_every`
// chunks the sender re-posts itself on the loop so queued deliveries drain
// before more data is enqueued.
class StreamSender : public std::enable_shared_from_this<StreamSender> {
public:
    using DoneCallback = std::function<void(bool ok)>;

    static std::shared_ptr<StreamSender> Create(EventLoop& loop,
                                                std::unique_ptr<filestream::ByteSource> source,
                                                PeerChannel& channel,
                                                MetaFrame meta,
                                                SendOptions options = {});

    void SetProgressCallback(ProgressCallback callback) { on_progress_ = std::move(callback); }
    void SetDoneCallback(DoneCallback callback) { on_done_ = std::move(callback); }

    void Start();

    SendState state() const noexcept { return state_; }
    std::uint64_t bytes_sent() const noexcept { return sent_; }
    std::uint64_t chunks_sent() const noexcept { return chunks_sent_; }
    std::size_t yields() const noexcept { return yields_; }

private:
    struct CreateTag {};

public:
    StreamSender(CreateTag,
                 EventLoop& loop,
                 std::unique_ptr<filestream::ByteSource> source,
                 PeerChannel& channel,
                 MetaFrame meta,
                 SendOptions options);

private:
    void Step();
    void Finish(bool ok);

    EventLoop& loop_;
    std::unique_ptr<filestream::ByteSource> source_;
    PeerChannel& channel_;
    MetaFrame meta_;
    SendOptions options_;
    ProgressCallback on_progress_;
    DoneCallback on_done_;
    SendState state_ = SendState::Idle;
    bool meta_sent_ = false;
    std::uint64_t total_ = 0;
    std::uint64_t sent_ = 0;
    std::uint64_t chunks_sent_ = 0;
    std::size_t yields_ = 0;
};

// Convenience wrapper: builds the meta frame from the source and starts sending.
std::shared_ptr<StreamSender> SendStream(EventLoop& loop,
                                         std::unique_ptr<filestream::ByteSource> source,
                                         PeerChannel& channel,
                                         MetaFrame meta,
                                         const SendOptions& options,
                                         ProgressCallback on_progress,
                                         StreamSender::DoneCallback on_done = {});

enum class SessionState {
    AwaitingMeta,
    Receiving,
    Complete,
    Aborted
};

// Receive half of one beam transfer.
class TransferSession {
public:
    using CompleteCallback = std::function<void(const MetaFrame& meta, const Bytes& payload)>;

    void SetProgressCallback(ProgressCallback callback) { on_progress_ = std::move(callback); }
    void SetCompleteCallback(CompleteCallback callback) { on_complete_ = std::move(callback); }

    void OnMetadata(MetaFrame meta);
    // Returns true when this chunk completed the transfer.
    bool OnChunk(std::uint64_t offset, Bytes data);
    void OnFrame(Frame frame);
    void OnClose();

    SessionState state() const noexcept { return state_; }
    bool meta_received() const noexcept { return has_meta_; }
    bool complete() const noexcept { return state_ == SessionState::Complete; }
    std::uint64_t bytes_received() const noexcept { return received_; }
    std::uint64_t bytes_expected() const noexcept { return meta_.size; }
    std::size_t dropped_chunks() const noexcept { return dropped_; }
    const MetaFrame& meta() const noexcept { return meta_; }

    // Throws TransferAborted when the channel closed early, std::logic_error
    // while the transfer is still running.
    Bytes TakePayload();

private:
    void Finalize();

    SessionState state_ = SessionState::AwaitingMeta;
    bool has_meta_ = false;
    MetaFrame meta_;
    std::vector<Bytes> ranges_;
    Bytes payload_;
    std::uint64_t received_ = 0;
    std::size_t dropped_ = 0;
    ProgressCallback on_progress_;
    CompleteCallback on_complete_;
};

// In-memory ordered channel. Each Send posts one delivery task on the loop;
// Close posts the close notification behind any pending deliveries.
class LoopbackChannel : public PeerChannel {
public:
    using MessageHandler = std::function<void(Bytes message)>;
    using CloseHandler = std::function<void()>;

    explicit LoopbackChannel(EventLoop& loop);

    void SetMessageHandler(MessageHandler handler);
    void SetCloseHandler(CloseHandler handler);

    void Send(Bytes message) override;
    std::size_t BufferedAmount() const override;
    bool IsOpen() const override;
    void Close() override;

    std::size_t peak_buffered() const;

private:
    struct State {
        bool open = true;
        std::size_t buffered = 0;
        std::size_t peak = 0;
        MessageHandler on_message;
        CloseHandler on_close;
    };

    EventLoop& loop_;
    std::shared_ptr<State> state_;
};

// Routes decoded frames into the session; undecodable messages are logged and dropped.
void BindSession(LoopbackChannel& channel, TransferSession& session);

// Writes each message as-is; encoded frames are self-delimiting.
class StreamChannel : public PeerChannel {
public:
    explicit StreamChannel(std::ostream& out) : out_(out) {}

    void Send(Bytes message) override;
    std::size_t BufferedAmount() const override { return 0; }
    bool IsOpen() const override { return open_ && static_cast<bool>(out_); }
    void Close() override;

private:
    std::ostream& out_;
    bool open_ = true;
};

// Feeds every frame from `in` into the session and signals close at end of
// input. A malformed frame aborts the session and throws CorruptStream.
// Returns frames read.
std::size_t ReadFrames(std::istream& in, TransferSession& session);

}  // namespace aether::transport
