#include "aether/transport.hpp"

#include "aether/errors.hpp"
#include "aether/format.hpp"
#include "aether/log.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace aether::transport {

namespace {

constexpr std::size_t kFrameHeaderLen = 4 + 1 + 4;
constexpr std::uint8_t kFlagEncrypted = 0x01;

Bytes ToBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

Bytes EncodeMetaBody(const MetaFrame& meta) {
    Bytes size;
    format::PutU64Be(size, meta.size);
    Bytes chunks;
    format::PutU64Be(chunks, meta.total_chunks);
    Bytes flags{static_cast<std::uint8_t>(meta.encrypted ? kFlagEncrypted : 0)};
    return format::PackLengthPrefixed({ToBytes(meta.filename), ToBytes(meta.mime), size, chunks, flags,
                                       meta.encrypted ? meta.salt : Bytes{}, meta.encrypted ? meta.iv : Bytes{}});
}

MetaFrame DecodeMetaBody(const Bytes& body) {
    std::vector<Bytes> parts = format::UnpackLengthPrefixed(body, 7);
    if (parts[2].size() != 8 || parts[3].size() != 8 || parts[4].size() != 1) {
        throw CorruptStream("Malformed meta frame");
    }
    MetaFrame meta;
    meta.filename.assign(parts[0].begin(), parts[0].end());
    meta.mime.assign(parts[1].begin(), parts[1].end());
    meta.size = format::ReadU64Be(parts[2], 0);
    meta.total_chunks = format::ReadU64Be(parts[3], 0);
    meta.encrypted = (parts[4][0] & kFlagEncrypted) != 0;
    if (meta.encrypted) {
        if (parts[5].size() != constants::kKdfSaltLen || parts[6].size() != constants::kAeadNonceLen) {
            throw CorruptStream("Meta frame has malformed crypto parameters");
        }
        meta.salt = std::move(parts[5]);
        meta.iv = std::move(parts[6]);
    }
    if (meta.filename.empty()) {
        throw CorruptStream("Meta frame without filename");
    }
    return meta;
}

}  // namespace

Bytes EncodeFrame(const Frame& frame) {
    Bytes body;
    std::uint8_t kind = 0;
    if (const auto* meta = std::get_if<MetaFrame>(&frame)) {
        kind = constants::kFrameKindMeta;
        body = EncodeMetaBody(*meta);
    } else {
        const auto& chunk = std::get<ChunkFrame>(frame);
        kind = constants::kFrameKindChunk;
        body.reserve(8 + chunk.data.size());
        format::PutU64Be(body, chunk.offset);
        body.insert(body.end(), chunk.data.begin(), chunk.data.end());
    }
    if (body.size() > constants::kMaxFrameBody) {
        throw std::invalid_argument("Frame body exceeds maximum size");
    }
    Bytes out;
    out.reserve(kFrameHeaderLen + body.size());
    out.insert(out.end(), constants::kFrameMagic.begin(), constants::kFrameMagic.end());
    out.push_back(kind);
    format::PutU32Be(out, static_cast<std::uint32_t>(body.size()));
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

Frame DecodeFrame(const Bytes& wire) {
    if (wire.size() < kFrameHeaderLen
        || !std::equal(constants::kFrameMagic.begin(), constants::kFrameMagic.end(), wire.begin())) {
        throw CorruptStream("Not a beam frame");
    }
    std::uint8_t kind = wire[4];
    std::uint32_t body_len = format::ReadU32Be(wire, 5);
    if (body_len != wire.size() - kFrameHeaderLen) {
        throw CorruptStream("Beam frame length mismatch");
    }
    Bytes body(wire.begin() + kFrameHeaderLen, wire.end());
    try {
        if (kind == constants::kFrameKindMeta) {
            return DecodeMetaBody(body);
        }
        if (kind == constants::kFrameKindChunk) {
            ChunkFrame chunk;
            chunk.offset = format::ReadU64Be(body, 0);
            chunk.data.assign(body.begin() + 8, body.end());
            return chunk;
        }
    } catch (const CorruptStream&) {
        throw;
    } catch (const std::runtime_error& exc) {
        throw CorruptStream(std::string("Malformed beam frame: ") + exc.what());
    }
    throw CorruptStream("Unknown beam frame kind " + std::to_string(kind));
}

std::uint64_t ChunkCount(std::uint64_t size, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }
    return size / chunk_size + (size % chunk_size != 0 ? 1 : 0);
}

int PercentOf(std::uint64_t done, std::uint64_t total) {
    if (total == 0) {
        return 100;
    }
    double percent = std::round(static_cast<double>(done) * 100.0 / static_cast<double>(total));
    return static_cast<int>(std::min(100.0, percent));
}

SendOptions DefaultSendOptions() {
    SendOptions options;
    options.chunk_size = constants::BeamChunkSize();
    options.yield_every = constants::BeamYieldEvery();
    return options;
}

// ---- sender ----

StreamSender::StreamSender(CreateTag,
                           EventLoop& loop,
                           std::unique_ptr<filestream::ByteSource> source,
                           PeerChannel& channel,
                           MetaFrame meta,
                           SendOptions options)
    : loop_(loop), source_(std::move(source)), channel_(channel), meta_(std::move(meta)), options_(options) {}

std::shared_ptr<StreamSender> StreamSender::Create(EventLoop& loop,
                                                   std::unique_ptr<filestream::ByteSource> source,
                                                   PeerChannel& channel,
                                                   MetaFrame meta,
                                                   SendOptions options) {
    if (!source) {
        throw std::invalid_argument("Sender needs a byte source");
    }
    if (options.chunk_size == 0 || options.yield_every == 0) {
        throw std::invalid_argument("Chunk size and yield interval must be positive");
    }
    if (options.chunk_size + 8 > constants::kMaxFrameBody) {
        throw std::invalid_argument("Chunk size exceeds maximum frame body");
    }
    if (meta.filename.empty()) {
        throw std::invalid_argument("Sender needs a filename");
    }
    meta.size = source->Size();
    meta.total_chunks = ChunkCount(meta.size, options.chunk_size);
    return std::make_shared<StreamSender>(CreateTag{}, loop, std::move(source), channel, std::move(meta), options);
}

void StreamSender::Start() {
    if (state_ != SendState::Idle) {
        throw std::logic_error("Sender already started");
    }
    state_ = SendState::Sending;
    total_ = meta_.size;
    log::Info("Beam send: " + meta_.filename + " (" + std::to_string(total_) + " bytes, "
              + std::to_string(meta_.total_chunks) + " chunks)");
    auto self = shared_from_this();
    loop_.Post([self] { self->Step(); });
}

void StreamSender::Step() {
    if (state_ != SendState::Sending) {
        return;
    }
    try {
        if (!meta_sent_) {
            if (!channel_.IsOpen()) {
                log::Warn("Beam send: channel closed before metadata");
                Finish(false);
                return;
            }
            channel_.Send(EncodeFrame(meta_));
            meta_sent_ = true;
        }
        for (std::size_t i = 0; i < options_.yield_every && sent_ < total_; ++i) {
            if (!channel_.IsOpen()) {
                log::Warn("Beam send: channel closed after " + std::to_string(sent_) + " of "
                          + std::to_string(total_) + " bytes");
                Finish(false);
                return;
            }
            std::size_t want = static_cast<std::size_t>(
                std::min<std::uint64_t>(options_.chunk_size, total_ - sent_));
            ChunkFrame chunk;
            chunk.offset = sent_;
            chunk.data.resize(want);
            std::size_t filled = 0;
            while (filled < want) {
                std::size_t got = source_->Read(chunk.data.data() + filled, want - filled);
                if (got == 0) {
                    throw std::runtime_error("Byte source ended before its declared size");
                }
                filled += got;
            }
            channel_.Send(EncodeFrame(chunk));
            sent_ += want;
            ++chunks_sent_;
            if (on_progress_) {
                on_progress_(PercentOf(sent_, total_), sent_, total_);
            }
        }
    } catch (const std::runtime_error& exc) {
        log::Error(std::string("Beam send failed: ") + exc.what());
        Finish(false);
        return;
    }
    if (sent_ < total_) {
        ++yields_;
        auto self = shared_from_this();
        loop_.Post([self] { self->Step(); });
        return;
    }
    Finish(true);
}

void StreamSender::Finish(bool ok) {
    state_ = ok ? SendState::Done : SendState::Failed;
    if (ok) {
        log::Info("Beam send complete: " + std::to_string(chunks_sent_) + " chunks");
    }
    if (on_done_) {
        on_done_(ok);
    }
}

std::shared_ptr<StreamSender> SendStream(EventLoop& loop,
                                         std::unique_ptr<filestream::ByteSource> source,
                                         PeerChannel& channel,
                                         MetaFrame meta,
                                         const SendOptions& options,
                                         ProgressCallback on_progress,
                                         StreamSender::DoneCallback on_done) {
    auto sender = StreamSender::Create(loop, std::move(source), channel, std::move(meta), options);
    sender->SetProgressCallback(std::move(on_progress));
    sender->SetDoneCallback(std::move(on_done));
    sender->Start();
    return sender;
}

// ---- receiver ----

void TransferSession::OnMetadata(MetaFrame meta) {
    if (state_ != SessionState::AwaitingMeta) {
        log::Warn("Ignoring repeated metadata frame for " + meta.filename);
        return;
    }
    meta_ = std::move(meta);
    has_meta_ = true;
    state_ = SessionState::Receiving;
    received_ = 0;
    ranges_.clear();
    log::Info("Receiving " + meta_.filename + " (" + std::to_string(meta_.size) + " bytes, "
              + std::to_string(meta_.total_chunks) + " chunks)");
    if (meta_.size == 0) {
        Finalize();
    }
}

bool TransferSession::OnChunk(std::uint64_t offset, Bytes data) {
    if (state_ == SessionState::AwaitingMeta) {
        ++dropped_;
        log::Warn("Chunk at offset " + std::to_string(offset) + " arrived before metadata; dropped");
        return false;
    }
    if (state_ != SessionState::Receiving) {
        ++dropped_;
        log::Warn("Chunk at offset " + std::to_string(offset) + " arrived after the transfer ended; dropped");
        return false;
    }
    if (offset != received_) {
        ++dropped_;
        log::Warn("Unexpected chunk offset " + std::to_string(offset) + " (expected "
                  + std::to_string(received_) + "); dropped");
        return false;
    }
    received_ += data.size();
    ranges_.push_back(std::move(data));
    if (on_progress_) {
        on_progress_(PercentOf(received_, meta_.size), received_, meta_.size);
    }
    if (received_ >= meta_.size) {
        Finalize();
        return true;
    }
    return false;
}

void TransferSession::OnFrame(Frame frame) {
    if (auto* meta = std::get_if<MetaFrame>(&frame)) {
        OnMetadata(std::move(*meta));
        return;
    }
    auto& chunk = std::get<ChunkFrame>(frame);
    OnChunk(chunk.offset, std::move(chunk.data));
}

void TransferSession::OnClose() {
    if (state_ == SessionState::Complete || state_ == SessionState::Aborted) {
        return;
    }
    state_ = SessionState::Aborted;
    ranges_.clear();
    log::Warn("Transfer aborted: channel closed after " + std::to_string(received_) + " of "
              + std::to_string(meta_.size) + " bytes");
}

Bytes TransferSession::TakePayload() {
    if (state_ == SessionState::Complete) {
        return std::move(payload_);
    }
    if (state_ == SessionState::Aborted) {
        throw TransferAborted(received_, meta_.size);
    }
    throw std::logic_error("Transfer still in progress");
}

void TransferSession::Finalize() {
    payload_.clear();
    payload_.reserve(static_cast<std::size_t>(received_));
    for (const auto& range : ranges_) {
        payload_.insert(payload_.end(), range.begin(), range.end());
    }
    ranges_.clear();
    ranges_.shrink_to_fit();
    state_ = SessionState::Complete;
    log::Info("Transfer complete: " + meta_.filename + " (" + std::to_string(payload_.size()) + " bytes)");
    if (on_complete_) {
        on_complete_(meta_, payload_);
    }
}

// ---- channels ----

LoopbackChannel::LoopbackChannel(EventLoop& loop) : loop_(loop), state_(std::make_shared<State>()) {}

void LoopbackChannel::SetMessageHandler(MessageHandler handler) {
    state_->on_message = std::move(handler);
}

void LoopbackChannel::SetCloseHandler(CloseHandler handler) {
    state_->on_close = std::move(handler);
}

void LoopbackChannel::Send(Bytes message) {
    if (!state_->open) {
        throw std::runtime_error("Channel is closed");
    }
    std::size_t size = message.size();
    state_->buffered += size;
    state_->peak = std::max(state_->peak, state_->buffered);
    auto state = state_;
    loop_.Post([state, size, message = std::move(message)]() mutable {
        state->buffered -= size;
        if (state->on_message) {
            state->on_message(std::move(message));
        }
    });
}

std::size_t LoopbackChannel::BufferedAmount() const {
    return state_->buffered;
}

bool LoopbackChannel::IsOpen() const {
    return state_->open;
}

void LoopbackChannel::Close() {
    if (!state_->open) {
        return;
    }
    state_->open = false;
    auto state = state_;
    loop_.Post([state] {
        if (state->on_close) {
            state->on_close();
        }
    });
}

std::size_t LoopbackChannel::peak_buffered() const {
    return state_->peak;
}

void BindSession(LoopbackChannel& channel, TransferSession& session) {
    channel.SetMessageHandler([&session](Bytes message) {
        try {
            session.OnFrame(DecodeFrame(message));
        } catch (const CorruptStream& exc) {
            log::Warn(std::string("Dropping undecodable frame: ") + exc.what());
        }
    });
    channel.SetCloseHandler([&session] { session.OnClose(); });
}

void StreamChannel::Send(Bytes message) {
    if (!IsOpen()) {
        throw std::runtime_error("Stream channel is closed");
    }
    out_.write(reinterpret_cast<const char*>(message.data()), static_cast<std::streamsize>(message.size()));
    if (!out_) {
        throw std::runtime_error("Failed to write frame");
    }
}

void StreamChannel::Close() {
    if (open_) {
        out_.flush();
        open_ = false;
    }
}

namespace {

void ReadFrameLoop(std::istream& in, TransferSession& session, std::size_t& count) {
    for (;;) {
        Bytes wire(kFrameHeaderLen);
        in.read(reinterpret_cast<char*>(wire.data()), static_cast<std::streamsize>(wire.size()));
        std::size_t got = static_cast<std::size_t>(in.gcount());
        if (got == 0) {
            break;
        }
        if (got < kFrameHeaderLen) {
            log::Warn("Frame stream ended inside a frame header");
            break;
        }
        if (!std::equal(constants::kFrameMagic.begin(), constants::kFrameMagic.end(), wire.begin())) {
            throw CorruptStream("Not a beam frame stream");
        }
        std::uint32_t body_len = format::ReadU32Be(wire, 5);
        if (body_len > constants::kMaxFrameBody) {
            throw CorruptStream("Beam frame exceeds maximum size");
        }
        wire.resize(kFrameHeaderLen + body_len);
        in.read(reinterpret_cast<char*>(wire.data() + kFrameHeaderLen), static_cast<std::streamsize>(body_len));
        if (static_cast<std::size_t>(in.gcount()) != body_len) {
            log::Warn("Frame stream ended inside a frame body");
            break;
        }
        session.OnFrame(DecodeFrame(wire));
        ++count;
    }
}

}  // namespace

std::size_t ReadFrames(std::istream& in, TransferSession& session) {
    std::size_t count = 0;
    try {
        ReadFrameLoop(in, session, count);
    } catch (const CorruptStream&) {
        session.OnClose();
        throw;
    }
    session.OnClose();
    return count;
}

}  // namespace aether::transport
