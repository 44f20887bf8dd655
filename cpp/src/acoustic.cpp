#include "aether/acoustic.hpp"

#include "aether/log.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>
#include <stdexcept>
#include <utility>

namespace aether::acoustic {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kBlackmanAlpha = 0.16;

bool IsPowerOfTwo(std::size_t value) {
    return value != 0 && (value & (value - 1)) == 0;
}

// In-place iterative radix-2 Cooley-Tukey.
void Fft(std::vector<std::complex<double>>& data) {
    const std::size_t n = data.size();
    for (std::size_t i = 1, j = 0; i < n; ++i) {
        std::size_t bit = n >> 1;
        for (; j & bit; bit >>= 1) {
            j ^= bit;
        }
        j ^= bit;
        if (i < j) {
            std::swap(data[i], data[j]);
        }
    }
    for (std::size_t len = 2; len <= n; len <<= 1) {
        double angle = -2.0 * kPi / static_cast<double>(len);
        std::complex<double> step(std::cos(angle), std::sin(angle));
        for (std::size_t i = 0; i < n; i += len) {
            std::complex<double> w(1.0, 0.0);
            for (std::size_t k = 0; k < len / 2; ++k) {
                std::complex<double> even = data[i + k];
                std::complex<double> odd = data[i + k + len / 2] * w;
                data[i + k] = even + odd;
                data[i + k + len / 2] = even - odd;
                w *= step;
            }
        }
    }
}

}  // namespace

const ModemConfig& DefaultModemConfig() {
    static const ModemConfig config{};
    return config;
}

void Validate(const ModemConfig& config) {
    if (!(config.mark_hz > 0.0) || !(config.space_hz > 0.0) || config.mark_hz == config.space_hz) {
        throw std::invalid_argument("Mark and space frequencies must be positive and distinct");
    }
    if (!(config.baud_rate > 0.0) || !(config.sample_rate > 0.0) || !(config.frame_rate > 0.0)) {
        throw std::invalid_argument("Baud, sample and frame rates must be positive");
    }
    if (!IsPowerOfTwo(config.fft_size) || config.fft_size < 32) {
        throw std::invalid_argument("FFT size must be a power of two >= 32");
    }
    if (config.smoothing < 0.0 || config.smoothing >= 1.0 || !(config.max_db > config.min_db)) {
        throw std::invalid_argument("Invalid analyser smoothing or decibel range");
    }
    if (config.lead_in_s < 0.0 || config.completion_slack_s < 0.0 || config.bin_range < 0) {
        throw std::invalid_argument("Negative timing or bin range");
    }
}

std::string TextToBits(std::string_view text) {
    std::string bits;
    bits.reserve(text.size() * 8);
    for (char ch : text) {
        auto byte = static_cast<std::uint8_t>(ch);
        for (int shift = 7; shift >= 0; --shift) {
            bits.push_back(((byte >> shift) & 1u) ? '1' : '0');
        }
    }
    return bits;
}

std::string FrameBits(std::string_view text) {
    std::string bits(constants::kPreambleBits);
    bits += TextToBits(text);
    bits += constants::kTrailerBits;
    return bits;
}

Transmission Modulate(std::string_view text, const ModemConfig& config, double now) {
    Validate(config);
    Transmission tx;
    tx.bits = FrameBits(text);
    tx.origin_s = now;
    tx.start_s = now + config.lead_in_s;
    const double bit_duration = config.BitDuration();
    tx.schedule.reserve(tx.bits.size());
    for (std::size_t i = 0; i < tx.bits.size(); ++i) {
        double freq = tx.bits[i] == '1' ? config.mark_hz : config.space_hz;
        tx.schedule.push_back(ToneSegment{freq, tx.start_s + static_cast<double>(i) * bit_duration});
    }
    tx.end_s = tx.start_s + static_cast<double>(tx.bits.size()) * bit_duration;
    // Measured from the call, so the lead-in is covered by the slack.
    tx.completion_s = now + (tx.end_s - tx.start_s) + config.completion_slack_s;
    return tx;
}

std::vector<float> Synthesize(const Transmission& transmission, const ModemConfig& config) {
    Validate(config);
    const double rate = config.sample_rate;
    const double span = transmission.end_s - transmission.origin_s;
    std::size_t count = span > 0.0 ? static_cast<std::size_t>(std::ceil(span * rate)) : 0;
    std::vector<float> samples(count, 0.0f);
    if (transmission.schedule.empty()) {
        return samples;
    }
    const double bit_duration = config.BitDuration();
    double phase = 0.0;
    for (std::size_t i = 0; i < count; ++i) {
        double t = transmission.origin_s + static_cast<double>(i) / rate;
        if (t < transmission.start_s || t >= transmission.end_s) {
            continue;
        }
        auto index = static_cast<std::size_t>((t - transmission.start_s) / bit_duration);
        index = std::min(index, transmission.schedule.size() - 1);
        phase += 2.0 * kPi * transmission.schedule[index].frequency_hz / rate;
        if (phase > 2.0 * kPi) {
            phase -= 2.0 * kPi;
        }
        samples[i] = static_cast<float>(config.amplitude * std::sin(phase));
    }
    return samples;
}

wav::PcmAudio Render(const Transmission& transmission, const ModemConfig& config) {
    wav::PcmAudio audio;
    audio.sample_rate = static_cast<std::uint32_t>(std::lround(config.sample_rate));
    audio.samples = Synthesize(transmission, config);
    return audio;
}

Transmission Transmit(EventLoop& loop,
                      std::string_view text,
                      const ModemConfig& config,
                      std::function<void()> on_complete) {
    Transmission tx = Modulate(text, config, loop.Now());
    log::Debug("Transmitting " + std::to_string(text.size()) + " bytes: " + tx.bits);
    if (on_complete) {
        loop.PostDelayed(tx.completion_s - tx.origin_s, std::move(on_complete));
    }
    return tx;
}

// ---- analysis ----

SpectrumAnalyzer::SpectrumAnalyzer(const ModemConfig& config) : config_(config) {
    Validate(config_);
    const std::size_t n = config_.fft_size;
    const double a0 = (1.0 - kBlackmanAlpha) / 2.0;
    const double a1 = 0.5;
    const double a2 = kBlackmanAlpha / 2.0;
    blackman_.resize(n);
    for (std::size_t i = 0; i < n; ++i) {
        double x = static_cast<double>(i) / static_cast<double>(n);
        blackman_[i] = a0 - a1 * std::cos(2.0 * kPi * x) + a2 * std::cos(4.0 * kPi * x);
    }
    smoothed_.assign(n / 2, 0.0);
}

void SpectrumAnalyzer::Reset() {
    std::fill(smoothed_.begin(), smoothed_.end(), 0.0);
}

Spectrum SpectrumAnalyzer::Analyze(const std::vector<float>& window) {
    const std::size_t n = config_.fft_size;
    std::vector<std::complex<double>> buffer(n);
    std::size_t take = std::min(n, window.size());
    std::size_t src = window.size() - take;
    std::size_t dst = n - take;
    for (std::size_t i = 0; i < take; ++i) {
        buffer[dst + i] = std::complex<double>(window[src + i] * blackman_[dst + i], 0.0);
    }
    Fft(buffer);

    const double tau = config_.smoothing;
    const double scale = 255.0 / (config_.max_db - config_.min_db);
    Spectrum out(n / 2);
    for (std::size_t k = 0; k < n / 2; ++k) {
        double magnitude = std::abs(buffer[k]) / static_cast<double>(n);
        smoothed_[k] = tau * smoothed_[k] + (1.0 - tau) * magnitude;
        if (!std::isfinite(smoothed_[k])) {
            smoothed_[k] = 0.0;
        }
        double db = smoothed_[k] > 0.0 ? 20.0 * std::log10(smoothed_[k]) : -std::numeric_limits<double>::infinity();
        double level = std::floor(scale * (db - config_.min_db));
        if (!(level > 0.0)) {
            out[k] = 0;
        } else {
            out[k] = static_cast<std::uint8_t>(std::min(255.0, level));
        }
    }
    return out;
}

int BinFor(double frequency_hz, double sample_rate, std::size_t fft_size) {
    double hz_per_bin = sample_rate / static_cast<double>(fft_size);
    return static_cast<int>(std::lround(frequency_hz / hz_per_bin));
}

int BandEnergy(const Spectrum& spectrum, int center_bin, int range) {
    int energy = 0;
    for (int bin = center_bin - range; bin <= center_bin + range; ++bin) {
        if (bin < 0 || static_cast<std::size_t>(bin) >= spectrum.size()) {
            continue;
        }
        energy = std::max(energy, static_cast<int>(spectrum[static_cast<std::size_t>(bin)]));
    }
    return energy;
}

std::optional<BitDecision> DecideBit(const Spectrum& spectrum, const ModemConfig& config, double sample_rate) {
    if (spectrum.empty()) {
        return std::nullopt;
    }
    const std::size_t fft_size = spectrum.size() * 2;
    int mark = BandEnergy(spectrum, BinFor(config.mark_hz, sample_rate, fft_size), config.bin_range);
    int space = BandEnergy(spectrum, BinFor(config.space_hz, sample_rate, fft_size), config.bin_range);
    if (mark <= config.noise_gate && space <= config.noise_gate) {
        return std::nullopt;
    }
    BitDecision decision;
    decision.bit = mark > space ? 1 : 0;
    decision.energy = std::max(mark, space);
    return decision;
}

// ---- inputs ----

PcmReplayInput::PcmReplayInput(wav::PcmAudio audio, const ModemConfig& config)
    : audio_(std::move(audio)), config_(config), analyzer_(config_) {
    if (audio_.sample_rate == 0) {
        throw std::invalid_argument("Replay input needs a sample rate");
    }
}

void PcmReplayInput::Open() {
    analyzer_.Reset();
    open_ = true;
}

void PcmReplayInput::Close() {
    open_ = false;
}

Spectrum PcmReplayInput::ReadSpectrum(double elapsed_s) {
    if (!open_) {
        throw std::logic_error("Audio input is not open");
    }
    const auto n = static_cast<std::int64_t>(config_.fft_size);
    const auto end = static_cast<std::int64_t>(std::llround(std::max(0.0, elapsed_s) * SampleRate()));
    const auto size = static_cast<std::int64_t>(audio_.samples.size());
    std::vector<float> window(static_cast<std::size_t>(n), 0.0f);
    for (std::int64_t j = 0; j < n; ++j) {
        std::int64_t index = end - n + j;
        if (index >= 0 && index < size) {
            window[static_cast<std::size_t>(j)] = audio_.samples[static_cast<std::size_t>(index)];
        }
    }
    return analyzer_.Analyze(window);
}

bool PcmReplayInput::Exhausted(double elapsed_s) const {
    double position = elapsed_s * SampleRate();
    return position >= static_cast<double>(audio_.samples.size() + config_.fft_size);
}

std::unique_ptr<PcmReplayInput> LoadWavInput(const std::string& path, const ModemConfig& config) {
    return std::make_unique<PcmReplayInput>(wav::ReadFile(path), config);
}

// ---- demodulator ----

struct Demodulator::Session {
    EventLoop* loop = nullptr;
    ModemConfig config;
    AudioInput* input = nullptr;
    SpectrumCallback on_spectrum;
    BitCallback on_bit;
    EndCallback on_end;
    double started_s = 0.0;
    bool listening = false;
    std::size_t frames = 0;
};

Demodulator::Demodulator(EventLoop& loop, const ModemConfig& config) : loop_(loop), config_(config) {
    Validate(config_);
}

Demodulator::~Demodulator() {
    StopListening();
}

void Demodulator::StartListening(AudioInput& input, SpectrumCallback on_spectrum, BitCallback on_bit) {
    if (listening()) {
        return;
    }
    input.Open();
    auto session = std::make_shared<Session>();
    session->loop = &loop_;
    session->config = config_;
    session->input = &input;
    session->on_spectrum = std::move(on_spectrum);
    session->on_bit = std::move(on_bit);
    session->on_end = on_end_;
    session->started_s = loop_.Now();
    session->listening = true;
    session_ = session;
    log::Debug("Listening at " + std::to_string(input.SampleRate()) + " Hz");
    loop_.Post([session] { Tick(session); });
}

void Demodulator::StopListening() {
    if (!session_ || !session_->listening) {
        return;
    }
    session_->listening = false;
    session_->input->Close();
    log::Debug("Stopped listening after " + std::to_string(session_->frames) + " frames");
}

void Demodulator::SetEndCallback(EndCallback callback) {
    on_end_ = std::move(callback);
    if (session_) {
        session_->on_end = on_end_;
    }
}

bool Demodulator::listening() const {
    return session_ && session_->listening;
}

std::size_t Demodulator::frames() const {
    return session_ ? session_->frames : 0;
}

void Demodulator::Tick(const std::shared_ptr<Session>& session) {
    if (!session->listening) {
        return;
    }
    double elapsed = session->loop->Now() - session->started_s;
    Spectrum spectrum = session->input->ReadSpectrum(elapsed);
    ++session->frames;
    if (session->on_spectrum) {
        session->on_spectrum(spectrum);
    }
    if (auto decision = DecideBit(spectrum, session->config, session->input->SampleRate())) {
        if (session->on_bit) {
            session->on_bit(decision->bit, decision->energy);
        }
    }
    if (!session->listening) {
        return;
    }
    if (session->input->Exhausted(elapsed)) {
        session->listening = false;
        session->input->Close();
        if (session->on_end) {
            session->on_end();
        }
        return;
    }
    auto next = session;
    session->loop->PostDelayed(1.0 / session->config.frame_rate, [next] { Tick(next); });
}

// ---- alignment ----

BitAligner::BitAligner(const ModemConfig& config, double frame_period_s)
    : config_(config), frame_period_s_(frame_period_s) {
    if (!(frame_period_s_ > 0.0)) {
        throw std::invalid_argument("Frame period must be positive");
    }
}

void BitAligner::Push(int bit, double time_s) {
    bit = bit ? 1 : 0;
    if (!runs_.empty()) {
        Run& last = runs_.back();
        if (last.bit == bit && time_s - last.last_s <= 1.5 * frame_period_s_) {
            last.last_s = time_s;
            return;
        }
    }
    runs_.push_back(Run{bit, time_s, time_s});
}

void BitAligner::Reset() {
    runs_.clear();
}

std::string BitAligner::Bits() const {
    std::string bits;
    for (const auto& run : runs_) {
        double duration = run.last_s - run.first_s + frame_period_s_;
        long count = std::max(1L, std::lround(duration * config_.baud_rate));
        bits.append(static_cast<std::size_t>(count), run.bit ? '1' : '0');
    }
    return bits;
}

std::optional<std::string> BitAligner::DecodeText() const {
    std::string bits = Bits();
    std::size_t pos = bits.find(constants::kPreambleBits);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    pos += constants::kPreambleBits.size();
    std::string text;
    for (; pos + 8 <= bits.size(); pos += 8) {
        std::uint8_t byte = 0;
        for (std::size_t i = 0; i < 8; ++i) {
            byte = static_cast<std::uint8_t>((byte << 1) | (bits[pos + i] == '1' ? 1u : 0u));
        }
        text.push_back(static_cast<char>(byte));
    }
    // The zero trailer can round up to a whole NUL byte.
    while (!text.empty() && text.back() == '\0') {
        text.pop_back();
    }
    return text;
}

}  // namespace aether::acoustic
