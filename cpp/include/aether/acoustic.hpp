#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "aether/constants.hpp"
#include "aether/event_loop.hpp"
#include "aether/wav.hpp"

namespace aether::acoustic {

// Signal parameters shared by both ends. Built once and passed by reference.
struct ModemConfig {
    double mark_hz = constants::kMarkHz;
    double space_hz = constants::kSpaceHz;
    double baud_rate = constants::kBaudRate;
    double lead_in_s = constants::kLeadInSeconds;
    double completion_slack_s = constants::kCompletionSlackSeconds;
    double amplitude = constants::kToneAmplitude;
    double sample_rate = constants::kSampleRate;
    std::size_t fft_size = constants::kFftSize;
    double smoothing = constants::kSmoothing;
    double min_db = constants::kMinDecibels;
    double max_db = constants::kMaxDecibels;
    int bin_range = constants::kBinRange;
    int noise_gate = constants::kNoiseGate;
    double frame_rate = constants::kFrameRate;

    double BitDuration() const { return 1.0 / baud_rate; }
};

const ModemConfig& DefaultModemConfig();

// Throws std::invalid_argument for non-positive rates or a non power-of-two FFT size.
void Validate(const ModemConfig& config);

// UTF-8 bytes of `text`, 8 bits each, most significant bit first.
std::string TextToBits(std::string_view text);
// Preamble + payload bits + trailer.
std::string FrameBits(std::string_view text);

struct ToneSegment {
    double frequency_hz = 0.0;
    double start_s = 0.0;
};

// All times are absolute on the clock passed to Modulate.
struct Transmission {
    std::string bits;
    std::vector<ToneSegment> schedule;
    double origin_s = 0.0;
    double start_s = 0.0;
    double end_s = 0.0;
    double completion_s = 0.0;
};

Transmission Modulate(std::string_view text, const ModemConfig& config, double now = 0.0);

// Phase-continuous sine rendering from origin_s to end_s; silent during the lead-in.
std::vector<float> Synthesize(const Transmission& transmission, const ModemConfig& config);
wav::PcmAudio Render(const Transmission& transmission, const ModemConfig& config);

// Modulates at loop.Now() and posts `on_complete` once the schedule plus the
// completion slack has elapsed.
Transmission Transmit(EventLoop& loop,
                      std::string_view text,
                      const ModemConfig& config,
                      std::function<void()> on_complete);

using Spectrum = std::vector<std::uint8_t>;

// Byte frequency data the way a browser analyser node reports it: Blackman
// window, magnitude / N, exponential smoothing across calls, dB mapped to 0..255.
class SpectrumAnalyzer {
public:
    explicit SpectrumAnalyzer(const ModemConfig& config);

    // Uses the last fft_size samples of `window`, zero-padded at the front.
    Spectrum Analyze(const std::vector<float>& window);
    void Reset();

private:
    ModemConfig config_;
    std::vector<double> blackman_;
    std::vector<double> smoothed_;
};

int BinFor(double frequency_hz, double sample_rate, std::size_t fft_size);
// Maximum over center_bin +/- range, ignoring bins outside the spectrum.
int BandEnergy(const Spectrum& spectrum, int center_bin, int range);

struct BitDecision {
    int bit = 0;
    int energy = 0;
};

// Empty when both bands sit at or below the noise gate. Ties decide 0.
std::optional<BitDecision> DecideBit(const Spectrum& spectrum, const ModemConfig& config, double sample_rate);

// A live or replayed sound source that exposes analyser spectra.
class AudioInput {
public:
    virtual ~AudioInput() = default;

    virtual void Open() = 0;
    virtual void Close() = 0;
    virtual bool IsOpen() const = 0;
    virtual double SampleRate() const = 0;
    virtual Spectrum ReadSpectrum(double elapsed_s) = 0;
    virtual bool Exhausted(double elapsed_s) const {
        (void)elapsed_s;
        return false;
    }
};

// Replays a PCM buffer in real time through a SpectrumAnalyzer.
class PcmReplayInput : public AudioInput {
public:
    PcmReplayInput(wav::PcmAudio audio, const ModemConfig& config);

    void Open() override;
    void Close() override;
    bool IsOpen() const override { return open_; }
    double SampleRate() const override { return static_cast<double>(audio_.sample_rate); }
    Spectrum ReadSpectrum(double elapsed_s) override;
    bool Exhausted(double elapsed_s) const override;

private:
    wav::PcmAudio audio_;
    ModemConfig config_;
    SpectrumAnalyzer analyzer_;
    bool open_ = false;
};

std::unique_ptr<PcmReplayInput> LoadWavInput(const std::string& path, const ModemConfig& config);

// Polls the input once per analysis frame on the event loop. Emits every
// spectrum and every gated decision; no bit-boundary alignment is done here.
class Demodulator {
public:
    using SpectrumCallback = std::function<void(const Spectrum& spectrum)>;
    using BitCallback = std::function<void(int bit, int energy)>;
    using EndCallback = std::function<void()>;

    Demodulator(EventLoop& loop, const ModemConfig& config);
    ~Demodulator();

    Demodulator(const Demodulator&) = delete;
    Demodulator& operator=(const Demodulator&) = delete;

    // No-op when already listening. `input` must outlive the listening period.
    void StartListening(AudioInput& input, SpectrumCallback on_spectrum, BitCallback on_bit);
    // Closes the input before returning.
    void StopListening();
    void SetEndCallback(EndCallback callback);

    bool listening() const;
    std::size_t frames() const;

private:
    struct Session;
    static void Tick(const std::shared_ptr<Session>& session);

    EventLoop& loop_;
    ModemConfig config_;
    std::shared_ptr<Session> session_;
    EndCallback on_end_;
};

// Opt-in bit-boundary recovery for the raw decision stream: collapses runs of
// equal decisions into bits at the baud rate, then decodes whole bytes after
// the first preamble.
class BitAligner {
public:
    BitAligner(const ModemConfig& config, double frame_period_s);

    void Push(int bit, double time_s);
    void Reset();

    std::string Bits() const;
    std::optional<std::string> DecodeText() const;

private:
    struct Run {
        int bit = 0;
        double first_s = 0.0;
        double last_s = 0.0;
    };

    ModemConfig config_;
    double frame_period_s_;
    std::vector<Run> runs_;
};

}  // namespace aether::acoustic
