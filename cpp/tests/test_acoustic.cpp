#include "aether/acoustic.hpp"
#include "aether/event_loop.hpp"
#include "aether/wav.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace {

using aether::EventLoop;
using aether::acoustic::ModemConfig;
using aether::acoustic::Spectrum;
namespace wav = aether::wav;

constexpr double kFramePeriod = 1.0 / 60.0;

const ModemConfig& Config() {
    return aether::acoustic::DefaultModemConfig();
}

int MarkBin() {
    return aether::acoustic::BinFor(Config().mark_hz, Config().sample_rate, Config().fft_size);
}

int SpaceBin() {
    return aether::acoustic::BinFor(Config().space_hz, Config().sample_rate, Config().fft_size);
}

Spectrum MakeSpectrum(int mark_level, int space_level) {
    Spectrum spectrum(Config().fft_size / 2, 10);
    spectrum[static_cast<std::size_t>(MarkBin() + 1)] = static_cast<std::uint8_t>(mark_level);
    spectrum[static_cast<std::size_t>(SpaceBin() - 2)] = static_cast<std::uint8_t>(space_level);
    return spectrum;
}

// Plays back a fixed list of spectra, one per poll.
class ScriptedInput : public aether::acoustic::AudioInput {
public:
    explicit ScriptedInput(std::vector<Spectrum> script) : script_(std::move(script)) {}

    void Open() override {
        open_ = true;
        ++opens_;
    }
    void Close() override { open_ = false; }
    bool IsOpen() const override { return open_; }
    double SampleRate() const override { return Config().sample_rate; }
    Spectrum ReadSpectrum(double elapsed_s) override {
        elapsed_.push_back(elapsed_s);
        std::size_t index = std::min(reads_, script_.size() - 1);
        ++reads_;
        return script_[index];
    }
    bool Exhausted(double) const override { return reads_ >= script_.size(); }

    std::size_t reads() const { return reads_; }
    int opens() const { return opens_; }
    const std::vector<double>& elapsed() const { return elapsed_; }

private:
    std::vector<Spectrum> script_;
    std::vector<double> elapsed_;
    std::size_t reads_ = 0;
    int opens_ = 0;
    bool open_ = false;
};

TEST(Modem, FramesTextBetweenPreambleAndTrailer) {
    EXPECT_EQ(aether::acoustic::TextToBits("A"), "01000001");
    EXPECT_EQ(aether::acoustic::FrameBits("A"), "10101010" "01000001" "0000");
    EXPECT_EQ(aether::acoustic::FrameBits(""), "101010100000");
    // Non-ASCII text travels as its UTF-8 bytes.
    EXPECT_EQ(aether::acoustic::TextToBits("\xC3\xA9"), "1100001110101001");
}

TEST(Modem, ScheduleStartsAfterLeadIn) {
    auto tx = aether::acoustic::Modulate("A", Config(), 10.0);
    ASSERT_EQ(tx.schedule.size(), 20u);
    EXPECT_DOUBLE_EQ(tx.origin_s, 10.0);
    EXPECT_NEAR(tx.start_s, 10.1, 1e-9);
    EXPECT_NEAR(tx.schedule[0].start_s, 10.1, 1e-9);
    EXPECT_DOUBLE_EQ(tx.schedule[0].frequency_hz, 2000.0);
    EXPECT_NEAR(tx.schedule[1].start_s, 10.15, 1e-9);
    EXPECT_DOUBLE_EQ(tx.schedule[1].frequency_hz, 1200.0);
    EXPECT_DOUBLE_EQ(tx.schedule[19].frequency_hz, 1200.0);
    EXPECT_NEAR(tx.end_s, 11.1, 1e-9);
    EXPECT_NEAR(tx.completion_s, 11.5, 1e-9);
}

TEST(Modem, SynthesisIsSilentDuringLeadIn) {
    auto tx = aether::acoustic::Modulate("hi", Config());
    std::vector<float> samples = aether::acoustic::Synthesize(tx, Config());
    auto expected = static_cast<std::size_t>(std::ceil(tx.end_s * Config().sample_rate));
    EXPECT_EQ(samples.size(), expected);
    std::size_t lead_in = static_cast<std::size_t>(Config().lead_in_s * Config().sample_rate) - 1;
    for (std::size_t i = 0; i < lead_in; ++i) {
        ASSERT_EQ(samples[i], 0.0f) << "sample " << i;
    }
    float peak = 0.0f;
    for (float sample : samples) {
        peak = std::max(peak, std::fabs(sample));
    }
    EXPECT_GT(peak, 0.45f);
    EXPECT_LE(peak, 0.5f);
}

TEST(Modem, RejectsInvalidConfig) {
    ModemConfig config;
    config.fft_size = 1000;
    EXPECT_THROW(aether::acoustic::Validate(config), std::invalid_argument);
    config = ModemConfig{};
    config.space_hz = config.mark_hz;
    EXPECT_THROW(aether::acoustic::Validate(config), std::invalid_argument);
    config = ModemConfig{};
    config.baud_rate = 0.0;
    EXPECT_THROW(aether::acoustic::Modulate("x", config), std::invalid_argument);
}

TEST(Modem, TransmitSignalsCompletionAfterSlack) {
    double now = 10.0;
    EventLoop loop([&now] { return now; });
    int completions = 0;
    auto tx = aether::acoustic::Transmit(loop, "A", Config(), [&completions] { ++completions; });
    EXPECT_EQ(tx.bits.size(), 20u);
    loop.RunReady();
    now = 11.49;
    loop.RunReady();
    EXPECT_EQ(completions, 0);
    now = 11.51;
    loop.RunReady();
    EXPECT_EQ(completions, 1);
    EXPECT_EQ(loop.Pending(), 0u);
}

TEST(BitDecision, StrongerBandWins) {
    auto decision = aether::acoustic::DecideBit(MakeSpectrum(200, 80), Config(), Config().sample_rate);
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->bit, 1);
    EXPECT_EQ(decision->energy, 200);

    decision = aether::acoustic::DecideBit(MakeSpectrum(60, 180), Config(), Config().sample_rate);
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->bit, 0);
    EXPECT_EQ(decision->energy, 180);
}

TEST(BitDecision, BothBandsAtGateAreSilence) {
    EXPECT_FALSE(aether::acoustic::DecideBit(MakeSpectrum(50, 50), Config(), Config().sample_rate).has_value());
    EXPECT_FALSE(aether::acoustic::DecideBit(MakeSpectrum(12, 49), Config(), Config().sample_rate).has_value());
    EXPECT_FALSE(aether::acoustic::DecideBit(Spectrum{}, Config(), Config().sample_rate).has_value());
}

TEST(BitDecision, TieDecidesZero) {
    auto decision = aether::acoustic::DecideBit(MakeSpectrum(120, 120), Config(), Config().sample_rate);
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->bit, 0);
}

TEST(BitDecision, BandEnergyIgnoresBinsOutsideSpectrum) {
    Spectrum spectrum{7, 9, 3};
    EXPECT_EQ(aether::acoustic::BandEnergy(spectrum, 0, 2), 9);
    EXPECT_EQ(aether::acoustic::BandEnergy(spectrum, 4, 2), 3);
    EXPECT_EQ(aether::acoustic::BandEnergy(spectrum, 40, 2), 0);
}

TEST(SpectrumAnalyzer, PureMarkToneDecidesOne) {
    const ModemConfig& config = Config();
    std::vector<float> window(config.fft_size);
    for (std::size_t i = 0; i < window.size(); ++i) {
        window[i] = static_cast<float>(
            0.5 * std::sin(2.0 * 3.14159265358979323846 * config.mark_hz * static_cast<double>(i) / config.sample_rate));
    }
    aether::acoustic::SpectrumAnalyzer analyzer(config);
    Spectrum spectrum = analyzer.Analyze(window);
    ASSERT_EQ(spectrum.size(), config.fft_size / 2);
    auto decision = aether::acoustic::DecideBit(spectrum, config, config.sample_rate);
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->bit, 1);
    EXPECT_GT(decision->energy, config.noise_gate);
}

TEST(SpectrumAnalyzer, SilenceStaysBelowGate) {
    aether::acoustic::SpectrumAnalyzer analyzer(Config());
    Spectrum spectrum = analyzer.Analyze(std::vector<float>(100, 0.0f));
    EXPECT_TRUE(std::all_of(spectrum.begin(), spectrum.end(), [](std::uint8_t v) { return v == 0; }));
    EXPECT_FALSE(aether::acoustic::DecideBit(spectrum, Config(), Config().sample_rate).has_value());
}

TEST(Demodulator, PollsOncePerFrameAndEndsWithInput) {
    double now = 0.0;
    EventLoop loop([&now] { return now; });
    ScriptedInput input({MakeSpectrum(200, 20), MakeSpectrum(20, 200), MakeSpectrum(20, 20), MakeSpectrum(150, 90)});
    aether::acoustic::Demodulator demodulator(loop, Config());

    std::vector<int> bits;
    std::size_t spectra = 0;
    int ends = 0;
    demodulator.SetEndCallback([&ends] { ++ends; });
    demodulator.StartListening(
        input, [&spectra](const Spectrum&) { ++spectra; }, [&bits](int bit, int) { bits.push_back(bit); });
    EXPECT_TRUE(demodulator.listening());
    EXPECT_TRUE(input.IsOpen());

    // A second start while listening is ignored.
    demodulator.StartListening(input, nullptr, nullptr);
    EXPECT_EQ(input.opens(), 1);

    for (int frame = 0; frame < 10; ++frame) {
        loop.RunReady();
        now += kFramePeriod;
    }

    EXPECT_EQ(spectra, 4u);
    EXPECT_EQ(bits, (std::vector<int>{1, 0, 1}));
    EXPECT_EQ(demodulator.frames(), 4u);
    EXPECT_EQ(ends, 1);
    EXPECT_FALSE(demodulator.listening());
    EXPECT_FALSE(input.IsOpen());
    ASSERT_EQ(input.elapsed().size(), 4u);
    EXPECT_NEAR(input.elapsed()[3], 3 * kFramePeriod, 1e-9);
    EXPECT_EQ(loop.Pending(), 0u);
}

TEST(Demodulator, StopListeningClosesInputAndHaltsPolling) {
    double now = 0.0;
    EventLoop loop([&now] { return now; });
    ScriptedInput input(std::vector<Spectrum>(100, MakeSpectrum(200, 20)));
    aether::acoustic::Demodulator demodulator(loop, Config());
    int ends = 0;
    demodulator.SetEndCallback([&ends] { ++ends; });
    demodulator.StartListening(input, nullptr, nullptr);
    loop.RunReady();
    now += kFramePeriod;
    loop.RunReady();
    EXPECT_EQ(input.reads(), 2u);

    demodulator.StopListening();
    EXPECT_FALSE(input.IsOpen());
    EXPECT_FALSE(demodulator.listening());

    now += kFramePeriod;
    loop.RunReady();
    EXPECT_EQ(input.reads(), 2u);
    EXPECT_EQ(ends, 0);
    demodulator.StopListening();
}

TEST(Demodulator, ReplayRequiresOpenInput) {
    wav::PcmAudio audio;
    audio.samples.assign(4410, 0.0f);
    aether::acoustic::PcmReplayInput input(audio, Config());
    EXPECT_THROW(input.ReadSpectrum(0.0), std::logic_error);
    input.Open();
    EXPECT_EQ(input.ReadSpectrum(0.05).size(), Config().fft_size / 2);
    EXPECT_FALSE(input.Exhausted(0.1));
    EXPECT_TRUE(input.Exhausted(1.0));
}

TEST(BitAligner, RecoversTextFromPerFrameDecisions) {
    const std::string bits = aether::acoustic::FrameBits("A");
    aether::acoustic::BitAligner aligner(Config(), kFramePeriod);
    // 60 frames per second against 20 baud: three decisions per bit.
    for (std::size_t frame = 0; frame < bits.size() * 3; ++frame) {
        aligner.Push(bits[frame / 3] == '1' ? 1 : 0, static_cast<double>(frame) * kFramePeriod);
    }
    EXPECT_EQ(aligner.Bits(), bits);
    auto text = aligner.DecodeText();
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "A");

    aligner.Reset();
    EXPECT_EQ(aligner.Bits(), "");
    EXPECT_FALSE(aligner.DecodeText().has_value());
}

TEST(BitAligner, NeedsPreamble) {
    aether::acoustic::BitAligner aligner(Config(), kFramePeriod);
    for (int frame = 0; frame < 60; ++frame) {
        aligner.Push(1, frame * kFramePeriod);
    }
    EXPECT_FALSE(aligner.DecodeText().has_value());
    EXPECT_THROW(aether::acoustic::BitAligner(Config(), 0.0), std::invalid_argument);
}

TEST(BitAligner, DecodesRenderedWaveform) {
    for (const std::string text : {"A", "Hi", "hello"}) {
        auto tx = aether::acoustic::Modulate(text, Config());
        std::vector<std::uint8_t> bytes = wav::Encode(aether::acoustic::Render(tx, Config()));

        // Every stage gets its own short-lived config copy.
        aether::acoustic::PcmReplayInput input(wav::Decode(bytes), ModemConfig{});
        double now = 0.0;
        EventLoop loop([&now] { return now; });
        aether::acoustic::Demodulator demodulator(loop, ModemConfig{});
        aether::acoustic::BitAligner aligner(ModemConfig{}, kFramePeriod);
        demodulator.StartListening(input, nullptr, [&](int bit, int) { aligner.Push(bit, now); });
        for (int frame = 0; frame < 6000 && demodulator.listening(); ++frame) {
            loop.RunReady();
            now += kFramePeriod;
        }
        EXPECT_FALSE(demodulator.listening()) << text;
        auto decoded = aligner.DecodeText();
        ASSERT_TRUE(decoded.has_value()) << text;
        EXPECT_EQ(*decoded, text);
    }
}

TEST(Wav, EncodesSixteenBitMono) {
    wav::PcmAudio audio;
    audio.sample_rate = 8000;
    audio.samples = {0.0f, 0.5f, -0.5f, 1.0f, -1.0f, 2.0f};
    std::vector<std::uint8_t> bytes = wav::Encode(audio);
    ASSERT_EQ(bytes.size(), 44u + 12u);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "RIFF");
    EXPECT_EQ(std::string(bytes.begin() + 8, bytes.begin() + 12), "WAVE");

    wav::PcmAudio decoded = wav::Decode(bytes);
    EXPECT_EQ(decoded.sample_rate, 8000u);
    ASSERT_EQ(decoded.samples.size(), 6u);
    EXPECT_NEAR(decoded.samples[1], 0.5f, 1e-4);
    EXPECT_NEAR(decoded.samples[2], -0.5f, 1e-4);
    // Out-of-range samples are clamped.
    EXPECT_NEAR(decoded.samples[5], 1.0f, 1e-4);
}

TEST(Wav, RejectsNonWaveInput) {
    EXPECT_THROW(wav::Decode(std::vector<std::uint8_t>(64, 0)), std::runtime_error);
    wav::PcmAudio audio;
    audio.samples = {0.1f, 0.2f};
    std::vector<std::uint8_t> bytes = wav::Encode(audio);
    bytes.resize(bytes.size() - 3);
    EXPECT_THROW(wav::Decode(bytes), std::runtime_error);
}

}  // namespace
