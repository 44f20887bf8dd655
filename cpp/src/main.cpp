#include "aether/aether.hpp"
#include "aether/cli_colors.hpp"
#include "aether/file_stream.hpp"
#include "aether/log.hpp"
#include "aether/wav.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  aether link <file> [-p <password>] [--lossy] [--quality <0-1>] [--xz] [--vibe <key>] [--expire-min <n>] [--geo <lat,lng[,radius]>] [--base-url <url>]\n";
    std::cout << "  aether open <link|@file|-> [-p <password>] [--out <path>]\n";
    std::cout << "  aether inspect <link|@file|->\n";
    std::cout << "  aether beam-link <file> --peer <id> [--base-url <url>]\n";
    std::cout << "  aether beam-send <file> --out <frames> [-p <password>] [--chunk-size <n>]\n";
    std::cout << "  aether beam-recv <frames> [-p <password>] [--out <path>]\n";
    std::cout << "  aether audio-tx <text> --out <file.wav>\n";
    std::cout << "  aether audio-rx <file.wav>\n";
    std::cout << "Global flags: --no-color\n";
}

struct CliArgs {
    std::string input;
    std::optional<std::string> password;
    std::string output;
    std::string peer;
    std::string base_url;
    bool lossy = false;
    double quality = aether::constants::kDefaultImageQuality;
    bool xz = false;
    std::optional<std::string> vibe;
    int expire_min = 0;
    std::optional<aether::header::GeoFence> geo;
    std::size_t chunk_size = 0;
};

const char* RequireValue(int argc, char** argv, int idx, const char* what) {
    if (idx + 1 >= argc) {
        throw std::invalid_argument(std::string("Missing ") + what + " value");
    }
    return argv[idx + 1];
}

aether::header::GeoFence ParseGeo(const std::string& text) {
    std::vector<double> values;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t comma = text.find(',', start);
        std::string part = text.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        std::size_t used = 0;
        double value = std::stod(part, &used);
        if (used != part.size()) {
            throw std::invalid_argument("Invalid --geo value: " + text);
        }
        values.push_back(value);
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    if (values.size() < 2 || values.size() > 3) {
        throw std::invalid_argument("--geo expects lat,lng[,radius]");
    }
    aether::header::GeoFence fence;
    fence.lat = values[0];
    fence.lng = values[1];
    if (values.size() == 3) {
        fence.radius_m = values[2];
    }
    return fence;
}

CliArgs ParseArgs(int argc, char** argv, int start_index) {
    CliArgs opts;
    if (start_index >= argc) {
        throw std::invalid_argument("Missing input");
    }
    opts.input = argv[start_index];
    int idx = start_index + 1;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (flag == "-p" || flag == "--password") {
            opts.password = aether::ResolvePassword(RequireValue(argc, argv, idx, "password"));
            idx += 2;
        } else if (flag == "--out") {
            opts.output = RequireValue(argc, argv, idx, "output");
            idx += 2;
        } else if (flag == "--peer") {
            opts.peer = RequireValue(argc, argv, idx, "peer");
            idx += 2;
        } else if (flag == "--base-url") {
            opts.base_url = RequireValue(argc, argv, idx, "base url");
            idx += 2;
        } else if (flag == "--lossy") {
            opts.lossy = true;
            idx += 1;
        } else if (flag == "--quality") {
            opts.quality = std::stod(RequireValue(argc, argv, idx, "quality"));
            idx += 2;
        } else if (flag == "--xz") {
            opts.xz = true;
            idx += 1;
        } else if (flag == "--vibe") {
            opts.vibe = RequireValue(argc, argv, idx, "vibe");
            idx += 2;
        } else if (flag == "--expire-min") {
            opts.expire_min = std::stoi(RequireValue(argc, argv, idx, "expiry"));
            idx += 2;
        } else if (flag == "--geo") {
            opts.geo = ParseGeo(RequireValue(argc, argv, idx, "geo"));
            idx += 2;
        } else if (flag == "--chunk-size") {
            opts.chunk_size = static_cast<std::size_t>(std::stoul(RequireValue(argc, argv, idx, "chunk size")));
            idx += 2;
        } else if (flag == "--no-color") {
            idx += 1;
        } else {
            throw std::invalid_argument("Unknown flag: " + flag);
        }
    }
    return opts;
}

// Never lets a received filename escape the working directory.
std::filesystem::path OutputPath(const CliArgs& opts, const std::string& received_name) {
    if (!opts.output.empty()) {
        return opts.output;
    }
    std::filesystem::path name = std::filesystem::path(received_name).filename();
    if (name.empty() || name == "." || name == "..") {
        name = "aether.out";
    }
    return name;
}

void PrintProgress(int percent, std::uint64_t done, std::uint64_t total) {
    std::cerr << "\r" << aether::cli::Dim(std::to_string(percent) + "% ") << done << "/" << total << " bytes";
    if (done >= total) {
        std::cerr << "\n";
    }
}

int RunLink(const CliArgs& opts) {
    aether::link::InputFile file = aether::link::LoadInputFile(opts.input);
    aether::link::LinkOptions link_opts;
    link_opts.password = opts.password;
    link_opts.lossy_images = opts.lossy;
    link_opts.quality = opts.quality;
    if (opts.xz) {
        if (!aether::compress::XzAvailable()) {
            throw std::invalid_argument("This build has no xz support");
        }
        link_opts.codec = aether::compress::Codec::Xz;
    }
    link_opts.vibe = opts.vibe;
    if (opts.expire_min > 0) {
        link_opts.expiry_ms = aether::link::ExpiryFromNow(opts.expire_min);
    }
    link_opts.geo = opts.geo;
    std::string locator = aether::link::BuildInlineLink(file, link_opts);
    std::cout << (opts.base_url.empty() ? locator : aether::link::ShareUrl(opts.base_url, locator)) << "\n";
    return 0;
}

int RunOpen(const CliArgs& opts) {
    aether::link::DecodedLink decoded = aether::link::ParseLink(aether::ResolveLocatorArgument(opts.input));
    if (decoded.beam) {
        std::cerr << "Beam link: connect to peer " << decoded.beam->peer << " to receive "
                  << decoded.header.filename << "\n";
        return 1;
    }
    if (decoded.locked) {
        if (!opts.password) {
            throw std::invalid_argument("This link is encrypted; pass -p <password>");
        }
        aether::link::Unlock(decoded, *opts.password);
    }
    std::filesystem::path out = OutputPath(opts, decoded.header.filename);
    aether::filestream::WriteFileBytes(out, decoded.payload);
    std::cout << aether::cli::Green(out.string()) << " (" << decoded.payload.size() << " bytes)\n";
    return 0;
}

int RunInspect(const CliArgs& opts) {
    aether::InspectResult info = aether::InspectLink(aether::ResolveLocatorArgument(opts.input));
    const auto& header = info.header;
    std::cout << "kind: " << info.kind << "\n";
    std::cout << "filename: " << header.filename << "\n";
    if (header.mime) {
        std::cout << "mime: " << *header.mime << "\n";
    }
    std::cout << "encrypted: " << (header.encrypted ? "yes" : "no") << "\n";
    if (header.vibe) {
        const aether::vibes::Vibe* vibe = aether::vibes::DefaultVibes().Find(*header.vibe);
        std::cout << "vibe: " << *header.vibe << (vibe ? " (" + vibe->name + ")" : std::string(" (unknown)")) << "\n";
    }
    if (header.expiry_ms) {
        std::cout << "expiry_ms: " << *header.expiry_ms << "\n";
    }
    if (header.geo) {
        std::cout << "geo: " << header.geo->lat << "," << header.geo->lng << " r=" << header.geo->radius_m << "m\n";
    }
    if (header.size) {
        std::cout << "size: " << *header.size << " bytes\n";
    }
    if (info.peer) {
        std::cout << "peer: " << *info.peer << "\n";
    } else {
        std::cout << (info.locked ? "sealed_len: " : "payload_len: ") << info.payload_len << " bytes\n";
    }
    return 0;
}

int RunBeamLink(const CliArgs& opts) {
    if (opts.peer.empty()) {
        throw std::invalid_argument("beam-link requires --peer <id>");
    }
    std::filesystem::path path(opts.input);
    std::uint64_t size = std::filesystem::file_size(path);
    std::string locator = aether::link::BuildBeamLink(opts.peer, path.filename().string(), size);
    std::cout << (opts.base_url.empty() ? locator : aether::link::ShareUrl(opts.base_url, locator)) << "\n";
    return 0;
}

int RunBeamSend(const CliArgs& opts) {
    if (opts.output.empty()) {
        throw std::invalid_argument("beam-send requires --out <frames>");
    }
    // Plain transfers stream from disk; sealed ones are encrypted whole first.
    std::unique_ptr<aether::filestream::ByteSource> source;
    aether::transport::MetaFrame meta;
    if (opts.password) {
        aether::link::BeamPayload beam =
            aether::link::PrepareBeam(aether::link::LoadInputFile(opts.input), opts.password);
        meta = std::move(beam.meta);
        source = std::make_unique<aether::filestream::MemorySource>(std::move(beam.data));
    } else {
        std::filesystem::path path(opts.input);
        meta.filename = path.filename().string();
        meta.mime = aether::link::GuessMime(meta.filename);
        source = std::make_unique<aether::filestream::FileSource>(path);
    }

    std::ofstream out(opts.output, std::ios::binary);
    if (!out) {
        throw std::runtime_error("Failed to open output file: " + opts.output);
    }
    aether::EventLoop loop;
    aether::transport::StreamChannel channel(out);
    aether::transport::SendOptions send_opts = aether::transport::DefaultSendOptions();
    if (opts.chunk_size > 0) {
        send_opts.chunk_size = opts.chunk_size;
    }
    bool ok = false;
    auto sender = aether::transport::SendStream(loop, std::move(source), channel, std::move(meta), send_opts,
                                                &PrintProgress, [&ok](bool done) { ok = done; });
    loop.Run();
    channel.Close();
    if (!ok) {
        throw std::runtime_error("Beam send failed after " + std::to_string(sender->bytes_sent()) + " bytes");
    }
    std::cout << aether::cli::Green(opts.output) << " (" << sender->chunks_sent() << " chunks)\n";
    return 0;
}

int RunBeamRecv(const CliArgs& opts) {
    std::ifstream in(opts.input, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open frame stream: " + opts.input);
    }
    aether::transport::TransferSession session;
    session.SetProgressCallback(&PrintProgress);
    aether::transport::ReadFrames(in, session);
    aether::transport::MetaFrame meta = session.meta();
    aether::link::Bytes payload = aether::link::OpenBeamPayload(meta, session.TakePayload(), opts.password);
    std::filesystem::path out = OutputPath(opts, meta.filename);
    aether::filestream::WriteFileBytes(out, payload);
    std::cout << aether::cli::Green(out.string()) << " (" << payload.size() << " bytes)\n";
    return 0;
}

int RunAudioTx(const CliArgs& opts) {
    if (opts.output.empty()) {
        throw std::invalid_argument("audio-tx requires --out <file.wav>");
    }
    const aether::acoustic::ModemConfig& config = aether::acoustic::DefaultModemConfig();
    aether::acoustic::Transmission tx = aether::acoustic::Modulate(opts.input, config);
    aether::wav::WriteFile(opts.output, aether::acoustic::Render(tx, config));
    std::cout << aether::cli::Cyan(tx.bits) << "\n";
    std::cout << aether::cli::Green(opts.output) << " (" << (tx.end_s - tx.origin_s) << " s)\n";
    return 0;
}

int RunAudioRx(const CliArgs& opts) {
    const aether::acoustic::ModemConfig& config = aether::acoustic::DefaultModemConfig();
    auto input = aether::acoustic::LoadWavInput(opts.input, config);

    // Replay on a simulated clock: one analysis frame per step.
    double now = 0.0;
    aether::EventLoop loop([&now] { return now; });
    const double frame_period = 1.0 / config.frame_rate;
    aether::acoustic::BitAligner aligner(config, frame_period);
    aether::acoustic::Demodulator demod(loop, config);
    std::string raw;
    demod.StartListening(*input, nullptr, [&](int bit, int) {
        raw.push_back(bit ? '1' : '0');
        aligner.Push(bit, now);
    });
    while (demod.listening()) {
        loop.RunReady();
        now += frame_period;
    }
    std::cout << "frames: " << demod.frames() << "\n";
    std::cout << "raw: " << aether::cli::Dim(raw) << "\n";
    std::cout << "bits: " << aether::cli::Cyan(aligner.Bits()) << "\n";
    std::optional<std::string> text = aligner.DecodeText();
    if (!text) {
        std::cerr << aether::cli::BoldRed("No preamble found") << "\n";
        return 1;
    }
    std::cout << "text: " << aether::cli::BoldGreen(*text) << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--no-color") == 0) {
            aether::cli::SetColorsEnabled(false);
        }
    }
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    try {
        if (command == "-h" || command == "--help" || command == "help") {
            PrintUsage();
            return 0;
        }
        if (command == "link") {
            return RunLink(ParseArgs(argc, argv, 2));
        }
        if (command == "open") {
            return RunOpen(ParseArgs(argc, argv, 2));
        }
        if (command == "inspect") {
            return RunInspect(ParseArgs(argc, argv, 2));
        }
        if (command == "beam-link") {
            return RunBeamLink(ParseArgs(argc, argv, 2));
        }
        if (command == "beam-send") {
            return RunBeamSend(ParseArgs(argc, argv, 2));
        }
        if (command == "beam-recv") {
            return RunBeamRecv(ParseArgs(argc, argv, 2));
        }
        if (command == "audio-tx") {
            return RunAudioTx(ParseArgs(argc, argv, 2));
        }
        if (command == "audio-rx") {
            return RunAudioRx(ParseArgs(argc, argv, 2));
        }
        PrintUsage();
        return 2;
    } catch (const std::invalid_argument& exc) {
        std::cerr << aether::cli::BoldRed("Error: ") << exc.what() << "\n";
        return 2;
    } catch (const aether::Error& exc) {
        aether::log::Debug(exc.what());
        std::cerr << aether::cli::BoldRed("Error: ")
                  << aether::link::UserMessage(aether::link::Classify(exc)) << "\n";
        return 1;
    } catch (const std::exception& exc) {
        std::cerr << aether::cli::BoldRed("Error: ") << exc.what() << "\n";
        return 1;
    }
}
