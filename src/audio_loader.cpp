#include "audio_loader.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sndfile.h>
#include <vector>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

double LoaderConfig::effective_duration() const {
    return std::min(analysis_seconds, max_duration_seconds);
}

namespace {

bool read_env_number(const char* name, double& out) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw)
        return false;
    try {
        std::size_t consumed = 0;
        double value = std::stod(raw, &consumed);
        if (consumed != std::string(raw).size() || !std::isfinite(value) || value <= 0) {
            std::cerr << "Warning: ignoring " << name << "='" << raw << "' (expected a positive number)" << std::endl;
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        std::cerr << "Warning: ignoring " << name << "='" << raw << "' (expected a positive number)" << std::endl;
        return false;
    }
}

} // namespace

LoaderConfig loader_config_from_env(LoaderConfig base) {
    double value = 0.0;
    if (read_env_number("VOICEGUARD_MAX_DURATION_SECONDS", value))
        base.max_duration_seconds = value;
    if (read_env_number("VOICEGUARD_TARGET_SAMPLE_RATE", value))
        base.target_sample_rate = static_cast<int>(std::lround(value));
    if (read_env_number("VOICEGUARD_MAX_FILE_MB", value))
        base.max_file_bytes = static_cast<std::uintmax_t>(value * 1024.0 * 1024.0);
    return base;
}

torch::Tensor resample_audio(const torch::Tensor& audio, int source_rate, int target_rate) {
    if (source_rate <= 0 || target_rate <= 0)
        throw AudioLoadError("sample rates must be positive");
    if (source_rate == target_rate || audio.numel() == 0)
        return audio;

    auto input = audio.to(torch::kFloat64).reshape({-1}).contiguous();
    long input_length = input.numel();
    long target_length = std::max(1L, std::lround(input_length * static_cast<double>(target_rate) / source_rate));

    AVChannelLayout mono;
    av_channel_layout_default(&mono, 1);

    SwrContext* swr_ctx = nullptr;
    if (swr_alloc_set_opts2(&swr_ctx, &mono, AV_SAMPLE_FMT_DBL, target_rate,
                            &mono, AV_SAMPLE_FMT_DBL, source_rate, 0, nullptr) < 0) {
        av_channel_layout_uninit(&mono);
        throw AudioLoadError("Failed to allocate resampler");
    }
    av_channel_layout_uninit(&mono);

    struct SwrContextGuard {
        SwrContext*& ctx;
        ~SwrContextGuard() { if (ctx) swr_free(&ctx); }
    } swr_guard{swr_ctx};

    if (swr_init(swr_ctx) < 0)
        throw AudioLoadError("Failed to initialize resampler");

    // Room for the converted input plus whatever the filter still holds.
    int capacity = static_cast<int>(av_rescale_rnd(swr_get_delay(swr_ctx, source_rate) + input_length,
                                                   target_rate, source_rate, AV_ROUND_UP)) + 256;
    std::vector<double> output(static_cast<std::size_t>(capacity));

    const uint8_t* in_ptr = reinterpret_cast<const uint8_t*>(input.data_ptr<double>());
    uint8_t* out_ptr = reinterpret_cast<uint8_t*>(output.data());
    int converted = swr_convert(swr_ctx, &out_ptr, capacity, &in_ptr, static_cast<int>(input_length));
    if (converted < 0)
        throw AudioLoadError("Resampling failed");

    // Drain the filter delay.
    uint8_t* tail_ptr = reinterpret_cast<uint8_t*>(output.data() + converted);
    int flushed = swr_convert(swr_ctx, &tail_ptr, capacity - converted, nullptr, 0);
    if (flushed < 0)
        throw AudioLoadError("Resampling failed");

    // Pin the length to the rate ratio so it does not depend on filter latency.
    output.resize(static_cast<std::size_t>(converted + flushed));
    output.resize(static_cast<std::size_t>(target_length), 0.0);
    return torch::tensor(output, torch::TensorOptions().dtype(torch::kFloat64));
}

AudioBuffer load_audio(const std::string& path, const LoaderConfig& config) {
    if (config.target_sample_rate <= 0)
        throw AudioLoadError("target sample rate must be positive");

    std::error_code ec;
    auto file_bytes = std::filesystem::file_size(path, ec);
    if (ec)
        throw AudioLoadError("Could not open input file: " + path);
    if (file_bytes > config.max_file_bytes)
        throw AudioLoadError("Input file exceeds the " + std::to_string(config.max_file_bytes) + " byte limit: " + path);

    SF_INFO sfinfo{};
    SNDFILE* infile = sf_open(path.c_str(), SFM_READ, &sfinfo);
    if (!infile)
        throw AudioLoadError("Could not open input file: " + path + " (" + sf_strerror(nullptr) + ")");
    if (sfinfo.frames <= 0 || sfinfo.channels <= 0 || sfinfo.samplerate <= 0) {
        sf_close(infile);
        throw AudioLoadError("Input file has no audio frames: " + path);
    }

    // Never decode more than the analysis window needs.
    sf_count_t frames_to_read = sfinfo.frames;
    double window_seconds = config.effective_duration();
    if (window_seconds > 0) {
        auto window_frames = static_cast<sf_count_t>(std::ceil(window_seconds * sfinfo.samplerate));
        frames_to_read = std::min(frames_to_read, std::max<sf_count_t>(1, window_frames));
    }

    std::vector<float> buffer(static_cast<std::size_t>(frames_to_read) * sfinfo.channels);
    sf_count_t read = sf_readf_float(infile, buffer.data(), frames_to_read);
    sf_close(infile);
    if (read <= 0)
        throw AudioLoadError("Could not read audio data from: " + path);

    torch::Tensor tensor = torch::from_blob(buffer.data(), {static_cast<long>(read), sfinfo.channels}, torch::kFloat32)
                               .to(torch::kFloat64);

    // If the audio has multiple channels (e.g., stereo), convert to mono by averaging them.
    if (tensor.size(1) > 1) {
        tensor = tensor.mean(1);
    }
    tensor = tensor.reshape({-1});

    AudioBuffer audio;
    audio.samples = resample_audio(tensor, sfinfo.samplerate, config.target_sample_rate);
    audio.sample_rate = config.target_sample_rate;

    long max_len = static_cast<long>(config.effective_duration() * audio.sample_rate);
    if (max_len > 0 && audio.samples.numel() > max_len) {
        audio.samples = audio.samples.slice(0, 0, max_len);
    }
    audio.samples = audio.samples.contiguous();

    std::cout << "Loaded audio file: " << path << " (" << read << " frames, " << sfinfo.channels << " ch, "
              << sfinfo.samplerate << " Hz -> " << audio.sample_rate << " Hz, "
              << audio.duration() << " s analysed)" << std::endl;

    return audio;
}
