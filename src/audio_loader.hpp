#ifndef AUDIO_LOADER_HPP
#define AUDIO_LOADER_HPP
#include "feature_extractor.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

class AudioLoadError : public std::runtime_error {
public:
    explicit AudioLoadError(const std::string& what) : std::runtime_error(what) {}
};

struct LoaderConfig {
    int target_sample_rate = 16000;    // analysis rate; inputs are resampled to it
    double analysis_seconds = 10.0;    // analysed prefix of each recording
    double max_duration_seconds = 60.0; // hard ceiling on analysis_seconds
    std::uintmax_t max_file_bytes = 10ull * 1024 * 1024;

    double effective_duration() const;
};

/**
 * @brief Applies VOICEGUARD_* environment overrides to a loader configuration.
 *
 * Unparseable or out-of-range values are reported on stderr and ignored.
 */
LoaderConfig loader_config_from_env(LoaderConfig base = LoaderConfig());

/**
 * @brief Decodes an audio file into mono samples at the target rate, truncated
 *        to the configured analysis duration.
 *
 * @throws AudioLoadError if the file is missing, too large, unreadable or empty.
 */
AudioBuffer load_audio(const std::string& path, const LoaderConfig& config = LoaderConfig());

/**
 * @brief Band-limited resampling of a 1-D signal with libswresample.
 *
 * Content above the target Nyquist is filtered out. The result has
 * round(n * target_rate / source_rate) samples.
 *
 * @throws AudioLoadError if either rate is not positive or the resampler fails.
 */
torch::Tensor resample_audio(const torch::Tensor& audio, int source_rate, int target_rate);

#endif
