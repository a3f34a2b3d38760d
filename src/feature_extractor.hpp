#ifndef FEATURE_EXTRACTOR_HPP
#define FEATURE_EXTRACTOR_HPP
#include "dsp_utils.hpp"
#include "features.hpp"
#include <stdexcept>
#include <string>
#include <torch/torch.h>

// Raised when a sample buffer cannot be analysed: empty, non-positive rate,
// no finite samples, or digital silence.
class InvalidAudioError : public std::runtime_error {
public:
    explicit InvalidAudioError(const std::string& what) : std::runtime_error(what) {}
};

// Mono samples in [-1, 1] at a known rate.
struct AudioBuffer {
    torch::Tensor samples;
    int sample_rate = 0;

    double duration() const;
};

// Short-time analysis parameters. Changing any of these changes every
// derived statistic.
struct FeatureConfig {
    int n_fft = 2048;
    int hop_length = 512;
    int n_mels = 40;
    double rolloff_percent = 0.85;
    int delta_width = 9;

    double pitch_fmin = 150.0;
    double pitch_fmax = 4000.0;
    double pitch_threshold = 0.1;

    double contrast_fmin = 200.0;
    int contrast_bands = 6;
    double contrast_quantile = 0.02;
};

struct SeriesStats {
    double mean = 0.0;
    double std = 0.0;
    double max = 0.0;
    double min = 0.0;
};

// Population statistics over every element of a tensor; zeros when empty.
SeriesStats summarize(const torch::Tensor& values);

class FeatureExtractor {
public:
    explicit FeatureExtractor(const FeatureConfig& config = FeatureConfig());

    /**
     * @brief Computes the full feature vector for one recording.
     *
     * Non-finite samples are replaced with zero. Deterministic for identical input.
     *
     * @throws InvalidAudioError if the buffer is empty, silent, has no finite
     *         samples, or sample_rate is not positive.
     */
    FeatureVector extract(const torch::Tensor& samples, int sample_rate) const;
    FeatureVector extract(const AudioBuffer& audio) const;

    const FeatureConfig& config() const { return config_; }

    // Number of spectral-contrast bands usable below Nyquist at this rate.
    int contrast_band_count(int sample_rate) const;

private:
    torch::Tensor validate_samples(const torch::Tensor& samples, int sample_rate) const;

    void compute_time_domain(const torch::Tensor& frames, FeatureVector& features) const;
    void compute_spectral_shape(const torch::Tensor& magnitude, const torch::Tensor& freqs, FeatureVector& features) const;
    void compute_spectral_contrast(const torch::Tensor& magnitude, const torch::Tensor& freqs, int sample_rate, FeatureVector& features) const;
    void compute_mfcc(const torch::Tensor& power, int sample_rate, FeatureVector& features) const;
    void compute_chroma(const torch::Tensor& power, int sample_rate, FeatureVector& features) const;
    void compute_pitch(const torch::Tensor& magnitude, int sample_rate, FeatureVector& features) const;

    torch::Tensor mfcc_delta(const torch::Tensor& mfcc) const;

    FeatureConfig config_;
};

// Convenience wrapper using the default configuration.
FeatureVector extract_features(const torch::Tensor& samples, int sample_rate);

#endif
