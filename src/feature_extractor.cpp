#include "feature_extractor.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <vector>

namespace {

template <std::size_t N>
std::array<double, N> to_array(const torch::Tensor& values) {
    std::array<double, N> out{};
    auto flat = values.to(torch::kFloat64).contiguous();
    const double* data = flat.data_ptr<double>();
    std::copy(data, data + std::min<std::size_t>(N, flat.numel()), out.begin());
    return out;
}

torch::Tensor row_mean(const torch::Tensor& rows) {
    return rows.mean(1);
}

torch::Tensor row_std(const torch::Tensor& rows) {
    auto centred = rows - rows.mean(1, true);
    return centred.pow(2).mean(1).sqrt();
}

torch::Tensor safe_divisor(const torch::Tensor& values) {
    return torch::where(values > 0, values, torch::ones_like(values));
}

} // namespace

double AudioBuffer::duration() const {
    if (!samples.defined() || sample_rate <= 0)
        return 0.0;
    return static_cast<double>(samples.numel()) / sample_rate;
}

SeriesStats summarize(const torch::Tensor& values) {
    SeriesStats stats;
    if (!values.defined() || values.numel() == 0)
        return stats;
    auto flat = values.to(torch::kFloat64).flatten();
    auto mean = flat.mean();
    stats.mean = mean.item<double>();
    stats.std = (flat - mean).pow(2).mean().sqrt().item<double>();
    stats.max = flat.max().item<double>();
    stats.min = flat.min().item<double>();
    return stats;
}

FeatureExtractor::FeatureExtractor(const FeatureConfig& config) : config_(config) {
    if (config_.n_fft <= 0 || config_.hop_length <= 0)
        throw std::invalid_argument("n_fft and hop_length must be positive");
    if (config_.n_mels < static_cast<int>(kMfccCount))
        throw std::invalid_argument("n_mels must be at least the number of MFCC coefficients");
    if (config_.delta_width < 3 || config_.delta_width % 2 == 0)
        throw std::invalid_argument("delta_width must be an odd integer >= 3");
    if (!(config_.rolloff_percent > 0.0 && config_.rolloff_percent < 1.0))
        throw std::invalid_argument("rolloff_percent must be in (0, 1)");
    if (!(config_.contrast_quantile > 0.0 && config_.contrast_quantile < 1.0))
        throw std::invalid_argument("contrast_quantile must be in (0, 1)");
    if (config_.contrast_fmin <= 0.0 || config_.contrast_bands < 1)
        throw std::invalid_argument("contrast_fmin and contrast_bands must be positive");
}

torch::Tensor FeatureExtractor::validate_samples(const torch::Tensor& samples, int sample_rate) const {
    if (sample_rate <= 0)
        throw InvalidAudioError("sample rate must be positive, got " + std::to_string(sample_rate));
    if (!samples.defined() || samples.numel() == 0)
        throw InvalidAudioError("audio buffer is empty");

    auto audio = samples.to(torch::kFloat64).flatten().contiguous();
    auto finite = torch::isfinite(audio);
    if (!finite.any().item<bool>())
        throw InvalidAudioError("audio buffer contains no finite samples");
    if (!finite.all().item<bool>()) {
        long bad = audio.numel() - finite.sum().item<long>();
        std::cerr << "Warning: replacing " << bad << " non-finite samples with silence" << std::endl;
        audio = torch::where(finite, audio, torch::zeros_like(audio));
    }
    if (audio.abs().max().item<double>() == 0.0)
        throw InvalidAudioError("audio buffer is silent");
    return audio;
}

FeatureVector FeatureExtractor::extract(const AudioBuffer& audio) const {
    return extract(audio.samples, audio.sample_rate);
}

FeatureVector FeatureExtractor::extract(const torch::Tensor& samples, int sample_rate) const {
    torch::NoGradGuard no_grad;
    auto audio = validate_samples(samples, sample_rate);

    FeatureVector features;
    features.duration = static_cast<double>(audio.numel()) / sample_rate;
    features.sample_rate = sample_rate;

    SpectralAnalyzer analyzer(config_.n_fft, config_.hop_length);
    auto frames = analyzer.frame_signal(audio);
    auto magnitude = analyzer.get_magnitude_spectrum(audio);
    auto power = magnitude.pow(2);
    auto freqs = analyzer.get_frequency_bins(sample_rate);

    compute_time_domain(frames, features);
    compute_spectral_shape(magnitude, freqs, features);
    compute_spectral_contrast(magnitude, freqs, sample_rate, features);
    compute_mfcc(power, sample_rate, features);
    compute_chroma(power, sample_rate, features);
    compute_pitch(magnitude, sample_rate, features);

    return features;
}

void FeatureExtractor::compute_time_domain(const torch::Tensor& frames, FeatureVector& features) const {
    // Samples within 1e-10 of zero count as positive.
    auto negative = frames < -1e-10;
    long width = frames.size(1);
    auto crossings = negative.slice(1, 1, width).ne(negative.slice(1, 0, width - 1));
    auto zcr = crossings.to(torch::kFloat64).sum(1) / static_cast<double>(width);

    SeriesStats zcr_stats = summarize(zcr);
    features.zcr_mean = zcr_stats.mean;
    features.zcr_std = zcr_stats.std;
    features.zcr_max = zcr_stats.max;
    features.zcr_min = zcr_stats.min;

    auto rms = frames.pow(2).mean(1).sqrt();
    SeriesStats energy = summarize(rms);
    features.energy_mean = energy.mean;
    features.energy_std = energy.std;
    features.energy_max = energy.max;
    features.energy_min = energy.min;
    features.energy_cv = energy.mean > 0 ? energy.std / energy.mean : 0.0;
}

void FeatureExtractor::compute_spectral_shape(const torch::Tensor& magnitude, const torch::Tensor& freqs, FeatureVector& features) const {
    auto bin_freqs = freqs.unsqueeze(1);
    auto total = magnitude.sum(0);
    auto weights = magnitude / safe_divisor(total).unsqueeze(0);

    auto centroid = (bin_freqs * weights).sum(0);
    SeriesStats centroid_stats = summarize(centroid);
    features.spectral_centroid_mean = centroid_stats.mean;
    features.spectral_centroid_std = centroid_stats.std;
    features.spectral_centroid_max = centroid_stats.max;
    features.spectral_centroid_min = centroid_stats.min;

    auto bandwidth = (weights * (bin_freqs - centroid.unsqueeze(0)).pow(2)).sum(0).sqrt();
    SeriesStats bandwidth_stats = summarize(bandwidth);
    features.spectral_bandwidth_mean = bandwidth_stats.mean;
    features.spectral_bandwidth_std = bandwidth_stats.std;

    // Lowest bin whose cumulative magnitude reaches the rolloff fraction.
    auto cumulative = magnitude.cumsum(0);
    auto threshold = config_.rolloff_percent * cumulative.select(0, cumulative.size(0) - 1);
    auto reached = (cumulative >= threshold.unsqueeze(0)).to(torch::kLong);
    auto rolloff = freqs.index_select(0, reached.argmax(0));
    SeriesStats rolloff_stats = summarize(rolloff);
    features.spectral_rolloff_mean = rolloff_stats.mean;
    features.spectral_rolloff_std = rolloff_stats.std;
}

int FeatureExtractor::contrast_band_count(int sample_rate) const {
    double nyquist = sample_rate / 2.0;
    int bands = config_.contrast_bands;
    // Only a band whose lower edge reaches Nyquist is unusable; the top band
    // is extended to Nyquist anyway.
    while (bands > 1 && config_.contrast_fmin * std::pow(2.0, bands - 1) >= nyquist)
        --bands;
    return bands;
}

void FeatureExtractor::compute_spectral_contrast(const torch::Tensor& magnitude, const torch::Tensor& freqs, int sample_rate, FeatureVector& features) const {
    int n_bands = contrast_band_count(sample_rate);
    long n_bins = magnitude.size(0);

    auto freq_data = freqs.contiguous();
    const double* f = freq_data.data_ptr<double>();

    std::vector<double> edges(n_bands + 2, 0.0);
    for (int k = 1; k < n_bands + 2; ++k)
        edges[k] = config_.contrast_fmin * std::pow(2.0, k - 1);

    std::vector<torch::Tensor> peaks;
    std::vector<torch::Tensor> valleys;
    for (int k = 0; k <= n_bands; ++k) {
        long lo = 0;
        while (lo < n_bins && f[lo] < edges[k])
            ++lo;
        long hi = lo;
        while (hi + 1 < n_bins && f[hi + 1] <= edges[k + 1])
            ++hi;
        lo = std::min(lo, n_bins - 1);
        hi = std::max(hi, lo);

        // Each band borrows the bin just below it; the top band runs to Nyquist.
        if (k > 0 && lo > 0)
            --lo;
        if (k == n_bands)
            hi = n_bins - 1;

        long band_bins = hi - lo + 1;
        long sub_hi = (k < n_bands && hi > lo) ? hi - 1 : hi;
        auto sub_band = magnitude.slice(0, lo, sub_hi + 1);
        auto sorted = std::get<0>(sub_band.sort(0));

        long rows = sorted.size(0);
        long idx = static_cast<long>(std::nearbyint(config_.contrast_quantile * band_bins));
        idx = std::min(std::max(idx, 1L), rows);

        valleys.push_back(sorted.slice(0, 0, idx).mean(0));
        peaks.push_back(sorted.slice(0, rows - idx, rows).mean(0));
    }

    auto contrast = power_to_db(torch::stack(peaks)) - power_to_db(torch::stack(valleys));
    SeriesStats stats = summarize(contrast);
    features.spectral_contrast_mean = stats.mean;
    features.spectral_contrast_std = stats.std;
}

void FeatureExtractor::compute_mfcc(const torch::Tensor& power, int sample_rate, FeatureVector& features) const {
    auto mel_basis = filters::mel(sample_rate, config_.n_fft, config_.n_mels, 0.0, sample_rate / 2.0);
    auto log_mel = power_to_db(mel_basis.matmul(power));
    auto mfcc = filters::dct_ortho(static_cast<int>(kMfccCount), config_.n_mels).matmul(log_mel);

    features.mfcc_mean = to_array<kMfccCount>(row_mean(mfcc));
    features.mfcc_std = to_array<kMfccCount>(row_std(mfcc));
    features.mfcc_max = to_array<kMfccCount>(mfcc.amax(1));
    features.mfcc_min = to_array<kMfccCount>(mfcc.amin(1));

    SeriesStats delta = summarize(mfcc_delta(mfcc));
    features.mfcc_delta_mean = delta.mean;
    features.mfcc_delta_std = delta.std;
}

// First-order regression slope over delta_width frames. With enough frames the
// edges reuse the slope of the first and last full window; shorter sequences
// extend their edge frames instead.
torch::Tensor FeatureExtractor::mfcc_delta(const torch::Tensor& mfcc) const {
    long frames = mfcc.size(1);
    long half = config_.delta_width / 2;

    auto padded = torch::cat({
        mfcc.slice(1, 0, 1).expand({-1, half}),
        mfcc,
        mfcc.slice(1, frames - 1, frames).expand({-1, half})}, 1);

    double denom = 0.0;
    auto delta = torch::zeros_like(mfcc);
    for (long k = -half; k <= half; ++k) {
        if (k == 0)
            continue;
        delta += static_cast<double>(k) * padded.slice(1, half + k, half + k + frames);
        denom += static_cast<double>(k * k);
    }
    delta /= denom;

    if (frames >= config_.delta_width) {
        delta.slice(1, 0, half).copy_(delta.slice(1, half, half + 1).expand({-1, half}));
        delta.slice(1, frames - half, frames).copy_(delta.slice(1, frames - half - 1, frames - half).expand({-1, half}));
    }
    return delta;
}

// Chroma over the power spectrogram, with the reference pitch shifted by the
// tuning estimated from the power spectrogram's own peaks.
void FeatureExtractor::compute_chroma(const torch::Tensor& power, int sample_rate, FeatureVector& features) const {
    double fmax = std::min(config_.pitch_fmax, sample_rate / 2.0);
    PeakTrack peaks = track_peaks(power, sample_rate, config_.n_fft, config_.pitch_fmin, fmax, config_.pitch_threshold);
    double tuning = estimate_tuning(peaks, 0.01, static_cast<int>(kChromaCount));

    auto chroma_basis = filters::chroma(sample_rate, config_.n_fft, static_cast<int>(kChromaCount), tuning);
    auto raw = chroma_basis.matmul(power);
    auto chroma = raw / safe_divisor(raw.amax(0, true));

    features.chroma_mean = to_array<kChromaCount>(row_mean(chroma));
    features.chroma_std = to_array<kChromaCount>(row_std(chroma));
}

// The frame's pitch is the spectral peak in [pitch_fmin, pitch_fmax) with the
// largest interpolated magnitude. Frames without a positive estimate are unvoiced.
void FeatureExtractor::compute_pitch(const torch::Tensor& magnitude, int sample_rate, FeatureVector& features) const {
    if (magnitude.size(0) < 3)
        return;

    double fmax = std::min(config_.pitch_fmax, sample_rate / 2.0);
    PeakTrack peaks = track_peaks(magnitude, sample_rate, config_.n_fft, config_.pitch_fmin, fmax, config_.pitch_threshold);

    auto strongest = peaks.magnitudes.argmax(0, true);
    auto frame_pitch = peaks.frequencies.gather(0, strongest).squeeze(0);
    auto voiced = frame_pitch.masked_select(frame_pitch > 0);
    if (voiced.numel() == 0)
        return;

    SeriesStats pitch = summarize(voiced);
    features.pitch_mean = pitch.mean;
    features.pitch_std = pitch.std;
    features.pitch_max = pitch.max;
    features.pitch_min = pitch.min;
    features.pitch_range = pitch.max - pitch.min;
    features.pitch_cv = pitch.mean > 0 ? pitch.std / pitch.mean : 0.0;
}

FeatureVector extract_features(const torch::Tensor& samples, int sample_rate) {
    return FeatureExtractor().extract(samples, sample_rate);
}
