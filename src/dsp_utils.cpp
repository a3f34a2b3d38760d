#include "dsp_utils.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace {
torch::TensorOptions real_options() {
    return torch::TensorOptions().dtype(torch::kFloat64);
}
} // namespace

SpectralAnalyzer::SpectralAnalyzer(int n_fft, int hop_length)
    : n_fft_(n_fft), hop_length_(hop_length), window_(torch::hann_window(n_fft, real_options())) {}

torch::Tensor SpectralAnalyzer::pad_centered(const torch::Tensor& audio) const {
    long pad_amount = n_fft_ / 2;
    auto audio_3d = audio.to(torch::kFloat64).unsqueeze(0).unsqueeze(0);
    auto padded_audio_3d = torch::nn::functional::pad(audio_3d, torch::nn::functional::PadFuncOptions({pad_amount, pad_amount}).mode(torch::kConstant));
    return padded_audio_3d.squeeze(0).squeeze(0);
}

torch::Tensor SpectralAnalyzer::analyze_spectrum(const torch::Tensor& audio) {
    auto padded_audio = pad_centered(audio);
    return torch::stft(padded_audio, n_fft_, hop_length_, n_fft_, window_, false, true, true);
}

torch::Tensor SpectralAnalyzer::get_magnitude_spectrum(const torch::Tensor& audio) {
    return torch::abs(analyze_spectrum(audio));
}

torch::Tensor SpectralAnalyzer::get_power_spectrum(const torch::Tensor& audio) {
    return get_magnitude_spectrum(audio).pow(2);
}

torch::Tensor SpectralAnalyzer::frame_signal(const torch::Tensor& audio) {
    return pad_centered(audio).unfold(0, n_fft_, hop_length_);
}

torch::Tensor SpectralAnalyzer::get_frequency_bins(int sample_rate) const {
    return torch::linspace(0, sample_rate / 2.0, n_fft_ / 2 + 1, real_options());
}

long SpectralAnalyzer::num_frames(long num_samples) const {
    return 1 + num_samples / hop_length_;
}

namespace filters {

// Slaney scale: linear below 1 kHz, logarithmic above.
namespace {
constexpr double kMelLinearStep = 200.0 / 3.0;
constexpr double kMinLogHz = 1000.0;
constexpr double kMinLogMel = kMinLogHz / kMelLinearStep;
const double kLogStep = std::log(6.4) / 27.0;
} // namespace

double hz_to_mel(double hz) {
    if (hz >= kMinLogHz) {
        return kMinLogMel + std::log(hz / kMinLogHz) / kLogStep;
    }
    return hz / kMelLinearStep;
}

double mel_to_hz(double mel) {
    if (mel >= kMinLogMel) {
        return kMinLogHz * std::exp(kLogStep * (mel - kMinLogMel));
    }
    return kMelLinearStep * mel;
}

torch::Tensor mel(int sample_rate, int n_fft, int n_mels, double fmin, double fmax) {
    auto fft_freqs = torch::linspace(0, sample_rate / 2.0, n_fft / 2 + 1, real_options());

    double min_mel = hz_to_mel(fmin);
    double max_mel = hz_to_mel(fmax);
    std::vector<double> edges(n_mels + 2);
    for (int i = 0; i < n_mels + 2; ++i) {
        double m = min_mel + (max_mel - min_mel) * i / static_cast<double>(n_mels + 1);
        edges[i] = mel_to_hz(m);
    }
    auto mel_f = torch::tensor(edges, real_options());
    auto fdiff = mel_f.slice(0, 1, n_mels + 2) - mel_f.slice(0, 0, n_mels + 1);
    auto ramps = mel_f.unsqueeze(1) - fft_freqs.unsqueeze(0);

    auto lower = -ramps.slice(0, 0, n_mels) / fdiff.slice(0, 0, n_mels).unsqueeze(1);
    auto upper = ramps.slice(0, 2, n_mels + 2) / fdiff.slice(0, 1, n_mels + 1).unsqueeze(1);
    auto weights = torch::minimum(lower, upper).clamp_min(0.0);

    auto enorm = 2.0 / (mel_f.slice(0, 2, n_mels + 2) - mel_f.slice(0, 0, n_mels));
    return weights * enorm.unsqueeze(1);
}

torch::Tensor chroma(int sample_rate, int n_fft, int n_chroma, double tuning) {
    // Bin frequencies excluding DC, expressed in chroma bins above the tuned A0/2.
    double a0_half = 27.5 * std::pow(2.0, tuning / n_chroma);
    auto frequencies = torch::arange(1, n_fft, real_options()) * (static_cast<double>(sample_rate) / n_fft);
    auto frqbins = n_chroma * torch::log2(frequencies / a0_half);
    auto first = frqbins.slice(0, 0, 1) - 1.5 * n_chroma;
    frqbins = torch::cat({first, frqbins});

    auto binwidthbins = torch::cat({
        (frqbins.slice(0, 1, n_fft) - frqbins.slice(0, 0, n_fft - 1)).clamp_min(1.0),
        torch::ones({1}, real_options())});

    auto d = frqbins.unsqueeze(0) - torch::arange(0, n_chroma, real_options()).unsqueeze(1);
    double half = std::round(n_chroma / 2.0);
    d = torch::remainder(d + half + 10.0 * n_chroma, static_cast<double>(n_chroma)) - half;

    auto wts = torch::exp(-0.5 * (2.0 * d / binwidthbins.unsqueeze(0)).pow(2));
    auto norms = wts.pow(2).sum(0, true).sqrt();
    wts = wts / torch::where(norms > 0, norms, torch::ones_like(norms));

    // Gaussian octave weighting centred on octave 5 with a two-octave half width.
    auto octave_weight = torch::exp(-0.5 * ((frqbins / n_chroma - 5.0) / 2.0).pow(2));
    wts = wts * octave_weight.unsqueeze(0);

    wts = torch::roll(wts, {-3 * (n_chroma / 12)}, {0});
    return wts.slice(1, 0, n_fft / 2 + 1).contiguous();
}

torch::Tensor dct_ortho(int n_out, int n_in) {
    auto k = torch::arange(0, n_out, real_options()).unsqueeze(1);
    auto n = torch::arange(0, n_in, real_options()).unsqueeze(0);
    auto basis = torch::cos(M_PI * k * (2.0 * n + 1.0) / (2.0 * n_in)) * std::sqrt(2.0 / n_in);
    basis[0].div_(std::sqrt(2.0));
    return basis;
}

} // namespace filters

torch::Tensor power_to_db(const torch::Tensor& power, double amin, double top_db) {
    auto log_spec = 10.0 * torch::log10(power.clamp_min(amin));
    double peak = log_spec.max().item<double>();
    return log_spec.clamp_min(peak - top_db);
}

torch::Tensor local_max(const torch::Tensor& x) {
    long n = x.size(0);
    auto padded = torch::cat({x.slice(0, 0, 1), x, x.slice(0, n - 1, n)});
    auto prev = padded.slice(0, 0, n);
    auto next = padded.slice(0, 2, n + 2);
    return (x > prev).logical_and(x >= next);
}

PeakTrack track_peaks(const torch::Tensor& spectrum, int sample_rate, int n_fft, double fmin, double fmax, double threshold) {
    long n_bins = spectrum.size(0);
    PeakTrack track;
    track.frequencies = torch::zeros_like(spectrum);
    track.magnitudes = torch::zeros_like(spectrum);
    if (n_bins < 3)
        return track;

    auto upper = spectrum.slice(0, 2, n_bins);
    auto lower = spectrum.slice(0, 0, n_bins - 2);
    auto avg = 0.5 * (upper - lower);
    auto curvature = 2.0 * spectrum.slice(0, 1, n_bins - 1) - upper - lower;
    auto tiny = curvature.abs() < std::numeric_limits<double>::min();
    auto shift = avg / (curvature + tiny.to(spectrum.scalar_type()));

    namespace F = torch::nn::functional;
    avg = F::pad(avg.t(), F::PadFuncOptions({1, 1})).t();
    shift = F::pad(shift.t(), F::PadFuncOptions({1, 1})).t();
    auto dskew = 0.5 * avg * shift;

    auto bin_freqs = torch::linspace(0, sample_rate / 2.0, n_bins, spectrum.options());
    auto freq_mask = ((bin_freqs >= fmin).logical_and(bin_freqs < fmax)).unsqueeze(1);
    auto ref = threshold * spectrum.amax(0, true);
    auto peaks = freq_mask.logical_and(local_max(spectrum * (spectrum > ref).to(spectrum.scalar_type())));

    auto bins = torch::arange(0, n_bins, spectrum.options()).unsqueeze(1);
    track.frequencies = torch::where(peaks, (bins + shift) * (static_cast<double>(sample_rate) / n_fft), track.frequencies);
    track.magnitudes = torch::where(peaks, spectrum + dskew, track.magnitudes);
    return track;
}

double pitch_tuning(const torch::Tensor& frequencies, double resolution, int bins_per_octave) {
    auto positive = frequencies.to(torch::kFloat64).flatten();
    positive = positive.masked_select(positive > 0);
    if (positive.numel() == 0)
        return 0.0;

    // Offset from the nearest A440-referenced bin, in [-0.5, 0.5).
    auto residual = torch::remainder(bins_per_octave * torch::log2(positive / 27.5), 1.0);
    residual = torch::where(residual >= 0.5, residual - 1.0, residual);

    long n_bins = static_cast<long>(std::ceil(1.0 / resolution));
    auto index = ((residual + 0.5) * static_cast<double>(n_bins)).floor().to(torch::kLong).clamp(0, n_bins - 1);
    auto counts = torch::bincount(index, {}, n_bins);
    long best = counts.argmax().item<long>();
    return -0.5 + static_cast<double>(best) / n_bins;
}

double estimate_tuning(const PeakTrack& peaks, double resolution, int bins_per_octave) {
    auto pitched = peaks.frequencies > 0;
    if (!pitched.any().item<bool>())
        return 0.0;
    double threshold = torch::quantile(peaks.magnitudes.masked_select(pitched), 0.5).item<double>();
    auto selected = peaks.frequencies.masked_select(pitched.logical_and(peaks.magnitudes >= threshold));
    return pitch_tuning(selected, resolution, bins_per_octave);
}
