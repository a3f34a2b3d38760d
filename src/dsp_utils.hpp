#ifndef DSP_UTILS_HPP
#define DSP_UTILS_HPP
#include <torch/torch.h>

// Short-time analysis over a centre-padded signal. Frames are n_fft long and
// start every hop_length samples; the signal is zero-padded by n_fft/2 on both
// sides so frame t is centred on sample t * hop_length.
class SpectralAnalyzer {
public:
    SpectralAnalyzer(int n_fft, int hop_length);

    // Complex STFT, shape [n_fft/2 + 1, frames].
    torch::Tensor analyze_spectrum(const torch::Tensor& audio);
    torch::Tensor get_magnitude_spectrum(const torch::Tensor& audio);
    torch::Tensor get_power_spectrum(const torch::Tensor& audio);

    // Unwindowed time-domain frames, shape [frames, n_fft].
    torch::Tensor frame_signal(const torch::Tensor& audio);

    torch::Tensor get_frequency_bins(int sample_rate) const;
    long num_frames(long num_samples) const;

    int n_fft() const { return n_fft_; }
    int hop_length() const { return hop_length_; }

private:
    torch::Tensor pad_centered(const torch::Tensor& audio) const;

    int n_fft_;
    int hop_length_;
    torch::Tensor window_;
};

// Filterbanks and transforms applied to a [bins, frames] spectrogram.
namespace filters {

// Slaney-style mel filterbank with area normalisation, [n_mels, n_fft/2 + 1].
torch::Tensor mel(int sample_rate, int n_fft, int n_mels, double fmin, double fmax);

// Gaussian pitch-class filterbank centred on C, [n_chroma, n_fft/2 + 1].
// tuning shifts the reference from A440 by a fraction of a chroma bin.
torch::Tensor chroma(int sample_rate, int n_fft, int n_chroma, double tuning = 0.0);

// Orthonormal DCT-II basis restricted to the first n_out rows, [n_out, n_in].
torch::Tensor dct_ortho(int n_out, int n_in);

double hz_to_mel(double hz);
double mel_to_hz(double mel);

} // namespace filters

// Decibel conversion referenced to 1.0 and floored top_db below the maximum.
torch::Tensor power_to_db(const torch::Tensor& power, double amin = 1e-10, double top_db = 80.0);

// Interpolated spectral peaks, both [bins, frames] and zero away from a peak.
struct PeakTrack {
    torch::Tensor frequencies;
    torch::Tensor magnitudes;
};

/**
 * @brief Picks local maxima in [fmin, fmax) that exceed threshold times the
 *        frame maximum and refines each by parabolic interpolation.
 */
PeakTrack track_peaks(const torch::Tensor& spectrum, int sample_rate, int n_fft, double fmin, double fmax, double threshold);

// Most common deviation of the frequencies from the A440 grid, in fractions of
// a bin, quantised to resolution. 0 when no frequency is positive.
double pitch_tuning(const torch::Tensor& frequencies, double resolution = 0.01, int bins_per_octave = 12);

// pitch_tuning over the peaks at or above the median peak magnitude.
double estimate_tuning(const PeakTrack& peaks, double resolution = 0.01, int bins_per_octave = 12);

// Boolean mask of local maxima along dim 0 (strictly greater than the
// previous bin, not less than the next one; edges compare against themselves).
torch::Tensor local_max(const torch::Tensor& x);

#endif
