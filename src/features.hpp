#ifndef FEATURES_HPP
#define FEATURES_HPP
#include <array>
#include <cstddef>
#include <ostream>

constexpr std::size_t kMfccCount = 13;
constexpr std::size_t kChromaCount = 12;

using MfccVector = std::array<double, kMfccCount>;
using ChromaVector = std::array<double, kChromaCount>;

// Summary statistics of one recording. Every field is always populated;
// statistics that are undefined for the input (e.g. no voiced frames) are 0.
// Standard deviations are population deviations.
struct FeatureVector {
    double duration = 0.0;
    double sample_rate = 0.0;

    double zcr_mean = 0.0;
    double zcr_std = 0.0;
    double zcr_max = 0.0;
    double zcr_min = 0.0;

    double spectral_centroid_mean = 0.0;
    double spectral_centroid_std = 0.0;
    double spectral_centroid_max = 0.0;
    double spectral_centroid_min = 0.0;

    double spectral_bandwidth_mean = 0.0;
    double spectral_bandwidth_std = 0.0;

    double spectral_contrast_mean = 0.0;
    double spectral_contrast_std = 0.0;

    MfccVector mfcc_mean{};
    MfccVector mfcc_std{};
    MfccVector mfcc_max{};
    MfccVector mfcc_min{};
    double mfcc_delta_mean = 0.0;
    double mfcc_delta_std = 0.0;

    ChromaVector chroma_mean{};
    ChromaVector chroma_std{};

    double pitch_mean = 0.0;
    double pitch_std = 0.0;
    double pitch_range = 0.0;
    double pitch_max = 0.0;
    double pitch_min = 0.0;
    double pitch_cv = 0.0;

    double energy_mean = 0.0;
    double energy_std = 0.0;
    double energy_max = 0.0;
    double energy_min = 0.0;
    double energy_cv = 0.0;

    double spectral_rolloff_mean = 0.0;
    double spectral_rolloff_std = 0.0;

    // Mean of the per-coefficient MFCC deviations.
    double mfcc_std_mean() const;
};

bool operator==(const FeatureVector& a, const FeatureVector& b);
inline bool operator!=(const FeatureVector& a, const FeatureVector& b) { return !(a == b); }

/**
 * @brief Writes every feature as a JSON object, keys in declaration order.
 */
void write_features_json(std::ostream& out, const FeatureVector& features, int indent = 2);

#endif
