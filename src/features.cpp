#include "features.hpp"
#include <iomanip>
#include <numeric>
#include <string>

double FeatureVector::mfcc_std_mean() const {
    return std::accumulate(mfcc_std.begin(), mfcc_std.end(), 0.0) / static_cast<double>(mfcc_std.size());
}

bool operator==(const FeatureVector& a, const FeatureVector& b) {
    return a.duration == b.duration && a.sample_rate == b.sample_rate &&
           a.zcr_mean == b.zcr_mean && a.zcr_std == b.zcr_std &&
           a.zcr_max == b.zcr_max && a.zcr_min == b.zcr_min &&
           a.spectral_centroid_mean == b.spectral_centroid_mean &&
           a.spectral_centroid_std == b.spectral_centroid_std &&
           a.spectral_centroid_max == b.spectral_centroid_max &&
           a.spectral_centroid_min == b.spectral_centroid_min &&
           a.spectral_bandwidth_mean == b.spectral_bandwidth_mean &&
           a.spectral_bandwidth_std == b.spectral_bandwidth_std &&
           a.spectral_contrast_mean == b.spectral_contrast_mean &&
           a.spectral_contrast_std == b.spectral_contrast_std &&
           a.mfcc_mean == b.mfcc_mean && a.mfcc_std == b.mfcc_std &&
           a.mfcc_max == b.mfcc_max && a.mfcc_min == b.mfcc_min &&
           a.mfcc_delta_mean == b.mfcc_delta_mean && a.mfcc_delta_std == b.mfcc_delta_std &&
           a.chroma_mean == b.chroma_mean && a.chroma_std == b.chroma_std &&
           a.pitch_mean == b.pitch_mean && a.pitch_std == b.pitch_std &&
           a.pitch_range == b.pitch_range && a.pitch_max == b.pitch_max &&
           a.pitch_min == b.pitch_min && a.pitch_cv == b.pitch_cv &&
           a.energy_mean == b.energy_mean && a.energy_std == b.energy_std &&
           a.energy_max == b.energy_max && a.energy_min == b.energy_min &&
           a.energy_cv == b.energy_cv &&
           a.spectral_rolloff_mean == b.spectral_rolloff_mean &&
           a.spectral_rolloff_std == b.spectral_rolloff_std;
}

namespace {

class JsonObjectWriter {
public:
    JsonObjectWriter(std::ostream& out, int indent) : out_(out), pad_(indent, ' ') {
        out_ << "{\n";
    }

    void field(const char* key, double value) {
        begin(key);
        out_ << value;
    }

    template <std::size_t N>
    void field(const char* key, const std::array<double, N>& values) {
        begin(key);
        out_ << "[";
        for (std::size_t i = 0; i < N; ++i) {
            if (i > 0)
                out_ << ", ";
            out_ << values[i];
        }
        out_ << "]";
    }

    void close() {
        out_ << "\n" << std::string(pad_.size() >= 2 ? pad_.size() - 2 : 0, ' ') << "}";
    }

private:
    void begin(const char* key) {
        if (!first_)
            out_ << ",\n";
        out_ << pad_ << "\"" << key << "\": ";
        first_ = false;
    }

    std::ostream& out_;
    std::string pad_;
    bool first_ = true;
};

} // namespace

void write_features_json(std::ostream& out, const FeatureVector& f, int indent) {
    auto flags = out.flags();
    auto precision = out.precision();
    out << std::setprecision(10);

    JsonObjectWriter json(out, indent);
    json.field("duration", f.duration);
    json.field("sample_rate", f.sample_rate);
    json.field("zcr_mean", f.zcr_mean);
    json.field("zcr_std", f.zcr_std);
    json.field("zcr_max", f.zcr_max);
    json.field("zcr_min", f.zcr_min);
    json.field("spectral_centroid_mean", f.spectral_centroid_mean);
    json.field("spectral_centroid_std", f.spectral_centroid_std);
    json.field("spectral_centroid_max", f.spectral_centroid_max);
    json.field("spectral_centroid_min", f.spectral_centroid_min);
    json.field("spectral_bandwidth_mean", f.spectral_bandwidth_mean);
    json.field("spectral_bandwidth_std", f.spectral_bandwidth_std);
    json.field("spectral_contrast_mean", f.spectral_contrast_mean);
    json.field("spectral_contrast_std", f.spectral_contrast_std);
    json.field("mfcc_mean", f.mfcc_mean);
    json.field("mfcc_std", f.mfcc_std);
    json.field("mfcc_max", f.mfcc_max);
    json.field("mfcc_min", f.mfcc_min);
    json.field("mfcc_delta_mean", f.mfcc_delta_mean);
    json.field("mfcc_delta_std", f.mfcc_delta_std);
    json.field("chroma_mean", f.chroma_mean);
    json.field("chroma_std", f.chroma_std);
    json.field("pitch_mean", f.pitch_mean);
    json.field("pitch_std", f.pitch_std);
    json.field("pitch_range", f.pitch_range);
    json.field("pitch_max", f.pitch_max);
    json.field("pitch_min", f.pitch_min);
    json.field("pitch_cv", f.pitch_cv);
    json.field("energy_mean", f.energy_mean);
    json.field("energy_std", f.energy_std);
    json.field("energy_max", f.energy_max);
    json.field("energy_min", f.energy_min);
    json.field("energy_cv", f.energy_cv);
    json.field("spectral_rolloff_mean", f.spectral_rolloff_mean);
    json.field("spectral_rolloff_std", f.spectral_rolloff_std);
    json.close();

    out.flags(flags);
    out.precision(precision);
}
