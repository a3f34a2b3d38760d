#ifndef VOICE_DETECTOR_HPP
#define VOICE_DETECTOR_HPP
#include "audio_loader.hpp"
#include "feature_extractor.hpp"
#include "heuristic_classifier.hpp"
#include <ostream>
#include <string>
#include <vector>

// Everything produced while analysing one recording.
struct DetectionReport {
    std::string source;
    double analysed_seconds = 0.0;
    FeatureVector features;
    std::vector<Indicator> indicators;
    ClassificationResult result;
    double extraction_time_ms = 0.0;
    double classification_time_ms = 0.0;
};

// Load -> extract -> classify. Holds configuration only, so one instance can
// serve concurrent callers.
class VoiceDetector {
public:
    VoiceDetector() = default;
    VoiceDetector(const LoaderConfig& loader_config, const FeatureConfig& feature_config);

    ClassificationResult detect(const std::string& path) const;
    DetectionReport analyze_file(const std::string& path) const;
    DetectionReport analyze(const AudioBuffer& audio) const;

    const LoaderConfig& loader_config() const { return loader_config_; }
    const FeatureExtractor& extractor() const { return extractor_; }

private:
    LoaderConfig loader_config_;
    FeatureExtractor extractor_;
};

/**
 * @brief Writes {"classification", "confidenceScore", "explanation"}.
 */
void write_result_json(std::ostream& out, const ClassificationResult& result);

std::string escape_json(const std::string& text);

#endif
