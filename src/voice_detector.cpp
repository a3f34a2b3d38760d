#include "voice_detector.hpp"
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <ostream>

VoiceDetector::VoiceDetector(const LoaderConfig& loader_config, const FeatureConfig& feature_config)
    : loader_config_(loader_config), extractor_(feature_config) {}

ClassificationResult VoiceDetector::detect(const std::string& path) const {
    return analyze_file(path).result;
}

DetectionReport VoiceDetector::analyze_file(const std::string& path) const {
    AudioBuffer audio = load_audio(path, loader_config_);
    DetectionReport report = analyze(audio);
    report.source = path;
    return report;
}

DetectionReport VoiceDetector::analyze(const AudioBuffer& audio) const {
    DetectionReport report;
    report.source = "<buffer>";
    report.analysed_seconds = audio.duration();

    auto start_time = std::chrono::high_resolution_clock::now();
    report.features = extractor_.extract(audio);
    auto extracted_time = std::chrono::high_resolution_clock::now();

    report.indicators = evaluate_rules(report.features);
    report.result = score_indicators(report.indicators);
    auto end_time = std::chrono::high_resolution_clock::now();

    report.extraction_time_ms =
        std::chrono::duration_cast<std::chrono::microseconds>(extracted_time - start_time).count() / 1000.0;
    report.classification_time_ms =
        std::chrono::duration_cast<std::chrono::microseconds>(end_time - extracted_time).count() / 1000.0;
    return report;
}

std::string escape_json(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char code[8];
                std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                out += code;
            } else {
                out += c;
            }
        }
    }
    return out;
}

void write_result_json(std::ostream& out, const ClassificationResult& result) {
    auto flags = out.flags();
    auto precision = out.precision();
    out << "{\n";
    out << "  \"classification\": \"" << to_string(result.label) << "\",\n";
    out << "  \"confidenceScore\": " << std::fixed << std::setprecision(2) << result.confidence << ",\n";
    out << "  \"explanation\": \"" << escape_json(result.explanation) << "\"\n";
    out << "}";
    out.flags(flags);
    out.precision(precision);
}
