#include "heuristic_classifier.hpp"
#include <algorithm>
#include <cmath>

namespace {

constexpr double kPriorAi = 0.4;
constexpr double kPriorHuman = 0.6;
constexpr double kAiBias = 0.08;
constexpr double kBoostPerIndicator = 0.03;
constexpr double kMaxBoost = 0.2;
constexpr int kStrongEvidenceCount = 3;
constexpr double kStrongCeiling = 0.95;
constexpr double kWeakCeiling = 0.90;
constexpr double kMinConfidence = 0.55;
constexpr double kMaxConfidence = 0.95;
constexpr std::size_t kMaxReasons = 3;

const char* const kAiPrefix = "AI-generated voice detected: ";
const char* const kAiFallback = "AI-generated voice patterns detected through spectral and pitch analysis";
const char* const kHumanExplanation =
    "Natural human speech patterns detected with expected variations in pitch, energy, and spectral characteristics";

std::vector<DetectionRule> build_rules() {
    return {
        {"pitch_consistency",
         [](const FeatureVector& f) { return f.pitch_std < 25 || (f.pitch_cv > 0 && f.pitch_cv < 0.08); },
         0.20, "unusually consistent pitch",
         [](const FeatureVector& f) { return f.pitch_std > 30 && f.pitch_range > 150; },
         0.15},
        {"mfcc_variation",
         [](const FeatureVector& f) { return f.mfcc_std_mean() < 6.5; },
         0.18, "atypical MFCC patterns",
         [](const FeatureVector& f) { return f.mfcc_std_mean() > 7; },
         0.12},
        {"mfcc_transitions",
         [](const FeatureVector& f) { return f.mfcc_delta_std < 4.0; },
         0.12, "unnatural spectral transitions",
         nullptr, 0.0},
        {"spectral_centroid_variation",
         [](const FeatureVector& f) { return f.spectral_centroid_std < 600; },
         0.10, "limited spectral variation",
         [](const FeatureVector& f) { return f.spectral_centroid_std > 800; },
         0.10},
        {"spectral_bandwidth_variation",
         [](const FeatureVector& f) { return f.spectral_bandwidth_std < 450; },
         0.08, "",
         nullptr, 0.0},
        {"energy_consistency",
         [](const FeatureVector& f) { return f.energy_std < 0.012 || (f.energy_cv > 0 && f.energy_cv < 0.18); },
         0.12, "unnatural energy consistency",
         [](const FeatureVector& f) { return f.energy_std > 0.015; },
         0.10},
        {"zero_crossing_variation",
         [](const FeatureVector& f) { return f.zcr_std < 0.012; },
         0.08, "unnatural zero crossing patterns",
         [](const FeatureVector& f) { return f.zcr_std > 0.015; },
         0.08},
        {"spectral_rolloff_variation",
         [](const FeatureVector& f) { return f.spectral_rolloff_std < 600; },
         0.08, "",
         nullptr, 0.0},
    };
}

double round_to_hundredths(double value) {
    return std::round(value * 100.0) / 100.0;
}

double side_confidence(double base, double boost, int side_count) {
    if (side_count >= kStrongEvidenceCount)
        return std::min(kStrongCeiling, base + boost);
    return std::min(kWeakCeiling, base + boost / 2.0);
}

std::string ai_explanation(const std::vector<Indicator>& indicators) {
    std::string joined;
    std::size_t used = 0;
    for (const auto& indicator : indicators) {
        if (indicator.side != EvidenceSide::Ai || indicator.reason.empty())
            continue;
        if (used == kMaxReasons)
            break;
        if (used > 0)
            joined += ", ";
        joined += indicator.reason;
        ++used;
    }
    if (used == 0)
        return kAiFallback;
    return kAiPrefix + joined;
}

} // namespace

const char* to_string(VoiceLabel label) {
    return label == VoiceLabel::AiGenerated ? "AI_GENERATED" : "HUMAN";
}

const std::vector<DetectionRule>& detection_rules() {
    static const std::vector<DetectionRule> rules = build_rules();
    return rules;
}

std::vector<Indicator> evaluate_rules(const FeatureVector& features) {
    return evaluate_rules(features, detection_rules());
}

std::vector<Indicator> evaluate_rules(const FeatureVector& features, const std::vector<DetectionRule>& rules) {
    std::vector<Indicator> fired;
    for (const auto& rule : rules) {
        if (rule.ai_test && rule.ai_test(features)) {
            fired.push_back({rule.name, rule.ai_weight, EvidenceSide::Ai, rule.ai_reason ? rule.ai_reason : ""});
        } else if (rule.human_test && rule.human_test(features)) {
            fired.push_back({rule.name, rule.human_weight, EvidenceSide::Human, ""});
        }
    }
    return fired;
}

ClassificationResult score_indicators(const std::vector<Indicator>& indicators) {
    double ai_weight = 0.0;
    double human_weight = 0.0;
    int ai_count = 0;
    int human_count = 0;
    for (const auto& indicator : indicators) {
        if (indicator.side == EvidenceSide::Ai) {
            ai_weight += indicator.weight;
            ++ai_count;
        } else {
            human_weight += indicator.weight;
            ++human_count;
        }
    }

    double total = ai_weight + human_weight;
    double ai_prob = kPriorAi;
    double human_prob = kPriorHuman;
    if (total > 0) {
        ai_prob = ai_weight / total;
        human_prob = human_weight / total;
    }

    int indicator_count = static_cast<int>(indicators.size());
    double boost = std::min(kMaxBoost, indicator_count * kBoostPerIndicator);

    if (ai_weight > 0 && total > 0) {
        ai_prob = std::min(1.0, ai_prob + kAiBias);
        double sum = ai_prob + human_prob;
        ai_prob /= sum;
        human_prob /= sum;
    }

    ClassificationResult result;
    double confidence;
    if (ai_prob > human_prob) {
        result.label = VoiceLabel::AiGenerated;
        confidence = side_confidence(ai_prob, boost, ai_count);
        result.explanation = ai_explanation(indicators);
    } else {
        result.label = VoiceLabel::Human;
        confidence = side_confidence(human_prob, boost, human_count);
        result.explanation = kHumanExplanation;
    }

    result.confidence = round_to_hundredths(std::clamp(confidence, kMinConfidence, kMaxConfidence));
    return result;
}

ClassificationResult classify(const FeatureVector& features) {
    return score_indicators(evaluate_rules(features));
}
