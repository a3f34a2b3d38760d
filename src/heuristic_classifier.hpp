#ifndef HEURISTIC_CLASSIFIER_HPP
#define HEURISTIC_CLASSIFIER_HPP
#include "features.hpp"
#include <string>
#include <vector>

enum class VoiceLabel { AiGenerated, Human };
enum class EvidenceSide { Ai, Human };

// "AI_GENERATED" or "HUMAN".
const char* to_string(VoiceLabel label);

// One fired rule. Reasons are recorded for AI-side evidence only and may be empty.
struct Indicator {
    std::string name;
    double weight = 0.0;
    EvidenceSide side = EvidenceSide::Ai;
    std::string reason;
};

struct ClassificationResult {
    VoiceLabel label = VoiceLabel::Human;
    double confidence = 0.0;
    std::string explanation;
};

using FeaturePredicate = bool (*)(const FeatureVector&);

// A threshold test with an AI branch and an optional HUMAN branch; the HUMAN
// branch is only consulted when the AI predicate is false.
struct DetectionRule {
    const char* name;
    FeaturePredicate ai_test;
    double ai_weight;
    const char* ai_reason;
    FeaturePredicate human_test;
    double human_weight;
};

// The fixed ordered rule table.
const std::vector<DetectionRule>& detection_rules();

// At most one indicator per rule, in table order.
std::vector<Indicator> evaluate_rules(const FeatureVector& features);
std::vector<Indicator> evaluate_rules(const FeatureVector& features, const std::vector<DetectionRule>& rules);

/**
 * @brief Folds fired indicators into a label, a confidence and an explanation.
 *
 * Weighted evidence is normalised into probabilities (0.4/0.6 prior when nothing
 * fired), AI evidence gets a +0.08 bias, and confidence is boosted by the number
 * of indicators, capped, clamped to [0.55, 0.95] and rounded to two decimals.
 */
ClassificationResult score_indicators(const std::vector<Indicator>& indicators);

// score_indicators(evaluate_rules(features)). Never throws.
ClassificationResult classify(const FeatureVector& features);

#endif
