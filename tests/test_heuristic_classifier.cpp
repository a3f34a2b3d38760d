#include "heuristic_classifier.hpp"
#include <catch2/catch.hpp>
#include <cmath>
#include <random>
#include <string>

namespace {

// Sits between every AI and HUMAN threshold, so no rule fires.
FeatureVector neutral_features() {
    FeatureVector f;
    f.pitch_mean = 280.0;
    f.pitch_std = 28.0;
    f.pitch_cv = 0.1;
    f.pitch_range = 100.0;
    f.mfcc_std.fill(6.8);
    f.mfcc_delta_std = 5.0;
    f.spectral_centroid_std = 700.0;
    f.spectral_bandwidth_std = 500.0;
    f.energy_mean = 0.065;
    f.energy_std = 0.013;
    f.energy_cv = 0.2;
    f.zcr_std = 0.013;
    f.spectral_rolloff_std = 700.0;
    return f;
}

FeatureVector ai_like_features() {
    FeatureVector f;
    f.pitch_std = 10.0;
    f.mfcc_std.fill(5.0);
    f.mfcc_delta_std = 2.0;
    f.spectral_centroid_std = 400.0;
    f.spectral_bandwidth_std = 300.0;
    f.energy_std = 0.005;
    f.zcr_std = 0.005;
    f.spectral_rolloff_std = 400.0;
    return f;
}

FeatureVector human_like_features() {
    FeatureVector f;
    f.pitch_mean = 200.0;
    f.pitch_std = 50.0;
    f.pitch_cv = 0.25;
    f.pitch_range = 200.0;
    f.mfcc_std.fill(9.0);
    f.mfcc_delta_std = 6.0;
    f.spectral_centroid_std = 900.0;
    f.spectral_bandwidth_std = 500.0;
    f.energy_mean = 0.05;
    f.energy_std = 0.02;
    f.energy_cv = 0.4;
    f.zcr_std = 0.02;
    f.spectral_rolloff_std = 700.0;
    return f;
}

const Indicator* find_indicator(const std::vector<Indicator>& indicators, const std::string& name) {
    for (const auto& indicator : indicators) {
        if (indicator.name == name)
            return &indicator;
    }
    return nullptr;
}

const char* const kHumanExplanation =
    "Natural human speech patterns detected with expected variations in pitch, energy, and spectral characteristics";
const char* const kAiFallback = "AI-generated voice patterns detected through spectral and pitch analysis";

} // namespace

TEST_CASE("Rule table has eight rules in fixed order", "[classifier][rules]") {
    const auto& rules = detection_rules();
    REQUIRE(rules.size() == 8);

    const char* expected[] = {"pitch_consistency", "mfcc_variation", "mfcc_transitions",
                              "spectral_centroid_variation", "spectral_bandwidth_variation",
                              "energy_consistency", "zero_crossing_variation", "spectral_rolloff_variation"};
    const double ai_weights[] = {0.20, 0.18, 0.12, 0.10, 0.08, 0.12, 0.08, 0.08};
    const double human_weights[] = {0.15, 0.12, 0.0, 0.10, 0.0, 0.10, 0.08, 0.0};
    for (std::size_t i = 0; i < rules.size(); ++i) {
        CHECK(std::string(rules[i].name) == expected[i]);
        CHECK(rules[i].ai_weight == Approx(ai_weights[i]));
        CHECK(rules[i].human_weight == Approx(human_weights[i]));
        CHECK((rules[i].human_test != nullptr) == (human_weights[i] > 0.0));
    }
}

TEST_CASE("Neutral features fire no rule", "[classifier][rules]") {
    REQUIRE(evaluate_rules(neutral_features()).empty());
}

TEST_CASE("Pitch rule", "[classifier][rules]") {
    SECTION("low deviation is AI evidence") {
        auto f = neutral_features();
        f.pitch_std = 24.9;
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].name == "pitch_consistency");
        CHECK(fired[0].side == EvidenceSide::Ai);
        CHECK(fired[0].weight == Approx(0.20));
        CHECK(fired[0].reason == "unusually consistent pitch");
    }
    SECTION("low coefficient of variation is AI evidence") {
        auto f = neutral_features();
        f.pitch_cv = 0.05;
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].side == EvidenceSide::Ai);
    }
    SECTION("zero coefficient of variation is not evidence by itself") {
        auto f = neutral_features();
        f.pitch_cv = 0.0;
        CHECK(evaluate_rules(f).empty());
    }
    SECTION("wide and varied pitch is HUMAN evidence") {
        auto f = neutral_features();
        f.pitch_std = 31.0;
        f.pitch_range = 151.0;
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].side == EvidenceSide::Human);
        CHECK(fired[0].weight == Approx(0.15));
        CHECK(fired[0].reason.empty());
    }
    SECTION("varied but narrow pitch is neither") {
        auto f = neutral_features();
        f.pitch_std = 31.0;
        f.pitch_range = 150.0;
        CHECK(evaluate_rules(f).empty());
    }
}

TEST_CASE("MFCC rules", "[classifier][rules]") {
    auto f = neutral_features();

    SECTION("low mean coefficient deviation is AI evidence") {
        f.mfcc_std.fill(6.0);
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].name == "mfcc_variation");
        CHECK(fired[0].reason == "atypical MFCC patterns");
    }
    SECTION("high mean coefficient deviation is HUMAN evidence") {
        f.mfcc_std.fill(7.5);
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].side == EvidenceSide::Human);
        CHECK(fired[0].weight == Approx(0.12));
    }
    SECTION("the mean over coefficients decides, not single coefficients") {
        f.mfcc_std.fill(6.0);
        f.mfcc_std[0] = 20.0;
        CHECK(f.mfcc_std_mean() > 7.0);
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].side == EvidenceSide::Human);
    }
    SECTION("smooth transitions are AI evidence with no HUMAN branch") {
        f.mfcc_delta_std = 3.9;
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].name == "mfcc_transitions");
        CHECK(fired[0].reason == "unnatural spectral transitions");

        f.mfcc_delta_std = 50.0;
        CHECK(evaluate_rules(f).empty());
    }
}

TEST_CASE("Spectral variation rules", "[classifier][rules]") {
    auto f = neutral_features();

    SECTION("centroid") {
        f.spectral_centroid_std = 599.0;
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].reason == "limited spectral variation");

        f.spectral_centroid_std = 801.0;
        fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].side == EvidenceSide::Human);
        CHECK(fired[0].weight == Approx(0.10));
    }
    SECTION("bandwidth fires without a reason") {
        f.spectral_bandwidth_std = 449.0;
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].name == "spectral_bandwidth_variation");
        CHECK(fired[0].side == EvidenceSide::Ai);
        CHECK(fired[0].reason.empty());
    }
    SECTION("rolloff fires without a reason") {
        f.spectral_rolloff_std = 599.0;
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].name == "spectral_rolloff_variation");
        CHECK(fired[0].weight == Approx(0.08));
        CHECK(fired[0].reason.empty());
    }
}

TEST_CASE("Energy and zero-crossing rules", "[classifier][rules]") {
    auto f = neutral_features();

    SECTION("flat energy") {
        f.energy_std = 0.011;
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].reason == "unnatural energy consistency");
    }
    SECTION("low energy coefficient of variation") {
        f.energy_cv = 0.1;
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].side == EvidenceSide::Ai);
    }
    SECTION("varied energy") {
        f.energy_std = 0.016;
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].side == EvidenceSide::Human);
    }
    SECTION("zero crossings") {
        f.zcr_std = 0.011;
        auto fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].reason == "unnatural zero crossing patterns");

        f.zcr_std = 0.016;
        fired = evaluate_rules(f);
        REQUIRE(fired.size() == 1);
        CHECK(fired[0].side == EvidenceSide::Human);
        CHECK(fired[0].weight == Approx(0.08));
    }
}

TEST_CASE("Custom rule tables are evaluated in order", "[classifier][rules]") {
    std::vector<DetectionRule> rules = {
        {"always_ai", [](const FeatureVector&) { return true; }, 0.5, "first", nullptr, 0.0},
        {"never", [](const FeatureVector&) { return false; }, 0.5, "unused",
         [](const FeatureVector&) { return false; }, 0.5},
        {"always_human", [](const FeatureVector&) { return false; }, 0.5, "unused",
         [](const FeatureVector&) { return true; }, 0.3},
    };
    auto fired = evaluate_rules(FeatureVector(), rules);
    REQUIRE(fired.size() == 2);
    CHECK(fired[0].name == "always_ai");
    CHECK(fired[1].name == "always_human");
    CHECK(fired[1].weight == Approx(0.3));
}

TEST_CASE("No evidence falls back to the HUMAN-leaning prior", "[classifier][score]") {
    auto result = classify(neutral_features());
    CHECK(result.label == VoiceLabel::Human);
    CHECK(result.confidence == Approx(0.60));
    CHECK(result.explanation == kHumanExplanation);

    auto empty = score_indicators({});
    CHECK(empty.label == VoiceLabel::Human);
    CHECK(empty.confidence == Approx(0.60));
}

TEST_CASE("AI-favouring features", "[classifier][score]") {
    auto indicators = evaluate_rules(ai_like_features());
    REQUIRE(indicators.size() == 8);
    for (const auto& indicator : indicators)
        CHECK(indicator.side == EvidenceSide::Ai);

    auto result = classify(ai_like_features());
    CHECK(result.label == VoiceLabel::AiGenerated);
    CHECK(result.confidence >= 0.90);
    CHECK(result.confidence == Approx(0.95));
    CHECK(result.explanation ==
          "AI-generated voice detected: unusually consistent pitch, atypical MFCC patterns, unnatural spectral transitions");
}

TEST_CASE("HUMAN-favouring features", "[classifier][score]") {
    auto indicators = evaluate_rules(human_like_features());
    REQUIRE(indicators.size() == 5);
    for (const auto& indicator : indicators)
        CHECK(indicator.side == EvidenceSide::Human);

    auto result = classify(human_like_features());
    CHECK(result.label == VoiceLabel::Human);
    CHECK(result.confidence >= 0.85);
    CHECK(result.confidence == Approx(0.95));
    CHECK(result.explanation == kHumanExplanation);
}

TEST_CASE("Missing pitch does not force an AI verdict", "[classifier][score]") {
    auto f = human_like_features();
    f.pitch_mean = 0.0;
    f.pitch_std = 0.0;
    f.pitch_range = 0.0;
    f.pitch_max = 0.0;
    f.pitch_min = 0.0;
    f.pitch_cv = 0.0;

    auto fired = evaluate_rules(f);
    const Indicator* pitch = find_indicator(fired, "pitch_consistency");
    REQUIRE(pitch != nullptr);
    CHECK(pitch->side == EvidenceSide::Ai);

    auto result = classify(f);
    CHECK(result.label == VoiceLabel::Human);
    CHECK(result.confidence == Approx(0.77));
}

TEST_CASE("Conservatism bias and confidence ceilings", "[classifier][score]") {
    SECTION("a single AI indicator is capped at the weak ceiling") {
        auto result = score_indicators({{"x", 0.1, EvidenceSide::Ai, "reason"}});
        CHECK(result.label == VoiceLabel::AiGenerated);
        CHECK(result.confidence == Approx(0.90));
        CHECK(result.explanation == "AI-generated voice detected: reason");
    }
    SECTION("bias narrows a HUMAN lead to the confidence floor") {
        auto result = score_indicators({{"a", 0.10, EvidenceSide::Ai, "a"}, {"h", 0.12, EvidenceSide::Human, ""}});
        CHECK(result.label == VoiceLabel::Human);
        CHECK(result.confidence == Approx(0.55));
    }
    SECTION("mixed evidence with a HUMAN majority") {
        auto result = score_indicators({{"a1", 0.20, EvidenceSide::Ai, "a1"},
                                        {"a2", 0.12, EvidenceSide::Ai, "a2"},
                                        {"h1", 0.12, EvidenceSide::Human, ""},
                                        {"h2", 0.10, EvidenceSide::Human, ""},
                                        {"h3", 0.10, EvidenceSide::Human, ""},
                                        {"h4", 0.08, EvidenceSide::Human, ""}});
        CHECK(result.label == VoiceLabel::Human);
        CHECK(result.confidence == Approx(0.69));
    }
    SECTION("mixed evidence with an AI majority") {
        auto result = score_indicators({{"a1", 0.20, EvidenceSide::Ai, "r1"},
                                        {"a2", 0.18, EvidenceSide::Ai, "r2"},
                                        {"a3", 0.12, EvidenceSide::Ai, "r3"},
                                        {"h1", 0.10, EvidenceSide::Human, ""},
                                        {"h2", 0.10, EvidenceSide::Human, ""}});
        CHECK(result.label == VoiceLabel::AiGenerated);
        CHECK(result.confidence == Approx(0.89));
        CHECK(result.explanation == "AI-generated voice detected: r1, r2, r3");
    }
}

TEST_CASE("AI explanation", "[classifier][score]") {
    SECTION("only the first three reasons are reported") {
        auto result = score_indicators({{"1", 0.1, EvidenceSide::Ai, "one"},
                                        {"2", 0.1, EvidenceSide::Ai, "two"},
                                        {"3", 0.1, EvidenceSide::Ai, "three"},
                                        {"4", 0.1, EvidenceSide::Ai, "four"}});
        CHECK(result.explanation == "AI-generated voice detected: one, two, three");
    }
    SECTION("reasonless evidence uses the generic sentence") {
        auto f = neutral_features();
        f.spectral_bandwidth_std = 300.0;
        f.spectral_rolloff_std = 300.0;
        auto result = classify(f);
        CHECK(result.label == VoiceLabel::AiGenerated);
        CHECK(result.confidence == Approx(0.90));
        CHECK(result.explanation == kAiFallback);
    }
}

TEST_CASE("Labels render as their wire names", "[classifier]") {
    CHECK(std::string(to_string(VoiceLabel::AiGenerated)) == "AI_GENERATED");
    CHECK(std::string(to_string(VoiceLabel::Human)) == "HUMAN");
}

TEST_CASE("Classification is total, bounded and repeatable", "[classifier][property]") {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> pitch(0.0, 120.0);
    std::uniform_real_distribution<double> mfcc(0.0, 15.0);
    std::uniform_real_distribution<double> spectral(0.0, 1500.0);
    std::uniform_real_distribution<double> small(0.0, 0.04);
    std::uniform_real_distribution<double> ratio(0.0, 0.5);

    for (int i = 0; i < 500; ++i) {
        FeatureVector f;
        f.pitch_std = pitch(rng);
        f.pitch_range = 4.0 * pitch(rng);
        f.pitch_cv = (i % 7 == 0) ? 0.0 : ratio(rng);
        for (auto& v : f.mfcc_std)
            v = mfcc(rng);
        f.mfcc_delta_std = mfcc(rng);
        f.spectral_centroid_std = spectral(rng);
        f.spectral_bandwidth_std = spectral(rng);
        f.spectral_rolloff_std = spectral(rng);
        f.energy_std = small(rng);
        f.energy_cv = (i % 5 == 0) ? 0.0 : ratio(rng);
        f.zcr_std = small(rng);

        auto first = classify(f);
        auto second = classify(f);
        REQUIRE(first.confidence >= 0.55);
        REQUIRE(first.confidence <= 0.95);
        REQUIRE(std::fabs(first.confidence * 100.0 - std::round(first.confidence * 100.0)) < 1e-9);
        REQUIRE((first.label == VoiceLabel::AiGenerated || first.label == VoiceLabel::Human));
        REQUIRE(first.label == second.label);
        REQUIRE(first.confidence == second.confidence);
        REQUIRE(first.explanation == second.explanation);
    }
}
