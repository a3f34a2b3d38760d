#include "cli_options.hpp"
#include "voice_detector.hpp"
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

void print_report(const DetectionReport& report, bool print_features) {
    const auto& result = report.result;
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "VOICE ANALYSIS: " << report.source << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Analysed duration: " << report.analysed_seconds << " s" << std::endl;
    std::cout << "  Feature extraction: " << report.extraction_time_ms << " ms" << std::endl;
    std::cout << "  Classification: " << report.classification_time_ms << " ms" << std::endl;

    std::cout << "\nIndicators:" << std::endl;
    if (report.indicators.empty()) {
        std::cout << "  (none fired)" << std::endl;
    }
    for (const auto& indicator : report.indicators) {
        std::cout << "  [" << (indicator.side == EvidenceSide::Ai ? "AI   " : "HUMAN") << "] "
                  << indicator.name << " (+" << indicator.weight << ")";
        if (!indicator.reason.empty())
            std::cout << " - " << indicator.reason;
        std::cout << std::endl;
    }

    std::cout << "\nResult:" << std::endl;
    std::cout << "  Classification: " << to_string(result.label) << std::endl;
    std::cout << "  Confidence: " << result.confidence << std::endl;
    std::cout << "  Explanation: " << result.explanation << std::endl;

    if (print_features) {
        std::cout << "\nFeatures:" << std::endl;
        write_features_json(std::cout, report.features);
        std::cout << std::endl;
    }
    std::cout << std::defaultfloat;
}

/**
 * @brief Save every report to a JSON array for further analysis
 */
bool save_reports_to_file(const std::vector<DetectionReport>& reports, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Could not save results to " << filename << std::endl;
        return false;
    }

    file << "[\n";
    for (std::size_t i = 0; i < reports.size(); ++i) {
        const auto& report = reports[i];
        file << "  {\n";
        file << "    \"file\": \"" << escape_json(report.source) << "\",\n";
        file << "    \"result\": ";
        std::ostringstream result_json;
        write_result_json(result_json, report.result);
        std::string indented = result_json.str();
        for (std::size_t pos = indented.find('\n'); pos != std::string::npos; pos = indented.find('\n', pos + 1)) {
            indented.insert(pos + 1, "    ");
        }
        file << indented << ",\n";
        file << "    \"features\": ";
        write_features_json(file, report.features, 6);
        file << "\n  }" << (i + 1 < reports.size() ? "," : "") << "\n";
    }
    file << "]\n";

    std::cout << "Detailed results saved to: " << filename << std::endl;
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = parse_cli(argc, argv);
    } catch (const CliUsageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    if (options.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    LoaderConfig loader_config = loader_config_from_env();
    if (options.max_duration > 0) {
        loader_config.analysis_seconds = options.max_duration;
    }

    std::cout << "AI-Generated Voice Detector" << std::endl;
    std::cout << std::string(50, '=') << std::endl;
    std::cout << "Input files: " << options.inputs.size() << std::endl;
    std::cout << "Analysis rate: " << loader_config.target_sample_rate << " Hz" << std::endl;
    std::cout << "Analysis window: " << loader_config.effective_duration() << " s" << std::endl;
    std::cout << std::string(50, '=') << std::endl;

    VoiceDetector detector(loader_config, FeatureConfig());

    std::vector<DetectionReport> reports;
    int failures = 0;
    for (const auto& input : options.inputs) {
        try {
            DetectionReport report = detector.analyze_file(input);
            print_report(report, options.print_features);
            reports.push_back(report);
        } catch (const AudioLoadError& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            ++failures;
        } catch (const InvalidAudioError& e) {
            std::cerr << "Error: invalid audio in " << input << ": " << e.what() << std::endl;
            ++failures;
        } catch (const c10::Error& e) {
            std::cerr << "Error: analysis failed for " << input << ": " << e.what_without_backtrace() << std::endl;
            ++failures;
        }
    }

    if (!options.json_path.empty() && !reports.empty()) {
        if (!save_reports_to_file(reports, options.json_path))
            ++failures;
    }

    std::cout << "\nAnalysed " << reports.size() << " of " << options.inputs.size() << " file(s)." << std::endl;
    return failures > 0 ? 2 : 0;
}
