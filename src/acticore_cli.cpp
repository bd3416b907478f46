#include "backend_registry.hpp"
#include "batch_processor.hpp"
#include "file_pipeline.hpp"

#include <cmath>
#include <cstdlib>
#include <cstddef>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Options {
    std::vector<std::string> inputPaths;
    std::string outputJson{"results.json"};
    acti::PipelineConfig pipeline;
    std::size_t threads{1};
    bool listBackends{false};
};

void printUsage() {
    std::cerr << "Usage: acticore_cli --input file.gt3x [--input more.gt3x ...] [options]\n"
              << "Options:\n"
              << "  --output-json path          Output JSON summary (default results.json)\n"
              << "  --backend id                Backend id (default: best available)\n"
              << "  --epoch seconds             Epoch length (default 60)\n"
              << "  --no-calibration            Skip autocalibration\n"
              << "  --no-imputation             Skip gap imputation\n"
              << "  --sleep-algorithm name      sadeh | cole_kripke | sib | none (default sadeh)\n"
              << "  --variant name              Scoring variant (default actilife)\n"
              << "  --nonwear name              van_hees_2023 | van_hees_2013 | choi | capsense | none\n"
              << "  --sleep-window              Run HDCZA sleep-window detection\n"
              << "  --aux                       Decode light, battery and capsense records\n"
              << "  --threads N                 Files processed in parallel (default 1, 0 = all cores)\n"
              << "  --metadata-only             Read metadata only\n"
              << "  --list-backends             Print registered backends and exit\n";
}

bool parseDouble(const std::string& token, double& out) {
    try {
        size_t idx = 0;
        double value = std::stod(token, &idx);
        if (idx != token.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseCount(const std::string& token, std::size_t& out) {
    double value = 0.0;
    if (!parseDouble(token, value) || value < 0.0 || std::floor(value) != value) {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

Options parseOptions(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            opts.inputPaths.push_back(argv[++i]);
        } else if (arg == "--output-json" && i + 1 < argc) {
            opts.outputJson = argv[++i];
        } else if (arg == "--backend" && i + 1 < argc) {
            opts.pipeline.backendId = argv[++i];
        } else if (arg == "--epoch" && i + 1 < argc) {
            if (!parseDouble(argv[++i], opts.pipeline.epochLengthSeconds)) {
                throw std::runtime_error("Invalid --epoch value");
            }
        } else if (arg == "--no-calibration") {
            opts.pipeline.calibrate = false;
        } else if (arg == "--no-imputation") {
            opts.pipeline.impute = false;
        } else if (arg == "--sleep-algorithm" && i + 1 < argc) {
            opts.pipeline.sleepAlgorithm = argv[++i];
        } else if (arg == "--variant" && i + 1 < argc) {
            opts.pipeline.variant = argv[++i];
        } else if (arg == "--nonwear" && i + 1 < argc) {
            opts.pipeline.nonwearAlgorithm = argv[++i];
        } else if (arg == "--sleep-window") {
            opts.pipeline.detectSleepWindow = true;
        } else if (arg == "--aux") {
            opts.pipeline.includeAuxiliary = true;
        } else if (arg == "--threads" && i + 1 < argc) {
            if (!parseCount(argv[++i], opts.threads)) {
                throw std::runtime_error("Invalid --threads value");
            }
        } else if (arg == "--metadata-only") {
            opts.pipeline.metadataOnly = true;
        } else if (arg == "--list-backends") {
            opts.listBackends = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(EXIT_SUCCESS);
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            printUsage();
            throw std::runtime_error("Invalid arguments");
        }
    }
    if (!opts.listBackends && opts.inputPaths.empty()) {
        printUsage();
        throw std::runtime_error("Missing --input");
    }
    return opts;
}

std::string quoted(const std::string& text) {
    std::string out = "\"";
    for (char ch : text) {
        switch (ch) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += ch;
                break;
        }
    }
    out += '"';
    return out;
}

// JSON has no NaN or infinity.
std::string number(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream ss;
    ss << std::setprecision(10) << value;
    return ss.str();
}

void listBackends() {
    const acti::BackendRegistry& registry = acti::defaultRegistry();
    for (const auto& id : registry.ids()) {
        const acti::BackendInfo& info = registry.info(id);
        std::cout << id << " (" << info.displayName << ")"
                  << " priority=" << info.priority
                  << " available=" << (info.available ? "yes" : "no")
                  << " capabilities=" << info.capabilities.size() << "\n"
                  << "    " << info.description << "\n";
    }
}

void writeMetadata(std::ostringstream& json, const acti::DeviceMetadata& meta) {
    json << "      \"metadata\": {\n"
         << "        \"serial_number\": " << quoted(meta.serialNumber) << ",\n"
         << "        \"device_type\": " << quoted(meta.deviceType) << ",\n"
         << "        \"firmware\": " << quoted(meta.firmware) << ",\n"
         << "        \"sample_rate\": " << number(meta.sampleRate) << ",\n"
         << "        \"start_time\": " << number(meta.startTime) << ",\n"
         << "        \"acceleration_scale\": " << number(meta.accelerationScale) << "\n"
         << "      },\n";
}

void writeReport(std::ostringstream& json, const acti::FileReport& report) {
    json << "    {\n";
    json << "      \"path\": " << quoted(report.path) << ",\n";
    json << "      \"backend\": " << quoted(report.backend) << ",\n";
    json << "      \"cancelled\": " << (report.cancelled ? "true" : "false") << ",\n";
    json << "      \"elapsed_seconds\": " << number(report.elapsedSeconds) << ",\n";
    if (report.metadata) {
        writeMetadata(json, *report.metadata);
    }
    json << "      \"sample_count\": " << report.sampleCount << ",\n";

    if (report.calibration) {
        const acti::CalibrationOutcome& c = *report.calibration;
        json << "      \"calibration\": {\n"
             << "        \"success\": " << (c.success ? "true" : "false") << ",\n"
             << "        \"scale\": [" << number(c.scale.x) << ',' << number(c.scale.y) << ','
             << number(c.scale.z) << "],\n"
             << "        \"offset\": [" << number(c.offset.x) << ',' << number(c.offset.y) << ','
             << number(c.offset.z) << "],\n"
             << "        \"error_before\": " << number(c.errorBefore) << ",\n"
             << "        \"error_after\": " << number(c.errorAfter) << ",\n"
             << "        \"point_count\": " << c.pointCount << ",\n"
             << "        \"message\": " << quoted(c.message) << "\n"
             << "      },\n";
    }

    json << "      \"imputation\": {\n"
         << "        \"gap_count\": " << report.gapCount << ",\n"
         << "        \"samples_added\": " << report.samplesAdded << ",\n"
         << "        \"total_gap_seconds\": " << number(report.totalGapSeconds) << ",\n"
         << "        \"zeros_replaced\": " << report.zerosReplaced << "\n"
         << "      },\n";

    if (report.epochs) {
        double total = 0.0;
        for (double c : report.epochs->counts) {
            total += c;
        }
        json << "      \"epochs\": {\n"
             << "        \"epoch_length_seconds\": " << number(report.epochs->epochLengthSeconds) << ",\n"
             << "        \"count\": " << report.epochs->size() << ",\n"
             << "        \"total_vector_magnitude\": " << number(total) << "\n"
             << "      },\n";
        json << "      \"mean_enmo\": " << number(report.meanEnmo) << ",\n";
    }

    if (report.scores) {
        std::size_t sleep = 0;
        for (int s : report.scores->scores) {
            sleep += s == 1 ? 1 : 0;
        }
        json << "      \"sleep\": {\n"
             << "        \"algorithm\": " << quoted(report.scores->algorithm) << ",\n"
             << "        \"epochs\": " << report.scores->scores.size() << ",\n"
             << "        \"sleep_epochs\": " << sleep << "\n"
             << "      },\n";
    }

    if (report.nonwear) {
        json << "      \"nonwear\": {\n"
             << "        \"algorithm\": " << quoted(report.nonwear->algorithm) << ",\n"
             << "        \"ranges\": [";
        for (std::size_t i = 0; i < report.nonwear->ranges.size(); ++i) {
            if (i > 0) json << ',';
            json << '[' << report.nonwear->ranges[i].start << ',' << report.nonwear->ranges[i].end << ']';
        }
        json << "]\n      },\n";
    }

    json << "      \"sleep_windows\": [";
    for (std::size_t i = 0; i < report.sleepWindows.size(); ++i) {
        const acti::SleepWindow& w = report.sleepWindows[i];
        if (i > 0) json << ',';
        json << "\n        {\"onset\": " << number(w.onsetTime)
             << ", \"offset\": " << number(w.offsetTime)
             << ", \"total_sleep_minutes\": " << number(w.totalSleepMinutes)
             << ", \"waso_minutes\": " << number(w.wakeAfterOnsetMinutes)
             << ", \"efficiency\": " << number(w.efficiencyPercent);
        if (i < report.sleepNonwearOverlap.size()) {
            const acti::NonwearOverlap& o = report.sleepNonwearOverlap[i];
            json << ", \"onset_in_nonwear\": " << (o.onsetInNonwear ? 1 : 0)
                 << ", \"offset_in_nonwear\": " << (o.offsetInNonwear ? 1 : 0)
                 << ", \"overlapping_nonwear_periods\": " << o.overlappingPeriods;
        }
        json << "}";
    }
    json << "],\n";

    json << "      \"circadian\": {";
    bool first = true;
    for (const auto& metric : report.circadian) {
        for (const auto& kv : metric.values) {
            json << (first ? "\n" : ",\n") << "        " << quoted(metric.name + "." + kv.first) << ": "
                 << number(kv.second);
            first = false;
        }
    }
    json << "\n      },\n";

    json << "      \"warnings\": [";
    for (std::size_t i = 0; i < report.warnings.size(); ++i) {
        if (i > 0) json << ", ";
        json << quoted(report.warnings[i]);
    }
    json << "],\n";
    json << "      \"error\": " << (report.error.empty() ? std::string("null") : quoted(report.error)) << "\n";
    json << "    }";
}

std::string buildJson(const std::vector<acti::FileReport>& reports) {
    std::size_t failed = 0;
    for (const auto& r : reports) {
        failed += r.ok() ? 0 : 1;
    }
    std::ostringstream json;
    json << std::setprecision(10);
    json << "{\n";
    json << "  \"file_count\": " << reports.size() << ",\n";
    json << "  \"failed_count\": " << failed << ",\n";
    json << "  \"files\": [\n";
    for (std::size_t i = 0; i < reports.size(); ++i) {
        writeReport(json, reports[i]);
        json << (i + 1 < reports.size() ? ",\n" : "\n");
    }
    json << "  ]\n";
    json << "}\n";
    return json.str();
}

}  // namespace

int main(int argc, char** argv) {
    try {
        Options opts = parseOptions(argc, argv);
        if (opts.listBackends) {
            listBackends();
            return EXIT_SUCCESS;
        }

        acti::BatchProcessor::Config config;
        config.pipeline = opts.pipeline;
        config.workers = opts.threads;
        acti::BatchProcessor batch(config);
        batch.setProgressCallback([](const acti::BatchProgress& progress) {
            std::cerr << "[" << progress.completed << "/" << progress.total << "] " << progress.report->path;
            if (!progress.report->error.empty()) {
                std::cerr << " failed: " << progress.report->error;
            }
            std::cerr << "\n";
        });

        std::vector<acti::FileReport> reports = batch.run(opts.inputPaths);

        std::ofstream out(opts.outputJson);
        if (!out) {
            throw std::runtime_error("Failed to open " + opts.outputJson);
        }
        out << buildJson(reports);

        std::size_t failed = 0;
        for (const auto& r : reports) {
            failed += r.ok() ? 0 : 1;
        }
        std::cout << "Processed " << reports.size() << " file(s), " << failed << " failed\n"
                  << "Summary written to " << opts.outputJson << "\n";
        return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return EXIT_FAILURE;
    }
}
