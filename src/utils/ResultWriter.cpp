#include "utils/ResultWriter.hpp"
#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include "exceptions/Exceptions.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>

namespace dissim {

std::string ResultWriter::escapeField(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string quoted = "\"";
    for (char c : field) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string ResultWriter::joinSeeds(const std::vector<std::string>& seeds) {
    std::string joined;
    for (size_t i = 0; i < seeds.size(); ++i) {
        if (i > 0) joined += ';';
        joined += seeds[i];
    }
    return joined;
}

std::string ResultWriter::formatNumber(double value) {
    std::ostringstream oss;
    oss << std::setprecision(10) << value;
    return oss.str();
}

void ResultWriter::writeRow(std::ostream& out, const std::vector<std::string>& fields) {
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) out << ',';
        out << escapeField(fields[i]);
    }
    out << '\n';
}

std::vector<std::string> ResultWriter::trialHeader(int rounds) {
    std::vector<std::string> header = {
        "graph", "patient0", "patient0_cent", "strategy", "centrality", "model", "pb", "pd", "seed",
        "vaccinated", "trial", "rounds", "rounds_executed", "susceptible", "infected", "recovered"
    };
    const int width = static_cast<int>(std::to_string(rounds).size());
    for (int r = 0; r < rounds; ++r) {
        std::ostringstream oss;
        oss << "infected_" << std::setw(width) << std::setfill('0') << r;
        header.push_back(oss.str());
    }
    return header;
}

void ResultWriter::writeTrials(std::ostream& out, const RunMetadata& meta, const std::vector<TrialResult>& results) {
    writeRow(out, trialHeader(meta.rounds));

    for (const auto& result : results) {
        std::string seed_cent;
        if (result.config_index >= 0 && static_cast<size_t>(result.config_index) < meta.seed_centrality.size() &&
            meta.seed_centrality[result.config_index]) {
            seed_cent = formatNumber(*meta.seed_centrality[result.config_index]);
        }

        std::vector<std::string> row = {
            meta.graph_name,
            joinSeeds(result.seed_vertices),
            seed_cent,
            meta.strategy,
            meta.centrality,
            meta.model,
            formatNumber(meta.pb),
            formatNumber(meta.pd),
            std::to_string(meta.seed),
            std::to_string(meta.num_vaccinated),
            std::to_string(result.trial_index),
            std::to_string(meta.rounds),
            std::to_string(result.rounds_executed),
            std::to_string(result.finalCount(HealthState::Susceptible)),
            std::to_string(result.finalCount(HealthState::Infected)),
            std::to_string(result.finalCount(HealthState::Recovered))
        };
        for (int r = 0; r < meta.rounds; ++r) {
            row.push_back(std::to_string(result.infectedAtRound(r)));
        }
        writeRow(out, row);
    }
}

void ResultWriter::writeTrialsToFile(const std::string& filename, const RunMetadata& meta, const std::vector<TrialResult>& results) {
    Logger& logger = Logger::getInstance();
    if (!FileUtils::ensureParentDirectoryExists(filename)) {
        throw FileIOException("ResultWriter::writeTrialsToFile", "Cannot create directory for output file: " + filename);
    }
    std::ofstream file(filename);
    if (!file.is_open()) {
        logger.error("ResultWriter", "Unable to open file for writing: " + filename);
        throw FileIOException("ResultWriter::writeTrialsToFile", "Unable to open file for writing: " + filename);
    }
    logger.info("ResultWriter", "Writing " + std::to_string(results.size()) + " trial rows to " + filename + "...");
    writeTrials(file, meta, results);
    file.flush();
    if (!file) {
        throw FileIOException("ResultWriter::writeTrialsToFile", "Error while writing file: " + filename);
    }
    logger.info("ResultWriter", "...done.");
}

void ResultWriter::writeSummary(std::ostream& out, const RunMetadata& meta, const std::vector<TrialSummary>& summaries) {
    writeRow(out, {"graph", "patient0", "strategy", "centrality", "model", "pb", "pd", "seed", "vaccinated",
                   "trials", "mean_attack_size", "variance_attack_size", "median_attack_size", "max_attack_size",
                   "mean_rounds_executed", "fraction_died_out"});
    for (const auto& summary : summaries) {
        writeRow(out, {
            meta.graph_name,
            joinSeeds(summary.seed_vertices),
            meta.strategy,
            meta.centrality,
            meta.model,
            formatNumber(meta.pb),
            formatNumber(meta.pd),
            std::to_string(meta.seed),
            std::to_string(meta.num_vaccinated),
            std::to_string(summary.num_trials),
            formatNumber(summary.mean_attack_size),
            formatNumber(summary.variance_attack_size),
            formatNumber(summary.median_attack_size),
            formatNumber(summary.max_attack_size),
            formatNumber(summary.mean_rounds_executed),
            formatNumber(summary.fraction_died_out)
        });
    }
}

void ResultWriter::writeSummaryToFile(const std::string& filename, const RunMetadata& meta, const std::vector<TrialSummary>& summaries) {
    Logger& logger = Logger::getInstance();
    if (!FileUtils::ensureParentDirectoryExists(filename)) {
        throw FileIOException("ResultWriter::writeSummaryToFile", "Cannot create directory for summary file: " + filename);
    }
    std::ofstream file(filename);
    if (!file.is_open()) {
        logger.error("ResultWriter", "Unable to open file for writing: " + filename);
        throw FileIOException("ResultWriter::writeSummaryToFile", "Unable to open file for writing: " + filename);
    }
    writeSummary(file, meta, summaries);
    file.flush();
    if (!file) {
        throw FileIOException("ResultWriter::writeSummaryToFile", "Error while writing file: " + filename);
    }
    logger.info("ResultWriter", "Wrote " + std::to_string(summaries.size()) + " summary rows to " + filename);
}

} // namespace dissim
