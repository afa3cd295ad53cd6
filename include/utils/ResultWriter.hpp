#ifndef RESULT_WRITER_HPP
#define RESULT_WRITER_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "analysis/TrialSummaryCalculator.hpp"
#include "simulation/TrialResult.hpp"

namespace dissim {

/**
 * @brief Settings shared by every row of one run.
 */
struct RunMetadata {
    std::string graph_name;
    std::string strategy;                 ///< Empty when no vaccination was applied.
    std::string centrality;               ///< Empty when no measure was configured.
    std::string model;
    double pb = 0.0;
    double pd = 0.0;
    std::uint64_t seed = 0;
    int num_vaccinated = 0;
    int rounds = 0;
    /// Centrality of the first seed of each configuration on the original graph, indexed by config_index.
    std::vector<std::optional<double>> seed_centrality;
};

/**
 * @class ResultWriter
 * @brief Writes trial results and per-configuration summaries as CSV.
 */
class ResultWriter {
public:
    /**
     * @brief Column names of the trial CSV; infected_<r> is zero-padded to the width of @p rounds.
     */
    static std::vector<std::string> trialHeader(int rounds);

    /**
     * @brief Writes the header and one row per trial result, in the given order.
     */
    static void writeTrials(std::ostream& out, const RunMetadata& meta, const std::vector<TrialResult>& results);

    /**
     * @brief Writes the trial CSV to @p filename, creating its directory if needed.
     * @throws FileIOException If the file cannot be opened or written.
     */
    static void writeTrialsToFile(const std::string& filename, const RunMetadata& meta, const std::vector<TrialResult>& results);

    /**
     * @brief Writes one row per configuration summary.
     */
    static void writeSummary(std::ostream& out, const RunMetadata& meta, const std::vector<TrialSummary>& summaries);

    /**
     * @brief Writes the summary CSV to @p filename, creating its directory if needed.
     * @throws FileIOException If the file cannot be opened or written.
     */
    static void writeSummaryToFile(const std::string& filename, const RunMetadata& meta, const std::vector<TrialSummary>& summaries);

    /**
     * @brief Quotes a field containing a comma, a quote or a line break; quotes are doubled.
     */
    static std::string escapeField(const std::string& field);

    /** @brief Seed identifiers joined with ';'. */
    static std::string joinSeeds(const std::vector<std::string>& seeds);

private:
    static std::string formatNumber(double value);
    static void writeRow(std::ostream& out, const std::vector<std::string>& fields);
};

} // namespace dissim

#endif // RESULT_WRITER_HPP
