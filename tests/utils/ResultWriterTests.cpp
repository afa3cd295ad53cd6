#include "utils/ResultWriter.hpp"
#include "simulation/PropagationEngine.hpp"
#include "exceptions/Exceptions.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace dissim;

namespace {

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) lines.push_back(line);
    return lines;
}

} // namespace

class ResultWriterTest : public ::testing::Test {
protected:
    std::string testDir = "temp_result_writer";
    RunMetadata meta;
    std::vector<TrialResult> results;

    void SetUp() override {
        meta.graph_name = "cycle";
        meta.strategy = "batch";
        meta.centrality = "degree";
        meta.model = "SIR";
        meta.pb = 0.0;
        meta.pd = 1.0;
        meta.seed = 42;
        meta.num_vaccinated = 0;
        meta.rounds = 12;
        meta.seed_centrality = {2.0};

        ContactGraph cycle = ContactGraph::create({"a", "b", "c", "d"}, {{"a", "b"}, {"b", "c"}, {"c", "d"}, {"d", "a"}});
        RandomStream stream(1);
        TrialResult result = PropagationEngine::runTrial(cycle, {"a"}, PropagationModel::SIR, 0.0, 1.0, 12, stream);
        result.config_index = 0;
        result.trial_index = 0;
        results.push_back(result);
        result.trial_index = 1;
        results.push_back(result);
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }
};

TEST_F(ResultWriterTest, HeaderPadsRoundColumns) {
    auto header = ResultWriter::trialHeader(12);
    ASSERT_EQ(header.size(), 16u + 12u);
    EXPECT_EQ(header[0], "graph");
    EXPECT_EQ(header[12], "rounds_executed");
    EXPECT_EQ(header[16], "infected_00");
    EXPECT_EQ(header.back(), "infected_11");
    EXPECT_EQ(ResultWriter::trialHeader(5).back(), "infected_4");
}

TEST_F(ResultWriterTest, WritesOneRowPerTrial) {
    std::ostringstream out;
    ResultWriter::writeTrials(out, meta, results);
    auto lines = splitLines(out.str());
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "cycle,a,2,batch,degree,SIR,0,1,42,0,0,12,1,3,0,1,1,0,0,0,0,0,0,0,0,0,0,0");
    EXPECT_EQ(lines[2].substr(0, 27), "cycle,a,2,batch,degree,SIR,");
}

TEST_F(ResultWriterTest, EmptyCentralityWhenNotConfigured) {
    meta.centrality.clear();
    meta.strategy.clear();
    meta.seed_centrality = {std::nullopt};
    std::ostringstream out;
    ResultWriter::writeTrials(out, meta, results);
    auto lines = splitLines(out.str());
    EXPECT_EQ(lines[1].substr(0, 17), "cycle,a,,,,SIR,0,");
}

TEST_F(ResultWriterTest, EscapesSpecialCharacters) {
    EXPECT_EQ(ResultWriter::escapeField("plain"), "plain");
    EXPECT_EQ(ResultWriter::escapeField("a,b"), "\"a,b\"");
    EXPECT_EQ(ResultWriter::escapeField("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(ResultWriter::escapeField("two\nlines"), "\"two\nlines\"");
    EXPECT_EQ(ResultWriter::joinSeeds({"a", "b", "c"}), "a;b;c");
}

TEST_F(ResultWriterTest, WritesFileAndCreatesDirectory) {
    std::string path = testDir + "/nested/trials.csv";
    ResultWriter::writeTrialsToFile(path, meta, results);
    std::ifstream file(path);
    ASSERT_TRUE(file.is_open());
    std::stringstream buffer;
    buffer << file.rdbuf();
    EXPECT_EQ(splitLines(buffer.str()).size(), 3u);
}

TEST_F(ResultWriterTest, UnwritablePathThrows) {
    std::filesystem::create_directories(testDir + "/occupied");
    EXPECT_THROW(ResultWriter::writeTrialsToFile(testDir + "/occupied", meta, results), FileIOException);
}

TEST_F(ResultWriterTest, WritesSummaryRows) {
    std::ostringstream out;
    ResultWriter::writeSummary(out, meta, TrialSummaryCalculator::summarize(results));
    auto lines = splitLines(out.str());
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].substr(0, 16), "graph,patient0,s");
    EXPECT_EQ(lines[1], "cycle,a,batch,degree,SIR,0,1,42,0,2,1,0,1,1,1,1");
}
