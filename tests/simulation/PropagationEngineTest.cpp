#include "gtest/gtest.h"
#include "simulation/PropagationEngine.hpp"
#include "exceptions/Exceptions.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

using namespace dissim;

class PropagationEngineTest : public ::testing::Test {
protected:
    ContactGraph cycle;   // a - b - c - d - a
    ContactGraph path;    // a - b - c

    void SetUp() override {
        cycle = ContactGraph::create({"a", "b", "c", "d"}, {{"a", "b"}, {"b", "c"}, {"c", "d"}, {"d", "a"}});
        path = ContactGraph::create({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}});
    }

    static std::vector<int> infectedSeries(const TrialResult& result) {
        std::vector<int> series;
        for (const auto& summary : result.round_summaries) {
            series.push_back(summary.infected);
        }
        return series;
    }
};

TEST_F(PropagationEngineTest, CertainSpreadFillsCycle) {
    RandomStream stream(1);
    PropagationEngine engine(PropagationModel::SIR, 1.0, 0.0, 3);
    TrialResult result = engine.runTrial(cycle, {"a"}, stream);

    EXPECT_EQ(result.rounds_executed, 3);
    EXPECT_EQ(result.finalCount(HealthState::Infected), 4);
    EXPECT_EQ(result.finalCount(HealthState::Susceptible), 0);
    EXPECT_EQ(result.finalCount(HealthState::Recovered), 0);
    EXPECT_EQ(infectedSeries(result), (std::vector<int>{1, 3, 4, 4}));
    EXPECT_EQ(result.round_summaries[1].new_infections, 2);
    EXPECT_EQ(result.round_summaries[2].new_infections, 1);
    EXPECT_EQ(result.ever_infected, 4);
    EXPECT_FALSE(result.diedOut());
}

TEST_F(PropagationEngineTest, CertainRecoveryEndsAfterOneRound) {
    RandomStream stream(1);
    TrialResult result = PropagationEngine::runTrial(cycle, {"a"}, PropagationModel::SIR, 0.0, 1.0, 3, stream);

    EXPECT_EQ(result.rounds_executed, 1);
    EXPECT_EQ(result.finalCount(HealthState::Recovered), 1);
    EXPECT_EQ(result.finalCount(HealthState::Susceptible), 3);
    EXPECT_EQ(result.finalCount(HealthState::Infected), 0);
    EXPECT_EQ(result.final_states[0], HealthState::Recovered);
    EXPECT_EQ(result.round_summaries.size(), 2u);
    EXPECT_TRUE(result.diedOut());
}

TEST_F(PropagationEngineTest, RecoveringVertexStillSpreadsThatRound) {
    RandomStream stream(1);
    TrialResult result = PropagationEngine::runTrial(path, {"a"}, PropagationModel::SIR, 1.0, 1.0, 10, stream);

    // a infects b and recovers in round 1, b infects c in round 2, c recovers in round 3
    EXPECT_EQ(result.rounds_executed, 3);
    EXPECT_EQ(result.finalCount(HealthState::Recovered), 3);
    EXPECT_EQ(infectedSeries(result), (std::vector<int>{1, 1, 1, 0}));
}

TEST_F(PropagationEngineTest, ZeroTransmissionNeverSpreads) {
    PropagationEngine engine(PropagationModel::SIR, 0.0, 0.3, 50);
    for (std::uint64_t seed = 0; seed < 20; ++seed) {
        RandomStream stream(seed);
        TrialResult result = engine.runTrial(cycle, {"a"}, stream);
        EXPECT_EQ(result.ever_infected, 1);
        EXPECT_EQ(result.finalCount(HealthState::Susceptible), 3);
        for (const auto& summary : result.round_summaries) {
            EXPECT_EQ(summary.new_infections, 0);
            EXPECT_LE(summary.infected, 1);
        }
    }
}

TEST_F(PropagationEngineTest, SisRecoveryReturnsToSusceptible) {
    RandomStream stream(3);
    TrialResult result = PropagationEngine::runTrial(cycle, {"a"}, PropagationModel::SIS, 0.0, 1.0, 5, stream);
    EXPECT_EQ(result.rounds_executed, 1);
    EXPECT_EQ(result.finalCount(HealthState::Susceptible), 4);
    EXPECT_EQ(result.finalCount(HealthState::Recovered), 0);
}

TEST_F(PropagationEngineTest, SisAllowsReinfection) {
    ContactGraph pair = ContactGraph::create({"a", "b"}, {{"a", "b"}});
    RandomStream stream(3);
    TrialResult result = PropagationEngine::runTrial(pair, {"a"}, PropagationModel::SIS, 1.0, 1.0, 4, stream);

    // The infection bounces between a and b and never dies out
    EXPECT_EQ(result.rounds_executed, 4);
    EXPECT_EQ(infectedSeries(result), (std::vector<int>{1, 1, 1, 1, 1}));
    EXPECT_EQ(result.final_states[0], HealthState::Infected);
    EXPECT_EQ(result.final_states[1], HealthState::Susceptible);
    EXPECT_EQ(result.finalCount(HealthState::Recovered), 0);
}

TEST_F(PropagationEngineTest, MultipleSeedsAndDuplicates) {
    RandomStream stream(1);
    TrialResult result = PropagationEngine::runTrial(cycle, {"c", "a", "a"}, PropagationModel::SIR, 0.0, 0.0, 2, stream);
    EXPECT_EQ(result.seed_vertices, (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(result.round_summaries.front().infected, 2);
    EXPECT_EQ(result.rounds_executed, 2);
}

TEST_F(PropagationEngineTest, SameStreamSeedSameTrial) {
    PropagationEngine engine(PropagationModel::SIR, 0.4, 0.2, 30);
    RandomStream first(2024);
    RandomStream second(2024);
    TrialResult r1 = engine.runTrial(cycle, {"b"}, first);
    TrialResult r2 = engine.runTrial(cycle, {"b"}, second);
    EXPECT_EQ(r1.final_states, r2.final_states);
    EXPECT_EQ(infectedSeries(r1), infectedSeries(r2));
    EXPECT_EQ(r1.rounds_executed, r2.rounds_executed);
}

TEST_F(PropagationEngineTest, StateCountsAlwaysSumToVertexCount) {
    PropagationEngine engine(PropagationModel::SIR, 0.5, 0.3, 20);
    RandomStream stream(11);
    TrialResult result = engine.runTrial(cycle, {"a"}, stream);
    for (const auto& s : result.round_summaries) {
        EXPECT_EQ(s.susceptible + s.infected + s.recovered, 4);
    }
}

TEST_F(PropagationEngineTest, InvalidSeeds) {
    PropagationEngine engine(PropagationModel::SIR, 0.5, 0.5, 10);
    RandomStream stream(1);
    EXPECT_THROW(engine.runTrial(cycle, {}, stream), InvalidSeedException);
    EXPECT_THROW(engine.runTrial(cycle, {"z"}, stream), InvalidSeedException);
    EXPECT_THROW(engine.runTrial(cycle, {"a", "z"}, stream), InvalidSeedException);
}

TEST_F(PropagationEngineTest, InvalidParameters) {
    EXPECT_THROW(PropagationEngine(PropagationModel::SIR, -0.1, 0.5, 10), InvalidParameterException);
    EXPECT_THROW(PropagationEngine(PropagationModel::SIR, 0.5, 1.5, 10), InvalidParameterException);
    EXPECT_THROW(PropagationEngine(PropagationModel::SIS, 0.5, 0.5, 0), InvalidParameterException);
}

TEST_F(PropagationEngineTest, InfectedAtRoundCarriesFinalCountForward) {
    RandomStream stream(1);
    TrialResult result = PropagationEngine::runTrial(cycle, {"a"}, PropagationModel::SIR, 0.0, 1.0, 10, stream);
    EXPECT_EQ(result.infectedAtRound(0), 1);
    EXPECT_EQ(result.infectedAtRound(1), 0);
    EXPECT_EQ(result.infectedAtRound(9), 0);
}

TEST(PropagationModelTest, Parse) {
    EXPECT_EQ(parsePropagationModel("SIR"), PropagationModel::SIR);
    EXPECT_EQ(parsePropagationModel("sis"), PropagationModel::SIS);
    EXPECT_THROW(parsePropagationModel("SEIR"), InvalidParameterException);
}

namespace {

RecoveryParameters uniformRecovery(int min_t, int max_t) {
    RecoveryParameters recovery;
    recovery.rule = RecoveryRule::Uniform;
    recovery.min_t = min_t;
    recovery.max_t = max_t;
    return recovery;
}

RecoveryParameters normalRecovery(double mu, double sigma) {
    RecoveryParameters recovery;
    recovery.rule = RecoveryRule::Normal;
    recovery.mu = mu;
    recovery.sigma = sigma;
    return recovery;
}

} // namespace

TEST_F(PropagationEngineTest, BernoulliRuleMatchesProbabilityConstructor) {
    PropagationEngine by_pd(PropagationModel::SIS, 0.5, 0.3, 20);
    PropagationEngine by_rule(PropagationModel::SIS, 0.5, RecoveryParameters::bernoulli(0.3), 20);
    for (std::uint64_t seed = 1; seed <= 10; ++seed) {
        RandomStream first(seed);
        RandomStream second(seed);
        TrialResult expected = by_pd.runTrial(cycle, {"a"}, first);
        TrialResult actual = by_rule.runTrial(cycle, {"a"}, second);
        EXPECT_EQ(expected.final_states, actual.final_states);
        EXPECT_EQ(infectedSeries(expected), infectedSeries(actual));
    }
}

TEST_F(PropagationEngineTest, UniformFixedDurationRecoversOnSchedule) {
    RandomStream stream(3);
    PropagationEngine engine(PropagationModel::SIR, 0.0, uniformRecovery(3, 3), 10);
    TrialResult result = engine.runTrial(cycle, {"a"}, stream);

    EXPECT_EQ(result.rounds_executed, 3);
    EXPECT_EQ(infectedSeries(result), (std::vector<int>{1, 1, 1, 0}));
    EXPECT_EQ(result.finalCount(HealthState::Recovered), 1);
}

TEST_F(PropagationEngineTest, UniformDurationCountsFromInfectionRound) {
    RandomStream stream(4);
    PropagationEngine engine(PropagationModel::SIR, 1.0, uniformRecovery(2, 2), 10);
    TrialResult result = engine.runTrial(path, {"a"}, stream);

    // a recovers after round 2, b (infected in round 1) after round 3, c after round 4
    EXPECT_EQ(result.rounds_executed, 4);
    EXPECT_EQ(infectedSeries(result), (std::vector<int>{1, 2, 2, 1, 0}));
    EXPECT_EQ(result.finalCount(HealthState::Recovered), 3);
}

TEST_F(PropagationEngineTest, UniformDurationStaysWithinBounds) {
    PropagationEngine engine(PropagationModel::SIR, 0.0, uniformRecovery(2, 4), 10);
    std::set<int> lengths;
    for (std::uint64_t seed = 1; seed <= 200; ++seed) {
        RandomStream stream(seed);
        lengths.insert(engine.runTrial(cycle, {"a"}, stream).rounds_executed);
    }
    EXPECT_EQ(lengths, (std::set<int>{2, 3, 4}));
}

TEST_F(PropagationEngineTest, NormalRuleWithNarrowSpreadRecoversAtMean) {
    RandomStream stream(5);
    PropagationEngine engine(PropagationModel::SIR, 0.0, normalRecovery(2.5, 1e-9), 10);
    TrialResult result = engine.runTrial(cycle, {"a", "c"}, stream);

    EXPECT_EQ(result.rounds_executed, 3);
    EXPECT_EQ(infectedSeries(result), (std::vector<int>{2, 2, 2, 0}));
}

TEST_F(PropagationEngineTest, InvalidRecoveryParameters) {
    EXPECT_THROW(PropagationEngine(PropagationModel::SIR, 0.5, normalRecovery(5.0, 0.0), 10), InvalidParameterException);
    EXPECT_THROW(PropagationEngine(PropagationModel::SIR, 0.5, uniformRecovery(0, 3), 10), InvalidParameterException);
    EXPECT_THROW(PropagationEngine(PropagationModel::SIR, 0.5, uniformRecovery(4, 3), 10), InvalidParameterException);
    EXPECT_THROW(PropagationEngine(PropagationModel::SIR, 0.5, RecoveryParameters::bernoulli(-0.1), 10), InvalidParameterException);
    EXPECT_NO_THROW(PropagationEngine(PropagationModel::SIR, 0.5, uniformRecovery(3, 3), 10));
}

TEST(RecoveryRuleTest, Parse) {
    EXPECT_EQ(parseRecoveryRule("bernoulli"), RecoveryRule::Bernoulli);
    EXPECT_EQ(parseRecoveryRule("Normal"), RecoveryRule::Normal);
    EXPECT_EQ(parseRecoveryRule("UNIFORM"), RecoveryRule::Uniform);
    EXPECT_EQ(toString(RecoveryRule::Uniform), "uniform");
    EXPECT_THROW(parseRecoveryRule("gamma"), InvalidParameterException);
}
