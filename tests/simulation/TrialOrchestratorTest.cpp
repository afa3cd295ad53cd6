#include "gtest/gtest.h"
#include "simulation/TrialOrchestrator.hpp"
#include "exceptions/Exceptions.hpp"
#include <string>
#include <vector>

using namespace dissim;

class TrialOrchestratorTest : public ::testing::Test {
protected:
    ContactGraph graph;

    void SetUp() override {
        // Two triangles joined by the bridge c - d
        graph = ContactGraph::create({"a", "b", "c", "d", "e", "f"},
                                     {{"a", "b"}, {"b", "c"}, {"a", "c"},
                                      {"c", "d"},
                                      {"d", "e"}, {"e", "f"}, {"d", "f"}});
    }

    static void expectSameResults(const std::vector<TrialResult>& lhs, const std::vector<TrialResult>& rhs) {
        ASSERT_EQ(lhs.size(), rhs.size());
        for (size_t i = 0; i < lhs.size(); ++i) {
            EXPECT_EQ(lhs[i].config_index, rhs[i].config_index);
            EXPECT_EQ(lhs[i].trial_index, rhs[i].trial_index);
            EXPECT_EQ(lhs[i].seed_vertices, rhs[i].seed_vertices);
            EXPECT_EQ(lhs[i].final_states, rhs[i].final_states);
            EXPECT_EQ(lhs[i].rounds_executed, rhs[i].rounds_executed);
            ASSERT_EQ(lhs[i].round_summaries.size(), rhs[i].round_summaries.size());
            for (size_t r = 0; r < lhs[i].round_summaries.size(); ++r) {
                EXPECT_EQ(lhs[i].round_summaries[r].infected, rhs[i].round_summaries[r].infected);
            }
        }
    }
};

TEST_F(TrialOrchestratorTest, ResultsInConfigurationThenTrialOrder) {
    TrialOrchestrator orchestrator;
    auto results = orchestrator.run(graph, VaccinationPlan(), SeedSpecification::allVertices(),
                                    PropagationModel::SIR, 0.3, 0.2, 10, 4, 42);
    ASSERT_EQ(results.size(), 24u);
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].config_index, static_cast<int>(i / 4));
        EXPECT_EQ(results[i].trial_index, static_cast<int>(i % 4));
        EXPECT_EQ(results[i].seed_vertices, (std::vector<std::string>{graph.label(static_cast<int>(i / 4))}));
    }
}

TEST_F(TrialOrchestratorTest, IdenticalInputsGiveIdenticalResults) {
    TrialOrchestrator orchestrator;
    auto first = orchestrator.run(graph, VaccinationPlan(), SeedSpecification::allVertices(),
                                  PropagationModel::SIR, 0.4, 0.1, 20, 10, 7);
    auto second = orchestrator.run(graph, VaccinationPlan(), SeedSpecification::allVertices(),
                                   PropagationModel::SIR, 0.4, 0.1, 20, 10, 7);
    expectSameResults(first, second);
}

TEST_F(TrialOrchestratorTest, ParallelMatchesSerial) {
    TrialOrchestrator serial(false);
    TrialOrchestrator parallel(true, 4);
    VaccinationPlan plan({"c"});
    auto expected = serial.run(graph, plan, SeedSpecification::allVertices(),
                               PropagationModel::SIS, 0.5, 0.3, 15, 20, 99);
    auto actual = parallel.run(graph, plan, SeedSpecification::allVertices(),
                               PropagationModel::SIS, 0.5, 0.3, 15, 20, 99);
    expectSameResults(expected, actual);
}

TEST_F(TrialOrchestratorTest, SeedSetKeepsItsTrialsAcrossEnumerations) {
    TrialOrchestrator orchestrator;
    // With "a" vaccinated, "e" moves from the fifth to the fourth configuration
    for (const VaccinationPlan& plan : {VaccinationPlan(), VaccinationPlan({"a"})}) {
        auto enumerated = orchestrator.run(graph, plan, SeedSpecification::allVertices(),
                                           PropagationModel::SIR, 0.5, 0.3, 20, 6, 42);
        auto listed = orchestrator.run(graph, plan, SeedSpecification::explicitSeeds({"e"}),
                                       PropagationModel::SIR, 0.5, 0.3, 20, 6, 42);

        std::vector<TrialResult> from_enumeration;
        for (const auto& result : enumerated) {
            if (result.seed_vertices == std::vector<std::string>{"e"}) {
                from_enumeration.push_back(result);
            }
        }
        ASSERT_EQ(from_enumeration.size(), listed.size());
        for (size_t t = 0; t < listed.size(); ++t) {
            EXPECT_EQ(listed[t].config_index, 0);
            EXPECT_EQ(from_enumeration[t].trial_index, listed[t].trial_index);
            EXPECT_EQ(from_enumeration[t].final_states, listed[t].final_states);
            EXPECT_EQ(from_enumeration[t].rounds_executed, listed[t].rounds_executed);
            EXPECT_EQ(from_enumeration[t].ever_infected, listed[t].ever_infected);
        }
    }
}

TEST_F(TrialOrchestratorTest, ConfiguredEngineOverloadMatchesParameterForm) {
    TrialOrchestrator orchestrator;
    PropagationEngine engine(PropagationModel::SIS, 0.4, 0.2, 15);
    auto expected = orchestrator.run(graph, VaccinationPlan({"d"}), SeedSpecification::allVertices(),
                                     PropagationModel::SIS, 0.4, 0.2, 15, 5, 11);
    auto actual = orchestrator.run(graph, VaccinationPlan({"d"}), SeedSpecification::allVertices(), engine, 5, 11);
    expectSameResults(expected, actual);
}

TEST_F(TrialOrchestratorTest, DifferentTopSeedChangesOutcome) {
    TrialOrchestrator orchestrator;
    auto first = orchestrator.run(graph, VaccinationPlan(), SeedSpecification::explicitSeeds({"a"}),
                                  PropagationModel::SIR, 0.5, 0.2, 30, 50, 1);
    auto second = orchestrator.run(graph, VaccinationPlan(), SeedSpecification::explicitSeeds({"a"}),
                                   PropagationModel::SIR, 0.5, 0.2, 30, 50, 2);
    bool any_difference = false;
    for (size_t i = 0; i < first.size(); ++i) {
        if (first[i].final_states != second[i].final_states || first[i].rounds_executed != second[i].rounds_executed) {
            any_difference = true;
        }
    }
    EXPECT_TRUE(any_difference);
}

TEST_F(TrialOrchestratorTest, VaccinatedVerticesAreRemoved) {
    TrialOrchestrator orchestrator;
    VaccinationPlan plan({"c", "d"});
    auto results = orchestrator.run(graph, plan, SeedSpecification::explicitSeeds({"a"}),
                                    PropagationModel::SIR, 1.0, 0.0, 10, 3, 5);
    ASSERT_EQ(results.size(), 3u);
    for (const auto& result : results) {
        EXPECT_EQ(result.final_states.size(), 4u);
        // The bridge is vaccinated, so only a's triangle (minus c) can be reached
        EXPECT_EQ(result.ever_infected, 2);
        EXPECT_EQ(result.finalCount(HealthState::Susceptible), 2);
    }
}

TEST_F(TrialOrchestratorTest, UnspecifiedSeedsSkipVaccinatedVertices) {
    VaccinationPlan plan({"b", "e"});
    auto configurations = TrialOrchestrator::buildSeedConfigurations(graph, plan, SeedSpecification::allVertices());
    ASSERT_EQ(configurations.size(), 4u);
    EXPECT_EQ(configurations[0], (std::vector<std::string>{"a"}));
    EXPECT_EQ(configurations[1], (std::vector<std::string>{"c"}));
    EXPECT_EQ(configurations[2], (std::vector<std::string>{"d"}));
    EXPECT_EQ(configurations[3], (std::vector<std::string>{"f"}));
}

TEST_F(TrialOrchestratorTest, ExplicitSeedsFormOneConfiguration) {
    auto configurations = TrialOrchestrator::buildSeedConfigurations(
        graph, VaccinationPlan(), SeedSpecification::explicitSeeds({"f", "a", "f"}));
    ASSERT_EQ(configurations.size(), 1u);
    EXPECT_EQ(configurations[0], (std::vector<std::string>{"f", "a"}));

    TrialOrchestrator orchestrator;
    auto results = orchestrator.run(graph, VaccinationPlan(), SeedSpecification::explicitSeeds({"f", "a"}),
                                    PropagationModel::SIR, 0.0, 0.0, 2, 2, 1);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].round_summaries.front().infected, 2);
}

TEST_F(TrialOrchestratorTest, InvalidSeedsFailBeforeAnyTrial) {
    TrialOrchestrator orchestrator;
    VaccinationPlan plan({"a"});
    EXPECT_THROW(orchestrator.run(graph, plan, SeedSpecification::explicitSeeds({"a"}),
                                  PropagationModel::SIR, 0.5, 0.5, 10, 5, 1), InvalidSeedException);
    EXPECT_THROW(orchestrator.run(graph, plan, SeedSpecification::explicitSeeds({"b", "zz"}),
                                  PropagationModel::SIR, 0.5, 0.5, 10, 5, 1), InvalidSeedException);
    EXPECT_THROW(orchestrator.run(graph, plan, SeedSpecification::explicitSeeds({}),
                                  PropagationModel::SIR, 0.5, 0.5, 10, 5, 1), InvalidSeedException);

    VaccinationPlan everyone(graph.labels());
    EXPECT_THROW(TrialOrchestrator::buildSeedConfigurations(graph, everyone, SeedSpecification::allVertices()),
                 InvalidSeedException);
}

TEST_F(TrialOrchestratorTest, InvalidParameters) {
    TrialOrchestrator orchestrator;
    EXPECT_THROW(orchestrator.run(graph, VaccinationPlan(), SeedSpecification::allVertices(),
                                  PropagationModel::SIR, 0.5, 0.5, 10, 0, 1), InvalidParameterException);
    EXPECT_THROW(orchestrator.run(graph, VaccinationPlan(), SeedSpecification::allVertices(),
                                  PropagationModel::SIR, 1.5, 0.5, 10, 3, 1), InvalidParameterException);
    EXPECT_THROW(orchestrator.run(graph, VaccinationPlan(), SeedSpecification::allVertices(),
                                  PropagationModel::SIR, 0.5, 0.5, 0, 3, 1), InvalidParameterException);
    EXPECT_THROW(TrialOrchestrator(true, -1), InvalidParameterException);
}
