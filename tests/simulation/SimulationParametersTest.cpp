#include "gtest/gtest.h"
#include "simulation/SimulationParameters.hpp"
#include "exceptions/Exceptions.hpp"
#include <string>
#include <vector>

using namespace dissim;

class SimulationParametersTest : public ::testing::Test {
protected:
    SimulationParameters params;

    void SetUp() override {
        params.graph_file = "graph.gml";
        params.output_file = "out.csv";
    }
};

TEST_F(SimulationParametersTest, Defaults) {
    SimulationParameters defaults;
    EXPECT_EQ(defaults.percent_to_vaccinate, 50);
    EXPECT_EQ(defaults.trials, 100);
    EXPECT_EQ(defaults.rounds, 100);
    EXPECT_DOUBLE_EQ(defaults.pb, 0.05);
    EXPECT_DOUBLE_EQ(defaults.pd, 0.05);
    EXPECT_EQ(defaults.seed, 42u);
    EXPECT_EQ(defaults.model, PropagationModel::SIR);
    EXPECT_FALSE(defaults.strategy.has_value());
    EXPECT_FALSE(defaults.centrality.has_value());
    EXPECT_TRUE(defaults.patient0.empty());
    EXPECT_FALSE(defaults.parallel);
    EXPECT_NO_THROW(params.validate());
}

TEST_F(SimulationParametersTest, ApplySettings) {
    applySetting(params, "strategy", "recursive");
    applySetting(params, "centrality", "Spread");
    applySetting(params, "percent_to_vaccinate", "20");
    applySetting(params, "model", "sis");
    applySetting(params, "trials", "7");
    applySetting(params, "rounds", "12");
    applySetting(params, "pb", "0.25");
    applySetting(params, "pd", "1e-1");
    applySetting(params, "seed", "123456789012");
    applySetting(params, "parallel", "yes");
    applySetting(params, "threads", "3");
    applySetting(params, "log_level", "debug");

    EXPECT_EQ(params.strategy.value(), SelectionStrategy::Recursive);
    EXPECT_EQ(params.centrality.value(), CentralityMeasure::Spread);
    EXPECT_EQ(params.percent_to_vaccinate, 20);
    EXPECT_EQ(params.model, PropagationModel::SIS);
    EXPECT_EQ(params.trials, 7);
    EXPECT_EQ(params.rounds, 12);
    EXPECT_DOUBLE_EQ(params.pb, 0.25);
    EXPECT_DOUBLE_EQ(params.pd, 0.1);
    EXPECT_EQ(params.seed, 123456789012ULL);
    EXPECT_TRUE(params.parallel);
    EXPECT_EQ(params.threads, 3);
    EXPECT_EQ(params.log_level, "debug");
    EXPECT_NO_THROW(params.validate());
}

TEST_F(SimulationParametersTest, Patient0Accumulates) {
    applySetting(params, "patient0", "a;b");
    applySetting(params, "patient0", "c");
    EXPECT_EQ(params.patient0, (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(SimulationParametersTest, MalformedValuesThrow) {
    EXPECT_THROW(applySetting(params, "trials", "ten"), InvalidParameterException);
    EXPECT_THROW(applySetting(params, "trials", "10x"), InvalidParameterException);
    EXPECT_THROW(applySetting(params, "pb", "abc"), InvalidParameterException);
    EXPECT_THROW(applySetting(params, "seed", "-1"), InvalidParameterException);
    EXPECT_THROW(applySetting(params, "parallel", "maybe"), InvalidParameterException);
    EXPECT_THROW(applySetting(params, "strategy", "random"), InvalidParameterException);
    EXPECT_THROW(applySetting(params, "log_level", "verbose"), InvalidParameterException);
    EXPECT_THROW(applySetting(params, "no_such_key", "1"), InvalidParameterException);
}

TEST_F(SimulationParametersTest, ValidateRanges) {
    SimulationParameters p = params;
    p.percent_to_vaccinate = 0;
    EXPECT_THROW(p.validate(), InvalidParameterException);
    p = params; p.percent_to_vaccinate = 100;
    EXPECT_THROW(p.validate(), InvalidParameterException);
    p = params; p.pb = 1.01;
    EXPECT_THROW(p.validate(), InvalidParameterException);
    p = params; p.pd = -0.5;
    EXPECT_THROW(p.validate(), InvalidParameterException);
    p = params; p.trials = 0;
    EXPECT_THROW(p.validate(), InvalidParameterException);
    p = params; p.rounds = -3;
    EXPECT_THROW(p.validate(), InvalidParameterException);
    p = params; p.threads = -1;
    EXPECT_THROW(p.validate(), InvalidParameterException);
    p = params; p.graph_file.clear();
    EXPECT_THROW(p.validate(), InvalidParameterException);
    p = params; p.output_file.clear();
    EXPECT_THROW(p.validate(), InvalidParameterException);
}

TEST_F(SimulationParametersTest, StrategyRequiresCentrality) {
    params.strategy = SelectionStrategy::Batch;
    EXPECT_THROW(params.validate(), InvalidParameterException);
    params.centrality = CentralityMeasure::Degree;
    EXPECT_NO_THROW(params.validate());
}

TEST_F(SimulationParametersTest, RecoveryRuleSettings) {
    EXPECT_EQ(params.recovery_rule, RecoveryRule::Bernoulli);

    applySetting(params, "recovery", "uniform");
    applySetting(params, "min_t", "3");
    applySetting(params, "max_t", "7");
    applySetting(params, "mu", "4.5");
    applySetting(params, "sigma", "1.5");

    RecoveryParameters recovery = params.recoveryParameters();
    EXPECT_EQ(recovery.rule, RecoveryRule::Uniform);
    EXPECT_EQ(recovery.min_t, 3);
    EXPECT_EQ(recovery.max_t, 7);
    EXPECT_DOUBLE_EQ(recovery.mu, 4.5);
    EXPECT_DOUBLE_EQ(recovery.sigma, 1.5);
    EXPECT_DOUBLE_EQ(recovery.pd, params.pd);
    EXPECT_NO_THROW(params.validate());

    EXPECT_THROW(applySetting(params, "recovery", "weibull"), InvalidParameterException);
    EXPECT_THROW(applySetting(params, "min_t", "two"), InvalidParameterException);
}

TEST_F(SimulationParametersTest, ValidateRecoveryRanges) {
    SimulationParameters p = params;
    p.recovery_rule = RecoveryRule::Uniform;
    p.min_t = 5; p.max_t = 4;
    EXPECT_THROW(p.validate(), InvalidParameterException);
    p.min_t = 0; p.max_t = 4;
    EXPECT_THROW(p.validate(), InvalidParameterException);

    p = params;
    p.recovery_rule = RecoveryRule::Normal;
    p.sigma = 0.0;
    EXPECT_THROW(p.validate(), InvalidParameterException);

    // Settings of an unselected rule are not checked
    p = params;
    p.sigma = -1.0;
    p.min_t = 0;
    EXPECT_NO_THROW(p.validate());
}
