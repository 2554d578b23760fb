#include <gtest/gtest.h>
#include <pathlayer/loss/PerturbedCostLoss.h>
#include <pathlayer/training/Metrics.h>
#include "../infrastructure/SyntheticDataset.h"

using namespace pathlayer;

class PerturbedCostLossTest : public ::testing::Test {
protected:
    void SetUp() override {
        RandomEngine rng = makeRandomEngine(31);
        dataset_ = test::makeSyntheticDataset(5, test::SyntheticGenerator{}, rng);
        theta_ = -test::randomCosts(5, 5, rng);
    }

    PerturbationConfig config_ = PerturbationConfig{}.withEpsilon(0.5).withSamples(8);
    Dataset dataset_;
    CostMatrix theta_;
};

TEST_F(PerturbedCostLossTest, LinearCostMatchesLayerPullback) {
    PerturbedAdditive layer(bellmanMaximizer, config_);
    PerturbedCostLoss loss(layer);
    const DataPoint& point = dataset_.front();

    RandomEngine rngLoss = makeRandomEngine(4);
    RandomEngine rngLayer = makeRandomEngine(4);

    LossEvaluation eval = loss.evaluate(theta_, point, rngLoss);
    PerturbedSamples samples = layer.sample(theta_, {}, rngLayer);

    double expectedValue = 0.0;
    for (const auto& y : samples.solutions) {
        expectedValue += solutionCost(y, point.trueCosts);
    }
    expectedValue /= static_cast<double>(samples.size());

    EXPECT_NEAR(eval.value, expectedValue, 1e-12);
    EXPECT_TRUE(eval.gradient.isApprox(PerturbedAdditive::pullback(samples, point.trueCosts), 1e-12));
}

TEST_F(PerturbedCostLossTest, NeverBelowOptimalCost) {
    PerturbedCostLoss loss(PerturbedAdditive(bellmanMaximizer, config_));
    RandomEngine rng = makeRandomEngine(9);

    for (const auto& point : dataset_) {
        double optimal = solutionCost(point.truePath, point.trueCosts);
        EXPECT_GE(loss.evaluate(theta_, point, rng).value, optimal - 1e-9);
    }
}

TEST_F(PerturbedCostLossTest, BlackBoxCostIsCalledPerSample) {
    int calls = 0;
    SolutionCostFunction cellCount = [&calls](const PathMatrix& y, const DataPoint&) {
        ++calls;
        return y.sum();
    };
    PerturbedCostLoss loss(PerturbedAdditive(bellmanMaximizer, config_), {}, cellCount);
    RandomEngine rng = makeRandomEngine(1);

    LossEvaluation eval = loss.evaluate(theta_, dataset_.front(), rng);

    EXPECT_EQ(calls, 8);
    EXPECT_GE(eval.value, 5.0);
    EXPECT_EQ(eval.gradient.rows(), 5);
    EXPECT_STREQ(loss.name(), "PerturbedCost");
}

TEST_F(PerturbedCostLossTest, SingleSampleGradientIsScaledNoise) {
    SolutionCostFunction constant = [](const PathMatrix&, const DataPoint&) { return 2.0; };
    PerturbationConfig single = config_;
    single.nbSamples = 1;

    PerturbedCostLoss loss(PerturbedAdditive(bellmanMaximizer, single), {}, constant);
    RandomEngine rngLoss = makeRandomEngine(6);
    RandomEngine rngLayer = makeRandomEngine(6);

    LossEvaluation eval = loss.evaluate(theta_, dataset_.front(), rngLoss);
    PerturbedSamples samples = PerturbedAdditive(bellmanMaximizer, single).sample(theta_, {}, rngLayer);

    // cost * Z / epsilon
    EXPECT_DOUBLE_EQ(eval.value, 2.0);
    EXPECT_TRUE(eval.gradient.isApprox(2.0 * samples.noise[0] / 0.5, 1e-12));
}

TEST_F(PerturbedCostLossTest, RequiresPositiveEpsilon) {
    PerturbedAdditive unperturbed(bellmanMaximizer, PerturbationConfig{}.withEpsilon(0.0));
    PerturbedAdditive perturbed(bellmanMaximizer, config_);

    EXPECT_THROW({ PerturbedCostLoss loss(unperturbed); }, std::invalid_argument);
    EXPECT_THROW({ PerturbedCostLoss loss(perturbed, {}, SolutionCostFunction{}); }, std::invalid_argument);
}
