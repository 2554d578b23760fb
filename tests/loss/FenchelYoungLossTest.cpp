#include <gtest/gtest.h>
#include <pathlayer/loss/FenchelYoungLoss.h>
#include "../infrastructure/SyntheticDataset.h"

using namespace pathlayer;

class FenchelYoungLossTest : public ::testing::Test {
protected:
    void SetUp() override {
        RandomEngine rng = makeRandomEngine(17);
        dataset_ = test::makeSyntheticDataset(10, generator_, rng);
        theta_ = -test::randomCosts(generator_.height, generator_.width, rng);
    }

    static FenchelYoungLoss makeLoss(double epsilon, int samples) {
        return FenchelYoungLoss(PerturbedAdditive(bellmanMaximizer,
                                                  PerturbationConfig{}.withEpsilon(epsilon).withSamples(samples)));
    }

    test::SyntheticGenerator generator_;
    Dataset dataset_;
    CostMatrix theta_;
};

TEST_F(FenchelYoungLossTest, NonNegativeOnFeasibleTargets) {
    FenchelYoungLoss loss = makeLoss(0.1, 10);
    RandomEngine rng = makeRandomEngine(3);

    for (const auto& point : dataset_) {
        LossEvaluation eval = loss.evaluate(theta_, point.truePath, rng);
        EXPECT_GE(eval.value, -0.5);
    }
}

TEST_F(FenchelYoungLossTest, ExactlyNonNegativeWithoutPerturbation) {
    FenchelYoungLoss loss = makeLoss(0.0, 1);
    RandomEngine rng = makeRandomEngine(3);

    for (const auto& point : dataset_) {
        EXPECT_GE(loss.evaluate(theta_, point.truePath, rng).value, -1e-12);
    }
}

TEST_F(FenchelYoungLossTest, ZeroAtUnperturbedSolution) {
    FenchelYoungLoss loss = makeLoss(1e-6, 10);
    RandomEngine rng = makeRandomEngine(3);
    PathMatrix target = bellmanMaximizer(theta_, {});

    LossEvaluation eval = loss.evaluate(theta_, target, rng);

    EXPECT_NEAR(eval.value, 0.0, 1e-4);
    EXPECT_TRUE(eval.gradient.isZero());
}

TEST_F(FenchelYoungLossTest, GradientIsPointEstimateMinusTarget) {
    FenchelYoungLoss loss = makeLoss(0.5, 8);
    PerturbedAdditive layer(bellmanMaximizer, PerturbationConfig{}.withEpsilon(0.5).withSamples(8));
    const PathMatrix& target = dataset_.front().truePath;

    RandomEngine rngLoss = makeRandomEngine(12);
    RandomEngine rngLayer = makeRandomEngine(12);

    LossEvaluation eval = loss.evaluate(theta_, target, rngLoss);
    PathMatrix estimate = layer(theta_, {}, rngLayer);

    EXPECT_TRUE(eval.gradient.isApprox(estimate - target, 1e-12));
}

TEST_F(FenchelYoungLossTest, GradientVanishesOnlyAtTarget) {
    FenchelYoungLoss loss = makeLoss(0.0, 1);
    RandomEngine rng = makeRandomEngine(0);

    // theta equal to the true (negated) costs makes the labelled path optimal
    const DataPoint& point = dataset_.front();
    LossEvaluation atOptimum = loss.evaluate(-point.trueCosts, point, rng);
    EXPECT_TRUE(atOptimum.gradient.isZero());
    EXPECT_NEAR(atOptimum.value, 0.0, 1e-12);

    // Flipping the costs sends the oracle elsewhere
    LossEvaluation flipped = loss.evaluate(-point.trueCosts.reverse().eval(), point, rng);
    if (!(bellmanMaximizer(-point.trueCosts.reverse().eval(), {}) == point.truePath)) {
        EXPECT_FALSE(flipped.gradient.isZero());
        EXPECT_GT(flipped.value, 0.0);
    }
}

TEST_F(FenchelYoungLossTest, DataPointOverloadUsesTruePath) {
    FenchelYoungLoss loss = makeLoss(0.2, 4);
    RandomEngine rngA = makeRandomEngine(5);
    RandomEngine rngB = makeRandomEngine(5);

    LossEvaluation a = loss.evaluate(theta_, dataset_[1], rngA);
    LossEvaluation b = loss.evaluate(theta_, dataset_[1].truePath, rngB);

    EXPECT_DOUBLE_EQ(a.value, b.value);
    EXPECT_TRUE(a.gradient == b.gradient);
    EXPECT_STREQ(loss.name(), "FenchelYoung");
}

TEST_F(FenchelYoungLossTest, ShapeMismatchThrows) {
    FenchelYoungLoss loss = makeLoss(0.1, 2);
    RandomEngine rng = makeRandomEngine(0);

    EXPECT_THROW(loss.evaluate(theta_, PathMatrix::Zero(4, 5), rng), std::invalid_argument);
}
