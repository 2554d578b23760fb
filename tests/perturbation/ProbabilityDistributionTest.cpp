#include <gtest/gtest.h>
#include <pathlayer/common/Logger.h>
#include <pathlayer/perturbation/ProbabilityDistribution.h>

using namespace pathlayer;

class ProbabilityDistributionTest : public ::testing::Test {
protected:
    void SetUp() override {
        a_ = PathMatrix::Zero(2, 2);
        a_(0, 0) = 1.0;
        a_(1, 1) = 1.0;

        b_ = a_;
        b_(0, 1) = 1.0;

        c_ = a_;
        c_(1, 0) = 1.0;
    }

    PathMatrix a_;
    PathMatrix b_;
    PathMatrix c_;
};

TEST_F(ProbabilityDistributionTest, ConstructorValidatesInputs) {
    EXPECT_THROW(FixedAtomsProbabilityDistribution({a_, b_}, {1.0}), std::invalid_argument);
    EXPECT_THROW(FixedAtomsProbabilityDistribution({a_, PathMatrix::Zero(3, 3)}, {0.5, 0.5}),
                 std::invalid_argument);
    EXPECT_THROW(FixedAtomsProbabilityDistribution({a_, b_}, {1.5, -0.5}), std::invalid_argument);
}

TEST_F(ProbabilityDistributionTest, CompressMergesRepeatedAtoms) {
    FixedAtomsProbabilityDistribution dist({a_, b_, a_, c_, b_, a_}, std::vector<double>(6, 1.0 / 6.0));

    dist.compress();

    ASSERT_EQ(dist.size(), 3u);
    EXPECT_TRUE(dist.atoms()[0] == a_);
    EXPECT_TRUE(dist.atoms()[1] == b_);
    EXPECT_TRUE(dist.atoms()[2] == c_);
    EXPECT_NEAR(dist.weights()[0], 0.5, 1e-12);
    EXPECT_NEAR(dist.weights()[1], 1.0 / 3.0, 1e-12);
    EXPECT_NEAR(dist.weights()[2], 1.0 / 6.0, 1e-12);
    EXPECT_TRUE(dist.isNormalized());
}

TEST_F(ProbabilityDistributionTest, CompressIsIdempotent) {
    FixedAtomsProbabilityDistribution dist({b_, a_, b_, b_}, {0.1, 0.2, 0.3, 0.4});
    dist.compress();

    FixedAtomsProbabilityDistribution again = dist.compressed();

    ASSERT_EQ(again.size(), dist.size());
    for (size_t i = 0; i < dist.size(); ++i) {
        EXPECT_TRUE(again.atoms()[i] == dist.atoms()[i]);
        EXPECT_NEAR(again.weights()[i], dist.weights()[i], 1e-12);
    }
}

TEST_F(ProbabilityDistributionTest, DistinctAtomsUnchanged) {
    FixedAtomsProbabilityDistribution dist({a_, b_, c_}, {0.2, 0.3, 0.5});

    dist.compress(0.0);

    ASSERT_EQ(dist.size(), 3u);
    EXPECT_TRUE(dist.atoms()[0] == a_);
    EXPECT_TRUE(dist.atoms()[2] == c_);
    EXPECT_DOUBLE_EQ(dist.weights()[1], 0.3);
}

TEST_F(ProbabilityDistributionTest, ToleranceMergesNearbyAtoms) {
    PathMatrix nearA = a_;
    nearA(0, 1) = 1e-3;

    FixedAtomsProbabilityDistribution dist({a_, nearA}, {0.5, 0.5});

    EXPECT_EQ(dist.compressed(0.0).size(), 2u);
    EXPECT_EQ(dist.compressed(1e-2).size(), 1u);
}

TEST_F(ProbabilityDistributionTest, CompressedLeavesOriginalUntouched) {
    FixedAtomsProbabilityDistribution dist({a_, a_}, {0.5, 0.5});

    auto merged = dist.compressed();

    EXPECT_EQ(merged.size(), 1u);
    EXPECT_EQ(dist.size(), 2u);
}

TEST_F(ProbabilityDistributionTest, ExpectationIsWeightedMean) {
    FixedAtomsProbabilityDistribution dist({a_, b_}, {0.25, 0.75});

    PathMatrix mean = dist.expectation();

    EXPECT_NEAR(mean(0, 0), 1.0, 1e-12);
    EXPECT_NEAR(mean(0, 1), 0.75, 1e-12);
    EXPECT_NEAR(mean(1, 0), 0.0, 1e-12);
}

TEST_F(ProbabilityDistributionTest, CompressionPreservesExpectation) {
    FixedAtomsProbabilityDistribution dist({a_, b_, a_, c_, b_}, std::vector<double>(5, 0.2));

    PathMatrix before = dist.expectation();
    dist.compress();

    EXPECT_TRUE(dist.expectation().isApprox(before, 1e-12));
}

TEST_F(ProbabilityDistributionTest, ExpectationOfEmptyThrows) {
    FixedAtomsProbabilityDistribution dist;
    EXPECT_THROW(dist.expectation(), std::logic_error);
}

TEST_F(ProbabilityDistributionTest, UnnormalizedWeightsWarnWithoutRenormalizing) {
    Logger::clearCapturedLogs();
    Logger::enableCapture(true);

    FixedAtomsProbabilityDistribution dist({a_}, {0.5});
    PathMatrix mean = dist.expectation();

    Logger::enableCapture(false);
    EXPECT_NEAR(mean(0, 0), 0.5, 1e-12);
    EXPECT_FALSE(Logger::getCapturedLogs("expected 1").empty());
    Logger::clearCapturedLogs();
}
