#include <gtest/gtest.h>
#include <pathlayer/training/Embedding.h>

#include <cmath>

using namespace pathlayer;

class LinearCellEmbeddingTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng_ = makeRandomEngine(13);
        std::uniform_real_distribution<double> uniform(-1.0, 1.0);
        for (int c = 0; c < 3; ++c) {
            Eigen::MatrixXd channel(4, 6);
            for (Eigen::Index i = 0; i < channel.size(); ++i) {
                channel.data()[i] = uniform(rng_);
            }
            features_.push_back(channel);
        }
    }

    RandomEngine rng_;
    Features features_;
};

TEST_F(LinearCellEmbeddingTest, PredictionsAreNegative) {
    LinearCellEmbedding model(3);
    model.initialize(rng_, 2.0);

    CostMatrix theta = model.forward(features_);

    EXPECT_EQ(theta.rows(), 4);
    EXPECT_EQ(theta.cols(), 6);
    EXPECT_LT(theta.maxCoeff(), 0.0);
}

TEST_F(LinearCellEmbeddingTest, ZeroParametersGiveMinusLogTwo) {
    LinearCellEmbedding model(3);

    CostMatrix theta = model.forward(features_);

    EXPECT_NEAR(theta(0, 0), -std::log(2.0), 1e-12);
    EXPECT_NEAR(theta(3, 5), -std::log(2.0), 1e-12);
}

TEST_F(LinearCellEmbeddingTest, BackwardMatchesFiniteDifferences) {
    LinearCellEmbedding model(3);
    model.initialize(rng_, 0.5);

    CostMatrix dTheta(4, 6);
    std::normal_distribution<double> normal(0.0, 1.0);
    for (Eigen::Index i = 0; i < dTheta.size(); ++i) {
        dTheta.data()[i] = normal(rng_);
    }

    ParameterVector analytic = model.backward(features_, dTheta);

    const double h = 1e-6;
    ParameterVector base = model.parameters();
    for (Eigen::Index k = 0; k < base.size(); ++k) {
        ParameterVector plus = base;
        ParameterVector minus = base;
        plus(k) += h;
        minus(k) -= h;

        model.setParameters(plus);
        double up = model.forward(features_).cwiseProduct(dTheta).sum();
        model.setParameters(minus);
        double down = model.forward(features_).cwiseProduct(dTheta).sum();

        EXPECT_NEAR(analytic(k), (up - down) / (2.0 * h), 1e-5) << "parameter " << k;
    }
}

TEST_F(LinearCellEmbeddingTest, CloneIsIndependent) {
    LinearCellEmbedding model(3);
    model.initialize(rng_);

    auto copy = model.clone();
    ParameterVector shifted = (model.parameters().array() + 1.0).matrix();
    model.setParameters(shifted);

    EXPECT_FALSE(copy->parameters().isApprox(model.parameters()));
    EXPECT_EQ(copy->parameterCount(), 4u);
}

TEST_F(LinearCellEmbeddingTest, InvalidInputsThrow) {
    EXPECT_THROW(LinearCellEmbedding(0), std::invalid_argument);

    LinearCellEmbedding model(3);
    Features tooFew(features_.begin(), features_.begin() + 2);
    EXPECT_THROW(model.forward(tooFew), std::invalid_argument);
    EXPECT_THROW(model.setParameters(ParameterVector::Zero(3)), std::invalid_argument);
    EXPECT_THROW(model.backward(features_, CostMatrix::Zero(2, 2)), std::invalid_argument);

    Features ragged = features_;
    ragged[1] = Eigen::MatrixXd::Zero(3, 6);
    EXPECT_THROW(model.forward(ragged), std::invalid_argument);
}
