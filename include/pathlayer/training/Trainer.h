#pragma once

#include "Dataset.h"
#include "Embedding.h"
#include "Optimizer.h"
#include "pathlayer/config/TrainingOptions.h"
#include "pathlayer/loss/IStructuredLoss.h"
#include "pathlayer/solvers/Maximizers.h"

#include <functional>
#include <optional>
#include <vector>

namespace pathlayer {

/// Metrics recorded after one epoch
struct EpochSummary {
    int epoch = 0;                    ///< 1-based
    double trainLoss = 0.0;           ///< Summed loss divided by the train size
    double testLoss = 0.0;            ///< Summed loss divided by the test size
    std::optional<double> trainGap;   ///< Cost gap in percent
    std::optional<double> testGap;
};

/// Learning curves of one training run
struct TrainingHistory {
    std::vector<double> trainLosses;              ///< One entry per epoch
    std::vector<double> testLosses;
    std::vector<std::optional<double>> trainGaps; ///< nbEpochs + 1 entries, before training first
    std::vector<std::optional<double>> testGaps;

    size_t epochs() const { return trainLosses.size(); }
};

/// Minibatch gradient descent of a cost embedding through a structured loss.
///
/// For each minibatch the loss gradients with respect to theta are pulled back
/// through the embedding, summed, and handed to the optimizer. Train loss is
/// accumulated during the epoch and test loss evaluated after it; cost gaps
/// are measured with the unperturbed maximizer.
class Trainer {
public:
    using EpochCallback = std::function<void(const EpochSummary&)>;

    /// @throws std::invalid_argument if the options are invalid
    explicit Trainer(TrainingOptions options);

    const TrainingOptions& options() const { return options_; }

    void setEpochCallback(EpochCallback callback) { onEpoch_ = std::move(callback); }

    /// @throws std::invalid_argument if the training set is empty
    TrainingHistory train(ICostEmbedding& embedding,
                          const IStructuredLoss& loss,
                          IOptimizer& optimizer,
                          const Maximizer& maximizer,
                          const MaximizerContext& context,
                          const Dataset& trainData,
                          const Dataset& testData) const;

private:
    double totalLoss(const ICostEmbedding& embedding, const IStructuredLoss& loss,
                     const Dataset& data, RandomEngine& rng) const;

    TrainingOptions options_;
    EpochCallback onEpoch_;
};

}  // namespace pathlayer
