#include "pathlayer/training/Trainer.h"
#include "pathlayer/common/Logger.h"
#include "pathlayer/training/Metrics.h"

#include <stdexcept>
#include <string>

namespace pathlayer {

namespace {

std::string formatGap(const std::optional<double>& gap) {
    return gap ? fmt::format("{:.2f}%", *gap) : std::string("n/a");
}

}  // namespace

Trainer::Trainer(TrainingOptions options) : options_(std::move(options)) {
    options_.validate();
}

double Trainer::totalLoss(const ICostEmbedding& embedding, const IStructuredLoss& loss,
                          const Dataset& data, RandomEngine& rng) const {
    double total = 0.0;
    for (const auto& point : data) {
        total += loss.evaluate(embedding.forward(point.features), point, rng).value;
    }
    return total;
}

TrainingHistory Trainer::train(ICostEmbedding& embedding,
                               const IStructuredLoss& loss,
                               IOptimizer& optimizer,
                               const Maximizer& maximizer,
                               const MaximizerContext& context,
                               const Dataset& trainData,
                               const Dataset& testData) const {
    if (trainData.empty()) {
        throw std::invalid_argument("Trainer needs a non-empty training set");
    }

    RandomEngine rng = makeRandomEngine(options_.seed);
    const auto batches = makeBatches(trainData, static_cast<size_t>(options_.batchSize));
    const double nTrain = static_cast<double>(trainData.size());
    const double nTest = static_cast<double>(testData.size());

    TrainingHistory history;
    history.trainGaps.push_back(costGap(embedding, trainData, maximizer, context));
    history.testGaps.push_back(costGap(embedding, testData, maximizer, context));

    LOG_INFO("[Trainer] {} loss, {} epochs, {} train / {} test, initial gap {} / {}",
             loss.name(), options_.nbEpochs, trainData.size(), testData.size(),
             formatGap(history.trainGaps.back()), formatGap(history.testGaps.back()));

    for (int epoch = 1; epoch <= options_.nbEpochs; ++epoch) {
        double trainLoss = 0.0;

        for (const auto& batch : batches) {
            ParameterVector grad = ParameterVector::Zero(static_cast<Eigen::Index>(embedding.parameterCount()));
            for (const auto& point : batch) {
                CostMatrix theta = embedding.forward(point.features);
                LossEvaluation eval = loss.evaluate(theta, point, rng);
                trainLoss += eval.value;
                grad += embedding.backward(point.features, eval.gradient);
            }
            ParameterVector params = embedding.parameters();
            optimizer.step(params, grad);
            embedding.setParameters(params);
        }

        EpochSummary summary;
        summary.epoch = epoch;
        summary.trainLoss = trainLoss / nTrain;
        summary.testLoss = testData.empty() ? 0.0 : totalLoss(embedding, loss, testData, rng) / nTest;
        summary.trainGap = costGap(embedding, trainData, maximizer, context);
        summary.testGap = costGap(embedding, testData, maximizer, context);

        history.trainLosses.push_back(summary.trainLoss);
        history.testLosses.push_back(summary.testLoss);
        history.trainGaps.push_back(summary.trainGap);
        history.testGaps.push_back(summary.testGap);

        LOG_INFO("[Trainer] epoch {}/{}: loss {:.4f} / {:.4f}, gap {} / {}",
                 epoch, options_.nbEpochs, summary.trainLoss, summary.testLoss,
                 formatGap(summary.trainGap), formatGap(summary.testGap));

        if (onEpoch_) {
            onEpoch_(summary);
        }
    }

    Logger::flush();
    return history;
}

}  // namespace pathlayer
