#include <pathlayer/pathlayer.h>
#include <pathlayer/common/Logger.h>
#include <fmt/format.h>
#include <cmath>
#include <iostream>
#include <memory>

namespace {

using namespace pathlayer;

// Random two-channel "images" whose true cell costs are a softplus of a fixed
// linear combination of the channels
Dataset makeDataset(size_t n, int size, Connectivity connectivity, RandomEngine& rng) {
    std::uniform_real_distribution<double> uniform(0.0, 1.0);
    MaximizerContext context;
    context.connectivity = connectivity;

    Dataset data;
    for (size_t k = 0; k < n; ++k) {
        DataPoint point;
        for (int c = 0; c < 2; ++c) {
            Eigen::MatrixXd channel(size, size);
            for (Eigen::Index i = 0; i < channel.size(); ++i) {
                channel.data()[i] = uniform(rng);
            }
            point.features.push_back(channel);
        }
        Eigen::MatrixXd z = (0.2 + 3.0 * point.features[0].array() - 1.5 * point.features[1].array()).matrix();
        point.trueCosts = z.unaryExpr([](double v) { return std::log1p(std::exp(v)); });
        point.truePath = dijkstraMaximizer(-point.trueCosts, context);
        data.push_back(std::move(point));
    }
    return data;
}

std::string formatGap(const std::optional<double>& gap) {
    return gap ? fmt::format("{:6.2f}%", *gap) : std::string("   n/a ");
}

}  // namespace

int main(int argc, char** argv) {
    using namespace pathlayer;

    Logger::initialize();

    ExperimentConfig config;
    config.training.nbEpochs = 20;
    config.training.learningRate = 0.05;
    config.training.seed = 0;
    config.perturbation.seed = 0;

    try {
        if (argc > 1) {
            config = ConfigSerializer::loadFromFile(argv[1]);
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 1;
    }

    std::cout << "pathlayer " << versionString() << "\n"
              << ConfigSerializer::toJson(config) << "\n";

    RandomEngine dataRng = makeRandomEngine(config.perturbation.seed);
    Dataset data = makeDataset(100, 8, config.solver.connectivity, dataRng);
    auto [train, test] = trainTestSplit(data, config.training.trainProportion);

    Maximizer maximizer = config.solver.resolveMaximizer();
    MaximizerContext context = config.solver.context();
    PerturbedAdditive layer(maximizer, config.perturbation);

    std::unique_ptr<IStructuredLoss> loss;
    if (config.mode == LearningMode::Imitation) {
        loss = std::make_unique<FenchelYoungLoss>(layer, context);
    } else {
        loss = std::make_unique<PerturbedCostLoss>(layer, context);
    }

    LinearCellEmbedding model(2);
    RandomEngine initRng = makeRandomEngine(config.training.seed);
    model.initialize(initRng);
    AdamOptimizer adam(config.training.learningRate);

    Trainer trainer(config.training);
    trainer.setEpochCallback([](const EpochSummary& summary) {
        std::cout << fmt::format("epoch {:3d}  loss {:9.4f} / {:9.4f}  gap {} / {}\n",
                                 summary.epoch, summary.trainLoss, summary.testLoss,
                                 formatGap(summary.trainGap), formatGap(summary.testGap));
    });

    try {
        TrainingHistory history = trainer.train(model, *loss, adam, maximizer, context, train, test);
        std::cout << "final test gap: " << formatGap(history.testGaps.back()) << "\n";
    } catch (const std::exception& e) {
        LOG_ERROR("Training failed: {}", e.what());
        return 1;
    }

    ParameterVector params = model.parameters();
    std::cout << fmt::format("learned weights [{:.3f}, {:.3f}], bias {:.3f}\n",
                             params(0), params(1), params(2));
    return 0;
}
