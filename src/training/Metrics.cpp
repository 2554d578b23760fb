#include "pathlayer/training/Metrics.h"
#include "pathlayer/common/Logger.h"

#include <cmath>
#include <stdexcept>

namespace pathlayer {

namespace {
constexpr double ZERO_COST_TOLERANCE = 1e-12;
}

double solutionCost(const PathMatrix& y, const CostMatrix& cTrue) {
    if (y.rows() != cTrue.rows() || y.cols() != cTrue.cols()) {
        throw std::invalid_argument("Path and cost matrices differ in shape");
    }
    return y.cwiseProduct(cTrue).sum();
}

std::optional<double> costRatio(const CostMatrix& thetaPredicted,
                                const PathMatrix& yTrue,
                                const CostMatrix& cTrue,
                                const Maximizer& maximizer,
                                const MaximizerContext& context) {
    PathMatrix yPredicted = maximizer(thetaPredicted, context);
    if (yPredicted.isZero()) {
        LOG_WARN("[costRatio] No path under the predicted costs");
        return std::nullopt;
    }

    double reference = solutionCost(yTrue, cTrue);
    if (std::abs(reference) < ZERO_COST_TOLERANCE) {
        LOG_WARN("[costRatio] Reference path has zero cost");
        return std::nullopt;
    }
    return solutionCost(yPredicted, cTrue) / reference;
}

std::optional<double> costRatio(const ICostEmbedding& model,
                                const DataPoint& point,
                                const Maximizer& maximizer,
                                const MaximizerContext& context) {
    return costRatio(model.forward(point.features), point.truePath, point.trueCosts,
                     maximizer, context);
}

std::optional<double> costGap(const ICostEmbedding& model,
                              const Dataset& data,
                              const Maximizer& maximizer,
                              const MaximizerContext& context) {
    double sum = 0.0;
    size_t counted = 0;
    for (const auto& point : data) {
        if (auto ratio = costRatio(model, point, maximizer, context)) {
            sum += *ratio;
            ++counted;
        }
    }
    if (counted == 0) {
        return std::nullopt;
    }
    if (counted < data.size()) {
        LOG_DEBUG("[costGap] {} of {} points skipped", data.size() - counted, data.size());
    }
    return (sum / static_cast<double>(counted) - 1.0) * 100.0;
}

}  // namespace pathlayer
