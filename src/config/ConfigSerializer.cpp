#include "pathlayer/config/ExperimentConfig.h"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace pathlayer {

std::string learningModeToString(LearningMode mode) {
    switch (mode) {
        case LearningMode::Imitation: return "imitation";
        case LearningMode::Experience: return "experience";
    }
    return "imitation";
}

LearningMode learningModeFromString(const std::string& name) {
    if (name == "imitation") return LearningMode::Imitation;
    if (name == "experience") return LearningMode::Experience;
    throw std::invalid_argument("Unknown learning mode: '" + name + "'");
}

std::string ConfigSerializer::toJson(const ExperimentConfig& config) {
    json j;
    j["version"] = 1;
    j["mode"] = learningModeToString(config.mode);

    json solver = {
        {"maximizer", config.solver.maximizer},
        {"connectivity", connectivityToString(config.solver.connectivity)}
    };
    if (config.solver.lengthMax) {
        solver["lengthMax"] = *config.solver.lengthMax;
    }
    j["solver"] = solver;

    json perturbation = {
        {"epsilon", config.perturbation.epsilon},
        {"nbSamples", config.perturbation.nbSamples},
        {"numThreads", config.perturbation.numThreads}
    };
    if (config.perturbation.seed) {
        perturbation["seed"] = *config.perturbation.seed;
    }
    j["perturbation"] = perturbation;

    json training = {
        {"nbEpochs", config.training.nbEpochs},
        {"batchSize", config.training.batchSize},
        {"learningRate", config.training.learningRate},
        {"trainProportion", config.training.trainProportion}
    };
    if (config.training.seed) {
        training["seed"] = *config.training.seed;
    }
    j["training"] = training;

    return j.dump(2);
}

ExperimentConfig ConfigSerializer::fromJson(const std::string& jsonStr) {
    ExperimentConfig config;
    try {
        json j = json::parse(jsonStr);

        if (j.contains("mode")) {
            config.mode = learningModeFromString(j["mode"].get<std::string>());
        }

        if (j.contains("solver")) {
            const auto& s = j["solver"];
            config.solver.maximizer = s.value("maximizer", config.solver.maximizer);
            if (s.contains("connectivity")) {
                config.solver.connectivity = connectivityFromString(s["connectivity"].get<std::string>());
            }
            if (s.contains("lengthMax") && !s["lengthMax"].is_null()) {
                const auto& bound = s["lengthMax"];
                if (!bound.is_number_integer() || (!bound.is_number_unsigned() && bound.get<int64_t>() < 0)) {
                    throw std::invalid_argument("solver.lengthMax must be a non-negative integer, got " +
                                                bound.dump());
                }
                config.solver.lengthMax = s["lengthMax"].get<size_t>();
            }
        }

        if (j.contains("perturbation")) {
            const auto& p = j["perturbation"];
            auto& target = config.perturbation;
            target.epsilon = p.value("epsilon", target.epsilon);
            target.nbSamples = p.value("nbSamples", target.nbSamples);
            target.numThreads = p.value("numThreads", target.numThreads);
            if (p.contains("seed") && !p["seed"].is_null()) {
                target.seed = p["seed"].get<uint64_t>();
            }
        }

        if (j.contains("training")) {
            const auto& t = j["training"];
            auto& target = config.training;
            target.nbEpochs = t.value("nbEpochs", target.nbEpochs);
            target.batchSize = t.value("batchSize", target.batchSize);
            target.learningRate = t.value("learningRate", target.learningRate);
            target.trainProportion = t.value("trainProportion", target.trainProportion);
            if (t.contains("seed") && !t["seed"].is_null()) {
                target.seed = t["seed"].get<uint64_t>();
            }
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid experiment configuration: ") + e.what());
    }
    return config;
}

bool ConfigSerializer::saveToFile(const ExperimentConfig& config, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) return false;
    file << toJson(config);
    return static_cast<bool>(file);
}

ExperimentConfig ConfigSerializer::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str());
}

}  // namespace pathlayer
