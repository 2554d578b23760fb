#pragma once

#include "PerturbationConfig.h"
#include "SolverConfig.h"
#include "TrainingOptions.h"

#include <string>

namespace pathlayer {

/// Which structured loss drives training
enum class LearningMode {
    Imitation,   ///< Fenchel-Young loss against labelled paths
    Experience   ///< Expected black-box path cost
};

std::string learningModeToString(LearningMode mode);

/// @throws std::invalid_argument for names other than "imitation" and "experience"
LearningMode learningModeFromString(const std::string& name);

/// Full configuration surface of a training run
struct ExperimentConfig {
    LearningMode mode = LearningMode::Imitation;
    SolverConfig solver;
    PerturbationConfig perturbation = PerturbationConfig::imitation();
    TrainingOptions training;

    void validate() const {
        solver.validate();
        perturbation.validate();
        training.validate();
    }
};

/// JSON serialization for ExperimentConfig
///
/// Missing keys keep their defaults, so a file may specify only the
/// hyperparameters it changes:
/// @code
/// { "perturbation": { "epsilon": 0.5, "nbSamples": 20 } }
/// @endcode
class ConfigSerializer {
public:
    static std::string toJson(const ExperimentConfig& config);

    /// @throws std::runtime_error if the JSON is malformed or has wrong types
    /// @throws std::invalid_argument on unknown enum names or a negative or
    ///         fractional solver.lengthMax
    static ExperimentConfig fromJson(const std::string& json);

    /// @return true if the file was written
    static bool saveToFile(const ExperimentConfig& config, const std::string& path);

    /// @throws std::runtime_error if the file cannot be read or parsed
    static ExperimentConfig loadFromFile(const std::string& path);
};

}  // namespace pathlayer
