#pragma once

#include "Learner.h"
#include <unordered_map>
#include <vector>
#include <functional>
#include <memory>
#include <string>

namespace superlearner {

/**
 * @brief Descriptive information about a registered learner
 */
struct LearnerMetadata {
    std::string name;
    std::string description;
    std::string family;     // e.g. "parametric", "nonparametric", "baseline"
};

/**
 * @brief Function type for creating a learner from run parameters
 */
using LearnerFactoryFunction = std::function<std::shared_ptr<const ILearner>(const LearnerParameters&)>;

/**
 * @brief Central lookup table of base learners, keyed by name
 *
 * Callers select learners by name (for example from the run configuration
 * file) and receive a fresh instance built with the run's parameters. The
 * registry is populated once at start-up on the main thread.
 */
class LearnerRegistry {
public:
    /**
     * @brief Register (or replace) a learner factory
     *
     * @param metadata Learner metadata; metadata.name is the lookup key
     * @param factory Function creating the learner
     * @throws StackingConfigurationException if the name is empty or the factory is unset
     */
    static void registerLearner(const LearnerMetadata& metadata, LearnerFactoryFunction factory);

    /**
     * @brief Create one learner by name
     *
     * @throws StackingConfigurationException if the name is not registered
     */
    static std::shared_ptr<const ILearner> createLearner(const std::string& name,
                                                         const LearnerParameters& parameters);

    /**
     * @brief Create learners for a list of names, preserving order
     *
     * @throws StackingConfigurationException for an unknown or repeated name
     */
    static LearnerSet createLearners(const std::vector<std::string>& names,
                                     const LearnerParameters& parameters);

    static bool isLearnerAvailable(const std::string& name) {
        return factories_.find(name) != factories_.end();
    }

    /**
     * @brief Registered learner names in sorted order
     */
    static std::vector<std::string> getAvailableLearners();

    static const LearnerMetadata& getLearnerMetadata(const std::string& name);

    /**
     * @brief Clear all registered learners (mainly for testing)
     */
    static void clear() {
        metadata_.clear();
        factories_.clear();
    }

    static size_t size() {
        return factories_.size();
    }

private:
    static std::unordered_map<std::string, LearnerMetadata> metadata_;
    static std::unordered_map<std::string, LearnerFactoryFunction> factories_;
};

} // namespace superlearner
