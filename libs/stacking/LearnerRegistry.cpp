#include "LearnerRegistry.h"
#include "StackingException.h"
#include <algorithm>
#include <set>

namespace superlearner {

// Static member definitions
std::unordered_map<std::string, LearnerMetadata> LearnerRegistry::metadata_;
std::unordered_map<std::string, LearnerFactoryFunction> LearnerRegistry::factories_;

void LearnerRegistry::registerLearner(const LearnerMetadata& metadata, LearnerFactoryFunction factory)
{
    if (metadata.name.empty()) {
        throw StackingConfigurationException("LearnerRegistry: learner name must not be empty");
    }
    if (!factory) {
        throw StackingConfigurationException("LearnerRegistry: no factory supplied for '" + metadata.name + "'");
    }

    metadata_[metadata.name] = metadata;
    factories_[metadata.name] = std::move(factory);
}

std::shared_ptr<const ILearner> LearnerRegistry::createLearner(const std::string& name,
                                                               const LearnerParameters& parameters)
{
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        std::string known;
        for (const auto& available : getAvailableLearners()) {
            known += (known.empty() ? "" : ", ") + available;
        }
        throw StackingConfigurationException("Unknown learner '" + name + "' (registered: " + known + ")");
    }

    auto learner = it->second(parameters);
    if (!learner) {
        throw StackingConfigurationException("LearnerRegistry: factory for '" + name + "' returned null");
    }
    return learner;
}

LearnerSet LearnerRegistry::createLearners(const std::vector<std::string>& names,
                                           const LearnerParameters& parameters)
{
    std::set<std::string> seen;
    LearnerSet learners;
    learners.reserve(names.size());

    for (const std::string& name : names) {
        if (!seen.insert(name).second) {
            throw StackingConfigurationException("Learner '" + name + "' requested more than once");
        }
        learners.push_back(createLearner(name, parameters));
    }
    return learners;
}

std::vector<std::string> LearnerRegistry::getAvailableLearners()
{
    std::vector<std::string> names;
    names.reserve(factories_.size());
    for (const auto& pair : factories_) {
        names.push_back(pair.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

const LearnerMetadata& LearnerRegistry::getLearnerMetadata(const std::string& name)
{
    auto it = metadata_.find(name);
    if (it == metadata_.end()) {
        throw StackingConfigurationException("Learner not found: " + name);
    }
    return it->second;
}

} // namespace superlearner
