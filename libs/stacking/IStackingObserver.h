#pragma once

#include <optional>
#include <string>
#include <cstddef>

namespace superlearner {

// One completed (learner, fold) training + prediction unit. fold is empty
// for the full-data fit.
struct StackingUnitRecord {
    std::string learnerName;
    std::optional<unsigned int> fold;
    std::size_t trainingRows = 0;
    std::size_t predictedRows = 0;
    double elapsedSeconds = 0.0;
};

// Notified from worker threads; implementations synchronise themselves.
class IStackingObserver {
public:
    virtual ~IStackingObserver() = default;
    virtual void onUnitCompleted(const StackingUnitRecord& record) = 0;
};

class NullStackingObserver : public IStackingObserver {
public:
    NullStackingObserver() = default;
    ~NullStackingObserver() override = default;

    void onUnitCompleted(const StackingUnitRecord& /*record*/) override {}
};

} // namespace superlearner
