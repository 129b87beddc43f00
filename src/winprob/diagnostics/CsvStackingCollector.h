#pragma once
#include "IStackingObserver.h"
#include <fstream>
#include <mutex>
#include <string>

namespace winprob::diagnostics {

// Appends one CSV line per completed (learner, fold) training unit.
class CsvStackingCollector : public superlearner::IStackingObserver {
public:
    explicit CsvStackingCollector(const std::string& filepath);
    ~CsvStackingCollector() override;

    void onUnitCompleted(const superlearner::StackingUnitRecord& record) override;

private:
    void writeHeaderIfNeeded();

    std::string m_filepath;
    std::ofstream m_ofs;
    std::mutex m_mutex;
    bool m_headerWritten = false;
};

} // namespace winprob::diagnostics
