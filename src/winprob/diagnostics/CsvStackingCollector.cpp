#include "CsvStackingCollector.h"
#include <boost/filesystem.hpp>
#include <stdexcept>

namespace winprob::diagnostics
{
  CsvStackingCollector::CsvStackingCollector(const std::string& filepath)
    : m_filepath(filepath)
  {
    boost::system::error_code ec;
    if (boost::filesystem::exists(m_filepath, ec) && boost::filesystem::file_size(m_filepath, ec) > 0 && !ec) {
      m_headerWritten = true;
    }

    m_ofs.open(m_filepath, std::ios::out | std::ios::app);
    if (!m_ofs.is_open()) {
      throw std::runtime_error("Failed to open diagnostic file: " + m_filepath);
    }

    if (!m_headerWritten) {
      writeHeaderIfNeeded();
    }
  }

  CsvStackingCollector::~CsvStackingCollector() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_ofs.is_open()) m_ofs.close();
  }

  void CsvStackingCollector::writeHeaderIfNeeded()
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_headerWritten) return;

    m_ofs << "Learner,Fold,TrainingRows,PredictedRows,ElapsedSeconds\n";
    m_ofs.flush();
    m_headerWritten = true;
  }

  void CsvStackingCollector::onUnitCompleted(const superlearner::StackingUnitRecord& r)
  {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (!m_ofs.is_open()) return;

    m_ofs << r.learnerName << ",";
    if (r.fold)
      m_ofs << *r.fold;
    else
      m_ofs << "full";

    m_ofs << "," << r.trainingRows
          << "," << r.predictedRows
          << "," << r.elapsedSeconds << "\n";
    m_ofs.flush();
  }
}
