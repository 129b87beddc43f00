#pragma once

#include <stdexcept>
#include <string>
#include <optional>

namespace superlearner
{
  class StackingException : public std::runtime_error
  {
  public:
    explicit StackingException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~StackingException() noexcept override = default;
  };

  // Invalid fold count, empty learner set, malformed ranges or bin widths.
  // Always raised before any training starts.
  class StackingConfigurationException : public StackingException
  {
  public:
    explicit StackingConfigurationException(const std::string& msg)
      : StackingException(msg)
    {}
  };

  /**
   * @brief A learner failed to train (or produced unusable predictions) on a
   * specific fold, or on the full data set when getFold() is empty.
   *
   * A partially filled prediction matrix is never returned, so this aborts
   * the whole run.
   */
  class LearnerTrainingException : public StackingException
  {
  public:
    LearnerTrainingException(const std::string& learnerName,
			     std::optional<unsigned int> fold,
			     const std::string& reason)
      : StackingException(formatMessage(learnerName, fold, reason)),
	mLearnerName(learnerName),
	mFold(fold),
	mReason(reason)
    {}

    const std::string& getLearnerName() const
    {
      return mLearnerName;
    }

    std::optional<unsigned int> getFold() const
    {
      return mFold;
    }

    bool isFullDataFit() const
    {
      return !mFold.has_value();
    }

    const std::string& getReason() const
    {
      return mReason;
    }

  private:
    static std::string formatMessage(const std::string& learnerName,
				     std::optional<unsigned int> fold,
				     const std::string& reason)
    {
      const std::string where = fold ? ("fold " + std::to_string(*fold)) : std::string("full data");
      return "Learner '" + learnerName + "' failed on " + where + ": " + reason;
    }

    std::string mLearnerName;
    std::optional<unsigned int> mFold;
    std::string mReason;
  };

  // Weight solver did not converge, or an objective became non-finite.
  class NumericalInstabilityException : public StackingException
  {
  public:
    explicit NumericalInstabilityException(const std::string& msg)
      : StackingException(msg)
    {}
  };
}
