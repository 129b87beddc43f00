#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include "Dataset.h"
#include "FunctionLearner.h"
#include "Learner.h"

namespace superlearner
{
  namespace testing
  {
    // Columns: rowId, signal (equal to the label), noise in (0,1).
    inline Dataset makeSignalDataset(std::size_t numRows, std::uint64_t seed = 7)
    {
      std::mt19937_64 rng(seed);
      std::uniform_real_distribution<double> uniform(0.01, 0.99);

      std::vector<Observation> observations;
      observations.reserve(numRows);
      for (std::size_t i = 0; i < numRows; ++i)
	{
	  // Alternating labels keep both classes in every contiguous fold.
	  const int label = static_cast<int>(i % 2);
	  observations.push_back(Observation{ { static_cast<double>(i), static_cast<double>(label), uniform(rng) },
					      label,
					      "G" + std::to_string(i / 4) });
	}
      return Dataset({ "RowId", "Signal", "Noise" }, std::move(observations));
    }

    // Predicts one feature column clamped to [0,1], or its complement.
    inline std::shared_ptr<const ILearner> makeColumnLearner(const std::string& name,
							     std::size_t column,
							     bool inverted = false)
    {
      return makeFunctionLearner<std::size_t>(name,
					      [column](const FeatureMatrix&, const std::vector<int>&) {
						return column;
					      },
					      [inverted](const std::size_t& c, const FeatureMatrix& x) {
						std::vector<double> out;
						out.reserve(x.getNumRows());
						for (std::size_t i = 0; i < x.getNumRows(); ++i)
						  {
						    const double v = std::clamp(x(i, c), 0.0, 1.0);
						    out.push_back(inverted ? 1.0 - v : v);
						  }
						return out;
					      });
    }

    // Remembers the label of every training row by its id (column 0) and
    // returns it for rows it has seen; unseen rows get 0.5.
    inline std::shared_ptr<const ILearner> makeMemorisingLearner(const std::string& name = "memoriser")
    {
      using Memory = std::map<long, int>;
      return makeFunctionLearner<Memory>(name,
					 [](const FeatureMatrix& x, const std::vector<int>& y) {
					   Memory memory;
					   for (std::size_t i = 0; i < x.getNumRows(); ++i)
					     memory[static_cast<long>(x(i, 0))] = y[i];
					   return memory;
					 },
					 [](const Memory& memory, const FeatureMatrix& x) {
					   std::vector<double> out;
					   out.reserve(x.getNumRows());
					   for (std::size_t i = 0; i < x.getNumRows(); ++i)
					     {
					       auto it = memory.find(static_cast<long>(x(i, 0)));
					       out.push_back(it == memory.end() ? 0.5 : static_cast<double>(it->second));
					     }
					   return out;
					 });
    }

    // Throws whenever the training rows do not include rowId 0, which with
    // contiguous folds happens only on fold 0.
    inline std::shared_ptr<const ILearner> makeFailsWithoutFirstRowLearner(const std::string& name = "fragile")
    {
      return makeFunctionLearner<int>(name,
				      [](const FeatureMatrix& x, const std::vector<int>&) {
					for (std::size_t i = 0; i < x.getNumRows(); ++i)
					  if (x(i, 0) == 0.0)
					    return 0;
					throw std::runtime_error("singular design");
				      },
				      [](const int&, const FeatureMatrix& x) {
					return std::vector<double>(x.getNumRows(), 0.5);
				      });
    }

    // Returns a fixed probability for every row.
    inline std::shared_ptr<const ILearner> makeConstantLearner(const std::string& name, double value)
    {
      return makeFunctionLearner<double>(name,
					 [value](const FeatureMatrix&, const std::vector<int>&) { return value; },
					 [](const double& v, const FeatureMatrix& x) {
					   return std::vector<double>(x.getNumRows(), v);
					 });
    }
  }
}
