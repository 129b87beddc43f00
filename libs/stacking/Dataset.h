#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include "FeatureMatrix.h"

namespace superlearner
{
  /**
   * @brief One labelled row. groupId ties together rows that belong to the
   * same logical unit (e.g. the same game); fold assignment is positional
   * and does not consult it.
   */
  struct Observation
  {
    std::vector<double> features;
    int label = 0;
    std::string groupId;
  };

  /**
   * @class Dataset
   * @brief Immutable collection of observations with named feature columns.
   *
   * The feature matrix and label vector are materialised once at
   * construction; every pipeline stage reads them concurrently without
   * synchronisation.
   */
  class Dataset
  {
  public:
    /**
     * @throws StackingConfigurationException if there are no observations,
     *         a row has the wrong width or a label is not 0/1
     */
    Dataset(std::vector<std::string> featureNames, std::vector<Observation> observations);

    std::size_t getNumObservations() const
    {
      return mObservations.size();
    }

    std::size_t getNumFeatures() const
    {
      return mFeatureNames.size();
    }

    const std::vector<std::string>& getFeatureNames() const
    {
      return mFeatureNames;
    }

    // @throws StackingConfigurationException for an unknown column name
    std::size_t getFeatureIndex(const std::string& name) const;

    const Observation& getObservation(std::size_t row) const
    {
      return mObservations.at(row);
    }

    const FeatureMatrix& getFeatureMatrix() const
    {
      return mFeatures;
    }

    const std::vector<int>& getLabels() const
    {
      return mLabels;
    }

    FeatureMatrix selectFeatures(const std::vector<std::size_t>& rows) const
    {
      return mFeatures.selectRows(rows);
    }

    std::vector<int> selectLabels(const std::vector<std::size_t>& rows) const;

    std::size_t getNumPositives() const;

  private:
    std::vector<std::string> mFeatureNames;
    std::vector<Observation> mObservations;
    FeatureMatrix mFeatures;
    std::vector<int> mLabels;
  };
}
