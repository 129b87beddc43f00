#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <stdexcept>
#include "Learner.h"

namespace superlearner
{
  /**
   * @class FunctionLearner
   * @brief Adapts a {name, train, predict} triple of callables to ILearner.
   *
   * @tparam Model the fitted state returned by the train callable. It is
   *         kept behind a shared_ptr<const Model> and handed back, unmodified,
   *         to the predict callable.
   */
  template <class Model>
  class FunctionLearner : public ILearner
  {
  public:
    using TrainFunction = std::function<Model(const FeatureMatrix&, const std::vector<int>&)>;
    using PredictFunction = std::function<std::vector<double>(const Model&, const FeatureMatrix&)>;

    FunctionLearner(std::string name, TrainFunction trainFn, PredictFunction predictFn)
      : mName(std::move(name)),
	mTrain(std::move(trainFn)),
	mPredict(std::move(predictFn))
    {
      if (mName.empty())
	throw std::invalid_argument("FunctionLearner: name must not be empty");
      if (!mTrain || !mPredict)
	throw std::invalid_argument("FunctionLearner '" + mName + "': train and predict must both be set");
    }

    std::string getName() const override
    {
      return mName;
    }

    std::shared_ptr<const ILearnerModel> train(const FeatureMatrix& features,
					       const std::vector<int>& labels) const override
    {
      return std::make_shared<FittedModel>(std::make_shared<const Model>(mTrain(features, labels)),
					   mPredict);
    }

  private:
    class FittedModel : public ILearnerModel
    {
    public:
      FittedModel(std::shared_ptr<const Model> model, PredictFunction predictFn)
	: mModel(std::move(model)),
	  mPredict(std::move(predictFn))
      {}

      std::vector<double> predict(const FeatureMatrix& features) const override
      {
	return mPredict(*mModel, features);
      }

    private:
      std::shared_ptr<const Model> mModel;
      PredictFunction mPredict;
    };

    std::string mName;
    TrainFunction mTrain;
    PredictFunction mPredict;
  };

  template <class Model>
  std::shared_ptr<const ILearner>
  makeFunctionLearner(std::string name,
		      typename FunctionLearner<Model>::TrainFunction trainFn,
		      typename FunctionLearner<Model>::PredictFunction predictFn)
  {
    return std::make_shared<FunctionLearner<Model>>(std::move(name), std::move(trainFn), std::move(predictFn));
  }
}
