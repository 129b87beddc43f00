#pragma once

#include <cmath>
#include <Eigen/Dense>
#include "FeatureMatrix.h"

namespace superlearner
{
  namespace learners
  {
    /**
     * @brief Per-column centring and scaling fitted on training rows.
     *
     * Constant columns keep a scale of one so they map to zero instead of
     * dividing by zero.
     */
    class FeatureScaler
    {
    public:
      FeatureScaler() = default;

      explicit FeatureScaler(const Eigen::MatrixXd& x)
	: mMean(x.colwise().mean().transpose()),
	  mScale(Eigen::VectorXd::Ones(x.cols()))
      {
	if (x.rows() < 2)
	  return;

	for (Eigen::Index j = 0; j < x.cols(); ++j)
	  {
	    const double sd = std::sqrt((x.col(j).array() - mMean(j)).square().sum()
					/ static_cast<double>(x.rows() - 1));
	    if (sd > 1e-12)
	      mScale(j) = sd;
	  }
      }

      Eigen::MatrixXd transform(const Eigen::MatrixXd& x) const
      {
	return ((x.rowwise() - mMean.transpose()).array().rowwise() / mScale.transpose().array()).matrix();
      }

    private:
      Eigen::VectorXd mMean;
      Eigen::VectorXd mScale;
    };

    inline Eigen::MatrixXd toEigen(const FeatureMatrix& features)
    {
      Eigen::MatrixXd x(static_cast<Eigen::Index>(features.getNumRows()),
			static_cast<Eigen::Index>(features.getNumColumns()));
      for (std::size_t i = 0; i < features.getNumRows(); ++i)
	for (std::size_t j = 0; j < features.getNumColumns(); ++j)
	  x(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = features(i, j);
      return x;
    }
  }
}
