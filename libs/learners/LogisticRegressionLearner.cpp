#include "LogisticRegressionLearner.h"
#include "FeatureScaler.h"
#include <Eigen/Dense>
#include <cmath>
#include <stdexcept>
#include <string>

namespace superlearner
{
  namespace learners
  {
    namespace
    {
      Eigen::MatrixXd expandQuadratic(const Eigen::MatrixXd& x)
      {
	const Eigen::Index p = x.cols();
	const Eigen::Index expanded = p + p * (p + 1) / 2;
	Eigen::MatrixXd out(x.rows(), expanded);
	out.leftCols(p) = x;

	Eigen::Index c = p;
	for (Eigen::Index j = 0; j < p; ++j)
	  for (Eigen::Index k = j; k < p; ++k)
	    out.col(c++) = x.col(j).cwiseProduct(x.col(k));
	return out;
      }

      Eigen::MatrixXd withIntercept(const Eigen::MatrixXd& x)
      {
	Eigen::MatrixXd out(x.rows(), x.cols() + 1);
	out.col(0).setOnes();
	out.rightCols(x.cols()) = x;
	return out;
      }

      Eigen::VectorXd sigmoid(const Eigen::VectorXd& eta)
      {
	return eta.unaryExpr([](double v) {
	  return v >= 0.0 ? 1.0 / (1.0 + std::exp(-v)) : std::exp(v) / (1.0 + std::exp(v));
	});
      }

      // Penalised log-likelihood maximised by the Newton iterations.
      double penalisedLogLikelihood(const Eigen::MatrixXd& design,
				    const Eigen::VectorXd& y,
				    const Eigen::VectorXd& beta,
				    double lambda)
      {
	const Eigen::VectorXd eta = design * beta;
	double ll = 0.0;
	for (Eigen::Index i = 0; i < eta.size(); ++i)
	  {
	    const double v = eta(i);
	    const double softplus = v > 0.0 ? v + std::log1p(std::exp(-v)) : std::log1p(std::exp(v));
	    ll += y(i) * v - softplus;
	  }
	return ll - 0.5 * lambda * beta.squaredNorm();
      }

      class LogisticModel : public ILearnerModel
      {
      public:
	LogisticModel(FeatureScaler scaler, Eigen::VectorXd coefficients, bool quadraticTerms)
	  : mScaler(std::move(scaler)),
	    mCoefficients(std::move(coefficients)),
	    mQuadraticTerms(quadraticTerms)
	{}

	std::vector<double> predict(const FeatureMatrix& features) const override
	{
	  Eigen::MatrixXd x = toEigen(features);
	  if (mQuadraticTerms)
	    x = expandQuadratic(x);

	  const Eigen::MatrixXd design = withIntercept(mScaler.transform(x));
	  if (design.cols() != mCoefficients.size())
	    throw std::invalid_argument("LogisticModel: expected "
					+ std::to_string(mCoefficients.size() - 1) + " design columns, got "
					+ std::to_string(design.cols() - 1));

	  const Eigen::VectorXd p = sigmoid(design * mCoefficients);
	  return std::vector<double>(p.data(), p.data() + p.size());
	}

      private:
	FeatureScaler mScaler;
	Eigen::VectorXd mCoefficients;
	bool mQuadraticTerms;
      };
    }

    LogisticRegressionLearner::LogisticRegressionLearner(std::string name,
							 bool quadraticTerms,
							 double ridgePenalty,
							 unsigned int maxIterations,
							 double tolerance)
      : mName(std::move(name)),
	mQuadraticTerms(quadraticTerms),
	mRidgePenalty(ridgePenalty),
	mMaxIterations(maxIterations),
	mTolerance(tolerance)
    {
      if (!(ridgePenalty > 0.0))
	throw std::invalid_argument("LogisticRegressionLearner: ridge penalty must be positive");
      if (maxIterations == 0)
	throw std::invalid_argument("LogisticRegressionLearner: iteration cap must be positive");
    }

    std::shared_ptr<const ILearnerModel> LogisticRegressionLearner::train(const FeatureMatrix& features,
									  const std::vector<int>& labels) const
    {
      if (labels.empty() || labels.size() != features.getNumRows())
	throw std::invalid_argument("LogisticRegressionLearner: need one label per training row");

      Eigen::MatrixXd x = toEigen(features);
      if (mQuadraticTerms)
	x = expandQuadratic(x);

      FeatureScaler scaler(x);
      const Eigen::MatrixXd design = withIntercept(scaler.transform(x));
      const Eigen::Index numRows = design.rows();
      const Eigen::Index numCoefficients = design.cols();

      Eigen::VectorXd y(numRows);
      for (Eigen::Index i = 0; i < numRows; ++i)
	y(i) = static_cast<double>(labels[static_cast<std::size_t>(i)]);

      // Penalty scaled by the row count so its strength does not depend on
      // the fold size.
      const double lambda = mRidgePenalty * static_cast<double>(numRows);
      Eigen::VectorXd beta = Eigen::VectorXd::Zero(numCoefficients);

      for (unsigned int iteration = 0; iteration < mMaxIterations; ++iteration)
	{
	  const Eigen::VectorXd p = sigmoid(design * beta);
	  const Eigen::VectorXd w = (p.array() * (1.0 - p.array())).max(1e-10).matrix();

	  Eigen::MatrixXd hessian = design.transpose() * w.asDiagonal() * design;
	  hessian.diagonal().array() += lambda;
	  const Eigen::VectorXd gradient = design.transpose() * (y - p) - lambda * beta;

	  const Eigen::VectorXd step = hessian.ldlt().solve(gradient);
	  if (!step.allFinite())
	    throw std::runtime_error("LogisticRegressionLearner '" + mName + "': non-finite Newton step");

	  // Step halving keeps each iteration an ascent step on separable data.
	  const double current = penalisedLogLikelihood(design, y, beta, lambda);
	  double t = 1.0;
	  while (t > 1e-8 && penalisedLogLikelihood(design, y, beta + t * step, lambda) < current)
	    t *= 0.5;

	  beta += t * step;
	  if ((t * step).cwiseAbs().maxCoeff() < mTolerance)
	    return std::make_shared<LogisticModel>(std::move(scaler), std::move(beta), mQuadraticTerms);
	}

      throw std::runtime_error("LogisticRegressionLearner '" + mName + "': IRLS did not converge in "
			       + std::to_string(mMaxIterations) + " iterations");
    }
  }
}
