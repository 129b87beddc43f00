#pragma once

namespace superlearner
{
  namespace learners
  {
    // Registers mean, logistic, logistic_quadratic and knn with the
    // LearnerRegistry. Safe to call more than once.
    void registerDefaultLearners();
  }
}
