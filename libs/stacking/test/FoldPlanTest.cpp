#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <set>
#include <vector>
#include "FoldPlan.h"
#include "StackingException.h"

using namespace superlearner;

TEST_CASE("FoldPlan assigns contiguous blocks", "[FoldPlan]")
{
  SECTION("Ten rows over three folds: the first fold takes the extra row")
  {
    const FoldAssignment folds = FoldPlan(3).assign(10);
    const std::vector<unsigned int> expected{ 0, 0, 0, 0, 1, 1, 1, 2, 2, 2 };

    REQUIRE(folds.getFolds() == expected);
    REQUIRE(folds.getFoldSizes() == std::vector<std::size_t>{ 4, 3, 3 });
  }

  SECTION("Fold sizes differ by at most one and every row is assigned once")
  {
    for (std::size_t n : { 7u, 20u, 101u })
      for (unsigned int v : { 2u, 3u, 5u, 7u })
	{
	  const FoldAssignment folds = FoldPlan(v).assign(n);
	  const auto sizes = folds.getFoldSizes();

	  REQUIRE(folds.getNumObservations() == n);
	  REQUIRE(*std::max_element(sizes.begin(), sizes.end())
		  - *std::min_element(sizes.begin(), sizes.end()) <= 1);

	  std::size_t total = 0;
	  for (unsigned int f = 0; f < v; ++f)
	    {
	      REQUIRE(folds.getRowsInFold(f).size() + folds.getRowsNotInFold(f).size() == n);
	      total += folds.getRowsInFold(f).size();
	    }
	  REQUIRE(total == n);
	}
  }

  SECTION("V equal to N puts one row in each fold")
  {
    const FoldAssignment folds = FoldPlan(5).assign(5);
    REQUIRE(folds.getFolds() == std::vector<unsigned int>{ 0, 1, 2, 3, 4 });
  }

  SECTION("The static overload matches the unshuffled plan")
  {
    REQUIRE(FoldPlan::assign(23, 4) == FoldPlan(4).assign(23));
  }
}

TEST_CASE("FoldPlan shuffling is reproducible", "[FoldPlan][shuffle]")
{
  const FoldPlan planA(5, true, 1234);
  const FoldPlan planB(5, true, 1234);
  const FoldPlan planC(5, true, 99);

  const FoldAssignment a = planA.assign(200);
  REQUIRE(a == planB.assign(200));
  REQUIRE(a == planA.assign(200));
  REQUIRE_FALSE(a == planC.assign(200));
  REQUIRE_FALSE(a == FoldPlan(5).assign(200));

  // Shuffling permutes rows but keeps the balanced block sizes.
  REQUIRE(a.getFoldSizes() == std::vector<std::size_t>{ 40, 40, 40, 40, 40 });
}

TEST_CASE("FoldPlan rejects invalid fold counts", "[FoldPlan][error]")
{
  REQUIRE_THROWS_AS(FoldPlan(1), StackingConfigurationException);
  REQUIRE_THROWS_AS(FoldPlan(0), StackingConfigurationException);
  REQUIRE_THROWS_AS(FoldPlan(6).assign(5), StackingConfigurationException);
}

TEST_CASE("FoldAssignment validates fold indices", "[FoldAssignment]")
{
  REQUIRE_THROWS_AS(FoldAssignment({ 0, 1, 2 }, 2), StackingConfigurationException);
  REQUIRE_THROWS_AS(FoldAssignment({ 0, 0 }, 0), StackingConfigurationException);

  const FoldAssignment folds({ 1, 0, 1, 0 }, 2);
  REQUIRE(folds.getRowsInFold(1) == std::vector<std::size_t>{ 0, 2 });
  REQUIRE(folds.getRowsNotInFold(1) == std::vector<std::size_t>{ 1, 3 });
  REQUIRE(folds.getFold(3) == 0);
}
