#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <vector>
#include "CalibrationAggregator.h"
#include "EmpiricalRateTable.h"
#include "ParallelExecutors.h"
#include "StackingException.h"

using namespace superlearner;
using Catch::Approx;

TEST_CASE("CalibrationAggregator bin index boundaries", "[CalibrationAggregator]")
{
  REQUIRE(CalibrationAggregator::numberOfBins(0.1) == 10);
  REQUIRE(CalibrationAggregator::numberOfBins(0.01) == 100);
  REQUIRE(CalibrationAggregator::numberOfBins(0.3) == 4);
  REQUIRE(CalibrationAggregator::numberOfBins(1.0) == 1);

  SECTION("Lower bound is inclusive")
  {
    REQUIRE(CalibrationAggregator::binIndex(0.0, 0.25) == 0);
    REQUIRE(CalibrationAggregator::binIndex(0.25, 0.25) == 1);
    REQUIRE(CalibrationAggregator::binIndex(0.2499, 0.25) == 0);
  }

  SECTION("One belongs to the last bin")
  {
    REQUIRE(CalibrationAggregator::binIndex(1.0, 0.25) == 3);
    REQUIRE(CalibrationAggregator::binIndex(1.0, 0.01) == 99);
    REQUIRE(CalibrationAggregator::binIndex(1.0, 0.3) == 3);
  }

  SECTION("Invalid widths")
  {
    REQUIRE_THROWS_AS(CalibrationAggregator::numberOfBins(0.0), StackingConfigurationException);
    REQUIRE_THROWS_AS(CalibrationAggregator::numberOfBins(1.5), StackingConfigurationException);
    REQUIRE_THROWS_AS(CalibrationAggregator::numberOfBins(-0.1), StackingConfigurationException);
  }

  SECTION("Widths needing more bins than can be indexed are rejected")
  {
    REQUIRE_THROWS_AS(CalibrationAggregator::numberOfBins(1e-25), StackingConfigurationException);
    REQUIRE_THROWS_AS(CalibrationAggregator::binIndex(0.5, 1e-19), StackingConfigurationException);

    const EmpiricalRateTable empty;
    concurrency::SingleThreadExecutor executor;
    REQUIRE_THROWS_AS(CalibrationAggregator(executor).bin({ { 0, 1, 0.5 } }, empty, 1e-16),
		      StackingConfigurationException);
  }

  SECTION("The finest accepted width still indexes exactly")
  {
    const double width = std::ldexp(1.0, -40);
    REQUIRE(CalibrationAggregator::numberOfBins(width) == 1099511627776ULL);
    REQUIRE(CalibrationAggregator::binIndex(0.5, width) == 549755813888ULL);
    REQUIRE(CalibrationAggregator::binIndex(0.5 - width, width) == 549755813887ULL);
    REQUIRE(CalibrationAggregator::binIndex(1.0, width) == 1099511627775ULL);
  }
}

TEST_CASE("CalibrationAggregator joins empirical rates per bin", "[CalibrationAggregator]")
{
  EmpiricalRateTable empirical;
  empirical.addCell(0, 10, 0.5, 40);
  empirical.addCell(1, 10, 0.6, 20);
  empirical.addCell(5, 10, 1.0, 3);

  const std::vector<PredictionGridCell> cells{
    { 0, 10, 0.52 },
    { 1, 10, 0.58 },
    { 2, 10, 0.55 },    // no empirical counterpart
    { 5, 10, 1.0 },
    { 3, 10, -0.05 },   // negative tie probability
  };

  concurrency::SingleThreadExecutor executor;
  const CalibrationTable table = CalibrationAggregator(executor).bin(cells, empirical, 0.1);

  REQUIRE(table.skippedOutOfRange == 1);
  REQUIRE(table.missingEmpirical == 1);
  REQUIRE(table.bins.size() == 2);
  REQUIRE(table.getNumBinnedCells() == 4);

  REQUIRE(table.outOfRange.has_value());
  REQUIRE(table.outOfRange->count == 1);
  REQUIRE(table.outOfRange->belowZero == 1);
  REQUIRE(table.outOfRange->meanPredicted == Approx(-0.05));
  REQUIRE_FALSE(table.outOfRange->meanEmpirical.has_value());

  const CalibrationBin& middle = table.bins[0];
  REQUIRE(middle.index == 5);
  REQUIRE(middle.lowerBound == Approx(0.5));
  REQUIRE(middle.upperBound == Approx(0.6));
  REQUIRE(middle.count == 3);
  REQUIRE(middle.empiricalCount == 2);
  REQUIRE(middle.meanPredicted == Approx((0.52 + 0.58 + 0.55) / 3.0));
  REQUIRE(middle.meanEmpirical.has_value());
  REQUIRE(*middle.meanEmpirical == Approx(0.55));

  const CalibrationBin& top = table.bins[1];
  REQUIRE(top.index == 9);
  REQUIRE(top.upperBound == 1.0);
  REQUIRE(top.count == 1);
  REQUIRE(*top.meanEmpirical == 1.0);
}

TEST_CASE("CalibrationAggregator summarises predictions outside the unit interval", "[CalibrationAggregator]")
{
  EmpiricalRateTable empirical;
  empirical.addCell(2, 5, 0.0, 10);
  empirical.addCell(3, 5, 0.1, 10);

  const std::vector<PredictionGridCell> cells{
    { 1, 5, 0.4 },
    { 2, 5, -0.2 },
    { 3, 5, -0.1 },
    { 4, 5, 1.25 },
    { 6, 5, std::numeric_limits<double>::quiet_NaN() },
  };

  concurrency::ThreadPoolExecutor<> pool(2);
  const CalibrationTable table = CalibrationAggregator(pool, 2).bin(cells, empirical, 0.1);

  REQUIRE(table.skippedOutOfRange == 4);
  REQUIRE(table.getNumBinnedCells() == 1);
  REQUIRE(table.missingEmpirical == 1);

  REQUIRE(table.outOfRange.has_value());
  const OutOfRangeSummary& summary = *table.outOfRange;
  REQUIRE(summary.count == 3);
  REQUIRE(summary.belowZero == 2);
  REQUIRE(summary.aboveOne == 1);
  REQUIRE(summary.meanPredicted == Approx((-0.2 - 0.1 + 1.25) / 3.0));
  REQUIRE(summary.empiricalCount == 2);
  REQUIRE(*summary.meanEmpirical == Approx(0.05));

  const CalibrationTable inRange = CalibrationAggregator(pool).bin({ { 1, 5, 0.4 } }, empirical, 0.1);
  REQUIRE_FALSE(inRange.outOfRange.has_value());
}

TEST_CASE("CalibrationAggregator keeps bins with no empirical data", "[CalibrationAggregator]")
{
  const EmpiricalRateTable empty;
  const std::vector<PredictionGridCell> cells{ { 0, 1, 0.1 }, { 1, 1, 0.12 } };
  concurrency::SingleThreadExecutor executor;

  const CalibrationTable table = CalibrationAggregator(executor).bin(cells, empty, 0.05);
  REQUIRE(table.bins.size() == 1);
  REQUIRE(table.bins[0].count == 2);
  REQUIRE_FALSE(table.bins[0].meanEmpirical.has_value());
  REQUIRE(table.missingEmpirical == 2);
}

TEST_CASE("CalibrationAggregator on a perfectly calibrated grid", "[CalibrationAggregator]")
{
  EmpiricalRateTable empirical;
  std::vector<PredictionGridCell> cells;
  for (int t = 1; t <= 40; ++t)
    for (int d = 0; d <= 50; ++d)
      {
	const double p = (d * 7 + t * 13) % 101 / 100.0;
	cells.push_back(PredictionGridCell{ d, t, p });
	empirical.addCell(d, t, p, 1);
      }

  concurrency::SingleThreadExecutor single;
  concurrency::ThreadPoolExecutor<> pool(4);
  const CalibrationTable serial = CalibrationAggregator(single).bin(cells, empirical, 0.02);
  const CalibrationTable parallel = CalibrationAggregator(pool, 97).bin(cells, empirical, 0.02);

  REQUIRE(serial.getNumBinnedCells() == cells.size());
  REQUIRE(serial.bins.size() == parallel.bins.size());
  for (std::size_t b = 0; b < serial.bins.size(); ++b)
    {
      const CalibrationBin& bin = serial.bins[b];
      REQUIRE(bin.meanEmpirical.has_value());
      REQUIRE(*bin.meanEmpirical == Approx(bin.meanPredicted));
      REQUIRE(bin.meanPredicted >= bin.lowerBound - 1e-12);
      REQUIRE(bin.meanPredicted <= bin.upperBound + 1e-12);

      REQUIRE(parallel.bins[b].index == bin.index);
      REQUIRE(parallel.bins[b].count == bin.count);
      REQUIRE(parallel.bins[b].meanPredicted == Approx(bin.meanPredicted));
    }
}

TEST_CASE("EmpiricalRateTable", "[EmpiricalRateTable]")
{
  SECTION("Built from labelled observations")
  {
    std::vector<Observation> rows{
      { { 3.0, 10.0 }, 1, "a" },
      { { 3.0, 10.0 }, 0, "b" },
      { { 3.0, 10.0 }, 1, "c" },
      { { -2.0, 5.0 }, 0, "d" },
    };
    const Dataset data({ "ScoreDifferential", "TimeLeft" }, std::move(rows));
    const EmpiricalRateTable table = EmpiricalRateTable::fromDataset(data, 0, 1);

    REQUIRE(table.size() == 2);
    REQUIRE(table.lookup(3, 10)->count == 3);
    REQUIRE(*table.lookupRate(3, 10) == Approx(2.0 / 3.0));
    REQUIRE(*table.lookupRate(-2, 5) == 0.0);
    REQUIRE_FALSE(table.lookup(3, 11).has_value());
    REQUIRE_THROWS_AS(EmpiricalRateTable::fromDataset(data, 0, 2), StackingConfigurationException);
  }

  SECTION("Rejects bad cells")
  {
    EmpiricalRateTable table;
    table.addCell(0, 1, 0.4, 5);
    REQUIRE_THROWS_AS(table.addCell(0, 1, 0.5, 5), StackingConfigurationException);
    REQUIRE_THROWS_AS(table.addCell(1, 1, 1.2, 5), StackingConfigurationException);
    REQUIRE_THROWS_AS(table.addCell(2, 1, 0.5, 0), StackingConfigurationException);
  }
}
