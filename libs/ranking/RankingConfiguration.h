// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __RANKING_CONFIGURATION_H
#define __RANKING_CONFIGURATION_H 1

#include "CategoryTables.h"

namespace abcrank
{
  // Each pair conventionally sums to one. Nothing here enforces it; a pair
  // that does not simply produces aggregates outside [0, 1].
  struct CriticalityWeights
  {
    double risk = 0.78;
    double fluctuation = 0.22;
  };

  struct DemandWeights
  {
    double dailyUsage = 0.71;
    double averageStock = 0.29;
  };

  struct SupplyWeights
  {
    double leadTime = 0.75;
    double consignment = 0.25;
  };

  /**
   * @brief Convex combination weights for the three second level criteria.
   */
  struct AggregationWeights
  {
    CriticalityWeights criticality;
    DemandWeights demand;
    SupplyWeights supply;
  };

  /**
   * @brief Cumulative population percentages for the A, B and C tiers.
   *
   * Only A and B determine the cut points; C is carried for reporting and
   * conventionally equals 100 - A - B.
   */
  struct AbcThresholds
  {
    double a = 20.0;
    double b = 30.0;
    double c = 50.0;
  };

  /**
   * @brief Everything the ranking pipeline needs besides the items.
   */
  class RankingConfiguration
  {
  public:
    RankingConfiguration()
      : mMappingTable(createDefaultMappingTable()),
	mFuzzyNumberTable(createDefaultFuzzyNumberTable()),
	mAggregationWeights(),
	mAbcThresholds()
    {}

    RankingConfiguration(const MappingTable& mappingTable,
			 const FuzzyNumberTable& fuzzyNumberTable,
			 const AggregationWeights& aggregationWeights,
			 const AbcThresholds& abcThresholds)
      : mMappingTable(mappingTable),
	mFuzzyNumberTable(fuzzyNumberTable),
	mAggregationWeights(aggregationWeights),
	mAbcThresholds(abcThresholds)
    {}

    const MappingTable& getMappingTable() const { return mMappingTable; }
    const FuzzyNumberTable& getFuzzyNumberTable() const { return mFuzzyNumberTable; }
    const AggregationWeights& getAggregationWeights() const { return mAggregationWeights; }
    const AbcThresholds& getAbcThresholds() const { return mAbcThresholds; }

    void setMappingTable(const MappingTable& table) { mMappingTable = table; }
    void setFuzzyNumberTable(const FuzzyNumberTable& table) { mFuzzyNumberTable = table; }
    void setAggregationWeights(const AggregationWeights& weights) { mAggregationWeights = weights; }
    void setAbcThresholds(const AbcThresholds& thresholds) { mAbcThresholds = thresholds; }

  private:
    MappingTable mMappingTable;
    FuzzyNumberTable mFuzzyNumberTable;
    AggregationWeights mAggregationWeights;
    AbcThresholds mAbcThresholds;
  };
}

#endif
