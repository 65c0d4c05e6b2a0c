// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "RankingPipeline.h"
#include "CategoryMapper.h"
#include "CriteriaAggregator.h"
#include "EntropyWeighting.h"
#include "TopsisRanker.h"
#include "FuzzyTopsisRanker.h"
#include "AbcClassifier.h"
#include "ClassComparison.h"
#include <algorithm>
#include <iomanip>

namespace abcrank
{
  RankingPipeline::RankingPipeline(const RankingConfiguration& configuration)
    : mConfiguration(configuration)
  {}

  RankingSnapshot RankingPipeline::recompute(const std::vector<InventoryItem>& rawItems,
					     std::ostream& os) const
  {
    os << "   [Mapping] " << rawItems.size() << " items mapped to crisp scores\n";
    const std::vector<InventoryItem> mapped = applyMappings(rawItems, mConfiguration.getMappingTable());

    const std::vector<InventoryItem> aggregated =
      calculateAggregations(mapped, mConfiguration.getAggregationWeights());
    os << "   [Aggregation] Criticality, Demand and Supply aggregates computed\n";

    if (usesEqualWeightFallback(aggregated))
      {
	if (aggregated.size() < 2)
	  os << "   [Entropy] warning: fewer than two items, using equal weights\n";
	else
	  os << "   [Entropy] warning: every decision criterion is constant, using equal weights\n";
      }

    const EntropyWeights weights = calculateEntropyWeights(aggregated);
    const std::streamsize oldPrecision = os.precision();
    os << "   [Entropy] weights:";
    for (DecisionCriterion criterion : allDecisionCriteria())
      os << " " << decisionCriterionName(criterion) << "="
	 << std::fixed << std::setprecision(4) << weights.getWeight(criterion);
    os << "\n";
    os.unsetf(std::ios_base::floatfield);
    os.precision(oldPrecision);

    const std::vector<InventoryItem> fuzzyScored =
      calculateFuzzyTOPSIS(aggregated, mConfiguration.getFuzzyNumberTable());
    os << "   [FuzzyTOPSIS] closeness computed over " << kFuzzyCriteriaCount << " criteria\n";

    const std::vector<InventoryItem> scored = calculateTOPSIS(fuzzyScored, weights);
    os << "   [TOPSIS] closeness computed over " << kNumDecisionCriteria << " criteria\n";

    RankingSnapshot snapshot;
    snapshot.configuration = mConfiguration;
    snapshot.entropyWeights = weights;
    snapshot.items = classifyBothTracks(scored, mConfiguration.getAbcThresholds());

    const ClassSummary crisp = summarizeClasses(snapshot.items, ScoreField::TOPSIS_SCORE);
    os << "   [Classification] A=" << crisp.getCount(AbcClass::A)
       << " B=" << crisp.getCount(AbcClass::B)
       << " C=" << crisp.getCount(AbcClass::C) << "\n";

    return snapshot;
  }

  RankingSnapshot RankingPipeline::reclassify(const RankingSnapshot& snapshot,
					      const AbcThresholds& thresholds,
					      std::ostream& os)
  {
    // Back to import order so ties break as they did in recompute
    std::vector<InventoryItem> byId(snapshot.items);
    std::stable_sort(byId.begin(), byId.end(),
		     [](const InventoryItem& lhs, const InventoryItem& rhs) {
		       return lhs.id < rhs.id;
		     });

    RankingSnapshot reclassified(snapshot);
    reclassified.configuration.setAbcThresholds(thresholds);
    reclassified.items = classifyBothTracks(byId, thresholds);

    os << "   [Classification] reclassified " << reclassified.items.size()
       << " items with thresholds A=" << thresholds.a
       << " B=" << thresholds.b
       << " C=" << thresholds.c << "\n";

    return reclassified;
  }

  std::vector<InventoryItem> RankingPipeline::classifyBothTracks(const std::vector<InventoryItem>& scoredItems,
								 const AbcThresholds& thresholds)
  {
    // Fuzzy classes are attached by input position so the merge does not
    // depend on ids being unique
    const std::vector<AbcClass> fuzzyClasses =
      abcClassesByPosition(scoredItems, thresholds, ScoreField::FUZZY_TOPSIS_SCORE);

    std::vector<InventoryItem> withFuzzyClass(scoredItems);
    for (std::size_t i = 0; i < withFuzzyClass.size(); ++i)
      withFuzzyClass[i].fuzzyAbcClass = fuzzyClasses[i];

    return classifyABC(withFuzzyClass, thresholds, ScoreField::TOPSIS_SCORE);
  }
}
