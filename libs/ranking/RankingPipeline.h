// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __RANKING_PIPELINE_H
#define __RANKING_PIPELINE_H 1

#include <ostream>
#include <vector>
#include "InventoryItem.h"
#include "RankingConfiguration.h"
#include "DecisionCriteria.h"

namespace abcrank
{
  /**
   * @brief Result of one pipeline run. Replaced wholesale on every
   * recompute or reclassify; nothing in it is updated in place.
   */
  struct RankingSnapshot
  {
    RankingConfiguration configuration;

    // Crisp rank order, every derived field populated
    std::vector<InventoryItem> items;

    EntropyWeights entropyWeights;
  };

  /**
   * @brief Runs the crisp and fuzzy ranking tracks over a set of raw items.
   *
   * Crisp track: applyMappings -> calculateAggregations ->
   * calculateEntropyWeights -> calculateTOPSIS -> classifyABC.
   * Fuzzy track: calculateFuzzyTOPSIS over the same mapped items, then
   * classifyABC on the fuzzy score.
   *
   * Both tracks score the items in input order so that ties are broken the
   * same way in each. The fuzzy class is attached to each item by input
   * position before the crisp sort, so ids need not be unique.
   */
  class RankingPipeline
  {
  public:
    explicit RankingPipeline(const RankingConfiguration& configuration);

    const RankingConfiguration& getConfiguration() const { return mConfiguration; }

    /**
     * @brief Runs every stage from the raw items forward.
     * @param rawItems Items as produced by the importer.
     * @param os Output stream for stage logging.
     */
    RankingSnapshot recompute(const std::vector<InventoryItem>& rawItems,
			      std::ostream& os) const;

    /**
     * @brief Re-runs only the classifier for both scores with new
     * thresholds. Scores and entropy weights are carried over unchanged.
     *
     * Items are put back in id order before classifying, so ties are
     * broken as in recompute when ids follow import order.
     */
    static RankingSnapshot reclassify(const RankingSnapshot& snapshot,
				      const AbcThresholds& thresholds,
				      std::ostream& os);

  private:
    static std::vector<InventoryItem> classifyBothTracks(const std::vector<InventoryItem>& scoredItems,
							 const AbcThresholds& thresholds);

  private:
    RankingConfiguration mConfiguration;
  };
}

#endif
