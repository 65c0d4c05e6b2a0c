#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>
#include "RankingPipeline.h"
#include "ClassComparison.h"

namespace abcranker
{
namespace reporting
{

using namespace abcrank;

/**
 * @brief Console tables for the results of a ranking run
 *
 * Every report is a titled section written to the given stream.
 */
class RankingConsoleReporter
{
public:
    static void writeEntropyWeights(std::ostream& os, const EntropyWeights& weights);

    /**
     * @brief Class populations of both tracks side by side
     */
    static void writeClassDistribution(std::ostream& os, const std::vector<InventoryItem>& items);

    /**
     * @brief Crisp class (rows) against fuzzy class (columns), agreement
     * rate and the first changed items
     * @param maxChanges Number of changed items listed
     */
    static void writeComparison(std::ostream& os,
                                const ClassificationComparison& comparison,
                                std::size_t maxChanges);

    /**
     * @brief Descriptive statistics of the quantitative import columns,
     * category counts and the correlation matrix of the decision criteria
     */
    static void writeDataOverview(std::ostream& os, const std::vector<InventoryItem>& items);

    static void writeTopRanked(std::ostream& os,
                               const std::vector<InventoryItem>& items,
                               ScoreField scoreField,
                               std::size_t count);

private:
    static void writeSectionHeader(std::ostream& os, const std::string& title);
    static void writeSectionFooter(std::ostream& os);
};

} // namespace reporting
} // namespace abcranker
