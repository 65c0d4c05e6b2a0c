#include "RankingConsoleReporter.h"
#include "DescriptiveStatistics.h"
#include <iomanip>

namespace abcranker
{
namespace reporting
{

namespace
{
    const AbcClass kClasses[] = { AbcClass::A, AbcClass::B, AbcClass::C };

    std::string classOrBlank(const std::optional<AbcClass>& abcClass)
    {
        return abcClass ? std::string(1, abcClassToChar(*abcClass)) : std::string("-");
    }
}

void RankingConsoleReporter::writeEntropyWeights(std::ostream& os, const EntropyWeights& weights)
{
    writeSectionHeader(os, "Entropy Weights");

    os << std::fixed << std::setprecision(4);
    for (DecisionCriterion criterion : allDecisionCriteria())
    {
        os << std::left << std::setw(18) << decisionCriterionName(criterion)
           << std::right << std::setw(10) << weights.getWeight(criterion)
           << (isBenefitCriterion(criterion) ? "  (benefit)" : "  (cost)") << std::endl;
    }
    os << "Sum: " << weights.sum() << std::endl;
    os.unsetf(std::ios_base::floatfield);

    writeSectionFooter(os);
    os << std::endl;
}

void RankingConsoleReporter::writeClassDistribution(std::ostream& os, const std::vector<InventoryItem>& items)
{
    const ClassSummary crisp = summarizeClasses(items, ScoreField::TOPSIS_SCORE);
    const ClassSummary fuzzy = summarizeClasses(items, ScoreField::FUZZY_TOPSIS_SCORE);

    writeSectionHeader(os, "ABC Class Distribution");

    os << std::left << std::setw(8) << "Class"
       << std::right << std::setw(10) << "TOPSIS" << std::setw(10) << "Share"
       << std::setw(10) << "Fuzzy" << std::setw(10) << "Share" << std::endl;

    os << std::fixed << std::setprecision(1);
    for (AbcClass abcClass : kClasses)
    {
        os << std::left << std::setw(8) << abcClassToChar(abcClass)
           << std::right << std::setw(10) << crisp.getCount(abcClass)
           << std::setw(9) << crisp.getShare(abcClass) * 100.0 << "%"
           << std::setw(10) << fuzzy.getCount(abcClass)
           << std::setw(9) << fuzzy.getShare(abcClass) * 100.0 << "%" << std::endl;
    }
    os.unsetf(std::ios_base::floatfield);

    writeSectionFooter(os);
    os << std::endl;
}

void RankingConsoleReporter::writeComparison(std::ostream& os,
                                             const ClassificationComparison& comparison,
                                             std::size_t maxChanges)
{
    writeSectionHeader(os, "TOPSIS vs Fuzzy TOPSIS");

    os << std::left << std::setw(10) << "Crisp" << std::right;
    for (AbcClass fuzzyClass : kClasses)
        os << std::setw(8) << (std::string("F-") + abcClassToChar(fuzzyClass));
    os << std::endl;

    for (AbcClass crispClass : kClasses)
    {
        os << std::left << std::setw(10) << abcClassToChar(crispClass) << std::right;
        for (AbcClass fuzzyClass : kClasses)
            os << std::setw(8) << comparison.changeMatrix[abcClassIndex(crispClass)][abcClassIndex(fuzzyClass)];
        os << std::endl;
    }

    os << std::fixed << std::setprecision(1);
    os << "Agreement: " << comparison.agreements << "/" << comparison.comparedItems
       << " (" << comparison.agreementRate * 100.0 << "%)" << std::endl;
    os << std::setprecision(4);
    os << "Mean |Fuzzy - TOPSIS| score: " << comparison.meanAbsoluteScoreDifference << std::endl;

    if (!comparison.changes.empty())
    {
        os << std::endl << "Items changing class:" << std::endl;
        os << std::setw(8) << "ID" << std::setw(12) << "TOPSIS" << std::setw(12) << "Fuzzy"
           << std::setw(8) << "Class" << std::setw(8) << "Fuzzy" << std::endl;

        std::size_t shown = 0;
        for (const auto& change : comparison.changes)
        {
            if (shown++ == maxChanges)
                break;

            os << std::setw(8) << change.id
               << std::setw(12) << change.topsisScore
               << std::setw(12) << change.fuzzyTopsisScore
               << std::setw(8) << abcClassToChar(change.crispClass)
               << std::setw(8) << abcClassToChar(change.fuzzyClass) << std::endl;
        }
    }
    os.unsetf(std::ios_base::floatfield);

    writeSectionFooter(os);
    os << std::endl;
}

void RankingConsoleReporter::writeDataOverview(std::ostream& os, const std::vector<InventoryItem>& items)
{
    writeSectionHeader(os, "Data Overview");

    os << "Items: " << items.size() << std::endl << std::endl;

    os << std::left << std::setw(16) << "Column" << std::right
       << std::setw(12) << "Min" << std::setw(12) << "Max" << std::setw(12) << "Mean"
       << std::setw(12) << "Median" << std::setw(12) << "Std" << std::endl;

    os << std::fixed << std::setprecision(3);
    for (const auto& [column, stats] : describeQuantitativeColumns(items))
    {
        os << std::left << std::setw(16) << itemColumnName(column) << std::right
           << std::setw(12) << stats.min << std::setw(12) << stats.max
           << std::setw(12) << stats.mean << std::setw(12) << stats.median
           << std::setw(12) << stats.stdDev << std::endl;
    }

    for (QualitativeAttribute attribute : allQualitativeAttributes())
    {
        os << std::endl << qualitativeAttributeName(attribute) << ":";
        for (const auto& [label, count] : calculateCategoryDistribution(items, attribute))
            os << "  " << label << "=" << count;
        os << std::endl;
    }

    std::vector<ItemColumn> criteriaColumns;
    for (DecisionCriterion criterion : allDecisionCriteria())
        criteriaColumns.push_back(decisionCriterionColumn(criterion));

    const CorrelationMatrix correlation = calculateCorrelationMatrix(items, criteriaColumns);

    os << std::endl << "Correlation of decision criteria:" << std::endl;
    os << std::setw(18) << "";
    for (const auto& label : correlation.labels)
        os << std::setw(18) << label;
    os << std::endl;

    for (std::size_t i = 0; i < correlation.labels.size(); ++i)
    {
        os << std::left << std::setw(18) << correlation.labels[i] << std::right;
        for (double r : correlation.matrix[i])
            os << std::setw(18) << r;
        os << std::endl;
    }
    os.unsetf(std::ios_base::floatfield);

    writeSectionFooter(os);
    os << std::endl;
}

void RankingConsoleReporter::writeTopRanked(std::ostream& os,
                                            const std::vector<InventoryItem>& items,
                                            ScoreField scoreField,
                                            std::size_t count)
{
    const bool crisp = (scoreField == ScoreField::TOPSIS_SCORE);
    writeSectionHeader(os, std::string("Top ") + std::to_string(count) +
                       (crisp ? " by TOPSIS" : " by Fuzzy TOPSIS"));

    os << std::setw(6) << "Rank" << std::setw(8) << "ID" << std::setw(12) << "Score"
       << std::setw(8) << "Class" << "  Risk / Demand fluctuation / Unit size" << std::endl;

    os << std::fixed << std::setprecision(4);
    std::size_t rank = 1;
    for (const auto& item : topRanked(items, scoreField, count))
    {
        os << std::setw(6) << rank++
           << std::setw(8) << item.id
           << std::setw(12) << (crisp ? item.topsisScore : item.fuzzyTopsisScore).value_or(0.0)
           << std::setw(8) << classOrBlank(crisp ? item.abcClass : item.fuzzyAbcClass)
           << "  " << item.risk << " / " << item.demandFluctuation << " / " << item.unitSize
           << std::endl;
    }
    os.unsetf(std::ios_base::floatfield);

    writeSectionFooter(os);
    os << std::endl;
}

void RankingConsoleReporter::writeSectionHeader(std::ostream& os, const std::string& title)
{
    os << "=== " << title << " ===" << std::endl;
}

void RankingConsoleReporter::writeSectionFooter(std::ostream& os)
{
    os << "===================================" << std::endl;
}

} // namespace reporting
} // namespace abcranker
