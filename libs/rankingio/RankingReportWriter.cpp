// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "RankingReportWriter.h"
#include "ClassComparison.h"
#include <cstdint>
#include <fstream>
#include <limits>

using namespace rapidjson;

namespace abcrank::io
{
  namespace
  {
    std::string csvField(const std::string& field)
    {
      if (field.find_first_of(",\"\r\n") == std::string::npos)
	return field;

      std::string quoted("\"");
      for (char c : field)
	{
	  if (c == '\"')
	    quoted += '\"';
	  quoted += c;
	}
      quoted += '\"';

      return quoted;
    }

    void writeOptional(std::ostream& os, const std::optional<double>& value)
    {
      if (value)
	os << *value;
    }

    void writeOptional(std::ostream& os, const std::optional<AbcClass>& value)
    {
      if (value)
	os << abcClassToChar(*value);
    }

    Value classSummaryToJson(const ClassSummary& summary, Document::AllocatorType& allocator)
    {
      Value json(kObjectType);
      const AbcClass classes[] = { AbcClass::A, AbcClass::B, AbcClass::C };

      for (AbcClass abcClass : classes)
	{
	  Value entry(kObjectType);
	  entry.AddMember("count", static_cast<uint64_t>(summary.getCount(abcClass)), allocator);
	  entry.AddMember("share", summary.getShare(abcClass), allocator);

	  const std::string key(1, abcClassToChar(abcClass));
	  json.AddMember(Value(key.c_str(), allocator), entry, allocator);
	}

      json.AddMember("unclassified", static_cast<uint64_t>(summary.getUnclassified()), allocator);
      return json;
    }

    Value comparisonToJson(const ClassificationComparison& comparison, Document::AllocatorType& allocator)
    {
      Value json(kObjectType);
      json.AddMember("comparedItems", static_cast<uint64_t>(comparison.comparedItems), allocator);
      json.AddMember("agreements", static_cast<uint64_t>(comparison.agreements), allocator);
      json.AddMember("agreementRate", comparison.agreementRate, allocator);
      json.AddMember("meanAbsoluteScoreDifference", comparison.meanAbsoluteScoreDifference, allocator);

      Value matrix(kArrayType);
      for (const auto& row : comparison.changeMatrix)
	{
	  Value jsonRow(kArrayType);
	  for (std::size_t count : row)
	    jsonRow.PushBack(static_cast<uint64_t>(count), allocator);
	  matrix.PushBack(jsonRow, allocator);
	}
      json.AddMember("changeMatrix", matrix, allocator);

      Value changes(kArrayType);
      for (const auto& change : comparison.changes)
	{
	  Value entry(kObjectType);
	  entry.AddMember("id", change.id, allocator);
	  entry.AddMember("topsisScore", change.topsisScore, allocator);
	  entry.AddMember("fuzzyTopsisScore", change.fuzzyTopsisScore, allocator);

	  const std::string crisp(1, abcClassToChar(change.crispClass));
	  const std::string fuzzy(1, abcClassToChar(change.fuzzyClass));
	  entry.AddMember("class", Value(crisp.c_str(), allocator), allocator);
	  entry.AddMember("fuzzyClass", Value(fuzzy.c_str(), allocator), allocator);
	  changes.PushBack(entry, allocator);
	}
      json.AddMember("changes", changes, allocator);

      return json;
    }
  }

  RankingReportWriter::RankingReportWriter(const RankingSnapshot& snapshot)
    : mSnapshot(snapshot)
  {}

  void RankingReportWriter::writeItems(std::ostream& os) const
  {
    const std::streamsize oldPrecision = os.precision(std::numeric_limits<double>::max_digits10);

    os << "id,Risk,Demand fluctuation,Average stock,Daily usage,Unit cost,Lead time,"
       << "Consignment stock,Unit size,Risk_Score,Fluctuation_Score,Consignment_Score,"
       << "Size_Score,Criticality_Agg,Demand_Agg,Supply_Agg,TOPSIS_Score,"
       << "Fuzzy_TOPSIS_Score,Class,Fuzzy_Class\n";

    for (const auto& item : mSnapshot.items)
      {
	os << item.id << ','
	   << csvField(item.risk) << ','
	   << csvField(item.demandFluctuation) << ','
	   << item.averageStock << ','
	   << item.dailyUsage << ','
	   << item.unitCost << ','
	   << item.leadTime << ','
	   << csvField(item.consignmentStock) << ','
	   << csvField(item.unitSize) << ',';
	writeOptional(os, item.riskScore); os << ',';
	writeOptional(os, item.fluctuationScore); os << ',';
	writeOptional(os, item.consignmentScore); os << ',';
	writeOptional(os, item.sizeScore); os << ',';
	writeOptional(os, item.criticalityAgg); os << ',';
	writeOptional(os, item.demandAgg); os << ',';
	writeOptional(os, item.supplyAgg); os << ',';
	writeOptional(os, item.topsisScore); os << ',';
	writeOptional(os, item.fuzzyTopsisScore); os << ',';
	writeOptional(os, item.abcClass); os << ',';
	writeOptional(os, item.fuzzyAbcClass);
	os << '\n';
      }

    os.precision(oldPrecision);
  }

  std::string RankingReportWriter::summaryToJson() const
  {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("itemCount", static_cast<uint64_t>(mSnapshot.items.size()), allocator);

    Value weights(kObjectType);
    for (DecisionCriterion criterion : allDecisionCriteria())
      weights.AddMember(Value(decisionCriterionName(criterion).c_str(), allocator),
			mSnapshot.entropyWeights.getWeight(criterion), allocator);
    doc.AddMember("entropyWeights", weights, allocator);

    const AbcThresholds& thresholds = mSnapshot.configuration.getAbcThresholds();
    Value jsonThresholds(kObjectType);
    jsonThresholds.AddMember("A", thresholds.a, allocator);
    jsonThresholds.AddMember("B", thresholds.b, allocator);
    jsonThresholds.AddMember("C", thresholds.c, allocator);
    doc.AddMember("abcThresholds", jsonThresholds, allocator);

    doc.AddMember("topsisClasses",
		  classSummaryToJson(summarizeClasses(mSnapshot.items, ScoreField::TOPSIS_SCORE), allocator),
		  allocator);
    doc.AddMember("fuzzyTopsisClasses",
		  classSummaryToJson(summarizeClasses(mSnapshot.items, ScoreField::FUZZY_TOPSIS_SCORE), allocator),
		  allocator);
    doc.AddMember("comparison",
		  comparisonToJson(compareClassifications(mSnapshot.items), allocator),
		  allocator);

    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);
    doc.Accept(writer);

    return buffer.GetString();
  }

  void RankingReportWriter::writeSummary(std::ostream& os) const
  {
    os << summaryToJson() << '\n';
  }

  void RankingReportWriter::writeItemsFile(const std::string& fileName) const
  {
    std::ofstream file(fileName);
    if (!file.is_open())
      throw RankingReportException("RankingReportWriter: cannot open " + fileName + " for writing");

    writeItems(file);
    if (!file)
      throw RankingReportException("RankingReportWriter: error writing " + fileName);
  }

  void RankingReportWriter::writeSummaryFile(const std::string& fileName) const
  {
    std::ofstream file(fileName);
    if (!file.is_open())
      throw RankingReportException("RankingReportWriter: cannot open " + fileName + " for writing");

    writeSummary(file);
    if (!file)
      throw RankingReportException("RankingReportWriter: error writing " + fileName);
  }
}
