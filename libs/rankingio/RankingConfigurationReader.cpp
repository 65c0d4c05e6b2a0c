// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "RankingConfigurationReader.h"
#include <fstream>
#include <iterator>

using namespace rapidjson;

namespace abcrank::io
{
  namespace
  {
    const Value& requireObject(const Value& parent, const char* member, const std::string& context)
    {
      const Value& value = parent[member];
      if (!value.IsObject())
	throw RankingConfigurationException("RankingConfiguration: " + context + "." + member +
					    " must be a JSON object");
      return value;
    }

    double requireNonNegativeNumber(const Value& value, const std::string& context)
    {
      if (!value.IsNumber())
	throw RankingConfigurationException("RankingConfiguration: " + context + " must be a number");

      const double number = value.GetDouble();
      if (number < 0.0)
	throw RankingConfigurationException("RankingConfiguration: " + context + " must not be negative");

      return number;
    }

    void overrideNumber(const Value& group, const char* member, const std::string& context,
			double& target)
    {
      if (group.HasMember(member))
	target = requireNonNegativeNumber(group[member], context + "." + member);
    }

    QualitativeAttribute attributeFromKey(const std::string& key, const std::string& context)
    {
      try
	{
	  return qualitativeAttributeFromName(key);
	}
      catch (const std::invalid_argument&)
	{
	  throw RankingConfigurationException("RankingConfiguration: unknown attribute '" + key +
					      "' in " + context);
	}
    }

    TriangularFuzzyNumber readFuzzyNumber(const Value& value, const std::string& context)
    {
      if (!value.IsArray() || value.Size() != 3)
	throw RankingConfigurationException("RankingConfiguration: " + context +
					    " must be an array of three numbers");

      for (SizeType i = 0; i < 3; ++i)
	if (!value[i].IsNumber())
	  throw RankingConfigurationException("RankingConfiguration: " + context +
					      " must be an array of three numbers");

      TriangularFuzzyNumber tfn(value[0].GetDouble(), value[1].GetDouble(), value[2].GetDouble());
      if (!tfn.isWellFormed())
	throw RankingConfigurationException("RankingConfiguration: " + context +
					    " must satisfy 0 <= l <= m <= u <= 1");
      return tfn;
    }

    void readMappings(const Value& mappings, MappingTable& table)
    {
      for (Value::ConstMemberIterator it = mappings.MemberBegin(); it != mappings.MemberEnd(); ++it)
	{
	  const std::string attributeName = it->name.GetString();
	  const QualitativeAttribute attribute = attributeFromKey(attributeName, "mappings");
	  const std::string context = "mappings." + attributeName;

	  if (!it->value.IsObject())
	    throw RankingConfigurationException("RankingConfiguration: " + context +
						" must be a JSON object");

	  MappingTable::LabelMap labels;
	  for (Value::ConstMemberIterator l = it->value.MemberBegin(); l != it->value.MemberEnd(); ++l)
	    {
	      const std::string label = l->name.GetString();
	      labels[label] = requireNonNegativeNumber(l->value, context + "." + label);
	    }

	  table.setTable(attribute, labels);
	}
    }

    void readFuzzyNumbers(const Value& fuzzyNumbers, FuzzyNumberTable& table)
    {
      for (Value::ConstMemberIterator it = fuzzyNumbers.MemberBegin(); it != fuzzyNumbers.MemberEnd(); ++it)
	{
	  const std::string attributeName = it->name.GetString();
	  const QualitativeAttribute attribute = attributeFromKey(attributeName, "fuzzyNumbers");
	  const std::string context = "fuzzyNumbers." + attributeName;

	  if (!it->value.IsObject())
	    throw RankingConfigurationException("RankingConfiguration: " + context +
						" must be a JSON object");

	  FuzzyNumberTable::LabelMap labels;
	  for (Value::ConstMemberIterator l = it->value.MemberBegin(); l != it->value.MemberEnd(); ++l)
	    {
	      const std::string label = l->name.GetString();
	      labels[label] = readFuzzyNumber(l->value, context + "." + label);
	    }

	  table.setTable(attribute, labels);
	}
    }

    void readAggregationWeights(const Value& weights, AggregationWeights& aggregation)
    {
      const std::string context("aggregationWeights");

      if (weights.HasMember("Criticality"))
	{
	  const Value& group = requireObject(weights, "Criticality", context);
	  overrideNumber(group, "Risk", context + ".Criticality", aggregation.criticality.risk);
	  overrideNumber(group, "Fluctuation", context + ".Criticality", aggregation.criticality.fluctuation);
	}

      if (weights.HasMember("Demand"))
	{
	  const Value& group = requireObject(weights, "Demand", context);
	  overrideNumber(group, "DailyUsage", context + ".Demand", aggregation.demand.dailyUsage);
	  overrideNumber(group, "AverageStock", context + ".Demand", aggregation.demand.averageStock);
	}

      if (weights.HasMember("Supply"))
	{
	  const Value& group = requireObject(weights, "Supply", context);
	  overrideNumber(group, "LeadTime", context + ".Supply", aggregation.supply.leadTime);
	  overrideNumber(group, "Consignment", context + ".Supply", aggregation.supply.consignment);
	}
    }

    void readAbcThresholds(const Value& thresholds, AbcThresholds& abc)
    {
      const std::string context("abcThresholds");
      overrideNumber(thresholds, "A", context, abc.a);
      overrideNumber(thresholds, "B", context, abc.b);
      overrideNumber(thresholds, "C", context, abc.c);
    }

    template <class Writer>
    void writeValue(Writer& writer, double value)
    {
      writer.Double(value);
    }

    template <class Writer>
    void writeValue(Writer& writer, const TriangularFuzzyNumber& tfn)
    {
      writer.StartArray();
      writer.Double(tfn.getLower());
      writer.Double(tfn.getModal());
      writer.Double(tfn.getUpper());
      writer.EndArray();
    }

    template <class Table, class Writer>
    void writeTables(Writer& writer, const Table& table)
    {
      writer.StartObject();
      for (QualitativeAttribute attribute : allQualitativeAttributes())
	{
	  writer.Key(qualitativeAttributeName(attribute).c_str());
	  writer.StartObject();
	  for (const auto& entry : table.getTable(attribute))
	    {
	      writer.Key(entry.first.c_str());
	      writeValue(writer, entry.second);
	    }
	  writer.EndObject();
	}
      writer.EndObject();
    }

    template <class Writer>
    void writeWeightPair(Writer& writer, const char* group,
			 const char* firstKey, double first,
			 const char* secondKey, double second)
    {
      writer.Key(group);
      writer.StartObject();
      writer.Key(firstKey);
      writer.Double(first);
      writer.Key(secondKey);
      writer.Double(second);
      writer.EndObject();
    }
  }

  RankingConfigurationReader::RankingConfigurationReader(const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  RankingConfiguration RankingConfigurationReader::readConfigurationFile() const
  {
    boost::filesystem::path configurationPath(mConfigurationFileName);
    if (!boost::filesystem::exists(configurationPath))
      throw RankingConfigurationException("RankingConfiguration: configuration file " +
					  mConfigurationFileName + " does not exist");

    std::ifstream file(mConfigurationFileName);
    if (!file.is_open())
      throw RankingConfigurationException("RankingConfiguration: cannot open " + mConfigurationFileName);

    std::string jsonText((std::istreambuf_iterator<char>(file)),
			 std::istreambuf_iterator<char>());

    return parseConfiguration(jsonText);
  }

  RankingConfiguration RankingConfigurationReader::parseConfiguration(const std::string& jsonText,
								      const RankingConfiguration& base)
  {
    Document doc;
    doc.Parse<kParseFullPrecisionFlag>(jsonText.c_str());

    if (doc.HasParseError())
      throw RankingConfigurationException(std::string("RankingConfiguration: JSON parse error at offset ") +
					  std::to_string(doc.GetErrorOffset()) + ": " +
					  GetParseError_En(doc.GetParseError()));

    if (!doc.IsObject())
      throw RankingConfigurationException("RankingConfiguration: top level must be a JSON object");

    MappingTable mappingTable(base.getMappingTable());
    FuzzyNumberTable fuzzyNumberTable(base.getFuzzyNumberTable());
    AggregationWeights aggregationWeights(base.getAggregationWeights());
    AbcThresholds abcThresholds(base.getAbcThresholds());

    if (doc.HasMember("mappings"))
      readMappings(requireObject(doc, "mappings", "configuration"), mappingTable);

    if (doc.HasMember("fuzzyNumbers"))
      readFuzzyNumbers(requireObject(doc, "fuzzyNumbers", "configuration"), fuzzyNumberTable);

    if (doc.HasMember("aggregationWeights"))
      readAggregationWeights(requireObject(doc, "aggregationWeights", "configuration"), aggregationWeights);

    if (doc.HasMember("abcThresholds"))
      readAbcThresholds(requireObject(doc, "abcThresholds", "configuration"), abcThresholds);

    return RankingConfiguration(mappingTable, fuzzyNumberTable, aggregationWeights, abcThresholds);
  }

  std::string RankingConfigurationReader::toJson(const RankingConfiguration& configuration)
  {
    StringBuffer buffer;
    PrettyWriter<StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("mappings");
    writeTables(writer, configuration.getMappingTable());

    writer.Key("fuzzyNumbers");
    writeTables(writer, configuration.getFuzzyNumberTable());

    const AggregationWeights& weights = configuration.getAggregationWeights();
    writer.Key("aggregationWeights");
    writer.StartObject();
    writeWeightPair(writer, "Criticality",
		    "Risk", weights.criticality.risk,
		    "Fluctuation", weights.criticality.fluctuation);
    writeWeightPair(writer, "Demand",
		    "DailyUsage", weights.demand.dailyUsage,
		    "AverageStock", weights.demand.averageStock);
    writeWeightPair(writer, "Supply",
		    "LeadTime", weights.supply.leadTime,
		    "Consignment", weights.supply.consignment);
    writer.EndObject();

    const AbcThresholds& thresholds = configuration.getAbcThresholds();
    writer.Key("abcThresholds");
    writer.StartObject();
    writer.Key("A");
    writer.Double(thresholds.a);
    writer.Key("B");
    writer.Double(thresholds.b);
    writer.Key("C");
    writer.Double(thresholds.c);
    writer.EndObject();

    writer.EndObject();

    return buffer.GetString();
  }
}
