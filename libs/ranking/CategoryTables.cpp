// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "CategoryTables.h"

namespace abcrank
{
  MappingTable createDefaultMappingTable()
  {
    MappingTable table;

    table.setTable(QualitativeAttribute::RISK,
		   { {"High", 0.47}, {"Normal", 0.35}, {"Low", 0.18} });

    table.setTable(QualitativeAttribute::DEMAND_FLUCTUATION,
		   { {"Increasing", 0.36}, {"Stable", 0.28}, {"Unknown", 0.20},
		     {"Decreasing", 0.16}, {"Ending", 0.00} });

    table.setTable(QualitativeAttribute::CONSIGNMENT_STOCK,
		   { {"No", 0.80}, {"Yes", 0.20} });

    table.setTable(QualitativeAttribute::UNIT_SIZE,
		   { {"Large", 0.53}, {"Medium", 0.31}, {"Small", 0.13} });

    return table;
  }

  FuzzyNumberTable createDefaultFuzzyNumberTable()
  {
    using TFN = TriangularFuzzyNumber;
    FuzzyNumberTable table;

    table.setTable(QualitativeAttribute::RISK,
		   { {"High",   TFN(0.7, 0.9, 1.0)},
		     {"Normal", TFN(0.3, 0.5, 0.7)},
		     {"Low",    TFN(0.0, 0.1, 0.3)} });

    table.setTable(QualitativeAttribute::DEMAND_FLUCTUATION,
		   { {"Increasing", TFN(0.7, 0.9, 1.0)},
		     {"Stable",     TFN(0.4, 0.6, 0.8)},
		     {"Unknown",    TFN(0.2, 0.4, 0.6)},
		     {"Decreasing", TFN(0.1, 0.2, 0.4)},
		     {"Ending",     TFN(0.0, 0.0, 0.1)} });

    table.setTable(QualitativeAttribute::CONSIGNMENT_STOCK,
		   { {"No",  TFN(0.6, 0.8, 1.0)},
		     {"Yes", TFN(0.0, 0.2, 0.4)} });

    table.setTable(QualitativeAttribute::UNIT_SIZE,
		   { {"Large",  TFN(0.6, 0.8, 1.0)},
		     {"Medium", TFN(0.3, 0.5, 0.7)},
		     {"Small",  TFN(0.0, 0.2, 0.4)} });

    return table;
  }
}
