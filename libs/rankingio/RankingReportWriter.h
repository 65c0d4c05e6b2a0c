// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include "RankingPipeline.h"

namespace abcrank::io
{
  class RankingReportException : public std::runtime_error
  {
  public:
    RankingReportException(const std::string msg)
      : std::runtime_error(msg)
    {}

    ~RankingReportException()
    {}
  };

  /**
   * @brief Writes the results of a ranking run.
   *
   * The item report is a CSV file with one row per item in crisp rank
   * order: id, the raw import columns, every derived score and both
   * classes. Derived values that were never computed are left empty.
   *
   * The summary is a JSON document holding the item count, the entropy
   * weights, the thresholds, a class summary for each track and the
   * crisp against fuzzy comparison.
   */
  class RankingReportWriter
  {
  public:
    explicit RankingReportWriter(const RankingSnapshot& snapshot);

    void writeItems(std::ostream& os) const;
    void writeSummary(std::ostream& os) const;

    /**
     * @throws RankingReportException if the file cannot be written
     */
    void writeItemsFile(const std::string& fileName) const;

    /**
     * @throws RankingReportException if the file cannot be written
     */
    void writeSummaryFile(const std::string& fileName) const;

    std::string summaryToJson() const;

  private:
    const RankingSnapshot& mSnapshot;
  };
}
