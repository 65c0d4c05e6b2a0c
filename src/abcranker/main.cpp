#include "InventoryCsvReader.h"
#include "RankingConfigurationReader.h"
#include "RankingReportWriter.h"
#include "RankingPipeline.h"
#include "RankingConsoleReporter.h"
#include <iostream>
#include <string>
#include <boost/program_options.hpp>

namespace po = boost::program_options;

using namespace abcrank;
using abcranker::reporting::RankingConsoleReporter;

void printUsage(const po::options_description& desc) {
    std::cout << "ABC Ranker - MCDM inventory ranking (TOPSIS and Fuzzy TOPSIS)\n\n";
    std::cout << "Usage: abcranker --input <items.csv> [options]\n\n";
    std::cout << desc << std::endl;

    std::cout << "\nExamples:\n";
    std::cout << "  # Rank with default mappings, weights and thresholds\n";
    std::cout << "  abcranker --input items.csv\n\n";
    std::cout << "  # Custom configuration, 10/20/70 split, reports written to disk\n";
    std::cout << "  abcranker --input items.csv --config ranking.json --threshold-a 10 --threshold-b 20 \\\n";
    std::cout << "            --threshold-c 70 --output ranked.csv --summary summary.json\n\n";
    std::cout << "  # Print the effective configuration as JSON\n";
    std::cout << "  abcranker --config ranking.json --dump-config\n";
}

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Options");
        desc.add_options()
            ("help,h", "Show help message")
            ("input,i", po::value<std::string>(), "Inventory CSV file")
            ("config,c", po::value<std::string>(), "JSON configuration overrides (mappings, fuzzy numbers, weights, thresholds)")
            ("threshold-a", po::value<double>(), "Percentage of items in class A")
            ("threshold-b", po::value<double>(), "Percentage of items in class B")
            ("threshold-c", po::value<double>(), "Percentage of items in class C")
            ("output,o", po::value<std::string>(), "Write the ranked items to this CSV file")
            ("summary,s", po::value<std::string>(), "Write a JSON summary to this file")
            ("stats", "Print descriptive statistics and the correlation matrix")
            ("top", po::value<std::size_t>()->default_value(10), "Number of top ranked items to print")
            ("dump-config", "Print the effective configuration as JSON and exit");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            printUsage(desc);
            return 0;
        }

        RankingConfiguration configuration;
        if (vm.count("config")) {
            const std::string configPath = vm["config"].as<std::string>();
            std::cout << "Loading configuration from " << configPath << std::endl;
            configuration = io::RankingConfigurationReader(configPath).readConfigurationFile();
        }

        AbcThresholds thresholds = configuration.getAbcThresholds();
        if (vm.count("threshold-a"))
            thresholds.a = vm["threshold-a"].as<double>();
        if (vm.count("threshold-b"))
            thresholds.b = vm["threshold-b"].as<double>();
        if (vm.count("threshold-c"))
            thresholds.c = vm["threshold-c"].as<double>();
        configuration.setAbcThresholds(thresholds);

        if (thresholds.a + thresholds.b + thresholds.c != 100.0) {
            std::cerr << "Warning: ABC thresholds sum to " << (thresholds.a + thresholds.b + thresholds.c)
                      << " rather than 100" << std::endl;
        }

        if (vm.count("dump-config")) {
            std::cout << io::RankingConfigurationReader::toJson(configuration) << std::endl;
            return 0;
        }

        if (!vm.count("input")) {
            std::cerr << "Error: --input is required" << std::endl;
            printUsage(desc);
            return 1;
        }

        const std::string inputPath = vm["input"].as<std::string>();
        std::cout << "Reading inventory from " << inputPath << std::endl;
        const std::vector<InventoryItem> rawItems = io::InventoryCsvReader(inputPath).readFile();
        std::cout << "Loaded " << rawItems.size() << " items." << std::endl;

        if (rawItems.empty()) {
            std::cerr << "Error: no inventory items in " << inputPath << std::endl;
            return 1;
        }

        RankingPipeline pipeline(configuration);
        const RankingSnapshot snapshot = pipeline.recompute(rawItems, std::cout);
        std::cout << std::endl;

        if (vm.count("stats"))
            RankingConsoleReporter::writeDataOverview(std::cout, snapshot.items);

        RankingConsoleReporter::writeEntropyWeights(std::cout, snapshot.entropyWeights);
        RankingConsoleReporter::writeClassDistribution(std::cout, snapshot.items);
        RankingConsoleReporter::writeComparison(std::cout, compareClassifications(snapshot.items), 10);

        const std::size_t topCount = vm["top"].as<std::size_t>();
        if (topCount > 0) {
            RankingConsoleReporter::writeTopRanked(std::cout, snapshot.items, ScoreField::TOPSIS_SCORE, topCount);
            RankingConsoleReporter::writeTopRanked(std::cout, snapshot.items, ScoreField::FUZZY_TOPSIS_SCORE, topCount);
        }

        io::RankingReportWriter writer(snapshot);
        if (vm.count("output")) {
            const std::string outputPath = vm["output"].as<std::string>();
            writer.writeItemsFile(outputPath);
            std::cout << "Ranked items written to " << outputPath << std::endl;
        }

        if (vm.count("summary")) {
            const std::string summaryPath = vm["summary"].as<std::string>();
            writer.writeSummaryFile(summaryPath);
            std::cout << "Summary written to " << summaryPath << std::endl;
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
