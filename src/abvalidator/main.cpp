#include <string>
#include <vector>
#include <stdio.h>
#include <iostream>
#include <fstream>
#include <memory>
#include <chrono>
#include <boost/filesystem.hpp>
#include "ExperimentConfigurationFileReader.h"
#include "ExperimentReportWriter.h"
#include "ExperimentRunner.h"
#include "ParallelExecutors.h"
#include "ResultSerializer.h"
#include "SubjectRecordLoader.h"

// Utility modules
#include "utils/TimeUtils.h"
#include "utils/OutputUtils.h"

using namespace abvalidator;
using namespace abvalidator::utils;

// ---- Main Application Entry Point ----

void usage()
{
    printf("Usage: ABValidator <config file>\n");
    printf("  Results are written to the results/ directory.\n");
}

int main(int argc, char **argv)
{
    if (argc != 2)
    {
        usage();
        return 1;
    }

    std::string configurationFileName = std::string(argv[1]);
    std::shared_ptr<ExperimentFileConfiguration> config;

    ExperimentConfigurationFileReader reader(configurationFileName);
    try {
        config = reader.readConfigurationFile();
    }
    catch (const ExperimentConfigurationException& e) {
        std::cout << "ExperimentConfigurationException thrown when reading configuration file: " << e.what() << std::endl;
        return 1;
    }
    catch (const ConfigurationException& e) {
        std::cout << "ConfigurationException: invalid experiment configuration: " << e.what() << std::endl;
        return 1;
    }
    catch (const CorrectionException& e) {
        std::cout << "CorrectionException: invalid correction in configuration file: " << e.what() << std::endl;
        return 1;
    }

    std::vector<SubjectRecord> records;
    try {
        records = SubjectRecordLoader::loadFromFile(config->getSubjectsPath());
    }
    catch (const SubjectDataException& e) {
        std::cout << "SubjectDataException: Error reading subject data: " << e.what() << std::endl;
        return 1;
    }
    catch (const InvalidSubjectRecordException& e) {
        std::cout << "InvalidSubjectRecordException: Error reading subject data: " << e.what() << std::endl;
        return 1;
    }

    // Mirror everything from here on to a log file
    const std::string experimentName = boost::filesystem::path(configurationFileName).stem().string();
    const std::string logPath = createExperimentLogFileName("results", experimentName);
    std::ofstream logFile(logPath);
    TeeStream experimentLog(std::cout, logFile);

    experimentLog << "Loaded " << records.size() << " subject records from "
                  << config->getSubjectsPath() << std::endl;
    ExperimentReportWriter::writeConfiguration(config->getExperimentConfiguration(),
                                               config->getGroupBucketMap(),
                                               experimentLog);

    auto experimentStartTime = std::chrono::steady_clock::now();
    experimentLog << "\nStarting experiment..." << std::endl;

    try {
        concurrency::ThreadPoolExecutor<> executor;
        ExperimentRunner runner(config->getExperimentConfiguration(), &executor);
        ExperimentReport report = runner.run(records, config->getGroupBucketMap(), &experimentLog);

        ExperimentReportWriter::writeReport(report, experimentLog);

        const std::string resultsPath = createExperimentResultsFileName("results", experimentName);
        ResultSerializer::exportToFile(report, config->getGroupBucketMap(), resultsPath);
        experimentLog << "\nResults written to " << resultsPath << std::endl;
    }
    catch (const UnassignedBucketException& e) {
        std::cerr << "UnassignedBucketException: " << e.what() << std::endl;
        return 1;
    }
    catch (const ZeroTrialsException& e) {
        std::cerr << "ZeroTrialsException: " << e.what() << std::endl;
        return 1;
    }
    catch (const ConfigurationException& e) {
        std::cerr << "ConfigurationException: " << e.what() << std::endl;
        return 1;
    }
    catch (const AbTestException& e) {
        std::cerr << "Experiment failed: " << e.what() << std::endl;
        return 1;
    }
    catch (const std::exception& e) {
        std::cerr << "Experiment failed: " << e.what() << std::endl;
        return 1;
    }

    experimentLog << "\nExperiment completed." << std::endl;
    experimentLog << "Total elapsed time: "
                  << formatElapsedTime(std::chrono::steady_clock::now() - experimentStartTime)
                  << std::endl;

    return 0;
}
