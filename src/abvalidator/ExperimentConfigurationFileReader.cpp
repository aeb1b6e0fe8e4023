// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <optional>
#include <type_traits>
#include <typeinfo>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"
#include "ExperimentConfigurationFileReader.h"
#include "GroupBucketSpecParser.h"

using namespace boost::filesystem;

namespace abvalidator
{
  template <class T>
  static T tryCast(const std::string& columnName, const std::string& inputString)
  {
    // lexical_cast wraps "-1" to the largest unsigned value
    if (std::is_unsigned<T>::value && boost::algorithm::starts_with(boost::algorithm::trim_copy(inputString), "-"))
      throw ExperimentConfigurationException("ExperimentConfigurationFileReader - " + columnName +
					     " value '" + inputString + "' must not be negative");

    try
      {
	return boost::lexical_cast<T>(inputString);
      }
    catch (const boost::bad_lexical_cast& e)
      {
	throw ExperimentConfigurationException("ExperimentConfigurationFileReader - cannot read " +
					       columnName + " value '" + inputString + "' as " +
					       typeid(T).name() + ": " + e.what());
      }
  }

  static bool parseBoolean(const std::string& columnName, const std::string& value)
  {
    std::string normalized = boost::algorithm::to_lower_copy(value);

    if (normalized.empty() || normalized == "false" || normalized == "no" || normalized == "0")
      return false;

    if (normalized == "true" || normalized == "yes" || normalized == "1")
      return true;

    throw ExperimentConfigurationException("ExperimentConfigurationFileReader - " + columnName +
					   " value '" + value + "' is not a boolean");
  }

  static std::optional<CorrectionMethod> parseCorrectionMethod(const std::string& value)
  {
    std::string normalized = boost::algorithm::to_lower_copy(value);
    if (normalized.empty() || normalized == "none")
      return std::nullopt;

    try
      {
	return correctionMethodFromString(normalized);
      }
    catch (const UnsupportedCorrectionMethodException& e)
      {
	throw ExperimentConfigurationException("ExperimentConfigurationFileReader - Correction: " +
					       std::string(e.what()));
      }
  }

  ExperimentConfigurationFileReader::ExperimentConfigurationFileReader (const std::string& configurationFileName)
    : mConfigurationFileName(configurationFileName)
  {}

  std::shared_ptr<ExperimentFileConfiguration> ExperimentConfigurationFileReader::readConfigurationFile()
  {
    boost::filesystem::path configFilePath (mConfigurationFileName);
    if (!exists (configFilePath))
      throw ExperimentConfigurationException("Configuration file " + configFilePath.string() + " does not exist");

    std::string subjectsPathStr, groupBucketsStr, methodStr, alphaStr, hypothesisStr;
    std::string correctionStr, sequentialStr, stoppingThresholdStr;
    std::string priorSuccessesStr, priorTrialsStr;

    try
      {
	// Check if the file has a header row by reading the first line
	io::CSVReader<10, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>>
	  csvConfigFileCheck(mConfigurationFileName.c_str());
	char* firstLine = csvConfigFileCheck.next_line();
	bool hasHeader = false;
	if (firstLine)
	  {
	    std::string firstLineStr(firstLine);
	    hasHeader = (firstLineStr.find("SubjectsPath") != std::string::npos &&
			 firstLineStr.find("GroupBuckets") != std::string::npos);
	  }

	io::CSVReader<10, io::trim_chars<' ', '\t'>, io::double_quote_escape<',','\"'>>
	  csvConfigFile(mConfigurationFileName.c_str());

	if (hasHeader)
	  csvConfigFile.read_header(io::ignore_missing_column, "SubjectsPath", "GroupBuckets", "Method",
				    "Alpha", "Hypothesis", "Correction", "Sequential",
				    "StoppingThreshold", "PriorSuccesses", "PriorTrials");
	else
	  csvConfigFile.set_header("SubjectsPath", "GroupBuckets", "Method",
				   "Alpha", "Hypothesis", "Correction", "Sequential",
				   "StoppingThreshold", "PriorSuccesses", "PriorTrials");

	if (!csvConfigFile.read_row (subjectsPathStr, groupBucketsStr, methodStr, alphaStr,
				     hypothesisStr, correctionStr, sequentialStr,
				     stoppingThresholdStr, priorSuccessesStr, priorTrialsStr))
	  throw ExperimentConfigurationException("ExperimentConfigurationFileReader::readConfigurationFile - " +
						 mConfigurationFileName + " has no configuration row");
      }
    catch (const io::error::base& e)
      {
	throw ExperimentConfigurationException("ExperimentConfigurationFileReader::readConfigurationFile - " +
					       std::string(e.what()));
      }

    if (subjectsPathStr.empty())
      throw ExperimentConfigurationException("ExperimentConfigurationFileReader::readConfigurationFile - SubjectsPath is required");

    if (groupBucketsStr.empty())
      throw ExperimentConfigurationException("ExperimentConfigurationFileReader::readConfigurationFile - GroupBuckets is required");

    boost::filesystem::path subjectsPath (subjectsPathStr);
    if (subjectsPath.is_relative())
      subjectsPath = configFilePath.parent_path() / subjectsPath;

    if (!exists (subjectsPath))
      throw ExperimentConfigurationException("Subject data file path " + subjectsPath.string() + " does not exist");

    GroupBucketMap groupBuckets = GroupBucketSpecParser::parse(groupBucketsStr);

    TestMethod method = methodStr.empty() ? TestMethod::Frequentist : testMethodFromString(methodStr);

    double alpha = alphaStr.empty() ? FrequentistTestConfiguration::DefaultAlpha :
      tryCast<double>("Alpha", alphaStr);

    TailType tail = hypothesisStr.empty() ? TailType::TwoTailed : tailTypeFromString(hypothesisStr);

    std::optional<CorrectionMethod> correctionMethod = parseCorrectionMethod(correctionStr);

    bool sequential = parseBoolean("Sequential", sequentialStr);

    double stoppingThreshold = stoppingThresholdStr.empty() ?
      ExperimentConfiguration::DefaultStoppingThreshold :
      tryCast<double>("StoppingThreshold", stoppingThresholdStr);

    uint64_t priorSuccesses = priorSuccessesStr.empty() ? BayesianPrior::DefaultPriorSuccesses :
      tryCast<uint64_t>("PriorSuccesses", priorSuccessesStr);

    uint64_t priorTrials = priorTrialsStr.empty() ? BayesianPrior::DefaultPriorTrials :
      tryCast<uint64_t>("PriorTrials", priorTrialsStr);

    ExperimentConfiguration experimentConfig(method,
					     FrequentistTestConfiguration(alpha, tail),
					     correctionMethod,
					     sequential,
					     stoppingThreshold,
					     BayesianPrior(priorSuccesses, priorTrials));

    return std::make_shared<ExperimentFileConfiguration>(subjectsPath.string(),
							 groupBuckets,
							 experimentConfig);
  }
}
