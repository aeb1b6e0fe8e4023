#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace abvalidator
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 * 
 * This class allows writing to two different stream buffers simultaneously,
 * useful for logging to both console and file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    /**
     * @brief Construct a TeeBuf with two target stream buffers
     * @param sb1 First stream buffer to write to
     * @param sb2 Second stream buffer to write to
     */
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    /**
     * @brief Handle character overflow by writing to both buffers
     * @param c Character to write
     * @return EOF on error, otherwise the character written
     */
    int overflow(int c) override;

    /**
     * @brief Synchronize both underlying buffers
     * @return 0 on success, -1 on error
     */
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 * 
 * Used by the driver to mirror the experiment log to the console and to
 * the run's log file.
 */
class TeeStream : public std::ostream
{
public:
    /**
     * @brief Construct a TeeStream with two target output streams
     * @param streamA First output stream
     * @param streamB Second output stream
     */
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Create the log filename for an experiment run
 * @param experimentName Stem of the configuration file
 * @return "<outputDir>/<experimentName>_Experiment_Log_<timestamp>.txt"
 */
std::string createExperimentLogFileName(const std::string& outputDir,
                                        const std::string& experimentName);

/**
 * @brief Create the JSON result filename for an experiment run
 * @param experimentName Stem of the configuration file
 * @return "<outputDir>/<experimentName>_Experiment_Results_<timestamp>.json"
 */
std::string createExperimentResultsFileName(const std::string& outputDir,
                                            const std::string& experimentName);

} // namespace utils
} // namespace abvalidator
