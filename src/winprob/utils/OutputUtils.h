#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace winprob
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to send progress output to the console and the run log at once.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Local time formatted for file names, e.g. Oct_19_2026_1432
 */
std::string getCurrentTimestamp();

/**
 * @brief Build "<outputDir>/<stem>_<timestamp>.<extension>", creating
 * outputDir if needed
 */
std::string createOutputFileName(const std::string& outputDir,
                                 const std::string& stem,
                                 const std::string& timestamp,
                                 const std::string& extension = "csv");

} // namespace utils
} // namespace winprob
