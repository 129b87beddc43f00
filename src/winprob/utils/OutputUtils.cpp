#include "OutputUtils.h"
#include <boost/filesystem.hpp>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace winprob
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%b_%d_%Y_%H%M");
    return ss.str();
}

std::string createOutputFileName(const std::string& outputDir,
                                 const std::string& stem,
                                 const std::string& timestamp,
                                 const std::string& extension)
{
    boost::filesystem::path dir(outputDir.empty() ? "." : outputDir);
    boost::filesystem::create_directories(dir);
    return (dir / (stem + "_" + timestamp + "." + extension)).string();
}

} // namespace utils
} // namespace winprob
