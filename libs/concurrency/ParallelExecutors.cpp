#include "ParallelExecutors.h"
#include <cstdlib>
#include <limits>

namespace concurrency
{
  std::size_t getNCpus()
  {
    const char* ncpuEnv = std::getenv("ncpu");
    if (ncpuEnv != nullptr)
      {
	const int envCpus = std::atoi(ncpuEnv);
	if (envCpus > 0)
	  return static_cast<std::size_t>(envCpus) % std::numeric_limits<unsigned char>::max();
      }

    const unsigned hwCpus = std::thread::hardware_concurrency();
    return hwCpus ? hwCpus : 2;
  }
}
