#include "Parallelism.hpp"

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <tbb/global_control.h>
#include <thread>

namespace orcka {

std::size_t numThreads() noexcept {
  const unsigned int numThreads = std::thread::hardware_concurrency();
  if (numThreads > 1) {
    return numThreads;
  }
  return 1;
}

// Generation is sequential until a caller asks for more workers.
static std::unique_ptr<tbb::global_control> parallelism =
    std::make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism, 1);

void setParallelism(const std::size_t numThreads) noexcept {
  const std::size_t workers = numThreads == 0 ? 1 : numThreads;
  spdlog::debug("Setting parallelism to {}", workers);
  parallelism.reset();
  parallelism = std::make_unique<tbb::global_control>(
      tbb::global_control::max_allowed_parallelism, workers);
}

std::size_t getParallelism() noexcept {
  return tbb::global_control::active_value(
      tbb::global_control::max_allowed_parallelism);
}

bool isParallel() noexcept { return getParallelism() > 1; }

} // namespace orcka
