#pragma once

#include <cstddef>

namespace orcka {

std::size_t numThreads() noexcept;

void setParallelism(std::size_t numThreads) noexcept;
std::size_t getParallelism() noexcept;
bool isParallel() noexcept;

} // namespace orcka
