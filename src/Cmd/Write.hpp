#pragma once

#include "Cli.hpp"

namespace orcka {

extern const Subcmd WRITE_CMD;

} // namespace orcka
