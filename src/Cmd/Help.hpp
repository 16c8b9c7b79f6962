#pragma once

#include "Cli.hpp"

namespace orcka {

extern const Subcmd HELP_CMD;

} // namespace orcka
