#pragma once

#include "Cli.hpp"

namespace orcka {

extern const Subcmd VERSION_CMD;

} // namespace orcka
