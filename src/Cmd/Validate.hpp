#pragma once

#include "Cli.hpp"

namespace orcka {

extern const Subcmd VALIDATE_CMD;

} // namespace orcka
