#pragma once

#include <QString>

#include "nullus/cli/CommandLine.hpp"
#include "nullus/core/AppContext.hpp"

namespace nullus {
namespace cli {

// Runs the parsed action against the session and returns the text to print.
// Errors of the store and of the command propagate as TaskError.
QString runCommand(core::AppContext &context, const ParsedCommand &command);

core::AppContext::Command commandFor(const ParsedCommand &command);

} // namespace cli
} // namespace nullus
