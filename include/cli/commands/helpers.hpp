#pragma once

#include "types/Version.hpp"

#include <string>

namespace bob::runtime { struct Context; }

namespace bob::cli {

struct CommandCall;

// Resolves the first positional, or fails with `missing` when there is none.
types::ResolvedVersion requireVersion(runtime::Context& ctx, const CommandCall& call);

// True when `used` already names this version. Short hashes that were never built are never used.
bool isVersionUsed(runtime::Context& ctx, const types::ResolvedVersion& v);

// The `use` flow shared by use and sync: install unless told not to, then switch.
// Returns the message for the user.
std::string useVersion(runtime::Context& ctx, types::ResolvedVersion v, bool install);

}
