#include "cli/commands.hpp"

namespace bob::cli {

void registerAllCommands(Router& r, runtime::Context& ctx) {
    registerUseCommands(r, ctx);
    registerInstallCommands(r, ctx);
    registerRollbackCommands(r, ctx);
    registerListCommands(r, ctx);
    registerRunCommands(r, ctx);
    registerSystemCommands(r, ctx);
}

}
