#pragma once

namespace bob::runtime { struct Context; }

namespace bob::cli {

class Router;

void registerAllCommands(Router& r, runtime::Context& ctx);

void registerUseCommands(Router& r, runtime::Context& ctx);
void registerInstallCommands(Router& r, runtime::Context& ctx);
void registerRollbackCommands(Router& r, runtime::Context& ctx);
void registerListCommands(Router& r, runtime::Context& ctx);
void registerRunCommands(Router& r, runtime::Context& ctx);
void registerSystemCommands(Router& r, runtime::Context& ctx);

}
