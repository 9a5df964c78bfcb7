#pragma once

#include "cli/CommandUsage.hpp"

namespace bob::cli {

class Usage {
public:
    [[nodiscard]] static CommandBook all();

    [[nodiscard]] static CommandUsage use();
    [[nodiscard]] static CommandUsage install();
    [[nodiscard]] static CommandUsage sync();
    [[nodiscard]] static CommandUsage uninstall();
    [[nodiscard]] static CommandUsage rollback();
    [[nodiscard]] static CommandUsage erase();
    [[nodiscard]] static CommandUsage list();
    [[nodiscard]] static CommandUsage listRemote();
    [[nodiscard]] static CommandUsage run();
    [[nodiscard]] static CommandUsage update();
    [[nodiscard]] static CommandUsage help();
    [[nodiscard]] static CommandUsage version();

private:
    static constexpr auto VERSION_FORMS = "nightly|stable|latest|head|<version-string>|<commit-hash>";
};

}
