#include "process/Processes.hpp"
#include "process/Runner.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace bob::process {

namespace {

bool mentionsEditor(const std::string& name) {
    return boost::algorithm::to_lower_copy(name).find("nvim") != std::string::npos;
}

#if defined(__linux__)
bool scanProc() {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/proc", ec)) {
        const auto name = entry.path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) continue;

        // procfs reports a zero size, so read by line rather than by length
        std::ifstream comm(entry.path() / "comm");
        std::string processName;
        if (comm && std::getline(comm, processName) && mentionsEditor(processName)) return true;
    }
    return false;
}
#endif

}

bool isEditorRunning(Runner& runner) {
#if defined(__linux__)
    (void)runner;
    return scanProc();
#else
#if defined(_WIN32)
    const Command cmd{"tasklist", {"/FO", "CSV", "/NH"}, std::nullopt};
#else
    const Command cmd{"ps", {"-A", "-o", "comm="}, std::nullopt};
#endif
    const auto res = runner.capture(cmd);
    if (!res.ok()) {
        log::Registry::bob()->warn("Could not list running processes ({}), assuming the editor is not running",
                                   cmd.toString());
        return false;
    }

    std::istringstream in(res.output);
    std::string line;
    while (std::getline(in, line))
        if (mentionsEditor(line)) return true;
    return false;
#endif
}

}
