#pragma once

#include <filesystem>

namespace bob::types {

enum class InstallStatus {
    Installed,
    AlreadyInstalled,
    NightlyUpToDate
};

struct InstallResult {
    InstallStatus status = InstallStatus::Installed;
    std::filesystem::path path; // set for Installed
};

}
