#pragma once

#include <string>

namespace bob::runtime {

// "x.y.z" as configured at build time. The shim answers `--&bob` with this string.
std::string toolVersion();

}
