#include "runtime/BuildInfo.hpp"

#include <version.h>

namespace bob::runtime {

std::string toolVersion() { return BOB_VERSION; }

}
