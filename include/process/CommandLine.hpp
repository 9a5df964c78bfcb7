#pragma once

#include <string>
#include <vector>

namespace bob::process {

// Quotes one argument for a Windows command line. Arguments without blanks or quotes pass through.
std::string quoteArg(const std::string& arg);

// program followed by its quoted arguments, as CreateProcess expects it.
std::string commandLine(const std::string& program, const std::vector<std::string>& args);

}
