#include "install/Checksum.hpp"
#include "util/files.hpp"
#include "util/hash.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <sstream>

using namespace bob::types;

namespace bob::install {

bool hasChecksum(const ResolvedVersion& v) {
    if (v.kind == VersionKind::Nightly) return true;
    return v.semver && *v.semver > Semver{0, 4, 4};
}

std::string checksumAssetName(const ResolvedVersion& v, const std::string& archiveName) {
    if (v.kind == VersionKind::Nightly || (v.semver && *v.semver >= Semver{0, 10, 4})) return "shasum.txt";
    return archiveName + ".sha256sum";
}

std::optional<std::string> expectedHash(const std::string& checksumContent, const std::string& filename) {
    std::istringstream in(checksumContent);
    std::string line;
    while (std::getline(in, line)) {
        if (line.find(filename) == std::string::npos) continue;
        std::istringstream tokens(line);
        std::string hash;
        if (tokens >> hash) return boost::algorithm::to_lower_copy(hash);
    }
    return std::nullopt;
}

bool matches(const std::filesystem::path& archive, const std::filesystem::path& checksumFile,
             const std::string& filename) {
    const auto expected = expectedHash(util::readFileToString(checksumFile), filename);
    if (!expected) {
        log::Registry::install()->error("Checksum not found for {}", filename);
        return false;
    }

    const auto actual = util::sha256File(archive);
    log::Registry::install()->debug("[Checksum] {} expected {} got {}", filename, *expected, actual);
    return actual == *expected;
}

}
