#include "nalstream/version.hh"

#include <cstdint>
#include <string>

namespace nalstream {
std::string get_version() { return NALSTREAM_VERSION; }

uint16_t get_version_major() { return NALSTREAM_VERSION_MAJOR; }

uint16_t get_version_minor() { return NALSTREAM_VERSION_MINOR; }

uint16_t get_version_patch() { return NALSTREAM_VERSION_PATCH; }
} // namespace nalstream
