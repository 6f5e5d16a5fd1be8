#pragma once

#include <cstdint>
#include <string>

namespace nalstream {

    /**
     * \brief Get the major version number of nalstream
     *
     * \return Major version number.
     */
    uint16_t get_version_major();

    /**
     * \brief Get the minor version number of nalstream
     *
     * \return Minor version number.
     */
    uint16_t get_version_minor();

    /**
     * \brief Get the patch version number of nalstream
     *
     * \return Patch version number.
     */
    uint16_t get_version_patch();

    /**
     * \brief Get the full version string of nalstream
     *
     * \return Full version string (e.g., "1.2.3").
     */
    std::string get_version();

} // namespace nalstream
