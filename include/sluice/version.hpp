#ifndef SLUICE_VERSION_HPP
#define SLUICE_VERSION_HPP

#pragma once

namespace sluice {

    inline constexpr int version_major = 0;
    inline constexpr int version_minor = 3;
    inline constexpr int version_patch = 0;

    inline constexpr const char* version_string = "0.3.0";

    /// Layout of the durable cache table, stored in PRAGMA user_version.
    /// Bump when columns change; older files are rebuilt, not migrated.
    inline constexpr int durable_schema_version = 1;

} // namespace sluice

#endif // SLUICE_VERSION_HPP
