#pragma once

/**
@file
@brief cuedat version string, assembled by the build from the project version and the prerelease/build options.
*/

#if CueDat_DEV_BUILD
    #define CueDat_FULL_VERSION CueDat_VERSION "-dev"
#else
    #define CueDat_FULL_VERSION CueDat_VERSION
#endif

namespace cuedat::version {

/// @brief "<major>.<minor>.<patch>[-<prerelease>][+<build>]", with `-dev` appended to development builds.
inline constexpr auto fullstring = CueDat_FULL_VERSION;

} // namespace cuedat::version
