#pragma once

#include <string>
#include <string_view>

#ifndef NTREE_VERSION_MAJOR
#define NTREE_VERSION_MAJOR 0
#endif

#ifndef NTREE_VERSION_MINOR
#define NTREE_VERSION_MINOR 0
#endif

#ifndef NTREE_VERSION_MAINTENANCE
#define NTREE_VERSION_MAINTENANCE 0
#endif

#ifndef NTREE_VERSION_HAS_MAINTENANCE
#define NTREE_VERSION_HAS_MAINTENANCE 0
#endif

#ifndef NTREE_VERSION_STRING
#define NTREE_VERSION_STRING "0.0"
#endif

#ifndef NTREE_VERSION_CORE_STRING
#define NTREE_VERSION_CORE_STRING "0.0"
#endif

namespace ntree {

class Version {
public:
    static constexpr int Major() noexcept { return NTREE_VERSION_MAJOR; }
    static constexpr int Minor() noexcept { return NTREE_VERSION_MINOR; }
    static constexpr int Maintenance() noexcept { return NTREE_VERSION_MAINTENANCE; }

    static constexpr bool HasMaintenance() noexcept { return NTREE_VERSION_HAS_MAINTENANCE != 0; }

    static constexpr std::string_view CoreString() noexcept { return std::string_view{NTREE_VERSION_CORE_STRING}; }
    static constexpr std::string_view String() noexcept { return std::string_view{NTREE_VERSION_STRING}; }

    static std::string FullString()
    {
        return "ntree " + std::string{String()};
    }
};

}  // namespace ntree
