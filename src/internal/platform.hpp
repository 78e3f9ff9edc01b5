#pragma once

#include <string_view>

namespace runbox::internal::platform {
    using namespace std::string_view_literals;

    inline constexpr bool is_linux = RUNBOX_PLATFORM_LINUX != 0;

    // network namespaces and prctl(PR_SET_PDEATHSIG) are linux-only
    inline constexpr bool supports_netns = is_linux;

    namespace tool {
        inline constexpr auto node = "node"sv;
        inline constexpr auto python = "python3"sv;
        // empty when the interpreter was not found at configure time
        inline constexpr auto node_path = std::string_view{RUNBOX_NODE_EXECUTABLE_PATH};
        inline constexpr auto python_path = std::string_view{RUNBOX_PYTHON_EXECUTABLE_PATH};
    }  // namespace tool

}  // namespace runbox::internal::platform
