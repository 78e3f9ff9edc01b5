#pragma once

#include "runbox.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace runbox::cli {

    enum class command : uint8_t { exec, serve };

    struct cli_options {
        service_config cfg{service_config::defaults()};
        command cmd{command::exec};
        // exec reads stdin when unset
        std::optional<std::filesystem::path> request_file{};
    };

    std::optional<int> parse_cli(int argc, char** argv, cli_options& opts);

    int run_exec(const cli_options& opts);
    int run_serve(const cli_options& opts);

}  // namespace runbox::cli
