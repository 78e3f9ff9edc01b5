#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        runbox::cli::cli_options opts{};
        if (auto cli_result = runbox::cli::parse_cli(argc, argv, opts)) {
            return *cli_result;
        }

        if (opts.cmd == runbox::cli::command::serve) {
            return runbox::cli::run_serve(opts);
        }
        return runbox::cli::run_exec(opts);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
