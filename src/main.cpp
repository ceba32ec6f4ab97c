// main.cpp — minimalist: parse CLI (and optional config), run app.

#include <iostream>

#include "app/app.hpp"
#include "cli/cli.hpp"

int main(int argc, char** argv) {
    cli::Options opt; // defaults
    if (!cli::parse_args(argc, argv, opt)) return opt.exit_code;  // prints help/errors

    return app::run_app(opt, std::cout);
}
