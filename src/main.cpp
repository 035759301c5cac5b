#include "lapbench/config.hpp"
#include "lapbench/results.hpp"
#include "lapbench/runner.hpp"
#include "lapbench/platform.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    lapbench::Config conf;
    try {
        conf = lapbench::parse_args(argc, argv);
    } catch (const lapbench::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        lapbench::print_help(argv[0]);
        return 1;
    }

    if (conf.help) {
        lapbench::print_help(argv[0]);
        return 0;
    }

    conf.print();

    try {
        const lapbench::RunOutcome outcome = lapbench::run_workers(conf);
        const lapbench::RunReport report =
            lapbench::make_report(conf, outcome, lapbench::collect_platform());

        std::cout << report.merged;

        if (!conf.out.empty()) report.save(conf.out);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Done.\n";
    return 0;
}
