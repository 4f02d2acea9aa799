#include "cmd_args.hpp"
#include "cmd_optim.hpp"
#include "cmd_solve.hpp"
#include "cmd_sweep.hpp"
#include "cmd_trim.hpp"
#include "config.hpp"

#include <iostream>
#include <string>

namespace {

void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> -c <config> [options]\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  solve    Thrust, torque and section table at one operating point\n";
    std::cerr << "  sweep    Evaluate the rpm_sweep x velocity_sweep grid\n";
    std::cerr << "  trim     Find the rpm producing target_thrust\n";
    std::cerr << "  optim    Optimize root/tip twist at the operating point\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  --rpm VALUE        Override rpm from config\n";
    std::cerr << "  --velocity VALUE   Override free-stream velocity (m/s)\n";
    std::cerr << "  -o FILE            HDF5 output file (overrides 'output')\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << prog << " solve -c configs/example.cfg\n";
    std::cerr << "  " << prog << " sweep -c configs/example.cfg -o sweep.h5\n";
    std::cerr << "  " << prog << " solve -c configs/example.cfg --rpm 4500 --velocity 12\n";
}

CliOverrides parseOverrides(int argc, char* argv[], int first) {
    CliOverrides overrides;
    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--rpm") {
            overrides.rpm = cliarg::parseDouble(cliarg::requireOptionValue(argc, argv, i, "--rpm"), "--rpm");
        } else if (arg == "--velocity") {
            overrides.velocity = cliarg::parseDouble(
                cliarg::requireOptionValue(argc, argv, i, "--velocity"), "--velocity");
        } else if (arg == "-o") {
            overrides.output = cliarg::requireOptionValue(argc, argv, i, "-o");
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }
    return overrides;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2 || cliarg::isHelpFlag(argv[1])) {
        printUsage(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    std::string command = argv[1];

    if (argc < 4 || std::string(argv[2]) != "-c") {
        std::cerr << "Error: expected -c <config>\n";
        printUsage(argv[0]);
        return 1;
    }

    Config cfg;
    CliOverrides overrides;
    try {
        cfg = Config::load(argv[3]);
        overrides = parseOverrides(argc, argv, 4);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        if (command == "solve") {
            return runSolve(cfg, overrides);
        } else if (command == "sweep") {
            return runSweep(cfg, overrides);
        } else if (command == "trim") {
            return runTrim(cfg, overrides);
        } else if (command == "optim") {
            return runOptim(cfg, overrides);
        } else {
            std::cerr << "Unknown command: " << command << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
