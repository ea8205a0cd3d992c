// <main.cpp> -*- C++ -*-


#include <iostream>

#include "RtlBridgeSim.hpp" // Platform with NEORV32 cores

#include "sparta/app/CommandLineSimulator.hpp"
#include "sparta/app/MultiDetailOptions.hpp"
#include "sparta/sparta.hpp"

// User-friendly usage that correspond with sparta::app::CommandLineSimulator
// options
const char USAGE[] =
    "Usage:\n"
    "    [--num-cores CORES] [--show-records] [--show-tree]\n"
    "    [-p PATTERN VAL] [-c FILENAME] [--arch ARCH]\n"
    "    [-l PATTERN CATEGORY DEST]\n"
    "    [-h,--help]\n"
    "\n"
    "Example: build the NEORV32 with a reset vector at 0x80000000\n"
    "    rtlbridge -p top.cpu.params.reset_address 0x80000000 --show-records\n"
    "\n";

constexpr char VERSION_VARNAME[] = "version,v"; //!< Name of option to show version

int main(int argc, char **argv)
{
    uint32_t num_cores = 1;

    sparta::app::DefaultValues DEFAULTS;
    DEFAULTS.auto_summary_default = "off";
    DEFAULTS.arch_arg_default = "neorv32";
    DEFAULTS.arch_search_dirs = {"arches"}; // Where --arch will be resolved by default

    const std::string rtlbridge_version = " " + std::string(RTLBRIDGE_VERSION);
    sparta::SimulationInfo::getInstance() = sparta::SimulationInfo("RTL Bridge NEORV32 Integration ",
                                                                   argc, argv, rtlbridge_version.c_str(),
                                                                   "", {});
    const bool show_field_names = true;
    sparta::SimulationInfo::getInstance().write(std::cout, "# ", "\n", show_field_names);
    std::cout << "# Sparta Version: " << sparta::SimulationInfo::sparta_version << std::endl;

    // Errors from building the cores (acquisition, conversion,
    // missing reset address) propagate out of populateSimulation
    sparta::app::CommandLineSimulator cls(USAGE, DEFAULTS);
    auto& app_opts = cls.getApplicationOptions();
    app_opts.add_options()
        (VERSION_VARNAME,
         "produce version message",
         "produce version message") // Brief
        ("num-cores",
         sparta::app::named_value<uint32_t>("CORES", &num_cores)->default_value(1),
         "The number of NEORV32 cores on the platform", "The number of NEORV32 cores on the platform")
        ("show-records",
         "Show the platform sources, bus connections and instantiation records");

    // Parse command line options and configure simulator
    int err_code = 0;
    if(!cls.parse(argc, argv, err_code)){
        return err_code; // Any errors already printed to cerr
    }

    bool show_records = false;
    auto& vm = cls.getVariablesMap();
    if(vm.count("show-records") != 0) {
        show_records = true;
    }

    // Create the simulator
    sparta::Scheduler scheduler;
    RtlBridgeSim sim("neorv32",
                     scheduler,
                     num_cores,
                     show_records);

    cls.populateSimulation(&sim);

    cls.runSimulator(&sim);

    cls.postProcess(&sim);

    return 0;
}
