#include <boost/program_options.hpp>
#include <filesystem>
#include <vector>
#include <string>
#include <iostream>

#include "sparta/simulation/TreeNode.hpp"
#include "sparta/log/MessageSource.hpp"
#include "sparta/log/Tap.hpp"

#include "core/NEORV32.hpp"
#include "core/RTLExceptions.hpp"
#include "core/rtl/Fetcher.hpp"
#include "core/rtl/SourceAcquirer.hpp"
#include "core/toolchain/ToolchainPipeline.hpp"
#include "core/variant/VariantTable.hpp"

int main(int argc, char **argv)
{
    namespace po = boost::program_options;
    po::options_description desc("rtl_fetch -- fetch the NEORV32 VHDL sources and optionally convert them to Verilog");
    desc.add_options()
        ("help,h", "Command line options")
        ("rtl-dir,r",   po::value<std::string>()->default_value("rtl"), "Directory receiving the VHDL sources")
        ("build-dir,b", po::value<std::string>()->default_value("build"), "Directory receiving the script and Verilog")
        ("source-url,u", po::value<std::string>()->default_value(rtlbridge::NEORV32_SOURCE_URL),
         "Upstream location of the sources, {name} is replaced by the file name")
        ("fetch-tool", po::value<std::string>()->default_value("wget"), "HTTP client used for downloads")
        ("convert,c",   "Convert the sources to Verilog after fetching")
        ("toolchain,t", po::value<std::string>()->default_value("yosys"), "Conversion executable")
        ("list-variants,l", "List the known NEORV32 variants and their GCC flags");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    po::notify(vm);

    if(vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }

    if(vm.count("list-variants")) {
        const auto & variants = rtlbridge::getNEORV32Variants();
        for(const auto & id : variants.getVariantIds()) {
            std::cout << id << ":";
            for(const auto & flag : variants.lookup(id).flags) {
                std::cout << " " << flag;
            }
            std::cout << std::endl;
        }
        return 0;
    }

    // Dummy node
    sparta::TreeNode rtn("rtl_fetch", "RTL fetch tree node");
    sparta::log::MessageSource info_logger(&rtn, "info", "rtl_fetch info messages");
    sparta::log::Tap info_tap(&rtn, "info", std::cout);

    const std::filesystem::path rtl_dir = vm["rtl-dir"].as<std::string>();

    try {
        const auto manifest = rtlbridge::NEORV32::makeManifest(vm["source-url"].as<std::string>());
        rtlbridge::ProcessFetcher fetcher(vm["fetch-tool"].as<std::string>());
        rtlbridge::SourceAcquirer acquirer(info_logger, fetcher);
        acquirer.ensure(manifest, rtl_dir);

        if(vm.count("convert")) {
            rtlbridge::ToolchainPipeline::Toolchain toolchain;
            toolchain.executable = vm["toolchain"].as<std::string>();
            rtlbridge::ToolchainPipeline pipeline(info_logger, toolchain);

            const std::filesystem::path build_dir = vm["build-dir"].as<std::string>();
            const rtlbridge::ToolchainJob job(rtlbridge::SourceAcquirer::resolve(manifest, rtl_dir),
                                              rtlbridge::NEORV32::TOP_ENTITY,
                                              build_dir / (std::string(rtlbridge::NEORV32::name) + ".v"));
            std::cout << pipeline.convert(job).string() << std::endl;
        }
    }
    catch(const rtlbridge::ToolchainError & ex) {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        if(!ex.getOutput().empty()) {
            std::cerr << ex.getOutput() << std::endl;
        }
        return 2;
    }
    catch(const rtlbridge::RTLExceptionBase & ex) {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
