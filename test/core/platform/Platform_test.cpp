#include "RtlBridgeSim.hpp"
#include "CPUFactory.hpp"
#include "NEORV32.hpp"
#include "Platform.hpp"
#include "RTLExceptions.hpp"

#include "test/core/common/RtlTestUtils.hpp"

#include "sparta/app/CommandLineSimulator.hpp"
#include "sparta/kernel/Scheduler.hpp"
#include "sparta/simulation/TreeNode.hpp"
#include "sparta/sparta.hpp"
#include "sparta/utils/SpartaTester.hpp"

#include <cstdint>
#include <string>
#include <vector>

TEST_INIT

const char USAGE[] =
    "Usage:\n"
    "    \n"
    "\n";

sparta::app::DefaultValues DEFAULTS;

namespace
{
    // Command line for a platform whose cores take a prebuilt Verilog
    std::vector<std::string> makeArgs(const std::string & verilog,
                                      const std::string & reset_address)
    {
        std::vector<std::string> args {
            "Platform_test",
            "-p", "top.cpu.core*.params.source_mode", "prebuilt",
            "-p", "top.cpu.core*.params.prebuilt_verilog", verilog,
            "-p", "top.cpu.params.bus_interconnect", "wb_xbar",
            "--no-run"
        };
        if(!reset_address.empty()) {
            args.insert(args.end(), {"-p", "top.cpu.params.reset_address", reset_address});
        }
        return args;
    }

    void populate(RtlBridgeSim & sim, std::vector<std::string> args)
    {
        std::vector<char *> argv;
        for(auto & a : args) {
            argv.push_back(a.data());
        }

        sparta::app::CommandLineSimulator cls(USAGE, DEFAULTS);
        int err_code = 0;
        EXPECT_TRUE(cls.parse(static_cast<int>(argv.size()), argv.data(), err_code));
        cls.populateSimulation(&sim);
    }
}

void testTwoCores()
{
    core_test::ScratchDir scratch;
    const auto verilog = scratch / "neorv32.v";
    core_test::writeFile(verilog, "module neorv32_cpu(); endmodule\n");

    sparta::Scheduler scheduler;
    RtlBridgeSim sim("neorv32", scheduler, 2);
    populate(sim, makeArgs(verilog.string(), "0x80000000"));

    const auto * platform = sim.getPlatform();
    EXPECT_TRUE(platform != nullptr);

    // Both cores share the one prebuilt file
    EXPECT_EQUAL(platform->getSources().size(), 1);
    EXPECT_EQUAL(platform->getSources().front(), verilog);

    // ibus and dbus of each core, all on the configured interconnect
    EXPECT_EQUAL(platform->getBusConnections().size(), 4);
    for(const auto & connection : platform->getBusConnections()) {
        EXPECT_EQUAL(connection.second, "wb_xbar");
        EXPECT_EQUAL(connection.first->connected_to, "wb_xbar");
    }

    EXPECT_EQUAL(platform->getInstances().size(), 2);
    EXPECT_EQUAL(platform->getInstances()[0].first, "top.cpu.core0");
    EXPECT_EQUAL(platform->getInstances()[1].first, "top.cpu.core1");
    for(const auto & instance : platform->getInstances()) {
        const auto & record = instance.second;
        EXPECT_EQUAL(record.getModuleName(), "neorv32_cpu");
        EXPECT_EQUAL(record.getNumericParam("RESET_PC"), 0x80000000);
        EXPECT_TRUE(record.getInstructionBus()->isConnected());
        EXPECT_TRUE(record.getDataBus()->isConnected());
    }

    // The cores themselves are sealed
    auto core = sim.getRoot()->getChild("cpu.core1")->getResourceAs<rtlbridge::NEORV32>();
    EXPECT_TRUE(core->hasEmittedRecord());
    EXPECT_THROW(core->setResetAddress(0x0));
}

void testMissingResetAddress()
{
    core_test::ScratchDir scratch;
    const auto verilog = scratch / "neorv32.v";
    core_test::writeFile(verilog, "module neorv32_cpu(); endmodule\n");

    sparta::Scheduler scheduler;
    RtlBridgeSim sim("neorv32", scheduler, 1);
    bool caught = false;
    try {
        populate(sim, makeArgs(verilog.string(), ""));
    }
    catch(const rtlbridge::MissingResetAddress & ex) {
        caught = true;
        EXPECT_TRUE(std::string(ex.what()).find("reset_address") != std::string::npos);
    }
    EXPECT_TRUE(caught);
    EXPECT_TRUE(sim.getPlatform()->getInstances().empty());
}

void testCPUResetAddress()
{
    sparta::TreeNode rtn("top", "CPU test node");

    const auto parse = [&rtn](const std::string & node_name, const std::string & value) {
        sparta::TreeNode tn(&rtn, node_name, "CPU under test");
        rtlbridge::CPU::CPUParameterSet params(&tn);
        params.getParameter("reset_address")->setValueFromString(value);
        rtlbridge::CPU cpu(&tn, &params);
        return cpu.hasResetAddress() ? cpu.getResetAddress() : ~uint64_t(0);
    };

    EXPECT_EQUAL(parse("cpu_unset", ""), ~uint64_t(0));
    EXPECT_EQUAL(parse("cpu_hex", "0x80000000"), 0x80000000);
    EXPECT_EQUAL(parse("cpu_dec", "4096"), 4096);
    EXPECT_EQUAL(parse("cpu_top", "0xFFFFFFFF"), rtlbridge::CPU::MAX_RESET_ADDRESS);

    // Negative, wider than RV32 or not a number at all
    uint32_t num_bad = 0;
    for(const std::string value : {"-1", " -5", "0x100000000", "0x80000000junk", "reset"}) {
        bool caught = false;
        try {
            parse("cpu_bad" + std::to_string(num_bad++), value);
        }
        catch(const sparta::SpartaException & ex) {
            caught = true;
            EXPECT_TRUE(std::string(ex.what()).find("reset_address") != std::string::npos);
        }
        EXPECT_TRUE(caught);
    }

    // Rejected before any core is finalized
    core_test::ScratchDir scratch;
    const auto verilog = scratch / "neorv32.v";
    core_test::writeFile(verilog, "module neorv32_cpu(); endmodule\n");

    sparta::Scheduler scheduler;
    RtlBridgeSim sim("neorv32", scheduler, 1);
    EXPECT_THROW(populate(sim, makeArgs(verilog.string(), "-1")));
    EXPECT_TRUE(sim.getPlatform() == nullptr || sim.getPlatform()->getInstances().empty());
}

void testTopology()
{
    rtlbridge::CPUFactory factory;
    EXPECT_THROW(factory.setTopology("out_of_order", 1));

    EXPECT_THROW(rtlbridge::CPUTopology::allocateTopology("big_core"));
    const auto topology = rtlbridge::CPUTopology::allocateTopology("neorv32");
    EXPECT_EQUAL(topology->units.size(), 1);
    EXPECT_EQUAL(topology->bus_connections.size(), 2);
}

void runTest(int argc, char **argv)
{
    (void)argc;
    (void)argv;
    DEFAULTS.auto_summary_default = "off";

    testTwoCores();
    testMissingResetAddress();
    testCPUResetAddress();
    testTopology();
}

int main(int argc, char **argv)
{
    runTest(argc, argv);

    REPORT_ERROR;
    return (int)ERROR_CODE;
}
