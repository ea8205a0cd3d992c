#include "core/toolchain/ToolchainPipeline.hpp"
#include "core/utils/RunProcess.hpp"
#include "core/RTLExceptions.hpp"

#include "test/core/common/RtlTestUtils.hpp"

#include "sparta/simulation/TreeNode.hpp"
#include "sparta/log/MessageSource.hpp"
#include "sparta/log/Tap.hpp"
#include "sparta/utils/SpartaTester.hpp"

#include <filesystem>
#include <string>
#include <vector>

TEST_INIT

namespace
{
    std::vector<std::filesystem::path> makeSources(const core_test::ScratchDir & scratch)
    {
        std::vector<std::filesystem::path> sources;
        for(const auto * name : {"pkg.vhd", "top.vhd"}) {
            sources.emplace_back(scratch / name);
            core_test::writeFile(sources.back(), "-- VHDL\n");
        }
        return sources;
    }
}

void testRunProcess()
{
    EXPECT_EQUAL(rtlbridge::utils::quoteCommand({"echo", "it's here"}), "'echo' 'it'\\''s here'");

    auto result = rtlbridge::utils::runProcess({"sh", "-c", "echo out; echo err 1>&2; exit 3"});
    EXPECT_EQUAL(result.exit_status, 3);
    EXPECT_FALSE(result.succeeded());
    EXPECT_TRUE(result.output.find("out") != std::string::npos);
    EXPECT_TRUE(result.output.find("err") != std::string::npos);

    // Arguments reach the child untouched by the shell
    result = rtlbridge::utils::runProcess({"printf", "%s", "$HOME; ls"});
    EXPECT_TRUE(result.succeeded());
    EXPECT_EQUAL(result.output, "$HOME; ls");

    result = rtlbridge::utils::runProcess({"rtlbridge-no-such-tool"});
    EXPECT_EQUAL(result.exit_status, 127);
}

void testJob()
{
    core_test::ScratchDir scratch;
    const auto sources = makeSources(scratch);

    const rtlbridge::ToolchainJob job(sources, "top", scratch / "build" / "top.v");
    EXPECT_EQUAL(job.getScriptPath(), scratch / "build" / "top.ys");
    EXPECT_EQUAL(job.getTopEntity(), "top");
    EXPECT_EQUAL(job.getSources().size(), 2);

    EXPECT_THROW(rtlbridge::ToolchainJob({}, "top", scratch / "top.v"));
    EXPECT_THROW(rtlbridge::ToolchainJob(sources, "", scratch / "top.v"));

    bool caught = false;
    try {
        rtlbridge::ToolchainJob({scratch / "missing.vhd"}, "top", scratch / "top.v");
    }
    catch(const rtlbridge::ToolchainError & ex) {
        caught = true;
        EXPECT_TRUE(ex.getReason().find("missing.vhd") != std::string::npos);
        EXPECT_EQUAL(ex.getHint(), "run source acquisition first");
        EXPECT_EQUAL(ex.getExitStatus(), rtlbridge::ToolchainError::NO_EXIT_STATUS);
    }
    EXPECT_TRUE(caught);
}

void testRenderScript(sparta::log::MessageSource & info_logger)
{
    core_test::ScratchDir scratch;
    const auto sources = makeSources(scratch);
    const auto out = scratch / "top.v";

    rtlbridge::ToolchainPipeline pipeline(info_logger, rtlbridge::ToolchainPipeline::Toolchain());
    const std::string script = pipeline.renderScript(rtlbridge::ToolchainJob(sources, "top", out));

    const std::string expected =
        "ghdl --ieee=synopsys -fexplicit -frelaxed-rules --std=08 \\\n" +
        sources[0].string() + " \\\n" +
        sources[1].string() + " \\\n" +
        "-e top\n"
        "chformal -assert -remove\n"
        "write_verilog " + out.string() + "\n";
    EXPECT_EQUAL(script, expected);
}

void testConvert(sparta::log::MessageSource & info_logger)
{
    core_test::ScratchDir scratch;
    const auto sources = makeSources(scratch);
    const auto out = scratch / "build" / "top.v";

    rtlbridge::ToolchainPipeline::Toolchain toolchain;
    toolchain.executable = core_test::writeFakeYosys(scratch / "yosys").string();
    rtlbridge::ToolchainPipeline pipeline(info_logger, toolchain);

    const rtlbridge::ToolchainJob job(sources, "top", out);
    EXPECT_EQUAL(pipeline.convert(job), out);
    EXPECT_TRUE(std::filesystem::exists(out));
    EXPECT_EQUAL(core_test::readFile(job.getScriptPath()), pipeline.renderScript(job));

    // Same job twice gives the same artifact
    EXPECT_EQUAL(pipeline.convert(job), out);
}

void testConvertFailures(sparta::log::MessageSource & info_logger)
{
    core_test::ScratchDir scratch;
    const auto sources = makeSources(scratch);
    const auto out = scratch / "top.v";
    const rtlbridge::ToolchainJob job(sources, "top", out);

    // Plugin missing: non-zero exit, output carried in the error
    {
        rtlbridge::ToolchainPipeline::Toolchain toolchain;
        toolchain.executable = core_test::writeFailingYosys(scratch / "yosys_fail").string();
        rtlbridge::ToolchainPipeline pipeline(info_logger, toolchain);

        bool caught = false;
        try {
            pipeline.convert(job);
        }
        catch(const rtlbridge::ToolchainError & ex) {
            caught = true;
            EXPECT_EQUAL(ex.getReason(), rtlbridge::ToolchainPipeline::CONVERSION_FAILED);
            EXPECT_EQUAL(ex.getHint(), rtlbridge::ToolchainPipeline::INSTALL_HINT);
            EXPECT_EQUAL(ex.getExitStatus(), 1);
            EXPECT_TRUE(ex.getOutput().find("No such command: ghdl") != std::string::npos);
            EXPECT_TRUE(std::string(ex.what()).find("Unable to convert NEORV32 CPU to verilog") == 0);
        }
        EXPECT_TRUE(caught);
        EXPECT_FALSE(std::filesystem::exists(out));
    }

    // Tool not installed
    {
        rtlbridge::ToolchainPipeline::Toolchain toolchain;
        toolchain.executable = (scratch / "not_installed").string();
        rtlbridge::ToolchainPipeline pipeline(info_logger, toolchain);

        bool caught = false;
        try {
            pipeline.convert(job);
        }
        catch(const rtlbridge::ToolchainError & ex) {
            caught = true;
            EXPECT_EQUAL(ex.getExitStatus(), 127);
        }
        EXPECT_TRUE(caught);
    }

    // Exit status 0 without the artifact, even if an older one was there
    {
        core_test::writeFile(out, "stale");
        rtlbridge::ToolchainPipeline::Toolchain toolchain;
        toolchain.executable = core_test::writeScript(scratch / "yosys_silent", "exit 0\n").string();
        rtlbridge::ToolchainPipeline pipeline(info_logger, toolchain);

        bool caught = false;
        try {
            pipeline.convert(job);
        }
        catch(const rtlbridge::ToolchainError & ex) {
            caught = true;
            EXPECT_EQUAL(ex.getReason(), rtlbridge::ToolchainPipeline::NO_ARTIFACT);
            EXPECT_EQUAL(ex.getExitStatus(), 0);
        }
        EXPECT_TRUE(caught);
        EXPECT_FALSE(std::filesystem::exists(out));
    }
}

void runTest(int argc, char **argv)
{
    (void)argc;
    (void)argv;

    sparta::TreeNode rtn("top", "ToolchainPipeline test node");
    sparta::log::MessageSource info_logger(&rtn, "info", "ToolchainPipeline info messages");
    sparta::log::Tap info_tap(&rtn, "info", "ToolchainPipeline_test.log");

    testRunProcess();
    testJob();
    testRenderScript(info_logger);
    testConvert(info_logger);
    testConvertFailures(info_logger);
}

int main(int argc, char **argv)
{
    runTest(argc, argv);

    REPORT_ERROR;
    return (int)ERROR_CODE;
}
