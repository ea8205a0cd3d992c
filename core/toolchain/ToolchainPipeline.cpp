// <ToolchainPipeline.cpp> -*- C++ -*-

#include <fstream>
#include <sstream>
#include <system_error>

#include "toolchain/ToolchainPipeline.hpp"
#include "utils/RunProcess.hpp"
#include "RTLExceptions.hpp"

#include "sparta/utils/LogUtils.hpp"

namespace rtlbridge
{
    constexpr char ToolchainPipeline::CONVERSION_FAILED[];
    constexpr char ToolchainPipeline::NO_ARTIFACT[];
    constexpr char ToolchainPipeline::INSTALL_HINT[];

    ////////////////////////////////////////////////////////////////////////////////
    // ToolchainJob

    ToolchainJob::ToolchainJob(const std::vector<std::filesystem::path> & sources,
                               const std::string & top_entity,
                               const std::filesystem::path & output_path) :
        sources_(sources),
        top_entity_(top_entity),
        output_path_(output_path)
    {
        if (sources_.empty()) {
            throw ToolchainError("no sources to convert", "check the source manifest");
        }
        if (top_entity_.empty()) {
            throw ToolchainError("no top-level entity", "set the entity to elaborate");
        }
        for (const auto & src : sources_)
        {
            if (!std::filesystem::exists(src)) {
                throw ToolchainError("source " + src.string() + " is missing",
                                     "run source acquisition first");
            }
        }
    }

    std::filesystem::path ToolchainJob::getScriptPath() const
    {
        auto script = output_path_;
        return script.replace_extension(".ys");
    }

    ////////////////////////////////////////////////////////////////////////////////
    // ToolchainPipeline

    std::string ToolchainPipeline::renderScript(const ToolchainJob & job) const
    {
        std::ostringstream ys;
        ys << "ghdl";
        for (const auto & flag : toolchain_.ghdl_flags) {
            ys << " " << flag;
        }
        ys << " \\\n";
        for (const auto & src : job.getSources()) {
            ys << src.string() << " \\\n";
        }
        ys << "-e " << job.getTopEntity() << "\n";
        // Formal assertions have no Verilog equivalent, drop them
        ys << "chformal -assert -remove\n";
        ys << "write_verilog " << job.getOutputPath().string() << "\n";
        return ys.str();
    }

    void ToolchainPipeline::writeScript_(const ToolchainJob & job) const
    {
        const auto script_path = job.getScriptPath();
        if (script_path.has_parent_path())
        {
            std::error_code ec;
            std::filesystem::create_directories(script_path.parent_path(), ec);
            if (ec) {
                throw ToolchainError("cannot create " + script_path.parent_path().string() +
                                     ": " + ec.message(), "check the build directory");
            }
        }

        std::ofstream fs(script_path, std::ios::out | std::ios::trunc);
        fs << renderScript(job);
        fs.close();
        if (!fs) {
            throw ToolchainError("cannot write " + script_path.string(),
                                 "check the build directory");
        }
        ILOG("wrote " << script_path);
    }

    std::filesystem::path ToolchainPipeline::convert(const ToolchainJob & job) const
    {
        writeScript_(job);

        // A stale artifact must not pass for the result of this run
        std::error_code ec;
        std::filesystem::remove(job.getOutputPath(), ec);
        if (ec) {
            throw ToolchainError("cannot remove " + job.getOutputPath().string() +
                                 ": " + ec.message(), "check the build directory");
        }

        std::vector<std::string> argv{toolchain_.executable};
        argv.insert(argv.end(), toolchain_.arguments.begin(), toolchain_.arguments.end());
        argv.emplace_back(job.getScriptPath().string());

        ILOG("running " << utils::quoteCommand(argv));
        const auto result = utils::runProcess(argv);
        if (!result.output.empty()) {
            ILOG(toolchain_.executable << " output:\n" << result.output);
        }

        if (!result.succeeded()) {
            throw ToolchainError(CONVERSION_FAILED, INSTALL_HINT, result.exit_status, result.output);
        }
        if (!std::filesystem::exists(job.getOutputPath())) {
            throw ToolchainError(NO_ARTIFACT, INSTALL_HINT, result.exit_status, result.output);
        }

        ILOG("converted " << job.getTopEntity() << " into " << job.getOutputPath());
        return job.getOutputPath();
    }

} // namespace rtlbridge
