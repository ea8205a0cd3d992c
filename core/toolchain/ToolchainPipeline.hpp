// <ToolchainPipeline.hpp> -*- C++ -*-

//!
//! \file ToolchainPipeline.hpp
//! \brief VHDL to Verilog conversion through GHDL and Yosys
//!

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "sparta/log/MessageSource.hpp"

namespace rtlbridge
{
    /**
     * \class ToolchainJob
     * \brief One conversion: the sources, the entity to elaborate and
     *        where the Verilog goes
     *
     * Every source must already exist when the job is built; a
     * missing one throws ToolchainError.  Jobs are not reused.
     */
    class ToolchainJob
    {
    public:
        ToolchainJob(const std::vector<std::filesystem::path> & sources,
                     const std::string & top_entity,
                     const std::filesystem::path & output_path);

        const std::vector<std::filesystem::path> & getSources() const { return sources_; }
        const std::string & getTopEntity() const { return top_entity_; }
        const std::filesystem::path & getOutputPath() const { return output_path_; }

        //! The Yosys script sits next to the output, with a .ys extension
        std::filesystem::path getScriptPath() const;

    private:
        const std::vector<std::filesystem::path> sources_;
        const std::string top_entity_;
        const std::filesystem::path output_path_;
    };

    /**
     * \class ToolchainPipeline
     * \brief Renders the synthesis script and runs the conversion tool
     *
     * The tool contract is exit status only: 0 means the artifact is
     * at the requested output path.  The tool's output is logged and
     * carried in ToolchainError, never parsed.
     */
    class ToolchainPipeline
    {
    public:
        //! \brief The external tool and the GHDL front-end options
        struct Toolchain
        {
            std::string executable = "yosys";
            std::vector<std::string> arguments = {"-q", "-m", "ghdl"};
            std::vector<std::string> ghdl_flags = {"--ieee=synopsys", "-fexplicit",
                                                   "-frelaxed-rules", "--std=08"};
        };

        static constexpr char CONVERSION_FAILED[] = "conversion failed";
        static constexpr char NO_ARTIFACT[]       = "conversion produced no artifact";
        static constexpr char INSTALL_HINT[]      = "verify toolchain installation (GHDL-Yosys plugin)";

        ToolchainPipeline(sparta::log::MessageSource & info_logger, const Toolchain & toolchain) :
            info_logger_(info_logger),
            toolchain_(toolchain)
        {}

        //! Text of the Yosys script for job
        std::string renderScript(const ToolchainJob & job) const;

        /**
         * \brief Write the script, run the tool and check the result
         * \return Path of the converted artifact
         *
         * Throws ToolchainError on a non-zero exit or a missing
         * artifact.  Never retries.
         */
        std::filesystem::path convert(const ToolchainJob & job) const;


    private:
        void writeScript_(const ToolchainJob & job) const;

        sparta::log::MessageSource & info_logger_;
        const Toolchain toolchain_;
    };

} // namespace rtlbridge
