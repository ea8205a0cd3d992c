// <RunProcess.hpp> -*- C++ -*-

//!
//! \file RunProcess.hpp
//! \brief Blocking subprocess launch used for the fetch and conversion tools
//!

#pragma once

#include <string>
#include <vector>

namespace rtlbridge::utils
{
    //! \brief Outcome of a finished subprocess
    struct RunResult
    {
        //! Exit status of the process, or LAUNCH_FAILED
        int exit_status = 0;

        //! Standard output and standard error, interleaved
        std::string output;

        static constexpr int LAUNCH_FAILED = -1;

        bool succeeded() const { return exit_status == 0; }
    };

    /**
     * \brief Run argv[0] with the remaining arguments and wait for it
     *
     * The command goes through /bin/sh with every argument quoted, so
     * no shell expansion happens on the arguments.  A missing
     * executable shows up as the shell's exit status 127.
     */
    RunResult runProcess(const std::vector<std::string> & argv);

    //! Render argv as the quoted command line runProcess executes
    std::string quoteCommand(const std::vector<std::string> & argv);

} // namespace rtlbridge::utils
