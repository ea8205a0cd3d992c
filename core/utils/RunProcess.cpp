// <RunProcess.cpp> -*- C++ -*-

#include <cstdio>

#include <sys/wait.h>

#include "utils/RunProcess.hpp"

#include "sparta/utils/SpartaAssert.hpp"

namespace rtlbridge::utils
{
    namespace
    {
        // Single quotes stop all expansion; an embedded quote is
        // closed, escaped and reopened
        std::string quoteArgument(const std::string & arg)
        {
            std::string quoted;
            quoted.reserve(arg.size() + 2);
            quoted.push_back('\'');
            for (const char ch : arg)
            {
                if (ch == '\'') {
                    quoted += "'\\''";
                }
                else {
                    quoted.push_back(ch);
                }
            }
            quoted.push_back('\'');
            return quoted;
        }
    }

    std::string quoteCommand(const std::vector<std::string> & argv)
    {
        std::string cmd;
        for (std::size_t i = 0; i < argv.size(); ++i)
        {
            if (i != 0) {
                cmd += ' ';
            }
            cmd += quoteArgument(argv[i]);
        }
        return cmd;
    }

    RunResult runProcess(const std::vector<std::string> & argv)
    {
        sparta_assert(!argv.empty(), "runProcess needs at least the executable");

        const std::string cmd = quoteCommand(argv) + " 2>&1";

        RunResult result;
        FILE * pipe = ::popen(cmd.c_str(), "r");
        if (nullptr == pipe)
        {
            result.exit_status = RunResult::LAUNCH_FAILED;
            result.output = "failed to launch: " + cmd;
            return result;
        }

        char buffer[4096];
        std::size_t count = 0;
        while ((count = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0)
        {
            result.output.append(buffer, count);
        }

        const int status = ::pclose(pipe);
        if (status == -1) {
            result.exit_status = RunResult::LAUNCH_FAILED;
        }
        else if (WIFEXITED(status)) {
            result.exit_status = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status)) {
            // Same convention as the shell
            result.exit_status = 128 + WTERMSIG(status);
        }
        else {
            result.exit_status = status;
        }
        return result;
    }

} // namespace rtlbridge::utils
