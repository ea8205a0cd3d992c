// <Fetcher.cpp> -*- C++ -*-

#include "rtl/Fetcher.hpp"
#include "utils/RunProcess.hpp"

#include "sparta/utils/SpartaException.hpp"

namespace rtlbridge
{
    ProcessFetcher::ProcessFetcher(const std::string & executable,
                                   const std::vector<std::string> & arguments) :
        executable_(executable),
        arguments_(arguments)
    {
    }

    void ProcessFetcher::fetch(const std::string & url, const std::filesystem::path & dest)
    {
        std::vector<std::string> argv{executable_};
        argv.insert(argv.end(), arguments_.begin(), arguments_.end());
        argv.emplace_back("-O");
        argv.emplace_back(dest.string());
        argv.emplace_back(url);

        const auto result = utils::runProcess(argv);
        if (!result.succeeded())
        {
            throw sparta::SpartaException(executable_) << " exited with status "
                                                        << result.exit_status << " for "
                                                        << url << ": " << result.output;
        }
    }

} // namespace rtlbridge
