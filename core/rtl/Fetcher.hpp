// <Fetcher.hpp> -*- C++ -*-

/**
 * \file   Fetcher.hpp
 *
 * \brief  Transport used to download RTL sources
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace rtlbridge
{
    /**
     * \class FetcherIF
     *
     * \brief Generic download API
     *
     * fetch() writes the content found at url to dest, creating or
     * truncating dest.  Any failure is reported by throwing; the
     * caller decides what to do with a partially written dest.
     */
    class FetcherIF
    {
      public:
        virtual ~FetcherIF() = default;

        virtual void fetch(const std::string & url, const std::filesystem::path & dest) = 0;
    };

    /**
     * \class ProcessFetcher
     *
     * \brief Downloads by running an external HTTP client
     *
     * The default client is `wget -q -O <dest> <url>`.  A non-zero
     * exit status throws a sparta::SpartaException carrying the
     * client's output.
     */
    class ProcessFetcher : public FetcherIF
    {
      public:
        explicit ProcessFetcher(const std::string & executable = "wget",
                                const std::vector<std::string> & arguments = {"-q"});

        void fetch(const std::string & url, const std::filesystem::path & dest) override final;


      private:
        const std::string executable_;
        const std::vector<std::string> arguments_;
    };

} // namespace rtlbridge
