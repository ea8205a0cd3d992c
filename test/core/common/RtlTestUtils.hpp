#pragma once

#include "core/rtl/Fetcher.hpp"

#include "sparta/utils/SpartaException.hpp"

#include <stdlib.h>
#include <cinttypes>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <system_error>

namespace core_test
{

    ////////////////////////////////////////////////////////////////////////////////
    // Temporary directory removed with everything in it when the
    // object goes out of scope
    class ScratchDir
    {
    public:
        explicit ScratchDir(const std::string & prefix = "rtlbridge_test")
        {
            std::string tmpl = (std::filesystem::temp_directory_path() / (prefix + "_XXXXXX")).string();
            if(::mkdtemp(tmpl.data()) == nullptr) {
                throw sparta::SpartaException("cannot create scratch directory from ") << tmpl;
            }
            path_ = tmpl;
        }

        ~ScratchDir()
        {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        ScratchDir(const ScratchDir &) = delete;
        ScratchDir & operator=(const ScratchDir &) = delete;

        const std::filesystem::path & path() const { return path_; }

        std::filesystem::path operator/(const std::string & name) const { return path_ / name; }

    private:
        std::filesystem::path path_;
    };

    inline void writeFile(const std::filesystem::path & path, const std::string & content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::trunc);
        out << content;
    }

    inline std::string readFile(const std::filesystem::path & path)
    {
        std::ifstream in(path);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    // Write an executable /bin/sh script
    inline std::filesystem::path writeScript(const std::filesystem::path & path, const std::string & body)
    {
        writeFile(path, "#!/bin/sh\n" + body);
        std::filesystem::permissions(path,
                                     std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read | std::filesystem::perms::group_exec,
                                     std::filesystem::perm_options::replace);
        return path;
    }

    // Stands in for yosys: reads the write_verilog target from the
    // script (last argument) and creates it
    inline std::filesystem::path writeFakeYosys(const std::filesystem::path & path)
    {
        return writeScript(path,
                           "for last; do :; done\n"
                           "out=$(sed -n 's/^write_verilog //p' \"$last\")\n"
                           "echo \"converted $last\"\n"
                           "echo 'module neorv32_cpu(); endmodule' > \"$out\"\n");
    }

    // A toolchain that exits with status 1 and an error message
    inline std::filesystem::path writeFailingYosys(const std::filesystem::path & path)
    {
        return writeScript(path,
                           "echo 'ERROR: No such command: ghdl'\n"
                           "exit 1\n");
    }

    ////////////////////////////////////////////////////////////////////////////////
    // In-process fetcher: writes the URL into the destination file and
    // counts the requests.  URLs ending with a name in the failing set
    // write half a file and throw.
    class CountingFetcher : public rtlbridge::FetcherIF
    {
    public:
        void fetch(const std::string & url, const std::filesystem::path & dest) override
        {
            ++num_requests_;
            ++requests_[url];
            for(const auto & name : failing_) {
                if(url.size() >= name.size() &&
                   url.compare(url.size() - name.size(), name.size(), name) == 0)
                {
                    writeFile(dest, "partial");
                    throw sparta::SpartaException("connection reset fetching ") << url;
                }
            }
            writeFile(dest, url + "\n");
        }

        void failOn(const std::string & name) { failing_.insert(name); }
        void clearFailures() { failing_.clear(); }

        uint32_t getNumRequests() const { return num_requests_; }

        uint32_t getNumRequests(const std::string & url) const
        {
            const auto it = requests_.find(url);
            return (it == requests_.end()) ? 0 : it->second;
        }

        void reset()
        {
            num_requests_ = 0;
            requests_.clear();
        }

    private:
        uint32_t num_requests_ = 0;
        std::map<std::string, uint32_t> requests_;
        std::set<std::string> failing_;
    };

} // namespace core_test
