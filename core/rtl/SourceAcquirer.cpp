// <SourceAcquirer.cpp> -*- C++ -*-

#include <exception>
#include <system_error>

#include "rtl/SourceAcquirer.hpp"
#include "RTLExceptions.hpp"

#include "sparta/utils/LogUtils.hpp"

namespace rtlbridge
{
    constexpr char SourceAcquirer::PARTIAL_SUFFIX[];

    uint32_t SourceAcquirer::ensure(const SourceManifest & manifest,
                                    const std::filesystem::path & local_dir)
    {
        uint32_t num_fetched = 0;
        for (const auto & file : manifest.getFiles())
        {
            const auto local_path = local_dir / file.name;
            std::error_code ec;
            const bool present = std::filesystem::exists(local_path, ec);
            if (ec) {
                throw AcquisitionFailed(file.name, "cannot check " + local_path.string() +
                                        ": " + ec.message());
            }
            if (present)
            {
                continue;
            }

            std::filesystem::create_directories(local_dir, ec);
            if (ec) {
                throw AcquisitionFailed(file.name, "cannot create " + local_dir.string() +
                                        ": " + ec.message());
            }

            fetchOne_(file, local_path);
            ++num_fetched;
        }

        ILOG(num_fetched << " of " << manifest.size() << " sources fetched from "
             << manifest.getRemoteTemplate() << " into " << local_dir);
        return num_fetched;
    }

    void SourceAcquirer::fetchOne_(const SourceFile & file, const std::filesystem::path & dest)
    {
        const std::string url = file.getRemoteLocation();
        std::filesystem::path partial = dest;
        partial += PARTIAL_SUFFIX;

        ILOG("fetching " << url);
        try {
            fetcher_.fetch(url, partial);
            std::filesystem::rename(partial, dest);
        }
        catch (const std::exception & e)
        {
            std::error_code ignored;
            std::filesystem::remove(partial, ignored);
            throw AcquisitionFailed(file.name, e.what());
        }
    }

    std::vector<std::filesystem::path> SourceAcquirer::resolve(const SourceManifest & manifest,
                                                               const std::filesystem::path & local_dir)
    {
        std::vector<std::filesystem::path> paths;
        paths.reserve(manifest.size());
        for (const auto & file : manifest.getFiles()) {
            paths.emplace_back(local_dir / file.name);
        }
        return paths;
    }

} // namespace rtlbridge
