// <SourceAcquirer.hpp> -*- C++ -*-

//!
//! \file SourceAcquirer.hpp
//! \brief Makes sure every file of a SourceManifest is present locally
//!

#pragma once

#include <cinttypes>
#include <filesystem>
#include <vector>

#include "sparta/log/MessageSource.hpp"

#include "rtl/Fetcher.hpp"
#include "rtl/SourceManifest.hpp"

namespace rtlbridge
{
    /**
     * \class SourceAcquirer
     * \brief Fetches the missing files of a manifest into a local directory
     *
     * A file that already exists locally is never fetched again and
     * is not checked; existence is the whole cache key.  Downloads go
     * to a ".part" file first so an interrupted fetch never leaves a
     * file that looks complete.
     *
     * Two acquirers racing on the same directory may fetch the same
     * file twice.  Callers building cores concurrently should use a
     * directory per instance.
     */
    class SourceAcquirer
    {
    public:
        SourceAcquirer(sparta::log::MessageSource & info_logger, FetcherIF & fetcher) :
            info_logger_(info_logger),
            fetcher_(fetcher)
        {}

        /**
         * \brief Fetch every missing manifest file into local_dir
         * \return Number of files fetched
         *
         * Stops at the first transport failure with AcquisitionFailed.
         * Files fetched before the failure are kept.
         */
        uint32_t ensure(const SourceManifest & manifest, const std::filesystem::path & local_dir);

        //! Local paths of the manifest files, in manifest order
        static std::vector<std::filesystem::path> resolve(const SourceManifest & manifest,
                                                          const std::filesystem::path & local_dir);

        //! Suffix of in-flight downloads
        static constexpr char PARTIAL_SUFFIX[] = ".part";

    private:
        void fetchOne_(const SourceFile & file, const std::filesystem::path & dest);

        sparta::log::MessageSource & info_logger_;
        FetcherIF & fetcher_;
    };

} // namespace rtlbridge
