// <SourceManifest.hpp> -*- C++ -*-

//!
//! \file SourceManifest.hpp
//! \brief Ordered list of the HDL files a core needs, and where they come from
//!

#pragma once

#include <string>
#include <vector>

namespace rtlbridge
{
    //! \brief A single HDL source file and its upstream location
    struct SourceFile
    {
        //! File name, unique within a manifest
        std::string name;

        //! URL template, {name} is replaced by the file name
        std::string remote_template;

        //! Expand the template for this file
        std::string getRemoteLocation() const;
    };

    /**
     * \class SourceManifest
     * \brief The required source files in elaboration order
     *
     * Order matters only to the toolchain script (packages before the
     * entities using them).  Acquisition fetches each file on its own.
     */
    class SourceManifest
    {
      public:
        //! Placeholder expanded by SourceFile::getRemoteLocation
        static constexpr char NAME_PLACEHOLDER[] = "{name}";

        explicit SourceManifest(const std::string & remote_template);

        SourceManifest(const std::string & remote_template,
                       const std::vector<std::string> & names);

        //! Append a file; throws ManifestError on a duplicate name
        SourceManifest & add(const std::string & name);

        const std::vector<SourceFile> & getFiles() const { return files_; }

        const std::string & getRemoteTemplate() const { return remote_template_; }

        std::size_t size() const { return files_.size(); }

        bool empty() const { return files_.empty(); }

      private:
        const std::string remote_template_;
        std::vector<SourceFile> files_;
    };

    //! Upstream location of the NEORV32 core sources
    extern const char NEORV32_SOURCE_URL[];

    //! The NEORV32 CPU sources, fetched from remote_template
    SourceManifest makeNEORV32Manifest(const std::string & remote_template = NEORV32_SOURCE_URL);

} // namespace rtlbridge
