// <SourceManifest.cpp> -*- C++ -*-

#include <algorithm>

#include "rtl/SourceManifest.hpp"
#include "RTLExceptions.hpp"

namespace rtlbridge
{
    constexpr char SourceManifest::NAME_PLACEHOLDER[];

    const char NEORV32_SOURCE_URL[] =
        "https://raw.githubusercontent.com/stnolting/neorv32/main/rtl/core/{name}";

    std::string SourceFile::getRemoteLocation() const
    {
        std::string url = remote_template;
        const std::string placeholder = SourceManifest::NAME_PLACEHOLDER;
        const auto pos = url.find(placeholder);
        if (pos == std::string::npos)
        {
            // Plain directory URL
            if (!url.empty() && url.back() != '/') {
                url += '/';
            }
            return url + name;
        }
        return url.replace(pos, placeholder.size(), name);
    }

    SourceManifest::SourceManifest(const std::string & remote_template) :
        remote_template_(remote_template)
    {
        if (remote_template_.empty()) {
            throw ManifestError("empty remote template");
        }
    }

    SourceManifest::SourceManifest(const std::string & remote_template,
                                   const std::vector<std::string> & names) :
        SourceManifest(remote_template)
    {
        for (const auto & n : names) {
            add(n);
        }
    }

    SourceManifest & SourceManifest::add(const std::string & name)
    {
        if (name.empty() || name.find('/') != std::string::npos) {
            throw ManifestError("invalid file name '" + name + "'");
        }
        if (std::any_of(files_.begin(), files_.end(),
                        [&name](const SourceFile & f) { return f.name == name; }))
        {
            throw ManifestError("duplicate file name '" + name + "'");
        }
        files_.push_back(SourceFile{name, remote_template_});
        return *this;
    }

    SourceManifest makeNEORV32Manifest(const std::string & remote_template)
    {
        // Indentation follows the entity hierarchy below neorv32_cpu
        return SourceManifest(remote_template, {
            "neorv32_package.vhd",
            "neorv32_cpu.vhd",
                "neorv32_cpu_alu.vhd",
                    "neorv32_cpu_cp_bitmanip.vhd",
                    "neorv32_cpu_cp_cfu.vhd",
                    "neorv32_cpu_cp_fpu.vhd",
                    "neorv32_cpu_cp_muldiv.vhd",
                    "neorv32_cpu_cp_shifter.vhd",
                "neorv32_cpu_bus.vhd",
                "neorv32_cpu_control.vhd",
                    "neorv32_cpu_decompressor.vhd",
                "neorv32_cpu_regfile.vhd"
        });
    }

} // namespace rtlbridge
