// <NEORV32.cpp> -*- C++ -*-

//!
//! \file NEORV32.cpp
//! \brief Implementation of the NEORV32 CPU integration unit
//!

#include "NEORV32.hpp"
#include "Platform.hpp"
#include "RTLExceptions.hpp"
#include "rtl/SourceAcquirer.hpp"
#include "toolchain/ToolchainPipeline.hpp"

#include "sparta/utils/LogUtils.hpp"
#include "sparta/utils/SpartaAssert.hpp"
#include "sparta/utils/SpartaException.hpp"

namespace rtlbridge
{
    constexpr char NEORV32::SOURCE_MODE_CONVERT[];
    constexpr char NEORV32::SOURCE_MODE_FETCH[];
    constexpr char NEORV32::SOURCE_MODE_PREBUILT[];
    constexpr char NEORV32::TOP_ENTITY[];
    constexpr char NEORV32::RESET_PARAM[];
    constexpr char NEORV32::name[];

    NEORV32::NEORV32(sparta::TreeNode* node, const NEORV32ParameterSet* p) :
        NEORV32(node, p, makeWishboneEndpoint, std::make_shared<ProcessFetcher>(std::string(p->fetch_tool)))
    {
    }

    NEORV32::NEORV32(sparta::TreeNode* node, const NEORV32ParameterSet* p,
                     const BusFactory & bus_factory,
                     const std::shared_ptr<FetcherIF> & fetcher) :
        sparta::Unit(node),
        variant_(getNEORV32Variants().lookup(p->variant)),
        strict_reset_address_(p->strict_reset_address),
        ibus_(bus_factory("ibus")),
        dbus_(bus_factory("dbus")),
        periph_buses_{ibus_, dbus_}
    {
        sparta_assert(ibus_ != nullptr && dbus_ != nullptr,
                      getLocation_() << ": bus factory returned no endpoint");
        sparta_assert(fetcher != nullptr);

        addSources_(p, *fetcher);
    }

    NEORV32::~NEORV32() {}

    const NEORV32::CPUInfo & NEORV32::getCPUInfo()
    {
        static const CPUInfo info {
            "riscv",
            "neorv32",
            "NEORV32",
            32,
            "little",
            {"riscv64-unknown-elf", "riscv32-unknown-elf", "riscv64-elf", "riscv32-elf",
             "riscv-none-elf", "riscv-none-embed", "riscv64-linux-gnu", "riscv64-pc-linux-musl"},
            "elf32-littleriscv",
            "nop",
            {{0x80000000, 0x80000000}}
        };
        return info;
    }

    SourceManifest NEORV32::makeManifest(const std::string & source_url)
    {
        return makeNEORV32Manifest(source_url);
    }

    void NEORV32::addSources_(const NEORV32ParameterSet* p, FetcherIF & fetcher)
    {
        const std::string mode = p->source_mode;

        if(mode == SOURCE_MODE_PREBUILT)
        {
            const std::filesystem::path prebuilt = std::string(p->prebuilt_verilog);
            if(prebuilt.empty()) {
                ILOG("prebuilt mode, RTL supplied outside of " << getLocation_());
                return;
            }
            if(!std::filesystem::exists(prebuilt)) {
                throw ToolchainError("prebuilt Verilog " + prebuilt.string() + " is missing",
                                     "check prebuilt_verilog");
            }
            handOff_(prebuilt);
            return;
        }

        const auto manifest = makeManifest(p->source_url);
        const std::filesystem::path rtl_dir = std::string(p->rtl_dir);

        SourceAcquirer acquirer(info_logger_, fetcher);
        num_fetched_ = acquirer.ensure(manifest, rtl_dir);

        if(mode == SOURCE_MODE_FETCH) {
            return;
        }

        ToolchainPipeline::Toolchain toolchain;
        toolchain.executable = std::string(p->toolchain);
        toolchain.arguments  = p->toolchain_args.getValue();
        ToolchainPipeline pipeline(info_logger_, toolchain);

        const std::filesystem::path build_dir = std::string(p->build_dir);
        const ToolchainJob job(SourceAcquirer::resolve(manifest, rtl_dir),
                               TOP_ENTITY,
                               build_dir / (std::string(name) + ".v"));
        handOff_(pipeline.convert(job));
    }

    void NEORV32::handOff_(const std::filesystem::path & verilog)
    {
        Platform * platform = Platform::getPlatform(getContainer());
        sparta_assert(platform != nullptr,
                      "No " << Platform::name << " node above " << getLocation_());
        platform->addSource(verilog);
        verilog_ = verilog;
        ILOG("added " << verilog << " to the platform sources");
    }

    void NEORV32::setResetAddress(uint64_t reset_address)
    {
        if(finalized_) {
            throw DescriptorFinalized(getLocation_(), "setResetAddress");
        }
        const uint32_t address_bits = getCPUInfo().data_width;
        if((address_bits < 64) && ((reset_address >> address_bits) != 0)) {
            throw InvalidResetAddress(getLocation_(), reset_address, address_bits);
        }
        if(strict_reset_address_ && reset_address_.has_value() &&
           (reset_address_.value() != reset_address))
        {
            throw ResetAddressConflict(getLocation_(), reset_address_.value(), reset_address);
        }

        if(reset_address_.has_value() && (reset_address_.value() != reset_address)) {
            WLOG("reset address 0x" << std::hex << reset_address_.value()
                 << " replaced by 0x" << reset_address);
        }
        reset_address_ = reset_address;
        cpu_params_[RESET_PARAM] = reset_address;
        ILOG("reset address 0x" << std::hex << reset_address);
    }

    InstantiationRecord NEORV32::finalize()
    {
        if(!reset_address_.has_value()) {
            throw MissingResetAddress(getLocation_());
        }
        finalized_ = true;
        return InstantiationRecord(TOP_ENTITY, variant_.flags, cpu_params_, ibus_, dbus_);
    }

    std::string NEORV32::getGccFlags() const
    {
        std::string flags;
        for(const auto & f : variant_.flags)
        {
            if(!flags.empty()) {
                flags += ' ';
            }
            flags += f;
        }
        return flags + " -D__neorv32__";
    }

    const BusEndpointPtr & NEORV32::getBusEndpoint(const std::string & endpoint_name) const
    {
        for(const auto * buses : {&periph_buses_, &memory_buses_})
        {
            for(const auto & ep : *buses)
            {
                if(ep->name == endpoint_name) {
                    return ep;
                }
            }
        }
        throw sparta::SpartaException(getLocation_()) << " has no bus endpoint named " << endpoint_name;
    }

    std::string NEORV32::getLocation_() const
    {
        return getContainer()->getLocation();
    }

} // namespace rtlbridge
