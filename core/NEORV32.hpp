// <NEORV32.hpp> -*- C++ -*-

//!
//! \file NEORV32.hpp
//! \brief Definition of the NEORV32 CPU integration unit
//!

#pragma once

#include <cinttypes>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sparta/simulation/Unit.hpp"
#include "sparta/simulation/TreeNode.hpp"
#include "sparta/simulation/ParameterSet.hpp"
#include "sparta/simulation/ResourceFactory.hpp"

#include "BusEndpoint.hpp"
#include "InstantiationRecord.hpp"
#include "rtl/Fetcher.hpp"
#include "rtl/SourceManifest.hpp"
#include "variant/VariantTable.hpp"

namespace rtlbridge
{
    class Platform;

    /**
     * @file   NEORV32.hpp
     * @brief  The NEORV32 RV32 core, described for the platform
     *
     * Building the unit makes the core's RTL available: the VHDL
     * sources are fetched if missing and, in "convert" mode, turned
     * into Verilog by GHDL/Yosys and handed to the Platform.  Any
     * failure throws out of the constructor.
     *
     * The unit then waits for its reset address.  finalize() refuses
     * to run without one and returns the InstantiationRecord; nothing
     * can be changed afterwards.
     */
    class NEORV32 : public sparta::Unit
    {
    public:
        static constexpr char SOURCE_MODE_CONVERT[]  = "convert";
        static constexpr char SOURCE_MODE_FETCH[]    = "fetch";
        static constexpr char SOURCE_MODE_PREBUILT[] = "prebuilt";

        //! \brief Parameters for the NEORV32 unit
        class NEORV32ParameterSet : public sparta::ParameterSet
        {
        public:
            NEORV32ParameterSet(sparta::TreeNode* n) :
                sparta::ParameterSet(n)
            {
                auto mode_validator = [](std::string & val, const sparta::TreeNode*)->bool {
                    return (val == SOURCE_MODE_CONVERT) ||
                        (val == SOURCE_MODE_FETCH) ||
                        (val == SOURCE_MODE_PREBUILT);
                };
                source_mode.addDependentValidationCallback(mode_validator,
                                                           "source_mode must be convert, fetch or prebuilt");
            }

            PARAMETER(std::string, variant,     "standard", "CPU variant, selects the GCC flags")
            PARAMETER(std::string, source_mode, "convert",
                      "How the RTL is supplied: convert (fetch VHDL, convert to Verilog), "
                      "fetch (fetch VHDL only) or prebuilt (use prebuilt_verilog)")
            PARAMETER(std::string, rtl_dir,     "rtl",   "Local directory holding the VHDL sources")
            PARAMETER(std::string, build_dir,   "build", "Directory receiving the Yosys script and the Verilog")
            PARAMETER(std::string, source_url,  NEORV32_SOURCE_URL,
                      "Upstream location of the VHDL sources, {name} is replaced by the file name")
            PARAMETER(std::string, prebuilt_verilog, "",
                      "Pre-converted Verilog handed to the platform in prebuilt mode (optional)")
            PARAMETER(std::string, fetch_tool,  "wget",  "HTTP client used to download missing sources")
            PARAMETER(std::string, toolchain,   "yosys", "Conversion executable, called with the script as last argument")
            PARAMETER(std::vector<std::string>, toolchain_args, std::vector<std::string>({"-q", "-m", "ghdl"}),
                      "Arguments passed to the conversion executable before the script")
            PARAMETER(bool,        strict_reset_address, false,
                      "Reject a second reset address that differs from the first one")
        };

        //! \brief Fixed description of the core, independent of the variant
        struct CPUInfo
        {
            std::string family;
            std::string name;
            std::string human_name;
            uint32_t    data_width;
            std::string endianness;
            std::vector<std::string> gcc_triple;
            std::string linker_output_format;
            std::string nop;
            //! Uncached IO regions, origin -> length
            std::map<uint64_t, uint64_t> io_regions;
        };

        //! HDL entity instantiated by the platform
        static constexpr char TOP_ENTITY[] = "neorv32_cpu";

        //! Instantiation parameter holding the reset vector
        static constexpr char RESET_PARAM[] = "RESET_PC";

        //! \brief Name of this resource. Required by sparta::UnitFactory
        static constexpr char name[] = "neorv32";

        /**
         * @brief Constructor for NEORV32, used by the resource factory
         *
         * Wishbone endpoints and a ProcessFetcher running fetch_tool.
         *
         * @param node The node that represents (has a pointer to) the NEORV32
         * @param p The NEORV32's parameter set
         */
        NEORV32(sparta::TreeNode* node, const NEORV32ParameterSet* p);

        /**
         * @brief Constructor for NEORV32 with explicit collaborators
         *
         * @param bus_factory Builds the "ibus" and "dbus" endpoints
         * @param fetcher Transport for missing sources
         */
        NEORV32(sparta::TreeNode* node, const NEORV32ParameterSet* p,
                const BusFactory & bus_factory,
                const std::shared_ptr<FetcherIF> & fetcher);

        ~NEORV32();

        static const CPUInfo & getCPUInfo();

        //! The sources this core needs
        static SourceManifest makeManifest(const std::string & source_url = NEORV32_SOURCE_URL);

        //! Record the reset vector; last write wins unless strict_reset_address.
        //! Throws InvalidResetAddress if it is wider than the data width
        void setResetAddress(uint64_t reset_address);

        bool hasResetAddress() const { return reset_address_.has_value(); }

        /**
         * @brief Check the configuration and describe the instance
         *
         * Throws MissingResetAddress if no reset address was set.
         * Calling it again returns an equal record.
         */
        InstantiationRecord finalize();

        //! True once finalize() has emitted the record
        bool hasEmittedRecord() const { return finalized_; }

        const VariantEntry & getVariant() const { return variant_; }

        //! Variant flags followed by the core define
        std::string getGccFlags() const;

        const InstantiationParams & getInstantiationParams() const { return cpu_params_; }

        const BusEndpointPtr & getInstructionBus() const { return ibus_; }
        const BusEndpointPtr & getDataBus() const { return dbus_; }

        //! Endpoint by name, throws SpartaException if the core has none
        const BusEndpointPtr & getBusEndpoint(const std::string & endpoint_name) const;

        //! Buses connected to the main SoC interconnect
        const std::vector<BusEndpointPtr> & getPeripheralBuses() const { return periph_buses_; }

        //! Buses connected straight to the memory controller (none on this core)
        const std::vector<BusEndpointPtr> & getMemoryBuses() const { return memory_buses_; }

        //! Verilog handed to the platform, empty if none
        const std::filesystem::path & getVerilog() const { return verilog_; }

        //! Number of sources fetched while building this unit
        uint32_t getNumFetched() const { return num_fetched_; }

    private:

        // Fetch and, depending on source_mode, convert the RTL
        void addSources_(const NEORV32ParameterSet* p, FetcherIF & fetcher);

        // Hand a Verilog file over to the platform
        void handOff_(const std::filesystem::path & verilog);

        std::string getLocation_() const;

        const VariantEntry & variant_;
        const bool strict_reset_address_;

        std::optional<uint64_t> reset_address_;
        InstantiationParams     cpu_params_;

        const BusEndpointPtr ibus_;
        const BusEndpointPtr dbus_;
        std::vector<BusEndpointPtr> periph_buses_;
        std::vector<BusEndpointPtr> memory_buses_;

        std::filesystem::path verilog_;
        uint32_t num_fetched_ = 0;
        bool finalized_ = false;
    };

    using NEORV32Factory = sparta::ResourceFactory<NEORV32, NEORV32::NEORV32ParameterSet>;

} // namespace rtlbridge
