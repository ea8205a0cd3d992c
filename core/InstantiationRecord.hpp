// <InstantiationRecord.hpp> -*- C++ -*-

//!
//! \file InstantiationRecord.hpp
//! \brief What the platform needs to instantiate and wire a finalized CPU
//!

#pragma once

#include <cinttypes>
#include <map>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

#include "BusEndpoint.hpp"

namespace rtlbridge
{
    //! A module parameter value: numeric (reset vector) or text
    using ParamValue = std::variant<uint64_t, std::string>;

    //! Module parameters by name
    using InstantiationParams = std::map<std::string, ParamValue>;

    /**
     * \class InstantiationRecord
     * \brief Immutable output of NEORV32::finalize()
     *
     * The parameter keys and the two bus endpoints are what the rest
     * of the platform connects to.
     */
    class InstantiationRecord
    {
    public:
        InstantiationRecord(const std::string & module_name,
                            const std::vector<std::string> & flags,
                            const InstantiationParams & params,
                            const BusEndpointPtr & ibus,
                            const BusEndpointPtr & dbus);

        //! HDL module to instantiate
        const std::string & getModuleName() const { return module_name_; }

        //! Compiler flags of the selected variant
        const std::vector<std::string> & getFlags() const { return flags_; }

        const InstantiationParams & getParams() const { return params_; }

        bool hasParam(const std::string & name) const { return params_.count(name) != 0; }

        //! Value of a numeric parameter, throws SpartaException if absent or not numeric
        uint64_t getNumericParam(const std::string & name) const;

        const BusEndpointPtr & getInstructionBus() const { return ibus_; }
        const BusEndpointPtr & getDataBus() const { return dbus_; }

        bool operator==(const InstantiationRecord & other) const;

    private:
        const std::string module_name_;
        const std::vector<std::string> flags_;
        const InstantiationParams params_;
        const BusEndpointPtr ibus_;
        const BusEndpointPtr dbus_;
    };

    std::ostream & operator<<(std::ostream & os, const InstantiationRecord & record);

} // namespace rtlbridge
