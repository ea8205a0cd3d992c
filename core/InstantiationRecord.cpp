// <InstantiationRecord.cpp> -*- C++ -*-

#include <iomanip>

#include "InstantiationRecord.hpp"

#include "sparta/utils/SpartaAssert.hpp"
#include "sparta/utils/SpartaException.hpp"

namespace rtlbridge
{
    InstantiationRecord::InstantiationRecord(const std::string & module_name,
                                             const std::vector<std::string> & flags,
                                             const InstantiationParams & params,
                                             const BusEndpointPtr & ibus,
                                             const BusEndpointPtr & dbus) :
        module_name_(module_name),
        flags_(flags),
        params_(params),
        ibus_(ibus),
        dbus_(dbus)
    {
        sparta_assert(ibus_ != nullptr && dbus_ != nullptr,
                      "Instantiation record for " << module_name_ << " needs both buses");
    }

    uint64_t InstantiationRecord::getNumericParam(const std::string & name) const
    {
        const auto match = params_.find(name);
        if (match == params_.end()) {
            throw sparta::SpartaException("Parameter ") << name << " not set on " << module_name_;
        }
        if (const auto value = std::get_if<uint64_t>(&match->second)) {
            return *value;
        }
        throw sparta::SpartaException("Parameter ") << name << " of " << module_name_
                                                    << " is not numeric";
    }

    bool InstantiationRecord::operator==(const InstantiationRecord & other) const
    {
        return (module_name_ == other.module_name_) &&
            (flags_ == other.flags_) &&
            (params_ == other.params_) &&
            (ibus_ == other.ibus_) &&
            (dbus_ == other.dbus_);
    }

    std::ostream & operator<<(std::ostream & os, const InstantiationRecord & record)
    {
        os << record.getModuleName() << ":";
        for (const auto & flag : record.getFlags()) {
            os << " " << flag;
        }
        for (const auto & [name, value] : record.getParams())
        {
            os << " " << name << "=";
            if (const auto num = std::get_if<uint64_t>(&value)) {
                os << "0x" << std::hex << *num << std::dec;
            }
            else {
                os << std::get<std::string>(value);
            }
        }
        return os << " ibus=" << *record.getInstructionBus()
                  << " dbus=" << *record.getDataBus();
    }

} // namespace rtlbridge
