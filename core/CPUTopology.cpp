// <CPUTopology.cpp> -*- C++ -*-

#include "CPUTopology.hpp"
#include "sparta/utils/SpartaAssert.hpp"
#include "sparta/utils/SpartaException.hpp"

/**
 * @brief Constructor for CoreTopologyNEORV32
 */
rtlbridge::CoreTopologyNEORV32::CoreTopologyNEORV32(){

    //! Instantiating units of this topology
    units = {
        {
            "core*",
            "cpu",
            "NEORV32 Core *",
            sparta::TreeNode::GROUP_NAME_NONE,
            sparta::TreeNode::GROUP_IDX_NONE,
            &factories->neorv32_rf
        }
    };

    //! Bus endpoints of this topology
    bus_connections = {
        {
            "cpu.core*",
            "ibus"
        },
        {
            "cpu.core*",
            "dbus"
        }
    };
}

/**
 * @brief Static method to allocate memory for topology
 */
std::unique_ptr<rtlbridge::CPUTopology>
rtlbridge::CPUTopology::allocateTopology(const std::string & topology)
{
    std::unique_ptr<CPUTopology> new_topology;
    if (topology == "neorv32")
    {
        new_topology.reset(new rtlbridge::CoreTopologyNEORV32());
    }
    else
    {
        throw sparta::SpartaException("This topology is unrecognized: ") << topology;
    }
    sparta_assert(nullptr != new_topology);
    return new_topology;
}
