// <CPUFactory.hpp> -*- C++ -*-


#pragma once

#include <memory>
#include <string>
#include <vector>

#include "sparta/simulation/ResourceFactory.hpp"
#include "sparta/simulation/RootTreeNode.hpp"
#include "sparta/simulation/ResourceTreeNode.hpp"
#include "CPU.hpp"
#include "CPUTopology.hpp"

namespace rtlbridge{

    /**
     * @file  CPUFactory.hpp
     * @brief CPUFactory will act as the place where a user-defined topology
     *        is built into the device tree, bound to the platform and
     *        finalized.
     *
     * CPUFactory unit will
     * 1. Create the cores of the selected topology under the cpu node
     * 2. Hand the cores' bus endpoints to the platform
     * 3. Give every core its reset address and collect its instantiation record
     */
    class CPUFactory : public sparta::ResourceFactory<rtlbridge::CPU,
                                                      rtlbridge::CPU::CPUParameterSet>{
    public:

        /**
         * @brief Constructor for CPUFactory
         */
        CPUFactory();

        /**
         * @brief Destructor for CPUFactory
         */
        ~CPUFactory();

        /**
         * @brief Set the user-defined topology for this CPU
         */
        auto setTopology(const std::string& topology, const uint32_t num_cores) -> void;

        /**
         * @brief Build the device tree by instantiating resource nodes
         */
        auto buildTree(sparta::RootTreeNode* root_node) -> void;

        /**
         * @brief Wire the buses, set reset addresses and finalize the cores
         */
        auto bindTree(sparta::RootTreeNode* root_node) -> void;

        /**
         * @brief Get the list of resources instantiated in this topology
         */
        auto getResourceNames() const -> const std::vector<std::string>&;

    private:

        /**
         * @brief The user-defined topology unit
         */
        std::unique_ptr<rtlbridge::CPUTopology> topology_;

        /**
         * @brief Tree nodes to be deleted at teardown
         */
        std::vector<std::unique_ptr<sparta::TreeNode>> to_delete_;

        /**
         * @brief Resource names of the units built
         */
        std::vector<std::string> resource_names_;

        /**
         * @brief Wildcard in topology names replaced by the core index
         */
        const char to_replace_ {'*'};

        /**
         * @brief Implementation : Build the device tree by instantiating resource nodes
         */
        auto buildTree_(sparta::RootTreeNode* root_node,
                        const std::vector<rtlbridge::CPUTopology::UnitInfo>& units) -> void;

        /**
         * @brief Implementation : Wire the buses, set reset addresses and finalize the cores
         */
        auto bindTree_(sparta::RootTreeNode* root_node,
                       const std::vector<rtlbridge::CPUTopology::UnitInfo>& units,
                       const std::vector<rtlbridge::CPUTopology::BusConnectionInfo>& buses) -> void;

        /**
         * @brief Replace the wildcard of a topology name with a core index
         */
        auto expand_(const std::string& name, const std::size_t core_idx) const -> std::string;
    }; // class CPUFactory
}  // namespace rtlbridge
