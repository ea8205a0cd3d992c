// <CPUFactory.cpp> -*- C++ -*-


#include "CPUFactory.hpp"
#include "NEORV32.hpp"
#include "Platform.hpp"

#include "sparta/utils/SpartaAssert.hpp"
#include "sparta/utils/Utils.hpp"

#include <string>

/**
 * @brief Constructor for CPUFactory
 */
rtlbridge::CPUFactory::CPUFactory() :
    sparta::ResourceFactory<rtlbridge::CPU, rtlbridge::CPU::CPUParameterSet>(){}

/**
 * @brief Destructor for CPUFactory
 */
rtlbridge::CPUFactory::~CPUFactory() = default;

/**
 * @brief Set the user-defined topology for this CPU
 */
auto rtlbridge::CPUFactory::setTopology(const std::string& topology,
                                        const uint32_t num_cores) -> void{
    sparta_assert(!topology_);
    topology_ = rtlbridge::CPUTopology::allocateTopology(topology);
    topology_->setName(topology);
    topology_->setNumCores(num_cores);
}

/**
 * @brief Implementation : Replace the wildcard with the core index
 */
auto rtlbridge::CPUFactory::expand_(const std::string& name,
                                    const std::size_t core_idx) const -> std::string
{
    std::string expanded = name;
    const std::string replace_with = std::to_string(core_idx);
    for(auto pos = expanded.find(to_replace_); pos != std::string::npos;
        pos = expanded.find(to_replace_, pos + replace_with.size())){
        expanded.replace(pos, 1, replace_with);
    }
    return expanded;
}

/**
 * @brief Implementation : Build the device tree by instantiating resource nodes
 */
auto rtlbridge::CPUFactory::buildTree_(sparta::RootTreeNode* root_node,
                                       const std::vector<rtlbridge::CPUTopology::UnitInfo>& units) -> void
{
    for(std::size_t num_of_cores = 0; num_of_cores < topology_->num_cores; ++num_of_cores){
        for(const auto& unit : units){
            const std::string parent_name = expand_(unit.parent_name, num_of_cores);
            const std::string node_name = expand_(unit.name, num_of_cores);
            const std::string human_name = expand_(unit.human_name, num_of_cores);
            auto parent_node = root_node->getChildAs<sparta::TreeNode>(parent_name);
            auto rtn = new sparta::ResourceTreeNode(parent_node,
                                                    node_name,
                                                    unit.group_name,
                                                    unit.group_id,
                                                    human_name,
                                                    unit.factory);
            if(unit.is_private_subtree){
                rtn->makeSubtreePrivate();
            }
            to_delete_.emplace_back(rtn);
            resource_names_.emplace_back(node_name);
        }
    }
}

/**
 * @brief Implementation : Wire the buses, set reset addresses and finalize the cores
 */
auto rtlbridge::CPUFactory::bindTree_(sparta::RootTreeNode* root_node,
                                      const std::vector<rtlbridge::CPUTopology::UnitInfo>& units,
                                      const std::vector<rtlbridge::CPUTopology::BusConnectionInfo>& buses) -> void
{
    auto platform = sparta::notNull(rtlbridge::Platform::getPlatform(root_node));
    auto cpu = sparta::notNull(root_node->getChild("cpu")->getResourceAs<rtlbridge::CPU>());

    for(std::size_t num_of_cores = 0; num_of_cores < topology_->num_cores; ++num_of_cores){
        for(const auto& bus : buses){
            auto core = root_node->getChild(expand_(bus.core_name, num_of_cores))->
                getResourceAs<rtlbridge::NEORV32>();
            platform->connectBus(core->getBusEndpoint(bus.endpoint_name),
                                 bus.interconnect.empty() ? cpu->getBusInterconnect() : bus.interconnect);
        }

        // Set the reset address and finalize
        for(const auto& unit : units){
            auto core_tree_node = root_node->getChild(expand_(unit.parent_name + "." + unit.name,
                                                              num_of_cores));
            sparta_assert(core_tree_node != nullptr);
            auto core = core_tree_node->getResourceAs<rtlbridge::NEORV32>();
            if(cpu->hasResetAddress()){
                core->setResetAddress(cpu->getResetAddress());
            }
            platform->addInstance(core_tree_node->getLocation(), core->finalize());
        }
    }
}

/**
 * @brief Build the device tree by instantiating resource nodes
 */
auto rtlbridge::CPUFactory::buildTree(sparta::RootTreeNode* root_node) -> void
{
    sparta_assert(topology_);
    buildTree_(root_node, topology_->units);
}

/**
 * @brief Wire the buses, set reset addresses and finalize the cores
 */
auto rtlbridge::CPUFactory::bindTree(sparta::RootTreeNode* root_node) -> void
{
    sparta_assert(topology_);
    bindTree_(root_node, topology_->units, topology_->bus_connections);
}

/**
 * @brief Get the list of resources instantiated in this topology
 */
auto rtlbridge::CPUFactory::getResourceNames() const -> const std::vector<std::string>&
{
    return resource_names_;
}
