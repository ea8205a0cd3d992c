// <RtlBridgeSim.cpp> -*- C++ -*-

#include <iostream>

#include "RtlBridgeSim.hpp"

#include "sparta/simulation/TreeNode.hpp"
#include "sparta/simulation/ResourceTreeNode.hpp"

#include "CPUFactory.hpp"
#include "NEORV32.hpp"
#include "Platform.hpp"

RtlBridgeSim::RtlBridgeSim(const std::string& topology,
                           sparta::Scheduler & scheduler,
                           const uint32_t num_cores,
                           const bool show_records) :
    sparta::app::Simulation("sparta_rtlbridge", &scheduler),
    cpu_topology_(topology),
    num_cores_(num_cores),
    show_records_(show_records)
{
    // Set up the CPU Resource Factory to be available through ResourceTreeNode
    getResourceSet()->addResourceFactory<rtlbridge::CPUFactory>();
}

RtlBridgeSim::~RtlBridgeSim()
{
    getRoot()->enterTeardown(); // Allow deletion of nodes without error now
}

//! Get the resource factory needed to build and bind the tree
auto RtlBridgeSim::getCPUFactory_() -> rtlbridge::CPUFactory*{
    auto sparta_res_factory = getResourceSet()->getResourceFactory("cpu");
    auto cpu_factory = dynamic_cast<rtlbridge::CPUFactory*>(sparta_res_factory);
    return cpu_factory;
}

void RtlBridgeSim::buildTree_()
{
    // TREE_BUILDING Phase.  See sparta::PhasedObject::TreePhase
    auto cpu_factory = getCPUFactory_();

    // The platform the cores hand their RTL to while being built
    platform_tn_.reset(new rtlbridge::Platform(getRoot()));

    // Set the cpu topology that will be built
    cpu_factory->setTopology(cpu_topology_, num_cores_);

    // Create a single CPU
    sparta::ResourceTreeNode* cpu_tn = new sparta::ResourceTreeNode(getRoot(),
                                                                    "cpu",
                                                                    sparta::TreeNode::GROUP_NAME_NONE,
                                                                    sparta::TreeNode::GROUP_IDX_NONE,
                                                                    "CPU Node",
                                                                    cpu_factory);
    to_delete_.emplace_back(cpu_tn);

    // Tell the factory to build the resources now
    cpu_factory->buildTree(getRoot());
}

void RtlBridgeSim::configureTree_()
{
    // In TREE_CONFIGURING phase
    // Configuration from command line is already applied
}

void RtlBridgeSim::bindTree_()
{
    // In TREE_FINALIZED phase
    // Cores are built and their RTL is with the platform

    //Tell the factory to wire and finalize all cores
    auto cpu_factory = getCPUFactory_();
    cpu_factory->bindTree(getRoot());

    if(show_records_){
        std::cout << "Platform sources: \n";
        for(const auto& s : platform_tn_->getSources()){
            std::cout << "\t" << s.string() << std::endl;
        }
        std::cout << "Bus connections: \n";
        for(const auto& c : platform_tn_->getBusConnections()){
            std::cout << "\t" << *c.first << std::endl;
        }
        std::cout << "Instances: \n";
        for(const auto& i : platform_tn_->getInstances()){
            std::cout << "\t" << i.first << ": " << i.second << std::endl;
        }
    }
}
