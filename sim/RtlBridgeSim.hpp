// <RtlBridgeSim.hpp> -*- C++ -*-

#pragma once

#include <memory>
#include <string>

#include "sparta/app/Simulation.hpp"

namespace rtlbridge {
    class CPUFactory;
    class Platform;
}

/*!
 * \brief RtlBridgeSim which builds the platform and its CPUs and
 *        configures them
 */
class RtlBridgeSim : public sparta::app::Simulation
{
public:

    /*!
     * \brief Construct RtlBridgeSim
     * \param topology The CPU topology to build ("neorv32")
     * \param scheduler The Scheduler used in simulation
     * \param num_cores Number of cores to instantiate
     * \param show_records Print the platform's sources, bus wiring
     *                     and instantiation records to stdout once bound
     */
    RtlBridgeSim(const std::string& topology,
                 sparta::Scheduler & scheduler,
                 const uint32_t num_cores,
                 const bool show_records = false);

    // Tear it down
    virtual ~RtlBridgeSim();

    //! The platform node, valid once the tree is built
    const rtlbridge::Platform * getPlatform() const { return platform_tn_.get(); }

private:

    //////////////////////////////////////////////////////////////////////
    // Setup

    // Platform.  Last thing to delete
    std::unique_ptr<rtlbridge::Platform> platform_tn_;

    //! Build the tree with tree nodes, but does not instantiate the
    //! unit yet
    void buildTree_() override;

    //! Configure the tree and apply any last minute parameter changes
    void configureTree_() override;

    //! The tree is now configured, built, and instantiated.  We need
    //! to bind things together.
    void bindTree_() override;

    //! Name of the topology to build
    const std::string cpu_topology_;

    //! Number of cores in this simulator
    const uint32_t num_cores_;

    /*!
     * \brief Get the factory for topology build
     */
    auto getCPUFactory_() -> rtlbridge::CPUFactory*;

    /*!
     * \brief Optional flag to print the platform contents to console
     */
    const bool show_records_;
};
