// <Platform.hpp> -*- C++ -*-

#pragma once

/*!
 * \file Platform.hpp
 * \brief Defines a general TreeNode holding what the CPUs hand to the
 *        surrounding platform: HDL sources, bus wiring and
 *        instantiation records
 */

#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "sparta/simulation/TreeNode.hpp"
#include "sparta/utils/SpartaAssert.hpp"

#include "BusEndpoint.hpp"
#include "InstantiationRecord.hpp"

namespace rtlbridge
{
    /*!
     * \class Platform
     * \brief A TreeNode that is actually a functional resource
     *        collecting the platform's source set
     *
     * CPUs find it by walking up the tree from their own node.
     */
    class Platform : public sparta::TreeNode
    {
    public:
        static constexpr char name[] = "platform";

        //! A CPU bus endpoint and the interconnect it is attached to
        using BusConnection = std::pair<BusEndpointPtr, std::string>;

        //! A finalized CPU, by tree location
        using Instance = std::pair<std::string, InstantiationRecord>;

        Platform(sparta::TreeNode *node) :
            sparta::TreeNode(node, name, "Platform sources, bus wiring and instances")
        {}

        static Platform * getPlatform(sparta::TreeNode *node)
        {
            Platform * platform = nullptr;
            if(node)
            {
                if(node->hasChild(Platform::name)) {
                    platform = node->getChildAs<Platform>(Platform::name);
                }
                else {
                    return getPlatform(node->getParent());
                }
            }
            return platform;
        }

        //! Add an HDL file to the platform build; adding it twice is a no-op
        void addSource(const std::filesystem::path & source)
        {
            if(std::find(sources_.begin(), sources_.end(), source) == sources_.end()) {
                sources_.emplace_back(source);
            }
        }

        const std::vector<std::filesystem::path> & getSources() const { return sources_; }

        //! Take ownership of a CPU bus endpoint and attach it to interconnect
        void connectBus(const BusEndpointPtr & endpoint, const std::string & interconnect)
        {
            sparta_assert(endpoint != nullptr);
            sparta_assert(!endpoint->isConnected(),
                          "Bus endpoint " << endpoint->name << " is already connected to "
                          << endpoint->connected_to);
            endpoint->connected_to = interconnect;
            bus_connections_.emplace_back(endpoint, interconnect);
        }

        const std::vector<BusConnection> & getBusConnections() const { return bus_connections_; }

        void addInstance(const std::string & location, const InstantiationRecord & record)
        {
            instances_.emplace_back(location, record);
        }

        const std::vector<Instance> & getInstances() const { return instances_; }

    private:
        std::vector<std::filesystem::path> sources_;
        std::vector<BusConnection> bus_connections_;
        std::vector<Instance> instances_;
    };
}
