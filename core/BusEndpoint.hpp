// <BusEndpoint.hpp> -*- C++ -*-

#pragma once

#include <cinttypes>
#include <functional>
#include <memory>
#include <ostream>
#include <string>

namespace rtlbridge
{
    /**
     * @file  BusEndpoint.hpp
     * @brief A bus master port exposed by a CPU for the platform to wire
     *
     * Endpoints are shared: the platform holds them to do the wiring
     * and the CPU keeps its own reference for bookkeeping.
     */
    struct BusEndpoint
    {
        //! Endpoint name, "ibus" or "dbus" on a CPU
        std::string name;

        //! Bus protocol spoken on the endpoint
        std::string protocol;

        //! Data width in bits
        uint32_t data_width = 32;

        //! Address width in bits (Wishbone addresses words)
        uint32_t address_width = 30;

        //! Interconnect the platform attached this endpoint to, empty until wired
        std::string connected_to;

        bool isConnected() const { return !connected_to.empty(); }
    };

    using BusEndpointPtr = std::shared_ptr<BusEndpoint>;

    //! Builds the endpoint with the given name
    using BusFactory = std::function<BusEndpointPtr(const std::string &)>;

    //! Default factory: a 32-bit classic Wishbone master
    BusEndpointPtr makeWishboneEndpoint(const std::string & name);

    std::ostream & operator<<(std::ostream & os, const BusEndpoint & ep);

} // namespace rtlbridge
