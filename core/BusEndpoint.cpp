// <BusEndpoint.cpp> -*- C++ -*-

#include "BusEndpoint.hpp"

namespace rtlbridge
{
    BusEndpointPtr makeWishboneEndpoint(const std::string & name)
    {
        auto ep = std::make_shared<BusEndpoint>();
        ep->name = name;
        ep->protocol = "wishbone";
        return ep;
    }

    std::ostream & operator<<(std::ostream & os, const BusEndpoint & ep)
    {
        os << ep.name << " (" << ep.protocol << ", " << ep.data_width << "-bit data, "
           << ep.address_width << "-bit address";
        if (ep.isConnected()) {
            os << ", -> " << ep.connected_to;
        }
        return os << ")";
    }

} // namespace rtlbridge
