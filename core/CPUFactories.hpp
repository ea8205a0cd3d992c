// <CPUFactories.hpp> -*- C++ -*-


#pragma once

#include "sparta/simulation/ResourceFactory.hpp"
#include "NEORV32.hpp"

namespace rtlbridge{

    /**
     * @file  CPUFactories.hpp
     * @brief CPUFactories will act as the place which contains all the
     *        required factories to build sub-units of the CPU.
     *
     * CPUFactories unit will
     * 1. Contain resource factories to build each core of the CPU
     */
    struct CPUFactories{

        //! \brief Resource Factory to build a NEORV32 core
        NEORV32Factory neorv32_rf;
    }; // struct CPUFactories
}  // namespace rtlbridge
