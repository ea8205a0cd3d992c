// <CPU.hpp> -*- C++ -*-

#pragma once

#include <cinttypes>
#include <optional>
#include <string>

#include "sparta/simulation/Unit.hpp"
#include "sparta/simulation/TreeNode.hpp"
#include "sparta/simulation/ParameterSet.hpp"

namespace rtlbridge
{

    /**
     * @file  CPU.hpp
     * @brief CPU Unit acts as a logical unit containing the cores and
     *        the settings the SoC imposes on them
     */
    class CPU : public sparta::Unit
    {
      public:
        //! \brief Parameters for CPU model
        class CPUParameterSet : public sparta::ParameterSet
        {
          public:
            CPUParameterSet(sparta::TreeNode* n) : sparta::ParameterSet(n) {}

            PARAMETER(std::string, reset_address, "",
                      "Reset vector given to every core (e.g. 0x80000000). "
                      "Empty leaves the cores without one and finalization fails")
            PARAMETER(std::string, bus_interconnect, "soc_bus",
                      "Interconnect the cores' peripheral buses are attached to")
        };

        //! \brief Name of this resource. Required by sparta::UnitFactory
        static constexpr char name[] = "cpu";

        /**
         * @brief Constructor for CPU
         *
         * @param node The node that represents (has a pointer to) the CPU
         * @param p The CPU's parameter set
         */
        CPU(sparta::TreeNode* node, const CPUParameterSet* params);

        //! \brief Destructor of the CPU Unit
        ~CPU();

        //! Widest reset_address accepted, the cores are RV32
        static constexpr uint64_t MAX_RESET_ADDRESS = 0xFFFFFFFF;

        bool hasResetAddress() const { return reset_address_.has_value(); }

        uint64_t getResetAddress() const { return reset_address_.value(); }

        const std::string & getBusInterconnect() const { return bus_interconnect_; }

      private:
        const std::optional<uint64_t> reset_address_;
        const std::string bus_interconnect_;

    }; // class CPU
} // namespace rtlbridge
