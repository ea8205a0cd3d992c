// <CPU.cpp> -*- C++ -*-

#include <stdexcept>

#include "CPU.hpp"

#include "sparta/utils/SpartaException.hpp"

namespace
{
    // Accepts decimal, 0x hex and 0 octal; throws on anything that is
    // not a non-negative number within MAX_RESET_ADDRESS
    std::optional<uint64_t> parseResetAddress(const std::string & text)
    {
        if(text.empty()) {
            return std::nullopt;
        }

        // stoull silently negates a leading minus sign
        const auto first = text.find_first_not_of(" \t");
        const bool negative = (first != std::string::npos) && (text[first] == '-');

        std::size_t consumed = 0;
        uint64_t value = 0;
        if(!negative) {
            try {
                value = std::stoull(text, &consumed, 0);
            }
            catch(const std::logic_error &) {
                consumed = 0;
            }
        }
        if(consumed == 0 || consumed != text.size()) {
            throw sparta::SpartaException("cpu.params.reset_address is not a non-negative number: '")
                << text << "'";
        }
        if(value > rtlbridge::CPU::MAX_RESET_ADDRESS) {
            throw sparta::SpartaException("cpu.params.reset_address '") << text
                << "' is wider than 32 bits";
        }
        return value;
    }
}

//! \brief Name of this resource. Required by sparta::UnitFactory
constexpr char rtlbridge::CPU::name[];
constexpr uint64_t rtlbridge::CPU::MAX_RESET_ADDRESS;

//! \brief Constructor of this CPU Unit
rtlbridge::CPU::CPU(sparta::TreeNode* node, const rtlbridge::CPU::CPUParameterSet* params) :
    sparta::Unit{node},
    reset_address_(parseResetAddress(params->reset_address)),
    bus_interconnect_(params->bus_interconnect)
{
}

//! \brief Destructor of this CPU Unit
rtlbridge::CPU::~CPU() = default;
