// <RTLExceptions.hpp> -*- C++ -*-

//!
//! \file RTLExceptions.hpp
//! \brief Exceptions raised while describing, fetching and converting the RTL core
//!

#pragma once

#include <cinttypes>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "sparta/utils/SpartaException.hpp"

//! \class RTLExceptionBase
//! \class UnknownVariant
//! \class ManifestError
//! \class AcquisitionFailed
//! \class ToolchainError
//! \class MissingResetAddress
//! \class ResetAddressConflict
//! \class InvalidResetAddress
//! \class DescriptorFinalized

namespace rtlbridge
{

    //! \brief exception base class for all RTL integration errors
    //!
    //! Derives from SpartaException so the command line simulator
    //! reports these the same way it reports model errors
    class RTLExceptionBase : public sparta::SpartaException
    {
      public:
        explicit RTLExceptionBase(const std::string & why) : sparta::SpartaException(why) {}
    };

    //! \brief the requested variant is not in the variant table
    struct UnknownVariant : RTLExceptionBase
    {
        UnknownVariant(const std::string & variant, const std::vector<std::string> & known) :
            RTLExceptionBase(format_(variant, known)),
            variant_(variant)
        {
        }

        const std::string & getVariant() const { return variant_; }

      private:
        static std::string format_(const std::string & variant,
                                   const std::vector<std::string> & known)
        {
            std::stringstream ss;
            ss << "Unknown CPU variant '" << variant << "', expected one of:";
            for (const auto & k : known)
            {
                ss << " " << k;
            }
            return ss.str();
        }

        const std::string variant_;
    };

    //! \brief the source manifest was built with bad entries
    //!
    //! Names must be unique plain file names and the remote template
    //! must not be empty
    struct ManifestError : RTLExceptionBase
    {
        explicit ManifestError(const std::string & why) :
            RTLExceptionBase("Source manifest: " + why)
        {
        }
    };

    //! \brief a required source file could not be fetched
    //!
    //! The acquisition stops at the first failure.  Files already
    //! fetched stay on disk so a retry only fetches what is missing
    struct AcquisitionFailed : RTLExceptionBase
    {
        AcquisitionFailed(const std::string & name, const std::string & cause) :
            RTLExceptionBase("Unable to fetch RTL source '" + name + "': " + cause),
            name_(name),
            cause_(cause)
        {
        }

        const std::string & getFileName() const { return name_; }
        const std::string & getCause() const { return cause_; }

      private:
        const std::string name_;
        const std::string cause_;
    };

    //! \brief the external conversion toolchain failed
    //!
    //! Not retried, a broken toolchain install will not fix itself
    struct ToolchainError : RTLExceptionBase
    {
        static constexpr int NO_EXIT_STATUS = -1;

        ToolchainError(const std::string & reason, const std::string & hint,
                       const int exit_status = NO_EXIT_STATUS,
                       const std::string & output = "") :
            RTLExceptionBase(format_(reason, hint, exit_status, output)),
            reason_(reason),
            hint_(hint),
            exit_status_(exit_status),
            output_(output)
        {
        }

        const std::string & getReason() const { return reason_; }
        const std::string & getHint() const { return hint_; }
        int getExitStatus() const { return exit_status_; }
        const std::string & getOutput() const { return output_; }

      private:
        static std::string format_(const std::string & reason, const std::string & hint,
                                   const int exit_status, const std::string & output)
        {
            std::stringstream ss;
            ss << "Unable to convert NEORV32 CPU to verilog: " << reason;
            if (exit_status != NO_EXIT_STATUS)
            {
                ss << " (exit status " << exit_status << ")";
            }
            ss << ", " << hint;
            if (!output.empty())
            {
                ss << "\n" << output;
            }
            return ss.str();
        }

        const std::string reason_;
        const std::string hint_;
        const int exit_status_;
        const std::string output_;
    };

    //! \brief finalize() was called before the reset address was assigned
    struct MissingResetAddress : RTLExceptionBase
    {
        explicit MissingResetAddress(const std::string & unit) :
            RTLExceptionBase(unit + ": reset_address must be set before finalize()")
        {
        }
    };

    //! \brief a second, different reset address under strict_reset_address
    struct ResetAddressConflict : RTLExceptionBase
    {
        ResetAddressConflict(const std::string & unit, const uint64_t current,
                             const uint64_t requested) :
            RTLExceptionBase(format_(unit, current, requested))
        {
        }

      private:
        static std::string format_(const std::string & unit, const uint64_t current,
                                   const uint64_t requested)
        {
            std::stringstream ss;
            ss << unit << ": reset_address already set to 0x" << std::hex << current
               << ", refusing 0x" << requested;
            return ss.str();
        }
    };

    //! \brief the reset address does not fit the core's address space
    struct InvalidResetAddress : RTLExceptionBase
    {
        InvalidResetAddress(const std::string & unit, const uint64_t requested,
                            const uint32_t address_bits) :
            RTLExceptionBase(format_(unit, requested, address_bits))
        {
        }

      private:
        static std::string format_(const std::string & unit, const uint64_t requested,
                                   const uint32_t address_bits)
        {
            std::stringstream ss;
            ss << unit << ": reset_address 0x" << std::hex << requested
               << " does not fit in " << std::dec << address_bits << " bits";
            return ss.str();
        }
    };

    //! \brief the descriptor was mutated after its record was emitted
    struct DescriptorFinalized : RTLExceptionBase
    {
        DescriptorFinalized(const std::string & unit, const std::string & operation) :
            RTLExceptionBase(unit + ": " + operation + " after finalize()")
        {
        }
    };

} // namespace rtlbridge
