// <VariantTable.hpp> -*- C++ -*-

//!
//! \file VariantTable.hpp
//! \brief Mapping from a CPU variant to its compiler flags
//!

#pragma once

#include <initializer_list>
#include <string>
#include <vector>

namespace rtlbridge
{
    //! \brief One CPU configuration and the GCC flags selecting it
    struct VariantEntry
    {
        //! Variant identifier, unique within a table
        std::string id;

        //! Compiler flag tokens, in order
        std::vector<std::string> flags;
    };

    /**
     * \class VariantTable
     * \brief Static lookup of a variant's flags
     *
     * Entries keep their declaration order.  An unknown id is a
     * configuration error, there is no default variant.
     */
    class VariantTable
    {
      public:
        VariantTable(std::initializer_list<VariantEntry> entries);

        //! Get the entry for id, throws UnknownVariant if absent
        const VariantEntry & lookup(const std::string & id) const;

        bool contains(const std::string & id) const;

        std::vector<std::string> getVariantIds() const;

      private:
        std::vector<VariantEntry> entries_;
    };

    //! The NEORV32 variants
    const VariantTable & getNEORV32Variants();

} // namespace rtlbridge
