// <VariantTable.cpp> -*- C++ -*-

#include <algorithm>

#include "variant/VariantTable.hpp"
#include "RTLExceptions.hpp"

#include "sparta/utils/SpartaAssert.hpp"

namespace rtlbridge
{
    VariantTable::VariantTable(std::initializer_list<VariantEntry> entries) :
        entries_(entries)
    {
        for (auto it = entries_.begin(); it != entries_.end(); ++it)
        {
            sparta_assert(!it->flags.empty(), "Variant '" << it->id << "' has no flags");
            sparta_assert(std::none_of(std::next(it), entries_.end(),
                                       [&it](const VariantEntry & e) { return e.id == it->id; }),
                          "Variant '" << it->id << "' is declared twice");
        }
    }

    const VariantEntry & VariantTable::lookup(const std::string & id) const
    {
        auto match = std::find_if(entries_.begin(), entries_.end(),
                                  [&id](const VariantEntry & e) { return e.id == id; });
        if (match == entries_.end())
        {
            throw UnknownVariant(id, getVariantIds());
        }
        return *match;
    }

    bool VariantTable::contains(const std::string & id) const
    {
        return std::any_of(entries_.begin(), entries_.end(),
                           [&id](const VariantEntry & e) { return e.id == id; });
    }

    std::vector<std::string> VariantTable::getVariantIds() const
    {
        std::vector<std::string> ids;
        for (const auto & e : entries_)
        {
            ids.emplace_back(e.id);
        }
        return ids;
    }

    const VariantTable & getNEORV32Variants()
    {
        static const VariantTable variants {
            {"standard", {"-march=rv32i", "-mabi=ilp32"}}
        };
        return variants;
    }

} // namespace rtlbridge
