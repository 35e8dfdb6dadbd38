/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <utility>

#include <peergen/dispatch_table.h>
#include <peergen/internal/errors.h>

namespace peergen
{
    const dispatch_entry* dispatch_table::find(const std::string& method) const
    {
        auto it = index_.find(method);
        if (it == index_.end())
            return nullptr;
        return &entries_[it->second];
    }

    const dispatch_entry& dispatch_table::at(const std::string& method) const
    {
        auto* entry = find(method);
        if (!entry)
            throw lookup_failure(method);
        return *entry;
    }

    bool dispatch_table::operator==(const dispatch_table& other) const
    {
        if (entries_.size() != other.entries_.size())
            return false;
        for (std::size_t i = 0; i < entries_.size(); ++i)
        {
            if (entries_[i].method != other.entries_[i].method || entries_[i].handler != other.entries_[i].handler)
                return false;
        }
        return true;
    }

    void dispatch_table_builder::add(const std::string& method, const std::string& handler)
    {
        if (contains(method))
        {
            throw error("method '" + method + "' is already registered to handler '" + table_.at(method).handler + "'");
        }
        ordinal slot{table_.entries_.size()};
        table_.index_.emplace(method, table_.entries_.size());
        table_.entries_.push_back(dispatch_entry{method, handler, slot});
    }

    bool dispatch_table_builder::contains(const std::string& method) const
    {
        return table_.find(method) != nullptr;
    }

    dispatch_table dispatch_table_builder::build()
    {
        dispatch_table result = std::move(table_);
        table_ = dispatch_table();
        return result;
    }
}
