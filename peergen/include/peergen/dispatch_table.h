/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include <peergen/internal/types.h>

namespace peergen
{
    struct dispatch_entry
    {
        std::string method;  // wire method string, e.g. "textDocument/hover"
        std::string handler; // identifier of the handler stub, e.g. "handle_hover"
        ordinal slot;
    };

    // Immutable mapping from wire method string to handler identifier.
    // Entries keep the order they were added in; the string index is only used to resolve a wire string to a slot.
    class dispatch_table
    {
        friend class dispatch_table_builder;

        std::vector<dispatch_entry> entries_;
        std::map<std::string, std::size_t> index_;

    public:
        dispatch_table() = default;

        const std::vector<dispatch_entry>& get_entries() const { return entries_; }
        std::size_t size() const { return entries_.size(); }
        bool empty() const { return entries_.empty(); }

        // nullptr when the method is unknown
        const dispatch_entry* find(const std::string& method) const;

        // throws lookup_failure when the method is unknown
        const dispatch_entry& at(const std::string& method) const;

        bool operator==(const dispatch_table& other) const;
    };

    // Accumulates entries while messages are compiled, the table only becomes visible once build() is called
    class dispatch_table_builder
    {
        dispatch_table table_;

    public:
        // throws peergen::error if the method is already registered
        void add(const std::string& method, const std::string& handler);
        bool contains(const std::string& method) const;

        // leaves the builder empty
        dispatch_table build();
    };
}
