// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <picklegen/pickle/protocol.hpp>
#include <picklegen/vm/value.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace picklegen
{
    /**
     * Simulated pickle machine: the value stack, the memo table and the
     * per-pass flags. Depths are counted from the top of the stack, so depth
     * 0 is the last value pushed.
     */
    class VmState
    {
    public:
        explicit VmState(ProtocolVersion version);

        ProtocolVersion version() const noexcept
        {
            return version_;
        }

        ValueArena &arena() noexcept
        {
            return arena_;
        }

        ValueArena const &arena() const noexcept
        {
            return arena_;
        }

        ////////////////////////////////////////////////////////////////////
        // Stack

        std::size_t depth() const noexcept
        {
            return stack_.size();
        }

        bool empty() const noexcept
        {
            return stack_.empty();
        }

        std::vector<ValueRef> const &stack() const noexcept
        {
            return stack_;
        }

        ValueRef push(Value v);
        void push_ref(ValueRef r);
        ValueRef pop();
        std::optional<ValueRef> peek() const;
        std::optional<ValueRef> peek_at(std::size_t depth) const;

        /// Pop everything above the topmost marker, then the marker itself.
        /// Returns the popped values in push order.
        std::vector<ValueRef> pop_to_marker();

        ////////////////////////////////////////////////////////////////////
        // Derived queries

        bool has_marker() const;

        /// Number of items strictly above the topmost marker.
        std::optional<std::size_t> count_above_marker() const;

        template <typename T>
        bool is_at(std::size_t const depth) const
        {
            auto const r = peek_at(depth);
            return r && arena_.holds<T>(*r);
        }

        bool is_marker_at(std::size_t depth) const;

        /// A `CallableValue` or a bare `GlobalValue`.
        bool is_callable_at(std::size_t depth) const;

        /// `true` if none of the top `n` items is a marker.
        bool top_free_of_markers(std::size_t n) const;

        template <typename T>
        bool below_marker_is() const
        {
            auto const r = below_marker();
            return r && arena_.holds<T>(*r);
        }

        bool callable_above_marker() const;

        ////////////////////////////////////////////////////////////////////
        // Memo

        std::map<std::size_t, ValueRef> const &memo() const noexcept
        {
            return memo_;
        }

        std::size_t memo_size() const noexcept
        {
            return memo_.size();
        }

        std::optional<ValueRef> memo_get(std::size_t index) const;
        void memo_put(std::size_t index, ValueRef r);

        ////////////////////////////////////////////////////////////////////
        // Pass flags and bookkeeping

        bool proto_emitted() const noexcept
        {
            return proto_emitted_;
        }

        void set_proto_emitted() noexcept
        {
            proto_emitted_ = true;
        }

        std::size_t markers_pushed() const noexcept
        {
            return markers_pushed_;
        }

        std::size_t markers_popped() const noexcept
        {
            return markers_popped_;
        }

        /// Clear stack, memo, values and flags; keep the protocol version.
        void reset();

    private:
        std::optional<std::size_t> top_marker_index() const;
        std::optional<ValueRef> below_marker() const;

        ProtocolVersion version_;
        ValueArena arena_;
        std::vector<ValueRef> stack_;
        std::map<std::size_t, ValueRef> memo_;
        bool proto_emitted_;
        std::size_t markers_pushed_;
        std::size_t markers_popped_;
    };
}
