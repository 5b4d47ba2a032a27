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

#include <picklegen/core/byte_string.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace picklegen
{
    /**
     * Handle of a value held by a `ValueArena`. Containers, the stack and the
     * memo all refer to values through handles, so a value stored in several
     * places is shared and a mutation through one holder is visible to all.
     */
    using ValueRef = std::uint32_t;

    struct IntValue
    {
        std::int64_t value;
    };

    struct FloatValue
    {
        double value;
    };

    struct BoolValue
    {
        bool value;
    };

    struct NoneValue
    {
    };

    struct BytesValue
    {
        byte_string data;
    };

    struct TextValue
    {
        std::string text;
    };

    struct ByteArrayValue
    {
        byte_string data;
    };

    struct ListValue
    {
        std::vector<ValueRef> items;
    };

    struct TupleValue
    {
        std::vector<ValueRef> items;
    };

    /// Keys are unique by value.
    struct DictValue
    {
        std::vector<std::pair<ValueRef, ValueRef>> entries;
    };

    /// Members are unique by value.
    struct SetValue
    {
        std::vector<ValueRef> items;
    };

    struct FrozenSetValue
    {
        std::vector<ValueRef> items;
    };

    /// Sentinel pushed by `MARK`; carries no data.
    struct MarkerValue
    {
    };

    struct GlobalValue
    {
        std::string module;
        std::string name;
    };

    struct CallableValue
    {
        ValueRef target;
    };

    struct InstanceValue
    {
        ValueRef callable;
        ValueRef args;
    };

    using Value = std::variant<
        IntValue, FloatValue, BoolValue, NoneValue, BytesValue, TextValue,
        ByteArrayValue, ListValue, TupleValue, DictValue, SetValue,
        FrozenSetValue, MarkerValue, GlobalValue, CallableValue,
        InstanceValue>;

    std::string_view kind_name(Value const &);

    /**
     * Owner of every value created during one generation pass.
     *
     * Equality and hashing are structural. Cyclic containers compare
     * co-inductively: a pair of handles already under comparison further up
     * the recursion is assumed equal, so self-containing values terminate.
     * Floats compare by bit pattern.
     */
    class ValueArena
    {
    public:
        ValueRef make(Value v);

        Value &get(ValueRef r);
        Value const &get(ValueRef r) const;

        template <typename T>
        bool holds(ValueRef const r) const
        {
            return std::holds_alternative<T>(get(r));
        }

        std::size_t size() const noexcept
        {
            return values_.size();
        }

        void clear() noexcept
        {
            values_.clear();
        }

        bool equal(ValueRef a, ValueRef b) const;
        std::size_t hash(ValueRef r) const;

        void list_append(ValueRef list, ValueRef item);

        /// Insert or overwrite the entry whose key equals `key`.
        void dict_set(ValueRef dict, ValueRef key, ValueRef value);

        /// Insert `item` unless an equal member is already present.
        void set_add(ValueRef set, ValueRef item);

        /// Build a frozen set from `items`, dropping duplicates.
        ValueRef make_frozen_set(std::vector<ValueRef> const &items);

    private:
        using PairStack = std::vector<std::pair<ValueRef, ValueRef>>;

        bool equal_impl(ValueRef a, ValueRef b, PairStack &assumed) const;
        bool equal_seq(
            std::vector<ValueRef> const &a, std::vector<ValueRef> const &b,
            PairStack &assumed) const;
        bool equal_unordered(
            std::vector<ValueRef> const &a, std::vector<ValueRef> const &b,
            PairStack &assumed) const;
        bool equal_entries(
            DictValue const &a, DictValue const &b, PairStack &assumed) const;
        std::size_t hash_impl(ValueRef r, unsigned depth) const;
        bool contains(std::vector<ValueRef> const &items, ValueRef item) const;

        // deque keeps references stable while new values are appended
        std::deque<Value> values_;
    };
}
