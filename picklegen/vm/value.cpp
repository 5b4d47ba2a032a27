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

#include <picklegen/core/assert.h>
#include <picklegen/core/cases.hpp>
#include <picklegen/vm/value.hpp>

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace
{
    using namespace picklegen;

    constexpr unsigned max_hash_depth = 8;

    void hash_combine(std::size_t &seed, std::size_t const h)
    {
        seed ^= h + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }

    std::size_t hash_bytes(byte_string const &data)
    {
        return std::hash<std::string_view>{}(
            to_string_view(byte_string_view{data}));
    }
}

namespace picklegen
{
    std::string_view kind_name(Value const &v)
    {
        return std::visit(
            Cases{
                [](IntValue const &) { return "int"; },
                [](FloatValue const &) { return "float"; },
                [](BoolValue const &) { return "bool"; },
                [](NoneValue const &) { return "none"; },
                [](BytesValue const &) { return "bytes"; },
                [](TextValue const &) { return "text"; },
                [](ByteArrayValue const &) { return "bytearray"; },
                [](ListValue const &) { return "list"; },
                [](TupleValue const &) { return "tuple"; },
                [](DictValue const &) { return "dict"; },
                [](SetValue const &) { return "set"; },
                [](FrozenSetValue const &) { return "frozenset"; },
                [](MarkerValue const &) { return "mark"; },
                [](GlobalValue const &) { return "global"; },
                [](CallableValue const &) { return "callable"; },
                [](InstanceValue const &) { return "instance"; },
            },
            v);
    }

    ValueRef ValueArena::make(Value v)
    {
        PICKLEGEN_ASSERT(values_.size() < std::numeric_limits<ValueRef>::max());
        values_.push_back(std::move(v));
        return static_cast<ValueRef>(values_.size() - 1);
    }

    Value &ValueArena::get(ValueRef const r)
    {
        PICKLEGEN_DEBUG_ASSERT(r < values_.size());
        return values_[r];
    }

    Value const &ValueArena::get(ValueRef const r) const
    {
        PICKLEGEN_DEBUG_ASSERT(r < values_.size());
        return values_[r];
    }

    bool ValueArena::equal(ValueRef const a, ValueRef const b) const
    {
        PairStack assumed;
        return equal_impl(a, b, assumed);
    }

    bool ValueArena::equal_impl(
        ValueRef const a, ValueRef const b, PairStack &assumed) const
    {
        if (a == b) {
            return true;
        }
        if (std::ranges::find(assumed, std::pair{a, b}) != assumed.end()) {
            return true;
        }

        auto const &va = get(a);
        auto const &vb = get(b);
        if (va.index() != vb.index()) {
            return false;
        }

        assumed.emplace_back(a, b);
        bool const result = std::visit(
            [&](auto const &x) -> bool {
                using T = std::decay_t<decltype(x)>;
                auto const &y = std::get<T>(vb);

                if constexpr (
                    std::is_same_v<T, IntValue> ||
                    std::is_same_v<T, BoolValue>) {
                    return x.value == y.value;
                }
                else if constexpr (std::is_same_v<T, FloatValue>) {
                    return std::bit_cast<std::uint64_t>(x.value) ==
                           std::bit_cast<std::uint64_t>(y.value);
                }
                else if constexpr (
                    std::is_same_v<T, NoneValue> ||
                    std::is_same_v<T, MarkerValue>) {
                    return true;
                }
                else if constexpr (
                    std::is_same_v<T, BytesValue> ||
                    std::is_same_v<T, ByteArrayValue>) {
                    return x.data == y.data;
                }
                else if constexpr (std::is_same_v<T, TextValue>) {
                    return x.text == y.text;
                }
                else if constexpr (
                    std::is_same_v<T, ListValue> ||
                    std::is_same_v<T, TupleValue>) {
                    return equal_seq(x.items, y.items, assumed);
                }
                else if constexpr (
                    std::is_same_v<T, SetValue> ||
                    std::is_same_v<T, FrozenSetValue>) {
                    return equal_unordered(x.items, y.items, assumed);
                }
                else if constexpr (std::is_same_v<T, DictValue>) {
                    return equal_entries(x, y, assumed);
                }
                else if constexpr (std::is_same_v<T, GlobalValue>) {
                    return x.module == y.module && x.name == y.name;
                }
                else if constexpr (std::is_same_v<T, CallableValue>) {
                    return equal_impl(x.target, y.target, assumed);
                }
                else {
                    static_assert(std::is_same_v<T, InstanceValue>);
                    return equal_impl(x.callable, y.callable, assumed) &&
                           equal_impl(x.args, y.args, assumed);
                }
            },
            va);
        assumed.pop_back();
        return result;
    }

    bool ValueArena::equal_seq(
        std::vector<ValueRef> const &a, std::vector<ValueRef> const &b,
        PairStack &assumed) const
    {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!equal_impl(a[i], b[i], assumed)) {
                return false;
            }
        }
        return true;
    }

    bool ValueArena::equal_unordered(
        std::vector<ValueRef> const &a, std::vector<ValueRef> const &b,
        PairStack &assumed) const
    {
        if (a.size() != b.size()) {
            return false;
        }
        return std::ranges::all_of(a, [&](ValueRef const x) {
            return std::ranges::any_of(b, [&](ValueRef const y) {
                return equal_impl(x, y, assumed);
            });
        });
    }

    bool ValueArena::equal_entries(
        DictValue const &a, DictValue const &b, PairStack &assumed) const
    {
        if (a.entries.size() != b.entries.size()) {
            return false;
        }
        return std::ranges::all_of(a.entries, [&](auto const &x) {
            return std::ranges::any_of(b.entries, [&](auto const &y) {
                return equal_impl(x.first, y.first, assumed) &&
                       equal_impl(x.second, y.second, assumed);
            });
        });
    }

    std::size_t ValueArena::hash(ValueRef const r) const
    {
        return hash_impl(r, 0);
    }

    std::size_t
    ValueArena::hash_impl(ValueRef const r, unsigned const depth) const
    {
        auto const &v = get(r);
        std::size_t seed = v.index();
        if (depth >= max_hash_depth) {
            return seed;
        }

        std::visit(
            [&](auto const &x) {
                using T = std::decay_t<decltype(x)>;

                if constexpr (std::is_same_v<T, IntValue>) {
                    hash_combine(seed, std::hash<std::int64_t>{}(x.value));
                }
                else if constexpr (std::is_same_v<T, BoolValue>) {
                    hash_combine(seed, std::hash<bool>{}(x.value));
                }
                else if constexpr (std::is_same_v<T, FloatValue>) {
                    hash_combine(
                        seed,
                        std::hash<std::uint64_t>{}(
                            std::bit_cast<std::uint64_t>(x.value)));
                }
                else if constexpr (
                    std::is_same_v<T, BytesValue> ||
                    std::is_same_v<T, ByteArrayValue>) {
                    hash_combine(seed, hash_bytes(x.data));
                }
                else if constexpr (std::is_same_v<T, TextValue>) {
                    hash_combine(seed, std::hash<std::string>{}(x.text));
                }
                else if constexpr (
                    std::is_same_v<T, ListValue> ||
                    std::is_same_v<T, TupleValue>) {
                    for (auto const item : x.items) {
                        hash_combine(seed, hash_impl(item, depth + 1));
                    }
                }
                else if constexpr (
                    std::is_same_v<T, SetValue> ||
                    std::is_same_v<T, FrozenSetValue>) {
                    // order independent
                    std::size_t sum = 0;
                    for (auto const item : x.items) {
                        sum += hash_impl(item, depth + 1);
                    }
                    hash_combine(seed, sum);
                }
                else if constexpr (std::is_same_v<T, DictValue>) {
                    std::size_t sum = 0;
                    for (auto const &[k, val] : x.entries) {
                        std::size_t h = hash_impl(k, depth + 1);
                        hash_combine(h, hash_impl(val, depth + 1));
                        sum += h;
                    }
                    hash_combine(seed, sum);
                }
                else if constexpr (std::is_same_v<T, GlobalValue>) {
                    hash_combine(seed, std::hash<std::string>{}(x.module));
                    hash_combine(seed, std::hash<std::string>{}(x.name));
                }
                else if constexpr (std::is_same_v<T, CallableValue>) {
                    hash_combine(seed, hash_impl(x.target, depth + 1));
                }
                else if constexpr (std::is_same_v<T, InstanceValue>) {
                    hash_combine(seed, hash_impl(x.callable, depth + 1));
                    hash_combine(seed, hash_impl(x.args, depth + 1));
                }
            },
            v);
        return seed;
    }

    bool ValueArena::contains(
        std::vector<ValueRef> const &items, ValueRef const item) const
    {
        auto const h = hash(item);
        return std::ranges::any_of(items, [&](ValueRef const x) {
            return hash(x) == h && equal(x, item);
        });
    }

    void ValueArena::list_append(ValueRef const list, ValueRef const item)
    {
        std::get<ListValue>(get(list)).items.push_back(item);
    }

    void ValueArena::dict_set(
        ValueRef const dict, ValueRef const key, ValueRef const value)
    {
        auto &entries = std::get<DictValue>(get(dict)).entries;
        auto const h = hash(key);
        auto const it = std::ranges::find_if(entries, [&](auto const &e) {
            return hash(e.first) == h && equal(e.first, key);
        });
        if (it != entries.end()) {
            it->second = value;
        }
        else {
            entries.emplace_back(key, value);
        }
    }

    void ValueArena::set_add(ValueRef const set, ValueRef const item)
    {
        if (contains(std::get<SetValue>(get(set)).items, item)) {
            return;
        }
        std::get<SetValue>(get(set)).items.push_back(item);
    }

    ValueRef ValueArena::make_frozen_set(std::vector<ValueRef> const &items)
    {
        FrozenSetValue fs;
        for (auto const item : items) {
            if (!contains(fs.items, item)) {
                fs.items.push_back(item);
            }
        }
        return make(std::move(fs));
    }
}
