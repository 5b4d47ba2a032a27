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
#include <picklegen/pickle/protocol.hpp>
#include <picklegen/vm/value.hpp>
#include <picklegen/vm/vm_state.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace picklegen
{
    VmState::VmState(ProtocolVersion const version)
        : version_{version}
        , proto_emitted_{false}
        , markers_pushed_{0}
        , markers_popped_{0}
    {
    }

    ValueRef VmState::push(Value v)
    {
        auto const r = arena_.make(std::move(v));
        push_ref(r);
        return r;
    }

    void VmState::push_ref(ValueRef const r)
    {
        if (arena_.holds<MarkerValue>(r)) {
            ++markers_pushed_;
        }
        stack_.push_back(r);
    }

    ValueRef VmState::pop()
    {
        PICKLEGEN_ASSERT(!stack_.empty(), "pop from empty simulated stack");
        auto const r = stack_.back();
        stack_.pop_back();
        if (arena_.holds<MarkerValue>(r)) {
            ++markers_popped_;
        }
        return r;
    }

    std::optional<ValueRef> VmState::peek() const
    {
        return peek_at(0);
    }

    std::optional<ValueRef> VmState::peek_at(std::size_t const depth) const
    {
        if (depth >= stack_.size()) {
            return std::nullopt;
        }
        return stack_[stack_.size() - 1 - depth];
    }

    std::vector<ValueRef> VmState::pop_to_marker()
    {
        std::vector<ValueRef> items;
        while (!stack_.empty()) {
            auto const r = pop();
            if (arena_.holds<MarkerValue>(r)) {
                break;
            }
            items.push_back(r);
        }
        std::ranges::reverse(items);
        return items;
    }

    std::optional<std::size_t> VmState::top_marker_index() const
    {
        for (std::size_t i = stack_.size(); i > 0; --i) {
            if (arena_.holds<MarkerValue>(stack_[i - 1])) {
                return i - 1;
            }
        }
        return std::nullopt;
    }

    bool VmState::has_marker() const
    {
        return top_marker_index().has_value();
    }

    std::optional<std::size_t> VmState::count_above_marker() const
    {
        auto const idx = top_marker_index();
        if (!idx) {
            return std::nullopt;
        }
        return stack_.size() - *idx - 1;
    }

    bool VmState::is_marker_at(std::size_t const depth) const
    {
        return is_at<MarkerValue>(depth);
    }

    bool VmState::is_callable_at(std::size_t const depth) const
    {
        return is_at<CallableValue>(depth) || is_at<GlobalValue>(depth);
    }

    bool VmState::top_free_of_markers(std::size_t const n) const
    {
        if (n > stack_.size()) {
            return false;
        }
        for (std::size_t d = 0; d < n; ++d) {
            if (is_marker_at(d)) {
                return false;
            }
        }
        return true;
    }

    std::optional<ValueRef> VmState::below_marker() const
    {
        auto const idx = top_marker_index();
        if (!idx || *idx == 0) {
            return std::nullopt;
        }
        return stack_[*idx - 1];
    }

    bool VmState::callable_above_marker() const
    {
        auto const idx = top_marker_index();
        if (!idx || *idx + 1 >= stack_.size()) {
            return false;
        }
        auto const r = stack_[*idx + 1];
        return arena_.holds<CallableValue>(r) || arena_.holds<GlobalValue>(r);
    }

    std::optional<ValueRef> VmState::memo_get(std::size_t const index) const
    {
        auto const it = memo_.find(index);
        if (it == memo_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void VmState::memo_put(std::size_t const index, ValueRef const r)
    {
        PICKLEGEN_DEBUG_ASSERT(!arena_.holds<MarkerValue>(r));
        memo_[index] = r;
    }

    void VmState::reset()
    {
        stack_.clear();
        memo_.clear();
        arena_.clear();
        proto_emitted_ = false;
        markers_pushed_ = 0;
        markers_popped_ = 0;
    }
}
