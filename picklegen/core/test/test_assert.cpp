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

#include <gtest/gtest.h>

namespace
{
    int checked_half(int const x)
    {
        PICKLEGEN_ASSERT(x % 2 == 0, "odd input");
        return x / 2;
    }

    TEST(AssertTest, passes_through)
    {
        EXPECT_EQ(checked_half(8), 4);
    }

    TEST(AssertDeathTest, reports_expression)
    {
        EXPECT_DEATH(checked_half(3), "Assertion 'x % 2 == 0' failed");
        EXPECT_DEATH(checked_half(5), "odd input");
    }

    TEST(AssertDeathTest, abort_reports_location)
    {
        EXPECT_DEATH(
            { PICKLEGEN_ABORT(); }, "test_assert.cpp:[0-9]+: .*Aborted");
    }
}
