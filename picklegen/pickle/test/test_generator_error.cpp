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

#include <picklegen/core/result.hpp>
#include <picklegen/pickle/generator_error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace picklegen;

namespace
{
    Result<int> fail_with(GeneratorError e)
    {
        return e;
    }
}

TEST(GeneratorError, message)
{
    auto const res = fail_with(GeneratorError::FrameTooLarge);
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), GeneratorError::FrameTooLarge);
    EXPECT_EQ(
        std::string{res.error().message().c_str()},
        "frame length exceeds 64 bits");
}

TEST(GeneratorError, distinct_codes)
{
    auto const a = fail_with(GeneratorError::InvalidProtocol);
    auto const b = fail_with(GeneratorError::MissingProtocolTable);
    EXPECT_NE(a.error(), b.error());
    EXPECT_EQ(a.error(), GeneratorError::InvalidProtocol);
}
