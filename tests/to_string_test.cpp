/*
	MIT License

	Copyright (c) 2024 Truong Hy

	Permission is hereby granted, free of charge, to any person obtaining a copy
	of this software and associated documentation files (the "Software"), to deal
	in the Software without restriction, including without limitation the rights
	to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
	copies of the Software, and to permit persons to whom the Software is
	furnished to do so, subject to the following conditions:

	The above copyright notice and this permission notice shall be included in all
	copies or substantial portions of the Software.

	THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
	IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
	FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
	AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
	LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
	OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
	SOFTWARE.
*/

#include "to_string.h"
#include "gtest/gtest.h"
#include <vector>

TEST(ToStringTest, HexlifyIsLowercaseTwoDigitsPerByte){
	EXPECT_EQ("00ff75", string_utils_ns::hexlify(std::vector<uint8_t>{0x00, 0xff, 0x75}));
	EXPECT_EQ("0a1f20", string_utils_ns::hexlify(std::vector<uint8_t>{0x0a, 0x1f, 0x20}));
	EXPECT_EQ("", string_utils_ns::hexlify(std::vector<uint8_t>()));
}

TEST(ToStringTest, PrintableDropsTrailingPaddingAndMasksControlBytes){
	const uint8_t version[] = {'K', '1', 0x01, 'v', '2', 0x00, 0x00};

	EXPECT_EQ("K1.v2", string_utils_ns::to_printable(version, sizeof(version)));
	EXPECT_EQ("", string_utils_ns::to_printable(version + 5, 2));
}
