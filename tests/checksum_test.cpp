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

#include "checksum.h"
#include "gtest/gtest.h"
#include <vector>

TEST(ChecksumTest, EmptyInputIsAllOnes){
	EXPECT_EQ(0xff, checksum_ns::compute(std::vector<uint8_t>()));
}

TEST(ChecksumTest, KnownBootloaderCommands){
	EXPECT_EQ(0xff, checksum_ns::compute(std::vector<uint8_t>{0x00}));
	EXPECT_EQ(0xfe, checksum_ns::compute(std::vector<uint8_t>{0x01}));
	EXPECT_EQ(0xfd, checksum_ns::compute(std::vector<uint8_t>{0x02}));
	EXPECT_EQ(0xfc, checksum_ns::compute(std::vector<uint8_t>{0x03}));
	EXPECT_EQ(0x8a, checksum_ns::compute(std::vector<uint8_t>{0x75}));
}

TEST(ChecksumTest, SingleByteIsComplement){
	for(int b = 0; b < 256; b++){
		uint8_t byte = (uint8_t)b;
		EXPECT_EQ((uint8_t)~byte, checksum_ns::compute(&byte, 1));
	}
}

TEST(ChecksumTest, SumWrapsModulo256){
	EXPECT_EQ(0xff, checksum_ns::compute(std::vector<uint8_t>{0xff, 0x01}));
	EXPECT_EQ(0xfe, checksum_ns::compute(std::vector<uint8_t>{0x80, 0x80, 0x01}));
}

TEST(ChecksumTest, OpcodeFormMatchesConcatenation){
	std::vector<uint8_t> payload{0x10, 0x20, 0xf0, 0x33};
	std::vector<uint8_t> joined{0x01, 0x10, 0x20, 0xf0, 0x33};

	EXPECT_EQ(checksum_ns::compute(joined), checksum_ns::compute(0x01, payload));
}

TEST(ChecksumTest, SizeFieldOfUpdateRequest){
	// 0x00012345 little endian
	std::vector<uint8_t> size_field{0x45, 0x23, 0x01, 0x00};

	EXPECT_EQ((uint8_t)((0x45 + 0x23 + 0x01) ^ 0xff), checksum_ns::compute(size_field));
}
