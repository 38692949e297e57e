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

	Single byte checksum used by the bootloader on every frame, in both
	directions:  (sum of bytes mod 256) XOR 0xff.

	For a single byte the result is the bitwise complement of the byte, which
	is why an opcode only request "opcode, ~opcode" is also a valid checksummed
	frame.
*/

#ifndef CHECKSUM_H
#define CHECKSUM_H

#include <cstdint>
#include <cstddef>
#include <vector>

namespace checksum_ns{
	uint8_t compute(const uint8_t *arg_buf, size_t arg_len);
	uint8_t compute(const std::vector<uint8_t> &arg_buf);
	// Checksum over the opcode followed by the payload
	uint8_t compute(uint8_t arg_opcode, const std::vector<uint8_t> &arg_payload);
}

#endif
