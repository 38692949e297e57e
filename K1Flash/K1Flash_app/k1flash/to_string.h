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

	String conversion helpers for diagnostic output.
*/

#ifndef TO_STRING_H
#define TO_STRING_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace string_utils_ns{
	// Hex dump of a byte sequence, e.g. "00ff75"
	std::string hexlify(const uint8_t *arg_buf, size_t arg_len);
	std::string hexlify(const std::vector<uint8_t> &arg_buf);

	// Replaces non printable characters with '.' and drops trailing NUL padding
	std::string to_printable(const uint8_t *arg_buf, size_t arg_len);
}

#endif
