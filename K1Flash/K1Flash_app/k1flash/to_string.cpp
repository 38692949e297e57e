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
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace string_utils_ns{
	std::string hexlify(const uint8_t *arg_buf, size_t arg_len){
		return fmt::format("{:02x}", fmt::join(arg_buf, arg_buf + arg_len, ""));
	}

	std::string hexlify(const std::vector<uint8_t> &arg_buf){
		return hexlify(arg_buf.data(), arg_buf.size());
	}

	std::string to_printable(const uint8_t *arg_buf, size_t arg_len){
		std::string str;

		// Ignore trailing NUL padding
		while(arg_len > 0 && arg_buf[arg_len - 1] == 0x00){
			arg_len--;
		}

		for(size_t i = 0; i < arg_len; i++){
			if(arg_buf[i] >= 0x20 && arg_buf[i] < 0x7f){
				str += (char)arg_buf[i];
			}else{
				str += '.';
			}
		}

		return str;
	}
}
