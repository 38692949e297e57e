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

namespace checksum_ns{
	static uint8_t sum(uint8_t arg_init, const uint8_t *arg_buf, size_t arg_len){
		uint8_t x = arg_init;

		for(size_t i = 0; i < arg_len; i++){
			x = (uint8_t)(x + arg_buf[i]);
		}

		return x;
	}

	uint8_t compute(const uint8_t *arg_buf, size_t arg_len){
		return sum(0, arg_buf, arg_len) ^ 0xff;
	}

	uint8_t compute(const std::vector<uint8_t> &arg_buf){
		return compute(arg_buf.data(), arg_buf.size());
	}

	uint8_t compute(uint8_t arg_opcode, const std::vector<uint8_t> &arg_payload){
		return sum(arg_opcode, arg_payload.data(), arg_payload.size()) ^ 0xff;
	}
}
