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

#include "framer.h"
#include "checksum.h"
#include "app_error_string.h"
#include "k1_exception.h"
#include <fmt/format.h>

namespace framer_ns{
	frame build_request(uint8_t arg_opcode, const std::vector<uint8_t> &arg_payload){
		frame f;

		f.opcode = arg_opcode;
		f.complement = (uint8_t)~arg_opcode;
		f.payload = arg_payload;
		f.checksum = checksum_ns::compute(arg_opcode, arg_payload);

		return f;
	}

	std::vector<uint8_t> encode(const frame &arg_frame){
		std::vector<uint8_t> bytes;

		bytes.reserve(arg_frame.payload.size() + 3);
		bytes.push_back(arg_frame.opcode);
		bytes.push_back(arg_frame.complement);

		// Opcode only: the complement already is the checksum
		if(!arg_frame.payload.empty()){
			bytes.insert(bytes.end(), arg_frame.payload.begin(), arg_frame.payload.end());
			bytes.push_back(arg_frame.checksum);
		}

		return bytes;
	}

	frame parse_response(const std::vector<uint8_t> &arg_bytes){
		frame f;
		uint8_t expected;

		if(arg_bytes.size() < 2){
			throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_FRAMING_ID, app_error_string::messages[APP_ERROR_FRAMING_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_XFER_INFO_ID]), 2, arg_bytes.size()));
		}

		f.opcode = arg_bytes[0];
		f.complement = arg_bytes[1];
		if(f.complement != (uint8_t)~f.opcode){
			throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_FRAMING_ID, app_error_string::messages[APP_ERROR_FRAMING_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_COMPLEMENT_INFO_ID]), f.opcode, f.complement));
		}

		if(arg_bytes.size() == 2){
			f.checksum = f.complement;
			return f;
		}

		f.payload.assign(arg_bytes.begin() + 2, arg_bytes.end() - 1);
		f.checksum = arg_bytes.back();
		expected = checksum_ns::compute(f.opcode, f.payload);
		if(f.checksum != expected){
			throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_CHECKSUM_ID, app_error_string::messages[APP_ERROR_CHECKSUM_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_CHECKSUM_INFO_ID]), expected, f.checksum));
		}

		return f;
	}

	std::vector<uint8_t> build_data(const uint8_t *arg_buf, size_t arg_len){
		std::vector<uint8_t> bytes(arg_buf, arg_buf + arg_len);

		bytes.push_back(checksum_ns::compute(arg_buf, arg_len));

		return bytes;
	}

	std::vector<uint8_t> build_data(const std::vector<uint8_t> &arg_payload){
		return build_data(arg_payload.data(), arg_payload.size());
	}

	std::vector<uint8_t> parse_data(const std::vector<uint8_t> &arg_bytes){
		uint8_t expected;

		if(arg_bytes.empty()){
			throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_FRAMING_ID, app_error_string::messages[APP_ERROR_FRAMING_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_XFER_INFO_ID]), 1, 0));
		}

		expected = checksum_ns::compute(arg_bytes.data(), arg_bytes.size() - 1);
		if(arg_bytes.back() != expected){
			throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_CHECKSUM_ID, app_error_string::messages[APP_ERROR_CHECKSUM_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_CHECKSUM_INFO_ID]), expected, arg_bytes.back()));
		}

		return std::vector<uint8_t>(arg_bytes.begin(), arg_bytes.end() - 1);
	}
}
