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

#include "app_log.h"
#include "to_string.h"

app_log::app_log(std::ostream &arg_out, bool arg_verbose) :
	out(&arg_out),
	verbose(arg_verbose){
}

void app_log::info(const std::string &arg_msg){
	*out << arg_msg << std::endl;
}

void app_log::debug(const std::string &arg_msg){
	if(verbose){
		*out << arg_msg << std::endl;
	}
}

void app_log::debug_bytes(const char *arg_dir, const std::vector<uint8_t> &arg_bytes){
	if(verbose){
		// Large chunks are shortened to their first bytes
		if(arg_bytes.size() > 32){
			*out << arg_dir << " " << string_utils_ns::hexlify(arg_bytes.data(), 32) << "... (" << arg_bytes.size() << " bytes)" << std::endl;
		}else{
			*out << arg_dir << " " << string_utils_ns::hexlify(arg_bytes) << std::endl;
		}
	}
}
