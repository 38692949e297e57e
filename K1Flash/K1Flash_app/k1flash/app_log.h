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

	Console log.  Informational lines are always written, diagnostic lines
	only when verbose.
*/

#ifndef APP_LOG_H
#define APP_LOG_H

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

class app_log{
protected:
	std::ostream *out;
	bool verbose;

public:
	app_log(std::ostream &arg_out, bool arg_verbose);

	void info(const std::string &arg_msg);
	void debug(const std::string &arg_msg);
	// Hex dump of bytes moved over the link, e.g. "tx 00ff"
	void debug_bytes(const char *arg_dir, const std::vector<uint8_t> &arg_bytes);
};

#endif
