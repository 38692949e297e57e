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

	Version: 20241019

	Exception type used throughout the program.

	An error carries the function that raised it, where the error code came
	from (this application, the C library or the OS), the code and message,
	plus an info string with the details of the failed operation.
*/

#ifndef K1_EXCEPTION_H
#define K1_EXCEPTION_H

#include <exception>
#include <string>
#include <cstdint>

#define K1_EXCEPT_SRC_VEN  0  // Application (vendor) error code
#define K1_EXCEPT_SRC_CLIB 1  // C library errno
#define K1_EXCEPT_SRC_OS   2  // OS specific error code, e.g. Windows GetLastError()

class k1_exception : public std::exception{
protected:
	std::string func_name;
	int src;
	int64_t code;
	std::string msg;
	std::string info;
	std::string error_str;

	void build_error_str();

public:
	k1_exception(std::string arg_func_name, int arg_src, int64_t arg_code, std::string arg_msg, std::string arg_info);

	const char* what() const noexcept override;
	const std::string& get_error() const;
	const std::string& get_func_name() const;
	int get_src() const;
	int64_t get_code() const;
	const std::string& get_msg() const;
	const std::string& get_info() const;

	// True when this is an application error with the given id
	bool is(int64_t arg_code) const;

	static k1_exception get_clib_last_error(std::string arg_func_name, std::string arg_info);
	static k1_exception get_os_last_error(std::string arg_func_name, std::string arg_info);
};

#endif
