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

#include "k1_exception.h"
#include <cerrno>
#include <cstring>

#if defined(WIN32) || defined(WIN64)
#include <windows.h>
#endif

k1_exception::k1_exception(std::string arg_func_name, int arg_src, int64_t arg_code, std::string arg_msg, std::string arg_info) :
	func_name(arg_func_name),
	src(arg_src),
	code(arg_code),
	msg(arg_msg),
	info(arg_info){
	build_error_str();
}

void k1_exception::build_error_str(){
	error_str = msg;
	if(!info.empty()){
		error_str += ". " + info;
	}

	switch(src){
		case K1_EXCEPT_SRC_CLIB:
			error_str += " (errno " + std::to_string(code) + ")";
			break;
		case K1_EXCEPT_SRC_OS:
			error_str += " (os error " + std::to_string(code) + ")";
			break;
	}

	if(!func_name.empty()){
		error_str += " [" + func_name + "]";
	}
}

const char* k1_exception::what() const noexcept{
	return error_str.c_str();
}

const std::string& k1_exception::get_error() const{
	return error_str;
}

const std::string& k1_exception::get_func_name() const{
	return func_name;
}

int k1_exception::get_src() const{
	return src;
}

int64_t k1_exception::get_code() const{
	return code;
}

const std::string& k1_exception::get_msg() const{
	return msg;
}

const std::string& k1_exception::get_info() const{
	return info;
}

bool k1_exception::is(int64_t arg_code) const{
	return src == K1_EXCEPT_SRC_VEN && code == arg_code;
}

k1_exception k1_exception::get_clib_last_error(std::string arg_func_name, std::string arg_info){
	int err = errno;

	return k1_exception(arg_func_name, K1_EXCEPT_SRC_CLIB, err, strerror(err), arg_info);
}

k1_exception k1_exception::get_os_last_error(std::string arg_func_name, std::string arg_info){
#if defined(WIN32) || defined(WIN64)
	DWORD err = GetLastError();
	char *buf = NULL;
	std::string msg;

	if(FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS, NULL, err, MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT), (LPSTR)&buf, 0, NULL) && buf != NULL){
		msg = buf;
		LocalFree(buf);
		// Strip the trailing CR LF
		while(!msg.empty() && (msg.back() == '\r' || msg.back() == '\n')){
			msg.pop_back();
		}
	}

	return k1_exception(arg_func_name, K1_EXCEPT_SRC_OS, err, msg, arg_info);
#else
	// Under Linux the OS reports through errno
	int err = errno;

	return k1_exception(arg_func_name, K1_EXCEPT_SRC_OS, err, strerror(err), arg_info);
#endif
}
