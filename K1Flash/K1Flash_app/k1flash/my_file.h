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

	Thin wrapper over the C library FILE stream which reports failures as
	k1_exception and closes the file on destruction.
*/

#ifndef MY_FILE_H
#define MY_FILE_H

#include "k1_exception.h"
#include <cstdio>
#include <cstdint>
#include <cerrno>
#include <string>

class cl_my_file{
protected:
	FILE *_fp;
	std::string _path;

public:
	cl_my_file() :
		_fp(NULL){
	}
	~cl_my_file(){
		close_file();
	}
	cl_my_file(const cl_my_file&) = delete;
	cl_my_file& operator=(const cl_my_file&) = delete;

	void open_file(std::string arg_path, const char *arg_mode){
		close_file();
		_fp = fopen(arg_path.c_str(), arg_mode);
		if(_fp == NULL){
			throw k1_exception::get_clib_last_error(__func__, arg_path);
		}
		_path = arg_path;
	}

	void close_file(){
		if(_fp != NULL){
			fclose(_fp);
			_fp = NULL;
		}
	}

	// Size in bytes, leaves the position at the start
	uint64_t get_size(){
		long size;

		if(fseek(_fp, 0, SEEK_END) != 0){
			throw k1_exception::get_clib_last_error(__func__, _path);
		}
		size = ftell(_fp);
		if(size < 0){
			throw k1_exception::get_clib_last_error(__func__, _path);
		}
		if(fseek(_fp, 0, SEEK_SET) != 0){
			throw k1_exception::get_clib_last_error(__func__, _path);
		}

		return (uint64_t)size;
	}

	void read_file(void *arg_buf, size_t arg_len, size_t &arg_bytes_read){
		arg_bytes_read = fread(arg_buf, 1, arg_len, _fp);
		if(arg_bytes_read != arg_len && ferror(_fp)){
			throw k1_exception::get_clib_last_error(__func__, _path);
		}
	}
};

#endif
