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

#ifndef CMD_LINE_H
#define CMD_LINE_H

#include "session.h"
#include <cstdint>
#include <cstdlib>
#include <string>

// Stages run in this fixed order: handshake, version, update, start.  The
// bootloader request runs on its own.
class cl_my_params{
public:
	bool do_handshake;
	bool do_version;
	bool do_update;
	bool do_start;
	bool do_reqboot;
	bool start_after_update;
	bool verbose;
	std::string dev_path;
	uint32_t baud_rate;  // Application baud, for the bootloader request
	uint32_t timeoutms;
	uint32_t windowms;
	uint32_t retries;
	std::string full_file_name;

	cl_my_params() :
		do_handshake(false),
		do_version(false),
		do_update(false),
		do_start(false),
		do_reqboot(false),
		start_after_update(true),
		verbose(false),
		baud_rate(K1_APP_BAUD),
		timeoutms(K1_RESPONSE_TIMEOUT_MS),
		windowms(K1_HANDSHAKE_WINDOW_MS),
		retries(0){
	}

	bool has_command() const{
		return do_handshake || do_version || do_update || do_start || do_reqboot;
	}
};

template<class T>
bool parse_param_val_uint(std::string param, std::string key, T &value){
	std::string param_substr;
	char *end_p;

	// Len of param is correct or longer?
	if(param.size() >= (key.size() + 1)){
		// Compares param to key word
		if(param.compare(0, key.size(), key) == 0){
			param_substr = param.substr(key.size(), param.size());
			value = (T)strtoul(param_substr.c_str(), &end_p, 0);
			if(*end_p != '\0'){
				return false;
			}

			return true;
		}
	}

	return false;
}

bool parse_param_exist(std::string param, std::string key);
bool parse_param_str(std::string param, std::string key, std::string &value);
bool parse_param_yn(std::string param, std::string key, bool &value);
void usage(char *arg_0);
bool parse_params_search(char *cmdl_param, cl_my_params *my_params);
void parse_params(int arg_c, char *arg_v[], cl_my_params *my_params);
session_cfg make_session_cfg(const cl_my_params *my_params);

#endif
