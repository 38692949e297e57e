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

#include "cmd_line.h"
#include "app_error_string.h"
#include "k1_exception.h"
#include <cstdio>

bool parse_param_exist(std::string param, std::string key){
	// Len of param is correct or longer?
	if(param.size() == key.size()){
		// Compares param to key word
		if(param.compare(0, key.size(), key) == 0){
			return true;
		}
	}

	return false;
}

bool parse_param_str(std::string param, std::string key, std::string &value){
	// Len of param is correct or longer?
	if(param.size() >= (key.size() + 1)){
		// Compares param to key word
		if(param.compare(0, key.size(), key) == 0){
			value = param.substr(key.size(), param.size());

			return true;
		}
	}

	return false;
}

bool parse_param_yn(std::string param, std::string key, bool &value){
	// Len of param is correct or longer?
	if(param.size() >= (key.size() + 1)){
		// Compares param to key word
		if(param.compare(0, key.size(), key) == 0){
			if(param.substr(key.size(), 1) == "y"){
				value = true;
			}else{
				value = false;
			}

			return true;
		}
	}

	return false;
}

void usage(char *arg_0){
	printf("%s ver 20241019\n", arg_0);
	printf("Flasher for the K1 MCU serial bootloader\n");
	printf("Usage:\n");
	printf(" %s <devparams> <cmdparams>\n", arg_0);
	printf("devparams:\n");
	printf("  path=<s>       : serial port path\n");
	printf("  [baud=<n>]     : application baud rate for reqboot (default %u)\n", K1_APP_BAUD);
	printf("  [timeout=<n>]  : response timeout ms (default %u)\n", K1_RESPONSE_TIMEOUT_MS);
	printf("  [window=<n>]   : handshake window ms (default %u, fixed by the bootloader)\n", K1_HANDSHAKE_WINDOW_MS);
	printf("  [retries=<n>]  : repeat handshake and commands on failure (default 0)\n");
	printf("  [verbose=<y|n>]: diagnostic output\n");
	printf("\n");
	printf("cmdparams (run in this order, handshake is always done first):\n");
	printf("handshake        : handshake with the bootloader only\n");
	printf("version          : read the hardware and firmware version\n");
	printf("update           : write firmware file, then start it\n");
	printf("  file=<s>       : firmware file\n");
	printf("  [start=<y|n>]  : start the application after the update (default y)\n");
	printf("start            : start the application\n");
	printf("reqboot          : ask a running application to enter the bootloader\n");
}

bool parse_params_search(char *cmdl_param, cl_my_params *my_params){
	if(parse_param_exist(cmdl_param, "handshake")){
		my_params->do_handshake = true;
		return true;
	}
	if(parse_param_exist(cmdl_param, "version")){
		my_params->do_version = true;
		return true;
	}
	if(parse_param_exist(cmdl_param, "update")){
		my_params->do_update = true;
		return true;
	}
	if(parse_param_exist(cmdl_param, "start")){
		my_params->do_start = true;
		return true;
	}
	if(parse_param_exist(cmdl_param, "reqboot")){
		my_params->do_reqboot = true;
		return true;
	}
	if(parse_param_str(cmdl_param, "path=", my_params->dev_path)){
		return true;
	}
	if(parse_param_val_uint(cmdl_param, "baud=", my_params->baud_rate)){
		return true;
	}
	if(parse_param_val_uint(cmdl_param, "timeout=", my_params->timeoutms)){
		return true;
	}
	if(parse_param_val_uint(cmdl_param, "window=", my_params->windowms)){
		return true;
	}
	if(parse_param_val_uint(cmdl_param, "retries=", my_params->retries)){
		return true;
	}
	if(parse_param_yn(cmdl_param, "verbose=", my_params->verbose)){
		return true;
	}
	if(parse_param_str(cmdl_param, "file=", my_params->full_file_name)){
		return true;
	}
	if(parse_param_yn(cmdl_param, "start=", my_params->start_after_update)){
		return true;
	}

	return false;
}

void parse_params(int arg_c, char *arg_v[], cl_my_params *my_params){
	// Iterate to search for parameters
	for(int i = 1; i < arg_c; i++){
		if(!parse_params_search(arg_v[i], my_params)){
			throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PARAM_ID, app_error_string::messages[APP_ERROR_PARAM_ID], arg_v[i]);
		}
	}

	if(my_params->dev_path.empty()){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PARAM_ID, app_error_string::messages[APP_ERROR_PARAM_ID], "path=<s> is required");
	}
	if(!my_params->has_command()){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PARAM_ID, app_error_string::messages[APP_ERROR_PARAM_ID], "no command given");
	}
	if(my_params->do_update && my_params->full_file_name.empty()){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PARAM_ID, app_error_string::messages[APP_ERROR_PARAM_ID], "update needs file=<s>");
	}
	if(my_params->do_reqboot && (my_params->do_version || my_params->do_update || my_params->do_start)){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PARAM_ID, app_error_string::messages[APP_ERROR_PARAM_ID], "reqboot runs on its own");
	}
}

session_cfg make_session_cfg(const cl_my_params *my_params){
	session_cfg cfg;

	cfg.port = my_params->dev_path;
	cfg.app_baud_rate = my_params->baud_rate;
	cfg.response_timeout_ms = my_params->timeoutms;
	cfg.handshake_window_ms = my_params->windowms;
	cfg.verbose = my_params->verbose;

	return cfg;
}
