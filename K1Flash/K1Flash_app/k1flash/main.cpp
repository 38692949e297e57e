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

	K1Flash
	-------

	A command line program for querying, updating and starting the firmware
	of the K1 printer MCU through its serial bootloader.

	After power up the bootloader listens for a handshake for 15 seconds,
	then it starts the application.  If the application fails its integrity
	check the bootloader keeps waiting.  A running application built with
	serial bootloader request support can be asked to reset into the
	bootloader (reqboot), so a power cycle is not needed.

	Developer   : Truong Hy
	Date        : 19 Oct 2024
	Language    : C++
	Program type: Console program
*/

#include "k1_macro.h"
#include "app_error_string.h"
#include "k1_exception.h"
#include "cmd_line.h"
#include "transport.h"
#include "session.h"
#include "session_controller.h"
#include "firmware_chunker.h"
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#define PROGRESS_BAR_LEN 44

static std::atomic<bool> cancel_requested(false);

extern "C" void on_interrupt(int arg_sig){
	K1_UNUSED(arg_sig);
	cancel_requested = true;
}

void progress_bar(const transfer_progress &arg_progress){
	uint32_t filled = (uint32_t)((uint64_t)PROGRESS_BAR_LEN * arg_progress.bytes_sent / arg_progress.total_bytes);
	uint32_t percent = (uint32_t)((uint64_t)100 * arg_progress.bytes_sent / arg_progress.total_bytes);

	std::cout << "\rProgress: |" << std::string(filled, '#') << std::string(PROGRESS_BAR_LEN - filled, '-') << "| " << percent << "% ";
	std::cout << (arg_progress.chunk_index + 1) << "/" << arg_progress.chunk_count << std::flush;
	if(arg_progress.bytes_sent == arg_progress.total_bytes){
		std::cout << std::endl;
	}
}

void print_version(const version_info &arg_ver){
	if(arg_ver.has_application()){
		std::cout << "FW Version: " << arg_ver.to_string() << std::endl;
	}else{
		std::cout << "FW Version: no valid application" << std::endl;
	}
}

void run_stages(cl_my_params *arg_params, session_controller *arg_ctl, const firmware_image *arg_image){
	if(arg_params->do_reqboot){
		print_version(arg_ctl->request_bootloader());
		return;
	}

	// Every other stage needs the handshake
	arg_ctl->handshake();

	if(arg_params->do_version){
		print_version(arg_ctl->query_version());
	}

	if(arg_params->do_update){
		arg_ctl->update_firmware(*arg_image);
		if(arg_params->start_after_update && !arg_params->do_start){
			arg_ctl->start_application();
		}
	}

	if(arg_params->do_start){
		arg_ctl->start_application();
	}
}

bool process_cmd_line(cl_my_params *arg_params){
	session_cfg cfg = make_session_cfg(arg_params);
	std::optional<firmware_image> image;
	std::string image_version;

	cfg.cancel = &cancel_requested;

	if(arg_params->do_update){
		std::cout << "Loading " << arg_params->full_file_name << std::endl;
		image.emplace(firmware_image::load(arg_params->full_file_name));
		image_version = image->embedded_version();
		std::cout << "Image size " << image->size() << " bytes, version " << (image_version.empty() ? "unknown" : image_version) << std::endl;
	}

	for(uint32_t attempt = 0; ; attempt++){
		try{
			session sess(std::make_unique<serial_transport>(), cfg);
			session_controller ctl(sess, std::cout);

			ctl.set_progress_callback(progress_bar);
			run_stages(arg_params, &ctl, image ? &*image : nullptr);

			return true;
		}catch(k1_exception &ex){
			// Retrying is the operator's choice, never after a cancel
			if(attempt >= arg_params->retries || ex.is(APP_ERROR_CANCELLED_ID) || ex.is(APP_ERROR_UPDATE_CANCELLED_ID) || ex.is(APP_ERROR_PARAM_ID)){
				throw;
			}
			std::cout << std::endl << "Error: " << ex.get_error() << std::endl;
			std::cout << "Retrying " << (attempt + 1) << "/" << arg_params->retries << ", power cycle the MCU now if needed" << std::endl;
		}
	}
}

int main(int arg_c, char *arg_v[]){
	cl_my_params my_params;

	try{
		if(arg_c > 1){
			parse_params(arg_c, arg_v, &my_params);
			signal(SIGINT, on_interrupt);
			process_cmd_line(&my_params);
		}else{
			usage(arg_v[0]);
		}
	}catch(k1_exception &ex){
		std::cout << "\nError: " << ex.get_error() << std::endl;
		if(session_controller::leaves_flash_undefined(ex)){
			std::cout << "Flash content is undefined, power cycle the MCU and run the update again" << std::endl;
		}
		return (int)ex.get_code();
	}

	return 0;
}
