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

#include "simulated_bootloader.h"
#include "session_controller.h"
#include "framer.h"
#include "checksum.h"
#include "app_error_string.h"
#include "k1_exception.h"
#include <algorithm>
#include <string>
#include <chrono>
#include <thread>

simulated_bootloader::simulated_bootloader() :
	responds_to_handshake(true),
	ignore_probes(0),
	in_application(false),
	supports_bootloader_request(true),
	fail_open(false),
	version("K1-HW1.0-FW2.3"),
	sector_multiplier(1),
	sector_unit(256),
	app_start_status(K1_STATUS_ACK),
	silent_on_app_start(false),
	corrupt_version_checksum(false),
	silent_after_chunk(-1),
	corrupt_ack_at_chunk(-1),
	bad_crc_at_chunk(-1),
	last_status_complete(true),
	handshake_probes(0),
	announced_size(0),
	bytes_after_silence(0),
	close_count(0),
	open_flag(false),
	reset_pending(false),
	state(rx_state_e::COMMAND),
	written(0){
}

void simulated_bootloader::open(const std::string &arg_port, uint32_t arg_baud_rate){
	if(fail_open){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_CONNECTION_ID, app_error_string::messages[APP_ERROR_CONNECTION_ID], arg_port);
	}
	open_bauds.push_back(arg_baud_rate);
	open_flag = true;
}

void simulated_bootloader::close(){
	if(!open_flag){
		return;
	}
	open_flag = false;
	close_count++;
	in.clear();
	out.clear();

	// The application resets into the bootloader once the request went out
	if(reset_pending){
		reset_pending = false;
		in_application = false;
		state = rx_state_e::COMMAND;
	}
}

bool simulated_bootloader::is_open() const{
	return open_flag;
}

void simulated_bootloader::send(const std::vector<uint8_t> &arg_bytes){
	if(!open_flag){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_CONNECTION_ID, app_error_string::messages[APP_ERROR_CONNECTION_ID], "port is closed");
	}

	in.insert(in.end(), arg_bytes.begin(), arg_bytes.end());
	if(in_application){
		process_application();
	}else{
		process();
	}
}

std::vector<uint8_t> simulated_bootloader::receive(size_t arg_len, uint32_t arg_timeout_ms){
	std::vector<uint8_t> rx;

	if(!open_flag){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_CONNECTION_ID, app_error_string::messages[APP_ERROR_CONNECTION_ID], "port is closed");
	}

	if(out.size() < arg_len){
		std::this_thread::sleep_for(std::chrono::milliseconds(arg_timeout_ms));
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_TIMEOUT_ID, app_error_string::messages[APP_ERROR_TIMEOUT_ID], "simulated");
	}

	wire_log.push_back("rx " + std::to_string(arg_len));
	rx.assign(out.begin(), out.begin() + arg_len);
	out.erase(out.begin(), out.begin() + arg_len);

	return rx;
}

void simulated_bootloader::discard_input(){
	out.clear();
}

std::vector<uint8_t> simulated_bootloader::image_written() const{
	std::vector<uint8_t> image;

	for(const std::vector<uint8_t> &chunk : chunks){
		image.insert(image.end(), chunk.begin(), chunk.end());
	}

	return image;
}

void simulated_bootloader::process_application(){
	const std::string request(K1_BOOTLOADER_REQUEST);

	app_rx.append(in.begin(), in.end());
	in.clear();
	if(supports_bootloader_request && app_rx.find(request) != std::string::npos){
		reset_pending = true;
	}
}

void simulated_bootloader::queue_status(uint8_t arg_status){
	out.push_back(arg_status);
	out.push_back(checksum_ns::compute(&arg_status, 1));
}

void simulated_bootloader::queue_data(const std::vector<uint8_t> &arg_payload){
	std::vector<uint8_t> bytes = framer_ns::build_data(arg_payload);

	out.insert(out.end(), bytes.begin(), bytes.end());
}

uint32_t simulated_bootloader::next_chunk_len() const{
	uint32_t sector_bytes = (uint32_t)sector_multiplier * sector_unit;

	return std::min(sector_bytes, announced_size - written);
}

void simulated_bootloader::process(){
	for(;;){
		switch(state){
			case rx_state_e::SILENT:
				bytes_after_silence += in.size();
				in.clear();
				return;

			case rx_state_e::COMMAND:{
				if(in.empty()){
					return;
				}

				if(in[0] == K1_HANDSHAKE_BYTE){
					in.erase(in.begin());
					handshake_probes++;
					if(responds_to_handshake && handshake_probes > ignore_probes){
						out.push_back(K1_HANDSHAKE_BYTE);
					}
					break;
				}

				if(in.size() < 2){
					return;
				}

				uint8_t opcode = in[0];
				uint8_t complement = in[1];
				in.erase(in.begin(), in.begin() + 2);
				if(complement != (uint8_t)~opcode){
					break;
				}
				opcodes.push_back(opcode);

				switch(opcode){
					case K1_OPCODE_VERSION:{
						std::vector<uint8_t> payload(version.begin(), version.end());
						payload.resize(K1_VERSION_LEN, 0x00);
						queue_data(payload);
						if(corrupt_version_checksum){
							out.back() ^= 0x01;
						}
						break;
					}
					case K1_OPCODE_SECTOR_SIZE:
						queue_data(std::vector<uint8_t>(1, sector_multiplier));
						break;
					case K1_OPCODE_UPDATE:
						queue_status(K1_STATUS_ACK);
						state = rx_state_e::SIZE;
						break;
					case K1_OPCODE_APP_START:
						if(!silent_on_app_start){
							queue_status(app_start_status);
						}
						break;
				}
				break;
			}

			case rx_state_e::SIZE:{
				if(in.size() < 5){
					return;
				}

				std::vector<uint8_t> frame_bytes(in.begin(), in.begin() + 5);
				in.erase(in.begin(), in.begin() + 5);
				if(checksum_ns::compute(frame_bytes.data(), 4) != frame_bytes[4]){
					queue_status(K1_STATUS_BAD_CRC);
					state = rx_state_e::COMMAND;
					break;
				}

				announced_size = (uint32_t)frame_bytes[0] | ((uint32_t)frame_bytes[1] << 8) | ((uint32_t)frame_bytes[2] << 16) | ((uint32_t)frame_bytes[3] << 24);
				written = 0;
				queue_status(K1_STATUS_ACK);
				state = rx_state_e::CHUNK;
				break;
			}

			case rx_state_e::CHUNK:{
				uint32_t len = next_chunk_len();
				int index;

				if(in.size() < len + 1){
					return;
				}

				std::vector<uint8_t> chunk(in.begin(), in.begin() + len);
				uint8_t crc = in[len];
				in.erase(in.begin(), in.begin() + len + 1);

				index = (int)chunks.size() + 1;
				wire_log.push_back("tx chunk " + std::to_string(index));
				if(checksum_ns::compute(chunk) != crc || index == bad_crc_at_chunk){
					queue_status(K1_STATUS_BAD_CRC);
					break;
				}

				chunks.push_back(chunk);
				written += len;

				if(index == silent_after_chunk){
					state = rx_state_e::SILENT;
					break;
				}

				if(index == corrupt_ack_at_chunk){
					out.push_back(K1_STATUS_ACK);
					out.push_back(0x00);
				}else if(written == announced_size){
					queue_status(last_status_complete ? K1_STATUS_COMPLETE : K1_STATUS_ACK);
					state = rx_state_e::COMMAND;
				}else{
					queue_status(K1_STATUS_ACK);
				}
				break;
			}
		}
	}
}
