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

#include "session_controller.h"
#include "checksum.h"
#include "to_string.h"
#include "app_error_string.h"
#include "k1_exception.h"
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <thread>

// ============
// Version info
// ============

version_info::version_info(){
	raw.fill(0x00);
}

version_info::version_info(const std::vector<uint8_t> &arg_payload){
	if(arg_payload.size() != K1_VERSION_LEN){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PROTOCOL_ID, app_error_string::messages[APP_ERROR_PROTOCOL_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_XFER_INFO_ID]), K1_VERSION_LEN, arg_payload.size()));
	}
	std::copy(arg_payload.begin(), arg_payload.end(), raw.begin());
}

const std::array<uint8_t, K1_VERSION_LEN>& version_info::get_raw() const{
	return raw;
}

std::string version_info::to_string() const{
	return string_utils_ns::to_printable(raw.data(), raw.size());
}

bool version_info::has_application() const{
	for(uint8_t b : raw){
		if(b != 0x00){
			return true;
		}
	}

	return false;
}

// ==================
// Session controller
// ==================

session_controller::session_controller(session &arg_session, std::ostream &arg_out) :
	sess(&arg_session),
	log(arg_out, arg_session.get_cfg().verbose){
}

void session_controller::set_progress_callback(progress_callback_t arg_cb){
	progress_cb = arg_cb;
}

bool session_controller::leaves_flash_undefined(const k1_exception &arg_ex){
	return arg_ex.is(APP_ERROR_UPDATE_FAILED_ID) || arg_ex.is(APP_ERROR_UPDATE_CANCELLED_ID);
}

std::string session_controller::status_to_string(uint8_t arg_status){
	switch(arg_status){
		case K1_STATUS_ACK: return "ok";
		case K1_STATUS_COMPLETE: return "image complete";
		case K1_STATUS_BAD_CRC: return "chunk checksum rejected by the MCU";
		case K1_STATUS_WRITE_ERROR: return "flash write error";
	}

	return "unknown status";
}

void session_controller::require_ready(const char *arg_op){
	if(sess->state != SESSION_READY || !sess->handshake_confirmed){
		throw k1_exception(arg_op, K1_EXCEPT_SRC_VEN, APP_ERROR_PROTOCOL_ID, app_error_string::messages[APP_ERROR_PROTOCOL_ID], fmt::format("{} needs a confirmed handshake, session is {}", arg_op, session_state_string::names[sess->state]));
	}
}

void session_controller::enter(session_state_e arg_state){
	log.debug(fmt::format("[{} -> {}]", session_state_string::names[sess->state], session_state_string::names[arg_state]));
	sess->state = arg_state;
}

void session_controller::disconnect(){
	log.debug(fmt::format("[{} -> {}] closing {}", session_state_string::names[sess->state], session_state_string::names[SESSION_DISCONNECTED], sess->cfg.port));
	sess->close();
}

void session_controller::check_cancel(){
	if(sess->cfg.cancel != nullptr && sess->cfg.cancel->load()){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_CANCELLED_ID, app_error_string::messages[APP_ERROR_CANCELLED_ID], session_state_string::names[sess->state]);
	}
}

void session_controller::sleep_ms(uint32_t arg_ms){
	std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(arg_ms);

	// Sleep in slices so a cancel request is not held up
	while(std::chrono::steady_clock::now() < deadline){
		check_cancel();
		std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(deadline - std::chrono::steady_clock::now(), std::chrono::milliseconds(50)));
	}
}

void session_controller::send(const std::vector<uint8_t> &arg_bytes){
	log.debug_bytes("tx", arg_bytes);
	sess->link->send(arg_bytes);
}

std::vector<uint8_t> session_controller::receive(size_t arg_len, uint32_t arg_timeout_ms){
	std::vector<uint8_t> rx = sess->link->receive(arg_len, arg_timeout_ms);

	log.debug_bytes("rx", rx);

	return rx;
}

void session_controller::send_command(uint8_t arg_opcode){
	send(framer_ns::encode(framer_ns::build_request(arg_opcode)));
}

// Status answers are "status, ~status" which is the opcode frame form
uint8_t session_controller::receive_status(){
	return framer_ns::parse_response(receive(K1_ACK_FRAME_LEN, sess->cfg.response_timeout_ms)).opcode;
}

void session_controller::expect_ack(const char *arg_stage){
	uint8_t status = receive_status();

	if(status != K1_STATUS_ACK){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PROTOCOL_ID, app_error_string::messages[APP_ERROR_PROTOCOL_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_STATUS_INFO_ID]), arg_stage, status) + " " + status_to_string(status));
	}
}

// =========
// Handshake
// =========

void session_controller::run_handshake(){
	const session_cfg &cfg = sess->cfg;
	std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(cfg.handshake_window_ms);
	const std::vector<uint8_t> probe(1, K1_HANDSHAKE_BYTE);
	std::vector<uint8_t> rx;
	int64_t left_ms;
	uint32_t wait_ms;
	uint32_t probes = 0;

	sess->link->discard_input();
	log.info(fmt::format("Waiting for bootloader handshake on {} ({} ms window)", cfg.port, cfg.handshake_window_ms));

	do{
		check_cancel();

		left_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
		wait_ms = (left_ms < (int64_t)cfg.handshake_poll_ms) ? (uint32_t)std::max<int64_t>(left_ms, 1) : cfg.handshake_poll_ms;

		send(probe);
		probes++;

		try{
			rx = receive(1, wait_ms);
		}catch(k1_exception &ex){
			if(!ex.is(APP_ERROR_TIMEOUT_ID)){
				throw;
			}
			// No echo yet, probe again
			continue;
		}

		if(rx[0] == K1_HANDSHAKE_BYTE){
			// A late echo of an earlier probe must not be taken as the next response
			sess->link->discard_input();
			log.debug(fmt::format("Handshake echo after {} probe(s)", probes));
			return;
		}

		log.debug(fmt::format("Ignoring unexpected byte 0x{:02X}", rx[0]));
	}while(std::chrono::steady_clock::now() < deadline);

	check_cancel();
	throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_HANDSHAKE_TIMEOUT_ID, app_error_string::messages[APP_ERROR_HANDSHAKE_TIMEOUT_ID], fmt::format("no echo to {} probe(s) within {} ms on {}", probes, cfg.handshake_window_ms, cfg.port));
}

void session_controller::handshake(){
	const session_cfg &cfg = sess->cfg;

	// Performed at most once per connection
	if(sess->state == SESSION_READY && sess->handshake_confirmed){
		log.debug("Handshake already confirmed");
		return;
	}

	if(sess->state != SESSION_DISCONNECTED){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PROTOCOL_ID, app_error_string::messages[APP_ERROR_PROTOCOL_ID], fmt::format("handshake requested during {}", session_state_string::names[sess->state]));
	}

	try{
		if(!sess->link->is_open()){
			sess->link->open(cfg.port, cfg.link_baud_rate);
		}
		enter(SESSION_HANDSHAKE_IN_FLIGHT);
		run_handshake();
	}catch(k1_exception &){
		disconnect();
		throw;
	}

	sess->handshake_confirmed = true;
	enter(SESSION_READY);
	log.info("Handshake confirmed");
}

// =============
// Version query
// =============

version_info session_controller::query_version(){
	std::vector<uint8_t> payload;

	require_ready(__func__);
	enter(SESSION_QUERYING_VERSION);

	try{
		send_command(K1_OPCODE_VERSION);
		payload = framer_ns::parse_data(receive(K1_VERSION_LEN + 1, sess->cfg.response_timeout_ms));
	}catch(k1_exception &){
		disconnect();
		throw;
	}

	version_info ver(payload);
	enter(SESSION_READY);
	log.debug("Version received: " + ver.to_string());

	return ver;
}

// ======
// Update
// ======

// Sector size in bytes
uint32_t session_controller::query_sector_size(){
	std::vector<uint8_t> payload;
	uint32_t sector_size;

	send_command(K1_OPCODE_SECTOR_SIZE);
	payload = framer_ns::parse_data(receive(2, sess->cfg.response_timeout_ms));

	sector_size = (uint32_t)payload[0] * sess->cfg.sector_unit;
	if(sector_size == 0){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PROTOCOL_ID, app_error_string::messages[APP_ERROR_PROTOCOL_ID], fmt::format("sector size {} x {} bytes is not positive", payload[0], sess->cfg.sector_unit));
	}
	log.debug(fmt::format("Sector size {} x {} = {} bytes", payload[0], sess->cfg.sector_unit, sector_size));

	return sector_size;
}

void session_controller::transfer_image(const firmware_image &arg_image, firmware_chunker &arg_chunker){
	transfer_progress progress;
	firmware_chunk chunk;
	std::vector<uint8_t> size_field(4);
	std::vector<uint8_t> txbuf;
	std::string stage = "update request";
	uint32_t size = arg_image.size();
	bool is_last;
	bool flash_started = false;

	progress.total_bytes = size;
	progress.chunk_count = arg_chunker.count();

	try{
		send_command(K1_OPCODE_UPDATE);
		expect_ack("update request");
		// From here on the flash content is undefined until the image is complete
		flash_started = true;

		// Image length, little endian
		stage = "image size";
		size_field[0] = (uint8_t)(size & 0xff);
		size_field[1] = (uint8_t)((size >> 8) & 0xff);
		size_field[2] = (uint8_t)((size >> 16) & 0xff);
		size_field[3] = (uint8_t)((size >> 24) & 0xff);
		send(framer_ns::build_data(size_field));
		expect_ack("image size");

		// One chunk in flight, the next one goes only after the previous is acknowledged
		arg_chunker.restart();
		while(arg_chunker.next(chunk)){
			check_cancel();

			stage = fmt::format("chunk {}/{}", chunk.index + 1, progress.chunk_count);
			is_last = (chunk.index + 1 == progress.chunk_count);

			txbuf.assign(chunk.data, chunk.data + chunk.len);
			txbuf.push_back(chunk.checksum);
			send(txbuf);

			// Only the last chunk is answered with the completion status
			progress.last_status = receive_status();
			if(progress.last_status != (is_last ? K1_STATUS_COMPLETE : K1_STATUS_ACK)){
				throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PROTOCOL_ID, app_error_string::messages[APP_ERROR_PROTOCOL_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_STATUS_INFO_ID]), stage, progress.last_status) + " " + status_to_string(progress.last_status));
			}
			if(is_last){
				log.debug("Bootloader reports image complete");
			}

			progress.bytes_sent += chunk.len;
			progress.chunk_index = chunk.index;
			if(progress_cb){
				progress_cb(progress);
			}
		}
	}catch(k1_exception &ex){
		if(ex.is(APP_ERROR_CANCELLED_ID)){
			if(!flash_started){
				throw;
			}
			throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_UPDATE_CANCELLED_ID, app_error_string::messages[APP_ERROR_UPDATE_CANCELLED_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_STAGE_INFO_ID]), stage, ex.get_error()));
		}
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_UPDATE_FAILED_ID, app_error_string::messages[APP_ERROR_UPDATE_FAILED_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_STAGE_INFO_ID]), stage, ex.get_error()));
	}
}

void session_controller::update_firmware(const firmware_image &arg_image){
	uint32_t sector_size;

	require_ready(__func__);
	enter(SESSION_UPDATING);

	// Nothing has been written yet, report as a protocol error
	try{
		sector_size = query_sector_size();
	}catch(k1_exception &ex){
		disconnect();
		if(ex.is(APP_ERROR_PROTOCOL_ID)){
			throw;
		}
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PROTOCOL_ID, app_error_string::messages[APP_ERROR_PROTOCOL_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_STAGE_INFO_ID]), "sector size query", ex.get_error()));
	}

	try{
		firmware_chunker chunker(arg_image, sector_size);

		log.info(fmt::format("Updating firmware: {} bytes, {} chunk(s) of {} bytes, checksum 0x{:02X}", arg_image.size(), chunker.count(), sector_size, arg_image.checksum()));
		transfer_image(arg_image, chunker);
	}catch(k1_exception &){
		disconnect();
		throw;
	}

	enter(SESSION_READY);
	log.info("Firmware update completed");
}

// =================
// Application start
// =================

void session_controller::start_application(){
	uint8_t status;

	require_ready(__func__);
	enter(SESSION_STARTING);

	try{
		send_command(K1_OPCODE_APP_START);
		status = receive_status();
		if(status != K1_STATUS_ACK){
			throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PROTOCOL_ID, app_error_string::messages[APP_ERROR_PROTOCOL_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_STATUS_INFO_ID]), "application start", status) + " " + status_to_string(status));
		}
	}catch(k1_exception &ex){
		disconnect();
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_APP_START_FAILED_ID, app_error_string::messages[APP_ERROR_APP_START_FAILED_ID], ex.get_error());
	}

	enter(SESSION_READY);
	log.info("Application started");
}

// ==================
// Bootloader request
// ==================

version_info session_controller::request_bootloader(){
	const session_cfg &cfg = sess->cfg;
	const std::string request(K1_BOOTLOADER_REQUEST);
	version_info ver;

	// A confirmed handshake means the bootloader is already running
	if(sess->state == SESSION_READY && sess->handshake_confirmed){
		ver = query_version();
		log.info("Already in bootloader mode: " + ver.to_string());
		return ver;
	}

	if(sess->state != SESSION_DISCONNECTED){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PROTOCOL_ID, app_error_string::messages[APP_ERROR_PROTOCOL_ID], fmt::format("bootloader request during {}", session_state_string::names[sess->state]));
	}

	enter(SESSION_REQUESTING_BOOTLOADER);
	try{
		log.info(fmt::format("Requesting serial bootloader on {}:{}", cfg.port, cfg.app_baud_rate));
		sess->link->close();
		sess->link->open(cfg.port, cfg.app_baud_rate);
		send(std::vector<uint8_t>(request.begin(), request.end()));
		sess->link->close();

		// The MCU resets into the bootloader, which opens a new handshake window
		sleep_ms(cfg.reboot_settle_ms);
		sess->link->open(cfg.port, cfg.link_baud_rate);
		enter(SESSION_DISCONNECTED);

		handshake();
		ver = query_version();
	}catch(k1_exception &ex){
		disconnect();
		if(ex.is(APP_ERROR_CANCELLED_ID)){
			throw;
		}
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PROTOCOL_ID, app_error_string::messages[APP_ERROR_PROTOCOL_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_STAGE_INFO_ID]), "bootloader mode not confirmed", ex.get_error()));
	}

	log.info("Entered bootloader mode: " + ver.to_string());

	return ver;
}
