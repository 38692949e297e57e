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

	Drives the bootloader protocol over a session, one operation at a time.

	States:
		disconnected -> handshake -> ready -> {version query | update |
		application start | bootloader request} -> ready

	Every operation other than the handshake and the bootloader request needs
	a confirmed handshake.  Any failure closes the link and leaves the session
	disconnected, a new handshake reopens it.  Nothing is retried here apart
	from the handshake probe, which repeats until the listening window of the
	bootloader has passed; retry policy belongs to the caller.

	Failure kinds (k1_exception codes):
		handshake          APP_ERROR_HANDSHAKE_TIMEOUT_ID, APP_ERROR_CANCELLED_ID
		version query      APP_ERROR_TIMEOUT_ID, APP_ERROR_FRAMING_ID, APP_ERROR_CHECKSUM_ID
		update             APP_ERROR_PROTOCOL_ID before anything was written
		                   (sector size query), APP_ERROR_UPDATE_FAILED_ID after,
		                   APP_ERROR_UPDATE_CANCELLED_ID once writing has started
		application start  APP_ERROR_APP_START_FAILED_ID
		bootloader request APP_ERROR_PROTOCOL_ID
	Calling an operation in the wrong state is APP_ERROR_PROTOCOL_ID.
*/

#ifndef SESSION_CONTROLLER_H
#define SESSION_CONTROLLER_H

#include "session.h"
#include "framer.h"
#include "firmware_chunker.h"
#include "app_log.h"
#include "k1_exception.h"
#include <array>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

// Understood by a running application built with serial bootloader request support
#define K1_BOOTLOADER_REQUEST "~ \x1c Request Serial Bootloader!! ~"

class version_info{
protected:
	std::array<uint8_t, K1_VERSION_LEN> raw;

public:
	version_info();
	explicit version_info(const std::vector<uint8_t> &arg_payload);

	const std::array<uint8_t, K1_VERSION_LEN>& get_raw() const;
	// Combined hardware and firmware version as printable text
	std::string to_string() const;
	// The bootloader sends all zeros when the application area fails its integrity check
	bool has_application() const;
};

class transfer_progress{
public:
	uint32_t bytes_sent;
	uint32_t total_bytes;
	uint32_t chunk_index;
	uint32_t chunk_count;
	uint8_t last_status;

	transfer_progress() :
		bytes_sent(0),
		total_bytes(0),
		chunk_index(0),
		chunk_count(0),
		last_status(0){
	}
};

typedef std::function<void(const transfer_progress&)> progress_callback_t;

class session_controller{
protected:
	session *sess;
	app_log log;
	progress_callback_t progress_cb;

	void require_ready(const char *arg_op);
	void enter(session_state_e arg_state);
	void disconnect();
	void check_cancel();
	void sleep_ms(uint32_t arg_ms);
	void send(const std::vector<uint8_t> &arg_bytes);
	std::vector<uint8_t> receive(size_t arg_len, uint32_t arg_timeout_ms);
	void send_command(uint8_t arg_opcode);
	uint8_t receive_status();
	void expect_ack(const char *arg_stage);
	void run_handshake();
	uint32_t query_sector_size();
	void transfer_image(const firmware_image &arg_image, firmware_chunker &arg_chunker);

public:
	session_controller(session &arg_session, std::ostream &arg_out);

	void set_progress_callback(progress_callback_t arg_cb);

	void handshake();
	version_info query_version();
	void update_firmware(const firmware_image &arg_image);
	void start_application();
	version_info request_bootloader();

	static std::string status_to_string(uint8_t arg_status);
	// True for failures after which the flash content is undefined and the MCU needs a power cycle
	static bool leaves_flash_undefined(const k1_exception &arg_ex);
};

#endif
