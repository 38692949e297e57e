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

	One open connection to the MCU.

	The session owns the transport: it is opened when the session is created
	and closed when the session is destroyed, on every exit path.  A session
	is not thread safe, callers sharing one between threads must serialize
	access to it.
*/

#ifndef SESSION_H
#define SESSION_H

#include "k1_macro.h"
#include "transport.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#define K1_BOOTLOADER_BAUD     115200
#define K1_APP_BAUD            230400
// The bootloader only listens for a handshake this long after power up,
// then it starts the application.  This is fixed by the MCU firmware, a
// longer window does not help once the bootloader has stopped listening.
#define K1_HANDSHAKE_WINDOW_MS 15000
#define K1_HANDSHAKE_POLL_MS   500
#define K1_RESPONSE_TIMEOUT_MS 2000
// Bytes per sector reported by the sector size query
#define K1_SECTOR_UNIT         1024
// Time for the MCU to reset after the bootloader request
#define K1_REBOOT_SETTLE_MS    1000

#define SESSION_STATE_LIST(item) \
	item(SESSION_DISCONNECTED, "disconnected") \
	item(SESSION_HANDSHAKE_IN_FLIGHT, "handshake") \
	item(SESSION_READY, "ready") \
	item(SESSION_QUERYING_VERSION, "version query") \
	item(SESSION_UPDATING, "update") \
	item(SESSION_STARTING, "application start") \
	item(SESSION_REQUESTING_BOOTLOADER, "bootloader request")

CREATE_ENUM(session_state_e, SESSION_STATE_LIST)

class session_state_string{
public:
	INIT_INLINE_CLASS_ARRAY_ENUM(static constexpr char const *, names, SESSION_STATE_LIST)
};

class session_cfg{
public:
	std::string port;
	uint32_t link_baud_rate;  // Bootloader line
	uint32_t app_baud_rate;  // Running application line, only used to request the bootloader
	uint32_t handshake_window_ms;
	uint32_t handshake_poll_ms;
	uint32_t response_timeout_ms;
	uint32_t sector_unit;
	uint32_t reboot_settle_ms;
	bool verbose;
	const std::atomic<bool> *cancel;  // Optional, set by the caller to abort a wait

	session_cfg() :
		link_baud_rate(K1_BOOTLOADER_BAUD),
		app_baud_rate(K1_APP_BAUD),
		handshake_window_ms(K1_HANDSHAKE_WINDOW_MS),
		handshake_poll_ms(K1_HANDSHAKE_POLL_MS),
		response_timeout_ms(K1_RESPONSE_TIMEOUT_MS),
		sector_unit(K1_SECTOR_UNIT),
		reboot_settle_ms(K1_REBOOT_SETTLE_MS),
		verbose(false),
		cancel(nullptr){
	}
};

class session{
protected:
	std::unique_ptr<transport> link;
	session_cfg cfg;
	session_state_e state;
	bool handshake_confirmed;

	friend class session_controller;

public:
	session(std::unique_ptr<transport> arg_link, const session_cfg &arg_cfg);
	~session();
	session(const session&) = delete;
	session& operator=(const session&) = delete;

	void close();
	bool is_open() const;
	session_state_e get_state() const;
	bool is_handshake_confirmed() const;
	const session_cfg& get_cfg() const;
};

#endif
