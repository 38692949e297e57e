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

	Byte level link to the MCU.

	The transport does no retrying of its own.  A receive either returns
	exactly the number of bytes asked for or throws APP_ERROR_TIMEOUT_ID, any
	other failure propagates to the caller untouched.
*/

#ifndef TRANSPORT_H
#define TRANSPORT_H

#include "serial_com.h"
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

class transport{
public:
	virtual ~transport(){
	}

	virtual void open(const std::string &arg_port, uint32_t arg_baud_rate) = 0;
	virtual void close() = 0;
	virtual bool is_open() const = 0;
	virtual void send(const std::vector<uint8_t> &arg_bytes) = 0;
	virtual std::vector<uint8_t> receive(size_t arg_len, uint32_t arg_timeout_ms) = 0;
	// Drops anything already received but not read
	virtual void discard_input() = 0;
};

// Transport over a local serial port, 8N1 without flow control
class serial_transport : public transport{
protected:
	serial_com serial;
	uint32_t timeout_ms;

public:
	serial_transport();

	void open(const std::string &arg_port, uint32_t arg_baud_rate) override;
	void close() override;
	bool is_open() const override;
	void send(const std::vector<uint8_t> &arg_bytes) override;
	std::vector<uint8_t> receive(size_t arg_len, uint32_t arg_timeout_ms) override;
	void discard_input() override;
};

#endif
