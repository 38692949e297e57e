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

#include "transport.h"
#include "app_error_string.h"
#include "k1_exception.h"
#include <fmt/format.h>
#include <chrono>

serial_transport::serial_transport() :
	timeout_ms(0){
}

void serial_transport::open(const std::string &arg_port, uint32_t arg_baud_rate){
	serial.open_handle(arg_port);
	try{
		serial.set_params(arg_baud_rate, 8, NOPARITY, ONESTOPBIT, false);
		timeout_ms = 0;
		serial.purge();  // Clear buffer
	}catch(k1_exception &ex){
		serial.close_handle();
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_CONNECTION_ID, app_error_string::messages[APP_ERROR_CONNECTION_ID], arg_port + ": " + ex.get_error());
	}
}

void serial_transport::close(){
	serial.close_handle();
}

bool serial_transport::is_open() const{
	return serial.is_open();
}

void serial_transport::send(const std::vector<uint8_t> &arg_bytes){
	const uint8_t *txbuf_p = arg_bytes.data();
	uint32_t remaining = (uint32_t)arg_bytes.size();
	SERIAL_COM_LEN_T xferredlen;

	if(!serial.is_open()){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_CONNECTION_ID, app_error_string::messages[APP_ERROR_CONNECTION_ID], "port is closed");
	}

	while(remaining){
		xferredlen = serial.write_port(txbuf_p, remaining);
		if(xferredlen <= 0){
			throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_TX_FAIL_ID, app_error_string::messages[APP_ERROR_TX_FAIL_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_XFER_INFO_ID]), arg_bytes.size(), arg_bytes.size() - remaining));
		}
		txbuf_p += xferredlen;
		remaining -= (uint32_t)xferredlen;
	}
}

std::vector<uint8_t> serial_transport::receive(size_t arg_len, uint32_t arg_timeout_ms){
	std::vector<uint8_t> rxbuf(arg_len);
	size_t received = 0;
	SERIAL_COM_LEN_T xferredlen;
	std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(arg_timeout_ms);
	int64_t left_ms;

	if(!serial.is_open()){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_CONNECTION_ID, app_error_string::messages[APP_ERROR_CONNECTION_ID], "port is closed");
	}

	while(received < arg_len){
		left_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
		if(left_ms <= 0){
			break;
		}

		if((uint32_t)left_ms != timeout_ms){
			timeout_ms = (uint32_t)left_ms;
			serial.set_timeout(timeout_ms);
		}

		xferredlen = serial.read_port(rxbuf.data() + received, (uint32_t)(arg_len - received));
		received += (size_t)xferredlen;
	}

	if(received != arg_len){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_TIMEOUT_ID, app_error_string::messages[APP_ERROR_TIMEOUT_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_XFER_INFO_ID]), arg_len, received));
	}

	return rxbuf;
}

void serial_transport::discard_input(){
	serial.purge();
}
