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

	Application error codes and messages.  The id doubles as the process exit
	code, so the list starts with the success entry.
*/

#ifndef APP_ERROR_STRING_H
#define APP_ERROR_STRING_H

#include "k1_macro.h"

// Application error message list
#define APP_ERROR_LIST(item) \
	item(APP_ERROR_OK_ID, "Success") \
	item(APP_ERROR_CONNECTION_ID, "Cannot open the serial port") \
	item(APP_ERROR_HANDSHAKE_TIMEOUT_ID, "Handshake timed out, the bootloader did not echo within its listening window") \
	item(APP_ERROR_FRAMING_ID, "Framing error, complement byte mismatch") \
	item(APP_ERROR_CHECKSUM_ID, "Checksum error") \
	item(APP_ERROR_TIMEOUT_ID, "Timed out waiting for a response") \
	item(APP_ERROR_PROTOCOL_ID, "Protocol error") \
	item(APP_ERROR_UPDATE_FAILED_ID, "Firmware update failed") \
	item(APP_ERROR_APP_START_FAILED_ID, "Application start failed") \
	item(APP_ERROR_TX_FAIL_ID, "Transmit failed") \
	item(APP_ERROR_CANCELLED_ID, "Cancelled by user") \
	item(APP_ERROR_UPDATE_CANCELLED_ID, "Firmware update cancelled by user") \
	item(APP_ERROR_IMAGE_EMPTY_ID, "Firmware image is empty") \
	item(APP_ERROR_IMAGE_TOO_BIG_ID, "Firmware image is too big") \
	item(APP_ERROR_PARAM_ID, "Invalid parameter") \
	item(APP_ERROR_XFER_INFO_ID, "Expected {} bytes, transferred {}") \
	item(APP_ERROR_CHECKSUM_INFO_ID, "Expected 0x{:02X}, received 0x{:02X}") \
	item(APP_ERROR_COMPLEMENT_INFO_ID, "Opcode 0x{:02X}, complement 0x{:02X}") \
	item(APP_ERROR_STATUS_INFO_ID, "{}: unexpected status 0x{:02X}") \
	item(APP_ERROR_STAGE_INFO_ID, "{}: {}")

// Create enum from error message list
CREATE_ENUM(app_error_e, APP_ERROR_LIST)

class app_error_string{
public:
	INIT_INLINE_CLASS_ARRAY_ENUM(static constexpr char const *, messages, APP_ERROR_LIST)
};

#endif
