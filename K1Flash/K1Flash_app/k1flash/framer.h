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

	Framing of bootloader requests and responses.

	Two kinds of frame exist on the wire:

	Opcode frame:  opcode, ~opcode [, payload..., checksum(opcode, payload)]
		With an empty payload the complement byte is itself the checksum over
		the opcode, so the frame is exactly two bytes.  Requests and the one
		byte status acknowledgments use this form.

	Data frame:  payload..., checksum(payload)
		Carries the update size, firmware chunks and the version and sector
		size answers.

	Responses are untrusted: parsing checks the complement byte first (a
	framing error means garbled bytes) and then the checksum (a checksum error
	means the framing is right but the content is corrupted).
*/

#ifndef FRAMER_H
#define FRAMER_H

#include <cstdint>
#include <cstddef>
#include <vector>

// Bootloader opcodes
#define K1_OPCODE_VERSION     0x00
#define K1_OPCODE_UPDATE      0x01
#define K1_OPCODE_APP_START   0x02
#define K1_OPCODE_SECTOR_SIZE 0x03

// Single byte handshake probe, echoed back by a listening bootloader
#define K1_HANDSHAKE_BYTE     0x75

// Status codes
#define K1_STATUS_ACK         0x75  // Accepted / chunk written
#define K1_STATUS_COMPLETE    0x20  // Whole image written
#define K1_STATUS_BAD_CRC     0x1f  // Chunk checksum mismatch on the MCU side
#define K1_STATUS_WRITE_ERROR 0x21  // RAM to flash write failed

#define K1_VERSION_LEN        25
#define K1_ACK_FRAME_LEN      2

class frame{
public:
	uint8_t opcode;
	uint8_t complement;
	std::vector<uint8_t> payload;
	uint8_t checksum;

	frame() :
		opcode(0),
		complement(0xff),
		checksum(0xff){
	}
};

namespace framer_ns{
	frame build_request(uint8_t arg_opcode, const std::vector<uint8_t> &arg_payload = std::vector<uint8_t>());
	std::vector<uint8_t> encode(const frame &arg_frame);
	frame parse_response(const std::vector<uint8_t> &arg_bytes);

	// Data frames, no opcode
	std::vector<uint8_t> build_data(const uint8_t *arg_buf, size_t arg_len);
	std::vector<uint8_t> build_data(const std::vector<uint8_t> &arg_payload);
	std::vector<uint8_t> parse_data(const std::vector<uint8_t> &arg_bytes);
}

#endif
