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

#include "framer.h"
#include "checksum.h"
#include "app_error_string.h"
#include "k1_exception.h"
#include "gtest/gtest.h"
#include <vector>

namespace {

std::vector<std::vector<uint8_t>> sample_payloads(){
	return {
		{},
		{0x00},
		{0xff},
		{0x12, 0x34},
		{0x00, 0x00, 0x00, 0x00, 0x00},
		{0x75, 0x8a, 0x20, 0x1f, 0x21, 0x01, 0xfe},
		std::vector<uint8_t>(256, 0xa5)
	};
}

int64_t parse_error_code(const std::vector<uint8_t> &arg_bytes){
	try{
		framer_ns::parse_response(arg_bytes);
	}catch(k1_exception &ex){
		return ex.get_code();
	}
	return APP_ERROR_OK_ID;
}

}  // namespace

TEST(FramerTest, OpcodeOnlyRequestsAreTwoBytes){
	EXPECT_EQ((std::vector<uint8_t>{0x00, 0xff}), framer_ns::encode(framer_ns::build_request(K1_OPCODE_VERSION)));
	EXPECT_EQ((std::vector<uint8_t>{0x01, 0xfe}), framer_ns::encode(framer_ns::build_request(K1_OPCODE_UPDATE)));
	EXPECT_EQ((std::vector<uint8_t>{0x02, 0xfd}), framer_ns::encode(framer_ns::build_request(K1_OPCODE_APP_START)));
	EXPECT_EQ((std::vector<uint8_t>{0x03, 0xfc}), framer_ns::encode(framer_ns::build_request(K1_OPCODE_SECTOR_SIZE)));
}

TEST(FramerTest, RequestWithPayloadEndsWithChecksum){
	std::vector<uint8_t> payload{0x10, 0x20};
	std::vector<uint8_t> bytes = framer_ns::encode(framer_ns::build_request(0x05, payload));

	ASSERT_EQ(5u, bytes.size());
	EXPECT_EQ(0x05, bytes[0]);
	EXPECT_EQ(0xfa, bytes[1]);
	EXPECT_EQ(0x10, bytes[2]);
	EXPECT_EQ(0x20, bytes[3]);
	EXPECT_EQ(checksum_ns::compute(0x05, payload), bytes[4]);
}

TEST(FramerTest, ParseRoundTripsBuiltRequests){
	const uint8_t opcodes[] = {0x00, 0x01, 0x02, 0x03, 0x75, 0x80, 0xff};

	for(uint8_t opcode : opcodes){
		for(const std::vector<uint8_t> &payload : sample_payloads()){
			frame built = framer_ns::build_request(opcode, payload);
			frame parsed = framer_ns::parse_response(framer_ns::encode(built));

			EXPECT_EQ(opcode, parsed.opcode);
			EXPECT_EQ((uint8_t)~opcode, parsed.complement);
			EXPECT_EQ(payload, parsed.payload);
			EXPECT_EQ(built.checksum, parsed.checksum);
			EXPECT_EQ(checksum_ns::compute(opcode, payload), parsed.checksum);
		}
	}
}

TEST(FramerTest, AnyFlippedTrailingBitIsDetected){
	for(const std::vector<uint8_t> &payload : sample_payloads()){
		std::vector<uint8_t> bytes = framer_ns::encode(framer_ns::build_request(0x42, payload));
		// Without a payload the trailing byte is the opcode complement
		int64_t expected = payload.empty() ? APP_ERROR_FRAMING_ID : APP_ERROR_CHECKSUM_ID;

		for(int bit = 0; bit < 8; bit++){
			std::vector<uint8_t> corrupted = bytes;
			corrupted.back() ^= (uint8_t)(1 << bit);
			EXPECT_EQ(expected, parse_error_code(corrupted)) << "payload size " << payload.size() << " bit " << bit;
		}
	}
}

TEST(FramerTest, CorruptedPayloadIsChecksumError){
	std::vector<uint8_t> bytes = framer_ns::encode(framer_ns::build_request(0x42, {0x01, 0x02, 0x03}));

	bytes[3] ^= 0x40;
	EXPECT_EQ(APP_ERROR_CHECKSUM_ID, parse_error_code(bytes));
}

TEST(FramerTest, ComplementMismatchIsFramingError){
	EXPECT_EQ(APP_ERROR_FRAMING_ID, parse_error_code({0x75, 0x00}));
	EXPECT_EQ(APP_ERROR_FRAMING_ID, parse_error_code({0x01, 0xff, 0x10, 0xee}));
	for(int bit = 0; bit < 8; bit++){
		std::vector<uint8_t> ack{0x75, 0x8a};
		ack[1] ^= (uint8_t)(1 << bit);
		EXPECT_EQ(APP_ERROR_FRAMING_ID, parse_error_code(ack));
	}
}

TEST(FramerTest, TruncatedResponseIsFramingError){
	EXPECT_EQ(APP_ERROR_FRAMING_ID, parse_error_code({}));
	EXPECT_EQ(APP_ERROR_FRAMING_ID, parse_error_code({0x75}));
}

TEST(FramerTest, AcknowledgmentParsesAsStatus){
	frame f = framer_ns::parse_response({0x75, 0x8a});

	EXPECT_EQ(K1_STATUS_ACK, f.opcode);
	EXPECT_TRUE(f.payload.empty());
	EXPECT_EQ(0x8a, f.checksum);
}

TEST(FramerTest, DataFrameAppendsChecksum){
	std::vector<uint8_t> payload{0x00, 0x0a, 0x00, 0x00};
	std::vector<uint8_t> bytes = framer_ns::build_data(payload);

	ASSERT_EQ(5u, bytes.size());
	EXPECT_EQ(checksum_ns::compute(payload), bytes.back());
	EXPECT_EQ(payload, framer_ns::parse_data(bytes));
}

TEST(FramerTest, DataFrameChecksumMismatchIsRejected){
	std::vector<uint8_t> bytes = framer_ns::build_data(std::vector<uint8_t>(25, 'A'));

	bytes.back() ^= 0x80;
	try{
		framer_ns::parse_data(bytes);
		FAIL() << "corrupted data frame accepted";
	}catch(k1_exception &ex){
		EXPECT_TRUE(ex.is(APP_ERROR_CHECKSUM_ID));
		EXPECT_EQ("parse_data", ex.get_func_name());
	}
}
