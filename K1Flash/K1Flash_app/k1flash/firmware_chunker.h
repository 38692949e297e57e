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

	Firmware image and its division into sector sized chunks.

	Chunk boundaries depend only on the image length and the sector size, no
	padding is added so the last chunk may be short.  The bootloader writes
	flash sequentially, so chunks are produced strictly in order; the
	sequence can be restarted from the first chunk but never resumed.
*/

#ifndef FIRMWARE_CHUNKER_H
#define FIRMWARE_CHUNKER_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

// Version label embedded in the application image
#define K1_IMAGE_VERSION_OFFSET 0x200
#define K1_IMAGE_VERSION_LEN    16

class firmware_image{
protected:
	std::vector<uint8_t> data;
	uint8_t file_checksum;

public:
	explicit firmware_image(std::vector<uint8_t> arg_data);

	static firmware_image load(const std::string &arg_path);

	uint32_t size() const;
	const std::vector<uint8_t>& get_data() const;
	// Checksum over the whole file
	uint8_t checksum() const;
	// Label stored at K1_IMAGE_VERSION_OFFSET with NUL bytes removed, empty if the image is too short
	std::string embedded_version() const;
};

class firmware_chunk{
public:
	uint32_t index;
	uint32_t offset;
	const uint8_t *data;
	uint32_t len;
	uint8_t checksum;

	firmware_chunk() :
		index(0),
		offset(0),
		data(nullptr),
		len(0),
		checksum(0xff){
	}
};

class firmware_chunker{
protected:
	const firmware_image *image;
	uint32_t sector_size;
	uint32_t chunk_count;
	uint32_t next_index;

public:
	firmware_chunker(const firmware_image &arg_image, uint32_t arg_sector_size);

	uint32_t count() const;
	uint32_t get_sector_size() const;
	firmware_chunk at(uint32_t arg_index) const;
	// Produces the next chunk in order, false when the sequence is exhausted
	bool next(firmware_chunk &arg_chunk);
	void restart();
};

#endif
