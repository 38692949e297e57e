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

#include "firmware_chunker.h"
#include "checksum.h"
#include "app_error_string.h"
#include "k1_exception.h"
#include "my_file.h"
#include <fmt/format.h>
#include <limits>
#include <utility>

firmware_image::firmware_image(std::vector<uint8_t> arg_data) :
	data(std::move(arg_data)),
	file_checksum(0xff){
	if(data.empty()){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_IMAGE_EMPTY_ID, app_error_string::messages[APP_ERROR_IMAGE_EMPTY_ID], "");
	}

	// The update request carries the length in 4 bytes
	if((uint64_t)data.size() > std::numeric_limits<uint32_t>::max()){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_IMAGE_TOO_BIG_ID, app_error_string::messages[APP_ERROR_IMAGE_TOO_BIG_ID], fmt::format("{} bytes", data.size()));
	}

	file_checksum = checksum_ns::compute(data);
}

firmware_image firmware_image::load(const std::string &arg_path){
	cl_my_file in_file;
	uint64_t size;
	size_t bytes_read;
	std::vector<uint8_t> buf;

	in_file.open_file(arg_path, "rb");
	size = in_file.get_size();
	if(size > std::numeric_limits<uint32_t>::max()){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_IMAGE_TOO_BIG_ID, app_error_string::messages[APP_ERROR_IMAGE_TOO_BIG_ID], fmt::format("{}: {} bytes", arg_path, size));
	}

	buf.resize((size_t)size);
	if(size > 0){
		in_file.read_file(buf.data(), buf.size(), bytes_read);
		if(bytes_read != buf.size()){
			throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_IMAGE_EMPTY_ID, app_error_string::messages[APP_ERROR_IMAGE_EMPTY_ID], fmt::format(fmt::runtime(app_error_string::messages[APP_ERROR_XFER_INFO_ID]), buf.size(), bytes_read));
		}
	}

	return firmware_image(std::move(buf));
}

uint32_t firmware_image::size() const{
	return (uint32_t)data.size();
}

const std::vector<uint8_t>& firmware_image::get_data() const{
	return data;
}

uint8_t firmware_image::checksum() const{
	return file_checksum;
}

std::string firmware_image::embedded_version() const{
	std::string str;

	for(size_t i = K1_IMAGE_VERSION_OFFSET; i < K1_IMAGE_VERSION_OFFSET + K1_IMAGE_VERSION_LEN && i < data.size(); i++){
		if(data[i] != 0x00){
			str += (char)data[i];
		}
	}

	return str;
}

firmware_chunker::firmware_chunker(const firmware_image &arg_image, uint32_t arg_sector_size) :
	image(&arg_image),
	sector_size(arg_sector_size),
	chunk_count(0),
	next_index(0){
	if(sector_size == 0){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PROTOCOL_ID, app_error_string::messages[APP_ERROR_PROTOCOL_ID], "sector size must be positive");
	}

	chunk_count = image->size() / sector_size + ((image->size() % sector_size) ? 1 : 0);
}

uint32_t firmware_chunker::count() const{
	return chunk_count;
}

uint32_t firmware_chunker::get_sector_size() const{
	return sector_size;
}

firmware_chunk firmware_chunker::at(uint32_t arg_index) const{
	firmware_chunk chunk;
	uint32_t remaining;

	if(arg_index >= chunk_count){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PARAM_ID, app_error_string::messages[APP_ERROR_PARAM_ID], fmt::format("chunk {} of {}", arg_index, chunk_count));
	}

	chunk.index = arg_index;
	chunk.offset = arg_index * sector_size;
	remaining = image->size() - chunk.offset;
	chunk.len = (remaining > sector_size) ? sector_size : remaining;
	chunk.data = image->get_data().data() + chunk.offset;
	chunk.checksum = checksum_ns::compute(chunk.data, chunk.len);

	return chunk;
}

bool firmware_chunker::next(firmware_chunk &arg_chunk){
	if(next_index >= chunk_count){
		return false;
	}

	arg_chunk = at(next_index);
	next_index++;

	return true;
}

void firmware_chunker::restart(){
	next_index = 0;
}
