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

#include "serial_com.h"
#include "app_error_string.h"
#include "k1_exception.h"
#include <cstring>

#if defined(WIN32) || defined(WIN64)

// =======
// Windows
// =======

serial_com::serial_com() :
	fd(INVALID_HANDLE_VALUE){
	memset(&dcb, 0, sizeof(dcb));
	memset(&timeouts, 0, sizeof(timeouts));
}

serial_com::~serial_com(){
	close_handle();
}

bool serial_com::is_open() const{
	return fd != INVALID_HANDLE_VALUE;
}

void serial_com::close_handle(){
	if(fd != INVALID_HANDLE_VALUE){
		CloseHandle(fd);
		fd = INVALID_HANDLE_VALUE;
	}
}

void serial_com::open_handle(std::string arg_path){
	std::string dev_path = arg_path;

	close_handle();

	// COM10 and above need the device namespace prefix
	if(dev_path.compare(0, 4, "\\\\.\\") != 0){
		dev_path = "\\\\.\\" + dev_path;
	}

	fd = CreateFileA(dev_path.c_str(), GENERIC_READ | GENERIC_WRITE, 0, NULL, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, NULL);
	if(fd == INVALID_HANDLE_VALUE){
		k1_exception ex = k1_exception::get_os_last_error(__func__, arg_path);
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_CONNECTION_ID, app_error_string::messages[APP_ERROR_CONNECTION_ID], arg_path + ": " + ex.get_msg());
	}
	path = arg_path;
}

void serial_com::set_params(uint32_t baud_rate, uint8_t byte_size, uint8_t parity, uint8_t stop_bits, bool rtscts_en){
	dcb.DCBlength = sizeof(DCB);
	if(!GetCommState(fd, &dcb)){
		throw k1_exception::get_os_last_error(__func__, path);
	}

	dcb.BaudRate = baud_rate;
	dcb.ByteSize = byte_size;
	dcb.Parity = parity;
	dcb.StopBits = stop_bits;
	dcb.fBinary = TRUE;
	dcb.fParity = (parity != NOPARITY) ? TRUE : FALSE;
	dcb.fOutxCtsFlow = rtscts_en ? TRUE : FALSE;
	dcb.fRtsControl = rtscts_en ? RTS_CONTROL_HANDSHAKE : RTS_CONTROL_ENABLE;
	dcb.fOutxDsrFlow = FALSE;
	dcb.fDtrControl = DTR_CONTROL_ENABLE;
	dcb.fOutX = FALSE;
	dcb.fInX = FALSE;

	if(!SetCommState(fd, &dcb)){
		throw k1_exception::get_os_last_error(__func__, path);
	}
}

void serial_com::set_timeout(uint32_t timeout_ms){
	timeouts.ReadIntervalTimeout = 0;
	timeouts.ReadTotalTimeoutMultiplier = 0;
	timeouts.ReadTotalTimeoutConstant = timeout_ms;
	timeouts.WriteTotalTimeoutMultiplier = 0;
	timeouts.WriteTotalTimeoutConstant = timeout_ms;

	if(!SetCommTimeouts(fd, &timeouts)){
		throw k1_exception::get_os_last_error(__func__, path);
	}
}

DWORD serial_com::read_port(void *buf, uint32_t len){
	DWORD bytes_read = 0;

	if(!ReadFile(fd, buf, len, &bytes_read, NULL)){
		throw k1_exception::get_os_last_error(__func__, path);
	}

	return bytes_read;
}

DWORD serial_com::write_port(const void *buf, uint32_t len){
	DWORD bytes_written = 0;

	if(!WriteFile(fd, buf, len, &bytes_written, NULL)){
		throw k1_exception::get_os_last_error(__func__, path);
	}

	return bytes_written;
}

void serial_com::purge(){
	if(!PurgeComm(fd, PURGE_RXABORT | PURGE_RXCLEAR | PURGE_TXABORT | PURGE_TXCLEAR)){
		throw k1_exception::get_os_last_error(__func__, path);
	}
}

#else

// =====
// Linux
// =====

serial_com::serial_com() :
	fd(-1){
}

serial_com::~serial_com(){
	close_handle();
}

bool serial_com::is_open() const{
	return fd >= 0;
}

void serial_com::close_handle(){
	if(fd >= 0){
		close(fd);
		fd = -1;
	}
}

void serial_com::open_handle(std::string arg_path){
	close_handle();

	fd = open(arg_path.c_str(), O_RDWR | O_NOCTTY);
	if(fd < 0){
		int err = errno;
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_CONNECTION_ID, app_error_string::messages[APP_ERROR_CONNECTION_ID], arg_path + ": " + strerror(err));
	}
	path = arg_path;
}

speed_t serial_com::baud_rate_to_code(uint32_t baud_rate){
	switch(baud_rate){
		case 1200: return B1200;
		case 2400: return B2400;
		case 4800: return B4800;
		case 9600: return B9600;
		case 19200: return B19200;
		case 38400: return B38400;
		case 57600: return B57600;
		case 115200: return B115200;
		case 230400: return B230400;
		case 460800: return B460800;
		case 921600: return B921600;
	}

	throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PARAM_ID, app_error_string::messages[APP_ERROR_PARAM_ID], "unsupported baud rate " + std::to_string(baud_rate));
}

tcflag_t serial_com::byte_size_to_code(uint8_t byte_size){
	switch(byte_size){
		case 5: return CS5;
		case 6: return CS6;
		case 7: return CS7;
		case 8: return CS8;
	}

	throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PARAM_ID, app_error_string::messages[APP_ERROR_PARAM_ID], "unsupported byte size " + std::to_string(byte_size));
}

void serial_com::set_params(uint32_t baud_rate, uint8_t byte_size, uint8_t parity, uint8_t stop_bits, bool rtscts_en){
	struct termios tty;
	speed_t speed = baud_rate_to_code(baud_rate);

	if(tcgetattr(fd, &tty) != 0){
		throw k1_exception::get_os_last_error(__func__, path);
	}

	// Raw mode, no echo, no line processing, no software flow control
	tty.c_iflag &= ~(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON | IXOFF | IXANY);
	tty.c_oflag &= ~OPOST;
	tty.c_lflag &= ~(ECHO | ECHOE | ECHONL | ICANON | ISIG | IEXTEN);

	tty.c_cflag &= ~(CSIZE | PARENB | PARODD | CMSPAR | CSTOPB | CRTSCTS);
	tty.c_cflag |= byte_size_to_code(byte_size) | CREAD | CLOCAL;

	switch(parity){
		case ODDPARITY: tty.c_cflag |= PARENB | PARODD; break;
		case EVENPARITY: tty.c_cflag |= PARENB; break;
		case MARKPARITY: tty.c_cflag |= PARENB | PARODD | CMSPAR; break;
		case SPACEPARITY: tty.c_cflag |= PARENB | CMSPAR; break;
	}

	// 1.5 stop bits is not available, treat as 2
	if(stop_bits != ONESTOPBIT){
		tty.c_cflag |= CSTOPB;
	}

	if(rtscts_en){
		tty.c_cflag |= CRTSCTS;
	}

	cfsetispeed(&tty, speed);
	cfsetospeed(&tty, speed);

	if(tcsetattr(fd, TCSANOW, &tty) != 0){
		throw k1_exception::get_os_last_error(__func__, path);
	}
}

// Timeout is in 100ms units under Linux, max 25.5s
void serial_com::set_timeout(uint32_t timeout_ms){
	struct termios tty;
	uint32_t deciseconds = (timeout_ms + 99) / 100;

	if(deciseconds == 0){
		deciseconds = 1;
	}else if(deciseconds > 255){
		deciseconds = 255;
	}

	if(tcgetattr(fd, &tty) != 0){
		throw k1_exception::get_os_last_error(__func__, path);
	}

	tty.c_cc[VMIN] = 0;
	tty.c_cc[VTIME] = (cc_t)deciseconds;

	if(tcsetattr(fd, TCSANOW, &tty) != 0){
		throw k1_exception::get_os_last_error(__func__, path);
	}
}

void serial_com::purge(){
	if(tcflush(fd, TCIOFLUSH) != 0){
		throw k1_exception::get_os_last_error(__func__, path);
	}
}

ssize_t serial_com::read_port(void *buf, uint32_t len){
	ssize_t n = read(fd, buf, len);

	if(n < 0){
		// Interrupted by a signal, e.g. Ctrl-C, report nothing read
		if(errno == EINTR){
			return 0;
		}
		throw k1_exception::get_os_last_error(__func__, path);
	}

	return n;
}

ssize_t serial_com::write_port(const void *buf, uint32_t len){
	ssize_t n = write(fd, buf, len);

	if(n < 0){
		if(errno == EINTR){
			return 0;
		}
		throw k1_exception::get_os_last_error(__func__, path);
	}

	// Wait until the bytes have left the UART
	if(tcdrain(fd) != 0 && errno != EINTR){
		throw k1_exception::get_os_last_error(__func__, path);
	}

	return n;
}

#endif
