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

#include "session.h"
#include "app_error_string.h"
#include "k1_exception.h"

session::session(std::unique_ptr<transport> arg_link, const session_cfg &arg_cfg) :
	link(std::move(arg_link)),
	cfg(arg_cfg),
	state(SESSION_DISCONNECTED),
	handshake_confirmed(false){
	if(!link){
		throw k1_exception(__func__, K1_EXCEPT_SRC_VEN, APP_ERROR_PARAM_ID, app_error_string::messages[APP_ERROR_PARAM_ID], "no transport");
	}

	link->open(cfg.port, cfg.link_baud_rate);
}

session::~session(){
	close();
}

void session::close(){
	link->close();
	state = SESSION_DISCONNECTED;
	handshake_confirmed = false;
}

bool session::is_open() const{
	return link->is_open();
}

session_state_e session::get_state() const{
	return state;
}

bool session::is_handshake_confirmed() const{
	return handshake_confirmed;
}

const session_cfg& session::get_cfg() const{
	return cfg;
}
