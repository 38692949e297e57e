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

#include "cmd_line.h"
#include "app_error_string.h"
#include "k1_exception.h"
#include "gtest/gtest.h"
#include <initializer_list>
#include <string>
#include <vector>

namespace {

// argv style storage for parse_params
class arg_list{
public:
	std::vector<std::string> strs;
	std::vector<char *> ptrs;

	arg_list(std::initializer_list<const char *> arg_args){
		strs.push_back("k1flash");
		for(const char *a : arg_args){
			strs.push_back(a);
		}
		for(std::string &s : strs){
			ptrs.push_back(&s[0]);
		}
	}

	int argc(){
		return (int)ptrs.size();
	}

	char **argv(){
		return ptrs.data();
	}
};

int64_t parse_error(arg_list &arg_args){
	cl_my_params params;

	try{
		parse_params(arg_args.argc(), arg_args.argv(), &params);
	}catch(k1_exception &ex){
		return ex.get_code();
	}
	return APP_ERROR_OK_ID;
}

}  // namespace

TEST(CmdLineTest, DefaultsMatchBootloaderConstants){
	cl_my_params params;

	EXPECT_EQ((uint32_t)K1_APP_BAUD, params.baud_rate);
	EXPECT_EQ((uint32_t)K1_RESPONSE_TIMEOUT_MS, params.timeoutms);
	EXPECT_EQ((uint32_t)K1_HANDSHAKE_WINDOW_MS, params.windowms);
	EXPECT_EQ(0u, params.retries);
	EXPECT_TRUE(params.start_after_update);
	EXPECT_FALSE(params.has_command());
}

TEST(CmdLineTest, ParsesUpdateCommand){
	arg_list args{"path=/dev/ttyUSB0", "update", "file=fw.bin", "start=n", "verbose=y", "retries=2"};
	cl_my_params params;

	parse_params(args.argc(), args.argv(), &params);

	EXPECT_EQ("/dev/ttyUSB0", params.dev_path);
	EXPECT_TRUE(params.do_update);
	EXPECT_FALSE(params.do_start);
	EXPECT_EQ("fw.bin", params.full_file_name);
	EXPECT_FALSE(params.start_after_update);
	EXPECT_TRUE(params.verbose);
	EXPECT_EQ(2u, params.retries);
}

TEST(CmdLineTest, ParsesNumericOptions){
	arg_list args{"path=COM3", "version", "baud=0x38400", "timeout=500", "window=8000"};
	cl_my_params params;

	parse_params(args.argc(), args.argv(), &params);

	EXPECT_TRUE(params.do_version);
	EXPECT_EQ(230400u, params.baud_rate);
	EXPECT_EQ(500u, params.timeoutms);
	EXPECT_EQ(8000u, params.windowms);
}

TEST(CmdLineTest, StartCommandDiffersFromStartOption){
	arg_list args{"path=COM3", "start"};
	cl_my_params params;

	parse_params(args.argc(), args.argv(), &params);

	EXPECT_TRUE(params.do_start);
	EXPECT_TRUE(params.start_after_update);
}

TEST(CmdLineTest, RejectsUnknownParameter){
	arg_list args{"path=COM3", "version", "flash"};

	EXPECT_EQ(APP_ERROR_PARAM_ID, parse_error(args));
}

TEST(CmdLineTest, RejectsTrailingJunkInNumber){
	arg_list args{"path=COM3", "version", "timeout=50ms"};

	EXPECT_EQ(APP_ERROR_PARAM_ID, parse_error(args));
}

TEST(CmdLineTest, RejectsMissingPath){
	arg_list args{"version"};

	EXPECT_EQ(APP_ERROR_PARAM_ID, parse_error(args));
}

TEST(CmdLineTest, RejectsMissingCommand){
	arg_list args{"path=COM3", "verbose=y"};

	EXPECT_EQ(APP_ERROR_PARAM_ID, parse_error(args));
}

TEST(CmdLineTest, RejectsUpdateWithoutFile){
	arg_list args{"path=COM3", "update"};

	EXPECT_EQ(APP_ERROR_PARAM_ID, parse_error(args));
}

TEST(CmdLineTest, BootloaderRequestRunsAlone){
	arg_list alone{"path=COM3", "reqboot"};
	arg_list combined{"path=COM3", "reqboot", "version"};

	EXPECT_EQ(APP_ERROR_OK_ID, parse_error(alone));
	EXPECT_EQ(APP_ERROR_PARAM_ID, parse_error(combined));
}

TEST(CmdLineTest, SessionSettingsFollowParameters){
	arg_list args{"path=/dev/ttyACM1", "version", "baud=115200", "timeout=750", "window=9000", "verbose=y"};
	cl_my_params params;

	parse_params(args.argc(), args.argv(), &params);
	session_cfg cfg = make_session_cfg(&params);

	EXPECT_EQ("/dev/ttyACM1", cfg.port);
	EXPECT_EQ(115200u, cfg.app_baud_rate);
	EXPECT_EQ((uint32_t)K1_BOOTLOADER_BAUD, cfg.link_baud_rate);
	EXPECT_EQ(750u, cfg.response_timeout_ms);
	EXPECT_EQ(9000u, cfg.handshake_window_ms);
	EXPECT_EQ((uint32_t)K1_SECTOR_UNIT, cfg.sector_unit);
	EXPECT_TRUE(cfg.verbose);
	EXPECT_EQ(nullptr, cfg.cancel);
}
