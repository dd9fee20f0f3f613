/*
	Copyright (C) 2003-2013 by David White <davewx7@gmail.com>
	
	This software is provided 'as-is', without any express or implied
	warranty. In no event will the authors be held liable for any damages
	arising from the use of this software.

	Permission is granted to anyone to use this software for any purpose,
	including commercial applications, and to alter it and redistribute it
	freely, subject to the following restrictions:

	   1. The origin of this software must not be misrepresented; you must not
	   claim that you wrote the original software. If you use this software
	   in a product, an acknowledgement in the product documentation would be
	   appreciated but is not required.

	   2. Altered source versions must be plainly marked as such, and must not be
	   misrepresented as being the original software.

	   3. This notice may not be removed or altered from any source
	   distribution.
*/

#include <algorithm>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "SDL.h"

#include "asserts.hpp"
#include "logger.hpp"
#include "preferences.hpp"
#include "unit_test.hpp"

namespace
{
	void print_help(const std::string& argv0)
	{
		std::cout << "Usage: " << argv0 << " [OPTIONS]\n" <<
			"\n" <<
			"Developer options:\n" <<
			"      --benchmarks             runs all the engine's benchmarks\n" <<
			"      --benchmarks=NAME        runs a single named benchmark code\n" <<
			"      --log-level=LEVEL        sets the log level to one of verbose, debug,\n" <<
			"                                 info, warn, error or critical\n" <<
			"      --tests                  runs the unit tests and exits\n" <<
			"      --tests=\"foo,bar,baz\"  runs the named unit tests and exits\n" <<
			"      --utility=NAME           runs the specified UTILITY( NAME ) code block,\n" <<
			"                                 such as board_dump, closest_targets or\n" <<
			"                                 skill_catalog, with the specified arguments\n" <<
			"\n" <<
			"Settings:\n" <<
			preferences::get_registered_helpstring();
	}

	std::vector<std::string> split_list(const std::string& value)
	{
		std::string list = value;
		if(list.size() >= 2 && list.front() == '"' && list.back() == '"') {
			list = list.substr(1, list.size() - 2);
		}

		std::vector<std::string> res;
		boost::split(res, list, boost::is_any_of(","), boost::token_compress_on);
		res.erase(std::remove(res.begin(), res.end(), std::string()), res.end());
		return res;
	}
}

int main(int argcount, char* argvec[])
{
	SDL_LogSetPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_INFO);

	std::vector<std::string> argv;
	for(int i = 1; i < argcount; ++i) {
		argv.emplace_back(argvec[i]);
	}

	std::string utility_program;
	std::vector<std::string> util_args;
	std::unique_ptr<std::vector<std::string>> test_names;
	std::unique_ptr<std::vector<std::string>> benchmarks_list;
	bool run_tests = argv.empty();
	bool run_benchmarks = false;

	for(size_t n = 0; n < argv.size(); ++n) {
		const std::string& arg = argv[n];
		std::string arg_name, arg_value;
		std::string::const_iterator equal = std::find(arg.begin(), arg.end(), '=');
		if(equal != arg.end()) {
			arg_name = std::string(arg.begin(), equal);
			arg_value = std::string(equal+1, arg.end());
		}

		if(arg_name == "--utility") {
			utility_program = arg_value;
			util_args.assign(argv.begin() + n + 1, argv.end());
			break;
		} else if(arg == "--benchmarks") {
			run_benchmarks = true;
		} else if(arg_name == "--benchmarks") {
			run_benchmarks = true;
			benchmarks_list.reset(new std::vector<std::string>(split_list(arg_value)));
		} else if(arg == "--tests") {
			run_tests = true;
		} else if(arg_name == "--tests") {
			run_tests = true;
			test_names.reset(new std::vector<std::string>(split_list(arg_value)));
		} else if(arg_name == "--log-level") {
			if(!set_log_level(arg_value)) {
				LOG_ERROR("unknown log level: '" << arg_value << "'");
				return -1;
			}
		} else if(arg == "--help" || arg == "-h") {
			print_help(std::string(argvec[0]));
			return 0;
		} else if(!preferences::parse_arg(arg)) {
			print_help(std::string(argvec[0]));
			LOG_ERROR("unrecognized arg: '" << arg << "'");
			return -1;
		}
	}

	if(!utility_program.empty()) {
		test::run_utility(utility_program, util_args);
		return 0;
	}

	if(run_benchmarks) {
		test::run_benchmarks(benchmarks_list.get());
		return 0;
	}

	if(run_tests && !test::run_tests(test_names.get())) {
		return -1;
	}
	return 0;
}
