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

#include <csignal>
#include <cstdlib>
#include <memory>
#include <vector>

#ifndef _MSC_VER
#include <cxxabi.h>
#include <execinfo.h>
#endif

#include "asserts.hpp"
#include "preferences.hpp"

namespace
{
	PREF_BOOL(die_on_assert, false, "Exit on the first failed assert, even inside recoverable scopes");
	PREF_BOOL(signal_on_assert, false, "Raise SIGABRT after a fatal assert so a debugger can stop there");
	PREF_INT(backtrace_depth, 64, "Maximum number of frames printed for a failed assert");

	int silence_on_assert = 0;
	int throw_validation_failure = 0;

#ifndef _MSC_VER
	// Turns "module(mangled+0x15) [0xaddr]" into "module : demangled+0x15".
	std::string demangle_frame(const char* frame)
	{
		std::string line(frame);
		const auto open = line.find('(');
		const auto plus = line.find('+', open == std::string::npos ? 0 : open);
		const auto close = line.find(')', plus == std::string::npos ? 0 : plus);
		if(open == std::string::npos || plus == std::string::npos || close == std::string::npos || plus <= open + 1) {
			return line;
		}

		const std::string mangled = line.substr(open + 1, plus - open - 1);
		int status = 0;
		std::unique_ptr<char, void(*)(void*)> name(abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status), std::free);
		if(status != 0 || !name) {
			return line;
		}
		return line.substr(0, open) + " : " + name.get() + line.substr(plus, close - plus);
	}
#endif
}

void report_assert_msg(const std::string& m)
{
	SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "Assertion failed\n\n%s\n", m.c_str());
	if(g_signal_on_assert) {
		raise(SIGABRT);			/* To continue from here in GDB: "signal 0". */
	}
}

validation_failure_exception::validation_failure_exception(const std::string& m)
  : msg(m)
{
	if(!silence_on_assert) {
		LOG_ERROR("ASSERT FAIL: " << m);
		output_backtrace();
	}
}

bool throw_validation_failure_on_assert()
{
	return throw_validation_failure != 0 && !g_die_on_assert;
}

assert_recover_scope::assert_recover_scope(int options) : options_(options)
{
	if(options_&static_cast<int>(SilenceAsserts)) {
		silence_on_assert++;
	}
	throw_validation_failure++;
}

assert_recover_scope::~assert_recover_scope()
{
	if(options_&SilenceAsserts) {
		silence_on_assert--;
	}
	throw_validation_failure--;
}

void output_backtrace()
{
#ifndef _MSC_VER
	std::vector<void*> frames(g_backtrace_depth > 0 ? g_backtrace_depth : 1);
	const int nframes = backtrace(frames.data(), static_cast<int>(frames.size()));
	if(nframes <= 1) {
		SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "%s\n", "  <empty, possibly corrupt>");
		return;
	}

	std::unique_ptr<char*, void(*)(void*)> symbols(backtrace_symbols(frames.data(), nframes), std::free);
	if(!symbols) {
		return;
	}

	// skip the first frame, it is this function.
	for(int i = 1; i < nframes; ++i) {
		SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "  %s\n", demangle_frame(symbols.get()[i]).c_str());
	}
#endif
	SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "%s\n", "---");
}
