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

#include <map>

#include "logger.hpp"

namespace
{
	const std::string::size_type max_log_packet_length = 3072;

	const std::map<std::string, SDL_LogPriority>& log_level_names()
	{
		static const std::map<std::string, SDL_LogPriority> res = {
			{ "verbose", SDL_LOG_PRIORITY_VERBOSE },
			{ "debug", SDL_LOG_PRIORITY_DEBUG },
			{ "info", SDL_LOG_PRIORITY_INFO },
			{ "warn", SDL_LOG_PRIORITY_WARN },
			{ "error", SDL_LOG_PRIORITY_ERROR },
			{ "critical", SDL_LOG_PRIORITY_CRITICAL },
		};
		return res;
	}
}

void log_internal(SDL_LogPriority priority, const std::string& str)
{
	std::string s(str);
	// break up long strings into something about max_log_packet_length in size.
	while(s.size() > max_log_packet_length) {
		SDL_LogMessage(SDL_LOG_CATEGORY_APPLICATION, priority, "%s\n", s.substr(0, max_log_packet_length).c_str());
		s = s.substr(max_log_packet_length);
	}
	if(!s.empty()) {
		SDL_LogMessage(SDL_LOG_CATEGORY_APPLICATION, priority, "%s\n", s.c_str());
	}
}

bool set_log_level(const std::string& level)
{
	auto it = log_level_names().find(level);
	if(it == log_level_names().end()) {
		return false;
	}
	SDL_LogSetPriority(SDL_LOG_CATEGORY_APPLICATION, it->second);
	return true;
}
