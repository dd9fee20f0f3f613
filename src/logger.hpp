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

#pragma once

#include <sstream>
#include <cstring>
#include <string>

#include "SDL.h"

#if defined(_MSC_VER)
#define __SHORT_FORM_OF_FILE__	\
	(strrchr(__FILE__,'\\')		\
	? strrchr(__FILE__,'\\')+1	\
	: __FILE__					\
	)
#else
#define __SHORT_FORM_OF_FILE__	\
	(strrchr(__FILE__,'/')		\
	? strrchr(__FILE__,'/')+1	\
	: __FILE__					\
	)
#endif

void log_internal(SDL_LogPriority priority, const std::string& s);

// Accepts verbose, debug, info, warn, error or critical. Returns false for
// anything else and leaves the current level untouched.
bool set_log_level(const std::string& level);

#define LOG_AT(_priority, _a)														\
	do {																			\
		std::ostringstream _s;														\
		_s << __SHORT_FORM_OF_FILE__ << ":" << __LINE__ << " : " << _a;				\
		log_internal(_priority, _s.str());											\
	} while(0)

#define LOG_VERBOSE(_a) LOG_AT(SDL_LOG_PRIORITY_VERBOSE, _a)
#define LOG_DEBUG(_a) LOG_AT(SDL_LOG_PRIORITY_DEBUG, _a)
#define LOG_INFO(_a) LOG_AT(SDL_LOG_PRIORITY_INFO, _a)
#define LOG_WARN(_a) LOG_AT(SDL_LOG_PRIORITY_WARN, _a)
#define LOG_ERROR(_a) LOG_AT(SDL_LOG_PRIORITY_ERROR, _a)
#define LOG_CRITICAL(_a) LOG_AT(SDL_LOG_PRIORITY_CRITICAL, _a)
