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

#include <iostream>
#include <sstream>
#include <stdlib.h>
#include <string>

#include "logger.hpp"

void report_assert_msg(const std::string& m);

//An exception we intend to recover from.
struct validation_failure_exception
{
	explicit validation_failure_exception(const std::string& m);
	std::string msg;
};

//If we should try to recover on asserts
bool throw_validation_failure_on_assert();

void output_backtrace();

enum AssertOptions { SilenceAsserts = 1 };

//Scope to make us recover
class assert_recover_scope
{
	int options_;
public:
	explicit assert_recover_scope(int options=0);
	~assert_recover_scope();
};

#define ABORT()		do { exit(1); } while(0)

// Shared tail of every assert: throw if a scope asked for it, otherwise
// log, dump the stack and die.
#define ASSERT_FAIL_WITH_(_msg)									\
	do {														\
		const std::string _m(_msg);								\
		if(throw_validation_failure_on_assert()) {				\
			throw validation_failure_exception(_m);				\
		} else {												\
			log_internal(SDL_LOG_PRIORITY_CRITICAL, _m);		\
			output_backtrace();									\
			report_assert_msg(_m);								\
			ABORT();											\
		}														\
	} while(0)

#define ASSERT_CMP_(a, b, cmp, name, fail_op)					\
	do { if(!((a) cmp (b))) {									\
		std::ostringstream _s;									\
		_s << __SHORT_FORM_OF_FILE__ << ":" << __LINE__ << " ASSERT " name " FAILED: " << #a << " " fail_op " " << #b << ": " << (a) << " " fail_op " " << (b) << "\n"; \
		ASSERT_FAIL_WITH_(_s.str());							\
	} } while(0)

//various asserts of standard "equality" tests. Example usage:
//ASSERT_NE(x, y);
#define ASSERT_EQ(a,b) ASSERT_CMP_(a, b, ==, "EQ", "!=")
#define ASSERT_NE(a,b) ASSERT_CMP_(a, b, !=, "NE", "==")
#define ASSERT_GE(a,b) ASSERT_CMP_(a, b, >=, "GE", "<")
#define ASSERT_LE(a,b) ASSERT_CMP_(a, b, <=, "LE", ">")
#define ASSERT_GT(a,b) ASSERT_CMP_(a, b, >, "GT", "<=")
#define ASSERT_LT(a,b) ASSERT_CMP_(a, b, <, "LT", ">=")

//for custom logging.  Example usage:
//ASSERT_LOG(x != y, "x not equal to y. Value of x: " << x << ", y: " << y);
#define ASSERT_LOG(_a,_b)										\
	do { if( !(_a) ) {											\
		std::ostringstream _s;									\
		_s << __SHORT_FORM_OF_FILE__ << ":" << __LINE__ << " ASSERTION FAILED: " << _b << "\n";	\
		ASSERT_FAIL_WITH_(_s.str());							\
	} } while(0)

#define ASSERT_FATAL(_b)										\
	do {														\
		std::ostringstream _s;									\
		_s << __SHORT_FORM_OF_FILE__ << ":" << __LINE__ << " ASSERTION FAILED: " << _b << "\n"; \
		if(throw_validation_failure_on_assert()) {				\
			throw validation_failure_exception(_s.str());		\
		}														\
		log_internal(SDL_LOG_PRIORITY_CRITICAL, _s.str());		\
		output_backtrace();										\
		report_assert_msg(_s.str());							\
		ABORT();												\
	} while(0)
