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

#include <string>

namespace preferences
{
	int register_string_setting(const std::string& id, std::string* value, const char* helpstring);
	int register_int_setting(const std::string& id, int* value, const char* helpstring);
	int register_bool_setting(const std::string& id, bool* value, const char* helpstring);

	std::string get_registered_helpstring();

	// Handles --name=value and --[no-]name for any registered setting.
	// Returns false if the argument names no registered setting.
	bool parse_arg(const std::string& arg);

	// Sets a registered setting from its textual value, as parse_arg would.
	void set_setting(const std::string& id, const std::string& value);
	std::string get_setting(const std::string& id);

#define PREF_BOOL(id, default_value, helpstring) \
	bool g_##id = default_value; \
	int g_##id##_dummy = preferences::register_bool_setting(#id, &g_##id, helpstring)

#define PREF_INT(id, default_value, helpstring) \
	int g_##id = default_value; \
	int g_##id##_dummy = preferences::register_int_setting(#id, &g_##id, helpstring)

#define PREF_STRING(id, default_value, helpstring) \
	std::string g_##id = default_value; \
	int g_##id##_dummy = preferences::register_string_setting(#id, &g_##id, helpstring)

	// Restores a setting to its previous value when leaving scope. Used by
	// tests that need a temporary configuration.
	class setting_scope
	{
	public:
		setting_scope(const std::string& id, const std::string& value);
		~setting_scope();
	private:
		std::string id_;
		std::string old_value_;
	};
}
