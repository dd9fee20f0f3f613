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
#include <map>
#include <sstream>

#include <boost/lexical_cast.hpp>

#include "asserts.hpp"
#include "preferences.hpp"
#include "unit_test.hpp"

namespace preferences
{
	namespace
	{
		struct RegisteredSetting
		{
			RegisteredSetting() : int_value(nullptr), bool_value(nullptr), string_value(nullptr), helpstring(nullptr)
			{}

			std::string write() const {
				std::ostringstream s;
				if(int_value) {
					s << *int_value;
				} else if(string_value) {
					s << *string_value;
				} else if(bool_value) {
					s << (*bool_value ? "true" : "false");
				}
				return s.str();
			}

			void read(const std::string& name, const std::string& value) {
				if(string_value) {
					*string_value = value;
				} else if(int_value) {
					try {
						*int_value = boost::lexical_cast<int>(value);
					} catch(boost::bad_lexical_cast&) {
						ASSERT_LOG(false, "Invalid value for numeric parameter " << name << ": " << value);
					}
				} else if(bool_value) {
					if(value == "yes" || value == "true") {
						*bool_value = true;
					} else if(value == "no" || value == "false") {
						*bool_value = false;
					} else {
						ASSERT_LOG(false, "Invalid value for boolean parameter " << name << ". Must be true or false");
					}
				} else {
					ASSERT_LOG(false, "Error making sense of preference type " << name);
				}
			}

			int* int_value;
			bool* bool_value;
			std::string* string_value;
			const char* helpstring;
		};

		std::map<std::string, RegisteredSetting>& g_registered_settings() {
			static std::map<std::string, RegisteredSetting> instance;
			return instance;
		}

		RegisteredSetting& new_setting(const std::string& id, const char* helpstring)
		{
			ASSERT_LOG(g_registered_settings().count(id) == 0, "Multiple definition of registered setting: " << id);
			RegisteredSetting& setting = g_registered_settings()[id];
			setting.helpstring = helpstring;
			return setting;
		}

		RegisteredSetting& existing_setting(const std::string& id)
		{
			auto it = g_registered_settings().find(id);
			ASSERT_LOG(it != g_registered_settings().end(), "Unknown preference setting: " << id);
			return it->second;
		}
	}

	int register_string_setting(const std::string& id, std::string* value, const char* helpstring)
	{
		new_setting(id, helpstring).string_value = value;
		return static_cast<int>(g_registered_settings().size());
	}

	int register_int_setting(const std::string& id, int* value, const char* helpstring)
	{
		new_setting(id, helpstring).int_value = value;
		return static_cast<int>(g_registered_settings().size());
	}

	int register_bool_setting(const std::string& id, bool* value, const char* helpstring)
	{
		new_setting(id, helpstring).bool_value = value;
		return static_cast<int>(g_registered_settings().size());
	}

	std::string get_registered_helpstring()
	{
		std::string return_value;
		for(const auto& i : g_registered_settings()) {
			std::ostringstream s;
			s << "      --";
			if(i.second.bool_value) {
				s << "[no-]";
			}

			s << i.first;
			if(i.second.bool_value) {
				s << " (default: " << i.second.write() << ")";
			} else {
				s << "=" << i.second.write();
			}

			std::string result = s.str();
			while(result.size() < 32) {
				result += " ";
			}

			if(i.second.helpstring) {
				result += i.second.helpstring;
			}
			result += "\n";
			return_value += result;
		}

		return return_value;
	}

	bool parse_arg(const std::string& arg)
	{
		if(arg.size() <= 2 || arg[0] != '-' || arg[1] != '-') {
			return false;
		}

		auto equal = std::find(arg.begin(), arg.end(), '=');
		if(equal != arg.end()) {
			std::string base_name(arg.begin()+2, equal);
			std::replace(base_name.begin(), base_name.end(), '-', '_');
			auto it = g_registered_settings().find(base_name);
			if(it == g_registered_settings().end()) {
				return false;
			}
			it->second.read(base_name, std::string(equal+1, arg.end()));
			return true;
		}

		auto begin = arg.begin() + 2;
		bool value = true;
		if(arg.size() > 5 && std::equal(begin, begin+3, "no-")) {
			value = false;
			begin += 3;
		}

		std::string base_name(begin, arg.end());
		std::replace(base_name.begin(), base_name.end(), '-', '_');
		auto it = g_registered_settings().find(base_name);
		if(it == g_registered_settings().end()) {
			return false;
		}
		ASSERT_LOG(it->second.bool_value, "Must provide value for option: " << base_name);
		*it->second.bool_value = value;
		return true;
	}

	void set_setting(const std::string& id, const std::string& value)
	{
		existing_setting(id).read(id, value);
	}

	std::string get_setting(const std::string& id)
	{
		return existing_setting(id).write();
	}

	setting_scope::setting_scope(const std::string& id, const std::string& value)
		: id_(id), old_value_(get_setting(id))
	{
		set_setting(id_, value);
	}

	setting_scope::~setting_scope()
	{
		set_setting(id_, old_value_);
	}
}

namespace
{
	PREF_INT(preferences_test_int, 7, "Setting exercised by the preferences unit test");
	PREF_BOOL(preferences_test_flag, false, "Setting exercised by the preferences unit test");
}

UNIT_TEST(preferences_parse_arg)
{
	CHECK_EQ(preferences::parse_arg("--preferences-test-int=12"), true);
	CHECK_EQ(g_preferences_test_int, 12);
	CHECK_EQ(preferences::parse_arg("--preferences_test_flag"), true);
	CHECK_EQ(g_preferences_test_flag, true);
	CHECK_EQ(preferences::parse_arg("--no-preferences-test-flag"), true);
	CHECK_EQ(g_preferences_test_flag, false);
	CHECK_EQ(preferences::parse_arg("--preferences-test-flag=yes"), true);
	CHECK_EQ(g_preferences_test_flag, true);
	CHECK_EQ(preferences::parse_arg("--not-a-setting=3"), false);
	CHECK_EQ(preferences::parse_arg("tests"), false);

	CHECK_ASSERTS(preferences::parse_arg("--preferences-test-flag=maybe"), "a non-boolean value for a flag must be rejected");
	CHECK_ASSERTS(preferences::parse_arg("--preferences-test-int=seven"), "a non-numeric value for an integer must be rejected");
	CHECK_EQ(g_preferences_test_int, 12);

	g_preferences_test_int = 7;
	g_preferences_test_flag = false;
}

UNIT_TEST(preferences_setting_scope)
{
	{
		preferences::setting_scope scope("preferences_test_int", "40");
		CHECK_EQ(g_preferences_test_int, 40);
		CHECK_EQ(preferences::get_setting("preferences_test_int"), "40");
	}
	CHECK_EQ(g_preferences_test_int, 7);
	CHECK(preferences::get_registered_helpstring().find("--preferences_test_int=7") != std::string::npos,
		preferences::get_registered_helpstring());
}
