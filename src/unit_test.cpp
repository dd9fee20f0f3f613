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

#include <cstdint>
#include <map>
#include <sstream>

#include "asserts.hpp"
#include "preferences.hpp"
#include "profile_timer.hpp"
#include "unit_test.hpp"

namespace
{
	PREF_BOOL(run_failing_unit_tests, false, "Also run unit tests whose name ends in FAILS");
	PREF_INT(benchmark_min_ticks, 1000, "Minimum milliseconds a benchmark is run for");
}

namespace test
{
	namespace
	{
		typedef std::map<std::string, UnitTest> TestMap;
		TestMap& get_test_map()
		{
			static TestMap map;
			return map;
		}

		typedef std::map<std::string, BenchmarkTest> BenchmarkMap;
		BenchmarkMap& get_benchmark_map()
		{
			static BenchmarkMap map;
			return map;
		}

		typedef std::map<std::string, UtilityProgram> UtilityMap;
		UtilityMap& get_utility_map()
		{
			static UtilityMap map;
			return map;
		}
	}

	int register_test(const std::string& name, UnitTest test)
	{
		get_test_map()[name] = test;
		return 0;
	}

	int register_utility(const std::string& name, UtilityProgram utility)
	{
		get_utility_map()[name] = utility;
		return 0;
	}

	std::vector<std::string> get_utility_names()
	{
		std::vector<std::string> res;
		for(const auto& u : get_utility_map()) {
			res.push_back(u.first);
		}
		return res;
	}

	bool run_tests(const std::vector<std::string>* tests)
	{
		const int start_time = profile::get_tick_time();
		std::vector<std::string> all_tests;
		if(!tests) {
			for(const auto& t : get_test_map()) {
				all_tests.push_back(t.first);
			}
			tests = &all_tests;
		}

		int npass = 0;
		std::vector<std::string> failed;
		for(const std::string& test : *tests) {
			if(!g_run_failing_unit_tests && test.size() > 5 && std::string(test.end()-5, test.end()) == "FAILS") {
				continue;
			}

			auto it = get_test_map().find(test);
			if(it == get_test_map().end()) {
				LOG_ERROR("TEST " << test << " NOT FOUND.");
				failed.push_back(test);
				continue;
			}

			const int test_start = profile::get_tick_time();
			try {
				it->second();
				LOG_INFO("TEST " << test << " PASSED");
				LOG_DEBUG("TEST " << test << " TOOK " << (profile::get_tick_time() - test_start) << "ms");
				++npass;
			} catch(FailureException&) {
				LOG_ERROR("TEST " << test << " FAILED!!");
				failed.push_back(test);
			} catch(validation_failure_exception& e) {
				LOG_ERROR("TEST " << test << " FAILED WITH UNEXPECTED ASSERT: " << e.msg);
				failed.push_back(test);
			}
		}

		if(!failed.empty()) {
			std::ostringstream names;
			for(const std::string& name : failed) {
				names << " " << name;
			}
			LOG_INFO(npass << " TESTS PASSED, " << failed.size() << " TESTS FAILED:" << names.str());
			return false;
		}
		LOG_INFO("ALL " << npass << " TESTS PASSED IN " << (profile::get_tick_time() - start_time) << "ms");
		return true;
	}

	int register_benchmark(const std::string& name, BenchmarkTest test)
	{
		get_benchmark_map()[name] = test;
		return 0;
	}

	std::string run_benchmark(const std::string& name, BenchmarkTest fn)
	{
		//run it once without counting it to let any initialization code be run.
		fn(1);

		LOG_INFO("RUNNING BENCHMARK " << name << "...");
		for(int64_t nruns = 10; ; nruns *= 10) {
			const int start_time = profile::get_tick_time();
			fn(static_cast<int>(nruns));
			const int64_t time_taken_ms = profile::get_tick_time() - start_time;
			if(time_taken_ms >= g_benchmark_min_ticks || nruns > 1000000000) {
				int64_t time_taken = time_taken_ms*1000000LL;
				int time_taken_units = 0;
				int64_t time_taken_per_iter = time_taken/nruns;
				int time_taken_per_iter_units = 0;
				while(time_taken > 10000 && time_taken_units < 3) {
					time_taken /= 1000;
					time_taken_units++;
				}

				while(time_taken_per_iter > 10000 && time_taken_per_iter_units < 3) {
					time_taken_per_iter /= 1000;
					time_taken_per_iter_units++;
				}

				const char* units[] = {"ns", "us", "ms", "s"};
				std::ostringstream s;
				s << "BENCH " << name << ": " << nruns << " iterations, " << time_taken_per_iter << units[time_taken_per_iter_units] << "/iteration; total, " << time_taken << units[time_taken_units];
				std::string res = s.str();
				LOG_INFO(res);
				return res;
			}
		}
	}

	void run_benchmarks(const std::vector<std::string>* benchmarks)
	{
		std::vector<std::string> all_benchmarks;
		if(!benchmarks) {
			for(const auto& b : get_benchmark_map()) {
				all_benchmarks.push_back(b.first);
			}
			benchmarks = &all_benchmarks;
		}

		for(const std::string& benchmark : *benchmarks) {
			auto it = get_benchmark_map().find(benchmark);
			if(it == get_benchmark_map().end()) {
				LOG_INFO("BENCHMARK " << benchmark << " NOT FOUND.");
				continue;
			}
			run_benchmark(benchmark, it->second);
		}
	}

	void run_utility(const std::string& utility_name, const std::vector<std::string>& arg)
	{
		auto it = get_utility_map().find(utility_name);
		if(it == get_utility_map().end()) {
			std::string known;
			for(const auto& name : get_utility_names()) {
				known += name + " ";
			}
			ASSERT_LOG(false, "Unknown utility: '" << utility_name << "'; known utilities: " << known);
		}
		it->second(arg);
	}
}
