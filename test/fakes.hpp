/*
 * hpcmon - batch scheduler abstraction and job monitor
 * Derived from Nimrod/G Embedded (https://github.com/UQ-RCC/nimrod-embedded)
 *
 * SPDX-License-Identifier: Apache-2.0
 * Copyright (c) 2019 The University of Queensland
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#ifndef _HPCMON_TEST_FAKES_HPP
#define _HPCMON_TEST_FAKES_HPP

#include <cerrno>
#include <deque>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>
#include "scheduler.hpp"

namespace hpcmon::test {

/* Replays canned results in order and records what was asked of it. */
class fake_runner : public command_runner
{
public:
	struct call
	{
		std::vector<std::string> argv;
		std::string input;
	};

	void push(int exit_code, std::string out, std::string err = {}, bool timed_out = false)
	{
		m_results.push_back(command_result{exit_code, std::move(out), std::move(err), timed_out});
	}

	command_result run(const std::vector<std::string>& argv, std::chrono::seconds, std::string_view input = {}) override
	{
		calls.push_back(call{argv, std::string(input)});
		if(m_results.empty())
			throw std::system_error(ENOENT, std::system_category(), argv.empty() ? "" : argv[0]);

		command_result r = std::move(m_results.front());
		m_results.pop_front();
		return r;
	}

	int run_attached(const std::vector<std::string>& argv) override
	{
		calls.push_back(call{argv, {}});
		return attached_exit;
	}

	std::vector<call> calls;
	int attached_exit = 0;

private:
	std::deque<command_result> m_results;
};

/* Scratch directory, removed on destruction. */
class temp_dir
{
public:
	temp_dir()
	{
		std::string tmpl = (fs::temp_directory_path() / "hpcmon-test-XXXXXX").string();
		if(mkdtemp(&tmpl[0]) == nullptr)
			throw make_posix_exception(errno);
		m_path = tmpl;
	}

	~temp_dir()
	{
		std::error_code ec;
		fs::remove_all(m_path, ec);
	}

	temp_dir(const temp_dir&) = delete;
	temp_dir& operator=(const temp_dir&) = delete;

	const fs::path& path() const noexcept { return m_path; }

	/* Drop an executable stub so find_executable() sees it. */
	void add_program(const std::string& name) const
	{
		fs::path p = m_path / name;
		{
			std::ofstream f(p);
			f << "#!/bin/sh\nexit 0\n";
		}
		if(chmod(p.c_str(), 0755) < 0)
			throw make_posix_exception(errno);
	}

private:
	fs::path m_path;
};

/* Set an environment variable for the lifetime of the object. */
class scoped_env
{
public:
	scoped_env(const char *name, const std::optional<std::string>& value) :
		m_name(name)
	{
		if(const char *old = getenv(name))
			m_old = old;

		apply(value);
	}

	~scoped_env()
	{
		apply(m_old);
	}

	scoped_env(const scoped_env&) = delete;
	scoped_env& operator=(const scoped_env&) = delete;

private:
	void apply(const std::optional<std::string>& value)
	{
		if(value)
			setenv(m_name.c_str(), value->c_str(), 1);
		else
			unsetenv(m_name.c_str());
	}

	std::string m_name;
	std::optional<std::string> m_old;
};

inline time_point local_time(const char *s)
{
	std::optional<time_point> t = parse_local_time(s, "%Y-%m-%d %H:%M:%S");
	if(!t)
		throw std::invalid_argument(s);
	return *t;
}

}

#endif /* _HPCMON_TEST_FAKES_HPP */
