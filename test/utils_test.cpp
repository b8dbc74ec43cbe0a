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
#include <unistd.h>
#include <catch2/catch.hpp>
#include "fakes.hpp"

using namespace hpcmon;
using namespace std::chrono_literals;

TEST_CASE("utils: splitting", "[utils]")
{
	REQUIRE(split_whitespace("  a  b\tc ") == std::vector<std::string_view>{"a", "b", "c"});
	REQUIRE(split_whitespace("key   value with spaces ", 2) == std::vector<std::string_view>{"key", "value with spaces"});
	REQUIRE(split_whitespace("   ").empty());

	REQUIRE(split_fields("a|b||c", '|') == std::vector<std::string_view>{"a", "b", "", "c"});
	REQUIRE(split_fields("a|", '|') == std::vector<std::string_view>{"a", ""});
}

TEST_CASE("utils: integers", "[utils]")
{
	REQUIRE(parse_integer(" 42 ") == 42);
	REQUIRE(parse_integer("+7") == 7);
	REQUIRE(parse_integer("-3") == -3);
	REQUIRE_FALSE(parse_integer("4x"));
	REQUIRE_FALSE(parse_integer(""));
}

TEST_CASE("utils: durations", "[utils]")
{
	REQUIRE(parse_duration("01:02:03") == 3723s);
	REQUIRE(parse_duration("2-00:00:10") == std::chrono::seconds(2 * 86400 + 10));
	REQUIRE(parse_duration("05:30") == 330s);
	REQUIRE(parse_duration("59") == 59s);
	REQUIRE(parse_duration("00:00:01.250") == 1s);
	REQUIRE_FALSE(parse_duration("1:2:3:4"));
	REQUIRE_FALSE(parse_duration("abc"));
	REQUIRE_FALSE(parse_duration(""));
}

TEST_CASE("utils: times", "[utils]")
{
	REQUIRE(parse_epoch("1700000000") == clock_type::from_time_t(1700000000));
	REQUIRE_FALSE(parse_epoch("0"));
	REQUIRE_FALSE(parse_epoch("yesterday"));

	std::optional<time_point> t = parse_local_time("2024-03-01T10:20:30", "%Y-%m-%dT%H:%M:%S");
	REQUIRE(t);
	REQUIRE(format_local_time(*t, "%Y-%m-%d %H:%M:%S") == "2024-03-01 10:20:30");

	REQUIRE(parse_local_time("2024-03-01T10:20:30.5", "%Y-%m-%dT%H:%M:%S") == t);
	REQUIRE_FALSE(parse_local_time("2024-03-01T10:20:30Z", "%Y-%m-%dT%H:%M:%S"));
}

TEST_CASE("utils: shell quoting", "[utils]")
{
	REQUIRE(shell_quote("plain/path-1.txt") == "plain/path-1.txt");
	REQUIRE(shell_quote("has space") == "'has space'");
	REQUIRE(shell_quote("it's") == "'it'\\''s'");
	REQUIRE(shell_quote("") == "''");
}

TEST_CASE("utils: executable lookup", "[utils]")
{
	test::temp_dir dir;
	dir.add_program("qfake");

	test::scoped_env path("PATH", dir.path().string());
	REQUIRE(find_executable("qfake") == dir.path() / "qfake");
	REQUIRE_FALSE(find_executable("qmissing"));
}

TEST_CASE("exec: process runner captures output", "[exec]")
{
	process_runner runner;

	command_result res = runner.run({"/bin/sh", "-c", "cat; echo oops >&2; exit 3"}, 10s, "hello\n");
	REQUIRE_FALSE(res.timed_out);
	REQUIRE(res.exit_code == 3);
	REQUIRE(res.out == "hello\n");
	REQUIRE(res.err == "oops\n");
	REQUIRE_FALSE(res.ok());
}

TEST_CASE("exec: process runner enforces timeouts", "[exec]")
{
	process_runner runner;

	command_result res = runner.run({"/bin/sh", "-c", "sleep 30"}, 1s);
	REQUIRE(res.timed_out);
	REQUIRE_FALSE(res.ok());
}

TEST_CASE("exec: timeouts cover children that close their output", "[exec]")
{
	process_runner runner;

	auto start = std::chrono::steady_clock::now();
	command_result res = runner.run({"/bin/sh", "-c", "exec >&- 2>&-; sleep 30"}, 1s);
	REQUIRE(res.timed_out);
	REQUIRE_FALSE(res.ok());
	REQUIRE(std::chrono::steady_clock::now() - start < 10s);
}

TEST_CASE("fd_ptr: reset closes and releases", "[utils]")
{
	int fds[2];
	REQUIRE(pipe(fds) == 0);

	fd_ptr rd(fds[0]);
	fd_ptr wr(fds[1]);

	const file_desc held = rd.get();
	REQUIRE(static_cast<int>(held) == fds[0]);
	REQUIRE(held != nullptr);

	wr.reset();
	REQUIRE_FALSE(wr);

	char c;
	REQUIRE(read(rd.get(), &c, 1) == 0);

	rd.reset();
	REQUIRE(rd.get() == nullptr);
}

TEST_CASE("exec: missing programs throw", "[exec]")
{
	process_runner runner;
	REQUIRE_THROWS_AS(runner.run({"/nonexistent/hpcmon-none"}, 1s), std::system_error);
}
