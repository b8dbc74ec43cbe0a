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
#ifndef _HPCMON_HPP
#define _HPCMON_HPP

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <algorithm>
#include <system_error>
#include <iosfwd>
#include <cstdint>
#include <cstdio>
#include <unistd.h>

/* Some of the clusters only have GCC 7.3.0 */
#if defined(__GNUC__) && !defined(__clang__) && __GNUC__ < 8
#	include <experimental/filesystem>
namespace fs = std::experimental::filesystem;
#else
#	include <filesystem>
namespace fs = std::filesystem;
#endif

namespace hpcmon {

struct file_desc
{
	file_desc(void) : _desc(-1) {}
	file_desc(int fd) : _desc(fd) {}
	file_desc(std::nullptr_t) : _desc(-1) {}

	operator int() const { return _desc; }

	bool operator==(const file_desc &other) const { return _desc == other._desc; }
	bool operator!=(const file_desc &other) const { return _desc != other._desc; }
	bool operator==(std::nullptr_t) const { return _desc < 0; }
	bool operator!=(std::nullptr_t) const { return _desc >= 0; }

	int _desc;
};

struct fd_deleter
{
	using pointer = file_desc;
	void operator()(pointer p) { close(p); }
};

using fd_ptr = std::unique_ptr<int, fd_deleter>;

using clock_type = std::chrono::system_clock;
using time_point = clock_type::time_point;

/* args.cpp */
struct hpcmon_args
{
	uint32_t	version;
	uint32_t	debug;
	const char	*scheduler;
	unsigned	interval;
	bool		all;
	const char	*user;
	const char	*queue;
	const char	*status;
	bool		completed;
	const char	*since;
	size_t		limit;
	bool		once;
	bool		json;
};

int parse_arguments(int argc, char **argv, FILE *out, FILE *err, hpcmon_args *args);

/* log.cpp */
enum : uint32_t
{
	log_level_normal	= 0,
	log_level_debug		= 1,
	log_level_exec		= 2,
};

void set_log_level(uint32_t level) noexcept;
uint32_t get_log_level() noexcept;
std::ostream& log_error() noexcept;
std::ostream& log_debug(uint32_t level) noexcept;

/* exec.cpp */

/* Upper bound on any scheduler query. */
constexpr std::chrono::seconds default_command_timeout{30};

struct command_result
{
	int exit_code;
	std::string out;
	std::string err;
	bool timed_out;

	bool ok() const noexcept { return !timed_out && exit_code == 0; }
};

/*
 * The only way the core talks to the outside world. Implementations must
 * throw std::system_error if the program can't be started at all.
 */
class command_runner
{
public:
	virtual ~command_runner() = default;

	virtual command_result run(const std::vector<std::string>& argv, std::chrono::seconds timeout, std::string_view input = {}) = 0;

	/* Run with the caller's stdio attached and wait for it, however long it takes. */
	virtual int run_attached(const std::vector<std::string>& argv) = 0;
};

class process_runner : public command_runner
{
public:
	command_result run(const std::vector<std::string>& argv, std::chrono::seconds timeout, std::string_view input = {}) override;
	int run_attached(const std::vector<std::string>& argv) override;
};

/* utils.cpp */
std::system_error make_posix_exception(int err);
pid_t spawn_process(const char *path, char * const *argv, int fdin, int fdout = -1, int fderr = -1, bool detach = true) noexcept;
int wait_process(pid_t pid);
int decode_wait_status(int status) noexcept;

std::optional<fs::path> find_executable(std::string_view name) noexcept;
std::string get_username();
std::string get_env(const char *name);

std::string_view trim(std::string_view s) noexcept;
std::string to_lower(std::string_view s);
std::vector<std::string_view> split_whitespace(std::string_view s, size_t max_fields = 0);
std::vector<std::string_view> split_fields(std::string_view s, char delim);
std::string join(const std::vector<std::string>& parts, std::string_view sep);
std::string shell_quote(std::string_view s);

std::optional<long long> parse_integer(std::string_view s) noexcept;
std::optional<time_point> parse_epoch(std::string_view s) noexcept;
std::optional<time_point> parse_local_time(std::string_view s, const char *fmt) noexcept;
std::string format_local_time(time_point t, const char *fmt);
/* "[D-]HH:MM:SS", "MM:SS" or "SS", fractional seconds ignored. */
std::optional<std::chrono::seconds> parse_duration(std::string_view s) noexcept;

template<
	typename V,
	typename CharT = char,
	typename InputIt = const CharT*,
	typename Traits = std::char_traits<CharT>,
	typename ViewT = std::basic_string_view<CharT, Traits>
>
void for_each_delim(InputIt begin, InputIt end, CharT delim, V&& proc)
{
	size_t i = 0;
	for(InputIt start = begin, next; start != end; start = next, ++i)
	{
		next = std::find(start, end, delim);
		proc(ViewT(start, std::distance(start, next)), i);
		if(next != end)
			++next;
	}
}

template <typename V>
void for_each_line(std::string_view s, V&& proc)
{
	for_each_delim(s.data(), s.data() + s.size(), '\n', [&proc](std::string_view line, size_t i) {
		if(!line.empty() && line.back() == '\r')
			line.remove_suffix(1);
		proc(line, i);
	});
}

}

#endif /* _HPCMON_HPP */
