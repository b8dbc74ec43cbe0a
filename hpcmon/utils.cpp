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
#include <cstring>
#include <cstdlib>
#include <ctime>
#include <cerrno>
#include <charconv>
#include <stdexcept>
#include <ostream>
#include <pwd.h>
#include <signal.h>
#include <sys/wait.h>
#include "hpcmon.hpp"

namespace hpcmon {

std::system_error make_posix_exception(int err)
{
	return std::system_error(err, std::system_category());
}

pid_t spawn_process(const char *path, char * const *argv, int fdin, int fdout, int fderr, bool detach) noexcept
{
	log_debug(log_level_exec) << "SPAWN: ";
	for(char * const *a = argv; *a != nullptr; ++a) {
		log_debug(log_level_exec) << *a << " ";
	}
	log_debug(log_level_exec) << std::endl;

	pid_t pid = fork();
	if(pid != 0)
	{
		/*
		 * Set the group from both sides so it exists by the time either
		 * returns. EACCES means the child already exec'd with it set.
		 */
		if(pid > 0 && detach)
			setpgid(pid, pid);
		return pid;
	}

	/* Own process group, so the whole job can be signalled at once. */
	if(detach)
		setpgid(0, 0);

	/* Don't leak our signal setup into the child. */
	sigset_t empty;
	sigemptyset(&empty);
	sigprocmask(SIG_SETMASK, &empty, nullptr);
	signal(SIGPIPE, SIG_DFL);

	if(fdin >= 0)
	{
		dup2(fdin, STDIN_FILENO);
		close(fdin);
	}

	if(fdout >= 0)
	{
		dup2(fdout, STDOUT_FILENO);
		close(fdout);
	}

	if(fderr >= 0)
	{
		if(fderr != fdout)
		{
			dup2(fderr, STDERR_FILENO);
			close(fderr);
		}
		else
		{
			dup2(STDOUT_FILENO, STDERR_FILENO);
		}
	}

	execvp(path, argv);
	_exit(127);
}

int decode_wait_status(int status) noexcept
{
	if(WIFEXITED(status))
		return WEXITSTATUS(status);
	else if(WIFSIGNALED(status))
		return 128 + WTERMSIG(status);
	else
		return -1;
}

int wait_process(pid_t pid)
{
	for(;;)
	{
		int status;
		if(waitpid(pid, &status, 0) < 0)
		{
			if(errno == EINTR)
				continue;

			throw make_posix_exception(errno);
		}

		return decode_wait_status(status);
	}
}

std::optional<fs::path> find_executable(std::string_view name) noexcept
{
	constexpr fs::perms execperms = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;

	auto is_exec = [execperms](const fs::path& p) {
		std::error_code ec;
		fs::file_status status = fs::status(p, ec);
		return !ec && fs::is_regular_file(status) && (status.permissions() & execperms) != fs::perms::none;
	};

	try
	{
		if(name.find('/') != std::string_view::npos)
		{
			fs::path path(name);
			if(is_exec(path))
				return path;
			return std::nullopt;
		}

		const char *path_env = getenv("PATH");
		if(path_env == nullptr)
			return std::nullopt;

		std::optional<fs::path> found;
		for_each_delim(path_env, path_env + strlen(path_env), ':', [&found, &name, &is_exec](std::string_view dir, size_t) {
			if(found || dir.empty())
				return;

			fs::path path(dir);
			path /= name;
			if(is_exec(path))
				found = path;
		});
		return found;
	}
	catch(const std::bad_alloc&)
	{
		return std::nullopt;
	}
}

std::string get_env(const char *name)
{
	const char *val = getenv(name);
	return val ? val : "";
}

std::string get_username()
{
	struct passwd *passwd;

	errno = 0;
	if((passwd = getpwuid(geteuid())) == nullptr) {
		/* Happens on NIS systems. */
		log_debug(log_level_debug) << "OS: getpwuid() failed, falling back to $USER" << std::endl;
		log_debug(log_level_debug) << "OS:   errno   = " << errno                    << std::endl;
		log_debug(log_level_debug) << "OS:   message = " << strerror(errno)          << std::endl;
	} else if(passwd->pw_name == nullptr || passwd->pw_name[0] == '\0') {
		log_debug(log_level_debug) << "OS: getpwuid() returned NULL or empty user, falling back to $USER" << std::endl;
	} else {
		return passwd->pw_name;
	}

	std::string user = get_env("USER");
	if(!user.empty())
		return user;

	throw std::runtime_error("Unable to determine user name, please fix your system");
}

std::string_view trim(std::string_view s) noexcept
{
	constexpr std::string_view ws = " \t\r\n\v\f";

	size_t first = s.find_first_not_of(ws);
	if(first == std::string_view::npos)
		return {};

	size_t last = s.find_last_not_of(ws);
	return s.substr(first, last - first + 1);
}

std::string to_lower(std::string_view s)
{
	std::string out(s);
	std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(tolower(c)); });
	return out;
}

std::vector<std::string_view> split_whitespace(std::string_view s, size_t max_fields)
{
	constexpr std::string_view ws = " \t\r\n\v\f";

	std::vector<std::string_view> fields;
	size_t pos = s.find_first_not_of(ws);
	while(pos != std::string_view::npos)
	{
		/* Last field takes the remainder. */
		if(max_fields != 0 && fields.size() + 1 == max_fields)
		{
			fields.push_back(trim(s.substr(pos)));
			break;
		}

		size_t end = s.find_first_of(ws, pos);
		if(end == std::string_view::npos)
		{
			fields.push_back(s.substr(pos));
			break;
		}

		fields.push_back(s.substr(pos, end - pos));
		pos = s.find_first_not_of(ws, end);
	}
	return fields;
}

std::vector<std::string_view> split_fields(std::string_view s, char delim)
{
	std::vector<std::string_view> fields;
	for_each_delim(s.data(), s.data() + s.size(), delim, [&fields](std::string_view f, size_t) {
		fields.push_back(f);
	});

	/* for_each_delim drops a trailing empty field. */
	if(!s.empty() && s.back() == delim)
		fields.emplace_back();

	return fields;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep)
{
	std::string out;
	for(size_t i = 0; i < parts.size(); ++i)
	{
		if(i > 0)
			out.append(sep);
		out.append(parts[i]);
	}
	return out;
}

std::string shell_quote(std::string_view s)
{
	if(!s.empty() && s.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-+=.,:/@%") == std::string_view::npos)
		return std::string(s);

	std::string out = "'";
	for(char c : s)
	{
		if(c == '\'')
			out.append("'\\''");
		else
			out.push_back(c);
	}
	out.push_back('\'');
	return out;
}

std::optional<long long> parse_integer(std::string_view s) noexcept
{
	s = trim(s);
	if(!s.empty() && s.front() == '+')
		s.remove_prefix(1);

	long long val;
	auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), val);
	if(ec != std::errc() || ptr != s.data() + s.size() || s.empty())
		return std::nullopt;

	return val;
}

std::optional<time_point> parse_epoch(std::string_view s) noexcept
{
	std::optional<long long> secs = parse_integer(s);
	if(!secs || *secs <= 0)
		return std::nullopt;

	return clock_type::from_time_t(static_cast<time_t>(*secs));
}

std::optional<time_point> parse_local_time(std::string_view s, const char *fmt) noexcept
{
	/* strptime() needs it NULL-terminated. */
	char buf[64];
	s = trim(s);
	if(s.empty() || s.size() >= sizeof(buf))
		return std::nullopt;

	memcpy(buf, s.data(), s.size());
	buf[s.size()] = '\0';

	struct tm tm;
	memset(&tm, 0, sizeof(tm));
	const char *end = strptime(buf, fmt, &tm);
	if(end == nullptr)
		return std::nullopt;

	/* Allow trailing fractional seconds, e.g. "10:00:00.123". */
	if(*end == '.')
	{
		for(++end; *end >= '0' && *end <= '9'; ++end)
			;
	}

	if(*end != '\0')
		return std::nullopt;

	tm.tm_isdst = -1;
	time_t t = mktime(&tm);
	if(t == static_cast<time_t>(-1))
		return std::nullopt;

	return clock_type::from_time_t(t);
}

std::string format_local_time(time_point t, const char *fmt)
{
	time_t tt = clock_type::to_time_t(t);
	struct tm tm;
	memset(&tm, 0, sizeof(tm));
	if(localtime_r(&tt, &tm) == nullptr)
		throw make_posix_exception(errno);

	char buf[64];
	size_t n = strftime(buf, sizeof(buf), fmt, &tm);
	return std::string(buf, n);
}

std::optional<std::chrono::seconds> parse_duration(std::string_view s) noexcept
{
	s = trim(s);
	if(s.empty())
		return std::nullopt;

	long long days = 0;
	size_t dash = s.find('-');
	if(dash != std::string_view::npos)
	{
		std::optional<long long> d = parse_integer(s.substr(0, dash));
		if(!d || *d < 0)
			return std::nullopt;
		days = *d;
		s = s.substr(dash + 1);
	}

	size_t dot = s.find('.');
	if(dot != std::string_view::npos)
		s = s.substr(0, dot);

	long long parts[3] = {0, 0, 0};
	size_t nparts = 0;
	bool bad = false;
	for_each_delim(s.data(), s.data() + s.size(), ':', [&parts, &nparts, &bad](std::string_view f, size_t) {
		std::optional<long long> v = parse_integer(f);
		if(!v || *v < 0 || nparts >= 3)
		{
			bad = true;
			return;
		}
		parts[nparts++] = *v;
	});

	if(bad || nparts == 0)
		return std::nullopt;

	long long secs = 0;
	for(size_t i = 0; i < nparts; ++i)
		secs = secs * 60 + parts[i];

	return std::chrono::seconds(days * 86400 + secs);
}

}
