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
#include <cerrno>
#include <cstring>
#include <csignal>
#include <ostream>
#include <stdexcept>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <unistd.h>
#include <sys/wait.h>
#include "hpcmon.hpp"

namespace hpcmon {

static void make_pipe(fd_ptr& rd, fd_ptr& wr)
{
	int fds[2];
	if(pipe2(fds, O_CLOEXEC) < 0)
		throw make_posix_exception(errno);

	rd.reset(fds[0]);
	wr.reset(fds[1]);
}

static void set_nonblocking(int fd)
{
	int flags = fcntl(fd, F_GETFL);
	if(flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
		throw make_posix_exception(errno);
}

static std::vector<char*> build_argv(const std::vector<std::string>& argv)
{
	std::vector<char*> args;
	args.reserve(argv.size() + 1);
	for(const std::string& a : argv)
		args.push_back(const_cast<char*>(a.c_str()));
	args.push_back(nullptr);
	return args;
}

/* Resolve up front; a child that fails execvp() is indistinguishable from exit 127. */
static fs::path resolve_program(const std::vector<std::string>& argv)
{
	if(argv.empty())
		throw std::invalid_argument("empty command line");

	std::optional<fs::path> path = find_executable(argv[0]);
	if(!path)
		throw std::system_error(ENOENT, std::system_category(), argv[0]);

	return *path;
}

/* A child that exits without reading stdin must not take us down with SIGPIPE. */
static ssize_t write_nosigpipe(int fd, const char *buf, size_t len) noexcept
{
	sigset_t pipe_set, old;
	sigemptyset(&pipe_set);
	sigaddset(&pipe_set, SIGPIPE);
	pthread_sigmask(SIG_BLOCK, &pipe_set, &old);

	ssize_t n = write(fd, buf, len);
	int err = errno;

	if(n < 0 && err == EPIPE && !sigismember(&old, SIGPIPE))
	{
		struct timespec zero{0, 0};
		sigtimedwait(&pipe_set, nullptr, &zero);
	}

	pthread_sigmask(SIG_SETMASK, &old, nullptr);
	errno = err;
	return n;
}

/* Returns false on EOF. */
static bool drain(int fd, std::string& out)
{
	char buf[4096];
	for(;;)
	{
		ssize_t n = read(fd, buf, sizeof(buf));
		if(n > 0)
		{
			out.append(buf, static_cast<size_t>(n));
			continue;
		}

		if(n == 0)
			return false;

		if(errno == EINTR)
			continue;

		if(errno == EAGAIN || errno == EWOULDBLOCK)
			return true;

		throw make_posix_exception(errno);
	}
}

static void kill_group(pid_t pid) noexcept
{
	kill(-pid, SIGKILL);
	kill(pid, SIGKILL);
}

/* Polls for the exit status. Returns nothing once the deadline passes. */
static std::optional<int> reap_until(pid_t pid, std::chrono::steady_clock::time_point deadline)
{
	using namespace std::chrono;

	for(;;)
	{
		int status;
		pid_t r = waitpid(pid, &status, WNOHANG);
		if(r > 0)
			return decode_wait_status(status);

		if(r < 0)
		{
			if(errno == EINTR)
				continue;

			throw make_posix_exception(errno);
		}

		if(steady_clock::now() >= deadline)
			return std::nullopt;

		std::this_thread::sleep_for(milliseconds(10));
	}
}

command_result process_runner::run(const std::vector<std::string>& argv, std::chrono::seconds timeout, std::string_view input)
{
	using namespace std::chrono;

	fs::path program = resolve_program(argv);
	std::vector<char*> args = build_argv(argv);

	fd_ptr in_rd, in_wr, out_rd, out_wr, err_rd, err_wr;
	make_pipe(in_rd, in_wr);
	make_pipe(out_rd, out_wr);
	make_pipe(err_rd, err_wr);

	auto start = steady_clock::now();
	pid_t pid = spawn_process(program.c_str(), args.data(), in_rd.get(), out_wr.get(), err_wr.get());
	if(pid < 0)
		throw make_posix_exception(errno);

	/* Child has its copies now. */
	in_rd.reset();
	out_wr.reset();
	err_wr.reset();

	set_nonblocking(out_rd.get());
	set_nonblocking(err_rd.get());

	if(input.empty())
		in_wr.reset();
	else
		set_nonblocking(in_wr.get());

	command_result res{-1, {}, {}, false};
	size_t written = 0;

	try
	{
		for(;;)
		{
			struct pollfd pfds[3];
			nfds_t nfds = 0;
			int out_idx = -1, err_idx = -1, in_idx = -1;

			if(out_rd)
			{
				out_idx = static_cast<int>(nfds);
				pfds[nfds++] = {out_rd.get(), POLLIN, 0};
			}

			if(err_rd)
			{
				err_idx = static_cast<int>(nfds);
				pfds[nfds++] = {err_rd.get(), POLLIN, 0};
			}

			if(in_wr)
			{
				in_idx = static_cast<int>(nfds);
				pfds[nfds++] = {in_wr.get(), POLLOUT, 0};
			}

			if(nfds == 0)
				break;

			int wait_ms = -1;
			if(timeout.count() > 0)
			{
				auto left = duration_cast<milliseconds>(start + timeout - steady_clock::now());
				if(left.count() <= 0)
				{
					res.timed_out = true;
					break;
				}
				wait_ms = static_cast<int>(left.count());
			}

			int ret = poll(pfds, nfds, wait_ms);
			if(ret < 0)
			{
				if(errno == EINTR)
					continue;

				throw make_posix_exception(errno);
			}

			if(ret == 0)
				continue;

			if(out_idx >= 0 && pfds[out_idx].revents != 0 && !drain(out_rd.get(), res.out))
				out_rd.reset();

			if(err_idx >= 0 && pfds[err_idx].revents != 0 && !drain(err_rd.get(), res.err))
				err_rd.reset();

			if(in_idx >= 0 && pfds[in_idx].revents != 0)
			{
				if(pfds[in_idx].revents & (POLLERR | POLLHUP))
				{
					/* Child isn't reading stdin. */
					in_wr.reset();
					continue;
				}

				ssize_t n = write_nosigpipe(in_wr.get(), input.data() + written, input.size() - written);
				if(n < 0 && errno != EINTR && errno != EAGAIN)
				{
					in_wr.reset();
					continue;
				}

				if(n > 0)
					written += static_cast<size_t>(n);

				if(written >= input.size())
					in_wr.reset();
			}
		}
	}
	catch(const std::exception&)
	{
		/* Don't leave the child running or unreaped behind us. */
		kill_group(pid);
		wait_process(pid);
		throw;
	}

	/* A child can close its stdio and keep running, so the reap is bounded too. */
	if(!res.timed_out && timeout.count() > 0)
	{
		std::optional<int> ret = reap_until(pid, start + timeout);
		if(ret)
			res.exit_code = *ret;
		else
			res.timed_out = true;
	}
	else if(!res.timed_out)
	{
		res.exit_code = wait_process(pid);
	}

	if(res.timed_out)
	{
		log_debug(log_level_exec) << "EXEC: " << argv[0] << " timed out after " << timeout.count() << "s, killing PID " << pid << std::endl;
		kill_group(pid);
		res.exit_code = wait_process(pid);
	}

	log_debug(log_level_exec) << "EXEC: " << argv[0] << " exited with " << res.exit_code
		<< " after " << duration_cast<milliseconds>(steady_clock::now() - start).count() << "ms"
		<< " (" << res.out.size() << " bytes stdout, " << res.err.size() << " bytes stderr)" << std::endl;

	return res;
}

int process_runner::run_attached(const std::vector<std::string>& argv)
{
	fs::path program = resolve_program(argv);
	std::vector<char*> args = build_argv(argv);

	/* Stay in the terminal's process group so job control works. */
	pid_t pid = spawn_process(program.c_str(), args.data(), -1, -1, -1, false);
	if(pid < 0)
		throw make_posix_exception(errno);

	int ret = wait_process(pid);
	log_debug(log_level_exec) << "EXEC: " << argv[0] << " exited with " << ret << std::endl;
	return ret;
}

}
