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
#include <iostream>
#include <iomanip>
#include <mutex>
#include <pthread.h>
#include "provider.hpp"

using namespace hpcmon;

static volatile sig_atomic_t g_interrupt = 0;
static volatile sig_atomic_t g_refresh = 0;

static int install_signal_handlers()
{
	struct sigaction new_action{};
	memset(&new_action, 0, sizeof(new_action));
	new_action.sa_handler = [](int signum){
		if(signum == SIGHUP)
			g_refresh = 1;
		else
			g_interrupt = 1;
	};
	new_action.sa_flags = 0;
	sigemptyset(&new_action.sa_mask);
	sigaddset(&new_action.sa_mask, SIGTERM);
	sigaddset(&new_action.sa_mask, SIGINT);
	sigaddset(&new_action.sa_mask, SIGHUP);

	if(sigaction(SIGTERM, &new_action, nullptr) < 0)
		return -1;

	if(sigaction(SIGINT, &new_action, nullptr) < 0)
		return -1;

	if(sigaction(SIGHUP, &new_action, nullptr) < 0)
		return -1;

	/* A closed pipe on stdout shouldn't kill us mid-refresh. */
	struct sigaction ign{};
	memset(&ign, 0, sizeof(ign));
	ign.sa_handler = SIG_IGN;
	sigemptyset(&ign.sa_mask);
	if(sigaction(SIGPIPE, &ign, nullptr) < 0)
		return -1;

	return 0;
}

static status_set parse_status_list(std::string_view list)
{
	status_set statuses;
	for(std::string_view s : split_fields(list, ','))
	{
		if(trim(s).empty())
			continue;

		std::optional<job_status> st = parse_status_name(s);
		if(!st)
			throw std::invalid_argument("Invalid status '" + std::string(s) + "'");

		statuses.insert(*st);
	}
	return statuses;
}

static time_point parse_since(const char *s)
{
	if(std::optional<time_point> t = parse_local_time(s, "%Y-%m-%d %H:%M:%S"))
		return *t;

	if(std::optional<time_point> t = parse_local_time(s, "%Y-%m-%d"))
		return *t;

	throw std::invalid_argument(std::string("Invalid --since value '") + s + "'");
}

static std::string format_time(const std::optional<time_point>& t)
{
	if(!t)
		return "-";
	return format_local_time(*t, "%Y-%m-%d %H:%M:%S");
}

static void print_table(std::ostream& os, const std::vector<job_info>& jobs, bool completed)
{
	os << std::left
		<< std::setw(14) << "JOBID" << " "
		<< std::setw(20) << "NAME" << " "
		<< std::setw(10) << "USER" << " "
		<< std::setw(10) << "STATUS" << " "
		<< std::setw(12) << "QUEUE" << " "
		<< std::setw(9) << "RUNTIME" << " "
		<< std::setw(12) << "RESOURCES" << " "
		<< (completed ? "ENDED" : "NODE") << "\n";

	for(const job_info& ji : jobs)
	{
		std::string id = ji.job_id;
		if(ji.array_task_id && id.find('_') == std::string::npos)
			id += "." + *ji.array_task_id;

		os << std::setw(14) << id << " "
			<< std::setw(20) << ji.name.substr(0, 20) << " "
			<< std::setw(10) << ji.user << " "
			<< std::setw(10) << status_name(ji.status) << " "
			<< std::setw(12) << ji.queue.value_or("-") << " "
			<< std::setw(9) << ji.runtime_display() << " "
			<< std::setw(12) << ji.resources_display() << " ";

		if(completed)
			os << format_time(ji.end_time);
		else
			os << ji.node.value_or("-");

		os << "\n";
	}
}

static void print_snapshot(std::ostream& os, const snapshot& snap, bool json)
{
	if(json)
	{
		nlohmann::json j{
			{"generation", snap.generation},
			{"timestamp", std::chrono::duration_cast<std::chrono::seconds>(snap.timestamp.time_since_epoch()).count()},
			{"ok", snap.ok},
			{"count", snap.count},
			{"jobs", *snap.jobs}
		};
		if(!snap.ok)
			j["error"] = snap.error;

		os << j.dump() << std::endl;
		return;
	}

	os << "=== " << format_local_time(snap.timestamp, "%Y-%m-%d %H:%M:%S") << ", " << snap.count << " job(s)";
	if(!snap.ok)
		os << ", refresh failed: " << snap.error;
	os << "\n";

	print_table(os, *snap.jobs, false);
	os << std::flush;
}

static int list_completed(scheduler& sched, const hpcmon_args& args, const std::string& username)
{
	completed_filter filter;
	if(!args.all)
		filter.user = args.user ? args.user : username;

	if(args.queue)
		filter.queue = args.queue;

	if(args.since)
		filter.since = parse_since(args.since);

	filter.limit = args.limit;

	std::vector<job_info> jobs = sched.list_completed_jobs(filter);

	if(args.json)
		std::cout << nlohmann::json(jobs).dump() << std::endl;
	else
		print_table(std::cout, jobs, true);

	return 0;
}

static int run_monitor(scheduler& sched, const hpcmon_args& args, const std::string& username)
{
	job_provider provider(sched, std::chrono::seconds(args.interval), args.user ? args.user : username);

	job_filter filter;
	filter.scope = args.all ? user_scope::all : user_scope::mine;
	if(args.status)
		filter.status = parse_status_list(args.status);
	if(args.queue)
		filter.queue = args.queue;

	provider.set_filter(filter);

	if(args.once)
	{
		provider.poll();
		snapshot snap = provider.current();
		print_snapshot(std::cout, snap, args.json);
		return snap.ok ? 0 : 1;
	}

	if(install_signal_handlers() < 0)
		throw make_posix_exception(errno);

	/* Only this thread takes signals; the worker inherits the blocked mask. */
	sigset_t block, orig;
	sigemptyset(&block);
	sigaddset(&block, SIGTERM);
	sigaddset(&block, SIGINT);
	sigaddset(&block, SIGHUP);
	if(int err = pthread_sigmask(SIG_BLOCK, &block, &orig); err != 0)
		throw make_posix_exception(err);

	std::mutex print_mutex;
	provider.subscribe([&print_mutex, &args](const snapshot& snap) {
		std::lock_guard<std::mutex> l(print_mutex);
		print_snapshot(std::cout, snap, args.json);
	});

	provider.start();

	while(!g_interrupt)
	{
		sigsuspend(&orig);

		if(g_refresh)
		{
			g_refresh = 0;
			log_debug(log_level_debug) << "SIGNAL: SIGHUP, refreshing" << std::endl;
			provider.refresh_now();
		}
	}

	log_debug(log_level_debug) << "SIGNAL: interrupted, shutting down" << std::endl;
	provider.stop();
	return 0;
}

int main(int argc, char **argv)
{
	hpcmon_args args;
	int status = parse_arguments(argc, argv, stdout, stderr, &args);
	if(status != 0 || args.version)
		return status;

	set_log_level(args.debug);

	try
	{
		process_runner runner;

		std::string name = args.scheduler ? to_lower(args.scheduler) : detect_scheduler(runner);
		std::unique_ptr<scheduler> sched = make_scheduler(name, runner);
		log_debug(log_level_debug) << "SCHED: using " << sched->name() << std::endl;

		std::string username = get_username();

		if(args.completed)
			return list_completed(*sched, args, username);

		return run_monitor(*sched, args, username);
	}
	catch(const accounting_not_available& e)
	{
		log_error() << e.what() << std::endl;
		return 1;
	}
	catch(const std::exception& e)
	{
		log_error() << "Caught exception: " << e.what() << std::endl;
		return 1;
	}
}
