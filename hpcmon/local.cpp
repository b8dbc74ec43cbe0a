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
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ostream>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#include "scheduler.hpp"

namespace hpcmon {

/*
 * The pid isn't known until after fork(), so default output files are
 * created under a temporary name and renamed once it is.
 */
struct output_file
{
	fd_ptr fd;
	fs::path path;
	bool temporary;
};

static output_file open_output(const std::optional<fs::path>& explicit_path, const fs::path& dir, const std::string& stem)
{
	output_file f{};

	if(explicit_path)
	{
		f.path = *explicit_path;
		f.temporary = false;
		f.fd.reset(open(f.path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
		if(!f.fd)
			throw std::system_error(errno, std::system_category(), f.path.string());
		return f;
	}

	std::string tmpl = (dir / (stem + "XXXXXX")).string();
	f.fd.reset(mkostemp(&tmpl[0], O_CLOEXEC));
	if(!f.fd)
		throw std::system_error(errno, std::system_category(), tmpl);

	f.path = tmpl;
	f.temporary = true;
	return f;
}

static fs::path finalise_output(const output_file& f, const fs::path& dir, const std::string& stem, pid_t pid)
{
	if(!f.temporary)
		return f.path;

	fs::path final_path = dir / (stem + std::to_string(pid));
	if(rename(f.path.c_str(), final_path.c_str()) < 0)
	{
		log_error() << "LOCAL: unable to rename " << f.path << " to " << final_path << ": " << strerror(errno) << std::endl;
		return f.path;
	}
	return final_path;
}

local_scheduler::local_scheduler(command_runner& runner, size_t retain) :
	scheduler(runner),
	m_user(get_username()),
	m_retain(retain)
{}

local_scheduler::~local_scheduler()
{
	std::lock_guard<std::mutex> l(m_mutex);
	reap();

	size_t running = std::count_if(m_jobs.begin(), m_jobs.end(), [](const auto& j) {
		return j.second.info.is_active();
	});

	if(running > 0)
		log_debug(log_level_debug) << "LOCAL: leaving " << running << " job(s) running" << std::endl;
}

std::vector<std::string> local_scheduler::build_submit_command(const job_spec& job) const
{
	return {job.shell, "-c", generate_script(job)};
}

pid_t local_scheduler::launch(const job_spec& job, const std::optional<std::string>& base_id, std::optional<unsigned> task)
{
	job_spec spec = job;
	if(task)
		spec.env.emplace_back("HPCMON_TASK_ID", std::to_string(*task));

	std::vector<std::string> argv = build_submit_command(spec);
	std::vector<char*> args;
	for(std::string& a : argv)
		args.push_back(&a[0]);
	args.push_back(nullptr);

	fs::path dir = submit_dir(spec);
	std::string out_stem = spec.name + ".o";
	std::string err_stem = spec.name + ".e";

	fd_ptr devnull(open("/dev/null", O_RDONLY | O_CLOEXEC));
	if(!devnull)
		throw make_posix_exception(errno);

	output_file out = open_output(spec.stdout_path, dir, out_stem);
	output_file err{};
	if(!spec.merge_output)
		err = open_output(spec.stderr_path, dir, err_stem);

	pid_t pid = spawn_process(spec.shell.c_str(), args.data(), devnull.get(), out.fd.get(),
		spec.merge_output ? out.fd.get() : err.fd.get());
	if(pid < 0)
	{
		int e = errno;
		if(out.temporary)
			unlink(out.path.c_str());
		if(err.fd && err.temporary)
			unlink(err.path.c_str());
		throw std::system_error(e, std::system_category(), "fork");
	}

	time_point now = clock_type::now();

	local_job lj{};
	lj.pid = pid;
	lj.cancelled = false;

	job_info& ji = lj.info;
	ji.job_id = base_id.value_or(std::to_string(pid));
	ji.name = spec.name;
	ji.user = m_user;
	ji.status = job_status::running;
	ji.queue = "local";
	ji.submit_time = now;
	ji.start_time = now;
	ji.cpu = spec.cpu;
	ji.memory = spec.memory;
	ji.gpu = spec.gpu;
	ji.node = "localhost";
	ji.stdout_path = finalise_output(out, dir, out_stem, pid);
	ji.stderr_path = spec.merge_output ? ji.stdout_path : finalise_output(err, dir, err_stem, pid);
	if(task)
		ji.array_task_id = std::to_string(*task);

	log_debug(log_level_debug) << "LOCAL: started " << spec.name << " as PID " << pid << std::endl;

	/* A recycled pid replaces the finished job that had it. */
	m_jobs.insert_or_assign(pid, std::move(lj));
	return pid;
}

void local_scheduler::reap() noexcept
{
	for(auto& it : m_jobs)
	{
		local_job& lj = it.second;
		if(!lj.info.is_active())
			continue;

		int status;
		pid_t corpse;
		do
			corpse = waitpid(lj.pid, &status, WNOHANG);
		while(corpse < 0 && errno == EINTR);

		if(corpse == 0)
			continue;

		time_point now = clock_type::now();
		lj.info.end_time = now;
		lj.info.runtime = std::chrono::duration_cast<std::chrono::seconds>(now - *lj.info.start_time);

		if(corpse < 0)
		{
			/* Somebody else reaped it. */
			log_debug(log_level_debug) << "LOCAL: lost track of PID " << lj.pid << ": " << strerror(errno) << std::endl;
			lj.info.status = lj.cancelled ? job_status::cancelled : job_status::failed;
			continue;
		}

		int ret = decode_wait_status(status);
		lj.info.exit_code = ret;

		if(lj.cancelled)
			lj.info.status = job_status::cancelled;
		else if(ret == 0)
			lj.info.status = job_status::completed;
		else
			lj.info.status = job_status::failed;

		log_debug(log_level_debug) << "LOCAL: PID " << lj.pid << " exited with " << ret << std::endl;
	}

	prune();
}

void local_scheduler::prune() noexcept
{
	std::vector<std::map<pid_t, local_job>::iterator> finished;
	for(auto it = m_jobs.begin(); it != m_jobs.end(); ++it)
	{
		if(!it->second.info.is_active())
			finished.push_back(it);
	}

	if(finished.size() <= m_retain)
		return;

	std::sort(finished.begin(), finished.end(), [](const auto& a, const auto& b) {
		return a->second.info.end_time < b->second.info.end_time;
	});

	size_t excess = finished.size() - m_retain;
	for(size_t i = 0; i < excess; ++i)
	{
		log_debug(log_level_debug) << "LOCAL: forgetting finished job " << finished[i]->second.info.job_id << std::endl;
		m_jobs.erase(finished[i]);
	}
}

job_result local_scheduler::submit(const job_spec& job, bool interactive)
{
	if(interactive)
		return run_interactive(build_submit_command(job));

	std::lock_guard<std::mutex> l(m_mutex);

	pid_t pid;
	try
	{
		pid = launch(job, std::nullopt, std::nullopt);
	}
	catch(const std::system_error& e)
	{
		throw submission_error(std::string("unable to start job: ") + e.what());
	}

	const job_info& ji = m_jobs.at(pid).info;

	job_result res;
	res.job_id = ji.job_id;
	res.scheduler = name();
	res.status = job_status::running;
	res.stdout_path = ji.stdout_path;
	res.stderr_path = ji.stderr_path;
	return res;
}

array_job_result local_scheduler::submit_array(const array_spec& array)
{
	std::lock_guard<std::mutex> l(m_mutex);

	std::optional<std::string> base_id;
	for(unsigned idx : array.indices())
	{
		try
		{
			pid_t pid = launch(array.job, base_id, idx);
			if(!base_id)
				base_id = std::to_string(pid);
		}
		catch(const std::system_error& e)
		{
			throw submission_error("unable to start task " + std::to_string(idx) + ": " + e.what());
		}
	}

	if(!base_id)
		throw submission_error("empty array range");

	return array_job_result{*base_id, name(), array.start, array.end, array.step};
}

bool local_scheduler::cancel(const std::string& job_id)
{
	std::lock_guard<std::mutex> l(m_mutex);
	reap();

	bool cancelled = false;
	for(auto& it : m_jobs)
	{
		local_job& lj = it.second;
		if(!lj.info.matches_id(job_id) || !lj.info.is_active() || lj.cancelled)
			continue;

		/* Each job leads its own process group. */
		int r = kill(-lj.pid, SIGTERM);
		if(r < 0 && errno == ESRCH)
			r = kill(lj.pid, SIGTERM);

		if(r < 0)
		{
			log_debug(log_level_debug) << "LOCAL: kill(" << -lj.pid << ") failed: " << strerror(errno) << std::endl;
			continue;
		}

		lj.cancelled = true;
		cancelled = true;
	}

	return cancelled;
}

job_status local_scheduler::get_status(const std::string& job_id) noexcept
{
	try
	{
		return get_job_details(job_id).status;
	}
	catch(const job_not_found&)
	{
		return job_status::unknown;
	}
	catch(const std::exception& e)
	{
		log_error() << "LOCAL: unable to query job " << job_id << ": " << e.what() << std::endl;
		return job_status::unknown;
	}
}

job_info local_scheduler::get_job_details(const std::string& job_id)
{
	std::lock_guard<std::mutex> l(m_mutex);
	reap();

	for(const auto& it : m_jobs)
	{
		if(it.second.info.matches_id(job_id))
			return it.second.info;
	}

	throw job_not_found(job_id);
}

std::vector<job_info> local_scheduler::list_active_jobs(const active_filter& filter)
{
	std::vector<job_info> jobs;
	{
		std::lock_guard<std::mutex> l(m_mutex);
		reap();

		time_point now = clock_type::now();
		jobs.reserve(m_jobs.size());
		for(const auto& it : m_jobs)
		{
			jobs.push_back(it.second.info);
			job_info& ji = jobs.back();
			if(ji.is_active() && ji.start_time)
				ji.runtime = std::chrono::duration_cast<std::chrono::seconds>(now - *ji.start_time);
		}
	}

	return apply_filter(std::move(jobs), filter);
}

std::vector<job_info> local_scheduler::list_completed_jobs(const completed_filter&)
{
	throw accounting_not_available(name());
}

}
