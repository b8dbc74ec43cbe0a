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
#include <sstream>
#include <ostream>
#include "scheduler.hpp"

namespace hpcmon {

scheduler::scheduler(command_runner& runner) noexcept :
	m_runner(runner)
{}

std::string scheduler::native_job_id(const std::string& job_id) const
{
	return job_id;
}

command_result scheduler::run_command(const std::vector<std::string>& argv, std::string_view input)
{
	log_debug(log_level_debug) << "SCHED: " << name() << ": " << join(argv, " ") << std::endl;
	return m_runner.run(argv, default_command_timeout, input);
}

std::string scheduler::submit_script(const std::vector<std::string>& argv, const std::string& script,
	std::optional<std::string> (*parse)(std::string_view))
{
	command_result res;
	try
	{
		res = run_command(argv, script);
	}
	catch(const std::system_error& e)
	{
		throw submission_error(argv[0] + ": " + e.what());
	}

	if(res.timed_out)
		throw submission_error(argv[0] + " timed out");

	if(res.exit_code != 0)
	{
		std::string msg(trim(res.err));
		if(msg.empty())
			msg = std::string(trim(res.out));
		throw submission_error(argv[0] + " failed with exit code " + std::to_string(res.exit_code) + ": " + msg);
	}

	std::optional<std::string> id = parse(res.out);
	if(!id)
		throw submission_error("Unable to parse job id from " + argv[0] + " output: " + std::string(trim(res.out)));

	log_debug(log_level_debug) << "SCHED: " << name() << ": submitted job " << *id << std::endl;
	return *id;
}

job_result scheduler::run_interactive(const std::vector<std::string>& argv)
{
	int ret;
	try
	{
		ret = m_runner.run_attached(argv);
	}
	catch(const std::system_error& e)
	{
		throw submission_error(argv[0] + ": " + e.what());
	}

	job_result res;
	res.job_id = "interactive";
	res.scheduler = name();
	res.exit_code = ret;
	res.status = ret == 0 ? job_status::completed : job_status::failed;
	return res;
}

bool scheduler::cancel_with(const std::string& job_id, const std::vector<std::string>& argv)
{
	std::optional<job_info> ji;
	try
	{
		ji = find_active(job_id);
	}
	catch(const std::exception& e)
	{
		log_error() << "SCHED: " << name() << ": unable to list jobs before cancelling " << job_id << ": " << e.what() << std::endl;
		return false;
	}

	if(!ji || ji->is_complete())
	{
		log_debug(log_level_debug) << "SCHED: " << name() << ": job " << job_id << " is not active, not cancelling" << std::endl;
		return false;
	}

	try
	{
		command_result res = run_command(argv);
		if(!res.ok())
		{
			log_debug(log_level_debug) << "SCHED: " << name() << ": " << argv[0] << " " << job_id
				<< " failed: " << trim(res.err) << std::endl;
			return false;
		}
	}
	catch(const std::system_error& e)
	{
		log_error() << "SCHED: " << name() << ": " << argv[0] << ": " << e.what() << std::endl;
		return false;
	}

	return true;
}

std::optional<job_info> scheduler::find_active(const std::string& job_id)
{
	active_filter filter;
	filter.status = all_statuses();

	std::string native = native_job_id(job_id);
	std::vector<job_info> jobs = list_active_jobs(filter);
	auto it = std::find_if(jobs.begin(), jobs.end(), [&job_id, &native](const job_info& ji) {
		return ji.matches_id(job_id) || ji.matches_id(native);
	});

	if(it == jobs.end())
		return std::nullopt;

	return std::move(*it);
}

fs::path scheduler::submit_dir(const job_spec& job)
{
	if(job.workdir)
		return *job.workdir;

	std::error_code ec;
	fs::path cwd = fs::current_path(ec);
	if(ec)
		return ".";
	return cwd;
}

void scheduler::record_submission(const std::string& job_id, const job_spec& job, const fs::path& default_out, const fs::path& default_err)
{
	output_paths p;
	p.out = job.stdout_path.value_or(default_out);
	if(job.merge_output)
		p.err = p.out;
	else
		p.err = job.stderr_path.value_or(default_err);

	std::lock_guard<std::mutex> l(m_paths_mutex);
	m_paths[job_id] = std::move(p);
}

std::optional<job_info> scheduler::lookup_accounting(const std::string&)
{
	return std::nullopt;
}

job_info scheduler::get_job_details(const std::string& job_id)
{
	if(std::optional<job_info> ji = find_active(job_id))
		return std::move(*ji);

	if(has_accounting())
	{
		if(std::optional<job_info> ji = lookup_accounting(job_id))
			return std::move(*ji);
	}

	throw job_not_found(job_id);
}

job_status scheduler::get_status(const std::string& job_id) noexcept
{
	try
	{
		return get_job_details(job_id).status;
	}
	catch(const job_not_found& e)
	{
		log_debug(log_level_debug) << "SCHED: " << name() << ": " << e.what() << std::endl;
	}
	catch(const std::exception& e)
	{
		log_error() << "SCHED: " << name() << ": unable to query status of job " << job_id << ": " << e.what() << std::endl;
	}

	return job_status::unknown;
}

std::optional<int> scheduler::get_exit_code(const std::string& job_id)
{
	job_info ji = get_job_details(job_id);
	if(!ji.is_complete())
		return std::nullopt;

	return ji.exit_code;
}

std::optional<fs::path> scheduler::get_output_path(const std::string& job_id, output_stream stream)
{
	{
		std::lock_guard<std::mutex> l(m_paths_mutex);
		auto it = m_paths.find(job_id);
		if(it != m_paths.end())
			return stream == output_stream::stdout_stream ? it->second.out : it->second.err;
	}

	job_info ji;
	try
	{
		ji = get_job_details(job_id);
	}
	catch(const job_not_found& e)
	{
		log_debug(log_level_debug) << "SCHED: " << name() << ": " << e.what() << std::endl;
		return std::nullopt;
	}

	return stream == output_stream::stdout_stream ? ji.stdout_path : ji.stderr_path;
}

std::string scheduler::generate_script(const job_spec& job) const
{
	std::ostringstream os;
	os << "#!" << job.shell << "\n";
	os << "# " << name() << " job script for " << job.name << ", generated by hpcmon\n";

	if(!job.modules.empty())
	{
		os << "\n";
		for(const std::string& m : job.modules)
			os << "module load " << shell_quote(m) << "\n";
	}

	if(!job.env.empty())
	{
		os << "\n";
		for(const auto& e : job.env)
			os << "export " << e.first << "=" << shell_quote(e.second) << "\n";
	}

	os << "\n";
	if(job.workdir)
		os << "cd " << shell_quote(job.workdir->string()) << " || exit 1\n";

	os << job.command << "\n";
	return os.str();
}

std::vector<job_info> scheduler::apply_filter(std::vector<job_info> jobs, const active_filter& filter)
{
	const status_set& statuses = filter.status ? *filter.status : active_statuses();

	jobs.erase(std::remove_if(jobs.begin(), jobs.end(), [&filter, &statuses](const job_info& ji) {
		if(filter.user && *filter.user != "*" && ji.user != *filter.user)
			return true;

		if(statuses.find(ji.status) == statuses.end())
			return true;

		if(filter.queue && (!ji.queue || *ji.queue != *filter.queue))
			return true;

		return false;
	}), jobs.end());

	return jobs;
}

std::vector<job_info> scheduler::apply_filter(std::vector<job_info> jobs, const completed_filter& filter)
{
	jobs.erase(std::remove_if(jobs.begin(), jobs.end(), [&filter](const job_info& ji) {
		if(!ji.is_complete())
			return true;

		if(filter.user && *filter.user != "*" && ji.user != *filter.user)
			return true;

		if(filter.since || filter.until)
		{
			if(!ji.end_time)
				return true;

			if(filter.since && *ji.end_time < *filter.since)
				return true;

			if(filter.until && *ji.end_time > *filter.until)
				return true;
		}

		if(filter.exit_code && ji.exit_code != filter.exit_code)
			return true;

		if(filter.queue && (!ji.queue || *ji.queue != *filter.queue))
			return true;

		return false;
	}), jobs.end());

	/* Most recent first, unknown end times last. */
	std::stable_sort(jobs.begin(), jobs.end(), [](const job_info& a, const job_info& b) {
		if(a.end_time && b.end_time)
			return *a.end_time > *b.end_time;
		return a.end_time.has_value() && !b.end_time.has_value();
	});

	if(filter.limit > 0 && jobs.size() > filter.limit)
		jobs.resize(filter.limit);

	return jobs;
}

}
