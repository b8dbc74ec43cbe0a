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
#include <ostream>
#include <nlohmann/json.hpp>
#include "scheduler.hpp"

namespace hpcmon {

/* Exit_status PBS uses for a job deleted while running. */
constexpr int pbs_exit_deleted = 271;

static std::optional<std::string> json_string(const nlohmann::json& j, const char *key)
{
	auto it = j.find(key);
	if(it == j.end())
		return std::nullopt;

	std::string s;
	if(it->is_string())
		s = it->get<std::string>();
	else if(it->is_number())
		s = it->dump();
	else
		return std::nullopt;

	std::string_view t = trim(s);
	if(t.empty())
		return std::nullopt;

	return std::string(t);
}

/* PBS is inconsistent about quoting numbers. */
static std::optional<long long> json_integer(const nlohmann::json& j, const char *key)
{
	auto it = j.find(key);
	if(it == j.end())
		return std::nullopt;

	if(it->is_number_integer())
		return it->get<long long>();

	if(it->is_string())
		return parse_integer(it->get<std::string>());

	return std::nullopt;
}

static std::optional<unsigned> json_unsigned(const nlohmann::json& j, const char *key)
{
	std::optional<long long> v = json_integer(j, key);
	if(!v || *v < 0)
		return std::nullopt;

	return static_cast<unsigned>(*v);
}

static std::optional<time_point> json_time(const nlohmann::json& j, const char *key)
{
	std::optional<std::string> s = json_string(j, key);
	if(!s)
		return std::nullopt;

	if(std::optional<time_point> t = parse_epoch(*s))
		return t;

	return parse_local_time(*s, "%a %b %d %H:%M:%S %Y");
}

/* "host.example.com:/home/user/job.o123" -> "/home/user/job.o123" */
static std::optional<fs::path> strip_host(const std::optional<std::string>& s)
{
	if(!s)
		return std::nullopt;

	size_t colon = s->find(':');
	if(colon == std::string::npos)
		return fs::path(*s);

	return fs::path(s->substr(colon + 1));
}

/* "node1/0*4+node2/0*4" -> "node1" */
static std::optional<std::string> first_exec_host(const std::optional<std::string>& s)
{
	if(!s)
		return std::nullopt;

	std::string_view h = *s;
	h = h.substr(0, h.find('+'));
	h = h.substr(0, h.find('/'));
	if(h.empty())
		return std::nullopt;

	return std::string(h);
}

/* "afterok:123.server:456.server,afterany:789.server" */
static std::vector<std::string> parse_depend(std::string_view dep)
{
	std::vector<std::string> ids;
	for(std::string_view d : split_fields(dep, ','))
	{
		std::vector<std::string_view> parts = split_fields(d, ':');
		for(size_t i = 1; i < parts.size(); ++i)
		{
			/* Drop "@server" qualifiers. */
			std::string_view id = trim(parts[i]);
			id = id.substr(0, id.find('@'));
			if(!id.empty())
				ids.emplace_back(id);
		}
	}
	return ids;
}

static job_info make_job_info(const std::string& id, const nlohmann::json& j, time_point now)
{
	job_info ji;
	ji.job_id = id;
	ji.name = json_string(j, "Job_Name").value_or("");

	std::string owner = json_string(j, "Job_Owner").value_or("");
	ji.user = owner.substr(0, owner.find('@'));

	std::optional<long long> exit_status = json_integer(j, "Exit_status");
	if(exit_status)
		ji.exit_code = static_cast<int>(*exit_status);

	std::optional<std::string> state = json_string(j, "job_state");
	ji.status = state ? pbs_state_to_status(*state, ji.exit_code) : job_status::unknown;

	ji.queue = json_string(j, "queue");
	ji.submit_time = json_time(j, "ctime");
	if(!ji.submit_time)
		ji.submit_time = json_time(j, "qtime");
	ji.start_time = json_time(j, "stime");

	if(ji.is_complete())
		ji.end_time = json_time(j, "mtime");

	if(auto rl = j.find("Resource_List"); rl != j.end() && rl->is_object())
	{
		ji.cpu = json_unsigned(*rl, "ncpus");
		ji.memory = json_string(*rl, "mem");
		ji.gpu = json_unsigned(*rl, "ngpus");
		if(ji.gpu && *ji.gpu == 0)
			ji.gpu.reset();
	}

	if(auto ru = j.find("resources_used"); ru != j.end() && ru->is_object())
	{
		if(std::optional<std::string> wt = json_string(*ru, "walltime"))
			ji.runtime = parse_duration(*wt);
	}

	if(!ji.runtime && ji.status == job_status::running && ji.start_time && now >= *ji.start_time)
		ji.runtime = std::chrono::duration_cast<std::chrono::seconds>(now - *ji.start_time);

	ji.node = first_exec_host(json_string(j, "exec_host"));
	ji.stdout_path = strip_host(json_string(j, "Output_Path"));
	ji.stderr_path = strip_host(json_string(j, "Error_Path"));

	if(std::optional<std::string> dep = json_string(j, "depend"))
	{
		std::vector<std::string> ids = parse_depend(*dep);
		if(!ids.empty())
			ji.dependencies = std::move(ids);
	}

	ji.array_task_id = json_string(j, "array_index");
	return ji;
}

std::vector<job_info> parse_pbs_qstat_json(std::string_view json) noexcept
{
	std::vector<job_info> jobs;

	try
	{
		nlohmann::json j = nlohmann::json::parse(json.begin(), json.end(), nullptr, false);
		if(j.is_discarded() || !j.is_object())
		{
			log_debug(log_level_debug) << "PBS: malformed qstat JSON, ignoring" << std::endl;
			return jobs;
		}

		auto js = j.find("Jobs");
		if(js == j.end() || !js->is_object())
			return jobs;

		time_point now = clock_type::now();
		for(auto it = js->begin(); it != js->end(); ++it)
		{
			if(!it.value().is_object())
				continue;

			jobs.push_back(make_job_info(it.key(), it.value(), now));
		}
	}
	catch(const std::exception& e)
	{
		log_error() << "PBS: unable to parse qstat JSON: " << e.what() << std::endl;
		jobs.clear();
	}

	return jobs;
}

job_status pbs_state_to_status(std::string_view state, std::optional<int> exit_status)
{
	std::string_view s = trim(state);
	if(s.size() != 1)
		return job_status::unknown;

	switch(s[0])
	{
		case 'Q':
		case 'H':
		case 'W':
		case 'T':
		case 'S':
		case 'U':
			return job_status::pending;

		case 'R':
		case 'E':
		case 'B':
			return job_status::running;

		case 'X':
			return job_status::completed;

		case 'F':
			if(exit_status == 0)
				return job_status::completed;
			if(exit_status == pbs_exit_deleted)
				return job_status::cancelled;
			return job_status::failed;

		default:
			return job_status::unknown;
	}
}

std::optional<std::string> parse_pbs_qsub_output(std::string_view output)
{
	std::optional<std::string> id;
	for_each_line(output, [&id](std::string_view line, size_t) {
		line = trim(line);
		if(!id && !line.empty())
			id = std::string(line);
	});
	return id;
}

pbs_scheduler::pbs_scheduler(command_runner& runner) :
	scheduler(runner)
{}

std::vector<std::string> pbs_scheduler::resource_args(const job_spec& job) const
{
	std::vector<std::string> args{"-N", job.name, "-S", job.shell};

	std::string select;
	if(job.cpu)
		select += ":ncpus=" + std::to_string(*job.cpu);
	if(job.memory)
		select += ":mem=" + *job.memory;
	if(job.gpu)
		select += ":ngpus=" + std::to_string(*job.gpu);

	if(!select.empty())
		args.insert(args.end(), {"-l", "select=1" + select});

	if(job.time)
		args.insert(args.end(), {"-l", "walltime=" + *job.time});

	if(job.queue)
		args.insert(args.end(), {"-q", *job.queue});

	if(job.stdout_path)
		args.insert(args.end(), {"-o", job.stdout_path->string()});

	if(job.merge_output)
		args.insert(args.end(), {"-j", "oe"});
	else if(job.stderr_path)
		args.insert(args.end(), {"-e", job.stderr_path->string()});

	if(!job.dependencies.empty())
		args.insert(args.end(), {"-W", "depend=afterok:" + join(job.dependencies, ":")});

	return args;
}

std::vector<std::string> pbs_scheduler::build_submit_command(const job_spec& job) const
{
	std::vector<std::string> argv{"qsub"};
	std::vector<std::string> res = resource_args(job);
	argv.insert(argv.end(), res.begin(), res.end());
	argv.insert(argv.end(), job.raw_args.begin(), job.raw_args.end());
	return argv;
}

job_result pbs_scheduler::submit(const job_spec& job, bool interactive)
{
	if(interactive)
	{
		std::vector<std::string> argv{"qsub", "-I"};
		std::vector<std::string> res = resource_args(job);
		argv.insert(argv.end(), res.begin(), res.end());
		argv.insert(argv.end(), job.raw_args.begin(), job.raw_args.end());
		argv.insert(argv.end(), {"--", job.shell, "-c", generate_script(job)});
		return run_interactive(argv);
	}

	std::string id = submit_script(build_submit_command(job), generate_script(job), parse_pbs_qsub_output);

	std::string seq = id.substr(0, id.find('.'));
	fs::path dir = submit_dir(job);
	record_submission(id, job, dir / (job.name + ".o" + seq), dir / (job.name + ".e" + seq));

	job_result res;
	res.job_id = id;
	res.scheduler = name();
	res.status = job_status::pending;
	res.stdout_path = get_output_path(id, output_stream::stdout_stream);
	res.stderr_path = get_output_path(id, output_stream::stderr_stream);
	return res;
}

array_job_result pbs_scheduler::submit_array(const array_spec& array)
{
	const job_spec& job = array.job;

	std::vector<std::string> argv{"qsub"};
	std::vector<std::string> res = resource_args(job);
	argv.insert(argv.end(), res.begin(), res.end());

	std::string range = std::to_string(array.start) + "-" + std::to_string(array.end) + ":" + std::to_string(array.step);
	if(array.max_concurrent)
		range += "%" + std::to_string(*array.max_concurrent);
	argv.insert(argv.end(), {"-J", range});

	argv.insert(argv.end(), job.raw_args.begin(), job.raw_args.end());

	std::string id = submit_script(argv, generate_script(job), parse_pbs_qsub_output);

	/* Subjob output lands in "<name>.o<seq>.<index>". */
	std::string seq = id.substr(0, id.find('['));
	fs::path dir = submit_dir(job);
	for(unsigned idx : array.indices())
	{
		std::string suffix = seq + "." + std::to_string(idx);
		record_submission(id + "." + std::to_string(idx), job, dir / (job.name + ".o" + suffix), dir / (job.name + ".e" + suffix));
	}

	return array_job_result{id, name(), array.start, array.end, array.step};
}

std::string pbs_scheduler::native_job_id(const std::string& job_id) const
{
	/* "1235[].server.4" -> "1235[4].server" */
	size_t br = job_id.find("[]");
	if(br == std::string::npos)
		return job_id;

	size_t dot = job_id.rfind('.');
	if(dot == std::string::npos || dot < br + 2)
		return job_id;

	std::string idx = job_id.substr(dot + 1);
	if(!parse_integer(idx))
		return job_id;

	return job_id.substr(0, br) + "[" + idx + "]" + job_id.substr(br + 2, dot - br - 2);
}

bool pbs_scheduler::cancel(const std::string& job_id)
{
	return cancel_with(job_id, {"qdel", native_job_id(job_id)});
}

/* Listings always include subjobs (-t), so array tasks can be found by id. */
std::vector<job_info> pbs_scheduler::query(const std::vector<std::string>& argv)
{
	command_result res = run_command(argv);
	if(res.timed_out)
		throw scheduler_error("qstat timed out");

	if(res.exit_code != 0)
		throw scheduler_error("qstat failed with exit code " + std::to_string(res.exit_code) + ": " + std::string(trim(res.err)));

	/* No output is no jobs, but a broken document must not read as one. */
	std::string_view out = trim(res.out);
	if(!out.empty() && (out.front() != '{' || !nlohmann::json::accept(out.begin(), out.end())))
		throw scheduler_error("qstat produced malformed JSON");

	return parse_pbs_qstat_json(res.out);
}

std::vector<job_info> pbs_scheduler::list_active_jobs(const active_filter& filter)
{
	return apply_filter(query({"qstat", "-t", "-f", "-F", "json"}), filter);
}

bool pbs_scheduler::has_accounting() const noexcept
{
	return find_executable("qstat").has_value();
}

std::vector<job_info> pbs_scheduler::list_completed_jobs(const completed_filter& filter)
{
	if(!has_accounting())
		throw accounting_not_available(name());

	/* qstat won't combine -f with -u, so user filtering is ours. */
	return apply_filter(query({"qstat", "-x", "-t", "-f", "-F", "json"}), filter);
}

std::optional<job_info> pbs_scheduler::lookup_accounting(const std::string& job_id)
{
	std::string native = native_job_id(job_id);

	command_result res = run_command({"qstat", "-x", "-t", "-f", "-F", "json", native});
	if(!res.ok())
	{
		log_debug(log_level_debug) << "PBS: no history for " << job_id << ": " << trim(res.err) << std::endl;
		return std::nullopt;
	}

	for(job_info& ji : parse_pbs_qstat_json(res.out))
	{
		if(ji.matches_id(job_id) || ji.matches_id(native))
			return std::move(ji);
	}

	return std::nullopt;
}

}
