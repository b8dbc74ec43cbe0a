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
#include <cctype>
#include <ostream>
#include "scheduler.hpp"

namespace hpcmon {

/* Field order must match the parsers below. */
static constexpr const char *squeue_format = "%i|%j|%u|%T|%P|%V|%S|%C|%m|%b|%N|%E|%K";
static constexpr const char *sacct_format = "--format=JobID,JobName,User,State,Partition,Submit,Start,End,Elapsed,AllocCPUS,ReqMem,ExitCode,NodeList";

static bool is_null_field(std::string_view s) noexcept
{
	return s.empty() || s == "N/A" || s == "(null)" || s == "Unknown" || s == "None" || s == "n/a";
}

static std::optional<std::string> opt_field(const std::vector<std::string_view>& f, size_t i)
{
	if(i >= f.size())
		return std::nullopt;

	std::string_view s = trim(f[i]);
	if(is_null_field(s))
		return std::nullopt;

	return std::string(s);
}

static std::optional<time_point> time_field(const std::vector<std::string_view>& f, size_t i)
{
	std::optional<std::string> s = opt_field(f, i);
	if(!s)
		return std::nullopt;

	return parse_local_time(*s, "%Y-%m-%dT%H:%M:%S");
}

static std::optional<unsigned> unsigned_field(const std::vector<std::string_view>& f, size_t i)
{
	std::optional<std::string> s = opt_field(f, i);
	if(!s)
		return std::nullopt;

	std::optional<long long> v = parse_integer(*s);
	if(!v || *v < 0)
		return std::nullopt;

	return static_cast<unsigned>(*v);
}

/* "gpu:2", "gpu:a100:2", "gres:gpu:2", "gres/gpu:2" */
static std::optional<unsigned> parse_gres_gpus(const std::optional<std::string>& gres)
{
	if(!gres)
		return std::nullopt;

	std::optional<unsigned> total;
	for(std::string_view g : split_fields(*gres, ','))
	{
		if(g.find("gpu") == std::string_view::npos)
			continue;

		size_t colon = g.find_last_of(':');
		if(colon == std::string_view::npos)
			continue;

		/* Strip "(IDX:0-1)" and friends. */
		std::string_view n = g.substr(colon + 1);
		n = n.substr(0, n.find('('));
		if(std::optional<long long> v = parse_integer(n); v && *v >= 0)
			total = total.value_or(0) + static_cast<unsigned>(*v);
	}
	return total;
}

/* "afterok:123(unfulfilled),afterany:456_*" */
static std::vector<std::string> parse_dependency_ids(std::string_view dep)
{
	std::vector<std::string> ids;
	for(std::string_view d : split_fields(dep, ','))
	{
		d = d.substr(0, d.find('('));
		std::vector<std::string_view> parts = split_fields(d, ':');
		for(size_t i = 1; i < parts.size(); ++i)
		{
			std::string_view id = trim(parts[i]);
			if(!id.empty())
				ids.emplace_back(id);
		}
	}
	return ids;
}

/* "123_4" -> "4", "123_[1-10%2]" -> "1-10%2" */
static std::optional<std::string> task_from_id(std::string_view id)
{
	size_t us = id.find('_');
	if(us == std::string_view::npos || us + 1 >= id.size())
		return std::nullopt;

	std::string_view t = id.substr(us + 1);
	if(t.front() == '[' && t.back() == ']')
		t = t.substr(1, t.size() - 2);

	return std::string(t);
}

/* Older releases append 'n' (per node) or 'c' (per cpu) to ReqMem. */
static std::optional<std::string> normalise_memory(std::optional<std::string> mem)
{
	if(!mem || *mem == "0")
		return std::nullopt;

	if(mem->size() >= 2 && (mem->back() == 'n' || mem->back() == 'c') && isalpha(static_cast<unsigned char>((*mem)[mem->size() - 2])))
		mem->pop_back();

	return mem;
}

std::vector<slurm_job_record> parse_squeue_output(std::string_view output)
{
	std::vector<slurm_job_record> jobs;

	for_each_line(output, [&jobs](std::string_view line, size_t) {
		if(trim(line).empty())
			return;

		std::vector<std::string_view> f = split_fields(line, '|');
		if(f.size() < 4)
			return;

		slurm_job_record rec;
		rec.job_id = std::string(trim(f[0]));
		rec.name = opt_field(f, 1);
		rec.user = opt_field(f, 2);
		rec.state = opt_field(f, 3);
		rec.partition = opt_field(f, 4);
		rec.submit_time = time_field(f, 5);
		rec.start_time = time_field(f, 6);
		rec.cpus = unsigned_field(f, 7);
		rec.memory = normalise_memory(opt_field(f, 8));
		rec.gpus = parse_gres_gpus(opt_field(f, 9));
		rec.nodes = opt_field(f, 10);

		if(std::optional<std::string> dep = opt_field(f, 11))
			rec.dependencies = parse_dependency_ids(*dep);

		rec.array_task_id = opt_field(f, 12);
		if(!rec.array_task_id)
			rec.array_task_id = task_from_id(rec.job_id);

		jobs.push_back(std::move(rec));
	});

	return jobs;
}

/* "0:0" -> 0, "1:0" -> 1, "0:9" -> 137 */
static std::optional<int> parse_exit_code(const std::optional<std::string>& s)
{
	if(!s)
		return std::nullopt;

	std::vector<std::string_view> parts = split_fields(*s, ':');
	std::optional<long long> code = parse_integer(parts[0]);
	if(!code)
		return std::nullopt;

	if(*code == 0 && parts.size() > 1)
	{
		if(std::optional<long long> sig = parse_integer(parts[1]); sig && *sig > 0)
			return static_cast<int>(128 + *sig);
	}

	return static_cast<int>(*code);
}

std::vector<slurm_job_record> parse_sacct_output(std::string_view output)
{
	std::vector<slurm_job_record> jobs;

	for_each_line(output, [&jobs](std::string_view line, size_t) {
		if(trim(line).empty())
			return;

		std::vector<std::string_view> f = split_fields(line, '|');
		if(f.size() < 4)
			return;

		slurm_job_record rec;
		rec.job_id = std::string(trim(f[0]));
		rec.name = opt_field(f, 1);
		rec.user = opt_field(f, 2);
		rec.state = opt_field(f, 3);
		rec.partition = opt_field(f, 4);
		rec.submit_time = time_field(f, 5);
		rec.start_time = time_field(f, 6);
		rec.end_time = time_field(f, 7);

		if(std::optional<std::string> e = opt_field(f, 8))
			rec.elapsed = parse_duration(*e);

		rec.cpus = unsigned_field(f, 9);
		rec.memory = normalise_memory(opt_field(f, 10));
		rec.exit_code = parse_exit_code(opt_field(f, 11));
		rec.nodes = opt_field(f, 12);
		if(rec.nodes && *rec.nodes == "None assigned")
			rec.nodes.reset();

		rec.array_task_id = task_from_id(rec.job_id);

		jobs.push_back(std::move(rec));
	});

	return jobs;
}

job_status slurm_state_to_status(std::string_view state)
{
	/* "CANCELLED by 1234" */
	std::vector<std::string_view> words = split_whitespace(state);
	if(words.empty())
		return job_status::unknown;

	std::string s = to_lower(words[0]);
	if(!s.empty() && s.back() == '+')
		s.pop_back();

	if(s == "pending" || s == "configuring" || s == "requeued" || s == "suspended" || s == "pd")
		return job_status::pending;
	else if(s == "running" || s == "completing" || s == "r" || s == "cg")
		return job_status::running;
	else if(s == "completed" || s == "cd")
		return job_status::completed;
	else if(s == "failed" || s == "node_fail" || s == "out_of_memory" || s == "boot_fail" || s == "deadline" ||
		s == "f" || s == "nf" || s == "oom")
		return job_status::failed;
	else if(s == "cancelled" || s == "ca")
		return job_status::cancelled;
	else if(s == "timeout" || s == "to")
		return job_status::timeout;

	return job_status::unknown;
}

std::optional<std::string> parse_sbatch_output(std::string_view output)
{
	std::optional<std::string> id;
	for_each_line(output, [&id](std::string_view line, size_t) {
		line = trim(line);
		if(id || line.empty())
			return;

		constexpr std::string_view prefix = "Submitted batch job ";
		if(line.substr(0, prefix.size()) == prefix)
			line = trim(line.substr(prefix.size()));

		/* --parsable gives "id[;cluster]" */
		line = line.substr(0, line.find(';'));
		if(!line.empty() && parse_integer(line) && line.find_first_not_of("0123456789") == std::string_view::npos)
			id = std::string(line);
	});
	return id;
}

job_info make_job_info(const slurm_job_record& rec, time_point now)
{
	job_info ji;
	ji.job_id = rec.job_id;
	ji.name = rec.name.value_or("");
	ji.user = rec.user.value_or("");
	ji.status = rec.state ? slurm_state_to_status(*rec.state) : job_status::unknown;
	ji.queue = rec.partition;
	ji.submit_time = rec.submit_time;
	ji.start_time = rec.start_time;
	ji.end_time = rec.end_time;
	ji.cpu = rec.cpus;
	ji.memory = rec.memory;
	ji.gpu = rec.gpus;
	ji.node = rec.nodes;
	ji.exit_code = rec.exit_code;
	ji.array_task_id = rec.array_task_id;

	if(!rec.dependencies.empty())
		ji.dependencies = rec.dependencies;

	if(rec.elapsed)
		ji.runtime = rec.elapsed;
	else if(ji.status == job_status::running && ji.start_time && now >= *ji.start_time)
		ji.runtime = std::chrono::duration_cast<std::chrono::seconds>(now - *ji.start_time);

	return ji;
}

slurm_scheduler::slurm_scheduler(command_runner& runner) :
	scheduler(runner)
{}

std::string slurm_scheduler::native_job_id(const std::string& job_id) const
{
	/* "123.4" -> "123_4"; "123.batch" style step ids aren't tasks. */
	size_t dot = job_id.find('.');
	if(dot == std::string::npos || !parse_integer(std::string_view(job_id).substr(dot + 1)))
		return job_id;

	std::string id = job_id;
	id[dot] = '_';
	return id;
}

std::vector<std::string> slurm_scheduler::resource_args(const job_spec& job) const
{
	std::vector<std::string> args{"--job-name=" + job.name};

	if(job.cpu)
		args.push_back("--cpus-per-task=" + std::to_string(*job.cpu));

	if(job.memory)
		args.push_back("--mem=" + *job.memory);

	if(job.time)
		args.push_back("--time=" + *job.time);

	if(job.queue)
		args.push_back("--partition=" + *job.queue);

	if(job.gpu)
		args.push_back("--gres=gpu:" + std::to_string(*job.gpu));

	if(job.workdir)
		args.push_back("--chdir=" + job.workdir->string());

	if(job.stdout_path)
		args.push_back("--output=" + job.stdout_path->string());

	/* Slurm merges unless told otherwise. */
	if(!job.merge_output && job.stderr_path)
		args.push_back("--error=" + job.stderr_path->string());

	if(!job.dependencies.empty())
		args.push_back("--dependency=afterok:" + join(job.dependencies, ":"));

	return args;
}

std::vector<std::string> slurm_scheduler::build_submit_command(const job_spec& job) const
{
	std::vector<std::string> argv{"sbatch", "--parsable"};
	std::vector<std::string> res = resource_args(job);
	argv.insert(argv.end(), res.begin(), res.end());
	argv.insert(argv.end(), job.raw_args.begin(), job.raw_args.end());
	return argv;
}

job_result slurm_scheduler::submit(const job_spec& job, bool interactive)
{
	if(interactive)
	{
		std::vector<std::string> argv{"srun"};
		std::vector<std::string> res = resource_args(job);
		argv.insert(argv.end(), res.begin(), res.end());
		argv.insert(argv.end(), job.raw_args.begin(), job.raw_args.end());
		argv.insert(argv.end(), {"--pty", job.shell, "-c", generate_script(job)});
		return run_interactive(argv);
	}

	std::string id = submit_script(build_submit_command(job), generate_script(job), parse_sbatch_output);

	fs::path out = submit_dir(job) / ("slurm-" + id + ".out");
	record_submission(id, job, out, out);

	job_result res;
	res.job_id = id;
	res.scheduler = name();
	res.status = job_status::pending;
	res.stdout_path = get_output_path(id, output_stream::stdout_stream);
	res.stderr_path = get_output_path(id, output_stream::stderr_stream);
	return res;
}

array_job_result slurm_scheduler::submit_array(const array_spec& array)
{
	const job_spec& job = array.job;

	std::vector<std::string> argv{"sbatch", "--parsable"};
	std::vector<std::string> res = resource_args(job);
	argv.insert(argv.end(), res.begin(), res.end());

	std::string range = std::to_string(array.start) + "-" + std::to_string(array.end) + ":" + std::to_string(array.step);
	if(array.max_concurrent)
		range += "%" + std::to_string(*array.max_concurrent);
	argv.push_back("--array=" + range);

	argv.insert(argv.end(), job.raw_args.begin(), job.raw_args.end());

	std::string id = submit_script(argv, generate_script(job), parse_sbatch_output);

	fs::path dir = submit_dir(job);
	for(unsigned idx : array.indices())
	{
		std::string sidx = std::to_string(idx);
		fs::path out = dir / ("slurm-" + id + "_" + sidx + ".out");
		record_submission(id + "." + sidx, job, out, out);
	}

	return array_job_result{id, name(), array.start, array.end, array.step};
}

bool slurm_scheduler::cancel(const std::string& job_id)
{
	return cancel_with(job_id, {"scancel", native_job_id(job_id)});
}

std::vector<job_info> slurm_scheduler::list_active_jobs(const active_filter& filter)
{
	std::vector<std::string> argv{"squeue", "-h", "-o", squeue_format};
	if(filter.user && *filter.user != "*")
		argv.insert(argv.end(), {"-u", *filter.user});

	command_result res = run_command(argv);
	if(res.timed_out)
		throw scheduler_error("squeue timed out");

	if(res.exit_code != 0)
		throw scheduler_error("squeue failed with exit code " + std::to_string(res.exit_code) + ": " + std::string(trim(res.err)));

	time_point now = clock_type::now();
	std::vector<job_info> jobs;
	for(const slurm_job_record& rec : parse_squeue_output(res.out))
		jobs.push_back(make_job_info(rec, now));

	return apply_filter(std::move(jobs), filter);
}

bool slurm_scheduler::has_accounting() const noexcept
{
	return find_executable("sacct").has_value();
}

std::vector<job_info> slurm_scheduler::list_completed_jobs(const completed_filter& filter)
{
	if(!has_accounting())
		throw accounting_not_available(name());

	std::vector<std::string> argv{"sacct", "-X", "-n", "-P", sacct_format};

	if(filter.user && *filter.user != "*")
		argv.insert(argv.end(), {"-u", *filter.user});
	else
		argv.push_back("-a");

	if(filter.since)
		argv.insert(argv.end(), {"-S", format_local_time(*filter.since, "%Y-%m-%dT%H:%M:%S")});

	if(filter.until)
		argv.insert(argv.end(), {"-E", format_local_time(*filter.until, "%Y-%m-%dT%H:%M:%S")});

	if(filter.queue)
		argv.insert(argv.end(), {"-r", *filter.queue});

	command_result res = run_command(argv);
	if(res.timed_out)
		throw scheduler_error("sacct timed out");

	if(res.exit_code != 0)
		throw scheduler_error("sacct failed with exit code " + std::to_string(res.exit_code) + ": " + std::string(trim(res.err)));

	time_point now = clock_type::now();
	std::vector<job_info> jobs;
	for(const slurm_job_record& rec : parse_sacct_output(res.out))
		jobs.push_back(make_job_info(rec, now));

	return apply_filter(std::move(jobs), filter);
}

std::optional<job_info> slurm_scheduler::lookup_accounting(const std::string& job_id)
{
	std::string native = native_job_id(job_id);

	command_result res = run_command({"sacct", "-X", "-n", "-P", sacct_format, "-j", native});
	if(!res.ok())
	{
		log_debug(log_level_debug) << "SLURM: sacct lookup of " << native << " failed: " << trim(res.err) << std::endl;
		return std::nullopt;
	}

	time_point now = clock_type::now();
	for(const slurm_job_record& rec : parse_sacct_output(res.out))
	{
		job_info ji = make_job_info(rec, now);
		if(ji.matches_id(native) || ji.matches_id(job_id))
			return ji;
	}

	return std::nullopt;
}

}
