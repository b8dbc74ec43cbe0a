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
#include <ostream>
#include <libxml/parser.h>
#include <libxml/tree.h>
#include "scheduler.hpp"

namespace hpcmon {

struct xml_doc_deleter
{
	using pointer = xmlDocPtr;
	void operator()(pointer p) noexcept { xmlFreeDoc(p); }
};
using xml_doc_ptr = std::unique_ptr<xmlDoc, xml_doc_deleter>;

struct xml_char_deleter
{
	using pointer = xmlChar*;
	void operator()(pointer p) noexcept { xmlFree(p); }
};
using xml_char_ptr = std::unique_ptr<xmlChar, xml_char_deleter>;

static bool node_is(const xmlNode *node, const char *name) noexcept
{
	return node->type == XML_ELEMENT_NODE && strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

/* Trimmed text content, absent if empty. */
static std::optional<std::string> node_text(xmlNode *node)
{
	xml_char_ptr content(xmlNodeGetContent(node));
	if(!content)
		return std::nullopt;

	std::string_view s = trim(reinterpret_cast<const char*>(content.get()));
	if(s.empty())
		return std::nullopt;

	return std::string(s);
}

static std::optional<unsigned> to_unsigned(const std::optional<std::string>& s) noexcept
{
	if(!s)
		return std::nullopt;

	std::optional<long long> v = parse_integer(*s);
	if(!v || *v < 0)
		return std::nullopt;

	return static_cast<unsigned>(*v);
}

/* Epoch seconds from older releases, ISO 8601 from newer ones. */
static std::optional<time_point> parse_xml_time(const std::optional<std::string>& s) noexcept
{
	if(!s)
		return std::nullopt;

	if(std::optional<time_point> t = parse_epoch(*s))
		return t;

	return parse_local_time(*s, "%Y-%m-%dT%H:%M:%S");
}

static void split_queue_host(std::string_view qh, sge_job_record& rec)
{
	size_t at = qh.find('@');
	if(at == std::string_view::npos)
	{
		rec.queue = std::string(qh);
		return;
	}

	rec.queue = std::string(qh.substr(0, at));
	if(at + 1 < qh.size())
		rec.host = std::string(qh.substr(at + 1));
}

static std::optional<sge_job_record> parse_job_list(xmlNode *job)
{
	sge_job_record rec;
	std::optional<std::string> queue_name, hard_queue;
	bool have_id = false;

	for(xmlNode *c = job->children; c != nullptr; c = c->next)
	{
		if(c->type != XML_ELEMENT_NODE)
			continue;

		if(node_is(c, "JB_job_number"))
		{
			if(std::optional<std::string> id = node_text(c))
			{
				rec.job_id = std::move(*id);
				have_id = true;
			}
		}
		else if(node_is(c, "JB_name"))
			rec.name = node_text(c);
		else if(node_is(c, "JB_owner"))
			rec.user = node_text(c);
		else if(node_is(c, "state"))
			rec.state = node_text(c);
		else if(node_is(c, "JAT_prio"))
			rec.priority = node_text(c);
		else if(node_is(c, "queue_name"))
			queue_name = node_text(c);
		else if(node_is(c, "hard_req_queue"))
			hard_queue = node_text(c);
		else if(node_is(c, "slots"))
			rec.slots = to_unsigned(node_text(c));
		else if(node_is(c, "JB_submission_time"))
			rec.submit_time = parse_xml_time(node_text(c));
		else if(node_is(c, "JAT_start_time"))
			rec.start_time = parse_xml_time(node_text(c));
		else if(node_is(c, "tasks"))
			rec.array_task_id = node_text(c);
	}

	if(!have_id)
		return std::nullopt;

	if(queue_name)
		split_queue_host(*queue_name, rec);
	else if(hard_queue)
		rec.queue = std::move(hard_queue);

	return rec;
}

static void collect_job_lists(xmlNode *node, std::vector<sge_job_record>& jobs)
{
	for(xmlNode *n = node; n != nullptr; n = n->next)
	{
		if(n->type != XML_ELEMENT_NODE)
			continue;

		if(node_is(n, "job_list"))
		{
			if(std::optional<sge_job_record> rec = parse_job_list(n))
				jobs.push_back(std::move(*rec));
			continue;
		}

		collect_job_lists(n->children, jobs);
	}
}

static xml_doc_ptr read_xml(std::string_view xml) noexcept
{
	return xml_doc_ptr(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), nullptr, nullptr,
		XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
}

bool qstat_xml_well_formed(std::string_view xml) noexcept
{
	if(trim(xml).empty())
		return true;

	xml_doc_ptr doc = read_xml(xml);
	return doc && xmlDocGetRootElement(doc.get()) != nullptr;
}

std::vector<sge_job_record> parse_qstat_xml(std::string_view xml) noexcept
{
	std::vector<sge_job_record> jobs;

	if(trim(xml).empty())
		return jobs;

	try
	{
		xml_doc_ptr doc = read_xml(xml);
		if(!doc)
		{
			log_debug(log_level_debug) << "SGE: malformed qstat XML, ignoring" << std::endl;
			return jobs;
		}

		collect_job_lists(xmlDocGetRootElement(doc.get()), jobs);
	}
	catch(const std::exception& e)
	{
		log_error() << "SGE: unable to parse qstat XML: " << e.what() << std::endl;
		jobs.clear();
	}

	return jobs;
}

std::vector<sge_job_record> parse_qstat_plain(std::string_view output)
{
	std::vector<sge_job_record> jobs;
	bool data_started = false;

	for_each_line(output, [&jobs, &data_started](std::string_view line, size_t) {
		if(!line.empty() && line.front() == '-')
		{
			data_started = true;
			return;
		}

		if(!data_started)
			return;

		std::vector<std::string_view> tok = split_whitespace(line);
		if(tok.size() < 5)
			return;

		sge_job_record rec;
		rec.job_id = std::string(tok[0]);
		rec.priority = std::string(tok[1]);
		rec.name = std::string(tok[2]);
		rec.user = std::string(tok[3]);
		rec.state = std::string(tok[4]);

		job_status status = sge_state_to_status(tok[4]);

		if(tok.size() >= 7)
		{
			std::string when(tok[5]);
			when.append(" ").append(tok[6]);
			std::optional<time_point> t = parse_local_time(when, "%m/%d/%Y %H:%M:%S");
			if(status == job_status::running)
				rec.start_time = t;
			else
				rec.submit_time = t;
		}

		/* Pending jobs have no queue column, so slots shift left. */
		size_t slots_idx = 8;
		if(tok.size() >= 8)
		{
			if(status == job_status::pending && parse_integer(tok[7]))
				slots_idx = 7;
			else
				split_queue_host(tok[7], rec);
		}

		if(tok.size() > slots_idx)
		{
			if(std::optional<long long> slots = parse_integer(tok[slots_idx]); slots && *slots >= 0)
				rec.slots = static_cast<unsigned>(*slots);
		}

		if(tok.size() > slots_idx + 1)
			rec.array_task_id = std::string(tok[slots_idx + 1]);

		jobs.push_back(std::move(rec));
	});

	return jobs;
}

static void parse_qacct_line(std::string_view line, sge_accounting_map& m)
{
	std::vector<std::string_view> kv = split_whitespace(line, 2);
	if(kv.size() != 2)
		return;

	m[std::string(kv[0])] = std::string(trim(kv[1]));
}

sge_accounting_map parse_qacct_output(std::string_view output)
{
	sge_accounting_map m;
	for_each_line(output, [&m](std::string_view line, size_t) {
		if(!line.empty() && line.front() == '=')
			return;

		parse_qacct_line(line, m);
	});
	return m;
}

std::vector<sge_accounting_map> parse_qacct_records(std::string_view output)
{
	std::vector<sge_accounting_map> records;
	sge_accounting_map current;

	for_each_line(output, [&records, &current](std::string_view line, size_t) {
		if(!line.empty() && line.front() == '=')
		{
			if(!current.empty())
				records.push_back(std::move(current));
			current.clear();
			return;
		}

		parse_qacct_line(line, current);
	});

	if(!current.empty())
		records.push_back(std::move(current));

	return records;
}

static std::optional<std::string> lookup(const sge_accounting_map& m, const char *key)
{
	auto it = m.find(key);
	if(it == m.end() || it->second.empty())
		return std::nullopt;
	return it->second;
}

/* qacct's date format has changed between releases. */
static std::optional<time_point> parse_qacct_time(const std::optional<std::string>& s) noexcept
{
	static const char *formats[] = {
		"%a %b %d %H:%M:%S %Y",
		"%m/%d/%Y %H:%M:%S",
		"%Y-%m-%d %H:%M:%S",
		nullptr
	};

	if(!s)
		return std::nullopt;

	for(const char **f = formats; *f != nullptr; ++f)
	{
		if(std::optional<time_point> t = parse_local_time(*s, *f))
			return t;
	}

	return std::nullopt;
}

sge_accounting_record make_accounting_record(const sge_accounting_map& m)
{
	sge_accounting_record rec;
	rec.job_id = lookup(m, "jobnumber");
	rec.name = lookup(m, "jobname");
	rec.owner = lookup(m, "owner");
	rec.queue = lookup(m, "qname");
	rec.host = lookup(m, "hostname");
	rec.failed = lookup(m, "failed");

	if(std::optional<std::string> task = lookup(m, "taskid"); task && *task != "undefined")
		rec.task_id = std::move(task);

	rec.submit_time = parse_qacct_time(lookup(m, "qsub_time"));
	rec.start_time = parse_qacct_time(lookup(m, "start_time"));
	rec.end_time = parse_qacct_time(lookup(m, "end_time"));

	if(std::optional<std::string> s = lookup(m, "exit_status"))
	{
		/* "137 (Killed)" on some releases */
		std::vector<std::string_view> tok = split_whitespace(*s);
		if(std::optional<long long> v = parse_integer(tok[0]))
			rec.exit_status = static_cast<int>(*v);
	}

	if(std::optional<std::string> s = lookup(m, "slots"))
	{
		if(std::optional<long long> v = parse_integer(*s); v && *v >= 0)
			rec.slots = static_cast<unsigned>(*v);
	}

	if(std::optional<std::string> s = lookup(m, "ru_wallclock"))
	{
		std::string_view w = *s;
		size_t dot = w.find('.');
		if(dot != std::string_view::npos)
			w = w.substr(0, dot);
		if(std::optional<long long> v = parse_integer(w); v && *v >= 0)
			rec.wallclock = std::chrono::seconds(*v);
		else
			rec.wallclock = parse_duration(*s);
	}

	rec.maxvmem = lookup(m, "maxvmem");
	return rec;
}

job_status sge_state_to_status(std::string_view state)
{
	std::string s = to_lower(trim(state));

	if(s == "r" || s == "t" || s == "rr" || s == "rt")
		return job_status::running;
	else if(s == "qw" || s == "hqw")
		return job_status::pending;
	else if(s == "eqw")
		return job_status::failed;
	else if(s == "dr" || s == "dt")
		return job_status::cancelled;
	else if(s == "s" || s == "ts" || s == "ss")
		return job_status::pending;

	return job_status::unknown;
}

job_status sge_accounting_status(const sge_accounting_record& rec) noexcept
{
	/* "failed" may carry a reason, e.g. "100 : assumed after job". */
	bool failed = false;
	if(rec.failed)
	{
		std::string_view f = trim(*rec.failed);
		f = f.substr(0, f.find_first_of(" \t:"));
		std::optional<long long> code = parse_integer(f);
		failed = !code || *code != 0;
	}

	if(!failed && rec.exit_status == 0)
		return job_status::completed;

	if(!failed && rec.exit_status == 137)
		return job_status::cancelled;

	return job_status::failed;
}

static std::optional<std::string> digits_after(std::string_view output, std::string_view prefix)
{
	size_t pos = output.find(prefix);
	if(pos == std::string_view::npos)
		return std::nullopt;

	pos += prefix.size();
	size_t end = pos;
	while(end < output.size() && output[end] >= '0' && output[end] <= '9')
		++end;

	if(end == pos)
		return std::nullopt;

	return std::string(output.substr(pos, end - pos));
}

std::optional<std::string> parse_qsub_output(std::string_view output)
{
	if(std::optional<std::string> id = digits_after(output, "Your job "))
		return id;

	return digits_after(output, "Your job-array ");
}

job_info make_job_info(const sge_job_record& rec, time_point now)
{
	job_info ji;
	ji.job_id = rec.job_id;
	ji.name = rec.name.value_or("");
	ji.user = rec.user.value_or("");
	ji.status = rec.state ? sge_state_to_status(*rec.state) : job_status::unknown;
	ji.queue = rec.queue;
	ji.node = rec.host;
	ji.cpu = rec.slots;
	ji.submit_time = rec.submit_time;
	ji.start_time = rec.start_time;
	ji.array_task_id = rec.array_task_id;

	if(ji.status == job_status::running && ji.start_time && now >= *ji.start_time)
		ji.runtime = std::chrono::duration_cast<std::chrono::seconds>(now - *ji.start_time);

	return ji;
}

job_info make_job_info(const sge_accounting_record& rec)
{
	job_info ji;
	ji.job_id = rec.job_id.value_or("");
	ji.name = rec.name.value_or("");
	ji.user = rec.owner.value_or("");
	ji.status = sge_accounting_status(rec);
	ji.queue = rec.queue;
	ji.node = rec.host;
	ji.array_task_id = rec.task_id;
	ji.submit_time = rec.submit_time;
	ji.start_time = rec.start_time;
	ji.end_time = rec.end_time;
	ji.exit_code = rec.exit_status;
	ji.cpu = rec.slots;
	ji.memory = rec.maxvmem;

	if(rec.wallclock)
		ji.runtime = rec.wallclock;
	else if(rec.start_time && rec.end_time && *rec.end_time >= *rec.start_time)
		ji.runtime = std::chrono::duration_cast<std::chrono::seconds>(*rec.end_time - *rec.start_time);

	return ji;
}

sge_scheduler::sge_scheduler(command_runner& runner) :
	scheduler(runner),
	m_pe_name(get_env("HPCMON_SGE_PE"))
{
	if(m_pe_name.empty())
		m_pe_name = "smp";
}

std::vector<std::string> sge_scheduler::resource_args(const job_spec& job) const
{
	std::vector<std::string> args{"-N", job.name, "-S", job.shell};

	if(job.cpu)
		args.insert(args.end(), {"-pe", m_pe_name, std::to_string(*job.cpu)});

	if(job.memory)
		args.insert(args.end(), {"-l", "h_vmem=" + *job.memory});

	if(job.time)
		args.insert(args.end(), {"-l", "h_rt=" + *job.time});

	if(job.queue)
		args.insert(args.end(), {"-q", *job.queue});

	if(job.gpu)
		args.insert(args.end(), {"-l", "gpu=" + std::to_string(*job.gpu)});

	if(job.workdir)
		args.insert(args.end(), {"-wd", job.workdir->string()});
	else
		args.push_back("-cwd");

	if(job.stdout_path)
		args.insert(args.end(), {"-o", job.stdout_path->string()});

	if(job.merge_output)
		args.insert(args.end(), {"-j", "y"});
	else if(job.stderr_path)
		args.insert(args.end(), {"-e", job.stderr_path->string()});

	if(!job.dependencies.empty())
		args.insert(args.end(), {"-hold_jid", join(job.dependencies, ",")});

	return args;
}

std::vector<std::string> sge_scheduler::build_submit_command(const job_spec& job) const
{
	std::vector<std::string> argv{"qsub"};
	std::vector<std::string> res = resource_args(job);
	argv.insert(argv.end(), res.begin(), res.end());
	argv.insert(argv.end(), job.raw_args.begin(), job.raw_args.end());
	return argv;
}

job_result sge_scheduler::submit(const job_spec& job, bool interactive)
{
	if(interactive)
	{
		std::vector<std::string> argv{"qrsh", "-now", "no"};
		std::vector<std::string> res = resource_args(job);
		argv.insert(argv.end(), res.begin(), res.end());
		argv.insert(argv.end(), job.raw_args.begin(), job.raw_args.end());
		argv.insert(argv.end(), {job.shell, "-c", generate_script(job)});
		return run_interactive(argv);
	}

	std::string id = submit_script(build_submit_command(job), generate_script(job), parse_qsub_output);

	fs::path dir = submit_dir(job);
	record_submission(id, job, dir / (job.name + ".o" + id), dir / (job.name + ".e" + id));

	job_result res;
	res.job_id = id;
	res.scheduler = name();
	res.status = job_status::pending;
	res.stdout_path = get_output_path(id, output_stream::stdout_stream);
	res.stderr_path = get_output_path(id, output_stream::stderr_stream);
	return res;
}

array_job_result sge_scheduler::submit_array(const array_spec& array)
{
	const job_spec& job = array.job;

	std::vector<std::string> argv{"qsub"};
	std::vector<std::string> res = resource_args(job);
	argv.insert(argv.end(), res.begin(), res.end());

	argv.insert(argv.end(), {"-t", std::to_string(array.start) + "-" + std::to_string(array.end) + ":" + std::to_string(array.step)});
	if(array.max_concurrent)
		argv.insert(argv.end(), {"-tc", std::to_string(*array.max_concurrent)});

	argv.insert(argv.end(), job.raw_args.begin(), job.raw_args.end());

	std::string id = submit_script(argv, generate_script(job), parse_qsub_output);

	fs::path dir = submit_dir(job);
	for(unsigned idx : array.indices())
	{
		std::string sidx = std::to_string(idx);
		record_submission(id + "." + sidx, job,
			dir / (job.name + ".o" + id + "." + sidx),
			dir / (job.name + ".e" + id + "." + sidx)
		);
	}

	return array_job_result{id, name(), array.start, array.end, array.step};
}

bool sge_scheduler::cancel(const std::string& job_id)
{
	std::vector<std::string> argv{"qdel"};

	/* qdel wants "123 -t 4" for a single task. */
	size_t dot = job_id.find('.');
	if(dot == std::string::npos)
		argv.push_back(job_id);
	else
		argv.insert(argv.end(), {job_id.substr(0, dot), "-t", job_id.substr(dot + 1)});

	return cancel_with(job_id, argv);
}

std::vector<job_info> sge_scheduler::list_active_jobs(const active_filter& filter)
{
	std::string user = filter.user.value_or("*");
	time_point now = clock_type::now();

	std::vector<sge_job_record> records;

	command_result res = run_command({"qstat", "-xml", "-u", user});
	if(res.timed_out)
		throw scheduler_error("qstat timed out");

	if(res.exit_code == 0)
	{
		/* Empty output is an empty queue; a broken document is a failed query. */
		if(!qstat_xml_well_formed(res.out))
			throw scheduler_error("qstat produced malformed XML");

		records = parse_qstat_xml(res.out);
	}
	else
	{
		log_debug(log_level_debug) << "SGE: qstat -xml failed with " << res.exit_code << ", falling back to plain output" << std::endl;

		res = run_command({"qstat", "-u", user});
		if(res.timed_out)
			throw scheduler_error("qstat timed out");

		if(res.exit_code != 0)
			throw scheduler_error("qstat failed with exit code " + std::to_string(res.exit_code) + ": " + std::string(trim(res.err)));

		records = parse_qstat_plain(res.out);
	}

	std::vector<job_info> jobs;
	jobs.reserve(records.size());
	for(const sge_job_record& rec : records)
		jobs.push_back(make_job_info(rec, now));

	return apply_filter(std::move(jobs), filter);
}

bool sge_scheduler::has_accounting() const noexcept
{
	return find_executable("qacct").has_value();
}

std::vector<job_info> sge_scheduler::list_completed_jobs(const completed_filter& filter)
{
	if(!has_accounting())
		throw accounting_not_available(name());

	std::vector<std::string> argv{"qacct", "-j"};

	if(filter.user && *filter.user != "*")
		argv.insert(argv.end(), {"-o", *filter.user});

	if(filter.queue)
		argv.insert(argv.end(), {"-q", *filter.queue});

	if(filter.since)
	{
		using namespace std::chrono;
		auto age = duration_cast<hours>(clock_type::now() - *filter.since);
		long long days = std::max<long long>(1, (age.count() + 23) / 24);
		argv.insert(argv.end(), {"-d", std::to_string(days)});
	}

	command_result res = run_command(argv);
	if(res.timed_out)
		throw scheduler_error("qacct timed out");

	/* qacct exits non-zero when nothing matches. */
	if(res.exit_code != 0)
	{
		if(trim(res.out).empty())
		{
			log_debug(log_level_debug) << "SGE: qacct returned " << res.exit_code << ": " << trim(res.err) << std::endl;
			return {};
		}

		throw scheduler_error("qacct failed with exit code " + std::to_string(res.exit_code) + ": " + std::string(trim(res.err)));
	}

	std::vector<job_info> jobs;
	for(const sge_accounting_map& m : parse_qacct_records(res.out))
		jobs.push_back(make_job_info(make_accounting_record(m)));

	return apply_filter(std::move(jobs), filter);
}

std::optional<job_info> sge_scheduler::lookup_accounting(const std::string& job_id)
{
	std::string base = job_id.substr(0, job_id.find('.'));

	command_result res = run_command({"qacct", "-j", base});
	if(!res.ok())
	{
		log_debug(log_level_debug) << "SGE: no accounting record for " << job_id << std::endl;
		return std::nullopt;
	}

	for(const sge_accounting_map& m : parse_qacct_records(res.out))
	{
		job_info ji = make_job_info(make_accounting_record(m));
		if(ji.matches_id(job_id))
			return ji;
	}

	return std::nullopt;
}

}
