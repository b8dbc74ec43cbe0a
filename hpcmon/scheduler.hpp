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
#ifndef _HPCMON_SCHEDULER_HPP
#define _HPCMON_SCHEDULER_HPP

#include <map>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include "job.hpp"

namespace hpcmon {

struct scheduler_error : public std::runtime_error
{
	explicit scheduler_error(const std::string& s) : std::runtime_error(s) {}
};

struct submission_error : public scheduler_error
{
	explicit submission_error(const std::string& s) : scheduler_error(s) {}
};

struct job_not_found : public scheduler_error
{
	explicit job_not_found(const std::string& id) : scheduler_error("Job " + id + " not found"), job_id(id) {}

	std::string job_id;
};

struct accounting_not_available : public scheduler_error
{
	explicit accounting_not_available(const std::string& sched) : scheduler_error("Job accounting is not available for " + sched) {}
};

struct active_filter
{
	std::optional<std::string> user;
	/* Empty means the active partition. */
	std::optional<status_set> status;
	std::optional<std::string> queue;
};

struct completed_filter
{
	std::optional<std::string> user;
	std::optional<time_point> since;
	std::optional<time_point> until;
	std::optional<int> exit_code;
	std::optional<std::string> queue;
	size_t limit = 100;
};

class scheduler
{
public:
	explicit scheduler(command_runner& runner) noexcept;
	virtual ~scheduler() = default;

	scheduler(const scheduler&) = delete;
	scheduler& operator=(const scheduler&) = delete;

	virtual const char *name() const noexcept = 0;

	virtual job_result submit(const job_spec& job, bool interactive = false) = 0;
	virtual array_job_result submit_array(const array_spec& array) = 0;
	virtual bool cancel(const std::string& job_id) = 0;

	virtual job_status get_status(const std::string& job_id) noexcept;
	virtual std::optional<int> get_exit_code(const std::string& job_id);
	virtual std::optional<fs::path> get_output_path(const std::string& job_id, output_stream stream);

	/* Shebang, module loads, exports, cd and the command. Flags go on the command line. */
	virtual std::string generate_script(const job_spec& job) const;
	virtual std::vector<std::string> build_submit_command(const job_spec& job) const = 0;

	virtual std::vector<job_info> list_active_jobs(const active_filter& filter = {}) = 0;
	virtual std::vector<job_info> list_completed_jobs(const completed_filter& filter = {}) = 0;
	virtual bool has_accounting() const noexcept = 0;
	virtual job_info get_job_details(const std::string& job_id);

protected:
	/* Accounting lookup for a single job, used by get_job_details(). */
	virtual std::optional<job_info> lookup_accounting(const std::string& job_id);

	/* Map a user-facing id ("123.4") to what the scheduler's tools expect. */
	virtual std::string native_job_id(const std::string& job_id) const;

	command_result run_command(const std::vector<std::string>& argv, std::string_view input = {});

	/* Feed the script to the submitter on stdin and pull the id out of its output. */
	std::string submit_script(const std::vector<std::string>& argv, const std::string& script,
		std::optional<std::string> (*parse)(std::string_view));
	job_result run_interactive(const std::vector<std::string>& argv);
	bool cancel_with(const std::string& job_id, const std::vector<std::string>& argv);

	/* Live listing lookup across all users and statuses. */
	std::optional<job_info> find_active(const std::string& job_id);

	/* Submit-side bookkeeping so get_output_path() works for our own jobs. */
	void record_submission(const std::string& job_id, const job_spec& job, const fs::path& default_out, const fs::path& default_err);

	static fs::path submit_dir(const job_spec& job);

	static std::vector<job_info> apply_filter(std::vector<job_info> jobs, const active_filter& filter);
	static std::vector<job_info> apply_filter(std::vector<job_info> jobs, const completed_filter& filter);

	command_runner& m_runner;

private:
	struct output_paths
	{
		std::optional<fs::path> out;
		std::optional<fs::path> err;
	};

	std::mutex m_paths_mutex;
	std::unordered_map<std::string, output_paths> m_paths;
};

/* detect.cpp */
constexpr std::chrono::seconds sge_probe_timeout{5};

bool probe_sge_qstat(command_runner& runner) noexcept;
std::string detect_scheduler(command_runner& runner);

enum class scheduler_kind
{
	unknown = 0,
	sge,
	slurm,
	pbs,
	local
};

NLOHMANN_JSON_SERIALIZE_ENUM(scheduler_kind, {
	{scheduler_kind::unknown,	"unknown"},
	{scheduler_kind::sge,		"sge"},
	{scheduler_kind::slurm,		"slurm"},
	{scheduler_kind::pbs,		"pbs"},
	{scheduler_kind::local,		"local"}
});

scheduler_kind parse_scheduler_kind(std::string_view name);
std::unique_ptr<scheduler> make_scheduler(std::string_view name, command_runner& runner);

/* sge.cpp */
struct sge_job_record
{
	std::string job_id;
	std::optional<std::string> name;
	std::optional<std::string> user;
	std::optional<std::string> state;
	std::optional<std::string> priority;
	std::optional<std::string> queue;
	std::optional<std::string> host;
	std::optional<unsigned> slots;
	std::optional<time_point> submit_time;
	std::optional<time_point> start_time;
	std::optional<std::string> array_task_id;
};

struct sge_accounting_record
{
	std::optional<std::string> job_id;
	std::optional<std::string> name;
	std::optional<std::string> owner;
	std::optional<std::string> queue;
	std::optional<std::string> host;
	std::optional<std::string> task_id;
	std::optional<time_point> submit_time;
	std::optional<time_point> start_time;
	std::optional<time_point> end_time;
	std::optional<std::string> failed;
	std::optional<int> exit_status;
	std::optional<unsigned> slots;
	std::optional<std::chrono::seconds> wallclock;
	std::optional<std::string> maxvmem;
};

using sge_accounting_map = std::map<std::string, std::string>;

std::vector<sge_job_record> parse_qstat_xml(std::string_view xml) noexcept;
/* True for blank output too, which is an empty queue. */
bool qstat_xml_well_formed(std::string_view xml) noexcept;
std::vector<sge_job_record> parse_qstat_plain(std::string_view output);
sge_accounting_map parse_qacct_output(std::string_view output);
std::vector<sge_accounting_map> parse_qacct_records(std::string_view output);
sge_accounting_record make_accounting_record(const sge_accounting_map& m);
job_status sge_state_to_status(std::string_view state);
job_status sge_accounting_status(const sge_accounting_record& rec) noexcept;
std::optional<std::string> parse_qsub_output(std::string_view output);

job_info make_job_info(const sge_job_record& rec, time_point now);
job_info make_job_info(const sge_accounting_record& rec);

class sge_scheduler : public scheduler
{
public:
	explicit sge_scheduler(command_runner& runner);

	const char *name() const noexcept override { return "sge"; }

	job_result submit(const job_spec& job, bool interactive = false) override;
	array_job_result submit_array(const array_spec& array) override;
	bool cancel(const std::string& job_id) override;

	std::vector<std::string> build_submit_command(const job_spec& job) const override;

	std::vector<job_info> list_active_jobs(const active_filter& filter = {}) override;
	std::vector<job_info> list_completed_jobs(const completed_filter& filter = {}) override;
	bool has_accounting() const noexcept override;

protected:
	std::optional<job_info> lookup_accounting(const std::string& job_id) override;

private:
	std::vector<std::string> resource_args(const job_spec& job) const;

	/* Parallel environment used for -pe, from $HPCMON_SGE_PE. */
	std::string m_pe_name;
};

/* slurm.cpp */
struct slurm_job_record
{
	std::string job_id;
	std::optional<std::string> name;
	std::optional<std::string> user;
	std::optional<std::string> state;
	std::optional<std::string> partition;
	std::optional<time_point> submit_time;
	std::optional<time_point> start_time;
	std::optional<time_point> end_time;
	std::optional<std::chrono::seconds> elapsed;
	std::optional<unsigned> cpus;
	std::optional<std::string> memory;
	std::optional<unsigned> gpus;
	std::optional<std::string> nodes;
	std::vector<std::string> dependencies;
	std::optional<std::string> array_task_id;
	std::optional<int> exit_code;
};

std::vector<slurm_job_record> parse_squeue_output(std::string_view output);
std::vector<slurm_job_record> parse_sacct_output(std::string_view output);
job_status slurm_state_to_status(std::string_view state);
std::optional<std::string> parse_sbatch_output(std::string_view output);

job_info make_job_info(const slurm_job_record& rec, time_point now);

class slurm_scheduler : public scheduler
{
public:
	explicit slurm_scheduler(command_runner& runner);

	const char *name() const noexcept override { return "slurm"; }

	job_result submit(const job_spec& job, bool interactive = false) override;
	array_job_result submit_array(const array_spec& array) override;
	bool cancel(const std::string& job_id) override;

	std::vector<std::string> build_submit_command(const job_spec& job) const override;

	std::vector<job_info> list_active_jobs(const active_filter& filter = {}) override;
	std::vector<job_info> list_completed_jobs(const completed_filter& filter = {}) override;
	bool has_accounting() const noexcept override;

protected:
	std::optional<job_info> lookup_accounting(const std::string& job_id) override;
	std::string native_job_id(const std::string& job_id) const override;

private:
	std::vector<std::string> resource_args(const job_spec& job) const;
};

/* pbs.cpp */
std::vector<job_info> parse_pbs_qstat_json(std::string_view json) noexcept;
job_status pbs_state_to_status(std::string_view state, std::optional<int> exit_status);
std::optional<std::string> parse_pbs_qsub_output(std::string_view output);

class pbs_scheduler : public scheduler
{
public:
	explicit pbs_scheduler(command_runner& runner);

	const char *name() const noexcept override { return "pbs"; }

	job_result submit(const job_spec& job, bool interactive = false) override;
	array_job_result submit_array(const array_spec& array) override;
	bool cancel(const std::string& job_id) override;

	std::vector<std::string> build_submit_command(const job_spec& job) const override;

	std::vector<job_info> list_active_jobs(const active_filter& filter = {}) override;
	std::vector<job_info> list_completed_jobs(const completed_filter& filter = {}) override;
	bool has_accounting() const noexcept override;

protected:
	std::optional<job_info> lookup_accounting(const std::string& job_id) override;
	std::string native_job_id(const std::string& job_id) const override;

private:
	std::vector<std::string> resource_args(const job_spec& job) const;
	std::vector<job_info> query(const std::vector<std::string>& argv);
};

/* local.cpp */
/* Finished local jobs kept for status queries before the oldest are dropped. */
constexpr size_t local_job_retention = 1000;

class local_scheduler : public scheduler
{
public:
	explicit local_scheduler(command_runner& runner, size_t retain = local_job_retention);
	~local_scheduler() override;

	const char *name() const noexcept override { return "local"; }

	job_result submit(const job_spec& job, bool interactive = false) override;
	array_job_result submit_array(const array_spec& array) override;
	bool cancel(const std::string& job_id) override;

	job_status get_status(const std::string& job_id) noexcept override;
	std::vector<std::string> build_submit_command(const job_spec& job) const override;

	std::vector<job_info> list_active_jobs(const active_filter& filter = {}) override;
	std::vector<job_info> list_completed_jobs(const completed_filter& filter = {}) override;
	bool has_accounting() const noexcept override { return false; }
	job_info get_job_details(const std::string& job_id) override;

private:
	struct local_job
	{
		pid_t pid;
		job_info info;
		bool cancelled;
	};

	/* Caller holds m_mutex. */
	pid_t launch(const job_spec& job, const std::optional<std::string>& base_id, std::optional<unsigned> task);
	void reap() noexcept;
	void prune() noexcept;

	std::mutex m_mutex;
	std::map<pid_t, local_job> m_jobs;
	std::string m_user;
	size_t m_retain;
};

}

#endif /* _HPCMON_SCHEDULER_HPP */
