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
#ifndef _HPCMON_JOB_HPP
#define _HPCMON_JOB_HPP

#include <set>
#include <utility>
#include <nlohmann/json.hpp>
#include "hpcmon.hpp"

namespace hpcmon {

enum class job_status
{
	pending = 0,
	running,
	completed,
	failed,
	cancelled,
	timeout,
	unknown
};

NLOHMANN_JSON_SERIALIZE_ENUM(job_status, {
	{job_status::unknown,	"unknown"},
	{job_status::pending,	"pending"},
	{job_status::running,	"running"},
	{job_status::completed,	"completed"},
	{job_status::failed,	"failed"},
	{job_status::cancelled,	"cancelled"},
	{job_status::timeout,	"timeout"},
});

using status_set = std::set<job_status>;

/* active = {pending, running, unknown}, complete = everything else. */
bool is_active_status(job_status s) noexcept;
bool is_complete_status(job_status s) noexcept;

const status_set& active_statuses();
const status_set& complete_statuses();
const status_set& all_statuses();

const char *status_name(job_status s) noexcept;
std::optional<job_status> parse_status_name(std::string_view name);

std::string format_runtime(std::chrono::seconds runtime);

/*
 * Scheduler-agnostic view of a job. Built fresh on every poll and never
 * modified afterwards; anything a backend can't supply stays empty.
 */
struct job_info
{
	std::string job_id;
	std::string name;
	std::string user;
	job_status status = job_status::unknown;

	std::optional<std::string> queue;

	std::optional<time_point> submit_time;
	std::optional<time_point> start_time;
	std::optional<time_point> end_time;
	std::optional<std::chrono::seconds> runtime;

	std::optional<unsigned> cpu;
	std::optional<std::string> memory;
	std::optional<unsigned> gpu;

	std::optional<int> exit_code;

	std::optional<fs::path> stdout_path;
	std::optional<fs::path> stderr_path;

	std::optional<std::string> node;
	std::optional<std::vector<std::string>> dependencies;
	std::optional<std::string> array_task_id;

	bool is_active() const noexcept { return is_active_status(status); }
	bool is_complete() const noexcept { return is_complete_status(status); }

	/* "2h 15m", or "-" if unknown. */
	std::string runtime_display() const;
	/* "4/16G/1GPU", or "-" if nothing is known. */
	std::string resources_display() const;

	/* Matches either the plain id or "<id>.<task>" for array tasks. */
	bool matches_id(std::string_view id) const noexcept;
};

void to_json(nlohmann::json& j, const job_info& ji);

/*
 * Is a task index inside a range-form task id? Accepts comma-separated
 * "s", "s-e" and "s-e:step" items, optionally bracketed, with a "%n"
 * throttle suffix ignored. "1-10:1", "[1-10%2]", "1,3,5-9:2".
 */
bool task_in_range(std::string_view range, long long idx) noexcept;

enum class output_stream
{
	stdout_stream,
	stderr_stream
};

struct job_spec
{
	std::string command;
	std::string name = "hpcmon";

	std::optional<unsigned> cpu;
	std::optional<std::string> memory;
	std::optional<std::string> time;
	std::optional<std::string> queue;
	std::optional<unsigned> gpu;

	std::optional<fs::path> workdir;
	std::optional<fs::path> stdout_path;
	std::optional<fs::path> stderr_path;
	bool merge_output = false;

	std::vector<std::string> modules;
	std::vector<std::pair<std::string, std::string>> env;
	std::vector<std::string> dependencies;
	std::vector<std::string> raw_args;

	std::string shell = "/bin/bash";
};

struct array_spec
{
	job_spec job;
	unsigned start = 1;
	unsigned end = 1;
	unsigned step = 1;
	std::optional<unsigned> max_concurrent;

	std::vector<unsigned> indices() const;
};

struct job_result
{
	std::string job_id;
	std::string scheduler;
	job_status status = job_status::pending;
	std::optional<int> exit_code;
	std::optional<fs::path> stdout_path;
	std::optional<fs::path> stderr_path;
};

struct array_job_result
{
	std::string base_id;
	std::string scheduler;
	unsigned start;
	unsigned end;
	unsigned step;

	/* "<base>.<index>" for every index in the range. */
	std::vector<std::string> task_ids() const;
};

}

#endif /* _HPCMON_JOB_HPP */
