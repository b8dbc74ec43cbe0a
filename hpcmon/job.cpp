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
#include "job.hpp"

namespace hpcmon {

static const char *status_strings[] = {
	"pending",
	"running",
	"completed",
	"failed",
	"cancelled",
	"timeout",
	"unknown",
	nullptr
};

bool is_active_status(job_status s) noexcept
{
	switch(s)
	{
		case job_status::pending:
		case job_status::running:
		case job_status::unknown:
			return true;
		default:
			return false;
	}
}

bool is_complete_status(job_status s) noexcept
{
	return !is_active_status(s);
}

const status_set& active_statuses()
{
	static const status_set s{job_status::pending, job_status::running, job_status::unknown};
	return s;
}

const status_set& complete_statuses()
{
	static const status_set s{job_status::completed, job_status::failed, job_status::cancelled, job_status::timeout};
	return s;
}

const status_set& all_statuses()
{
	static const status_set s{
		job_status::pending,
		job_status::running,
		job_status::completed,
		job_status::failed,
		job_status::cancelled,
		job_status::timeout,
		job_status::unknown
	};
	return s;
}

const char *status_name(job_status s) noexcept
{
	return status_strings[static_cast<size_t>(s)];
}

std::optional<job_status> parse_status_name(std::string_view name)
{
	std::string lname = to_lower(trim(name));
	for(size_t i = 0; status_strings[i] != nullptr; ++i)
	{
		if(lname == status_strings[i])
			return static_cast<job_status>(i);
	}
	return std::nullopt;
}

std::string format_runtime(std::chrono::seconds runtime)
{
	long long total = runtime.count();
	if(total < 0)
		total = 0;

	std::ostringstream os;
	if(total < 60)
	{
		os << total << "s";
		return os.str();
	}

	long long minutes = total / 60;
	if(minutes < 60)
	{
		os << minutes << "m";
		return os.str();
	}

	long long hours = minutes / 60;
	if(hours < 24)
	{
		os << hours << "h " << (minutes % 60) << "m";
		return os.str();
	}

	os << (hours / 24) << "d " << (hours % 24) << "h";
	return os.str();
}

std::string job_info::runtime_display() const
{
	if(!runtime)
		return "-";

	return format_runtime(*runtime);
}

std::string job_info::resources_display() const
{
	std::vector<std::string> parts;
	if(cpu)
		parts.push_back(std::to_string(*cpu));
	if(memory)
		parts.push_back(*memory);
	if(gpu)
		parts.push_back(std::to_string(*gpu) + "GPU");

	if(parts.empty())
		return "-";

	return join(parts, "/");
}

bool task_in_range(std::string_view range, long long idx) noexcept
{
	if(!range.empty() && range.front() == '[')
		range.remove_prefix(1);
	if(!range.empty() && range.back() == ']')
		range.remove_suffix(1);

	if(size_t pct = range.find('%'); pct != std::string_view::npos)
		range = range.substr(0, pct);

	if(range.empty())
		return false;

	bool found = false;
	for_each_delim(range.data(), range.data() + range.size(), ',', [idx, &found](std::string_view item, size_t) {
		if(found)
			return;

		std::optional<long long> step = 1;
		if(size_t colon = item.find(':'); colon != std::string_view::npos)
		{
			step = parse_integer(item.substr(colon + 1));
			item = item.substr(0, colon);
		}

		std::optional<long long> first, last;
		if(size_t dash = item.find('-'); dash != std::string_view::npos)
		{
			first = parse_integer(item.substr(0, dash));
			last = parse_integer(item.substr(dash + 1));
		}
		else
		{
			first = last = parse_integer(item);
		}

		if(!first || !last || !step || *step <= 0)
			return;

		found = idx >= *first && idx <= *last && (idx - *first) % *step == 0;
	});

	return found;
}

bool job_info::matches_id(std::string_view id) const noexcept
{
	if(id == job_id)
		return true;

	if(!array_task_id)
		return false;

	if(id.size() == job_id.size() + 1 + array_task_id->size() &&
		id.substr(0, job_id.size()) == job_id &&
		id[job_id.size()] == '.' &&
		id.substr(job_id.size() + 1) == *array_task_id)
		return true;

	/* A pending array is one row covering many tasks: "900" with "1-10:1", or "123_[1-10%2]". */
	size_t dot = id.rfind('.');
	if(dot == std::string_view::npos)
		return false;

	std::string_view base = job_id;
	if(size_t br = base.find("_["); br != std::string_view::npos)
		base = base.substr(0, br);

	if(id.substr(0, dot) != base)
		return false;

	std::optional<long long> idx = parse_integer(id.substr(dot + 1));
	return idx && task_in_range(*array_task_id, *idx);
}

static int64_t to_epoch(time_point t) noexcept
{
	return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

void to_json(nlohmann::json& j, const job_info& ji)
{
	j = nlohmann::json{
		{"job_id", ji.job_id},
		{"name", ji.name},
		{"user", ji.user},
		{"status", ji.status},
	};

	if(ji.queue)			j["queue"] = *ji.queue;
	if(ji.submit_time)		j["submit_time"] = to_epoch(*ji.submit_time);
	if(ji.start_time)		j["start_time"] = to_epoch(*ji.start_time);
	if(ji.end_time)			j["end_time"] = to_epoch(*ji.end_time);
	if(ji.runtime)			j["runtime"] = ji.runtime->count();
	if(ji.cpu)				j["cpu"] = *ji.cpu;
	if(ji.memory)			j["memory"] = *ji.memory;
	if(ji.gpu)				j["gpu"] = *ji.gpu;
	if(ji.exit_code)		j["exit_code"] = *ji.exit_code;
	if(ji.stdout_path)		j["stdout_path"] = ji.stdout_path->string();
	if(ji.stderr_path)		j["stderr_path"] = ji.stderr_path->string();
	if(ji.node)				j["node"] = *ji.node;
	if(ji.dependencies)		j["dependencies"] = *ji.dependencies;
	if(ji.array_task_id)	j["array_task_id"] = *ji.array_task_id;
}

std::vector<unsigned> array_spec::indices() const
{
	std::vector<unsigned> idx;
	unsigned s = step == 0 ? 1 : step;
	for(unsigned i = start; i <= end; i += s)
		idx.push_back(i);
	return idx;
}

std::vector<std::string> array_job_result::task_ids() const
{
	std::vector<std::string> ids;
	unsigned s = step == 0 ? 1 : step;
	for(unsigned i = start; i <= end; i += s)
		ids.push_back(base_id + "." + std::to_string(i));
	return ids;
}

}
