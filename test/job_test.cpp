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
#include <catch2/catch.hpp>
#include "job.hpp"

using namespace hpcmon;

TEST_CASE("job: active and complete partitions are disjoint", "[job]")
{
	for(job_status s : all_statuses())
		REQUIRE(is_active_status(s) != is_complete_status(s));

	REQUIRE(active_statuses().size() + complete_statuses().size() == all_statuses().size());
	REQUIRE(is_active_status(job_status::unknown));
	REQUIRE(is_complete_status(job_status::timeout));
	REQUIRE_FALSE(is_active_status(job_status::cancelled));
}

TEST_CASE("job: status names", "[job]")
{
	REQUIRE(std::string(status_name(job_status::running)) == "running");
	REQUIRE(parse_status_name("Pending") == job_status::pending);
	REQUIRE(parse_status_name(" timeout ") == job_status::timeout);
	REQUIRE_FALSE(parse_status_name("queued"));
	REQUIRE_FALSE(parse_status_name(""));

	REQUIRE(nlohmann::json(job_status::cancelled) == "cancelled");
}

TEST_CASE("job: runtime display", "[job]")
{
	job_info ji;
	REQUIRE(ji.runtime_display() == "-");

	ji.runtime = std::chrono::seconds(42);
	REQUIRE(ji.runtime_display() == "42s");

	ji.runtime = std::chrono::seconds(5 * 60 + 10);
	REQUIRE(ji.runtime_display() == "5m");

	ji.runtime = std::chrono::seconds(2 * 3600 + 15 * 60);
	REQUIRE(ji.runtime_display() == "2h 15m");

	ji.runtime = std::chrono::seconds(3 * 86400 + 4 * 3600 + 59);
	REQUIRE(ji.runtime_display() == "3d 4h");
}

TEST_CASE("job: resources display", "[job]")
{
	job_info ji;
	REQUIRE(ji.resources_display() == "-");

	ji.cpu = 4;
	REQUIRE(ji.resources_display() == "4");

	ji.memory = "16G";
	ji.gpu = 1;
	REQUIRE(ji.resources_display() == "4/16G/1GPU");

	ji.cpu.reset();
	REQUIRE(ji.resources_display() == "16G/1GPU");
}

TEST_CASE("job: array task ids match", "[job]")
{
	job_info ji;
	ji.job_id = "123";
	REQUIRE(ji.matches_id("123"));
	REQUIRE_FALSE(ji.matches_id("123.4"));

	ji.array_task_id = "4";
	REQUIRE(ji.matches_id("123"));
	REQUIRE(ji.matches_id("123.4"));
	REQUIRE_FALSE(ji.matches_id("123.5"));
	REQUIRE_FALSE(ji.matches_id("1234"));
	REQUIRE_FALSE(ji.matches_id("12.4"));
}

TEST_CASE("job: task ranges", "[job]")
{
	REQUIRE(task_in_range("1-10:1", 1));
	REQUIRE(task_in_range("1-10:1", 10));
	REQUIRE_FALSE(task_in_range("1-10:1", 11));
	REQUIRE(task_in_range("2-10:2", 6));
	REQUIRE_FALSE(task_in_range("2-10:2", 7));
	REQUIRE(task_in_range("[1-10%2]", 5));
	REQUIRE(task_in_range("1-10%2", 5));
	REQUIRE(task_in_range("1,3,5-9:2", 7));
	REQUIRE_FALSE(task_in_range("1,3,5-9:2", 4));
	REQUIRE(task_in_range("4", 4));
	REQUIRE_FALSE(task_in_range("", 1));
	REQUIRE_FALSE(task_in_range("1-10:0", 1));
	REQUIRE_FALSE(task_in_range("bogus", 1));
}

TEST_CASE("job: pending array rows match their tasks", "[job]")
{
	job_info sge;
	sge.job_id = "900";
	sge.array_task_id = "1-10:1";
	REQUIRE(sge.matches_id("900"));
	REQUIRE(sge.matches_id("900.5"));
	REQUIRE_FALSE(sge.matches_id("900.11"));
	REQUIRE_FALSE(sge.matches_id("901.5"));

	job_info slurm;
	slurm.job_id = "123_[1-10%2]";
	slurm.array_task_id = "1-10%2";
	REQUIRE(slurm.matches_id("123.5"));
	REQUIRE_FALSE(slurm.matches_id("123.11"));
	REQUIRE_FALSE(slurm.matches_id("12.5"));
}

TEST_CASE("job: json omits unknown fields", "[job]")
{
	job_info ji;
	ji.job_id = "77";
	ji.name = "sim";
	ji.user = "alice";
	ji.status = job_status::running;
	ji.cpu = 8;
	ji.start_time = clock_type::from_time_t(1700000000);

	nlohmann::json j = ji;
	REQUIRE(j["job_id"] == "77");
	REQUIRE(j["status"] == "running");
	REQUIRE(j["cpu"] == 8);
	REQUIRE(j["start_time"] == 1700000000);
	REQUIRE_FALSE(j.contains("queue"));
	REQUIRE_FALSE(j.contains("exit_code"));
	REQUIRE_FALSE(j.contains("dependencies"));
}

TEST_CASE("job: array ranges", "[job]")
{
	array_spec a;
	a.start = 1;
	a.end = 10;
	a.step = 3;
	REQUIRE(a.indices() == std::vector<unsigned>{1, 4, 7, 10});

	a.step = 0;
	a.end = 2;
	REQUIRE(a.indices() == std::vector<unsigned>{1, 2});

	array_job_result r{"55", "sge", 2, 6, 2};
	REQUIRE(r.task_ids() == std::vector<std::string>{"55.2", "55.4", "55.6"});
}
