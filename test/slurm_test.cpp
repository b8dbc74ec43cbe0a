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
#include "fakes.hpp"

using namespace hpcmon;
using hpcmon::test::local_time;

static const char *squeue_output =
"123|sim|alice|RUNNING|batch|2024-03-01T10:00:00|2024-03-01T10:05:00|4|16G|gres:gpu:2|node01|(null)|N/A\n"
"200_3|sweep|bob|PENDING|gpu|2024-03-01T10:00:00|N/A|1|4000Mn|N/A||afterok:123(unfulfilled),afterany:150_*|3\n"
"\n"
"junk line\n";

static const char *sacct_output =
"300|fit|alice|FAILED|batch|2024-03-01T09:00:00|2024-03-01T09:01:00|2024-03-01T09:31:00|00:30:00|2|2Gn|1:0|node02\n"
"301|killed|alice|CANCELLED by 0|batch|2024-03-01T09:00:00|Unknown|2024-03-01T09:00:10|00:00:00|1|0|0:15|None assigned\n"
"302_7|task|bob|COMPLETED|short|2024-03-01T08:00:00|2024-03-01T08:00:01|2024-03-01T08:10:01|1-00:00:00|1|1G|0:0|node03\n";

TEST_CASE("slurm: squeue", "[slurm]")
{
	std::vector<slurm_job_record> recs = parse_squeue_output(squeue_output);
	REQUIRE(recs.size() == 2);

	const slurm_job_record& r = recs[0];
	REQUIRE(r.job_id == "123");
	REQUIRE(r.state == "RUNNING");
	REQUIRE(r.partition == "batch");
	REQUIRE(r.start_time == local_time("2024-03-01 10:05:00"));
	REQUIRE(r.cpus == 4u);
	REQUIRE(r.memory == "16G");
	REQUIRE(r.gpus == 2u);
	REQUIRE(r.nodes == "node01");
	REQUIRE(r.dependencies.empty());
	REQUIRE_FALSE(r.array_task_id);

	const slurm_job_record& p = recs[1];
	REQUIRE(p.job_id == "200_3");
	REQUIRE_FALSE(p.start_time);
	REQUIRE(p.memory == "4000M");
	REQUIRE_FALSE(p.gpus);
	REQUIRE_FALSE(p.nodes);
	REQUIRE(p.dependencies == std::vector<std::string>{"123", "150_*"});
	REQUIRE(p.array_task_id == "3");

	job_info ji = make_job_info(p, local_time("2024-03-01 11:00:00"));
	REQUIRE(ji.status == job_status::pending);
	REQUIRE(ji.queue == "gpu");
	REQUIRE(ji.dependencies);
	REQUIRE_FALSE(ji.runtime);
}

TEST_CASE("slurm: sacct", "[slurm]")
{
	std::vector<slurm_job_record> recs = parse_sacct_output(sacct_output);
	REQUIRE(recs.size() == 3);

	REQUIRE(recs[0].exit_code == 1);
	REQUIRE(recs[0].elapsed == std::chrono::seconds(1800));
	REQUIRE(recs[0].memory == "2G");
	REQUIRE(recs[0].end_time == local_time("2024-03-01 09:31:00"));
	REQUIRE(slurm_state_to_status(*recs[0].state) == job_status::failed);

	REQUIRE(recs[1].exit_code == 143);
	REQUIRE_FALSE(recs[1].start_time);
	REQUIRE_FALSE(recs[1].memory);
	REQUIRE_FALSE(recs[1].nodes);
	REQUIRE(slurm_state_to_status(*recs[1].state) == job_status::cancelled);

	REQUIRE(recs[2].array_task_id == "7");
	REQUIRE(recs[2].exit_code == 0);
	REQUIRE(recs[2].elapsed == std::chrono::seconds(86400));

	job_info ji = make_job_info(recs[2], local_time("2024-03-02 00:00:00"));
	REQUIRE(ji.status == job_status::completed);
	REQUIRE(ji.runtime == std::chrono::seconds(86400));
}

TEST_CASE("slurm: state mapping", "[slurm]")
{
	REQUIRE(slurm_state_to_status("PENDING") == job_status::pending);
	REQUIRE(slurm_state_to_status("PD") == job_status::pending);
	REQUIRE(slurm_state_to_status("REQUEUED") == job_status::pending);
	REQUIRE(slurm_state_to_status("COMPLETING") == job_status::running);
	REQUIRE(slurm_state_to_status("COMPLETED") == job_status::completed);
	REQUIRE(slurm_state_to_status("OUT_OF_MEMORY") == job_status::failed);
	REQUIRE(slurm_state_to_status("NODE_FAIL") == job_status::failed);
	REQUIRE(slurm_state_to_status("CANCELLED+") == job_status::cancelled);
	REQUIRE(slurm_state_to_status("TIMEOUT") == job_status::timeout);
	REQUIRE(slurm_state_to_status("PREEMPTED") == job_status::unknown);
	REQUIRE(slurm_state_to_status("") == job_status::unknown);
}

TEST_CASE("slurm: sbatch output", "[slurm]")
{
	REQUIRE(parse_sbatch_output("Submitted batch job 999\n") == "999");
	REQUIRE(parse_sbatch_output("1000;cluster\n") == "1000");
	REQUIRE(parse_sbatch_output("1001\n") == "1001");
	REQUIRE_FALSE(parse_sbatch_output("sbatch: error: invalid partition\n"));
	REQUIRE_FALSE(parse_sbatch_output(""));
}
