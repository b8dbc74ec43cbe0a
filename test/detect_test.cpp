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
using namespace hpcmon::test;

/* A clean slate: no scheduler hints in the environment, PATH under our control. */
struct detect_env
{
	detect_env() :
		forced("HPC_SCHEDULER", std::nullopt),
		sge_root("SGE_ROOT", std::nullopt),
		pbs_conf("PBS_CONF_FILE", std::nullopt),
		path("PATH", dir.path().string())
	{}

	temp_dir dir;
	scoped_env forced;
	scoped_env sge_root;
	scoped_env pbs_conf;
	scoped_env path;
	fake_runner runner;
};

TEST_CASE("detect: environment override wins", "[detect]")
{
	detect_env env;
	env.dir.add_program("sbatch");
	env.dir.add_program("squeue");

	scoped_env forced("HPC_SCHEDULER", std::string(" PBS "));
	REQUIRE(detect_scheduler(env.runner) == "pbs");
	REQUIRE(env.runner.calls.empty());
}

TEST_CASE("detect: nothing installed runs locally", "[detect]")
{
	detect_env env;
	REQUIRE(detect_scheduler(env.runner) == "local");
	REQUIRE(env.runner.calls.empty());
}

TEST_CASE("detect: SGE_ROOT identifies SGE", "[detect]")
{
	detect_env env;
	env.dir.add_program("qsub");

	scoped_env root("SGE_ROOT", std::string("/opt/sge"));
	REQUIRE(detect_scheduler(env.runner) == "sge");
	REQUIRE(env.runner.calls.empty());
}

TEST_CASE("detect: qstat banner identifies SGE", "[detect]")
{
	detect_env env;
	env.dir.add_program("qsub");

	env.runner.push(1, "", "SGE 8.1.9\nusage: qstat [options]\n");
	REQUIRE(detect_scheduler(env.runner) == "sge");
	REQUIRE(env.runner.calls.size() == 1);
	REQUIRE(env.runner.calls[0].argv == std::vector<std::string>{"qstat", "-help"});
}

TEST_CASE("detect: Slurm needs both sbatch and squeue", "[detect]")
{
	detect_env env;
	env.dir.add_program("sbatch");
	REQUIRE(detect_scheduler(env.runner) == "local");

	env.dir.add_program("squeue");
	REQUIRE(detect_scheduler(env.runner) == "slurm");
}

TEST_CASE("detect: PBS qsub isn't mistaken for SGE", "[detect]")
{
	detect_env env;
	env.dir.add_program("qsub");

	scoped_env conf("PBS_CONF_FILE", std::string("/etc/pbs.conf"));
	env.runner.push(0, "usage: qstat [-f] [-J] [-p] [-t] [-x]\n");
	REQUIRE(detect_scheduler(env.runner) == "pbs");
}

TEST_CASE("detect: failed probes are negative", "[detect]")
{
	fake_runner runner;
	REQUIRE_FALSE(probe_sge_qstat(runner));

	runner.push(0, "Grid Engine 2011.11\n", "", true);
	REQUIRE_FALSE(probe_sge_qstat(runner));

	runner.push(0, "", "Open Grid Scheduler/Grid Engine 2011.11p1\n");
	REQUIRE(probe_sge_qstat(runner));
}

TEST_CASE("detect: scheduler names", "[detect]")
{
	REQUIRE(parse_scheduler_kind("sge") == scheduler_kind::sge);
	REQUIRE(parse_scheduler_kind(" Slurm") == scheduler_kind::slurm);
	REQUIRE(parse_scheduler_kind("LOCAL") == scheduler_kind::local);
	REQUIRE(parse_scheduler_kind("lsf") == scheduler_kind::unknown);

	fake_runner runner;
	REQUIRE(std::string(make_scheduler("pbs", runner)->name()) == "pbs");
	REQUIRE(std::string(make_scheduler("SGE", runner)->name()) == "sge");
	REQUIRE(std::string(make_scheduler("slurm", runner)->name()) == "slurm");
	REQUIRE(std::string(make_scheduler("local", runner)->name()) == "local");
	REQUIRE_THROWS_AS(make_scheduler("lsf", runner), std::runtime_error);
	REQUIRE_THROWS_AS(make_scheduler("", runner), std::runtime_error);
}
