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

static const char *qstat_xml = R"(<?xml version='1.0'?>
<job_info xmlns:xsd="http://arc.liv.ac.uk/repos/darcs/sge/source/dist/util/resources/schemas/qstat/qstat.xsd">
  <queue_info>
    <job_list state="running">
      <JB_job_number>123</JB_job_number>
      <JAT_prio>0.55500</JAT_prio>
      <JB_name>sim</JB_name>
      <JB_owner>alice</JB_owner>
      <state>r</state>
      <JAT_start_time>2024-03-01T10:20:30</JAT_start_time>
      <queue_name>all.q@node01</queue_name>
      <slots>4</slots>
    </job_list>
  </queue_info>
  <job_info>
    <job_list state="pending">
      <JB_job_number>124</JB_job_number>
      <JAT_prio>0.00000</JAT_prio>
      <JB_name>sweep</JB_name>
      <JB_owner>bob</JB_owner>
      <state>qw</state>
      <JB_submission_time>1709288700</JB_submission_time>
      <queue_name></queue_name>
      <hard_req_queue>gpu.q</hard_req_queue>
      <slots>2</slots>
      <tasks>3</tasks>
    </job_list>
    <job_list state="pending">
      <JB_name>orphan</JB_name>
      <state>qw</state>
    </job_list>
  </job_info>
</job_info>
)";

static const char *qstat_plain =
"job-ID  prior   name       user         state submit/start at     queue                          slots ja-task-ID\n"
"-----------------------------------------------------------------------------------------------------------------\n"
"    123 0.55500 sim        alice        r     03/01/2024 10:20:30 all.q@node01                       4\n"
"    124 0.00000 sweep      bob          qw    03/01/2024 10:25:00                                    2 3\n"
"    125 0.00000 held       bob          hqw   03/01/2024 10:26:00\n"
"    126 0.00000 truncated\n"
"\n"
"    127\n";

static const char *qacct_output =
"==============================================================\n"
"qname        all.q\n"
"hostname     node01\n"
"owner        alice\n"
"jobname      sim\n"
"jobnumber    123\n"
"taskid       undefined\n"
"qsub_time    Fri Mar 15 10:00:00 2024\n"
"start_time   Fri Mar 15 10:05:00 2024\n"
"end_time     Fri Mar 15 11:05:00 2024\n"
"failed       0\n"
"exit_status  0\n"
"ru_wallclock 3600.000\n"
"slots        4\n"
"maxvmem      1.2G\n"
"==============================================================\n"
"qname        all.q\n"
"hostname     node02\n"
"owner        alice\n"
"jobname      crash\n"
"jobnumber    130\n"
"taskid       2\n"
"qsub_time    03/15/2024 12:00:00\n"
"start_time   03/15/2024 12:01:00\n"
"end_time     03/15/2024 12:02:00\n"
"failed       100 : assumed after job\n"
"exit_status  137 (Killed)\n"
"ru_wallclock 60\n"
"slots        1\n";

TEST_CASE("sge: qstat xml", "[sge]")
{
	std::vector<sge_job_record> recs = parse_qstat_xml(qstat_xml);
	REQUIRE(recs.size() == 2);

	const sge_job_record& r = recs[0];
	REQUIRE(r.job_id == "123");
	REQUIRE(r.name == "sim");
	REQUIRE(r.user == "alice");
	REQUIRE(r.state == "r");
	REQUIRE(r.queue == "all.q");
	REQUIRE(r.host == "node01");
	REQUIRE(r.slots == 4u);
	REQUIRE(r.start_time == local_time("2024-03-01 10:20:30"));
	REQUIRE_FALSE(r.array_task_id);

	const sge_job_record& p = recs[1];
	REQUIRE(p.job_id == "124");
	REQUIRE(p.queue == "gpu.q");
	REQUIRE_FALSE(p.host);
	REQUIRE(p.submit_time == clock_type::from_time_t(1709288700));
	REQUIRE(p.array_task_id == "3");
}

static const char *qstat_xml_full = R"(<?xml version='1.0'?>
<job_info>
  <queue_info>
    <job_list state="running">
      <JB_job_number>200</JB_job_number>
      <JAT_prio>0.75000</JAT_prio>
      <JB_name>render</JB_name>
      <JB_owner>carol</JB_owner>
      <state>r</state>
      <JB_submission_time>1709280000</JB_submission_time>
      <JAT_start_time>1709283600</JAT_start_time>
      <queue_name>long.q@node07.cluster</queue_name>
      <slots>16</slots>
      <tasks>7</tasks>
    </job_list>
  </queue_info>
</job_info>
)";

TEST_CASE("sge: qstat xml with every field", "[sge]")
{
	std::vector<sge_job_record> recs = parse_qstat_xml(qstat_xml_full);
	REQUIRE(recs.size() == 1);

	const sge_job_record& r = recs[0];
	REQUIRE(r.job_id == "200");
	REQUIRE(r.priority == "0.75000");
	REQUIRE(r.name == "render");
	REQUIRE(r.user == "carol");
	REQUIRE(r.state == "r");
	REQUIRE(r.submit_time == clock_type::from_time_t(1709280000));
	REQUIRE(r.start_time == clock_type::from_time_t(1709283600));
	REQUIRE(r.queue == "long.q");
	REQUIRE(r.host == "node07.cluster");
	REQUIRE(r.slots == 16u);
	REQUIRE(r.array_task_id == "7");

	time_point now = clock_type::from_time_t(1709283600 + 5400);
	job_info ji = make_job_info(r, now);
	REQUIRE(ji.status == job_status::running);
	REQUIRE(ji.queue == "long.q");
	REQUIRE(ji.node == "node07.cluster");
	REQUIRE(ji.cpu == 16u);
	REQUIRE(ji.runtime == std::chrono::seconds(5400));
	REQUIRE(ji.matches_id("200.7"));
}

TEST_CASE("sge: malformed qstat xml is empty", "[sge]")
{
	REQUIRE(parse_qstat_xml("").empty());
	REQUIRE(parse_qstat_xml("<job_info><job_list>").empty());
	REQUIRE(parse_qstat_xml("not xml at all").empty());
}

TEST_CASE("sge: qstat plain", "[sge]")
{
	std::vector<sge_job_record> recs = parse_qstat_plain(qstat_plain);
	REQUIRE(recs.size() == 3);

	REQUIRE(recs[0].job_id == "123");
	REQUIRE(recs[0].queue == "all.q");
	REQUIRE(recs[0].host == "node01");
	REQUIRE(recs[0].slots == 4u);
	REQUIRE(recs[0].start_time == local_time("2024-03-01 10:20:30"));
	REQUIRE_FALSE(recs[0].submit_time);

	REQUIRE(recs[1].job_id == "124");
	REQUIRE_FALSE(recs[1].queue);
	REQUIRE(recs[1].slots == 2u);
	REQUIRE(recs[1].array_task_id == "3");
	REQUIRE(recs[1].submit_time == local_time("2024-03-01 10:25:00"));

	REQUIRE(recs[2].state == "hqw");
	REQUIRE_FALSE(recs[2].slots);

	/* Rows with fewer than five columns are dropped. */
	for(const sge_job_record& r : recs)
	{
		REQUIRE(r.job_id != "126");
		REQUIRE(r.job_id != "127");
	}

	REQUIRE(parse_qstat_plain("").empty());
}

TEST_CASE("sge: state mapping", "[sge]")
{
	REQUIRE(sge_state_to_status("r") == job_status::running);
	REQUIRE(sge_state_to_status("Rr") == job_status::running);
	REQUIRE(sge_state_to_status("t") == job_status::running);
	REQUIRE(sge_state_to_status("qw") == job_status::pending);
	REQUIRE(sge_state_to_status("hqw") == job_status::pending);
	REQUIRE(sge_state_to_status("s") == job_status::pending);
	REQUIRE(sge_state_to_status("Eqw") == job_status::failed);
	REQUIRE(sge_state_to_status("dr") == job_status::cancelled);
	REQUIRE(sge_state_to_status("zz") == job_status::unknown);
}

TEST_CASE("sge: qacct records", "[sge]")
{
	std::vector<sge_accounting_map> maps = parse_qacct_records(qacct_output);
	REQUIRE(maps.size() == 2);

	sge_accounting_record ok = make_accounting_record(maps[0]);
	REQUIRE(ok.job_id == "123");
	REQUIRE_FALSE(ok.task_id);
	REQUIRE(ok.exit_status == 0);
	REQUIRE(ok.wallclock == std::chrono::seconds(3600));
	REQUIRE(ok.submit_time == local_time("2024-03-15 10:00:00"));
	REQUIRE(ok.end_time == local_time("2024-03-15 11:05:00"));
	REQUIRE(sge_accounting_status(ok) == job_status::completed);

	sge_accounting_record bad = make_accounting_record(maps[1]);
	REQUIRE(bad.task_id == "2");
	REQUIRE(bad.exit_status == 137);
	REQUIRE(bad.start_time == local_time("2024-03-15 12:01:00"));
	REQUIRE(sge_accounting_status(bad) == job_status::failed);

	job_info ji = make_job_info(bad);
	REQUIRE(ji.job_id == "130");
	REQUIRE(ji.matches_id("130.2"));
	REQUIRE(ji.user == "alice");
	REQUIRE(ji.node == "node02");
	REQUIRE(ji.exit_code == 137);
	REQUIRE(ji.runtime == std::chrono::seconds(60));

	/* The single-record form keeps the last value for repeated keys. */
	sge_accounting_map last = parse_qacct_output(qacct_output);
	REQUIRE(last["jobnumber"] == "130");
}

TEST_CASE("sge: accounting status", "[sge]")
{
	sge_accounting_record rec;
	rec.failed = "0";
	rec.exit_status = 137;
	REQUIRE(sge_accounting_status(rec) == job_status::cancelled);

	rec.exit_status = 2;
	REQUIRE(sge_accounting_status(rec) == job_status::failed);

	rec.failed = "1 : assumedly before job";
	rec.exit_status = 0;
	REQUIRE(sge_accounting_status(rec) == job_status::failed);
}

TEST_CASE("sge: qsub output", "[sge]")
{
	REQUIRE(parse_qsub_output("Your job 4242 (\"sim\") has been submitted\n") == "4242");
	REQUIRE(parse_qsub_output("Your job-array 77.1-10:1 (\"sweep\") has been submitted\n") == "77");
	REQUIRE_FALSE(parse_qsub_output("Unable to run job: denied.\n"));
}

TEST_CASE("sge: running job runtime", "[sge]")
{
	sge_job_record rec;
	rec.job_id = "9";
	rec.state = "r";
	rec.start_time = local_time("2024-03-01 10:00:00");

	job_info ji = make_job_info(rec, local_time("2024-03-01 10:30:00"));
	REQUIRE(ji.status == job_status::running);
	REQUIRE(ji.runtime == std::chrono::seconds(1800));

	rec.state = "qw";
	REQUIRE_FALSE(make_job_info(rec, local_time("2024-03-01 10:30:00")).runtime);
}
