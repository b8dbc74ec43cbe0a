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
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <parg.h>
#include <libxml/xmlversion.h>
#include <nlohmann/json.hpp>
#include "hpcmon.hpp"
#include "config.h"

namespace hpcmon {

#define ARGDEF_VERSION			'v'
#define ARGDEF_DEBUG			'd'
#define ARGDEF_SCHEDULER		's'
#define ARGDEF_INTERVAL			'i'
#define ARGDEF_ALL				'a'
#define ARGDEF_USER				'u'
#define ARGDEF_QUEUE			'q'
#define ARGDEF_STATUS			301
#define ARGDEF_COMPLETED		'c'
#define ARGDEF_SINCE			302
#define ARGDEF_LIMIT			'n'
#define ARGDEF_ONCE				'1'
#define ARGDEF_JSON				'j'
#define ARGDEF_HELP				'h'

static struct parg_option argdefs[] = {
	{"version",		PARG_NOARG,		nullptr,	ARGDEF_VERSION},
	{"debug",		PARG_NOARG,		nullptr,	ARGDEF_DEBUG},
	{"scheduler",	PARG_REQARG,	nullptr,	ARGDEF_SCHEDULER},
	{"interval",	PARG_REQARG,	nullptr,	ARGDEF_INTERVAL},
	{"all",			PARG_NOARG,		nullptr,	ARGDEF_ALL},
	{"user",		PARG_REQARG,	nullptr,	ARGDEF_USER},
	{"queue",		PARG_REQARG,	nullptr,	ARGDEF_QUEUE},
	{"status",		PARG_REQARG,	nullptr,	ARGDEF_STATUS},
	{"completed",	PARG_NOARG,		nullptr,	ARGDEF_COMPLETED},
	{"since",		PARG_REQARG,	nullptr,	ARGDEF_SINCE},
	{"limit",		PARG_REQARG,	nullptr,	ARGDEF_LIMIT},
	{"once",		PARG_NOARG,		nullptr,	ARGDEF_ONCE},
	{"json",		PARG_NOARG,		nullptr,	ARGDEF_JSON},
	{"help",		PARG_NOARG,		nullptr,	ARGDEF_HELP},
	{nullptr,		0,				nullptr,	0}
};

static const char *USAGE_OPTIONS =
"  -v, --version           Display version information\n"
"  -d, --debug             Enable debugging. Repeat for subprocess tracing\n"
"  -s, --scheduler         The batch system to use. If unspecified, use $HPC_SCHEDULER.\n"
"                          If $HPC_SCHEDULER isn't set or is empty, attempt to autodetect.\n"
"                          Valid options are:\n"
"                          - sge, slurm, pbs, local\n"
"  -i, --interval          Seconds between refreshes. If unspecified, use $HPCMON_INTERVAL,\n"
"                          otherwise 10\n"
"  -a, --all               Show jobs from all users\n"
"  -u, --user              Show jobs from this user instead of the current one\n"
"  -q, --queue             Only show jobs in this queue/partition\n"
"  --status                Comma-separated statuses to show, e.g. pending,running\n"
"  -c, --completed         List finished jobs from the accounting database and exit\n"
"  --since                 With --completed, only jobs that ended after this time\n"
"                          (YYYY-MM-DD or \"YYYY-MM-DD HH:MM:SS\")\n"
"  -n, --limit             With --completed, the maximum number of jobs (default 100)\n"
"  -1, --once              Refresh once, print and exit\n"
"  -j, --json              Print snapshots as JSON\n"
"";

static bool parse_unsigned(const char *s, unsigned long long& val) noexcept
{
	if(s == nullptr || s[0] == '\0')
		return false;

	char *end = nullptr;
	errno = 0;
	val = strtoull(s, &end, 10);
	return errno == 0 && *end == '\0' && s[0] != '-';
}

static int parse_args_hpcmon(int argc, char **argv, hpcmon_args *args) noexcept
{
	parg_state ps{};
	parg_init(&ps);

	memset(args, 0, sizeof(hpcmon_args));
	args->limit = 100;

	for(int c; (c = parg_getopt_long(&ps, argc, argv, "vds:i:au:q:cn:1jh", argdefs, nullptr)) != -1; )
	{
		unsigned long long val;
		switch(c)
		{
			case ARGDEF_HELP:
				return 2;

			case ARGDEF_VERSION:
				++args->version;
				return 0;

			case ARGDEF_DEBUG:
				++args->debug;
				break;

			case ARGDEF_SCHEDULER:
				args->scheduler = ps.optarg;
				break;

			case ARGDEF_INTERVAL:
				if(!parse_unsigned(ps.optarg, val) || val == 0 || val > 86400)
					return 2;
				args->interval = static_cast<unsigned>(val);
				break;

			case ARGDEF_ALL:
				args->all = true;
				break;

			case ARGDEF_USER:
				args->user = ps.optarg;
				break;

			case ARGDEF_QUEUE:
				args->queue = ps.optarg;
				break;

			case ARGDEF_STATUS:
				args->status = ps.optarg;
				break;

			case ARGDEF_COMPLETED:
				args->completed = true;
				break;

			case ARGDEF_SINCE:
				args->since = ps.optarg;
				break;

			case ARGDEF_LIMIT:
				if(!parse_unsigned(ps.optarg, val))
					return 2;
				args->limit = static_cast<size_t>(val);
				break;

			case ARGDEF_ONCE:
				args->once = true;
				break;

			case ARGDEF_JSON:
				args->json = true;
				break;

			case 1:
			case '?':
			case ':':
			default:
				return 2;
		}
	}

	if(args->all && args->user != nullptr)
		return 2;

	return 0;
}

int parse_arguments(int argc, char **argv, FILE *out, FILE *err, hpcmon_args *args)
{
	int status = parse_args_hpcmon(argc, argv, args);
	if(status != 0)
	{
		fprintf(err, "Usage: %s [OPTIONS]\nOptions:\n%s", argv[0], USAGE_OPTIONS);
		return status;
	}

	if(args->version)
	{
		fprintf(out, "hpcmon %s libxml2/%s nlohmann_json/%d.%d.%d\n", HPCMON_VERSION, LIBXML_DOTTED_VERSION,
			NLOHMANN_JSON_VERSION_MAJOR, NLOHMANN_JSON_VERSION_MINOR, NLOHMANN_JSON_VERSION_PATCH);
		return status;
	}

	/* This isn't an error, we can attempt to autodetect otherwise. */
	if(args->scheduler == nullptr || args->scheduler[0] == '\0')
		args->scheduler = getenv("HPC_SCHEDULER");

	if(args->scheduler != nullptr && args->scheduler[0] == '\0')
		args->scheduler = nullptr;

	if(args->interval == 0)
	{
		const char *env = getenv("HPCMON_INTERVAL");
		unsigned long long val;
		if(env != nullptr && env[0] != '\0')
		{
			if(!parse_unsigned(env, val) || val == 0 || val > 86400)
			{
				fprintf(err, "HPCMON_INTERVAL is invalid. Please use the --interval option.\n");
				return 1;
			}
			args->interval = static_cast<unsigned>(val);
		}
		else
		{
			args->interval = 10;
		}
	}

	return 0;
}

}
