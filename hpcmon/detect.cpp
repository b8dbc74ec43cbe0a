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
#include <ostream>
#include "scheduler.hpp"

namespace hpcmon {

bool probe_sge_qstat(command_runner& runner) noexcept
{
	try
	{
		command_result res = runner.run({"qstat", "-help"}, sge_probe_timeout);
		if(res.timed_out)
		{
			log_debug(log_level_debug) << "DETECT: qstat -help timed out" << std::endl;
			return false;
		}

		/* Exit status varies between releases, only the banner matters. */
		for(const std::string *s : {&res.out, &res.err})
		{
			if(s->find("SGE") != std::string::npos || s->find("Grid Engine") != std::string::npos)
				return true;
		}
	}
	catch(const std::exception& e)
	{
		log_debug(log_level_debug) << "DETECT: qstat -help failed: " << e.what() << std::endl;
	}

	return false;
}

std::string detect_scheduler(command_runner& runner)
{
	/* This one's easy. */
	std::string forced = to_lower(trim(get_env("HPC_SCHEDULER")));
	if(!forced.empty())
	{
		log_debug(log_level_debug) << "DETECT: using $HPC_SCHEDULER=" << forced << std::endl;
		return forced;
	}

	bool have_qsub = find_executable("qsub").has_value();

	/* PBS ships a qsub too, so SGE needs positive identification. */
	if(have_qsub && (!get_env("SGE_ROOT").empty() || probe_sge_qstat(runner)))
	{
		log_debug(log_level_debug) << "DETECT: found SGE" << std::endl;
		return "sge";
	}

	if(find_executable("sbatch") && find_executable("squeue"))
	{
		log_debug(log_level_debug) << "DETECT: found Slurm" << std::endl;
		return "slurm";
	}

	if(have_qsub && !get_env("PBS_CONF_FILE").empty())
	{
		log_debug(log_level_debug) << "DETECT: found PBS" << std::endl;
		return "pbs";
	}

	log_debug(log_level_debug) << "DETECT: no batch system found, running locally" << std::endl;
	return "local";
}

scheduler_kind parse_scheduler_kind(std::string_view name)
{
	/* Unmatched names map to the first entry, scheduler_kind::unknown. */
	return nlohmann::json(to_lower(trim(name))).get<scheduler_kind>();
}

std::unique_ptr<scheduler> make_scheduler(std::string_view name, command_runner& runner)
{
	switch(parse_scheduler_kind(name))
	{
		case scheduler_kind::sge:
			return std::make_unique<sge_scheduler>(runner);
		case scheduler_kind::slurm:
			return std::make_unique<slurm_scheduler>(runner);
		case scheduler_kind::pbs:
			return std::make_unique<pbs_scheduler>(runner);
		case scheduler_kind::local:
			return std::make_unique<local_scheduler>(runner);
		case scheduler_kind::unknown:
			break;
	}

	throw std::runtime_error("Unknown scheduler '" + std::string(name) + "'. Valid options are sge, slurm, pbs and local");
}

}
