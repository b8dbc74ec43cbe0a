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
#include <atomic>
#include <iostream>
#include "hpcmon.hpp"

namespace hpcmon {

static std::atomic<uint32_t> g_log_level{log_level_normal};

void set_log_level(uint32_t level) noexcept
{
	g_log_level = level;
}

uint32_t get_log_level() noexcept
{
	return g_log_level;
}

std::ostream& log_error() noexcept
{
	return std::cerr;
}

std::ostream& log_debug(uint32_t level) noexcept
{
	static std::ostream s(nullptr);

	if(g_log_level >= level)
		return std::cerr;

	return s;
}

}
