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
#ifndef _HPCMON_PROVIDER_HPP
#define _HPCMON_PROVIDER_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <thread>
#include "scheduler.hpp"

namespace hpcmon {

enum class user_scope
{
	mine,
	all
};

struct job_filter
{
	user_scope scope = user_scope::mine;
	std::optional<status_set> status;
	std::optional<std::string> queue;
};

struct snapshot
{
	std::shared_ptr<const std::vector<job_info>> jobs;
	size_t count;
	bool ok;
	std::string error;
	job_filter filter;
	uint64_t generation;
	time_point timestamp;
};

/*
 * Polls a scheduler on its own thread and publishes immutable snapshots.
 * At most one list_active_jobs() call is ever in flight; manual refreshes
 * requested while one is running are dropped, not queued.
 */
class job_provider
{
public:
	using listener = std::function<void(const snapshot&)>;

	job_provider(scheduler& sched, std::chrono::seconds interval, std::string current_user);
	~job_provider();

	job_provider(const job_provider&) = delete;
	job_provider& operator=(const job_provider&) = delete;

	void start();
	void stop() noexcept;

	bool refresh_now();
	/* Refresh on the calling thread. False if one was already in flight. */
	bool poll();

	void set_filter(job_filter filter);
	job_filter filter() const;

	void subscribe(listener l);

	snapshot current() const;
	bool refreshing() const noexcept { return m_refreshing; }

private:
	void worker();
	bool do_refresh();
	void publish(snapshot snap);

	scheduler& m_scheduler;
	std::chrono::seconds m_interval;
	std::string m_current_user;

	std::atomic<bool> m_refreshing;

	mutable std::mutex m_mutex;
	std::condition_variable m_cv;
	bool m_stop;
	bool m_wake;
	job_filter m_filter;
	std::thread m_thread;

	mutable std::mutex m_snap_mutex;
	snapshot m_snapshot;
	std::vector<listener> m_listeners;
};

}

#endif /* _HPCMON_PROVIDER_HPP */
