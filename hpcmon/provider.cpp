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
#include "provider.hpp"

namespace hpcmon {

job_provider::job_provider(scheduler& sched, std::chrono::seconds interval, std::string current_user) :
	m_scheduler(sched),
	m_interval(interval.count() > 0 ? interval : std::chrono::seconds(1)),
	m_current_user(std::move(current_user)),
	m_refreshing(false),
	m_stop(false),
	m_wake(false),
	m_filter{},
	m_snapshot{std::make_shared<const std::vector<job_info>>(), 0, true, {}, {}, 0, clock_type::now()}
{}

job_provider::~job_provider()
{
	stop();
}

void job_provider::start()
{
	std::lock_guard<std::mutex> l(m_mutex);
	if(m_thread.joinable())
		return;

	m_stop = false;
	m_wake = false;
	m_thread = std::thread(&job_provider::worker, this);
}

void job_provider::stop() noexcept
{
	{
		std::lock_guard<std::mutex> l(m_mutex);
		if(!m_thread.joinable())
			return;

		m_stop = true;
	}
	m_cv.notify_all();

	/* Any in-flight call runs to completion. */
	m_thread.join();
}

void job_provider::worker()
{
	using namespace std::chrono;

	std::unique_lock<std::mutex> lk(m_mutex);
	auto next = steady_clock::now();

	for(;;)
	{
		m_cv.wait_until(lk, next, [this, &next]() {
			return m_stop || m_wake || steady_clock::now() >= next;
		});

		if(m_stop)
			break;

		auto now = steady_clock::now();
		if(now >= next)
		{
			/* Manual refreshes don't shift the schedule. */
			next += m_interval;
			if(next <= now)
				next = now + m_interval;
		}
		m_wake = false;

		lk.unlock();
		do_refresh();
		lk.lock();
	}
}

bool job_provider::refresh_now()
{
	if(m_refreshing)
	{
		log_debug(log_level_debug) << "POLL: refresh already in flight, dropping request" << std::endl;
		return false;
	}

	{
		std::lock_guard<std::mutex> l(m_mutex);
		if(!m_thread.joinable())
			return false;

		m_wake = true;
	}
	m_cv.notify_all();
	return true;
}

bool job_provider::poll()
{
	return do_refresh();
}

void job_provider::set_filter(job_filter filter)
{
	{
		std::lock_guard<std::mutex> l(m_mutex);
		m_filter = std::move(filter);
	}
	refresh_now();
}

job_filter job_provider::filter() const
{
	std::lock_guard<std::mutex> l(m_mutex);
	return m_filter;
}

void job_provider::subscribe(listener l)
{
	std::lock_guard<std::mutex> sl(m_snap_mutex);
	m_listeners.push_back(std::move(l));
}

snapshot job_provider::current() const
{
	std::lock_guard<std::mutex> l(m_snap_mutex);
	return m_snapshot;
}

bool job_provider::do_refresh()
{
	bool expected = false;
	if(!m_refreshing.compare_exchange_strong(expected, true))
		return false;

	struct refresh_guard
	{
		std::atomic<bool>& flag;
		~refresh_guard() { flag = false; }
	} guard{m_refreshing};

	job_filter filter = this->filter();

	active_filter af;
	if(filter.scope == user_scope::mine)
		af.user = m_current_user;
	af.status = filter.status;
	af.queue = filter.queue;

	snapshot snap = current();
	snap.filter = filter;
	snap.timestamp = clock_type::now();
	++snap.generation;

	auto start = std::chrono::steady_clock::now();
	try
	{
		auto jobs = std::make_shared<const std::vector<job_info>>(m_scheduler.list_active_jobs(af));
		snap.count = jobs->size();
		snap.jobs = std::move(jobs);
		snap.ok = true;
		snap.error.clear();

		log_debug(log_level_debug) << "POLL: " << snap.count << " job(s) in "
			<< std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count()
			<< "ms" << std::endl;
	}
	catch(const std::exception& e)
	{
		/* Keep showing the last good list. */
		snap.ok = false;
		snap.error = e.what();
		log_error() << "POLL: refresh failed: " << e.what() << std::endl;
	}

	publish(std::move(snap));
	return true;
}

void job_provider::publish(snapshot snap)
{
	std::vector<listener> listeners;
	{
		std::lock_guard<std::mutex> l(m_snap_mutex);
		m_snapshot = snap;
		listeners = m_listeners;
	}

	for(const listener& l : listeners)
	{
		try
		{
			l(snap);
		}
		catch(const std::exception& e)
		{
			log_error() << "POLL: listener threw: " << e.what() << std::endl;
		}
	}
}

}
