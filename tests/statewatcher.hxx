/* Copyright (C) 2026 The upcast authors
 *	 This program is free software; you can redistribute it and/or modify
 *	 it under the terms of the GNU General Public License as published by
 *	 the Free Software Foundation; either version 2 of the License, or
 *	 (at your option) any later version.
 *
 *	 This program is distributed in the hope that it will be useful,
 *	 but WITHOUT ANY WARRANTY; without even the implied warranty of
 *	 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *	 GNU General Public License for more details.
 *
 *	 You should have received a copy of the GNU General Public License
 *	 along with this program; if not, write to the
 *	 Free Software Foundation, Inc.,
 *	 59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
#ifndef _STATEWATCHER_HXX_INCLUDED_
#define _STATEWATCHER_HXX_INCLUDED_

#include <vector>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>

#include "playbackengine.hxx"

// Samples an engine state from its own thread until told to stop, and
// records the sequence of distinct states seen.
class StateWatcher {
public:
    explicit StateWatcher(std::shared_ptr<PlaybackEngine> engine)
        : m_engine(engine), m_stop(false), m_samples(0) {
        m_thread = std::thread([this] () {
                while (!m_stop) {
                    PlaybackState st = m_engine->state();
                    {
                        std::unique_lock<std::mutex> lock(m_mutex);
                        if (m_seen.empty() || m_seen.back() != st)
                            m_seen.push_back(st);
                    }
                    m_samples++;
                    std::this_thread::sleep_for(
                        std::chrono::microseconds(200));
                }
            });
    }
    ~StateWatcher() {
        finish();
    }
    void finish() {
        m_stop = true;
        if (m_thread.joinable())
            m_thread.join();
    }
    int samples() {
        return m_samples;
    }
    std::vector<PlaybackState> seen() {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_seen;
    }
private:
    std::shared_ptr<PlaybackEngine> m_engine;
    std::atomic<bool> m_stop;
    std::atomic<int> m_samples;
    std::mutex m_mutex;
    std::vector<PlaybackState> m_seen;
    std::thread m_thread;
};

#endif /* _STATEWATCHER_HXX_INCLUDED_ */
