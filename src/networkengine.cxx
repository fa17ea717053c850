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
#include "networkengine.hxx"

#include <chrono>

#include "libupnpp/log.hxx"
#include "libupcast/upcastutils.hxx"

using namespace std;
using namespace UpCast;

NetworkPlaybackEngine::NetworkPlaybackEngine(
    shared_ptr<RendererControl> ctl, const string& name,
    shared_ptr<LocalMediaServer> server, int pollms)
    : m_ctl(ctl), m_name(name), m_server(server), m_pollms(pollms),
      m_state(PBS_STOP), m_shareid(-1), m_positionms(0), m_durationms(-1),
      m_volume(1.0), m_muted(false), m_cmdgen(0), m_loading(false),
      m_stoppoll(false)
{
    LOGDEB("NetworkPlaybackEngine: " << m_name << " transport " <<
           m_ctl->hasTransport() << " rendering " << m_ctl->hasRendering() <<
           endl);
}

NetworkPlaybackEngine::~NetworkPlaybackEngine()
{
    stopPolling();
    unshare();
}

bool NetworkPlaybackEngine::tpStateToPbState(
    RendererControl::TransportState tps, PlaybackState *pbs)
{
    switch (tps) {
    case RendererControl::TPS_PLAYING:
    case RendererControl::TPS_TRANSITIONING:
        *pbs = PBS_PLAY;
        return true;
    case RendererControl::TPS_PAUSED:
        *pbs = PBS_PAUSE;
        return true;
    case RendererControl::TPS_STOPPED:
    case RendererControl::TPS_NOMEDIA:
        *pbs = PBS_STOP;
        return true;
    case RendererControl::TPS_UNKNOWN:
    default:
        return false;
    }
}

void NetworkPlaybackEngine::setState(PlaybackState st)
{
    PlaybackState old;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        old = m_state;
        m_state = st;
        m_cmdgen++;
    }
    if (old != st)
        fireStateChanged(st);
}

bool NetworkPlaybackEngine::isCurrent(unsigned int gen)
{
    return !m_loading && gen == m_cmdgen;
}

void NetworkPlaybackEngine::unshare()
{
    int id;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        id = m_shareid;
        m_shareid = -1;
    }
    if (id > 0 && m_server) {
        m_server->unshareFile(id);
    }
}

void NetworkPlaybackEngine::startPolling()
{
    std::unique_lock<std::mutex> lock(m_pollmutex);
    if (m_poller.joinable())
        return;
    m_stoppoll = false;
    m_poller = std::thread(&NetworkPlaybackEngine::pollLoop, this);
}

void NetworkPlaybackEngine::stopPolling()
{
    std::thread poller;
    {
        std::unique_lock<std::mutex> lock(m_pollmutex);
        m_stoppoll = true;
        m_pollcv.notify_all();
        poller.swap(m_poller);
    }
    if (poller.joinable()) {
        if (poller.get_id() == std::this_thread::get_id()) {
            LOGERR("NetworkPlaybackEngine::stopPolling: called from the "
                   "poll thread" << endl);
            poller.detach();
        } else {
            poller.join();
        }
    }
}

void NetworkPlaybackEngine::pollLoop()
{
    LOGDEB("NetworkPlaybackEngine: polling " << m_name << " every " <<
           m_pollms << " mS" << endl);
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(m_pollmutex);
            m_pollcv.wait_for(lock, std::chrono::milliseconds(m_pollms),
                              [this] {return m_stoppoll;});
            if (m_stoppoll)
                break;
        }
        pollOnce();
    }
    LOGDEB("NetworkPlaybackEngine: poll thread exiting" << endl);
}

void NetworkPlaybackEngine::pollOnce()
{
    unsigned int gen;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_loading)
            return;
        gen = m_cmdgen;
    }

    RendererControl::TransportState tps;
    int ret = m_ctl->getTransportState(tps);
    if (ret != UPCAST_E_SUCCESS) {
        LOGERR(errAsString("NetworkPlaybackEngine::poll: getTransportState",
                           ret) << endl);
        return;
    }
    PlaybackState nstate;
    if (!tpStateToPbState(tps, &nstate)) {
        LOGINF("NetworkPlaybackEngine::poll: unknown transport state" << endl);
        return;
    }

    PlaybackState old;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!isCurrent(gen)) {
            LOGDEB("NetworkPlaybackEngine::poll: stale result dropped" << endl);
            return;
        }
        old = m_state;
        m_state = nstate;
    }
    if (old != nstate) {
        LOGDEB("NetworkPlaybackEngine::poll: " << pbStateToString(old) <<
               " -> " << pbStateToString(nstate) << endl);
        fireStateChanged(nstate);
        if (nstate == PBS_STOP) {
            fireFinished();
        }
    }

    if (nstate != PBS_STOP) {
        int posms, durms;
        ret = m_ctl->getPosition(posms, durms);
        if (ret != UPCAST_E_SUCCESS) {
            LOGERR(errAsString("NetworkPlaybackEngine::poll: getPosition",
                               ret) << endl);
        } else {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (isCurrent(gen)) {
                if (posms >= 0)
                    m_positionms = posms;
                if (durms > 0)
                    m_durationms = durms;
            }
        }
    }

    if (m_ctl->hasRendering()) {
        int vol;
        ret = m_ctl->getVolume(vol);
        if (ret != UPCAST_E_SUCCESS) {
            LOGERR(errAsString("NetworkPlaybackEngine::poll: getVolume", ret)
                   << endl);
        } else {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_volume = float(vol) / 100.0;
        }
    }
}

int NetworkPlaybackEngine::loadAndPlay(const string& path)
{
    LOGDEB("NetworkPlaybackEngine::loadAndPlay: " << path << " on " <<
           m_name << endl);
    PlaybackState prev;
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        prev = m_state;
        m_state = PBS_PLAY;
        m_loading = true;
        m_cmdgen++;
        m_ref = path;
        m_positionms = 0;
        m_durationms = -1;
    }

    stopPolling();
    int ret = m_ctl->stop();
    if (ret != UPCAST_E_SUCCESS) {
        LOGDEB(errAsString("NetworkPlaybackEngine::loadAndPlay: stop", ret)
               << endl);
    }
    unshare();

    int id = -1;
    string url;
    if (!m_ctl->hasTransport()) {
        ret = UPCAST_E_NO_SERVICE;
    } else if (!path_exists(path)) {
        ret = UPCAST_E_FILE_NOT_FOUND;
    } else if (!m_server) {
        ret = UPCAST_E_SERVER;
    } else {
        ret = m_server->shareFile(path, url, &id);
    }
    if (ret == UPCAST_E_SUCCESS) {
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_shareid = id;
        }
        ret = m_ctl->setURI(url, "");
    }
    if (ret == UPCAST_E_SUCCESS) {
        ret = m_ctl->play();
    }

    if (ret != UPCAST_E_SUCCESS) {
        LOGERR(errAsString("NetworkPlaybackEngine::loadAndPlay", ret) << endl);
        unshare();
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_state = PBS_STOP;
            m_loading = false;
            m_cmdgen++;
            m_ref.clear();
        }
        if (prev != PBS_STOP)
            fireStateChanged(PBS_STOP);
        return ret;
    }

    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_state = PBS_PLAY;
        m_loading = false;
        m_cmdgen++;
    }
    startPolling();
    if (prev != PBS_PLAY)
        fireStateChanged(PBS_PLAY);
    return ret;
}

int NetworkPlaybackEngine::play()
{
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_ref.empty()) {
            LOGDEB("NetworkPlaybackEngine::play: nothing loaded" << endl);
            return UPCAST_E_NO_ITEM;
        }
    }
    int ret = m_ctl->play();
    if (ret != UPCAST_E_SUCCESS) {
        LOGERR(errAsString("NetworkPlaybackEngine::play", ret) << endl);
        return ret;
    }
    setState(PBS_PLAY);
    startPolling();
    return ret;
}

int NetworkPlaybackEngine::pause()
{
    int ret = m_ctl->pause();
    if (ret != UPCAST_E_SUCCESS) {
        LOGERR(errAsString("NetworkPlaybackEngine::pause", ret) << endl);
        return ret;
    }
    setState(PBS_PAUSE);
    return ret;
}

int NetworkPlaybackEngine::stop()
{
    LOGDEB("NetworkPlaybackEngine::stop" << endl);
    stopPolling();
    int ret = m_ctl->stop();
    if (ret != UPCAST_E_SUCCESS) {
        LOGERR(errAsString("NetworkPlaybackEngine::stop", ret) << endl);
    }
    unshare();
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_ref.clear();
        m_positionms = 0;
    }
    setState(PBS_STOP);
    return UPCAST_E_SUCCESS;
}

int NetworkPlaybackEngine::seek(int ms)
{
    if (ms < 0)
        return UPCAST_E_INVALID_PARAM;
    int ret = m_ctl->seek(ms);
    if (ret != UPCAST_E_SUCCESS) {
        LOGERR(errAsString("NetworkPlaybackEngine::seek", ret) << endl);
        return ret;
    }
    std::unique_lock<std::mutex> lock(m_mutex);
    m_positionms = ms;
    return ret;
}

float NetworkPlaybackEngine::volume()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_volume;
}

int NetworkPlaybackEngine::setVolume(float vol)
{
    if (vol < 0.0)
        vol = 0.0;
    if (vol > 1.0)
        vol = 1.0;
    int ret = m_ctl->setVolume(int(vol * 100 + 0.5));
    if (ret != UPCAST_E_SUCCESS) {
        LOGERR(errAsString("NetworkPlaybackEngine::setVolume", ret) << endl);
        return ret;
    }
    std::unique_lock<std::mutex> lock(m_mutex);
    m_volume = vol;
    return ret;
}

int NetworkPlaybackEngine::setMute(bool mute)
{
    int ret = m_ctl->setMute(mute);
    if (ret != UPCAST_E_SUCCESS) {
        LOGERR(errAsString("NetworkPlaybackEngine::setMute", ret) << endl);
        return ret;
    }
    std::unique_lock<std::mutex> lock(m_mutex);
    m_muted = mute;
    return ret;
}

bool NetworkPlaybackEngine::isMuted()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_muted;
}

PlaybackState NetworkPlaybackEngine::state()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_state;
}

int NetworkPlaybackEngine::currentTimeMs()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_positionms;
}

bool NetworkPlaybackEngine::durationMs(int *ms)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_durationms <= 0)
        return false;
    *ms = m_durationms;
    return true;
}

string NetworkPlaybackEngine::currentRef()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_ref;
}

bool NetworkPlaybackEngine::getFormatDescription(string& desc)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_ref.empty())
        return false;
    desc = stringtoupper(path_suffix(m_ref)) + " (via UPnP)";
    return true;
}
