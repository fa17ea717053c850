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
#include "controller.hxx"

#include "libupnpp/log.hxx"
#include "libupnpp/workqueue.hxx"
#include "libupcast/upcastutils.hxx"

using namespace std;
using namespace UPnPP;
using namespace UpCast;
using namespace UpCastClient;

// Minimum play time before an end of track starts the next one.
static const long autoAdvanceMinMs = 500;

class PlaybackController::Internal {
public:
    Internal()
        : events("EngineEvents") {
    }
    WorkQueue<EngineEvent> events;
};

PlaybackController::PlaybackController(
    shared_ptr<LocalPlaybackEngine> local, NetEngineFactory netfactory,
    shared_ptr<RendererDiscovery> discovery)
    : m_local(local), m_netfactory(netfactory), m_discovery(discovery),
      m_generation(0), m_loadseq(0), m_bitperfect(true), m(new Internal())
{
    OutputDestination dest;
    dest.name = "Default Output";
    bindEngine(m_local, dest);
}

PlaybackController::~PlaybackController()
{
    shutdown();
}

bool PlaybackController::start()
{
    AudioDevice dev;
    if (m_local->defaultDevice(dev)) {
        std::unique_lock<std::mutex> lock(m_enginemutex);
        if (m_dest.kind == OutputDestination::OD_LOCAL &&
            m_dest.devid.empty()) {
            m_dest.devid = dev.id;
            m_dest.name = dev.name;
        }
    }
    bool bp;
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        bp = m_bitperfect;
    }
    m_local->setBitPerfect(bp);
    if (!m->events.start(1, eventWorker, this)) {
        LOGERR("PlaybackController::start: can't start event thread" << endl);
        return false;
    }
    return true;
}

void PlaybackController::shutdown()
{
    // The event thread may be waiting for the command lock: don't hold it
    m->events.setTerminateAndWait();

    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    shared_ptr<PlaybackEngine> engine = getEngine();
    if (engine) {
        // No event thread any more: disconnect before stopping
        engine->setFinishedCallback(PlaybackEngine::FinishedCallback());
        engine->setStateChangedCallback(
            PlaybackEngine::StateChangedCallback());
        engine->stop();
    }
}

shared_ptr<PlaybackEngine> PlaybackController::getEngine()
{
    std::unique_lock<std::mutex> lock(m_enginemutex);
    return m_engine;
}

void PlaybackController::bindEngine(shared_ptr<PlaybackEngine> engine,
                                    const OutputDestination& dest)
{
    std::unique_lock<std::mutex> lock(m_enginemutex);
    if (m_engine) {
        m_engine->setFinishedCallback(PlaybackEngine::FinishedCallback());
        m_engine->setStateChangedCallback(
            PlaybackEngine::StateChangedCallback());
    }
    int gen = ++m_generation;
    engine->setFinishedCallback(
        [this, gen] () {
            if (!m->events.put(finishedEvent(gen))) {
                LOGDEB("PlaybackController: event queue closed" << endl);
            }
        });
    engine->setStateChangedCallback(
        [this, gen] (PlaybackState st) {
            if (!m->events.put(EngineEvent(EV_STATECHANGED, gen, st))) {
                LOGDEB("PlaybackController: event queue closed" << endl);
            }
        });
    m_engine = engine;
    m_dest = dest;
    LOGDEB("PlaybackController: bound " << dest.key() << " (" << dest.name <<
           ") generation " << gen << endl);
}

// Called from the engine thread: record the play time now, the event
// may wait for a while for the command lock.
PlaybackController::EngineEvent PlaybackController::finishedEvent(int gen)
{
    EngineEvent ev(EV_FINISHED, gen);
    std::unique_lock<std::mutex> lock(m_datamutex);
    ev.loadseq = m_loadedref.empty() ? -1 : m_loadseq;
    ev.elapsedms = m_loadchrono.millis();
    return ev;
}

void *PlaybackController::eventWorker(void *arg)
{
    PlaybackController *ctl = (PlaybackController *)arg;
    for (;;) {
        EngineEvent ev;
        if (!ctl->m->events.take(&ev)) {
            LOGDEB("PlaybackController::eventWorker: exiting" << endl);
            ctl->m->events.workerExit();
            return (void*)1;
        }
        ctl->onEngineEvent(ev);
    }
}

void PlaybackController::onEngineEvent(const EngineEvent& ev)
{
    if (ev.type == EV_STATECHANGED) {
        LOGDEB1("PlaybackController: engine state " <<
                pbStateToString(ev.state) << endl);
        return;
    }
    if (ev.type != EV_FINISHED)
        return;

    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    {
        std::unique_lock<std::mutex> lock(m_enginemutex);
        if (ev.generation != m_generation) {
            LOGDEB("PlaybackController: dropping event from old engine" <<
                   endl);
            return;
        }
    }
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        if (ev.loadseq < 0 || m_loadedref.empty()) {
            return;
        }
        if (ev.loadseq != m_loadseq) {
            LOGDEB("PlaybackController: end of track for an old load" <<
                   endl);
            return;
        }
    }
    if (ev.elapsedms < autoAdvanceMinMs) {
        LOGINF("PlaybackController: track played for " << ev.elapsedms <<
               " mS only, not starting the next one" << endl);
        return;
    }
    int ret = nextLocked();
    if (ret == UPCAST_E_NO_ITEM) {
        LOGDEB("PlaybackController: end of playlist" << endl);
    } else if (ret != UPCAST_E_SUCCESS) {
        LOGERR(errAsString("PlaybackController: auto-advance", ret) << endl);
    }
}

int PlaybackController::loadAndPlayLocked(const string& ref)
{
    shared_ptr<PlaybackEngine> engine = getEngine();
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        m_loadedref = ref;
        m_loadseq++;
        m_loadchrono.restart();
    }
    int ret = engine->loadAndPlay(ref);
    if (ret != UPCAST_E_SUCCESS) {
        std::unique_lock<std::mutex> lock(m_datamutex);
        m_loadedref.clear();
    }
    return ret;
}

int PlaybackController::nextLocked()
{
    PlaylistItem item;
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        if (!m_playlist.next(item))
            return UPCAST_E_NO_ITEM;
    }
    return loadAndPlayLocked(item.locator);
}

int PlaybackController::play()
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    shared_ptr<PlaybackEngine> engine = getEngine();
    switch (engine->state()) {
    case PBS_PLAY:
        return UPCAST_E_SUCCESS;
    case PBS_PAUSE:
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        m_loadchrono.restart();
    }
    return engine->play();
    case PBS_STOP:
    default:
        break;
    }
    PlaylistItem item;
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        if (!m_playlist.currentItem(item)) {
            LOGDEB("PlaybackController::play: empty playlist" << endl);
            return UPCAST_E_NO_ITEM;
        }
    }
    return loadAndPlayLocked(item.locator);
}

int PlaybackController::playItem(int idx)
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    PlaylistItem item;
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        if (!m_playlist.jumpTo(idx, &item)) {
            LOGERR("PlaybackController::playItem: bad index " << idx << endl);
            return UPCAST_E_INVALID_PARAM;
        }
    }
    return loadAndPlayLocked(item.locator);
}

int PlaybackController::pause()
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    return getEngine()->pause();
}

int PlaybackController::resume()
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        m_loadchrono.restart();
    }
    return getEngine()->play();
}

int PlaybackController::stop()
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    int ret = getEngine()->stop();
    std::unique_lock<std::mutex> lock(m_datamutex);
    m_loadedref.clear();
    return ret;
}

int PlaybackController::next()
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    return nextLocked();
}

int PlaybackController::previous()
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    PlaylistItem item;
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        if (!m_playlist.previous(item))
            return UPCAST_E_NO_ITEM;
    }
    return loadAndPlayLocked(item.locator);
}

int PlaybackController::seek(int ms)
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    return getEngine()->seek(ms);
}

int PlaybackController::setVolume(float vol)
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    return getEngine()->setVolume(vol);
}

int PlaybackController::setBitPerfect(bool on)
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        m_bitperfect = on;
    }
    m_local->setBitPerfect(on);
    return UPCAST_E_SUCCESS;
}

int PlaybackController::setPlaybackMode(PlaybackMode mode)
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    std::unique_lock<std::mutex> lock(m_datamutex);
    m_playlist.setMode(mode);
    return UPCAST_E_SUCCESS;
}

bool PlaybackController::resolveDestination(const string& dest,
                                            OutputDestination& od,
                                            RendererDevice& device)
{
    if (dest.empty() || !dest.compare("local")) {
        od.kind = OutputDestination::OD_LOCAL;
        od.devid.clear();
        od.name = "Default Output";
        return true;
    }

    vector<AudioDevice> ldevs;
    if (!m_local->listDevices(ldevs)) {
        LOGDEB("PlaybackController: can't list local devices" << endl);
    }
    string localid;
    if (beginswith(dest, "local-")) {
        localid = dest.substr(6);
    }
    for (unsigned int i = 0; i < ldevs.size(); i++) {
        if ((!localid.empty() && !ldevs[i].id.compare(localid)) ||
            !ldevs[i].name.compare(dest)) {
            od.kind = OutputDestination::OD_LOCAL;
            od.devid = ldevs[i].id;
            od.name = ldevs[i].name;
            return true;
        }
    }
    if (!localid.empty()) {
        return false;
    }

    if (!m_discovery) {
        return false;
    }
    string rid = dest;
    if (beginswith(dest, "upnp-")) {
        rid = dest.substr(5);
    }
    if (!m_discovery->getDirectory()->getDevice(rid, device)) {
        return false;
    }
    od.kind = OutputDestination::OD_UPNP;
    od.devid = device.id;
    od.name = device.friendlyName;
    return true;
}

int PlaybackController::setOutputDestination(const string& dest)
{
    LOGDEB("PlaybackController::setOutputDestination: " << dest << endl);
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);

    OutputDestination od;
    RendererDevice device;
    if (!resolveDestination(dest, od, device)) {
        LOGERR("PlaybackController::setOutputDestination: unknown "
               "destination " << dest << endl);
        return UPCAST_E_INVALID_PARAM;
    }
    if (od.kind == OutputDestination::OD_UPNP && !m_netfactory) {
        LOGERR("PlaybackController::setOutputDestination: no network "
               "support" << endl);
        return UPCAST_E_ENGINE;
    }

    getEngine()->stop();

    shared_ptr<PlaybackEngine> engine;
    if (od.kind == OutputDestination::OD_LOCAL) {
        if (!od.devid.empty()) {
            int ret = m_local->selectDevice(od.devid);
            if (ret != UPCAST_E_SUCCESS) {
                LOGERR(errAsString("PlaybackController: selectDevice", ret) <<
                       endl);
                return ret;
            }
        }
        engine = m_local;
    } else {
        engine = m_netfactory(device);
        if (!engine) {
            LOGERR("PlaybackController: could not create engine for " <<
                   device.friendlyName << endl);
            return UPCAST_E_ENGINE;
        }
    }
    bindEngine(engine, od);

    string ref;
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        ref = m_loadedref;
    }
    if (!ref.empty()) {
        int ret = loadAndPlayLocked(ref);
        if (ret != UPCAST_E_SUCCESS) {
            LOGERR(errAsString("PlaybackController: reload after switch", ret)
                   << endl);
        }
    }
    return UPCAST_E_SUCCESS;
}

void PlaybackController::addToPlaylist(const string& path)
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    std::unique_lock<std::mutex> lock(m_datamutex);
    m_playlist.add(PlaylistItem(path));
}

void PlaybackController::addToPlaylist(const vector<string>& paths)
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    std::unique_lock<std::mutex> lock(m_datamutex);
    for (unsigned int i = 0; i < paths.size(); i++) {
        m_playlist.add(PlaylistItem(paths[i]));
    }
}

bool PlaybackController::removeFromPlaylist(int idx)
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    std::unique_lock<std::mutex> lock(m_datamutex);
    return m_playlist.remove(idx);
}

void PlaybackController::clearPlaylist()
{
    std::unique_lock<std::mutex> cmdlock(m_cmdmutex);
    std::unique_lock<std::mutex> lock(m_datamutex);
    m_playlist.clear();
}

PlaybackState PlaybackController::currentState()
{
    return getEngine()->state();
}

int PlaybackController::currentTimeMs()
{
    return getEngine()->currentTimeMs();
}

bool PlaybackController::durationMs(int *ms)
{
    return getEngine()->durationMs(ms);
}

float PlaybackController::volume()
{
    return getEngine()->volume();
}

bool PlaybackController::currentItem(PlaylistItem& item)
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    return m_playlist.currentItem(item);
}

int PlaybackController::currentPosition()
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    return m_playlist.currentPosition();
}

vector<PlaylistItem> PlaybackController::playlistItems()
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    return m_playlist.items();
}

OutputDestination PlaybackController::currentDestination()
{
    std::unique_lock<std::mutex> lock(m_enginemutex);
    return m_dest;
}

bool PlaybackController::getFormatDescription(string& desc)
{
    return getEngine()->getFormatDescription(desc);
}

bool PlaybackController::bitPerfect()
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    return m_bitperfect;
}

PlaybackMode PlaybackController::playbackMode()
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    return m_playlist.mode();
}

bool PlaybackController::listAllDestinations(vector<OutputDestination>& dests)
{
    dests.clear();
    vector<AudioDevice> ldevs;
    if (m_local->listDevices(ldevs)) {
        for (unsigned int i = 0; i < ldevs.size(); i++) {
            OutputDestination od;
            od.kind = OutputDestination::OD_LOCAL;
            od.devid = ldevs[i].id;
            od.name = ldevs[i].name;
            dests.push_back(od);
        }
    } else {
        LOGERR("PlaybackController: can't list local devices" << endl);
    }

    if (m_discovery) {
        vector<RendererDevice> rdevs;
        m_discovery->getDirectory()->getDevices(rdevs);
        for (unsigned int i = 0; i < rdevs.size(); i++) {
            OutputDestination od;
            od.kind = OutputDestination::OD_UPNP;
            od.devid = rdevs[i].id;
            od.name = rdevs[i].friendlyName;
            dests.push_back(od);
        }
    }
    return true;
}

bool PlaybackController::refreshDevices()
{
    if (!m_discovery)
        return false;
    return m_discovery->refresh();
}
