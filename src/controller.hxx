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
#ifndef _CONTROLLER_H_X_INCLUDED_
#define _CONTROLLER_H_X_INCLUDED_

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <functional>

#include "playbackengine.hxx"
#include "localengine.hxx"
#include "playlist.hxx"
#include "libupcast/chrono.hxx"
#include "libupcast/control/rendererdevice.hxx"
#include "libupcast/control/rendererdirectory.hxx"

/** Where the sound goes: a local device, or a network renderer */
class OutputDestination {
public:
    enum Kind {OD_LOCAL, OD_UPNP};
    OutputDestination() : kind(OD_LOCAL) {}
    Kind kind;
    /** Device id: MPD output id or renderer UUID. May be empty for
     * the local default device. */
    std::string devid;
    std::string name;
    /** "local-<devid>" or "upnp-<devid>" */
    std::string key() const {
        return std::string(kind == OD_LOCAL ? "local-" : "upnp-") + devid;
    }
};

/**
 * The player: a playlist and the currently bound engine.
 *
 * Commands are serialized. The read-side methods only look at the
 * current engine and playlist and never wait for a command to
 * complete.
 *
 * Engine events are queued with the generation of the engine which
 * produced them, and processed by a single event thread. Events from
 * an engine which is not current any more are dropped. An end of track
 * starts the next one, except if the track had been playing for less
 * than 500 mS when the engine reported it, which usually means that
 * it failed to play. The play time is measured when the event is
 * produced, not when it is processed.
 */
class PlaybackController {
public:
    typedef std::function<std::shared_ptr<PlaybackEngine>
                          (const UpCastClient::RendererDevice&)>
    NetEngineFactory;

    /**
     * @param local the local engine. Must not be null.
     * @param netfactory builds the engine for a renderer. If empty,
     *    network destinations are refused.
     * @param discovery source for the renderer list. May be null.
     */
    PlaybackController(std::shared_ptr<LocalPlaybackEngine> local,
                       NetEngineFactory netfactory,
                       std::shared_ptr<UpCastClient::RendererDiscovery> discovery);
    ~PlaybackController();

    /** Start the event thread */
    bool start();
    /** Stop playing and the event thread. */
    void shutdown();

    // Commands. These return UPCAST_E_SUCCESS or an error code.
    int play();
    int playItem(int idx);
    int pause();
    int resume();
    int stop();
    int next();
    int previous();
    int seek(int ms);
    int setVolume(float vol);
    int setBitPerfect(bool on);
    int setPlaybackMode(PlaybackMode mode);
    /** @param dest "local", "local-<id>", "upnp-<id>", or a renderer
     *   or local device name */
    int setOutputDestination(const std::string& dest);

    void addToPlaylist(const std::string& path);
    void addToPlaylist(const std::vector<std::string>& paths);
    bool removeFromPlaylist(int idx);
    void clearPlaylist();

    // Read side
    PlaybackState currentState();
    int currentTimeMs();
    bool durationMs(int *ms);
    float volume();
    bool currentItem(PlaylistItem& item);
    int currentPosition();
    std::vector<PlaylistItem> playlistItems();
    OutputDestination currentDestination();
    bool getFormatDescription(std::string& desc);
    bool bitPerfect();
    PlaybackMode playbackMode();

    /** Local devices followed by the currently known renderers */
    bool listAllDestinations(std::vector<OutputDestination>& dests);

    /** Restart discovery, dropping the known renderers */
    bool refreshDevices();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

private:
    enum EventType {EV_FINISHED, EV_STATECHANGED, EV_EXIT};
    struct EngineEvent {
        EngineEvent()
            : type(EV_EXIT), generation(0), state(PBS_STOP), loadseq(0),
              elapsedms(0) {}
        EngineEvent(EventType tp, int gen, PlaybackState st = PBS_STOP)
            : type(tp), generation(gen), state(st), loadseq(0),
              elapsedms(0) {}
        EventType type;
        int generation;
        PlaybackState state;
        // For EV_FINISHED: the load it ends, or -1 if nothing was
        // loaded, and how long it had been playing.
        int loadseq;
        long elapsedms;
    };

    std::shared_ptr<LocalPlaybackEngine> m_local;
    NetEngineFactory m_netfactory;
    std::shared_ptr<UpCastClient::RendererDiscovery> m_discovery;

    // Serializes the commands.
    std::mutex m_cmdmutex;

    // Protects the current engine pointer, generation and
    // destination.
    std::mutex m_enginemutex;
    std::shared_ptr<PlaybackEngine> m_engine;
    int m_generation;
    OutputDestination m_dest;

    // Protects the playlist and the load tracking data
    std::mutex m_datamutex;
    Playlist m_playlist;
    // Reference loaded since the last explicit stop, when, and a
    // sequence number for each load.
    std::string m_loadedref;
    UpCast::Chrono m_loadchrono;
    int m_loadseq;
    bool m_bitperfect;

    // The event queue
    class Internal;
    std::unique_ptr<Internal> m;

    std::shared_ptr<PlaybackEngine> getEngine();
    void bindEngine(std::shared_ptr<PlaybackEngine> engine,
                    const OutputDestination& dest);
    int loadAndPlayLocked(const std::string& ref);
    int nextLocked();
    bool resolveDestination(const std::string& dest, OutputDestination& od,
                            UpCastClient::RendererDevice& device);
    EngineEvent finishedEvent(int gen);
    static void *eventWorker(void *);
    void onEngineEvent(const EngineEvent& ev);
};

#endif /* _CONTROLLER_H_X_INCLUDED_ */
