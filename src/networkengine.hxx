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
#ifndef _NETWORKENGINE_H_X_INCLUDED_
#define _NETWORKENGINE_H_X_INCLUDED_

#include <string>
#include <memory>
#include <mutex>
#include <thread>
#include <condition_variable>

#include "playbackengine.hxx"
#include "mediaserver.hxx"
#include "renderercontrol.hxx"

/**
 * Playback engine driving a UPnP Media Renderer.
 *
 * Local files are made available to the renderer through the media
 * server. While a track is loaded, a poll thread retrieves the
 * renderer state every pollms milliseconds, signals state changes,
 * and the end of track (transition into stopped state).
 *
 * Every command bumps a generation counter. A poll tick which started
 * before the last command, or runs while a load is in progress,
 * discards what it got from the renderer.
 */
class NetworkPlaybackEngine : public PlaybackEngine {
public:
    /**
     * @param ctl the renderer. Must not be null.
     * @param name the renderer name, for messages.
     * @param server where the tracks are published.
     */
    NetworkPlaybackEngine(std::shared_ptr<RendererControl> ctl,
                          const std::string& name,
                          std::shared_ptr<LocalMediaServer> server,
                          int pollms = 1000);
    virtual ~NetworkPlaybackEngine();

    virtual int loadAndPlay(const std::string& ref);
    virtual int play();
    virtual int pause();
    virtual int stop();
    virtual int seek(int ms);
    virtual float volume();
    virtual int setVolume(float vol);
    virtual PlaybackState state();
    virtual int currentTimeMs();
    virtual bool durationMs(int *ms);
    virtual std::string currentRef();
    virtual bool getFormatDescription(std::string& desc);

    int setMute(bool mute);
    bool isMuted();

    const std::string& getName() const {
        return m_name;
    }

    /** Map the renderer transport state to ours. Transitioning counts
     * as playing. @return false for Unknown */
    static bool tpStateToPbState(RendererControl::TransportState,
                                 PlaybackState *pbs);

    /** Perform one poll tick. Normally called from the poll thread. */
    void pollOnce();

private:
    std::shared_ptr<RendererControl> m_ctl;
    std::string m_name;
    std::shared_ptr<LocalMediaServer> m_server;
    int m_pollms;

    std::mutex m_mutex;
    PlaybackState m_state;
    std::string m_ref;
    int m_shareid;
    int m_positionms;
    int m_durationms;
    float m_volume;
    bool m_muted;
    // Command generation and load in progress flag, for the poller
    unsigned int m_cmdgen;
    bool m_loading;

    std::mutex m_pollmutex;
    std::condition_variable m_pollcv;
    std::thread m_poller;
    bool m_stoppoll;

    void startPolling();
    void stopPolling();
    void pollLoop();
    void unshare();
    void setState(PlaybackState st);
    bool isCurrent(unsigned int gen);
};

#endif /* _NETWORKENGINE_H_X_INCLUDED_ */
