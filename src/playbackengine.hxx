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
#ifndef _PLAYBACKENGINE_H_X_INCLUDED_
#define _PLAYBACKENGINE_H_X_INCLUDED_

#include <string>
#include <mutex>
#include <functional>

/** The three states seen by the controller and its observers */
enum PlaybackState {PBS_STOP, PBS_PLAY, PBS_PAUSE};

extern const char *pbStateToString(PlaybackState st);

/**
 * Interface to the things which can play a track: the local output
 * adapter and the network renderer engine.
 *
 * The int methods return UPCAST_E_SUCCESS or a negative UPCAST_E_* code.
 *
 * loadAndPlay() is atomic from the point of view of state() readers:
 * they see PBS_PLAY from the start of the call, until it returns
 * successfully, or they see PBS_STOP after a failure.
 *
 * The callbacks may be called from an internal thread of the
 * engine. They must return quickly and must not call back into the
 * engine.
 */
class PlaybackEngine {
public:
    typedef std::function<void ()> FinishedCallback;
    typedef std::function<void (PlaybackState)> StateChangedCallback;

    virtual ~PlaybackEngine() {}

    virtual int loadAndPlay(const std::string& ref) = 0;
    /** Resume after pause */
    virtual int play() = 0;
    virtual int pause() = 0;
    /** Always possible, whatever the current state */
    virtual int stop() = 0;
    virtual int seek(int ms) = 0;

    /** Volume, 0.0 to 1.0 */
    virtual float volume() = 0;
    virtual int setVolume(float vol) = 0;

    virtual PlaybackState state() = 0;
    virtual int currentTimeMs() = 0;
    /** @return false if the duration is not known */
    virtual bool durationMs(int *ms) = 0;
    virtual std::string currentRef() = 0;
    /** Short description of what is playing, like "FLAC 44100 Hz..." */
    virtual bool getFormatDescription(std::string& desc) = 0;

    /** Only meaningful for local outputs */
    virtual void setBitPerfect(bool) {}

    /** Called once when the track ended by itself */
    void setFinishedCallback(FinishedCallback cb) {
        std::unique_lock<std::mutex> lock(m_cbmutex);
        m_finishedcb = cb;
    }
    void setStateChangedCallback(StateChangedCallback cb) {
        std::unique_lock<std::mutex> lock(m_cbmutex);
        m_statecb = cb;
    }

protected:
    void fireFinished() {
        FinishedCallback cb;
        {
            std::unique_lock<std::mutex> lock(m_cbmutex);
            cb = m_finishedcb;
        }
        if (cb)
            cb();
    }
    void fireStateChanged(PlaybackState st) {
        StateChangedCallback cb;
        {
            std::unique_lock<std::mutex> lock(m_cbmutex);
            cb = m_statecb;
        }
        if (cb)
            cb(st);
    }

private:
    std::mutex m_cbmutex;
    FinishedCallback m_finishedcb;
    StateChangedCallback m_statecb;
};

#endif /* _PLAYBACKENGINE_H_X_INCLUDED_ */
