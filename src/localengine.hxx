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
#ifndef _LOCALENGINE_H_X_INCLUDED_
#define _LOCALENGINE_H_X_INCLUDED_

#include <string>
#include <vector>
#include <memory>
#include <mutex>

#include "playbackengine.hxx"
#include "audiooutput.hxx"

/**
 * Playback engine for the local output. Everything is delegated to
 * the AudioOutput. State changes are signalled after each command,
 * and the output's end of track events are forwarded as finished.
 *
 * While a load is in progress, state() is PBS_PLAY whatever the
 * output says, and the output end of track events are ignored.
 */
class LocalPlaybackEngine : public PlaybackEngine {
public:
    LocalPlaybackEngine(std::shared_ptr<AudioOutput> output);
    virtual ~LocalPlaybackEngine();

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
    virtual void setBitPerfect(bool on);

    bool bitPerfect();
    bool listDevices(std::vector<AudioDevice>& devices);
    bool defaultDevice(AudioDevice& device);
    int selectDevice(const std::string& id);

private:
    std::shared_ptr<AudioOutput> m_output;
    std::mutex m_mutex;
    std::string m_ref;
    bool m_loading;

    void onOutputFinished();
};

#endif /* _LOCALENGINE_H_X_INCLUDED_ */
