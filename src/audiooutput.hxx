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
#ifndef _AUDIOOUTPUT_H_X_INCLUDED_
#define _AUDIOOUTPUT_H_X_INCLUDED_

#include <string>
#include <vector>
#include <functional>

#include "playbackengine.hxx"

/** A local audio device, as seen by the output */
class AudioDevice {
public:
    AudioDevice() : enabled(false) {}
    std::string id;
    std::string name;
    bool enabled;
};

/**
 * Native local audio output. This does the actual decoding and
 * device access, the local playback engine is just an adapter on
 * top of it.
 *
 * Implementations must honour the PlaybackEngine::loadAndPlay()
 * atomicity rule. In bit-perfect mode, they try to have the device
 * use the source format, and fall back to the default format
 * (logging the error) if this fails.
 */
class AudioOutput {
public:
    typedef std::function<void ()> FinishedCallback;

    virtual ~AudioOutput() {}

    /** @return UPCAST_E_FILE_NOT_FOUND, UPCAST_E_UNSUPPORTED_FORMAT,
     * UPCAST_E_LOAD or UPCAST_E_ENGINE for errors */
    virtual int loadAndPlay(const std::string& path) = 0;
    virtual int play() = 0;
    virtual int pause() = 0;
    virtual int stop() = 0;
    virtual int seek(int ms) = 0;
    virtual float volume() = 0;
    virtual int setVolume(float vol) = 0;
    virtual PlaybackState state() = 0;
    virtual int positionMs() = 0;
    virtual bool durationMs(int *ms) = 0;
    virtual bool getFormatDescription(std::string& desc) = 0;

    virtual bool listDevices(std::vector<AudioDevice>& devices) = 0;
    virtual bool defaultDevice(AudioDevice& device) = 0;
    virtual int selectDevice(const std::string& id) = 0;

    virtual void setBitPerfect(bool on) = 0;
    virtual bool bitPerfect() = 0;

    /** Called from the output's monitor thread when a track ends */
    virtual void setFinishedCallback(FinishedCallback cb) = 0;
};

#endif /* _AUDIOOUTPUT_H_X_INCLUDED_ */
