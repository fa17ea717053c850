/* Copyright (C) 2014 J.F.Dockes
 * Copyright (C) 2026 The upcast authors
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
#ifndef _MPDOUTPUT_H_X_INCLUDED_
#define _MPDOUTPUT_H_X_INCLUDED_

#include <string>
#include <vector>
#include <mutex>
#include <thread>
#include <condition_variable>

#include "audiooutput.hxx"

/**
 * Local output through an MPD server, which must run on this host
 * (we play file:// URIs).
 *
 * The MPD outputs are our devices. A monitor thread polls the MPD
 * status every 100 mS, and signals the end of a track which was
 * playing and stopped by itself.
 */
class MpdOutput : public AudioOutput {
public:
    MpdOutput(const std::string& host, int port = 6600,
              const std::string& pass = "");
    virtual ~MpdOutput();

    /** Connect and start the monitor thread. */
    bool start();
    /** Stop the monitor thread and close the connection. */
    void shutdown();
    bool ok();

    virtual int loadAndPlay(const std::string& path);
    virtual int play();
    virtual int pause();
    virtual int stop();
    virtual int seek(int ms);
    virtual float volume();
    virtual int setVolume(float vol);
    virtual PlaybackState state();
    virtual int positionMs();
    virtual bool durationMs(int *ms);
    virtual bool getFormatDescription(std::string& desc);

    virtual bool listDevices(std::vector<AudioDevice>& devices);
    virtual bool defaultDevice(AudioDevice& device);
    virtual int selectDevice(const std::string& id);

    virtual void setBitPerfect(bool on);
    virtual bool bitPerfect();

    virtual void setFinishedCallback(FinishedCallback cb);

    /** Suffixes of the files we accept to play */
    static bool supportedFormat(const std::string& path);

private:
    void *m_conn;
    std::string m_host;
    int m_port;
    std::string m_password;

    // Protects the connection. Taken before m_datamutex if both are needed
    std::mutex m_connmutex;

    // Protects the cached status, which is what state readers see.
    std::mutex m_datamutex;
    PlaybackState m_state;
    int m_elapsedms;
    int m_durationms;
    int m_volume;
    bool m_bitperfect;
    std::string m_path;
    std::string m_format;
    FinishedCallback m_finishedcb;

    std::thread m_monitor;
    std::mutex m_monmutex;
    std::condition_variable m_moncv;
    bool m_stopmonitor;

    bool openconn();
    bool connok();
    bool showError(const std::string& who);
    bool updStatus(bool *finished);
    bool applyReplayGain();
    void monitorLoop();
};

#endif /* _MPDOUTPUT_H_X_INCLUDED_ */
