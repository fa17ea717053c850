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
#include "mpdoutput.hxx"

#include <mpd/client.h>

#include <stdlib.h>

#include <sstream>
#include <chrono>

#include "libupnpp/log.hxx"
#include "libupnpp/soaphelp.hxx"
#include "libupcast/upcastutils.hxx"

using namespace std;
using namespace UpCast;
using namespace UPnPP;

#define M_CONN ((struct mpd_connection *)m_conn)

// Monitor period
static const int monitorMs = 100;

MpdOutput::MpdOutput(const string& host, int port, const string& pass)
    : m_conn(0), m_host(host), m_port(port), m_password(pass),
      m_state(PBS_STOP), m_elapsedms(0), m_durationms(-1), m_volume(50),
      m_bitperfect(true), m_stopmonitor(false)
{
}

MpdOutput::~MpdOutput()
{
    shutdown();
}

bool MpdOutput::openconn()
{
    if (m_conn) {
        mpd_connection_free(M_CONN);
        m_conn = 0;
    }
    m_conn = mpd_connection_new(m_host.c_str(), m_port, 0);
    if (m_conn == NULL) {
        LOGERR("mpd_connection_new failed. No memory?" << endl);
        return false;
    }

    if (mpd_connection_get_error(M_CONN) != MPD_ERROR_SUCCESS) {
        LOGERR("MpdOutput::openconn: " << m_host << ":" << m_port << ": " <<
               mpd_connection_get_error_message(M_CONN) << endl);
        mpd_connection_free(M_CONN);
        m_conn = 0;
        return false;
    }

    if(!m_password.empty()) {
        if (!mpd_run_password(M_CONN, m_password.c_str())) {
            LOGERR("Password wrong" << endl);
            mpd_connection_free(M_CONN);
            m_conn = 0;
            return false;
        }
    }
    return true;
}

// Call with m_connmutex held
bool MpdOutput::connok()
{
    return m_conn != 0 || openconn();
}

bool MpdOutput::ok()
{
    std::unique_lock<std::mutex> lock(m_connmutex);
    return m_conn != 0;
}

// Log the connection error. Returns true if the command may be retried
bool MpdOutput::showError(const string& who)
{
    if (m_conn == 0) {
        LOGERR("MpdOutput::showError: no connection" << endl);
        return false;
    }

    int error = mpd_connection_get_error(M_CONN);
    if (error == MPD_ERROR_SUCCESS) {
        return false;
    }
    LOGERR(who << " failed: " <<  mpd_connection_get_error_message(M_CONN) 
           << endl);
    if (error == MPD_ERROR_SERVER) {
        LOGERR(who << " server error: " << 
               mpd_connection_get_server_error(M_CONN) << endl);
        // Server errors leave the connection usable, but it must be reset
        mpd_connection_clear_error(M_CONN);
        return false;
    }

    if (error == MPD_ERROR_CLOSED)
        if (openconn())
            return true;
    return false;
}

#define RETRY_CMD(CMD, ERR) {                           \
    for (int i = 0; i < 2; i++) {                       \
        if ((CMD))                                      \
            break;                                      \
        if (i == 1 || !showError(#CMD))                 \
            return (ERR);                               \
    }                                                   \
    }

bool MpdOutput::supportedFormat(const string& path)
{
    static const char *suffs[] = {"mp3", "m4a", "m4b", "m4p", "flac", "wav",
                                  "aac", "ogg", "opus", "wma", "aiff", "aif"};
    string suff = path_suffix(path);
    for (unsigned int i = 0; i < sizeof(suffs) / sizeof(char *); i++) {
        if (!suff.compare(suffs[i]))
            return true;
    }
    return false;
}

bool MpdOutput::start()
{
    {
        std::unique_lock<std::mutex> lock(m_connmutex);
        if (!connok()) {
            return false;
        }
    }
    std::unique_lock<std::mutex> lock(m_monmutex);
    if (!m_monitor.joinable()) {
        m_stopmonitor = false;
        m_monitor = std::thread(&MpdOutput::monitorLoop, this);
    }
    return true;
}

void MpdOutput::shutdown()
{
    {
        std::unique_lock<std::mutex> lock(m_monmutex);
        m_stopmonitor = true;
        m_moncv.notify_all();
    }
    if (m_monitor.joinable()) {
        m_monitor.join();
    }
    std::unique_lock<std::mutex> lock(m_connmutex);
    if (m_conn) {
        mpd_connection_free(M_CONN);
        m_conn = 0;
    }
}

void MpdOutput::monitorLoop()
{
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(m_monmutex);
            m_moncv.wait_for(lock, std::chrono::milliseconds(monitorMs),
                             [this] {return m_stopmonitor;});
            if (m_stopmonitor)
                break;
        }
        bool finished = false;
        {
            std::unique_lock<std::mutex> lock(m_connmutex);
            if (!connok())
                continue;
            updStatus(&finished);
        }
        if (finished) {
            FinishedCallback cb;
            {
                std::unique_lock<std::mutex> lock(m_datamutex);
                cb = m_finishedcb;
            }
            LOGDEB("MpdOutput: track finished" << endl);
            if (cb)
                cb();
        }
    }
    LOGDEB("MpdOutput::monitorLoop: exiting" << endl);
}

// Call with m_connmutex held.
bool MpdOutput::updStatus(bool *finished)
{
    mpd_status *mpds = mpd_run_status(M_CONN);
    if (mpds == 0) {
        showError("MpdOutput::updStatus");
        return false;
    }

    PlaybackState nstate;
    switch (mpd_status_get_state(mpds)) {
    case MPD_STATE_PLAY: nstate = PBS_PLAY; break;
    case MPD_STATE_PAUSE: nstate = PBS_PAUSE; break;
    case MPD_STATE_STOP:
    case MPD_STATE_UNKNOWN: 
    default:
        nstate = PBS_STOP;
        break;
    }

    std::unique_lock<std::mutex> lock(m_datamutex);
    if (finished) {
        *finished = m_state == PBS_PLAY && nstate == PBS_STOP;
    }
    m_state = nstate;
    if (nstate != PBS_STOP) {
        m_elapsedms = mpd_status_get_elapsed_ms(mpds);
        m_durationms = mpd_status_get_total_time(mpds) * 1000;
        const struct mpd_audio_format *maf = 
            mpd_status_get_audio_format(mpds);
        if (maf) {
            ostringstream oss;
            oss << stringtoupper(path_suffix(m_path)) << " " << 
                maf->sample_rate << " Hz " << int(maf->bits) << " bits " <<
                int(maf->channels) << " ch";
            m_format = oss.str();
        }
    } else {
        m_elapsedms = 0;
    }
    int vol = mpd_status_get_volume(mpds);
    // MPD returns -1 when it has no mixer, or when it is stopped
    if (vol >= 0) {
        m_volume = vol;
    }
    mpd_status_free(mpds);
    return true;
}

// Call with m_connmutex held. Bit-perfect output means no replay gain
// scaling. A failure here is not fatal, we just play with the current
// settings.
bool MpdOutput::applyReplayGain()
{
    bool bp;
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        bp = m_bitperfect;
    }
    if (!bp)
        return true;
    if (!mpd_send_command(M_CONN, "replay_gain_mode", "off", NULL) ||
        !mpd_response_finish(M_CONN)) {
        showError("MpdOutput: replay_gain_mode off");
        LOGINF("MpdOutput: could not set bit-perfect mode, "
               "using default format" << endl);
        return false;
    }
    return true;
}

int MpdOutput::loadAndPlay(const string& path)
{
    LOGDEB("MpdOutput::loadAndPlay: " << path << endl);
    std::unique_lock<std::mutex> connlock(m_connmutex);
    {
        std::unique_lock<std::mutex> lock(m_datamutex);
        m_state = PBS_PLAY;
        m_path = path;
        m_elapsedms = 0;
        m_durationms = -1;
        m_format.clear();
    }

    int ret = UPCAST_E_SUCCESS;
    if (!path_exists(path)) {
        ret = UPCAST_E_FILE_NOT_FOUND;
    } else if (!supportedFormat(path)) {
        ret = UPCAST_E_UNSUPPORTED_FORMAT;
    } else if (!connok()) {
        ret = UPCAST_E_ENGINE;
    } else {
        string uri = string("file://") + path;
        if (!mpd_run_clear(M_CONN) && !showError("mpd_run_clear")) {
            ret = UPCAST_E_ENGINE;
        } else {
            applyReplayGain();
            if (!mpd_run_add(M_CONN, uri.c_str())) {
                showError("mpd_run_add");
                ret = UPCAST_E_LOAD;
            } else if (!mpd_run_play(M_CONN)) {
                showError("mpd_run_play");
                ret = UPCAST_E_LOAD;
            }
        }
    }

    if (ret != UPCAST_E_SUCCESS) {
        LOGERR(errAsString("MpdOutput::loadAndPlay", ret) << endl);
        std::unique_lock<std::mutex> lock(m_datamutex);
        m_state = PBS_STOP;
        m_path.clear();
        return ret;
    }
    // Don't let the monitor see the track as finished if it failed
    // right away: it was never seen playing.
    updStatus(0);
    return ret;
}

int MpdOutput::play()
{
    LOGDEB("MpdOutput::play" << endl);
    std::unique_lock<std::mutex> connlock(m_connmutex);
    if (!connok())
        return UPCAST_E_ENGINE;
    RETRY_CMD(mpd_run_play(M_CONN), UPCAST_E_ENGINE);
    updStatus(0);
    return UPCAST_E_SUCCESS;
}

int MpdOutput::pause()
{
    LOGDEB("MpdOutput::pause" << endl);
    std::unique_lock<std::mutex> connlock(m_connmutex);
    if (!connok())
        return UPCAST_E_ENGINE;
    RETRY_CMD(mpd_run_pause(M_CONN, true), UPCAST_E_ENGINE);
    updStatus(0);
    return UPCAST_E_SUCCESS;
}

int MpdOutput::stop()
{
    LOGDEB("MpdOutput::stop" << endl);
    std::unique_lock<std::mutex> connlock(m_connmutex);
    {
        // Set first, so that the monitor does not see an end of track
        std::unique_lock<std::mutex> lock(m_datamutex);
        m_state = PBS_STOP;
        m_elapsedms = 0;
        m_path.clear();
    }
    if (!connok())
        return UPCAST_E_ENGINE;
    RETRY_CMD(mpd_run_stop(M_CONN), UPCAST_E_ENGINE);
    return UPCAST_E_SUCCESS;
}

int MpdOutput::seek(int ms)
{
    LOGDEB("MpdOutput::seek: " << ms << endl);
    if (ms < 0)
        return UPCAST_E_INVALID_PARAM;
    std::unique_lock<std::mutex> connlock(m_connmutex);
    if (!connok())
        return UPCAST_E_ENGINE;
    RETRY_CMD(mpd_run_seek_pos(M_CONN, 0, (unsigned int)(ms / 1000)),
              UPCAST_E_ENGINE);
    std::unique_lock<std::mutex> lock(m_datamutex);
    m_elapsedms = ms;
    return UPCAST_E_SUCCESS;
}

float MpdOutput::volume()
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    return float(m_volume) / 100.0;
}

int MpdOutput::setVolume(float vol)
{
    if (vol < 0.0)
        vol = 0.0;
    if (vol > 1.0)
        vol = 1.0;
    int ivol = int(vol * 100);
    LOGDEB("MpdOutput::setVolume: " << ivol << endl);
    std::unique_lock<std::mutex> connlock(m_connmutex);
    if (!connok())
        return UPCAST_E_ENGINE;
    RETRY_CMD(mpd_run_set_volume(M_CONN, ivol), UPCAST_E_ENGINE);
    std::unique_lock<std::mutex> lock(m_datamutex);
    m_volume = ivol;
    return UPCAST_E_SUCCESS;
}

PlaybackState MpdOutput::state()
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    return m_state;
}

int MpdOutput::positionMs()
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    return m_elapsedms;
}

bool MpdOutput::durationMs(int *ms)
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    if (m_durationms <= 0)
        return false;
    *ms = m_durationms;
    return true;
}

bool MpdOutput::getFormatDescription(string& desc)
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    if (m_path.empty())
        return false;
    desc = m_format.empty() ? stringtoupper(path_suffix(m_path)) : m_format;
    return true;
}

bool MpdOutput::listDevices(vector<AudioDevice>& devices)
{
    devices.clear();
    std::unique_lock<std::mutex> connlock(m_connmutex);
    if (!connok())
        return false;
    RETRY_CMD(mpd_send_outputs(M_CONN), false);
    struct mpd_output *output;
    while ((output = mpd_recv_output(M_CONN)) != NULL) {
        AudioDevice dev;
        dev.id = SoapHelp::i2s(mpd_output_get_id(output));
        dev.name = mpd_output_get_name(output);
        dev.enabled = mpd_output_get_enabled(output);
        devices.push_back(dev);
        mpd_output_free(output);
    }
    if (!mpd_response_finish(M_CONN)) {
        showError("MpdOutput::listDevices");
        return false;
    }
    return true;
}

bool MpdOutput::defaultDevice(AudioDevice& device)
{
    vector<AudioDevice> devices;
    if (!listDevices(devices))
        return false;
    for (unsigned int i = 0; i < devices.size(); i++) {
        if (devices[i].enabled) {
            device = devices[i];
            return true;
        }
    }
    if (devices.empty())
        return false;
    device = devices[0];
    return true;
}

int MpdOutput::selectDevice(const string& id)
{
    vector<AudioDevice> devices;
    if (!listDevices(devices))
        return UPCAST_E_ENGINE;
    bool found = false;
    for (unsigned int i = 0; i < devices.size(); i++) {
        if (!devices[i].id.compare(id) || !devices[i].name.compare(id)) {
            found = true;
        }
    }
    if (!found) {
        LOGERR("MpdOutput::selectDevice: no output " << id << endl);
        return UPCAST_E_INVALID_PARAM;
    }

    std::unique_lock<std::mutex> connlock(m_connmutex);
    if (!connok())
        return UPCAST_E_ENGINE;
    // Enable the new one first, MPD does not like having no output at all
    for (unsigned int i = 0; i < devices.size(); i++) {
        unsigned int oid = atoi(devices[i].id.c_str());
        if (!devices[i].id.compare(id) || !devices[i].name.compare(id)) {
            RETRY_CMD(mpd_run_enable_output(M_CONN, oid), UPCAST_E_ENGINE);
        }
    }
    for (unsigned int i = 0; i < devices.size(); i++) {
        unsigned int oid = atoi(devices[i].id.c_str());
        if (devices[i].id.compare(id) && devices[i].name.compare(id) &&
            devices[i].enabled) {
            RETRY_CMD(mpd_run_disable_output(M_CONN, oid), UPCAST_E_ENGINE);
        }
    }
    return UPCAST_E_SUCCESS;
}

void MpdOutput::setBitPerfect(bool on)
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    m_bitperfect = on;
}

bool MpdOutput::bitPerfect()
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    return m_bitperfect;
}

void MpdOutput::setFinishedCallback(FinishedCallback cb)
{
    std::unique_lock<std::mutex> lock(m_datamutex);
    m_finishedcb = cb;
}
