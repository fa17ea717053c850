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
#include "localengine.hxx"

#include "libupnpp/log.hxx"
#include "libupcast/upcastutils.hxx"

using namespace std;
using namespace UpCast;

LocalPlaybackEngine::LocalPlaybackEngine(shared_ptr<AudioOutput> output)
    : m_output(output), m_loading(false)
{
    m_output->setFinishedCallback(
        std::bind(&LocalPlaybackEngine::onOutputFinished, this));
}

LocalPlaybackEngine::~LocalPlaybackEngine()
{
    m_output->setFinishedCallback(AudioOutput::FinishedCallback());
}

void LocalPlaybackEngine::onOutputFinished()
{
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_loading) {
            LOGDEB("LocalPlaybackEngine: end of track during load, ignored"
                   << endl);
            return;
        }
    }
    LOGDEB("LocalPlaybackEngine: end of track" << endl);
    fireStateChanged(PBS_STOP);
    fireFinished();
}

int LocalPlaybackEngine::loadAndPlay(const string& ref)
{
    LOGDEB("LocalPlaybackEngine::loadAndPlay: " << ref << endl);
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_ref = ref;
        m_loading = true;
    }
    int ret = m_output->loadAndPlay(ref);
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_loading = false;
        if (ret != UPCAST_E_SUCCESS)
            m_ref.clear();
    }
    if (ret != UPCAST_E_SUCCESS) {
        LOGERR(errAsString("LocalPlaybackEngine::loadAndPlay", ret) << endl);
    }
    fireStateChanged(m_output->state());
    return ret;
}

int LocalPlaybackEngine::play()
{
    int ret = m_output->play();
    fireStateChanged(m_output->state());
    return ret;
}

int LocalPlaybackEngine::pause()
{
    int ret = m_output->pause();
    fireStateChanged(m_output->state());
    return ret;
}

int LocalPlaybackEngine::stop()
{
    int ret = m_output->stop();
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_ref.clear();
    }
    fireStateChanged(PBS_STOP);
    return ret;
}

int LocalPlaybackEngine::seek(int ms)
{
    return m_output->seek(ms);
}

float LocalPlaybackEngine::volume()
{
    return m_output->volume();
}

int LocalPlaybackEngine::setVolume(float vol)
{
    return m_output->setVolume(vol);
}

PlaybackState LocalPlaybackEngine::state()
{
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (m_loading)
            return PBS_PLAY;
    }
    return m_output->state();
}

int LocalPlaybackEngine::currentTimeMs()
{
    return m_output->positionMs();
}

bool LocalPlaybackEngine::durationMs(int *ms)
{
    return m_output->durationMs(ms);
}

string LocalPlaybackEngine::currentRef()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_ref;
}

bool LocalPlaybackEngine::getFormatDescription(string& desc)
{
    return m_output->getFormatDescription(desc);
}

void LocalPlaybackEngine::setBitPerfect(bool on)
{
    m_output->setBitPerfect(on);
}

bool LocalPlaybackEngine::bitPerfect()
{
    return m_output->bitPerfect();
}

bool LocalPlaybackEngine::listDevices(vector<AudioDevice>& devices)
{
    return m_output->listDevices(devices);
}

bool LocalPlaybackEngine::defaultDevice(AudioDevice& device)
{
    return m_output->defaultDevice(device);
}

int LocalPlaybackEngine::selectDevice(const string& id)
{
    LOGDEB("LocalPlaybackEngine::selectDevice: " << id << endl);
    return m_output->selectDevice(id);
}
