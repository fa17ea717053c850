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
#include "libupcast/control/rendererdirectory.hxx"

#include <map>
#include <set>
#include <mutex>
#include <thread>
#include <chrono>
#include <condition_variable>

#include "libupnpp/log.hxx"
#include "libupnpp/workqueue.hxx"
#include "libupnpp/control/discovery.hxx"

using namespace std;
using namespace std::placeholders;
using namespace UPnPP;
using namespace UPnPClient;

namespace UpCastClient {

class RendererDirectory::Internal {
public:
    Internal()
        : queue("RendererRegistrar"), running(false) {
    }
    WorkQueue<UPnPDeviceDesc> queue;
    bool running;

    std::mutex mutex;
    // Ids we have seen: registered, pending, or rejected
    set<string> known;
    vector<RendererDevice> devices;
    AddedCallback added;
};

static void *registrarWorker(void *arg)
{
    RendererDirectory::Internal *m = (RendererDirectory::Internal*)arg;
    for (;;) {
        UPnPDeviceDesc desc;
        if (!m->queue.take(&desc)) {
            m->queue.workerExit();
            return (void*)1;
        }

        string id = usnToDeviceId(desc.UDN);
        RendererDevice device;
        if (!rendererFromDesc(desc, device)) {
            // Unparsed descriptions may be fixed on the next walk,
            // nameless devices are not.
            if (!desc.ok) {
                std::unique_lock<std::mutex> lock(m->mutex);
                m->known.erase(id);
            }
            continue;
        }
        if (!device.hasTransport()) {
            LOGINF("RendererDirectory: " << device.friendlyName << 
                   " has no AVTransport, ignored" << endl);
            continue;
        }

        AddedCallback cb;
        {
            std::unique_lock<std::mutex> lock(m->mutex);
            m->devices.push_back(device);
            cb = m->added;
        }
        LOGDEB("RendererDirectory: added " << device.friendlyName << 
               " id " << device.id << " at " << device.avtURL << endl);
        if (cb)
            cb(device);
    }
}

RendererDirectory::RendererDirectory()
    : m(new Internal())
{
}

RendererDirectory::~RendererDirectory()
{
    stop();
}

bool RendererDirectory::start()
{
    std::unique_lock<std::mutex> lock(m->mutex);
    if (m->running)
        return true;
    if (!m->queue.start(1, registrarWorker, m.get())) {
        LOGERR("RendererDirectory::start: can't start registrar" << endl);
        return false;
    }
    m->running = true;
    return true;
}

void RendererDirectory::stop()
{
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        if (!m->running)
            return;
        m->running = false;
    }
    m->queue.setTerminateAndWait();
    std::unique_lock<std::mutex> lock(m->mutex);
    m->known.clear();
    m->devices.clear();
}

void RendererDirectory::setAddedCallback(AddedCallback cb)
{
    std::unique_lock<std::mutex> lock(m->mutex);
    m->added = cb;
}

void RendererDirectory::onDevice(const UPnPDeviceDesc& desc)
{
    string id = usnToDeviceId(desc.UDN);
    if (id.empty()) {
        LOGDEB("RendererDirectory::onDevice: no UDN" << endl);
        return;
    }
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        if (!m->running || !m->known.insert(id).second)
            return;
    }
    if (!m->queue.put(desc)) {
        LOGERR("RendererDirectory::onDevice: can't queue " << id << endl);
        std::unique_lock<std::mutex> lock(m->mutex);
        m->known.erase(id);
    }
}

bool RendererDirectory::getDevices(vector<RendererDevice>& devices)
{
    std::unique_lock<std::mutex> lock(m->mutex);
    devices = m->devices;
    return true;
}

bool RendererDirectory::getDevice(const string& idorname, 
                                  RendererDevice& device)
{
    std::unique_lock<std::mutex> lock(m->mutex);
    for (vector<RendererDevice>::const_iterator it = m->devices.begin();
         it != m->devices.end(); it++) {
        if (it->id == idorname || it->friendlyName == idorname) {
            device = *it;
            return true;
        }
    }
    return false;
}

bool RendererDirectory::waitIdle()
{
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        if (!m->running)
            return true;
    }
    return m->queue.waitIdle();
}


class RendererDiscovery::Internal {
public:
    Internal(int sw, int ps)
        : searchwindow(sw), walksecs(ps), running(false), stopwalk(false) {
    }
    int searchwindow;
    int walksecs;
    bool running;

    std::mutex mutex;
    std::condition_variable cv;
    bool stopwalk;
    std::thread walker;
};

RendererDiscovery::RendererDiscovery(std::shared_ptr<RendererDirectory> dir,
                                     int searchwindow, int walksecs)
    : m_directory(dir), m(new Internal(searchwindow, walksecs))
{
}

RendererDiscovery::~RendererDiscovery()
{
    stop();
}

bool RendererDiscovery::start()
{
    std::unique_lock<std::mutex> lock(m->mutex);
    if (m->running)
        return true;
    UPnPDeviceDirectory *dir = 
        UPnPDeviceDirectory::getTheDir(m->searchwindow);
    if (dir == 0) {
        LOGERR("RendererDiscovery::start: libupnpp directory init failed" <<
               endl);
        return false;
    }
    if (!m_directory->start()) {
        return false;
    }
    m->stopwalk = false;
    m->running = true;
    m->walker = std::thread([this] () {
            bool first = true;
            for (;;) {
                {
                    std::unique_lock<std::mutex> lock(m->mutex);
                    int secs = first ? m->searchwindow : m->walksecs;
                    m->cv.wait_for(lock, std::chrono::seconds(secs),
                                   [this] {return m->stopwalk;});
                    if (m->stopwalk)
                        return;
                }
                first = false;
                rescan();
            }
        });
    LOGDEB("RendererDiscovery::start: search window " << m->searchwindow <<
           " S, walk period " << m->walksecs << " S" << endl);
    return true;
}

void RendererDiscovery::stop()
{
    {
        std::unique_lock<std::mutex> lock(m->mutex);
        if (!m->running)
            return;
        m->running = false;
        m->stopwalk = true;
    }
    m->cv.notify_all();
    if (m->walker.joinable())
        m->walker.join();
    m_directory->stop();
}

bool RendererDiscovery::refresh()
{
    stop();
    return start();
}

bool RendererDiscovery::isRunning()
{
    std::unique_lock<std::mutex> lock(m->mutex);
    return m->running;
}

static bool visitDevice(std::shared_ptr<RendererDirectory> dir,
                        const UPnPDeviceDesc& device, const UPnPServiceDesc&)
{
    // Called once per service, the directory ignores repeats
    dir->onDevice(device);
    return true;
}

bool RendererDiscovery::rescan()
{
    UPnPDeviceDirectory *dir = UPnPDeviceDirectory::getTheDir();
    if (dir == 0) {
        LOGERR("RendererDiscovery::rescan: no libupnpp directory" << endl);
        return false;
    }
    return dir->traverse(std::bind(visitDevice, m_directory, _1, _2));
}

} // namespace UpCastClient
