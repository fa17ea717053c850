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
#ifndef _RENDERERDIRECTORY_HXX_INCLUDED_
#define _RENDERERDIRECTORY_HXX_INCLUDED_

#include <string>
#include <vector>
#include <memory>
#include <functional>

#include "libupnpp/control/description.hxx"
#include "libupcast/control/rendererdevice.hxx"

namespace UpCastClient {

/**
 * Registry of the Media Renderers found on the network.
 *
 * Descriptions are fed by the libupnpp discovery thread through
 * onDevice(), which returns immediately. They are turned into
 * RendererDevice records by a single registrar thread, which is the
 * only writer of the device table.
 *
 * A device id is processed once: later descriptions for a known or
 * pending id are ignored. Devices without a transport service are
 * not registered.
 */
class RendererDirectory {
public:
    typedef std::function<void (const RendererDevice&)> AddedCallback;

    RendererDirectory();
    ~RendererDirectory();

    /** Start the registrar thread. Idempotent */
    bool start();

    /** Stop the registrar and forget everything. Idempotent */
    void stop();

    /** Called from the registrar thread for each new device */
    void setAddedCallback(AddedCallback cb);

    /** Queue a device description */
    void onDevice(const UPnPClient::UPnPDeviceDesc& desc);

    /** Retrieve a copy of the current device list, in discovery order */
    bool getDevices(std::vector<RendererDevice>& devices);

    /** Find device by id or friendly name */
    bool getDevice(const std::string& idorname, RendererDevice& device);

    /** Wait until all queued descriptions are processed */
    bool waitIdle();

    RendererDirectory(const RendererDirectory&) = delete;
    RendererDirectory& operator=(const RendererDirectory&) = delete;

    class Internal;
private:
    std::unique_ptr<Internal> m;
};

/**
 * Renderer discovery on top of the libupnpp device directory.
 *
 * libupnpp sends the searches, and downloads and parses the
 * description documents. A walker thread traverses the libupnpp pool
 * after the search window, then every walksecs seconds, and feeds
 * the devices to the directory. Traversal also expires stale devices
 * in the pool.
 */
class RendererDiscovery {
public:
    /**
     * @param directory where the devices are sent.
     * @param searchwindow the search window (MX) in seconds.
     * @param walksecs period of the pool walks.
     */
    RendererDiscovery(std::shared_ptr<RendererDirectory> directory,
                      int searchwindow = 3, int walksecs = 30);
    ~RendererDiscovery();

    /** Start the libupnpp directory and our threads. Returns
     * false (and leaves discovery inactive) if libupnpp can't start
     * its directory. Does nothing if we are already running. */
    bool start();

    /** Stop the threads and clear the directory. Safe in any state. */
    void stop();

    /** Stop and restart discovery, dropping the known devices */
    bool refresh();

    bool isRunning();

    /** Walk the libupnpp device pool now. Blocks until the initial
     * search window is expired. */
    bool rescan();

    std::shared_ptr<RendererDirectory> getDirectory() {
        return m_directory;
    }

    RendererDiscovery(const RendererDiscovery&) = delete;
    RendererDiscovery& operator=(const RendererDiscovery&) = delete;

    class Internal;
private:
    std::shared_ptr<RendererDirectory> m_directory;
    std::unique_ptr<Internal> m;
};

} // namespace UpCastClient

#endif /* _RENDERERDIRECTORY_HXX_INCLUDED_ */
