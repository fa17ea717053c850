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
#ifndef _UPNPRENDERERCONTROL_HXX_INCLUDED_
#define _UPNPRENDERERCONTROL_HXX_INCLUDED_

#include <string>
#include <memory>

#include "renderercontrol.hxx"
#include "libupcast/control/rendererdevice.hxx"

namespace UPnPClient {
class AVTransport;
class RenderingControl;
}

/** RendererControl talking to a real device through libupnpp */
class UpnpRendererControl : public RendererControl {
public:
    explicit UpnpRendererControl(const UpCastClient::RendererDevice& device);
    virtual ~UpnpRendererControl();

    virtual bool hasTransport() {
        return m_avt != 0;
    }
    virtual bool hasRendering() {
        return m_rdc != 0;
    }

    virtual int setURI(const std::string& uri, const std::string& meta);
    virtual int play();
    virtual int pause();
    virtual int stop();
    virtual int seek(int ms);
    virtual int getTransportState(TransportState& tps);
    virtual int getPosition(int& posms, int& durms);
    virtual int setVolume(int vol);
    virtual int getVolume(int& vol);
    virtual int setMute(bool mute);
    virtual int getMute(bool& mute);

    /** libupnpp returns 0, a positive UPnP error code, or a negative
     * libupnp one. */
    static int mapError(int upnpret);

private:
    std::shared_ptr<UPnPClient::AVTransport> m_avt;
    std::shared_ptr<UPnPClient::RenderingControl> m_rdc;
};

#endif /* _UPNPRENDERERCONTROL_HXX_INCLUDED_ */
