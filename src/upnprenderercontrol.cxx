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
#include "upnprenderercontrol.hxx"

#include "libupnpp/log.hxx"
#include "libupnpp/control/avtransport.hxx"
#include "libupnpp/control/renderingcontrol.hxx"

#include "libupcast/upcastutils.hxx"

using namespace std;
using namespace UpCast;
using namespace UpCastClient;
using namespace UPnPClient;

// libupnpp builds the action URL from URLBase and controlURL. An
// absolute controlURL is split so that the result is the same URL.
static void fixAbsoluteURL(UPnPDeviceDesc& desc, UPnPServiceDesc& service)
{
    if (service.controlURL.find("http://") != 0)
        return;
    string url = service.controlURL;
    string base = baseurl(url);
    if (base.empty() || base[base.size()-1] != '/')
        return;
    desc.URLBase = base;
    service.controlURL = url.substr(base.size() - 1);
}

UpnpRendererControl::UpnpRendererControl(const RendererDevice& device)
{
    if (device.hasTransport()) {
        UPnPDeviceDesc desc(device.desc);
        UPnPServiceDesc service(device.avtService);
        fixAbsoluteURL(desc, service);
        m_avt = make_shared<AVTransport>(desc, service);
    }
    if (device.hasRendering()) {
        UPnPDeviceDesc desc(device.desc);
        UPnPServiceDesc service(device.rdcService);
        fixAbsoluteURL(desc, service);
        m_rdc = make_shared<RenderingControl>(desc, service);
    }
}

UpnpRendererControl::~UpnpRendererControl()
{
}

int UpnpRendererControl::mapError(int ret)
{
    if (ret == 0)
        return UPCAST_E_SUCCESS;
    if (ret > 0) {
        LOGDEB("UpnpRendererControl: UPnP error " << ret << endl);
        return UPCAST_E_SOAP_FAULT;
    }
    LOGDEB("UpnpRendererControl: libupnp error " << ret << endl);
    return UPCAST_E_NETWORK;
}

int UpnpRendererControl::setURI(const string& uri, const string& meta)
{
    if (!m_avt)
        return UPCAST_E_NO_SERVICE;
    return mapError(m_avt->setAVTransportURI(uri, meta));
}

int UpnpRendererControl::play()
{
    if (!m_avt)
        return UPCAST_E_NO_SERVICE;
    return mapError(m_avt->play());
}

int UpnpRendererControl::pause()
{
    if (!m_avt)
        return UPCAST_E_NO_SERVICE;
    return mapError(m_avt->pause());
}

int UpnpRendererControl::stop()
{
    if (!m_avt)
        return UPCAST_E_NO_SERVICE;
    return mapError(m_avt->stop());
}

int UpnpRendererControl::seek(int ms)
{
    if (!m_avt)
        return UPCAST_E_NO_SERVICE;
    // REL_TIME has a one second resolution
    return mapError(m_avt->seek(AVTransport::SEEK_REL_TIME, ms / 1000));
}

int UpnpRendererControl::getTransportState(TransportState& tps)
{
    if (!m_avt)
        return UPCAST_E_NO_SERVICE;
    AVTransport::TransportInfo info;
    int ret = mapError(m_avt->getTransportInfo(info));
    if (ret != UPCAST_E_SUCCESS)
        return ret;
    switch (info.tpstate) {
    case AVTransport::Stopped: tps = TPS_STOPPED; break;
    case AVTransport::Playing: tps = TPS_PLAYING; break;
    case AVTransport::Transitioning: tps = TPS_TRANSITIONING; break;
    case AVTransport::PausedPlayback: tps = TPS_PAUSED; break;
    case AVTransport::NoMediaPresent: tps = TPS_NOMEDIA; break;
    default: tps = TPS_UNKNOWN; break;
    }
    return ret;
}

int UpnpRendererControl::getPosition(int& posms, int& durms)
{
    if (!m_avt)
        return UPCAST_E_NO_SERVICE;
    AVTransport::PositionInfo info;
    int ret = mapError(m_avt->getPositionInfo(info));
    if (ret != UPCAST_E_SUCCESS)
        return ret;
    posms = info.reltime >= 0 ? info.reltime * 1000 : -1;
    durms = info.trackduration > 0 ? info.trackduration * 1000 : -1;
    return ret;
}

int UpnpRendererControl::setVolume(int vol)
{
    if (!m_rdc)
        return UPCAST_E_NO_SERVICE;
    return mapError(m_rdc->setVolume(vol));
}

int UpnpRendererControl::getVolume(int& vol)
{
    if (!m_rdc)
        return UPCAST_E_NO_SERVICE;
    int ret = m_rdc->getVolume();
    if (ret < 0) {
        LOGDEB("UpnpRendererControl::getVolume: failed" << endl);
        return UPCAST_E_NETWORK;
    }
    vol = ret;
    return UPCAST_E_SUCCESS;
}

int UpnpRendererControl::setMute(bool mute)
{
    if (!m_rdc)
        return UPCAST_E_NO_SERVICE;
    return mapError(m_rdc->setMute(mute));
}

int UpnpRendererControl::getMute(bool& mute)
{
    if (!m_rdc)
        return UPCAST_E_NO_SERVICE;
    mute = m_rdc->getMute();
    return UPCAST_E_SUCCESS;
}
