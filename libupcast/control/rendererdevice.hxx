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
#ifndef _RENDERERDEVICE_HXX_INCLUDED_
#define _RENDERERDEVICE_HXX_INCLUDED_

#include <string>

#include "libupnpp/control/description.hxx"

namespace UpCastClient {

/**
 * A Media Renderer as seen by the player.
 *
 * Built from the description parsed by libupnpp. The transport and
 * rendering services are the first ones whose type contains
 * "AVTransport" and "RenderingControl", whatever the version suffix.
 * Either may be missing. The object is not modified after it is built.
 */
class RendererDevice {
public:
    // Stable identifier, from the device UDN or discovery USN
    std::string id;
    std::string friendlyName;
    std::string manufacturer;
    std::string modelName;
    // Resolved control URLs, and advertised service types
    std::string avtURL;
    std::string avtServiceType;
    std::string rdcURL;
    std::string rdcServiceType;

    // What the services are built from
    UPnPClient::UPnPDeviceDesc desc;
    UPnPClient::UPnPServiceDesc avtService;
    UPnPClient::UPnPServiceDesc rdcService;

    bool hasTransport() const {
        return !avtURL.empty();
    }
    bool hasRendering() const {
        return !rdcURL.empty();
    }

    std::string dump() const;
};

/** Compute the device identifier from an USN or UDN:
 * "uuid:XXX::urn:..." and "uuid:XXX" give "XXX", anything else is
 * returned unchanged */
extern std::string usnToDeviceId(const std::string& usn);

extern bool isTransportService(const std::string& serviceType);
extern bool isRenderingService(const std::string& serviceType);

/** Build the renderer record from a libupnpp description.
 *
 * Empty manufacturer and model names become "Unknown".
 * @return false if the description was not parsed or has an empty
 *   friendly name. A device without a transport service is returned,
 *   check hasTransport().
 */
extern bool rendererFromDesc(const UPnPClient::UPnPDeviceDesc& desc,
                             RendererDevice& device);

} // namespace UpCastClient

#endif /* _RENDERERDEVICE_HXX_INCLUDED_ */
