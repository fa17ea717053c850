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
#include "libupcast/control/rendererdevice.hxx"

#include <sstream>

#include "libupnpp/log.hxx"
#include "libupcast/upcastutils.hxx"

using namespace std;
using namespace UpCast;
using namespace UPnPClient;

namespace UpCastClient {

static const string uuidPrefix("uuid:");

string usnToDeviceId(const string& usn)
{
    if (usn.compare(0, uuidPrefix.size(), uuidPrefix)) {
        return usn;
    }
    string::size_type end = usn.find("::", uuidPrefix.size());
    return usn.substr(uuidPrefix.size(), end == string::npos ? 
                      string::npos : end - uuidPrefix.size());
}

bool isTransportService(const string& st)
{
    return st.find("AVTransport") != string::npos;
}

bool isRenderingService(const string& st)
{
    return st.find("RenderingControl") != string::npos;
}

bool rendererFromDesc(const UPnPDeviceDesc& desc, RendererDevice& device)
{
    if (!desc.ok) {
        LOGDEB("rendererFromDesc: description was not parsed" << endl);
        return false;
    }
    if (desc.friendlyName.empty()) {
        LOGINF("rendererFromDesc: empty friendlyName for " << desc.UDN <<
               endl);
        return false;
    }

    device = RendererDevice();
    device.id = usnToDeviceId(desc.UDN);
    device.friendlyName = desc.friendlyName;
    device.manufacturer = desc.manufacturer.empty() ? 
        "Unknown" : desc.manufacturer;
    device.modelName = desc.modelName.empty() ? "Unknown" : desc.modelName;
    device.desc = desc;

    // First match wins
    for (vector<UPnPServiceDesc>::const_iterator it = desc.services.begin();
         it != desc.services.end(); it++) {
        if (it->controlURL.empty())
            continue;
        if (!device.hasTransport() && isTransportService(it->serviceType)) {
            device.avtService = *it;
            device.avtServiceType = it->serviceType;
            device.avtURL = caturl(desc.URLBase, it->controlURL);
        } else if (!device.hasRendering() &&
                   isRenderingService(it->serviceType)) {
            device.rdcService = *it;
            device.rdcServiceType = it->serviceType;
            device.rdcURL = caturl(desc.URLBase, it->controlURL);
        }
    }
    return true;
}

string RendererDevice::dump() const
{
    ostringstream os;
    os << "RendererDevice: {\n" <<
        "id [" << id << "]\n" <<
        "friendlyName [" << friendlyName << "]\n" <<
        "manufacturer [" << manufacturer << "]\n" <<
        "modelName [" << modelName << "]\n" <<
        "avtURL [" << avtURL << "] (" << avtServiceType << ")\n" <<
        "rdcURL [" << rdcURL << "] (" << rdcServiceType << ")\n}\n";
    return os.str();
}

} // namespace UpCastClient
