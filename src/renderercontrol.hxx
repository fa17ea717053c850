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
#ifndef _RENDERERCONTROL_HXX_INCLUDED_
#define _RENDERERCONTROL_HXX_INCLUDED_

#include <string>

/**
 * The renderer actions used by the network engine.
 *
 * The int methods return UPCAST_E_SUCCESS, UPCAST_E_SOAP_FAULT if the
 * device returned a fault, or UPCAST_E_NETWORK if it could not be
 * reached. Times are in milliseconds.
 */
class RendererControl {
public:
    enum TransportState {TPS_UNKNOWN, TPS_STOPPED, TPS_PLAYING,
                         TPS_TRANSITIONING, TPS_PAUSED, TPS_NOMEDIA};

    virtual ~RendererControl() {}

    virtual bool hasTransport() = 0;
    virtual bool hasRendering() = 0;

    virtual int setURI(const std::string& uri, const std::string& meta) = 0;
    virtual int play() = 0;
    virtual int pause() = 0;
    virtual int stop() = 0;
    virtual int seek(int ms) = 0;

    virtual int getTransportState(TransportState& tps) = 0;
    /** durms is -1 if the renderer does not know */
    virtual int getPosition(int& posms, int& durms) = 0;

    /** 0-100 */
    virtual int setVolume(int vol) = 0;
    virtual int getVolume(int& vol) = 0;
    virtual int setMute(bool mute) = 0;
    virtual int getMute(bool& mute) = 0;
};

#endif /* _RENDERERCONTROL_HXX_INCLUDED_ */
