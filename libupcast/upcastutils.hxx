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
#ifndef _UPCASTUTILS_H_X_INCLUDED_
#define _UPCASTUTILS_H_X_INCLUDED_

#include <string>

/** Status codes returned by the library and player operations. Zero
 * is success, errors are negative. */
enum UpCastError {
    UPCAST_E_SUCCESS = 0,
    UPCAST_E_INVALID_URL = -1,
    UPCAST_E_NETWORK = -2,
    UPCAST_E_BAD_RESPONSE = -3,
    UPCAST_E_SOAP_FAULT = -4,
    UPCAST_E_PARSE = -5,
    UPCAST_E_NO_SERVICE = -6,
    UPCAST_E_NO_ADDRESS = -7,
    UPCAST_E_FILE_NOT_FOUND = -8,
    UPCAST_E_UNSUPPORTED_FORMAT = -9,
    UPCAST_E_ENGINE = -10,
    UPCAST_E_LOAD = -11,
    UPCAST_E_NO_ITEM = -12,
    UPCAST_E_INVALID_PARAM = -13,
    UPCAST_E_SERVER = -14,
};

namespace UpCast {

/** Translate status code to printable string, prefixed by who */
extern std::string errAsString(const std::string& who, int code);

// Concatenate paths. Caller should make sure it makes sense.
extern std::string caturl(const std::string& s1, const std::string& s2);
// Return the scheme://host:port[/] part of input, or input if it is weird
extern std::string baseurl(const std::string& url);
// Return the url with its last path element removed, ending with '/'
extern std::string urldirectory(const std::string& url);
extern void trimstring(std::string &s, const char *ws = " \t\r\n");
extern std::string path_getsimple(const std::string &s);
// Simple file name, without the suffix
extern std::string path_basename(const std::string &s);
// Lower-cased suffix, without the dot
extern std::string path_suffix(const std::string &s);
extern bool path_exists(const std::string& path);
extern std::string stringtolower(const std::string& s);
extern std::string stringtoupper(const std::string& s);

// @return false if s does not look like a bool at all (does not begin
// with [FfNnYyTt01]
extern bool stringToBool(const std::string& s, bool *v);

// Case-insensitive ascii string compare where s1 is already upper-case
extern int stringuppercmp(const std::string &s1, const std::string& s2);
// Case-insensitive test of s2 beginning with s1, s1 already upper-case
extern bool beginswithupper(const std::string &s1, const std::string& s2);
// Test if big begins with small
extern bool beginswith(const std::string& big, const std::string& small);

/** Find an IPv4 address for this host, usable by other hosts on the LAN.
 *
 * Loopback interfaces are skipped. The address for the preferred
 * interface is used if it has one, else the first other non-loopback
 * IPv4 address found.
 * @return false if no usable address exists.
 */
extern bool localIPv4Address(const std::string& preferrediface,
                             std::string& addr);

} // namespace

#endif /* _UPCASTUTILS_H_X_INCLUDED_ */
