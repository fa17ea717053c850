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
#include "libupcast/upcastutils.hxx"

#include <sys/types.h>
#include <sys/stat.h>
#include <sys/socket.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <ctype.h>
#include <stdlib.h>
#include <unistd.h>

#include <sstream>

#include "libupnpp/log.hxx"

using namespace std;

namespace UpCast {

string errAsString(const string& who, int code)
{
    const char *what;
    switch (code) {
    case UPCAST_E_SUCCESS: what = "success"; break;
    case UPCAST_E_INVALID_URL: what = "invalid URL"; break;
    case UPCAST_E_NETWORK: what = "network error"; break;
    case UPCAST_E_BAD_RESPONSE: what = "invalid response"; break;
    case UPCAST_E_SOAP_FAULT: what = "SOAP fault"; break;
    case UPCAST_E_PARSE: what = "parse error"; break;
    case UPCAST_E_NO_SERVICE: what = "service not available"; break;
    case UPCAST_E_NO_ADDRESS: what = "no usable local address"; break;
    case UPCAST_E_FILE_NOT_FOUND: what = "file not found"; break;
    case UPCAST_E_UNSUPPORTED_FORMAT: what = "unsupported format"; break;
    case UPCAST_E_ENGINE: what = "audio engine error"; break;
    case UPCAST_E_LOAD: what = "file load error"; break;
    case UPCAST_E_NO_ITEM: what = "no item"; break;
    case UPCAST_E_INVALID_PARAM: what = "invalid parameter"; break;
    case UPCAST_E_SERVER: what = "server error"; break;
    default: what = "unknown error"; break;
    }
    ostringstream oss;
    oss << who << " :" << code << ": " << what;
    return oss.str();
}

string caturl(const string& s1, const string& s2)
{
    if (s2.find("http://") == 0 || s2.find("https://") == 0) {
        return s2;
    }
    string out(s1);
    if (out.empty() || out[out.size()-1] != '/') {
        if (s2.empty() || s2[0] != '/')
            out += '/';
    } else {
        if (!s2.empty() && s2[0] == '/') {
            out.erase(out.size()-1);
        }
    }
    out += s2;
    return out;
}

string baseurl(const string& url)
{
    string::size_type pos = url.find("://");
    if (pos == string::npos)
        return url;

    pos = url.find_first_of("/", pos + 3);
    if (pos == string::npos) {
        return url;
    } else {
        return url.substr(0, pos + 1);
    }
}

string urldirectory(const string& url)
{
    string::size_type start = url.find("://");
    start = (start == string::npos) ? 0 : start + 3;
    string::size_type slash = url.find_last_of('/');
    if (slash == string::npos || slash < start) {
        return url + "/";
    }
    return url.substr(0, slash + 1);
}

void trimstring(string &s, const char *ws)
{
    string::size_type pos = s.find_first_not_of(ws);
    if (pos == string::npos) {
        s.clear();
        return;
    }
    s.replace(0, pos, string());

    pos = s.find_last_not_of(ws);
    if (pos != string::npos && pos != s.length()-1)
        s.replace(pos + 1, string::npos, string());
}

string path_getsimple(const string &s)
{
    string::size_type slp = s.rfind('/');
    if (slp == string::npos)
        return s;

    return s.substr(slp + 1);
}

string path_basename(const string &s)
{
    string simple = path_getsimple(s);
    string::size_type dot = simple.rfind('.');
    if (dot == string::npos || dot == 0)
        return simple;
    return simple.substr(0, dot);
}

string path_suffix(const string &s)
{
    string simple = path_getsimple(s);
    string::size_type dot = simple.rfind('.');
    if (dot == string::npos)
        return string();
    return stringtolower(simple.substr(dot + 1));
}

bool path_exists(const string& path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0)
        return false;
    return S_ISREG(st.st_mode);
}

string stringtolower(const string& s)
{
    string o(s);
    for (string::iterator it = o.begin(); it != o.end(); it++)
        *it = tolower(*it);
    return o;
}

string stringtoupper(const string& s)
{
    string o(s);
    for (string::iterator it = o.begin(); it != o.end(); it++)
        *it = toupper(*it);
    return o;
}

bool stringToBool(const string& s, bool *value)
{
    if (s.empty())
        return false;
    if (isdigit(s[0])) {
        int val = atoi(s.c_str());
        *value = (val != 0);
    } else if (s.find_first_of("yYtT") == 0) {
        *value = true;
    } else if (s.find_first_of("nNfF") == 0) {
        *value = false;
    } else {
        return false;
    }
    return true;
}

int stringuppercmp(const string & s1, const string& s2)
{
    string::const_iterator it1 = s1.begin();
    string::const_iterator it2 = s2.begin();
    string::size_type size1 = s1.length(), size2 = s2.length();
    int c2;

    if (size2 == 0) {
        return size1 == 0 ? 0 : 1;
    }
    if (size1 > size2) {
        while (it1 != s1.end()) {
            c2 = ::toupper(*it2);
            if (*it1 != c2) {
                return *it1 > c2 ? 1 : -1;
            }
            ++it1; ++it2;
            if (it2 == s2.end())
                return size1 == size2 ? 0 : 1;
        }
    } else {
        while (it2 != s2.end()) {
            if (it1 == s1.end())
                return size1 == size2 ? 0 : -1;
            c2 = ::toupper(*it2);
            if (*it1 != c2) {
                return *it1 > c2 ? 1 : -1;
            }
            ++it1; ++it2;
        }
        if (it1 != s1.end())
            return 1;
    }
    return 0;
}

bool beginswithupper(const string &s1, const string& s2)
{
    if (s2.size() < s1.size())
        return false;
    return stringuppercmp(s1, s2.substr(0, s1.size())) == 0;
}

bool beginswith(const string& big, const string& small)
{
    return big.compare(0, small.size(), small) == 0;
}

bool localIPv4Address(const string& preferrediface, string& addr)
{
    struct ifaddrs *ifap;
    if (getifaddrs(&ifap) != 0) {
        LOGERR("localIPv4Address: getifaddrs failed" << endl);
        return false;
    }
    string fallback;
    for (struct ifaddrs *ifa = ifap; ifa != 0; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == 0 || ifa->ifa_addr->sa_family != AF_INET)
            continue;
        if (ifa->ifa_flags & IFF_LOOPBACK)
            continue;
        char buf[INET_ADDRSTRLEN];
        struct sockaddr_in *sin = (struct sockaddr_in *)ifa->ifa_addr;
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) == 0)
            continue;
        if (!preferrediface.empty() && preferrediface == ifa->ifa_name) {
            addr = buf;
            freeifaddrs(ifap);
            LOGDEB1("localIPv4Address: " << preferrediface << " -> " <<
                    addr << endl);
            return true;
        }
        if (fallback.empty()) {
            fallback = buf;
        }
    }
    freeifaddrs(ifap);
    if (fallback.empty()) {
        return false;
    }
    addr = fallback;
    return true;
}

} // namespace
