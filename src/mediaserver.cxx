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
#include "mediaserver.hxx"

#include <sys/types.h>
#include <sys/stat.h>
#include <errno.h>
#include <fcntl.h>
#include <regex.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <microhttpd.h>

#include <map>
#include <mutex>
#include <sstream>

#include "libupnpp/log.hxx"
#include "libupcast/upcastutils.hxx"

using namespace std;
using namespace UpCast;

#if MHD_VERSION >= 0x00097002
typedef enum MHD_Result MHDRet;
#else
typedef int MHDRet;
#endif

static const string mediaPrefix("/media/");

class LocalMediaServer::Internal {
public:
    Internal(int _port, const string& _iface)
        : port(_port), iface(_iface) {}
    ~Internal() {
        stopMHD();
    }

    bool startMHD();
    void stopMHD();

    MHDRet answerConn(struct MHD_Connection *connection, const char *url,
                      const char *method);
    MHDRet serveFile(struct MHD_Connection *connection, int id);

    int port;
    string iface;
    string hostaddr;

    std::mutex mhdmutex;
    struct MHD_Daemon *mhd{nullptr};

    // Shared file table, also used by the connection threads.
    std::mutex tablemutex;
    map<int, string> files;
    int nextid{1};
};

LocalMediaServer::LocalMediaServer(int port, const string& iface)
    : m(new Internal(port, iface))
{
}

LocalMediaServer::~LocalMediaServer()
{
}

static MHDRet queueStatic(struct MHD_Connection *conn, unsigned int code,
                          const string& text)
{
    struct MHD_Response *response =
        MHD_create_response_from_buffer(text.size(), (void *)text.c_str(),
                                        MHD_RESPMEM_MUST_COPY);
    if (response == nullptr) {
        LOGERR("LocalMediaServer: can't create response" << endl);
        return MHD_NO;
    }
    MHD_add_response_header(response, "Content-Type", "text/plain");
    MHDRet ret = MHD_queue_response(conn, code, response);
    MHD_destroy_response(response);
    return ret;
}

static MHDRet answer_to_connection(
    void *cls, struct MHD_Connection *conn,
    const char *url, const char *method, const char *,
    const char *, size_t *, void **)
{
    LocalMediaServer::Internal *internal =
        static_cast<LocalMediaServer::Internal*>(cls);
    return internal->answerConn(conn, url, method);
}

MHDRet LocalMediaServer::Internal::answerConn(
    struct MHD_Connection *conn, const char *_url, const char *method)
{
    string url(_url);
    LOGDEB1("LocalMediaServer::answerConn: " << method << " " << url << endl);

    if (strcmp(method, "GET") && strcmp(method, "HEAD")) {
        LOGERR("LocalMediaServer::answerConn: method is not GET or HEAD: " <<
               method << endl);
        return queueStatic(conn, MHD_HTTP_METHOD_NOT_ALLOWED, "");
    }
    if (!url.compare("/health")) {
        return queueStatic(conn, MHD_HTTP_OK, "OK");
    }
    if (url.find(mediaPrefix) == 0) {
        string sid = url.substr(mediaPrefix.size());
        if (!sid.empty() && sid.find_first_not_of("0123456789") ==
            string::npos) {
            return serveFile(conn, atoi(sid.c_str()));
        }
    }
    return queueStatic(conn, MHD_HTTP_NOT_FOUND, "Not Found");
}

MHDRet LocalMediaServer::Internal::serveFile(struct MHD_Connection *conn,
                                             int id)
{
    string path;
    {
        std::unique_lock<std::mutex> lock(tablemutex);
        map<int, string>::const_iterator it = files.find(id);
        if (it == files.end()) {
            LOGDEB("LocalMediaServer: no share for id " << id << endl);
            return queueStatic(conn, MHD_HTTP_NOT_FOUND, "Not Found");
        }
        path = it->second;
    }

    int fd = open(path.c_str(), O_RDONLY);
    struct stat st;
    if (fd < 0 || fstat(fd, &st) != 0) {
        LOGERR("LocalMediaServer: can't open " << path << " errno " <<
               errno << endl);
        if (fd >= 0)
            close(fd);
        return queueStatic(conn, MHD_HTTP_INTERNAL_SERVER_ERROR, "");
    }
    int64_t length = st.st_size;

    int64_t start = 0, end = length - 1;
    bool partial = false;
    const char* rangeh =
        MHD_lookup_connection_value(conn, MHD_HEADER_KIND, "range");
    if (rangeh) {
        partial = parseRangeHeader(rangeh, length, &start, &end);
        LOGDEB("LocalMediaServer: range [" << rangeh << "] partial " <<
               partial << " " << start << "-" << end << endl);
    }

    uint64_t count = partial ? uint64_t(end - start + 1) : uint64_t(length);
    // The response owns the fd from now on.
    struct MHD_Response *response =
        MHD_create_response_from_fd_at_offset64(count, fd,
                                                partial ? start : 0);
    if (response == nullptr) {
        LOGERR("LocalMediaServer: can't create file response" << endl);
        close(fd);
        return MHD_NO;
    }
    MHD_add_response_header(response, "Content-Type", mimeType(path).c_str());
    MHD_add_response_header(response, "Accept-Ranges", "bytes");
    unsigned int code = MHD_HTTP_OK;
    if (partial) {
        ostringstream oss;
        oss << "bytes " << start << "-" << end << "/" << length;
        MHD_add_response_header(response, "Content-Range", oss.str().c_str());
        code = MHD_HTTP_PARTIAL_CONTENT;
    }
    MHDRet ret = MHD_queue_response(conn, code, response);
    MHD_destroy_response(response);
    return ret;
}

bool LocalMediaServer::Internal::startMHD()
{
    std::unique_lock<std::mutex> lock(mhdmutex);
    if (mhd) {
        return true;
    }
    mhd = MHD_start_daemon(
        MHD_USE_THREAD_PER_CONNECTION|MHD_USE_SELECT_INTERNALLY|MHD_USE_DEBUG,
        port,
        /* Accept policy callback and arg */
        nullptr, nullptr,
        /* handler and arg */
        &answer_to_connection, this,
        MHD_OPTION_END);

    if (nullptr == mhd) {
        LOGERR("LocalMediaServer: MHD_start_daemon failed on port " << port <<
               endl);
        return false;
    }
    LOGINF("LocalMediaServer: listening on port " << port << endl);
    return true;
}

void LocalMediaServer::Internal::stopMHD()
{
    std::unique_lock<std::mutex> lock(mhdmutex);
    if (mhd) {
        MHD_stop_daemon(mhd);
        mhd = nullptr;
    }
}

int LocalMediaServer::start()
{
    return m->startMHD() ? UPCAST_E_SUCCESS : UPCAST_E_SERVER;
}

void LocalMediaServer::stop()
{
    m->stopMHD();
    std::unique_lock<std::mutex> lock(m->tablemutex);
    m->files.clear();
}

bool LocalMediaServer::isRunning()
{
    std::unique_lock<std::mutex> lock(m->mhdmutex);
    return m->mhd != nullptr;
}

int LocalMediaServer::getPort() const
{
    return m->port;
}

void LocalMediaServer::setHostAddress(const string& addr)
{
    std::unique_lock<std::mutex> lock(m->tablemutex);
    m->hostaddr = addr;
}

int LocalMediaServer::registerFile(const string& path)
{
    std::unique_lock<std::mutex> lock(m->tablemutex);
    int id = m->nextid++;
    m->files[id] = path;
    return id;
}

int LocalMediaServer::shareFile(const string& path, string& url, int *idp)
{
    int id = registerFile(path);
    string addr;
    {
        std::unique_lock<std::mutex> lock(m->tablemutex);
        addr = m->hostaddr;
    }
    if (addr.empty() && !localIPv4Address(m->iface, addr)) {
        LOGERR("LocalMediaServer::shareFile: can't determine local IP "
               "address" << endl);
        unshareFile(id);
        return UPCAST_E_NO_ADDRESS;
    }
    ostringstream oss;
    oss << "http://" << addr << ":" << m->port << mediaPrefix << id;
    url = oss.str();
    if (idp)
        *idp = id;
    LOGDEB("LocalMediaServer::shareFile: " << path << " -> " << url << endl);
    return UPCAST_E_SUCCESS;
}

bool LocalMediaServer::unshareFile(int id)
{
    std::unique_lock<std::mutex> lock(m->tablemutex);
    return m->files.erase(id) != 0;
}

void LocalMediaServer::unshareAll()
{
    std::unique_lock<std::mutex> lock(m->tablemutex);
    m->files.clear();
    m->nextid = 1;
}

bool LocalMediaServer::getSharedPath(int id, string& path)
{
    std::unique_lock<std::mutex> lock(m->tablemutex);
    map<int, string>::const_iterator it = m->files.find(id);
    if (it == m->files.end())
        return false;
    path = it->second;
    return true;
}

bool LocalMediaServer::parseRangeHeader(const string& hdr, int64_t length,
                                        int64_t *startp, int64_t *endp)
{
    regex_t expr;
    if (regcomp(&expr, "bytes=([0-9]+)-([0-9]*)", REG_EXTENDED) != 0) {
        LOGERR("parseRangeHeader: regcomp failed" << endl);
        return false;
    }
    regmatch_t match[3];
    int res = regexec(&expr, hdr.c_str(), 3, match, 0);
    regfree(&expr);
    if (res != 0 || length <= 0) {
        return false;
    }
    int64_t start = atoll(hdr.substr(match[1].rm_so,
                                     match[1].rm_eo - match[1].rm_so).c_str());
    int64_t end = length - 1;
    if (match[2].rm_eo > match[2].rm_so) {
        end = atoll(hdr.substr(match[2].rm_so,
                               match[2].rm_eo - match[2].rm_so).c_str());
        if (end > length - 1)
            end = length - 1;
    }
    if (start > end || start >= length) {
        return false;
    }
    *startp = start;
    *endp = end;
    return true;
}

string LocalMediaServer::mimeType(const string& path)
{
    string suff = path_suffix(path);
    if (suff == "mp3") {
        return "audio/mpeg";
    } else if (suff == "m4a" || suff == "m4b" || suff == "m4p") {
        return "audio/mp4";
    } else if (suff == "flac") {
        return "audio/flac";
    } else if (suff == "wav") {
        return "audio/wav";
    } else if (suff == "aac") {
        return "audio/aac";
    } else if (suff == "ogg") {
        return "audio/ogg";
    } else if (suff == "opus") {
        return "audio/opus";
    } else if (suff == "wma") {
        return "audio/x-ms-wma";
    } else if (suff == "aiff" || suff == "aif") {
        return "audio/aiff";
    }
    return "application/octet-stream";
}
