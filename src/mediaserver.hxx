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
#ifndef _MEDIASERVER_H_X_INCLUDED_
#define _MEDIASERVER_H_X_INCLUDED_

#include <stdint.h>

#include <memory>
#include <string>

/// HTTP server for local files played on network renderers.
///
/// Uses microhttpd. Shared files are accessed as /media/<id>, with
/// support for byte range requests. /health returns "OK".
///
/// All methods are thread-safe. The shared file table is also
/// accessed by the connection threads.
class LocalMediaServer {
public:
    /**
     * @param port listening port.
     * @param iface name of the network interface whose address we
     *   prefer for composing the media URLs.
     */
    LocalMediaServer(int port = 8080, const std::string& iface = "eth0");
    ~LocalMediaServer();

    /** Start listening. Idempotent.
     * @return UPCAST_E_SUCCESS or UPCAST_E_SERVER */
    int start();

    /** Stop the server and forget all shared files */
    void stop();

    bool isRunning();
    int getPort() const;

    /** Use a fixed host address in the media URLs instead of looking
     * up the interfaces. An empty value restores the lookup. */
    void setHostAddress(const std::string& addr);

    /** Record path under a new id, and return the id. Ids are
     * allocated in increasing order, starting at 1. */
    int registerFile(const std::string& path);

    /** Share file and compute the URL to be used by the renderers.
     *
     * @param path local file path.
     * @param[out] url http://<addr>:<port>/media/<id>
     * @param[out] idp if not null, the id of the new share.
     * @return UPCAST_E_SUCCESS, or UPCAST_E_NO_ADDRESS if no usable
     *   local IPv4 address was found (the share is then removed).
     */
    int shareFile(const std::string& path, std::string& url, int *idp = 0);

    /** @return false if there was no such share */
    bool unshareFile(int id);

    /** Forget all shares and restart the id sequence at 1 */
    void unshareAll();

    bool getSharedPath(int id, std::string& path);

    /** Interpret a Range header value against a resource size.
     *
     * The value must match bytes=(\d+)-(\d*). A missing end, or one past
     * the resource size, is set to length-1.
     * @return true if a partial (206) response should be sent for
     *   [*startp, *endp], false for a full response.
     */
    static bool parseRangeHeader(const std::string& hdr, int64_t length,
                                 int64_t *startp, int64_t *endp);

    /** Content type from file suffix */
    static std::string mimeType(const std::string& path);

    LocalMediaServer(const LocalMediaServer&) = delete;
    LocalMediaServer& operator=(const LocalMediaServer&) = delete;

    class Internal;
private:
    std::unique_ptr<Internal> m;
};

#endif /* _MEDIASERVER_H_X_INCLUDED_ */
