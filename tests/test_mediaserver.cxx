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
#include <gtest/gtest.h>

#include <stdlib.h>
#include <unistd.h>

#include <string>
#include <map>
#include <fstream>

#include <curl/curl.h>

#include "libupnpp/soaphelp.hxx"
#include "libupcast/upcastutils.hxx"
#include "mediaserver.hxx"

using namespace std;
using namespace UPnPP;
using namespace UpCast;

struct HttpResponse {
    int status{0};
    // Names are lowercased
    map<string, string> headers;
    string body;
};

// Minimal libcurl client for talking to the live server
class TestHttp {
public:
    int get(const string& url, const map<string, string>& hdrs,
            HttpResponse& resp) {
        return perform(url, hdrs, 0, resp);
    }
    int post(const string& url, const map<string, string>& hdrs,
             const string& body, HttpResponse& resp) {
        return perform(url, hdrs, &body, resp);
    }

private:
    static size_t writeCB(char *ptr, size_t size, size_t nmemb, void *ud) {
        ((HttpResponse *)ud)->body.append(ptr, size * nmemb);
        return size * nmemb;
    }
    static size_t headerCB(char *ptr, size_t size, size_t nmemb, void *ud) {
        string line(ptr, size * nmemb);
        string::size_type colon = line.find(':');
        if (colon != string::npos) {
            string name = stringtolower(line.substr(0, colon));
            string value = line.substr(colon + 1);
            trimstring(value, " \t\r\n");
            ((HttpResponse *)ud)->headers[name] = value;
        }
        return size * nmemb;
    }

    int perform(const string& url, const map<string, string>& hdrs,
                const string *body, HttpResponse& resp) {
        resp = HttpResponse();
        CURL *curl = curl_easy_init();
        if (curl == 0)
            return UPCAST_E_NETWORK;
        struct curl_slist *slist = 0;
        for (map<string, string>::const_iterator it = hdrs.begin();
             it != hdrs.end(); it++) {
            slist = curl_slist_append(slist,
                                      (it->first + ": " + it->second).c_str());
        }
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, slist);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, 5L);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCB);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCB);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &resp);
        if (body) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, long(body->size()));
        }
        CURLcode code = curl_easy_perform(curl);
        long status = 0;
        if (code == CURLE_OK) {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        }
        curl_slist_free_all(slist);
        curl_easy_cleanup(curl);
        if (code != CURLE_OK)
            return UPCAST_E_NETWORK;
        resp.status = int(status);
        return UPCAST_E_SUCCESS;
    }
};

TEST(MediaServerRange, Parse)
{
    int64_t s = -1, e = -1;
    EXPECT_TRUE(LocalMediaServer::parseRangeHeader("bytes=100-199", 1000,
                                                   &s, &e));
    EXPECT_EQ(100, s);
    EXPECT_EQ(199, e);

    // Open ended
    EXPECT_TRUE(LocalMediaServer::parseRangeHeader("bytes=500-", 1000,
                                                   &s, &e));
    EXPECT_EQ(500, s);
    EXPECT_EQ(999, e);

    // End past the resource size
    EXPECT_TRUE(LocalMediaServer::parseRangeHeader("bytes=900-2000", 1000,
                                                   &s, &e));
    EXPECT_EQ(900, s);
    EXPECT_EQ(999, e);

    EXPECT_TRUE(LocalMediaServer::parseRangeHeader("bytes=0-0", 1000,
                                                   &s, &e));
    EXPECT_EQ(0, s);
    EXPECT_EQ(0, e);
}

TEST(MediaServerRange, Full)
{
    int64_t s = -1, e = -1;
    EXPECT_FALSE(LocalMediaServer::parseRangeHeader("", 1000, &s, &e));
    EXPECT_FALSE(LocalMediaServer::parseRangeHeader("bytes=-100", 1000,
                                                    &s, &e));
    EXPECT_FALSE(LocalMediaServer::parseRangeHeader("items=0-10", 1000,
                                                    &s, &e));
    EXPECT_FALSE(LocalMediaServer::parseRangeHeader("bytes=1000-", 1000,
                                                    &s, &e));
    EXPECT_FALSE(LocalMediaServer::parseRangeHeader("bytes=300-200", 1000,
                                                    &s, &e));
    EXPECT_FALSE(LocalMediaServer::parseRangeHeader("bytes=0-10", 0,
                                                    &s, &e));
    // Not modified on failure
    EXPECT_EQ(-1, s);
    EXPECT_EQ(-1, e);
}

TEST(MediaServer, MimeTypes)
{
    EXPECT_EQ("audio/mpeg", LocalMediaServer::mimeType("/a/b.mp3"));
    EXPECT_EQ("audio/mpeg", LocalMediaServer::mimeType("/a/b.MP3"));
    EXPECT_EQ("audio/mp4", LocalMediaServer::mimeType("x.m4a"));
    EXPECT_EQ("audio/flac", LocalMediaServer::mimeType("x.flac"));
    EXPECT_EQ("audio/wav", LocalMediaServer::mimeType("x.wav"));
    EXPECT_EQ("audio/aac", LocalMediaServer::mimeType("x.aac"));
    EXPECT_EQ("audio/ogg", LocalMediaServer::mimeType("x.ogg"));
    EXPECT_EQ("audio/opus", LocalMediaServer::mimeType("x.opus"));
    EXPECT_EQ("audio/x-ms-wma", LocalMediaServer::mimeType("x.wma"));
    EXPECT_EQ("audio/aiff", LocalMediaServer::mimeType("x.aif"));
    EXPECT_EQ("application/octet-stream",
              LocalMediaServer::mimeType("x.txt"));
    EXPECT_EQ("application/octet-stream",
              LocalMediaServer::mimeType("noext"));
}

TEST(MediaServer, ShareTable)
{
    LocalMediaServer server(18088);
    server.setHostAddress("192.168.1.10");
    EXPECT_EQ(1, server.registerFile("/music/a.flac"));
    EXPECT_EQ(2, server.registerFile("/music/b.flac"));

    string url;
    int id = 0;
    ASSERT_EQ(UPCAST_E_SUCCESS, server.shareFile("/music/c.mp3", url, &id));
    EXPECT_EQ(3, id);
    EXPECT_EQ("http://192.168.1.10:18088/media/3", url);

    string path;
    EXPECT_TRUE(server.getSharedPath(2, path));
    EXPECT_EQ("/music/b.flac", path);
    EXPECT_TRUE(server.unshareFile(2));
    EXPECT_FALSE(server.unshareFile(2));
    EXPECT_FALSE(server.getSharedPath(2, path));

    // Ids are never reused until everything is cleared
    EXPECT_EQ(4, server.registerFile("/music/d.flac"));
    server.unshareAll();
    EXPECT_FALSE(server.getSharedPath(1, path));
    EXPECT_EQ(1, server.registerFile("/music/e.flac"));
}

class MediaServerLive : public ::testing::Test {
protected:
    MediaServerLive() : server(18089) {}

    virtual void SetUp() {
        char tmpl[] = "/tmp/upcasttestXXXXXX";
        int fd = mkstemp(tmpl);
        ASSERT_GE(fd, 0);
        close(fd);
        fn = string(tmpl) + ".mp3";
        unlink(tmpl);
        ofstream out(fn.c_str(), ios::binary);
        for (int i = 0; i < 1000; i++) {
            out.put(char('a' + i % 26));
        }
        out.close();
        server.setHostAddress("127.0.0.1");
        ASSERT_EQ(UPCAST_E_SUCCESS, server.start());
    }
    virtual void TearDown() {
        server.stop();
        unlink(fn.c_str());
    }

    string fn;
    LocalMediaServer server;
    TestHttp http;
};

TEST_F(MediaServerLive, Health)
{
    EXPECT_TRUE(server.isRunning());
    // Idempotent
    EXPECT_EQ(UPCAST_E_SUCCESS, server.start());
    HttpResponse resp;
    ASSERT_EQ(UPCAST_E_SUCCESS,
              http.get("http://127.0.0.1:18089/health",
                       map<string, string>(), resp));
    EXPECT_EQ(200, resp.status);
    EXPECT_EQ("OK", resp.body);
}

TEST_F(MediaServerLive, RangeRequest)
{
    string url;
    ASSERT_EQ(UPCAST_E_SUCCESS, server.shareFile(fn, url));
    EXPECT_EQ("http://127.0.0.1:18089/media/1", url);

    map<string, string> hdrs;
    hdrs["Range"] = "bytes=100-199";
    HttpResponse resp;
    ASSERT_EQ(UPCAST_E_SUCCESS, http.get(url, hdrs, resp));
    EXPECT_EQ(206, resp.status);
    EXPECT_EQ("bytes 100-199/1000", resp.headers["content-range"]);
    EXPECT_EQ("bytes", resp.headers["accept-ranges"]);
    EXPECT_EQ("audio/mpeg", resp.headers["content-type"]);
    ASSERT_EQ(100u, resp.body.size());
    // Byte 100 is 'a' + 100 % 26
    EXPECT_EQ('w', resp.body[0]);

    hdrs["Range"] = "bytes=990-";
    ASSERT_EQ(UPCAST_E_SUCCESS, http.get(url, hdrs, resp));
    EXPECT_EQ(206, resp.status);
    EXPECT_EQ("bytes 990-999/1000", resp.headers["content-range"]);
    EXPECT_EQ(10u, resp.body.size());
}

TEST_F(MediaServerLive, FullRequest)
{
    string url;
    ASSERT_EQ(UPCAST_E_SUCCESS, server.shareFile(fn, url));
    HttpResponse resp;
    ASSERT_EQ(UPCAST_E_SUCCESS, http.get(url, map<string, string>(), resp));
    EXPECT_EQ(200, resp.status);
    EXPECT_EQ(1000u, resp.body.size());
    EXPECT_EQ(0u, resp.headers.count("content-range"));

    // Unsatisfiable range: whole file
    map<string, string> hdrs;
    hdrs["Range"] = "bytes=5000-";
    ASSERT_EQ(UPCAST_E_SUCCESS, http.get(url, hdrs, resp));
    EXPECT_EQ(200, resp.status);
    EXPECT_EQ(1000u, resp.body.size());
}

TEST_F(MediaServerLive, Errors)
{
    HttpResponse resp;
    ASSERT_EQ(UPCAST_E_SUCCESS,
              http.get("http://127.0.0.1:18089/media/42",
                       map<string, string>(), resp));
    EXPECT_EQ(404, resp.status);
    ASSERT_EQ(UPCAST_E_SUCCESS,
              http.get("http://127.0.0.1:18089/media/abc",
                       map<string, string>(), resp));
    EXPECT_EQ(404, resp.status);
    ASSERT_EQ(UPCAST_E_SUCCESS,
              http.get("http://127.0.0.1:18089/other",
                       map<string, string>(), resp));
    EXPECT_EQ(404, resp.status);

    // Unshared
    string url;
    int id;
    ASSERT_EQ(UPCAST_E_SUCCESS, server.shareFile(fn, url, &id));
    server.unshareFile(id);
    ASSERT_EQ(UPCAST_E_SUCCESS, http.get(url, map<string, string>(), resp));
    EXPECT_EQ(404, resp.status);

    // Registered, but unreadable
    int id1 = server.registerFile("/nonexistent/upcast/file.mp3");
    ASSERT_EQ(UPCAST_E_SUCCESS,
              http.get("http://127.0.0.1:18089/media/" + SoapHelp::i2s(id1),
                       map<string, string>(), resp));
    EXPECT_EQ(500, resp.status);

    ASSERT_EQ(UPCAST_E_SUCCESS,
              http.post("http://127.0.0.1:18089/health",
                        map<string, string>(), "x", resp));
    EXPECT_EQ(405, resp.status);
}
