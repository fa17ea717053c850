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
/////////////////////////////////////////////////////////////////////
// Main program
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <iostream>
#include <string>
#include <vector>
#include <memory>

#include "libupnpp/upnpplib.hxx"
#include "libupnpp/log.hxx"
#include "libupnpp/control/discovery.hxx"
#include "libupnpp/upnpavutils.hxx"
#include "libupcast/conftree.hxx"
#include "libupcast/upcastutils.hxx"
#include "libupcast/control/rendererdirectory.hxx"
#include "mediaserver.hxx"
#include "mpdoutput.hxx"
#include "localengine.hxx"
#include "networkengine.hxx"
#include "upnprenderercontrol.hxx"
#include "controller.hxx"

using namespace std;
using namespace UPnPP;
using namespace UPnPClient;
using namespace UpCast;
using namespace UpCastClient;

static char *thisprog;

static int op_flags;
#define OPT_MOINS 0x1
#define OPT_c     0x2
#define OPT_d     0x4
#define OPT_h     0x8
#define OPT_l     0x10
#define OPT_p     0x20
#define OPT_t     0x40

static const char usage[] = 
    "[options] devices\n"
    "   list the local outputs and the network renderers\n"
    "[options] play <destination> file [file ...]\n"
    "   play files. destination is \"local\", a local output name, or a\n"
    "   renderer name or UUID\n"
    "options:\n"
    "-c configfile \t configuration file to use\n"
    "-h host    \t specify host MPD is running on\n"
    "-p port     \t specify MPD port\n"
    "-d logfilename\t debug messages to\n"
    "-l loglevel\t  log level (0-6)\n"
    "-t secs\t  time to wait for renderers to answer (default 4)\n"
    ;

static void
Usage(FILE *fp = stderr)
{
    fprintf(fp, "%s: usage:\n%s", thisprog, usage);
    exit(1);
}

static volatile sig_atomic_t g_exitrequested;

static void onsig(int)
{
    g_exitrequested = 1;
}

static const int catchedSigs[] = {SIGINT, SIGQUIT, SIGTERM};
static void setupsigs()
{
    struct sigaction action;
    action.sa_handler = onsig;
    action.sa_flags = 0;
    sigemptyset(&action.sa_mask);
    for (unsigned int i = 0; i < sizeof(catchedSigs) / sizeof(int); i++)
        if (signal(catchedSigs[i], SIG_IGN) != SIG_IGN) {
            if (sigaction(catchedSigs[i], &action, 0) < 0) {
                perror("Sigaction failed");
            }
        }
}

// Wait for renderers to show up, or for a signal
static void waitForDevices(int secs)
{
    for (int i = 0; i < secs * 10 && !g_exitrequested; i++) {
        usleep(100 * 1000);
    }
}

static int listDevices(PlaybackController& ctl, int waitsecs)
{
    waitForDevices(waitsecs);
    vector<OutputDestination> dests;
    ctl.listAllDestinations(dests);
    if (dests.empty()) {
        cout << "No output found" << endl;
        return 1;
    }
    for (unsigned int i = 0; i < dests.size(); i++) {
        cout << (dests[i].kind == OutputDestination::OD_LOCAL ?
                 "Local " : "UPnP  ") << dests[i].key() << "  " <<
            dests[i].name << endl;
    }
    return 0;
}

static int playFiles(PlaybackController& ctl, const string& dest,
                     const vector<string>& files, int waitsecs)
{
    for (unsigned int i = 0; i < files.size(); i++) {
        if (!path_exists(files[i])) {
            cerr << "No such file: " << files[i] << endl;
            return 1;
        }
    }
    ctl.addToPlaylist(files);

    if (stringtolower(dest).compare("local")) {
        // Renderers need some time to be discovered.
        int ret = UPCAST_E_SUCCESS;
        for (int i = 0; i < waitsecs * 10 && !g_exitrequested; i++) {
            ret = ctl.setOutputDestination(dest);
            if (ret != UPCAST_E_INVALID_PARAM)
                break;
            usleep(100 * 1000);
        }
        if (ret != UPCAST_E_SUCCESS) {
            cerr << errAsString("setOutputDestination " + dest, ret) << endl;
            return 1;
        }
    }

    int ret = ctl.play();
    if (ret != UPCAST_E_SUCCESS) {
        cerr << errAsString("play", ret) << endl;
        return 1;
    }

    // The engine may take a moment before it reports stopped at the
    // end of the playlist. Exit after a few consecutive stopped ticks.
    int stoppedticks = 0;
    while (!g_exitrequested && stoppedticks < 3) {
        sleep(1);
        PlaybackState st = ctl.currentState();
        if (st == PBS_STOP) {
            stoppedticks++;
            continue;
        }
        stoppedticks = 0;
        PlaylistItem item;
        ctl.currentItem(item);
        int dur = 0;
        string sdur = ctl.durationMs(&dur) ? upnpduration(dur) : "?";
        string fmt;
        ctl.getFormatDescription(fmt);
        cout << pbStateToString(st) << " [" << item.title << "] " <<
            upnpduration(ctl.currentTimeMs()) << "/" << sdur << " " <<
            fmt << endl;
    }
    ctl.stop();
    return 0;
}

int main(int argc, char *argv[])
{
    string configfilename;
    string logfilename;
    int loglevel(Logger::LLINF);
    string mpdhost("localhost");
    int mpdport = 6600;
    string mpdpassword;
    int waitsecs = 4;

    const char *cp;
    if ((cp = getenv("UPCAST_MPDHOST")))
        mpdhost = cp;
    if ((cp = getenv("UPCAST_MPDPORT")))
        mpdport = atoi(cp);
    if ((cp = getenv("UPCAST_CONFIG")))
        configfilename = cp;

    thisprog = argv[0];
    argc--; argv++;
    while (argc > 0 && **argv == '-') {
        (*argv)++;
        if (!(**argv))
            Usage();
        while (**argv)
            switch (*(*argv)++) {
            case 'c':   op_flags |= OPT_c; if (argc < 2)  Usage();
                configfilename = *(++argv); argc--; goto b1;
            case 'd':   op_flags |= OPT_d; if (argc < 2)  Usage();
                logfilename = *(++argv); argc--; goto b1;
            case 'h':   op_flags |= OPT_h; if (argc < 2)  Usage();
                mpdhost = *(++argv); argc--; goto b1;
            case 'l':   op_flags |= OPT_l; if (argc < 2)  Usage();
                loglevel = atoi(*(++argv)); argc--; goto b1;
            case 'p':   op_flags |= OPT_p; if (argc < 2)  Usage();
                mpdport = atoi(*(++argv)); argc--; goto b1;
            case 't':   op_flags |= OPT_t; if (argc < 2)  Usage();
                waitsecs = atoi(*(++argv)); argc--; goto b1;
            default: Usage();   break;
            }
    b1: argc--; argv++;
    }

    if (argc < 1) {
        Usage();
    }
    string command = *argv++; argc--;
    string dest;
    vector<string> files;
    if (!command.compare("play")) {
        if (argc < 2)
            Usage();
        dest = *argv++; argc--;
        while (argc > 0) {
            files.push_back(*argv++); argc--;
        }
    } else if (command.compare("devices") || argc != 0) {
        Usage();
    }

    int msport = 8080;
    string msiface("eth0");
    string mshost;
    bool bitperfect = true;
    int searchwindow = 3;
    if (!configfilename.empty()) {
        ConfSimple config(configfilename.c_str(), 1);
        if (!config.ok()) {
            cerr << "Could not open config: " << configfilename << endl;
            return 1;
        }
        string value;
        if (!(op_flags & OPT_d))
            config.get("logfilename", logfilename);
        if (!(op_flags & OPT_l) && config.get("loglevel", value))
            loglevel = atoi(value.c_str());
        if (!(op_flags & OPT_h))
            config.get("mpdhost", mpdhost);
        if (!(op_flags & OPT_p))
            mpdport = config.getInt("mpdport", mpdport);
        config.get("mpdpassword", mpdpassword);
        msport = config.getInt("mediaserverport", msport);
        config.get("mediaiface", msiface);
        config.get("mediahost", mshost);
        bitperfect = config.getBool("bitperfect", bitperfect);
        searchwindow = config.getInt("searchwindow", searchwindow);
    }

    if (Logger::getTheLog(logfilename) == 0) {
        cerr << "Can't initialize log" << endl;
        return 1;
    }
    Logger::getTheLog("")->setLogLevel(Logger::LogLevel(loglevel));

    setupsigs();

    // Control point only. Renderers are still usable if this fails.
    LibUPnP *mylib = LibUPnP::getLibUPnP(false, 0, msiface);
    bool upnpok = mylib != 0 && mylib->ok();
    if (!upnpok) {
        LOGERR("upcast: libupnp init failed: " << (mylib ? 
               mylib->errAsString("main", mylib->getInitError()) : 
               string("no lib")) << endl);
    } else if (mshost.empty()) {
        mshost = mylib->host();
    }

    shared_ptr<LocalMediaServer> mediaserver(
        new LocalMediaServer(msport, msiface));
    if (!mshost.empty())
        mediaserver->setHostAddress(mshost);
    if (mediaserver->start() != UPCAST_E_SUCCESS) {
        // Local playback still works
        LOGERR("upcast: media server start failed, port " << msport << endl);
    }

    shared_ptr<RendererDirectory> directory(new RendererDirectory());
    shared_ptr<RendererDiscovery> discovery(
        new RendererDiscovery(directory, searchwindow));
    if (!upnpok || !discovery->start()) {
        LOGERR("upcast: discovery could not start, no network renderers" <<
               endl);
    }

    shared_ptr<MpdOutput> mpd(new MpdOutput(mpdhost, mpdport, mpdpassword));
    if (!mpd->start()) {
        LOGERR("upcast: can't connect to MPD at " << mpdhost << ":" <<
               mpdport << endl);
    }
    shared_ptr<LocalPlaybackEngine> local(new LocalPlaybackEngine(mpd));

    PlaybackController::NetEngineFactory factory =
        [mediaserver] (const RendererDevice& dev) {
        shared_ptr<RendererControl> ctl(new UpnpRendererControl(dev));
        return shared_ptr<PlaybackEngine>(
            new NetworkPlaybackEngine(ctl, dev.friendlyName, mediaserver));
    };

    int status;
    {
        PlaybackController controller(local, factory, discovery);
        controller.start();
        controller.setBitPerfect(bitperfect);
        if (!command.compare("devices")) {
            status = listDevices(controller, waitsecs);
        } else {
            status = playFiles(controller, dest, files, waitsecs);
        }
        controller.shutdown();
    }

    discovery->stop();
    if (upnpok)
        UPnPDeviceDirectory::terminate();
    mediaserver->stop();
    mpd->shutdown();
    LOGDEB("upcast: exiting" << endl);
    return status;
}
