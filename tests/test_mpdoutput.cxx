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
#include <fstream>

#include "mpdoutput.hxx"
#include "libupcast/upcastutils.hxx"

using namespace std;

// These run without an MPD server: nothing listens on port 1.

static string makeFile(const string& suffix)
{
    char tmpl[] = "/tmp/upcastmpdXXXXXX";
    int fd = mkstemp(tmpl);
    if (fd < 0)
        return string();
    close(fd);
    unlink(tmpl);
    string fn = string(tmpl) + suffix;
    ofstream out(fn.c_str());
    out << "data";
    return fn;
}

TEST(MpdOutput, SupportedFormats)
{
    EXPECT_TRUE(MpdOutput::supportedFormat("/a/b.mp3"));
    EXPECT_TRUE(MpdOutput::supportedFormat("/a/b.FLAC"));
    EXPECT_TRUE(MpdOutput::supportedFormat("b.m4a"));
    EXPECT_TRUE(MpdOutput::supportedFormat("b.aif"));
    EXPECT_TRUE(MpdOutput::supportedFormat("b.opus"));
    EXPECT_FALSE(MpdOutput::supportedFormat("b.txt"));
    EXPECT_FALSE(MpdOutput::supportedFormat("b"));
    EXPECT_FALSE(MpdOutput::supportedFormat("/a.flac/b"));
}

TEST(MpdOutput, Defaults)
{
    MpdOutput out("127.0.0.1", 1);
    EXPECT_EQ(PBS_STOP, out.state());
    EXPECT_TRUE(out.bitPerfect());
    out.setBitPerfect(false);
    EXPECT_FALSE(out.bitPerfect());
    int ms;
    EXPECT_FALSE(out.durationMs(&ms));
    string desc;
    EXPECT_FALSE(out.getFormatDescription(desc));
}

TEST(MpdOutput, LoadErrors)
{
    MpdOutput out("127.0.0.1", 1);
    EXPECT_FALSE(out.start());
    EXPECT_FALSE(out.ok());

    EXPECT_EQ(UPCAST_E_FILE_NOT_FOUND,
              out.loadAndPlay("/nonexistent/upcast/track.flac"));
    EXPECT_EQ(PBS_STOP, out.state());

    string txt = makeFile(".txt");
    ASSERT_FALSE(txt.empty());
    EXPECT_EQ(UPCAST_E_UNSUPPORTED_FORMAT, out.loadAndPlay(txt));
    EXPECT_EQ(PBS_STOP, out.state());
    unlink(txt.c_str());

    string flac = makeFile(".flac");
    ASSERT_FALSE(flac.empty());
    EXPECT_EQ(UPCAST_E_ENGINE, out.loadAndPlay(flac));
    EXPECT_EQ(PBS_STOP, out.state());
    unlink(flac.c_str());
}
