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
#ifndef _PLAYLIST_H_X_INCLUDED_
#define _PLAYLIST_H_X_INCLUDED_

#include <string>
#include <vector>
#include <random>

class PlaylistItem {
public:
    PlaylistItem() {}
    /** The title defaults to the file name without suffix */
    PlaylistItem(const std::string& locator, const std::string& title = "");
    std::string locator;
    std::string title;
};

enum PlaybackMode {PM_SEQUENTIAL, PM_LOOP, PM_LOOPONE, PM_SHUFFLE};

extern const char *pbModeToString(PlaybackMode mode);
extern bool stringToPbMode(const std::string& s, PlaybackMode *mode);

/**
 * Ordered list of tracks with a cursor. The cursor is -1 (no current
 * item) or a valid index.
 *
 * This is not synchronized, the owner must provide locking.
 */
class Playlist {
public:
    Playlist();

    void add(const PlaylistItem& item);
    void addAll(const std::vector<PlaylistItem>& items);
    /** @return false if the index is out of range */
    bool remove(int idx);
    void clear();

    /** Move the cursor according to the mode and return the new
     * current item. @return false if there is no next item (the
     * cursor does not move then) */
    bool next(PlaylistItem& item);
    bool previous(PlaylistItem& item);
    bool jumpTo(int idx, PlaylistItem *item = 0);

    bool currentItem(PlaylistItem& item) const;
    int currentPosition() const {
        return m_cursor;
    }
    int count() const {
        return int(m_items.size());
    }
    const std::vector<PlaylistItem>& items() const {
        return m_items;
    }

    PlaybackMode mode() const {
        return m_mode;
    }
    void setMode(PlaybackMode mode) {
        m_mode = mode;
    }

private:
    std::vector<PlaylistItem> m_items;
    int m_cursor;
    PlaybackMode m_mode;
    std::mt19937 m_rng;

    bool move(int step, PlaylistItem& item);
};

#endif /* _PLAYLIST_H_X_INCLUDED_ */
