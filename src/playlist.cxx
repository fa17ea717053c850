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
#include "playlist.hxx"

#include "libupcast/upcastutils.hxx"

using namespace std;
using namespace UpCast;

PlaylistItem::PlaylistItem(const string& loc, const string& tit)
    : locator(loc), title(tit)
{
    if (title.empty()) {
        title = path_basename(locator);
    }
}

const char *pbModeToString(PlaybackMode mode)
{
    switch (mode) {
    case PM_SEQUENTIAL: return "sequential";
    case PM_LOOP: return "loop";
    case PM_LOOPONE: return "loopone";
    case PM_SHUFFLE: return "shuffle";
    default: return "unknown";
    }
}

bool stringToPbMode(const string& s, PlaybackMode *mode)
{
    string ls = stringtolower(s);
    if (ls == "sequential") {
        *mode = PM_SEQUENTIAL;
    } else if (ls == "loop") {
        *mode = PM_LOOP;
    } else if (ls == "loopone") {
        *mode = PM_LOOPONE;
    } else if (ls == "shuffle") {
        *mode = PM_SHUFFLE;
    } else {
        return false;
    }
    return true;
}

Playlist::Playlist()
    : m_cursor(-1), m_mode(PM_SEQUENTIAL), m_rng(std::random_device()())
{
}

void Playlist::add(const PlaylistItem& item)
{
    m_items.push_back(item);
    if (m_cursor < 0)
        m_cursor = 0;
}

void Playlist::addAll(const vector<PlaylistItem>& items)
{
    for (unsigned int i = 0; i < items.size(); i++) {
        add(items[i]);
    }
}

bool Playlist::remove(int idx)
{
    if (idx < 0 || idx >= count())
        return false;
    m_items.erase(m_items.begin() + idx);
    // The cursor keeps its value unless it is now past the end
    if (m_cursor >= count())
        m_cursor = count() - 1;
    return true;
}

void Playlist::clear()
{
    m_items.clear();
    m_cursor = -1;
}

bool Playlist::move(int step, PlaylistItem& item)
{
    int n = count();
    if (n == 0)
        return false;
    int ncursor = m_cursor;
    switch (m_mode) {
    case PM_SEQUENTIAL:
        ncursor = m_cursor + step;
        if (ncursor < 0 || ncursor >= n)
            return false;
        break;
    case PM_LOOP:
        ncursor = ((m_cursor + step) % n + n) % n;
        break;
    case PM_LOOPONE:
        if (ncursor < 0)
            ncursor = 0;
        break;
    case PM_SHUFFLE:
    {
        std::uniform_int_distribution<int> dist(0, n - 1);
        ncursor = dist(m_rng);
    }
    break;
    }
    m_cursor = ncursor;
    item = m_items[m_cursor];
    return true;
}

bool Playlist::next(PlaylistItem& item)
{
    return move(1, item);
}

bool Playlist::previous(PlaylistItem& item)
{
    return move(-1, item);
}

bool Playlist::jumpTo(int idx, PlaylistItem *item)
{
    if (idx < 0 || idx >= count())
        return false;
    m_cursor = idx;
    if (item)
        *item = m_items[idx];
    return true;
}

bool Playlist::currentItem(PlaylistItem& item) const
{
    if (m_cursor < 0 || m_cursor >= count())
        return false;
    item = m_items[m_cursor];
    return true;
}
