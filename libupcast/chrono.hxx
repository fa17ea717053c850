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
#ifndef _CHRONO_H_X_INCLUDED_
#define _CHRONO_H_X_INCLUDED_
#include <chrono>

namespace UpCast {

/** Easy interface to measuring time intervals */
class Chrono {
public:
    /** Initialize, setting the origin time */
    Chrono();

    /** Re-store current time and return mS since init or last call */
    long restart();

    /** Return interval value since init or last restart */
    long millis() const;
    float secs() const;

private:
    typedef std::chrono::time_point<std::chrono::steady_clock> TimePoint;
    TimePoint m_orig;
};

}

#endif /* _CHRONO_H_X_INCLUDED_ */
