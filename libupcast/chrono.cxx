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
#include "libupcast/chrono.hxx"

using namespace std;

namespace UpCast {

Chrono::Chrono()
    : m_orig(chrono::steady_clock::now())
{
}

long Chrono::restart()
{
    auto nnow = chrono::steady_clock::now();
    auto ms = chrono::duration_cast<chrono::milliseconds>(nnow - m_orig);
    m_orig = nnow;
    return ms.count();
}

long Chrono::millis() const
{
    auto nnow = chrono::steady_clock::now();
    return chrono::duration_cast<chrono::milliseconds>(nnow - m_orig).count();
}

float Chrono::secs() const
{
    auto nnow = chrono::steady_clock::now();
    return chrono::duration_cast<chrono::duration<float>>(nnow - m_orig).count();
}

}
