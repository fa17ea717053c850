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
#include "libupcast/conftree.hxx"

#include <stdlib.h>
#include <ctype.h>

#include <fstream>
#include <sstream>

#include "libupnpp/log.hxx"
#include "libupcast/upcastutils.hxx"

using namespace std;
using namespace UpCast;

ConfSimple::ConfSimple(const char *fname, int)
{
    ifstream input(fname);
    if (!input.is_open()) {
        LOGERR("ConfSimple::ConfSimple: can't open " << fname << endl);
        return;
    }
    parseinput(input);
}

ConfSimple::ConfSimple(const string& data, bool)
{
    stringstream input(data, ios::in);
    parseinput(input);
}

void ConfSimple::parseinput(istream& input)
{
    string line;
    int lineno = 0;
    while (getline(input, line)) {
        lineno++;
        trimstring(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        string::size_type eqpos = line.find('=');
        if (eqpos == string::npos) {
            LOGINF("ConfSimple: ignoring line " << lineno << ": [" <<
                   line << "]" << endl);
            continue;
        }
        string nm = line.substr(0, eqpos);
        string val = line.substr(eqpos + 1);
        trimstring(nm);
        trimstring(val);
        if (nm.empty()) {
            continue;
        }
        m_values[nm] = val;
    }
    m_ok = true;
}

bool ConfSimple::get(const string& nm, string& value) const
{
    map<string, string>::const_iterator it = m_values.find(nm);
    if (it == m_values.end()) {
        return false;
    }
    value = it->second;
    return true;
}

int ConfSimple::getInt(const string& nm, int dflt) const
{
    string value;
    if (!get(nm, value) || value.empty() ||
        !(isdigit(value[0]) || value[0] == '-')) {
        return dflt;
    }
    return atoi(value.c_str());
}

bool ConfSimple::getBool(const string& nm, bool dflt) const
{
    string value;
    bool bval;
    if (!get(nm, value) || !stringToBool(value, &bval)) {
        return dflt;
    }
    return bval;
}

vector<string> ConfSimple::getNames() const
{
    vector<string> names;
    for (map<string, string>::const_iterator it = m_values.begin();
         it != m_values.end(); it++) {
        names.push_back(it->first);
    }
    return names;
}
