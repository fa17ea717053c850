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
#ifndef _CONFTREE_H_X_INCLUDED_
#define _CONFTREE_H_X_INCLUDED_

#include <string>
#include <map>
#include <vector>
#include <istream>

/**
 * Simple configuration storage, read from a file or a string.
 *
 * The data is a list of "name = value" lines. Blank lines and lines
 * beginning with '#' are ignored. Leading and trailing white space is
 * trimmed from names and values. A later assignment of the same name
 * overrides an earlier one.
 */
class ConfSimple {
public:
    /**
     * Build the object by reading content from file.
     * @param fname file name
     * @param readonly accepted for compatibility, we never write
     */
    ConfSimple(const char *fname, int readonly = 1);

    /** Build the object by reading data from string */
    ConfSimple(const std::string& data, bool fromstring);

    /** Was the input usable ? */
    bool ok() const {return m_ok;}

    /**
     * Get string value for named parameter.
     * @return false if the name is not set
     */
    bool get(const std::string& name, std::string& value) const;

    /** Get integer value, or dflt if unset or not a number */
    int getInt(const std::string& name, int dflt) const;

    /** Get boolean value, or dflt if unset or not a boolean */
    bool getBool(const std::string& name, bool dflt) const;

    std::vector<std::string> getNames() const;

private:
    bool m_ok{false};
    std::map<std::string, std::string> m_values;

    void parseinput(std::istream& input);
};

#endif /* _CONFTREE_H_X_INCLUDED_ */
