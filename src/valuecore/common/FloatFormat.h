/* This file is part of ValueCore.
 * Copyright (C) 2008-2022 Volt Active Data Inc.
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with ValueCore.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <string>

namespace valuecore {

/**
 * Text of a DOUBLE in SQL output form: the fewest significant digits that
 * read back as the same double, plain notation for 1e-3 <= |x| < 1e7
 * ("100.0", "0.001") and scientific otherwise ("1.0E7", "1.5E-10").
 * NaN, Infinity and -Infinity are spelled out.
 */
std::string formatDouble(double value);

/** As formatDouble, with the digits chosen to read back as the same float. */
std::string formatFloat(float value);

/**
 * Parses a DOUBLE/REAL literal. Accepts what formatDouble writes plus
 * leading '+' and lowercase 'e'. Returns false on anything else.
 */
bool parseDouble(std::string const& text, double* result);

}
