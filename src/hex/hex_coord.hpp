/*
	Copyright (C) 2003-2013 by Kristina Simpson <sweet.kristas@gmail.com>
	
	This software is provided 'as-is', without any express or implied
	warranty. In no event will the authors be held liable for any damages
	arising from the use of this software.

	Permission is granted to anyone to use this software for any purpose,
	including commercial applications, and to alter it and redistribute it
	freely, subject to the following restrictions:

	   1. The origin of this software must not be misrepresented; you must not
	   claim that you wrote the original software. If you use this software
	   in a product, an acknowledgement in the product documentation would be
	   appreciated but is not required.

	   2. Altered source versions must be plainly marked as such, and must not be
	   misrepresented as being the original software.

	   3. This notice may not be removed or altered from any source
	   distribution.
*/

#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "hex_fwd.hpp"

namespace hex
{
	// Cube coordinate with q+r+s == 0. The board-position id is assigned by
	// the board preset and does not take part in equality.
	class Coordinate
	{
	public:
		Coordinate(int q, int r, int s, int id=0);
		Coordinate(int q, int r);

		int q() const { return q_; }
		int r() const { return r_; }
		int s() const { return s_; }
		int getId() const { return id_; }

		int distance(const Coordinate& other) const;
		Coordinate neighbor(int dir) const;
		std::vector<Coordinate> getNeighbors() const;
		Coordinate offset(int dir, int steps) const;

		// Canonical "q,r,s" key.
		std::string toString() const;

		bool operator==(const Coordinate& other) const { return q_ == other.q_ && r_ == other.r_ && s_ == other.s_; }
		bool operator!=(const Coordinate& other) const { return !operator==(other); }
		bool operator<(const Coordinate& other) const;
	private:
		int q_;
		int r_;
		int s_;
		int id_;
	};

	std::ostream& operator<<(std::ostream& os, const Coordinate& c);

	int distance(int q1, int r1, int s1, int q2, int r2, int s2);
	int distance(const Coordinate& a, const Coordinate& b);

	// All coordinates at exactly `radius` from `center`, walked clockwise from
	// the corner center + radius*start_dir. A radius of 0 yields the center.
	std::vector<Coordinate> ring(const Coordinate& center, int radius, int start_dir);
}
