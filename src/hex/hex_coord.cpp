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

#include <cstdlib>
#include <sstream>

#include "asserts.hpp"
#include "hex_coord.hpp"
#include "unit_test.hpp"

namespace hex
{
	namespace
	{
		const int dir_dq[NUM_DIRECTIONS] = { 1, 1, 0, -1, -1, 0 };
		const int dir_dr[NUM_DIRECTIONS] = { -1, 0, 1, 1, 0, -1 };

		const char* const tile_state_names[] = {
			"default", "available_ally", "available_enemy", "occupied_ally", "occupied_enemy", "blocked", "blocked_breakable",
		};
	}

	bool is_valid_tile_state(int value)
	{
		return value >= static_cast<int>(TileState::DEFAULT) && value <= static_cast<int>(TileState::BLOCKED_BREAKABLE);
	}

	bool is_occupied_state(TileState s)
	{
		return s == TileState::OCCUPIED_ALLY || s == TileState::OCCUPIED_ENEMY;
	}

	bool is_blocked_state(TileState s)
	{
		return s == TileState::BLOCKED || s == TileState::BLOCKED_BREAKABLE;
	}

	const char* to_string(Team t)
	{
		return t == Team::ALLY ? "ally" : "enemy";
	}

	const char* to_string(TileState s)
	{
		const int n = static_cast<int>(s);
		return is_valid_tile_state(n) ? tile_state_names[n] : "invalid";
	}

	std::ostream& operator<<(std::ostream& os, Team t)
	{
		return os << to_string(t);
	}

	std::ostream& operator<<(std::ostream& os, TileState s)
	{
		return os << to_string(s);
	}

	Coordinate::Coordinate(int q, int r, int s, int id)
		: q_(q), r_(r), s_(s), id_(id)
	{
		ASSERT_LOG(q + r + s == 0, "Invalid hex coordinate (" << q << "," << r << "," << s << "): q+r+s must be 0");
	}

	Coordinate::Coordinate(int q, int r)
		: q_(q), r_(r), s_(-q - r), id_(0)
	{
	}

	int Coordinate::distance(const Coordinate& other) const
	{
		return hex::distance(q_, r_, s_, other.q_, other.r_, other.s_);
	}

	Coordinate Coordinate::neighbor(int dir) const
	{
		return offset(dir, 1);
	}

	Coordinate Coordinate::offset(int dir, int steps) const
	{
		ASSERT_LOG(dir >= 0 && dir < NUM_DIRECTIONS, "Invalid hex direction: " << dir);
		return Coordinate(q_ + dir_dq[dir] * steps, r_ + dir_dr[dir] * steps);
	}

	std::vector<Coordinate> Coordinate::getNeighbors() const
	{
		std::vector<Coordinate> res;
		res.reserve(NUM_DIRECTIONS);
		for(int dir = 0; dir != NUM_DIRECTIONS; ++dir) {
			res.emplace_back(neighbor(dir));
		}
		return res;
	}

	std::string Coordinate::toString() const
	{
		std::ostringstream s;
		s << q_ << "," << r_ << "," << s_;
		return s.str();
	}

	bool Coordinate::operator<(const Coordinate& other) const
	{
		if(q_ != other.q_) {
			return q_ < other.q_;
		}
		return r_ < other.r_;
	}

	std::ostream& operator<<(std::ostream& os, const Coordinate& c)
	{
		os << "(" << c.toString();
		if(c.getId() != 0) {
			os << " #" << c.getId();
		}
		return os << ")";
	}

	int distance(int q1, int r1, int s1, int q2, int r2, int s2)
	{
		return (abs(q1 - q2) + abs(r1 - r2) + abs(s1 - s2)) / 2;
	}

	int distance(const Coordinate& a, const Coordinate& b)
	{
		return a.distance(b);
	}

	std::vector<Coordinate> ring(const Coordinate& center, int radius, int start_dir)
	{
		std::vector<Coordinate> res;
		if(radius <= 0) {
			res.push_back(center);
			return res;
		}

		res.reserve(NUM_DIRECTIONS * radius);
		Coordinate p = center.offset(start_dir, radius);
		for(int side = 0; side != NUM_DIRECTIONS; ++side) {
			const int dir = (start_dir + 2 + side) % NUM_DIRECTIONS;
			for(int i = 0; i != radius; ++i) {
				res.push_back(p);
				p = p.neighbor(dir);
			}
		}
		return res;
	}
}

UNIT_TEST(hex_coordinate_construction)
{
	for(int q = -4; q <= 4; ++q) {
		for(int r = -4; r <= 4; ++r) {
			hex::Coordinate c(q, r, -q - r);
			CHECK_EQ(c.q() + c.r() + c.s(), 0);
		}
	}

	for(int s = -2; s <= 2; ++s) {
		if(s != -1) {
			CHECK_ASSERTS(hex::Coordinate(1, 0, s), "1,0," << s << " is not a cube coordinate");
		}
	}
}

UNIT_TEST(hex_coordinate_distance)
{
	std::vector<hex::Coordinate> coords;
	for(int q = -3; q <= 3; ++q) {
		for(int r = -3; r <= 3; ++r) {
			coords.emplace_back(q, r);
		}
	}

	for(const auto& a : coords) {
		CHECK_EQ(a.distance(a), 0);
		for(const auto& b : coords) {
			CHECK_EQ(a.distance(b), b.distance(a));
			for(const auto& c : coords) {
				CHECK_LE(a.distance(c), a.distance(b) + b.distance(c));
			}
		}
	}

	CHECK_EQ(hex::distance(hex::Coordinate(-2, 2, 0), hex::Coordinate(2, -1, -1)), 4);
	CHECK_EQ(hex::Coordinate(0, 0).neighbor(hex::NORTH_EAST), hex::Coordinate(1, -1, 0));
	CHECK_EQ(hex::Coordinate(0, 0).neighbor(hex::NORTH_WEST), hex::Coordinate(0, -1, 1));
	CHECK_EQ(hex::Coordinate(1, 2).toString(), "1,2,-3");
}

UNIT_TEST(hex_ring_walk)
{
	const hex::Coordinate center(0, 0);
	CHECK_EQ(hex::ring(center, 0, 0).size(), 1U);

	// Radius one from the upper-right corner visits the neighbours in direction order.
	auto r1 = hex::ring(center, 1, hex::NORTH_EAST);
	CHECK_EQ(r1.size(), 6U);
	for(int dir = 0; dir != hex::NUM_DIRECTIONS; ++dir) {
		CHECK_EQ(r1[dir], center.neighbor(dir));
	}

	for(int radius = 1; radius <= 4; ++radius) {
		auto r = hex::ring(center, radius, hex::SOUTH_WEST);
		CHECK_EQ(r.size(), static_cast<size_t>(6 * radius));
		CHECK_EQ(r.front(), center.offset(hex::SOUTH_WEST, radius));
		for(const auto& c : r) {
			CHECK_EQ(center.distance(c), radius);
		}
	}
}
