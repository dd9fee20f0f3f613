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

#include <memory>
#include <ostream>
#include <string>

namespace hex
{
	// Neighbour directions, clockwise starting at the upper right.
	enum direction { NORTH_EAST, EAST, SOUTH_EAST, SOUTH_WEST, WEST, NORTH_WEST };
	const int NUM_DIRECTIONS = 6;

	enum class Team { ALLY, ENEMY };

	// Numeric values are part of the board preset and sharing formats.
	enum class TileState {
		DEFAULT = 0,
		AVAILABLE_ALLY = 1,
		AVAILABLE_ENEMY = 2,
		OCCUPIED_ALLY = 3,
		OCCUPIED_ENEMY = 4,
		BLOCKED = 5,
		BLOCKED_BREAKABLE = 6,
	};

	inline Team opposing_team(Team t) { return t == Team::ALLY ? Team::ENEMY : Team::ALLY; }
	inline TileState available_state(Team t) { return t == Team::ALLY ? TileState::AVAILABLE_ALLY : TileState::AVAILABLE_ENEMY; }
	inline TileState occupied_state(Team t) { return t == Team::ALLY ? TileState::OCCUPIED_ALLY : TileState::OCCUPIED_ENEMY; }
	bool is_valid_tile_state(int value);
	bool is_occupied_state(TileState s);
	bool is_blocked_state(TileState s);

	const char* to_string(Team t);
	const char* to_string(TileState s);
	std::ostream& operator<<(std::ostream& os, Team t);
	std::ostream& operator<<(std::ostream& os, TileState s);

	class Coordinate;
	class UnitId;
	struct Tile;
	class BoardPreset;
	typedef std::shared_ptr<const BoardPreset> BoardPresetPtr;
	class SpatialGrid;
	class PathfindingCache;
	typedef std::shared_ptr<PathfindingCache> PathfindingCachePtr;
	class PathfindingEngine;
	class SkillRegistry;
	typedef std::shared_ptr<const SkillRegistry> SkillRegistryPtr;
	class SkillManager;
	class TransactionCoordinator;
}
