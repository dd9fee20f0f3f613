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

#include <map>
#include <set>
#include <vector>

#include <boost/optional.hpp>

#include "board_preset.hpp"
#include "hex_coord.hpp"
#include "hex_fwd.hpp"
#include "unit_id.hpp"

namespace hex
{
	struct Tile
	{
		Tile(const Coordinate& c, TileState s) : coord(c), state(s) {}
		int id() const { return coord.getId(); }
		bool hasUnit() const { return unit.is_initialized(); }

		Coordinate coord;
		TileState state;
		boost::optional<UnitId> unit;
		boost::optional<Team> team;
	};

	// Occupancy of the board. Owns every Tile, the per-team membership and
	// capacity, and the links from main units to their companions.
	// A unit is in a team's set iff exactly one tile of that team holds it.
	class SpatialGrid
	{
	public:
		explicit SpatialGrid(BoardPresetPtr preset);
		SpatialGrid(BoardPresetPtr preset, int team_size);

		const BoardPreset& getPreset() const { return *preset_; }

		const Tile& getTile(const Coordinate& c) const;
		const Tile& getTileById(int id) const;
		// nullptr for coordinates off the board.
		const Tile* findTile(const Coordinate& c) const;
		const Tile* findTileById(int id) const;
		const std::vector<Tile>& getAllTiles() const { return tiles_; }
		std::vector<const Tile*> getTilesWithUnits() const;
		int tileIndex(int id) const;

		// Returns false without mutating for an invalid state value. A tile
		// painted away from its occupied state loses its occupant.
		bool setOccupancyState(const Coordinate& c, int state);
		bool setOccupancyState(int tile_id, int state);

		bool placeUnit(int tile_id, const UnitId& unit, Team team, bool is_new_placement=true);
		bool removeUnit(int tile_id);
		void clearUnits();

		boost::optional<int> findUnitTile(const UnitId& unit, Team team) const;
		const std::set<UnitId>& getTeamUnits(Team team) const;
		bool hasUnit(const UnitId& unit, Team team) const;
		int unitCount(Team team) const;

		int getMaxTeamSize(Team team) const;
		// Capacity the grid was built with.
		int getDefaultTeamSize() const { return default_team_size_; }
		bool setMaxTeamSize(Team team, int size);
		int availableSlots(Team team) const;
		bool canPlaceUnit(const UnitId& unit, Team team) const;
		bool canHostTeam(int tile_id, Team team) const;
		static boost::optional<Team> teamForTileState(TileState state);

		void addCompanionLink(const UnitId& main, Team team, const UnitId& companion);
		void clearCompanionLinks(const UnitId& main, Team team);
		const std::set<UnitId>& getCompanions(const UnitId& main, Team team) const;

		std::size_t fingerprint() const;
		int revision() const { return revision_; }
	private:
		Tile& mutableTile(int tile_id);
		std::set<UnitId>& members(Team team) { return team_units_[static_cast<int>(team)]; }
		void detachOccupant(Tile& t);

		BoardPresetPtr preset_;
		std::vector<Tile> tiles_;
		std::set<UnitId> team_units_[2];
		int max_team_size_[2];
		int default_team_size_;
		std::map<std::pair<UnitId, Team>, std::set<UnitId>> companions_;
		int revision_;
	};
}
