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

#include <algorithm>

#include <boost/functional/hash.hpp>

#include "asserts.hpp"
#include "preferences.hpp"
#include "spatial_grid.hpp"
#include "unit_test.hpp"

namespace hex
{
	namespace
	{
		PREF_INT(default_team_size, 5, "Number of units each team may place on a new board");

		const std::set<UnitId>& empty_unit_set()
		{
			static const std::set<UnitId> res;
			return res;
		}
	}

	SpatialGrid::SpatialGrid(BoardPresetPtr preset)
		: SpatialGrid(preset, g_default_team_size)
	{
	}

	SpatialGrid::SpatialGrid(BoardPresetPtr preset, int team_size)
		: preset_(preset),
		  default_team_size_(team_size),
		  revision_(0)
	{
		ASSERT_LOG(preset_ != nullptr, "SpatialGrid needs a board preset");
		ASSERT_LOG(team_size > 0 && team_size <= preset_->tileCount(), "Invalid team size " << team_size << " for a board of " << preset_->tileCount() << " tiles");
		tiles_.reserve(preset_->tileCount());
		for(const auto& c : preset_->getCoordinates()) {
			tiles_.emplace_back(c, preset_->initialState(c.getId()));
		}
		max_team_size_[0] = max_team_size_[1] = team_size;
	}

	int SpatialGrid::tileIndex(int id) const
	{
		return preset_->indexOf(id);
	}

	const Tile* SpatialGrid::findTileById(int id) const
	{
		const int index = preset_->indexOf(id);
		return index < 0 ? nullptr : &tiles_[index];
	}

	const Tile* SpatialGrid::findTile(const Coordinate& c) const
	{
		auto found = preset_->findCoordinate(c);
		return found ? findTileById(found->getId()) : nullptr;
	}

	const Tile& SpatialGrid::getTileById(int id) const
	{
		const Tile* t = findTileById(id);
		ASSERT_LOG(t != nullptr, "Tile with id " << id << " not found");
		return *t;
	}

	const Tile& SpatialGrid::getTile(const Coordinate& c) const
	{
		const Tile* t = findTile(c);
		ASSERT_LOG(t != nullptr, "Tile not found at " << c);
		return *t;
	}

	Tile& SpatialGrid::mutableTile(int tile_id)
	{
		const int index = preset_->indexOf(tile_id);
		ASSERT_LOG(index >= 0, "Tile with id " << tile_id << " not found");
		return tiles_[index];
	}

	std::vector<const Tile*> SpatialGrid::getTilesWithUnits() const
	{
		std::vector<const Tile*> res;
		for(const Tile& t : tiles_) {
			if(t.hasUnit()) {
				res.push_back(&t);
			}
		}
		return res;
	}

	void SpatialGrid::detachOccupant(Tile& t)
	{
		if(t.unit && t.team) {
			members(*t.team).erase(*t.unit);
		}
		t.unit = boost::none;
		t.team = boost::none;
	}

	bool SpatialGrid::setOccupancyState(const Coordinate& c, int state)
	{
		return setOccupancyState(getTile(c).id(), state);
	}

	bool SpatialGrid::setOccupancyState(int tile_id, int state)
	{
		Tile& t = mutableTile(tile_id);
		if(!is_valid_tile_state(state)) {
			LOG_WARN("Rejected tile state " << state << " for tile " << tile_id);
			return false;
		}

		const TileState new_state = static_cast<TileState>(state);
		if(t.hasUnit() && new_state == occupied_state(*t.team)) {
			return true;
		}

		if(is_occupied_state(new_state)) {
			LOG_WARN("Tile " << tile_id << " cannot be painted " << new_state << " without a unit");
			return false;
		}

		detachOccupant(t);
		t.state = new_state;
		++revision_;
		return true;
	}

	bool SpatialGrid::canHostTeam(int tile_id, Team team) const
	{
		const Tile* t = findTileById(tile_id);
		return t != nullptr && (t->state == available_state(team) || t->state == occupied_state(team));
	}

	bool SpatialGrid::canPlaceUnit(const UnitId& unit, Team team) const
	{
		return !hasUnit(unit, team) && availableSlots(team) > 0;
	}

	boost::optional<Team> SpatialGrid::teamForTileState(TileState state)
	{
		switch(state) {
		case TileState::AVAILABLE_ALLY:
		case TileState::OCCUPIED_ALLY:
			return Team::ALLY;
		case TileState::AVAILABLE_ENEMY:
		case TileState::OCCUPIED_ENEMY:
			return Team::ENEMY;
		default:
			return boost::none;
		}
	}

	bool SpatialGrid::placeUnit(int tile_id, const UnitId& unit, Team team, bool is_new_placement)
	{
		if(!canHostTeam(tile_id, team)) {
			return false;
		}

		if(hasUnit(unit, team)) {
			return false;
		}

		if(is_new_placement && availableSlots(team) <= 0) {
			return false;
		}

		Tile& t = mutableTile(tile_id);
		detachOccupant(t);
		t.unit = unit;
		t.team = team;
		t.state = occupied_state(team);
		members(team).insert(unit);
		++revision_;
		return true;
	}

	bool SpatialGrid::removeUnit(int tile_id)
	{
		const Tile* found = findTileById(tile_id);
		if(found == nullptr || !found->hasUnit()) {
			return false;
		}

		Tile& t = mutableTile(tile_id);
		const Team team = *t.team;
		detachOccupant(t);
		t.state = available_state(team);
		++revision_;
		return true;
	}

	void SpatialGrid::clearUnits()
	{
		for(Tile& t : tiles_) {
			if(t.hasUnit()) {
				const Team team = *t.team;
				detachOccupant(t);
				t.state = available_state(team);
			}
		}
		team_units_[0].clear();
		team_units_[1].clear();
		++revision_;
	}

	boost::optional<int> SpatialGrid::findUnitTile(const UnitId& unit, Team team) const
	{
		if(!hasUnit(unit, team)) {
			return boost::none;
		}

		for(const Tile& t : tiles_) {
			if(t.unit && *t.unit == unit && t.team && *t.team == team) {
				return t.id();
			}
		}
		return boost::none;
	}

	const std::set<UnitId>& SpatialGrid::getTeamUnits(Team team) const
	{
		return team_units_[static_cast<int>(team)];
	}

	bool SpatialGrid::hasUnit(const UnitId& unit, Team team) const
	{
		return getTeamUnits(team).count(unit) != 0;
	}

	int SpatialGrid::unitCount(Team team) const
	{
		return static_cast<int>(getTeamUnits(team).size());
	}

	int SpatialGrid::getMaxTeamSize(Team team) const
	{
		return max_team_size_[static_cast<int>(team)];
	}

	bool SpatialGrid::setMaxTeamSize(Team team, int size)
	{
		if(size <= 0 || size > static_cast<int>(tiles_.size()) || size < unitCount(team)) {
			LOG_DEBUG("Rejected team size " << size << " for " << team << " (" << unitCount(team) << " units placed)");
			return false;
		}

		max_team_size_[static_cast<int>(team)] = size;
		++revision_;
		return true;
	}

	int SpatialGrid::availableSlots(Team team) const
	{
		return getMaxTeamSize(team) - unitCount(team);
	}

	void SpatialGrid::addCompanionLink(const UnitId& main, Team team, const UnitId& companion)
	{
		companions_[std::make_pair(main, team)].insert(companion);
		++revision_;
	}

	void SpatialGrid::clearCompanionLinks(const UnitId& main, Team team)
	{
		if(companions_.erase(std::make_pair(main, team)) != 0) {
			++revision_;
		}
	}

	const std::set<UnitId>& SpatialGrid::getCompanions(const UnitId& main, Team team) const
	{
		auto it = companions_.find(std::make_pair(main, team));
		return it == companions_.end() ? empty_unit_set() : it->second;
	}

	std::size_t SpatialGrid::fingerprint() const
	{
		std::size_t seed = 0;
		for(const Tile& t : tiles_) {
			boost::hash_combine(seed, t.id());
			boost::hash_combine(seed, static_cast<int>(t.state));
			boost::hash_combine(seed, t.unit ? hash_value(*t.unit) : 0);
			boost::hash_combine(seed, t.team ? static_cast<int>(*t.team) : -1);
		}
		boost::hash_combine(seed, max_team_size_[0]);
		boost::hash_combine(seed, max_team_size_[1]);
		return seed;
	}
}

namespace
{
	hex::SpatialGrid make_test_grid(int team_size=5)
	{
		return hex::SpatialGrid(hex::BoardPreset::builtin("full", 1), team_size);
	}
}

UNIT_TEST(spatial_grid_place_and_remove_restore_state)
{
	using namespace hex;
	SpatialGrid grid = make_test_grid();
	for(const Tile& t : grid.getAllTiles()) {
		auto team = SpatialGrid::teamForTileState(t.state);
		if(!team) {
			continue;
		}

		const TileState before = t.state;
		const std::size_t fp = grid.fingerprint();
		CHECK(grid.placeUnit(t.id(), UnitId(7), *team), "placing on " << t.id());
		CHECK_EQ(grid.getTileById(t.id()).state, occupied_state(*team));
		CHECK(grid.hasUnit(UnitId(7), *team), "membership after place");
		CHECK_EQ(*grid.findUnitTile(UnitId(7), *team), t.id());
		CHECK_NE(grid.fingerprint(), fp);

		CHECK(grid.removeUnit(t.id()), "removing from " << t.id());
		CHECK_EQ(grid.getTileById(t.id()).state, before);
		CHECK(!grid.hasUnit(UnitId(7), *team), "membership after remove");
		CHECK(!grid.getTileById(t.id()).hasUnit(), "occupant after remove");
		CHECK_EQ(grid.fingerprint(), fp);
	}
	CHECK(!grid.removeUnit(1), "removing from an empty tile");
}

UNIT_TEST(spatial_grid_placement_rules)
{
	using namespace hex;
	SpatialGrid grid = make_test_grid(2);
	CHECK(!grid.placeUnit(45, UnitId(1), Team::ALLY), "ally on an enemy tile");
	CHECK(!grid.placeUnit(11, UnitId(1), Team::ALLY), "ally on a default tile");
	CHECK(!grid.placeUnit(999, UnitId(1), Team::ALLY), "unknown tile");

	CHECK(grid.placeUnit(1, UnitId(1), Team::ALLY), "first ally");
	CHECK(!grid.placeUnit(2, UnitId(1), Team::ALLY), "duplicate ally");
	CHECK(grid.placeUnit(45, UnitId(1), Team::ENEMY), "same unit on the other team");
	CHECK(grid.placeUnit(2, UnitId(2), Team::ALLY), "second ally");
	CHECK(!grid.placeUnit(3, UnitId(3), Team::ALLY), "team at capacity");
	CHECK(grid.placeUnit(3, UnitId(3), Team::ALLY, false), "restoring placement skips the capacity check");
	CHECK(grid.removeUnit(3), "remove restored unit");

	CHECK(grid.removeUnit(2), "make room");
	CHECK(grid.placeUnit(1, UnitId(4), Team::ALLY), "replace occupant");
	CHECK(!grid.hasUnit(UnitId(1), Team::ALLY), "displaced unit leaves the team");
	CHECK_EQ(grid.unitCount(Team::ALLY), 1);
	CHECK_EQ(*grid.getTileById(1).unit, UnitId(4));

	CHECK_EQ(grid.availableSlots(Team::ALLY), 1);
	CHECK(grid.canPlaceUnit(UnitId(9), Team::ALLY), "free slot");
	CHECK(!grid.canPlaceUnit(UnitId(4), Team::ALLY), "already placed");

	grid.clearUnits();
	CHECK_EQ(grid.unitCount(Team::ALLY), 0);
	CHECK_EQ(grid.unitCount(Team::ENEMY), 0);
	CHECK_EQ(grid.getTileById(45).state, TileState::AVAILABLE_ENEMY);
	CHECK(grid.getTilesWithUnits().empty(), "board is empty");
}

UNIT_TEST(spatial_grid_team_capacity)
{
	using namespace hex;
	SpatialGrid grid = make_test_grid(3);
	CHECK(grid.placeUnit(1, UnitId(1), Team::ALLY), "place");
	CHECK(grid.placeUnit(2, UnitId(2), Team::ALLY), "place");
	const int revision = grid.revision();
	CHECK(!grid.setMaxTeamSize(Team::ALLY, 1), "below the unit count");
	CHECK(!grid.setMaxTeamSize(Team::ALLY, 0), "zero");
	CHECK(!grid.setMaxTeamSize(Team::ALLY, 46), "more than the tile count");
	CHECK_EQ(grid.revision(), revision);
	CHECK_EQ(grid.getMaxTeamSize(Team::ALLY), 3);
	CHECK(grid.setMaxTeamSize(Team::ALLY, 2), "equal to the unit count");
	CHECK_EQ(grid.availableSlots(Team::ALLY), 0);
	CHECK_EQ(grid.getDefaultTeamSize(), 3);
}

UNIT_TEST(spatial_grid_occupancy_painting)
{
	using namespace hex;
	SpatialGrid grid = make_test_grid();
	CHECK(!grid.setOccupancyState(11, 7), "out of range");
	CHECK(!grid.setOccupancyState(11, -1), "negative");
	CHECK_EQ(grid.getTileById(11).state, TileState::DEFAULT);
	CHECK(grid.setOccupancyState(11, static_cast<int>(TileState::BLOCKED)), "paint blocked");
	CHECK_EQ(grid.getTileById(11).state, TileState::BLOCKED);
	CHECK(grid.setOccupancyState(grid.getTileById(11).coord, static_cast<int>(TileState::AVAILABLE_ENEMY)), "paint by coordinate");
	CHECK_EQ(grid.getTileById(11).state, TileState::AVAILABLE_ENEMY);
	CHECK(!grid.setOccupancyState(12, static_cast<int>(TileState::OCCUPIED_ALLY)), "occupied without a unit");

	CHECK(grid.placeUnit(1, UnitId(5), Team::ALLY), "place");
	CHECK(grid.setOccupancyState(1, static_cast<int>(TileState::BLOCKED)), "paint over a unit");
	CHECK(!grid.hasUnit(UnitId(5), Team::ALLY), "painted occupant leaves the team");
	CHECK(!grid.getTileById(1).hasUnit(), "painted tile is empty");

	CHECK_ASSERTS(grid.getTile(Coordinate(10, -10)), "tile off the board");
	CHECK(grid.findTile(Coordinate(10, -10)) == nullptr, "findTile off the board");
}

UNIT_TEST(spatial_grid_companion_links)
{
	using namespace hex;
	SpatialGrid grid = make_test_grid();
	grid.addCompanionLink(UnitId(50), Team::ALLY, UnitId(50, 1));
	CHECK_EQ(grid.getCompanions(UnitId(50), Team::ALLY).size(), 1U);
	CHECK(grid.getCompanions(UnitId(50), Team::ENEMY).empty(), "links are per team");
	grid.clearCompanionLinks(UnitId(50), Team::ALLY);
	CHECK(grid.getCompanions(UnitId(50), Team::ALLY).empty(), "links cleared");
}
