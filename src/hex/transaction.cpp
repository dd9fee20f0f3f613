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

#include "asserts.hpp"
#include "hex_pathfinding.hpp"
#include "skill_engine.hpp"
#include "spatial_grid.hpp"
#include "transaction.hpp"
#include "unit_test.hpp"

namespace hex
{
	TransactionCoordinator::TransactionCoordinator(SpatialGrid& grid, SkillManager& skills, PathfindingEngine& engine)
		: grid_(grid),
		  skills_(skills),
		  engine_(engine),
		  depth_(0),
		  dirty_(false)
	{
	}

	bool TransactionCoordinator::executeTransaction(const std::vector<transaction_step>& steps)
	{
		++depth_;

		std::vector<const transaction_step*> applied;
		bool result = true;
		for(const transaction_step& step : steps) {
			dirty_ = true;
			if(!step.apply()) {
				result = false;
				break;
			}
			applied.push_back(&step);
		}

		if(!result) {
			LOG_DEBUG("Transaction failed after " << applied.size() << " of " << steps.size() << " steps, rolling back");
			for(auto it = applied.rbegin(); it != applied.rend(); ++it) {
				if((*it)->rollback) {
					(*it)->rollback();
				}
			}
		}

		if(--depth_ == 0) {
			if(dirty_) {
				engine_.invalidate();
				dirty_ = false;
			}
			skills_.updateActiveSkills(grid_);
		}
		return result;
	}

	bool TransactionCoordinator::place(int tile_id, const UnitId& unit, Team team)
	{
		const Tile* t = grid_.findTileById(tile_id);
		if(unit.isCompanion() || t == nullptr || t->hasUnit()) {
			return false;
		}

		bool placed = false;
		return executeTransaction({
			transaction_step([=, &placed]() {
				placed = grid_.placeUnit(tile_id, unit, team);
				return placed;
			}, [=, &placed]() {
				if(placed) {
					grid_.removeUnit(tile_id);
				}
			}),
			transaction_step([=]() {
				return skills_.activate(grid_, tile_id, team, unit);
			}),
		});
	}

	bool TransactionCoordinator::removeUnitAndSkill(int tile_id)
	{
		const Tile& t = grid_.getTileById(tile_id);
		const UnitId unit = *t.unit;
		const Team team = *t.team;
		return executeTransaction({
			transaction_step([=]() {
				skills_.deactivate(grid_, unit, team);
				if(grid_.getTileById(tile_id).hasUnit()) {
					return grid_.removeUnit(tile_id);
				}
				return true;
			}),
		});
	}

	bool TransactionCoordinator::remove(int tile_id)
	{
		const Tile* t = grid_.findTileById(tile_id);
		if(t == nullptr) {
			return false;
		}

		if(!t->hasUnit()) {
			return true;
		}

		if(t->unit->isCompanion()) {
			const auto owner_tile = grid_.findUnitTile(t->unit->getOwner(), *t->team);
			if(owner_tile) {
				return removeUnitAndSkill(*owner_tile);
			}

			return executeTransaction({
				transaction_step([=]() { return grid_.removeUnit(tile_id); }),
			});
		}

		return removeUnitAndSkill(tile_id);
	}

	std::vector<TransactionCoordinator::companion_position> TransactionCoordinator::companionPositions(const UnitId& main, Team team) const
	{
		std::vector<companion_position> res;
		for(const UnitId& companion : grid_.getCompanions(main, team)) {
			const auto tile = grid_.findUnitTile(companion, team);
			if(tile) {
				res.push_back(companion_position(companion, *tile));
			}
		}
		return res;
	}

	void TransactionCoordinator::reactivate(int tile_id, const UnitId& unit, Team team, const std::vector<companion_position>& companions)
	{
		if(!skills_.activate(grid_, tile_id, team, unit)) {
			LOG_WARN("Could not reactivate the skill of unit " << unit << " (" << team << ") on tile " << tile_id);
			return;
		}

		// Fresh companions land on the lowest free tiles; put them back
		// where they stood.
		std::vector<companion_position> displaced;
		for(const companion_position& pos : companions) {
			const auto current = grid_.findUnitTile(pos.unit, team);
			if(current && *current != pos.tile_id) {
				grid_.removeUnit(*current);
				displaced.push_back(pos);
			}
		}
		for(const companion_position& pos : displaced) {
			if(!grid_.placeUnit(pos.tile_id, pos.unit, team, false)) {
				LOG_WARN("Could not restore companion " << pos.unit << " to tile " << pos.tile_id);
			}
		}
	}

	bool TransactionCoordinator::move(int from_tile, int to_tile, const UnitId& unit)
	{
		if(from_tile == to_tile) {
			return false;
		}

		const Tile* from = grid_.findTileById(from_tile);
		const Tile* to = grid_.findTileById(to_tile);
		if(from == nullptr || to == nullptr || !from->hasUnit() || *from->unit != unit || to->hasUnit()) {
			return false;
		}

		const Team from_team = *from->team;
		const auto to_team = SpatialGrid::teamForTileState(to->state);
		if(!to_team) {
			return false;
		}

		const bool changing_teams = from_team != *to_team;
		if(unit.isCompanion() && changing_teams) {
			return false;
		}

		if(!changing_teams || skills_.getDescriptor(unit) == nullptr) {
			return executeTransaction({
				transaction_step([=]() { return grid_.removeUnit(from_tile); },
					[=]() { grid_.placeUnit(from_tile, unit, from_team, false); }),
				transaction_step([=]() { return grid_.placeUnit(to_tile, unit, *to_team, changing_teams); },
					[=]() { grid_.removeUnit(to_tile); }),
			});
		}

		// A skill that is not active on the old team is still activated on
		// the new one.
		const bool was_active = skills_.isActive(unit, from_team);
		const std::vector<companion_position> companions = companionPositions(unit, from_team);
		return executeTransaction({
			transaction_step([=]() {
				skills_.deactivate(grid_, unit, from_team);
				return true;
			}, [=]() {
				if(was_active) {
					reactivate(from_tile, unit, from_team, companions);
				}
			}),
			transaction_step([=]() { return grid_.removeUnit(from_tile); },
				[=]() { grid_.placeUnit(from_tile, unit, from_team, false); }),
			transaction_step([=]() { return grid_.placeUnit(to_tile, unit, *to_team); },
				[=]() { grid_.removeUnit(to_tile); }),
			transaction_step([=]() { return skills_.activate(grid_, to_tile, *to_team, unit); }),
		});
	}

	std::vector<transaction_step> TransactionCoordinator::plainSwapSteps(int tile_a, int tile_b, const UnitId& unit_a, const UnitId& unit_b, Team team_a, Team team_b)
	{
		return {
			transaction_step([=]() { return grid_.removeUnit(tile_a); },
				[=]() { grid_.placeUnit(tile_a, unit_a, team_a, false); }),
			transaction_step([=]() { return grid_.removeUnit(tile_b); },
				[=]() { grid_.placeUnit(tile_b, unit_b, team_b, false); }),
			transaction_step([=]() { return grid_.placeUnit(tile_a, unit_b, team_a, false); },
				[=]() { grid_.removeUnit(tile_a); }),
			transaction_step([=]() { return grid_.placeUnit(tile_b, unit_a, team_b, false); },
				[=]() { grid_.removeUnit(tile_b); }),
		};
	}

	bool TransactionCoordinator::crossTeamSwap(int tile_a, int tile_b, const UnitId& unit_a, const UnitId& unit_b, Team team_a, Team team_b)
	{
		if(grid_.hasUnit(unit_a, team_b) || grid_.hasUnit(unit_b, team_a)) {
			return false;
		}

		const bool a_active = skills_.isActive(unit_a, team_a);
		const bool b_active = skills_.isActive(unit_b, team_b);
		const std::vector<companion_position> companions_a = companionPositions(unit_a, team_a);
		const std::vector<companion_position> companions_b = companionPositions(unit_b, team_b);

		return executeTransaction({
			transaction_step([=]() {
				skills_.deactivate(grid_, unit_a, team_a);
				skills_.deactivate(grid_, unit_b, team_b);
				return true;
			}, [=]() {
				if(a_active) {
					reactivate(tile_a, unit_a, team_a, companions_a);
				}
				if(b_active) {
					reactivate(tile_b, unit_b, team_b, companions_b);
				}
			}),
			transaction_step([=]() {
				return executeTransaction(plainSwapSteps(tile_a, tile_b, unit_a, unit_b, team_a, team_b));
			}, [=]() {
				executeTransaction(plainSwapSteps(tile_a, tile_b, unit_b, unit_a, team_a, team_b));
			}),
			transaction_step([=]() { return skills_.activate(grid_, tile_b, team_b, unit_a); },
				[=]() { skills_.deactivate(grid_, unit_a, team_b); }),
			transaction_step([=]() { return skills_.activate(grid_, tile_a, team_a, unit_b); },
				[=]() { skills_.deactivate(grid_, unit_b, team_a); }),
		});
	}

	bool TransactionCoordinator::swap(int tile_a, int tile_b)
	{
		if(tile_a == tile_b) {
			return false;
		}

		const Tile* a = grid_.findTileById(tile_a);
		const Tile* b = grid_.findTileById(tile_b);
		if(a == nullptr || b == nullptr || !a->hasUnit() || !b->hasUnit()) {
			return false;
		}

		const UnitId unit_a = *a->unit;
		const UnitId unit_b = *b->unit;
		const Team team_a = *a->team;
		const Team team_b = *b->team;
		if(team_a != team_b && (unit_a.isCompanion() || unit_b.isCompanion())) {
			return false;
		}

		const bool skilled = skills_.getDescriptor(unit_a) != nullptr || skills_.getDescriptor(unit_b) != nullptr;
		if(team_a != team_b && skilled) {
			return crossTeamSwap(tile_a, tile_b, unit_a, unit_b, team_a, team_b);
		}
		return executeTransaction(plainSwapSteps(tile_a, tile_b, unit_a, unit_b, team_a, team_b));
	}

	bool TransactionCoordinator::clearAll()
	{
		return executeTransaction({
			transaction_step([=]() {
				skills_.deactivateAll(grid_);
				grid_.clearUnits();
				for(Team team : { Team::ALLY, Team::ENEMY }) {
					if(!grid_.setMaxTeamSize(team, grid_.getDefaultTeamSize())) {
						LOG_WARN("Could not restore the " << team << " capacity to " << grid_.getDefaultTeamSize());
					}
				}
				return true;
			}),
		});
	}

	bool TransactionCoordinator::autoPlace(const UnitId& unit, Team team)
	{
		if(unit.isCompanion() || !grid_.canPlaceUnit(unit, team)) {
			return false;
		}

		boost::optional<int> best;
		for(const Tile& t : grid_.getAllTiles()) {
			if(t.state == available_state(team) && !t.hasUnit() && (!best || t.id() < *best)) {
				best = t.id();
			}
		}

		if(!best) {
			LOG_DEBUG("No free " << team << " tile for unit " << unit);
			return false;
		}
		return place(*best, unit, team);
	}

	bool TransactionCoordinator::setOccupancyState(int tile_id, int state)
	{
		const Tile* t = grid_.findTileById(tile_id);
		if(t == nullptr || !is_valid_tile_state(state)) {
			return false;
		}

		const TileState new_state = static_cast<TileState>(state);
		if(t->hasUnit() && new_state == occupied_state(*t->team)) {
			return true;
		}
		if(is_occupied_state(new_state)) {
			return false;
		}

		return executeTransaction({
			transaction_step([=]() { return remove(tile_id); }),
			transaction_step([=]() { return grid_.setOccupancyState(tile_id, state); }),
		});
	}

	bool TransactionCoordinator::setMaxTeamSize(Team team, int size)
	{
		return executeTransaction({
			transaction_step([=]() { return grid_.setMaxTeamSize(team, size); }),
		});
	}
}

namespace
{
	using hex::Team;
	using hex::UnitId;

	struct transaction_fixture
	{
		explicit transaction_fixture(int arena=1, int team_size=5)
			: grid(hex::BoardPreset::builtin("full", arena), team_size),
			  cache(std::make_shared<hex::PathfindingCache>()),
			  engine(cache),
			  resolver(engine),
			  skills(hex::SkillRegistry::builtin(), resolver),
			  coordinator(grid, skills, engine)
		{}

		hex::SpatialGrid grid;
		hex::PathfindingCachePtr cache;
		hex::PathfindingEngine engine;
		hex::TargetResolver resolver;
		hex::SkillManager skills;
		hex::TransactionCoordinator coordinator;
	};
}

UNIT_TEST(transaction_swap_is_its_own_inverse)
{
	transaction_fixture f;
	CHECK(f.coordinator.place(1, UnitId(50), Team::ALLY), "phraesto");
	CHECK(f.coordinator.place(3, UnitId(7), Team::ALLY), "plain ally");
	CHECK(f.coordinator.place(45, UnitId(8), Team::ENEMY), "plain enemy");
	const std::size_t before = f.grid.fingerprint();

	CHECK(f.coordinator.swap(1, 3), "same-team swap");
	CHECK_EQ(*f.grid.getTileById(3).unit, UnitId(50));
	CHECK_EQ(*f.grid.getTileById(1).unit, UnitId(7));
	CHECK_EQ(f.skills.getActiveSkills().begin()->second.tile_id, 3);
	CHECK(f.coordinator.swap(1, 3), "swap back");
	CHECK_EQ(f.grid.fingerprint(), before);

	CHECK(f.coordinator.swap(3, 45), "cross-team swap without skills");
	CHECK(f.grid.hasUnit(UnitId(8), Team::ALLY), "enemy joined the allies");
	CHECK(f.coordinator.swap(3, 45), "swap back");
	CHECK_EQ(f.grid.fingerprint(), before);

	CHECK(!f.coordinator.swap(2, 45), "companions stay on their team");
	CHECK(!f.coordinator.swap(1, 1), "same tile");
	CHECK(!f.coordinator.swap(1, 4), "empty tile");
	CHECK_EQ(f.grid.fingerprint(), before);
}

UNIT_TEST(transaction_failed_companion_spawn_rolls_back)
{
	transaction_fixture f(7, 6);
	for(int tile : { 1, 2, 3, 4, 6 }) {
		CHECK(f.coordinator.place(tile, UnitId(tile), Team::ALLY), "fill " << tile);
	}
	const std::size_t before = f.grid.fingerprint();

	CHECK(!f.coordinator.place(8, UnitId(89), Team::ALLY), "zanie needs two free tiles");
	CHECK_EQ(f.grid.fingerprint(), before);
	CHECK_EQ(f.grid.unitCount(Team::ALLY), 5);
	CHECK_EQ(f.grid.getTileById(8).state, hex::TileState::AVAILABLE_ALLY);
	CHECK(f.skills.getActiveSkills().empty(), "no skill left active");

	CHECK(!f.coordinator.place(9, UnitId(2), Team::ALLY), "not an ally tile");
	CHECK(!f.coordinator.place(1, UnitId(12), Team::ALLY), "occupied tile");
	CHECK(!f.coordinator.place(8, UnitId(50, 1), Team::ALLY), "companions are spawned, not placed");
}

UNIT_TEST(transaction_remove_cascades_companions)
{
	transaction_fixture f;
	CHECK(f.coordinator.place(1, UnitId(89), Team::ALLY), "zanie");
	CHECK_EQ(f.grid.unitCount(Team::ALLY), 3);
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 7);

	// Removing a companion takes its owner with it.
	CHECK(f.coordinator.remove(2), "remove companion");
	for(const UnitId& u : { UnitId(89), UnitId(89, 1), UnitId(89, 2) }) {
		CHECK(!f.grid.hasUnit(u, Team::ALLY), u << " is gone");
	}
	CHECK_EQ(f.grid.unitCount(Team::ALLY), 0);
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 5);
	CHECK(f.skills.getActiveSkills().empty(), "skill deactivated");

	CHECK(f.coordinator.remove(1), "removing an empty tile");
	CHECK(!f.coordinator.remove(999), "unknown tile");
}

UNIT_TEST(transaction_remove_owner_restores_capacity)
{
	transaction_fixture f;
	CHECK(f.coordinator.place(9, UnitId(7), Team::ALLY), "plain ally");
	const int capacity = f.grid.getMaxTeamSize(Team::ALLY);
	CHECK(f.coordinator.place(1, UnitId(89), Team::ALLY), "zanie");
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), capacity + 2);
	CHECK_EQ(f.grid.getCompanions(UnitId(89), Team::ALLY).size(), 2U);

	CHECK(f.coordinator.remove(1), "remove the owner");
	for(const UnitId& u : { UnitId(89), UnitId(89, 1), UnitId(89, 2) }) {
		CHECK(!f.grid.hasUnit(u, Team::ALLY), u << " is gone");
	}
	CHECK(f.grid.getCompanions(UnitId(89), Team::ALLY).empty(), "links dropped");
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), capacity);
	CHECK_EQ(f.grid.unitCount(Team::ALLY), 1);
	CHECK(f.grid.hasUnit(UnitId(7), Team::ALLY), "unrelated unit stays");
}

UNIT_TEST(transaction_cross_team_move_activates_dormant_skill)
{
	transaction_fixture f;
	// Vala reaches the board without going through the coordinator, so her
	// skill never ran.
	CHECK(f.grid.placeUnit(1, UnitId(46), Team::ALLY), "vala");
	CHECK(f.coordinator.place(5, UnitId(7), Team::ALLY), "plain ally");
	CHECK(!f.skills.isActive(UnitId(46), Team::ALLY), "dormant");

	CHECK(f.coordinator.move(1, 30, UnitId(46)), "cross-team move");
	CHECK(f.grid.hasUnit(UnitId(46), Team::ENEMY), "vala changed team");
	CHECK(f.skills.isActive(UnitId(46), Team::ENEMY), "skill active on the new team");
	auto target = f.skills.getTarget(UnitId(46), Team::ENEMY);
	CHECK(target, "vala targets the remaining ally");
	CHECK_EQ(target->target_tile_id, 5);
}

UNIT_TEST(transaction_cross_team_move)
{
	transaction_fixture f;
	CHECK(f.coordinator.place(1, UnitId(50), Team::ALLY), "phraesto");
	CHECK(f.coordinator.move(2, 5, UnitId(50, 1)), "companion moves within its team");
	CHECK(!f.coordinator.move(5, 30, UnitId(50, 1)), "companions cannot change team");
	CHECK(!f.coordinator.move(1, 5, UnitId(50)), "destination occupied");
	CHECK(!f.coordinator.move(1, 2, UnitId(7)), "wrong unit");

	// Fill the enemy team so the move cannot complete.
	for(int tile : { 30, 33, 34, 36, 37 }) {
		CHECK(f.coordinator.place(tile, UnitId(tile), Team::ENEMY), "enemy " << tile);
	}
	const std::size_t before = f.grid.fingerprint();
	CHECK(!f.coordinator.move(1, 38, UnitId(50)), "enemy team is full");
	CHECK_EQ(f.grid.fingerprint(), before);
	CHECK_EQ(*f.grid.findUnitTile(UnitId(50, 1), Team::ALLY), 5);
	CHECK(f.skills.isActive(UnitId(50), Team::ALLY), "skill restored");

	CHECK(f.coordinator.remove(37), "make room");
	CHECK(f.coordinator.move(1, 38, UnitId(50)), "cross-team move");
	CHECK(f.grid.hasUnit(UnitId(50), Team::ENEMY), "joined the enemy");
	CHECK_EQ(f.grid.unitCount(Team::ALLY), 0);
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 5);
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ENEMY), 6);
	CHECK_EQ(*f.grid.findUnitTile(UnitId(50, 1), Team::ENEMY), 37);
	CHECK(f.skills.isActive(UnitId(50), Team::ENEMY), "active on the new team");
}

UNIT_TEST(transaction_cross_team_swap_with_skills)
{
	transaction_fixture f;
	CHECK(f.coordinator.place(1, UnitId(46), Team::ALLY), "vala");
	CHECK(f.coordinator.place(45, UnitId(66), Team::ENEMY), "bonnie");
	CHECK(f.coordinator.place(44, UnitId(7), Team::ENEMY), "plain enemy");

	CHECK(f.coordinator.swap(1, 45), "cross-team swap");
	CHECK(f.skills.isActive(UnitId(46), Team::ENEMY), "vala switched team");
	CHECK(f.skills.isActive(UnitId(66), Team::ALLY), "bonnie switched team");
	CHECK(!f.skills.isActive(UnitId(46), Team::ALLY), "old key dropped");
	CHECK_EQ(f.skills.getActiveSkills().size(), 2U);

	CHECK(f.coordinator.place(2, UnitId(46), Team::ALLY), "vala on both teams");
	const std::size_t before = f.grid.fingerprint();
	CHECK(!f.coordinator.swap(2, 44), "would put vala on the enemy team twice");
	CHECK_EQ(f.grid.fingerprint(), before);
	CHECK(f.skills.isActive(UnitId(46), Team::ALLY), "untouched");
}

UNIT_TEST(transaction_invalidates_once)
{
	transaction_fixture f;
	int count = f.cache->invalidations();
	CHECK(f.coordinator.place(1, UnitId(89), Team::ALLY), "zanie and two companions");
	CHECK_EQ(f.cache->invalidations(), ++count);

	CHECK(f.coordinator.place(30, UnitId(7), Team::ENEMY), "enemy");
	CHECK_EQ(f.cache->invalidations(), ++count);

	CHECK(!f.coordinator.place(33, UnitId(7), Team::ENEMY), "duplicate");
	CHECK_EQ(f.cache->invalidations(), ++count);

	CHECK(f.coordinator.autoPlace(UnitId(8), Team::ENEMY), "auto placement");
	CHECK_EQ(f.cache->invalidations(), ++count);

	// Painting runs a removal inside its own transaction.
	CHECK(f.coordinator.setOccupancyState(1, static_cast<int>(hex::TileState::BLOCKED)), "paint over zanie");
	CHECK_EQ(f.cache->invalidations(), ++count);
	CHECK_EQ(f.coordinator.depth(), 0);

	CHECK(f.coordinator.clearAll(), "clear");
	CHECK_EQ(f.cache->invalidations(), ++count);
}

UNIT_TEST(transaction_auto_place_and_clear)
{
	transaction_fixture f;
	CHECK(f.coordinator.autoPlace(UnitId(7), Team::ALLY), "first");
	CHECK_EQ(*f.grid.findUnitTile(UnitId(7), Team::ALLY), 1);
	CHECK(f.coordinator.autoPlace(UnitId(50), Team::ALLY), "phraesto");
	CHECK_EQ(*f.grid.findUnitTile(UnitId(50), Team::ALLY), 2);
	CHECK_EQ(*f.grid.findUnitTile(UnitId(50, 1), Team::ALLY), 3);
	CHECK(!f.coordinator.autoPlace(UnitId(7), Team::ALLY), "already placed");
	CHECK(f.coordinator.autoPlace(UnitId(9), Team::ENEMY), "enemy");
	CHECK_EQ(*f.grid.findUnitTile(UnitId(9), Team::ENEMY), 30);

	CHECK(f.coordinator.clearAll(), "clear");
	CHECK(f.grid.getTilesWithUnits().empty(), "board is empty");
	CHECK(f.skills.getActiveSkills().empty(), "no skills");
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 5);
}

UNIT_TEST(transaction_painting_removes_units)
{
	transaction_fixture f;
	CHECK(f.coordinator.place(1, UnitId(89), Team::ALLY), "zanie");
	CHECK(!f.coordinator.setOccupancyState(4, static_cast<int>(hex::TileState::OCCUPIED_ALLY)), "occupied states come from placement");
	CHECK(!f.coordinator.setOccupancyState(4, 9), "invalid state");

	CHECK(f.coordinator.setOccupancyState(1, static_cast<int>(hex::TileState::BLOCKED)), "paint the owner's tile");
	CHECK_EQ(f.grid.getTileById(1).state, hex::TileState::BLOCKED);
	CHECK_EQ(f.grid.unitCount(Team::ALLY), 0);
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 5);

	CHECK(f.coordinator.setMaxTeamSize(Team::ENEMY, 2), "shrink");
	CHECK(!f.coordinator.setMaxTeamSize(Team::ENEMY, 0), "zero");
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ENEMY), 2);
}
