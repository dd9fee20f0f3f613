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
#include <set>
#include <sstream>

#include "asserts.hpp"
#include "skill_engine.hpp"
#include "spatial_grid.hpp"
#include "target_resolver.hpp"
#include "unit_test.hpp"

namespace hex
{
	namespace
	{
		// Neighbour order of the adjacent-mirror strategy.
		const int ally_adjacent_priority[NUM_DIRECTIONS] = { SOUTH_WEST, WEST, SOUTH_EAST, EAST, NORTH_WEST, NORTH_EAST };
		const int enemy_adjacent_priority[NUM_DIRECTIONS] = { NORTH_EAST, NORTH_WEST, EAST, SOUTH_EAST, WEST, SOUTH_WEST };

		// Equal-move tie-break: ALLY takes the higher id, ENEMY the lower.
		bool tie_break_prefers(Team team, int a, int b)
		{
			return team == Team::ALLY ? a > b : a < b;
		}

		// Equal-distance preference of the distance strategies.
		bool distance_prefers(Team team, int a, int b)
		{
			return team == Team::ALLY ? a < b : a > b;
		}

		TargetInfo make_target(const Tile& t)
		{
			ASSERT_LOG(t.hasUnit(), "Target tile " << t.id() << " holds no unit");
			return TargetInfo(t.id(), *t.unit);
		}
	}

	std::vector<const Tile*> team_unit_tiles(const SpatialGrid& grid, Team team)
	{
		std::vector<const Tile*> res;
		for(const Tile* t : grid.getTilesWithUnits()) {
			if(t->team && *t->team == team) {
				res.push_back(t);
			}
		}
		std::sort(res.begin(), res.end(), [](const Tile* a, const Tile* b) { return a->id() < b->id(); });
		return res;
	}

	std::vector<Coordinate> spiral_ring(const Coordinate& center, int radius, Team caster_team)
	{
		if(caster_team == Team::ALLY) {
			return ring(center, radius, NORTH_EAST);
		}

		std::vector<Coordinate> res = ring(center, radius, SOUTH_WEST);
		std::reverse(res.begin(), res.end());
		return res;
	}

	TargetResolver::TargetResolver(PathfindingEngine& engine)
		: engine_(engine)
	{
	}

	int TargetResolver::breakTie(const SpatialGrid& grid, int source_tile, Team source_team, const std::vector<int>& candidates) const
	{
		ASSERT_LOG(!candidates.empty(), "breakTie() called without candidates");
		const BoardPreset& preset = grid.getPreset();
		const Coordinate& src = grid.getTileById(source_tile).coord;

		auto better = [&](int a, int b) {
			const Coordinate& ca = grid.getTileById(a).coord;
			const Coordinate& cb = grid.getTileById(b).coord;
			const bool va = ca.q() == src.q();
			const bool vb = cb.q() == src.q();
			if(va != vb) {
				return va;
			}

			if(preset.sameDiagonalRow(a, b)) {
				return tie_break_prefers(source_team, a, b);
			}

			// Two vertical candidates in different rows keep the earlier one.
			if(va) {
				return false;
			}

			const int da = src.distance(ca);
			const int db = src.distance(cb);
			if(da != db) {
				return da < db;
			}
			return tie_break_prefers(source_team, a, b);
		};

		int best = candidates.front();
		for(int c : candidates) {
			if(c != best && better(c, best)) {
				best = c;
			}
		}
		return best;
	}

	boost::optional<ClosestTarget> TargetResolver::closestTarget(const SpatialGrid& grid, int source_tile, Team source_team, const std::vector<int>& targets, int range)
	{
		auto reached = engine_.minMovesToRange(grid, source_tile, targets, range);
		if(!reached || reached->targets.empty()) {
			return boost::none;
		}

		ClosestTarget res;
		res.tile_id = breakTie(grid, source_tile, source_team, reached->targets);
		res.movement = reached->movement;
		return res;
	}

	ClosestTargetMap TargetResolver::closestTargetMap(const SpatialGrid& grid, Team source_team, Team target_team, const RangeTable& ranges, const SkillRegistry* skills)
	{
		auto range_of = [&](const UnitId& unit) {
			if(unit.isCompanion() && skills != nullptr) {
				const SkillDescriptor* desc = skills->find(unit.getMainId());
				if(desc != nullptr && desc->companion_range > 0) {
					return desc->companion_range;
				}
			}
			auto it = ranges.find(unit.getMainId());
			return it == ranges.end() ? 1 : it->second;
		};

		std::vector<const Tile*> occupied = grid.getTilesWithUnits();
		std::sort(occupied.begin(), occupied.end(), [](const Tile* a, const Tile* b) { return a->id() < b->id(); });

		std::ostringstream key;
		key << source_team << ">" << target_team << "@" << grid.fingerprint();
		for(const Tile* t : occupied) {
			key << ";" << t->id() << ":" << t->unit->toLegacy() << ":" << static_cast<int>(*t->team) << ":" << range_of(*t->unit);
		}

		PathfindingCachePtr cache = engine_.getCache();
		if(cache) {
			if(auto cached = cache->targetMaps().get(key.str())) {
				return *cached;
			}
		}

		std::vector<int> targets;
		for(const Tile* t : team_unit_tiles(grid, target_team)) {
			targets.push_back(t->id());
		}

		ClosestTargetMap res;
		for(const Tile* t : team_unit_tiles(grid, source_team)) {
			auto closest = closestTarget(grid, t->id(), source_team, targets, range_of(*t->unit));
			if(closest) {
				res[t->id()] = *closest;
			}
		}

		if(cache) {
			cache->targetMaps().put(key.str(), res);
		}
		return res;
	}

	boost::optional<TargetInfo> TargetResolver::findByDistance(const SpatialGrid& grid, const Caster& caster, Team target_team, bool furthest, bool exclude_self, int reference_tile) const
	{
		const Coordinate& ref = grid.getTileById(reference_tile > 0 ? reference_tile : caster.tile_id).coord;
		const Tile* best = nullptr;
		int best_distance = 0;
		std::vector<int> examined;
		for(const Tile* t : team_unit_tiles(grid, target_team)) {
			if(exclude_self && t->id() == caster.tile_id) {
				continue;
			}

			examined.push_back(t->id());
			const int d = ref.distance(t->coord);
			const bool take = best == nullptr
				|| (furthest ? d > best_distance : d < best_distance)
				|| (d == best_distance && distance_prefers(caster.team, t->id(), best->id()));
			if(take) {
				best = t;
				best_distance = d;
			}
		}

		if(best == nullptr) {
			return boost::none;
		}

		TargetInfo res = make_target(*best);
		res.examined_tiles = examined;
		res.metadata["distance"] = best_distance;
		return res;
	}

	boost::optional<TargetInfo> TargetResolver::findRearmost(const SpatialGrid& grid, const Caster& caster, Team target_team, bool exclude_self) const
	{
		const bool skip_self = exclude_self && target_team == caster.team;
		const Tile* best = nullptr;
		for(const Tile* t : team_unit_tiles(grid, target_team)) {
			if(skip_self && t->id() == caster.tile_id) {
				continue;
			}
			if(best == nullptr || (target_team == Team::ENEMY ? t->id() > best->id() : t->id() < best->id())) {
				best = t;
			}
		}
		return best ? boost::optional<TargetInfo>(make_target(*best)) : boost::none;
	}

	boost::optional<TargetInfo> TargetResolver::findFrontmost(const SpatialGrid& grid, const Caster& caster, Team target_team) const
	{
		const Tile* best = nullptr;
		for(const Tile* t : team_unit_tiles(grid, target_team)) {
			if(target_team == caster.team && t->id() == caster.tile_id) {
				continue;
			}
			if(best == nullptr || (target_team == Team::ENEMY ? t->id() < best->id() : t->id() > best->id())) {
				best = t;
			}
		}
		return best ? boost::optional<TargetInfo>(make_target(*best)) : boost::none;
	}

	std::vector<TargetInfo> TargetResolver::findRearmostMany(const SpatialGrid& grid, const Caster& caster, Team target_team, int count) const
	{
		std::vector<const Tile*> candidates;
		for(const Tile* t : team_unit_tiles(grid, target_team)) {
			if(t->id() != caster.tile_id) {
				candidates.push_back(t);
			}
		}
		if(target_team == Team::ENEMY) {
			std::reverse(candidates.begin(), candidates.end());
		}

		std::vector<TargetInfo> res;
		for(const Tile* t : candidates) {
			if(static_cast<int>(res.size()) >= count) {
				break;
			}
			res.push_back(make_target(*t));
			res.back().metadata["slot"] = static_cast<int>(res.size()) - 1;
		}
		return res;
	}

	boost::optional<TargetInfo> TargetResolver::searchByRow(const SpatialGrid& grid, const Caster& caster, Team target_team) const
	{
		const BoardPreset& preset = grid.getPreset();
		const Coordinate& src = grid.getTileById(caster.tile_id).coord;
		std::vector<const Tile*> row;
		for(const Tile* t : team_unit_tiles(grid, target_team)) {
			if(t->id() != caster.tile_id && preset.sameDiagonalRow(caster.tile_id, t->id())) {
				row.push_back(t);
			}
		}

		if(row.empty()) {
			return boost::none;
		}

		std::sort(row.begin(), row.end(), [&](const Tile* a, const Tile* b) {
			const int da = src.distance(a->coord);
			const int db = src.distance(b->coord);
			if(da != db) {
				return da < db;
			}
			return tie_break_prefers(caster.team, a->id(), b->id());
		});

		TargetInfo res = make_target(*row.front());
		for(const Tile* t : row) {
			res.examined_tiles.push_back(t->id());
		}
		res.metadata["row"] = preset.diagonalRow(caster.tile_id);
		res.metadata["distance"] = src.distance(row.front()->coord);
		return res;
	}

	boost::optional<TargetInfo> TargetResolver::rowScan(const SpatialGrid& grid, const Caster& caster, Team target_team, ScanDirection direction, bool exclude_companions, int max_distance) const
	{
		const Coordinate& src = grid.getTileById(caster.tile_id).coord;
		std::set<int> candidates;
		int farthest = 0;
		for(const Tile* t : team_unit_tiles(grid, target_team)) {
			if(t->id() == caster.tile_id || (exclude_companions && t->unit->isCompanion())) {
				continue;
			}
			candidates.insert(t->id());
			farthest = std::max(farthest, src.distance(t->coord));
		}

		const int limit = max_distance > 0 ? std::min(max_distance, farthest) : farthest;
		const bool ascending = (caster.team == Team::ALLY) == (direction == ScanDirection::REARMOST);
		std::vector<int> examined;
		for(int d = 1; d <= limit; ++d) {
			std::vector<int> ring_ids;
			for(const Tile& t : grid.getAllTiles()) {
				if(src.distance(t.coord) == d) {
					ring_ids.push_back(t.id());
				}
			}
			std::sort(ring_ids.begin(), ring_ids.end());
			if(!ascending) {
				std::reverse(ring_ids.begin(), ring_ids.end());
			}

			for(int id : ring_ids) {
				examined.push_back(id);
				if(candidates.count(id)) {
					TargetInfo res = make_target(grid.getTileById(id));
					res.examined_tiles = examined;
					res.metadata["distance"] = d;
					return res;
				}
			}
		}
		return boost::none;
	}

	boost::optional<TargetInfo> TargetResolver::spiralSearch(const SpatialGrid& grid, int center_tile, Team caster_team, Team target_team) const
	{
		const Coordinate& center = grid.getTileById(center_tile).coord;
		int farthest = 0;
		for(const Tile* t : team_unit_tiles(grid, target_team)) {
			farthest = std::max(farthest, center.distance(t->coord));
		}

		std::vector<int> examined;
		for(int radius = 1; radius <= farthest; ++radius) {
			for(const Coordinate& c : spiral_ring(center, radius, caster_team)) {
				const Tile* t = grid.findTile(c);
				if(t == nullptr) {
					continue;
				}
				examined.push_back(t->id());
				if(t->hasUnit() && *t->team == target_team) {
					TargetInfo res = make_target(*t);
					res.examined_tiles = examined;
					res.metadata["ring"] = radius;
					return res;
				}
			}
		}
		return boost::none;
	}

	boost::optional<TargetInfo> TargetResolver::findMirror(const SpatialGrid& grid, const Caster& caster) const
	{
		const Team opposing = opposing_team(caster.team);
		const auto mirror = grid.getPreset().mirrorOf(caster.tile_id);
		if(mirror) {
			const Tile& t = grid.getTileById(*mirror);
			if(t.hasUnit() && *t.team == opposing) {
				TargetInfo res = make_target(t);
				res.examined_tiles.push_back(*mirror);
				res.metadata["mirror_tile"] = *mirror;
				return res;
			}
		}

		auto res = spiralSearch(grid, mirror ? *mirror : caster.tile_id, caster.team, opposing);
		if(res) {
			res->metadata["spiral"] = 1;
			if(mirror) {
				res->metadata["mirror_tile"] = *mirror;
			}
		}
		return res;
	}

	boost::optional<TargetInfo> TargetResolver::findAdjacentMirror(const SpatialGrid& grid, const Caster& caster) const
	{
		const Team opposing = opposing_team(caster.team);
		const int* priority = caster.team == Team::ALLY ? ally_adjacent_priority : enemy_adjacent_priority;
		const Coordinate& src = grid.getTileById(caster.tile_id).coord;
		std::vector<int> examined;
		for(int n = 0; n != NUM_DIRECTIONS; ++n) {
			const Tile* t = grid.findTile(src.neighbor(priority[n]));
			if(t == nullptr || !t->hasUnit() || *t->team != caster.team) {
				continue;
			}

			examined.push_back(t->id());
			const auto mirror = grid.getPreset().mirrorOf(t->id());
			if(!mirror) {
				continue;
			}

			const Tile& m = grid.getTileById(*mirror);
			if(m.hasUnit() && *m.team == opposing) {
				TargetInfo res = make_target(*t);
				res.examined_tiles = examined;
				res.metadata["mirror_tile"] = *mirror;
				res.metadata["direction"] = priority[n];
				return res;
			}
		}
		return boost::none;
	}

	boost::optional<TargetInfo> TargetResolver::findAdjacentBehind(const SpatialGrid& grid, const Caster& caster) const
	{
		const Coordinate& src = grid.getTileById(caster.tile_id).coord;
		std::vector<int> behind;
		for(int dir = 0; dir != NUM_DIRECTIONS; ++dir) {
			const Tile* t = grid.findTile(src.neighbor(dir));
			if(t != nullptr && (caster.team == Team::ALLY ? t->id() < caster.tile_id : t->id() > caster.tile_id)) {
				behind.push_back(t->id());
			}
		}
		std::sort(behind.begin(), behind.end());
		if(caster.team == Team::ENEMY) {
			std::reverse(behind.begin(), behind.end());
		}
		if(behind.size() > 3) {
			behind.resize(3);
		}

		// Of the two tiles flanking the one straight behind, the farther
		// in sort order goes first.
		if(behind.size() == 3) {
			std::swap(behind[1], behind[2]);
		}

		std::vector<int> examined;
		for(int id : behind) {
			examined.push_back(id);
			const Tile& t = grid.getTileById(id);
			if(t.hasUnit() && *t.team == caster.team && *t.unit != caster.unit) {
				TargetInfo res = make_target(t);
				res.examined_tiles = examined;
				res.metadata["distance"] = 1;
				return res;
			}
		}
		return boost::none;
	}
}

namespace
{
	using hex::Team;
	using hex::UnitId;

	hex::SpatialGrid make_full_grid()
	{
		return hex::SpatialGrid(hex::BoardPreset::builtin("full", 1), 10);
	}

	// A narrow seven-row board: ids 1-8 are ally tiles, 9-14 enemy tiles.
	hex::SpatialGrid make_column_grid()
	{
		std::vector<hex::BoardRow> rows;
		rows.emplace_back(0, std::vector<int>{ 7 });
		rows.emplace_back(-1, std::vector<int>{ 6, 8 });
		rows.emplace_back(-1, std::vector<int>{ 5, 9 });
		rows.emplace_back(-2, std::vector<int>{ 4, 10 });
		rows.emplace_back(-2, std::vector<int>{ 3, 11 });
		rows.emplace_back(-3, std::vector<int>{ 2, 12 });
		rows.emplace_back(-3, std::vector<int>{ 1, 13, 14 });
		std::vector<std::vector<int>> diagonal_rows;
		for(const auto& r : rows) {
			diagonal_rows.push_back(r.ids);
		}

		auto preset = std::make_shared<hex::BoardPreset>("column", rows, diagonal_rows);
		for(int id = 1; id <= 14; ++id) {
			preset->setInitialState(id, id <= 8 ? hex::TileState::AVAILABLE_ALLY : hex::TileState::AVAILABLE_ENEMY);
		}
		return hex::SpatialGrid(preset, 7);
	}
}

UNIT_TEST(target_tie_break_rules)
{
	hex::SpatialGrid grid = make_full_grid();
	hex::PathfindingEngine engine(nullptr);
	hex::TargetResolver resolver(engine);

	// 33 and 37 are equally far from 9, in different rows, off the vertical.
	std::vector<int> candidates{ 33, 37 };
	CHECK_EQ(resolver.breakTie(grid, 9, Team::ALLY, candidates), 37);
	CHECK_EQ(resolver.breakTie(grid, 9, Team::ENEMY, candidates), 33);

	// 36 and 38 share a diagonal row.
	candidates = { 36, 38 };
	CHECK_EQ(resolver.breakTie(grid, 1, Team::ALLY, candidates), 38);
	CHECK_EQ(resolver.breakTie(grid, 1, Team::ENEMY, candidates), 36);
	candidates = { 38, 36 };
	CHECK_EQ(resolver.breakTie(grid, 1, Team::ALLY, candidates), 38);

	// 13 is straight above 9.
	candidates = { 12, 13 };
	CHECK_EQ(resolver.breakTie(grid, 9, Team::ALLY, candidates), 13);
	CHECK_EQ(resolver.breakTie(grid, 9, Team::ENEMY, candidates), 13);

	// 21 and 13 are both straight above 9 but in different rows.
	candidates = { 21, 13 };
	CHECK_EQ(resolver.breakTie(grid, 9, Team::ALLY, candidates), 21);
	CHECK_EQ(resolver.breakTie(grid, 9, Team::ENEMY, candidates), 21);
	candidates = { 13, 21 };
	CHECK_EQ(resolver.breakTie(grid, 9, Team::ALLY, candidates), 13);
}

UNIT_TEST(target_closest_scenario_is_stable)
{
	hex::SpatialGrid grid = make_full_grid();
	CHECK(grid.placeUnit(9, UnitId(1), Team::ALLY), "place");
	CHECK(grid.placeUnit(33, UnitId(2), Team::ENEMY), "place");
	CHECK(grid.placeUnit(37, UnitId(3), Team::ENEMY), "place");
	hex::PathfindingEngine engine;
	hex::TargetResolver resolver(engine);

	std::vector<int> targets{ 33, 37 };
	for(int n = 0; n != 3; ++n) {
		auto closest = resolver.closestTarget(grid, 9, Team::ALLY, targets, 2);
		CHECK(closest, "reachable");
		CHECK_EQ(closest->tile_id, 37);
		CHECK_EQ(closest->movement, 2);
	}
	CHECK_EQ(resolver.closestTarget(grid, 9, Team::ENEMY, targets, 2)->tile_id, 33);

	hex::RangeTable ranges;
	ranges[1] = 2;
	auto map = resolver.closestTargetMap(grid, Team::ALLY, Team::ENEMY, ranges);
	CHECK_EQ(map.size(), 1U);
	CHECK_EQ(map[9].tile_id, 37);
	CHECK_EQ(map[9].movement, 2);
	const int hits = engine.getCache()->targetMaps().hits();
	resolver.closestTargetMap(grid, Team::ALLY, Team::ENEMY, ranges);
	CHECK_EQ(engine.getCache()->targetMaps().hits(), hits + 1);

	auto reverse = resolver.closestTargetMap(grid, Team::ENEMY, Team::ALLY, ranges);
	CHECK_EQ(reverse.size(), 2U);
	CHECK_EQ(reverse[33].tile_id, 9);
	CHECK_EQ(reverse[33].movement, 3);
	CHECK_EQ(reverse[37].tile_id, 9);
}

UNIT_TEST(target_front_and_rear)
{
	hex::SpatialGrid grid = make_full_grid();
	for(int id : { 1, 5, 12 }) {
		CHECK(grid.placeUnit(id, UnitId(id), Team::ALLY), "place ally " << id);
	}
	for(int id : { 30, 40, 45 }) {
		CHECK(grid.placeUnit(id, UnitId(id), Team::ENEMY), "place enemy " << id);
	}
	hex::PathfindingEngine engine(nullptr);
	hex::TargetResolver resolver(engine);
	const hex::Caster caster(5, UnitId(5), Team::ALLY);

	CHECK_EQ(resolver.findRearmost(grid, caster, Team::ENEMY, false)->target_tile_id, 45);
	CHECK_EQ(resolver.findRearmost(grid, caster, Team::ALLY, true)->target_tile_id, 1);
	CHECK_EQ(resolver.findFrontmost(grid, caster, Team::ENEMY)->target_tile_id, 30);
	CHECK_EQ(resolver.findFrontmost(grid, caster, Team::ALLY)->target_tile_id, 12);
	CHECK_EQ(resolver.findFrontmost(grid, hex::Caster(12, UnitId(12), Team::ALLY), Team::ALLY)->target_tile_id, 5);

	const hex::Caster rear_caster(1, UnitId(1), Team::ALLY);
	CHECK_EQ(resolver.findRearmost(grid, rear_caster, Team::ALLY, true)->target_tile_id, 5);
	CHECK_EQ(resolver.findRearmost(grid, rear_caster, Team::ALLY, false)->target_tile_id, 1);

	auto many = resolver.findRearmostMany(grid, caster, Team::ALLY, 2);
	CHECK_EQ(many.size(), 2U);
	CHECK_EQ(many[0].target_tile_id, 1);
	CHECK_EQ(many[1].target_tile_id, 12);
	CHECK_EQ(resolver.findRearmostMany(grid, caster, Team::ENEMY, 5).size(), 3U);

	CHECK_EQ(resolver.findByDistance(grid, caster, Team::ENEMY, false, false)->target_tile_id, 30);
	CHECK_EQ(resolver.findByDistance(grid, caster, Team::ENEMY, true, false)->target_tile_id, 45);
	// 1 and 12 are both three steps from 5.
	CHECK_EQ(resolver.findByDistance(grid, caster, Team::ALLY, true, true)->target_tile_id, 1);
}

UNIT_TEST(target_distance_ties_follow_caster_team)
{
	hex::SpatialGrid grid = make_full_grid();
	CHECK(grid.placeUnit(9, UnitId(1), Team::ALLY), "place");
	CHECK(grid.placeUnit(12, UnitId(2), Team::ALLY), "place");
	CHECK(grid.placeUnit(30, UnitId(3), Team::ENEMY), "place");
	CHECK(grid.placeUnit(33, UnitId(4), Team::ENEMY), "place");
	CHECK(grid.placeUnit(37, UnitId(5), Team::ENEMY), "place");
	hex::PathfindingEngine engine(nullptr);
	hex::TargetResolver resolver(engine);

	// 9 and 12 are both three steps from 30.
	auto t = resolver.findByDistance(grid, hex::Caster(30, UnitId(3), Team::ENEMY), Team::ALLY, false, false);
	CHECK_EQ(t->target_tile_id, 12);
	CHECK_EQ(t->metadata["distance"], 3);

	// 33 and 37 are both four steps from 9; 30 is three.
	t = resolver.findByDistance(grid, hex::Caster(9, UnitId(1), Team::ALLY), Team::ENEMY, true, false);
	CHECK_EQ(t->target_tile_id, 33);
}

UNIT_TEST(target_row_search_and_scan)
{
	hex::SpatialGrid grid = make_full_grid();
	for(int id : { 8, 9, 10 }) {
		CHECK(grid.placeUnit(id, UnitId(id), Team::ALLY), "place " << id);
	}
	hex::PathfindingEngine engine(nullptr);
	hex::TargetResolver resolver(engine);
	auto t = resolver.searchByRow(grid, hex::Caster(8, UnitId(8), Team::ALLY), Team::ALLY);
	CHECK_EQ(t->target_tile_id, 9);
	CHECK_EQ(t->metadata["row"], 4);
	CHECK(!resolver.searchByRow(grid, hex::Caster(8, UnitId(8), Team::ALLY), Team::ENEMY), "no enemy in the row");

	hex::SpatialGrid column = make_column_grid();
	CHECK(column.placeUnit(7, UnitId(10), Team::ALLY), "caster");
	CHECK(column.placeUnit(6, UnitId(11), Team::ALLY), "ally");
	CHECK(column.placeUnit(8, UnitId(12), Team::ALLY), "ally");
	const hex::Caster caster(7, UnitId(10), Team::ALLY);
	CHECK_EQ(resolver.rowScan(column, caster, Team::ALLY, hex::ScanDirection::FRONTMOST, false, 0)->target_tile_id, 8);
	CHECK_EQ(resolver.rowScan(column, caster, Team::ALLY, hex::ScanDirection::REARMOST, false, 0)->target_tile_id, 6);

	CHECK(column.removeUnit(6), "remove");
	CHECK(column.removeUnit(8), "remove");
	CHECK(column.placeUnit(2, UnitId(12), Team::ALLY), "far ally");
	CHECK(!resolver.rowScan(column, caster, Team::ALLY, hex::ScanDirection::REARMOST, false, 1), "beyond the scan distance");
	t = resolver.rowScan(column, caster, Team::ALLY, hex::ScanDirection::REARMOST, false, 0);
	CHECK_EQ(t->target_tile_id, 2);
	CHECK_EQ(t->metadata["distance"], 5);

	CHECK(column.placeUnit(5, UnitId(12, 1), Team::ALLY), "companion");
	CHECK_EQ(resolver.rowScan(column, caster, Team::ALLY, hex::ScanDirection::REARMOST, false, 0)->target_tile_id, 5);
	CHECK_EQ(resolver.rowScan(column, caster, Team::ALLY, hex::ScanDirection::REARMOST, true, 0)->target_tile_id, 2);
}

UNIT_TEST(target_spiral_order_per_team)
{
	hex::SpatialGrid grid = make_full_grid();
	for(int id : { 19, 26 }) {
		CHECK(grid.setOccupancyState(id, static_cast<int>(hex::TileState::AVAILABLE_ENEMY)), "paint");
		CHECK(grid.placeUnit(id, UnitId(id), Team::ENEMY), "place");
	}
	hex::PathfindingEngine engine(nullptr);
	hex::TargetResolver resolver(engine);
	CHECK_EQ(resolver.spiralSearch(grid, 23, Team::ALLY, Team::ENEMY)->target_tile_id, 26);
	CHECK_EQ(resolver.spiralSearch(grid, 23, Team::ENEMY, Team::ENEMY)->target_tile_id, 19);
	CHECK(!resolver.spiralSearch(grid, 23, Team::ALLY, Team::ALLY), "no allies on the board");

	const hex::Coordinate center(0, 0);
	auto ally_ring = hex::spiral_ring(center, 2, Team::ALLY);
	auto enemy_ring = hex::spiral_ring(center, 2, Team::ENEMY);
	CHECK_EQ(ally_ring.front(), hex::Coordinate(2, -2, 0));
	CHECK_EQ(enemy_ring.back(), hex::Coordinate(-2, 2, 0));
	CHECK_EQ(enemy_ring.size(), 12U);
}

UNIT_TEST(target_mirror_and_adjacent_mirror)
{
	hex::SpatialGrid grid = make_full_grid();
	hex::PathfindingEngine engine(nullptr);
	hex::TargetResolver resolver(engine);
	CHECK(grid.placeUnit(1, UnitId(58), Team::ALLY), "caster");
	CHECK(grid.placeUnit(44, UnitId(2), Team::ENEMY), "mirror enemy");
	const hex::Caster caster(1, UnitId(58), Team::ALLY);
	auto t = resolver.findMirror(grid, caster);
	CHECK_EQ(t->target_tile_id, 44);
	CHECK_EQ(t->metadata["mirror_tile"], 44);

	CHECK(grid.removeUnit(44), "remove");
	CHECK(grid.placeUnit(39, UnitId(3), Team::ENEMY), "place");
	CHECK(grid.placeUnit(42, UnitId(4), Team::ENEMY), "place");
	t = resolver.findMirror(grid, caster);
	CHECK_EQ(t->target_tile_id, 39);
	CHECK_EQ(t->metadata["spiral"], 1);

	hex::SpatialGrid enemy_grid = make_full_grid();
	CHECK(enemy_grid.placeUnit(44, UnitId(58), Team::ENEMY), "caster");
	CHECK(enemy_grid.placeUnit(3, UnitId(3), Team::ALLY), "place");
	CHECK(enemy_grid.placeUnit(6, UnitId(6), Team::ALLY), "place");
	CHECK_EQ(resolver.findMirror(enemy_grid, hex::Caster(44, UnitId(58), Team::ENEMY))->target_tile_id, 3);

	hex::SpatialGrid adj = make_full_grid();
	CHECK(adj.placeUnit(9, UnitId(31), Team::ALLY), "caster");
	CHECK(adj.placeUnit(7, UnitId(7), Team::ALLY), "west neighbour");
	CHECK(adj.placeUnit(12, UnitId(12), Team::ALLY), "east neighbour");
	const hex::Caster reinier(9, UnitId(31), Team::ALLY);
	CHECK(!resolver.findAdjacentMirror(adj, reinier), "no enemy on any mirror tile");
	CHECK(adj.placeUnit(33, UnitId(2), Team::ENEMY), "mirror of 12");
	t = resolver.findAdjacentMirror(adj, reinier);
	CHECK_EQ(t->target_tile_id, 12);
	CHECK_EQ(t->metadata["mirror_tile"], 33);
	CHECK(adj.placeUnit(40, UnitId(3), Team::ENEMY), "mirror of 7");
	CHECK_EQ(resolver.findAdjacentMirror(adj, reinier)->target_tile_id, 7);
}

BENCHMARK(target_closest_target_map)
{
	hex::SpatialGrid grid = make_full_grid();
	for(int tile : { 1, 4, 9, 13, 16 }) {
		ASSERT_LOG(grid.placeUnit(tile, UnitId(tile), Team::ALLY), "benchmark board rejected ally " << tile);
	}
	for(int tile : { 30, 37, 40, 44, 45 }) {
		ASSERT_LOG(grid.placeUnit(tile, UnitId(tile), Team::ENEMY), "benchmark board rejected enemy " << tile);
	}

	hex::PathfindingEngine engine(nullptr);
	hex::TargetResolver resolver(engine);
	const hex::RangeTable ranges;
	BENCHMARK_LOOP {
		resolver.closestTargetMap(grid, Team::ALLY, Team::ENEMY, ranges);
	}
}

UNIT_TEST(target_adjacent_behind)
{
	hex::SpatialGrid grid = make_full_grid();
	hex::PathfindingEngine engine(nullptr);
	hex::TargetResolver resolver(engine);
	CHECK(grid.placeUnit(9, UnitId(81), Team::ALLY), "caster");
	const hex::Caster caster(9, UnitId(81), Team::ALLY);
	CHECK(!resolver.findAdjacentBehind(grid, caster), "nobody behind");

	// Tile 9 has 4, 6 and 7 behind it; 4 is straight behind, then 7, then 6.
	CHECK(grid.placeUnit(6, UnitId(2), Team::ALLY), "ally");
	CHECK(grid.placeUnit(7, UnitId(3), Team::ALLY), "ally");
	CHECK(grid.placeUnit(12, UnitId(5), Team::ALLY), "ally in front");
	auto t = resolver.findAdjacentBehind(grid, caster);
	CHECK_EQ(t->target_tile_id, 7);
	CHECK_EQ(t->metadata["distance"], 1);
	CHECK_EQ(t->examined_tiles.size(), 2U);

	CHECK(grid.placeUnit(4, UnitId(4), Team::ALLY), "ally straight behind");
	CHECK_EQ(resolver.findAdjacentBehind(grid, caster)->target_tile_id, 4);

	CHECK(grid.removeUnit(4), "remove");
	CHECK(grid.removeUnit(7), "remove");
	CHECK_EQ(resolver.findAdjacentBehind(grid, caster)->target_tile_id, 6);

	// ENEMY looks at higher ids: 37 straight behind 30, then 33, then 34.
	CHECK(grid.placeUnit(30, UnitId(81), Team::ENEMY), "enemy caster");
	CHECK(grid.placeUnit(33, UnitId(6), Team::ENEMY), "enemy");
	CHECK(grid.placeUnit(34, UnitId(7), Team::ENEMY), "enemy");
	const hex::Caster enemy(30, UnitId(81), Team::ENEMY);
	CHECK_EQ(resolver.findAdjacentBehind(grid, enemy)->target_tile_id, 33);
	CHECK(grid.placeUnit(37, UnitId(8), Team::ENEMY), "enemy straight behind");
	CHECK_EQ(resolver.findAdjacentBehind(grid, enemy)->target_tile_id, 37);
}
