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
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "hex_fwd.hpp"
#include "hex_pathfinding.hpp"
#include "unit_id.hpp"

namespace hex
{
	enum class ScanDirection { FRONTMOST, REARMOST };

	struct Caster
	{
		Caster(int tile, const UnitId& u, Team t) : tile_id(tile), unit(u), team(t) {}
		int tile_id;
		UnitId unit;
		Team team;
	};

	// Result of a target resolution. Derived data only; recomputed whenever
	// the board changes.
	struct TargetInfo
	{
		TargetInfo(int tile, const UnitId& u) : target_tile_id(tile), target_unit(u) {}
		int target_tile_id;
		UnitId target_unit;
		// Tiles looked at, in the order the strategy examined them.
		std::vector<int> examined_tiles;
		std::map<std::string, int> metadata;
	};

	// Main unit id -> base attack range.
	typedef std::map<int, int> RangeTable;

	class TargetResolver
	{
	public:
		explicit TargetResolver(PathfindingEngine& engine);

		// Picks one of several candidates that are equally close in moves.
		// Vertical alignment with the source wins, then the diagonal-row id
		// preference, then raw distance.
		int breakTie(const SpatialGrid& grid, int source_tile, Team source_team, const std::vector<int>& candidates) const;

		boost::optional<ClosestTarget> closestTarget(const SpatialGrid& grid, int source_tile, Team source_team, const std::vector<int>& targets, int range);

		// Closest opposing unit for every unit of source_team, keyed by the
		// source tile. Companions use their owner's companion range if the
		// registry gives one.
		ClosestTargetMap closestTargetMap(const SpatialGrid& grid, Team source_team, Team target_team, const RangeTable& ranges, const SkillRegistry* skills=nullptr);

		boost::optional<TargetInfo> findByDistance(const SpatialGrid& grid, const Caster& caster, Team target_team, bool furthest, bool exclude_self, int reference_tile=-1) const;
		boost::optional<TargetInfo> findRearmost(const SpatialGrid& grid, const Caster& caster, Team target_team, bool exclude_self) const;
		boost::optional<TargetInfo> findFrontmost(const SpatialGrid& grid, const Caster& caster, Team target_team) const;
		// Up to count targets in rearmost order. The caster is never included.
		std::vector<TargetInfo> findRearmostMany(const SpatialGrid& grid, const Caster& caster, Team target_team, int count) const;
		boost::optional<TargetInfo> searchByRow(const SpatialGrid& grid, const Caster& caster, Team target_team) const;
		// max_distance <= 0 scans every ring up to the farthest candidate.
		boost::optional<TargetInfo> rowScan(const SpatialGrid& grid, const Caster& caster, Team target_team, ScanDirection direction, bool exclude_companions, int max_distance) const;
		boost::optional<TargetInfo> findMirror(const SpatialGrid& grid, const Caster& caster) const;
		boost::optional<TargetInfo> findAdjacentMirror(const SpatialGrid& grid, const Caster& caster) const;
		// Own-team unit on a neighbour behind the caster: lower ids for
		// ALLY, higher for ENEMY. The tile straight behind comes first.
		boost::optional<TargetInfo> findAdjacentBehind(const SpatialGrid& grid, const Caster& caster) const;

		// Ring-by-ring walk from center_tile in the caster team's fixed order;
		// the first tile holding a unit of target_team wins.
		boost::optional<TargetInfo> spiralSearch(const SpatialGrid& grid, int center_tile, Team caster_team, Team target_team) const;
	private:
		PathfindingEngine& engine_;
	};

	// Tiles holding a unit of the team, by ascending id.
	std::vector<const Tile*> team_unit_tiles(const SpatialGrid& grid, Team team);

	// Walk order of one spiral ring.
	std::vector<Coordinate> spiral_ring(const Coordinate& center, int radius, Team caster_team);
}
