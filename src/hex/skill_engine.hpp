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
#include <tuple>
#include <vector>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree_fwd.hpp>

#include "hex_fwd.hpp"
#include "target_resolver.hpp"
#include "unit_id.hpp"

namespace hex
{
	enum class SkillStrategy {
		COMPANION,
		CLOSEST,
		FURTHEST,
		REARMOST,
		FRONTMOST,
		REARMOST_MANY,
		ROW_SEARCH,
		ROW_SCAN,
		MIRROR,
		ADJACENT_MIRROR,
		// Slot 0 an own-team unit by row, slot 1 the furthest opposing unit.
		ROW_AND_FURTHEST,
		ADJACENT_BEHIND,
		DEMOLITION_ZONE,
	};

	enum class TargetSide { OWN, OPPOSING };

	const char* to_string(SkillStrategy s);

	// Tiles a demolition zone paints over while its owner is on the board.
	struct DemolitionZone
	{
		std::vector<int> blocked;
		std::vector<int> breakable;
	};

	// Data-driven description of one unit's skill.
	struct SkillDescriptor
	{
		SkillDescriptor();

		int unit_id;
		std::string id;
		std::string name;
		SkillStrategy strategy;
		TargetSide side;
		bool exclude_self;
		bool exclude_companions;
		// Row scans only; 0 means no limit.
		int max_distance;
		ScanDirection direction;
		int slots;
		int companion_count;
		// Attack range of spawned companions; 0 means the owner's range.
		int companion_range;
		std::string self_color;
		std::string companion_color;
		std::string targeting_color;
		std::string tile_color;
		// Demolition zones only, keyed by the owner's team.
		std::map<Team, DemolitionZone> zones;
	};

	class SkillRegistry
	{
	public:
		void add(const SkillDescriptor& desc);
		// nullptr if the unit has no skill.
		const SkillDescriptor* find(int unit_id) const;
		const std::map<int, SkillDescriptor>& getAll() const { return skills_; }
		boost::property_tree::ptree toPtree() const;

		// Builds a new registry holding the stock skills on every call.
		static SkillRegistryPtr builtin();
	private:
		std::map<int, SkillDescriptor> skills_;
	};

	// Raised inside an activation that cannot complete; the skill manager
	// undoes the partial activation and reports failure.
	struct skill_activation_failure
	{
		explicit skill_activation_failure(const std::string& m) : msg(m) {}
		std::string msg;
	};

	// Per-(unit, team) skill state: Inactive -> Active -> Inactive.
	class SkillManager
	{
	public:
		typedef std::pair<UnitId, Team> SkillKey;
		typedef std::tuple<UnitId, Team, int> TargetKey;

		struct ActiveSkill
		{
			ActiveSkill(const UnitId& u, Team t, int tile, const SkillDescriptor* d)
				: unit(u), team(t), tile_id(tile), desc(d), capacity_raise(0) {}
			UnitId unit;
			Team team;
			int tile_id;
			const SkillDescriptor* desc;
			int capacity_raise;
			std::vector<UnitId> companions;
			// States of the tiles a demolition zone replaced.
			std::map<int, TileState> saved_states;
		};

		SkillManager(SkillRegistryPtr registry, TargetResolver& resolver);

		const SkillRegistry& getRegistry() const { return *registry_; }
		const SkillDescriptor* getDescriptor(const UnitId& unit) const;

		// Units without a skill succeed trivially. On failure nothing the
		// activation did remains on the grid.
		bool activate(SpatialGrid& grid, int tile_id, Team team, const UnitId& unit);
		void deactivate(SpatialGrid& grid, const UnitId& unit, Team team);
		// Recomputes every target. Never respawns companions.
		void updateActiveSkills(SpatialGrid& grid);
		void deactivateAll(SpatialGrid& grid);

		bool isActive(const UnitId& unit, Team team) const;
		const std::map<SkillKey, ActiveSkill>& getActiveSkills() const { return active_; }

		boost::optional<TargetInfo> getTarget(const UnitId& unit, Team team, int slot=0) const;
		const std::map<TargetKey, TargetInfo>& allTargets() const { return targets_; }
		int targetVersion() const { return target_version_; }

		std::map<SkillKey, std::string> colorModifiers() const;
		std::map<int, std::string> tileColorModifiers() const;
	private:
		void spawnCompanions(SpatialGrid& grid, ActiveSkill& skill);
		void raiseZone(SpatialGrid& grid, ActiveSkill& skill);
		void evictFromZone(SpatialGrid& grid, int tile_id, const ActiveSkill& skill);
		void restoreZone(SpatialGrid& grid, ActiveSkill& skill);
		void computeTargets(const SpatialGrid& grid, const ActiveSkill& skill);
		void setTileColor(const SkillKey& owner, int tile_id, const std::string& color);
		void clearTargets(const SkillKey& key);
		void releaseSkill(SpatialGrid& grid, ActiveSkill& skill);

		SkillRegistryPtr registry_;
		TargetResolver& resolver_;
		std::map<SkillKey, ActiveSkill> active_;
		std::map<TargetKey, TargetInfo> targets_;
		std::map<SkillKey, std::string> unit_colors_;
		std::map<int, std::pair<SkillKey, std::string>> tile_colors_;
		int target_version_;
	};
}
