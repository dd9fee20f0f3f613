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

#include "asserts.hpp"
#include "skill_engine.hpp"
#include "spatial_grid.hpp"
#include "unit_test.hpp"

namespace hex
{
	SkillDescriptor::SkillDescriptor()
		: unit_id(0),
		  strategy(SkillStrategy::CLOSEST),
		  side(TargetSide::OPPOSING),
		  exclude_self(false),
		  exclude_companions(false),
		  max_distance(0),
		  direction(ScanDirection::FRONTMOST),
		  slots(1),
		  companion_count(0),
		  companion_range(0)
	{
	}

	void SkillRegistry::add(const SkillDescriptor& desc)
	{
		ASSERT_LOG(desc.unit_id > 0, "Skill '" << desc.id << "' has no unit id");
		ASSERT_LOG(skills_.count(desc.unit_id) == 0, "Unit " << desc.unit_id << " already has a skill");
		ASSERT_LOG(desc.slots >= 1, "Skill '" << desc.id << "' needs at least one target slot");
		ASSERT_LOG(desc.strategy != SkillStrategy::COMPANION || desc.companion_count > 0, "Companion skill '" << desc.id << "' spawns no companions");
		ASSERT_LOG(desc.strategy != SkillStrategy::DEMOLITION_ZONE || !desc.zones.empty(), "Demolition skill '" << desc.id << "' has no zone");
		skills_[desc.unit_id] = desc;
	}

	const SkillDescriptor* SkillRegistry::find(int unit_id) const
	{
		auto it = skills_.find(unit_id);
		return it == skills_.end() ? nullptr : &it->second;
	}

	SkillManager::SkillManager(SkillRegistryPtr registry, TargetResolver& resolver)
		: registry_(registry),
		  resolver_(resolver),
		  target_version_(0)
	{
		ASSERT_LOG(registry_ != nullptr, "SkillManager needs a skill registry");
	}

	const SkillDescriptor* SkillManager::getDescriptor(const UnitId& unit) const
	{
		return unit.isCompanion() ? nullptr : registry_->find(unit.getMainId());
	}

	bool SkillManager::isActive(const UnitId& unit, Team team) const
	{
		return active_.count(SkillKey(unit, team)) != 0;
	}

	bool SkillManager::activate(SpatialGrid& grid, int tile_id, Team team, const UnitId& unit)
	{
		const SkillDescriptor* desc = getDescriptor(unit);
		if(desc == nullptr) {
			return true;
		}

		const SkillKey key(unit, team);
		if(isActive(unit, team)) {
			deactivate(grid, unit, team);
		}

		auto it = active_.insert(std::make_pair(key, ActiveSkill(unit, team, tile_id, desc))).first;
		ActiveSkill& skill = it->second;
		try {
			if(desc->strategy == SkillStrategy::COMPANION) {
				spawnCompanions(grid, skill);
			} else if(desc->strategy == SkillStrategy::DEMOLITION_ZONE) {
				raiseZone(grid, skill);
			}
			computeTargets(grid, skill);
		} catch(skill_activation_failure& e) {
			LOG_WARN("Skill '" << desc->id << "' of unit " << unit << " (" << team << ") failed to activate: " << e.msg);
			releaseSkill(grid, skill);
			active_.erase(it);
			return false;
		}

		LOG_DEBUG("Activated skill '" << desc->id << "' for unit " << unit << " (" << team << ") on tile " << tile_id);
		return true;
	}

	void SkillManager::spawnCompanions(SpatialGrid& grid, ActiveSkill& skill)
	{
		const SkillDescriptor& desc = *skill.desc;
		std::vector<int> free_tiles;
		for(const Tile& t : grid.getAllTiles()) {
			if(t.state == available_state(skill.team) && !t.hasUnit()) {
				free_tiles.push_back(t.id());
			}
		}
		std::sort(free_tiles.begin(), free_tiles.end());

		if(static_cast<int>(free_tiles.size()) < desc.companion_count) {
			throw skill_activation_failure("needs " + std::to_string(desc.companion_count) + " free tiles, found " + std::to_string(free_tiles.size()));
		}

		const int capacity = grid.getMaxTeamSize(skill.team);
		if(!grid.setMaxTeamSize(skill.team, capacity + desc.companion_count)) {
			throw skill_activation_failure("team capacity cannot grow to " + std::to_string(capacity + desc.companion_count));
		}
		skill.capacity_raise = desc.companion_count;

		for(int seq = 1; seq <= desc.companion_count; ++seq) {
			const UnitId companion = UnitId::makeCompanion(skill.unit.getMainId(), seq);
			if(!grid.placeUnit(free_tiles[seq - 1], companion, skill.team)) {
				throw skill_activation_failure("could not place companion " + companion.toString() + " on tile " + std::to_string(free_tiles[seq - 1]));
			}
			skill.companions.push_back(companion);
		}

		for(const UnitId& companion : skill.companions) {
			grid.addCompanionLink(skill.unit, skill.team, companion);
			if(!desc.companion_color.empty()) {
				unit_colors_[SkillKey(companion, skill.team)] = desc.companion_color;
			}
		}
		if(!desc.self_color.empty()) {
			unit_colors_[SkillKey(skill.unit, skill.team)] = desc.self_color;
		}
	}

	void SkillManager::raiseZone(SpatialGrid& grid, ActiveSkill& skill)
	{
		auto zone = skill.desc->zones.find(skill.team);
		if(zone == skill.desc->zones.end()) {
			return;
		}

		std::vector<std::pair<int, TileState>> paint;
		for(int id : zone->second.blocked) {
			paint.push_back(std::make_pair(id, TileState::BLOCKED));
		}
		for(int id : zone->second.breakable) {
			paint.push_back(std::make_pair(id, TileState::BLOCKED_BREAKABLE));
		}

		// Zone tiles missing from this board are skipped.
		std::set<int> affected;
		for(const auto& p : paint) {
			if(grid.findTileById(p.first) != nullptr) {
				affected.insert(p.first);
			}
		}

		boost::optional<int> relocation;
		if(affected.count(skill.tile_id)) {
			for(const Tile& t : grid.getAllTiles()) {
				if(t.state == available_state(skill.team) && !t.hasUnit() && affected.count(t.id()) == 0 && (!relocation || t.id() < *relocation)) {
					relocation = t.id();
				}
			}
			if(!relocation) {
				throw skill_activation_failure("no free tile outside the demolition zone for tile " + std::to_string(skill.tile_id));
			}
		}

		for(int id : affected) {
			const TileState state = grid.getTileById(id).state;
			skill.saved_states[id] = is_occupied_state(state) ? available_state(*SpatialGrid::teamForTileState(state)) : state;
		}

		for(int id : affected) {
			if(id != skill.tile_id) {
				evictFromZone(grid, id, skill);
			}
		}

		if(relocation) {
			if(!grid.removeUnit(skill.tile_id) || !grid.placeUnit(*relocation, skill.unit, skill.team, false)) {
				throw skill_activation_failure("could not move " + skill.unit.toString() + " to tile " + std::to_string(*relocation));
			}
			LOG_DEBUG("Unit " << skill.unit << " (" << skill.team << ") moved out of its demolition zone from tile " << skill.tile_id << " to " << *relocation);
			skill.tile_id = *relocation;
		}

		for(const auto& p : paint) {
			if(affected.count(p.first) && !grid.setOccupancyState(p.first, static_cast<int>(p.second))) {
				throw skill_activation_failure("could not paint tile " + std::to_string(p.first));
			}
		}
	}

	// A companion takes its owner and the owner's other companions with it.
	void SkillManager::evictFromZone(SpatialGrid& grid, int tile_id, const ActiveSkill& skill)
	{
		const Tile& t = grid.getTileById(tile_id);
		if(!t.hasUnit()) {
			return;
		}

		const UnitId unit = *t.unit;
		const Team team = *t.team;
		const UnitId main = unit.isCompanion() ? unit.getOwner() : unit;
		LOG_DEBUG("Demolition zone of " << skill.unit << " (" << skill.team << ") evicts " << unit << " (" << team << ") from tile " << tile_id);

		deactivate(grid, main, team);
		auto main_tile = grid.findUnitTile(main, team);
		if(main_tile) {
			grid.removeUnit(*main_tile);
		}
		if(grid.getTileById(tile_id).hasUnit()) {
			grid.removeUnit(tile_id);
		}
	}

	void SkillManager::restoreZone(SpatialGrid& grid, ActiveSkill& skill)
	{
		for(const auto& s : skill.saved_states) {
			if(!grid.setOccupancyState(s.first, static_cast<int>(s.second))) {
				LOG_WARN("Skill '" << skill.desc->id << "' could not restore tile " << s.first << " to " << s.second);
			}
		}
		skill.saved_states.clear();
	}

	void SkillManager::setTileColor(const SkillKey& owner, int tile_id, const std::string& color)
	{
		if(color.empty()) {
			return;
		}
		auto res = tile_colors_.insert(std::make_pair(tile_id, std::make_pair(owner, color)));
		if(!res.second) {
			res.first->second = std::make_pair(owner, color);
		}
	}

	void SkillManager::clearTargets(const SkillKey& key)
	{
		bool changed = false;
		for(auto it = targets_.begin(); it != targets_.end(); ) {
			if(std::get<0>(it->first) == key.first && std::get<1>(it->first) == key.second) {
				it = targets_.erase(it);
				changed = true;
			} else {
				++it;
			}
		}

		for(auto it = tile_colors_.begin(); it != tile_colors_.end(); ) {
			if(it->second.first == key) {
				it = tile_colors_.erase(it);
			} else {
				++it;
			}
		}

		if(changed) {
			++target_version_;
		}
	}

	void SkillManager::computeTargets(const SpatialGrid& grid, const ActiveSkill& skill)
	{
		const SkillDescriptor& desc = *skill.desc;
		const SkillKey key(skill.unit, skill.team);
		const Team target_team = desc.side == TargetSide::OWN ? skill.team : opposing_team(skill.team);
		const Caster caster(skill.tile_id, skill.unit, skill.team);

		std::vector<TargetInfo> found;
		boost::optional<TargetInfo> single;
		switch(desc.strategy) {
		case SkillStrategy::COMPANION:
			break;
		case SkillStrategy::CLOSEST:
			single = resolver_.findByDistance(grid, caster, target_team, false, desc.exclude_self);
			break;
		case SkillStrategy::FURTHEST:
			single = resolver_.findByDistance(grid, caster, target_team, true, desc.exclude_self);
			break;
		case SkillStrategy::REARMOST:
			single = resolver_.findRearmost(grid, caster, target_team, desc.exclude_self);
			break;
		case SkillStrategy::FRONTMOST:
			single = resolver_.findFrontmost(grid, caster, target_team);
			break;
		case SkillStrategy::REARMOST_MANY:
			found = resolver_.findRearmostMany(grid, caster, target_team, desc.slots);
			break;
		case SkillStrategy::ROW_SEARCH:
			single = resolver_.searchByRow(grid, caster, target_team);
			break;
		case SkillStrategy::ROW_SCAN:
			single = resolver_.rowScan(grid, caster, target_team, desc.direction, desc.exclude_companions, desc.max_distance);
			break;
		case SkillStrategy::MIRROR:
			single = resolver_.findMirror(grid, caster);
			break;
		case SkillStrategy::ADJACENT_MIRROR:
			single = resolver_.findAdjacentMirror(grid, caster);
			break;
		case SkillStrategy::ROW_AND_FURTHEST:
			single = resolver_.searchByRow(grid, caster, skill.team);
			if(!single) {
				single = resolver_.rowScan(grid, caster, skill.team, ScanDirection::FRONTMOST, false, 0);
			}
			// No opposing target without an own-team one.
			if(single) {
				found.push_back(*single);
				single = resolver_.findByDistance(grid, caster, opposing_team(skill.team), true, false);
			}
			break;
		case SkillStrategy::ADJACENT_BEHIND:
			single = resolver_.findAdjacentBehind(grid, caster);
			break;
		case SkillStrategy::DEMOLITION_ZONE:
			break;
		}
		if(single) {
			found.push_back(*single);
		}

		std::vector<std::pair<int, UnitId>> previous;
		for(int slot = 0; slot != desc.slots; ++slot) {
			auto it = targets_.find(TargetKey(skill.unit, skill.team, slot));
			if(it != targets_.end()) {
				previous.push_back(std::make_pair(it->second.target_tile_id, it->second.target_unit));
			}
		}

		std::vector<std::pair<int, UnitId>> current;
		for(const TargetInfo& info : found) {
			current.push_back(std::make_pair(info.target_tile_id, info.target_unit));
		}

		const int version = target_version_;
		clearTargets(key);
		for(int slot = 0; slot != static_cast<int>(found.size()); ++slot) {
			const TargetInfo& info = found[slot];
			targets_.insert(std::make_pair(TargetKey(skill.unit, skill.team, slot), info));
			if(desc.strategy == SkillStrategy::ROW_SCAN || desc.strategy == SkillStrategy::ADJACENT_BEHIND) {
				setTileColor(key, info.target_tile_id, desc.tile_color);
			} else if(desc.strategy == SkillStrategy::ADJACENT_MIRROR) {
				setTileColor(key, info.target_tile_id, desc.tile_color);
				auto mirror = info.metadata.find("mirror_tile");
				if(mirror != info.metadata.end()) {
					setTileColor(key, mirror->second, desc.tile_color);
				}
			}
		}
		target_version_ = previous == current ? version : version + 1;
	}

	void SkillManager::releaseSkill(SpatialGrid& grid, ActiveSkill& skill)
	{
		const SkillKey key(skill.unit, skill.team);
		unit_colors_.erase(key);
		for(const UnitId& companion : skill.companions) {
			unit_colors_.erase(SkillKey(companion, skill.team));
		}

		for(const UnitId& companion : skill.companions) {
			auto tile = grid.findUnitTile(companion, skill.team);
			if(tile) {
				grid.removeUnit(*tile);
			}
		}
		skill.companions.clear();
		grid.clearCompanionLinks(skill.unit, skill.team);

		if(skill.capacity_raise > 0) {
			const int wanted = grid.getMaxTeamSize(skill.team) - skill.capacity_raise;
			const int restored = std::max(wanted, std::max(1, grid.unitCount(skill.team)));
			if(restored != wanted) {
				LOG_WARN("Skill '" << skill.desc->id << "' could only restore " << skill.team << " capacity to " << restored << " instead of " << wanted);
			}
			if(!grid.setMaxTeamSize(skill.team, restored)) {
				LOG_WARN("Skill '" << skill.desc->id << "' could not restore " << skill.team << " capacity to " << restored);
			}
			skill.capacity_raise = 0;
		}

		restoreZone(grid, skill);
		clearTargets(key);
	}

	void SkillManager::deactivate(SpatialGrid& grid, const UnitId& unit, Team team)
	{
		auto it = active_.find(SkillKey(unit, team));
		if(it == active_.end()) {
			return;
		}

		LOG_DEBUG("Deactivating skill '" << it->second.desc->id << "' for unit " << unit << " (" << team << ")");
		releaseSkill(grid, it->second);
		active_.erase(it);
	}

	void SkillManager::updateActiveSkills(SpatialGrid& grid)
	{
		for(auto it = active_.begin(); it != active_.end(); ) {
			ActiveSkill& skill = it->second;
			auto tile = grid.findUnitTile(skill.unit, skill.team);
			if(!tile) {
				LOG_DEBUG("Unit " << skill.unit << " (" << skill.team << ") left the board, releasing skill '" << skill.desc->id << "'");
				releaseSkill(grid, skill);
				it = active_.erase(it);
				continue;
			}

			skill.tile_id = *tile;
			computeTargets(grid, skill);
			++it;
		}
	}

	void SkillManager::deactivateAll(SpatialGrid& grid)
	{
		while(!active_.empty()) {
			const SkillKey key = active_.begin()->first;
			deactivate(grid, key.first, key.second);
		}
	}

	boost::optional<TargetInfo> SkillManager::getTarget(const UnitId& unit, Team team, int slot) const
	{
		auto it = targets_.find(TargetKey(unit, team, slot));
		if(it == targets_.end()) {
			return boost::none;
		}
		return it->second;
	}

	std::map<SkillManager::SkillKey, std::string> SkillManager::colorModifiers() const
	{
		std::map<SkillKey, std::string> res;
		for(const auto& a : active_) {
			if(!a.second.desc->targeting_color.empty()) {
				res[a.first] = a.second.desc->targeting_color;
			}
		}
		for(const auto& c : unit_colors_) {
			res[c.first] = c.second;
		}
		return res;
	}

	std::map<int, std::string> SkillManager::tileColorModifiers() const
	{
		std::map<int, std::string> res;
		for(const auto& t : tile_colors_) {
			res[t.first] = t.second.second;
		}
		return res;
	}
}

namespace
{
	using hex::Team;
	using hex::UnitId;

	struct skill_fixture
	{
		explicit skill_fixture(int arena=1, int team_size=5)
			: grid(hex::BoardPreset::builtin("full", arena), team_size),
			  engine(nullptr),
			  resolver(engine),
			  skills(hex::SkillRegistry::builtin(), resolver)
		{}

		bool place(int tile, int unit, Team team) {
			return grid.placeUnit(tile, UnitId(unit), team) && skills.activate(grid, tile, team, UnitId(unit));
		}

		hex::SpatialGrid grid;
		hex::PathfindingEngine engine;
		hex::TargetResolver resolver;
		hex::SkillManager skills;
	};
}

UNIT_TEST(skill_companion_lifecycle)
{
	skill_fixture f;
	CHECK(f.place(1, 50, Team::ALLY), "phraesto");
	CHECK(f.skills.isActive(UnitId(50), Team::ALLY), "active");
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 6);
	CHECK_EQ(*f.grid.findUnitTile(UnitId(50, 1), Team::ALLY), 2);
	CHECK_EQ(f.grid.getCompanions(UnitId(50), Team::ALLY).size(), 1U);

	auto colors = f.skills.colorModifiers();
	CHECK_EQ(colors[hex::SkillManager::SkillKey(UnitId(50), Team::ALLY)], "#ffffff");
	CHECK_EQ(colors[hex::SkillManager::SkillKey(UnitId(50, 1), Team::ALLY)], "#c83232");

	f.skills.deactivate(f.grid, UnitId(50), Team::ALLY);
	CHECK(!f.skills.isActive(UnitId(50), Team::ALLY), "inactive");
	CHECK(!f.grid.hasUnit(UnitId(50, 1), Team::ALLY), "companion removed");
	CHECK(f.grid.hasUnit(UnitId(50), Team::ALLY), "main stays");
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 5);
	CHECK(f.grid.getCompanions(UnitId(50), Team::ALLY).empty(), "links cleared");
	CHECK(f.skills.colorModifiers().empty(), "colors cleared");
}

UNIT_TEST(skill_companion_failure_leaves_no_trace)
{
	// Arena "SP (S4)" has six ally tiles.
	skill_fixture f(7, 6);
	for(int tile : { 1, 2, 3, 4, 6 }) {
		CHECK(f.grid.placeUnit(tile, UnitId(tile), Team::ALLY), "fill " << tile);
	}
	CHECK(f.grid.placeUnit(8, UnitId(89), Team::ALLY), "zanie");
	const std::size_t before = f.grid.fingerprint();
	CHECK(!f.skills.activate(f.grid, 8, Team::ALLY, UnitId(89)), "no free tiles");
	CHECK_EQ(f.grid.fingerprint(), before);
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 6);
	CHECK(!f.skills.isActive(UnitId(89), Team::ALLY), "not active");

	// One free tile is not enough for two companions either.
	CHECK(f.grid.removeUnit(6), "free a tile");
	const std::size_t one_free = f.grid.fingerprint();
	CHECK(!f.skills.activate(f.grid, 8, Team::ALLY, UnitId(89)), "one free tile");
	CHECK_EQ(f.grid.fingerprint(), one_free);
	CHECK(f.grid.getCompanions(UnitId(89), Team::ALLY).empty(), "no links");
}

UNIT_TEST(skill_two_companions_restore_capacity)
{
	skill_fixture f;
	CHECK(f.place(1, 89, Team::ALLY), "zanie");
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 7);
	CHECK_EQ(*f.grid.findUnitTile(UnitId(89, 1), Team::ALLY), 2);
	CHECK_EQ(*f.grid.findUnitTile(UnitId(89, 2), Team::ALLY), 3);
	CHECK_EQ(f.grid.getCompanions(UnitId(89), Team::ALLY).size(), 2U);

	f.skills.deactivateAll(f.grid);
	CHECK_EQ(f.grid.unitCount(Team::ALLY), 1);
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 5);
}

UNIT_TEST(skill_owner_displaced_by_painting_releases_companions)
{
	skill_fixture f;
	CHECK(f.place(1, 89, Team::ALLY), "zanie");
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 7);

	// Painting over the owner bypasses the skill manager entirely.
	CHECK(f.grid.setOccupancyState(1, static_cast<int>(hex::TileState::BLOCKED)), "paint over zanie");
	CHECK(!f.grid.hasUnit(UnitId(89), Team::ALLY), "owner displaced");
	f.skills.updateActiveSkills(f.grid);

	CHECK(!f.skills.isActive(UnitId(89), Team::ALLY), "skill dropped");
	CHECK(!f.grid.hasUnit(UnitId(89, 1), Team::ALLY), "first companion removed");
	CHECK(!f.grid.hasUnit(UnitId(89, 2), Team::ALLY), "second companion removed");
	CHECK(f.grid.getCompanions(UnitId(89), Team::ALLY).empty(), "links cleared");
	CHECK_EQ(f.grid.unitCount(Team::ALLY), 0);
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 5);
	CHECK(f.skills.colorModifiers().empty(), "colors cleared");
}

UNIT_TEST(skill_targets_follow_the_board)
{
	skill_fixture f;
	CHECK(f.grid.placeUnit(30, UnitId(2), Team::ENEMY), "enemy");
	CHECK(f.grid.placeUnit(45, UnitId(3), Team::ENEMY), "enemy");
	CHECK(f.place(5, 46, Team::ALLY), "vala");
	CHECK_EQ(f.skills.getTarget(UnitId(46), Team::ALLY)->target_tile_id, 45);
	const int version = f.skills.targetVersion();

	f.skills.updateActiveSkills(f.grid);
	CHECK_EQ(f.skills.targetVersion(), version);

	CHECK(f.grid.removeUnit(45), "remove furthest");
	f.skills.updateActiveSkills(f.grid);
	CHECK_EQ(f.skills.getTarget(UnitId(46), Team::ALLY)->target_tile_id, 30);
	CHECK_GT(f.skills.targetVersion(), version);

	CHECK(f.grid.removeUnit(30), "remove last enemy");
	f.skills.updateActiveSkills(f.grid);
	CHECK(!f.skills.getTarget(UnitId(46), Team::ALLY), "no target left");
	CHECK(f.skills.isActive(UnitId(46), Team::ALLY), "still active");

	CHECK(f.grid.removeUnit(5), "caster leaves");
	f.skills.updateActiveSkills(f.grid);
	CHECK(!f.skills.isActive(UnitId(46), Team::ALLY), "dropped");
}

UNIT_TEST(skill_multi_slot_and_tile_colors)
{
	skill_fixture f(1, 8);
	for(int tile : { 1, 2, 9 }) {
		CHECK(f.grid.placeUnit(tile, UnitId(tile + 100), Team::ALLY), "ally " << tile);
	}
	CHECK(f.place(5, 90, Team::ALLY), "ravion");
	CHECK_EQ(f.skills.getTarget(UnitId(90), Team::ALLY, 0)->target_tile_id, 1);
	CHECK_EQ(f.skills.getTarget(UnitId(90), Team::ALLY, 1)->target_tile_id, 2);
	CHECK(!f.skills.getTarget(UnitId(90), Team::ALLY, 2), "two slots only");

	skill_fixture r;
	CHECK(r.grid.placeUnit(12, UnitId(12), Team::ALLY), "ally");
	CHECK(r.grid.placeUnit(33, UnitId(2), Team::ENEMY), "enemy");
	CHECK(r.place(9, 31, Team::ALLY), "reinier");
	CHECK_EQ(r.skills.getTarget(UnitId(31), Team::ALLY)->target_tile_id, 12);
	auto tiles = r.skills.tileColorModifiers();
	CHECK_EQ(tiles.size(), 2U);
	CHECK_EQ(tiles[12], "#9925be");
	CHECK_EQ(tiles[33], "#9925be");

	r.skills.deactivate(r.grid, UnitId(31), Team::ALLY);
	CHECK(r.skills.tileColorModifiers().empty(), "tile colors cleared");
	CHECK(r.skills.allTargets().empty(), "targets cleared");
}

UNIT_TEST(skill_units_without_skills)
{
	skill_fixture f;
	CHECK(f.place(1, 7, Team::ALLY), "plain unit");
	CHECK(!f.skills.isActive(UnitId(7), Team::ALLY), "nothing to activate");
	CHECK(f.skills.activate(f.grid, 2, Team::ALLY, UnitId(50, 1)), "companions have no skill");
}

UNIT_TEST(skill_row_and_furthest_needs_an_own_target)
{
	skill_fixture f;
	CHECK(f.grid.placeUnit(8, UnitId(8), Team::ALLY), "ally");
	CHECK(f.grid.placeUnit(10, UnitId(10), Team::ALLY), "ally");
	CHECK(f.grid.placeUnit(30, UnitId(2), Team::ENEMY), "enemy");
	CHECK(f.grid.placeUnit(45, UnitId(3), Team::ENEMY), "enemy");
	CHECK(f.place(9, 91, Team::ALLY), "aliceth");
	CHECK_EQ(f.skills.getTarget(UnitId(91), Team::ALLY, 0)->target_tile_id, 10);
	CHECK_EQ(f.skills.getTarget(UnitId(91), Team::ALLY, 1)->target_tile_id, 45);

	// Nobody left in the row: the nearest ring is scanned from the highest id.
	CHECK(f.grid.removeUnit(8), "remove");
	CHECK(f.grid.removeUnit(10), "remove");
	CHECK(f.grid.placeUnit(4, UnitId(4), Team::ALLY), "ally");
	CHECK(f.grid.placeUnit(16, UnitId(16), Team::ALLY), "ally");
	f.skills.updateActiveSkills(f.grid);
	CHECK_EQ(f.skills.getTarget(UnitId(91), Team::ALLY, 0)->target_tile_id, 16);
	CHECK_EQ(f.skills.getTarget(UnitId(91), Team::ALLY, 1)->target_tile_id, 45);

	CHECK(f.grid.removeUnit(4), "remove");
	CHECK(f.grid.removeUnit(16), "remove");
	f.skills.updateActiveSkills(f.grid);
	CHECK(!f.skills.getTarget(UnitId(91), Team::ALLY, 0), "no ally");
	CHECK(!f.skills.getTarget(UnitId(91), Team::ALLY, 1), "no enemy target without an ally");
	CHECK(f.skills.isActive(UnitId(91), Team::ALLY), "still active");
}

UNIT_TEST(skill_adjacent_behind_colors_its_target)
{
	skill_fixture f;
	CHECK(f.grid.placeUnit(6, UnitId(6), Team::ALLY), "ally");
	CHECK(f.grid.placeUnit(7, UnitId(7), Team::ALLY), "ally");
	CHECK(f.place(9, 81, Team::ALLY), "daimon");
	CHECK_EQ(f.skills.getTarget(UnitId(81), Team::ALLY)->target_tile_id, 7);
	auto tiles = f.skills.tileColorModifiers();
	CHECK_EQ(tiles.size(), 1U);
	CHECK_EQ(tiles[7], "#6d9c86");

	CHECK(f.grid.placeUnit(4, UnitId(4), Team::ALLY), "ally straight behind");
	f.skills.updateActiveSkills(f.grid);
	CHECK_EQ(f.skills.getTarget(UnitId(81), Team::ALLY)->target_tile_id, 4);
	tiles = f.skills.tileColorModifiers();
	CHECK_EQ(tiles.size(), 1U);
	CHECK_EQ(tiles.count(4), 1U);

	f.skills.deactivate(f.grid, UnitId(81), Team::ALLY);
	CHECK(f.skills.tileColorModifiers().empty(), "tile colors cleared");
}

UNIT_TEST(skill_demolition_zone_evicts_and_restores)
{
	// Arena "SP (S5)" has ally tiles 21 and 28 and enemy tile 18.
	skill_fixture f(8, 12);
	CHECK(f.grid.placeUnit(21, UnitId(7), Team::ALLY), "ally in the zone");
	CHECK(f.grid.placeUnit(18, UnitId(3), Team::ENEMY), "enemy in the zone");
	CHECK(f.grid.placeUnit(28, UnitId(8), Team::ALLY), "ally outside the zone");
	CHECK(f.place(1, 80, Team::ALLY), "kulu");

	CHECK(!f.grid.hasUnit(UnitId(7), Team::ALLY), "ally evicted");
	CHECK(!f.grid.hasUnit(UnitId(3), Team::ENEMY), "enemy evicted");
	CHECK(f.grid.hasUnit(UnitId(8), Team::ALLY), "ally outside stays");
	CHECK(f.grid.getTileById(21).state == hex::TileState::BLOCKED, "21 blocked");
	CHECK(f.grid.getTileById(18).state == hex::TileState::BLOCKED, "18 blocked");
	CHECK(f.grid.getTileById(23).state == hex::TileState::BLOCKED_BREAKABLE, "23 breakable");
	CHECK_EQ(*f.grid.findUnitTile(UnitId(80), Team::ALLY), 1);

	f.skills.deactivate(f.grid, UnitId(80), Team::ALLY);
	CHECK(f.grid.getTileById(21).state == hex::TileState::AVAILABLE_ALLY, "21 restored as a free tile");
	CHECK(f.grid.getTileById(18).state == hex::TileState::AVAILABLE_ENEMY, "18 restored as a free tile");
	CHECK(f.grid.getTileById(22).state == hex::TileState::BLOCKED, "22 was already blocked");
	CHECK(f.grid.getTileById(23).state == f.grid.getPreset().initialState(23), "23 restored");
	CHECK(!f.grid.hasUnit(UnitId(7), Team::ALLY), "evicted units stay off the board");
	CHECK_EQ(f.grid.unitCount(Team::ALLY), 2);
}

UNIT_TEST(skill_demolition_zone_moves_its_owner)
{
	skill_fixture f(8, 12);
	CHECK(f.place(21, 80, Team::ALLY), "kulu inside its own zone");
	CHECK_EQ(*f.grid.findUnitTile(UnitId(80), Team::ALLY), 1);
	CHECK_EQ(f.skills.getActiveSkills().at(hex::SkillManager::SkillKey(UnitId(80), Team::ALLY)).tile_id, 1);
	CHECK(f.grid.getTileById(21).state == hex::TileState::BLOCKED, "old tile blocked");

	// Every other ally tile is taken, so there is nowhere to go.
	skill_fixture g(8, 12);
	for(int tile : { 1, 2, 3, 4, 5, 6, 7, 8, 9, 16, 28 }) {
		CHECK(g.grid.placeUnit(tile, UnitId(tile + 100), Team::ALLY), "fill " << tile);
	}
	CHECK(g.grid.placeUnit(21, UnitId(80), Team::ALLY), "kulu");
	const std::size_t before = g.grid.fingerprint();
	CHECK(!g.skills.activate(g.grid, 21, Team::ALLY, UnitId(80)), "no tile to move to");
	CHECK_EQ(g.grid.fingerprint(), before);
	CHECK(!g.skills.isActive(UnitId(80), Team::ALLY), "not active");
	CHECK_EQ(*g.grid.findUnitTile(UnitId(80), Team::ALLY), 21);
}

UNIT_TEST(skill_demolition_zone_evicts_companion_owner)
{
	skill_fixture f(8, 12);
	for(int tile : { 2, 3, 4, 5, 6, 7, 8, 9, 16 }) {
		CHECK(f.grid.placeUnit(tile, UnitId(tile + 100), Team::ALLY), "fill " << tile);
	}
	CHECK(f.grid.placeUnit(1, UnitId(80), Team::ALLY), "kulu");
	CHECK(f.place(28, 50, Team::ALLY), "phraesto");
	CHECK_EQ(*f.grid.findUnitTile(UnitId(50, 1), Team::ALLY), 21);
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 13);

	CHECK(f.skills.activate(f.grid, 1, Team::ALLY, UnitId(80)), "kulu");
	CHECK(!f.skills.isActive(UnitId(50), Team::ALLY), "owner skill released");
	CHECK(!f.grid.hasUnit(UnitId(50), Team::ALLY), "owner removed");
	CHECK(!f.grid.hasUnit(UnitId(50, 1), Team::ALLY), "companion removed");
	CHECK_EQ(f.grid.getMaxTeamSize(Team::ALLY), 12);
	CHECK_EQ(f.grid.unitCount(Team::ALLY), 10);
	CHECK(f.skills.colorModifiers().empty(), "colors cleared");
}

UNIT_TEST(skill_shared_tile_color_last_writer_wins)
{
	skill_fixture f;
	CHECK(f.grid.placeUnit(7, UnitId(7), Team::ALLY), "ally");
	CHECK(f.place(9, 81, Team::ALLY), "daimon");
	CHECK(f.place(13, 10, Team::ALLY), "cassadee");
	CHECK_EQ(f.skills.getTarget(UnitId(81), Team::ALLY)->target_tile_id, 7);
	CHECK_EQ(f.skills.getTarget(UnitId(10), Team::ALLY)->target_tile_id, 7);
	auto tiles = f.skills.tileColorModifiers();
	CHECK_EQ(tiles.size(), 1U);
	CHECK_EQ(tiles[7], "#4fc3f7");

	// Skills are recomputed in (unit, team) order, so daimon paints last.
	f.skills.updateActiveSkills(f.grid);
	tiles = f.skills.tileColorModifiers();
	CHECK_EQ(tiles.size(), 1U);
	CHECK_EQ(tiles[7], "#6d9c86");
}
