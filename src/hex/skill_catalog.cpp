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

#include <boost/property_tree/ptree.hpp>

#include "asserts.hpp"
#include "skill_engine.hpp"
#include "unit_test.hpp"

namespace hex
{
	namespace
	{
		SkillDescriptor make_skill(int unit_id, const std::string& id, const std::string& name, SkillStrategy strategy, TargetSide side)
		{
			SkillDescriptor res;
			res.unit_id = unit_id;
			res.id = id;
			res.name = name;
			res.strategy = strategy;
			res.side = side;
			return res;
		}

		SkillDescriptor companion_skill(int unit_id, const std::string& id, const std::string& name, int count, int range)
		{
			SkillDescriptor res = make_skill(unit_id, id, name, SkillStrategy::COMPANION, TargetSide::OWN);
			res.companion_count = count;
			res.companion_range = range;
			return res;
		}

		SkillDescriptor targeting_skill(int unit_id, const std::string& id, const std::string& name, SkillStrategy strategy, TargetSide side, const std::string& color)
		{
			SkillDescriptor res = make_skill(unit_id, id, name, strategy, side);
			res.targeting_color = color;
			return res;
		}

		SkillDescriptor row_scan_skill(int unit_id, const std::string& id, const std::string& name, const std::string& tile_color)
		{
			SkillDescriptor res = make_skill(unit_id, id, name, SkillStrategy::ROW_SCAN, TargetSide::OWN);
			res.direction = ScanDirection::REARMOST;
			res.tile_color = tile_color;
			return res;
		}

		const char* to_string(TargetSide side)
		{
			return side == TargetSide::OWN ? "own" : "opposing";
		}

		const char* to_string(ScanDirection d)
		{
			return d == ScanDirection::FRONTMOST ? "frontmost" : "rearmost";
		}

		DemolitionZone demolition_zone(const std::vector<int>& blocked, const std::vector<int>& breakable)
		{
			DemolitionZone res;
			res.blocked = blocked;
			res.breakable = breakable;
			return res;
		}

		boost::property_tree::ptree id_list(const std::vector<int>& ids)
		{
			boost::property_tree::ptree res;
			for(int id : ids) {
				boost::property_tree::ptree v;
				v.put_value(id);
				res.push_back(std::make_pair("", v));
			}
			return res;
		}
	}

	const char* to_string(SkillStrategy s)
	{
		switch(s) {
		case SkillStrategy::COMPANION:       return "companion";
		case SkillStrategy::CLOSEST:         return "closest";
		case SkillStrategy::FURTHEST:        return "furthest";
		case SkillStrategy::REARMOST:        return "rearmost";
		case SkillStrategy::FRONTMOST:       return "frontmost";
		case SkillStrategy::REARMOST_MANY:   return "rearmost_many";
		case SkillStrategy::ROW_SEARCH:      return "row_search";
		case SkillStrategy::ROW_SCAN:        return "row_scan";
		case SkillStrategy::MIRROR:          return "mirror";
		case SkillStrategy::ADJACENT_MIRROR: return "adjacent_mirror";
		case SkillStrategy::ROW_AND_FURTHEST: return "row_and_furthest";
		case SkillStrategy::ADJACENT_BEHIND: return "adjacent_behind";
		case SkillStrategy::DEMOLITION_ZONE: return "demolition_zone";
		}
		ASSERT_FATAL("Unknown skill strategy " << static_cast<int>(s));
	}

	boost::property_tree::ptree SkillRegistry::toPtree() const
	{
		using boost::property_tree::ptree;
		ptree skills;
		for(const auto& entry : skills_) {
			const SkillDescriptor& d = entry.second;
			ptree node;
			node.put("unit", d.unit_id);
			node.put("id", d.id);
			node.put("name", d.name);
			node.put("strategy", to_string(d.strategy));
			node.put("side", to_string(d.side));
			if(d.exclude_self) {
				node.put("exclude_self", true);
			}
			if(d.exclude_companions) {
				node.put("exclude_companions", true);
			}
			if(d.strategy == SkillStrategy::ROW_SCAN) {
				node.put("direction", to_string(d.direction));
				if(d.max_distance > 0) {
					node.put("max_distance", d.max_distance);
				}
			}
			if(d.slots > 1) {
				node.put("slots", d.slots);
			}
			if(d.companion_count > 0) {
				node.put("companion_count", d.companion_count);
			}
			if(d.companion_range > 0) {
				node.put("companion_range", d.companion_range);
			}
			for(const auto& z : d.zones) {
				ptree zone;
				zone.add_child("blocked", id_list(z.second.blocked));
				zone.add_child("breakable", id_list(z.second.breakable));
				node.add_child(std::string("zones.") + to_string(z.first), zone);
			}

			const std::pair<const char*, const std::string*> colors[] = {
				{ "self_color", &d.self_color },
				{ "companion_color", &d.companion_color },
				{ "targeting_color", &d.targeting_color },
				{ "tile_color", &d.tile_color },
			};
			for(const auto& c : colors) {
				if(!c.second->empty()) {
					node.put(c.first, *c.second);
				}
			}
			skills.push_back(std::make_pair("", node));
		}

		ptree res;
		res.add_child("skills", skills);
		return res;
	}

	SkillRegistryPtr SkillRegistry::builtin()
	{
		auto res = std::make_shared<SkillRegistry>();

		SkillDescriptor phraesto = companion_skill(50, "phraesto", "Phraesto", 1, 0);
		phraesto.self_color = "#ffffff";
		phraesto.companion_color = "#c83232";
		res->add(phraesto);

		SkillDescriptor elijah = companion_skill(68, "elijah-lailah", "Elijah & Lailah", 1, 1);
		elijah.self_color = "#6ca3a0";
		elijah.companion_color = "#cd7169";
		res->add(elijah);

		res->add(companion_skill(89, "zanie", "Zanie", 2, 3));

		res->add(targeting_skill(46, "vala", "Vala", SkillStrategy::FURTHEST, TargetSide::OPPOSING, "#9661f1"));

		SkillDescriptor dunlingr = targeting_skill(57, "dunlingr", "Dunlingr", SkillStrategy::FURTHEST, TargetSide::OWN, "#ffa000");
		dunlingr.exclude_self = true;
		res->add(dunlingr);

		res->add(targeting_skill(66, "bonnie", "Bonnie", SkillStrategy::REARMOST, TargetSide::OPPOSING, "#98be5d"));

		SkillDescriptor pandora = targeting_skill(85, "pandora", "Pandora", SkillStrategy::REARMOST, TargetSide::OWN, "#9661f1");
		pandora.exclude_self = true;
		res->add(pandora);

		res->add(targeting_skill(93, "isabella", "Isabella", SkillStrategy::FRONTMOST, TargetSide::OWN, "#6d9c86"));
		res->add(targeting_skill(52, "talene", "Talene", SkillStrategy::FRONTMOST, TargetSide::OWN, "#c83232"));

		res->add(row_scan_skill(10, "cassadee", "Cassadee", "#4fc3f7"));

		SkillDescriptor faramor = row_scan_skill(75, "faramor", "Faramor", "#6d9c86");
		faramor.max_distance = 1;
		res->add(faramor);

		SkillDescriptor galahad = row_scan_skill(99, "galahad", "Galahad", "#e57373");
		galahad.exclude_companions = true;
		res->add(galahad);

		res->add(targeting_skill(100, "alna", "Alna", SkillStrategy::ROW_SEARCH, TargetSide::OWN, "#4fc3f7"));

		SkillDescriptor ravion = targeting_skill(90, "ravion", "Ravion", SkillStrategy::REARMOST_MANY, TargetSide::OWN, "#6d9c86");
		ravion.exclude_self = true;
		ravion.slots = 2;
		res->add(ravion);

		SkillDescriptor reinier = make_skill(31, "reinier", "Reinier", SkillStrategy::ADJACENT_MIRROR, TargetSide::OWN);
		reinier.tile_color = "#9925be";
		res->add(reinier);

		SkillDescriptor aliceth = targeting_skill(91, "aliceth", "Aliceth", SkillStrategy::ROW_AND_FURTHEST, TargetSide::OWN, "#ffa000");
		aliceth.slots = 2;
		res->add(aliceth);

		SkillDescriptor daimon = make_skill(81, "daimon", "Daimon", SkillStrategy::ADJACENT_BEHIND, TargetSide::OWN);
		daimon.tile_color = "#6d9c86";
		res->add(daimon);

		SkillDescriptor kulu = make_skill(80, "kulu", "Kulu", SkillStrategy::DEMOLITION_ZONE, TargetSide::OWN);
		kulu.zones[Team::ALLY] = demolition_zone({ 18, 19, 20, 21, 22, 24 }, { 23 });
		kulu.zones[Team::ENEMY] = demolition_zone({ 25, 26, 27, 28, 22, 24 }, { 23 });
		res->add(kulu);

		res->add(targeting_skill(39, "silvina", "Silvina", SkillStrategy::MIRROR, TargetSide::OPPOSING, "#000000"));
		res->add(targeting_skill(58, "nara", "Nara", SkillStrategy::MIRROR, TargetSide::OPPOSING, "#98be5d"));

		return res;
	}
}

UNIT_TEST(skill_catalog_contents)
{
	using namespace hex;
	SkillRegistryPtr registry = SkillRegistry::builtin();
	CHECK_EQ(registry->getAll().size(), 20U);
	CHECK(registry->find(7) == nullptr, "plain units have no skill");

	const SkillDescriptor* zanie = registry->find(89);
	CHECK(zanie != nullptr, "zanie");
	CHECK(zanie->strategy == SkillStrategy::COMPANION, to_string(zanie->strategy));
	CHECK_EQ(zanie->companion_count, 2);
	CHECK_EQ(zanie->companion_range, 3);

	const SkillDescriptor* faramor = registry->find(75);
	CHECK(faramor->direction == ScanDirection::REARMOST, "faramor scans from the rear");
	CHECK_EQ(faramor->max_distance, 1);
	CHECK_EQ(registry->find(99)->exclude_companions, true);
	CHECK_EQ(registry->find(90)->slots, 2);
	CHECK_EQ(registry->find(31)->tile_color, "#9925be");
	CHECK_EQ(registry->find(50)->companion_range, 0);
	CHECK_EQ(registry->find(91)->slots, 2);
	CHECK(registry->find(81)->strategy == SkillStrategy::ADJACENT_BEHIND, to_string(registry->find(81)->strategy));
	CHECK_EQ(registry->find(81)->tile_color, "#6d9c86");

	const SkillDescriptor* kulu = registry->find(80);
	CHECK_EQ(kulu->zones.size(), 2U);
	CHECK_EQ(kulu->zones.at(Team::ALLY).blocked.size(), 6U);
	CHECK_EQ(kulu->zones.at(Team::ENEMY).breakable.front(), 23);

	// Each call builds an independent catalog.
	SkillRegistryPtr other = SkillRegistry::builtin();
	CHECK(registry != other, "builtin catalog must not be shared");
	CHECK(registry->find(89) != other->find(89), "descriptors belong to their own catalog");
	CHECK_EQ(other->getAll().size(), registry->getAll().size());
}

UNIT_TEST(skill_catalog_to_ptree)
{
	using namespace hex;
	const boost::property_tree::ptree pt = SkillRegistry::builtin()->toPtree();
	CHECK_EQ(pt.get_child("skills").size(), 20U);

	// Entries are ordered by unit id.
	const boost::property_tree::ptree& first = pt.get_child("skills").front().second;
	CHECK_EQ(first.get<int>("unit"), 10);
	CHECK_EQ(first.get<std::string>("strategy"), "row_scan");
	CHECK_EQ(first.get<std::string>("direction"), "rearmost");
	CHECK_EQ(first.get<std::string>("tile_color"), "#4fc3f7");
	CHECK(!first.get_optional<int>("slots"), "single slot is implicit");

	bool saw_zone = false;
	for(const auto& s : pt.get_child("skills")) {
		if(s.second.get<int>("unit") == 80) {
			saw_zone = true;
			CHECK_EQ(s.second.get_child("zones.ally.blocked").size(), 6U);
			CHECK_EQ(s.second.get_child("zones.enemy.breakable").front().second.get_value<int>(), 23);
		}
	}
	CHECK(saw_zone, "demolition zone exported");
}

UNIT_TEST(skill_registry_rejects_duplicates)
{
	using namespace hex;
	SkillRegistry registry;
	SkillDescriptor d;
	d.unit_id = 12;
	d.id = "test";
	registry.add(d);

	CHECK_ASSERTS(registry.add(d), "duplicate skill accepted");
	d.unit_id = 13;
	d.slots = 0;
	CHECK_ASSERTS(registry.add(d), "a skill without target slots accepted");
	d.slots = 1;
	d.strategy = SkillStrategy::DEMOLITION_ZONE;
	CHECK_ASSERTS(registry.add(d), "a demolition skill without a zone accepted");
	CHECK_EQ(registry.getAll().size(), 1U);
}
