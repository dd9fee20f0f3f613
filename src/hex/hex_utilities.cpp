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

#include <iomanip>
#include <iostream>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "asserts.hpp"
#include "board_preset.hpp"
#include "hex_pathfinding.hpp"
#include "preferences.hpp"
#include "skill_engine.hpp"
#include "spatial_grid.hpp"
#include "target_resolver.hpp"
#include "transaction.hpp"
#include "unit_test.hpp"

namespace
{
	PREF_STRING(board_preset, "", "JSON board preset used by the command-line utilities instead of the built-in board");
	PREF_INT(arena, 1, "Built-in arena painted on the board used by the command-line utilities");

	hex::BoardPresetPtr utility_board()
	{
		if(!g_board_preset.empty()) {
			return hex::BoardPreset::fromJsonFile(g_board_preset);
		}
		return hex::BoardPreset::builtin("full", g_arena);
	}

	hex::Team parse_team(const std::string& s)
	{
		if(s == "ally" || s == "a") {
			return hex::Team::ALLY;
		}
		ASSERT_LOG(s == "enemy" || s == "e", "Unknown team '" << s << "', expected ally or enemy");
		return hex::Team::ENEMY;
	}

	struct placement
	{
		int tile_id;
		hex::UnitId unit;
		hex::Team team;
		int range;
	};

	// tile:unit:team[:range]
	placement parse_placement(const std::string& arg)
	{
		std::vector<std::string> parts;
		boost::split(parts, arg, boost::is_any_of(":"));
		ASSERT_LOG(parts.size() == 3 || parts.size() == 4, "Bad placement '" << arg << "', expected tile:unit:team[:range]");

		try {
			placement res = {
				boost::lexical_cast<int>(parts[0]),
				hex::UnitId(boost::lexical_cast<int>(parts[1])),
				parse_team(parts[2]),
				parts.size() == 4 ? boost::lexical_cast<int>(parts[3]) : 1,
			};
			return res;
		} catch(boost::bad_lexical_cast&) {
			ASSERT_LOG(false, "Bad number in placement '" << arg << "'");
		}
		return placement{ 0, hex::UnitId(1), hex::Team::ALLY, 1 };
	}
}

COMMAND_LINE_UTILITY(board_dump)
{
	hex::SpatialGrid grid(utility_board());
	const hex::BoardPreset& preset = grid.getPreset();
	std::cout << "board " << preset.name() << ": " << preset.tileCount() << " tiles\n";
	for(const hex::Tile& t : grid.getAllTiles()) {
		const auto mirror = preset.mirrorOf(t.id());
		std::cout << std::setw(3) << t.id() << "  " << std::setw(10) << t.coord.toString()
			<< "  " << std::setw(18) << t.state
			<< "  row " << std::setw(2) << preset.diagonalRow(t.id())
			<< "  mirror " << (mirror ? std::to_string(*mirror) : "-") << "\n";
	}

	std::cout << "diagonal rows:\n";
	int row = 1;
	for(const std::vector<int>& ids : preset.getDiagonalRows()) {
		std::cout << std::setw(3) << row++ << ":";
		for(int id : ids) {
			std::cout << " " << id;
		}
		std::cout << "\n";
	}
}

COMMAND_LINE_UTILITY(closest_targets)
{
	hex::SpatialGrid grid(utility_board());
	hex::PathfindingEngine engine;
	hex::TargetResolver resolver(engine);
	hex::SkillManager skills(hex::SkillRegistry::builtin(), resolver);
	hex::TransactionCoordinator coordinator(grid, skills, engine);

	hex::RangeTable ranges;
	for(const std::string& arg : args) {
		const placement p = parse_placement(arg);
		if(!coordinator.place(p.tile_id, p.unit, p.team)) {
			LOG_ERROR("Could not place unit " << p.unit << " (" << p.team << ") on tile " << p.tile_id);
			continue;
		}
		ranges[p.unit.getMainId()] = p.range;
	}

	for(hex::Team team : { hex::Team::ALLY, hex::Team::ENEMY }) {
		const hex::ClosestTargetMap targets = resolver.closestTargetMap(grid, team, hex::opposing_team(team), ranges, &skills.getRegistry());
		std::cout << team << ":\n";
		for(const auto& entry : targets) {
			const hex::Tile& src = grid.getTileById(entry.first);
			std::cout << "  " << *src.unit << " @" << entry.first << " -> tile " << entry.second.tile_id
				<< " (" << *grid.getTileById(entry.second.tile_id).unit << ") in " << entry.second.movement << " moves\n";
		}
	}

	for(const auto& t : skills.allTargets()) {
		std::cout << "skill " << std::get<0>(t.first) << " (" << std::get<1>(t.first) << ") slot " << std::get<2>(t.first)
			<< " -> tile " << t.second.target_tile_id << "\n";
	}
}

COMMAND_LINE_UTILITY(skill_catalog)
{
	boost::property_tree::write_json(std::cout, hex::SkillRegistry::builtin()->toPtree());
}

UNIT_TEST(utility_placement_parsing)
{
	const placement p = parse_placement("9:68:ally:2");
	CHECK_EQ(p.tile_id, 9);
	CHECK_EQ(p.unit, hex::UnitId(68));
	CHECK(p.team == hex::Team::ALLY, "team");
	CHECK_EQ(p.range, 2);
	CHECK_EQ(parse_placement("33:4:enemy").range, 1);

	CHECK_ASSERTS(parse_placement("33:x:enemy"), "bad number accepted");
	CHECK_ASSERTS(parse_placement("33:4:neutral"), "unknown team accepted");
}
