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
#include <sstream>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "asserts.hpp"
#include "board_preset.hpp"
#include "unit_test.hpp"

namespace hex
{
	namespace
	{
		std::vector<BoardRow> full_grid_rows()
		{
			return {
				BoardRow(2, { 43, 45 }),
				BoardRow(0, { 35, 38, 40, 42, 44 }),
				BoardRow(-1, { 28, 31, 34, 37, 39, 41 }),
				BoardRow(-2, { 21, 24, 27, 30, 33, 36 }),
				BoardRow(-3, { 14, 17, 20, 23, 26, 29, 32 }),
				BoardRow(-3, { 10, 13, 16, 19, 22, 25 }),
				BoardRow(-4, { 5, 7, 9, 12, 15, 18 }),
				BoardRow(-4, { 2, 4, 6, 8, 11 }),
				BoardRow(-3, { 1, 3 }),
			};
		}

		std::vector<BoardRow> full_grid_flat_rows()
		{
			return {
				BoardRow(1, { 44, 41 }),
				BoardRow(-1, { 45, 42, 39, 36, 32 }),
				BoardRow(-2, { 43, 40, 37, 33, 29, 25 }),
				BoardRow(-2, { 38, 34, 30, 26, 22, 18 }),
				BoardRow(-3, { 35, 31, 27, 23, 19, 15, 11 }),
				BoardRow(-3, { 28, 24, 20, 16, 12, 8 }),
				BoardRow(-3, { 21, 17, 13, 9, 6, 3 }),
				BoardRow(-3, { 14, 10, 7, 4, 1 }),
				BoardRow(-2, { 5, 2 }),
			};
		}

		Arena make_arena(int id, const std::string& name,
			const std::vector<int>& ally, const std::vector<int>& enemy,
			const std::vector<int>& blocked, const std::vector<int>& breakable)
		{
			Arena a;
			a.id = id;
			a.name = name;
			a.tiles[TileState::AVAILABLE_ALLY] = ally;
			a.tiles[TileState::AVAILABLE_ENEMY] = enemy;
			a.tiles[TileState::BLOCKED] = blocked;
			a.tiles[TileState::BLOCKED_BREAKABLE] = breakable;
			return a;
		}

		const std::map<std::string, TileState>& tile_state_keys()
		{
			static const std::map<std::string, TileState> res = {
				{ "available_ally", TileState::AVAILABLE_ALLY },
				{ "available_enemy", TileState::AVAILABLE_ENEMY },
				{ "blocked", TileState::BLOCKED },
				{ "blocked_breakable", TileState::BLOCKED_BREAKABLE },
			};
			return res;
		}

		std::vector<int> read_int_list(const boost::property_tree::ptree& pt)
		{
			std::vector<int> res;
			for(const auto& v : pt) {
				res.push_back(v.second.get_value<int>());
			}
			return res;
		}
	}

	BoardPreset::BoardPreset(const std::string& name, const std::vector<BoardRow>& rows, const std::vector<std::vector<int>>& diagonal_rows)
		: name_(name),
		  diagonal_rows_(diagonal_rows)
	{
		const int center_row = static_cast<int>(rows.size()) / 2;
		for(int row_index = 0; row_index != static_cast<int>(rows.size()); ++row_index) {
			const BoardRow& row = rows[row_index];
			const int r = row_index - center_row;
			for(int i = 0; i != static_cast<int>(row.ids.size()); ++i) {
				const int q = row.q_offset + i;
				const int id = row.ids[i];
				ASSERT_LOG(id > 0, "Board '" << name << "': tile ids must be positive, found " << id);
				ASSERT_LOG(index_by_id_.count(id) == 0, "Board '" << name << "': duplicate tile id " << id);
				ASSERT_LOG(index_by_qr_.count(std::make_pair(q, r)) == 0, "Board '" << name << "': two ids at coordinate " << q << "," << r);
				index_by_id_[id] = static_cast<int>(coords_.size());
				index_by_qr_[std::make_pair(q, r)] = static_cast<int>(coords_.size());
				coords_.emplace_back(q, r, -q - r, id);
				initial_states_[id] = TileState::DEFAULT;
			}
		}

		for(int row = 0; row != static_cast<int>(diagonal_rows_.size()); ++row) {
			for(int id : diagonal_rows_[row]) {
				row_by_id_[id] = row + 1;
			}
		}
		buildMirrorMap();
	}

	void BoardPreset::buildMirrorMap()
	{
		const int nrows = static_cast<int>(diagonal_rows_.size());
		const int middle_row = nrows / 2;
		for(int row = 0; row < nrows; ++row) {
			const int target_row = 2 * middle_row - row;
			if(target_row < 0 || target_row >= nrows) {
				continue;
			}

			// first maps to first, last to last; the shorter row bounds the pairing.
			const auto& src = diagonal_rows_[row];
			const auto& dst = diagonal_rows_[target_row];
			for(size_t pos = 0; pos < src.size() && pos < dst.size(); ++pos) {
				mirror_[src[pos]] = dst[pos];
				mirror_[dst[pos]] = src[pos];
			}
		}

		if(middle_row < nrows) {
			for(int id : diagonal_rows_[middle_row]) {
				mirror_[id] = id;
			}
		}
	}

	const Coordinate& BoardPreset::getCoordinateById(int id) const
	{
		auto it = index_by_id_.find(id);
		ASSERT_LOG(it != index_by_id_.end(), "Tile with id " << id << " not found on board '" << name_ << "'");
		return coords_[it->second];
	}

	boost::optional<Coordinate> BoardPreset::findCoordinate(const Coordinate& c) const
	{
		auto it = index_by_qr_.find(std::make_pair(c.q(), c.r()));
		if(it == index_by_qr_.end()) {
			return boost::none;
		}
		return coords_[it->second];
	}

	int BoardPreset::indexOf(int id) const
	{
		auto it = index_by_id_.find(id);
		return it == index_by_id_.end() ? -1 : it->second;
	}

	TileState BoardPreset::initialState(int id) const
	{
		auto it = initial_states_.find(id);
		ASSERT_LOG(it != initial_states_.end(), "Tile with id " << id << " not found on board '" << name_ << "'");
		return it->second;
	}

	void BoardPreset::setInitialState(int id, TileState state)
	{
		ASSERT_LOG(hasId(id), "Arena paints unknown tile id " << id << " on board '" << name_ << "'");
		ASSERT_LOG(!is_occupied_state(state), "Board presets cannot start with occupied tiles (id " << id << ")");
		initial_states_[id] = state;
	}

	void BoardPreset::paint(const Arena& arena)
	{
		for(const auto& entry : arena.tiles) {
			for(int id : entry.second) {
				setInitialState(id, entry.first);
			}
		}
	}

	int BoardPreset::diagonalRow(int id) const
	{
		auto it = row_by_id_.find(id);
		return it == row_by_id_.end() ? -1 : it->second;
	}

	bool BoardPreset::sameDiagonalRow(int a, int b) const
	{
		const int ra = diagonalRow(a);
		return ra != -1 && ra == diagonalRow(b);
	}

	boost::optional<int> BoardPreset::mirrorOf(int id) const
	{
		auto it = mirror_.find(id);
		if(it == mirror_.end()) {
			return boost::none;
		}
		return it->second;
	}

	const std::vector<std::vector<int>>& BoardPreset::standardDiagonalRows()
	{
		static const std::vector<std::vector<int>> rows = {
			{ 1, 2 }, { 3, 4, 5 }, { 6, 7 }, { 8, 9, 10 }, { 11, 12, 13, 14 },
			{ 15, 16, 17 }, { 18, 19, 20, 21 }, { 22, 23, 24 }, { 25, 26, 27, 28 },
			{ 29, 30, 31 }, { 32, 33, 34, 35 }, { 36, 37, 38 }, { 39, 40 },
			{ 41, 42, 43 }, { 44, 45 },
		};
		return rows;
	}

	const std::vector<Arena>& BoardPreset::getArenas()
	{
		static const std::vector<Arena> arenas = {
			make_arena(1, "Arena I",
				{ 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 12, 13, 16 },
				{ 30, 33, 34, 36, 37, 38, 39, 40, 41, 42, 43, 44, 45 }, {}, {}),
			make_arena(2, "Arena II",
				{ 1, 2, 3, 4, 5, 6, 7, 8, 10 },
				{ 33, 36, 38, 39, 40, 41, 42, 43, 44, 45 },
				{ 9, 11, 12, 15, 18, 28, 31, 34, 35, 37 }, {}),
			make_arena(3, "Arena III",
				{ 1, 2, 4, 5, 7, 9, 13, 14, 16, 21 },
				{ 25, 30, 32, 33, 37, 39, 41, 42, 44, 45 },
				{ 10, 12, 15, 17, 22, 24, 29, 31, 34, 36 }, {}),
			make_arena(4, "Arena IV",
				{ 1, 3, 4, 6, 8, 9, 21, 24, 28 },
				{ 18, 22, 25, 37, 38, 40, 42, 43, 45 }, {}, {}),
			make_arena(5, "Arena V",
				{ 1, 2, 3, 5, 8, 10, 11, 14, 16, 18, 21 },
				{ 25, 28, 30, 32, 35, 38, 41, 43, 44, 45 },
				{ 12, 13, 19, 20, 26, 27, 33, 34 }, {}),
			make_arena(6, "SP (S3)",
				{ 1, 2, 5, 7, 9, 12, 15, 18 },
				{ 28, 31, 34, 37, 39, 41, 43, 44, 45 }, {},
				{ 4, 6, 8, 11, 35, 38, 40, 42 }),
			make_arena(7, "SP (S4)",
				{ 1, 2, 3, 4, 6, 8 },
				{ 10, 14, 35, 38, 40, 42, 43, 44, 45 },
				{ 7, 13, 17 }, {}),
			make_arena(8, "SP (S5)",
				{ 1, 2, 3, 4, 5, 6, 7, 8, 9, 16, 21, 28 },
				{ 18, 25, 30, 37, 38, 39, 40, 41, 42, 43, 44, 45 },
				{ 14, 17, 22, 24, 29, 32 }, {}),
		};
		return arenas;
	}

	const Arena& get_arena(int id)
	{
		for(const Arena& a : BoardPreset::getArenas()) {
			if(a.id == id) {
				return a;
			}
		}
		ASSERT_FATAL("Unknown arena id: " << id);
	}

	BoardPresetPtr BoardPreset::builtin(const std::string& layout, int arena_id)
	{
		std::shared_ptr<BoardPreset> res;
		if(layout == "full") {
			res = std::make_shared<BoardPreset>("full", full_grid_rows(), standardDiagonalRows());
		} else if(layout == "full_flat") {
			res = std::make_shared<BoardPreset>("full_flat", full_grid_flat_rows(), standardDiagonalRows());
		} else {
			ASSERT_LOG(false, "Unknown board layout: '" << layout << "'. Known layouts: full, full_flat");
		}

		if(arena_id != 0) {
			res->paint(get_arena(arena_id));
		}
		return res;
	}

	BoardPresetPtr BoardPreset::fromPtree(const boost::property_tree::ptree& pt)
	{
		using boost::property_tree::ptree;
		try {
			std::vector<BoardRow> rows;
			for(const auto& row : pt.get_child("rows")) {
				rows.emplace_back(row.second.get<int>("q_offset"), read_int_list(row.second.get_child("ids")));
			}

			std::vector<std::vector<int>> diagonal_rows = standardDiagonalRows();
			if(auto dr = pt.get_child_optional("diagonal_rows")) {
				diagonal_rows.clear();
				for(const auto& row : *dr) {
					diagonal_rows.push_back(read_int_list(row.second));
				}
			}

			auto res = std::make_shared<BoardPreset>(pt.get<std::string>("name", "custom"), rows, diagonal_rows);
			if(auto tiles = pt.get_child_optional("tiles")) {
				for(const auto& entry : *tiles) {
					auto key = tile_state_keys().find(entry.first);
					ASSERT_LOG(key != tile_state_keys().end(), "Unknown tile state '" << entry.first << "' in board preset");
					for(int id : read_int_list(entry.second)) {
						res->setInitialState(id, key->second);
					}
				}
			}
			return res;
		} catch(boost::property_tree::ptree_error& e) {
			ASSERT_LOG(false, "Malformed board preset: " << e.what());
		}
		return BoardPresetPtr();
	}

	BoardPresetPtr BoardPreset::fromJsonFile(const std::string& filename)
	{
		boost::property_tree::ptree pt;
		try {
			boost::property_tree::read_json(filename, pt);
		} catch(boost::property_tree::json_parser_error& e) {
			ASSERT_LOG(false, "Error parsing board preset " << filename << ": " << e.what());
		}
		LOG_INFO("Loaded board preset from " << filename);
		return fromPtree(pt);
	}
}

UNIT_TEST(board_preset_full_grid)
{
	auto board = hex::BoardPreset::builtin();
	CHECK_EQ(board->tileCount(), 45);
	CHECK_EQ(board->getCoordinates().front().getId(), 43);
	CHECK_EQ(board->getCoordinateById(43), hex::Coordinate(2, -4, 2));
	CHECK_EQ(board->getCoordinateById(9), hex::Coordinate(-2, 2, 0));
	CHECK_EQ(board->getCoordinateById(33), hex::Coordinate(2, -1, -1));
	CHECK_EQ(board->getCoordinateById(37), hex::Coordinate(2, -2, 0));
	CHECK_EQ(board->getCoordinateById(1), hex::Coordinate(-3, 4, -1));

	CHECK_EQ(board->initialState(1), hex::TileState::AVAILABLE_ALLY);
	CHECK_EQ(board->initialState(45), hex::TileState::AVAILABLE_ENEMY);
	CHECK_EQ(board->initialState(11), hex::TileState::DEFAULT);

	auto flat = hex::BoardPreset::builtin("full_flat", 2);
	CHECK_EQ(flat->tileCount(), 45);
	CHECK_EQ(flat->initialState(9), hex::TileState::BLOCKED);
}

UNIT_TEST(board_preset_diagonal_rows_and_mirror)
{
	auto board = hex::BoardPreset::builtin();
	CHECK_EQ(board->diagonalRow(1), 1);
	CHECK_EQ(board->diagonalRow(33), 11);
	CHECK_EQ(board->diagonalRow(37), 12);
	CHECK_EQ(board->diagonalRow(99), -1);
	CHECK(board->sameDiagonalRow(3, 5), "3 and 5 share row 2");
	CHECK(!board->sameDiagonalRow(33, 37), "33 and 37 are in different rows");
	CHECK(!board->sameDiagonalRow(99, 99), "unknown ids never share a row");

	CHECK_EQ(*board->mirrorOf(1), 44);
	CHECK_EQ(*board->mirrorOf(44), 1);
	CHECK_EQ(*board->mirrorOf(3), 41);
	CHECK_EQ(*board->mirrorOf(23), 23);
	CHECK_EQ(*board->mirrorOf(6), 39);
	// row 4 has three ids, its mirror row 12 has three as well
	CHECK_EQ(*board->mirrorOf(10), 38);
	for(const auto& c : board->getCoordinates()) {
		auto m = board->mirrorOf(c.getId());
		if(m) {
			CHECK_EQ(*board->mirrorOf(*m), c.getId());
		}
	}
}

UNIT_TEST(board_preset_from_json)
{
	std::istringstream json(
		"{ \"name\": \"tiny\","
		"  \"rows\": [ { \"q_offset\": 0, \"ids\": [3] }, { \"q_offset\": -1, \"ids\": [1, 2] } ],"
		"  \"tiles\": { \"available_ally\": [1], \"available_enemy\": [3], \"blocked\": [2] },"
		"  \"diagonal_rows\": [ [1], [2, 3] ] }");
	boost::property_tree::ptree pt;
	boost::property_tree::read_json(json, pt);
	auto board = hex::BoardPreset::fromPtree(pt);
	CHECK_EQ(board->name(), "tiny");
	CHECK_EQ(board->tileCount(), 3);
	CHECK_EQ(board->getCoordinateById(3), hex::Coordinate(0, -1, 1));
	CHECK_EQ(board->getCoordinateById(1), hex::Coordinate(-1, 0, 1));
	CHECK_EQ(board->initialState(2), hex::TileState::BLOCKED);
	CHECK_EQ(board->diagonalRow(3), 2);
	CHECK(!board->mirrorOf(1), "a row without a partner has no mirror");
	CHECK_EQ(*board->mirrorOf(3), 3);

	std::istringstream bad("{ \"rows\": [ { \"q_offset\": 0, \"ids\": [1, 1] } ] }");
	boost::property_tree::ptree bad_pt;
	boost::property_tree::read_json(bad, bad_pt);
	CHECK_ASSERTS(hex::BoardPreset::fromPtree(bad_pt), "duplicate ids must be rejected");
}
