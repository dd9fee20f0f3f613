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
#include <boost/property_tree/ptree_fwd.hpp>

#include "hex_coord.hpp"
#include "hex_fwd.hpp"

namespace hex
{
	struct BoardRow
	{
		BoardRow(int off, const std::vector<int>& i) : q_offset(off), ids(i) {}
		int q_offset;
		std::vector<int> ids;
	};

	// Initial tile states painted over a layout, keyed by board-position id.
	struct Arena
	{
		int id;
		std::string name;
		std::map<TileState, std::vector<int>> tiles;
	};

	// The static board: valid coordinates with their ids, the initial state
	// of each tile, the diagonal-row classes and the mirror map derived from
	// them. Immutable once built.
	class BoardPreset
	{
	public:
		BoardPreset(const std::string& name, const std::vector<BoardRow>& rows, const std::vector<std::vector<int>>& diagonal_rows);

		const std::string& name() const { return name_; }

		// Coordinates in preset order: rows top to bottom, left to right.
		const std::vector<Coordinate>& getCoordinates() const { return coords_; }
		int tileCount() const { return static_cast<int>(coords_.size()); }
		bool hasId(int id) const { return index_by_id_.count(id) != 0; }
		const Coordinate& getCoordinateById(int id) const;
		boost::optional<Coordinate> findCoordinate(const Coordinate& c) const;

		// Index into getCoordinates(), or -1.
		int indexOf(int id) const;

		TileState initialState(int id) const;
		void paint(const Arena& arena);
		void setInitialState(int id, TileState state);

		// Diagonal row number starting at 1, or -1 for an unknown id.
		int diagonalRow(int id) const;
		bool sameDiagonalRow(int a, int b) const;
		const std::vector<std::vector<int>>& getDiagonalRows() const { return diagonal_rows_; }

		boost::optional<int> mirrorOf(int id) const;

		static BoardPresetPtr builtin(const std::string& layout="full", int arena_id=1);
		static BoardPresetPtr fromPtree(const boost::property_tree::ptree& pt);
		static BoardPresetPtr fromJsonFile(const std::string& filename);
		static const std::vector<Arena>& getArenas();
		static const std::vector<std::vector<int>>& standardDiagonalRows();
	private:
		void buildMirrorMap();

		std::string name_;
		std::vector<Coordinate> coords_;
		std::map<int, int> index_by_id_;
		std::map<std::pair<int,int>, int> index_by_qr_;
		std::map<int, TileState> initial_states_;
		std::vector<std::vector<int>> diagonal_rows_;
		std::map<int, int> row_by_id_;
		std::map<int, int> mirror_;
	};

	const Arena& get_arena(int id);
}
