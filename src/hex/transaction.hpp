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

#include <functional>
#include <vector>

#include "hex_fwd.hpp"
#include "unit_id.hpp"

namespace hex
{
	struct transaction_step
	{
		transaction_step(std::function<bool()> a, std::function<void()> r=std::function<void()>())
			: apply(a), rollback(r) {}
		std::function<bool()> apply;
		// Undoes a successful apply. May be empty.
		std::function<void()> rollback;
	};

	// The only writer of the grid during a mutating operation. Every public
	// mutation runs as one transaction: either all of its steps apply, or
	// the applied ones are undone in reverse order. Cached search results
	// are invalidated once when the outermost transaction ends.
	class TransactionCoordinator
	{
	public:
		TransactionCoordinator(SpatialGrid& grid, SkillManager& skills, PathfindingEngine& engine);

		bool executeTransaction(const std::vector<transaction_step>& steps);

		// Companions are never placed directly. The tile must be empty.
		bool place(int tile_id, const UnitId& unit, Team team);
		// Removing a companion removes its owner and every linked companion.
		bool remove(int tile_id);
		bool move(int from_tile, int to_tile, const UnitId& unit);
		bool swap(int tile_a, int tile_b);
		bool clearAll();
		// Places on the free tile of the team with the lowest id.
		bool autoPlace(const UnitId& unit, Team team);
		bool setOccupancyState(int tile_id, int state);
		bool setMaxTeamSize(Team team, int size);

		int depth() const { return depth_; }
	private:
		struct companion_position
		{
			companion_position(const UnitId& u, int tile) : unit(u), tile_id(tile) {}
			UnitId unit;
			int tile_id;
		};

		bool removeUnitAndSkill(int tile_id);
		std::vector<transaction_step> plainSwapSteps(int tile_a, int tile_b, const UnitId& unit_a, const UnitId& unit_b, Team team_a, Team team_b);
		bool crossTeamSwap(int tile_a, int tile_b, const UnitId& unit_a, const UnitId& unit_b, Team team_a, Team team_b);
		std::vector<companion_position> companionPositions(const UnitId& main, Team team) const;
		void reactivate(int tile_id, const UnitId& unit, Team team, const std::vector<companion_position>& companions);

		SpatialGrid& grid_;
		SkillManager& skills_;
		PathfindingEngine& engine_;
		int depth_;
		bool dirty_;
	};
}
