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

#include <ostream>
#include <string>

namespace hex
{
	// Numeric offset used when a companion is exchanged as a single integer.
	const int COMPANION_ID_OFFSET = 10000;

	// Identifies a placed unit. A main unit is identified by its catalog id;
	// a companion by the main unit that owns it and a sequence number >= 1.
	class UnitId
	{
	public:
		explicit UnitId(int main_id, int seq=0);

		static UnitId makeMain(int main_id) { return UnitId(main_id); }
		static UnitId makeCompanion(int main_id, int seq) { return UnitId(main_id, seq); }

		// Decodes mainId + seq * COMPANION_ID_OFFSET.
		static UnitId fromLegacy(int encoded);
		int toLegacy() const { return main_id_ + seq_ * COMPANION_ID_OFFSET; }

		int getMainId() const { return main_id_; }
		int getSeq() const { return seq_; }
		bool isCompanion() const { return seq_ != 0; }
		UnitId getOwner() const { return UnitId(main_id_); }

		std::string toString() const;

		bool operator==(const UnitId& other) const { return main_id_ == other.main_id_ && seq_ == other.seq_; }
		bool operator!=(const UnitId& other) const { return !operator==(other); }
		bool operator<(const UnitId& other) const;
	private:
		int main_id_;
		int seq_;
	};

	std::ostream& operator<<(std::ostream& os, const UnitId& u);
	std::size_t hash_value(const UnitId& u);
}
