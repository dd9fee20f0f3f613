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

#include <sstream>

#include <boost/functional/hash.hpp>

#include "asserts.hpp"
#include "unit_id.hpp"
#include "unit_test.hpp"

namespace hex
{
	UnitId::UnitId(int main_id, int seq)
		: main_id_(main_id), seq_(seq)
	{
		ASSERT_LOG(main_id > 0 && main_id < COMPANION_ID_OFFSET, "Invalid unit id: " << main_id);
		ASSERT_LOG(seq >= 0, "Invalid companion sequence " << seq << " for unit " << main_id);
	}

	UnitId UnitId::fromLegacy(int encoded)
	{
		ASSERT_LOG(encoded > 0, "Invalid numeric unit id: " << encoded);
		return UnitId(encoded % COMPANION_ID_OFFSET, encoded / COMPANION_ID_OFFSET);
	}

	std::string UnitId::toString() const
	{
		std::ostringstream s;
		s << main_id_;
		if(seq_ != 0) {
			s << "#" << seq_;
		}
		return s.str();
	}

	bool UnitId::operator<(const UnitId& other) const
	{
		if(main_id_ != other.main_id_) {
			return main_id_ < other.main_id_;
		}
		return seq_ < other.seq_;
	}

	std::ostream& operator<<(std::ostream& os, const UnitId& u)
	{
		return os << u.toString();
	}

	std::size_t hash_value(const UnitId& u)
	{
		std::size_t seed = 0;
		boost::hash_combine(seed, u.getMainId());
		boost::hash_combine(seed, u.getSeq());
		return seed;
	}
}

UNIT_TEST(unit_id_legacy_encoding)
{
	using hex::UnitId;
	CHECK_EQ(UnitId::fromLegacy(58), UnitId::makeMain(58));
	CHECK_EQ(UnitId::fromLegacy(10050), UnitId::makeCompanion(50, 1));
	CHECK_EQ(UnitId::fromLegacy(20089).getSeq(), 2);
	CHECK_EQ(UnitId::makeCompanion(89, 2).toLegacy(), 20089);
	CHECK_EQ(UnitId::makeCompanion(89, 2).getOwner(), UnitId(89));
	CHECK(UnitId::makeCompanion(50, 1).isCompanion(), "companion flag");
	CHECK(!UnitId(50).isCompanion(), "main flag");
	CHECK(UnitId(50) < UnitId(50, 1), "main sorts before its companions");
	CHECK_EQ(UnitId(68, 1).toString(), "68#1");

	for(int bad : { 0, -5, 10000 }) {
		CHECK_ASSERTS(UnitId::fromLegacy(bad), "legacy id " << bad << " accepted");
	}
}
