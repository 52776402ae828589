/*	BSD 3-Clause License

	Copyright (c) 2024, Paul Varga
	All rights reserved.

	Redistribution and use in source and binary forms, with or without
	modification, are permitted provided that the following conditions are met:

	1. Redistributions of source code must retain the above copyright notice, this
	   list of conditions and the following disclaimer.

	2. Redistributions in binary form must reproduce the above copyright notice,
	   this list of conditions and the following disclaimer in the documentation
	   and/or other materials provided with the distribution.

	3. Neither the name of the copyright holder nor the names of its
	   contributors may be used to endorse or promote products derived from
	   this software without specific prior written permission.

	THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
	AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
	IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
	DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
	FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
	DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
	SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
	CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
	OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
	OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*/

#include <gtest/gtest.h>

#include <cstdint>
#include <span>
#include <sstream>
#include <np/slot.hpp>

using np::basic_slot;
using np::errc;
using np::slot;
using np::slot_for;
using np::pointer::occupy;
using np::pointer::slot_state;

namespace
{
	struct lifetimes
	{
		int m_constructed{ 0 };
		int m_destructed{ 0 };

		static lifetimes& get()
		{
			static lifetimes instance;
			return instance;
		}

		friend std::ostream& operator<<(std::ostream& ostr, const lifetimes& all)
		{
			return ostr << "constructed " << all.m_constructed << ", destructed " << all.m_destructed;
		}
	};

	struct tracked
	{
		explicit tracked(const int value) noexcept
			: m_value{ value }
		{
			++lifetimes::get().m_constructed;
		}
		tracked(const tracked& other) noexcept
			: m_value{ other.m_value }
		{
			++lifetimes::get().m_constructed;
		}
		~tracked()
		{
			++lifetimes::get().m_destructed;
		}

		int m_value;
	};

	struct wide
	{
		std::uint64_t m_a;
		std::uint64_t m_b;
	};

	class np_slot : public ::testing::Test
	{
	protected:
		void SetUp() override
		{
			lifetimes::get() = lifetimes{};
		}
		void TearDown() override
		{
			const auto& all = lifetimes::get();
			EXPECT_EQ(all.m_constructed, all.m_destructed) << all;
		}
	};
} // anonymous namespace

TEST_F(np_slot, slot_ctor)
{
	const slot<16> s;
	EXPECT_FALSE(s.is_occupied());
	EXPECT_EQ(16u, s.capacity());
	EXPECT_NE(nullptr, s.data());
	EXPECT_EQ(0u, reinterpret_cast<std::uintptr_t>(s.data()) % np::pointer::default_alignment);
	EXPECT_EQ(slot_state::empty, s.get_control().get_state());
	EXPECT_EQ(nullptr, s.get_control().get_type());
}
TEST_F(np_slot, slot_for_size)
{
	static_assert(slot_for<char>::static_capacity == 1u);
	static_assert(slot_for<char, double>::static_capacity == sizeof(double));
	static_assert(slot_for<char, double>::static_alignment == alignof(double));
	static_assert(slot_for<tracked, wide>::static_capacity == sizeof(wide));

	const slot_for<char, wide> s;
	EXPECT_EQ(sizeof(wide), s.capacity());
}
TEST_F(np_slot, occupy)
{
	slot_for<tracked> s;
	errc error{};
	tracked* const value = occupy<tracked>(s.get_control(), error, 42);
	ASSERT_NE(nullptr, value);
	EXPECT_EQ(errc{}, error);
	EXPECT_EQ(42, value->m_value);
	EXPECT_EQ(static_cast<const void*>(s.data()), static_cast<const void*>(value));
	EXPECT_TRUE(s.is_occupied());
	EXPECT_EQ(slot_state::occupied, s.get_control().get_state());
	EXPECT_EQ(1u, s.get_control().get_shared_count());
	EXPECT_EQ(np::pointer::type_id_of<tracked>(), s.get_control().get_type());
	EXPECT_EQ(1, lifetimes::get().m_constructed);

	s.get_control().teardown();
	EXPECT_FALSE(s.is_occupied());
	EXPECT_EQ(nullptr, s.get_control().get_type());
	EXPECT_EQ(1, lifetimes::get().m_destructed);
}
TEST_F(np_slot, occupy_occupied)
{
	slot_for<tracked> s;
	errc error{};
	tracked* const first = occupy<tracked>(s.get_control(), error, 1);
	ASSERT_NE(nullptr, first);

	tracked* const second = occupy<tracked>(s.get_control(), error, 2);
	EXPECT_EQ(nullptr, second);
	EXPECT_EQ(errc::slot_occupied, error);
	EXPECT_EQ(1, first->m_value);
	EXPECT_EQ(1, lifetimes::get().m_constructed);
	EXPECT_EQ(slot_state::occupied, s.get_control().get_state());

	s.get_control().teardown();
}
TEST_F(np_slot, occupy_after_teardown)
{
	slot_for<tracked> s;
	errc error{};
	ASSERT_NE(nullptr, occupy<tracked>(s.get_control(), error, 1));
	s.get_control().teardown();

	tracked* const value = occupy<tracked>(s.get_control(), error, 2);
	ASSERT_NE(nullptr, value);
	EXPECT_EQ(2, value->m_value);
	s.get_control().teardown();
	EXPECT_EQ(2, lifetimes::get().m_destructed);
}
TEST_F(np_slot, basic_slot_capacity_exceeded)
{
	alignas(16) std::byte buffer[8];
	basic_slot s{ std::span<std::byte>{ buffer } };
	EXPECT_EQ(8u, s.capacity());

	errc error{};
	EXPECT_EQ(nullptr, occupy<wide>(s.get_control(), error, wide{ 1u, 2u }));
	EXPECT_EQ(errc::capacity_exceeded, error);
	EXPECT_FALSE(s.is_occupied());

	std::uint64_t* const value = occupy<std::uint64_t>(s.get_control(), error, std::uint64_t{ 7u });
	ASSERT_NE(nullptr, value);
	EXPECT_EQ(7u, *value);
	s.get_control().teardown();
}
TEST_F(np_slot, basic_slot_misaligned)
{
	alignas(8) std::byte buffer[32];
	basic_slot s{ std::span<std::byte>{ buffer + 1, 16u } };

	errc error{};
	EXPECT_EQ(nullptr, occupy<std::uint64_t>(s.get_control(), error, std::uint64_t{ 7u }));
	EXPECT_EQ(errc::capacity_exceeded, error);
	EXPECT_FALSE(s.is_occupied());

	char* const value = occupy<char>(s.get_control(), error, 'x');
	ASSERT_NE(nullptr, value);
	EXPECT_EQ('x', *value);
	s.get_control().teardown();
}
TEST_F(np_slot, control_abandon_occupy)
{
	slot_for<int> s;
	np::pointer::control& ctrl = s.get_control();
	ASSERT_TRUE(ctrl.try_occupy());
	EXPECT_EQ(slot_state::constructing, ctrl.get_state());
	EXPECT_TRUE(s.is_occupied());
	EXPECT_EQ(nullptr, ctrl.get_type());
	EXPECT_FALSE(ctrl.try_occupy());

	ctrl.abandon_occupy();
	EXPECT_EQ(slot_state::empty, ctrl.get_state());
	EXPECT_FALSE(s.is_occupied());
}
TEST_F(np_slot, control_shared_count)
{
	slot_for<tracked> s;
	np::pointer::control& ctrl = s.get_control();
	errc error{};
	ASSERT_NE(nullptr, occupy<tracked>(ctrl, error, 3));
	ASSERT_EQ(1u, ctrl.get_shared_count());

	ctrl.shared_inc();
	ctrl.shared_inc();
	EXPECT_EQ(3u, ctrl.get_shared_count());

	ctrl.shared_dec();
	ctrl.shared_dec();
	EXPECT_EQ(1u, ctrl.get_shared_count());
	EXPECT_TRUE(s.is_occupied());
	EXPECT_EQ(0, lifetimes::get().m_destructed);

	ctrl.shared_dec();
	EXPECT_EQ(0u, ctrl.get_shared_count());
	EXPECT_FALSE(s.is_occupied());
	EXPECT_EQ(1, lifetimes::get().m_destructed);
}
TEST_F(np_slot, errc_to_string)
{
	EXPECT_STREQ("slot occupied", np::to_string(errc::slot_occupied));
	EXPECT_STREQ("capacity exceeded", np::to_string(errc::capacity_exceeded));

	std::ostringstream ostr;
	ostr << errc::capacity_exceeded;
	EXPECT_EQ("capacity exceeded", ostr.str());
}

using np_slot_death = np_slot;

TEST_F(np_slot_death, destroyed_while_occupied)
{
	EXPECT_DEATH({
		slot_for<int> s;
		errc error{};
		occupy<int>(s.get_control(), error, 1);
	}, "Slot destroyed while a handle still owns its value");
}
TEST_F(np_slot_death, double_teardown)
{
	EXPECT_DEATH({
		slot_for<int> s;
		errc error{};
		occupy<int>(s.get_control(), error, 1);
		s.get_control().teardown();
		s.get_control().teardown();
	}, "Double teardown");
}
TEST_F(np_slot_death, shared_count_underflow)
{
	EXPECT_DEATH({
		slot_for<int> s;
		s.get_control().shared_dec();
	}, "underflow");
}
