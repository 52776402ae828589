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

/**	@file
 *	Exercises np::unique_ptr in a build without exceptions or RTTI. Exits non-zero if any check fails.
 */

#include <cstddef>
#include <cstdlib>
#include <span>
#include <utility>

#include <fmt/format.h>

#include <np/unique_ptr.hpp>

#if NP_POINTER_EXCEPTIONS
	#error "Build this program with exceptions disabled."
#endif // NP_POINTER_EXCEPTIONS

namespace
{
	int failures{ 0 };

	void check(const bool condition, const char* const description)
	{
		if (!condition)
		{
			fmt::print(stderr, "FAILED: {}\n", description);
			++failures;
		}
	}

	struct shape
	{
		struct vtable
		{
			int (*area)(const void*) noexcept;
		};
		template <typename T>
		static constexpr vtable make_vtable() noexcept
		{
			return {
				[](const void* self) noexcept { return static_cast<const T*>(self)->area(); }
			};
		}
	};

	struct square
	{
		int area() const noexcept
		{
			return m_side * m_side;
		}

		int m_side;
	};
} // anonymous namespace

int main()
{
	np::slot_for<int> s;
	{
		np::result<np::unique_ptr<int>> made{ np::try_make_unique<int>(s, 42) };
		check(made.has_value(), "construct over an empty slot");
		np::unique_ptr<int> x{ std::move(made).value() };
		check(*x == 42, "read the constructed value");

		const np::result<np::unique_ptr<int>> again{ np::try_make_unique<int>(s, 7) };
		check(again.error() == np::errc::slot_occupied, "construct over an occupied slot");
		check(*x == 42, "value unaffected by a rejected construction");

		check(x.take() == 42, "take the value");
		check(!s.is_occupied(), "slot empty after take");
	}
	check(!s.is_occupied(), "slot empty after release");

	alignas(8) std::byte buffer[2];
	np::basic_slot small{ std::span<std::byte>{ buffer } };
	check(np::try_make_unique<int>(small, 1).error() == np::errc::capacity_exceeded, "reject a value that doesn't fit");

	np::slot_for<square> shapes;
	{
		np::unique_ptr<np::dyn<shape>> x{ np::try_make_unique<np::dyn<shape>, square>(shapes, square{ 3 }).value() };
		check(x->call(&shape::vtable::area) == 9, "dispatch through the view");

		np::unique_ptr<square> y{ np::downcast<square>(std::move(x)) };
		check(y && y->m_side == 3, "downcast to the stored type");
	}
	check(!shapes.is_occupied(), "slot empty after the view's owner is released");

	if (failures != 0)
	{
		fmt::print(stderr, "{} check(s) failed\n", failures);
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}
