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
 *	Exercises np::shared_ptr & np::cell in a build without exceptions or RTTI. Exits non-zero if any check fails.
 */

#include <cstdlib>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include <np/cell.hpp>
#include <np/shared_ptr.hpp>

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

	struct counter
	{
		np::cell<int> m_hits{ 0 };
	};
} // anonymous namespace

int main()
{
	np::slot_for<counter> s;
	{
		np::shared_ptr<counter> x{ np::try_make_shared<counter>(s).value() };
		check(x.use_count() == 1u, "one owner after construction");

		std::vector<np::shared_ptr<counter>> clones(3, x);
		check(x.use_count() == 4u, "four owners after three clones");
		clones.clear();
		check(s.is_occupied(), "slot occupied while an owner remains");

		std::vector<std::thread> threads;
		for (int i = 0; i != 2; ++i)
		{
			threads.emplace_back([p = x]()
			{
				for (int j = 0; j != 1000; ++j)
				{
					std::vector<np::shared_ptr<counter>> owners(2, p);
					int seen{ p->m_hits.read() };
					while (!p->m_hits.compare_and_swap(seen, seen + 1))
					{ }
				}
			});
		}
		for (std::thread& t : threads)
		{
			t.join();
		}
		check(x->m_hits.read() == 2000, "every increment observed");
		check(x.use_count() == 1u, "one owner after the threads finish");

		const np::result<np::shared_ptr<counter>> again{ np::try_make_shared<counter>(s) };
		check(again.error() == np::errc::slot_occupied, "construct over an occupied slot");
	}
	check(!s.is_occupied(), "slot empty after the last owner is released");

	if (failures != 0)
	{
		fmt::print(stderr, "{} check(s) failed\n", failures);
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}
