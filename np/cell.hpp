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

#ifndef INC_NP__CELL_HPP
#define INC_NP__CELL_HPP

/**	@file
 *	This file declares np::cell, a lock-free value that may be read & written
 *	through const access. It is how values owned by np::shared_ptr, which only
 *	hands out const references, hold state that changes while shared:
 *
 *		struct counter
 *		{
 *			np::cell<int> m_hits{ 0 };
 *		};
 *
 *		np::shared_ptr<counter> p{ np::try_make_shared<counter>(storage).value() };
 *		int seen{ p->m_hits.read() };
 *		while (!p->m_hits.compare_and_swap(seen, seen + 1))
 *		{ }
 */

#include <atomic>
#include <type_traits>
#include <utility>

namespace np
{
	/**	A value that's atomically readable & writable through const access.
	 *	@tparam T A trivially copyable type whose std::atomic is always lock-free.
	 */
	template <typename T>
	class cell
	{
		static_assert(std::is_trivially_copyable_v<T>, "np::cell holds trivially copyable values.");
		static_assert(std::atomic<T>::is_always_lock_free, "np::cell requires a lock-free std::atomic<T>.");

	public:
		using value_type = T;

		constexpr cell() noexcept(std::is_nothrow_default_constructible_v<T>)
			: m_value{ T{} }
		{ }
		constexpr explicit cell(const T value) noexcept
			: m_value{ value }
		{ }
		cell(const cell&) = delete;
		cell& operator=(const cell&) = delete;

		/**	Return the current value. Sees every write that happened before the write it reads.
		 */
		T read() const noexcept
		{
			return m_value.load(std::memory_order_acquire);
		}
		void write(const T value) const noexcept
		{
			m_value.store(value, std::memory_order_release);
		}
		/**	Replace the value and return the previous one.
		 */
		T exchange(const T value) const noexcept
		{
			return m_value.exchange(value, std::memory_order_acq_rel);
		}
		/**	Replace the value with \p desired if it equals \p expected.
		 *	@param expected The value to compare with. Updated to the current value on failure.
		 *	@param desired The value to store.
		 *	@return True if the value was replaced.
		 */
		bool compare_and_swap(T& expected, const T desired) const noexcept
		{
			return m_value.compare_exchange_strong(expected, desired,
				std::memory_order_acq_rel, std::memory_order_acquire);
		}

	private:
		mutable std::atomic<T> m_value;
	};
} // namespace np

#endif
