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

#ifndef INC_NP__SLOT_HPP
#define INC_NP__SLOT_HPP

/**	@file
 *	This file declares np::basic_slot, np::slot and np::slot_for: caller owned
 *	storage for exactly one value, and the control block the handles in
 *	np/unique_ptr.hpp & np/shared_ptr.hpp operate on.
 *
 *	A slot never allocates. np::slot<Size, Align> carries its storage inline
 *	and rejects values that don't fit at compile time. np::basic_slot wraps
 *	storage supplied by the caller and checks size & alignment when a value is
 *	placed, reporting np::errc::capacity_exceeded.
 *
 *	A slot must outlive every handle constructed over it. Slots are neither
 *	copyable nor movable, and destroying an occupied slot aborts.
 */

#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <new>
#include <span>
#include <type_traits>
#include <utility>

#include "pointer.hpp"

namespace np::pointer
{
	/**	The occupancy of a slot.
	 */
	enum class slot_state : std::uint8_t
	{
		/**	No value. The only state in which a value may be placed.
		 */
		empty,
		/**	Claimed by a factory that's running the value's constructor.
		 */
		constructing,
		/**	Holds a live value owned by one handle family.
		 */
		occupied,
		/**	The value's destructor is running.
		 */
		tearing_down
	};

	/**	Operations associated with the type of value held by a slot. One constant table exists per stored type.
	 */
	struct slot_operations final
	{
		using destruct_type = void(*)(void*) noexcept;

		/**	Called with the address of the value to destruct it.
		 */
		destruct_type m_destruct;

		/**	Identifies the stored type for np::downcast.
		 */
		type_id m_type;

		/**	sizeof the stored type.
		 */
		std::size_t m_size;

		/**	alignof the stored type.
		 */
		std::size_t m_alignment;
	};

	/**	The operations table for values of type T.
	 *	@tparam T The stored type.
	 */
	template <typename T>
	inline constexpr slot_operations operations_for{
		/* destruct */
		[](void* const value) noexcept -> void
		{
			std::destroy_at(std::launder(static_cast<T*>(value)));
		},
		/* type */ type_id_of<T>(),
		/* size */ sizeof(T),
		/* alignment */ alignof(T)
	};

	using use_count_t = std::uint32_t;

	/**	The occupancy state, reference count and storage bounds of one slot.
	 *	@detail State transitions:
	 *		empty -> constructing (try_occupy) -> occupied (finish_occupy) -> tearing_down (teardown) -> empty
	 *		constructing -> empty (abandon_occupy, when the value's constructor throws)
	 */
	class control final
	{
	public:
		control(std::byte* const data, const std::size_t capacity) noexcept
			: m_data{ data }
			, m_capacity{ capacity }
		{ }
		control() = delete;
		control(const control&) = delete;
		control& operator=(const control&) = delete;
		~control()
		{
			NP_POINTER_VERIFY(m_state.load(std::memory_order_acquire) == slot_state::empty,
				"Slot destroyed while a handle still owns its value.");
		}

		/**	Check if a value of the given size & alignment can be placed in this slot's storage.
		 *	@param size The size of the value.
		 *	@param alignment The alignment of the value.
		 *	@return True if the value fits.
		 */
		bool fits(const std::size_t size, const std::size_t alignment) const noexcept
		{
			return size <= m_capacity
				&& reinterpret_cast<std::uintptr_t>(m_data) % alignment == 0u;
		}

		/**	Claim an empty slot for construction of a value.
		 *	@return True if the slot was empty and is now constructing. False if nothing was changed.
		 */
		bool try_occupy() noexcept
		{
			slot_state expected{ slot_state::empty };
			// Acquire the previous teardown's writes to storage.
			return m_state.compare_exchange_strong(expected, slot_state::constructing,
				std::memory_order_acquire, std::memory_order_relaxed);
		}
		/**	Publish a constructed value, moving from constructing to occupied with one reference.
		 *	@param operations The operations table of the constructed value's type.
		 */
		void finish_occupy(const slot_operations& operations) noexcept
		{
			NP_POINTER_ASSERT(m_state.load(std::memory_order_relaxed) == slot_state::constructing,
				"Finishing occupation of a slot that wasn't claimed.");
			m_operations = &operations;
			m_count.store(1u, std::memory_order_relaxed);
			m_state.store(slot_state::occupied, std::memory_order_release);
		}
		/**	Return a claimed slot to empty without a value ever being published.
		 */
		void abandon_occupy() noexcept
		{
			NP_POINTER_ASSERT(m_state.load(std::memory_order_relaxed) == slot_state::constructing,
				"Abandoning occupation of a slot that wasn't claimed.");
			m_state.store(slot_state::empty, std::memory_order_release);
		}

		/**	Destruct the held value and return the slot to empty.
		 *	@detail A second teardown of the same value can't be continued from safely: it aborts.
		 */
		void teardown() noexcept
		{
			slot_state expected{ slot_state::occupied };
			const bool claimed{ m_state.compare_exchange_strong(expected, slot_state::tearing_down,
				std::memory_order_acq_rel, std::memory_order_acquire) };
			NP_POINTER_VERIFY(claimed,
				"Double teardown: slot state is {} rather than occupied.", static_cast<int>(expected));

			const slot_operations* const operations = std::exchange(m_operations, nullptr);
			operations->m_destruct(m_data);
			m_state.store(slot_state::empty, std::memory_order_release);
		}

		/**	Add one shared reference.
		 *	@detail The caller owns a reference, so the count can't concurrently reach zero.
		 */
		void shared_inc() noexcept
		{
			const use_count_t previous{ m_count.fetch_add(1u, std::memory_order_relaxed) };
			NP_POINTER_VERIFY(previous != 0u, "Cloning a shared handle whose value was already torn down.");
			NP_POINTER_VERIFY(previous != std::numeric_limits<use_count_t>::max(), "Shared reference count overflow.");
		}
		/**	Release one shared reference. Tears down the value if this was the last reference.
		 */
		void shared_dec() noexcept
		{
			const use_count_t previous{ m_count.fetch_sub(1u, std::memory_order_release) };
			NP_POINTER_VERIFY(previous != 0u, "Shared reference count underflow.");
			if (previous == 1u)
			{
				// Acquire every other owner's releases before destructing.
				std::atomic_thread_fence(std::memory_order_acquire);
				teardown();
			}
		}
		/**	Return the number of shared references.
		 *	@note Stored count may change immediately after returning.
		 */
		use_count_t get_shared_count() const noexcept
		{
			return m_count.load(std::memory_order_relaxed);
		}

		bool is_occupied() const noexcept
		{
			return m_state.load(std::memory_order_acquire) != slot_state::empty;
		}
		slot_state get_state() const noexcept
		{
			return m_state.load(std::memory_order_acquire);
		}
		/**	Return the type of the held value.
		 *	@return The type_id of the held value, or nullptr if there is none.
		 */
		type_id get_type() const noexcept
		{
			return m_state.load(std::memory_order_acquire) == slot_state::occupied
				? m_operations->m_type
				: nullptr;
		}
		std::byte* get_data() const noexcept
		{
			return m_data;
		}
		std::size_t get_capacity() const noexcept
		{
			return m_capacity;
		}

	private:
		std::atomic<slot_state> m_state{ slot_state::empty };
		std::atomic<use_count_t> m_count{ 0u };

		/**	Pointer to the static operations table of the held value's type. Null unless occupied.
		 */
		const slot_operations* m_operations{ nullptr };

		std::byte* const m_data;
		const std::size_t m_capacity;
	};

	/**	Construct a value of type U in a slot's storage.
	 *	@detail On success the slot is occupied by the new value with one reference. If U's constructor throws, the
	 *		slot is returned to empty and the exception propagates.
	 *	@param ctrl The slot's control block.
	 *	@param error Set to the reason nothing was constructed when returning nullptr.
	 *	@param args The arguments to pass to U::U.
	 *	@return A pointer to the new value, or the reason nothing was constructed.
	 */
	template <typename U, typename... Args>
	U* occupy(control& ctrl, errc& error, Args&&... args)
		noexcept(std::is_nothrow_constructible_v<U, Args...>)
	{
		static_assert(std::is_nothrow_destructible_v<U>,
			"Values held by a slot must have a non-throwing destructor.");

		if (false == ctrl.fits(sizeof(U), alignof(U)))
		{
			error = errc::capacity_exceeded;
			return nullptr;
		}
		if (false == ctrl.try_occupy())
		{
			error = errc::slot_occupied;
			return nullptr;
		}

		U* value{ nullptr };
		if constexpr (std::is_nothrow_constructible_v<U, Args...>)
		{
			value = ::new (static_cast<void*>(ctrl.get_data())) U(std::forward<Args>(args)...);
		}
		else
		{
#if NP_POINTER_EXCEPTIONS
			try
			{
				value = ::new (static_cast<void*>(ctrl.get_data())) U(std::forward<Args>(args)...);
			}
			catch (...)
			{
				ctrl.abandon_occupy();
				throw;
			}
#else // !NP_POINTER_EXCEPTIONS
			value = ::new (static_cast<void*>(ctrl.get_data())) U(std::forward<Args>(args)...);
#endif // !NP_POINTER_EXCEPTIONS
		}
		ctrl.finish_occupy(operations_for<U>);
		return value;
	}

	/**	Satisfied by slots whose storage size & alignment are known at compile time.
	 */
	template <typename Slot>
	concept static_slot = requires
	{
		{ Slot::static_capacity } -> std::convertible_to<std::size_t>;
		{ Slot::static_alignment } -> std::convertible_to<std::size_t>;
	};

	/**	Reject at compile time a value that can never fit a slot.
	 *	@tparam Slot The slot type.
	 *	@tparam U The type of value to be placed.
	 */
	template <typename Slot, typename U>
	constexpr void check_capacity() noexcept
	{
		if constexpr (static_slot<Slot>)
		{
			static_assert(sizeof(U) <= Slot::static_capacity,
				"Value type is larger than the slot's capacity.");
			static_assert(Slot::static_alignment % alignof(U) == 0u,
				"Value type requires stricter alignment than the slot provides.");
		}
	}
} // namespace np::pointer

namespace np
{
	/**	A slot over storage supplied by the caller.
	 *	@note The storage must outlive the slot. Whether a value fits is checked when it is placed.
	 */
	class basic_slot
	{
	public:
		/**	Construct an empty slot over caller storage.
		 *	@param storage The bytes values will be constructed in.
		 */
		explicit basic_slot(const std::span<std::byte> storage) noexcept
			: m_ctrl{ storage.data(), storage.size() }
		{ }
		basic_slot() = delete;
		basic_slot(const basic_slot&) = delete;
		basic_slot& operator=(const basic_slot&) = delete;

		/**	Check if a handle currently owns a value in this slot.
		 *	@note For diagnostics. The state may change immediately after returning if handles are used by other threads.
		 */
		bool is_occupied() const noexcept
		{
			return m_ctrl.is_occupied();
		}
		std::size_t capacity() const noexcept
		{
			return m_ctrl.get_capacity();
		}
		const std::byte* data() const noexcept
		{
			return m_ctrl.get_data();
		}

		/**	Return the control block used by handles.
		 */
		pointer::control& get_control() noexcept
		{
			return m_ctrl;
		}
		const pointer::control& get_control() const noexcept
		{
			return m_ctrl;
		}

	private:
		pointer::control m_ctrl;
	};

	/**	A slot with inline storage of \p Size bytes aligned to \p Align.
	 *	@tparam Size The capacity in bytes.
	 *	@tparam Align The alignment of the storage.
	 */
	template <std::size_t Size, std::size_t Align = pointer::default_alignment>
	class slot : public basic_slot
	{
		static_assert(Size > 0u, "A slot must have storage.");
		static_assert((Align & (Align - 1u)) == 0u, "Slot alignment must be a power of two.");

	public:
		static constexpr std::size_t static_capacity{ Size };
		static constexpr std::size_t static_alignment{ Align };

		slot() noexcept
			: basic_slot{ std::span<std::byte>{ m_storage } }
		{ }

	private:
		alignas(Align) std::byte m_storage[Size];
	};

	/**	A slot sized & aligned to hold any one of the given types.
	 */
	template <typename T, typename... Ts>
	using slot_for = slot<
		std::max({ sizeof(T), sizeof(Ts)... }),
		std::max({ alignof(T), alignof(Ts)... })>;
} // namespace np

namespace np::pointer
{
	/**	Holds a slot whose destructor never runs.
	 *	@detail Backs the static slots of NP_POINTER_MAKE_STATIC_UNIQUE & NP_POINTER_MAKE_STATIC_SHARED: handles into
	 *		them may live in other statics, so the slot stays valid, and doesn't check occupancy, at exit.
	 *	@tparam Slot The slot type.
	 */
	template <typename Slot>
	class undestroyed final
	{
	public:
		undestroyed() noexcept
		{
			::new (static_cast<void*>(m_storage)) Slot{};
		}
		undestroyed(const undestroyed&) = delete;
		undestroyed& operator=(const undestroyed&) = delete;

		Slot& get() noexcept
		{
			return *std::launder(reinterpret_cast<Slot*>(m_storage));
		}

	private:
		alignas(Slot) std::byte m_storage[sizeof(Slot)];
	};
} // namespace np::pointer

#endif
