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

#ifndef INC_NP__SHARED_PTR_HPP
#define INC_NP__SHARED_PTR_HPP

/**	@file
 *	This file declares np::shared_ptr, a reference counted owner of a value
 *	held in an np::slot, and related functions:
 *		* try_make_shared
 *		* make_shared (when exceptions are enabled)
 *		* downcast
 *		* NP_POINTER_MAKE_STATIC_SHARED
 *		* std::hash<np::shared_ptr>
 *
 *	The reference count lives in the slot's control block, so copying a
 *	handle never allocates. Copies may be used and destroyed on any thread;
 *	the value is torn down exactly once, by whichever thread drops the last
 *	reference, after every other owner's accesses.
 *
 *	Shared handles only give const access to their value. A value that must be
 *	modified while shared holds its mutable state in np::cell members.
 */

#include <compare>
#include <cstddef>
#include <functional>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>
#include <iosfwd>

#include "dyn.hpp"
#include "pointer.hpp"
#include "slot.hpp"
#include "unique_ptr.hpp"

namespace np
{
	template <typename T> class shared_ptr;

	template <typename U, typename T>
	shared_ptr<U> downcast(const shared_ptr<T>& from) noexcept;
	template <typename U, typename T>
	shared_ptr<U> downcast(shared_ptr<T>&& from) noexcept;

	/**	A shared owner of a value held in a slot.
	 *	@tparam T The element type: the constructed type, one of its bases, np::dyn<Interface>, or E[] for a
	 *		std::array<E, N>.
	 */
	template <typename T>
	class shared_ptr
	{
		static_assert(false == std::is_bounded_array_v<T>, "np::shared_ptr owns arrays as T[], constructed from a std::array<T, N>.");
		static_assert(false == std::is_reference_v<T>, "np::shared_ptr element type can't be a reference.");

	public:
		using element_type = std::remove_extent_t<T>;

		constexpr shared_ptr() noexcept = default;
		constexpr shared_ptr(std::nullptr_t) noexcept
		{ }
		/**	Adopt one reference to the value in a slot. Used by np::try_make_shared and np::downcast.
		 *	@param ctrl The slot's control block. The reference adopted must already be counted.
		 *	@param element The reference to the value.
		 */
		shared_ptr(const pointer::adopt_tag&, pointer::control& ctrl, const pointer::element_reference<T>& element) noexcept
			: m_ctrl{ &ctrl }
			, m_element{ element }
		{
			NP_POINTER_ASSERT(ctrl.get_state() == pointer::slot_state::occupied,
				"Adopting a slot that isn't occupied.");
		}
		shared_ptr(const shared_ptr& other) noexcept
			: m_ctrl{ other.m_ctrl }
			, m_element{ other.m_element }
		{
			increment(m_ctrl);
		}
		shared_ptr(shared_ptr&& other) noexcept
			: m_ctrl{ std::exchange(other.m_ctrl, nullptr) }
			, m_element{ std::exchange(other.m_element, pointer::element_reference<T>{}) }
		{ }
		template <typename U>
			requires (pointer::is_upcast_compatible<T, U>())
		shared_ptr(const shared_ptr<U>& other) noexcept
			: m_ctrl{ other.m_ctrl }
			, m_element{ other.m_element.get() }
		{
			increment(m_ctrl);
		}
		template <typename U>
			requires (pointer::is_upcast_compatible<T, U>())
		shared_ptr(shared_ptr<U>&& other) noexcept
			: m_ctrl{ std::exchange(other.m_ctrl, nullptr) }
			, m_element{ other.m_element.get() }
		{
			other.m_element.reset();
		}
		~shared_ptr()
		{
			decrement(m_ctrl);
		}

		shared_ptr& operator=(const shared_ptr& other) noexcept
		{
			increment(other.m_ctrl);
			decrement(m_ctrl);
			m_ctrl = other.m_ctrl;
			m_element = other.m_element;
			return *this;
		}
		shared_ptr& operator=(shared_ptr&& other) noexcept
		{
			if (this != &other)
			{
				pointer::control* const ctrl = std::exchange(other.m_ctrl, nullptr);
				const pointer::element_reference<T> element{ std::exchange(other.m_element, pointer::element_reference<T>{}) };
				decrement(m_ctrl);
				m_ctrl = ctrl;
				m_element = element;
			}
			return *this;
		}
		template <typename U>
			requires (pointer::is_upcast_compatible<T, U>())
		shared_ptr& operator=(const shared_ptr<U>& other) noexcept
		{
			increment(other.m_ctrl);
			decrement(m_ctrl);
			m_ctrl = other.m_ctrl;
			m_element = pointer::element_reference<T>{ other.m_element.get() };
			return *this;
		}
		template <typename U>
			requires (pointer::is_upcast_compatible<T, U>())
		shared_ptr& operator=(shared_ptr<U>&& other) noexcept
		{
			pointer::control* const ctrl = std::exchange(other.m_ctrl, nullptr);
			const pointer::element_reference<T> element{ other.m_element.get() };
			other.m_element.reset();
			decrement(m_ctrl);
			m_ctrl = ctrl;
			m_element = element;
			return *this;
		}
		shared_ptr& operator=(std::nullptr_t) noexcept
		{
			reset();
			return *this;
		}

		/**	Drop this handle's reference. Tears down the value if it was the last one.
		 */
		void reset() noexcept
		{
			m_element.reset();
			decrement(std::exchange(m_ctrl, nullptr));
		}
		void swap(shared_ptr& other) noexcept
		{
			std::swap(m_ctrl, other.m_ctrl);
			std::swap(m_element, other.m_element);
		}

		const element_type* get() const noexcept
		{
			return m_element.get();
		}
		const element_type& operator*() const noexcept
			requires (false == std::is_array_v<T>)
		{
			validate_access();
			return *m_element.get();
		}
		const element_type* operator->() const noexcept
			requires (false == std::is_array_v<T>)
		{
			validate_access();
			return m_element.get();
		}
		const element_type& operator[](const std::size_t index) const noexcept
			requires (std::is_array_v<T>)
		{
			validate_access();
			NP_POINTER_ASSERT(index < m_element.size(),
				"Index {} out of range of an array of {}.", index, m_element.size());
			return m_element.get()[index];
		}
		/**	Return the number of elements shared, or zero if empty.
		 */
		std::size_t size() const noexcept
			requires (std::is_array_v<T>)
		{
			return m_element.size();
		}
		std::span<const element_type> span() const noexcept
			requires (std::is_array_v<T>)
		{
			return { m_element.get(), m_element.size() };
		}
		explicit operator bool() const noexcept
		{
			return m_ctrl != nullptr;
		}

		/**	Return the number of handles sharing the value.
		 *	@note The count may change immediately after returning if other threads hold handles.
		 */
		pointer::use_count_t use_count() const noexcept
		{
			return m_ctrl ? m_ctrl->get_shared_count() : pointer::use_count_t{ 0 };
		}
		template <typename Y>
		bool owner_before(const shared_ptr<Y>& other) const noexcept
		{
			return std::less<const pointer::control*>{}(m_ctrl, other.m_ctrl);
		}

		/**	Return the control block of the shared value's slot.
		 *	@return The control block, or nullptr if empty.
		 */
		const pointer::control* get_control() const noexcept
		{
			return m_ctrl;
		}
		/**	Return the address of the shared value.
		 *	@note For an np::dyn element, this is the address of the viewed value rather than of the view.
		 */
		const void* address() const noexcept
		{
			return m_element.address();
		}

	private:
		template <typename U> friend class shared_ptr;

		template <typename U, typename V>
		friend shared_ptr<U> downcast(const shared_ptr<V>& from) noexcept;
		template <typename U, typename V>
		friend shared_ptr<U> downcast(shared_ptr<V>&& from) noexcept;

		static void increment(pointer::control* const ctrl) noexcept
		{
			if (ctrl != nullptr)
			{
				ctrl->shared_inc();
			}
		}
		static void decrement(pointer::control* const ctrl) noexcept
		{
			if (ctrl != nullptr)
			{
				ctrl->shared_dec();
			}
		}

		void validate_access() const noexcept
		{
			NP_POINTER_ASSERT(m_ctrl != nullptr, "Dereferencing an empty np::shared_ptr.");
			NP_POINTER_ASSERT(m_ctrl->get_state() == pointer::slot_state::occupied,
				"Dereferencing an np::shared_ptr whose value was torn down.");
#if NP_POINTER_DEBUG
			if constexpr (is_dyn_v<T>)
			{
				NP_POINTER_ASSERT(m_element.get()->type() == m_ctrl->get_type(),
					"np::dyn behaviour table doesn't belong to the slot's value.");
			}
#endif // NP_POINTER_DEBUG
		}

		pointer::control* m_ctrl{ nullptr };
		pointer::element_reference<T> m_element;
	};

	/**	Construct a value of type U in a slot and return the first of its shared owners.
	 *	@detail Never throws unless U's constructor does. If it throws, the slot is left empty.
	 *	@tparam T The element type of the returned handle: U, a base of U, or np::dyn<Interface>.
	 *	@tparam U The type to construct.
	 *	@param slot An empty slot. Must outlive every handle sharing the value.
	 *	@param args The arguments to pass to U::U. Not consumed on error.
	 *	@return The handle with use_count() of 1, errc::slot_occupied if \p slot isn't empty, or
	 *		errc::capacity_exceeded if a U can't be placed in \p slot's storage.
	 */
	template <typename T, typename U = T, typename Slot, typename... Args>
		requires (std::is_base_of_v<basic_slot, Slot>
			&& pointer::is_element_compatible<T, U>())
	result<shared_ptr<T>> try_make_shared(Slot& slot, Args&&... args)
		noexcept(std::is_nothrow_constructible_v<U, Args...>)
	{
		pointer::check_capacity<Slot, U>();

		pointer::control& ctrl = slot.get_control();
		errc error{};
		U* const value = pointer::occupy<U>(ctrl, error, std::forward<Args>(args)...);
		if (value == nullptr)
		{
			return error;
		}
		return shared_ptr<T>{ pointer::adopt_tag{}, ctrl, pointer::make_element_reference<T>(value) };
	}

#if NP_POINTER_EXCEPTIONS
	/**	Construct a value of type U in a slot and return the first of its shared owners.
	 *	@throw np::slot_error if the slot is occupied or U can't be placed in it. Exceptions from U's constructor.
	 */
	template <typename T, typename U = T, typename Slot, typename... Args>
		requires (std::is_base_of_v<basic_slot, Slot>
			&& pointer::is_element_compatible<T, U>())
	shared_ptr<T> make_shared(Slot& slot, Args&&... args)
	{
		result<shared_ptr<T>> made{ try_make_shared<T, U>(slot, std::forward<Args>(args)...) };
		if (false == made.has_value())
		{
			throw slot_error{ made.error() };
		}
		return std::move(made).value();
	}
#endif // NP_POINTER_EXCEPTIONS

	/**	Share ownership through a handle of the exact stored type.
	 *	@tparam U The type to cast to. Must be exactly the type constructed in the slot.
	 *	@param from The handle to cast.
	 *	@return A new owner, or an empty handle if the slot doesn't hold a U.
	 */
	template <typename U, typename T>
	shared_ptr<U> downcast(const shared_ptr<T>& from) noexcept
	{
		static_assert(false == is_dyn_v<U> && false == std::is_array_v<U>, "np::downcast casts to concrete types.");
		if (from.m_ctrl == nullptr || from.m_ctrl->get_type() != pointer::type_id_of<U>())
		{
			return nullptr;
		}
		pointer::control& ctrl = *from.m_ctrl;
		ctrl.shared_inc();
		return shared_ptr<U>{ pointer::adopt_tag{}, ctrl,
			pointer::element_reference<U>{ pointer::stored_value<U>(ctrl) } };
	}
	/**	Transfer this handle's reference to a handle of the exact stored type.
	 *	@tparam U The type to cast to. Must be exactly the type constructed in the slot.
	 *	@param from The handle to cast. Left unchanged if the cast fails.
	 *	@return The handle, or an empty handle if the slot doesn't hold a U.
	 */
	template <typename U, typename T>
	shared_ptr<U> downcast(shared_ptr<T>&& from) noexcept
	{
		static_assert(false == is_dyn_v<U> && false == std::is_array_v<U>, "np::downcast casts to concrete types.");
		if (from.m_ctrl == nullptr || from.m_ctrl->get_type() != pointer::type_id_of<U>())
		{
			return nullptr;
		}
		pointer::control& ctrl = *std::exchange(from.m_ctrl, nullptr);
		from.m_element.reset();
		return shared_ptr<U>{ pointer::adopt_tag{}, ctrl,
			pointer::element_reference<U>{ pointer::stored_value<U>(ctrl) } };
	}

	template <typename T, typename U>
	bool operator==(const shared_ptr<T>& lhs, const shared_ptr<U>& rhs) noexcept
	{
		return lhs.get_control() == rhs.get_control();
	}
	template <typename T>
	bool operator==(const shared_ptr<T>& lhs, const std::nullptr_t) noexcept
	{
		return lhs.get_control() == nullptr;
	}
	template <typename T, typename U>
	std::strong_ordering operator<=>(const shared_ptr<T>& lhs, const shared_ptr<U>& rhs) noexcept
	{
		return std::compare_three_way{}(lhs.get_control(), rhs.get_control());
	}
	template <typename T>
	std::strong_ordering operator<=>(const shared_ptr<T>& lhs, const std::nullptr_t) noexcept
	{
		return std::compare_three_way{}(lhs.get_control(), static_cast<const pointer::control*>(nullptr));
	}
	template <typename T, typename U, typename V>
	std::basic_ostream<U, V>& operator<<(std::basic_ostream<U, V>& ostr, const shared_ptr<T>& ptr)
	{
		ostr << ptr.address();
		return ostr;
	}
	template <typename T>
	void swap(shared_ptr<T>& lhs, shared_ptr<T>& rhs) noexcept
	{
		lhs.swap(rhs);
	}

	/**	Orders shared handles by the slot they share.
	 */
	struct owner_less
	{
		template <typename T, typename U>
		bool operator()(const shared_ptr<T>& lhs, const shared_ptr<U>& rhs) const noexcept
		{
			return lhs.owner_before(rhs);
		}
	};
} // namespace np

/**	Construct a value in a static slot private to this expansion site.
 *	@detail The slot is never destroyed, so handles may outlive static destruction of the expansion site.
 *	@param T The element type of the handle.
 *	@param U The type to construct.
 *	@return An np::result<np::shared_ptr<T>>. errc::slot_occupied while any handle from this site is alive.
 */
#define NP_POINTER_MAKE_STATIC_SHARED(T, U, ...) \
	([&]() \
	{ \
		static ::np::pointer::undestroyed<::np::slot_for<U>> np_pointer_static_slot; \
		return ::np::try_make_shared<T, U>(np_pointer_static_slot.get() __VA_OPT__(,) __VA_ARGS__); \
	}())

namespace std
{
	template <typename T>
	struct hash<np::shared_ptr<T>>
	{
		std::size_t operator()(const np::shared_ptr<T>& ptr) const noexcept
		{
			return std::hash<const void*>{}(ptr.get_control());
		}
	};
} // namespace std

#endif
