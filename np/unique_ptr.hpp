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

#ifndef INC_NP__UNIQUE_PTR_HPP
#define INC_NP__UNIQUE_PTR_HPP

/**	@file
 *	This file declares np::unique_ptr, the exclusive owner of a value held in
 *	an np::slot, and related functions:
 *		* try_make_unique
 *		* make_unique (when exceptions are enabled)
 *		* downcast
 *		* NP_POINTER_MAKE_STATIC_UNIQUE
 *		* std::hash<np::unique_ptr>
 *
 *	Unlike std::unique_ptr, construction never allocates and ownership can't be
 *	adopted from or released to a raw pointer: the value always lives in the
 *	slot it was constructed in, and the slot is returned to empty when the
 *	value is torn down. The element type may be a base of the constructed type
 *	or an np::dyn view of it:
 *
 *		np::slot_for<circle> storage;
 *		np::unique_ptr<np::dyn<shape>> s{ np::try_make_unique<np::dyn<shape>, circle>(storage, 2.0).value() };
 *		s->call(&shape::vtable::area);
 *
 *	An element type of T[] owns a std::array<T, N> and forgets its extent at
 *	compile time, keeping it as size():
 *
 *		np::slot_for<std::array<std::uint8_t, 3>> bytes;
 *		np::unique_ptr<std::uint8_t[]> b{ np::try_make_unique<std::uint8_t[], std::array<std::uint8_t, 3>>(bytes).value() };
 *		b[2] = 0xffu;
 */

#include <array>
#include <compare>
#include <cstddef>
#include <functional>
#include <memory>
#include <new>
#include <span>
#include <type_traits>
#include <utility>
#include <iosfwd>

#include "dyn.hpp"
#include "pointer.hpp"
#include "slot.hpp"

namespace np::pointer
{
	/**	Tag for handle constructors adopting a freshly occupied slot.
	 */
	struct adopt_tag {};

	/**	How a handle refers to its element: a pointer for ordinary types.
	 *	@tparam T The element type.
	 */
	template <typename T>
	class element_reference
	{
	public:
		using element_type = T;

		constexpr element_reference() noexcept = default;
		constexpr explicit element_reference(T* const value) noexcept
			: m_value{ value }
		{ }

		T* get() const noexcept
		{
			return m_value;
		}
		/**	Return the address of the referenced value.
		 */
		const void* address() const noexcept
		{
			return m_value;
		}
		void reset() noexcept
		{
			m_value = nullptr;
		}

	private:
		T* m_value{ nullptr };
	};

	/**	How a handle refers to its element: an embedded view for np::dyn.
	 *	@tparam Interface The interface of the view.
	 */
	template <typename Interface>
	class element_reference<dyn<Interface>>
	{
	public:
		using element_type = dyn<Interface>;

		constexpr element_reference() noexcept = default;
		constexpr explicit element_reference(const dyn<Interface>& view) noexcept
			: m_view{ view }
		{ }

		/**	Return a pointer to the embedded view, or nullptr if there is no value.
		 */
		dyn<Interface>* get() const noexcept
		{
			return m_view ? std::addressof(m_view) : nullptr;
		}
		/**	Return the address of the viewed value.
		 */
		const void* address() const noexcept
		{
			return m_view.data();
		}
		void reset() noexcept
		{
			m_view = nullptr;
		}

	private:
		/**	Mutable as handles hand out non-const pointers to their element from const members, as pointers do.
		 */
		mutable dyn<Interface> m_view;
	};

	/**	How a handle refers to its element: the first element and extent for arrays.
	 *	@tparam T The array's element type.
	 */
	template <typename T>
	class element_reference<T[]>
	{
	public:
		using element_type = T;

		constexpr element_reference() noexcept = default;
		constexpr element_reference(T* const data, const std::size_t size) noexcept
			: m_data{ data }
			, m_size{ size }
		{ }

		T* get() const noexcept
		{
			return m_data;
		}
		const void* address() const noexcept
		{
			return m_data;
		}
		std::size_t size() const noexcept
		{
			return m_size;
		}
		void reset() noexcept
		{
			m_data = nullptr;
			m_size = 0u;
		}

	private:
		T* m_data{ nullptr };
		std::size_t m_size{ 0u };
	};

	/**	Describes the stored types an array handle may own: std::array<T, N>.
	 */
	template <typename U>
	struct array_storage : std::false_type {};
	template <typename T, std::size_t N>
	struct array_storage<std::array<T, N>> : std::true_type
	{
		using value_type = T;
	};

	/**	Check if a handle of element type T may own a constructed value of type U.
	 *	@tparam T The handle's element type.
	 *	@tparam U The constructed type.
	 */
	template <typename T, typename U>
	constexpr bool is_element_compatible() noexcept
	{
		if constexpr (is_dyn_v<U> || std::is_array_v<U> || std::is_reference_v<U>)
		{
			return false;
		}
		else if constexpr (is_dyn_v<T>)
		{
			return interface_for<typename T::interface_type, U>;
		}
		else if constexpr (std::is_array_v<T>)
		{
			// Elements are indexed with T's stride, so the stored elements must be T rather than derived from it.
			if constexpr (std::is_unbounded_array_v<T> && array_storage<U>::value)
			{
				using element_type = std::remove_extent_t<T>;
				using stored_type = typename array_storage<U>::value_type;
				return std::is_same_v<std::remove_cv_t<element_type>, std::remove_cv_t<stored_type>>
					&& std::is_convertible_v<stored_type*, element_type*>;
			}
			else
			{
				return false;
			}
		}
		else
		{
			return std::is_convertible_v<U*, T*>;
		}
	}

	/**	Check if a handle of element type T may take over a handle of element type U by implicit conversion.
	 */
	template <typename T, typename U>
	constexpr bool is_upcast_compatible() noexcept
	{
		return false == is_dyn_v<T> && false == is_dyn_v<U>
			&& false == std::is_array_v<T> && false == std::is_array_v<U>
			&& std::is_convertible_v<U*, T*>;
	}

	/**	Build the element reference a handle of element type T keeps for a constructed value.
	 *	@tparam T The handle's element type.
	 *	@tparam U The constructed type.
	 *	@param value The constructed value.
	 *	@return A pointer to, or view of, \p value.
	 */
	template <typename T, typename U>
	element_reference<T> make_element_reference(U* const value) noexcept
	{
		static_assert(is_element_compatible<T, U>(),
			"Handle element type must be the constructed type, a base of it, or an np::dyn of an interface it satisfies.");
		if constexpr (is_dyn_v<T>)
		{
			return element_reference<T>{ erase<typename T::interface_type>(*value) };
		}
		else if constexpr (std::is_array_v<T>)
		{
			return element_reference<T>{ value->data(), value->size() };
		}
		else
		{
			return element_reference<T>{ value };
		}
	}

	/**	Return the value held by a slot as a U. The slot must hold exactly a U.
	 *	@param ctrl The slot's control block.
	 *	@return A pointer to the U in the slot's storage.
	 */
	template <typename U>
	U* stored_value(const control& ctrl) noexcept
	{
		NP_POINTER_ASSERT(ctrl.get_type() == type_id_of<U>(),
			"Slot doesn't hold a value of the requested type.");
		return std::launder(static_cast<U*>(static_cast<void*>(ctrl.get_data())));
	}
} // namespace np::pointer

namespace np
{
	template <typename T> class unique_ptr;

	template <typename U, typename T>
	unique_ptr<U> downcast(unique_ptr<T>&& from) noexcept;

	/**	The exclusive owner of a value held in a slot.
	 *	@tparam T The element type: the constructed type, one of its bases, np::dyn<Interface>, or E[] for a
	 *		std::array<E, N>.
	 */
	template <typename T>
	class unique_ptr
	{
		static_assert(false == std::is_bounded_array_v<T>, "np::unique_ptr owns arrays as T[], constructed from a std::array<T, N>.");
		static_assert(false == std::is_reference_v<T>, "np::unique_ptr element type can't be a reference.");

	public:
		using element_type = std::remove_extent_t<T>;

		constexpr unique_ptr() noexcept = default;
		constexpr unique_ptr(std::nullptr_t) noexcept
		{ }
		/**	Adopt a value just constructed in a slot. Used by np::try_make_unique.
		 *	@param ctrl The slot's control block, occupied with one reference.
		 *	@param element The reference to the constructed value.
		 */
		unique_ptr(const pointer::adopt_tag&, pointer::control& ctrl, const pointer::element_reference<T>& element) noexcept
			: m_ctrl{ &ctrl }
			, m_element{ element }
		{
			NP_POINTER_ASSERT(ctrl.get_state() == pointer::slot_state::occupied,
				"Adopting a slot that isn't occupied.");
		}
		unique_ptr(const unique_ptr&) = delete;
		unique_ptr(unique_ptr&& other) noexcept
			: m_ctrl{ std::exchange(other.m_ctrl, nullptr) }
			, m_element{ std::exchange(other.m_element, pointer::element_reference<T>{}) }
		{ }
		template <typename U>
			requires (pointer::is_upcast_compatible<T, U>())
		unique_ptr(unique_ptr<U>&& other) noexcept
			: m_ctrl{ std::exchange(other.m_ctrl, nullptr) }
			, m_element{ other.m_element.get() }
		{
			other.m_element.reset();
		}
		~unique_ptr()
		{
			reset();
		}

		unique_ptr& operator=(const unique_ptr&) = delete;
		unique_ptr& operator=(unique_ptr&& other) noexcept
		{
			if (this != &other)
			{
				reset();
				m_ctrl = std::exchange(other.m_ctrl, nullptr);
				m_element = std::exchange(other.m_element, pointer::element_reference<T>{});
			}
			return *this;
		}
		template <typename U>
			requires (pointer::is_upcast_compatible<T, U>())
		unique_ptr& operator=(unique_ptr<U>&& other) noexcept
		{
			reset();
			m_ctrl = std::exchange(other.m_ctrl, nullptr);
			m_element = pointer::element_reference<T>{ other.m_element.get() };
			other.m_element.reset();
			return *this;
		}
		unique_ptr& operator=(std::nullptr_t) noexcept
		{
			reset();
			return *this;
		}

		/**	Tear down the owned value, if any, and return its slot to empty.
		 */
		void reset() noexcept
		{
			if (pointer::control* const ctrl = std::exchange(m_ctrl, nullptr))
			{
				m_element.reset();
				ctrl->teardown();
			}
		}
		void swap(unique_ptr& other) noexcept
		{
			std::swap(m_ctrl, other.m_ctrl);
			std::swap(m_element, other.m_element);
		}

		/**	Move the owned value out of its slot and return the slot to empty.
		 *	@detail T must be the constructed type. Taking through a handle to a base of it aborts rather than slicing.
		 *	@return The value previously owned.
		 */
		template <typename U = T>
		U take() noexcept(std::is_nothrow_move_constructible_v<U>)
			requires (std::is_same_v<U, T>
				&& false == is_dyn_v<U>
				&& false == std::is_array_v<U>
				&& std::is_move_constructible_v<U>)
		{
			NP_POINTER_VERIFY(m_ctrl != nullptr, "Taking the value of an empty np::unique_ptr.");
			NP_POINTER_VERIFY(m_ctrl->get_type() == pointer::type_id_of<T>(),
				"Taking the value through a handle to one of its bases would slice it.");
			T value{ std::move(*m_element.get()) };
			reset();
			return value;
		}

		element_type* get() const noexcept
		{
			return m_element.get();
		}
		element_type& operator*() const noexcept
			requires (false == std::is_array_v<T>)
		{
			validate_access();
			return *m_element.get();
		}
		element_type* operator->() const noexcept
			requires (false == std::is_array_v<T>)
		{
			validate_access();
			return m_element.get();
		}
		element_type& operator[](const std::size_t index) const noexcept
			requires (std::is_array_v<T>)
		{
			validate_access();
			NP_POINTER_ASSERT(index < m_element.size(),
				"Index {} out of range of an array of {}.", index, m_element.size());
			return m_element.get()[index];
		}
		/**	Return the number of elements owned, or zero if empty.
		 */
		std::size_t size() const noexcept
			requires (std::is_array_v<T>)
		{
			return m_element.size();
		}
		std::span<element_type> span() const noexcept
			requires (std::is_array_v<T>)
		{
			return { m_element.get(), m_element.size() };
		}
		explicit operator bool() const noexcept
		{
			return m_ctrl != nullptr;
		}

		/**	Return the control block of the owned value's slot.
		 *	@return The control block, or nullptr if empty.
		 */
		const pointer::control* get_control() const noexcept
		{
			return m_ctrl;
		}
		/**	Return the address of the owned value.
		 *	@note For an np::dyn element, this is the address of the viewed value rather than of the view.
		 */
		const void* address() const noexcept
		{
			return m_element.address();
		}

	private:
		template <typename U> friend class unique_ptr;

		template <typename U, typename V>
		friend unique_ptr<U> downcast(unique_ptr<V>&& from) noexcept;

		void validate_access() const noexcept
		{
			NP_POINTER_ASSERT(m_ctrl != nullptr, "Dereferencing an empty np::unique_ptr.");
			NP_POINTER_ASSERT(m_ctrl->get_state() == pointer::slot_state::occupied,
				"Dereferencing an np::unique_ptr whose value was torn down.");
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

	/**	Construct a value of type U in a slot and return its exclusive owner.
	 *	@detail Never throws unless U's constructor does. If it throws, the slot is left empty.
	 *	@tparam T The element type of the returned handle: U, a base of U, or np::dyn<Interface>.
	 *	@tparam U The type to construct.
	 *	@param slot An empty slot. Must outlive the returned handle.
	 *	@param args The arguments to pass to U::U. Not consumed on error.
	 *	@return The handle, errc::slot_occupied if \p slot isn't empty, or errc::capacity_exceeded if a U can't be
	 *		placed in \p slot's storage. An np::slot too small for U is rejected at compile time instead.
	 */
	template <typename T, typename U = T, typename Slot, typename... Args>
		requires (std::is_base_of_v<basic_slot, Slot>
			&& pointer::is_element_compatible<T, U>())
	result<unique_ptr<T>> try_make_unique(Slot& slot, Args&&... args)
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
		return unique_ptr<T>{ pointer::adopt_tag{}, ctrl, pointer::make_element_reference<T>(value) };
	}

#if NP_POINTER_EXCEPTIONS
	/**	Construct a value of type U in a slot and return its exclusive owner.
	 *	@throw np::slot_error if the slot is occupied or U can't be placed in it. Exceptions from U's constructor.
	 *	@tparam T The element type of the returned handle: U, a base of U, or np::dyn<Interface>.
	 *	@tparam U The type to construct.
	 *	@param slot An empty slot. Must outlive the returned handle.
	 *	@param args The arguments to pass to U::U.
	 *	@return A non-null handle.
	 */
	template <typename T, typename U = T, typename Slot, typename... Args>
		requires (std::is_base_of_v<basic_slot, Slot>
			&& pointer::is_element_compatible<T, U>())
	unique_ptr<T> make_unique(Slot& slot, Args&&... args)
	{
		result<unique_ptr<T>> made{ try_make_unique<T, U>(slot, std::forward<Args>(args)...) };
		if (false == made.has_value())
		{
			throw slot_error{ made.error() };
		}
		return std::move(made).value();
	}
#endif // NP_POINTER_EXCEPTIONS

	/**	Transfer ownership to a handle of the exact stored type.
	 *	@tparam U The type to cast to. Must be exactly the type constructed in the slot.
	 *	@param from The handle to cast. Left unchanged if the cast fails.
	 *	@return The handle, or an empty handle if the slot doesn't hold a U.
	 */
	template <typename U, typename T>
	unique_ptr<U> downcast(unique_ptr<T>&& from) noexcept
	{
		static_assert(false == is_dyn_v<U> && false == std::is_array_v<U>, "np::downcast casts to concrete types.");
		if (from.m_ctrl == nullptr || from.m_ctrl->get_type() != pointer::type_id_of<U>())
		{
			return nullptr;
		}
		pointer::control& ctrl = *std::exchange(from.m_ctrl, nullptr);
		from.m_element.reset();
		return unique_ptr<U>{ pointer::adopt_tag{}, ctrl,
			pointer::element_reference<U>{ pointer::stored_value<U>(ctrl) } };
	}

	template <typename T, typename U>
	bool operator==(const unique_ptr<T>& lhs, const unique_ptr<U>& rhs) noexcept
	{
		return lhs.get_control() == rhs.get_control();
	}
	template <typename T>
	bool operator==(const unique_ptr<T>& lhs, const std::nullptr_t) noexcept
	{
		return lhs.get_control() == nullptr;
	}
	template <typename T, typename U>
	std::strong_ordering operator<=>(const unique_ptr<T>& lhs, const unique_ptr<U>& rhs) noexcept
	{
		return std::compare_three_way{}(lhs.get_control(), rhs.get_control());
	}
	template <typename T>
	std::strong_ordering operator<=>(const unique_ptr<T>& lhs, const std::nullptr_t) noexcept
	{
		return std::compare_three_way{}(lhs.get_control(), static_cast<const pointer::control*>(nullptr));
	}
	template <typename T, typename U, typename V>
	std::basic_ostream<U, V>& operator<<(std::basic_ostream<U, V>& ostr, const unique_ptr<T>& ptr)
	{
		ostr << ptr.address();
		return ostr;
	}
	template <typename T>
	void swap(unique_ptr<T>& lhs, unique_ptr<T>& rhs) noexcept
	{
		lhs.swap(rhs);
	}
} // namespace np

/**	Construct a value in a static slot private to this expansion site.
 *	@detail The slot is never destroyed, so the handle may outlive static destruction of the expansion site.
 *	@param T The element type of the handle.
 *	@param U The type to construct.
 *	@return An np::result<np::unique_ptr<T>>. errc::slot_occupied while a previous handle from this site is alive.
 */
#define NP_POINTER_MAKE_STATIC_UNIQUE(T, U, ...) \
	([&]() \
	{ \
		static ::np::pointer::undestroyed<::np::slot_for<U>> np_pointer_static_slot; \
		return ::np::try_make_unique<T, U>(np_pointer_static_slot.get() __VA_OPT__(,) __VA_ARGS__); \
	}())

namespace std
{
	template <typename T>
	struct hash<np::unique_ptr<T>>
	{
		std::size_t operator()(const np::unique_ptr<T>& ptr) const noexcept
		{
			return std::hash<const void*>{}(ptr.get_control());
		}
	};
} // namespace std

#endif
