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

#ifndef INC_NP__DYN_HPP
#define INC_NP__DYN_HPP

/**	@file
 *	This file declares np::dyn, a view of a value through an interface that
 *	hides the value's concrete type, and np::erase which builds one.
 *
 *	A view is two pointers: the value's address and a constant table of
 *	function pointers generated at compile time for the pair (interface,
 *	concrete type). Nothing is allocated and no virtual functions are
 *	required of the value.
 *
 *	An interface is a class with a nested vtable struct of function pointers
 *	and a static member function template make_vtable<T>() returning the table
 *	for concrete type T. The first parameter of every function pointer is the
 *	value's address, as const void* for operations that don't modify the value
 *	or void* for those that do:
 *
 *		struct shape
 *		{
 *			struct vtable
 *			{
 *				double (*area)(const void*) noexcept;
 *				void (*scale)(void*, double) noexcept;
 *			};
 *			template <typename T>
 *			static constexpr vtable make_vtable() noexcept
 *			{
 *				return {
 *					[](const void* self) noexcept { return static_cast<const T*>(self)->area(); },
 *					[](void* self, double factor) noexcept { static_cast<T*>(self)->scale(factor); }
 *				};
 *			}
 *		};
 *
 *		circle c{ 2.0 };
 *		np::dyn<shape> view = np::erase<shape>(c);
 *		view.call(&shape::vtable::area);
 *
 *	A const np::dyn only dispatches operations taking const void*. Handles
 *	holding a np::dyn (np::unique_ptr<np::dyn<I>>, np::shared_ptr<np::dyn<I>>)
 *	build the view when the value is constructed.
 */

#include <concepts>
#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>

#include "pointer.hpp"

namespace np
{
	/**	Satisfied by classes usable as the interface of np::dyn for concrete type T.
	 */
	template <typename Interface, typename T>
	concept interface_for = requires
	{
		typename Interface::vtable;
		{ Interface::template make_vtable<T>() } -> std::same_as<typename Interface::vtable>;
	};

	/**	The behaviour table of concrete type T through Interface.
	 *	@detail Constant initialized. Every view of a T through Interface points at this one table.
	 */
	template <typename Interface, typename T>
		requires interface_for<Interface, T>
	inline constexpr typename Interface::vtable vtable_for{ Interface::template make_vtable<T>() };

	/**	A type-erased view of a value through an interface.
	 *	@tparam Interface The interface. See the file documentation.
	 */
	template <typename Interface>
	class dyn
	{
	public:
		using interface_type = Interface;
		using vtable_type = typename Interface::vtable;

		constexpr dyn() noexcept = default;
		constexpr dyn(std::nullptr_t) noexcept
		{ }
		/**	Construct a view from its parts. Prefer np::erase, which can't mismatch \p table and \p data.
		 *	@param data The address of the value.
		 *	@param table The behaviour table of the value's concrete type.
		 *	@param type The type_id of the value's concrete type.
		 */
		constexpr dyn(void* const data, const vtable_type& table, const pointer::type_id type) noexcept
			: m_data{ data }
			, m_table{ &table }
			, m_type{ type }
		{ }

		/**	Invoke a non-modifying operation on the value.
		 *	@param op The vtable member to call, e.g. &Interface::vtable::name.
		 *	@param args The arguments following the value's address.
		 *	@return The result of the operation.
		 */
		template <typename R, typename... Params, bool NoExcept, typename... Args>
		R call(R (* vtable_type::* const op)(const void*, Params...) noexcept(NoExcept), Args&&... args) const
			noexcept(NoExcept)
		{
			NP_POINTER_ASSERT(m_table != nullptr, "Calling through an empty np::dyn.");
			return (m_table->*op)(m_data, std::forward<Args>(args)...);
		}
		/**	Invoke a modifying operation on the value.
		 *	@param op The vtable member to call, e.g. &Interface::vtable::scale.
		 *	@param args The arguments following the value's address.
		 *	@return The result of the operation.
		 */
		template <typename R, typename... Params, bool NoExcept, typename... Args>
		R call(R (* vtable_type::* const op)(void*, Params...) noexcept(NoExcept), Args&&... args)
			noexcept(NoExcept)
		{
			NP_POINTER_ASSERT(m_table != nullptr, "Calling through an empty np::dyn.");
			return (m_table->*op)(m_data, std::forward<Args>(args)...);
		}

		const vtable_type* table() const noexcept
		{
			return m_table;
		}
		void* data() noexcept
		{
			return m_data;
		}
		const void* data() const noexcept
		{
			return m_data;
		}
		/**	Return the type of the viewed value.
		 *	@return The type_id of the concrete type the view was built from, or nullptr if empty.
		 */
		pointer::type_id type() const noexcept
		{
			return m_type;
		}
		explicit constexpr operator bool() const noexcept
		{
			return m_table != nullptr;
		}

	private:
		void* m_data{ nullptr };
		const vtable_type* m_table{ nullptr };
		pointer::type_id m_type{ nullptr };
	};

	/**	Build a view of a value through an interface.
	 *	@tparam Interface The interface.
	 *	@tparam T The concrete type of the value.
	 *	@param value The value. Must outlive the view.
	 *	@return A view dispatching through vtable_for<Interface, T>.
	 */
	template <typename Interface, typename T>
		requires (false == std::is_const_v<T>
			&& interface_for<Interface, T>)
	constexpr dyn<Interface> erase(T& value) noexcept
	{
		return dyn<Interface>{
			static_cast<void*>(std::addressof(value)),
			vtable_for<Interface, T>,
			pointer::type_id_of<T>()
		};
	}

	template <typename T>
	struct is_dyn : std::false_type
	{ };
	template <typename Interface>
	struct is_dyn<dyn<Interface>> : std::true_type
	{ };
	template <typename T>
	constexpr bool is_dyn_v = is_dyn<std::remove_cv_t<T>>::value;
} // namespace np

#endif
