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

#ifndef INC_NP__POINTER_HPP
#define INC_NP__POINTER_HPP

/**	@file
 *	This file declares the pieces shared by every np-pointer header:
 *		* configuration macros (NP_POINTER_DEBUG, NP_POINTER_EXCEPTIONS)
 *		* contract checking (NP_POINTER_VERIFY, NP_POINTER_ASSERT)
 *		* np::errc, np::result and np::slot_error
 *		* np::pointer::type_id_of
 *
 *	Recoverable failures (an occupied slot, a value that doesn't fit) are
 *	returned as np::result. Contract violations (double teardown, a reference
 *	count underflow, a slot destroyed while a handle still points into it)
 *	have no sensible recovery; they are reported on stderr and the process is
 *	aborted. Reporting never allocates: the diagnostic is formatted with {fmt}
 *	into a stack buffer.
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iosfwd>
#include <source_location>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

/**	If NP_POINTER_DEBUG is defined as non-zero, extra validation will be performed at runtime.
 */
#if !defined(NP_POINTER_DEBUG)
	#if defined(NDEBUG)
		#define NP_POINTER_DEBUG 0
	#else // !NDEBUG
		#define NP_POINTER_DEBUG 1
	#endif // !NDEBUG
#endif // !NP_POINTER_DEBUG

/**	NP_POINTER_EXCEPTIONS is non-zero if the throwing factories (np::make_unique, np::make_shared) are available.
 *	@note Building with -fno-exceptions sets this to zero, leaving only the np::try_make_* factories.
 */
#if !defined(NP_POINTER_EXCEPTIONS)
	#if defined(__cpp_exceptions)
		#define NP_POINTER_EXCEPTIONS 1
	#else // !__cpp_exceptions
		#define NP_POINTER_EXCEPTIONS 0
	#endif // !__cpp_exceptions
#endif // !NP_POINTER_EXCEPTIONS

#if NP_POINTER_EXCEPTIONS
	#include <stdexcept>
#endif // NP_POINTER_EXCEPTIONS

/**	Define NP_POINTER_CONTRACT_VIOLATION to replace the reporting & abort of a failed contract check.
 *	@note Must not return.
 */
#if !defined(NP_POINTER_CONTRACT_VIOLATION)
	#define NP_POINTER_CONTRACT_VIOLATION(expression, ...) \
		::np::pointer::contract_violation(std::source_location::current(), expression, __VA_ARGS__)
#endif // !NP_POINTER_CONTRACT_VIOLATION

/**	Check a condition that must hold in every build. Aborts the process if false.
 */
#define NP_POINTER_VERIFY(condition, ...) \
	do \
	{ \
		if (!(condition)) [[unlikely]] \
		{ \
			NP_POINTER_CONTRACT_VIOLATION(#condition, __VA_ARGS__); \
		} \
	} while (false)

/**	Check a condition only when NP_POINTER_DEBUG is non-zero.
 */
#if NP_POINTER_DEBUG
	#define NP_POINTER_ASSERT(condition, ...) NP_POINTER_VERIFY(condition, __VA_ARGS__)
#else // !NP_POINTER_DEBUG
	#define NP_POINTER_ASSERT(condition, ...) do { } while (false)
#endif // !NP_POINTER_DEBUG

namespace np::pointer
{
	/**	Report a failed contract check on stderr and abort.
	 *	@detail The message is formatted into a fixed-size stack buffer and truncated if it doesn't fit.
	 *	@param location Where the failed check is.
	 *	@param expression The text of the failed condition.
	 *	@param message A {fmt} format string describing the violation.
	 *	@param args Arguments for \p message.
	 */
	template <typename... Args>
	[[noreturn]] void contract_violation(
		const std::source_location& location,
		const char* const expression,
		fmt::format_string<Args...> message,
		Args&&... args) noexcept
	{
		static constexpr std::size_t capacity{ 511u };
		char buffer[capacity + 1u];

		std::size_t length{ 0u };
		const auto advance = [&length](const std::size_t written) noexcept
		{
			length = std::min(length + written, capacity);
		};
		advance(fmt::format_to_n(buffer, capacity,
			"{}:{}: np::pointer contract violation: ",
			location.file_name(), location.line()).size);
		advance(fmt::format_to_n(buffer + length, capacity - length,
			message, std::forward<Args>(args)...).size);
		advance(fmt::format_to_n(buffer + length, capacity - length,
			" [{}] in {}\n", expression, location.function_name()).size);
		buffer[length - 1u] = '\n';

		std::fwrite(buffer, 1u, length, stderr);
		std::fflush(stderr);
		std::abort();
	}

	/**	Holds one static byte per type to give each type a unique address.
	 */
	template <typename T>
	struct type_tag final
	{
		static constexpr char m_id{};
	};

	/**	An opaque identifier of a stored type. Only compared for equality.
	 */
	using type_id = const void*;

	/**	Return the identifier of a type. Doesn't require RTTI.
	 *	@tparam T The type to identify. cv-qualifiers are ignored.
	 *	@return The identifier of T.
	 */
	template <typename T>
	constexpr type_id type_id_of() noexcept
	{
		return &type_tag<std::remove_cv_t<T>>::m_id;
	}

	/**	The alignment used by np::slot when none is given.
	 */
	constexpr std::size_t default_alignment{ alignof(std::max_align_t) };
} // namespace np::pointer

namespace np
{
	/**	Recoverable failures of slot occupation.
	 */
	enum class errc : std::uint8_t
	{
		/**	The slot already holds a live value. Nothing was changed.
		 */
		slot_occupied = 1,
		/**	The value is too large for the slot, or the slot's storage isn't aligned well enough for it.
		 */
		capacity_exceeded
	};

	/**	Return a static string naming an errc.
	 *	@param error The error.
	 *	@return The name of \p error.
	 */
	constexpr const char* to_string(const errc error) noexcept
	{
		switch (error)
		{
		case errc::slot_occupied:
			return "slot occupied";
		case errc::capacity_exceeded:
			return "capacity exceeded";
		}
		return "unknown error";
	}

	template <typename U, typename V>
	std::basic_ostream<U, V>& operator<<(std::basic_ostream<U, V>& ostr, const errc error)
	{
		ostr << to_string(error);
		return ostr;
	}

#if NP_POINTER_EXCEPTIONS
	/**	Exception thrown by np::make_unique & np::make_shared when a slot can't be occupied.
	 */
	class slot_error : public std::runtime_error
	{
	public:
		explicit slot_error(const errc code)
			: std::runtime_error{ to_string(code) }
			, m_code{ code }
		{ }

		errc code() const noexcept
		{
			return m_code;
		}

	private:
		errc m_code;
	};
#endif // NP_POINTER_EXCEPTIONS

	/**	Either a handle or the reason it couldn't be created.
	 *	@tparam T A handle type (np::unique_ptr or np::shared_ptr).
	 *	@note Never throws. Accessing the value of an error result is a contract violation.
	 */
	template <typename T>
	class [[nodiscard]] result
	{
		static_assert(std::is_nothrow_default_constructible_v<T> && std::is_nothrow_move_constructible_v<T>,
			"np::result holds handle types, which are nothrow default & move constructible.");

	public:
		using value_type = T;

		result(T&& value) noexcept
			: m_value{ std::move(value) }
		{ }
		result(const errc error) noexcept
			: m_error{ error }
		{ }

		bool has_value() const noexcept
		{
			return m_error == errc{};
		}
		explicit operator bool() const noexcept
		{
			return has_value();
		}
		/**	Return the error.
		 *	@return The error, or a value-initialized errc if has_value().
		 */
		errc error() const noexcept
		{
			return m_error;
		}

		T& value() & noexcept
		{
			NP_POINTER_VERIFY(has_value(), "np::result::value() called on an error result ({})", to_string(m_error));
			return m_value;
		}
		const T& value() const& noexcept
		{
			NP_POINTER_VERIFY(has_value(), "np::result::value() called on an error result ({})", to_string(m_error));
			return m_value;
		}
		T value() && noexcept
		{
			NP_POINTER_VERIFY(has_value(), "np::result::value() called on an error result ({})", to_string(m_error));
			return std::move(m_value);
		}

		T& operator*() & noexcept
		{
			return value();
		}
		T* operator->() noexcept
		{
			return &value();
		}
		const T* operator->() const noexcept
		{
			return &value();
		}

	private:
		T m_value{};
		errc m_error{};
	};
} // namespace np

#endif
