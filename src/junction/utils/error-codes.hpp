#pragma once

#include <system_error>

/**
 * @defgroup error-codes Error Codes
 * @ingroup junction-utils
 *
 * ~~~~~~~~~~~~~~~~~~~~~~{.cpp}
 * // The route key does not resolve to a node
 * return make_error_code(ecode::no_such_route);
 * ~~~~~~~~~~~~~~~~~~~~~~
 */

namespace junction
{
using std::error_code;

/**
 * @ingroup error-codes
 * @brief Complete set of junction error codes.
 */
enum class ecode : int {
   okay = 0,           //!< i.e., everything's okay.
   logic_error,        //!< Faulty logic in the program.
   operation_failed,   //!< Like a system error, but within the program.
   exception_occurred, //!< Exception caught and forwarded as an error_code.
   argument_error,     //!< An invalid argument was supplied.
   type_error,         //!< A field had the wrong type.
   invalid_data,       //!< Input data (network frame, url, etc.) was invalid.

   no_such_route,     //!< A route key did not resolve to a node in the route trie.
   not_connected,     //!< The transport is not open.
   already_connected, //!< The transport has already been asked to connect.
};
} // namespace junction

namespace std
{
template<> struct is_error_code_enum<junction::ecode> : true_type
{};
} // namespace std

namespace junction
{
error_code make_error_code(ecode);
} // namespace junction
