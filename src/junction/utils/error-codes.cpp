#include "error-codes.hpp"

#include <string>

namespace junction
{
namespace
{
   /**
    * @private
    */
   struct ECodeCategory : std::error_category
   {
      const char* name() const noexcept override;
      std::string message(int ev) const override;
   };

   /**
    * @private
    */
   const char* ECodeCategory::name() const noexcept { return "junction"; }

   /**
    * @private
    */
   std::string ECodeCategory::message(int e) const
   {
      switch(static_cast<ecode>(e)) {
      case ecode::okay: return "okay";
      case ecode::logic_error: return "logic error";
      case ecode::operation_failed: return "operation failed";
      case ecode::exception_occurred: return "exception occurred";
      case ecode::argument_error: return "argument error";
      case ecode::type_error: return "type error";
      case ecode::invalid_data: return "invalid data";
      case ecode::no_such_route: return "no such route";
      case ecode::not_connected: return "not connected";
      case ecode::already_connected: return "already connected";
      }
      return "(unknown error)";
   }

   /**
    * @private
    */
   static const ECodeCategory ecode_category{};
} // namespace

/**
 * @ingroup error-codes
 * @brief Make an `ecode` `std::error_code`.
 */
error_code make_error_code(ecode e) { return {static_cast<int>(e), ecode_category}; }

} // namespace junction
