// Validation.hpp
// Type & validation engine: checks and coerces values written to typed members
#pragma once

#include <NGIN/ObjectModel/Export.hpp>
#include <NGIN/ObjectModel/Types.hpp>
#include <NGIN/ObjectModel/Descriptor.hpp>

namespace NGIN::ObjectModel
{

  // Exact acceptance: same native type, an Object of the class lineage, or an
  // Object structurally conforming to the interface.
  [[nodiscard]] NGIN_OBJECTMODEL_API bool MatchesTag(const Any &value, const TypeTag &tag);

  // Single coercion attempt towards `tag`. Native targets use arithmetic and text
  // conversions; class targets construct the class from the value; interfaces
  // cannot be coerced to.
  [[nodiscard]] NGIN_OBJECTMODEL_API Expected<Any> Coerce(const Any &value, const TypeTag &tag);

  /**
   * Validate a candidate value against a member descriptor.
   *
   * With declared types, an exact match is accepted unchanged. Otherwise a single
   * declared type allows one coercion attempt, while several declared types fail
   * without coercing. A validator, if present, then runs on the accepted value.
   * Any failure is an InvalidValue error naming the member; nothing is stored here.
   */
  [[nodiscard]] NGIN_OBJECTMODEL_API Expected<Any> Validate(const MemberDescriptor &desc, const Any &candidate);

} // namespace NGIN::ObjectModel
