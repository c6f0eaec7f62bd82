#pragma once

#include <string_view>

#include <NGIN/ObjectModel/Export.hpp>
#include <NGIN/ObjectModel/Types.hpp>
#include <NGIN/ObjectModel/Descriptor.hpp>
#include <NGIN/ObjectModel/Access.hpp>
#include <NGIN/ObjectModel/Validation.hpp>
#include <NGIN/ObjectModel/Object.hpp>
#include <NGIN/ObjectModel/Interface.hpp>
#include <NGIN/ObjectModel/ClassBuilder.hpp>
#include <NGIN/ObjectModel/Diagnostics.hpp>
#include <NGIN/ObjectModel/ModuleInit.hpp>

namespace NGIN::ObjectModel
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.ObjectModel"; }

} // namespace NGIN::ObjectModel
