#pragma once

#include <string_view>

#include <NGIN/JNI/Export.hpp>
#include <NGIN/JNI/Types.hpp>
#include <NGIN/JNI/Descriptor.hpp>
#include <NGIN/JNI/TypeMap.hpp>
#include <NGIN/JNI/Env.hpp>
#include <NGIN/JNI/String.hpp>
#include <NGIN/JNI/Reflector.hpp>
#include <NGIN/JNI/Callable.hpp>

namespace NGIN::JNI
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.JNI"; }

} // namespace NGIN::JNI
