// Types.hpp
// Public-facing error codes, kind tags and expected aliases
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/JNI/Export.hpp>

#include <jni.h>

#include <expected>
#include <string_view>

namespace NGIN::JNI
{

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    AllocationFailed = 3,
    CallFailed = 4,
    OutOfMemory = 5,
  };

  struct NGIN_JNI_API Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
    // Class name, member + signature or descriptor text involved; interned.
    std::string_view subject{};

    constexpr Error() = default;
    constexpr Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
    Error(ErrorCode c, std::string_view m, std::string_view s);
  };

  // Kind of a single value in the runtime's type system.
  enum class DescriptorKind : NGIN::UInt8
  {
    Byte = 0,
    Char,
    Int,
    Long,
    Short,
    Float,
    Double,
    Boolean,
    Void,
    Object,
    Array,
  };

  // Which per-kind Call<Type>MethodA operation decodes a return value.
  // All reference kinds share Object.
  enum class CallKind : NGIN::UInt8
  {
    Byte = 0,
    Char,
    Int,
    Long,
    Short,
    Float,
    Double,
    Boolean,
    Object,
    Void,
  };

  enum class ReferenceKind : NGIN::UInt8
  {
    Local = 0,
    Global = 1,
    WeakGlobal = 2,
  };

  // Forward decls of high-level wrappers
  class Descriptor;
  struct MethodDescriptor;
  class Env;
  class Reflector;
  class Class;
  class Object;
  class String;

  template <class T>
  using Expected = std::expected<T, Error>;

  using ExpectedDescriptor = std::expected<Descriptor, Error>;
  using ExpectedMethodDescriptor = std::expected<MethodDescriptor, Error>;
  using ExpectedClass = std::expected<Class, Error>;
  using ExpectedObject = std::expected<Object, Error>;
  using ExpectedString = std::expected<String, Error>;

  namespace detail
  {
    using NameId = NGIN::UInt32;

    // Process-wide interner backing Error::subject and cache keys.
    NGIN_JNI_API NameId InternNameId(std::string_view s) noexcept;
    NGIN_JNI_API std::string_view NameFromId(NameId id) noexcept;
    NGIN_JNI_API std::string_view InternName(std::string_view s) noexcept;
  } // namespace detail

} // namespace NGIN::JNI
