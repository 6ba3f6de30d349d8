// Descriptor.hpp
// Runtime descriptor model: one value type, or a full method signature, plus its grammar text
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/JNI/Export.hpp>
#include <NGIN/JNI/Types.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace NGIN::JNI
{

  // Immutable, structurally compared. Object carries the slash-separated class
  // name, Array carries its element; every other kind is nullary.
  class NGIN_JNI_API Descriptor
  {
  public:
    Descriptor() = default;

    static Descriptor Primitive(DescriptorKind kind);
    static Descriptor Object(std::string_view className);
    static Descriptor Array(Descriptor element);

    [[nodiscard]] DescriptorKind Kind() const noexcept { return m_kind; }
    [[nodiscard]] bool IsPrimitive() const noexcept
    {
      return m_kind != DescriptorKind::Object && m_kind != DescriptorKind::Array && m_kind != DescriptorKind::Void;
    }
    [[nodiscard]] bool IsReference() const noexcept
    {
      return m_kind == DescriptorKind::Object || m_kind == DescriptorKind::Array;
    }
    [[nodiscard]] bool IsVoid() const noexcept { return m_kind == DescriptorKind::Void; }

    // Empty unless Kind() == Object.
    [[nodiscard]] std::string_view ClassName() const noexcept { return m_className; }
    // Only valid when Kind() == Array.
    [[nodiscard]] const Descriptor &Element() const noexcept { return *m_element; }
    // Number of leading '[' in the encoding.
    [[nodiscard]] NGIN::UIntSize Dimensions() const noexcept;

    void AppendTo(std::string &out) const;
    [[nodiscard]] std::string Serialize() const;

    friend NGIN_JNI_API bool operator==(const Descriptor &a, const Descriptor &b) noexcept;

  private:
    DescriptorKind m_kind{DescriptorKind::Void};
    std::string m_className{};
    std::shared_ptr<const Descriptor> m_element{};
  };

  struct NGIN_JNI_API MethodDescriptor
  {
    NGIN::Containers::Vector<Descriptor> parameters{};
    Descriptor returnType{};

    void AppendTo(std::string &out) const;
    // "(" + parameters + ")" + return, no separators.
    [[nodiscard]] std::string Serialize() const;

    friend NGIN_JNI_API bool operator==(const MethodDescriptor &a, const MethodDescriptor &b) noexcept;
  };

  // Grammar letter of a primitive or void kind ('\0' for Object/Array).
  [[nodiscard]] constexpr char PrimitiveCode(DescriptorKind kind) noexcept
  {
    switch (kind)
    {
    case DescriptorKind::Byte:
      return 'B';
    case DescriptorKind::Char:
      return 'C';
    case DescriptorKind::Int:
      return 'I';
    case DescriptorKind::Long:
      return 'J';
    case DescriptorKind::Short:
      return 'S';
    case DescriptorKind::Float:
      return 'F';
    case DescriptorKind::Double:
      return 'D';
    case DescriptorKind::Boolean:
      return 'Z';
    case DescriptorKind::Void:
      return 'V';
    case DescriptorKind::Object:
    case DescriptorKind::Array:
      break;
    }
    return '\0';
  }

  [[nodiscard]] constexpr CallKind CallKindOf(DescriptorKind kind) noexcept
  {
    switch (kind)
    {
    case DescriptorKind::Byte:
      return CallKind::Byte;
    case DescriptorKind::Char:
      return CallKind::Char;
    case DescriptorKind::Int:
      return CallKind::Int;
    case DescriptorKind::Long:
      return CallKind::Long;
    case DescriptorKind::Short:
      return CallKind::Short;
    case DescriptorKind::Float:
      return CallKind::Float;
    case DescriptorKind::Double:
      return CallKind::Double;
    case DescriptorKind::Boolean:
      return CallKind::Boolean;
    case DescriptorKind::Void:
      return CallKind::Void;
    case DescriptorKind::Object:
    case DescriptorKind::Array:
      break;
    }
    return CallKind::Object;
  }

  [[nodiscard]] inline CallKind CallKindOf(const Descriptor &d) noexcept { return CallKindOf(d.Kind()); }

  // Parse a single field descriptor ("I", "[J", "Ljava/lang/String;").
  [[nodiscard]] NGIN_JNI_API ExpectedDescriptor ParseDescriptor(std::string_view text);
  // Parse a method descriptor ("(ILjava/lang/String;)V").
  [[nodiscard]] NGIN_JNI_API ExpectedMethodDescriptor ParseMethodDescriptor(std::string_view text);

} // namespace NGIN::JNI
