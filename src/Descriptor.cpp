#include <NGIN/JNI/Descriptor.hpp>

#include <utility>

namespace NGIN::JNI
{

  namespace
  {
    constexpr NGIN::UIntSize kMaxArrayDimensions = 255;

    struct Cursor
    {
      std::string_view text;
      NGIN::UIntSize pos{0};

      [[nodiscard]] bool AtEnd() const noexcept { return pos >= text.size(); }
      [[nodiscard]] char Peek() const noexcept { return AtEnd() ? '\0' : text[pos]; }
    };

    Error Malformed(std::string_view message, std::string_view text)
    {
      return Error{ErrorCode::InvalidArgument, message, text};
    }

    bool KindFromCode(char c, DescriptorKind &out) noexcept
    {
      switch (c)
      {
      case 'B':
        out = DescriptorKind::Byte;
        return true;
      case 'C':
        out = DescriptorKind::Char;
        return true;
      case 'I':
        out = DescriptorKind::Int;
        return true;
      case 'J':
        out = DescriptorKind::Long;
        return true;
      case 'S':
        out = DescriptorKind::Short;
        return true;
      case 'F':
        out = DescriptorKind::Float;
        return true;
      case 'D':
        out = DescriptorKind::Double;
        return true;
      case 'Z':
        out = DescriptorKind::Boolean;
        return true;
      case 'V':
        out = DescriptorKind::Void;
        return true;
      default:
        return false;
      }
    }

    // Reads one descriptor starting at cur.pos. Void is accepted only when allowVoid is set.
    ExpectedDescriptor ParseOne(Cursor &cur, bool allowVoid)
    {
      NGIN::UIntSize dims = 0;
      while (cur.Peek() == '[')
      {
        ++dims;
        ++cur.pos;
      }
      if (dims > kMaxArrayDimensions)
        return std::unexpected(Malformed("array descriptor exceeds 255 dimensions", cur.text));
      if (cur.AtEnd())
        return std::unexpected(Malformed("unexpected end of descriptor", cur.text));

      Descriptor base;
      const char c = cur.text[cur.pos];
      if (c == 'L')
      {
        const auto end = cur.text.find(';', cur.pos + 1);
        if (end == std::string_view::npos)
          return std::unexpected(Malformed("unterminated class descriptor", cur.text));
        const auto name = cur.text.substr(cur.pos + 1, end - cur.pos - 1);
        if (name.empty())
          return std::unexpected(Malformed("empty class name in descriptor", cur.text));
        base = Descriptor::Object(name);
        cur.pos = end + 1;
      }
      else
      {
        DescriptorKind kind{};
        if (!KindFromCode(c, kind))
          return std::unexpected(Malformed("unknown descriptor character", cur.text));
        if (kind == DescriptorKind::Void && (dims > 0 || !allowVoid))
          return std::unexpected(Malformed("void is only valid as a return type", cur.text));
        base = Descriptor::Primitive(kind);
        ++cur.pos;
      }

      for (NGIN::UIntSize i = 0; i < dims; ++i)
        base = Descriptor::Array(std::move(base));
      return base;
    }
  } // namespace

  Descriptor Descriptor::Primitive(DescriptorKind kind)
  {
    Descriptor d;
    d.m_kind = kind;
    return d;
  }

  Descriptor Descriptor::Object(std::string_view className)
  {
    Descriptor d;
    d.m_kind = DescriptorKind::Object;
    d.m_className = std::string{className};
    return d;
  }

  Descriptor Descriptor::Array(Descriptor element)
  {
    Descriptor d;
    d.m_kind = DescriptorKind::Array;
    d.m_element = std::make_shared<const Descriptor>(std::move(element));
    return d;
  }

  NGIN::UIntSize Descriptor::Dimensions() const noexcept
  {
    NGIN::UIntSize n = 0;
    const Descriptor *d = this;
    while (d->m_kind == DescriptorKind::Array)
    {
      ++n;
      d = d->m_element.get();
    }
    return n;
  }

  void Descriptor::AppendTo(std::string &out) const
  {
    switch (m_kind)
    {
    case DescriptorKind::Object:
      out.push_back('L');
      out.append(m_className);
      out.push_back(';');
      break;
    case DescriptorKind::Array:
      out.push_back('[');
      m_element->AppendTo(out);
      break;
    default:
      out.push_back(PrimitiveCode(m_kind));
      break;
    }
  }

  std::string Descriptor::Serialize() const
  {
    std::string out;
    AppendTo(out);
    return out;
  }

  bool operator==(const Descriptor &a, const Descriptor &b) noexcept
  {
    if (a.m_kind != b.m_kind)
      return false;
    if (a.m_kind == DescriptorKind::Object)
      return a.m_className == b.m_className;
    if (a.m_kind == DescriptorKind::Array)
      return *a.m_element == *b.m_element;
    return true;
  }

  void MethodDescriptor::AppendTo(std::string &out) const
  {
    out.push_back('(');
    for (NGIN::UIntSize i = 0; i < parameters.Size(); ++i)
      parameters[i].AppendTo(out);
    out.push_back(')');
    returnType.AppendTo(out);
  }

  std::string MethodDescriptor::Serialize() const
  {
    std::string out;
    AppendTo(out);
    return out;
  }

  bool operator==(const MethodDescriptor &a, const MethodDescriptor &b) noexcept
  {
    if (a.parameters.Size() != b.parameters.Size())
      return false;
    for (NGIN::UIntSize i = 0; i < a.parameters.Size(); ++i)
    {
      if (!(a.parameters[i] == b.parameters[i]))
        return false;
    }
    return a.returnType == b.returnType;
  }

  ExpectedDescriptor ParseDescriptor(std::string_view text)
  {
    Cursor cur{text};
    auto d = ParseOne(cur, false);
    if (!d.has_value())
      return d;
    if (!cur.AtEnd())
      return std::unexpected(Malformed("trailing characters after descriptor", text));
    return d;
  }

  ExpectedMethodDescriptor ParseMethodDescriptor(std::string_view text)
  {
    Cursor cur{text};
    if (cur.Peek() != '(')
      return std::unexpected(Malformed("method descriptor must start with '('", text));
    ++cur.pos;

    MethodDescriptor md;
    while (cur.Peek() != ')')
    {
      if (cur.AtEnd())
        return std::unexpected(Malformed("unterminated parameter list", text));
      auto p = ParseOne(cur, false);
      if (!p.has_value())
        return std::unexpected(p.error());
      md.parameters.PushBack(std::move(*p));
    }
    ++cur.pos;

    auto r = ParseOne(cur, true);
    if (!r.has_value())
      return std::unexpected(r.error());
    if (!cur.AtEnd())
      return std::unexpected(Malformed("trailing characters after descriptor", text));
    md.returnType = std::move(*r);
    return md;
  }

} // namespace NGIN::JNI
