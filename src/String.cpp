#include <NGIN/JNI/String.hpp>

#include <utility>

namespace NGIN::JNI
{

  namespace
  {
    void AppendModifiedUnit(std::string &out, char32_t unit)
    {
      if (unit != 0 && unit < 0x80)
      {
        out.push_back(static_cast<char>(unit));
      }
      else if (unit < 0x800)
      {
        out.push_back(static_cast<char>(0xC0 | (unit >> 6)));
        out.push_back(static_cast<char>(0x80 | (unit & 0x3F)));
      }
      else
      {
        out.push_back(static_cast<char>(0xE0 | (unit >> 12)));
        out.push_back(static_cast<char>(0x80 | ((unit >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (unit & 0x3F)));
      }
    }

    // Standard UTF-8 -> modified UTF-8: U+0000 becomes C0 80 and supplementary
    // characters become a surrogate pair of 3-byte sequences.
    std::expected<std::string, Error> ToModifiedUtf8(std::string_view utf8)
    {
      std::string out;
      out.reserve(utf8.size());
      for (NGIN::UIntSize i = 0; i < utf8.size();)
      {
        const auto b0 = static_cast<unsigned char>(utf8[i]);
        NGIN::UIntSize extra = 0;
        char32_t cp = 0;
        if (b0 < 0x80)
        {
          cp = b0;
        }
        else if ((b0 & 0xE0) == 0xC0)
        {
          extra = 1;
          cp = b0 & 0x1F;
        }
        else if ((b0 & 0xF0) == 0xE0)
        {
          extra = 2;
          cp = b0 & 0x0F;
        }
        else if ((b0 & 0xF8) == 0xF0)
        {
          extra = 3;
          cp = b0 & 0x07;
        }
        else
        {
          return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid UTF-8 lead byte", utf8});
        }
        if (i + extra >= utf8.size() && extra != 0)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "truncated UTF-8 sequence", utf8});
        for (NGIN::UIntSize k = 1; k <= extra; ++k)
        {
          const auto bk = static_cast<unsigned char>(utf8[i + k]);
          if ((bk & 0xC0) != 0x80)
            return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid UTF-8 continuation byte", utf8});
          cp = (cp << 6) | (bk & 0x3F);
        }
        constexpr char32_t minimum[] = {0, 0x80, 0x800, 0x10000};
        if (cp < minimum[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
          return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid UTF-8 code point", utf8});

        if (cp >= 0x10000)
        {
          cp -= 0x10000;
          AppendModifiedUnit(out, 0xD800 + (cp >> 10));
          AppendModifiedUnit(out, 0xDC00 + (cp & 0x3FF));
        }
        else
        {
          AppendModifiedUnit(out, cp);
        }
        i += extra + 1;
      }
      return out;
    }
  } // namespace

  String::String(const Env &env, jstring string, Chars chars) noexcept
      : m_env(env), m_string(string), m_chars(std::move(chars))
  {
  }

  String::~String() { Unpin(); }

  String::String(String &&other) noexcept
      : m_env(other.m_env), m_string(other.m_string), m_chars(std::move(other.m_chars)), m_released(other.m_released)
  {
    // The moved-from adapter must not unpin what it no longer owns.
    other.m_string = nullptr;
    other.m_chars = std::string{};
    other.m_released = false;
  }

  String &String::operator=(String &&other) noexcept
  {
    if (this != &other)
    {
      Unpin();
      m_env = other.m_env;
      m_string = other.m_string;
      m_chars = std::move(other.m_chars);
      m_released = other.m_released;
      other.m_string = nullptr;
      other.m_chars = std::string{};
      other.m_released = false;
    }
    return *this;
  }

  ExpectedString String::Create(const Env &env, std::string_view utf8)
  {
    auto modified = ToModifiedUtf8(utf8);
    if (!modified.has_value())
      return std::unexpected(modified.error());
    std::string owned = std::move(*modified);
    auto str = env.NewStringUTF(owned.c_str());
    if (!str.has_value())
      return std::unexpected(str.error());
    return String{env, *str, Chars{std::move(owned)}};
  }

  ExpectedString String::Create(const Env &env, std::u16string_view utf16)
  {
    std::u16string owned{utf16};
    auto str = env.NewString(reinterpret_cast<const jchar *>(owned.data()), static_cast<jsize>(owned.size()));
    if (!str.has_value())
      return std::unexpected(str.error());
    return String{env, *str, Chars{std::move(owned)}};
  }

  ExpectedString String::FromObject(const Env &env, jobject object)
  {
    if (!object)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null string reference"});
    auto str = static_cast<jstring>(object);
    const auto length = env.GetStringUTFLength(str);
    auto chars = env.GetStringUTFChars(str);
    if (!chars.has_value())
      return std::unexpected(chars.error());
    return String{env, str, Chars{BorrowedUtf8{*chars, static_cast<NGIN::UIntSize>(length)}}};
  }

  ExpectedString String::FromObjectUtf16(const Env &env, jobject object)
  {
    if (!object)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null string reference"});
    auto str = static_cast<jstring>(object);
    const auto length = env.GetStringLength(str);
    auto chars = env.GetStringChars(str);
    if (!chars.has_value())
      return std::unexpected(chars.error());
    return String{env, str, Chars{BorrowedUtf16{*chars, static_cast<NGIN::UIntSize>(length)}}};
  }

  ExpectedString String::FromJValue(const Env &env, const jvalue &value) { return FromObject(env, value.l); }

  std::expected<void, Error> String::Release()
  {
    if (!IsBorrowed())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "owned strings hold no pinned characters"});
    if (m_released)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "string characters already released"});
    Unpin();
    return {};
  }

  void String::Unpin() noexcept
  {
    if (m_released || !m_string)
      return;
    if (const auto *u8 = std::get_if<BorrowedUtf8>(&m_chars))
    {
      m_env.ReleaseStringUTFChars(m_string, u8->chars);
      m_released = true;
    }
    else if (const auto *u16 = std::get_if<BorrowedUtf16>(&m_chars))
    {
      m_env.ReleaseStringChars(m_string, u16->chars);
      m_released = true;
    }
  }

  jvalue String::ToJValue() const noexcept
  {
    jvalue v{};
    v.l = m_string;
    return v;
  }

  StringEncoding String::GetEncoding() const noexcept
  {
    if (std::holds_alternative<std::u16string>(m_chars) || std::holds_alternative<BorrowedUtf16>(m_chars))
      return StringEncoding::Utf16;
    return StringEncoding::Utf8;
  }

  std::string_view String::Utf8() const noexcept
  {
    if (const auto *owned = std::get_if<std::string>(&m_chars))
      return *owned;
    if (const auto *u8 = std::get_if<BorrowedUtf8>(&m_chars); u8 && !m_released)
      return {u8->chars, u8->length};
    return {};
  }

  std::u16string_view String::Utf16() const noexcept
  {
    if (const auto *owned = std::get_if<std::u16string>(&m_chars))
      return *owned;
    if (const auto *u16 = std::get_if<BorrowedUtf16>(&m_chars); u16 && !m_released)
      return {reinterpret_cast<const char16_t *>(u16->chars), u16->length};
    return {};
  }

  NGIN::UIntSize String::Length() const noexcept
  {
    return GetEncoding() == StringEncoding::Utf16 ? Utf16().size() : Utf8().size();
  }

} // namespace NGIN::JNI
