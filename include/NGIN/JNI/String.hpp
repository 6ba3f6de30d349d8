// String.hpp
// java/lang/String adapter: owned content turned into a new string, or characters borrowed from an existing one
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/JNI/Env.hpp>
#include <NGIN/JNI/Export.hpp>
#include <NGIN/JNI/Types.hpp>

#include <jni.h>

#include <expected>
#include <string>
#include <string_view>
#include <variant>

namespace NGIN::JNI
{

  enum class StringEncoding : NGIN::UInt8
  {
    Utf8 = 0,
    Utf16 = 1,
  };

  // An owned adapter created a fresh runtime string and needs no release.
  // A borrowed adapter pins the characters of an existing runtime string; the pin is
  // dropped by Release() or, at the latest, when the adapter is destroyed.
  class NGIN_JNI_API String
  {
  public:
    static constexpr std::string_view ClassName = "java/lang/String";

    String() = default;
    ~String();

    String(const String &) = delete;
    String &operator=(const String &) = delete;
    String(String &&other) noexcept;
    String &operator=(String &&other) noexcept;

    // init: creates a new runtime string from owned content. Standard UTF-8 input is stored
    // as modified UTF-8 (NUL as C0 80, supplementary characters as surrogate pairs);
    // malformed UTF-8 reports InvalidArgument.
    [[nodiscard]] static ExpectedString Create(const Env &env, std::string_view utf8);
    [[nodiscard]] static ExpectedString Create(const Env &env, std::u16string_view utf16);

    // fromObject: borrows the modified UTF-8 characters of an existing string.
    [[nodiscard]] static ExpectedString FromObject(const Env &env, jobject object);
    // Borrows the UTF-16 characters of an existing string.
    [[nodiscard]] static ExpectedString FromObjectUtf16(const Env &env, jobject object);
    [[nodiscard]] static ExpectedString FromJValue(const Env &env, const jvalue &value);

    // Unpins borrowed characters. Owned adapters and repeated calls report InvalidArgument
    // and never reach the runtime.
    std::expected<void, Error> Release();

    [[nodiscard]] jvalue ToJValue() const noexcept;
    [[nodiscard]] jstring Raw() const noexcept { return m_string; }
    // True for the empty adapter a Java null decodes to.
    [[nodiscard]] bool IsNull() const noexcept { return m_string == nullptr; }

    [[nodiscard]] bool IsBorrowed() const noexcept
    {
      return std::holds_alternative<BorrowedUtf8>(m_chars) || std::holds_alternative<BorrowedUtf16>(m_chars);
    }
    [[nodiscard]] bool IsReleased() const noexcept { return m_released; }
    [[nodiscard]] StringEncoding GetEncoding() const noexcept;

    // Characters in the adapter's encoding; empty when the other encoding is held or after Release().
    // Utf8() is modified UTF-8 for owned and borrowed adapters alike.
    [[nodiscard]] std::string_view Utf8() const noexcept;
    [[nodiscard]] std::u16string_view Utf16() const noexcept;
    // Length in code units of the held encoding.
    [[nodiscard]] NGIN::UIntSize Length() const noexcept;
    [[nodiscard]] std::string ToStdString() const { return std::string{Utf8()}; }

  private:
    struct BorrowedUtf8
    {
      const char *chars{nullptr};
      NGIN::UIntSize length{0};
    };
    struct BorrowedUtf16
    {
      const jchar *chars{nullptr};
      NGIN::UIntSize length{0};
    };
    using Chars = std::variant<std::string, std::u16string, BorrowedUtf8, BorrowedUtf16>;

    String(const Env &env, jstring string, Chars chars) noexcept;
    void Unpin() noexcept;

    Env m_env{};
    jstring m_string{nullptr};
    Chars m_chars{};
    bool m_released{false};
  };

} // namespace NGIN::JNI
