#include <NGIN/JNI/Types.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <mutex>

namespace NGIN::JNI::detail
{

  namespace
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    constexpr NameId InvalidNameId = static_cast<NameId>(StringInterner::INVALID_ID);

    StringInterner &GetNames() noexcept
    {
      static StringInterner g_names{};
      return g_names;
    }

    // Guards every access to GetNames(); reflectors on different threads share the table.
    std::mutex &GetNamesMutex() noexcept
    {
      static std::mutex g_namesMutex;
      return g_namesMutex;
    }
  } // namespace

  NameId InternNameId(std::string_view s) noexcept
  {
    std::lock_guard lock{GetNamesMutex()};
    const auto id = GetNames().InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    std::lock_guard lock{GetNamesMutex()};
    return GetNames().View(static_cast<StringInterner::IdType>(id));
  }

  std::string_view InternName(std::string_view s) noexcept
  {
    std::lock_guard lock{GetNamesMutex()};
    return GetNames().Intern(s);
  }

} // namespace NGIN::JNI::detail

namespace NGIN::JNI
{

  Error::Error(ErrorCode c, std::string_view m, std::string_view s)
      : code(c), message(m), subject(detail::InternName(s))
  {
  }

} // namespace NGIN::JNI
