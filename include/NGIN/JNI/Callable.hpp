// Callable.hpp
// Typed Constructor / Method / StaticMethod bound to one resolved member id
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/JNI/Descriptor.hpp>
#include <NGIN/JNI/Env.hpp>
#include <NGIN/JNI/Reflector.hpp>
#include <NGIN/JNI/String.hpp>
#include <NGIN/JNI/TypeMap.hpp>
#include <NGIN/JNI/Types.hpp>

#include <jni.h>

#include <array>
#include <expected>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace NGIN::JNI
{

  namespace detail
  {
    // Re-tags an environment failure with "<class>.<member><signature>".
    NGIN_JNI_API Error MemberError(const Error &error, std::string_view className, std::string_view member,
                                   std::string_view signature);

    template <class Ret>
    [[nodiscard]] Expected<NativeOf<Ret>> DecodeResult(const Env &env, BoundaryOf<Ret> value)
    {
      if constexpr (IsStringDescriptor<Ret>)
      {
        // A Java null stays an empty adapter; there is nothing to pin.
        if (!value)
          return String{};
        return String::FromObject(env, value);
      }
      else
      {
        return FromBoundary<Ret>(value);
      }
    }

    [[nodiscard]] inline const jvalue *ArgsPointer(std::span<const jvalue> args) noexcept
    {
      return args.empty() ? nullptr : args.data();
    }
  } // namespace detail

  template <class D>
  class Constructor
  {
    static_assert(detail::AlwaysFalse<D>, "Constructor<> is parametrized by a Descriptors::Method");
  };

  template <class D>
  class Method
  {
    static_assert(detail::AlwaysFalse<D>, "Method<> is parametrized by a Descriptors::Method");
  };

  template <class D>
  class StaticMethod
  {
    static_assert(detail::AlwaysFalse<D>, "StaticMethod<> is parametrized by a Descriptors::Method");
  };

  template <class Ret, class... Params>
  class Constructor<Descriptors::Method<Ret, Params...>>
  {
    static_assert(Ret::Kind == DescriptorKind::Void, "constructor signatures return void");

  public:
    using DescriptorType = Descriptors::Method<Ret, Params...>;

    Constructor(Class cls, jmethodID id) noexcept : m_class(std::move(cls)), m_id(id) {}

    [[nodiscard]] static constexpr std::string_view Signature() noexcept { return DescriptorType::Encoding.View(); }
    [[nodiscard]] static MethodDescriptor Descriptor() { return DescriptorType::Make(); }
    [[nodiscard]] const Class &GetClass() const noexcept { return m_class; }
    [[nodiscard]] jmethodID Id() const noexcept { return m_id; }

    // Runs the constructor on a freshly allocated instance.
    [[nodiscard]] ExpectedObject Call(const NativeOf<Params> &...args) const
    {
      const std::array<jvalue, sizeof...(Params)> packed{detail::ToJValue<Params>(args)...};
      auto obj = CallJValues(packed);
      if (!obj.has_value())
        return std::unexpected(obj.error());
      return Object{m_class, *obj};
    }

    [[nodiscard]] std::expected<jobject, Error> CallJValues(std::span<const jvalue> args) const
    {
      auto obj = m_class.GetEnv().NewObject(m_class.Raw(), m_id, detail::ArgsPointer(args));
      if (!obj.has_value())
        return std::unexpected(detail::MemberError(obj.error(), m_class.Name(), "<init>", Signature()));
      return obj;
    }

  private:
    Class m_class;
    jmethodID m_id{nullptr};
  };

  template <class Ret, class... Params>
  class Method<Descriptors::Method<Ret, Params...>>
  {
  public:
    using DescriptorType = Descriptors::Method<Ret, Params...>;
    using ReturnType = NativeOf<Ret>;

    Method(Class cls, jmethodID id, std::string_view name) noexcept
        : m_class(std::move(cls)), m_id(id), m_name(name)
    {
    }

    [[nodiscard]] static constexpr std::string_view Signature() noexcept { return DescriptorType::Encoding.View(); }
    [[nodiscard]] static MethodDescriptor Descriptor() { return DescriptorType::Make(); }
    [[nodiscard]] const Class &GetClass() const noexcept { return m_class; }
    [[nodiscard]] jmethodID Id() const noexcept { return m_id; }
    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }

    [[nodiscard]] Expected<ReturnType> Call(const Object &target, const NativeOf<Params> &...args) const
    {
      return Call(target.Raw(), args...);
    }

    [[nodiscard]] Expected<ReturnType> Call(jobject target, const NativeOf<Params> &...args) const
    {
      const std::array<jvalue, sizeof...(Params)> packed{detail::ToJValue<Params>(args)...};
      auto raw = CallJValues(target, packed);
      if (!raw.has_value())
        return std::unexpected(raw.error());
      if constexpr (std::is_void_v<ReturnType>)
        return {};
      else
        return detail::DecodeResult<Ret>(m_class.GetEnv(), *raw);
    }

    // Untyped path: the caller packs jvalues; the result stays in its boundary form.
    [[nodiscard]] Expected<BoundaryOf<Ret>> CallJValues(jobject target, std::span<const jvalue> args) const
    {
      auto raw = m_class.GetEnv().template CallMethod<CallKindFor<Ret>>(target, m_id, detail::ArgsPointer(args));
      if (!raw.has_value())
        return std::unexpected(detail::MemberError(raw.error(), m_class.Name(), m_name, Signature()));
      return raw;
    }

  private:
    Class m_class;
    jmethodID m_id{nullptr};
    std::string_view m_name{};
  };

  template <class Ret, class... Params>
  class StaticMethod<Descriptors::Method<Ret, Params...>>
  {
  public:
    using DescriptorType = Descriptors::Method<Ret, Params...>;
    using ReturnType = NativeOf<Ret>;

    StaticMethod(Class cls, jmethodID id, std::string_view name) noexcept
        : m_class(std::move(cls)), m_id(id), m_name(name)
    {
    }

    [[nodiscard]] static constexpr std::string_view Signature() noexcept { return DescriptorType::Encoding.View(); }
    [[nodiscard]] static MethodDescriptor Descriptor() { return DescriptorType::Make(); }
    [[nodiscard]] const Class &GetClass() const noexcept { return m_class; }
    [[nodiscard]] jmethodID Id() const noexcept { return m_id; }
    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }

    [[nodiscard]] Expected<ReturnType> Call(const NativeOf<Params> &...args) const
    {
      const std::array<jvalue, sizeof...(Params)> packed{detail::ToJValue<Params>(args)...};
      auto raw = CallJValues(packed);
      if (!raw.has_value())
        return std::unexpected(raw.error());
      if constexpr (std::is_void_v<ReturnType>)
        return {};
      else
        return detail::DecodeResult<Ret>(m_class.GetEnv(), *raw);
    }

    [[nodiscard]] Expected<BoundaryOf<Ret>> CallJValues(std::span<const jvalue> args) const
    {
      auto raw = m_class.GetEnv().template CallStaticMethod<CallKindFor<Ret>>(m_class.Raw(), m_id, detail::ArgsPointer(args));
      if (!raw.has_value())
        return std::unexpected(detail::MemberError(raw.error(), m_class.Name(), m_name, Signature()));
      return raw;
    }

  private:
    Class m_class;
    jmethodID m_id{nullptr};
    std::string_view m_name{};
  };

  // ==== Class member resolution ====

  template <class Sig>
  std::expected<ConstructorFor<Sig>, Error> Class::GetConstructor() const
  {
    using D = MethodOf<Sig>;
    static_assert(D::Return::Kind == DescriptorKind::Void, "constructor signatures return void");
    auto id = ResolveMethodId("<init>", D::Encoding.CStr(), false);
    if (!id.has_value())
      return std::unexpected(id.error());
    return ConstructorFor<Sig>{*this, *id};
  }

  template <class Sig>
  std::expected<MethodFor<Sig>, Error> Class::GetMethod(std::string_view name) const
  {
    using D = MethodOf<Sig>;
    auto id = ResolveMethodId(name, D::Encoding.CStr(), false);
    if (!id.has_value())
      return std::unexpected(id.error());
    return MethodFor<Sig>{*this, *id, detail::InternName(name)};
  }

  template <class Sig>
  std::expected<StaticMethodFor<Sig>, Error> Class::GetStaticMethod(std::string_view name) const
  {
    using D = MethodOf<Sig>;
    auto id = ResolveMethodId(name, D::Encoding.CStr(), true);
    if (!id.has_value())
      return std::unexpected(id.error());
    return StaticMethodFor<Sig>{*this, *id, detail::InternName(name)};
  }

} // namespace NGIN::JNI
