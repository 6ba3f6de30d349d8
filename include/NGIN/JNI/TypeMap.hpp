// TypeMap.hpp
// Compile-time descriptors and the native <-> boundary type mapping
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/JNI/Descriptor.hpp>
#include <NGIN/JNI/Types.hpp>

#include <jni.h>

#include <string_view>
#include <tuple>
#include <type_traits>

namespace NGIN::JNI
{

  // Null-terminated string usable as a template argument and concatenated at compile time.
  template <NGIN::UIntSize N>
  struct FixedString
  {
    char data[N]{};

    constexpr FixedString() = default;
    constexpr FixedString(const char (&s)[N])
    {
      for (NGIN::UIntSize i = 0; i < N; ++i)
        data[i] = s[i];
    }

    static constexpr NGIN::UIntSize Length = N - 1;

    [[nodiscard]] constexpr std::string_view View() const noexcept { return {data, N - 1}; }
    [[nodiscard]] constexpr const char *CStr() const noexcept { return data; }

    template <NGIN::UIntSize M>
    [[nodiscard]] constexpr FixedString<N + M - 1> operator+(const FixedString<M> &rhs) const noexcept
    {
      FixedString<N + M - 1> out{};
      for (NGIN::UIntSize i = 0; i < N - 1; ++i)
        out.data[i] = data[i];
      for (NGIN::UIntSize i = 0; i < M; ++i)
        out.data[N - 1 + i] = rhs.data[i];
      return out;
    }
  };

  template <NGIN::UIntSize N>
  FixedString(const char (&)[N]) -> FixedString<N>;

  // Signature markers. ObjectType<"java/lang/Integer"> declares a reference of that class;
  // ArrayType<T> declares an array whose element is described by T.
  template <FixedString Name>
  struct ObjectType
  {
    static constexpr std::string_view ClassName = Name.View();
  };

  template <class T>
  struct ArrayType
  {
  };

  inline constexpr std::string_view StringClassName = "java/lang/String";

  namespace detail
  {
    template <class>
    inline constexpr bool AlwaysFalse = false;

    constexpr FixedString<2> CharString(char c) noexcept
    {
      FixedString<2> s{};
      s.data[0] = c;
      s.data[1] = '\0';
      return s;
    }

    // Boundary scalar and jvalue member for each kind.
    template <DescriptorKind K>
    struct KindTraits;

    template <>
    struct KindTraits<DescriptorKind::Byte>
    {
      using Boundary = jbyte;
      static constexpr jbyte jvalue::*Member = &jvalue::b;
    };
    template <>
    struct KindTraits<DescriptorKind::Char>
    {
      using Boundary = jchar;
      static constexpr jchar jvalue::*Member = &jvalue::c;
    };
    template <>
    struct KindTraits<DescriptorKind::Int>
    {
      using Boundary = jint;
      static constexpr jint jvalue::*Member = &jvalue::i;
    };
    template <>
    struct KindTraits<DescriptorKind::Long>
    {
      using Boundary = jlong;
      static constexpr jlong jvalue::*Member = &jvalue::j;
    };
    template <>
    struct KindTraits<DescriptorKind::Short>
    {
      using Boundary = jshort;
      static constexpr jshort jvalue::*Member = &jvalue::s;
    };
    template <>
    struct KindTraits<DescriptorKind::Float>
    {
      using Boundary = jfloat;
      static constexpr jfloat jvalue::*Member = &jvalue::f;
    };
    template <>
    struct KindTraits<DescriptorKind::Double>
    {
      using Boundary = jdouble;
      static constexpr jdouble jvalue::*Member = &jvalue::d;
    };
    template <>
    struct KindTraits<DescriptorKind::Boolean>
    {
      using Boundary = jboolean;
      static constexpr jboolean jvalue::*Member = &jvalue::z;
    };
    template <>
    struct KindTraits<DescriptorKind::Object>
    {
      using Boundary = jobject;
      static constexpr jobject jvalue::*Member = &jvalue::l;
    };
    template <>
    struct KindTraits<DescriptorKind::Array>
    {
      using Boundary = jobject;
      static constexpr jobject jvalue::*Member = &jvalue::l;
    };
    template <>
    struct KindTraits<DescriptorKind::Void>
    {
      using Boundary = void;
    };
  } // namespace detail

  // Type-level descriptors. Encoding is the grammar text as a compile-time constant;
  // Make() produces the equivalent runtime value.
  namespace Descriptors
  {
    template <DescriptorKind K>
    struct Primitive
    {
      static_assert(K != DescriptorKind::Object && K != DescriptorKind::Array, "Primitive<> takes a nullary kind");
      static constexpr DescriptorKind Kind = K;
      static constexpr auto Encoding = detail::CharString(PrimitiveCode(K));
      static Descriptor Make() { return Descriptor::Primitive(K); }
    };

    template <FixedString Name>
    struct Object
    {
      static_assert(!Name.View().empty(), "class name must not be empty");
      static constexpr DescriptorKind Kind = DescriptorKind::Object;
      static constexpr std::string_view ClassName = Name.View();
      static constexpr auto Encoding = FixedString{"L"} + Name + FixedString{";"};
      static Descriptor Make() { return Descriptor::Object(ClassName); }
    };

    template <class Element>
    struct Array
    {
      static_assert(Element::Kind != DescriptorKind::Void, "arrays of void do not exist");
      using ElementType = Element;
      static constexpr DescriptorKind Kind = DescriptorKind::Array;
      static constexpr auto Encoding = FixedString{"["} + Element::Encoding;
      static Descriptor Make() { return Descriptor::Array(Element::Make()); }
    };

    template <class Ret, class... Params>
    struct Method
    {
      static_assert(((Params::Kind != DescriptorKind::Void) && ...), "void is only valid as a return type");
      using Return = Ret;
      using Parameters = std::tuple<Params...>;
      static constexpr NGIN::UIntSize Arity = sizeof...(Params);
      static constexpr auto Encoding = (FixedString{"("} + ... + Params::Encoding) + FixedString{")"} + Ret::Encoding;

      static MethodDescriptor Make()
      {
        MethodDescriptor md;
        md.parameters.Reserve(Arity);
        (md.parameters.PushBack(Params::Make()), ...);
        md.returnType = Ret::Make();
        return md;
      }
    };
  } // namespace Descriptors

  namespace detail
  {
    template <class T>
    struct DescriptorOfImpl
    {
      static_assert(AlwaysFalse<T>, "NGIN::JNI: unsupported native type in a method signature");
    };

    template <DescriptorKind K>
    using Prim = Descriptors::Primitive<K>;

    // clang-format off
    template <> struct DescriptorOfImpl<jbyte> { using type = Prim<DescriptorKind::Byte>; };
    template <> struct DescriptorOfImpl<jchar> { using type = Prim<DescriptorKind::Char>; };
    template <> struct DescriptorOfImpl<jint> { using type = Prim<DescriptorKind::Int>; };
    template <> struct DescriptorOfImpl<jlong> { using type = Prim<DescriptorKind::Long>; };
    template <> struct DescriptorOfImpl<jshort> { using type = Prim<DescriptorKind::Short>; };
    template <> struct DescriptorOfImpl<jfloat> { using type = Prim<DescriptorKind::Float>; };
    template <> struct DescriptorOfImpl<jdouble> { using type = Prim<DescriptorKind::Double>; };
    template <> struct DescriptorOfImpl<jboolean> { using type = Prim<DescriptorKind::Boolean>; };
    template <> struct DescriptorOfImpl<void> { using type = Prim<DescriptorKind::Void>; };

    template <> struct DescriptorOfImpl<jobject> { using type = Descriptors::Object<"java/lang/Object">; };
    template <> struct DescriptorOfImpl<jstring> { using type = Descriptors::Object<"java/lang/String">; };
    template <> struct DescriptorOfImpl<jclass> { using type = Descriptors::Object<"java/lang/Class">; };
    template <> struct DescriptorOfImpl<jthrowable> { using type = Descriptors::Object<"java/lang/Throwable">; };
    template <> struct DescriptorOfImpl<String> { using type = Descriptors::Object<"java/lang/String">; };

    template <> struct DescriptorOfImpl<jbyteArray> { using type = Descriptors::Array<Prim<DescriptorKind::Byte>>; };
    template <> struct DescriptorOfImpl<jcharArray> { using type = Descriptors::Array<Prim<DescriptorKind::Char>>; };
    template <> struct DescriptorOfImpl<jintArray> { using type = Descriptors::Array<Prim<DescriptorKind::Int>>; };
    template <> struct DescriptorOfImpl<jlongArray> { using type = Descriptors::Array<Prim<DescriptorKind::Long>>; };
    template <> struct DescriptorOfImpl<jshortArray> { using type = Descriptors::Array<Prim<DescriptorKind::Short>>; };
    template <> struct DescriptorOfImpl<jfloatArray> { using type = Descriptors::Array<Prim<DescriptorKind::Float>>; };
    template <> struct DescriptorOfImpl<jdoubleArray> { using type = Descriptors::Array<Prim<DescriptorKind::Double>>; };
    template <> struct DescriptorOfImpl<jbooleanArray> { using type = Descriptors::Array<Prim<DescriptorKind::Boolean>>; };
    template <> struct DescriptorOfImpl<jobjectArray> { using type = Descriptors::Array<Descriptors::Object<"java/lang/Object">>; };
    // clang-format on

    template <FixedString Name>
    struct DescriptorOfImpl<ObjectType<Name>>
    {
      using type = Descriptors::Object<Name>;
    };

    template <class T>
    struct DescriptorOfImpl<ArrayType<T>>
    {
      using type = Descriptors::Array<typename DescriptorOfImpl<std::remove_cvref_t<T>>::type>;
    };

    template <class Sig>
    struct MethodOfImpl
    {
      static_assert(AlwaysFalse<Sig>, "NGIN::JNI: signature must be a function type R(A...)");
    };

    template <class R, class... A>
    struct MethodOfImpl<R(A...)>
    {
      using type = Descriptors::Method<typename DescriptorOfImpl<std::remove_cvref_t<R>>::type,
                                       typename DescriptorOfImpl<std::remove_cvref_t<A>>::type...>;
    };

    template <class D>
    struct NativeOfImpl
    {
      using type = typename KindTraits<D::Kind>::Boundary;
    };

    template <FixedString Name>
    struct NativeOfImpl<Descriptors::Object<Name>>
    {
      // The string class is the only object kind with a dedicated native form.
      using type = std::conditional_t<Name.View() == StringClassName, String, jobject>;
    };

    template <class E>
    struct NativeOfImpl<Descriptors::Array<E>>
    {
      using type = jarray;
    };
  } // namespace detail

  // fromNativeType: native signature type -> type-level descriptor.
  template <class T>
  using DescriptorOf = typename detail::DescriptorOfImpl<std::remove_cvref_t<T>>::type;

  // Function shape R(A...) -> Descriptors::Method<...>.
  template <class Sig>
  using MethodOf = typename detail::MethodOfImpl<Sig>::type;

  template <class Sig>
  inline constexpr auto SignatureOf = MethodOf<Sig>::Encoding;

  // nativeRepresentation(d): what a caller holds in-process.
  template <class D>
  using NativeOf = typename detail::NativeOfImpl<D>::type;

  // boundaryRepresentation(d): the jvalue member's type (jobject for every reference kind).
  template <class D>
  using BoundaryOf = typename detail::KindTraits<D::Kind>::Boundary;

  // callOperationTag(d)
  template <class D>
  inline constexpr CallKind CallKindFor = CallKindOf(D::Kind);

  template <class D>
  inline constexpr bool IsStringDescriptor = std::is_same_v<NativeOf<D>, String>;

  namespace detail
  {
    template <class D>
    [[nodiscard]] inline jvalue ToJValue(const NativeOf<D> &value)
    {
      static_assert(D::Kind != DescriptorKind::Void, "void has no boundary value");
      if constexpr (IsStringDescriptor<D>)
      {
        return value.ToJValue();
      }
      else
      {
        jvalue out{};
        out.*KindTraits<D::Kind>::Member = value;
        return out;
      }
    }

    // Boundary -> native for every kind except the string class, which needs the reflector
    // to pin its characters.
    template <class D>
    [[nodiscard]] inline NativeOf<D> FromBoundary(BoundaryOf<D> value) noexcept
    {
      static_assert(!IsStringDescriptor<D>, "strings are decoded through String::FromObject");
      if constexpr (D::Kind == DescriptorKind::Array)
        return static_cast<jarray>(value);
      else
        return value;
    }

    template <class D>
    [[nodiscard]] inline NativeOf<D> FromJValue(const jvalue &value) noexcept
    {
      return FromBoundary<D>(value.*KindTraits<D::Kind>::Member);
    }
  } // namespace detail

} // namespace NGIN::JNI
