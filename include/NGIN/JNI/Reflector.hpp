// Reflector.hpp
// Environment context, class handles and object references
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/JNI/Env.hpp>
#include <NGIN/JNI/Export.hpp>
#include <NGIN/JNI/String.hpp>
#include <NGIN/JNI/TypeMap.hpp>
#include <NGIN/JNI/Types.hpp>

#include <jni.h>

#include <expected>
#include <memory>
#include <string_view>
#include <utility>

namespace NGIN::JNI
{

  template <class D>
  class Constructor;
  template <class D>
  class Method;
  template <class D>
  class StaticMethod;

  template <class Sig>
  using ConstructorFor = Constructor<MethodOf<Sig>>;
  template <class Sig>
  using MethodFor = Method<MethodOf<Sig>>;
  template <class Sig>
  using StaticMethodFor = StaticMethod<MethodOf<Sig>>;

  namespace detail
  {
    // Owns one global reference; deleted exactly once when the last holder goes away.
    class GlobalRef
    {
    public:
      GlobalRef(const Env &env, jobject ref) noexcept : m_env(env), m_ref(ref) {}
      ~GlobalRef() { m_env.DeleteReference(ReferenceKind::Global, m_ref); }

      GlobalRef(const GlobalRef &) = delete;
      GlobalRef &operator=(const GlobalRef &) = delete;

      [[nodiscard]] jobject Get() const noexcept { return m_ref; }

    private:
      Env m_env;
      jobject m_ref{nullptr};
    };
  } // namespace detail

  class NGIN_JNI_API Class
  {
  public:
    Class() = default;
    Class(Reflector &reflector, std::shared_ptr<detail::GlobalRef> ref, std::string_view name) noexcept;

    [[nodiscard]] bool IsValid() const noexcept { return m_reflector && m_ref; }
    [[nodiscard]] Reflector &GetReflector() const noexcept { return *m_reflector; }
    [[nodiscard]] const Env &GetEnv() const noexcept;
    [[nodiscard]] jclass Raw() const noexcept { return m_ref ? static_cast<jclass>(m_ref->Get()) : nullptr; }
    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }
    // Number of Class copies sharing the global reference.
    [[nodiscard]] long UseCount() const noexcept { return m_ref.use_count(); }

    // Allocates an instance without running any constructor.
    [[nodiscard]] ExpectedObject Create() const;
    // Pairs an existing reference with this class; no ownership is taken.
    [[nodiscard]] Object Wrap(jobject object) const noexcept;
    [[nodiscard]] bool IsInstance(const Object &object) const noexcept;

    // Resolve members by name and compile-time signature R(A...). The grammar text comes from
    // SignatureOf<Sig>; overloads are told apart by that text alone. Defined in Callable.hpp,
    // which is included at the end of this header.
    template <class Sig>
    [[nodiscard]] std::expected<ConstructorFor<Sig>, Error> GetConstructor() const;
    template <class Sig>
    [[nodiscard]] std::expected<MethodFor<Sig>, Error> GetMethod(std::string_view name) const;
    template <class Sig>
    [[nodiscard]] std::expected<StaticMethodFor<Sig>, Error> GetStaticMethod(std::string_view name) const;

  private:
    [[nodiscard]] std::expected<jmethodID, Error> ResolveMethodId(std::string_view name, const char *signature, bool isStatic) const;

    Reflector *m_reflector{nullptr};
    std::shared_ptr<detail::GlobalRef> m_ref{};
    std::string_view m_name{};
  };

  // A runtime object reference paired with the class describing it. Reference semantics only.
  class Object
  {
  public:
    Object() = default;
    Object(Class cls, jobject object) noexcept : m_class(std::move(cls)), m_object(object) {}

    [[nodiscard]] const Class &GetClass() const noexcept { return m_class; }
    [[nodiscard]] jobject Raw() const noexcept { return m_object; }
    [[nodiscard]] bool IsNull() const noexcept { return m_object == nullptr; }
    [[nodiscard]] jvalue ToJValue() const noexcept
    {
      jvalue v{};
      v.l = m_object;
      return v;
    }

  private:
    Class m_class{};
    jobject m_object{nullptr};
  };

  // Environment context for one JNIEnv. Must outlive every Class, Object and callable
  // obtained through it; bound to the JNIEnv's thread. Use one Reflector per thread.
  // The name table behind the class cache and Error::subject is process-wide and
  // internally locked, so reflectors on different threads may run concurrently.
  class NGIN_JNI_API Reflector
  {
  public:
    explicit Reflector(JNIEnv *env) noexcept;
    ~Reflector();

    Reflector(const Reflector &) = delete;
    Reflector &operator=(const Reflector &) = delete;

    [[nodiscard]] const Env &GetEnv() const noexcept { return m_env; }

    // Looks up a class by slash-separated name and promotes it to a global reference.
    // Repeated lookups of the same name share that reference.
    [[nodiscard]] ExpectedClass GetClass(std::string_view name);
    [[nodiscard]] NGIN::UIntSize CachedClassCount() const noexcept { return m_classCount; }

    [[nodiscard]] ExpectedString NewString(std::string_view utf8) const { return String::Create(m_env, utf8); }
    [[nodiscard]] ExpectedString NewString(std::u16string_view utf16) const { return String::Create(m_env, utf16); }
    [[nodiscard]] ExpectedString GetString(jobject object) const { return String::FromObject(m_env, object); }
    [[nodiscard]] ExpectedString GetStringUtf16(jobject object) const { return String::FromObjectUtf16(m_env, object); }

  private:
    Env m_env;
    NGIN::Containers::FlatHashMap<detail::NameId, Class> m_classes{};
    NGIN::UIntSize m_classCount{0};
  };

} // namespace NGIN::JNI

// Member resolution templates of Class.
#include <NGIN/JNI/Callable.hpp>
