// Env.hpp
// Thin wrapper over JNIEnv* that reports failures as std::expected
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/JNI/Export.hpp>
#include <NGIN/JNI/Types.hpp>

#include <jni.h>

#include <expected>
#include <string_view>

namespace NGIN::JNI
{

  namespace detail
  {
    template <CallKind K>
    struct CallResult;

    // clang-format off
    template <> struct CallResult<CallKind::Byte> { using type = jbyte; };
    template <> struct CallResult<CallKind::Char> { using type = jchar; };
    template <> struct CallResult<CallKind::Int> { using type = jint; };
    template <> struct CallResult<CallKind::Long> { using type = jlong; };
    template <> struct CallResult<CallKind::Short> { using type = jshort; };
    template <> struct CallResult<CallKind::Float> { using type = jfloat; };
    template <> struct CallResult<CallKind::Double> { using type = jdouble; };
    template <> struct CallResult<CallKind::Boolean> { using type = jboolean; };
    template <> struct CallResult<CallKind::Object> { using type = jobject; };
    template <> struct CallResult<CallKind::Void> { using type = void; };
    // clang-format on
  } // namespace detail

  template <CallKind K>
  using CallResultT = typename detail::CallResult<K>::type;

  // Not thread-safe: a JNIEnv is bound to the thread that obtained it.
  // Java exceptions raised by a failing primitive are left pending.
  class NGIN_JNI_API Env
  {
  public:
    constexpr Env() = default;
    explicit constexpr Env(JNIEnv *env) noexcept : m_env(env) {}

    [[nodiscard]] constexpr JNIEnv *Raw() const noexcept { return m_env; }
    [[nodiscard]] constexpr bool IsValid() const noexcept { return m_env != nullptr; }

    // Classes and references
    [[nodiscard]] std::expected<jclass, Error> FindClass(const char *name) const;
    [[nodiscard]] std::expected<jclass, Error> GetObjectClass(jobject object) const;
    [[nodiscard]] std::expected<jobject, Error> NewReference(ReferenceKind kind, jobject ref) const;
    void DeleteReference(ReferenceKind kind, jobject ref) const noexcept;
    [[nodiscard]] bool IsInstanceOf(jobject object, jclass cls) const noexcept;

    // Objects
    [[nodiscard]] std::expected<jobject, Error> AllocObject(jclass cls) const;
    [[nodiscard]] std::expected<jobject, Error> NewObject(jclass cls, jmethodID ctor, const jvalue *args) const;

    // Members
    [[nodiscard]] std::expected<jmethodID, Error> GetMethodId(jclass cls, const char *name, const char *signature) const;
    [[nodiscard]] std::expected<jmethodID, Error> GetStaticMethodId(jclass cls, const char *name, const char *signature) const;

    template <CallKind K>
    [[nodiscard]] std::expected<CallResultT<K>, Error> CallMethod(jobject target, jmethodID method, const jvalue *args) const;
    template <CallKind K>
    [[nodiscard]] std::expected<CallResultT<K>, Error> CallStaticMethod(jclass cls, jmethodID method, const jvalue *args) const;

    // Strings
    [[nodiscard]] std::expected<jstring, Error> NewStringUTF(const char *utf8) const;
    [[nodiscard]] std::expected<jstring, Error> NewString(const jchar *utf16, jsize length) const;
    [[nodiscard]] jsize GetStringUTFLength(jstring str) const noexcept;
    [[nodiscard]] jsize GetStringLength(jstring str) const noexcept;
    [[nodiscard]] std::expected<const char *, Error> GetStringUTFChars(jstring str) const;
    [[nodiscard]] std::expected<const jchar *, Error> GetStringChars(jstring str) const;
    void ReleaseStringUTFChars(jstring str, const char *chars) const noexcept;
    void ReleaseStringChars(jstring str, const jchar *chars) const noexcept;

    // Pending Java exception state
    [[nodiscard]] bool ExceptionCheck() const noexcept;
    void ExceptionClear() const noexcept;

  private:
    JNIEnv *m_env{nullptr};
  };

  template <CallKind K>
  std::expected<CallResultT<K>, Error> Env::CallMethod(jobject target, jmethodID method, const jvalue *args) const
  {
    using R = CallResultT<K>;
    if constexpr (K == CallKind::Void)
    {
      m_env->CallVoidMethodA(target, method, args);
      if (ExceptionCheck())
        return std::unexpected(Error{ErrorCode::CallFailed, "method raised a Java exception"});
      return {};
    }
    else
    {
      R result{};
      if constexpr (K == CallKind::Byte)
        result = m_env->CallByteMethodA(target, method, args);
      else if constexpr (K == CallKind::Char)
        result = m_env->CallCharMethodA(target, method, args);
      else if constexpr (K == CallKind::Int)
        result = m_env->CallIntMethodA(target, method, args);
      else if constexpr (K == CallKind::Long)
        result = m_env->CallLongMethodA(target, method, args);
      else if constexpr (K == CallKind::Short)
        result = m_env->CallShortMethodA(target, method, args);
      else if constexpr (K == CallKind::Float)
        result = m_env->CallFloatMethodA(target, method, args);
      else if constexpr (K == CallKind::Double)
        result = m_env->CallDoubleMethodA(target, method, args);
      else if constexpr (K == CallKind::Boolean)
        result = m_env->CallBooleanMethodA(target, method, args);
      else
        result = m_env->CallObjectMethodA(target, method, args);
      if (ExceptionCheck())
        return std::unexpected(Error{ErrorCode::CallFailed, "method raised a Java exception"});
      return result;
    }
  }

  template <CallKind K>
  std::expected<CallResultT<K>, Error> Env::CallStaticMethod(jclass cls, jmethodID method, const jvalue *args) const
  {
    using R = CallResultT<K>;
    if constexpr (K == CallKind::Void)
    {
      m_env->CallStaticVoidMethodA(cls, method, args);
      if (ExceptionCheck())
        return std::unexpected(Error{ErrorCode::CallFailed, "static method raised a Java exception"});
      return {};
    }
    else
    {
      R result{};
      if constexpr (K == CallKind::Byte)
        result = m_env->CallStaticByteMethodA(cls, method, args);
      else if constexpr (K == CallKind::Char)
        result = m_env->CallStaticCharMethodA(cls, method, args);
      else if constexpr (K == CallKind::Int)
        result = m_env->CallStaticIntMethodA(cls, method, args);
      else if constexpr (K == CallKind::Long)
        result = m_env->CallStaticLongMethodA(cls, method, args);
      else if constexpr (K == CallKind::Short)
        result = m_env->CallStaticShortMethodA(cls, method, args);
      else if constexpr (K == CallKind::Float)
        result = m_env->CallStaticFloatMethodA(cls, method, args);
      else if constexpr (K == CallKind::Double)
        result = m_env->CallStaticDoubleMethodA(cls, method, args);
      else if constexpr (K == CallKind::Boolean)
        result = m_env->CallStaticBooleanMethodA(cls, method, args);
      else
        result = m_env->CallStaticObjectMethodA(cls, method, args);
      if (ExceptionCheck())
        return std::unexpected(Error{ErrorCode::CallFailed, "static method raised a Java exception"});
      return result;
    }
  }

} // namespace NGIN::JNI
