#include <NGIN/JNI/Env.hpp>

namespace NGIN::JNI
{

  std::expected<jclass, Error> Env::FindClass(const char *name) const
  {
    jclass cls = m_env->FindClass(name);
    if (!cls)
      return std::unexpected(Error{ErrorCode::NotFound, "class not found", name});
    return cls;
  }

  std::expected<jclass, Error> Env::GetObjectClass(jobject object) const
  {
    if (!object)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "null object has no class"});
    jclass cls = m_env->GetObjectClass(object);
    if (!cls)
      return std::unexpected(Error{ErrorCode::NotFound, "object class unavailable"});
    return cls;
  }

  std::expected<jobject, Error> Env::NewReference(ReferenceKind kind, jobject ref) const
  {
    jobject out = nullptr;
    switch (kind)
    {
    case ReferenceKind::Local:
      out = m_env->NewLocalRef(ref);
      break;
    case ReferenceKind::Global:
      out = m_env->NewGlobalRef(ref);
      break;
    case ReferenceKind::WeakGlobal:
      out = m_env->NewWeakGlobalRef(ref);
      break;
    }
    if (!out)
      return std::unexpected(Error{ErrorCode::OutOfMemory, "reference could not be created"});
    return out;
  }

  void Env::DeleteReference(ReferenceKind kind, jobject ref) const noexcept
  {
    if (!ref)
      return;
    switch (kind)
    {
    case ReferenceKind::Local:
      m_env->DeleteLocalRef(ref);
      break;
    case ReferenceKind::Global:
      m_env->DeleteGlobalRef(ref);
      break;
    case ReferenceKind::WeakGlobal:
      m_env->DeleteWeakGlobalRef(static_cast<jweak>(ref));
      break;
    }
  }

  bool Env::IsInstanceOf(jobject object, jclass cls) const noexcept
  {
    return m_env->IsInstanceOf(object, cls) == JNI_TRUE;
  }

  std::expected<jobject, Error> Env::AllocObject(jclass cls) const
  {
    jobject obj = m_env->AllocObject(cls);
    if (!obj)
      return std::unexpected(Error{ErrorCode::AllocationFailed, "class cannot be instantiated"});
    return obj;
  }

  std::expected<jobject, Error> Env::NewObject(jclass cls, jmethodID ctor, const jvalue *args) const
  {
    jobject obj = m_env->NewObjectA(cls, ctor, args);
    if (!obj || ExceptionCheck())
      return std::unexpected(Error{ErrorCode::AllocationFailed, "constructor raised a Java exception"});
    return obj;
  }

  std::expected<jmethodID, Error> Env::GetMethodId(jclass cls, const char *name, const char *signature) const
  {
    jmethodID id = m_env->GetMethodID(cls, name, signature);
    if (!id)
      return std::unexpected(Error{ErrorCode::NotFound, "no method with this name and signature", name});
    return id;
  }

  std::expected<jmethodID, Error> Env::GetStaticMethodId(jclass cls, const char *name, const char *signature) const
  {
    jmethodID id = m_env->GetStaticMethodID(cls, name, signature);
    if (!id)
      return std::unexpected(Error{ErrorCode::NotFound, "no static method with this name and signature", name});
    return id;
  }

  std::expected<jstring, Error> Env::NewStringUTF(const char *utf8) const
  {
    jstring str = m_env->NewStringUTF(utf8);
    if (!str)
      return std::unexpected(Error{ErrorCode::OutOfMemory, "string could not be created"});
    return str;
  }

  std::expected<jstring, Error> Env::NewString(const jchar *utf16, jsize length) const
  {
    jstring str = m_env->NewString(utf16, length);
    if (!str)
      return std::unexpected(Error{ErrorCode::OutOfMemory, "string could not be created"});
    return str;
  }

  jsize Env::GetStringUTFLength(jstring str) const noexcept { return m_env->GetStringUTFLength(str); }

  jsize Env::GetStringLength(jstring str) const noexcept { return m_env->GetStringLength(str); }

  std::expected<const char *, Error> Env::GetStringUTFChars(jstring str) const
  {
    const char *chars = m_env->GetStringUTFChars(str, nullptr);
    if (!chars)
      return std::unexpected(Error{ErrorCode::OutOfMemory, "string characters could not be pinned"});
    return chars;
  }

  std::expected<const jchar *, Error> Env::GetStringChars(jstring str) const
  {
    const jchar *chars = m_env->GetStringChars(str, nullptr);
    if (!chars)
      return std::unexpected(Error{ErrorCode::OutOfMemory, "string characters could not be pinned"});
    return chars;
  }

  void Env::ReleaseStringUTFChars(jstring str, const char *chars) const noexcept
  {
    m_env->ReleaseStringUTFChars(str, chars);
  }

  void Env::ReleaseStringChars(jstring str, const jchar *chars) const noexcept
  {
    m_env->ReleaseStringChars(str, chars);
  }

  bool Env::ExceptionCheck() const noexcept { return m_env->ExceptionCheck() == JNI_TRUE; }

  void Env::ExceptionClear() const noexcept { m_env->ExceptionClear(); }

} // namespace NGIN::JNI
