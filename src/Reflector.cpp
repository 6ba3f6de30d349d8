#include <NGIN/JNI/Callable.hpp>
#include <NGIN/JNI/Reflector.hpp>

#include <string>
#include <utility>

namespace NGIN::JNI
{

  Error detail::MemberError(const Error &error, std::string_view className, std::string_view member,
                            std::string_view signature)
  {
    std::string subject{className};
    subject.push_back('.');
    subject.append(member);
    subject.append(signature);
    return Error{error.code, error.message, subject};
  }

  // Class
  Class::Class(Reflector &reflector, std::shared_ptr<detail::GlobalRef> ref, std::string_view name) noexcept
      : m_reflector(&reflector), m_ref(std::move(ref)), m_name(name)
  {
  }

  const Env &Class::GetEnv() const noexcept { return m_reflector->GetEnv(); }

  ExpectedObject Class::Create() const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "class handle is empty"});
    auto obj = GetEnv().AllocObject(Raw());
    if (!obj.has_value())
      return std::unexpected(Error{obj.error().code, obj.error().message, m_name});
    return Object{*this, *obj};
  }

  Object Class::Wrap(jobject object) const noexcept { return Object{*this, object}; }

  bool Class::IsInstance(const Object &object) const noexcept
  {
    return IsValid() && !object.IsNull() && GetEnv().IsInstanceOf(object.Raw(), Raw());
  }

  std::expected<jmethodID, Error> Class::ResolveMethodId(std::string_view name, const char *signature, bool isStatic) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "class handle is empty"});
    const std::string memberName{name};
    auto id = isStatic ? GetEnv().GetStaticMethodId(Raw(), memberName.c_str(), signature)
                       : GetEnv().GetMethodId(Raw(), memberName.c_str(), signature);
    if (!id.has_value())
      return std::unexpected(detail::MemberError(id.error(), m_name, memberName, signature));
    return *id;
  }

  // Reflector
  Reflector::Reflector(JNIEnv *env) noexcept : m_env(env) {}

  Reflector::~Reflector() = default;

  ExpectedClass Reflector::GetClass(std::string_view name)
  {
    const auto id = detail::InternNameId(name);
    if (auto *cached = m_classes.GetPtr(id))
      return *cached;

    const std::string className{name};
    auto local = m_env.FindClass(className.c_str());
    if (!local.has_value())
      return std::unexpected(local.error());
    auto global = m_env.NewReference(ReferenceKind::Global, *local);
    m_env.DeleteReference(ReferenceKind::Local, *local);
    if (!global.has_value())
      return std::unexpected(Error{global.error().code, global.error().message, name});

    Class cls{*this, std::make_shared<detail::GlobalRef>(m_env, *global), detail::NameFromId(id)};
    m_classes.Insert(id, cls);
    ++m_classCount;
    return cls;
  }

} // namespace NGIN::JNI
