#include "FakeJvm.hpp"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <utility>

namespace NGIN::JNI::Testing
{
  namespace
  {
    template <class R>
    R Extract(const jvalue &v) noexcept
    {
      if constexpr (std::is_same_v<R, jbyte>)
        return v.b;
      else if constexpr (std::is_same_v<R, jchar>)
        return v.c;
      else if constexpr (std::is_same_v<R, jint>)
        return v.i;
      else if constexpr (std::is_same_v<R, jlong>)
        return v.j;
      else if constexpr (std::is_same_v<R, jshort>)
        return v.s;
      else if constexpr (std::is_same_v<R, jfloat>)
        return v.f;
      else if constexpr (std::is_same_v<R, jdouble>)
        return v.d;
      else if constexpr (std::is_same_v<R, jboolean>)
        return v.z;
      else
        return v.l;
    }

    template <class R>
    R JNICALL CallA(JNIEnv *env, jobject obj, jmethodID id, const jvalue *args)
    {
      return Extract<R>(FakeJvm::From(env).DoInvoke(obj, id, args));
    }

    template <class R>
    R JNICALL CallStaticA(JNIEnv *env, jclass, jmethodID id, const jvalue *args)
    {
      return Extract<R>(FakeJvm::From(env).DoInvoke(nullptr, id, args));
    }

    jvalue Int(jint i) noexcept
    {
      jvalue v{};
      v.i = i;
      return v;
    }

    jvalue Ref(jobject l) noexcept
    {
      jvalue v{};
      v.l = l;
      return v;
    }

    jvalue Nothing() noexcept { return jvalue{}; }

    bool IsSubclassOf(const FakeClass *cls, const FakeClass *base) noexcept
    {
      for (; cls; cls = cls->super)
      {
        if (cls == base)
          return true;
      }
      return false;
    }

    std::u16string Widen(std::string_view ascii)
    {
      return std::u16string(ascii.begin(), ascii.end());
    }

    std::string Narrow(std::u16string_view text)
    {
      std::string out;
      out.reserve(text.size());
      for (char16_t c : text)
        out.push_back(static_cast<char>(c));
      return out;
    }
  } // namespace

  std::string EncodeModifiedUtf8(std::u16string_view text)
  {
    std::string out;
    for (char16_t c : text)
    {
      if (c != 0 && c < 0x80)
      {
        out.push_back(static_cast<char>(c));
      }
      else if (c < 0x800)
      {
        out.push_back(static_cast<char>(0xC0 | (c >> 6)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
      }
      else
      {
        out.push_back(static_cast<char>(0xE0 | (c >> 12)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
      }
    }
    return out;
  }

  std::u16string DecodeModifiedUtf8(std::string_view bytes)
  {
    std::u16string out;
    for (std::size_t i = 0; i < bytes.size();)
    {
      const auto b0 = static_cast<unsigned char>(bytes[i]);
      if (b0 < 0x80)
      {
        out.push_back(static_cast<char16_t>(b0));
        i += 1;
      }
      else if ((b0 & 0xE0) == 0xC0 && i + 1 < bytes.size())
      {
        const auto b1 = static_cast<unsigned char>(bytes[i + 1]);
        out.push_back(static_cast<char16_t>(((b0 & 0x1F) << 6) | (b1 & 0x3F)));
        i += 2;
      }
      else if (i + 2 < bytes.size())
      {
        const auto b1 = static_cast<unsigned char>(bytes[i + 1]);
        const auto b2 = static_cast<unsigned char>(bytes[i + 2]);
        out.push_back(static_cast<char16_t>(((b0 & 0x0F) << 12) | ((b1 & 0x3F) << 6) | (b2 & 0x3F)));
        i += 3;
      }
      else
      {
        break;
      }
    }
    return out;
  }

  FakeJvm::FakeJvm()
  {
    m_block.vm = this;
    m_block.env.functions = &m_table;
    InstallFunctionTable();
    InstallStandardClasses();
    InstallTestClasses();
  }

  FakeJvm::~FakeJvm() = default;

  JNIEnv *FakeJvm::Env() noexcept { return &m_block.env; }

  FakeJvm &FakeJvm::From(JNIEnv *env) noexcept
  {
    // env is the first member of EnvBlock.
    return *reinterpret_cast<EnvBlock *>(env)->vm;
  }

  FakeClass &FakeJvm::DefineClass(std::string_view name, FakeClass *super, bool isAbstract)
  {
    auto cls = std::make_unique<FakeClass>();
    cls->name = std::string{name};
    cls->super = super;
    cls->isAbstract = isAbstract;
    m_classes.push_back(std::move(cls));
    return *m_classes.back();
  }

  void FakeJvm::DefineMethod(FakeClass &cls, std::string_view name, std::string_view signature, bool isStatic,
                             FakeHandler handler)
  {
    auto m = std::make_unique<FakeMethod>();
    m->name = std::string{name};
    m->signature = std::string{signature};
    m->isStatic = isStatic;
    m->handler = std::move(handler);
    cls.methods.push_back(std::move(m));
  }

  FakeClass *FakeJvm::FindClass(std::string_view name) noexcept
  {
    for (auto &cls : m_classes)
    {
      if (cls->name == name)
        return cls.get();
    }
    return nullptr;
  }

  FakeObject *FakeJvm::NewInstance(FakeClass &cls)
  {
    auto obj = std::make_unique<FakeObject>();
    obj->cls = &cls;
    obj->initialized = true;
    m_objects.push_back(std::move(obj));
    return m_objects.back().get();
  }

  jstring FakeJvm::MakeString(std::u16string text)
  {
    auto *obj = NewInstance(*FindClass("java/lang/String"));
    obj->text = std::move(text);
    return static_cast<jstring>(HandleOf(obj));
  }

  jstring FakeJvm::MakeStringUtf8(std::string_view modifiedUtf8)
  {
    return MakeString(DecodeModifiedUtf8(modifiedUtf8));
  }

  jobject FakeJvm::MakeArray(std::string_view descriptor)
  {
    auto *cls = FindClass(descriptor);
    if (!cls)
      cls = &DefineClass(descriptor, FindClass("java/lang/Object"));
    return HandleOf(NewInstance(*cls));
  }

  std::u16string FakeJvm::TextOf(jobject str) const
  {
    return str ? ObjectOf(str)->text : std::u16string{};
  }

  void FakeJvm::Throw(std::string_view exceptionClass)
  {
    auto *cls = FindClass(exceptionClass);
    if (!cls)
      cls = &DefineClass(exceptionClass, FindClass("java/lang/Throwable"));
    m_pending = NewInstance(*cls);
  }

  int FakeJvm::LiveGlobalRefs() const noexcept
  {
    int total = 0;
    for (const auto &[ref, count] : m_globalRefs)
      total += count;
    return total;
  }

  std::string FakeJvm::PendingExceptionClass() const
  {
    return m_pending ? m_pending->cls->name : std::string{};
  }

  jclass FakeJvm::DoFindClass(const char *name)
  {
    ++m_findClassCalls;
    auto *cls = FindClass(name);
    if (!cls)
    {
      Throw("java/lang/NoClassDefFoundError");
      return nullptr;
    }
    return reinterpret_cast<jclass>(cls);
  }

  jmethodID FakeJvm::DoGetMethodId(jclass clsHandle, const char *name, const char *signature, bool isStatic)
  {
    auto *cls = reinterpret_cast<FakeClass *>(clsHandle);
    const std::string_view wanted{name};
    // Constructors are never inherited.
    for (auto *c = cls; c; c = (wanted == "<init>") ? nullptr : c->super)
    {
      for (auto &m : c->methods)
      {
        if (m->name == wanted && m->signature == signature && m->isStatic == isStatic)
          return reinterpret_cast<jmethodID>(m.get());
      }
    }
    Throw("java/lang/NoSuchMethodError");
    return nullptr;
  }

  jvalue FakeJvm::DoInvoke(jobject target, jmethodID id, const jvalue *args)
  {
    auto *m = reinterpret_cast<FakeMethod *>(id);
    return m->handler(*this, ObjectOf(target), args);
  }

  jobject FakeJvm::DoAllocObject(jclass clsHandle)
  {
    auto *cls = reinterpret_cast<FakeClass *>(clsHandle);
    if (cls->isAbstract)
    {
      Throw("java/lang/InstantiationException");
      return nullptr;
    }
    auto *obj = NewInstance(*cls);
    obj->initialized = false;
    return HandleOf(obj);
  }

  jobject FakeJvm::DoNewObject(jclass clsHandle, jmethodID ctor, const jvalue *args)
  {
    auto *cls = reinterpret_cast<FakeClass *>(clsHandle);
    if (cls->isAbstract)
    {
      Throw("java/lang/InstantiationException");
      return nullptr;
    }
    auto *obj = NewInstance(*cls);
    auto *m = reinterpret_cast<FakeMethod *>(ctor);
    m->handler(*this, obj, args);
    if (m_pending)
      return nullptr;
    return HandleOf(obj);
  }

  jobject FakeJvm::DoNewGlobalRef(jobject obj)
  {
    if (!obj)
      return nullptr;
    ++m_globalRefs[obj];
    return obj;
  }

  void FakeJvm::DoDeleteGlobalRef(jobject obj)
  {
    auto it = m_globalRefs.find(obj);
    if (it == m_globalRefs.end() || it->second == 0)
    {
      ++m_unmatchedReleases;
      return;
    }
    if (--it->second == 0)
      m_globalRefs.erase(it);
  }

  const char *FakeJvm::DoPinUtf8(jstring str)
  {
    const auto bytes = EncodeModifiedUtf8(ObjectOf(str)->text);
    auto buf = std::make_unique<char[]>(bytes.size() + 1);
    std::memcpy(buf.get(), bytes.data(), bytes.size());
    buf[bytes.size()] = '\0';
    const char *p = buf.get();
    m_pins.emplace(p, std::move(buf));
    return p;
  }

  const jchar *FakeJvm::DoPinUtf16(jstring str)
  {
    const auto &text = ObjectOf(str)->text;
    auto buf = std::make_unique<char[]>((text.size() + 1) * sizeof(jchar));
    std::memcpy(buf.get(), text.data(), text.size() * sizeof(jchar));
    const auto *p = reinterpret_cast<const jchar *>(buf.get());
    m_pins.emplace(buf.get(), std::move(buf));
    return p;
  }

  void FakeJvm::DoUnpin(const void *chars)
  {
    if (m_pins.erase(chars) == 0)
      ++m_unmatchedReleases;
  }

  void FakeJvm::InstallFunctionTable()
  {
    auto &t = m_table;

    t.FindClass = [](JNIEnv *env, const char *name) -> jclass { return From(env).DoFindClass(name); };
    t.GetObjectClass = [](JNIEnv *, jobject obj) -> jclass { return reinterpret_cast<jclass>(ObjectOf(obj)->cls); };
    t.IsInstanceOf = [](JNIEnv *, jobject obj, jclass cls) -> jboolean {
      return IsSubclassOf(ObjectOf(obj)->cls, reinterpret_cast<FakeClass *>(cls)) ? JNI_TRUE : JNI_FALSE;
    };

    t.NewLocalRef = [](JNIEnv *, jobject obj) -> jobject { return obj; };
    t.DeleteLocalRef = [](JNIEnv *, jobject) {};
    t.NewGlobalRef = [](JNIEnv *env, jobject obj) -> jobject { return From(env).DoNewGlobalRef(obj); };
    t.DeleteGlobalRef = [](JNIEnv *env, jobject obj) { From(env).DoDeleteGlobalRef(obj); };
    t.NewWeakGlobalRef = [](JNIEnv *, jobject obj) -> jweak { return static_cast<jweak>(obj); };
    t.DeleteWeakGlobalRef = [](JNIEnv *, jweak) {};

    t.AllocObject = [](JNIEnv *env, jclass cls) -> jobject { return From(env).DoAllocObject(cls); };
    t.NewObjectA = [](JNIEnv *env, jclass cls, jmethodID id, const jvalue *args) -> jobject {
      return From(env).DoNewObject(cls, id, args);
    };

    t.GetMethodID = [](JNIEnv *env, jclass cls, const char *name, const char *sig) -> jmethodID {
      return From(env).DoGetMethodId(cls, name, sig, false);
    };
    t.GetStaticMethodID = [](JNIEnv *env, jclass cls, const char *name, const char *sig) -> jmethodID {
      return From(env).DoGetMethodId(cls, name, sig, true);
    };

    t.CallByteMethodA = &CallA<jbyte>;
    t.CallCharMethodA = &CallA<jchar>;
    t.CallIntMethodA = &CallA<jint>;
    t.CallLongMethodA = &CallA<jlong>;
    t.CallShortMethodA = &CallA<jshort>;
    t.CallFloatMethodA = &CallA<jfloat>;
    t.CallDoubleMethodA = &CallA<jdouble>;
    t.CallBooleanMethodA = &CallA<jboolean>;
    t.CallObjectMethodA = &CallA<jobject>;
    t.CallVoidMethodA = [](JNIEnv *env, jobject obj, jmethodID id, const jvalue *args) {
      From(env).DoInvoke(obj, id, args);
    };

    t.CallStaticByteMethodA = &CallStaticA<jbyte>;
    t.CallStaticCharMethodA = &CallStaticA<jchar>;
    t.CallStaticIntMethodA = &CallStaticA<jint>;
    t.CallStaticLongMethodA = &CallStaticA<jlong>;
    t.CallStaticShortMethodA = &CallStaticA<jshort>;
    t.CallStaticFloatMethodA = &CallStaticA<jfloat>;
    t.CallStaticDoubleMethodA = &CallStaticA<jdouble>;
    t.CallStaticBooleanMethodA = &CallStaticA<jboolean>;
    t.CallStaticObjectMethodA = &CallStaticA<jobject>;
    t.CallStaticVoidMethodA = [](JNIEnv *env, jclass, jmethodID id, const jvalue *args) {
      From(env).DoInvoke(nullptr, id, args);
    };

    t.NewStringUTF = [](JNIEnv *env, const char *utf) -> jstring {
      return utf ? From(env).MakeStringUtf8(utf) : nullptr;
    };
    t.NewString = [](JNIEnv *env, const jchar *chars, jsize len) -> jstring {
      std::u16string text(static_cast<std::size_t>(len), u'\0');
      if (len > 0)
        std::memcpy(text.data(), chars, static_cast<std::size_t>(len) * sizeof(jchar));
      return From(env).MakeString(std::move(text));
    };
    t.GetStringUTFLength = [](JNIEnv *, jstring str) -> jsize {
      return static_cast<jsize>(EncodeModifiedUtf8(ObjectOf(str)->text).size());
    };
    t.GetStringLength = [](JNIEnv *, jstring str) -> jsize { return static_cast<jsize>(ObjectOf(str)->text.size()); };
    t.GetStringUTFChars = [](JNIEnv *env, jstring str, jboolean *isCopy) -> const char * {
      if (isCopy)
        *isCopy = JNI_TRUE;
      return From(env).DoPinUtf8(str);
    };
    t.GetStringChars = [](JNIEnv *env, jstring str, jboolean *isCopy) -> const jchar * {
      if (isCopy)
        *isCopy = JNI_TRUE;
      return From(env).DoPinUtf16(str);
    };
    t.ReleaseStringUTFChars = [](JNIEnv *env, jstring, const char *chars) { From(env).DoUnpin(chars); };
    t.ReleaseStringChars = [](JNIEnv *env, jstring, const jchar *chars) { From(env).DoUnpin(chars); };

    t.ExceptionCheck = [](JNIEnv *env) -> jboolean { return From(env).HasPendingException() ? JNI_TRUE : JNI_FALSE; };
    t.ExceptionOccurred = [](JNIEnv *env) -> jthrowable {
      auto &vm = From(env);
      return vm.m_pending ? static_cast<jthrowable>(HandleOf(vm.m_pending)) : nullptr;
    };
    t.ExceptionClear = [](JNIEnv *env) { From(env).ClearException(); };
  }

  void FakeJvm::InstallStandardClasses()
  {
    auto &object = DefineClass("java/lang/Object");
    DefineMethod(object, "<init>", "()V", false, [](FakeJvm &, FakeObject *, const jvalue *) { return Nothing(); });
    DefineMethod(object, "hashCode", "()I", false, [](FakeJvm &, FakeObject *self, const jvalue *) {
      return Int(static_cast<jint>(reinterpret_cast<std::uintptr_t>(self) & 0x7FFFFFFF));
    });

    DefineClass("java/lang/Throwable", &object);

    auto &string = DefineClass("java/lang/String", &object);
    DefineMethod(string, "<init>", "()V", false, [](FakeJvm &, FakeObject *self, const jvalue *) {
      self->text.clear();
      return Nothing();
    });
    DefineMethod(string, "length", "()I", false, [](FakeJvm &, FakeObject *self, const jvalue *) {
      return Int(static_cast<jint>(self->text.size()));
    });
    DefineMethod(string, "isEmpty", "()Z", false, [](FakeJvm &, FakeObject *self, const jvalue *) {
      jvalue v{};
      v.z = self->text.empty() ? JNI_TRUE : JNI_FALSE;
      return v;
    });
    DefineMethod(string, "charAt", "(I)C", false, [](FakeJvm &vm, FakeObject *self, const jvalue *args) {
      jvalue v{};
      if (args[0].i < 0 || static_cast<std::size_t>(args[0].i) >= self->text.size())
      {
        vm.Throw("java/lang/StringIndexOutOfBoundsException");
        return v;
      }
      v.c = static_cast<jchar>(self->text[static_cast<std::size_t>(args[0].i)]);
      return v;
    });
    DefineMethod(string, "concat", "(Ljava/lang/String;)Ljava/lang/String;", false,
                 [](FakeJvm &vm, FakeObject *self, const jvalue *args) {
                   if (!args[0].l)
                   {
                     vm.Throw("java/lang/NullPointerException");
                     return Nothing();
                   }
                   return Ref(vm.MakeString(self->text + ObjectOf(args[0].l)->text));
                 });
    DefineMethod(string, "valueOf", "(I)Ljava/lang/String;", true, [](FakeJvm &vm, FakeObject *, const jvalue *args) {
      return Ref(vm.MakeString(Widen(std::to_string(args[0].i))));
    });

    auto &integer = DefineClass("java/lang/Integer", &object);
    DefineMethod(integer, "<init>", "(I)V", false, [](FakeJvm &, FakeObject *self, const jvalue *args) {
      self->intValue = args[0].i;
      return Nothing();
    });
    DefineMethod(integer, "valueOf", "(I)Ljava/lang/Integer;", true, [](FakeJvm &vm, FakeObject *, const jvalue *args) {
      auto *boxed = vm.NewInstance(*vm.FindClass("java/lang/Integer"));
      boxed->intValue = args[0].i;
      return Ref(HandleOf(boxed));
    });
    DefineMethod(integer, "intValue", "()I", false,
                 [](FakeJvm &, FakeObject *self, const jvalue *) { return Int(self->intValue); });
    DefineMethod(integer, "longValue", "()J", false, [](FakeJvm &, FakeObject *self, const jvalue *) {
      jvalue v{};
      v.j = self->intValue;
      return v;
    });
    DefineMethod(integer, "doubleValue", "()D", false, [](FakeJvm &, FakeObject *self, const jvalue *) {
      jvalue v{};
      v.d = self->intValue;
      return v;
    });
    DefineMethod(integer, "parseInt", "(Ljava/lang/String;)I", true, [](FakeJvm &vm, FakeObject *, const jvalue *args) {
      const auto text = Narrow(vm.TextOf(args[0].l));
      const bool digits = !text.empty() && std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
      if (!digits)
      {
        vm.Throw("java/lang/NumberFormatException");
        return Nothing();
      }
      return Int(static_cast<jint>(std::stol(text)));
    });
    DefineMethod(integer, "toString", "(I)Ljava/lang/String;", true, [](FakeJvm &vm, FakeObject *, const jvalue *args) {
      return Ref(vm.MakeString(Widen(std::to_string(args[0].i))));
    });

    auto &builder = DefineClass("java/lang/StringBuilder", &object);
    DefineMethod(builder, "<init>", "()V", false, [](FakeJvm &, FakeObject *self, const jvalue *) {
      self->text.clear();
      return Nothing();
    });
    DefineMethod(builder, "<init>", "(Ljava/lang/String;)V", false, [](FakeJvm &vm, FakeObject *self, const jvalue *args) {
      if (!args[0].l)
      {
        vm.Throw("java/lang/NullPointerException");
        return Nothing();
      }
      self->text = ObjectOf(args[0].l)->text;
      return Nothing();
    });
    // An instance that skipped its constructor has no backing buffer.
    DefineMethod(builder, "append", "(Ljava/lang/String;)Ljava/lang/StringBuilder;", false,
                 [](FakeJvm &vm, FakeObject *self, const jvalue *args) {
                   if (!self->initialized)
                   {
                     vm.Throw("java/lang/NullPointerException");
                     return Nothing();
                   }
                   self->text += args[0].l ? ObjectOf(args[0].l)->text : u"null";
                   return Ref(HandleOf(self));
                 });
    DefineMethod(builder, "length", "()I", false, [](FakeJvm &, FakeObject *self, const jvalue *) {
      return Int(static_cast<jint>(self->text.size()));
    });
    DefineMethod(builder, "toString", "()Ljava/lang/String;", false,
                 [](FakeJvm &vm, FakeObject *self, const jvalue *) { return Ref(vm.MakeString(self->text)); });

    auto &math = DefineClass("java/lang/Math", &object);
    DefineMethod(math, "max", "(II)I", true, [](FakeJvm &, FakeObject *, const jvalue *args) {
      return Int(std::max(args[0].i, args[1].i));
    });
    DefineMethod(math, "max", "(JJ)J", true, [](FakeJvm &, FakeObject *, const jvalue *args) {
      jvalue v{};
      v.j = std::max(args[0].j, args[1].j);
      return v;
    });
    DefineMethod(math, "abs", "(D)D", true, [](FakeJvm &, FakeObject *, const jvalue *args) {
      jvalue v{};
      v.d = args[0].d < 0 ? -args[0].d : args[0].d;
      return v;
    });

    auto &runnable = DefineClass("java/lang/Runnable", &object, true);
    DefineMethod(runnable, "run", "()V", false, [](FakeJvm &, FakeObject *, const jvalue *) { return Nothing(); });
  }

  void FakeJvm::InstallTestClasses()
  {
    auto *object = FindClass("java/lang/Object");

    // Every echo hands its argument back unchanged.
    auto &echo = DefineClass("ngin/test/Echo", object);
    const auto identity = [](FakeJvm &, FakeObject *, const jvalue *args) { return args[0]; };
    DefineMethod(echo, "echoByte", "(B)B", true, identity);
    DefineMethod(echo, "echoChar", "(C)C", true, identity);
    DefineMethod(echo, "echoShort", "(S)S", true, identity);
    DefineMethod(echo, "echoInt", "(I)I", true, identity);
    DefineMethod(echo, "echoLong", "(J)J", true, identity);
    DefineMethod(echo, "echoFloat", "(F)F", true, identity);
    DefineMethod(echo, "echoDouble", "(D)D", true, identity);
    DefineMethod(echo, "echoBoolean", "(Z)Z", true, identity);
    DefineMethod(echo, "echoString", "(Ljava/lang/String;)Ljava/lang/String;", true, identity);
    DefineMethod(echo, "echoObject", "(Ljava/lang/Object;)Ljava/lang/Object;", true, identity);
    DefineMethod(echo, "echoIntArray", "([I)[I", true, identity);
    DefineMethod(echo, "nullString", "()Ljava/lang/String;", true,
                 [](FakeJvm &, FakeObject *, const jvalue *) { return Nothing(); });
    DefineMethod(echo, "describe", "(IJLjava/lang/String;)Ljava/lang/String;", true,
                 [](FakeJvm &vm, FakeObject *, const jvalue *args) {
                   auto text = Widen(std::to_string(args[0].i) + ":" + std::to_string(args[1].j) + ":");
                   text += vm.TextOf(args[2].l);
                   return Ref(vm.MakeString(std::move(text)));
                 });

    auto &counter = DefineClass("ngin/test/Counter", object);
    DefineMethod(counter, "<init>", "()V", false, [](FakeJvm &, FakeObject *self, const jvalue *) {
      self->intValue = 0;
      return Nothing();
    });
    DefineMethod(counter, "<init>", "(I)V", false, [](FakeJvm &vm, FakeObject *self, const jvalue *args) {
      if (args[0].i < 0)
      {
        vm.Throw("java/lang/IllegalArgumentException");
        return Nothing();
      }
      self->intValue = args[0].i;
      return Nothing();
    });
    DefineMethod(counter, "increment", "()V", false, [](FakeJvm &, FakeObject *self, const jvalue *) {
      ++self->intValue;
      return Nothing();
    });
    DefineMethod(counter, "add", "(I)V", false, [](FakeJvm &, FakeObject *self, const jvalue *args) {
      self->intValue += args[0].i;
      return Nothing();
    });
    DefineMethod(counter, "get", "()I", false, [](FakeJvm &, FakeObject *self, const jvalue *) { return Int(self->intValue); });
    DefineMethod(counter, "fail", "()V", false, [](FakeJvm &vm, FakeObject *, const jvalue *) {
      vm.Throw("java/lang/IllegalStateException");
      return Nothing();
    });
  }

} // namespace NGIN::JNI::Testing
