#include <NGIN/JNI/JNI.hpp>

#include <jni.h>

#include <iostream>

namespace {
  void Report(const NGIN::JNI::Error &e) {
    std::cerr << "error " << static_cast<unsigned>(e.code) << ": " << e.message;
    if (!e.subject.empty())
      std::cerr << " (" << e.subject << ")";
    std::cerr << "\n";
  }
}

int main() {
  using namespace NGIN::JNI;
  std::cout << "Library: " << LibraryName() << "\n";

  JavaVMInitArgs args{};
  args.version = JNI_VERSION_1_8;
  JavaVM *vm = nullptr;
  JNIEnv *env = nullptr;
  if (JNI_CreateJavaVM(&vm, reinterpret_cast<void **>(&env), &args) != JNI_OK) {
    std::cerr << "could not start a JVM\n";
    return 1;
  }

  int status = 0;
  {
    Reflector reflector{env};
    auto integer = reflector.GetClass("java/lang/Integer");
    if (!integer) {
      Report(integer.error());
      return 1;
    }

    using Integer = ObjectType<"java/lang/Integer">;
    auto valueOf = integer->GetStaticMethod<Integer(jint)>("valueOf");
    auto intValue = integer->GetMethod<jint()>("intValue");
    if (!valueOf || !intValue) {
      Report(!valueOf ? valueOf.error() : intValue.error());
      return 1;
    }
    std::cout << "valueOf signature: " << valueOf->Signature() << "\n";

    auto boxed = valueOf->Call(42);
    auto value = boxed ? intValue->Call(*boxed) : Expected<jint>{std::unexpected(boxed.error())};
    if (value) {
      std::cout << "Integer.valueOf(42).intValue() = " << *value << "\n";
    } else {
      Report(value.error());
      status = 1;
    }
  }

  vm->DestroyJavaVM();
  return status;
}
