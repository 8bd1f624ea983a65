// ╔══════════════════════════════════════════════════════════════════════════════╗
// ║  Conduit - Type Names                                                        ║
// ╚══════════════════════════════════════════════════════════════════════════════╝

#include "conduit/request.hpp"

#if defined(__GNUG__) || defined(__clang__)
#include <cxxabi.h>
#include <cstdlib>
#include <memory>
#endif

namespace conduit {

std::string demangle(const char* mangled) {
#if defined(__GNUG__) || defined(__clang__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return mangled;
}

} // namespace conduit
