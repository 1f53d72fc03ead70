/*
 * The core imports for ripple. Use this to ensure the correct import order can be maintained.
 * Only the intrusive reference counting part of nanobind is used here, this keeps the core free of the Python
 * headers. The Python extension includes the full nanobind headers on top of these.
 */

#ifndef RIPPLE_BASE_H
#define RIPPLE_BASE_H

#include <nanobind/intrusive/counter.h>
#include <nanobind/intrusive/ref.h>

#include <fmt/format.h>

#include <ripple/ripple_export.h>
#include <ripple/ripple_forward_declarations.h>

namespace ripple {
    // ONLY use then when you need to return a casted ptr reference, otherwise unpack and use as a raw pointer or reference.
    template<typename T, typename T_>
    nb::ref<T> dynamic_cast_ref(nb::ref<T_> ptr) {
        auto v = dynamic_cast<T *>(ptr.get());
        if (v != nullptr) {
            return nb::ref<T>(v);
        } else {
            return nb::ref<T>();
        }
    }
} // namespace ripple

#endif //RIPPLE_BASE_H
