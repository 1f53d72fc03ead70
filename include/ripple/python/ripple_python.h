/*
 * The imports for the Python extension. This must be the first include of every binding source: the nanobind
 * casters for nb::ref are only registered when nanobind.h is seen before the intrusive headers pulled in by
 * ripple_base.h.
 */

#ifndef RIPPLE_PYTHON_H
#define RIPPLE_PYTHON_H

#include <nanobind/nanobind.h>
#include <nanobind/trampoline.h>

#include <nanobind/intrusive/counter.h>
#include <nanobind/intrusive/ref.h>

#include <nanobind/stl/function.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/variant.h>
#include <nanobind/stl/vector.h>

#include <ripple/ripple_base.h>

#include <any>

namespace ripple::python {
    /**
     * Wraps a Python value for a trigger. Integers are unwrapped so they can be used as sequence lengths, anything
     * else is carried as the Python object.
     */
    std::any to_any(nb::handle value);

    /**
     * The inverse of to_any, values that did not come from Python are reported as None.
     */
    nb::object from_any(const std::any &value);
} // namespace ripple::python

void export_scheduler(nb::module_ &);

void export_reactivity(nb::module_ &);

void export_runtime(nb::module_ &);

#endif // RIPPLE_PYTHON_H
