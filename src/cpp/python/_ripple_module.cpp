/*
 * The entry point into the python _ripple module exposing the reactive core to python.
 *
 * All the exposed objects are intrusively reference counted, Python holds them through the same counter as the
 * C++ side. Callables handed in from Python (effect bodies, schedulers, hooks, continuations) are held by the C++
 * objects that receive them.
 */
#include <ripple/python/ripple_python.h>
#include <ripple/runtime/runtime_config.h>
#include <ripple/util/errors.h>

namespace ripple::python {
    std::any to_any(nb::handle value) {
        if (!value.is_valid() || value.is_none()) { return {}; }
        if (PyLong_Check(value.ptr()) && !PyBool_Check(value.ptr())) { return nb::cast<std::int64_t>(value); }
        return nb::borrow<nb::object>(value);
    }

    nb::object from_any(const std::any &value) {
        if (auto v = std::any_cast<nb::object>(&value)) { return *v; }
        if (auto v = std::any_cast<std::int64_t>(&value)) { return nb::int_(*v); }
        return nb::none();
    }
} // namespace ripple::python

NB_MODULE(_ripple, m) {
    nb::set_leak_warnings(false);
    m.doc() = "The ripple reactive core: dependency tracking and deferred job scheduling";
    nb::intrusive_init(
        [](PyObject *o) noexcept {
            nb::gil_scoped_acquire guard;
            Py_INCREF(o);
        },
        [](PyObject *o) noexcept {
            nb::gil_scoped_acquire guard;
            Py_DECREF(o);
        });

    nb::exception<ripple::RecursionLimitError>(m, "RecursionLimitError", PyExc_RuntimeError);

    nb::class_<nb::intrusive_base>(
        m, "intrusive_base",
        nb::intrusive_ptr<nb::intrusive_base>(
            [](nb::intrusive_base *o, PyObject *po) noexcept { o->set_self_py(po); }));

    m.attr("DEFAULT_RECURSION_LIMIT") = ripple::DEFAULT_RECURSION_LIMIT;

    export_scheduler(m);
    export_reactivity(m);
    export_runtime(m);
}
