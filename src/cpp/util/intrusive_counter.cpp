// The intrusive reference counter is compiled into the core library once, so the core does not depend on the
// Python extension being loaded. The extension module installs the Python hooks with intrusive_init.
#include <nanobind/intrusive/counter.inl>
