/*
 * Expose the dependency graph elements to python
 */
#include <ripple/python/ripple_python.h>
#include <ripple/reactivity/dep.h>
#include <ripple/reactivity/effect.h>
#include <ripple/reactivity/operations.h>
#include <ripple/reactivity/target.h>

using namespace nb::literals;

void export_reactivity(nb::module_ &m) {
    using namespace ripple;

    nb::enum_<TrackOpType>(m, "TrackOpType")
            .value("GET", TrackOpType::GET)
            .value("HAS", TrackOpType::HAS)
            .value("ITERATE", TrackOpType::ITERATE);

    nb::enum_<TriggerOpType>(m, "TriggerOpType")
            .value("SET", TriggerOpType::SET)
            .value("ADD", TriggerOpType::ADD)
            .value("DELETE", TriggerOpType::DELETE)
            .value("CLEAR", TriggerOpType::CLEAR);

    nb::enum_<TargetKind>(m, "TargetKind")
            .value("OBJECT", TargetKind::OBJECT)
            .value("SEQUENCE", TargetKind::SEQUENCE)
            .value("MAP", TargetKind::MAP)
            .value("SET", TargetKind::SET);

    nb::enum_<PseudoKey>(m, "PseudoKey")
            .value("ITERATE", PseudoKey::ITERATE)
            .value("MAP_KEY_ITERATE", PseudoKey::MAP_KEY_ITERATE)
            .value("LENGTH", PseudoKey::LENGTH);

    m.attr("ITERATE_KEY") = ITERATE_KEY;
    m.attr("MAP_KEY_ITERATE_KEY") = MAP_KEY_ITERATE_KEY;
    m.attr("LENGTH_KEY") = LENGTH_KEY;

    nb::class_<Target, nb::intrusive_base>(m, "Target")
            .def(nb::init<TargetKind, std::string>(), "kind"_a = TargetKind::OBJECT, "label"_a = "")
            .def_prop_ro("kind", &Target::kind)
            .def_prop_ro("label", &Target::label)
            .def_prop_ro("is_observed", &Target::is_observed)
            .def_prop_ro("dep_count", &Target::dep_count)
            .def("subscriber_count",
                 [](const Target &self, const Key &key) -> std::size_t {
                     auto dep = self.find_dep(key);
                     return dep != nullptr ? dep->size() : 0;
                 }, "key"_a)
            .def("subscribers",
                 [](const Target &self, const Key &key) {
                     std::vector<effect_s_ptr> result;
                     if (auto dep = self.find_dep(key)) { result = dep->subscribers(); }
                     return result;
                 }, "key"_a)
            .def("release_dependencies", &Target::release_dependencies)
            .def("__str__", &Target::to_string)
            .def("__repr__", &Target::to_string);

    nb::class_<DebuggerEvent>(m, "DebuggerEvent")
            .def_prop_ro("effect", [](const DebuggerEvent &self) { return effect_s_ptr{self.effect}; })
            .def_prop_ro("target", [](const DebuggerEvent &self) { return target_s_ptr{self.target}; })
            .def_prop_ro("type", [](const DebuggerEvent &self) { return self.type; })
            .def_prop_ro("key", [](const DebuggerEvent &self) { return self.key; })
            .def_prop_ro("new_value", [](const DebuggerEvent &self) { return python::from_any(self.new_value); })
            .def_prop_ro("old_value", [](const DebuggerEvent &self) { return python::from_any(self.old_value); })
            .def_prop_ro("old_target", [](const DebuggerEvent &self) { return python::from_any(self.old_target); })
            .def_prop_ro("is_track", &DebuggerEvent::is_track)
            .def("__str__", &DebuggerEvent::to_string)
            .def("__repr__", &DebuggerEvent::to_string);

    nb::class_<Effect, Job>(m, "Effect")
            .def("stop", &Effect::stop)
            .def("cleanup", &Effect::cleanup)
            .def_prop_ro("active", &Effect::active)
            .def_prop_ro("effect_id", &Effect::effect_id)
            .def_prop_ro("allow_recurse", [](const Effect &self) { return self.options().allow_recurse; })
            .def_prop_ro("lazy", [](const Effect &self) { return self.options().lazy; })
            .def_prop_ro("dep_count", [](const Effect &self) { return self.deps().size(); })
            .def_prop_ro("has_scheduler",
                         [](const Effect &self) { return self.has_capability(EffectCapability::SCHEDULER); })
            .def("raw", [](const Effect &self) { self.raw()(); });
}
