#include <ripple/reactivity/operations.h>

#include <type_traits>

namespace ripple {
    std::string_view to_string(TrackOpType type) {
        switch (type) {
            case TrackOpType::GET: return "get";
            case TrackOpType::HAS: return "has";
            case TrackOpType::ITERATE: return "iterate";
        }
        return "unknown";
    }

    std::string_view to_string(TriggerOpType type) {
        switch (type) {
            case TriggerOpType::SET: return "set";
            case TriggerOpType::ADD: return "add";
            case TriggerOpType::DELETE: return "delete";
            case TriggerOpType::CLEAR: return "clear";
        }
        return "unknown";
    }

    std::string_view to_string(TargetKind kind) {
        switch (kind) {
            case TargetKind::OBJECT: return "object";
            case TargetKind::SEQUENCE: return "sequence";
            case TargetKind::MAP: return "map";
            case TargetKind::SET: return "set";
        }
        return "unknown";
    }

    std::string_view to_string(PseudoKey key) {
        switch (key) {
            case PseudoKey::ITERATE: return "<iterate>";
            case PseudoKey::MAP_KEY_ITERATE: return "<map key iterate>";
            case PseudoKey::LENGTH: return "length";
        }
        return "<unknown>";
    }

    std::string to_string(const Key &key) {
        return std::visit([](const auto &k) -> std::string {
            using K = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<K, PseudoKey>) {
                return std::string{to_string(k)};
            } else if constexpr (std::is_same_v<K, std::int64_t>) {
                return fmt::format("[{}]", k);
            } else {
                return fmt::format("'{}'", k);
            }
        }, key);
    }

    std::string to_string(const std::optional<Key> &key) { return key.has_value() ? to_string(*key) : "<none>"; }
} // namespace ripple
