#ifndef RIPPLE_REACTIVITY_OPERATIONS_H
#define RIPPLE_REACTIVITY_OPERATIONS_H

#include <ripple/ripple_base.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace ripple {
    /**
     * The kind of read reported to track.
     */
    enum class TrackOpType : std::uint8_t { GET = 0, HAS = 1, ITERATE = 2 };

    /**
     * The kind of write reported to trigger, this drives the key resolution when computing the effects to notify.
     */
    enum class TriggerOpType : std::uint8_t { SET = 0, ADD = 1, DELETE = 2, CLEAR = 3 };

    /**
     * The shape of an observed target. Sequences and maps have shape-sensitive keys (length, key iteration) that
     * need to be notified in addition to the key written.
     */
    enum class TargetKind : std::uint8_t { OBJECT = 0, SEQUENCE = 1, MAP = 2, SET = 3 };

    /**
     * Reserved keys that do not name a slot of the target.
     *
     * ITERATE:          any form of iteration over the target (keys, values, entries, size).
     * MAP_KEY_ITERATE:  iteration over the keys of a map only, not affected by value replacement.
     * LENGTH:           the length of a sequence.
     */
    enum class PseudoKey : std::uint8_t { ITERATE = 0, MAP_KEY_ITERATE = 1, LENGTH = 2 };

    /**
     * A slot of a target. Integer keys are sequence indices (or integer map keys), string keys are named slots.
     */
    using Key = std::variant<PseudoKey, std::int64_t, std::string>;

    inline constexpr PseudoKey ITERATE_KEY = PseudoKey::ITERATE;
    inline constexpr PseudoKey MAP_KEY_ITERATE_KEY = PseudoKey::MAP_KEY_ITERATE;
    inline constexpr PseudoKey LENGTH_KEY = PseudoKey::LENGTH;

    [[nodiscard]] inline bool is_integer_key(const Key &key) { return std::holds_alternative<std::int64_t>(key); }

    [[nodiscard]] inline bool is_pseudo_key(const Key &key, PseudoKey pseudo) {
        auto p = std::get_if<PseudoKey>(&key);
        return p != nullptr && *p == pseudo;
    }

    [[nodiscard]] RIPPLE_EXPORT std::string_view to_string(TrackOpType type);

    [[nodiscard]] RIPPLE_EXPORT std::string_view to_string(TriggerOpType type);

    [[nodiscard]] RIPPLE_EXPORT std::string_view to_string(TargetKind kind);

    [[nodiscard]] RIPPLE_EXPORT std::string_view to_string(PseudoKey key);

    [[nodiscard]] RIPPLE_EXPORT std::string to_string(const Key &key);

    [[nodiscard]] RIPPLE_EXPORT std::string to_string(const std::optional<Key> &key);
} // namespace ripple

template<>
struct fmt::formatter<ripple::Key> : fmt::formatter<std::string> {
    auto format(const ripple::Key &key, format_context &ctx) const {
        return fmt::formatter<std::string>::format(ripple::to_string(key), ctx);
    }
};

#endif // RIPPLE_REACTIVITY_OPERATIONS_H
