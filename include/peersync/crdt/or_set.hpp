/// @file or_set.hpp
/// @brief Observed-remove set with add-wins semantics.

#pragma once

#include <peersync/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace peersync {

/// A globally unique identifier minted for one add operation.
using Tag = std::string;

/// Mint a fresh tag for an add performed on `node`:
/// `<node>-<millis>-<8 random hex chars>`.
auto make_tag(const NodeId& node) -> Tag;

/// A value together with the live tags of the adds that produced it.
template <typename T>
struct TaggedElement {
    T value{};
    std::set<Tag> tags;

    auto operator==(const TaggedElement&) const -> bool = default;
};

/// Serializable state of an OrSet.
///
/// Elements are keyed by the set's key function. Tombstones are the tags of
/// removed adds; they are never deleted so a late-arriving copy of a
/// removed add cannot resurrect it.
template <typename T>
struct OrSetState {
    std::map<std::string, TaggedElement<T>> elements;
    std::set<Tag> tombstones;

    auto operator==(const OrSetState&) const -> bool = default;
};

/// An observed-remove set.
///
/// Each add mints a unique tag; a remove only tombstones the tags it has
/// observed. A concurrent add on another replica carries a tag the remove
/// never saw, so after merging the element is present (add wins).
///
/// @code
/// auto a = OrSet<std::string>{"a"};
/// auto b = OrSet<std::string>{"b"};
/// a.add("x");
/// b.merge(a.state());
/// b.remove("x");   // b only tombstones a's tag
/// a.add("x");      // concurrent add with a new tag
/// a.merge(b.state());
/// b.merge(a.state());
/// // a.contains("x") && b.contains("x")
/// @endcode
template <typename T>
class OrSet {
public:
    using State = OrSetState<T>;
    using KeyFn = std::function<std::string(const T&)>;

    explicit OrSet(NodeId node_id, KeyFn key_fn = default_key)
        : node_id_{std::move(node_id)}, key_fn_{std::move(key_fn)} {}

    /// Rebuild a set from a captured state.
    static auto from_state(NodeId node_id, State state, KeyFn key_fn = default_key) -> OrSet {
        auto result = OrSet{std::move(node_id), std::move(key_fn)};
        result.state_ = std::move(state);
        return result;
    }

    /// Add a value under a freshly minted tag.
    /// @return The minted tag.
    auto add(T value) -> Tag {
        auto tag = make_tag(node_id_);
        auto key = key_fn_(value);
        auto [it, inserted] = state_.elements.try_emplace(std::move(key));
        if (inserted) it->second.value = std::move(value);
        it->second.tags.insert(tag);
        return tag;
    }

    /// Tombstone every live tag of a value and drop it.
    /// @return false if the value had no live tags.
    auto remove(const T& value) -> bool {
        auto it = state_.elements.find(key_fn_(value));
        if (it == state_.elements.end() || it->second.tags.empty()) return false;
        state_.tombstones.insert(it->second.tags.begin(), it->second.tags.end());
        state_.elements.erase(it);
        return true;
    }

    auto contains(const T& value) const -> bool {
        auto it = state_.elements.find(key_fn_(value));
        return it != state_.elements.end() && !it->second.tags.empty();
    }

    /// Live values in key order.
    auto values() const -> std::vector<T> {
        auto result = std::vector<T>{};
        for (const auto& [key, element] : state_.elements) {
            if (!element.tags.empty()) result.push_back(element.value);
        }
        return result;
    }

    auto size() const -> std::size_t {
        auto count = std::size_t{0};
        for (const auto& [key, element] : state_.elements) {
            if (!element.tags.empty()) ++count;
        }
        return count;
    }

    auto empty() const -> bool { return size() == 0; }

    /// Remove every element, tombstoning all live tags.
    void clear() {
        for (const auto& [key, element] : state_.elements) {
            state_.tombstones.insert(element.tags.begin(), element.tags.end());
        }
        state_.elements.clear();
    }

    /// Merge a remote state.
    ///
    /// Remote tombstones are applied first, then remote tags that are not
    /// tombstoned are added, and finally any local tag that is now
    /// tombstoned is purged. Elements left without tags are dropped.
    /// @return true if the state changed.
    auto merge(const State& remote) -> bool {
        bool changed = false;

        for (const auto& tag : remote.tombstones) {
            if (state_.tombstones.insert(tag).second) changed = true;
        }

        for (const auto& [key, remote_element] : remote.elements) {
            auto live = std::set<Tag>{};
            for (const auto& tag : remote_element.tags) {
                if (!state_.tombstones.contains(tag)) live.insert(tag);
            }
            if (live.empty()) continue;

            auto [it, inserted] = state_.elements.try_emplace(key);
            if (inserted) {
                it->second.value = remote_element.value;
                it->second.tags = std::move(live);
                changed = true;
                continue;
            }
            for (auto& tag : live) {
                if (it->second.tags.insert(tag).second) changed = true;
            }
        }

        for (auto it = state_.elements.begin(); it != state_.elements.end();) {
            auto& tags = it->second.tags;
            for (auto tag = tags.begin(); tag != tags.end();) {
                if (state_.tombstones.contains(*tag)) {
                    tag = tags.erase(tag);
                    changed = true;
                } else {
                    ++tag;
                }
            }
            it = tags.empty() ? state_.elements.erase(it) : std::next(it);
        }

        return changed;
    }

    /// A new set holding the merge of this set and `other`.
    auto union_with(const OrSet& other) const -> OrSet {
        auto result = *this;
        result.merge(other.state_);
        return result;
    }

    /// A new set holding the live values present in both sets.
    auto intersection(const OrSet& other) const -> OrSet {
        auto result = OrSet{node_id_, key_fn_};
        for (const auto& [key, element] : state_.elements) {
            if (!element.tags.empty() && other.contains(element.value)) {
                result.add(element.value);
            }
        }
        return result;
    }

    /// A new set holding the live values of this set absent from `other`.
    auto difference(const OrSet& other) const -> OrSet {
        auto result = OrSet{node_id_, key_fn_};
        for (const auto& [key, element] : state_.elements) {
            if (!element.tags.empty() && !other.contains(element.value)) {
                result.add(element.value);
            }
        }
        return result;
    }

    auto state() const -> const State& { return state_; }
    auto node_id() const -> const NodeId& { return node_id_; }

    /// Strings key as themselves; anything else by its JSON dump.
    static auto default_key(const T& value) -> std::string {
        if constexpr (std::is_same_v<T, std::string>) {
            return value;
        } else {
            return nlohmann::json(value).dump();
        }
    }

private:
    NodeId node_id_;
    KeyFn key_fn_;
    State state_;
};

}  // namespace peersync
