#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace labscan::core {

/// Read-only mapping from lowercase abbreviations / synonyms to canonical
/// biomarker names ("a1c" -> "HbA1c", "ldl-c" -> "LDL Cholesterol").
///
/// Constructed once and shared by const reference; never mutated afterwards,
/// so concurrent normalize() calls need no synchronization.
///
/// Invariant (checked by the constructor): every canonical name is a fixed
/// point of normalize(), which makes normalize() idempotent.
class AliasTable {
 public:
  using Map = std::unordered_map<std::string, std::string>;

  /// Throws std::invalid_argument if a key is not lowercase/trimmed or a
  /// canonical name would normalize to something else.
  explicit AliasTable(Map aliases);

  /// Built-in table of common lab abbreviations. Process lifetime.
  [[nodiscard]] static const AliasTable& builtin();

  /// Trim, lowercase, look up. Unknown names come back trimmed, case kept.
  [[nodiscard]] std::string normalize(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view alias) const;
  [[nodiscard]] std::size_t size() const noexcept { return aliases_.size(); }
  [[nodiscard]] const Map& entries() const noexcept { return aliases_; }

 private:
  Map aliases_;
};

/// ASCII lowercase copy.
[[nodiscard]] std::string to_lower(std::string_view s);

/// Copy with leading/trailing whitespace removed.
[[nodiscard]] std::string trim_copy(std::string_view s);

/// Number of UTF-8 code points (continuation bytes are not counted).
[[nodiscard]] std::size_t utf8_length(std::string_view s) noexcept;

}  // namespace labscan::core
