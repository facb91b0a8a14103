// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace sightline
{

/// @brief When an unchanged window produces a new OCR row.
enum class OcrDedupPolicy : std::uint8_t
{
    None,      ///< every recognised window yields a row
    Unchanged, ///< skip a window whose text equals its previous text
};

[[nodiscard]] constexpr auto ocrDedupPolicyFromString(std::string_view str) -> std::optional<OcrDedupPolicy>
{
    if (str == "none")
        return OcrDedupPolicy::None;
    if (str == "unchanged")
        return OcrDedupPolicy::Unchanged;
    return std::nullopt;
}

[[nodiscard]] constexpr auto ocrDedupPolicyToString(OcrDedupPolicy policy) -> std::string_view
{
    return policy == OcrDedupPolicy::None ? "none" : "unchanged";
}

/// @brief Remembers the last text per (monitor, app, window) of one vision loop.
///
/// Windows not seen for maxIdleTicks ticks are forgotten, so titles that keep changing
/// (clocks, counters) do not accumulate.
class OcrDeduplicator
{
  public:
    static constexpr auto DefaultMaxIdleTicks = std::uint64_t { 300 };

    explicit OcrDeduplicator(OcrDedupPolicy policy, std::uint64_t maxIdleTicks = DefaultMaxIdleTicks):
        _policy(policy), _maxIdleTicks(maxIdleTicks)
    {
    }

    /// @brief Starts a new capture tick and forgets windows idle for too long.
    void nextTick()
    {
        ++_tick;
        std::erase_if(_last, [this](auto const& entry) { return _tick - entry.second.lastSeen > _maxIdleTicks; });
    }

    /// @brief Returns true if the text should become a new OCR row, and records it.
    [[nodiscard]] auto admit(std::uint32_t monitorId,
                             std::string_view appName,
                             std::string_view windowName,
                             std::string_view text) -> bool
    {
        if (_policy == OcrDedupPolicy::None)
            return true;

        auto key = std::tuple { monitorId, std::string(appName), std::string(windowName) };
        auto [it, inserted] = _last.try_emplace(std::move(key), Entry { .text = std::string(text), .lastSeen = _tick });
        if (inserted)
            return true;

        it->second.lastSeen = _tick;
        if (it->second.text == text)
            return false;
        it->second.text = std::string(text);
        return true;
    }

    [[nodiscard]] auto size() const -> size_t { return _last.size(); }

    void clear() { _last.clear(); }

  private:
    struct Entry
    {
        std::string text;
        std::uint64_t lastSeen = 0;
    };

    OcrDedupPolicy _policy;
    std::uint64_t _maxIdleTicks;
    std::uint64_t _tick = 0;
    std::map<std::tuple<std::uint32_t, std::string, std::string>, Entry> _last;
};

} // namespace sightline
