#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "decode_result.hpp"

namespace QueryFusion {

// Multi-valued view of a key=value&... text. Keys and values point into the
// parsed text, which must outlive the map. Values are consumed front to back;
// a key whose values are all consumed reads as absent.
class FieldMap {
    struct Values {
        std::vector<std::string_view> items;
        std::size_t next = 0;

        std::span<const std::string_view> remaining() const {
            return std::span<const std::string_view>(items).subspan(next);
        }
    };
    std::map<std::string_view, Values, std::less<>> m_fields;

public:
    FieldMap() = default;

    // Splits on '&', then each piece on '='. A piece must have exactly one '='.
    static DecodeResult Parse(std::string_view text, FieldMap & out) {
        out.m_fields.clear();
        // Empty text is deliberately an empty map rather than one malformed
        // piece (a strict reading of the grammar rejects it), so a request
        // without a query string decodes records whose fields are all optional.
        if(text.empty()) {
            return DecodeResult{};
        }
        std::size_t offset = 0;
        while(true) {
            const std::size_t amp = text.find('&', offset);
            const std::size_t end = amp == std::string_view::npos ? text.size() : amp;
            const std::string_view piece = text.substr(offset, end - offset);

            const std::size_t eq = piece.find('=');
            if(eq == std::string_view::npos || piece.find('=', eq + 1) != std::string_view::npos) {
                out.m_fields.clear();
                return DecodeResult(Error{.code = ErrorCode::INVALID_PAIR, .key = piece, .pos = offset});
            }
            out.m_fields[piece.substr(0, eq)].items.push_back(piece.substr(eq + 1));

            if(amp == std::string_view::npos) {
                break;
            }
            offset = amp + 1;
        }
        return DecodeResult{};
    }

    bool contains(std::string_view key) const {
        return m_fields.find(key) != m_fields.end();
    }

    // number of keys that still have unconsumed values
    std::size_t size() const {
        return m_fields.size();
    }
    bool empty() const {
        return m_fields.empty();
    }

    std::span<const std::string_view> peekAll(std::string_view key) const {
        auto it = m_fields.find(key);
        if(it == m_fields.end()) {
            return {};
        }
        return it->second.remaining();
    }

    std::optional<std::string_view> takeFirst(std::string_view key) {
        auto it = m_fields.find(key);
        if(it == m_fields.end()) {
            return std::nullopt;
        }
        std::string_view v = it->second.items[it->second.next++];
        if(it->second.next == it->second.items.size()) {
            m_fields.erase(it);
        }
        return v;
    }

    // Takes every remaining value of key; the returned views stay valid
    // after the key is gone because they point into the parsed text.
    std::vector<std::string_view> takeAll(std::string_view key) {
        std::vector<std::string_view> out;
        auto it = m_fields.find(key);
        if(it == m_fields.end()) {
            return out;
        }
        auto rest = it->second.remaining();
        out.assign(rest.begin(), rest.end());
        m_fields.erase(it);
        return out;
    }
};

} // namespace QueryFusion
