#include "yamlsort/yamlsort.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <ostream>
#include <sstream>
#include <stdexcept>


namespace yamlsort {

    namespace detail {
        using expected_void = std::expected<void, EmitError>;

        inline constexpr std::string_view promoted_key = "name";

        inline constexpr std::array<std::string_view, 6> boolean_words{
            "true", "false", "yes", "no", "on", "off"
        };

        bool iequals(std::string_view a, std::string_view b) noexcept {
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); i++) {
                auto ca = static_cast<unsigned char>(a[i]);
                auto cb = static_cast<unsigned char>(b[i]);
                if (std::tolower(ca) != std::tolower(cb)) return false;
            }
            return true;
        }

        void write_indent(std::ostream& os, size_t level) {
            for (size_t i = 0; i < level; i++) os.put(' ');
        }

        void write_quoted(std::string_view s, std::string& out) {
            out.reserve(out.size() + s.size() + 2);
            out.push_back('"');
            for (char c : s) {
                if (c == '"' || c == '\\') out.push_back('\\');
                out.push_back(c);
            }
            out.push_back('"');
        }

        void write_floating(double d, std::string& out) {
            if (std::isnan(d)) {
                out += ".nan";
                return;
            }
            if (std::isinf(d)) {
                out += d < 0 ? "-.inf" : ".inf";
                return;
            }
            char buf[64];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
            if (ec != std::errc{}) out += "0";
            else out.append(buf, ptr);
        }

        void write_integer(std::int64_t i, std::string& out) {
            char buf[32];
            auto res = std::to_chars(buf, buf + sizeof(buf), i);
            out.append(buf, res.ptr);
        }

        // Appends ".key" or "[idx]" to the diagnostic path for the lifetime
        // of the guard.
        struct PathGuard {
            std::string& path;
            size_t mark;

            PathGuard(std::string& p, std::string_view key) : path(p), mark(p.size()) {
                if (!path.empty()) path.push_back('.');
                path.append(key);
            }

            PathGuard(std::string& p, size_t idx) : path(p), mark(p.size()) {
                path.push_back('[');
                path += std::to_string(idx);
                path.push_back(']');
            }

            ~PathGuard() { path.resize(mark); }

            PathGuard(const PathGuard&) = delete;
            PathGuard& operator=(const PathGuard&) = delete;
        };

        struct Emitter {
            std::ostream& os;
            const EmitOptions& opts;
            std::string path{};

            Emitter(std::ostream& o, const EmitOptions& e) : os{ o }, opts{ e } {}

            expected_void emit(const value& v, size_t level, bool in_sequence);
            expected_void emit_mapping(const mapping& m, size_t level, bool in_sequence);
            expected_void emit_sequence(const sequence& seq, size_t level, bool in_sequence);
        };

        expected_void Emitter::emit(const value& v, size_t level, bool in_sequence) {
            switch (v.type()) {
            case kind::null:
                os.put('\n');
                return {};
            case kind::mapping:
                return emit_mapping(v.as_mapping(), level, in_sequence);
            case kind::sequence:
                return emit_sequence(v.as_sequence(), level, in_sequence);
            case kind::string:
            case kind::integer:
            case kind::floating:
                os << format_scalar(v, opts) << '\n';
                return {};
            case kind::boolean:
                break;
            }
            return std::unexpected(EmitError::unsupported(v, path));
        }

        expected_void Emitter::emit_mapping(const mapping& m, size_t level, bool in_sequence) {
            if (m.empty()) {
                os << "{}\n";
                return {};
            }

            auto keys = ordered_keys(m);
            for (size_t i = 0; i < keys.size(); i++) {
                std::string_view key = keys[i];
                const value& child = m.find(key)->second;
                PathGuard guard{ path, key };

                // the "- " marker already holds the first key's column
                if (!(in_sequence && i == 0)) write_indent(os, level);

                switch (classify(child)) {
                case shape::unsupported:
                    return std::unexpected(EmitError::unsupported(child, path));
                case shape::empty_mapping:
                    os << key << ": {}\n";
                    continue;
                case shape::empty_sequence:
                    os << key << ": []\n";
                    continue;
                case shape::omitted:
                    os << key << ':';
                    break;
                case shape::block:
                    os << key << ":\n";
                    break;
                case shape::inline_scalar:
                    os << key << ": ";
                    break;
                }

                if (auto r = emit(child, level + 2, false); !r) return r;
            }
            return {};
        }

        expected_void Emitter::emit_sequence(const sequence& seq, size_t level, bool in_sequence) {
            if (seq.empty()) {
                os << "[]\n";
                return {};
            }

            // Markers sit two columns left of the items, level 0 included.
            size_t marker = level >= 2 ? level - 2 : 0;
            size_t item_level = marker + 2;

            for (size_t i = 0; i < seq.size(); i++) {
                const value& item = seq[i];
                PathGuard guard{ path, i };

                if (!(in_sequence && i == 0)) write_indent(os, marker);
                os << "- ";

                // A nested sequence puts its own markers one step to the right.
                size_t child_level = (item.is_sequence() && item.size() != 0) ? item_level + 2 : item_level;
                if (auto r = emit(item, child_level, true); !r) return r;
            }
            return {};
        }

    } // namespace detail

    bool key_less(std::string_view lhs, std::string_view rhs) noexcept {
        if (lhs == detail::promoted_key && rhs == detail::promoted_key) return false;
        if (lhs == detail::promoted_key) return true;
        if (rhs == detail::promoted_key) return false;
        return lhs < rhs;
    }

    std::vector<std::string_view> ordered_keys(const mapping& m) {
        std::vector<std::string_view> keys;
        keys.reserve(m.size());
        for (const auto& [k, v] : m) keys.emplace_back(k);
        std::sort(keys.begin(), keys.end(), key_less);
        return keys;
    }

    shape classify(const value& v) noexcept {
        switch (v.type()) {
        case kind::null: return shape::omitted;
        case kind::mapping: return v.size() == 0 ? shape::empty_mapping : shape::block;
        case kind::sequence: return v.size() == 0 ? shape::empty_sequence : shape::block;
        case kind::string:
        case kind::integer:
        case kind::floating:
            return shape::inline_scalar;
        case kind::boolean:
            break;
        }
        return shape::unsupported;
    }

    bool needs_quotes(std::string_view s, const EmitOptions& opts) noexcept {
        if (opts.quote_strings) return true;
        // a bare empty scalar reads back as null
        if (s.empty()) return true;
        char first = s.front();
        if ((first >= '0' && first <= '9') || first == ',') return true;
        return std::any_of(detail::boolean_words.begin(), detail::boolean_words.end(),
                           [s](std::string_view w) { return detail::iequals(s, w); });
    }

    std::string format_scalar(const value& v, const EmitOptions& opts) {
        if (!v.is_scalar()) throw std::invalid_argument{ "yamlsort::format_scalar: value is not a scalar" };

        std::string out;
        if (v.is_string()) {
            const auto& s = v.as_string();
            if (needs_quotes(s, opts)) detail::write_quoted(s, out);
            else out.assign(s.begin(), s.end());
        } else if (v.is_integer()) {
            detail::write_integer(v.as_integer(), out);
        } else {
            detail::write_floating(v.as_floating(), out);
        }
        return out;
    }

    std::expected<void, EmitError> serialize(const value& v, std::ostream& os, const EmitOptions& opts) {
        detail::Emitter e{ os, opts };
        return e.emit(v, 0, false);
    }

    EmitResult serialize(const value& v, const EmitOptions& opts) {
        std::ostringstream oss;
        if (auto r = serialize(v, oss, opts); !r) return std::unexpected(std::move(r.error()));
        return oss.str();
    }

} // namespace yamlsort
