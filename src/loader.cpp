#include "yamlsort/yamlsort.hpp"

#include <yaml-cpp/yaml.h>

#include <array>
#include <charconv>
#include <limits>
#include <optional>
#include <sstream>


namespace yamlsort {

    namespace detail {
        template<typename T>
        using expected_t = std::expected<T, LoadError>;

        // Plain scalars that YAML 1.1 reads as null / booleans.
        inline constexpr std::array<std::string_view, 5> null_words{ "", "~", "null", "Null", "NULL" };

        inline constexpr std::array<std::string_view, 11> true_words{
            "y", "Y", "yes", "Yes", "YES", "true", "True", "TRUE", "on", "On", "ON"
        };
        inline constexpr std::array<std::string_view, 11> false_words{
            "n", "N", "no", "No", "NO", "false", "False", "FALSE", "off", "Off", "OFF"
        };

        template<size_t N>
        bool one_of(std::string_view s, const std::array<std::string_view, N>& words) {
            for (auto w : words) {
                if (s == w) return true;
            }
            return false;
        }

        std::optional<std::int64_t> parse_integer(std::string_view s) {
            bool negative = false;
            if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
                negative = s.front() == '-';
                s.remove_prefix(1);
            }
            if (s.empty()) return std::nullopt;

            int base = 10;
            if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
                base = 16;
                s.remove_prefix(2);
            } else if (s.size() > 1 && s[0] == '0') {
                base = 8;
                s.remove_prefix(1);
            }
            if (s.empty() || s.front() == '-' || s.front() == '+') return std::nullopt;

            std::uint64_t magnitude = 0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), magnitude, base);
            if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;

            constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
            if (negative) {
                if (magnitude > max + 1) return std::nullopt;
                if (magnitude == max + 1) return std::numeric_limits<std::int64_t>::min();
                return -static_cast<std::int64_t>(magnitude);
            }
            if (magnitude > max) return std::nullopt;
            return static_cast<std::int64_t>(magnitude);
        }

        std::optional<double> parse_floating(std::string_view s) {
            bool negative = false;
            if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
                negative = s.front() == '-';
                s.remove_prefix(1);
            }
            if (s == ".inf" || s == ".Inf" || s == ".INF") {
                return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
            }
            if (s == ".nan" || s == ".NaN" || s == ".NAN") {
                return std::numeric_limits<double>::quiet_NaN();
            }

            // from_chars alone would also take "inf", "nan" and friends
            bool digit_first = !s.empty() && s[0] >= '0' && s[0] <= '9';
            bool dot_digit = s.size() > 1 && s[0] == '.' && s[1] >= '0' && s[1] <= '9';
            if (!digit_first && !dot_digit) return std::nullopt;

            double d = 0.0;
            auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), d, std::chars_format::general);
            if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
            return negative ? -d : d;
        }

        LoadError make_error(LoadError::code c, const YAML::Mark& mark, std::string_view msg) {
            if (mark.is_null()) return LoadError::make(c, 0, 0, 0, msg);
            return LoadError::make(c,
                                   static_cast<std::size_t>(mark.pos),
                                   static_cast<std::size_t>(mark.line) + 1,
                                   static_cast<std::size_t>(mark.column) + 1,
                                   msg);
        }

        struct Converter {
            const LoadOptions& opts;
            std::pmr::memory_resource* mem_res;
            size_t depth = 0;

            Converter(const LoadOptions& o, std::pmr::memory_resource* r) : opts{ o }, mem_res{ r } {}

            expected_t<value> convert(const YAML::Node& node);
            expected_t<value> convert_sequence(const YAML::Node& node);
            expected_t<value> convert_mapping(const YAML::Node& node);
            value convert_scalar(const YAML::Node& node) const;
        };

        struct DepthGuard {
            Converter& c;
            bool active = false;

            DepthGuard(Converter& cv) : c(cv) {
                if (c.opts.max_depth == 0 || c.depth < c.opts.max_depth) {
                    c.depth++;
                    active = true;
                }
            }

            ~DepthGuard() {
                if (active) c.depth--;
            }

            bool ok() const {
                return active;
            }
        };

        value Converter::convert_scalar(const YAML::Node& node) const {
            const std::string& text = node.Scalar();
            const std::string& tag = node.Tag();

            // Quoted ("!") and explicitly !!str tagged scalars are never resolved.
            if (tag == "!" || tag == "tag:yaml.org,2002:str") return value{ std::string_view{ text }, mem_res };

            if (one_of(text, null_words)) return value{ nullptr, mem_res };
            if (one_of(text, true_words)) return value{ true, mem_res };
            if (one_of(text, false_words)) return value{ false, mem_res };
            if (auto i = parse_integer(text)) return value{ *i, mem_res };
            if (auto d = parse_floating(text)) return value{ *d, mem_res };
            return value{ std::string_view{ text }, mem_res };
        }

        expected_t<value> Converter::convert_sequence(const YAML::Node& node) {
            DepthGuard guard{ *this };
            if (!guard.ok()) return std::unexpected(make_error(LoadError::code::depth_limit_exceeded, node.Mark(), "Maximum nesting depth exceeded"));

            sequence seq{ allocator_type(mem_res) };
            seq.reserve(node.size());
            for (const auto& child : node) {
                auto v = convert(child);
                if (!v) return std::unexpected(std::move(v.error()));
                seq.emplace_back(std::move(*v));
            }
            return value{ std::move(seq), mem_res };
        }

        expected_t<value> Converter::convert_mapping(const YAML::Node& node) {
            DepthGuard guard{ *this };
            if (!guard.ok()) return std::unexpected(make_error(LoadError::code::depth_limit_exceeded, node.Mark(), "Maximum nesting depth exceeded"));

            mapping m{ std::less<>{}, allocator_type(mem_res) };
            for (auto it = node.begin(); it != node.end(); ++it) {
                YAML::Node key = it->first;
                string k{ mem_res };
                if (key.IsScalar()) k.assign(key.Scalar());
                else if (key.IsNull()) k.assign("null");
                else return std::unexpected(make_error(LoadError::code::unsupported_key, key.Mark(), "Mapping keys must be scalars"));

                YAML::Node val = it->second;
                auto v = convert(val);
                if (!v) return std::unexpected(std::move(v.error()));
                m.insert_or_assign(std::move(k), std::move(*v)); // last wins
            }
            return value{ std::move(m), mem_res };
        }

        expected_t<value> Converter::convert(const YAML::Node& node) {
            switch (node.Type()) {
            case YAML::NodeType::Sequence: return convert_sequence(node);
            case YAML::NodeType::Map: return convert_mapping(node);
            case YAML::NodeType::Scalar: return convert_scalar(node);
            case YAML::NodeType::Null:
            case YAML::NodeType::Undefined:
                break;
            }
            return value{ nullptr, mem_res };
        }

        LoadResult load_impl(std::string_view text, const LoadOptions& opts) {
            std::pmr::memory_resource* res = std::pmr::get_default_resource();

            YAML::Node root;
            try {
                root = YAML::Load(std::string{ text });
            } catch (const YAML::Exception& e) {
                return std::unexpected(make_error(LoadError::code::syntax_error, e.mark, e.msg));
            }

            Converter c{ opts, res };
            return c.convert(root);
        }

    } // namespace detail

    LoadResult load(std::string_view input, const LoadOptions& opts) {
        return detail::load_impl(input, opts);
    }

    LoadResult load(std::istream& is, const LoadOptions& opts) {
        std::ostringstream oss;
        oss << is.rdbuf();
        return detail::load_impl(oss.str(), opts);
    }

} // namespace yamlsort
