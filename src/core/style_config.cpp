#include <cctype>
#include <climits>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <map>
#include <sparkline/logger.hpp>
#include <sparkline/style_config.hpp>
#include <sstream>
#include <vector>

namespace sparkline
{

// ─── JSON helpers (minimal, no external deps) ────────────────────────────────

namespace
{

constexpr const char* kCategory = "sparkline.config";
constexpr int         kVersion  = 1;

std::string number_to_json(double v)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.9g", v);
    return buf;
}

std::string color_to_json(const Color& c)
{
    char buf[128];
    std::snprintf(buf, sizeof(buf), "[%.9g, %.9g, %.9g, %.9g]", c.r, c.g, c.b, c.a);
    return buf;
}

std::string escape_json_string(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char ch : s)
    {
        if (ch == '"')
            out += "\\\"";
        else if (ch == '\\')
            out += "\\\\";
        else if (ch == '\n')
            out += "\\n";
        else if (ch == '\t')
            out += "\\t";
        else if (ch == '\r')
            out += "\\r";
        else if (ch == '\b')
            out += "\\b";
        else if (ch == '\f')
            out += "\\f";
        else if (static_cast<unsigned char>(ch) < 0x20)
        {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
            out += buf;
        }
        else
            out += ch;
    }
    out += '"';
    return out;
}

std::string gradient_to_json(const std::optional<LinearGradient>& gradient)
{
    if (!gradient)
        return "null";

    std::ostringstream os;
    os << "{\"begin\": [" << number_to_json(gradient->begin.x) << ", "
       << number_to_json(gradient->begin.y) << "], \"end\": [" << number_to_json(gradient->end.x)
       << ", " << number_to_json(gradient->end.y) << "], \"stops\": [";
    for (size_t i = 0; i < gradient->stops.size(); ++i)
    {
        const auto& s = gradient->stops[i];
        if (i > 0)
            os << ", ";
        os << "[" << number_to_json(s.offset) << ", " << number_to_json(s.color.r) << ", "
           << number_to_json(s.color.g) << ", " << number_to_json(s.color.b) << ", "
           << number_to_json(s.color.a) << "]";
    }
    os << "]}";
    return os.str();
}

size_t skip_ws(const std::string& s, size_t pos)
{
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos])))
        ++pos;
    return pos;
}

// End (one past) of the string literal starting at s[pos] == '"'.
size_t skip_string(const std::string& s, size_t pos)
{
    for (size_t i = pos + 1; i < s.size(); ++i)
    {
        if (s[i] == '\\')
            ++i;
        else if (s[i] == '"')
            return i + 1;
    }
    return std::string::npos;
}

// End (one past) of the value starting at s[pos]: a string, a balanced
// array/object, or a bare token.
size_t skip_value(const std::string& s, size_t pos)
{
    if (pos >= s.size())
        return std::string::npos;
    if (s[pos] == '"')
        return skip_string(s, pos);

    if (s[pos] == '[' || s[pos] == '{')
    {
        int depth = 0;
        for (size_t i = pos; i < s.size(); ++i)
        {
            if (s[i] == '"')
            {
                i = skip_string(s, i);
                if (i == std::string::npos)
                    return i;
                --i;
            }
            else if (s[i] == '[' || s[i] == '{')
                ++depth;
            else if (s[i] == ']' || s[i] == '}')
            {
                if (--depth == 0)
                    return i + 1;
            }
        }
        return std::string::npos;
    }

    size_t i = pos;
    while (i < s.size() && s[i] != ',' && s[i] != '}' && s[i] != ']'
           && !std::isspace(static_cast<unsigned char>(s[i])))
        ++i;
    return i;
}

// Parses the four hex digits of a \u escape starting at raw[pos].
std::optional<unsigned> parse_hex4(const std::string& raw, size_t pos)
{
    if (pos + 4 > raw.size())
        return std::nullopt;
    unsigned code = 0;
    for (size_t i = pos; i < pos + 4; ++i)
    {
        const char c = raw[i];
        code <<= 4;
        if (c >= '0' && c <= '9')
            code |= static_cast<unsigned>(c - '0');
        else if (c >= 'a' && c <= 'f')
            code |= static_cast<unsigned>(c - 'a' + 10);
        else if (c >= 'A' && c <= 'F')
            code |= static_cast<unsigned>(c - 'A' + 10);
        else
            return std::nullopt;
    }
    return code;
}

void append_utf8(std::string& out, unsigned cp)
{
    if (cp < 0x80)
    {
        out += static_cast<char>(cp);
    }
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
    else
    {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::optional<std::string> unescape_string(const std::string& raw)
{
    if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"')
        return std::nullopt;
    const size_t end = raw.size() - 1;
    std::string  out;
    for (size_t i = 1; i < end; ++i)
    {
        char ch = raw[i];
        if (ch != '\\')
        {
            out += ch;
            continue;
        }
        ++i;
        if (i >= end)
            return std::nullopt;
        switch (raw[i])
        {
            case '"':
            case '\\':
            case '/':
                out += raw[i];
                break;
            case 'n':
                out += '\n';
                break;
            case 't':
                out += '\t';
                break;
            case 'r':
                out += '\r';
                break;
            case 'b':
                out += '\b';
                break;
            case 'f':
                out += '\f';
                break;
            case 'u':
            {
                if (i + 5 > end)
                    return std::nullopt;
                auto code = parse_hex4(raw, i + 1);
                if (!code)
                    return std::nullopt;
                i += 4;
                unsigned cp = *code;
                if (cp >= 0xD800 && cp <= 0xDBFF)
                {
                    // High surrogate: a \uDC00-\uDFFF low half must follow.
                    if (i + 7 > end || raw[i + 1] != '\\' || raw[i + 2] != 'u')
                        return std::nullopt;
                    auto low = parse_hex4(raw, i + 3);
                    if (!low || *low < 0xDC00 || *low > 0xDFFF)
                        return std::nullopt;
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (*low - 0xDC00);
                    i += 6;
                }
                else if (cp >= 0xDC00 && cp <= 0xDFFF)
                {
                    return std::nullopt;
                }
                append_utf8(out, cp);
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return out;
}

// Top-level members of a JSON object as key -> raw value text.
std::optional<std::map<std::string, std::string>> parse_object(const std::string& json)
{
    std::map<std::string, std::string> members;

    size_t pos = skip_ws(json, 0);
    if (pos >= json.size() || json[pos] != '{')
        return std::nullopt;
    pos = skip_ws(json, pos + 1);
    if (pos < json.size() && json[pos] == '}')
        return members;

    while (pos < json.size())
    {
        if (json[pos] != '"')
            return std::nullopt;
        size_t key_end = skip_string(json, pos);
        if (key_end == std::string::npos)
            return std::nullopt;
        auto key = unescape_string(json.substr(pos, key_end - pos));
        if (!key)
            return std::nullopt;

        pos = skip_ws(json, key_end);
        if (pos >= json.size() || json[pos] != ':')
            return std::nullopt;
        pos = skip_ws(json, pos + 1);

        size_t value_end = skip_value(json, pos);
        if (value_end == std::string::npos || value_end == pos)
            return std::nullopt;
        members[*key] = json.substr(pos, value_end - pos);

        pos = skip_ws(json, value_end);
        if (pos < json.size() && json[pos] == ',')
        {
            pos = skip_ws(json, pos + 1);
            continue;
        }
        if (pos < json.size() && json[pos] == '}')
            return members;
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<double> parse_number(const std::string& raw)
{
    if (raw.empty())
        return std::nullopt;
    char*  end = nullptr;
    double v   = std::strtod(raw.c_str(), &end);
    if (end != raw.c_str() + raw.size())
        return std::nullopt;
    // JSON has no nan/inf literals; strtod accepts them and overflows to inf.
    if (!std::isfinite(v))
        return std::nullopt;
    return v;
}

// Every non-integer field of the document is a float.
std::optional<float> parse_float(const std::string& raw)
{
    auto v = parse_number(raw);
    if (!v)
        return std::nullopt;
    const float f = static_cast<float>(*v);
    if (!std::isfinite(f))
        return std::nullopt;
    return f;
}

std::optional<int> parse_int(const std::string& raw)
{
    auto v = parse_number(raw);
    if (!v || *v < static_cast<double>(INT_MIN) || *v > static_cast<double>(INT_MAX)
        || *v != std::trunc(*v))
        return std::nullopt;
    return static_cast<int>(*v);
}

std::optional<bool> parse_bool(const std::string& raw)
{
    if (raw == "true")
        return true;
    if (raw == "false")
        return false;
    return std::nullopt;
}

// Elements of a JSON array as raw value texts.
std::optional<std::vector<std::string>> parse_array(const std::string& raw)
{
    if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']')
        return std::nullopt;

    std::vector<std::string> items;
    size_t                   pos = skip_ws(raw, 1);
    const size_t             end = raw.size() - 1;
    if (pos == end)
        return items;

    while (pos < end)
    {
        size_t value_end = skip_value(raw, pos);
        if (value_end == std::string::npos || value_end > end || value_end == pos)
            return std::nullopt;
        items.push_back(raw.substr(pos, value_end - pos));
        pos = skip_ws(raw, value_end);
        if (pos < end && raw[pos] == ',')
            pos = skip_ws(raw, pos + 1);
        else if (pos != end)
            return std::nullopt;
    }
    return items;
}

std::optional<std::vector<float>> parse_float_array(const std::string& raw, size_t count)
{
    auto items = parse_array(raw);
    if (!items || items->size() != count)
        return std::nullopt;
    std::vector<float> out;
    for (const auto& item : *items)
    {
        auto v = parse_float(item);
        if (!v)
            return std::nullopt;
        out.push_back(*v);
    }
    return out;
}

std::optional<Color> parse_color(const std::string& raw)
{
    auto v = parse_float_array(raw, 4);
    if (!v)
        return std::nullopt;
    return Color((*v)[0], (*v)[1], (*v)[2], (*v)[3]);
}

std::optional<Point> parse_point(const std::string& raw)
{
    auto v = parse_float_array(raw, 2);
    if (!v)
        return std::nullopt;
    return Point{(*v)[0], (*v)[1]};
}

std::optional<LinearGradient> parse_gradient(const std::string& raw)
{
    auto members = parse_object(raw);
    if (!members)
        return std::nullopt;

    LinearGradient gradient;
    if (auto it = members->find("begin"); it != members->end())
    {
        auto p = parse_point(it->second);
        if (!p)
            return std::nullopt;
        gradient.begin = *p;
    }
    if (auto it = members->find("end"); it != members->end())
    {
        auto p = parse_point(it->second);
        if (!p)
            return std::nullopt;
        gradient.end = *p;
    }

    auto it = members->find("stops");
    if (it == members->end())
        return std::nullopt;
    auto stops = parse_array(it->second);
    if (!stops)
        return std::nullopt;
    for (const auto& raw_stop : *stops)
    {
        auto v = parse_float_array(raw_stop, 5);
        if (!v)
            return std::nullopt;
        gradient.stops.push_back({(*v)[0], Color((*v)[1], (*v)[2], (*v)[3], (*v)[4])});
    }
    return gradient;
}

// Reads members[key] into `field` with `parse` when present. Returns false
// only when the key is present and malformed.
template <typename T, typename Parser>
bool read_field(const std::map<std::string, std::string>& members,
                const char*                               key,
                T&                                        field,
                Parser                                    parse)
{
    auto it = members.find(key);
    if (it == members.end())
        return true;
    auto value = parse(it->second);
    if (!value)
    {
        SPARKLINE_LOG_WARN(kCategory, "malformed value for '{}': {}", key, it->second);
        return false;
    }
    field = static_cast<T>(*value);
    return true;
}

// Same as read_field for optional fields; null clears the field.
template <typename T, typename Parser>
bool read_optional_field(const std::map<std::string, std::string>& members,
                         const char*                               key,
                         std::optional<T>&                         field,
                         Parser                                    parse)
{
    auto it = members.find(key);
    if (it == members.end())
        return true;
    if (it->second == "null")
    {
        field.reset();
        return true;
    }
    auto value = parse(it->second);
    if (!value)
    {
        SPARKLINE_LOG_WARN(kCategory, "malformed value for '{}': {}", key, it->second);
        return false;
    }
    field = static_cast<T>(*value);
    return true;
}

template <typename T>
std::string optional_to_json(const std::optional<T>& v)
{
    return v ? number_to_json(*v) : std::string("null");
}

}   // anonymous namespace

std::string serialize_style(const SparklineStyle& s)
{
    std::ostringstream os;
    auto               flag = [](bool b) { return b ? "true" : "false"; };

    os << "{\n";
    os << "  \"version\": " << kVersion << ",\n";
    os << "  \"line_width\": " << number_to_json(s.line_width) << ",\n";
    os << "  \"line_color\": " << color_to_json(s.line_color) << ",\n";
    os << "  \"line_gradient\": " << gradient_to_json(s.line_gradient) << ",\n";
    os << "  \"sharp_corners\": " << flag(s.sharp_corners) << ",\n";
    os << "  \"cubic_smoothing\": " << flag(s.cubic_smoothing) << ",\n";
    os << "  \"cubic_smoothing_factor\": " << number_to_json(s.cubic_smoothing_factor) << ",\n";
    os << "  \"fill_mode\": " << escape_json_string(fill_mode_name(s.fill_mode)) << ",\n";
    os << "  \"fill_color\": " << color_to_json(s.fill_color) << ",\n";
    os << "  \"fill_gradient\": " << gradient_to_json(s.fill_gradient) << ",\n";
    os << "  \"points_mode\": " << escape_json_string(points_mode_name(s.points_mode)) << ",\n";
    os << "  \"point_size\": " << optional_to_json(s.point_size) << ",\n";
    os << "  \"point_color\": " << (s.point_color ? color_to_json(*s.point_color) : "null")
       << ",\n";
    os << "  \"grid_lines\": " << flag(s.grid_lines) << ",\n";
    os << "  \"grid_line_color\": " << color_to_json(s.grid_line_color) << ",\n";
    os << "  \"grid_line_amount\": " << s.grid_line_amount << ",\n";
    os << "  \"grid_line_width\": " << number_to_json(s.grid_line_width) << ",\n";
    os << "  \"grid_label_color\": " << color_to_json(s.grid_label_color) << ",\n";
    os << "  \"grid_label_prefix\": " << escape_json_string(s.grid_label_prefix) << ",\n";
    os << "  \"grid_label_font_size\": " << number_to_json(s.grid_label_font_size) << ",\n";
    os << "  \"min\": " << optional_to_json(s.min) << ",\n";
    os << "  \"max\": " << optional_to_json(s.max) << ",\n";
    os << "  \"fallback_width\": " << number_to_json(s.fallback_width) << ",\n";
    os << "  \"fallback_height\": " << number_to_json(s.fallback_height) << "\n";
    os << "}\n";
    return os.str();
}

bool deserialize_style(const std::string& json, SparklineStyle& out)
{
    auto members = parse_object(json);
    if (!members)
    {
        SPARKLINE_LOG_WARN(kCategory, "style document is not a JSON object");
        return false;
    }

    if (auto it = members->find("version"); it != members->end())
    {
        auto v = parse_number(it->second);
        if (!v || *v > kVersion)
        {
            SPARKLINE_LOG_WARN(kCategory, "unsupported style version {}", it->second);
            return false;
        }
    }

    auto gradient = [](const std::string& raw) { return parse_gradient(raw); };
    auto fill_mode = [](const std::string& raw) -> std::optional<FillMode>
    {
        auto name = unescape_string(raw);
        return name ? parse_fill_mode(*name) : std::nullopt;
    };
    auto points_mode = [](const std::string& raw) -> std::optional<PointsMode>
    {
        auto name = unescape_string(raw);
        return name ? parse_points_mode(*name) : std::nullopt;
    };

    SparklineStyle s  = out;
    const auto&    m  = *members;
    bool           ok = true;
    ok = ok && read_field(m, "line_width", s.line_width, parse_float);
    ok = ok && read_field(m, "line_color", s.line_color, parse_color);
    ok = ok && read_optional_field(m, "line_gradient", s.line_gradient, gradient);
    ok = ok && read_field(m, "sharp_corners", s.sharp_corners, parse_bool);
    ok = ok && read_field(m, "cubic_smoothing", s.cubic_smoothing, parse_bool);
    ok = ok && read_field(m, "cubic_smoothing_factor", s.cubic_smoothing_factor, parse_float);
    ok = ok && read_field(m, "fill_mode", s.fill_mode, fill_mode);
    ok = ok && read_field(m, "fill_color", s.fill_color, parse_color);
    ok = ok && read_optional_field(m, "fill_gradient", s.fill_gradient, gradient);
    ok = ok && read_field(m, "points_mode", s.points_mode, points_mode);
    ok = ok && read_optional_field(m, "point_size", s.point_size, parse_float);
    ok = ok && read_optional_field(m, "point_color", s.point_color, parse_color);
    ok = ok && read_field(m, "grid_lines", s.grid_lines, parse_bool);
    ok = ok && read_field(m, "grid_line_color", s.grid_line_color, parse_color);
    ok = ok && read_field(m, "grid_line_amount", s.grid_line_amount, parse_int);
    ok = ok && read_field(m, "grid_line_width", s.grid_line_width, parse_float);
    ok = ok && read_field(m, "grid_label_color", s.grid_label_color, parse_color);
    ok = ok && read_field(m, "grid_label_prefix", s.grid_label_prefix, unescape_string);
    ok = ok && read_field(m, "grid_label_font_size", s.grid_label_font_size, parse_float);
    ok = ok && read_optional_field(m, "min", s.min, parse_float);
    ok = ok && read_optional_field(m, "max", s.max, parse_float);
    ok = ok && read_field(m, "fallback_width", s.fallback_width, parse_float);
    ok = ok && read_field(m, "fallback_height", s.fallback_height, parse_float);
    if (!ok)
        return false;

    out = std::move(s);
    return true;
}

bool save_style(const std::string& path, const SparklineStyle& style)
{
    std::ofstream f(path);
    if (!f.is_open())
    {
        SPARKLINE_LOG_ERROR(kCategory, "cannot open '{}' for writing", path);
        return false;
    }
    f << serialize_style(style);
    return f.good();
}

bool load_style(const std::string& path, SparklineStyle& out)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        SPARKLINE_LOG_ERROR(kCategory, "cannot open '{}'", path);
        return false;
    }

    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (json.empty())
    {
        SPARKLINE_LOG_WARN(kCategory, "'{}' is empty", path);
        return false;
    }
    return deserialize_style(json, out);
}

}   // namespace sparkline
