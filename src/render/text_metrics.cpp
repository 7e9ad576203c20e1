#include <cstddef>
#include <sparkline/canvas.hpp>

namespace sparkline
{

namespace
{

constexpr float kGlyphAdvanceEm = 0.6f;
constexpr float kLineHeightEm   = 1.2f;

// Counts UTF-8 code points so a multi-byte prefix (e.g. a currency sign)
// measures as a single glyph.
size_t glyph_count(std::string_view text)
{
    size_t count = 0;
    for (unsigned char ch : text)
    {
        if ((ch & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

}   // anonymous namespace

TextLayout fixed_advance_layout(std::string_view text, const TextStyle& style)
{
    TextLayout layout;
    layout.text   = std::string(text);
    layout.style  = style;
    layout.width  = static_cast<float>(glyph_count(text)) * style.font_size * kGlyphAdvanceEm;
    layout.height = style.font_size * kLineHeightEm;
    return layout;
}

}   // namespace sparkline
