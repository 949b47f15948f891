#ifndef SHADE_HTML_WRITER_HPP
#define SHADE_HTML_WRITER_HPP

#include <cstddef>
#include <memory_resource>
#include <string_view>
#include <vector>

#include "shade/util/assert.hpp"

#include "shade/fwd.hpp"

namespace shade {

/// @brief Appends text to a vector without any processing.
void append(std::pmr::vector<char8_t>& out, std::u8string_view text);

/// @brief Appends text to the vector where characters in `charset`
/// are replaced with their corresponding HTML entities.
/// For example, if `charset` includes `&`, `&amp;` is appended in its stead.
///
/// Currently, `charset` must be a subset of `&`, `<`, `>`, `'`, `"`.
void append_html_escaped(
    std::pmr::vector<char8_t>& out,
    std::u8string_view text,
    std::u8string_view charset
);

/// @brief Returns `true` if `name` is a non-empty sequence of lowercase ASCII letters and digits,
/// starting with a letter.
[[nodiscard]]
bool is_html_tag_name(std::u8string_view name);

struct Attribute_Writer;

/// @brief A class which provides member functions for writing HTML snippets to a vector.
/// This writer only performs checks that are possible without additional memory,
/// such as ensuring that the number of opened tags matches the number of closed tags.
///
/// To correctly use this class, the opening tags must match the closing tags.
struct HTML_Writer {
public:
    friend struct Attribute_Writer;
    using Self = HTML_Writer;
    using char_type = char8_t;
    using string_view_type = std::u8string_view;

private:
    std::pmr::vector<char_type>& m_out;

    std::size_t m_depth = 0;
    bool m_in_attributes = false;

public:
    /// @brief Constructor.
    /// Writes nothing to the vector.
    [[nodiscard]]
    explicit HTML_Writer(std::pmr::vector<char_type>& out) noexcept
        : m_out { out }
    {
    }

    HTML_Writer(const HTML_Writer&) = delete;
    HTML_Writer& operator=(const HTML_Writer&) = delete;

    ~HTML_Writer() = default;

    [[nodiscard]]
    std::pmr::vector<char_type>& get_output() const
    {
        return m_out;
    }

    /// @brief Returns `true` if every opened tag has been closed.
    [[nodiscard]]
    bool is_done() const
    {
        return m_depth == 0 && !m_in_attributes;
    }

    /// @brief Writes an opening tag such as `<div>`.
    Self& open_tag(string_view_type id);

    /// @brief Writes an incomplete opening tag such as `<div`.
    /// Returns an `Attribute_Writer` which must be used to write attributes (if any)
    /// and complete the opening tag.
    [[nodiscard]]
    Attribute_Writer open_tag_with_attributes(string_view_type id);

    /// @brief Writes a closing tag, such as `</div>`.
    /// The most recent unclosed call to `open_tag` or `open_tag_with_attributes`
    /// shall have been made with the same `id`.
    Self& close_tag(string_view_type id);

    /// @brief Writes text between tags.
    /// Text characters such as `<` or `>` which interfere with HTML are converted to entities.
    void write_inner_text(string_view_type text);

private:
    Self& write_attribute(string_view_type key, string_view_type value);
    Self& end_attributes();

    void do_write(char_type);
    void do_write(string_view_type);
};

/// @brief RAII helper class which lets us write attributes more conveniently.
/// This class is not intended to be used directly, but with the help of `HTML_Writer`.
struct Attribute_Writer {
private:
    using string_view_type = HTML_Writer::string_view_type;

    HTML_Writer& m_writer;

public:
    explicit Attribute_Writer(HTML_Writer& writer)
        : m_writer(writer)
    {
        m_writer.m_in_attributes = true;
    }

    Attribute_Writer(const Attribute_Writer&) = delete;
    Attribute_Writer& operator=(const Attribute_Writer&) = delete;

    /// @brief Writes an attribute with a double-quoted value, such as `class="a b"`.
    /// Quotes within `value` are escaped.
    Attribute_Writer& write_attribute(string_view_type key, string_view_type value)
    {
        m_writer.write_attribute(key, value);
        return *this;
    }

    /// @brief Writes `>` and finishes writing attributes.
    /// This function shall be called exactly once prior to destruction of this writer.
    Attribute_Writer& end()
    {
        m_writer.end_attributes();
        return *this;
    }

    ~Attribute_Writer() noexcept(false)
    {
        // This indicates that end() wasn't called.
        SHADE_ASSERT(!m_writer.m_in_attributes);
    }
};

} // namespace shade

#endif
