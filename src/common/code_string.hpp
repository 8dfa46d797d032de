#ifndef PARADOX_DATA_CODE_STRING_HPP
#define PARADOX_DATA_CODE_STRING_HPP

#include <concepts>
#include <string>
#include <string_view>
#include <vector>

#include "common/assert.hpp"
#include "common/code_span_type.hpp"
#include "common/to_chars.hpp"

namespace paradox_data {

struct Code_String_Span {
    Size begin;
    Size length;
    Code_Span_Type type;

    [[nodiscard]] constexpr Size end() const
    {
        return begin + length;
    }
};

/// @brief A string of text where some ranges carry a `Code_Span_Type`.
/// All printing (diagnostics, tree dumps, metrics) first builds a `Code_String`, which is then
/// either printed plainly or with ANSI colors.
struct Code_String {
public:
    using iterator = Code_String_Span*;
    using const_iterator = const Code_String_Span*;

private:
    std::string m_text;
    std::vector<Code_String_Span> m_spans;

public:
    [[nodiscard]] Size get_text_length() const
    {
        return m_text.size();
    }

    [[nodiscard]] Size get_span_count() const
    {
        return m_spans.size();
    }

    [[nodiscard]] std::string_view get_text() const
    {
        return m_text;
    }

    [[nodiscard]] std::string_view get_text(const Code_String_Span& span) const
    {
        return get_text().substr(span.begin, span.length);
    }

    void clear() noexcept
    {
        m_text.clear();
        m_spans.clear();
    }

    /// @brief Appends a raw range of text to the string.
    /// This is typically useful for e.g. whitespace between pieces of code.
    void append(std::string_view text)
    {
        m_text.append(text);
    }

    void append(char c)
    {
        m_text.push_back(c);
    }

    void append(Size amount, char c)
    {
        m_text.append(amount, c);
    }

    void append(std::string_view text, Code_Span_Type type)
    {
        PARADOX_DATA_ASSERT(!text.empty());
        m_spans.push_back({ .begin = m_text.size(), .length = text.size(), .type = type });
        m_text.append(text);
    }

    void append(char c, Code_Span_Type type)
    {
        m_spans.push_back({ .begin = m_text.size(), .length = 1, .type = type });
        m_text.push_back(c);
    }

    template <std::integral T>
    void append_integer(T x, Code_Span_Type type)
    {
        append(to_characters(x).as_string(), type);
    }

    template <std::integral T>
    void append_integer(T x)
    {
        append(to_characters(x).as_string());
    }

    void append_double(double x, Code_Span_Type type)
    {
        append(to_characters(x).as_string(), type);
    }

    struct Scoped_Builder;

    /// @brief Starts building a single code span out of multiple parts which will be fused
    /// together.
    /// For example:
    /// ```
    /// string.build(Code_Span_Type::date)
    ///     .append_integer(year)
    ///     .append('.')
    ///     .append_integer(month);
    /// ```
    /// @param type the type of the appended span as a whole
    Scoped_Builder build(Code_Span_Type type) &;

    [[nodiscard]] iterator begin()
    {
        return m_spans.data();
    }

    [[nodiscard]] iterator end()
    {
        return m_spans.data() + Difference(m_spans.size());
    }

    [[nodiscard]] const_iterator begin() const
    {
        return m_spans.data();
    }

    [[nodiscard]] const_iterator end() const
    {
        return m_spans.data() + Difference(m_spans.size());
    }
};

struct [[nodiscard]] Code_String::Scoped_Builder {
private:
    Code_String& self;
    Size initial_size;
    Code_Span_Type type;

public:
    Scoped_Builder(Code_String& self, Code_Span_Type type)
        : self { self }
        , initial_size { self.m_text.size() }
        , type { type }
    {
    }

    ~Scoped_Builder()
    {
        const Size length = self.m_text.size() - initial_size;
        if (length != 0) {
            self.m_spans.push_back({ .begin = initial_size, .length = length, .type = type });
        }
    }

    Scoped_Builder(const Scoped_Builder&) = delete;
    Scoped_Builder& operator=(const Scoped_Builder&) = delete;

    Scoped_Builder& append(char c)
    {
        self.append(c);
        return *this;
    }

    Scoped_Builder& append(std::string_view text)
    {
        self.append(text);
        return *this;
    }

    template <std::integral T>
    Scoped_Builder& append_integer(T x)
    {
        self.append_integer(x);
        return *this;
    }
};

inline Code_String::Scoped_Builder Code_String::build(Code_Span_Type type) &
{
    return { *this, type };
}

} // namespace paradox_data

#endif
