#ifndef PARADOX_DATA_SOURCE_POSITION_HPP
#define PARADOX_DATA_SOURCE_POSITION_HPP

#include <compare>
#include <string_view>

#include "common/assert.hpp"
#include "common/config.hpp"

namespace paradox_data {

/// @brief Represents a position in a source file.
/// Lines and columns are zero-based; they are only converted to one-based numbers when printed.
struct Local_Source_Position {
    /// Line number.
    Size line;
    /// Column number.
    Size column;
    /// First index in the source file that is part of the syntactical element.
    Size begin;

    [[nodiscard]] friend constexpr auto operator<=>(Local_Source_Position, Local_Source_Position)
        = default;

    [[nodiscard]] constexpr Local_Source_Position to_right(Size offset) const
    {
        return { .line = line, .column = column + offset, .begin = begin + offset };
    }
};

/// @brief Represents a range of characters in a source file that lies on a single line,
/// or starts on a line in case of multi-line elements.
struct Local_Source_Span : Local_Source_Position {
    Size length;

    [[nodiscard]] friend constexpr auto operator<=>(Local_Source_Span, Local_Source_Span) = default;

    /// @brief Returns a span with the same properties except that the length is `l`.
    [[nodiscard]] constexpr Local_Source_Span with_length(Size l) const
    {
        return { Local_Source_Position { *this }, l };
    }

    [[nodiscard]] constexpr bool empty() const
    {
        return length == 0;
    }

    /// @brief Returns the one-past-the-end position in the source.
    [[nodiscard]] constexpr Size end() const
    {
        return begin + length;
    }
};

/// @brief Represents the location of a file, combined with the position within that file.
struct Source_Position : Local_Source_Position {
    /// File name.
    std::string_view file_name;

    [[nodiscard]] constexpr Source_Position(Local_Source_Position local, std::string_view file)
        : Local_Source_Position(local)
        , file_name(file)
    {
    }

    [[nodiscard]] friend constexpr auto operator<=>(Source_Position, Source_Position) = default;
};

} // namespace paradox_data

#endif
