#ifndef PARADOX_DATA_SCRIPT_TOKENIZE_HPP
#define PARADOX_DATA_SCRIPT_TOKENIZE_HPP

#include <string_view>
#include <vector>

#include "script/fwd.hpp"
#include "script/tokenization/token.hpp"

namespace paradox_data::script {

/// @brief Appends the tokens of `source` to `out`, followed by exactly one `eof` token.
/// Tokenization never fails; characters which cannot start a token are skipped.
/// @param out the output vector
/// @param source the UTF-8 source text
void tokenize(std::vector<Token>& out, std::string_view source);

/// @brief Equivalent to calling `tokenize(out, source)` with an empty vector.
[[nodiscard]] std::vector<Token> tokenize(std::string_view source);

} // namespace paradox_data::script

#endif
