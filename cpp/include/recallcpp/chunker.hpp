#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace recallcpp {

// Splits `text` on whitespace and emits windows of `chunk_size` tokens every chunk_size / 2
// tokens. Trailing windows shorter than chunk_size are emitted on their own. Empty or
// all-whitespace text yields no chunks. Throws InvalidArgumentError when chunk_size <= 1.
[[nodiscard]] std::vector<std::string> ChunkText(std::string_view text, int chunk_size);

[[nodiscard]] std::vector<std::string> TokenizeWhitespace(std::string_view text);

}  // namespace recallcpp
