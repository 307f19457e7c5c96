#pragma once

#include "libkinda/source_map.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace libkinda {

struct TransformOptions {
    bool use_composition = true;           // emit the composed tolerance helpers
    bool emit_import_header = true;
    std::string runtime_module = "_libkinda";
    std::string source_name = "<input>";   // prefix of loop site identifiers
    std::string indent_unit = "    ";      // used for single-line ~maybe_for bodies
    std::size_t max_line_length = 10000;
};

struct TransformResult {
    std::string text;
    SourceMap source_map;
    std::vector<std::string> helpers;  // runtime callables referenced by the output, sorted
};

// Rewrites fuzzy markers in indentation-based source into calls against the runtime module.
// Text outside rewritten spans is preserved byte for byte, including line endings.
class Transformer {
public:
    Transformer() = default;
    explicit Transformer(TransformOptions options);

    [[nodiscard]] TransformResult transform(std::string_view source) const;

    [[nodiscard]] const TransformOptions& options() const noexcept { return options_; }

private:
    TransformOptions options_;
};

}  // namespace libkinda
