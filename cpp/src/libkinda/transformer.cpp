#include "libkinda/transformer.hpp"

#include "libkinda/construct_detector.hpp"
#include "libkinda/errors.hpp"
#include "libkinda/source_scanner.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <stdexcept>
#include <utility>

namespace libkinda {

namespace {

constexpr std::string_view kItemGuard = "maybe_for_item_execute";

struct InputLine {
    std::string_view text;
    std::string_view eol;
};

struct OutputLine {
    std::string text;
    std::string eol;
    std::size_t original;
};

struct RewrittenLine {
    std::optional<std::string> setup;  // statement emitted before the line at the same indentation
    std::string text;
    bool opens_maybe_for = false;
    std::optional<std::string> inline_body;
};

// Indentation added to the body of a ~maybe_for block.
struct GuardedBlock {
    std::size_t header_width;
    std::string unit;
};

struct PendingGuard {
    std::size_t line;
    std::string header_ws;
    std::string text;
};

[[nodiscard]] std::vector<InputLine> split_lines(std::string_view source) {
    std::vector<InputLine> lines;
    std::size_t pos = 0;
    while (pos < source.size()) {
        std::size_t newline = source.find('\n', pos);
        if (newline == std::string_view::npos) {
            lines.push_back({source.substr(pos), {}});
            break;
        }
        std::size_t end = newline;
        if (end > pos && source[end - 1] == '\r') {
            --end;
        }
        lines.push_back({source.substr(pos, end - pos), source.substr(end, newline + 1 - end)});
        pos = newline + 1;
    }
    return lines;
}

[[nodiscard]] std::string quote_literal(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
    return out;
}

[[nodiscard]] bool is_coding_comment(std::string_view body) {
    return body.substr(0, 7) == "# -*- c" || body.substr(0, 8) == "# coding";
}

[[nodiscard]] bool opens_string_literal(std::string_view body) {
    std::size_t prefix = 0;
    while (prefix < body.size() && prefix < 2 && std::string_view("rRuUbB").find(body[prefix]) != std::string_view::npos) {
        ++prefix;
    }
    return prefix < body.size() && (body[prefix] == '"' || body[prefix] == '\'');
}

// Index after the shebang, encoding comment, module docstring and __future__ imports.
[[nodiscard]] std::size_t header_position(const std::vector<OutputLine>& out) {
    std::size_t at = 0;
    std::size_t i = 0;
    bool statement_seen = false;
    if (!out.empty() && out.front().text.substr(0, 2) == "#!") {
        at = i = 1;
    }
    while (i < out.size()) {
        std::string_view body = trim(out[i].text);
        if (body.empty() || body.front() == '#') {
            ++i;
            if (is_coding_comment(body)) {
                at = i;
            }
            continue;
        }
        if (body.substr(0, 22) == "from __future__ import") {
            statement_seen = true;
            at = ++i;
            continue;
        }
        if (statement_seen || !opens_string_literal(body)) {
            break;
        }
        statement_seen = true;
        QuoteState quote;
        (void)classify_line(out[i].text, quote);
        while (quote.in_string() && i + 1 < out.size()) {
            (void)classify_line(out[++i].text, quote);
        }
        at = ++i;
    }
    return at;
}

class LineRewriter {
public:
    LineRewriter(const TransformOptions& options, std::set<std::string>& helpers)
        : options_(options), helpers_(helpers) {}

    RewrittenLine rewrite_statement(std::string_view text, std::size_t number) {
        SourceLine source{number, text};
        std::string_view indent = leading_whitespace(text);
        auto mask = classify_line(text);

        std::size_t code_end = comment_start(mask).value_or(text.size());
        while (code_end > indent.size() && (text[code_end - 1] == ' ' || text[code_end - 1] == '\t')) {
            --code_end;
        }
        std::string_view statement = text.substr(indent.size(), code_end - indent.size());
        std::string tail(text.substr(code_end));
        std::size_t column = indent.size();
        std::string lead(indent);

        StatementNode node = classify_statement(statement, source, column);
        if (!std::holds_alternative<PlainStatement>(node) && !brackets_balanced(statement, classify_line(statement))) {
            throw TransformError("fuzzy statements must keep their brackets on one line", number, column + 1,
                                 std::string(text));
        }
        RewrittenLine out;

        if (const auto* loop = std::get_if<LoopConstruct>(&node)) {
            std::string expression = rewrite_inline(loop->expression, {}, source, column);
            std::string trailing = rewrite_inline(loop->trailing, {}, source, column);
            switch (loop->kind) {
                case LoopKind::SometimesWhile:
                case LoopKind::EventuallyUntil: {
                    // Each entry into the loop gets its own state object.
                    std::string handle = "_kinda_loop_" + std::to_string(number);
                    std::string factory = loop->kind == LoopKind::SometimesWhile ? "sometimes_while_loop"
                                                                                : "eventually_until_loop";
                    out.setup = lead + handle + " = " + use(factory) + "(" + site(number) + ")";
                    out.text = lead + "while " + handle + ".check(" + expression + "):" + trailing;
                    break;
                }
                case LoopKind::KindaRepeat:
                    out.text = lead + "for _ in range(" + use("kinda_repeat_count") + "(" + expression + ")):" + trailing;
                    break;
                case LoopKind::MaybeFor:
                    use(std::string(kItemGuard));
                    out.text = lead + "for " + loop->target + " in " + expression + ":";
                    out.opens_maybe_for = true;
                    if (!trim(trailing).empty()) {
                        out.inline_body = trailing;
                    } else {
                        out.text += trailing;
                    }
                    break;
            }
        } else if (const auto* gate = std::get_if<ConditionalGate>(&node)) {
            std::string condition = rewrite_inline(gate->condition, {}, source, column);
            std::string trailing = rewrite_inline(gate->trailing, {}, source, column);
            out.text = lead + gate->keyword + " " + use(to_string(gate->tier)) + "(" + condition + "):" + trailing;
        } else if (const auto* declaration = std::get_if<FuzzyDeclaration>(&node)) {
            std::string call = "kinda_" + to_string(declaration->type);
            std::string argument = declaration->type == FuzzyType::Binary
                                       ? std::string()
                                       : rewrite_inline(declaration->expression, {}, source, column);
            out.text = lead + declaration->name + " = " + use(call) + "(" + argument + ")";
        } else if (const auto* reassignment = std::get_if<FuzzyReassignment>(&node)) {
            std::string expression = rewrite_inline(reassignment->expression, {}, source, column);
            out.text = lead + reassignment->name + " = " + use("fuzzy_assign") + "('" + reassignment->name + "', " +
                       expression + ")";
        } else if (const auto* sorta = std::get_if<SortaPrint>(&node)) {
            out.text = lead + use("sorta_print") + "(" + rewrite_inline(sorta->arguments, {}, source, column) + ")";
        } else if (const auto* assertion = std::get_if<StatisticalAssertion>(&node)) {
            out.text = lead + use(to_string(assertion->kind)) + "(lambda: " +
                       rewrite_inline(assertion->subject, {}, source, column);
            if (!assertion->arguments.empty()) {
                out.text += ", " + rewrite_inline(assertion->arguments, {}, source, column);
            }
            out.text += ")";
        } else if (const auto* tolerance = std::get_if<ToleranceAssignment>(&node)) {
            std::string call = options_.use_composition ? "ish_value_composed" : "ish_value";
            out.text = lead + tolerance->variable + " = " + use(call) + "(" + tolerance->variable;
            if (tolerance->target) {
                out.text += ", " + rewrite_inline(*tolerance->target, {}, source, column);
            }
            out.text += ")";
        } else {
            out.text = lead + rewrite_inline(statement, {}, source, column);
        }
        out.text += tail;
        return out;
    }

    std::string rewrite_inline(std::string_view text, QuoteState start, const SourceLine& source, std::size_t column) {
        std::string current(text);
        while (true) {
            QuoteState state = start;
            auto mask = classify_line(current, state);
            auto node = find_inline_marker(current, mask, source, column);
            if (!node) {
                break;
            }
            std::size_t begin = 0;
            std::size_t end = 0;
            std::string replacement;
            if (const auto* gate = std::get_if<InlineGate>(&*node)) {
                begin = gate->begin;
                end = gate->end;
                replacement = use(to_string(gate->tier)) + "(" + gate->argument + ")";
            } else if (const auto* comparison = std::get_if<ToleranceComparison>(&*node)) {
                begin = comparison->begin;
                end = comparison->end;
                std::string call = options_.use_composition ? "ish_comparison_composed" : "ish_comparison";
                replacement = use(call) + "(" + comparison->left + ", " + comparison->right + ")";
            } else if (const auto* welp = std::get_if<WelpFallback>(&*node)) {
                begin = welp->begin;
                end = welp->end;
                replacement = use("welp_fallback") + "(lambda: " + welp->primary + ", " + welp->fallback + ")";
            } else {
                const auto& value = std::get<ToleranceValue>(*node);
                begin = value.begin;
                end = value.end;
                replacement = use("ish_value") + "(" + value.operand + ")";
            }
            current.replace(begin, end - begin, replacement);
        }
        return current;
    }

private:
    std::string use(std::string name) {
        helpers_.insert(name);
        return name;
    }

    [[nodiscard]] std::string site(std::size_t number) const {
        return quote_literal(options_.source_name + ":" + std::to_string(number));
    }

    const TransformOptions& options_;
    std::set<std::string>& helpers_;
};

}  // namespace

Transformer::Transformer(TransformOptions options)
    : options_(std::move(options)) {
    if (options_.runtime_module.empty()) {
        throw std::invalid_argument("runtime module name must be non-empty");
    }
    if (options_.indent_unit.empty() || !trim(options_.indent_unit).empty()) {
        throw std::invalid_argument("indent unit must be non-empty whitespace");
    }
}

TransformResult Transformer::transform(std::string_view source) const {
    auto lines = split_lines(source);
    std::set<std::string> helpers;
    LineRewriter rewriter(options_, helpers);
    std::vector<OutputLine> out;
    out.reserve(lines.size());

    QuoteState quote;
    int carried_depth = 0;
    bool backslash = false;
    std::vector<GuardedBlock> blocks;
    std::optional<PendingGuard> pending;

    auto prefix = [&blocks]() {
        std::string text;
        for (const auto& block : blocks) {
            text += block.unit;
        }
        return text;
    };

    for (std::size_t i = 0; i < lines.size(); ++i) {
        std::string_view text = lines[i].text;
        std::string eol(lines[i].eol);
        std::size_t number = i + 1;
        if (text.size() > options_.max_line_length) {
            throw TransformError("line exceeds " + std::to_string(options_.max_line_length) + " characters",
                                 number, options_.max_line_length + 1, std::string(text.substr(0, 80)));
        }

        QuoteState start = quote;
        auto mask = classify_line(text, quote);
        bool starts_in_string = start.in_string();
        bool continuation = starts_in_string || carried_depth > 0 || backslash;
        carried_depth = std::max(0, carried_depth + net_bracket_depth(text, mask));
        backslash = !text.empty() && text.back() == '\\' && is_code(mask, text.size() - 1);

        std::string_view body = trim(text);
        bool blank = body.empty() || mask[leading_whitespace(text).size()] == CharClass::Comment;

        if (!continuation && !blank) {
            std::string_view ws = leading_whitespace(text);
            while (!blocks.empty() && ws.size() <= blocks.back().header_width) {
                blocks.pop_back();
            }
            if (pending) {
                if (ws.size() <= pending->header_ws.size()) {
                    throw TransformError("expected an indented block after ~maybe_for", pending->line,
                                         pending->header_ws.size() + 1, pending->text);
                }
                if (ws.substr(0, pending->header_ws.size()) != pending->header_ws) {
                    throw TransformError("inconsistent indentation in ~maybe_for body", number, 1, std::string(text));
                }
                out.push_back({prefix() + std::string(ws) + "if " + std::string(kItemGuard) + "():", eol, 0});
                blocks.push_back({pending->header_ws.size(), std::string(ws.substr(pending->header_ws.size()))});
                pending.reset();
            }
        }

        if (blank) {
            out.push_back({body.empty() ? std::string(text) : prefix() + std::string(text), eol, number});
            continue;
        }
        if (continuation) {
            std::string rewritten = rewriter.rewrite_inline(text, start, SourceLine{number, text}, 0);
            out.push_back({starts_in_string ? rewritten : prefix() + rewritten, eol, number});
            continue;
        }

        RewrittenLine rewritten = rewriter.rewrite_statement(text, number);
        if (rewritten.setup) {
            out.push_back({prefix() + *rewritten.setup, eol.empty() ? std::string("\n") : eol, number});
        }
        out.push_back({prefix() + rewritten.text, eol, number});
        if (rewritten.opens_maybe_for) {
            std::string header_ws(leading_whitespace(text));
            if (rewritten.inline_body) {
                out.back().eol = eol.empty() ? "\n" : eol;
                out.push_back({prefix() + header_ws + options_.indent_unit + "if " + std::string(kItemGuard) +
                                   "():" + *rewritten.inline_body,
                               eol, 0});
            } else {
                pending = PendingGuard{number, header_ws, std::string(text)};
            }
        }
    }

    if (pending) {
        throw TransformError("expected an indented block after ~maybe_for", pending->line,
                             pending->header_ws.size() + 1, pending->text);
    }

    TransformResult result;
    result.helpers.assign(helpers.begin(), helpers.end());
    if (options_.emit_import_header && !helpers.empty()) {
        std::string header = "from " + options_.runtime_module + " import ";
        for (std::size_t i = 0; i < result.helpers.size(); ++i) {
            header += (i == 0 ? "" : ", ") + result.helpers[i];
        }
        std::size_t at = header_position(out);
        std::string eol = out.empty() || out.front().eol.empty() ? std::string("\n") : out.front().eol;
        out.insert(out.begin() + static_cast<std::ptrdiff_t>(at), OutputLine{header, eol, 0});
    }

    for (const auto& line : out) {
        result.text += line.text;
        result.text += line.eol;
        result.source_map.append(line.original);
    }
    return result;
}

}  // namespace libkinda
