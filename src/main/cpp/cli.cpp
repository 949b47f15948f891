#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "shade/util/ansi.hpp"
#include "shade/util/charconv.hpp"
#include "shade/util/io.hpp"
#include "shade/util/result.hpp"
#include "shade/util/severity.hpp"
#include "shade/util/strings.hpp"
#include "shade/util/text_range.hpp"
#include "shade/util/tty.hpp"

#include "shade/analysis.hpp"
#include "shade/diagnostic.hpp"
#include "shade/fwd.hpp"
#include "shade/highlight.hpp"
#include "shade/highlight_tag.hpp"
#include "shade/line_index.hpp"
#include "shade/services.hpp"

namespace shade {
namespace {

enum struct Range_Parse_Error : Default_Underlying {
    /// @brief The range is not of the form `BEGIN:END`.
    format,
    /// @brief `BEGIN` or `END` is not a non-negative integer.
    number,
    /// @brief `BEGIN` is greater than `END`.
    reversed,
};

[[nodiscard]]
std::u8string_view range_parse_error_message(Range_Parse_Error error)
{
    switch (error) {
    case Range_Parse_Error::format: return u8"The range has to be of the form BEGIN:END.";
    case Range_Parse_Error::number: return u8"BEGIN and END have to be byte offsets.";
    case Range_Parse_Error::reversed: return u8"BEGIN cannot be greater than END.";
    }
    return u8"Invalid range.";
}

[[nodiscard]]
Result<Text_Range, Range_Parse_Error> parse_range(std::u8string_view text)
{
    const std::size_t colon = text.find(u8':');
    if (colon == std::u8string_view::npos) {
        return Range_Parse_Error::format;
    }
    const std::optional<std::size_t> begin = from_characters<std::size_t>(text.substr(0, colon));
    const std::optional<std::size_t> end = from_characters<std::size_t>(text.substr(colon + 1));
    if (!begin || !end) {
        return Range_Parse_Error::number;
    }
    if (*begin > *end) {
        return Range_Parse_Error::reversed;
    }
    return Text_Range::from_to(*begin, *end);
}

std::ostream& operator<<(std::ostream& out, std::u8string_view str)
{
    return out << as_string_view(str);
}

[[nodiscard]]
std::u8string_view severity_highlight(Severity severity)
{
    return severity <= Severity::trace    ? ansi::black
        : severity <= Severity::debug        ? ansi::h_black
        : severity <= Severity::info         ? ansi::blue
        : severity <= Severity::soft_warning ? ansi::green
        : severity <= Severity::warning      ? ansi::h_yellow
        : severity <= Severity::error        ? ansi::h_red
        : severity <= Severity::fatal        ? ansi::red
                                             : ansi::magenta;
}

void append_line_col(std::pmr::u8string& out, Line_Col pos)
{
    append_integer(out, pos.line + 1);
    out += u8':';
    append_integer(out, pos.col_utf16 + 1);
}

struct Stderr_Logger final : Logger {
    const std::u8string_view file_name;
    const Line_Index& lines;
    std::pmr::u8string out;
    bool any_errors = false;

    [[nodiscard]]
    Stderr_Logger(
        Severity min_severity,
        std::u8string_view file_name,
        const Line_Index& lines,
        std::pmr::memory_resource* memory
    )
        : Logger { min_severity }
        , file_name { file_name }
        , lines { lines }
        , out { memory }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        any_errors |= diagnostic.severity >= Severity::error;

        const bool colors = is_stderr_tty;
        if (colors) {
            out += severity_highlight(diagnostic.severity);
        }
        out += severity_tag(diagnostic.severity);
        if (colors) {
            out += ansi::reset;
        }
        out += u8": ";
        out += file_name;
        out += u8':';
        append_line_col(out, lines.line_col(diagnostic.location.begin));
        out += u8": ";
        out += diagnostic.message;
        if (colors) {
            out += ansi::h_black;
        }
        out += u8" [";
        out += diagnostic.id;
        out += u8']';
        if (colors) {
            out += ansi::reset;
        }
        out += u8'\n';
        std::cerr << std::u8string_view { out };
        out.clear();
    }
};

void print_ranges(
    std::pmr::u8string& out,
    const Line_Index& lines,
    const std::pmr::vector<Highlighted_Range>& ranges
)
{
    for (const Highlighted_Range& r : ranges) {
        append_line_col(out, lines.line_col(r.range.begin));
        out += u8'-';
        append_line_col(out, lines.line_col(r.range.end()));
        out += u8' ';
        append_highlight_name(out, r.highlight);
        if (r.binding) {
            out += u8" #";
            append_integer(out, *r.binding);
        }
        out += u8'\n';
    }
}

int main(int argc, const char* const* const argv)
{
    static const std::unordered_map<std::string, Severity> severity_arg_map {
        { "min", Severity::min },
        { "trace", Severity::trace },
        { "debug", Severity::debug },
        { "info", Severity::info },
        { "soft_warning", Severity::soft_warning },
        { "warning", Severity::warning },
        { "error", Severity::error },
        { "fatal", Severity::fatal },
        { "none", Severity::none },
    };

    args::ArgumentParser parser { "Semantically highlights Rust source files." };
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;
    args::Positional<std::string> input_arg {
        parser,
        "input",
        "Input Rust file",
        args::Options::Required,
    };
    args::Flag html_arg {
        parser,
        "html",
        "Write HTML instead of a list of highlighted ranges",
        { "html" },
    };
    args::ValueFlag<std::string> range_arg {
        parser,
        "BEGIN:END",
        "Only highlight elements intersecting the given range of byte offsets",
        { "range" },
    };
    args::ValueFlag<std::string> fixture_prefix_arg {
        parser,
        "prefix",
        "Parameter name prefix which marks raw string arguments as embedded source code",
        { "fixture-prefix" },
        "ra_fixture",
    };
    args::ValueFlag<std::size_t> max_depth_arg {
        parser,
        "depth",
        "Maximum nesting depth of embedded source code",
        { "max-injection-depth" },
        8,
    };
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for log messages",
        { 'l', "severity" },
        severity_arg_map,
        Severity::warning,
    };
    args::HelpFlag help_arg {
        parser, "help", "Display this help menu", { 'h', "help" }, args::Options::Global
    };

    if (argc <= 1) {
        parser.Help(std::cout);
        return EXIT_FAILURE;
    }
    if (!parser.ParseCLI(argc, argv) || parser.GetError() != args::Error::None) {
        std::cerr << parser.GetErrorMsg() << '\n';
        return EXIT_FAILURE;
    }
    if (help_arg.Matched()) {
        parser.Help(std::cout);
        return EXIT_SUCCESS;
    }

    std::pmr::unsynchronized_pool_resource memory;

    std::optional<Text_Range> range;
    if (range_arg.Matched()) {
        const Result<Text_Range, Range_Parse_Error> parsed
            = parse_range(as_u8string_view(range_arg.Get()));
        if (!parsed) {
            std::cerr << range_parse_error_message(parsed.error()) << '\n';
            return EXIT_FAILURE;
        }
        range = *parsed;
    }

    const std::string in_path = input_arg.Get();
    const std::u8string_view in_path_u8 = as_u8string_view(in_path);
    const Result<std::pmr::vector<char8_t>, IO_Error_Code> in_text
        = load_utf8_file(in_path_u8, &memory);
    if (!in_text) {
        std::cerr << in_path_u8 << ": " << io_error_code_message(in_text.error()) << '\n';
        return EXIT_FAILURE;
    }
    const std::u8string_view in_source = as_u8string_view(*in_text);

    const Line_Index lines { in_source, &memory };
    Stderr_Logger logger { severity_arg.Get(), in_path_u8, lines, &memory };

    const std::string fixture_prefix = fixture_prefix_arg.Get();
    const Highlight_Options options {
        .fixture_prefix = as_u8string_view(fixture_prefix),
        .max_injection_depth = max_depth_arg.Get(),
        .logger = &logger,
    };

    const Analysis analysis { in_source, &memory, logger };

    if (html_arg.Matched()) {
        std::pmr::vector<char8_t> html { &memory };
        analysis.highlight_as_html(html, options);
        html.push_back(u8'\n');
        std::cout << as_u8string_view(html);
    }
    else {
        std::pmr::vector<Highlighted_Range> ranges { &memory };
        analysis.highlight(ranges, range, options);
        std::pmr::u8string listing { &memory };
        print_ranges(listing, lines, ranges);
        std::cout << std::u8string_view { listing };
    }

    return logger.any_errors ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace
} // namespace shade

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, const char* const* argv)
{
    return shade::main(argc, argv);
}
