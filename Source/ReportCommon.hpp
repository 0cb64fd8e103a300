/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Comparator.hpp"
#include "Errors.hpp"
#include "Lib/StdLib.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

#include <unistd.h>

namespace Report {
using namespace StdLib;

namespace Label {
    static constexpr auto MATCH = "MATCH";
    static constexpr auto DIFFERENT_VALUES = "DIFFERENT VALUES";
    static constexpr auto MISSING_IN_REQUEST = "MISSING IN REQUEST";
    static constexpr auto MISSING_IN_RESPONSE = "MISSING IN RESPONSE";
} // namespace Label

static inline String OutcomeLabel(const Comparison::Outcome outcome) {
    switch (outcome) {
    case Comparison::Outcome::Match:
        return Label::MATCH;
    case Comparison::Outcome::DifferentValues:
        return Label::DIFFERENT_VALUES;
    case Comparison::Outcome::MissingInA:
        return Label::MISSING_IN_REQUEST;
    case Comparison::Outcome::MissingInB:
        return Label::MISSING_IN_RESPONSE;
    }

    return {};
}

static inline fmt::text_style OutcomeStyle(const Comparison::Outcome outcome) {
    switch (outcome) {
    case Comparison::Outcome::Match:
        return fmt::fg(fmt::terminal_color::green);
    case Comparison::Outcome::DifferentValues:
        return fmt::fg(fmt::terminal_color::yellow) | fmt::bg(fmt::terminal_color::black);
    case Comparison::Outcome::MissingInA:
    case Comparison::Outcome::MissingInB:
        return fmt::fg(fmt::terminal_color::red) | fmt::bg(fmt::terminal_color::black);
    }

    return {};
}

/** Color is used only when enabled and the descriptor refers to a terminal */
static inline bool UseColorFor(const bool colorEnabled, const int fileDescriptor) {
    return colorEnabled && ::isatty(fileDescriptor);
}

static inline String Colorize(const String& text, const fmt::text_style& style, const bool useColor) {
    if (!useColor) {
        return text;
    }

    return fmt::format(style, "{}", text);
}

/** FormatParseError - Human readable diagnostic with the offending line and a pointer under the failing column */
static inline String FormatParseError(const Errors::ParseError& error, const bool useColor) {
    const auto errorStyle = fmt::fg(fmt::terminal_color::red);
    const auto headerStyle = fmt::fg(fmt::terminal_color::yellow);
    const auto locationStyle = fmt::fg(fmt::terminal_color::cyan);
    OStrStream diagnostic;
    diagnostic << "\n"
        << Colorize(fmt::format("{} PARSING ERROR:", error.Label()), errorStyle, useColor) << "\n"
        << Colorize(fmt::format("Line {}, Column {}:", error.Line(), error.Column()), headerStyle, useColor) << " " << error.Message() << "\n"
        << "\n"
        << Colorize("Error Location:", locationStyle, useColor) << "\n"
        << fmt::format("{:3d} | {}", error.Line(), error.LineText()) << "\n"
        << "    | " << Colorize(error.Pointer(), errorStyle, useColor) << "\n";
    return diagnostic.str();
}
} // namespace Report
