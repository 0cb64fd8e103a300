/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include "Lib/StdLib.hpp"

namespace Errors {
using namespace StdLib;

/** Base of every error the comparator surfaces to its caller */
class ComparatorError : public RuntimeError {
public:
    explicit ComparatorError(const String& what) : RuntimeError(what) {}
};

/** Malformed input document. Carries where the parser stopped and why */
class ParseError : public ComparatorError {
public:
    ParseError(String label, size_t line, size_t column, String lineText, String message)
      : ComparatorError(label + " parse error at line " + std::to_string(line) + ", column " + std::to_string(column) + ": " + message),
        mLabel(std::move(label)), mLine(line), mColumn(column), mLineText(std::move(lineText)), mMessage(std::move(message)) {}

    const String& Label() const { return mLabel; }
    /** Line - 1-based line of the failure */
    size_t Line() const { return mLine; }
    /** Column - 1-based column of the failure */
    size_t Column() const { return mColumn; }
    /** LineText - The offending line as found in the input, unmodified */
    const String& LineText() const { return mLineText; }
    /** Pointer - (Column - 1) spaces followed by '^' */
    String Pointer() const { return String(mColumn > 0 ? mColumn - 1 : 0, ' ') + "^"; }
    /** Message - The underlying parser's message */
    const String& Message() const { return mMessage; }

private:
    String mLabel;
    size_t mLine;
    size_t mColumn;
    String mLineText;
    String mMessage;
};

/** Unexpected failure while flattening, grouping or classifying well-formed documents */
class ComparisonError : public ComparatorError {
public:
    explicit ComparisonError(const String& reason) : ComparatorError("Unexpected error during comparison: " + reason) {}
};
} // namespace Errors
