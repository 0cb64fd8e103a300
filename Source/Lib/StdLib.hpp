/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */

#pragma once

// Headers arranged in alphabetical order
#include <cstddef>
#include <fstream>
#include <istream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stack>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

/** Provides aliases for types from C++ Standard Library */
namespace StdLib {
// Aliases arranged in alphabetical order
using Exception = std::exception;
using IFStream = std::ifstream;
using IStream = std::istream;
using OFStream = std::ofstream;
using OStrStream = std::ostringstream;
using RuntimeError = std::runtime_error;
using String = std::string;

template<class T> using Optional = std::optional<T>;
template<class T> using SharedPtr = std::shared_ptr<T>;
template<class T> using Stack = std::stack<T>;
template<class T> using UniquePtr = std::unique_ptr<T>;
template<class T> using Vector = std::vector<T>;

template<class Key, class T> using Map = std::map<Key, T>;
template<class T1, class T2> using Pair = std::pair<T1, T2>;
template<class... Ts> using Variant = std::variant<Ts...>;
} // namespace StdLib
