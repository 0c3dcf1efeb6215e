// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Exception types raised by semdiff.
///
/// All errors derive from std::runtime_error:
/// - TypeMismatchError:          narrowing accessor used on the wrong kind
/// - UnsupportedConstructError:  YAML event the converter cannot map
/// - YamlParseError:             malformed YAML text
/// - JsonParseError:             malformed JSON text
/// - DiffMismatchError:          verify() found a semantic difference

#pragma once

#include "api.h"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace semdiff {

class SEMDIFF_API TypeMismatchError : public std::runtime_error {
public:
    TypeMismatchError(std::string_view expected_type, std::string_view actual_type);

    [[nodiscard]] const std::string& expected_type() const noexcept { return expected_type_; }
    [[nodiscard]] const std::string& actual_type() const noexcept { return actual_type_; }

private:
    std::string expected_type_;
    std::string actual_type_;
};

class SEMDIFF_API UnsupportedConstructError : public std::runtime_error {
public:
    /// @param construct Event type name, e.g. "Alias" or "MappingStart"
    /// @param line 1-based source line, 0 when unknown
    /// @param column 1-based source column, 0 when unknown
    explicit UnsupportedConstructError(std::string_view construct, int line = 0, int column = 0);

    [[nodiscard]] const std::string& construct() const noexcept { return construct_; }
    [[nodiscard]] int line() const noexcept { return line_; }
    [[nodiscard]] int column() const noexcept { return column_; }

private:
    std::string construct_;
    int line_;
    int column_;
};

class SEMDIFF_API YamlParseError : public std::runtime_error {
public:
    YamlParseError(const std::string& message, int line, int column);

    [[nodiscard]] int line() const noexcept { return line_; }
    [[nodiscard]] int column() const noexcept { return column_; }

private:
    int line_;
    int column_;
};

class SEMDIFF_API JsonParseError : public std::runtime_error {
public:
    JsonParseError(const std::string& message, std::size_t position);

    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::size_t position_;
};

class SEMDIFF_API DiffMismatchError : public std::runtime_error {
public:
    /// what() is "<summary>\n<diff>", or just the diff when summary is empty
    DiffMismatchError(std::string summary, std::string diff);

    [[nodiscard]] const std::string& summary() const noexcept { return summary_; }
    [[nodiscard]] const std::string& diff() const noexcept { return diff_; }

private:
    std::string summary_;
    std::string diff_;
};

} // namespace semdiff
