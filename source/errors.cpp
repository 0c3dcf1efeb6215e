// errors.cpp - Exception types

#include <semdiff/errors.h>

namespace semdiff {

namespace {

std::string describe_construct(std::string_view construct, int line, int column)
{
    std::string msg = "YAML construct '" + std::string(construct) + "' is not supported";
    if (line > 0) {
        msg += " (line " + std::to_string(line) + ", column " + std::to_string(column) + ")";
    }
    return msg;
}

std::string join_summary(const std::string& summary, const std::string& diff)
{
    if (summary.empty()) return diff;
    return summary + "\n" + diff;
}

} // anonymous namespace

TypeMismatchError::TypeMismatchError(std::string_view expected_type, std::string_view actual_type)
    : std::runtime_error("Type mismatch: expected " + std::string(expected_type) +
                         ", got " + std::string(actual_type))
    , expected_type_(expected_type)
    , actual_type_(actual_type)
{
}

UnsupportedConstructError::UnsupportedConstructError(std::string_view construct, int line, int column)
    : std::runtime_error(describe_construct(construct, line, column))
    , construct_(construct)
    , line_(line)
    , column_(column)
{
}

YamlParseError::YamlParseError(const std::string& message, int line, int column)
    : std::runtime_error(message)
    , line_(line)
    , column_(column)
{
}

JsonParseError::JsonParseError(const std::string& message, std::size_t position)
    : std::runtime_error(message + " at position " + std::to_string(position))
    , position_(position)
{
}

DiffMismatchError::DiffMismatchError(std::string summary, std::string diff)
    : std::runtime_error(join_summary(summary, diff))
    , summary_(std::move(summary))
    , diff_(std::move(diff))
{
}

} // namespace semdiff
