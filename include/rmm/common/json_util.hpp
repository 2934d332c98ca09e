#pragma once

#include "rmm/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rmm::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t, \b, \f, \uXXXX and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Quote and escape a string as a JSON string literal.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Format a double so that parsing it back yields the identical bit pattern.
[[nodiscard]] std::string json_number(double value);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Raw value text (string with quotes, number, object, array, literal) of a top-level field.
[[nodiscard]] std::optional<std::string> json_get_raw(const std::string &json,
                                                      const std::string &field);

/// Extract a string field value; nullopt when absent or not a string.
[[nodiscard]] std::optional<std::string> json_get_string(const std::string &json,
                                                         const std::string &field);

/// Extract a numeric field value; nullopt when absent, non-numeric or non-finite.
[[nodiscard]] std::optional<double> json_get_double(const std::string &json,
                                                    const std::string &field);

/// Extract an integral field value; nullopt when absent or fractional.
[[nodiscard]] std::optional<std::int64_t> json_get_int(const std::string &json,
                                                       const std::string &field);

[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Split a JSON array into the raw text of its top-level elements.
[[nodiscard]] Result<std::vector<std::string>> json_split_array(const std::string &array_json);

/// Parse a JSON array whose elements are all finite numbers.
[[nodiscard]] Result<std::vector<double>> json_parse_number_array(const std::string &array_json);

/// Parse a JSON array of strings.
[[nodiscard]] Result<std::vector<std::string>>
json_parse_string_array(const std::string &array_json);

} // namespace rmm::common
