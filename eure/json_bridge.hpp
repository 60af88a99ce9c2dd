#pragma once

#include "document.hpp"
#include "value.hpp"
#include <nlohmann/json.hpp>
#include <expected>
#include <memory>

namespace eure {

/**
 * @brief Lossy projection of a value to JSON
 *
 * Holes become null, tuples become arrays, text loses its language and
 * extensions are dropped. Non-text keys are rendered as strings.
 */
nlohmann::json to_json(const value &v);
nlohmann::json to_json(const document &doc);

/// Objects become maps, with identifier-shaped keys turned into identifier keys
value value_from_json(const nlohmann::json &j);
std::expected<std::shared_ptr<const document>, path_error> document_from_json(const nlohmann::json &j);

} // namespace eure
