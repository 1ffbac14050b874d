/**
 * @file Loader.hpp
 * @brief Loading expected/actual documents and rule files from disk
 *
 * Supported formats, selected by extension:
 * - .json: nlohmann::json
 * - .toml: toml++
 * - anything else: read as text and converted with to_value()
 *   (JSON if it parses, a raw string leaf otherwise)
 */

#ifndef JSONEXPECT_LOADER_HPP
#define JSONEXPECT_LOADER_HPP

#include "jsonexpect/Value.hpp"

#include <string>

namespace jsonexpect {

/**
 * @brief Load a JSON file
 *
 * @param path Path to the JSON file
 * @return Parsed Value, object keys in document order
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file
 *
 * Tables map to nested objects, arrays of tables to arrays of objects.
 *
 * @param path Path to the TOML file
 * @return Parsed Value
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid (with line/column)
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, detecting the format by extension
 *
 * @param path Path to the document
 * @return Parsed Value
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError for .json/.toml syntax errors
 */
Value load_document(const std::string& path);

/**
 * @brief Get file extension (lowercase)
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace jsonexpect

#endif // JSONEXPECT_LOADER_HPP
