#pragma once

#include <string>

namespace frameport {
namespace exporter {

/**
 * Make a node name safe to use as a file name component.
 *
 * Path separators and reserved characters are dropped, whitespace and dash
 * runs collapse to a single '-', and the result is capped at 200 characters.
 * Empty results become "Unnamed".
 *
 *   "Page 1: Overview"     -> "Page-1-Overview"
 *   "Dashboard / Settings" -> "Dashboard-Settings"
 */
std::string sanitize_filename(const std::string& name);

// Node ids contain ':' (e.g. "12:34"), which is not portable in file names
std::string sanitize_node_id(const std::string& id);

} // namespace exporter
} // namespace frameport
