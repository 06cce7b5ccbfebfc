#pragma once
/// @file config.hpp
/// @brief Loading server descriptors from an "mcpServers" JSON document

#include "mcphub/client/types.hpp"
#include "mcphub/types.hpp"

#include <filesystem>
#include <vector>

namespace mcphub::config
{

/**
 * Parse descriptors from
 * @code
 * {"mcpServers": {"name": {"command": "node", "args": [...], "env": {...}, "disabled": false}}}
 * @endcode
 * Throws ValidationError on a missing command or mistyped field.
 */
std::vector<client::ServerDescriptor> descriptors_from_json(const Json& document);

/// Read and parse a descriptor file; throws ValidationError if it cannot be read or parsed
std::vector<client::ServerDescriptor> load_descriptors(const std::filesystem::path& path);

} // namespace mcphub::config
