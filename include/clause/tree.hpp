#pragma once

#include "element.hpp"

#include <filesystem>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace clause {

    // Structurally malformed element tree: bad JSON, an unknown statement or
    // expression kind, or a qualified_path used twice.
    class tree_error : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    inline constexpr int tree_schema_version = 1;

    /*
     * Reads `{schema_version, elements, bodies}`. Element kinds go through the schema
     * registry, so an unknown kind raises schema_lookup_error; every other defect
     * raises tree_error.
     */
    element_tree load_tree(std::string_view json);
    element_tree load_tree_file(const std::filesystem::path& path);

    // Pre-order walk of every element; throws tree_error on a repeated qualified_path.
    std::vector<const element*> flatten(const element_tree& tree);

}  // namespace clause
