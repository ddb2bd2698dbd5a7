#ifndef SYLVA_LOADER_HPP
#define SYLVA_LOADER_HPP

#include <nlohmann/json.hpp>
#include <string>
#include "model/expression.hpp"
#include "model/tree.hpp"

namespace sylva
{
    /**
     * Builds trees from JSON documents.
     *
     * Generic trees:
     *     {"name": "Scene", "children": [{"name": "Camera"}]}
     * An object without "children" is a leaf.
     *
     * Expressions:
     *     {"type": "Integer", "value": 2}
     *     {"type": "Float", "value": 5.0}
     *     {"type": "Negative", "operand": {...}}
     *     {"type": "Add", "left": {...}, "right": {...}}   (also Subtract, Multiply, Divide)
     *
     * Malformed descriptions raise ConstructionError.
     */
    TreeElement loadTree(const nlohmann::json &json);
    Expression loadExpression(const nlohmann::json &json);

    // Throws nlohmann::json::parse_error when the file is not valid JSON.
    TreeElement loadTreeFile(const std::string &path);
    Expression loadExpressionFile(const std::string &path);
} // namespace sylva

#endif // SYLVA_LOADER_HPP
