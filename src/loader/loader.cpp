#include <cstdint>
#include <limits>
#include <vector>
#include "loader/loader.hpp"
#include "util/util.hpp"

namespace sylva
{
    namespace
    {
        const nlohmann::json &requireField(const nlohmann::json &json, const std::string &field, const std::string &context)
        {
            if (!json.is_object())
            {
                throw ConstructionError(context + " must be a JSON object.");
            }
            auto it = json.find(field);
            if (it == json.end())
            {
                throw ConstructionError(context + " is missing the '" + field + "' field.");
            }
            return *it;
        }

        std::int64_t integerValue(const nlohmann::json &value)
        {
            if (value.is_number_unsigned())
            {
                if (value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
                {
                    throw ConstructionError("Integer value " + value.dump() + " is out of range.");
                }
                return static_cast<std::int64_t>(value.get<std::uint64_t>());
            }
            if (!value.is_number_integer())
            {
                throw ConstructionError("Integer value must be an integral number, got " + value.dump() + ".");
            }
            return value.get<std::int64_t>();
        }

        double floatValue(const nlohmann::json &value)
        {
            if (!value.is_number())
            {
                throw ConstructionError("Float value must be a number, got " + value.dump() + ".");
            }
            return value.get<double>();
        }
    } // namespace

    TreeElement loadTree(const nlohmann::json &json)
    {
        const nlohmann::json &name = requireField(json, "name", "Tree element");
        if (!name.is_string())
        {
            throw ConstructionError("Tree element 'name' must be a string, got " + name.dump() + ".");
        }

        auto children = json.find("children");
        if (children == json.end())
        {
            return Leaf(name.get<std::string>());
        }
        if (!children->is_array())
        {
            throw ConstructionError("Children of '" + name.get<std::string>() + "' must be a JSON array.");
        }

        std::vector<TreeElement> list;
        list.reserve(children->size());
        for (const auto &child : *children)
        {
            list.push_back(loadTree(child));
        }
        return TreeElement(TreeNode(name.get<std::string>(), std::move(list)));
    }

    Expression loadExpression(const nlohmann::json &json)
    {
        const nlohmann::json &typeField = requireField(json, "type", "Expression");
        if (!typeField.is_string())
        {
            throw ConstructionError("Expression 'type' must be a string, got " + typeField.dump() + ".");
        }
        const std::string type = typeField.get<std::string>();

        if (type == "Integer")
            return Integer(integerValue(requireField(json, "value", type)));
        if (type == "Float")
            return Float(floatValue(requireField(json, "value", type)));
        if (type == "Negative")
            return Negative(loadExpression(requireField(json, "operand", type)));

        if (type != "Add" && type != "Subtract" && type != "Multiply" && type != "Divide")
        {
            throw ConstructionError("Unknown expression type '" + type + "'.");
        }

        Expression left = loadExpression(requireField(json, "left", type));
        Expression right = loadExpression(requireField(json, "right", type));

        if (type == "Add")
            return Add(std::move(left), std::move(right));
        if (type == "Subtract")
            return Subtract(std::move(left), std::move(right));
        if (type == "Multiply")
            return Multiply(std::move(left), std::move(right));
        return Divide(std::move(left), std::move(right));
    }

    TreeElement loadTreeFile(const std::string &path)
    {
        return loadTree(nlohmann::json::parse(util::readFileContent(path)));
    }

    Expression loadExpressionFile(const std::string &path)
    {
        return loadExpression(nlohmann::json::parse(util::readFileContent(path)));
    }
} // namespace sylva
