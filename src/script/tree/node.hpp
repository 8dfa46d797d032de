#ifndef PARADOX_DATA_SCRIPT_NODE_HPP
#define PARADOX_DATA_SCRIPT_NODE_HPP

#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include "common/config.hpp"

#include "script/fwd.hpp"
#include "script/tree/coerce.hpp"
#include "script/tree/date.hpp"
#include "script/tree/value.hpp"

namespace paradox_data::script {

enum struct Node_Kind : Default_Underlying {
    /// @brief A single value.
    scalar,
    /// @brief An ordered sequence of nodes, from an explicit list or from repeated keys.
    list,
    /// @brief An insertion-ordered mapping of unique keys to nodes.
    object,
    /// @brief A historical block keyed by a date, with children like an `object`.
    date,
};

[[nodiscard]] std::string_view node_kind_name(Node_Kind kind);

/// @brief Thrown when a node is mutated in a way its kind does not permit, such as adding a
/// child to a scalar.
struct Invalid_Node_Operation : std::logic_error {
    using std::logic_error::logic_error;
};

/// @brief An insertion-ordered map from keys to nodes with unique keys.
/// Assigning an existing key replaces the node but keeps its original position.
struct Node_Map {
private:
    struct String_Hash {
        using is_transparent = void;

        [[nodiscard]] Size operator()(std::string_view str) const noexcept
        {
            return std::hash<std::string_view> {}(str);
        }
    };

    std::vector<Node> m_nodes;
    std::unordered_map<std::string, Size, String_Hash, std::equal_to<>> m_indices;

public:
    [[nodiscard]] Node* find(std::string_view key);
    [[nodiscard]] const Node* find(std::string_view key) const;

    void insert_or_assign(Node&& node);

    [[nodiscard]] std::span<const Node> nodes() const;

    [[nodiscard]] Size size() const noexcept
    {
        return m_indices.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_indices.empty();
    }
};

/// @brief A node of the parsed script tree.
///
/// Every node carries the key of the statement it was assigned under (empty for unlabeled list
/// items) and exactly one of the four kinds of data described by `Node_Kind`.
/// Nodes are created through the static factory functions and only mutated while a tree is
/// being built.
struct Node {
private:
    struct Scalar {
        Value value;
    };
    struct List {
        std::vector<Node> items;
    };
    struct Object {
        Node_Map children;
    };
    struct Date_Block {
        Date date;
        Node_Map children;
    };

    std::string m_key;
    std::variant<Scalar, List, Object, Date_Block> m_data;

    template <typename T>
    Node(std::string&& key, T&& data)
        : m_key(std::move(key))
        , m_data(std::forward<T>(data))
    {
    }

public:
    [[nodiscard]] static Node scalar(std::string key, Value value);
    [[nodiscard]] static Node list(std::string key);
    [[nodiscard]] static Node object(std::string key);
    [[nodiscard]] static Node date(std::string key, const Date& date);

    [[nodiscard]] Node_Kind get_kind() const noexcept
    {
        return static_cast<Node_Kind>(m_data.index());
    }

    [[nodiscard]] bool is_scalar() const noexcept
    {
        return get_kind() == Node_Kind::scalar;
    }

    [[nodiscard]] bool is_list() const noexcept
    {
        return get_kind() == Node_Kind::list;
    }

    [[nodiscard]] bool is_object() const noexcept
    {
        return get_kind() == Node_Kind::object;
    }

    [[nodiscard]] bool is_date() const noexcept
    {
        return get_kind() == Node_Kind::date;
    }

    /// @brief Returns `true` if this node is an object or a date block, i.e. has keyed children.
    [[nodiscard]] bool has_children() const noexcept
    {
        return is_object() || is_date();
    }

    [[nodiscard]] const std::string& get_key() const noexcept
    {
        return m_key;
    }

    /// @brief Returns the value of a scalar node, or `nullptr` for other kinds.
    [[nodiscard]] const Value* get_scalar_value() const noexcept;

    /// @brief Returns the date of a date block, or `nullptr` for other kinds.
    [[nodiscard]] const Date* get_date() const noexcept;

    /// @brief Returns the keyed children of an object or date block in insertion order.
    /// For other kinds, the result is empty.
    [[nodiscard]] std::span<const Node> get_child_nodes() const noexcept;

    /// @brief Returns the items of a list, or an empty span for other kinds.
    [[nodiscard]] std::span<const Node> get_items() const noexcept;

    [[nodiscard]] Size get_child_count() const noexcept;

    [[nodiscard]] Size get_item_count() const noexcept
    {
        return get_items().size();
    }

    /// @brief Adds `child` under its key, replacing any existing child with the same key.
    /// @throws Invalid_Node_Operation if this node is neither an object nor a date block
    void add_child(Node child);

    /// @brief Adds `child` under its key, keeping existing children with the same key.
    /// An existing non-list child is replaced by a list holding the previous and the new child;
    /// an existing list is appended to.
    /// @throws Invalid_Node_Operation if this node is neither an object nor a date block
    void add_child_accumulating(Node child);

    /// @brief Appends `item` to this list.
    /// @throws Invalid_Node_Operation if this node is not a list
    void add_item(Node item);

    /// @brief Returns the child with the given key, or `nullptr` if there is none.
    [[nodiscard]] const Node* get_child(std::string_view key) const noexcept;

    /// @brief Returns all nodes under `key`: the items if the child is a list, the child itself
    /// otherwise, and nothing if there is no such child.
    [[nodiscard]] std::span<const Node> get_children(std::string_view key) const noexcept;

    [[nodiscard]] bool has_child(std::string_view key) const noexcept
    {
        return get_child(key) != nullptr;
    }

    /// @brief Converts the node's own value to `T`, see `coerce`.
    /// Scalars convert their value, and date blocks convert their date.
    template <typename T>
    [[nodiscard]] std::optional<T> as() const
    {
        if (const Value* value = get_scalar_value()) {
            return coerce<T>(*value);
        }
        if (const Date* block_date = get_date()) {
            return coerce<T>(Value { *block_date });
        }
        return {};
    }

    /// @brief Returns the value of the child with the given key converted to `T`.
    /// @param key the key of the child
    /// @param fallback returned when there is no such child or it cannot be converted
    template <typename T>
    [[nodiscard]] T get_value(std::string_view key, T fallback = T {}) const
    {
        const Node* child = get_child(key);
        if (child == nullptr) {
            return fallback;
        }
        std::optional<T> result = child->as<T>();
        return result ? std::move(*result) : std::move(fallback);
    }

    /// @brief Returns every node under `key` which converts to `T`, in order.
    /// Nodes which do not convert are left out.
    template <typename T>
    [[nodiscard]] std::vector<T> get_values(std::string_view key) const
    {
        std::vector<T> result;
        for (const Node& node : get_children(key)) {
            if (std::optional<T> value = node.as<T>()) {
                result.push_back(std::move(*value));
            }
        }
        return result;
    }

    /// @brief Returns the color stored under `key`, if it is a valid RGB literal.
    [[nodiscard]] std::optional<Rgb_Color> get_color(std::string_view key) const;
};

} // namespace paradox_data::script

#endif
