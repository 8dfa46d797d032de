#include <type_traits>

#include "common/assert.hpp"

#include "script/tree/node.hpp"

namespace paradox_data::script {

std::string_view node_kind_name(Node_Kind kind)
{
    using enum Node_Kind;
    switch (kind) {
        PARADOX_DATA_ENUM_STRING_CASE(scalar);
        PARADOX_DATA_ENUM_STRING_CASE(list);
        PARADOX_DATA_ENUM_STRING_CASE(object);
        PARADOX_DATA_ENUM_STRING_CASE(date);
    }
    PARADOX_DATA_ASSERT_UNREACHABLE("invalid node kind");
}

// =================================================================================================

Node* Node_Map::find(std::string_view key)
{
    const auto it = m_indices.find(key);
    return it == m_indices.end() ? nullptr : &m_nodes[it->second];
}

const Node* Node_Map::find(std::string_view key) const
{
    const auto it = m_indices.find(key);
    return it == m_indices.end() ? nullptr : &m_nodes[it->second];
}

void Node_Map::insert_or_assign(Node&& node)
{
    if (Node* existing = find(node.get_key())) {
        *existing = std::move(node);
        return;
    }
    m_indices.emplace(node.get_key(), m_nodes.size());
    m_nodes.push_back(std::move(node));
}

std::span<const Node> Node_Map::nodes() const
{
    return m_nodes;
}

// =================================================================================================

Node Node::scalar(std::string key, Value value)
{
    return Node { std::move(key), Scalar { std::move(value) } };
}

Node Node::list(std::string key)
{
    return Node { std::move(key), List {} };
}

Node Node::object(std::string key)
{
    return Node { std::move(key), Object {} };
}

Node Node::date(std::string key, const Date& date)
{
    return Node { std::move(key), Date_Block { .date = date, .children = {} } };
}

const Value* Node::get_scalar_value() const noexcept
{
    const auto* scalar = std::get_if<Scalar>(&m_data);
    return scalar ? &scalar->value : nullptr;
}

const Date* Node::get_date() const noexcept
{
    const auto* block = std::get_if<Date_Block>(&m_data);
    return block ? &block->date : nullptr;
}

std::span<const Node> Node::get_child_nodes() const noexcept
{
    if (const auto* object = std::get_if<Object>(&m_data)) {
        return object->children.nodes();
    }
    if (const auto* block = std::get_if<Date_Block>(&m_data)) {
        return block->children.nodes();
    }
    return {};
}

std::span<const Node> Node::get_items() const noexcept
{
    const auto* list = std::get_if<List>(&m_data);
    return list ? std::span<const Node> { list->items } : std::span<const Node> {};
}

Size Node::get_child_count() const noexcept
{
    return get_child_nodes().size();
}

namespace {

template <typename Variant>
[[nodiscard]] auto* children_of(Variant& data) noexcept
{
    using Map = std::conditional_t<std::is_const_v<Variant>, const Node_Map, Node_Map>;
    Map* result = nullptr;
    std::visit(
        [&]<typename T>(T& alternative) {
            if constexpr (requires { alternative.children; }) {
                result = &alternative.children;
            }
        },
        data);
    return result;
}

} // namespace

void Node::add_child(Node child)
{
    Node_Map* children = children_of(m_data);
    if (children == nullptr) {
        throw Invalid_Node_Operation { "Cannot add a child to a node of kind "
                                       + std::string(node_kind_name(get_kind())) + "." };
    }
    children->insert_or_assign(std::move(child));
}

void Node::add_child_accumulating(Node child)
{
    Node_Map* children = children_of(m_data);
    if (children == nullptr) {
        throw Invalid_Node_Operation { "Cannot add a child to a node of kind "
                                       + std::string(node_kind_name(get_kind())) + "." };
    }

    Node* existing = children->find(child.get_key());
    if (existing == nullptr) {
        children->insert_or_assign(std::move(child));
        return;
    }
    if (existing->is_list()) {
        existing->add_item(std::move(child));
        return;
    }

    Node accumulated = Node::list(child.get_key());
    accumulated.add_item(std::move(*existing));
    accumulated.add_item(std::move(child));
    *existing = std::move(accumulated);
}

void Node::add_item(Node item)
{
    auto* list = std::get_if<List>(&m_data);
    if (list == nullptr) {
        throw Invalid_Node_Operation { "Cannot add an item to a node of kind "
                                       + std::string(node_kind_name(get_kind())) + "." };
    }
    list->items.push_back(std::move(item));
}

const Node* Node::get_child(std::string_view key) const noexcept
{
    const Node_Map* children = children_of(m_data);
    return children ? children->find(key) : nullptr;
}

std::span<const Node> Node::get_children(std::string_view key) const noexcept
{
    const Node* child = get_child(key);
    if (child == nullptr) {
        return {};
    }
    if (child->is_list()) {
        return child->get_items();
    }
    return { child, 1 };
}

std::optional<Rgb_Color> Node::get_color(std::string_view key) const
{
    const Node* child = get_child(key);
    if (child == nullptr) {
        return {};
    }
    return child->as<Rgb_Color>();
}

} // namespace paradox_data::script
