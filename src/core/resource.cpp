/**
 * LSV Inspector - Resource document queries
 */

#include "lsv/resource.hpp"

namespace lsv {

std::vector<size_t> ResourceDocument::roots() const {
    std::vector<size_t> result;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].is_root()) {
            result.push_back(i);
        }
    }
    return result;
}

size_t ResourceDocument::find_region(std::string_view name) const {
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (nodes_[i].is_root() && strings_.get(nodes_[i].name) == name) {
            return i;
        }
    }
    return npos;
}

size_t ResourceDocument::find_child(size_t node, std::string_view name) const {
    if (node >= nodes_.size()) {
        return npos;
    }
    for (size_t c = nodes_[node].first_child; c != npos; c = nodes_[c].next_sibling) {
        if (strings_.get(nodes_[c].name) == name) {
            return c;
        }
    }
    return npos;
}

size_t ResourceDocument::find_attribute(size_t node, std::string_view name) const {
    if (node >= nodes_.size()) {
        return npos;
    }
    for (size_t a = nodes_[node].first_attribute; a != npos; a = attributes_[a].next) {
        if (strings_.get(attributes_[a].name) == name) {
            return a;
        }
    }
    return npos;
}

std::vector<size_t> ResourceDocument::children(size_t node) const {
    std::vector<size_t> result;
    if (node >= nodes_.size()) {
        return result;
    }
    for (size_t c = nodes_[node].first_child; c != npos; c = nodes_[c].next_sibling) {
        result.push_back(c);
    }
    return result;
}

std::vector<size_t> ResourceDocument::attributes(size_t node) const {
    std::vector<size_t> result;
    if (node >= nodes_.size()) {
        return result;
    }
    for (size_t a = nodes_[node].first_attribute; a != npos; a = attributes_[a].next) {
        result.push_back(a);
    }
    return result;
}

const std::string& ResourceDocument::node_name(size_t node) const {
    static const std::string empty;
    return node < nodes_.size() ? strings_.get(nodes_[node].name) : empty;
}

const std::string& ResourceDocument::attribute_name(size_t attribute) const {
    static const std::string empty;
    return attribute < attributes_.size() ? strings_.get(attributes_[attribute].name) : empty;
}

std::span<const uint8_t> ResourceDocument::attribute_bytes(const Attribute& attribute) const {
    if (!values_ || attribute.offset > values_->size() ||
        attribute.length > values_->size() - attribute.offset) {
        return {};
    }
    return std::span<const uint8_t>(values_->data() + attribute.offset, attribute.length);
}

} // namespace lsv
