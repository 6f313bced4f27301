#pragma once

#include <concepts>
#include <cstddef>
#include <optional>
#include <ostream>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>

#include "context_stack.hpp"
#include "errors.hpp"
#include "scribe.hpp"
#include "sink.hpp"
#include "value_writer.hpp"

namespace JsonScribe {

// Builder handles
//
// A handle stands for one open construct. Methods that write inside it return
// the handle itself; methods that open a child return the child's handle; then()
// closes the construct and returns the parent handle, so a whole document can
// be written as one chained expression:
//
//     std::string out;
//     Document(out).object()
//         .with("id", 7)
//         .array("tags").with("a").with("b").then()
//     .then().finish();                               // {"id":7,"tags":["a","b"]}
//
// Handles never check which construct is innermost. Writing through a handle
// after its then(), or through a parent while one of its children is open,
// produces undefined output. Failures (sink errors, misuse the scribe detects)
// are recorded by the scribe, which then refuses further writes; they surface
// through Document::finish().

template<class Parent> class ArrayNode;
template<class Parent> class ObjectNode;
template<class Parent> class ValueNode;

namespace builder_detail {

/// Unkeyed writes: array elements, or the root value of a document.
template<class Derived>
class ElementWriter {
    constexpr Derived& self() {
        return static_cast<Derived&>(*this);
    }

public:
    constexpr Derived& withNull() {
        self().scribe().write_null();
        return self();
    }

    constexpr Derived& withTrue() {
        self().scribe().write_bool(true);
        return self();
    }

    constexpr Derived& withFalse() {
        self().scribe().write_bool(false);
        return self();
    }

    /// bool, char, strings, numbers, Decimal, nullptr, std::optional of those.
    template<WritableValue T>
    constexpr Derived& with(const T& value) {
        write_value(self().scribe(), value);
        return self();
    }

    template<WritableValue... Ts>
    constexpr Derived& withAll(const Ts&... values) {
        (write_value(self().scribe(), values), ...);
        return self();
    }

    template<std::ranges::input_range R>
        requires WritableValue<std::ranges::range_value_t<R>>
    constexpr Derived& withRange(const R& range) {
        for (const auto& value : range) {
            write_value(self().scribe(), value);
        }
        return self();
    }

    constexpr Derived& withEmptyArray() {
        auto& s = self().scribe();
        if (s.begin_array()) {
            s.end_current();
        }
        return self();
    }

    constexpr Derived& withEmptyObject() {
        auto& s = self().scribe();
        if (s.begin_object()) {
            s.end_current();
        }
        return self();
    }

    /// Opens a string value whose content is appended through the returned handle.
    constexpr ValueNode<Derived> element() {
        self().scribe().begin_string_value();
        return ValueNode<Derived>(self().scribe(), self());
    }

    constexpr ValueNode<Derived> element(std::string_view prefix) {
        self().scribe().begin_string_value(prefix);
        return ValueNode<Derived>(self().scribe(), self());
    }

    constexpr ValueNode<Derived> element(char prefix) {
        return element(std::string_view(&prefix, 1));
    }

    /// An empty optional opens the value without a prefix.
    constexpr ValueNode<Derived> element(const std::optional<char>& prefix) {
        if (!prefix.has_value()) {
            return element();
        }
        return element(*prefix);
    }

    constexpr ArrayNode<Derived> array() {
        self().scribe().begin_array();
        return ArrayNode<Derived>(self().scribe(), self());
    }

    constexpr ObjectNode<Derived> object() {
        self().scribe().begin_object();
        return ObjectNode<Derived>(self().scribe(), self());
    }
};

/// What every child handle shares: the scribe, the parent to hand back, and
/// the depth and sequence number its construct was opened with.
template<class Parent>
class NodeBase {
public:
    using scribe_type = typename Parent::scribe_type;
    using parent_type = Parent;

    constexpr scribe_type& scribe() const {
        return *m_scribe;
    }

    /// Depth of this node's construct; the scribe's cursor while it is innermost.
    constexpr std::size_t depth() const {
        return m_depth;
    }

    /// Closes this construct, and any child left open inside it, and returns the parent.
    /// If the construct was already closed, the scribe records CONTEXT_ALREADY_CLOSED
    /// and closes nothing, even when another construct now sits at the same depth.
    constexpr Parent& then() {
        m_scribe->end_through(m_depth, m_id);
        return *m_parent;
    }

protected:
    // Called right after the scribe opened the construct.
    constexpr NodeBase(scribe_type& scribe, Parent& parent):
        m_scribe(&scribe), m_parent(&parent), m_depth(scribe.cursor()), m_id(scribe.current_id())
    {}

    scribe_type* m_scribe;
    Parent* m_parent;
    std::size_t m_depth;
    std::size_t m_id;
};

} // namespace builder_detail

// ============================================================================
// ArrayNode
// ============================================================================

template<class Parent>
class ArrayNode : public builder_detail::NodeBase<Parent>,
                  public builder_detail::ElementWriter<ArrayNode<Parent>> {
public:
    using typename builder_detail::NodeBase<Parent>::scribe_type;

    constexpr ArrayNode(scribe_type& scribe, Parent& parent):
        builder_detail::NodeBase<Parent>(scribe, parent)
    {}
};

// ============================================================================
// ObjectNode
// ============================================================================

template<class Parent>
class ObjectNode : public builder_detail::NodeBase<Parent> {
    using Base = builder_detail::NodeBase<Parent>;

public:
    using typename Base::scribe_type;

    constexpr ObjectNode(scribe_type& scribe, Parent& parent):
        Base(scribe, parent)
    {}

    constexpr ObjectNode& withNull(std::string_view key) {
        if (this->m_scribe->write_key(key)) {
            this->m_scribe->write_null();
        }
        return *this;
    }

    constexpr ObjectNode& withTrue(std::string_view key) {
        if (this->m_scribe->write_key(key)) {
            this->m_scribe->write_bool(true);
        }
        return *this;
    }

    constexpr ObjectNode& withFalse(std::string_view key) {
        if (this->m_scribe->write_key(key)) {
            this->m_scribe->write_bool(false);
        }
        return *this;
    }

    template<WritableValue T>
    constexpr ObjectNode& with(std::string_view key, const T& value) {
        if (this->m_scribe->write_key(key)) {
            write_value(*this->m_scribe, value);
        }
        return *this;
    }

    /// Writes every entry of a map-like range of (key, value) pairs.
    template<std::ranges::input_range M>
        requires std::convertible_to<const typename std::ranges::range_value_t<M>::first_type&, std::string_view>
              && WritableValue<typename std::ranges::range_value_t<M>::second_type>
    constexpr ObjectNode& withEntries(const M& entries) {
        for (const auto& [key, value] : entries) {
            with(key, value);
        }
        return *this;
    }

    constexpr ObjectNode& withEmptyArray(std::string_view key) {
        if (this->m_scribe->write_key(key) && this->m_scribe->begin_array()) {
            this->m_scribe->end_current();
        }
        return *this;
    }

    constexpr ObjectNode& withEmptyObject(std::string_view key) {
        if (this->m_scribe->write_key(key) && this->m_scribe->begin_object()) {
            this->m_scribe->end_current();
        }
        return *this;
    }

    constexpr ValueNode<ObjectNode> value(std::string_view key) {
        if (this->m_scribe->write_key(key)) {
            this->m_scribe->begin_string_value();
        }
        return ValueNode<ObjectNode>(*this->m_scribe, *this);
    }

    constexpr ValueNode<ObjectNode> value(std::string_view key, std::string_view prefix) {
        if (this->m_scribe->write_key(key)) {
            this->m_scribe->begin_string_value(prefix);
        }
        return ValueNode<ObjectNode>(*this->m_scribe, *this);
    }

    constexpr ArrayNode<ObjectNode> array(std::string_view key) {
        if (this->m_scribe->write_key(key)) {
            this->m_scribe->begin_array();
        }
        return ArrayNode<ObjectNode>(*this->m_scribe, *this);
    }

    constexpr ObjectNode<ObjectNode> object(std::string_view key) {
        if (this->m_scribe->write_key(key)) {
            this->m_scribe->begin_object();
        }
        return ObjectNode<ObjectNode>(*this->m_scribe, *this);
    }
};

// ============================================================================
// ValueNode - a string value written in pieces
// ============================================================================

template<class Parent>
class ValueNode : public builder_detail::NodeBase<Parent> {
    using Base = builder_detail::NodeBase<Parent>;

public:
    using typename Base::scribe_type;

    constexpr ValueNode(scribe_type& scribe, Parent& parent):
        Base(scribe, parent)
    {}

    constexpr ValueNode& append(std::string_view content) {
        this->m_scribe->append_to_string_value(content);
        return *this;
    }

    constexpr ValueNode& append(char c) {
        this->m_scribe->append_to_string_value(c);
        return *this;
    }
};

// ============================================================================
// Document - root handle, owns the scribe
// ============================================================================

/// Holds the writing session. Handles refer back to it, so it is neither
/// copyable nor movable. The sink it writes into stays owned by the caller and
/// is not flushed or closed by finish().
template<SinkLike Sink, ContextStackLike Stack = DefaultContextStack>
class Document : public builder_detail::ElementWriter<Document<Sink, Stack>> {
public:
    using scribe_type = Scribe<Sink, Stack>;

    template<class... Args>
        requires std::constructible_from<Sink, Args&&...>
    constexpr explicit Document(Args&&... args): m_scribe(Sink(std::forward<Args>(args)...)) {}

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    constexpr scribe_type& scribe() {
        return m_scribe;
    }

    constexpr std::size_t cursor() const {
        return m_scribe.cursor();
    }

    constexpr ScribeResult result() const {
        return m_scribe.result();
    }

    /// Ends the session. Reports UNCLOSED_CONTEXT when constructs are still
    /// open; nothing is written either way.
    constexpr ScribeResult finish() const {
        if (m_scribe.getError() == ScribeError::NO_ERROR && m_scribe.cursor() != 0) {
            return ScribeResult(ScribeError::UNCLOSED_CONTEXT, m_scribe.cursor());
        }
        return m_scribe.result();
    }

private:
    scribe_type m_scribe;
};

Document(std::string&) -> Document<StringSink>;
Document(std::ostream&) -> Document<StreamSink>;

template<SinkLike Sink>
Document(Sink) -> Document<Sink>;

template<CharOutputIterator It, CharSentinelForOut<It> Sent>
Document(It, Sent) -> Document<IteratorSink<It, Sent>>;

} // namespace JsonScribe
